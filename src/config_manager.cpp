#include "telemon/config_manager.hpp"
#include "telemon/logger.hpp"
#include <cctype>
#include <fstream>
#include <stdexcept>

// Minimal YAML subset reader: top-level sections, one level of keys, scalars
namespace telemon {

bool TelemonConfig::validate() const {
    if (collection_interval <= 0) {
        return false;
    }
    if (!history.validate() || !alerts.validate()) {
        return false;
    }
    LogLevel level;
    return parse_log_level(logging.level, level);
}

ConfigManager::ConfigManager(const std::string& config_path)
    : config_path_(config_path)
{
}

static std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, last - first + 1);
}

static std::string strip_comment(const std::string& line) {
    bool in_quotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            in_quotes = !in_quotes;
        } else if (line[i] == '#' && !in_quotes) {
            return line.substr(0, i);
        }
    }
    return line;
}

static bool parse_double(const std::string& value, double& out) {
    try {
        size_t consumed = 0;
        out = std::stod(value, &consumed);
        return consumed == value.size();
    } catch (const std::exception&) {
        return false;
    }
}

static bool parse_int(const std::string& value, int& out) {
    try {
        size_t consumed = 0;
        out = std::stoi(value, &consumed);
        return consumed == value.size();
    } catch (const std::exception&) {
        return false;
    }
}

static bool parse_bool(const std::string& value) {
    std::string lower = value;
    for (char& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return lower == "true" || lower == "yes" || lower == "1";
}

bool ConfigManager::load() {
    std::ifstream file(config_path_);
    if (!file.is_open()) {
        Logger::error("Failed to open config file: ", config_path_);
        return false;
    }

    config_ = TelemonConfig{};

    std::string raw_line;
    std::string current_section;
    int line_number = 0;

    while (std::getline(file, raw_line)) {
        ++line_number;
        std::string without_comment = strip_comment(raw_line);
        std::string line = trim(without_comment);
        if (line.empty()) {
            continue;
        }

        size_t indent = without_comment.find_first_not_of(' ');
        size_t colon_pos = line.find(':');
        if (colon_pos == std::string::npos) {
            Logger::warning(config_path_, ":", line_number, ": ignoring line without key");
            continue;
        }

        std::string key = trim(line.substr(0, colon_pos));
        std::string value = trim(line.substr(colon_pos + 1));

        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        // Section header (no indent, no value)
        if (indent == 0 && value.empty()) {
            current_section = key;
            continue;
        }
        if (indent == 0) {
            current_section.clear();
        }

        bool ok = true;
        if (current_section.empty()) {
            if (key == "version") config_.version = value;
            else if (key == "collection_interval") ok = parse_int(value, config_.collection_interval);
        }
        else if (current_section == "resources") {
            if (key == "disk_mount_point") config_.resources.disk_mount_point = value;
        }
        else if (current_section == "history") {
            if (key == "resource_history") ok = parse_int(value, config_.history.resource_history);
            else if (key == "application_history") ok = parse_int(value, config_.history.application_history);
            else if (key == "alert_ledger") ok = parse_int(value, config_.history.alert_ledger);
            else if (key == "recent_errors") ok = parse_int(value, config_.history.recent_errors);
        }
        else if (current_section == "alerts") {
            auto& alerts = config_.alerts;
            if (key == "enabled") alerts.enabled = parse_bool(value);
            else if (key == "error_total_threshold") ok = parse_int(value, alerts.error_total_threshold);
            else if (key == "min_call_success_rate") ok = parse_double(value, alerts.min_call_success_rate);
            else if (key == "max_memory_usage_percent") ok = parse_double(value, alerts.max_memory_usage_percent);
            else if (key == "max_api_failure_rate") ok = parse_double(value, alerts.max_api_failure_rate);
            else if (key == "max_inference_failure_rate") ok = parse_double(value, alerts.max_inference_failure_rate);
        }
        else if (current_section == "logging") {
            if (key == "level") config_.logging.level = value;
            else if (key == "log_to_file") config_.logging.log_to_file = parse_bool(value);
            else if (key == "log_path") config_.logging.log_path = value;
        }
        else if (current_section == "display") {
            if (key == "color_scheme") config_.display.color_scheme = value;
            else if (key == "max_alerts_shown") ok = parse_int(value, config_.display.max_alerts_shown);
        }

        if (!ok) {
            Logger::error(config_path_, ":", line_number, ": invalid value for '", key, "': ", value);
            return false;
        }
    }

    return true;
}

bool ConfigManager::validate_config(std::string& error_msg) const {
    if (config_.collection_interval <= 0) {
        error_msg = "collection_interval must be positive";
        return false;
    }

    if (!config_.history.validate()) {
        error_msg = "History capacities must be positive";
        return false;
    }

    if (!config_.alerts.validate()) {
        error_msg = "Alert thresholds invalid: rates must be within [0, 1] and percentages within [0, 100]";
        return false;
    }

    LogLevel level;
    if (!parse_log_level(config_.logging.level, level)) {
        error_msg = "Unknown logging level: " + config_.logging.level;
        return false;
    }

    return true;
}

} // namespace telemon
