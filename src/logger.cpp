#include "telemon/logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>

namespace telemon {

LogLevel Logger::level_ = LogLevel::Info;
bool Logger::console_enabled_ = true;
std::ofstream Logger::file_;
std::mutex Logger::mutex_;

bool parse_log_level(const std::string& name, LogLevel& level) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        level = LogLevel::Debug;
    } else if (lower == "info") {
        level = LogLevel::Info;
    } else if (lower == "warning" || lower == "warn") {
        level = LogLevel::Warning;
    } else if (lower == "error") {
        level = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
    }
    return "INFO";
}

std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

bool Logger::set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    if (path.empty()) {
        return true;
    }

    file_.open(path, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "Warning: Failed to open log file: " << path << "\n";
        return false;
    }
    return true;
}

void Logger::write_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (console_enabled_) {
        std::cerr << line << std::endl;
    }
    if (file_.is_open()) {
        file_ << line << "\n";
        file_.flush();
    }
}

} // namespace telemon
