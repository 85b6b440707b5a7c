#include "telemon/alert_engine.hpp"
#include "telemon/logger.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace telemon {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Low:      return "low";
        case Severity::Medium:   return "medium";
        case Severity::High:     return "high";
        case Severity::Critical: return "critical";
    }
    return "low";
}

Severity parse_severity(const std::string& name) {
    if (name == "low") return Severity::Low;
    if (name == "medium") return Severity::Medium;
    if (name == "high") return Severity::High;
    if (name == "critical") return Severity::Critical;
    throw std::invalid_argument("Unknown alert severity: " + name);
}

AlertCategory category_for(Severity severity) {
    switch (severity) {
        case Severity::Critical: return AlertCategory::Error;
        case Severity::High:     return AlertCategory::Warning;
        default:                 return AlertCategory::Info;
    }
}

const char* category_name(AlertCategory category) {
    switch (category) {
        case AlertCategory::Info:    return "info";
        case AlertCategory::Warning: return "warning";
        case AlertCategory::Error:   return "error";
    }
    return "info";
}

static std::string upper(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

static std::string format_number(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

static double ratio(uint64_t part, uint64_t whole) {
    return static_cast<double>(part) / static_cast<double>(whole);
}

std::vector<AlertRule> default_alert_rules(const AlertRulesConfig& config) {
    std::vector<AlertRule> rules;

    rules.push_back({"high_error_rate", Severity::High, "High error rate detected",
        [threshold = config.error_total_threshold](const ApplicationSnapshot& s,
                                                   const std::optional<ResourceSample>&) {
            return s.errors.total > static_cast<uint64_t>(threshold);
        }});

    rules.push_back({"low_success_rate", Severity::Medium, "Low call success rate detected",
        [min_rate = config.min_call_success_rate](const ApplicationSnapshot& s,
                                                  const std::optional<ResourceSample>&) {
            return s.calls.total > 0 && ratio(s.calls.successful, s.calls.total) < min_rate;
        }});

    rules.push_back({"high_memory_usage", Severity::High, "High memory usage detected",
        [max_percent = config.max_memory_usage_percent](const ApplicationSnapshot&,
                                                        const std::optional<ResourceSample>& r) {
            return r.has_value() && r->memory.usage_percent > max_percent;
        }});

    rules.push_back({"api_failures", Severity::Medium, "High API failure rate detected",
        [max_rate = config.max_api_failure_rate](const ApplicationSnapshot& s,
                                                 const std::optional<ResourceSample>&) {
            return s.api.total_requests > 0 &&
                   ratio(s.api.failed_requests, s.api.total_requests) > max_rate;
        }});

    rules.push_back({"inference_failures", Severity::High, "High inference failure rate detected",
        [max_rate = config.max_inference_failure_rate](const ApplicationSnapshot& s,
                                                       const std::optional<ResourceSample>&) {
            return s.inference.total_requests > 0 &&
                   ratio(s.inference.failed_requests, s.inference.total_requests) > max_rate;
        }});

    return rules;
}

AlertMetadata snapshot_metadata(const ApplicationSnapshot& s) {
    AlertMetadata metadata;
    metadata["calls.total"] = std::to_string(s.calls.total);
    metadata["calls.successful"] = std::to_string(s.calls.successful);
    metadata["calls.failed"] = std::to_string(s.calls.failed);
    metadata["calls.average_duration_ms"] = format_number(s.calls.average_duration_ms);
    metadata["api.total_requests"] = std::to_string(s.api.total_requests);
    metadata["api.successful_requests"] = std::to_string(s.api.successful_requests);
    metadata["api.failed_requests"] = std::to_string(s.api.failed_requests);
    metadata["api.average_response_time_ms"] = format_number(s.api.average_response_time_ms);
    metadata["inference.total_requests"] = std::to_string(s.inference.total_requests);
    metadata["inference.successful_requests"] = std::to_string(s.inference.successful_requests);
    metadata["inference.failed_requests"] = std::to_string(s.inference.failed_requests);
    metadata["inference.average_response_time_ms"] = format_number(s.inference.average_response_time_ms);
    metadata["inference.tokens_consumed"] = std::to_string(s.inference.tokens_consumed);
    metadata["errors.total"] = std::to_string(s.errors.total);
    for (const auto& [kind, count] : s.errors.count_by_kind) {
        metadata["errors.by_kind." + kind] = std::to_string(count);
    }
    return metadata;
}

AlertEngine::AlertEngine(std::size_t ledger_size)
    : ledger_(ledger_size)
    , rng_(std::random_device{}())
{
}

bool AlertEngine::load_rules(std::vector<AlertRule> rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (rules_loaded_) {
        Logger::warning("Alert rules already loaded; ignoring reload");
        return false;
    }
    rules_ = std::move(rules);
    rules_loaded_ = true;
    Logger::debug("Loaded ", rules_.size(), " alert rules");
    return true;
}

std::size_t AlertEngine::rule_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rules_.size();
}

std::vector<Alert> AlertEngine::evaluate(const ApplicationSnapshot& snapshot,
                                         const std::optional<ResourceSample>& latest_resources) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Alert> triggered;
    for (const auto& rule : rules_) {
        if (rule.predicate && rule.predicate(snapshot, latest_resources)) {
            triggered.push_back(create_alert_locked(rule.name, rule.severity, rule.message,
                                                    snapshot_metadata(snapshot)));
        }
    }
    return triggered;
}

Alert AlertEngine::create_alert(const std::string& kind, Severity severity,
                                const std::string& message, AlertMetadata metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    return create_alert_locked(kind, severity, message, std::move(metadata));
}

Alert AlertEngine::create_alert_locked(const std::string& kind, Severity severity,
                                       const std::string& message, AlertMetadata metadata) {
    Alert alert;
    alert.id = generate_id();
    alert.kind = kind;
    alert.category = category_for(severity);
    alert.severity = severity;
    alert.title = upper(severity_name(severity)) + ": " + kind;
    alert.message = message;
    alert.timestamp = std::chrono::system_clock::now();
    alert.metadata = std::move(metadata);

    ledger_.push(alert);

    Logger::warning("ALERT [", upper(severity_name(severity)), "] ", kind, ": ", message,
                    " (id ", alert.id, ")");
    return alert;
}

bool AlertEngine::resolve_alert(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(ledger_.begin(), ledger_.end(),
                           [&id](const Alert& alert) { return alert.id == id; });
    if (it == ledger_.end() || it->resolved) {
        return false;
    }

    it->resolved = true;
    it->resolved_at = std::chrono::system_clock::now();
    Logger::info("Alert resolved: ", it->title, " (id ", id, ")");
    return true;
}

std::vector<Alert> AlertEngine::all_alerts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.to_vector();
}

std::vector<Alert> AlertEngine::active_alerts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Alert> alerts;
    std::copy_if(ledger_.begin(), ledger_.end(), std::back_inserter(alerts),
                 [](const Alert& alert) { return !alert.resolved; });
    return alerts;
}

std::vector<Alert> AlertEngine::alerts_by_severity(Severity severity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Alert> alerts;
    std::copy_if(ledger_.begin(), ledger_.end(), std::back_inserter(alerts),
                 [severity](const Alert& alert) { return alert.severity == severity; });
    return alerts;
}

std::string AlertEngine::generate_id() {
    static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::uniform_int_distribution<int> pick(0, 35);

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::string id = "alert_" + std::to_string(millis) + "_";
    for (int i = 0; i < 9; ++i) {
        id += digits[pick(rng_)];
    }
    return id;
}

} // namespace telemon
