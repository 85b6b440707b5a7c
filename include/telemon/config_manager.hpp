#pragma once

#include <typiconf/typiconf.hpp>
#include <string>

namespace telemon {

struct ResourceConfig {
    std::string disk_mount_point = "/";

    TYPICONF_DEFINE_FIELDS(ResourceConfig,
        TYPICONF_FIELD(disk_mount_point)
    )
};

struct HistoryConfig {
    int resource_history = 1000;
    int application_history = 1000;
    int alert_ledger = 500;
    int recent_errors = 100;

    bool validate() const {
        return resource_history > 0 && application_history > 0 &&
               alert_ledger > 0 && recent_errors > 0;
    }

    TYPICONF_DEFINE_FIELDS(HistoryConfig,
        TYPICONF_FIELD(resource_history),
        TYPICONF_FIELD(application_history),
        TYPICONF_FIELD(alert_ledger),
        TYPICONF_FIELD(recent_errors)
    )
};

struct AlertRulesConfig {
    bool enabled = true;
    int error_total_threshold = 10;
    double min_call_success_rate = 0.8;
    double max_memory_usage_percent = 90.0;
    double max_api_failure_rate = 0.1;
    double max_inference_failure_rate = 0.05;

    bool validate() const {
        return error_total_threshold >= 0 &&
               min_call_success_rate >= 0.0 && min_call_success_rate <= 1.0 &&
               max_memory_usage_percent >= 0.0 && max_memory_usage_percent <= 100.0 &&
               max_api_failure_rate >= 0.0 && max_api_failure_rate <= 1.0 &&
               max_inference_failure_rate >= 0.0 && max_inference_failure_rate <= 1.0;
    }

    TYPICONF_DEFINE_FIELDS(AlertRulesConfig,
        TYPICONF_FIELD(enabled),
        TYPICONF_FIELD(error_total_threshold),
        TYPICONF_FIELD(min_call_success_rate),
        TYPICONF_FIELD(max_memory_usage_percent),
        TYPICONF_FIELD(max_api_failure_rate),
        TYPICONF_FIELD(max_inference_failure_rate)
    )
};

struct LoggingConfig {
    std::string level = "info";
    bool log_to_file = false;
    std::string log_path = "./telemon.log";

    TYPICONF_DEFINE_FIELDS(LoggingConfig,
        TYPICONF_FIELD(level),
        TYPICONF_FIELD(log_to_file),
        TYPICONF_FIELD(log_path)
    )
};

struct DisplayConfig {
    std::string color_scheme = "default";
    int max_alerts_shown = 5;

    TYPICONF_DEFINE_FIELDS(DisplayConfig,
        TYPICONF_FIELD(color_scheme),
        TYPICONF_FIELD(max_alerts_shown)
    )
};

struct TelemonConfig {
    std::string version = "1.0";
    int collection_interval = 60;   // seconds
    ResourceConfig resources;
    HistoryConfig history;
    AlertRulesConfig alerts;
    LoggingConfig logging;
    DisplayConfig display;

    bool validate() const;

    TYPICONF_DEFINE_FIELDS(TelemonConfig,
        TYPICONF_FIELD(version),
        TYPICONF_FIELD(collection_interval),
        TYPICONF_FIELD(resources),
        TYPICONF_FIELD(history),
        TYPICONF_FIELD(alerts),
        TYPICONF_FIELD(logging),
        TYPICONF_FIELD(display)
    )
};

class ConfigManager {
public:
    explicit ConfigManager(const std::string& config_path);

    // Load configuration; missing keys keep their defaults
    bool load();

    const TelemonConfig& get_config() const { return config_; }

    bool validate_config(std::string& error_msg) const;

private:
    std::string config_path_;
    TelemonConfig config_;
};

} // namespace telemon
