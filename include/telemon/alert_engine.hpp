#pragma once

#include "telemon/application_aggregator.hpp"
#include "telemon/bounded_history.hpp"
#include "telemon/config_manager.hpp"
#include "telemon/resource_sampler.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace telemon {

// Ordered: Low < Medium < High < Critical
enum class Severity {
    Low,
    Medium,
    High,
    Critical
};

enum class AlertCategory {
    Info,
    Warning,
    Error
};

const char* severity_name(Severity severity);          // "low" ... "critical"
Severity parse_severity(const std::string& name);     // throws std::invalid_argument
AlertCategory category_for(Severity severity);
const char* category_name(AlertCategory category);

using AlertMetadata = std::map<std::string, std::string>;

struct Alert {
    std::string id;
    std::string kind;        // triggering rule name, e.g. "high_error_rate"
    AlertCategory category = AlertCategory::Info;
    Severity severity = Severity::Low;
    std::string title;       // "HIGH: high_error_rate"
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    bool resolved = false;
    std::optional<std::chrono::system_clock::time_point> resolved_at;
    AlertMetadata metadata;
};

using AlertPredicate =
    std::function<bool(const ApplicationSnapshot&, const std::optional<ResourceSample>&)>;

struct AlertRule {
    std::string name;
    Severity severity;
    std::string message;
    AlertPredicate predicate;
};

// Rules fired on every evaluation tick, in this order
std::vector<AlertRule> default_alert_rules(const AlertRulesConfig& config);

// Flattened counters of a snapshot, captured as alert context
AlertMetadata snapshot_metadata(const ApplicationSnapshot& snapshot);

class AlertEngine {
public:
    static constexpr std::size_t kDefaultLedgerSize = 500;

    explicit AlertEngine(std::size_t ledger_size = kDefaultLedgerSize);

    // Rules are installed once; later calls are rejected
    bool load_rules(std::vector<AlertRule> rules);
    std::size_t rule_count() const;

    // One new alert per matching rule, no deduplication across ticks
    std::vector<Alert> evaluate(const ApplicationSnapshot& snapshot,
                                const std::optional<ResourceSample>& latest_resources);

    Alert create_alert(const std::string& kind, Severity severity,
                       const std::string& message, AlertMetadata metadata = {});

    // True only when an unresolved alert with this id was resolved now
    bool resolve_alert(const std::string& id);

    std::vector<Alert> all_alerts() const;
    std::vector<Alert> active_alerts() const;
    std::vector<Alert> alerts_by_severity(Severity severity) const;

private:
    Alert create_alert_locked(const std::string& kind, Severity severity,
                              const std::string& message, AlertMetadata metadata);
    std::string generate_id();

    std::vector<AlertRule> rules_;
    bool rules_loaded_ = false;

    mutable std::mutex mutex_;
    BoundedHistory<Alert> ledger_;
    std::mt19937_64 rng_;
};

} // namespace telemon
