#pragma once

#include "telemon/alert_engine.hpp"
#include "telemon/application_aggregator.hpp"
#include "telemon/collection_scheduler.hpp"
#include "telemon/config_manager.hpp"
#include "telemon/dashboard.hpp"
#include "telemon/health_checker.hpp"
#include "telemon/metrics_collector.hpp"
#include "telemon/resource_sampler.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace telemon {

// Owns the telemetry state of one process: resource history, application
// counters, alert ledger and health registry, plus the collection timer.
class TelemetryService {
public:
    explicit TelemetryService(const TelemonConfig& config = TelemonConfig{},
                              std::unique_ptr<MetricsCollector> collector = create_metrics_collector());

    TelemetryService(const TelemetryService&) = delete;
    TelemetryService& operator=(const TelemetryService&) = delete;

    // Install the alert rules and start periodic collection. Only once.
    bool initialize(bool start_scheduler = true);
    bool is_initialized() const { return initialized_; }

    // One sample -> snapshot -> evaluate cycle on the calling thread.
    // Throws whatever the collector throws.
    void collect_once();

    // Called after every successful scheduled tick
    void set_tick_listener(std::function<void()> listener);

    void register_check(const std::string& name, HealthProbe probe);
    DashboardData dashboard_data() const;
    MetricsHistory metrics_history(double hours = 24.0) const;

    bool resolve_alert(const std::string& id);
    std::vector<Alert> active_alerts() const;
    std::vector<Alert> all_alerts() const;
    std::vector<Alert> alerts_by_severity(Severity severity) const;

    ApplicationAggregator& application() { return application_; }
    ResourceSampler& resources() { return sampler_; }
    AlertEngine& alerts() { return alerts_; }
    HealthChecker& health() { return health_; }
    const Dashboard& dashboard() const { return dashboard_; }
    CollectionScheduler& scheduler() { return *scheduler_; }

private:
    void scheduled_tick();

    TelemonConfig config_;
    ResourceSampler sampler_;
    ApplicationAggregator application_;
    AlertEngine alerts_;
    HealthChecker health_;
    Dashboard dashboard_;

    std::mutex listener_mutex_;
    std::function<void()> tick_listener_;
    std::atomic<bool> initialized_{false};
    std::unique_ptr<CollectionScheduler> scheduler_;
};

} // namespace telemon
