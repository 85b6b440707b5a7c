#include "telemon/telemetry_service.hpp"
#include "telemon/logger.hpp"
#include <stdexcept>
#include <string>

namespace telemon {

namespace {

std::size_t checked_capacity(int value, const char* name) {
    if (value <= 0) {
        throw std::invalid_argument(std::string("history.") + name + " must be positive");
    }
    return static_cast<std::size_t>(value);
}

} // namespace

TelemetryService::TelemetryService(const TelemonConfig& config,
                                   std::unique_ptr<MetricsCollector> collector)
    : config_(config)
    , sampler_(std::move(collector), config.resources.disk_mount_point,
               checked_capacity(config.history.resource_history, "resource_history"))
    , application_(checked_capacity(config.history.application_history, "application_history"),
                   checked_capacity(config.history.recent_errors, "recent_errors"))
    , alerts_(checked_capacity(config.history.alert_ledger, "alert_ledger"))
    , dashboard_(sampler_, application_, alerts_, health_)
    , scheduler_(std::make_unique<CollectionScheduler>(
          [this] { scheduled_tick(); },
          std::chrono::seconds(config.collection_interval)))
{
}

bool TelemetryService::initialize(bool start_scheduler) {
    bool expected = false;
    if (!initialized_.compare_exchange_strong(expected, true)) {
        Logger::warning("Telemetry service already initialized");
        return false;
    }

    Logger::info("Initializing telemetry service...");

    if (config_.alerts.enabled) {
        alerts_.load_rules(default_alert_rules(config_.alerts));
    } else {
        alerts_.load_rules({});
        Logger::info("Alert rules disabled by configuration");
    }

    if (start_scheduler) {
        scheduler_->start();
    }

    Logger::info("Telemetry service initialized");
    return true;
}

void TelemetryService::collect_once() {
    sampler_.sample();
    ApplicationSnapshot snapshot = application_.snapshot();
    alerts_.evaluate(snapshot, sampler_.latest());
}

void TelemetryService::scheduled_tick() {
    collect_once();

    std::function<void()> listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = tick_listener_;
    }
    if (listener) {
        listener();
    }
}

void TelemetryService::set_tick_listener(std::function<void()> listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    tick_listener_ = std::move(listener);
}

void TelemetryService::register_check(const std::string& name, HealthProbe probe) {
    health_.register_check(name, std::move(probe));
}

DashboardData TelemetryService::dashboard_data() const {
    return dashboard_.data();
}

MetricsHistory TelemetryService::metrics_history(double hours) const {
    return dashboard_.history(hours);
}

bool TelemetryService::resolve_alert(const std::string& id) {
    return alerts_.resolve_alert(id);
}

std::vector<Alert> TelemetryService::active_alerts() const {
    return alerts_.active_alerts();
}

std::vector<Alert> TelemetryService::all_alerts() const {
    return alerts_.all_alerts();
}

std::vector<Alert> TelemetryService::alerts_by_severity(Severity severity) const {
    return alerts_.alerts_by_severity(severity);
}

} // namespace telemon
