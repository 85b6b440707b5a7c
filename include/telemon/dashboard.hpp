#pragma once

#include "telemon/alert_engine.hpp"
#include "telemon/application_aggregator.hpp"
#include "telemon/health_checker.hpp"
#include "telemon/resource_sampler.hpp"
#include <chrono>
#include <optional>
#include <vector>

namespace telemon {

struct DashboardData {
    std::optional<ResourceSample> resources;   // empty until the first sample
    ApplicationSnapshot application;
    std::vector<Alert> active_alerts;
    HealthReport health;
    std::chrono::duration<double> uptime{0.0};
};

struct MetricsHistory {
    std::vector<ResourceSample> resources;
    std::vector<ApplicationSnapshot> application;
};

// Read-only view over the collection components
class Dashboard {
public:
    Dashboard(const ResourceSampler& sampler,
              const ApplicationAggregator& application,
              const AlertEngine& alerts,
              const HealthChecker& health,
              std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now());

    // Runs every health probe
    DashboardData data() const;

    // Entries with timestamp >= now - hours, oldest first
    MetricsHistory history(double hours = 24.0,
                           std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    std::chrono::duration<double> uptime() const;

private:
    const ResourceSampler& sampler_;
    const ApplicationAggregator& application_;
    const AlertEngine& alerts_;
    const HealthChecker& health_;
    std::chrono::steady_clock::time_point started_;
};

} // namespace telemon
