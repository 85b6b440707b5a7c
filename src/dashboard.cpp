#include "telemon/dashboard.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>

namespace telemon {

Dashboard::Dashboard(const ResourceSampler& sampler,
                     const ApplicationAggregator& application,
                     const AlertEngine& alerts,
                     const HealthChecker& health,
                     std::chrono::steady_clock::time_point started)
    : sampler_(sampler)
    , application_(application)
    , alerts_(alerts)
    , health_(health)
    , started_(started)
{
}

std::chrono::duration<double> Dashboard::uptime() const {
    return std::chrono::steady_clock::now() - started_;
}

DashboardData Dashboard::data() const {
    DashboardData data;
    data.resources = sampler_.latest();
    data.application = application_.current_snapshot();
    data.active_alerts = alerts_.active_alerts();
    data.health = health_.run_all();
    data.uptime = uptime();
    return data;
}

MetricsHistory Dashboard::history(double hours, std::chrono::system_clock::time_point now) const {
    // Windows reaching past the clock epoch (or NaN/inf) cover the whole history
    auto cutoff = std::chrono::system_clock::time_point::min();
    const double window_seconds = hours * 3600.0;
    const double since_epoch = std::chrono::duration<double>(now.time_since_epoch()).count();
    if (!std::isnan(window_seconds) && window_seconds < since_epoch) {
        cutoff = now - std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(std::max(0.0, window_seconds)));
    }

    MetricsHistory history;

    auto resources = sampler_.history();
    std::copy_if(resources.begin(), resources.end(), std::back_inserter(history.resources),
                 [cutoff](const ResourceSample& sample) { return sample.timestamp >= cutoff; });

    auto snapshots = application_.history();
    std::copy_if(snapshots.begin(), snapshots.end(), std::back_inserter(history.application),
                 [cutoff](const ApplicationSnapshot& snapshot) { return snapshot.timestamp >= cutoff; });

    return history;
}

} // namespace telemon
