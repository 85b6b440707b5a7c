#pragma once

#include "telemon/bounded_history.hpp"
#include "telemon/metrics_collector.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace telemon {

struct CpuSample {
    double usage_percent = 0.0;              // 0-100%
    std::vector<double> load_averages;       // 1, 5 and 15 minute
};

struct ResourceSample {
    std::chrono::system_clock::time_point timestamp;
    CpuSample cpu;
    MemoryUsage memory;
    DiskUsage disk;
    NetworkUsage network;
};

class ResourceSampler {
public:
    static constexpr std::size_t kDefaultHistorySize = 1000;

    ResourceSampler(std::unique_ptr<MetricsCollector> collector,
                    std::string disk_mount_point = "/",
                    std::size_t history_size = kDefaultHistorySize);

    // Take a sample, append it to the history and return it.
    // Collector failures propagate to the caller.
    ResourceSample sample();

    std::optional<ResourceSample> latest() const;
    std::vector<ResourceSample> history() const;

private:
    double cpu_usage_since_last_read();

    std::unique_ptr<MetricsCollector> collector_;
    std::string disk_mount_point_;
    CpuTimes prev_cpu_;

    mutable std::mutex mutex_;
    BoundedHistory<ResourceSample> history_;
};

} // namespace telemon
