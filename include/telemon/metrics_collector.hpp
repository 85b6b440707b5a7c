#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace telemon {

// Cumulative scheduler ticks summed over every core
struct CpuTimes {
    uint64_t total_ticks = 0;
    uint64_t idle_ticks = 0;
};

struct MemoryUsage {
    uint64_t used_bytes = 0;
    uint64_t free_bytes = 0;
    uint64_t total_bytes = 0;
    double usage_percent = 0.0;
};

struct DiskUsage {
    uint64_t used_bytes = 0;
    uint64_t free_bytes = 0;
    uint64_t total_bytes = 0;
    double usage_percent = 0.0;
};

struct NetworkUsage {
    uint64_t bytes_in = 0;
    uint64_t bytes_out = 0;
    uint32_t active_connections = 0;
};

// Host instrumentation consumed by the resource sampler. Implementations may
// throw on probing failures; the collection scheduler isolates them.
class MetricsCollector {
public:
    virtual ~MetricsCollector() = default;

    virtual CpuTimes read_cpu_times() = 0;
    virtual std::vector<double> load_averages() = 0;
    virtual MemoryUsage collect_memory() = 0;
    virtual DiskUsage collect_disk(const std::string& mount_point) = 0;
    virtual NetworkUsage collect_network() = 0;
};

// Factory function
std::unique_ptr<MetricsCollector> create_metrics_collector();

} // namespace telemon
