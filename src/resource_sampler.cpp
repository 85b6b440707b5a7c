#include "telemon/resource_sampler.hpp"
#include <cmath>
#include <stdexcept>

namespace telemon {

ResourceSampler::ResourceSampler(std::unique_ptr<MetricsCollector> collector,
                                 std::string disk_mount_point,
                                 std::size_t history_size)
    : collector_(std::move(collector))
    , disk_mount_point_(std::move(disk_mount_point))
    , history_(history_size)
{
    if (!collector_) {
        throw std::invalid_argument("ResourceSampler requires a metrics collector");
    }
    // Baseline for the first delta
    prev_cpu_ = collector_->read_cpu_times();
}

double ResourceSampler::cpu_usage_since_last_read() {
    CpuTimes now = collector_->read_cpu_times();

    uint64_t total_diff = now.total_ticks >= prev_cpu_.total_ticks ? now.total_ticks - prev_cpu_.total_ticks : 0;
    uint64_t idle_diff = now.idle_ticks >= prev_cpu_.idle_ticks ? now.idle_ticks - prev_cpu_.idle_ticks : 0;
    prev_cpu_ = now;

    if (total_diff == 0) {
        return 0.0;
    }
    return 100.0 - std::round(100.0 * static_cast<double>(idle_diff) / static_cast<double>(total_diff));
}

ResourceSample ResourceSampler::sample() {
    std::lock_guard<std::mutex> lock(mutex_);

    ResourceSample sample;
    sample.timestamp = std::chrono::system_clock::now();
    sample.cpu.usage_percent = cpu_usage_since_last_read();
    sample.cpu.load_averages = collector_->load_averages();
    sample.memory = collector_->collect_memory();
    sample.disk = collector_->collect_disk(disk_mount_point_);
    sample.network = collector_->collect_network();

    history_.push(sample);
    return sample;
}

std::optional<ResourceSample> ResourceSampler::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (history_.empty()) {
        return std::nullopt;
    }
    return history_.back();
}

std::vector<ResourceSample> ResourceSampler::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.to_vector();
}

} // namespace telemon
