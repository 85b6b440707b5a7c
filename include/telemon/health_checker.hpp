#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace telemon {

struct HealthCheckResult {
    bool healthy = false;
    std::map<std::string, std::string> details;
    std::optional<std::string> error;
};

// A probe reports its verdict or throws; it may block on its own I/O
using HealthProbe = std::function<HealthCheckResult()>;

struct NamedCheckResult {
    std::string name;
    HealthCheckResult result;
};

struct HealthReport {
    bool overall = true;
    std::vector<NamedCheckResult> checks;      // registration order
    std::chrono::system_clock::time_point timestamp;

    const HealthCheckResult* find(const std::string& name) const;
};

class HealthChecker {
public:
    // Last registration for a name wins; it keeps its first position
    void register_check(const std::string& name, HealthProbe probe);

    std::size_t check_count() const;

    // Runs every probe one after another. A throwing probe is recorded as
    // unhealthy with its message and does not stop the remaining probes.
    HealthReport run_all() const;

    bool is_healthy() const { return run_all().overall; }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<std::string, HealthProbe>> checks_;
};

} // namespace telemon
