#include "telemon/health_checker.hpp"
#include "telemon/logger.hpp"
#include <algorithm>
#include <exception>
#include <stdexcept>

namespace telemon {

const HealthCheckResult* HealthReport::find(const std::string& name) const {
    auto it = std::find_if(checks.begin(), checks.end(),
                           [&name](const NamedCheckResult& check) { return check.name == name; });
    return it == checks.end() ? nullptr : &it->result;
}

void HealthChecker::register_check(const std::string& name, HealthProbe probe) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(checks_.begin(), checks_.end(),
                           [&name](const auto& entry) { return entry.first == name; });
    if (it != checks_.end()) {
        it->second = std::move(probe);
        Logger::debug("Health check replaced: ", name);
        return;
    }
    checks_.emplace_back(name, std::move(probe));
    Logger::debug("Health check registered: ", name);
}

std::size_t HealthChecker::check_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return checks_.size();
}

HealthReport HealthChecker::run_all() const {
    std::vector<std::pair<std::string, HealthProbe>> checks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        checks = checks_;
    }

    HealthReport report;
    for (const auto& [name, probe] : checks) {
        HealthCheckResult result;
        try {
            if (!probe) {
                throw std::runtime_error("probe not callable");
            }
            result = probe();
        } catch (const std::exception& e) {
            result = HealthCheckResult{};
            result.error = e.what();
        } catch (...) {
            result = HealthCheckResult{};
            result.error = "unknown error";
        }

        if (!result.healthy) {
            report.overall = false;
            Logger::warning("Health check '", name, "' unhealthy",
                            result.error ? ": " + *result.error : std::string());
        }
        report.checks.push_back(NamedCheckResult{name, std::move(result)});
    }

    report.timestamp = std::chrono::system_clock::now();
    return report;
}

} // namespace telemon
