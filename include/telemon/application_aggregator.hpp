#pragma once

#include "telemon/bounded_history.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace telemon {

struct SessionCounters {
    int64_t active = 0;
    uint64_t total = 0;
    uint64_t expired_count = 0;
};

struct CallCounters {
    uint64_t total = 0;
    uint64_t successful = 0;
    uint64_t failed = 0;
    double average_duration_ms = 0.0;
};

struct ApiCounters {
    uint64_t total_requests = 0;
    uint64_t successful_requests = 0;
    uint64_t failed_requests = 0;
    double average_response_time_ms = 0.0;
};

struct InferenceCounters {
    uint64_t total_requests = 0;
    uint64_t successful_requests = 0;
    uint64_t failed_requests = 0;
    double average_response_time_ms = 0.0;
    uint64_t tokens_consumed = 0;
};

struct ErrorRecord {
    std::chrono::system_clock::time_point timestamp;
    std::string kind;
    std::string message;
    std::optional<std::string> trace;
};

struct ErrorCounters {
    uint64_t total = 0;
    std::map<std::string, uint64_t> count_by_kind;
    std::vector<ErrorRecord> recent;    // oldest first
};

struct ApplicationSnapshot {
    std::chrono::system_clock::time_point timestamp;
    SessionCounters sessions;
    CallCounters calls;
    ApiCounters api;
    InferenceCounters inference;
    ErrorCounters errors;
};

// Cumulative application counters for the process lifetime. Recording calls
// mutate one live counter set; snapshot() freezes a copy into the history.
class ApplicationAggregator {
public:
    static constexpr std::size_t kDefaultHistorySize = 1000;
    static constexpr std::size_t kDefaultRecentErrors = 100;

    explicit ApplicationAggregator(std::size_t history_size = kDefaultHistorySize,
                                   std::size_t recent_errors = kDefaultRecentErrors);

    void record_session_start();
    void record_session_end(bool success);
    void record_call(bool success, double duration_ms);
    void record_api_request(bool success, double response_time_ms);
    void record_inference_request(bool success, double response_time_ms, uint64_t tokens = 0);
    void record_error(const std::string& kind, const std::string& message,
                      std::optional<std::string> trace = std::nullopt);

    // Copy the live counters into the history; live counters are not reset
    ApplicationSnapshot snapshot();

    ApplicationSnapshot current_snapshot() const;
    std::vector<ApplicationSnapshot> history() const;

private:
    ApplicationSnapshot copy_live_locked() const;
    static void update_average(double& average, uint64_t count, double value);

    mutable std::mutex mutex_;
    SessionCounters sessions_;
    CallCounters calls_;
    ApiCounters api_;
    InferenceCounters inference_;
    uint64_t error_total_ = 0;
    std::map<std::string, uint64_t> error_count_by_kind_;
    BoundedHistory<ErrorRecord> recent_errors_;
    BoundedHistory<ApplicationSnapshot> history_;
};

} // namespace telemon
