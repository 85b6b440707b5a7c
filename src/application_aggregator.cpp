#include "telemon/application_aggregator.hpp"

namespace telemon {

ApplicationAggregator::ApplicationAggregator(std::size_t history_size, std::size_t recent_errors)
    : recent_errors_(recent_errors)
    , history_(history_size)
{
}

void ApplicationAggregator::update_average(double& average, uint64_t count, double value) {
    // count was incremented by the caller
    if (count == 0) {
        return;
    }
    const double n = static_cast<double>(count);
    average = (average * (n - 1.0) + value) / n;
}

void ApplicationAggregator::record_session_start() {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.active += 1;
    sessions_.total += 1;
}

void ApplicationAggregator::record_session_end(bool success) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.active -= 1;
    if (!success) {
        sessions_.expired_count += 1;
    }
}

void ApplicationAggregator::record_call(bool success, double duration_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.total += 1;
    if (success) {
        calls_.successful += 1;
    } else {
        calls_.failed += 1;
    }

    // Weighted by the successful count on every call, failures included.
    // Until the first success there is no denominator and the average holds.
    update_average(calls_.average_duration_ms, calls_.successful, duration_ms);
}

void ApplicationAggregator::record_api_request(bool success, double response_time_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    api_.total_requests += 1;
    if (success) {
        api_.successful_requests += 1;
    } else {
        api_.failed_requests += 1;
    }
    update_average(api_.average_response_time_ms, api_.total_requests, response_time_ms);
}

void ApplicationAggregator::record_inference_request(bool success, double response_time_ms, uint64_t tokens) {
    std::lock_guard<std::mutex> lock(mutex_);
    inference_.total_requests += 1;
    if (success) {
        inference_.successful_requests += 1;
        inference_.tokens_consumed += tokens;
    } else {
        inference_.failed_requests += 1;
    }
    update_average(inference_.average_response_time_ms, inference_.total_requests, response_time_ms);
}

void ApplicationAggregator::record_error(const std::string& kind, const std::string& message,
                                         std::optional<std::string> trace) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_total_ += 1;
    error_count_by_kind_[kind] += 1;
    recent_errors_.push(ErrorRecord{std::chrono::system_clock::now(), kind, message, std::move(trace)});
}

ApplicationSnapshot ApplicationAggregator::copy_live_locked() const {
    ApplicationSnapshot snap;
    snap.timestamp = std::chrono::system_clock::now();
    snap.sessions = sessions_;
    snap.calls = calls_;
    snap.api = api_;
    snap.inference = inference_;
    snap.errors.total = error_total_;
    snap.errors.count_by_kind = error_count_by_kind_;
    snap.errors.recent = recent_errors_.to_vector();
    return snap;
}

ApplicationSnapshot ApplicationAggregator::current_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return copy_live_locked();
}

ApplicationSnapshot ApplicationAggregator::snapshot() {
    std::lock_guard<std::mutex> lock(mutex_);
    ApplicationSnapshot snap = copy_live_locked();
    history_.push(snap);
    return snap;
}

std::vector<ApplicationSnapshot> ApplicationAggregator::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.to_vector();
}

} // namespace telemon
