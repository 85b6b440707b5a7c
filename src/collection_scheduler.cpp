#include "telemon/collection_scheduler.hpp"
#include "telemon/logger.hpp"
#include <exception>
#include <stdexcept>

namespace telemon {

CollectionScheduler::CollectionScheduler(Tick tick, std::chrono::milliseconds interval)
    : tick_(std::move(tick))
    , interval_(interval)
{
    if (!tick_) {
        throw std::invalid_argument("CollectionScheduler requires a tick function");
    }
    if (interval_.count() <= 0) {
        throw std::invalid_argument("CollectionScheduler interval must be positive");
    }
}

CollectionScheduler::~CollectionScheduler() {
    stop();
}

bool CollectionScheduler::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return false;
    }
    stopping_ = false;
    thread_ = std::thread(&CollectionScheduler::loop, this);
    Logger::info("Collection scheduler started (interval ", interval_.count(), " ms)");
    return true;
}

void CollectionScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stopping_ = true;
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
}

bool CollectionScheduler::run_tick() {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    try {
        tick_();
        ++completed_ticks_;
        return true;
    } catch (const std::exception& e) {
        Logger::error("Error in collection tick: ", e.what());
    } catch (...) {
        Logger::error("Error in collection tick: unknown exception");
    }
    ++failed_ticks_;
    return false;
}

void CollectionScheduler::loop() {
    auto next_tick = std::chrono::steady_clock::now() + interval_;

    while (true) {
        {
            std::unique_lock<std::mutex> lock(wait_mutex_);
            if (wake_.wait_until(lock, next_tick, [this] { return stopping_.load(); })) {
                return;
            }
        }

        run_tick();

        // Fixed cadence; skip missed slots if a tick overran the interval
        next_tick += interval_;
        auto now = std::chrono::steady_clock::now();
        while (next_tick <= now) {
            next_tick += interval_;
        }
    }
}

} // namespace telemon
