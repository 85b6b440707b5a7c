#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace telemon {

// Periodic timer running one collection tick per interval on a background
// thread. A failed tick is logged and the timer keeps going.
class CollectionScheduler {
public:
    using Tick = std::function<void()>;

    static constexpr std::chrono::milliseconds kDefaultInterval{60000};

    explicit CollectionScheduler(Tick tick, std::chrono::milliseconds interval = kDefaultInterval);
    ~CollectionScheduler();

    CollectionScheduler(const CollectionScheduler&) = delete;
    CollectionScheduler& operator=(const CollectionScheduler&) = delete;

    // Returns false if already started
    bool start();
    bool is_running() const { return running_; }

    // Run one tick on the calling thread with the same error isolation
    bool run_tick();

    uint64_t completed_ticks() const { return completed_ticks_; }
    uint64_t failed_ticks() const { return failed_ticks_; }
    std::chrono::milliseconds interval() const { return interval_; }

private:
    void loop();
    void stop();

    Tick tick_;
    std::chrono::milliseconds interval_;

    std::mutex tick_mutex_;
    std::mutex wait_mutex_;
    std::condition_variable wake_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<uint64_t> completed_ticks_{0};
    std::atomic<uint64_t> failed_ticks_{0};
    std::thread thread_;
};

} // namespace telemon
