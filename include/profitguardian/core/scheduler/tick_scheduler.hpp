#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace ProfitGuardian {

/**
 * @class TickScheduler
 * @brief Background thread firing ticks at a fixed interval
 *
 * Ticks run on the scheduler thread, one at a time. Slots that come due while
 * a tick is still running are reported through the skip callback and dropped,
 * never queued.
 */
class TickScheduler {
public:
    using TickFn = std::function<void(uint64_t tick_ms)>;
    using SkipFn = std::function<void(uint64_t slot_ms)>;

    TickScheduler(std::chrono::milliseconds interval, TickFn on_tick, SkipFn on_skip);
    ~TickScheduler() noexcept;

    void start();
    void stop();

    bool isRunning() const { return running_.load(std::memory_order_acquire); }
    uint64_t skippedSlots() const { return skipped_.load(std::memory_order_relaxed); }

private:
    void loop();

    std::chrono::milliseconds interval_;
    TickFn on_tick_;
    SkipFn on_skip_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> skipped_{0};
    std::thread worker_thread_;

    // For interruptible sleep during shutdown
    std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;
};

} // namespace ProfitGuardian
