#include <profitguardian/core/scheduler/tick_scheduler.hpp>
#include <profitguardian/core/utils/clock.hpp>

#include <spdlog/spdlog.h>

#include <exception>

using namespace ProfitGuardian;

TickScheduler::TickScheduler(std::chrono::milliseconds interval, TickFn on_tick, SkipFn on_skip)
    : interval_(interval), on_tick_(std::move(on_tick)), on_skip_(std::move(on_skip)) {}

TickScheduler::~TickScheduler() noexcept {
    stop();
}

void TickScheduler::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    worker_thread_ = std::thread(&TickScheduler::loop, this);
    spdlog::info("[Scheduler] Started tick loop (interval: {}s)", interval_.count() / 1000);
}

void TickScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(sleep_mutex_);
        running_.store(false, std::memory_order_release);
    }
    sleep_cv_.notify_all();  // Wake up sleeping thread immediately
    if (worker_thread_.joinable()) {
        worker_thread_.join();
        spdlog::info("[Scheduler] Stopped");
    }
}

void TickScheduler::loop() {
    using SteadyClock = std::chrono::steady_clock;

    // First tick fires immediately, later ones on the interval grid
    auto due = SteadyClock::now();
    uint64_t due_wall_ms = Clock::wall_ms();

    while (running_.load(std::memory_order_acquire)) {
        {
            std::unique_lock<std::mutex> lock(sleep_mutex_);
            sleep_cv_.wait_until(lock, due, [this]() {
                return !running_.load(std::memory_order_acquire);
            });
        }
        if (!running_.load(std::memory_order_acquire)) {
            break;
        }

        const uint64_t tick_ms = Clock::wall_ms();
        try {
            on_tick_(tick_ms);
        } catch (const std::exception& e) {
            spdlog::error("[Scheduler] Tick at {} threw: {}", tick_ms, e.what());
        }

        // Slots that elapsed during the tick are skipped, not queued
        due += interval_;
        due_wall_ms += static_cast<uint64_t>(interval_.count());
        const auto now = SteadyClock::now();
        while (due <= now) {
            skipped_.fetch_add(1, std::memory_order_relaxed);
            spdlog::warn("[Scheduler] Tick slot {} overlapped a running tick, skipping", due_wall_ms);
            if (on_skip_) {
                on_skip_(due_wall_ms);
            }
            due += interval_;
            due_wall_ms += static_cast<uint64_t>(interval_.count());
        }
    }
}
