// ============================================================================
// TICK SCHEDULER UNIT TESTS
// ============================================================================
// Immediate first tick, skipped (not queued) slots, interruptible stop
// ============================================================================

#include <gtest/gtest.h>
#include <profitguardian/core/scheduler/tick_scheduler.hpp>

#include <stdexcept>

using namespace ProfitGuardian;
using namespace std::chrono_literals;

class TickSchedulerTest : public ::testing::Test {
protected:
    std::mutex mutex;
    std::condition_variable cv;
    int ticks = 0;
    int skips = 0;

    void countTick() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            ++ticks;
        }
        cv.notify_all();
    }

    bool waitForTicks(int n) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, 5s, [&]() { return ticks >= n; });
    }
};

TEST_F(TickSchedulerTest, FirstTickFiresImmediately) {
    TickScheduler scheduler(1h, [this](uint64_t) { countTick(); }, nullptr);
    scheduler.start();
    EXPECT_TRUE(scheduler.isRunning());
    ASSERT_TRUE(waitForTicks(1));

    // Stop interrupts the hour-long wait
    const auto before = std::chrono::steady_clock::now();
    scheduler.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - before, 1s);
    EXPECT_FALSE(scheduler.isRunning());
    EXPECT_EQ(ticks, 1);

    scheduler.stop();   // idempotent
}

TEST_F(TickSchedulerTest, SlowTickSkipsMissedSlots) {
    bool first = true;
    TickScheduler scheduler(
        10ms,
        [&](uint64_t) {
            if (first) {
                first = false;
                std::this_thread::sleep_for(55ms);
            }
            countTick();
        },
        [this](uint64_t) {
            std::lock_guard<std::mutex> lock(mutex);
            ++skips;
        });

    scheduler.start();
    ASSERT_TRUE(waitForTicks(2));
    scheduler.stop();

    // Slots at 10..50 ms came due during the first tick
    EXPECT_GE(scheduler.skippedSlots(), 4u);
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(static_cast<uint64_t>(skips), scheduler.skippedSlots());
}

TEST_F(TickSchedulerTest, ThrowingTickDoesNotStopLoop) {
    TickScheduler scheduler(
        10ms,
        [this](uint64_t) {
            countTick();
            if (ticks == 1) {
                throw std::runtime_error("tick failed");
            }
        },
        nullptr);

    scheduler.start();
    EXPECT_TRUE(waitForTicks(3));
    scheduler.stop();
}
