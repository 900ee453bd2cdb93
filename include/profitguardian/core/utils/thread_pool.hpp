#pragma once
#include <vector>
#include <thread>
#include <atomic>
#include <queue>
#include <functional>
#include <condition_variable>
#include <mutex>

namespace ProfitGuardian {

/**
 * @class ThreadPool
 * @brief Bounded worker pool for per-entity platform calls within one tick
 *
 * Fetch batches and status updates are independent per entity, so they fan out
 * here. The tick thread calls waitIdle() before it merges results.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t numThreads);
    ~ThreadPool();

    void submit(std::function<void()> task);
    size_t getPendingTasks() const;

    /**
     * @brief Block until the queue is empty and no task is executing
     */
    void waitIdle();
    void shutdown();

    size_t size() const { return workers.size(); }

private:
    void workerLoop();

    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    mutable std::mutex queueMutex;  // mutable for const getPendingTasks
    std::condition_variable condition;
    std::condition_variable idleCondition;
    size_t activeTasks = 0;
    std::atomic<bool> isRunning;
};

} // namespace ProfitGuardian
