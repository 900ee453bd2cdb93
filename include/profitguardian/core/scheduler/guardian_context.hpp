#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <profitguardian/core/applier/action_applier.hpp>
#include <profitguardian/core/config/app_config.hpp>
#include <profitguardian/core/engine/decision_engine.hpp>
#include <profitguardian/core/evaluator/performance_evaluator.hpp>
#include <profitguardian/core/fetcher/metrics_fetcher.hpp>
#include <profitguardian/core/platform/ads_platform.hpp>
#include <profitguardian/core/protector/capital_protector.hpp>
#include <profitguardian/core/scheduler/tick_scheduler.hpp>
#include <profitguardian/core/storage/state_store.hpp>
#include <profitguardian/core/utils/backoff.hpp>
#include <profitguardian/core/utils/thread_pool.hpp>

namespace ProfitGuardian {

struct LossLedgerView {
    std::string campaign_id;
    double cumulative_loss = 0.0;
    uint64_t window_start_ms = 0;
    bool halted = false;
    uint64_t halted_since_ms = 0;
    std::string halt_reason;
};

struct GuardianStats {
    uint64_t ticks_committed = 0;
    uint64_t ticks_skipped_overlap = 0;
    uint64_t ticks_skipped_disabled = 0;
    uint64_t ticks_aborted = 0;
    uint64_t actions_applied = 0;
    uint64_t actions_failed = 0;
    uint64_t stale_entities = 0;
    uint64_t last_tick_ms = 0;
    uint64_t last_tick_duration_ms = 0;
    size_t pending_commands = 0;
    bool enabled = false;
    bool running = false;
};

/**
 * @class GuardianContext
 * @brief Process-wide owner of the control loop
 *
 * Owns the store, the components, the worker pool, the scheduler and the
 * operator command queue. One tick at a time:
 *
 *   commands -> fetch -> evaluate -> protect -> decide -> apply -> commit
 *
 * Anything thrown before commit (PlatformUnavailableError,
 * StoreUnavailableError) aborts the tick and leaves the store untouched.
 */
class GuardianContext {
public:
    GuardianContext(const AppConfig::AppConfiguration& config,
                    AdsPlatform& platform,
                    Sleeper sleeper = threadSleeper());
    ~GuardianContext() noexcept;

    GuardianContext(const GuardianContext&) = delete;
    GuardianContext& operator=(const GuardianContext&) = delete;

    /**
     * @brief Load persisted state and cross-check it against decision replay
     * @throws StoreUnavailableError if the journal cannot be opened
     */
    void init();
    void start();
    void stop();

    /**
     * @brief Stop the scheduler, wait for the in-flight tick, flush the store
     */
    void shutdown();

    /**
     * @brief Run one tick now; rejected with SKIPPED_OVERLAP if one is running
     */
    TickRecord runNow();
    TickRecord runTickAt(uint64_t tick_ms);

    void enable();
    void disable();
    bool isEnabled() const { return enabled_.load(std::memory_order_acquire); }

    // ---- Operator commands, applied at the start of the next tick ----
    bool requestManualPause(const std::string& entity_id);
    bool requestManualRelease(const std::string& entity_id);
    bool updateBudget(const std::string& entity_id, double daily_budget);

    // ---- Status queries ----
    std::optional<EntityStateView> getCurrentState(const std::string& entity_id) const;
    std::optional<LossLedgerView> getLossLedger(const std::string& campaign_id) const;
    std::vector<GuardianDecision> listDecisionHistory(const std::string& entity_id, size_t limit) const;
    std::vector<TickRecord> listTickHistory(size_t limit) const;
    GuardianStats getStats() const;

    const StateStore& store() const { return *store_; }
    const DecisionEngine& engine() const { return engine_; }

private:
    enum class CommandType : uint8_t { MANUAL_PAUSE, MANUAL_RELEASE, BUDGET };

    struct PendingCommand {
        CommandType type;
        std::string entity_id;
        double budget = 0.0;
    };

    TickRecord executeTick(uint64_t tick_ms);
    TickBatch buildTick(uint64_t tick_ms, const std::vector<PendingCommand>& commands);
    TickRecord recordSkip(uint64_t tick_ms, TickOutcome outcome, const std::string& reason);

    bool enqueue(PendingCommand command);
    std::vector<PendingCommand> drainCommands();
    void restoreCommands(std::vector<PendingCommand> commands);

    void reportTick(const TickBatch& batch) const;

    AppConfig::AppConfiguration config_;
    AdsPlatform& platform_;
    std::unordered_map<std::string, size_t> entity_index_;
    std::map<std::string, int> campaign_ranks_;

    std::unique_ptr<StateStore> store_;
    ThreadPool pool_;
    MetricsFetcher fetcher_;
    PerformanceEvaluator evaluator_;
    CapitalProtector protector_;
    DecisionEngine engine_;
    ActionApplier applier_;
    std::unique_ptr<TickScheduler> scheduler_;

    std::atomic<bool> enabled_;
    std::atomic<bool> initialized_{false};
    std::atomic<bool> shut_down_{false};
    std::mutex tick_mutex_;

    mutable std::mutex command_mutex_;
    std::vector<PendingCommand> commands_;

    std::atomic<uint64_t> ticks_committed_{0};
    std::atomic<uint64_t> ticks_skipped_overlap_{0};
    std::atomic<uint64_t> ticks_skipped_disabled_{0};
    std::atomic<uint64_t> ticks_aborted_{0};
    std::atomic<uint64_t> actions_applied_{0};
    std::atomic<uint64_t> actions_failed_{0};
    std::atomic<uint64_t> stale_entities_{0};
    std::atomic<uint64_t> last_tick_ms_{0};
    std::atomic<uint64_t> last_tick_duration_ms_{0};
};

} // namespace ProfitGuardian
