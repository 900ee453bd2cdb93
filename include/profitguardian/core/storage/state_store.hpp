#pragma once

#include <cstdint>
#include <deque>
#include <fstream>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <profitguardian/core/model/decision.hpp>
#include <profitguardian/core/model/ledger.hpp>
#include <profitguardian/core/model/metrics.hpp>
#include <profitguardian/core/storage/journal_codec.hpp>

namespace ProfitGuardian {

struct EntityStateView {
    LifecycleState state = LifecycleState::ACTIVE;
    std::optional<GuardianDecision> last_decision;
};

/**
 * @class StateStore
 * @brief Durable owner of lifecycle state, histories, loss ledgers and tick records
 *
 * Write path (single tick thread):
 *   encode -> append to journal -> flush -> update memory
 * A journal failure throws StoreUnavailableError before memory is touched,
 * so readers only ever see fully committed ticks.
 */
class StateStore {
public:
    static constexpr size_t MAX_TICK_RECORDS = 2048;

    /**
     * @param journal_path empty for a memory-only store
     */
    StateStore(std::string journal_path, size_t max_snapshots_per_entity);
    ~StateStore();

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    /**
     * @brief Replay the journal into memory and open it for appending
     * @return number of frames replayed
     * @throws StoreUnavailableError if the journal cannot be opened
     */
    size_t load();

    /**
     * @throws StoreUnavailableError on journal write failure; nothing is applied
     */
    void commitTick(const TickBatch& batch);

    /**
     * @brief Record a skipped or aborted tick
     * @throws StoreUnavailableError on journal write failure
     */
    void recordTickOutcome(const TickRecord& record);

    void flush();

    // ---- Queries (shared lock) ----
    std::optional<EntityStateView> getCurrentState(const std::string& entity_id) const;
    EntityRuntime runtime(const std::string& entity_id) const;
    std::optional<LossLedger> getLossLedger(const std::string& campaign_id) const;
    std::unordered_map<std::string, LossLedger> ledgers() const;

    /** Most recent first */
    std::vector<GuardianDecision> listDecisionHistory(const std::string& entity_id, size_t limit) const;
    /** Oldest first, full history */
    std::vector<GuardianDecision> decisionHistory(const std::string& entity_id) const;
    /** Oldest first, bounded */
    std::vector<MetricsSnapshot> snapshotHistory(const std::string& entity_id) const;
    std::optional<MetricsSnapshot> lastSnapshot(const std::string& entity_id) const;

    /** Most recent first */
    std::vector<TickRecord> listTickHistory(size_t limit) const;
    std::unordered_map<std::string, double> budgetOverrides() const;
    uint64_t lastCommittedTick() const;
    uint64_t committedTicks() const;

    bool isPersistent() const { return !journal_path_.empty(); }

private:
    void applyBatch(const TickBatch& batch);     // caller holds exclusive lock
    void appendRecord(const TickRecord& record); // caller holds exclusive lock
    void writeFrame(const std::vector<uint8_t>& bytes, uint64_t tick_ms);
    bool rollbackJournal();                      // caller holds journal_mutex_

    std::string journal_path_;
    size_t max_snapshots_;

    std::mutex journal_mutex_;
    std::ofstream journal_;
    uint64_t journal_bytes_ = 0;   // end of the last complete frame
    bool loaded_ = false;

    mutable std::shared_mutex state_mutex_;
    std::unordered_map<std::string, std::vector<GuardianDecision>> decisions_;
    std::unordered_map<std::string, std::deque<MetricsSnapshot>> snapshots_;
    std::unordered_map<std::string, LossLedger> ledgers_;
    std::unordered_map<std::string, double> budgets_;
    std::deque<TickRecord> ticks_;
    uint64_t last_committed_tick_ = 0;
    uint64_t committed_ticks_ = 0;
};

} // namespace ProfitGuardian
