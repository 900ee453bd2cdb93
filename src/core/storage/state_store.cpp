#include <profitguardian/core/storage/state_store.hpp>
#include <profitguardian/core/model/errors.hpp>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iterator>

namespace ProfitGuardian {

StateStore::StateStore(std::string journal_path, size_t max_snapshots_per_entity)
    : journal_path_(std::move(journal_path)),
      max_snapshots_(max_snapshots_per_entity == 0 ? 1 : max_snapshots_per_entity) {}

StateStore::~StateStore() {
    if (journal_.is_open()) {
        journal_.flush();
        journal_.close();
    }
}

size_t StateStore::load() {
    if (journal_path_.empty()) {
        spdlog::info("[StateStore] Memory-only store (no journal path)");
        return 0;
    }

    std::vector<uint8_t> image;
    {
        std::ifstream in(journal_path_, std::ios::binary);
        if (in.is_open()) {
            image.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        }
    }

    DecodeResult decoded = decodeJournal(image.data(), image.size());
    if (decoded.valid_bytes < image.size()) {
        spdlog::warn("[StateStore] Discarding {} trailing journal bytes ({})",
                     image.size() - decoded.valid_bytes, decoded.error);
        std::error_code ec;
        std::filesystem::resize_file(journal_path_, decoded.valid_bytes, ec);
        if (ec) {
            spdlog::error("[StateStore] Failed to truncate journal {}: {}", journal_path_, ec.message());
            throw StoreUnavailableError("cannot truncate corrupt journal tail: " + ec.message());
        }
    }

    {
        std::unique_lock<std::shared_mutex> lock(state_mutex_);
        for (const auto& f : decoded.frames) {
            if (f.type == FrameType::TICK_COMMIT) {
                applyBatch(f.batch);
            } else {
                appendRecord(f.batch.record);
            }
        }
    }

    std::lock_guard<std::mutex> jlock(journal_mutex_);
    journal_.open(journal_path_, std::ios::binary | std::ios::app);
    if (!journal_.is_open()) {
        spdlog::error("[StateStore] Failed to open journal at {}", journal_path_);
        throw StoreUnavailableError("failed to open journal " + journal_path_);
    }
    journal_bytes_ = decoded.valid_bytes;
    loaded_ = true;

    spdlog::info("[StateStore] Loaded {} frames from {} ({} entities, {} campaigns)",
                 decoded.frames.size(), journal_path_, decisions_.size(), ledgers_.size());
    return decoded.frames.size();
}

bool StateStore::rollbackJournal() {
    if (journal_.is_open()) {
        journal_.close();
    }
    std::error_code ec;
    std::filesystem::resize_file(journal_path_, journal_bytes_, ec);
    if (ec) {
        spdlog::error("[StateStore] Failed to roll journal back to {} bytes: {}", journal_bytes_, ec.message());
        return false;
    }
    journal_.clear();
    journal_.open(journal_path_, std::ios::binary | std::ios::app);
    return journal_.is_open();
}

void StateStore::writeFrame(const std::vector<uint8_t>& bytes, uint64_t tick_ms) {
    if (journal_path_.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(journal_mutex_);
    if (!loaded_) {
        throw StoreUnavailableError("journal not open");
    }

    // Bytes past the last good frame (a failed earlier write) would hide every later frame.
    // A journal that vanished from disk cannot be restored and fails the write.
    std::error_code ec;
    const uint64_t on_disk = std::filesystem::file_size(journal_path_, ec);
    if (!journal_.is_open() || ec || on_disk != journal_bytes_) {
        spdlog::warn("[StateStore] Journal holds {} bytes, expected {}; rolling back to last frame",
                     ec ? 0 : on_disk, journal_bytes_);
        if (!rollbackJournal()) {
            throw StoreUnavailableError("cannot restore journal to last committed frame");
        }
    }

    journal_.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    journal_.flush();
    if (!journal_.good()) {
        spdlog::error("[StateStore] Failed to write tick {} to journal", tick_ms);
        if (!rollbackJournal()) {
            spdlog::error("[StateStore] Journal left closed; next write retries the rollback");
        }
        throw StoreUnavailableError("journal write failed");
    }
    journal_bytes_ += bytes.size();
}

void StateStore::commitTick(const TickBatch& batch) {
    writeFrame(encodeTickCommit(batch), batch.record.tick_ms);

    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    applyBatch(batch);
}

void StateStore::recordTickOutcome(const TickRecord& record) {
    writeFrame(encodeTickOutcome(record), record.tick_ms);

    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    appendRecord(record);
}

void StateStore::flush() {
    std::lock_guard<std::mutex> lock(journal_mutex_);
    if (journal_.is_open()) {
        journal_.flush();
    }
}

void StateStore::applyBatch(const TickBatch& batch) {
    for (const auto& s : batch.snapshots) {
        auto& history = snapshots_[s.entity_id];
        history.push_back(s);
        while (history.size() > max_snapshots_) {
            history.pop_front();
        }
    }
    for (const auto& d : batch.decisions) {
        decisions_[d.entity_id].push_back(d);
    }
    for (const auto& l : batch.ledgers) {
        ledgers_[l.campaign_id] = l;
    }
    for (const auto& [id, budget] : batch.budget_updates) {
        budgets_[id] = budget;
    }
    appendRecord(batch.record);
    last_committed_tick_ = batch.record.tick_ms;
    ++committed_ticks_;
}

void StateStore::appendRecord(const TickRecord& record) {
    ticks_.push_back(record);
    while (ticks_.size() > MAX_TICK_RECORDS) {
        ticks_.pop_front();
    }
}

// ============================================================================
// Queries
// ============================================================================

std::optional<EntityStateView> StateStore::getCurrentState(const std::string& entity_id) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    auto it = decisions_.find(entity_id);
    if (it == decisions_.end() || it->second.empty()) {
        return std::nullopt;
    }
    EntityStateView view;
    view.last_decision = it->second.back();
    view.state = view.last_decision->resultingState();
    return view;
}

EntityRuntime StateStore::runtime(const std::string& entity_id) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    auto it = decisions_.find(entity_id);
    if (it == decisions_.end() || it->second.empty()) {
        return EntityRuntime{};
    }
    return runtimeAfter(it->second.back());
}

std::optional<LossLedger> StateStore::getLossLedger(const std::string& campaign_id) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    auto it = ledgers_.find(campaign_id);
    if (it == ledgers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::unordered_map<std::string, LossLedger> StateStore::ledgers() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return ledgers_;
}

std::vector<GuardianDecision> StateStore::listDecisionHistory(const std::string& entity_id, size_t limit) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    std::vector<GuardianDecision> out;
    auto it = decisions_.find(entity_id);
    if (it == decisions_.end()) {
        return out;
    }
    const auto& history = it->second;
    for (auto rit = history.rbegin(); rit != history.rend() && out.size() < limit; ++rit) {
        out.push_back(*rit);
    }
    return out;
}

std::vector<GuardianDecision> StateStore::decisionHistory(const std::string& entity_id) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    auto it = decisions_.find(entity_id);
    if (it == decisions_.end()) {
        return {};
    }
    return it->second;
}

std::vector<MetricsSnapshot> StateStore::snapshotHistory(const std::string& entity_id) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    auto it = snapshots_.find(entity_id);
    if (it == snapshots_.end()) {
        return {};
    }
    return std::vector<MetricsSnapshot>(it->second.begin(), it->second.end());
}

std::optional<MetricsSnapshot> StateStore::lastSnapshot(const std::string& entity_id) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    auto it = snapshots_.find(entity_id);
    if (it == snapshots_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back();
}

std::vector<TickRecord> StateStore::listTickHistory(size_t limit) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    std::vector<TickRecord> out;
    for (auto rit = ticks_.rbegin(); rit != ticks_.rend() && out.size() < limit; ++rit) {
        out.push_back(*rit);
    }
    return out;
}

std::unordered_map<std::string, double> StateStore::budgetOverrides() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return budgets_;
}

uint64_t StateStore::lastCommittedTick() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return last_committed_tick_;
}

uint64_t StateStore::committedTicks() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return committed_ticks_;
}

} // namespace ProfitGuardian
