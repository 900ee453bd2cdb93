#include <profitguardian/core/scheduler/guardian_context.hpp>
#include <profitguardian/core/model/errors.hpp>
#include <profitguardian/core/utils/clock.hpp>

#include <spdlog/spdlog.h>


namespace ProfitGuardian {

GuardianContext::GuardianContext(const AppConfig::AppConfiguration& config,
                                 AdsPlatform& platform,
                                 Sleeper sleeper)
    : config_(config),
      platform_(platform),
      store_(std::make_unique<StateStore>(config.storage.journal_path,
                                          config.storage.max_snapshots_per_entity)),
      pool_(config.fetcher.workers),
      fetcher_(platform, pool_, config.fetcher, sleeper),
      evaluator_(config.evaluator),
      protector_(config.protector, evaluator_),
      engine_(config.guardian.hysteresis_ticks),
      applier_(platform, pool_, config.applier, sleeper),
      enabled_(config.guardian.enabled) {
    for (size_t i = 0; i < config_.entities.size(); ++i) {
        entity_index_[config_.entities[i].id] = i;
    }
    campaign_ranks_ = CapitalProtector::coarsestRanks(config_.entities);

    scheduler_ = std::make_unique<TickScheduler>(
        std::chrono::milliseconds(static_cast<uint64_t>(config_.guardian.tick_interval_seconds) * 1000),
        [this](uint64_t tick_ms) { executeTick(tick_ms); },
        [this](uint64_t slot_ms) {
            recordSkip(slot_ms, TickOutcome::SKIPPED_OVERLAP, "previous tick still running");
        });

    spdlog::info("[GuardianContext] {} v{}: {} entities, tick every {}s, K={}",
                 config_.app_name, config_.version, config_.entities.size(),
                 config_.guardian.tick_interval_seconds, config_.guardian.hysteresis_ticks);
}

GuardianContext::~GuardianContext() noexcept {
    try {
        shutdown();
    } catch (const std::exception& e) {
        spdlog::error("[GuardianContext] Shutdown error: {}", e.what());
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

void GuardianContext::init() {
    const size_t frames = store_->load();

    // Stored streaks and states must agree with a replay of the decision log
    size_t restored = 0;
    for (const auto& entity : config_.entities) {
        const auto history = store_->decisionHistory(entity.id);
        if (history.empty()) {
            continue;
        }
        ++restored;
        const EntityRuntime replayed = engine_.replay(history);
        const EntityRuntime stored = store_->runtime(entity.id);
        if (replayed.state != stored.state
            || replayed.negative_streak != stored.negative_streak
            || replayed.positive_streak != stored.positive_streak
            || replayed.paced != stored.paced) {
            spdlog::warn("[GuardianContext] Replay mismatch for {}: stored {} (-{}/+{}) replayed {} (-{}/+{})",
                         entity.id, GuardianDecision::stateString(stored.state),
                         stored.negative_streak, stored.positive_streak,
                         GuardianDecision::stateString(replayed.state),
                         replayed.negative_streak, replayed.positive_streak);
        }
    }

    initialized_.store(true, std::memory_order_release);
    spdlog::info("[GuardianContext] Initialized: {} journal frames, {} entities restored",
                 frames, restored);
}

void GuardianContext::start() {
    if (!initialized_.load(std::memory_order_acquire)) {
        init();
    }
    scheduler_->start();
}

void GuardianContext::stop() {
    if (scheduler_) {
        scheduler_->stop();
    }
}

void GuardianContext::shutdown() {
    if (shut_down_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    stop();
    // Wait for a manual tick still in flight
    std::lock_guard<std::mutex> lock(tick_mutex_);
    pool_.shutdown();
    store_->flush();
    spdlog::info("[GuardianContext] Shutdown complete");
}

void GuardianContext::enable() {
    enabled_.store(true, std::memory_order_release);
    spdlog::info("[GuardianContext] Guardian ENABLED");
}

void GuardianContext::disable() {
    enabled_.store(false, std::memory_order_release);
    spdlog::warn("[GuardianContext] Guardian DISABLED, ticks will be skipped");
}

// ============================================================================
// Operator commands
// ============================================================================

bool GuardianContext::enqueue(PendingCommand command) {
    if (entity_index_.count(command.entity_id) == 0) {
        spdlog::warn("[GuardianContext] Command for unknown entity {} ignored", command.entity_id);
        return false;
    }
    std::lock_guard<std::mutex> lock(command_mutex_);
    commands_.push_back(std::move(command));
    return true;
}

bool GuardianContext::requestManualPause(const std::string& entity_id) {
    return enqueue(PendingCommand{CommandType::MANUAL_PAUSE, entity_id, 0.0});
}

bool GuardianContext::requestManualRelease(const std::string& entity_id) {
    return enqueue(PendingCommand{CommandType::MANUAL_RELEASE, entity_id, 0.0});
}

bool GuardianContext::updateBudget(const std::string& entity_id, double daily_budget) {
    if (daily_budget < 0.0) {
        spdlog::warn("[GuardianContext] Negative budget {} for {} rejected", daily_budget, entity_id);
        return false;
    }
    return enqueue(PendingCommand{CommandType::BUDGET, entity_id, daily_budget});
}

std::vector<GuardianContext::PendingCommand> GuardianContext::drainCommands() {
    std::lock_guard<std::mutex> lock(command_mutex_);
    std::vector<PendingCommand> drained;
    drained.swap(commands_);
    return drained;
}

void GuardianContext::restoreCommands(std::vector<PendingCommand> commands) {
    if (commands.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(command_mutex_);
    commands.insert(commands.end(), commands_.begin(), commands_.end());
    commands_.swap(commands);
}

// ============================================================================
// Tick execution
// ============================================================================

TickRecord GuardianContext::runNow() {
    return executeTick(Clock::wall_ms());
}

TickRecord GuardianContext::runTickAt(uint64_t tick_ms) {
    return executeTick(tick_ms);
}

TickRecord GuardianContext::recordSkip(uint64_t tick_ms, TickOutcome outcome, const std::string& reason) {
    TickRecord record;
    record.tick_ms = tick_ms;
    record.outcome = outcome;
    record.reason = reason;

    switch (outcome) {
        case TickOutcome::SKIPPED_OVERLAP:
            ticks_skipped_overlap_.fetch_add(1, std::memory_order_relaxed);
            spdlog::warn("[GuardianContext] Tick {} SKIPPED_OVERLAP: {}", tick_ms, reason);
            break;
        case TickOutcome::SKIPPED_DISABLED:
            ticks_skipped_disabled_.fetch_add(1, std::memory_order_relaxed);
            spdlog::info("[GuardianContext] Tick {} SKIPPED_DISABLED", tick_ms);
            break;
        case TickOutcome::ABORTED:
            ticks_aborted_.fetch_add(1, std::memory_order_relaxed);
            spdlog::error("[GuardianContext] Tick {} ABORTED: {}", tick_ms, reason);
            break;
        case TickOutcome::COMMITTED:
        default:
            break;
    }

    try {
        store_->recordTickOutcome(record);
    } catch (const StoreUnavailableError& e) {
        spdlog::error("[GuardianContext] Could not journal outcome of tick {}: {}", tick_ms, e.what());
    }
    return record;
}

TickRecord GuardianContext::executeTick(uint64_t tick_ms) {
    std::unique_lock<std::mutex> tick_lock(tick_mutex_, std::try_to_lock);
    if (!tick_lock.owns_lock()) {
        return recordSkip(tick_ms, TickOutcome::SKIPPED_OVERLAP, "tick already in progress");
    }
    if (!enabled_.load(std::memory_order_acquire)) {
        return recordSkip(tick_ms, TickOutcome::SKIPPED_DISABLED, "guardian disabled");
    }

    const uint64_t started = Clock::now_ms();
    auto commands = drainCommands();

    TickBatch batch;
    try {
        batch = buildTick(tick_ms, commands);
        batch.record.duration_ms = Clock::now_ms() - started;
        store_->commitTick(batch);
    } catch (const PlatformUnavailableError& e) {
        restoreCommands(std::move(commands));
        return recordSkip(tick_ms, TickOutcome::ABORTED, std::string("platform unavailable: ") + e.what());
    } catch (const StoreUnavailableError& e) {
        // Status changes already on the platform are not in the journal
        for (const auto& d : batch.decisions) {
            if (d.outcome == ActionOutcome::APPLIED) {
                spdlog::error("[GuardianContext] {} applied on platform but not committed (key {})",
                              d.entity_id, d.idempotency_key);
            }
        }
        restoreCommands(std::move(commands));
        return recordSkip(tick_ms, TickOutcome::ABORTED, std::string("store unavailable: ") + e.what());
    } catch (const std::exception& e) {
        restoreCommands(std::move(commands));
        return recordSkip(tick_ms, TickOutcome::ABORTED, std::string("tick failed: ") + e.what());
    }

    ticks_committed_.fetch_add(1, std::memory_order_relaxed);
    actions_applied_.fetch_add(batch.record.applied, std::memory_order_relaxed);
    actions_failed_.fetch_add(batch.record.failed, std::memory_order_relaxed);
    stale_entities_.fetch_add(batch.record.stale, std::memory_order_relaxed);
    last_tick_ms_.store(tick_ms, std::memory_order_relaxed);
    last_tick_duration_ms_.store(batch.record.duration_ms, std::memory_order_relaxed);

    reportTick(batch);
    return batch.record;
}

TickBatch GuardianContext::buildTick(uint64_t tick_ms, const std::vector<PendingCommand>& commands) {
    TickBatch batch;
    batch.record.tick_ms = tick_ms;
    batch.record.outcome = TickOutcome::COMMITTED;

    // ---- 1. Operator commands ----
    auto budgets = store_->budgetOverrides();
    std::unordered_map<std::string, OperatorCommand> operator_commands;
    for (const auto& cmd : commands) {
        switch (cmd.type) {
            case CommandType::BUDGET:
                budgets[cmd.entity_id] = cmd.budget;
                batch.budget_updates[cmd.entity_id] = cmd.budget;
                spdlog::info("[GuardianContext] Budget for {} set to {:.2f}", cmd.entity_id, cmd.budget);
                break;
            case CommandType::MANUAL_PAUSE:
                operator_commands[cmd.entity_id] = OperatorCommand::MANUAL_PAUSE;
                break;
            case CommandType::MANUAL_RELEASE:
                operator_commands[cmd.entity_id] = OperatorCommand::MANUAL_RELEASE;
                break;
        }
    }

    std::vector<ManagedEntity> entities = config_.entities;
    std::vector<std::string> ids;
    for (auto& entity : entities) {
        auto b = budgets.find(entity.id);
        if (b != budgets.end()) {
            entity.daily_budget = b->second;
        }
        ids.push_back(entity.id);
    }

    // ---- 2. Fetch (throws PlatformUnavailableError) ----
    ReportingWindow window;
    window.end_ms = tick_ms;
    const uint64_t last = store_->lastCommittedTick();
    const uint64_t interval_ms = static_cast<uint64_t>(config_.guardian.tick_interval_seconds) * 1000;
    window.start_ms = (last > 0 && last < tick_ms) ? last
                    : (tick_ms > interval_ms ? tick_ms - interval_ms : 0);
    FetchOutcome fetched = fetcher_.fetch(ids, window);

    // ---- 3. Evaluate ----
    std::unordered_map<std::string, EntityEvaluation> evaluations;
    std::vector<EntityInterval> intervals;
    for (const auto& entity : entities) {
        auto snap = fetched.snapshots.find(entity.id);
        if (snap == fetched.snapshots.end()) {
            continue;
        }
        const auto history = store_->snapshotHistory(entity.id);
        evaluations[entity.id] = evaluator_.evaluate(entity, snap->second, history);

        const MetricsSnapshot* previous = history.empty() ? nullptr : &history.back();
        intervals.push_back(EntityInterval{entity.id, entity.campaign_id, rollupRank(entity.scope),
                                           PerformanceEvaluator::intervalDelta(previous, snap->second)});
        batch.snapshots.push_back(snap->second);
    }

    // ---- 4. Protect ----
    ProtectorResult protection = protector_.assess(tick_ms, campaign_ranks_, store_->ledgers(), intervals);
    for (auto& [campaign_id, ledger] : protection.ledgers) {
        batch.ledgers.push_back(std::move(ledger));
    }

    // ---- 5. Decide ----
    for (const auto& entity : entities) {
        const EntityRuntime runtime = store_->runtime(entity.id);

        auto cmd = operator_commands.find(entity.id);
        if (cmd != operator_commands.end()) {
            const bool redundant =
                (cmd->second == OperatorCommand::MANUAL_PAUSE && runtime.state == LifecycleState::MANUALLY_PAUSED)
                || (cmd->second == OperatorCommand::MANUAL_RELEASE && runtime.state != LifecycleState::MANUALLY_PAUSED);
            if (!redundant) {
                batch.decisions.push_back(engine_.operatorDecision(entity, runtime, cmd->second, tick_ms));
                continue;
            }
            spdlog::warn("[GuardianContext] Operator command for {} has no effect in state {}",
                         entity.id, GuardianDecision::stateString(runtime.state));
        }

        auto ev = evaluations.find(entity.id);
        const EntityEvaluation* evaluation = ev != evaluations.end() ? &ev->second : nullptr;
        batch.decisions.push_back(engine_.decide(entity, runtime, evaluation,
                                                 protection.isHalted(entity.campaign_id), tick_ms));
    }

    // ---- 6. Apply ----
    const ApplyReport applied = applier_.apply(batch.decisions, Clock::wall_ms());

    batch.record.evaluated = static_cast<uint32_t>(evaluations.size());
    batch.record.stale = static_cast<uint32_t>(fetched.stale.size());
    batch.record.applied = applied.applied;
    batch.record.failed = applied.failed;
    return batch;
}

void GuardianContext::reportTick(const TickBatch& batch) const {
    const auto& r = batch.record;
    auto log_level = (r.failed > 0 || r.stale > 0) ? spdlog::level::warn : spdlog::level::info;

    spdlog::log(log_level, "╔════════════════════════════════════════════════════════════╗");
    spdlog::log(log_level, "║              GUARDIAN TICK REPORT                          ║");
    spdlog::log(log_level, "╠════════════════════════════════════════════════════════════╣");

    for (const auto& d : batch.decisions) {
        if (d.action == ActionIntent::NONE && d.reason != ReasonCode::STALE_DATA) {
            spdlog::debug("║ {:20} │ {:16} │ {:22} ║", d.entity_id,
                          GuardianDecision::stateString(d.resultingState()),
                          GuardianDecision::reasonString(d.reason));
            continue;
        }
        spdlog::log(log_level, "║ {:20} │ {:6} │ {:16} │ {:12} ║", d.entity_id,
                    GuardianDecision::actionString(d.action),
                    GuardianDecision::reasonString(d.reason),
                    GuardianDecision::outcomeString(d.outcome));
    }

    for (const auto& l : batch.ledgers) {
        if (l.halted) {
            spdlog::log(log_level, "║ HALT {:15} │ loss {:10.2f} │ {:20} ║",
                        l.campaign_id, l.cumulativeLoss(), l.halt_reason);
        }
    }

    spdlog::log(log_level, "╠════════════════════════════════════════════════════════════╣");
    spdlog::log(log_level, "║ Evaluated: {:4} │ Stale: {:4} │ Applied: {:4} │ Failed: {:4} ║",
                r.evaluated, r.stale, r.applied, r.failed);
    spdlog::log(log_level, "║ Duration: {:6} ms │ Committed ticks: {:8}              ║",
                r.duration_ms, ticks_committed_.load(std::memory_order_relaxed));
    spdlog::log(log_level, "╚════════════════════════════════════════════════════════════╝");
}

// ============================================================================
// Status queries
// ============================================================================

std::optional<EntityStateView> GuardianContext::getCurrentState(const std::string& entity_id) const {
    auto view = store_->getCurrentState(entity_id);
    if (!view && entity_index_.count(entity_id) > 0) {
        return EntityStateView{};   // managed, not yet evaluated: ACTIVE
    }
    return view;
}

std::optional<LossLedgerView> GuardianContext::getLossLedger(const std::string& campaign_id) const {
    auto ledger = store_->getLossLedger(campaign_id);
    if (!ledger) {
        return std::nullopt;
    }
    const uint64_t window_ms = static_cast<uint64_t>(config_.protector.window_hours * MS_PER_HOUR);
    LossLedgerView view;
    view.campaign_id = campaign_id;
    view.cumulative_loss = ledger->cumulativeLoss();
    view.window_start_ms = ledger->windowStart(store_->lastCommittedTick(), window_ms);
    view.halted = ledger->halted;
    view.halted_since_ms = ledger->halted_since_ms;
    view.halt_reason = ledger->halt_reason;
    return view;
}

std::vector<GuardianDecision> GuardianContext::listDecisionHistory(const std::string& entity_id, size_t limit) const {
    return store_->listDecisionHistory(entity_id, limit);
}

std::vector<TickRecord> GuardianContext::listTickHistory(size_t limit) const {
    return store_->listTickHistory(limit);
}

GuardianStats GuardianContext::getStats() const {
    GuardianStats s;
    s.ticks_committed = ticks_committed_.load(std::memory_order_relaxed);
    s.ticks_skipped_overlap = ticks_skipped_overlap_.load(std::memory_order_relaxed);
    s.ticks_skipped_disabled = ticks_skipped_disabled_.load(std::memory_order_relaxed);
    s.ticks_aborted = ticks_aborted_.load(std::memory_order_relaxed);
    s.actions_applied = actions_applied_.load(std::memory_order_relaxed);
    s.actions_failed = actions_failed_.load(std::memory_order_relaxed);
    s.stale_entities = stale_entities_.load(std::memory_order_relaxed);
    s.last_tick_ms = last_tick_ms_.load(std::memory_order_relaxed);
    s.last_tick_duration_ms = last_tick_duration_ms_.load(std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lock(command_mutex_);
        s.pending_commands = commands_.size();
    }
    s.enabled = enabled_.load(std::memory_order_acquire);
    s.running = scheduler_ && scheduler_->isRunning();
    return s;
}

} // namespace ProfitGuardian
