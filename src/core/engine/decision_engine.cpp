#include <profitguardian/core/engine/decision_engine.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

using namespace ProfitGuardian;

namespace {

bool qualifyingNegative(Polarity polarity, Confidence confidence) {
    return polarity == Polarity::NEGATIVE && confidence != Confidence::LOW;
}

bool isClearReason(ReasonCode r) {
    return r == ReasonCode::HALT_CLEARED_AWAITING
        || r == ReasonCode::HALT_CLEARED_NEGATIVE
        || r == ReasonCode::HALT_RELEASED;
}

void stampSignal(GuardianDecision& d, const EntityEvaluation& ev) {
    d.pacing_ratio = ev.pacing.ratio;
    d.pacing = ev.pacing.pacing;
    d.profit = ev.signal.profit;
    d.basis = ev.signal.basis;
    d.confidence = ev.signal.confidence;
    d.polarity = ev.signal.polarity;
    d.window_clicks = ev.signal.window_clicks;
}

void propose(GuardianDecision& d, ActionIntent action, ReasonCode reason, LifecycleState next) {
    d.action = action;
    d.reason = reason;
    d.proposed_state = next;
    d.outcome = action == ActionIntent::NONE ? ActionOutcome::NOT_REQUIRED : ActionOutcome::PENDING;
    // Any PAUSE or RESUME replaces a PACED platform status
    if (action == ActionIntent::REPACE) {
        d.paced = true;
    } else if (action != ActionIntent::NONE) {
        d.paced = false;
    }
}

} // namespace

DecisionEngine::DecisionEngine(uint32_t hysteresis_ticks)
    : hysteresis_ticks_(hysteresis_ticks == 0 ? 1 : hysteresis_ticks) {
    spdlog::debug("[DecisionEngine] Initialized with hysteresis K={}", hysteresis_ticks_);
}

// ============================================================================
// Transition table
// ============================================================================
// MANUALLY_PAUSED                      -> observe only (NONE)
// halt asserted, ACTIVE/GUARDIAN_PAUSED -> CIRCUIT_HALTED   (PAUSE)
// halt asserted, CIRCUIT_HALTED         -> stays            (NONE)
// halt clear, CIRCUIT_HALTED, 1st tick  -> stays, awaiting  (NONE)
// halt clear, CIRCUIT_HALTED, clean     -> ACTIVE           (RESUME)
// ACTIVE, negative streak >= K          -> GUARDIAN_PAUSED  (PAUSE)
// ACTIVE, over pace, not yet paced      -> ACTIVE, PACED    (REPACE)
// ACTIVE, PACED, pacing back in range   -> ACTIVE, ENABLED  (RESUME)
// GUARDIAN_PAUSED, non-negative >= K    -> ACTIVE           (RESUME)
// Halt is checked before any resume, so it wins a same-tick tie.
// ============================================================================

GuardianDecision DecisionEngine::decide(const ManagedEntity& entity,
                                        const EntityRuntime& runtime,
                                        const EntityEvaluation* evaluation,
                                        bool campaign_halted,
                                        uint64_t tick_ms) const {
    GuardianDecision d;
    d.entity_id = entity.id;
    d.campaign_id = entity.campaign_id;
    d.tick_ms = tick_ms;
    d.prior_state = runtime.state;
    d.proposed_state = runtime.state;
    d.negative_streak = runtime.negative_streak;
    d.positive_streak = runtime.positive_streak;
    d.awaiting_clean_tick = runtime.awaiting_clean_tick;
    d.prior_paced = runtime.paced;
    d.paced = runtime.paced;

    bool negative = false;
    d.stale = evaluation == nullptr;
    if (evaluation != nullptr) {
        stampSignal(d, *evaluation);
        negative = qualifyingNegative(evaluation->signal.polarity, evaluation->signal.confidence);
        d.negative_streak = negative ? runtime.negative_streak + 1 : 0;
        d.positive_streak = evaluation->signal.negative() ? 0 : runtime.positive_streak + 1;
    }

    if (runtime.state == LifecycleState::MANUALLY_PAUSED) {
        propose(d, ActionIntent::NONE, ReasonCode::MANUAL_PAUSE_OBSERVED, runtime.state);
        d.awaiting_clean_tick = false;
        return d;
    }

    if (campaign_halted) {
        d.awaiting_clean_tick = false;
        if (runtime.state == LifecycleState::CIRCUIT_HALTED) {
            propose(d, ActionIntent::NONE, ReasonCode::HALT_PERSISTS, runtime.state);
        } else {
            propose(d, ActionIntent::PAUSE, ReasonCode::CIRCUIT_HALT, LifecycleState::CIRCUIT_HALTED);
        }
        return d;
    }

    if (evaluation == nullptr) {
        propose(d, ActionIntent::NONE, ReasonCode::STALE_DATA, runtime.state);
        d.detail = "no fresh snapshot this tick";
        return d;
    }

    const auto& signal = evaluation->signal;
    const uint32_t k = hysteresis_ticks_;

    switch (runtime.state) {
        case LifecycleState::CIRCUIT_HALTED:
            // Re-entry needs one clean evaluation after the clear is observed
            if (!runtime.awaiting_clean_tick) {
                propose(d, ActionIntent::NONE, ReasonCode::HALT_CLEARED_AWAITING, runtime.state);
            } else if (negative) {
                propose(d, ActionIntent::NONE, ReasonCode::HALT_CLEARED_NEGATIVE, runtime.state);
            } else {
                propose(d, ActionIntent::RESUME, ReasonCode::HALT_RELEASED, LifecycleState::ACTIVE);
            }
            d.awaiting_clean_tick = true;
            break;

        case LifecycleState::GUARDIAN_PAUSED:
            if (d.positive_streak >= k) {
                propose(d, ActionIntent::RESUME, ReasonCode::RECOVERED, LifecycleState::ACTIVE);
            } else if (!signal.negative()) {
                propose(d, ActionIntent::NONE, ReasonCode::RECOVERY_PENDING, runtime.state);
            } else {
                propose(d, ActionIntent::NONE, ReasonCode::STILL_NEGATIVE, runtime.state);
            }
            break;

        case LifecycleState::ACTIVE:
        default:
            if (d.negative_streak >= k) {
                propose(d, ActionIntent::PAUSE, ReasonCode::NEGATIVE_PROFIT, LifecycleState::GUARDIAN_PAUSED);
            } else if (evaluation->pacing.pacing == PacingClass::OVER_PACE) {
                // Already throttled: nothing to re-send
                propose(d, runtime.paced ? ActionIntent::NONE : ActionIntent::REPACE,
                        ReasonCode::OVER_PACE, runtime.state);
            } else if (runtime.paced) {
                propose(d, ActionIntent::RESUME, ReasonCode::PACE_RESTORED, runtime.state);
            } else if (negative) {
                propose(d, ActionIntent::NONE, ReasonCode::NEGATIVE_PENDING, runtime.state);
            } else if (signal.negative()) {
                propose(d, ActionIntent::NONE, ReasonCode::LOW_CONFIDENCE, runtime.state);
            } else if (signal.polarity == Polarity::NEUTRAL) {
                propose(d, ActionIntent::NONE, ReasonCode::NO_SIGNAL, runtime.state);
            } else {
                propose(d, ActionIntent::NONE, ReasonCode::HEALTHY, runtime.state);
            }
            break;
    }

    if (d.action != ActionIntent::NONE) {
        d.detail = fmt::format("profit={:.2f} ({}, {}) streak -{}/+{} K={}",
                               d.profit, basisString(d.basis), confidenceString(d.confidence),
                               d.negative_streak, d.positive_streak, k);
    }
    return d;
}

GuardianDecision DecisionEngine::operatorDecision(const ManagedEntity& entity,
                                                  const EntityRuntime& runtime,
                                                  OperatorCommand command,
                                                  uint64_t tick_ms) const {
    GuardianDecision d;
    d.entity_id = entity.id;
    d.campaign_id = entity.campaign_id;
    d.tick_ms = tick_ms;
    d.prior_state = runtime.state;
    d.prior_paced = runtime.paced;
    d.paced = false;

    // Operator already changed the platform; the guardian only records it
    if (command == OperatorCommand::MANUAL_PAUSE) {
        propose(d, ActionIntent::NONE, ReasonCode::OPERATOR_PAUSE, LifecycleState::MANUALLY_PAUSED);
    } else {
        propose(d, ActionIntent::NONE, ReasonCode::OPERATOR_RELEASE, LifecycleState::ACTIVE);
    }
    d.detail = "operator command";
    return d;
}

EntityRuntime DecisionEngine::replay(const std::vector<GuardianDecision>& history) const {
    EntityRuntime rt;
    for (const auto& d : history) {
        if (d.prior_state != rt.state) {
            spdlog::warn("[DecisionEngine] Replay of {} at {}: recorded prior {} but replayed {}",
                         d.entity_id, d.tick_ms, GuardianDecision::stateString(d.prior_state),
                         GuardianDecision::stateString(rt.state));
        }

        if (d.reason == ReasonCode::OPERATOR_PAUSE || d.reason == ReasonCode::OPERATOR_RELEASE) {
            rt.negative_streak = 0;
            rt.positive_streak = 0;
        } else if (!d.stale) {
            const bool negative = qualifyingNegative(d.polarity, d.confidence);
            rt.negative_streak = negative ? rt.negative_streak + 1 : 0;
            rt.positive_streak = d.polarity == Polarity::NEGATIVE ? 0 : rt.positive_streak + 1;
        }

        rt.state = d.resultingState();
        rt.paced = d.resultingPaced();
        if (rt.state != LifecycleState::CIRCUIT_HALTED) {
            rt.awaiting_clean_tick = false;
        } else if (d.reason != ReasonCode::STALE_DATA) {
            rt.awaiting_clean_tick = isClearReason(d.reason);
        }
    }
    return rt;
}
