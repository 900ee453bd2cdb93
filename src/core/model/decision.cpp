#include <profitguardian/core/model/decision.hpp>

namespace ProfitGuardian {

const char* GuardianDecision::actionString(ActionIntent a) {
    switch (a) {
        case ActionIntent::NONE:   return "NONE";
        case ActionIntent::PAUSE:  return "PAUSE";
        case ActionIntent::RESUME: return "RESUME";
        case ActionIntent::REPACE: return "REPACE";
        default:                   return "UNKNOWN";
    }
}

const char* GuardianDecision::reasonString(ReasonCode r) {
    switch (r) {
        case ReasonCode::HEALTHY:               return "HEALTHY";
        case ReasonCode::NO_SIGNAL:             return "NO_SIGNAL";
        case ReasonCode::LOW_CONFIDENCE:        return "LOW_CONFIDENCE";
        case ReasonCode::NEGATIVE_PENDING:      return "NEGATIVE_PENDING";
        case ReasonCode::NEGATIVE_PROFIT:       return "NEGATIVE_PROFIT";
        case ReasonCode::OVER_PACE:             return "OVER_PACE";
        case ReasonCode::RECOVERY_PENDING:      return "RECOVERY_PENDING";
        case ReasonCode::STILL_NEGATIVE:        return "STILL_NEGATIVE";
        case ReasonCode::RECOVERED:             return "RECOVERED";
        case ReasonCode::CIRCUIT_HALT:          return "CIRCUIT_HALT";
        case ReasonCode::HALT_PERSISTS:         return "HALT_PERSISTS";
        case ReasonCode::HALT_CLEARED_AWAITING: return "HALT_CLEARED_AWAITING";
        case ReasonCode::HALT_CLEARED_NEGATIVE: return "HALT_CLEARED_NEGATIVE";
        case ReasonCode::HALT_RELEASED:         return "HALT_RELEASED";
        case ReasonCode::MANUAL_PAUSE_OBSERVED: return "MANUAL_PAUSE_OBSERVED";
        case ReasonCode::OPERATOR_PAUSE:        return "OPERATOR_PAUSE";
        case ReasonCode::OPERATOR_RELEASE:      return "OPERATOR_RELEASE";
        case ReasonCode::STALE_DATA:            return "STALE_DATA";
        case ReasonCode::PACE_RESTORED:         return "PACE_RESTORED";
        default:                                return "UNKNOWN";
    }
}

const char* GuardianDecision::stateString(LifecycleState s) {
    switch (s) {
        case LifecycleState::ACTIVE:          return "ACTIVE";
        case LifecycleState::GUARDIAN_PAUSED: return "GUARDIAN_PAUSED";
        case LifecycleState::MANUALLY_PAUSED: return "MANUALLY_PAUSED";
        case LifecycleState::CIRCUIT_HALTED:  return "CIRCUIT_HALTED";
        default:                              return "UNKNOWN";
    }
}

const char* GuardianDecision::outcomeString(ActionOutcome o) {
    switch (o) {
        case ActionOutcome::NOT_REQUIRED: return "NOT_REQUIRED";
        case ActionOutcome::PENDING:      return "PENDING";
        case ActionOutcome::APPLIED:      return "APPLIED";
        case ActionOutcome::FAILED:       return "FAILED";
        case ActionOutcome::SUPERSEDED:   return "SUPERSEDED";
        default:                          return "UNKNOWN";
    }
}

EntityRuntime runtimeAfter(const GuardianDecision& decision) {
    EntityRuntime rt;
    rt.state = decision.resultingState();
    rt.negative_streak = decision.negative_streak;
    rt.positive_streak = decision.positive_streak;
    rt.awaiting_clean_tick = decision.awaiting_clean_tick
        && rt.state == LifecycleState::CIRCUIT_HALTED;
    rt.paced = decision.resultingPaced();
    return rt;
}

const char* TickRecord::outcomeString(TickOutcome o) {
    switch (o) {
        case TickOutcome::COMMITTED:        return "COMMITTED";
        case TickOutcome::SKIPPED_OVERLAP:  return "SKIPPED_OVERLAP";
        case TickOutcome::SKIPPED_DISABLED: return "SKIPPED_DISABLED";
        case TickOutcome::ABORTED:          return "ABORTED";
        default:                            return "UNKNOWN";
    }
}

const char* pacingString(PacingClass p) {
    switch (p) {
        case PacingClass::NO_SIGNAL:  return "NO_SIGNAL";
        case PacingClass::UNDER_PACE: return "UNDER_PACE";
        case PacingClass::ON_PACE:    return "ON_PACE";
        case PacingClass::OVER_PACE:  return "OVER_PACE";
        default:                      return "UNKNOWN";
    }
}

const char* basisString(SignalBasis b) {
    return b == SignalBasis::VALUE ? "VALUE" : "PROXY";
}

const char* confidenceString(Confidence c) {
    switch (c) {
        case Confidence::LOW:    return "LOW";
        case Confidence::MEDIUM: return "MEDIUM";
        case Confidence::HIGH:   return "HIGH";
        default:                 return "UNKNOWN";
    }
}

const char* polarityString(Polarity p) {
    switch (p) {
        case Polarity::NEGATIVE: return "NEGATIVE";
        case Polarity::NEUTRAL:  return "NEUTRAL";
        case Polarity::POSITIVE: return "POSITIVE";
        default:                 return "UNKNOWN";
    }
}

} // namespace ProfitGuardian
