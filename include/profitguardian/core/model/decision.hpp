#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <profitguardian/core/model/metrics.hpp>

namespace ProfitGuardian {

/**
 * Entity lifecycle - owned by the DecisionEngine
 *
 * MANUALLY_PAUSED is a sink for automated transitions: only operator
 * commands move an entity in or out of it.
 */
enum class LifecycleState : uint8_t {
    ACTIVE = 0,
    GUARDIAN_PAUSED = 1,
    MANUALLY_PAUSED = 2,
    CIRCUIT_HALTED = 3
};

enum class ActionIntent : uint8_t {
    NONE = 0,
    PAUSE = 1,
    RESUME = 2,
    REPACE = 3
};

enum class ReasonCode : uint8_t {
    HEALTHY = 0,
    NO_SIGNAL = 1,
    LOW_CONFIDENCE = 2,
    NEGATIVE_PENDING = 3,        // negative, streak below K
    NEGATIVE_PROFIT = 4,         // PAUSE
    OVER_PACE = 5,               // REPACE
    RECOVERY_PENDING = 6,        // paused, non-negative streak below K
    STILL_NEGATIVE = 7,
    RECOVERED = 8,               // RESUME
    CIRCUIT_HALT = 9,            // PAUSE into CIRCUIT_HALTED
    HALT_PERSISTS = 10,
    HALT_CLEARED_AWAITING = 11,  // first clear tick, no resume yet
    HALT_CLEARED_NEGATIVE = 12,  // clear, but re-evaluation still negative
    HALT_RELEASED = 13,          // RESUME after a clean tick
    MANUAL_PAUSE_OBSERVED = 14,
    OPERATOR_PAUSE = 15,
    OPERATOR_RELEASE = 16,
    STALE_DATA = 17,
    PACE_RESTORED = 18           // RESUME from PACED once pacing normalizes
};

enum class ActionOutcome : uint8_t {
    NOT_REQUIRED = 0,   // action NONE
    PENDING = 1,        // proposed, not yet applied
    APPLIED = 2,
    FAILED = 3,         // retries exhausted or permanent error
    SUPERSEDED = 4      // a newer intent for the entity was already applied
};

/**
 * @struct GuardianDecision
 * @brief One record per entity per tick, including observational NONE
 *
 * Carries the signal values and hysteresis counters that produced it, so the
 * lifecycle state and streaks can be rebuilt from history alone.
 */
struct GuardianDecision {
    std::string entity_id;
    std::string campaign_id;
    uint64_t tick_ms = 0;

    ActionIntent action = ActionIntent::NONE;
    ReasonCode reason = ReasonCode::NO_SIGNAL;
    LifecycleState prior_state = LifecycleState::ACTIVE;
    LifecycleState proposed_state = LifecycleState::ACTIVE;
    ActionOutcome outcome = ActionOutcome::NOT_REQUIRED;

    // Signal values
    std::optional<double> pacing_ratio;
    PacingClass pacing = PacingClass::NO_SIGNAL;
    double profit = 0.0;
    SignalBasis basis = SignalBasis::VALUE;
    Confidence confidence = Confidence::LOW;
    Polarity polarity = Polarity::NEUTRAL;
    uint64_t window_clicks = 0;
    bool stale = false;          // no fresh snapshot, counters carried

    // Hysteresis after this tick
    uint32_t negative_streak = 0;
    uint32_t positive_streak = 0;
    bool awaiting_clean_tick = false;

    // Platform status throttled to PACED before / after this decision
    bool prior_paced = false;
    bool paced = false;

    std::string idempotency_key;
    uint32_t attempts = 0;
    std::string detail;

    /**
     * @brief State the entity holds once this decision is committed
     * A failed or superseded action leaves the prior state authoritative.
     */
    LifecycleState resultingState() const {
        if (outcome == ActionOutcome::FAILED || outcome == ActionOutcome::SUPERSEDED) {
            return prior_state;
        }
        return proposed_state;
    }

    bool resultingPaced() const {
        if (outcome == ActionOutcome::FAILED || outcome == ActionOutcome::SUPERSEDED) {
            return prior_paced;
        }
        return paced;
    }

    bool changesState() const { return proposed_state != prior_state; }

    static const char* actionString(ActionIntent a);
    static const char* reasonString(ReasonCode r);
    static const char* stateString(LifecycleState s);
    static const char* outcomeString(ActionOutcome o);
};

/**
 * @struct EntityRuntime
 * @brief Decision-engine view of one entity, derived from its last decision
 */
struct EntityRuntime {
    LifecycleState state = LifecycleState::ACTIVE;
    uint32_t negative_streak = 0;
    uint32_t positive_streak = 0;
    bool awaiting_clean_tick = false;
    bool paced = false;
};

EntityRuntime runtimeAfter(const GuardianDecision& decision);

// ============================================================================
// Tick audit records
// ============================================================================

enum class TickOutcome : uint8_t {
    COMMITTED = 0,
    SKIPPED_OVERLAP = 1,
    SKIPPED_DISABLED = 2,
    ABORTED = 3
};

struct TickRecord {
    uint64_t tick_ms = 0;
    TickOutcome outcome = TickOutcome::COMMITTED;
    std::string reason;
    uint32_t evaluated = 0;
    uint32_t stale = 0;
    uint32_t applied = 0;
    uint32_t failed = 0;
    uint64_t duration_ms = 0;

    static const char* outcomeString(TickOutcome o);
};

} // namespace ProfitGuardian
