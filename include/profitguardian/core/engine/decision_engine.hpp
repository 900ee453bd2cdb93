#pragma once

#include <cstdint>
#include <vector>

#include <profitguardian/core/model/decision.hpp>
#include <profitguardian/core/model/entity.hpp>
#include <profitguardian/core/model/metrics.hpp>

namespace ProfitGuardian {

enum class OperatorCommand : uint8_t {
    MANUAL_PAUSE = 0,
    MANUAL_RELEASE = 1
};

/**
 * @class DecisionEngine
 * @brief Per-entity lifecycle state machine with hysteresis
 *
 * Pure function of (runtime, evaluation, campaign halt): it proposes exactly
 * one GuardianDecision per entity per tick and never mutates stored state.
 */
class DecisionEngine {
public:
    explicit DecisionEngine(uint32_t hysteresis_ticks);

    /**
     * @param evaluation nullptr when the entity is STALE this tick
     * @param campaign_halted halt asserted by the CapitalProtector this tick
     */
    GuardianDecision decide(const ManagedEntity& entity,
                            const EntityRuntime& runtime,
                            const EntityEvaluation* evaluation,
                            bool campaign_halted,
                            uint64_t tick_ms) const;

    GuardianDecision operatorDecision(const ManagedEntity& entity,
                                      const EntityRuntime& runtime,
                                      OperatorCommand command,
                                      uint64_t tick_ms) const;

    /**
     * @brief Rebuild lifecycle state and streaks from decision history alone
     * @param history oldest first
     */
    EntityRuntime replay(const std::vector<GuardianDecision>& history) const;

    uint32_t hysteresisTicks() const { return hysteresis_ticks_; }

private:
    uint32_t hysteresis_ticks_;
};

} // namespace ProfitGuardian
