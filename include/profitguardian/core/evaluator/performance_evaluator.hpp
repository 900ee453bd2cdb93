#pragma once

#include <vector>

#include <profitguardian/core/config/app_config.hpp>
#include <profitguardian/core/model/entity.hpp>
#include <profitguardian/core/model/metrics.hpp>

namespace ProfitGuardian {

/**
 * @struct IntervalActivity
 * @brief Activity between two consecutive snapshots of one entity
 */
struct IntervalActivity {
    double spend = 0.0;
    double value = 0.0;
    double conversions = 0.0;
    uint64_t clicks = 0;
    uint64_t impressions = 0;
    bool has_value = false;
};

/**
 * @class PerformanceEvaluator
 * @brief Derives PacingState and ProfitabilitySignal per entity
 *
 * Stateless: everything comes from the current snapshot and the stored
 * history passed in, so a tick can be evaluated and thrown away.
 */
class PerformanceEvaluator {
public:
    explicit PerformanceEvaluator(const AppConfig::EvaluatorThresholds& thresholds);

    /**
     * @brief target-spend-by-now = budget * elapsed fraction of day
     * A zero target yields NO_SIGNAL with an empty ratio.
     */
    PacingState computePacing(const ManagedEntity& entity, const MetricsSnapshot& current) const;

    /**
     * @brief Trailing-window profitability
     * @param history stored snapshots for the entity, oldest first, excluding current
     */
    ProfitabilitySignal computeSignal(const MetricsSnapshot& current,
                                      const std::vector<MetricsSnapshot>& history) const;

    EntityEvaluation evaluate(const ManagedEntity& entity,
                              const MetricsSnapshot& current,
                              const std::vector<MetricsSnapshot>& history) const;

    /**
     * @brief Delta between consecutive day-cumulative snapshots
     * A decreasing spend or click counter marks a day rollover; the delta is
     * then the current cumulative value.
     */
    static IntervalActivity intervalDelta(const MetricsSnapshot* previous, const MetricsSnapshot& current);

    /**
     * @brief Attributed value of an interval, or conversions * breakeven without value data
     */
    double attributedValue(const IntervalActivity& activity) const;

    const AppConfig::EvaluatorThresholds& getThresholds() const { return thresholds_; }

private:
    Confidence classifyConfidence(uint64_t clicks, uint64_t impressions) const;

    AppConfig::EvaluatorThresholds thresholds_;
};

} // namespace ProfitGuardian
