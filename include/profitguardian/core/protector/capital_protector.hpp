#pragma once

#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <profitguardian/core/config/app_config.hpp>
#include <profitguardian/core/evaluator/performance_evaluator.hpp>
#include <profitguardian/core/model/entity.hpp>
#include <profitguardian/core/model/ledger.hpp>

namespace ProfitGuardian {

/**
 * @struct EntityInterval
 * @brief One entity's activity since its previous stored snapshot
 */
struct EntityInterval {
    std::string entity_id;
    std::string campaign_id;
    int rollup_rank = 0;
    IntervalActivity activity;
};

struct HaltAssessment {
    std::string campaign_id;
    bool halted = false;
    bool newly_halted = false;
    bool newly_cleared = false;
    double interval_loss = 0.0;
    double cumulative_loss = 0.0;
    double loss_rate = 0.0;
    uint64_t window_start_ms = 0;
    std::string reason;
};

struct ProtectorResult {
    std::unordered_map<std::string, HaltAssessment> assessments;
    std::unordered_map<std::string, LossLedger> ledgers;   // proposed, committed with the tick

    bool isHalted(const std::string& campaign_id) const {
        auto it = assessments.find(campaign_id);
        return it != assessments.end() && it->second.halted;
    }
};

/**
 * @class CapitalProtector
 * @brief Campaign-level circuit breaker on absolute and rate-of-loss limits
 *
 * Works on copies of the committed ledgers; the proposals become durable only
 * when the tick commits.
 */
class CapitalProtector {
public:
    CapitalProtector(const AppConfig::ProtectorLimits& limits, const PerformanceEvaluator& evaluator);

    /**
     * @brief Coarsest configured rollup rank per campaign
     */
    static std::map<std::string, int> coarsestRanks(const std::vector<ManagedEntity>& entities);

    /**
     * @brief Roll the ledgers forward one tick and assert or clear halts
     * @param campaign_ranks campaign id -> coarsest configured rank; only intervals
     *        at that rank add to the campaign's loss
     */
    ProtectorResult assess(uint64_t tick_ms,
                           const std::map<std::string, int>& campaign_ranks,
                           const std::unordered_map<std::string, LossLedger>& committed,
                           const std::vector<EntityInterval>& intervals) const;

    const AppConfig::ProtectorLimits& getLimits() const { return limits_; }

private:
    AppConfig::ProtectorLimits limits_;
    const PerformanceEvaluator& evaluator_;
};

} // namespace ProfitGuardian
