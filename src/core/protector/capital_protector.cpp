#include <profitguardian/core/protector/capital_protector.hpp>
#include <profitguardian/core/utils/clock.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>

using namespace ProfitGuardian;

CapitalProtector::CapitalProtector(const AppConfig::ProtectorLimits& limits,
                                   const PerformanceEvaluator& evaluator)
    : limits_(limits), evaluator_(evaluator) {
    spdlog::info("[CapitalProtector] Limits: absolute={:.2f} rate={:.2f}/h window={}h",
                 limits_.absolute_loss_limit, limits_.loss_rate_limit, limits_.window_hours);
}

std::map<std::string, int> CapitalProtector::coarsestRanks(const std::vector<ManagedEntity>& entities) {
    std::map<std::string, int> ranks;
    for (const auto& entity : entities) {
        const int rank = rollupRank(entity.scope);
        auto [it, inserted] = ranks.emplace(entity.campaign_id, rank);
        if (!inserted) {
            it->second = std::min(it->second, rank);
        }
    }
    return ranks;
}

ProtectorResult CapitalProtector::assess(uint64_t tick_ms,
                                         const std::map<std::string, int>& campaign_ranks,
                                         const std::unordered_map<std::string, LossLedger>& committed,
                                         const std::vector<EntityInterval>& intervals) const {
    const uint64_t window_ms = static_cast<uint64_t>(limits_.window_hours * MS_PER_HOUR);

    // Campaign spend already contains its children: only the coarsest managed level counts.
    // A stale coarsest entity contributes nothing this tick; its next delta covers the gap.
    std::unordered_map<std::string, double> net_loss;
    for (const auto& iv : intervals) {
        auto rank = campaign_ranks.find(iv.campaign_id);
        if (rank == campaign_ranks.end() || iv.rollup_rank != rank->second) {
            continue;
        }
        net_loss[iv.campaign_id] += iv.activity.spend - evaluator_.attributedValue(iv.activity);
    }

    std::set<std::string> all_campaigns;
    for (const auto& [id, rank] : campaign_ranks) {
        all_campaigns.insert(id);
    }
    for (const auto& [id, ledger] : committed) {
        all_campaigns.insert(id);
    }

    ProtectorResult result;
    for (const auto& campaign_id : all_campaigns) {
        LossLedger ledger;
        auto existing = committed.find(campaign_id);
        if (existing != committed.end()) {
            ledger = existing->second;
        } else {
            ledger.campaign_id = campaign_id;
            ledger.opened_ms = tick_ms;
        }

        // Window rollover
        const uint64_t cutoff = tick_ms > window_ms ? tick_ms - window_ms : 0;
        while (!ledger.entries.empty() && ledger.entries.front().interval_end_ms <= cutoff) {
            ledger.entries.pop_front();
        }

        HaltAssessment a;
        a.campaign_id = campaign_id;
        auto loss_it = net_loss.find(campaign_id);
        if (loss_it != net_loss.end()) {
            a.interval_loss = std::max(0.0, loss_it->second - limits_.acceptable_loss_per_interval);
            if (a.interval_loss > 0.0) {
                ledger.entries.push_back(LedgerEntry{tick_ms, a.interval_loss});
            }
        }

        a.cumulative_loss = ledger.cumulativeLoss();
        a.window_start_ms = ledger.windowStart(tick_ms, window_ms);
        const double elapsed_h = static_cast<double>(tick_ms - a.window_start_ms) / MS_PER_HOUR;
        a.loss_rate = a.cumulative_loss / std::max(elapsed_h, limits_.min_rate_elapsed_hours);

        const bool over_absolute = a.cumulative_loss > limits_.absolute_loss_limit;
        const bool over_rate = a.loss_rate > limits_.loss_rate_limit;
        a.halted = over_absolute || over_rate;

        if (over_absolute) {
            a.reason = fmt::format("cumulative loss {:.2f} > limit {:.2f}",
                                   a.cumulative_loss, limits_.absolute_loss_limit);
        } else if (over_rate) {
            a.reason = fmt::format("loss rate {:.2f}/h > limit {:.2f}/h",
                                   a.loss_rate, limits_.loss_rate_limit);
        }

        a.newly_halted = a.halted && !ledger.halted;
        a.newly_cleared = !a.halted && ledger.halted;

        if (a.newly_halted) {
            ledger.halted_since_ms = tick_ms;
            spdlog::error("[CapitalProtector] CIRCUIT HALT campaign {}: {}", campaign_id, a.reason);
        } else if (a.newly_cleared) {
            spdlog::warn("[CapitalProtector] Halt cleared for campaign {} (loss {:.2f}, rate {:.2f}/h)",
                         campaign_id, a.cumulative_loss, a.loss_rate);
            ledger.halted_since_ms = 0;
        }
        ledger.halted = a.halted;
        ledger.halt_reason = a.reason;

        result.ledgers[campaign_id] = std::move(ledger);
        result.assessments[campaign_id] = std::move(a);
    }
    return result;
}
