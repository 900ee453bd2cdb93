#pragma once

#include <cstdint>
#include <deque>
#include <string>

namespace ProfitGuardian {

struct LedgerEntry {
    uint64_t interval_end_ms = 0;
    double loss = 0.0;
};

/**
 * @struct LossLedger
 * @brief Rolling-window loss record for one campaign
 *
 * Entries only accumulate inside the window; entries whose interval ended
 * before (now - window) roll off.
 */
struct LossLedger {
    std::string campaign_id;
    uint64_t opened_ms = 0;
    std::deque<LedgerEntry> entries;

    bool halted = false;
    uint64_t halted_since_ms = 0;
    std::string halt_reason;

    double cumulativeLoss() const {
        double total = 0.0;
        for (const auto& e : entries) {
            total += e.loss;
        }
        return total;
    }

    uint64_t windowStart(uint64_t now_ms, uint64_t window_ms) const {
        const uint64_t rolling = now_ms > window_ms ? now_ms - window_ms : 0;
        return rolling > opened_ms ? rolling : opened_ms;
    }
};

} // namespace ProfitGuardian
