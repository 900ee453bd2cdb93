// ============================================================================
// CLOCKS
// ============================================================================
// steady_clock for durations and backoff, system_clock for tick timestamps
// (ledger windows and the journal are keyed by wall time).
// ============================================================================

#pragma once

#include <chrono>
#include <cstdint>

namespace ProfitGuardian {

class Clock {
public:
    // Monotonic time in milliseconds
    static inline uint64_t now_ms() {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ).count();
    }

    // Wall-clock milliseconds since epoch
    static inline uint64_t wall_ms() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ).count();
    }
};

constexpr uint64_t MS_PER_HOUR = 3600ULL * 1000ULL;
constexpr uint64_t MS_PER_DAY = 24ULL * MS_PER_HOUR;

} // namespace ProfitGuardian
