#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>

namespace ProfitGuardian {

/**
 * @brief Exponential backoff delay before retry number `attempt` (0-based)
 * base * 2^attempt, capped at max. Pure; callers decide how to wait.
 */
inline std::chrono::milliseconds computeBackoff(uint32_t attempt, uint32_t base_ms, uint32_t max_ms) {
    uint64_t delay = base_ms;
    for (uint32_t i = 0; i < attempt && delay < max_ms; ++i) {
        delay *= 2;
    }
    if (delay > max_ms) {
        delay = max_ms;
    }
    return std::chrono::milliseconds(delay);
}

using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline Sleeper threadSleeper() {
    return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

} // namespace ProfitGuardian
