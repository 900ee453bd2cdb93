// ============================================================================
// IDEMPOTENCY REGISTRY
// ============================================================================
// Guards ActionApplier against double-application:
// - acknowledged keys are never sent to the platform twice
// - an older intent never overwrites a newer applied one for the same entity
//
// Keys are recorded ONLY after the platform acknowledged them, so a failed
// attempt can be retried on a later tick.
// ============================================================================

#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ProfitGuardian {

class IdempotencyRegistry {
public:
    explicit IdempotencyRegistry(uint64_t window_ms);

    bool isAcknowledged(const std::string& key) const;

    /**
     * @brief True when a decision from a later tick was already applied
     */
    bool isSuperseded(const std::string& entity_id, uint64_t tick_ms) const;

    /**
     * @return false if the key was already present
     */
    bool recordAck(const std::string& key, const std::string& entity_id,
                   uint64_t tick_ms, uint64_t now_ms);

    /**
     * @brief Drop keys acknowledged more than window_ms before now_ms
     * @return number of keys evicted
     */
    size_t cleanup(uint64_t now_ms);

    size_t size() const;

private:
    uint64_t window_ms_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, uint64_t> acked_;              // key -> ack time
    std::unordered_map<std::string, uint64_t> latest_applied_tick_; // entity -> tick
};

} // namespace ProfitGuardian
