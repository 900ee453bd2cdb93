#include <profitguardian/core/applier/idempotency_registry.hpp>

#include <spdlog/spdlog.h>

namespace ProfitGuardian {

IdempotencyRegistry::IdempotencyRegistry(uint64_t window_ms) : window_ms_(window_ms) {}

bool IdempotencyRegistry::isAcknowledged(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return acked_.count(key) > 0;
}

bool IdempotencyRegistry::isSuperseded(const std::string& entity_id, uint64_t tick_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = latest_applied_tick_.find(entity_id);
    return it != latest_applied_tick_.end() && it->second > tick_ms;
}

bool IdempotencyRegistry::recordAck(const std::string& key, const std::string& entity_id,
                                    uint64_t tick_ms, uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& latest = latest_applied_tick_[entity_id];
    if (tick_ms > latest) {
        latest = tick_ms;
    }
    return acked_.emplace(key, now_ms).second;
}

size_t IdempotencyRegistry::cleanup(uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t evicted = 0;
    for (auto it = acked_.begin(); it != acked_.end();) {
        if (now_ms > it->second && now_ms - it->second > window_ms_) {
            it = acked_.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }
    if (evicted > 0) {
        spdlog::debug("[Idempotency] Evicted {} keys older than {} ms", evicted, window_ms_);
    }
    return evicted;
}

size_t IdempotencyRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return acked_.size();
}

} // namespace ProfitGuardian
