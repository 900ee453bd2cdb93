#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <profitguardian/core/applier/idempotency_registry.hpp>
#include <profitguardian/core/config/app_config.hpp>
#include <profitguardian/core/model/decision.hpp>
#include <profitguardian/core/platform/ads_platform.hpp>
#include <profitguardian/core/utils/backoff.hpp>
#include <profitguardian/core/utils/thread_pool.hpp>

namespace ProfitGuardian {

struct ApplyReport {
    uint32_t applied = 0;
    uint32_t failed = 0;
    uint32_t superseded = 0;
    uint32_t replayed = 0;   // acknowledged without a new platform write
};

/**
 * @class ActionApplier
 * @brief Translates PAUSE/RESUME/REPACE decisions into platform status changes
 *
 * Guarantees:
 * - at most one effective platform write per idempotency key
 * - transient failures retried with exponential backoff up to max_retries
 * - permanent failures and exhausted retries leave the decision FAILED and
 *   raise an alert; the entity keeps its prior state
 *
 * Decisions are updated in place (outcome, idempotency_key, attempts, detail).
 */
class ActionApplier {
public:
    ActionApplier(AdsPlatform& platform,
                  ThreadPool& pool,
                  const AppConfig::ApplierPolicy& policy,
                  Sleeper sleeper = threadSleeper());

    ApplyReport apply(std::vector<GuardianDecision>& decisions, uint64_t now_ms);

    static std::string idempotencyKey(const std::string& entity_id, TargetStatus target, uint64_t tick_ms);
    static TargetStatus targetFor(ActionIntent action);

    IdempotencyRegistry& registry() { return registry_; }

private:
    // @return true when the ack was replayed rather than freshly applied
    bool applyOne(GuardianDecision& decision, uint64_t now_ms);

    AdsPlatform& platform_;
    ThreadPool& pool_;
    AppConfig::ApplierPolicy policy_;
    Sleeper sleeper_;
    IdempotencyRegistry registry_;
};

} // namespace ProfitGuardian
