#include <profitguardian/core/applier/action_applier.hpp>
#include <profitguardian/core/utils/clock.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <exception>

namespace ProfitGuardian {

ActionApplier::ActionApplier(AdsPlatform& platform,
                             ThreadPool& pool,
                             const AppConfig::ApplierPolicy& policy,
                             Sleeper sleeper)
    : platform_(platform),
      pool_(pool),
      policy_(policy),
      sleeper_(std::move(sleeper)),
      registry_(static_cast<uint64_t>(policy.idempotency_window_hours) * MS_PER_HOUR) {
    spdlog::info("[Applier] max_retries: {}, backoff: {}..{} ms, idempotency window: {}h",
                 policy_.max_retries, policy_.backoff_base_ms, policy_.backoff_max_ms,
                 policy_.idempotency_window_hours);
}

std::string ActionApplier::idempotencyKey(const std::string& entity_id, TargetStatus target, uint64_t tick_ms) {
    return fmt::format("{}|{}|{}", entity_id, targetStatusString(target), tick_ms);
}

TargetStatus ActionApplier::targetFor(ActionIntent action) {
    switch (action) {
        case ActionIntent::PAUSE:  return TargetStatus::PAUSED;
        case ActionIntent::REPACE: return TargetStatus::PACED;
        case ActionIntent::RESUME:
        case ActionIntent::NONE:
        default:                   return TargetStatus::ENABLED;
    }
}

ApplyReport ActionApplier::apply(std::vector<GuardianDecision>& decisions, uint64_t now_ms) {
    ApplyReport report;
    std::atomic<uint32_t> replayed{0};

    for (auto& decision : decisions) {
        if (decision.action == ActionIntent::NONE) {
            decision.outcome = ActionOutcome::NOT_REQUIRED;
            continue;
        }
        // Each task owns exactly one decision slot
        GuardianDecision* slot = &decision;
        pool_.submit([this, slot, now_ms, &replayed]() {
            if (applyOne(*slot, now_ms)) {
                replayed.fetch_add(1, std::memory_order_relaxed);
            }
        });
    }
    pool_.waitIdle();

    for (const auto& decision : decisions) {
        switch (decision.outcome) {
            case ActionOutcome::APPLIED:    ++report.applied; break;
            case ActionOutcome::FAILED:     ++report.failed; break;
            case ActionOutcome::SUPERSEDED: ++report.superseded; break;
            default: break;
        }
    }
    report.replayed = replayed.load(std::memory_order_relaxed);

    registry_.cleanup(now_ms);
    return report;
}

bool ActionApplier::applyOne(GuardianDecision& decision, uint64_t now_ms) {
    const TargetStatus target = targetFor(decision.action);
    decision.idempotency_key = idempotencyKey(decision.entity_id, target, decision.tick_ms);

    if (registry_.isSuperseded(decision.entity_id, decision.tick_ms)) {
        spdlog::warn("[Applier] {} {} superseded by a newer applied intent",
                     decision.entity_id, GuardianDecision::actionString(decision.action));
        decision.outcome = ActionOutcome::SUPERSEDED;
        decision.detail = "superseded by newer applied intent";
        return false;
    }

    if (registry_.isAcknowledged(decision.idempotency_key)) {
        spdlog::debug("[Applier] Key {} already acknowledged", decision.idempotency_key);
        decision.outcome = ActionOutcome::APPLIED;
        return true;
    }

    std::string last_error;
    for (uint32_t attempt = 0; attempt <= policy_.max_retries; ++attempt) {
        if (attempt > 0) {
            spdlog::warn("[Applier] {} -> {} failed (attempt {}/{}): {}, retrying...",
                         decision.entity_id, targetStatusString(target),
                         attempt, policy_.max_retries + 1, last_error);
            sleeper_(computeBackoff(attempt - 1, policy_.backoff_base_ms, policy_.backoff_max_ms));
        }
        decision.attempts = attempt + 1;

        StatusResult result;
        try {
            result = platform_.setEntityStatus(decision.entity_id, target, decision.idempotency_key);
        } catch (const std::exception& e) {
            result = PlatformError{true, e.what()};
        }

        if (auto* ack = std::get_if<StatusAck>(&result)) {
            // Record ONLY after the platform acknowledged, so failures stay retryable
            registry_.recordAck(decision.idempotency_key, decision.entity_id, decision.tick_ms, now_ms);
            decision.outcome = ActionOutcome::APPLIED;
            spdlog::info("[Applier] {} {} -> {} ({}){}",
                         decision.entity_id, GuardianDecision::actionString(decision.action),
                         targetStatusString(target), GuardianDecision::reasonString(decision.reason),
                         ack->replayed ? " [replayed]" : "");
            return ack->replayed;
        }

        const auto& err = std::get<PlatformError>(result);
        last_error = err.message;
        if (!err.transient) {
            break;
        }
    }

    decision.outcome = ActionOutcome::FAILED;
    decision.detail = "apply failed: " + last_error;
    spdlog::error("[Applier] ALERT: {} {} FAILED after {} attempt(s): {} - keeping {}",
                  decision.entity_id, GuardianDecision::actionString(decision.action),
                  decision.attempts, last_error, GuardianDecision::stateString(decision.prior_state));
    return false;
}

} // namespace ProfitGuardian
