// ============================================================================
// SCRIPTED ADS PLATFORM (test double)
// ============================================================================
// In-process AdsPlatform: tests set the metrics each entity reports, inject
// fetch/status failures, and inspect every status change that went through.
// ============================================================================

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <profitguardian/core/config/app_config.hpp>
#include <profitguardian/core/model/entity.hpp>
#include <profitguardian/core/model/errors.hpp>
#include <profitguardian/core/platform/ads_platform.hpp>
#include <profitguardian/core/utils/backoff.hpp>

namespace ProfitGuardian {
namespace Testing {

struct StatusCall {
    std::string entity_id;
    TargetStatus target;
    std::string idempotency_key;
};

class ScriptedAdsPlatform : public AdsPlatform {
public:
    // ---- Scripting ----

    void setMetrics(const std::string& id, double spend, double conversions,
                    std::optional<double> value, uint64_t clicks, uint64_t impressions,
                    double elapsed_day_fraction = 0.5) {
        std::lock_guard<std::mutex> lock(mutex_);
        MetricsSnapshot s;
        s.entity_id = id;
        s.spend = spend;
        s.conversions = conversions;
        s.conversion_value = value;
        s.clicks = clicks;
        s.impressions = impressions;
        s.elapsed_day_fraction = elapsed_day_fraction;
        metrics_[id] = s;
    }

    // Next `times` fetches of `id` fail with `error`
    void failFetch(const std::string& id, FetchError error, int times = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (int i = 0; i < times; ++i) {
            fetch_failures_[id].push_back(error);
        }
    }

    // Next `times` status calls for `id` fail with `error`
    void failStatus(const std::string& id, PlatformError error, int times = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (int i = 0; i < times; ++i) {
            status_failures_[id].push_back(error);
        }
    }

    void setUnavailable(bool unavailable) {
        std::lock_guard<std::mutex> lock(mutex_);
        unavailable_ = unavailable;
    }

    // Block fetchMetrics until releaseFetches(); waitForFetch() returns once one is blocked
    void holdFetches() {
        std::lock_guard<std::mutex> lock(mutex_);
        hold_ = true;
    }

    void waitForFetch() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return waiting_ > 0; });
    }

    void releaseFetches() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hold_ = false;
        }
        cv_.notify_all();
    }

    // ---- Inspection ----

    std::vector<StatusCall> effectiveChanges() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return changes_;
    }

    size_t statusCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_calls_;
    }

    size_t fetchCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fetch_calls_;
    }

    // ---- AdsPlatform ----

    std::unordered_map<std::string, FetchResult> fetchMetrics(
        const std::vector<std::string>& entity_ids,
        const ReportingWindow& window) override {
        std::unique_lock<std::mutex> lock(mutex_);
        ++fetch_calls_;
        if (hold_) {
            ++waiting_;
            cv_.notify_all();
            cv_.wait(lock, [this]() { return !hold_; });
            --waiting_;
        }
        if (unavailable_) {
            throw PlatformUnavailableError("scripted outage");
        }

        std::unordered_map<std::string, FetchResult> out;
        for (const auto& id : entity_ids) {
            auto& failures = fetch_failures_[id];
            if (!failures.empty()) {
                out[id] = failures.front();
                failures.pop_front();
                continue;
            }
            auto it = metrics_.find(id);
            if (it == metrics_.end()) {
                out[id] = FetchError{FetchErrorKind::PERMANENT, "entity not found"};
                continue;
            }
            MetricsSnapshot s = it->second;
            s.timestamp_ms = window.end_ms;
            out[id] = s;
        }
        return out;
    }

    StatusResult setEntityStatus(const std::string& entity_id,
                                 TargetStatus target,
                                 const std::string& idempotency_key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++status_calls_;
        auto& failures = status_failures_[entity_id];
        if (!failures.empty()) {
            PlatformError err = failures.front();
            failures.pop_front();
            return err;
        }
        if (!applied_keys_.insert(idempotency_key).second) {
            return StatusAck{idempotency_key, true};
        }
        changes_.push_back(StatusCall{entity_id, target, idempotency_key});
        return StatusAck{idempotency_key, false};
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool hold_ = false;
    int waiting_ = 0;
    bool unavailable_ = false;

    std::unordered_map<std::string, MetricsSnapshot> metrics_;
    std::unordered_map<std::string, std::deque<FetchError>> fetch_failures_;
    std::unordered_map<std::string, std::deque<PlatformError>> status_failures_;
    std::unordered_set<std::string> applied_keys_;
    std::vector<StatusCall> changes_;
    size_t status_calls_ = 0;
    size_t fetch_calls_ = 0;
};

/**
 * @brief Minimal valid configuration for tests: memory-only store, instant backoff
 */
inline AppConfig::AppConfiguration testConfig() {
    AppConfig::AppConfiguration config;
    config.app_name = "ProfitGuardianTest";
    config.version = "0.0.0";
    config.guardian.tick_interval_seconds = 900;
    config.guardian.hysteresis_ticks = 2;
    config.protector.absolute_loss_limit = 1000.0;
    config.protector.loss_rate_limit = 100000.0;
    config.applier.backoff_base_ms = 1;
    config.applier.backoff_max_ms = 4;
    config.fetcher.backoff_base_ms = 1;
    config.fetcher.workers = 2;
    config.storage.journal_path = "";
    return config;
}

inline ManagedEntity makeEntity(const std::string& id, const std::string& campaign_id,
                                EntityScope scope, double budget) {
    ManagedEntity e;
    e.id = id;
    e.campaign_id = campaign_id;
    e.scope = std::move(scope);
    e.daily_budget = budget;
    return e;
}

inline Sleeper noSleep() {
    return [](std::chrono::milliseconds) {};
}

} // namespace Testing
} // namespace ProfitGuardian
