#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include <profitguardian/core/config/app_config.hpp>
#include <profitguardian/core/platform/ads_platform.hpp>
#include <profitguardian/core/utils/backoff.hpp>
#include <profitguardian/core/utils/thread_pool.hpp>

namespace ProfitGuardian {

/**
 * @struct FetchOutcome
 * @brief Per-tick fetch result: fresh snapshots plus STALE entities
 */
struct FetchOutcome {
    std::unordered_map<std::string, MetricsSnapshot> snapshots;
    std::unordered_map<std::string, FetchError> stale;
    uint32_t retries = 0;
};

/**
 * @class MetricsFetcher
 * @brief Pulls snapshots for all managed entities in concurrent batches
 *
 * Per-entity failures never block other entities:
 * - TransientFetchError: retried up to max_retries within the tick, then STALE
 * - PermanentFetchError: not retried, STALE for this tick, alert logged
 * PlatformUnavailableError from any batch aborts the whole fetch.
 */
class MetricsFetcher {
public:
    MetricsFetcher(AdsPlatform& platform,
                   ThreadPool& pool,
                   const AppConfig::FetcherPolicy& policy,
                   Sleeper sleeper = threadSleeper());

    FetchOutcome fetch(const std::vector<std::string>& entity_ids, const ReportingWindow& window);

private:
    FetchOutcome fetchBatch(const std::vector<std::string>& batch, const ReportingWindow& window);

    AdsPlatform& platform_;
    ThreadPool& pool_;
    AppConfig::FetcherPolicy policy_;
    Sleeper sleeper_;
};

} // namespace ProfitGuardian
