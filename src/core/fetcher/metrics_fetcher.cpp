#include <profitguardian/core/fetcher/metrics_fetcher.hpp>
#include <profitguardian/core/model/errors.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <mutex>

namespace ProfitGuardian {

MetricsFetcher::MetricsFetcher(AdsPlatform& platform,
                               ThreadPool& pool,
                               const AppConfig::FetcherPolicy& policy,
                               Sleeper sleeper)
    : platform_(platform), pool_(pool), policy_(policy), sleeper_(std::move(sleeper)) {}

FetchOutcome MetricsFetcher::fetch(const std::vector<std::string>& entity_ids,
                                   const ReportingWindow& window) {
    FetchOutcome merged;
    if (entity_ids.empty()) {
        return merged;
    }

    std::mutex merge_mutex;
    std::exception_ptr fatal;

    const size_t batch_size = policy_.batch_size;
    for (size_t begin = 0; begin < entity_ids.size(); begin += batch_size) {
        const size_t end = std::min(entity_ids.size(), begin + batch_size);
        std::vector<std::string> batch(entity_ids.begin() + begin, entity_ids.begin() + end);

        pool_.submit([this, batch = std::move(batch), &window, &merged, &merge_mutex, &fatal]() {
            try {
                FetchOutcome part = fetchBatch(batch, window);
                std::lock_guard<std::mutex> lock(merge_mutex);
                for (auto& [id, snap] : part.snapshots) {
                    merged.snapshots.emplace(id, std::move(snap));
                }
                for (auto& [id, err] : part.stale) {
                    merged.stale.emplace(id, std::move(err));
                }
                merged.retries += part.retries;
            } catch (const PlatformUnavailableError&) {
                std::lock_guard<std::mutex> lock(merge_mutex);
                if (!fatal) {
                    fatal = std::current_exception();
                }
            } catch (const std::exception& e) {
                spdlog::error("[Fetcher] Batch of {} failed: {}", batch.size(), e.what());
                std::lock_guard<std::mutex> lock(merge_mutex);
                for (const auto& id : batch) {
                    merged.stale.emplace(id, FetchError{FetchErrorKind::TRANSIENT, e.what()});
                }
            }
        });
    }
    pool_.waitIdle();

    if (fatal) {
        std::rethrow_exception(fatal);
    }

    spdlog::debug("[Fetcher] {} snapshots, {} stale, {} retries",
                  merged.snapshots.size(), merged.stale.size(), merged.retries);
    return merged;
}

FetchOutcome MetricsFetcher::fetchBatch(const std::vector<std::string>& batch,
                                        const ReportingWindow& window) {
    FetchOutcome out;
    std::vector<std::string> pending = batch;
    std::unordered_map<std::string, FetchError> last_transient;

    for (uint32_t attempt = 0; attempt <= policy_.max_retries && !pending.empty(); ++attempt) {
        if (attempt > 0) {
            out.retries += static_cast<uint32_t>(pending.size());
            sleeper_(computeBackoff(attempt - 1, policy_.backoff_base_ms, policy_.backoff_base_ms * 8));
        }

        auto results = platform_.fetchMetrics(pending, window);
        std::vector<std::string> retry;

        for (const auto& id : pending) {
            auto it = results.find(id);
            if (it == results.end()) {
                last_transient[id] = FetchError{FetchErrorKind::TRANSIENT, "no result returned"};
                retry.push_back(id);
                continue;
            }

            if (auto* snap = std::get_if<MetricsSnapshot>(&it->second)) {
                MetricsSnapshot normalized = *snap;
                normalized.entity_id = id;
                normalized.timestamp_ms = window.end_ms;
                out.snapshots.emplace(id, std::move(normalized));
                last_transient.erase(id);
                continue;
            }

            const auto& err = std::get<FetchError>(it->second);
            if (err.retryable()) {
                spdlog::debug("[Fetcher] {} transient failure (attempt {}/{}): {}",
                              id, attempt + 1, policy_.max_retries + 1, err.message);
                last_transient[id] = err;
                retry.push_back(id);
            } else {
                spdlog::error("[Fetcher] ALERT: {} for {}: {} - entity STALE this tick",
                              FetchError::kindString(err.kind), id, err.message);
                out.stale.emplace(id, err);
            }
        }
        pending = std::move(retry);
    }

    for (const auto& id : pending) {
        const auto& err = last_transient[id];
        spdlog::warn("[Fetcher] {} still failing after {} attempts ({}) - entity STALE this tick",
                     id, policy_.max_retries + 1, err.message);
        out.stale.emplace(id, err);
    }
    return out;
}

} // namespace ProfitGuardian
