#pragma once

#include <fstream>
#include <mutex>
#include <string>
#include <unordered_set>

#include <profitguardian/core/platform/ads_platform.hpp>

namespace ProfitGuardian {

/**
 * @class FeedAdsPlatform
 * @brief File-backed platform adapter used by the profit_guardian binary
 *
 * The external ads client exports current metrics into a YAML feed; the feed
 * is re-read on every fetch. Status changes are appended to an action log,
 * one line per idempotency key. Keys already in the log are acknowledged as
 * replays and never written twice.
 *
 * Feed layout:
 *   entities:
 *     kw-1: {spend: 80, conversions: 0, clicks: 25, impressions: 900,
 *            elapsed_day_fraction: 0.5, conversion_value: 0}
 *     kw-2: {error: transient, message: "rate limited"}
 */
class FeedAdsPlatform : public AdsPlatform {
public:
    FeedAdsPlatform(std::string feed_path, const std::string& action_log_path);
    ~FeedAdsPlatform() override;

    std::unordered_map<std::string, FetchResult> fetchMetrics(
        const std::vector<std::string>& entity_ids,
        const ReportingWindow& window) override;

    StatusResult setEntityStatus(
        const std::string& entity_id,
        TargetStatus target,
        const std::string& idempotency_key) override;

    size_t appliedCount() const;

private:
    void loadAppliedKeys(const std::string& action_log_path);

    std::string feed_path_;
    mutable std::mutex log_mutex_;
    std::ofstream action_log_;
    std::unordered_set<std::string> applied_keys_;
};

/**
 * @brief Fraction of the local calendar day elapsed at timestamp_ms
 */
double elapsedDayFraction(uint64_t timestamp_ms);

} // namespace ProfitGuardian
