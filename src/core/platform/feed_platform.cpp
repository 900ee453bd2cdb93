#include <profitguardian/core/platform/feed_platform.hpp>
#include <profitguardian/core/model/errors.hpp>
#include <profitguardian/core/utils/clock.hpp>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <ctime>
#include <sstream>

namespace ProfitGuardian {

double elapsedDayFraction(uint64_t timestamp_ms) {
    const std::time_t t = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm tm{};
    localtime_r(&t, &tm);
    const double seconds = tm.tm_hour * 3600.0 + tm.tm_min * 60.0 + tm.tm_sec;
    return seconds / 86400.0;
}

FeedAdsPlatform::FeedAdsPlatform(std::string feed_path, const std::string& action_log_path)
    : feed_path_(std::move(feed_path)) {
    loadAppliedKeys(action_log_path);
    action_log_.open(action_log_path, std::ios::app);
    if (!action_log_.is_open()) {
        spdlog::error("[FeedPlatform] Failed to open action log at {}", action_log_path);
        throw std::runtime_error("Failed to open platform action log");
    }
    spdlog::info("[FeedPlatform] feed={} action_log={} ({} keys already applied)",
                 feed_path_, action_log_path, applied_keys_.size());
}

FeedAdsPlatform::~FeedAdsPlatform() {
    if (action_log_.is_open()) {
        action_log_.flush();
        action_log_.close();
    }
}

void FeedAdsPlatform::loadAppliedKeys(const std::string& action_log_path) {
    std::ifstream in(action_log_path);
    if (!in.is_open()) {
        return;  // first run
    }
    // Line format: <timestamp_ms> <idempotency_key> <entity_id> <status>
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string ts;
        std::string key;
        if (fields >> ts >> key) {
            applied_keys_.insert(key);
        }
    }
}

std::unordered_map<std::string, FetchResult> FeedAdsPlatform::fetchMetrics(
    const std::vector<std::string>& entity_ids,
    const ReportingWindow& window) {

    std::unordered_map<std::string, FetchResult> results;

    YAML::Node feed;
    try {
        feed = YAML::LoadFile(feed_path_);
    } catch (const YAML::BadFile&) {
        throw PlatformUnavailableError("metrics feed not readable: " + feed_path_);
    } catch (const YAML::Exception& e) {
        // Exporter may be mid-write; let the fetcher retry
        for (const auto& id : entity_ids) {
            results[id] = FetchError{FetchErrorKind::TRANSIENT,
                                     std::string("feed parse error: ") + e.what()};
        }
        return results;
    }

    const YAML::Node entities = feed["entities"];
    for (const auto& id : entity_ids) {
        const YAML::Node row = entities ? entities[id] : YAML::Node();
        if (!row || !row.IsMap()) {
            results[id] = FetchError{FetchErrorKind::PERMANENT, "entity not found in feed"};
            continue;
        }

        try {
            if (row["error"]) {
                const std::string kind = row["error"].as<std::string>();
                const std::string message = row["message"] ? row["message"].as<std::string>() : kind;
                results[id] = FetchError{
                    kind == "permanent" ? FetchErrorKind::PERMANENT : FetchErrorKind::TRANSIENT,
                    message};
                continue;
            }

            MetricsSnapshot snap;
            snap.entity_id = id;
            snap.timestamp_ms = window.end_ms;
            snap.spend = row["spend"].as<double>(0.0);
            snap.conversions = row["conversions"].as<double>(0.0);
            if (row["conversion_value"] && !row["conversion_value"].IsNull()) {
                snap.conversion_value = row["conversion_value"].as<double>();
            }
            snap.clicks = row["clicks"].as<uint64_t>(0);
            snap.impressions = row["impressions"].as<uint64_t>(0);
            snap.elapsed_day_fraction = row["elapsed_day_fraction"]
                ? row["elapsed_day_fraction"].as<double>()
                : elapsedDayFraction(window.end_ms);
            results[id] = snap;
        } catch (const YAML::Exception& e) {
            results[id] = FetchError{FetchErrorKind::PERMANENT,
                                     std::string("malformed feed row: ") + e.what()};
        }
    }
    return results;
}

StatusResult FeedAdsPlatform::setEntityStatus(
    const std::string& entity_id,
    TargetStatus target,
    const std::string& idempotency_key) {

    std::lock_guard<std::mutex> lock(log_mutex_);
    if (applied_keys_.count(idempotency_key) > 0) {
        spdlog::debug("[FeedPlatform] Key {} already applied, replaying ack", idempotency_key);
        return StatusAck{idempotency_key, true};
    }

    action_log_ << Clock::wall_ms() << ' ' << idempotency_key << ' '
                << entity_id << ' ' << targetStatusString(target) << '\n';
    action_log_.flush();
    if (!action_log_.good()) {
        action_log_.clear();
        return PlatformError{true, "action log write failed"};
    }

    applied_keys_.insert(idempotency_key);
    spdlog::info("[FeedPlatform] {} -> {}", entity_id, targetStatusString(target));
    return StatusAck{idempotency_key, false};
}

size_t FeedAdsPlatform::appliedCount() const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return applied_keys_.size();
}

} // namespace ProfitGuardian
