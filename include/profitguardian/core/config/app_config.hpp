#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <profitguardian/core/model/entity.hpp>

namespace AppConfig {

struct GuardianSettings {
    bool enabled = true;
    uint32_t tick_interval_seconds = 900;   // 15 minutes
    uint32_t hysteresis_ticks = 2;          // K
};

/**
 * @struct EvaluatorThresholds
 * @brief Boundaries for pacing and profitability classification
 *
 * - pacing ratio > over_pace_ratio  -> OVER_PACE (REPACE candidate)
 * - pacing ratio < under_pace_ratio -> UNDER_PACE (reported only)
 * - window clicks < min_clicks or impressions < min_impressions -> LOW confidence
 * - window clicks < min_clicks * high_confidence_multiplier   -> MEDIUM
 */
struct EvaluatorThresholds {
    uint64_t min_clicks = 10;
    uint64_t min_impressions = 100;
    double high_confidence_multiplier = 3.0;

    // Proxy: value of one conversion when the platform reports no value
    double breakeven_cost = 50.0;
    double profit_tolerance = 0.0;

    double over_pace_ratio = 1.5;
    double under_pace_ratio = 0.5;

    uint32_t history_ticks = 8;
    double history_window_hours = 24.0;
};

struct ProtectorLimits {
    double absolute_loss_limit = 0.0;    // required
    double loss_rate_limit = 0.0;        // required, loss per hour
    double acceptable_loss_per_interval = 0.0;
    double window_hours = 24.0;
    double min_rate_elapsed_hours = 1.0;
};

struct ApplierPolicy {
    uint32_t max_retries = 3;
    uint32_t backoff_base_ms = 500;
    uint32_t backoff_max_ms = 30000;
    uint32_t idempotency_window_hours = 48;
};

struct FetcherPolicy {
    uint32_t max_retries = 2;
    uint32_t backoff_base_ms = 250;
    uint32_t batch_size = 50;
    uint32_t workers = 4;
};

struct StorageSettings {
    std::string journal_path = "data/guardian.journal";
    uint32_t max_snapshots_per_entity = 96;
};

struct PlatformSettings {
    std::string feed_path = "data/metrics_feed.yaml";
    std::string action_log_path = "data/platform_actions.log";
};

struct LoggingSettings {
    std::string level = "info";
};

struct AppConfiguration {
    std::string app_name;
    std::string version;

    GuardianSettings guardian;
    EvaluatorThresholds evaluator;
    ProtectorLimits protector;
    ApplierPolicy applier;
    FetcherPolicy fetcher;
    StorageSettings storage;
    PlatformSettings platform;
    LoggingSettings logging;

    std::vector<ProfitGuardian::ManagedEntity> entities;
};

} // namespace AppConfig
