#include <profitguardian/core/config/loader.hpp>
#include <profitguardian/core/model/errors.hpp>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <unordered_set>
#include <utility>

using ProfitGuardian::ConfigurationError;

namespace {

template <typename T>
T readRequired(const YAML::Node& parent, const char* key, const std::string& path) {
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        throw ConfigurationError("Missing required field: " + path + key);
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid type for field " + path + key + ": " + e.what());
    }
}

template <typename T>
T readOptional(const YAML::Node& parent, const char* key, const std::string& path, T fallback) {
    if (!parent) {
        return fallback;
    }
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        return fallback;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid type for field " + path + key + ": " + e.what());
    }
}

YAML::Node section(const YAML::Node& root, const char* key) {
    YAML::Node node = root[key];
    if (node && !node.IsMap()) {
        throw ConfigurationError(std::string("Section '") + key + "' must be a mapping");
    }
    return node;
}

ProfitGuardian::ManagedEntity parseEntity(const YAML::Node& node, size_t index) {
    const std::string path = "entities[" + std::to_string(index) + "].";
    if (!node.IsMap()) {
        throw ConfigurationError("Entity entry " + path + " must be a mapping");
    }

    ProfitGuardian::ManagedEntity entity;
    entity.id = readRequired<std::string>(node, "id", path);
    entity.campaign_id = readRequired<std::string>(node, "campaign_id", path);
    entity.daily_budget = readOptional<double>(node, "daily_budget", path, 0.0);
    entity.created_at_ms = readOptional<uint64_t>(node, "created_at_ms", path, 0);

    const std::string kindText = readRequired<std::string>(node, "kind", path);
    const auto kind = ProfitGuardian::parseEntityKind(kindText);
    if (!kind) {
        throw ConfigurationError("Unknown entity kind '" + kindText + "' at " + path + "kind");
    }

    const std::string name = readOptional<std::string>(node, "name", path, "");
    switch (*kind) {
        case ProfitGuardian::EntityKind::CAMPAIGN:
            entity.scope = ProfitGuardian::CampaignScope{name};
            break;
        case ProfitGuardian::EntityKind::AD_GROUP:
            entity.scope = ProfitGuardian::AdGroupScope{name};
            break;
        case ProfitGuardian::EntityKind::KEYWORD:
            entity.scope = ProfitGuardian::KeywordScope{
                readOptional<std::string>(node, "ad_group_id", path, ""),
                readOptional<std::string>(node, "text", path, name)
            };
            break;
    }
    return entity;
}

AppConfig::AppConfiguration parseRoot(const YAML::Node& root) {
    if (!root || !root.IsMap()) {
        throw ConfigurationError("Configuration root must be a mapping");
    }

    AppConfig::AppConfiguration config;
    config.app_name = readRequired<std::string>(root, "app_name", "");
    config.version = readRequired<std::string>(root, "version", "");

    const YAML::Node guardian = section(root, "guardian");
    config.guardian.enabled = readOptional<bool>(guardian, "enabled", "guardian.", config.guardian.enabled);
    config.guardian.tick_interval_seconds = readOptional<uint32_t>(
        guardian, "tick_interval_seconds", "guardian.", config.guardian.tick_interval_seconds);
    config.guardian.hysteresis_ticks = readOptional<uint32_t>(
        guardian, "hysteresis_ticks", "guardian.", config.guardian.hysteresis_ticks);

    const YAML::Node evaluator = section(root, "evaluator");
    auto& ev = config.evaluator;
    ev.min_clicks = readOptional<uint64_t>(evaluator, "min_clicks", "evaluator.", ev.min_clicks);
    ev.min_impressions = readOptional<uint64_t>(evaluator, "min_impressions", "evaluator.", ev.min_impressions);
    ev.high_confidence_multiplier = readOptional<double>(
        evaluator, "high_confidence_multiplier", "evaluator.", ev.high_confidence_multiplier);
    ev.breakeven_cost = readOptional<double>(evaluator, "breakeven_cost", "evaluator.", ev.breakeven_cost);
    ev.profit_tolerance = readOptional<double>(evaluator, "profit_tolerance", "evaluator.", ev.profit_tolerance);
    ev.over_pace_ratio = readOptional<double>(evaluator, "over_pace_ratio", "evaluator.", ev.over_pace_ratio);
    ev.under_pace_ratio = readOptional<double>(evaluator, "under_pace_ratio", "evaluator.", ev.under_pace_ratio);
    ev.history_ticks = readOptional<uint32_t>(evaluator, "history_ticks", "evaluator.", ev.history_ticks);
    ev.history_window_hours = readOptional<double>(
        evaluator, "history_window_hours", "evaluator.", ev.history_window_hours);

    // Loss limits have no safe default
    const YAML::Node protector = root["protector"];
    if (!protector || !protector.IsMap()) {
        throw ConfigurationError("Missing required section: protector");
    }
    auto& pr = config.protector;
    pr.absolute_loss_limit = readRequired<double>(protector, "absolute_loss_limit", "protector.");
    pr.loss_rate_limit = readRequired<double>(protector, "loss_rate_limit", "protector.");
    pr.acceptable_loss_per_interval = readOptional<double>(
        protector, "acceptable_loss_per_interval", "protector.", pr.acceptable_loss_per_interval);
    pr.window_hours = readOptional<double>(protector, "window_hours", "protector.", pr.window_hours);
    pr.min_rate_elapsed_hours = readOptional<double>(
        protector, "min_rate_elapsed_hours", "protector.", pr.min_rate_elapsed_hours);

    const YAML::Node applier = section(root, "applier");
    auto& ap = config.applier;
    ap.max_retries = readOptional<uint32_t>(applier, "max_retries", "applier.", ap.max_retries);
    ap.backoff_base_ms = readOptional<uint32_t>(applier, "backoff_base_ms", "applier.", ap.backoff_base_ms);
    ap.backoff_max_ms = readOptional<uint32_t>(applier, "backoff_max_ms", "applier.", ap.backoff_max_ms);
    ap.idempotency_window_hours = readOptional<uint32_t>(
        applier, "idempotency_window_hours", "applier.", ap.idempotency_window_hours);

    const YAML::Node fetcher = section(root, "fetcher");
    auto& fe = config.fetcher;
    fe.max_retries = readOptional<uint32_t>(fetcher, "max_retries", "fetcher.", fe.max_retries);
    fe.backoff_base_ms = readOptional<uint32_t>(fetcher, "backoff_base_ms", "fetcher.", fe.backoff_base_ms);
    fe.batch_size = readOptional<uint32_t>(fetcher, "batch_size", "fetcher.", fe.batch_size);
    fe.workers = readOptional<uint32_t>(fetcher, "workers", "fetcher.", fe.workers);

    const YAML::Node storage = section(root, "storage");
    config.storage.journal_path = readOptional<std::string>(
        storage, "journal_path", "storage.", config.storage.journal_path);
    config.storage.max_snapshots_per_entity = readOptional<uint32_t>(
        storage, "max_snapshots_per_entity", "storage.", config.storage.max_snapshots_per_entity);

    const YAML::Node platform = section(root, "platform");
    config.platform.feed_path = readOptional<std::string>(
        platform, "feed_path", "platform.", config.platform.feed_path);
    config.platform.action_log_path = readOptional<std::string>(
        platform, "action_log_path", "platform.", config.platform.action_log_path);

    const YAML::Node logging = section(root, "logging");
    config.logging.level = readOptional<std::string>(logging, "level", "logging.", config.logging.level);

    const YAML::Node entities = root["entities"];
    if (entities) {
        if (!entities.IsSequence()) {
            throw ConfigurationError("Field 'entities' must be a sequence");
        }
        for (size_t i = 0; i < entities.size(); ++i) {
            config.entities.push_back(parseEntity(entities[i], i));
        }
    }

    ConfigLoader::validate(config);
    return config;
}

} // namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        throw ConfigurationError("Configuration file not found: " + filepath);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Malformed configuration " + filepath + ": " + e.what());
    }

    auto config = parseRoot(root);
    spdlog::info("[ConfigLoader] Loaded {} v{} from {} ({} entities)",
                 config.app_name, config.version, filepath, config.entities.size());
    return config;
}

AppConfig::AppConfiguration ConfigLoader::loadFromString(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Malformed configuration: ") + e.what());
    }
    return parseRoot(root);
}

void ConfigLoader::validate(const AppConfig::AppConfiguration& config) {
    const auto& ev = config.evaluator;
    const auto& pr = config.protector;
    const std::pair<const char*, double> reals[] = {
        {"evaluator.high_confidence_multiplier", ev.high_confidence_multiplier},
        {"evaluator.breakeven_cost", ev.breakeven_cost},
        {"evaluator.profit_tolerance", ev.profit_tolerance},
        {"evaluator.over_pace_ratio", ev.over_pace_ratio},
        {"evaluator.under_pace_ratio", ev.under_pace_ratio},
        {"evaluator.history_window_hours", ev.history_window_hours},
        {"protector.absolute_loss_limit", pr.absolute_loss_limit},
        {"protector.loss_rate_limit", pr.loss_rate_limit},
        {"protector.acceptable_loss_per_interval", pr.acceptable_loss_per_interval},
        {"protector.window_hours", pr.window_hours},
        {"protector.min_rate_elapsed_hours", pr.min_rate_elapsed_hours},
    };
    for (const auto& [name, value] : reals) {
        if (!std::isfinite(value)) {
            throw ConfigurationError(std::string(name) + " must be a finite number");
        }
    }

    const auto& g = config.guardian;
    if (g.tick_interval_seconds == 0) {
        throw ConfigurationError("guardian.tick_interval_seconds must be > 0");
    }
    if (g.hysteresis_ticks == 0) {
        throw ConfigurationError("guardian.hysteresis_ticks must be >= 1");
    }

    if (ev.breakeven_cost <= 0.0) {
        throw ConfigurationError("evaluator.breakeven_cost must be > 0");
    }
    if (ev.high_confidence_multiplier < 1.0) {
        throw ConfigurationError("evaluator.high_confidence_multiplier must be >= 1");
    }
    if (ev.profit_tolerance < 0.0) {
        throw ConfigurationError("evaluator.profit_tolerance must be >= 0");
    }
    if (ev.over_pace_ratio <= 1.0 || ev.under_pace_ratio < 0.0 || ev.under_pace_ratio >= 1.0) {
        throw ConfigurationError("evaluator pace ratios must satisfy 0 <= under < 1 < over");
    }
    if (ev.history_ticks == 0 || ev.history_window_hours <= 0.0) {
        throw ConfigurationError("evaluator history bounds must be positive");
    }

    if (pr.absolute_loss_limit <= 0.0) {
        throw ConfigurationError("protector.absolute_loss_limit must be > 0");
    }
    if (pr.loss_rate_limit <= 0.0) {
        throw ConfigurationError("protector.loss_rate_limit must be > 0");
    }
    if (pr.acceptable_loss_per_interval < 0.0) {
        throw ConfigurationError("protector.acceptable_loss_per_interval must be >= 0");
    }
    if (pr.window_hours <= 0.0 || pr.min_rate_elapsed_hours <= 0.0) {
        throw ConfigurationError("protector window lengths must be > 0");
    }

    const auto& ap = config.applier;
    if (ap.backoff_base_ms == 0 || ap.backoff_max_ms < ap.backoff_base_ms) {
        throw ConfigurationError("applier backoff must satisfy 0 < base <= max");
    }

    const auto& fe = config.fetcher;
    if (fe.batch_size == 0 || fe.workers == 0) {
        throw ConfigurationError("fetcher.batch_size and fetcher.workers must be > 0");
    }

    if (config.storage.max_snapshots_per_entity < ev.history_ticks) {
        throw ConfigurationError("storage.max_snapshots_per_entity must be >= evaluator.history_ticks");
    }

    static const std::unordered_set<std::string> levels{
        "trace", "debug", "info", "warn", "warning", "error", "critical", "off"};
    if (levels.count(config.logging.level) == 0) {
        throw ConfigurationError("logging.level '" + config.logging.level + "' is not a spdlog level");
    }

    std::unordered_set<std::string> ids;
    for (const auto& entity : config.entities) {
        if (entity.id.empty() || entity.campaign_id.empty()) {
            throw ConfigurationError("entity id and campaign_id must not be empty");
        }
        if (!ids.insert(entity.id).second) {
            throw ConfigurationError("duplicate entity id: " + entity.id);
        }
        if (!std::isfinite(entity.daily_budget) || entity.daily_budget < 0.0) {
            throw ConfigurationError("entity " + entity.id + " has a negative or non-finite daily_budget");
        }
    }
}
