// ============================================================================
// CONFIG LOADER UNIT TESTS
// ============================================================================
// Tests for YAML configuration loading and validation
// ============================================================================

#include <gtest/gtest.h>
#include <profitguardian/core/config/loader.hpp>
#include <profitguardian/core/config/app_config.hpp>
#include <profitguardian/core/model/errors.hpp>

using ProfitGuardian::ConfigurationError;
using ProfitGuardian::EntityKind;

namespace {

const char* kMinimalYaml = R"(
app_name: ProfitGuardian
version: 2.0.0
protector:
  absolute_loss_limit: 250
  loss_rate_limit: 40
)";

} // namespace

// ============================================================================
// SUCCESSFUL LOADING TESTS
// ============================================================================

TEST(ConfigLoader, LoadValidConfiguration) {
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig("config/guardian.yaml");

    EXPECT_EQ(config.app_name, "ProfitGuardian");
    EXPECT_EQ(config.version, "1.0.0");

    EXPECT_EQ(config.guardian.tick_interval_seconds, 900u);
    EXPECT_EQ(config.guardian.hysteresis_ticks, 2u);
    EXPECT_DOUBLE_EQ(config.protector.absolute_loss_limit, 500.0);
    EXPECT_DOUBLE_EQ(config.protector.loss_rate_limit, 100.0);
    EXPECT_EQ(config.storage.journal_path, "data/guardian.journal");

    ASSERT_EQ(config.entities.size(), 4u);
    EXPECT_EQ(config.entities[0].kind(), EntityKind::CAMPAIGN);
    EXPECT_EQ(config.entities[1].kind(), EntityKind::AD_GROUP);
    EXPECT_EQ(config.entities[2].kind(), EntityKind::KEYWORD);
    EXPECT_EQ(ProfitGuardian::describeScope(config.entities[2].scope), "running shoes");
    EXPECT_EQ(config.entities[2].campaign_id, "cmp-spring");
}

TEST(ConfigLoader, OptionalSectionsFallBackToDefaults) {
    auto config = ConfigLoader::loadFromString(kMinimalYaml);

    EXPECT_TRUE(config.guardian.enabled);
    EXPECT_EQ(config.guardian.hysteresis_ticks, 2u);
    EXPECT_EQ(config.evaluator.min_clicks, 10u);
    EXPECT_DOUBLE_EQ(config.evaluator.over_pace_ratio, 1.5);
    EXPECT_DOUBLE_EQ(config.evaluator.breakeven_cost, 50.0);
    EXPECT_EQ(config.applier.max_retries, 3u);
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_TRUE(config.entities.empty());
}

// ============================================================================
// ERROR HANDLING TESTS
// ============================================================================

TEST(ConfigLoader, ThrowsOnFileNotFound) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("config/non_existent.yaml"),
        ConfigurationError
    );
}

TEST(ConfigLoader, ThrowsOnMissingRequiredField) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/missing_field.yaml"),
        ConfigurationError
    );
}

TEST(ConfigLoader, ThrowsOnInvalidFieldType) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_type.yaml"),
        ConfigurationError
    );
}

TEST(ConfigLoader, ThrowsOnInvalidFieldValue) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_value.yaml"),
        ConfigurationError
    );
}

TEST(ConfigLoader, ThrowsOnUnknownEntityKind) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/unknown_kind.yaml"),
        ConfigurationError
    );
}

TEST(ConfigLoader, ThrowsOnNonFiniteLimit) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/non_finite.yaml"),
        ConfigurationError
    );
}

TEST(ConfigLoader, ConfigurationErrorIsRuntimeError) {
    EXPECT_THROW(ConfigLoader::loadFromString("app_name: x\nversion: 1\n"), std::runtime_error);
}

TEST(ConfigLoader, RejectsMissingProtectorSection) {
    EXPECT_THROW(ConfigLoader::loadFromString("app_name: x\nversion: '1'\n"), ConfigurationError);
}

TEST(ConfigLoader, RejectsDuplicateEntityIds) {
    std::string yaml = std::string(kMinimalYaml) + R"(
entities:
  - {id: a, campaign_id: c, kind: campaign}
  - {id: a, campaign_id: c, kind: keyword}
)";
    EXPECT_THROW(ConfigLoader::loadFromString(yaml), ConfigurationError);
}

TEST(ConfigLoader, RejectsUnknownLogLevel) {
    std::string yaml = std::string(kMinimalYaml) + "logging:\n  level: loud\n";
    EXPECT_THROW(ConfigLoader::loadFromString(yaml), ConfigurationError);
}

TEST(ConfigLoader, RejectsZeroHysteresis) {
    std::string yaml = std::string(kMinimalYaml) + "guardian:\n  hysteresis_ticks: 0\n";
    EXPECT_THROW(ConfigLoader::loadFromString(yaml), ConfigurationError);
}

TEST(ConfigLoader, RejectsNotANumber) {
    std::string tolerance = std::string(kMinimalYaml) + "evaluator:\n  profit_tolerance: .nan\n";
    EXPECT_THROW(ConfigLoader::loadFromString(tolerance), ConfigurationError);

    std::string budget = std::string(kMinimalYaml) + R"(
entities:
  - {id: a, campaign_id: c, kind: campaign, daily_budget: .nan}
)";
    EXPECT_THROW(ConfigLoader::loadFromString(budget), ConfigurationError);
}

TEST(ConfigLoader, RejectsSnapshotCapBelowHistory) {
    std::string yaml = std::string(kMinimalYaml)
        + "evaluator:\n  history_ticks: 20\nstorage:\n  max_snapshots_per_entity: 10\n";
    EXPECT_THROW(ConfigLoader::loadFromString(yaml), ConfigurationError);
}
