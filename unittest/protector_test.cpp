// ============================================================================
// CAPITAL PROTECTOR UNIT TESTS
// ============================================================================
// Rolling loss ledger, absolute and rate limits, rollup, automatic clear
// ============================================================================

#include <gtest/gtest.h>
#include <profitguardian/core/protector/capital_protector.hpp>
#include <profitguardian/core/utils/clock.hpp>

using namespace ProfitGuardian;

class CapitalProtectorTest : public ::testing::Test {
protected:
    AppConfig::EvaluatorThresholds thresholds;
    AppConfig::ProtectorLimits limits;

    void SetUp() override {
        limits.absolute_loss_limit = 100.0;
        limits.loss_rate_limit = 1.0e6;
        limits.window_hours = 24.0;
    }

    static EntityInterval interval(const std::string& id, const std::string& campaign, int rank,
                                   double spend, double value, bool has_value = true,
                                   double conversions = 0.0) {
        EntityInterval iv;
        iv.entity_id = id;
        iv.campaign_id = campaign;
        iv.rollup_rank = rank;
        iv.activity.spend = spend;
        iv.activity.value = value;
        iv.activity.has_value = has_value;
        iv.activity.conversions = conversions;
        return iv;
    }
};

// ============================================================================
// LIMIT TESTS
// ============================================================================

TEST_F(CapitalProtectorTest, AbsoluteLimitHaltsCampaign) {
    PerformanceEvaluator evaluator(thresholds);
    CapitalProtector protector(limits, evaluator);

    auto result = protector.assess(10 * MS_PER_HOUR, {{"c-1", 0}}, {},
                                   {interval("c-1", "c-1", 0, 120.0, 0.0)});

    ASSERT_TRUE(result.isHalted("c-1"));
    const auto& a = result.assessments.at("c-1");
    EXPECT_TRUE(a.newly_halted);
    EXPECT_DOUBLE_EQ(a.cumulative_loss, 120.0);
    EXPECT_TRUE(result.ledgers.at("c-1").halted);
    EXPECT_EQ(result.ledgers.at("c-1").halted_since_ms, 10 * MS_PER_HOUR);
}

TEST_F(CapitalProtectorTest, UnderLimitDoesNotHalt) {
    PerformanceEvaluator evaluator(thresholds);
    CapitalProtector protector(limits, evaluator);

    auto result = protector.assess(MS_PER_HOUR, {{"c-1", 0}}, {},
                                   {interval("c-1", "c-1", 0, 80.0, 0.0)});
    EXPECT_FALSE(result.isHalted("c-1"));
    EXPECT_DOUBLE_EQ(result.assessments.at("c-1").cumulative_loss, 80.0);
}

TEST_F(CapitalProtectorTest, RateLimitUsesElapsedFloor) {
    limits.absolute_loss_limit = 1.0e6;
    limits.loss_rate_limit = 50.0;
    limits.min_rate_elapsed_hours = 1.0;
    PerformanceEvaluator evaluator(thresholds);
    CapitalProtector protector(limits, evaluator);

    // Fresh ledger: elapsed 0h is floored to 1h, so 60 loss = 60/h
    auto result = protector.assess(5 * MS_PER_HOUR, {{"c-1", 0}}, {},
                                   {interval("c-1", "c-1", 0, 60.0, 0.0)});
    EXPECT_DOUBLE_EQ(result.assessments.at("c-1").loss_rate, 60.0);
    EXPECT_TRUE(result.isHalted("c-1"));
}

TEST_F(CapitalProtectorTest, AcceptableLossIsSubtractedAndFloored) {
    limits.acceptable_loss_per_interval = 30.0;
    PerformanceEvaluator evaluator(thresholds);
    CapitalProtector protector(limits, evaluator);

    auto result = protector.assess(MS_PER_HOUR, {{"c-1", 0}, {"c-2", 0}}, {},
                                   {interval("a", "c-1", 0, 50.0, 0.0),
                                    interval("b", "c-2", 0, 20.0, 0.0)});

    EXPECT_DOUBLE_EQ(result.assessments.at("c-1").interval_loss, 20.0);
    EXPECT_DOUBLE_EQ(result.assessments.at("c-2").interval_loss, 0.0);
    EXPECT_TRUE(result.ledgers.at("c-2").entries.empty());
}

TEST_F(CapitalProtectorTest, ProfitableIntervalAddsNothing) {
    PerformanceEvaluator evaluator(thresholds);
    CapitalProtector protector(limits, evaluator);

    auto result = protector.assess(MS_PER_HOUR, {{"c-1", 0}}, {},
                                   {interval("c-1", "c-1", 0, 50.0, 200.0)});
    EXPECT_DOUBLE_EQ(result.assessments.at("c-1").cumulative_loss, 0.0);
}

// ============================================================================
// ROLLUP TESTS
// ============================================================================

TEST_F(CapitalProtectorTest, OnlyCoarsestRankCounts) {
    PerformanceEvaluator evaluator(thresholds);
    CapitalProtector protector(limits, evaluator);

    // Keyword spend is already inside the campaign figure
    auto result = protector.assess(MS_PER_HOUR, {{"c-1", 0}}, {},
                                   {interval("c-1", "c-1", 0, 90.0, 0.0),
                                    interval("kw", "c-1", 2, 60.0, 0.0)});
    EXPECT_DOUBLE_EQ(result.assessments.at("c-1").interval_loss, 90.0);
    EXPECT_FALSE(result.isHalted("c-1"));
}

TEST_F(CapitalProtectorTest, KeywordsSumWhenNoCoarserLevel) {
    PerformanceEvaluator evaluator(thresholds);
    CapitalProtector protector(limits, evaluator);

    auto result = protector.assess(MS_PER_HOUR, {{"c-1", 2}}, {},
                                   {interval("kw-1", "c-1", 2, 60.0, 0.0),
                                    interval("kw-2", "c-1", 2, 60.0, 0.0)});
    EXPECT_DOUBLE_EQ(result.assessments.at("c-1").interval_loss, 120.0);
    EXPECT_TRUE(result.isHalted("c-1"));
}

TEST_F(CapitalProtectorTest, StaleCampaignEntityAddsNothing) {
    PerformanceEvaluator evaluator(thresholds);
    CapitalProtector protector(limits, evaluator);

    // Campaign entity missing this tick: its keyword must not stand in for it
    auto result = protector.assess(MS_PER_HOUR, {{"c-1", 0}}, {},
                                   {interval("kw", "c-1", 2, 60.0, 0.0)});
    EXPECT_DOUBLE_EQ(result.assessments.at("c-1").interval_loss, 0.0);
    EXPECT_TRUE(result.ledgers.at("c-1").entries.empty());
}

TEST(CapitalProtectorRanks, CoarsestConfiguredRankPerCampaign) {
    std::vector<ManagedEntity> entities(3);
    entities[0].id = "kw";
    entities[0].campaign_id = "c-1";
    entities[0].scope = KeywordScope{"ag", "shoes"};
    entities[1].id = "c-1";
    entities[1].campaign_id = "c-1";
    entities[1].scope = CampaignScope{"Spring"};
    entities[2].id = "ag-2";
    entities[2].campaign_id = "c-2";
    entities[2].scope = AdGroupScope{"Brand"};

    auto ranks = CapitalProtector::coarsestRanks(entities);
    ASSERT_EQ(ranks.size(), 2u);
    EXPECT_EQ(ranks.at("c-1"), 0);
    EXPECT_EQ(ranks.at("c-2"), 1);
}

TEST_F(CapitalProtectorTest, ProxyValueWithoutValueData) {
    PerformanceEvaluator evaluator(thresholds);   // breakeven 50
    CapitalProtector protector(limits, evaluator);

    auto result = protector.assess(MS_PER_HOUR, {{"c-1", 0}}, {},
                                   {interval("c-1", "c-1", 0, 120.0, 0.0, false, 1.0)});
    EXPECT_DOUBLE_EQ(result.assessments.at("c-1").interval_loss, 70.0);
}

// ============================================================================
// WINDOW TESTS
// ============================================================================

TEST_F(CapitalProtectorTest, HaltClearsWhenWindowAdvances) {
    limits.window_hours = 2.0;
    PerformanceEvaluator evaluator(thresholds);
    CapitalProtector protector(limits, evaluator);

    auto first = protector.assess(MS_PER_HOUR, {{"c-1", 0}}, {},
                                  {interval("c-1", "c-1", 0, 120.0, 0.0)});
    ASSERT_TRUE(first.isHalted("c-1"));

    // Still inside the window: halt persists without new loss
    auto second = protector.assess(2 * MS_PER_HOUR, {{"c-1", 0}}, first.ledgers, {});
    EXPECT_TRUE(second.isHalted("c-1"));
    EXPECT_FALSE(second.assessments.at("c-1").newly_halted);

    // Entry ended at 1h; at 3h it is out of the 2h window
    auto third = protector.assess(3 * MS_PER_HOUR, {{"c-1", 0}}, second.ledgers, {});
    EXPECT_FALSE(third.isHalted("c-1"));
    EXPECT_TRUE(third.assessments.at("c-1").newly_cleared);
    EXPECT_DOUBLE_EQ(third.assessments.at("c-1").cumulative_loss, 0.0);
    EXPECT_FALSE(third.ledgers.at("c-1").halted);
}

TEST_F(CapitalProtectorTest, LedgerAccumulatesInsideWindow) {
    PerformanceEvaluator evaluator(thresholds);
    CapitalProtector protector(limits, evaluator);

    auto first = protector.assess(MS_PER_HOUR, {{"c-1", 0}}, {},
                                  {interval("c-1", "c-1", 0, 60.0, 0.0)});
    EXPECT_FALSE(first.isHalted("c-1"));

    auto second = protector.assess(2 * MS_PER_HOUR, {{"c-1", 0}}, first.ledgers,
                                   {interval("c-1", "c-1", 0, 60.0, 0.0)});
    EXPECT_DOUBLE_EQ(second.assessments.at("c-1").cumulative_loss, 120.0);
    EXPECT_TRUE(second.isHalted("c-1"));
    EXPECT_EQ(second.assessments.at("c-1").window_start_ms, MS_PER_HOUR);
}
