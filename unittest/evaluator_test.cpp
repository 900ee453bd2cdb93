// ============================================================================
// PERFORMANCE EVALUATOR UNIT TESTS
// ============================================================================
// Pacing classification, trailing-window profit, proxy basis and confidence
// ============================================================================

#include <gtest/gtest.h>
#include <profitguardian/core/evaluator/performance_evaluator.hpp>
#include <profitguardian/core/utils/clock.hpp>

using namespace ProfitGuardian;

class PerformanceEvaluatorTest : public ::testing::Test {
protected:
    AppConfig::EvaluatorThresholds thresholds;
    ManagedEntity entity;

    void SetUp() override {
        entity.id = "kw-1";
        entity.campaign_id = "c-1";
        entity.scope = KeywordScope{"ag-1", "running shoes"};
        entity.daily_budget = 100.0;
    }

    static MetricsSnapshot snap(uint64_t ts, double spend, double conversions,
                                std::optional<double> value, uint64_t clicks,
                                uint64_t impressions, double elapsed = 0.5) {
        MetricsSnapshot s;
        s.entity_id = "kw-1";
        s.timestamp_ms = ts;
        s.spend = spend;
        s.conversions = conversions;
        s.conversion_value = value;
        s.clicks = clicks;
        s.impressions = impressions;
        s.elapsed_day_fraction = elapsed;
        return s;
    }
};

// ============================================================================
// PACING TESTS
// ============================================================================

TEST_F(PerformanceEvaluatorTest, OverPaceAtHalfDay) {
    PerformanceEvaluator evaluator(thresholds);
    auto pacing = evaluator.computePacing(entity, snap(1000, 80.0, 0, std::nullopt, 0, 0, 0.5));

    EXPECT_DOUBLE_EQ(pacing.target_by_now, 50.0);
    ASSERT_TRUE(pacing.ratio.has_value());
    EXPECT_DOUBLE_EQ(*pacing.ratio, 1.6);
    EXPECT_EQ(pacing.pacing, PacingClass::OVER_PACE);
}

TEST_F(PerformanceEvaluatorTest, ZeroTargetIsNoSignal) {
    PerformanceEvaluator evaluator(thresholds);
    auto pacing = evaluator.computePacing(entity, snap(1000, 10.0, 0, std::nullopt, 0, 0, 0.0));

    EXPECT_DOUBLE_EQ(pacing.target_by_now, 0.0);
    EXPECT_FALSE(pacing.ratio.has_value());
    EXPECT_EQ(pacing.pacing, PacingClass::NO_SIGNAL);

    entity.daily_budget = 0.0;
    pacing = evaluator.computePacing(entity, snap(1000, 10.0, 0, std::nullopt, 0, 0, 0.5));
    EXPECT_EQ(pacing.pacing, PacingClass::NO_SIGNAL);
}

TEST_F(PerformanceEvaluatorTest, UnderAndOnPace) {
    PerformanceEvaluator evaluator(thresholds);
    EXPECT_EQ(evaluator.computePacing(entity, snap(1, 20.0, 0, std::nullopt, 0, 0)).pacing,
              PacingClass::UNDER_PACE);
    EXPECT_EQ(evaluator.computePacing(entity, snap(1, 50.0, 0, std::nullopt, 0, 0)).pacing,
              PacingClass::ON_PACE);
}

// ============================================================================
// PROFITABILITY TESTS
// ============================================================================

TEST_F(PerformanceEvaluatorTest, ValueBasedNegativeHighConfidence) {
    PerformanceEvaluator evaluator(thresholds);
    auto signal = evaluator.computeSignal(snap(1000, 120.0, 1, 40.0, 40, 800), {});

    EXPECT_EQ(signal.basis, SignalBasis::VALUE);
    EXPECT_DOUBLE_EQ(signal.profit, -80.0);
    EXPECT_EQ(signal.polarity, Polarity::NEGATIVE);
    EXPECT_EQ(signal.confidence, Confidence::HIGH);
}

TEST_F(PerformanceEvaluatorTest, ProxyUsedWhenValueMissing) {
    PerformanceEvaluator evaluator(thresholds);
    // 2 conversions * 50 breakeven = 100 estimated value
    auto signal = evaluator.computeSignal(snap(1000, 60.0, 2, std::nullopt, 20, 500), {});

    EXPECT_EQ(signal.basis, SignalBasis::PROXY);
    EXPECT_DOUBLE_EQ(signal.window_value, 100.0);
    EXPECT_DOUBLE_EQ(signal.profit, 40.0);
    EXPECT_EQ(signal.polarity, Polarity::POSITIVE);
    EXPECT_EQ(signal.confidence, Confidence::MEDIUM);
}

TEST_F(PerformanceEvaluatorTest, ProxyWithoutConversionsBelowBreakevenIsNeutral) {
    PerformanceEvaluator evaluator(thresholds);
    auto signal = evaluator.computeSignal(snap(1000, 45.0, 0, std::nullopt, 30, 500), {});
    EXPECT_EQ(signal.polarity, Polarity::NEUTRAL);

    signal = evaluator.computeSignal(snap(1000, 51.0, 0, std::nullopt, 30, 500), {});
    EXPECT_EQ(signal.polarity, Polarity::NEGATIVE);
}

TEST_F(PerformanceEvaluatorTest, ZeroSpendZeroClicksIsNeutral) {
    PerformanceEvaluator evaluator(thresholds);
    auto signal = evaluator.computeSignal(snap(1000, 0.0, 0, std::nullopt, 0, 0), {});
    EXPECT_EQ(signal.polarity, Polarity::NEUTRAL);
    EXPECT_DOUBLE_EQ(signal.profit, 0.0);
    EXPECT_EQ(signal.confidence, Confidence::LOW);
}

TEST_F(PerformanceEvaluatorTest, ProfitInsideToleranceIsNeutral) {
    thresholds.profit_tolerance = 5.0;
    PerformanceEvaluator evaluator(thresholds);
    auto signal = evaluator.computeSignal(snap(1000, 100.0, 1, 97.0, 40, 800), {});
    EXPECT_EQ(signal.polarity, Polarity::NEUTRAL);
}

TEST_F(PerformanceEvaluatorTest, LowConfidenceBelowClickOrImpressionFloor) {
    PerformanceEvaluator evaluator(thresholds);
    EXPECT_EQ(evaluator.computeSignal(snap(1000, 100.0, 0, 0.0, 5, 800), {}).confidence,
              Confidence::LOW);
    EXPECT_EQ(evaluator.computeSignal(snap(1000, 100.0, 0, 0.0, 50, 50), {}).confidence,
              Confidence::LOW);
}

// ============================================================================
// WINDOW TESTS
// ============================================================================

TEST_F(PerformanceEvaluatorTest, WindowSumsConsecutiveDeltas) {
    PerformanceEvaluator evaluator(thresholds);
    std::vector<MetricsSnapshot> history{
        snap(1 * MS_PER_HOUR, 30.0, 0, 0.0, 10, 200),
        snap(2 * MS_PER_HOUR, 60.0, 1, 20.0, 20, 400),
    };
    auto signal = evaluator.computeSignal(snap(3 * MS_PER_HOUR, 90.0, 1, 20.0, 30, 600), history);

    EXPECT_EQ(signal.window_ticks, 3u);
    EXPECT_DOUBLE_EQ(signal.window_spend, 90.0);
    EXPECT_EQ(signal.window_clicks, 30u);
    EXPECT_DOUBLE_EQ(signal.profit, -70.0);
}

TEST_F(PerformanceEvaluatorTest, WindowBoundedByHistoryTicks) {
    thresholds.history_ticks = 2;
    PerformanceEvaluator evaluator(thresholds);
    std::vector<MetricsSnapshot> history{
        snap(1 * MS_PER_HOUR, 30.0, 0, 0.0, 10, 200),
        snap(2 * MS_PER_HOUR, 60.0, 0, 0.0, 20, 400),
    };
    auto signal = evaluator.computeSignal(snap(3 * MS_PER_HOUR, 90.0, 0, 0.0, 30, 600), history);

    // Current interval (30) plus the one before it (30)
    EXPECT_EQ(signal.window_ticks, 2u);
    EXPECT_DOUBLE_EQ(signal.window_spend, 60.0);
}

TEST_F(PerformanceEvaluatorTest, WindowBoundedByHours) {
    thresholds.history_window_hours = 2.0;
    PerformanceEvaluator evaluator(thresholds);
    std::vector<MetricsSnapshot> history{
        snap(1 * MS_PER_HOUR, 30.0, 0, 0.0, 10, 200),
        snap(4 * MS_PER_HOUR, 60.0, 0, 0.0, 20, 400),
    };
    auto signal = evaluator.computeSignal(snap(5 * MS_PER_HOUR, 90.0, 0, 0.0, 30, 600), history);

    EXPECT_EQ(signal.window_ticks, 2u);
    // 4h snapshot has no in-window predecessor: counted as its own cumulative (60) + 30
    EXPECT_DOUBLE_EQ(signal.window_spend, 90.0);
}

TEST_F(PerformanceEvaluatorTest, DecreasingCounterIsDayRollover) {
    auto prev = snap(1000, 400.0, 5, 300.0, 200, 4000);
    auto cur = snap(2000, 15.0, 0, 0.0, 4, 90);
    auto delta = PerformanceEvaluator::intervalDelta(&prev, cur);

    EXPECT_DOUBLE_EQ(delta.spend, 15.0);
    EXPECT_EQ(delta.clicks, 4u);
    EXPECT_EQ(delta.impressions, 90u);
}

TEST_F(PerformanceEvaluatorTest, EvaluationIsIndependentOfEntityKind) {
    PerformanceEvaluator evaluator(thresholds);
    auto current = snap(1000, 80.0, 0, 0.0, 40, 800);

    ManagedEntity campaign = entity;
    campaign.scope = CampaignScope{"Spring"};
    auto a = evaluator.evaluate(entity, current, {});
    auto b = evaluator.evaluate(campaign, current, {});

    EXPECT_EQ(a.signal.polarity, b.signal.polarity);
    EXPECT_DOUBLE_EQ(a.signal.profit, b.signal.profit);
    EXPECT_EQ(a.pacing.pacing, b.pacing.pacing);
}
