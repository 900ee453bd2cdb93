// ============================================================================
// FEED PLATFORM UNIT TESTS
// ============================================================================
// YAML metrics feed parsing and the append-only action log
// ============================================================================

#include <gtest/gtest.h>
#include <profitguardian/core/model/errors.hpp>
#include <profitguardian/core/platform/feed_platform.hpp>

#include <filesystem>
#include <fstream>

using namespace ProfitGuardian;

class FeedPlatformTest : public ::testing::Test {
protected:
    std::filesystem::path dir;
    std::string feed_path;
    std::string log_path;

    void SetUp() override {
        dir = std::filesystem::temp_directory_path() / "pg_feed_platform_test";
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        feed_path = (dir / "feed.yaml").string();
        log_path = (dir / "actions.log").string();

        std::ofstream feed(feed_path);
        feed << "entities:\n"
             << "  kw-1: {spend: 80, conversions: 1, conversion_value: 30, clicks: 25,"
             << " impressions: 900, elapsed_day_fraction: 0.5}\n"
             << "  kw-2: {error: transient, message: \"rate limited\"}\n"
             << "  kw-3: {error: permanent, message: \"removed\"}\n"
             << "  kw-4: {spend: 5, clicks: 2, impressions: 40}\n";
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }
};

TEST_F(FeedPlatformTest, ReadsFeedRows) {
    FeedAdsPlatform platform(feed_path, log_path);
    auto results = platform.fetchMetrics({"kw-1", "kw-4"}, ReportingWindow{0, 5000});

    const auto& kw1 = std::get<MetricsSnapshot>(results.at("kw-1"));
    EXPECT_DOUBLE_EQ(kw1.spend, 80.0);
    ASSERT_TRUE(kw1.conversion_value.has_value());
    EXPECT_DOUBLE_EQ(*kw1.conversion_value, 30.0);
    EXPECT_EQ(kw1.clicks, 25u);
    EXPECT_EQ(kw1.timestamp_ms, 5000u);
    EXPECT_DOUBLE_EQ(kw1.elapsed_day_fraction, 0.5);

    const auto& kw4 = std::get<MetricsSnapshot>(results.at("kw-4"));
    EXPECT_FALSE(kw4.conversion_value.has_value());
    EXPECT_DOUBLE_EQ(kw4.conversions, 0.0);
}

TEST_F(FeedPlatformTest, ErrorRowsAndMissingEntities) {
    FeedAdsPlatform platform(feed_path, log_path);
    auto results = platform.fetchMetrics({"kw-2", "kw-3", "kw-9"}, ReportingWindow{0, 5000});

    EXPECT_EQ(std::get<FetchError>(results.at("kw-2")).kind, FetchErrorKind::TRANSIENT);
    EXPECT_EQ(std::get<FetchError>(results.at("kw-2")).message, "rate limited");
    EXPECT_EQ(std::get<FetchError>(results.at("kw-3")).kind, FetchErrorKind::PERMANENT);
    EXPECT_EQ(std::get<FetchError>(results.at("kw-9")).kind, FetchErrorKind::PERMANENT);
}

TEST_F(FeedPlatformTest, MissingFeedIsPlatformOutage) {
    FeedAdsPlatform platform((dir / "absent.yaml").string(), log_path);
    EXPECT_THROW(platform.fetchMetrics({"kw-1"}, ReportingWindow{0, 5000}),
                 PlatformUnavailableError);
}

TEST_F(FeedPlatformTest, DuplicateKeyIsReplayed) {
    FeedAdsPlatform platform(feed_path, log_path);
    auto first = platform.setEntityStatus("kw-1", TargetStatus::PAUSED, "kw-1|PAUSED|5000");
    auto second = platform.setEntityStatus("kw-1", TargetStatus::PAUSED, "kw-1|PAUSED|5000");

    EXPECT_FALSE(std::get<StatusAck>(first).replayed);
    EXPECT_TRUE(std::get<StatusAck>(second).replayed);
    EXPECT_EQ(platform.appliedCount(), 1u);
}

TEST_F(FeedPlatformTest, AppliedKeysSurviveRestart) {
    {
        FeedAdsPlatform platform(feed_path, log_path);
        auto ack = platform.setEntityStatus("kw-1", TargetStatus::PAUSED, "kw-1|PAUSED|5000");
        EXPECT_FALSE(std::get<StatusAck>(ack).replayed);
    }

    FeedAdsPlatform restarted(feed_path, log_path);
    EXPECT_EQ(restarted.appliedCount(), 1u);
    auto again = restarted.setEntityStatus("kw-1", TargetStatus::PAUSED, "kw-1|PAUSED|5000");
    EXPECT_TRUE(std::get<StatusAck>(again).replayed);
}

TEST(ElapsedDayFraction, StaysWithinDay) {
    const double f = elapsedDayFraction(1700000000000ULL);
    EXPECT_GE(f, 0.0);
    EXPECT_LT(f, 1.0);
}
