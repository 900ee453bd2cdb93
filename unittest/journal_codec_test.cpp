// ============================================================================
// JOURNAL CODEC UNIT TESTS
// ============================================================================
// Frame layout, checksum and truncated-tail handling
// ============================================================================

#include <gtest/gtest.h>
#include <profitguardian/core/storage/journal_codec.hpp>

using namespace ProfitGuardian;

namespace {

TickBatch sampleBatch(uint64_t tick) {
    TickBatch batch;
    batch.record.tick_ms = tick;
    batch.record.evaluated = 1;
    batch.record.applied = 1;

    MetricsSnapshot s;
    s.entity_id = "kw-1";
    s.timestamp_ms = tick;
    s.spend = 42.5;
    s.clicks = 17;
    batch.snapshots.push_back(s);

    GuardianDecision d;
    d.entity_id = "kw-1";
    d.campaign_id = "c-1";
    d.tick_ms = tick;
    d.action = ActionIntent::PAUSE;
    d.reason = ReasonCode::NEGATIVE_PROFIT;
    d.proposed_state = LifecycleState::GUARDIAN_PAUSED;
    d.outcome = ActionOutcome::APPLIED;
    d.pacing_ratio = 1.25;
    d.negative_streak = 2;
    d.prior_paced = true;
    d.idempotency_key = "kw-1|PAUSED|" + std::to_string(tick);
    batch.decisions.push_back(d);

    LossLedger l;
    l.campaign_id = "c-1";
    l.opened_ms = tick;
    l.entries.push_back(LedgerEntry{tick, 12.5});
    batch.ledgers.push_back(l);

    batch.budget_updates["kw-1"] = 75.0;
    return batch;
}

} // namespace

TEST(JournalCodec, DecodesConsecutiveFrames) {
    auto a = encodeTickCommit(sampleBatch(1000));
    TickRecord skipped;
    skipped.tick_ms = 2000;
    skipped.outcome = TickOutcome::SKIPPED_OVERLAP;
    skipped.reason = "busy";
    auto b = encodeTickOutcome(skipped);

    std::vector<uint8_t> image(a);
    image.insert(image.end(), b.begin(), b.end());

    auto decoded = decodeJournal(image.data(), image.size());
    ASSERT_EQ(decoded.frames.size(), 2u);
    EXPECT_TRUE(decoded.error.empty());
    EXPECT_EQ(decoded.valid_bytes, image.size());

    const auto& commit = decoded.frames[0];
    EXPECT_EQ(commit.type, FrameType::TICK_COMMIT);
    ASSERT_EQ(commit.batch.decisions.size(), 1u);
    const auto& d = commit.batch.decisions[0];
    EXPECT_EQ(d.reason, ReasonCode::NEGATIVE_PROFIT);
    EXPECT_EQ(d.negative_streak, 2u);
    EXPECT_TRUE(d.prior_paced);
    EXPECT_FALSE(d.paced);
    ASSERT_TRUE(d.pacing_ratio.has_value());
    EXPECT_DOUBLE_EQ(*d.pacing_ratio, 1.25);
    EXPECT_DOUBLE_EQ(commit.batch.ledgers[0].cumulativeLoss(), 12.5);
    EXPECT_DOUBLE_EQ(commit.batch.budget_updates.at("kw-1"), 75.0);
    EXPECT_FALSE(commit.batch.snapshots[0].conversion_value.has_value());

    EXPECT_EQ(decoded.frames[1].type, FrameType::TICK_OUTCOME);
    EXPECT_EQ(decoded.frames[1].batch.record.outcome, TickOutcome::SKIPPED_OVERLAP);
    EXPECT_EQ(decoded.frames[1].batch.record.reason, "busy");
}

TEST(JournalCodec, TruncatedTailIsDiscarded) {
    auto a = encodeTickCommit(sampleBatch(1000));
    auto b = encodeTickCommit(sampleBatch(2000));

    std::vector<uint8_t> image(a);
    image.insert(image.end(), b.begin(), b.begin() + static_cast<long>(b.size() / 2));

    auto decoded = decodeJournal(image.data(), image.size());
    ASSERT_EQ(decoded.frames.size(), 1u);
    EXPECT_EQ(decoded.valid_bytes, a.size());
    EXPECT_FALSE(decoded.error.empty());
}

TEST(JournalCodec, ChecksumMismatchStopsDecoding) {
    auto a = encodeTickCommit(sampleBatch(1000));
    a[20] ^= 0xFF;

    auto decoded = decodeJournal(a.data(), a.size());
    EXPECT_TRUE(decoded.frames.empty());
    EXPECT_EQ(decoded.valid_bytes, 0u);
}

TEST(JournalCodec, EmptyImageIsClean) {
    auto decoded = decodeJournal(nullptr, 0);
    EXPECT_TRUE(decoded.frames.empty());
    EXPECT_TRUE(decoded.error.empty());
}
