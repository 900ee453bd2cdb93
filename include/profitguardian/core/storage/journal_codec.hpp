#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include <profitguardian/core/model/decision.hpp>
#include <profitguardian/core/model/ledger.hpp>
#include <profitguardian/core/model/metrics.hpp>

namespace ProfitGuardian {

/**
 * @struct TickBatch
 * @brief Everything one tick commits, as a single all-or-nothing unit
 */
struct TickBatch {
    TickRecord record;
    std::vector<MetricsSnapshot> snapshots;
    std::vector<GuardianDecision> decisions;
    std::vector<LossLedger> ledgers;
    std::unordered_map<std::string, double> budget_updates;
};

// ============================================================================
// Journal frame layout (host byte order, append-only)
// ============================================================================
//   [magic:4 "PGJ1"][type:1][payload_len:4][payload:N][fnv1a(type..payload):4]
//
// A frame is accepted only if it is complete and its checksum matches. The
// first bad frame ends the valid prefix; everything after it is discarded.
// ============================================================================

enum class FrameType : uint8_t {
    TICK_COMMIT = 1,    // full TickBatch
    TICK_OUTCOME = 2    // TickRecord only (skipped or aborted tick)
};

struct JournalFrame {
    FrameType type = FrameType::TICK_COMMIT;
    TickBatch batch;    // only batch.record is set for TICK_OUTCOME
};

struct DecodeResult {
    std::vector<JournalFrame> frames;
    size_t valid_bytes = 0;        // length of the intact prefix
    std::string error;             // why decoding stopped early, empty if clean
};

constexpr uint32_t JOURNAL_MAGIC = 0x314A4750;   // "PGJ1"
constexpr size_t FRAME_OVERHEAD = 4 + 1 + 4 + 4;

std::vector<uint8_t> encodeTickCommit(const TickBatch& batch);
std::vector<uint8_t> encodeTickOutcome(const TickRecord& record);

/**
 * @brief Decode every intact frame from the start of a journal image
 * Never throws: a truncated or corrupt frame stops decoding.
 */
DecodeResult decodeJournal(const uint8_t* data, size_t len);

uint32_t fnv1a(const uint8_t* data, size_t len);

} // namespace ProfitGuardian
