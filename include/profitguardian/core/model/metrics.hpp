#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace ProfitGuardian {

/**
 * @struct MetricsSnapshot
 * @brief One fetch result for one entity at one tick
 *
 * Counters are cumulative for the current platform day. conversion_value is
 * empty when the platform reports no value data for the entity.
 */
struct MetricsSnapshot {
    std::string entity_id;
    uint64_t timestamp_ms = 0;
    double spend = 0.0;
    double conversions = 0.0;
    std::optional<double> conversion_value;
    uint64_t clicks = 0;
    uint64_t impressions = 0;
    double elapsed_day_fraction = 0.0;
};

enum class FetchErrorKind : uint8_t {
    TRANSIENT = 0,   // rate limit, network: retry within the tick
    PERMANENT = 1    // authorization, entity not found: skip for this tick
};

struct FetchError {
    FetchErrorKind kind = FetchErrorKind::TRANSIENT;
    std::string message;

    bool retryable() const { return kind == FetchErrorKind::TRANSIENT; }
    static const char* kindString(FetchErrorKind k) {
        return k == FetchErrorKind::TRANSIENT ? "TransientFetchError" : "PermanentFetchError";
    }
};

using FetchResult = std::variant<MetricsSnapshot, FetchError>;

// ============================================================================
// Derived signals
// ============================================================================

enum class PacingClass : uint8_t {
    NO_SIGNAL = 0,   // target-spend-by-now is zero, ratio undefined
    UNDER_PACE = 1,
    ON_PACE = 2,
    OVER_PACE = 3
};

struct PacingState {
    double target_by_now = 0.0;
    double actual_spend = 0.0;
    std::optional<double> ratio;     // empty when target_by_now == 0
    PacingClass pacing = PacingClass::NO_SIGNAL;
};

enum class SignalBasis : uint8_t {
    VALUE = 0,
    PROXY = 1
};

enum class Confidence : uint8_t {
    LOW = 0,
    MEDIUM = 1,
    HIGH = 2
};

enum class Polarity : uint8_t {
    NEGATIVE = 0,
    NEUTRAL = 1,
    POSITIVE = 2
};

struct ProfitabilitySignal {
    double profit = 0.0;
    SignalBasis basis = SignalBasis::VALUE;
    Polarity polarity = Polarity::NEUTRAL;
    Confidence confidence = Confidence::LOW;

    double window_spend = 0.0;
    double window_value = 0.0;
    double window_conversions = 0.0;
    uint64_t window_clicks = 0;
    uint64_t window_impressions = 0;
    uint32_t window_ticks = 0;

    bool negative() const { return polarity == Polarity::NEGATIVE; }
};

struct EntityEvaluation {
    std::string entity_id;
    PacingState pacing;
    ProfitabilitySignal signal;
};

const char* pacingString(PacingClass p);
const char* basisString(SignalBasis b);
const char* confidenceString(Confidence c);
const char* polarityString(Polarity p);

} // namespace ProfitGuardian
