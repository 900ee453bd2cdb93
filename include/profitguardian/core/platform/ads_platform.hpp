#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <profitguardian/core/model/metrics.hpp>

namespace ProfitGuardian {

/**
 * Status requested from the platform for one entity
 */
enum class TargetStatus : uint8_t {
    ENABLED = 0,
    PAUSED = 1,
    PACED = 2     // serving throttled to spread remaining budget
};

const char* targetStatusString(TargetStatus s);

struct ReportingWindow {
    uint64_t start_ms = 0;
    uint64_t end_ms = 0;
};

struct StatusAck {
    std::string idempotency_key;
    bool replayed = false;   // platform had already applied this key
};

struct PlatformError {
    bool transient = true;
    std::string message;
};

using StatusResult = std::variant<StatusAck, PlatformError>;

/**
 * @class AdsPlatform
 * @brief Boundary to the advertising platform client
 *
 * fetchMetrics reports per-entity failures as FetchError values. It throws
 * PlatformUnavailableError only when nothing at all can be fetched.
 * Implementations must be safe to call from several worker threads.
 */
class AdsPlatform {
public:
    virtual ~AdsPlatform() = default;

    virtual std::unordered_map<std::string, FetchResult> fetchMetrics(
        const std::vector<std::string>& entity_ids,
        const ReportingWindow& window) = 0;

    virtual StatusResult setEntityStatus(
        const std::string& entity_id,
        TargetStatus target,
        const std::string& idempotency_key) = 0;
};

} // namespace ProfitGuardian
