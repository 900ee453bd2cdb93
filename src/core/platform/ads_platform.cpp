#include <profitguardian/core/platform/ads_platform.hpp>

namespace ProfitGuardian {

const char* targetStatusString(TargetStatus s) {
    switch (s) {
        case TargetStatus::ENABLED: return "ENABLED";
        case TargetStatus::PAUSED:  return "PAUSED";
        case TargetStatus::PACED:   return "PACED";
        default:                    return "UNKNOWN";
    }
}

} // namespace ProfitGuardian
