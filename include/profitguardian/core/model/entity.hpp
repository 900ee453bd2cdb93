#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace ProfitGuardian {

// ============================================================================
// Entity kinds as a tagged variant
// ============================================================================
// Each alternative carries what is specific to that level. Evaluation is the
// same for all three; only rollup rank and reporting differ.
// ============================================================================

struct CampaignScope {
    std::string name;
};

struct AdGroupScope {
    std::string name;
};

struct KeywordScope {
    std::string ad_group_id;
    std::string text;
};

using EntityScope = std::variant<CampaignScope, AdGroupScope, KeywordScope>;

enum class EntityKind : uint8_t {
    CAMPAIGN = 0,
    AD_GROUP = 1,
    KEYWORD = 2
};

EntityKind kindOf(const EntityScope& scope);

/**
 * @brief Rollup rank for campaign-level loss aggregation
 * Lower rank = coarser level. Campaign spend already contains its ad groups,
 * so the protector only sums entities at the lowest rank present.
 */
int rollupRank(const EntityScope& scope);

const char* kindString(EntityKind kind);
std::optional<EntityKind> parseEntityKind(const std::string& text);

/**
 * @brief Human readable label: campaign name, ad group name or keyword text
 */
std::string describeScope(const EntityScope& scope);

/**
 * @struct ManagedEntity
 * @brief A campaign, ad group or keyword under guardianship
 *
 * Immutable except daily_budget, which operators may change between ticks.
 */
struct ManagedEntity {
    std::string id;
    std::string campaign_id;
    EntityScope scope{CampaignScope{}};
    double daily_budget = 0.0;
    uint64_t created_at_ms = 0;

    EntityKind kind() const { return kindOf(scope); }
};

} // namespace ProfitGuardian
