#include <profitguardian/core/model/entity.hpp>

#include <algorithm>
#include <cctype>

namespace ProfitGuardian {

namespace {

template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

EntityKind kindOf(const EntityScope& scope) {
    return std::visit(Overloaded{
        [](const CampaignScope&) { return EntityKind::CAMPAIGN; },
        [](const AdGroupScope&) { return EntityKind::AD_GROUP; },
        [](const KeywordScope&) { return EntityKind::KEYWORD; }
    }, scope);
}

int rollupRank(const EntityScope& scope) {
    return static_cast<int>(kindOf(scope));
}

const char* kindString(EntityKind kind) {
    switch (kind) {
        case EntityKind::CAMPAIGN: return "campaign";
        case EntityKind::AD_GROUP: return "ad_group";
        case EntityKind::KEYWORD:  return "keyword";
        default:                   return "unknown";
    }
}

std::optional<EntityKind> parseEntityKind(const std::string& text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "campaign") return EntityKind::CAMPAIGN;
    if (lowered == "ad_group" || lowered == "adgroup") return EntityKind::AD_GROUP;
    if (lowered == "keyword") return EntityKind::KEYWORD;
    return std::nullopt;
}

std::string describeScope(const EntityScope& scope) {
    return std::visit(Overloaded{
        [](const CampaignScope& c) { return c.name; },
        [](const AdGroupScope& a) { return a.name; },
        [](const KeywordScope& k) { return k.text; }
    }, scope);
}

} // namespace ProfitGuardian
