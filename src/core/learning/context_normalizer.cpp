#include "core/learning/context_normalizer.h"

#include <array>

namespace crl {

namespace {

struct GoalAlias {
    const char* alias;
    const char* key;
};

// Generic goal phrasings collapse onto shared keys.
constexpr std::array<GoalAlias, 6> kGoalAliases = {{
    {"minimize cpa", "MINIMIZE_CPA"},
    {"maximize roas", "MAXIMIZE_ROAS"},
    {"brand awareness", "BRAND_AWARENESS"},
    {"conversions", "MAXIMIZE_CONVERSIONS"},
    {"reach", "MAXIMIZE_REACH"},
    {"ctr", "MAXIMIZE_CTR"},
}};

} // namespace

std::optional<QString> ContextNormalizer::normalize(const QString& raw)
{
    const QString simplified = raw.simplified();
    if (simplified.isEmpty()) {
        return std::nullopt;
    }

    const QString lowered = simplified.toLower();
    for (const GoalAlias& entry : kGoalAliases) {
        if (lowered == QLatin1String(entry.alias)) {
            return QString::fromLatin1(entry.key);
        }
    }

    QString key = simplified.toUpper();
    key.replace(QLatin1Char(' '), QLatin1Char('_'));
    key.replace(QLatin1Char('-'), QLatin1Char('_'));
    return key;
}

std::optional<QString> ContextNormalizer::normalize(const CampaignContext& context)
{
    return normalize(context.strategicContext);
}

} // namespace crl
