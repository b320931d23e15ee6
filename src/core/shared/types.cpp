#include "core/shared/types.h"

#include <array>
#include <cmath>
#include <limits>

namespace crl {

namespace {

struct ActionName {
    ActionType action;
    const char* name;
};

constexpr std::array<ActionName, kActionTypeCount> kActionNames = {{
    {ActionType::OptimizeBiddingStrategy, "optimize_bidding_strategy"},
    {ActionType::IncreaseBidConversionKeywords, "increase_bid_conversion_keywords"},
    {ActionType::ReduceBidConservative, "reduce_bid_conservative"},
    {ActionType::FocusHighValueAudiences, "focus_high_value_audiences"},
    {ActionType::ExpandReachCampaigns, "expand_reach_campaigns"},
    {ActionType::PauseCampaign, "pause_campaign"},
    {ActionType::IncreaseBudgetModerate, "increase_budget_moderate"},
    {ActionType::ReduceBudgetDrastic, "reduce_budget_drastic"},
    {ActionType::OptimizeForCtr, "optimize_for_ctr"},
    {ActionType::OptimizeForReach, "optimize_for_reach"},
    {ActionType::AdjustTargetingNarrow, "adjust_targeting_narrow"},
    {ActionType::AdjustTargetingBroad, "adjust_targeting_broad"},
}};

QString canonicalToken(const QString& raw)
{
    QString token = raw.trimmed().toLower();
    token.replace(QLatin1Char('-'), QLatin1Char('_'));
    return token;
}

} // namespace

QString actionTypeToString(ActionType action)
{
    for (const ActionName& entry : kActionNames) {
        if (entry.action == action) {
            return QString::fromLatin1(entry.name);
        }
    }
    return QStringLiteral("unknown");
}

std::optional<ActionType> actionTypeFromString(const QString& str)
{
    const QString token = canonicalToken(str);
    if (token.isEmpty()) {
        return std::nullopt;
    }
    for (const ActionName& entry : kActionNames) {
        if (token == QLatin1String(entry.name)) {
            return entry.action;
        }
    }
    return std::nullopt;
}

const QVector<ActionType>& allActionTypes()
{
    static const QVector<ActionType> kAll = [] {
        QVector<ActionType> actions;
        actions.reserve(kActionTypeCount);
        for (const ActionName& entry : kActionNames) {
            actions.push_back(entry.action);
        }
        return actions;
    }();
    return kAll;
}

QString campaignTypeToString(CampaignType type)
{
    switch (type) {
    case CampaignType::Conversion: return QStringLiteral("conversion");
    case CampaignType::Awareness:  return QStringLiteral("awareness");
    case CampaignType::Reach:      return QStringLiteral("reach");
    case CampaignType::Engagement: return QStringLiteral("engagement");
    case CampaignType::Traffic:    return QStringLiteral("traffic");
    }
    return QStringLiteral("conversion");
}

std::optional<CampaignType> campaignTypeFromString(const QString& str)
{
    const QString token = canonicalToken(str);
    if (token == QLatin1String("conversion")) return CampaignType::Conversion;
    if (token == QLatin1String("awareness"))  return CampaignType::Awareness;
    if (token == QLatin1String("reach"))      return CampaignType::Reach;
    if (token == QLatin1String("engagement")) return CampaignType::Engagement;
    if (token == QLatin1String("traffic"))    return CampaignType::Traffic;
    return std::nullopt;
}

QString riskAppetiteToString(RiskAppetite risk)
{
    switch (risk) {
    case RiskAppetite::Conservative: return QStringLiteral("conservative");
    case RiskAppetite::Moderate:     return QStringLiteral("moderate");
    case RiskAppetite::Aggressive:   return QStringLiteral("aggressive");
    }
    return QStringLiteral("moderate");
}

std::optional<RiskAppetite> riskAppetiteFromString(const QString& str)
{
    const QString token = canonicalToken(str);
    if (token == QLatin1String("conservative")) return RiskAppetite::Conservative;
    if (token == QLatin1String("moderate"))     return RiskAppetite::Moderate;
    if (token == QLatin1String("aggressive"))   return RiskAppetite::Aggressive;
    return std::nullopt;
}

QString competitionToString(Competition competition)
{
    switch (competition) {
    case Competition::Low:      return QStringLiteral("low");
    case Competition::Moderate: return QStringLiteral("moderate");
    case Competition::High:     return QStringLiteral("high");
    }
    return QStringLiteral("moderate");
}

std::optional<Competition> competitionFromString(const QString& str)
{
    const QString token = canonicalToken(str);
    if (token == QLatin1String("low"))      return Competition::Low;
    if (token == QLatin1String("moderate")) return Competition::Moderate;
    if (token == QLatin1String("high"))     return Competition::High;
    return std::nullopt;
}

int64_t countFromJson(const QJsonValue& value, int64_t fallback)
{
    if (!value.isDouble()) {
        return fallback;
    }
    const double raw = value.toDouble();
    if (std::isnan(raw)) {
        return fallback;
    }
    if (raw <= 0.0) {
        return 0;
    }
    // 2^63 is the smallest double that no longer fits.
    if (raw >= 9223372036854775808.0) {
        return std::numeric_limits<int64_t>::max();
    }
    return static_cast<int64_t>(raw);
}

} // namespace crl
