#pragma once

#include <QJsonValue>
#include <QString>
#include <QVector>

#include <cstdint>
#include <optional>

namespace crl {

// Fixed optimization vocabulary. Wire form is the lower-case underscore name.
enum class ActionType {
    OptimizeBiddingStrategy,
    IncreaseBidConversionKeywords,
    ReduceBidConservative,
    FocusHighValueAudiences,
    ExpandReachCampaigns,
    PauseCampaign,
    IncreaseBudgetModerate,
    ReduceBudgetDrastic,
    OptimizeForCtr,
    OptimizeForReach,
    AdjustTargetingNarrow,
    AdjustTargetingBroad,
};

constexpr int kActionTypeCount = 12;

QString actionTypeToString(ActionType action);
// Case-insensitive; accepts '-' in place of '_'.
std::optional<ActionType> actionTypeFromString(const QString& str);
const QVector<ActionType>& allActionTypes();

enum class CampaignType {
    Conversion,
    Awareness,
    Reach,
    Engagement,
    Traffic,
};

QString campaignTypeToString(CampaignType type);
std::optional<CampaignType> campaignTypeFromString(const QString& str);

enum class RiskAppetite {
    Conservative,
    Moderate,
    Aggressive,
};

QString riskAppetiteToString(RiskAppetite risk);
std::optional<RiskAppetite> riskAppetiteFromString(const QString& str);

enum class Competition {
    Low,
    Moderate,
    High,
};

QString competitionToString(Competition competition);
std::optional<Competition> competitionFromString(const QString& str);

// Reads a non-negative count from JSON. Values beyond the int64 range
// saturate; anything that is not a number gives `fallback`.
int64_t countFromJson(const QJsonValue& value, int64_t fallback);

// Observed campaign performance. Defaults match a healthy mid-size campaign.
struct CampaignMetrics {
    double ctr = 2.0;
    double cpm = 10.0;
    double cpc = 0.5;
    int64_t impressions = 10000;
    int64_t clicks = 200;
    int64_t conversions = 20;
    double spend = 100.0;
    double revenue = 200.0;
    double roas = 2.0;
    double budgetUtilization = 0.8;
    int64_t reach = 8000;
    double frequency = 1.25;

    bool isPerformingWell() const
    {
        return roas >= 2.0 && ctr >= 1.5 && conversions >= 10;
    }

    bool needsOptimization() const
    {
        return roas < 1.5 || ctr < 1.0 || budgetUtilization > 0.9;
    }
};

struct CampaignContext {
    QString strategicContext;
    CampaignType campaignType = CampaignType::Conversion;
    RiskAppetite riskAppetite = RiskAppetite::Moderate;
    Competition competition = Competition::Moderate;

    QString timeOfDay = QStringLiteral("business_hours");
    QString dayOfWeek = QStringLiteral("weekday");
    QString seasonality = QStringLiteral("normal");
    QString marketConditions = QStringLiteral("stable");
    QString region = QStringLiteral("southeast");
};

} // namespace crl
