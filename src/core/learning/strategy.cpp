#include "core/learning/strategy.h"

#include <QJsonValue>

namespace crl {

namespace {

QString isoString(const QDateTime& value)
{
    return value.isValid() ? value.toString(Qt::ISODateWithMs) : QString();
}

QDateTime fromIsoString(const QString& value)
{
    QDateTime parsed = QDateTime::fromString(value, Qt::ISODateWithMs);
    if (!parsed.isValid()) {
        parsed = QDateTime::fromString(value, Qt::ISODate);
    }
    return parsed.isValid() ? parsed.toUTC() : QDateTime();
}

} // namespace

double Strategy::confidence() const
{
    return confidenceFor(totalExperiences);
}

double Strategy::confidenceFor(int totalExperiences)
{
    if (totalExperiences <= 0) {
        return 0.0;
    }
    const double n = static_cast<double>(totalExperiences);
    return n / (n + kConfidenceHalfSaturation);
}

void Strategy::recordOutcome(ActionType action, double qValue, double reward, const QDateTime& now)
{
    ++totalExperiences;
    updatedAt = now;

    ActionDetail* detail = nullptr;
    for (ActionDetail& candidate : actionDetails) {
        if (candidate.action == action) {
            detail = &candidate;
            break;
        }
    }
    if (!detail) {
        actionDetails.push_back(ActionDetail{});
        detail = &actionDetails.back();
        detail->action = action;
    }

    ++detail->count;
    detail->totalReward += reward;
    detail->avgReward = detail->totalReward / static_cast<double>(detail->count);
    detail->qValue = qValue;
    detail->lastUsed = now;
}

bool Strategy::recompute(const QVector<ActionValue>& row, const QDateTime& now)
{
    if (row.isEmpty()) {
        return false;
    }

    ActionValue best = row.front();
    for (const ActionValue& entry : row) {
        if (entry.value > best.value) {
            best = entry;
        }
        for (ActionDetail& detail : actionDetails) {
            if (detail.action == entry.action) {
                detail.qValue = entry.value;
            }
        }
    }

    bestAction = best.action;
    bestValue = best.value;
    updatedAt = now;
    return true;
}

const ActionDetail* Strategy::detailFor(ActionType action) const
{
    for (const ActionDetail& detail : actionDetails) {
        if (detail.action == action) {
            return &detail;
        }
    }
    return nullptr;
}

QJsonObject Strategy::actionDetailsToJson(const QVector<ActionDetail>& details)
{
    QJsonObject json;
    for (const ActionDetail& detail : details) {
        QJsonObject entry;
        entry[QStringLiteral("count")] = detail.count;
        entry[QStringLiteral("total_reward")] = detail.totalReward;
        entry[QStringLiteral("avg_reward")] = detail.avgReward;
        entry[QStringLiteral("q_value")] = detail.qValue;
        entry[QStringLiteral("last_used")] = isoString(detail.lastUsed);
        json[actionTypeToString(detail.action)] = entry;
    }
    return json;
}

QVector<ActionDetail> Strategy::actionDetailsFromJson(const QJsonObject& json)
{
    QVector<ActionDetail> details;
    for (auto it = json.constBegin(); it != json.constEnd(); ++it) {
        const std::optional<ActionType> action = actionTypeFromString(it.key());
        if (!action) {
            continue;
        }
        const QJsonObject entry = it.value().toObject();
        ActionDetail detail;
        detail.action = *action;
        detail.count = entry.value(QStringLiteral("count")).toInt();
        detail.totalReward = entry.value(QStringLiteral("total_reward")).toDouble();
        detail.avgReward = entry.value(QStringLiteral("avg_reward")).toDouble();
        detail.qValue = entry.value(QStringLiteral("q_value")).toDouble();
        detail.lastUsed = fromIsoString(entry.value(QStringLiteral("last_used")).toString());
        details.push_back(detail);
    }
    return details;
}

QJsonObject Strategy::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("context")] = context;
    json[QStringLiteral("best_action")] = actionTypeToString(bestAction);
    json[QStringLiteral("best_q_value")] = bestValue;
    json[QStringLiteral("total_experiences")] = totalExperiences;
    json[QStringLiteral("actions_count")] = actionsCount();
    json[QStringLiteral("confidence")] = confidence();
    json[QStringLiteral("action_details")] = actionDetailsToJson(actionDetails);
    json[QStringLiteral("created_at")] = isoString(createdAt);
    json[QStringLiteral("last_updated")] = isoString(updatedAt);
    json[QStringLiteral("algorithm_version")] = algorithmVersion;
    return json;
}

Strategy Strategy::fromJson(const QJsonObject& json, bool* okOut)
{
    Strategy strategy;
    strategy.context = json.value(QStringLiteral("context")).toString();
    const std::optional<ActionType> best = actionTypeFromString(
        json.value(QStringLiteral("best_action")).toString());
    if (okOut) {
        *okOut = !strategy.context.isEmpty() && best.has_value();
    }
    strategy.bestAction = best.value_or(ActionType::OptimizeBiddingStrategy);
    strategy.bestValue = json.value(QStringLiteral("best_q_value")).toDouble();
    strategy.totalExperiences = json.value(QStringLiteral("total_experiences")).toInt();
    strategy.actionDetails = actionDetailsFromJson(
        json.value(QStringLiteral("action_details")).toObject());
    strategy.createdAt = fromIsoString(json.value(QStringLiteral("created_at")).toString());
    strategy.updatedAt = fromIsoString(json.value(QStringLiteral("last_updated")).toString());
    strategy.algorithmVersion = json.value(QStringLiteral("algorithm_version"))
                                    .toString(QString::fromLatin1(kAlgorithmVersion));
    return strategy;
}

} // namespace crl
