#include "core/events/outcome_event.h"

#include <QJsonValue>

#include <initializer_list>

namespace crl {

namespace {

const QString kDefaultAction = QStringLiteral("optimize_bidding_strategy");

QString firstString(const QJsonObject& json, std::initializer_list<const char*> keys)
{
    for (const char* key : keys) {
        const QJsonValue value = json.value(QLatin1String(key));
        if (value.isString() && !value.toString().trimmed().isEmpty()) {
            return value.toString();
        }
    }
    return QString();
}

RewardSignals rewardSignalsFrom(const QJsonObject& metrics)
{
    RewardSignals rewardSignals;
    rewardSignals.roas = metrics.value(QStringLiteral("roas")).toDouble(0.0);
    rewardSignals.ctr = metrics.value(QStringLiteral("ctr")).toDouble(0.0);
    rewardSignals.conversions = countFromJson(metrics.value(QStringLiteral("conversions")), 0);
    return rewardSignals;
}

} // namespace

QString outcomeEventTypeToString(OutcomeEventType type)
{
    switch (type) {
    case OutcomeEventType::TrafficRequestCompleted:
        return QStringLiteral("traffic.request_completed");
    case OutcomeEventType::CampaignPerformanceUpdated:
        return QStringLiteral("campaign.performance_updated");
    case OutcomeEventType::StrategyFeedback:
        return QStringLiteral("rl.strategy_feedback");
    }
    return QStringLiteral("traffic.request_completed");
}

std::optional<OutcomeEventType> outcomeEventTypeFromString(const QString& str)
{
    const QString normalized = str.trimmed().toLower();
    if (normalized == QLatin1String("traffic.request_completed")) {
        return OutcomeEventType::TrafficRequestCompleted;
    }
    if (normalized == QLatin1String("campaign.performance_updated")) {
        return OutcomeEventType::CampaignPerformanceUpdated;
    }
    if (normalized == QLatin1String("rl.strategy_feedback")) {
        return OutcomeEventType::StrategyFeedback;
    }
    return std::nullopt;
}

std::optional<OutcomeEvent> OutcomeEvent::fromJson(const QJsonObject& json, LearningError* errorOut)
{
    const QString typeName = firstString(json, {"type", "event_type"});
    const std::optional<OutcomeEventType> type = outcomeEventTypeFromString(typeName);
    if (!type) {
        setLearningError(errorOut, LearningErrorCode::InvalidEvent,
                         QStringLiteral("unsupported event type: '%1'").arg(typeName));
        return std::nullopt;
    }

    const QJsonObject data = json.value(QStringLiteral("data")).isObject()
        ? json.value(QStringLiteral("data")).toObject()
        : json;

    OutcomeEvent event;
    event.type = *type;
    event.eventId = firstString(json, {"event_id", "id"});
    event.correlationId = firstString(json, {"correlation_id"});
    event.sourceService = firstString(json, {"source_service"});
    event.timestamp = QDateTime::fromString(firstString(json, {"timestamp"}), Qt::ISODateWithMs);
    if (!event.timestamp.isValid()) {
        event.timestamp = QDateTime::currentDateTimeUtc();
    }
    event.metrics = data.value(QStringLiteral("metrics")).toObject();
    event.rewardSignals = rewardSignalsFrom(event.metrics);

    switch (event.type) {
    case OutcomeEventType::TrafficRequestCompleted:
        event.context = firstString(data, {"context", "strategic_context"});
        event.action = firstString(data, {"action"});
        event.success = data.value(QStringLiteral("success")).toBool(false);
        if (data.contains(QStringLiteral("request_id"))) {
            event.extra.insert(QStringLiteral("request_id"), data.value(QStringLiteral("request_id")));
        }
        if (data.contains(QStringLiteral("response_time_ms"))) {
            event.extra.insert(QStringLiteral("response_time_ms"),
                               data.value(QStringLiteral("response_time_ms")));
        }
        break;
    case OutcomeEventType::CampaignPerformanceUpdated:
        event.context = firstString(data, {"strategic_context", "context"});
        event.action = firstString(data, {"previous_action", "action"});
        event.improvement = data.value(QStringLiteral("improvement")).toBool(false);
        if (data.contains(QStringLiteral("campaign_id"))) {
            event.extra.insert(QStringLiteral("campaign_id"), data.value(QStringLiteral("campaign_id")));
        }
        break;
    case OutcomeEventType::StrategyFeedback: {
        event.context = firstString(data, {"context", "strategic_context"});
        event.action = firstString(data, {"action"});
        const QJsonValue reward = data.value(QStringLiteral("reward"));
        if (!reward.isUndefined() && !reward.isNull() && !reward.isDouble()) {
            setLearningError(errorOut, LearningErrorCode::InvalidEvent,
                             QStringLiteral("reward must be numeric"));
            return std::nullopt;
        }
        event.reward = reward.toDouble(0.0);
        event.extra.insert(QStringLiteral("feedback_source"),
                           data.value(QStringLiteral("feedback_source")).toString(
                               QStringLiteral("unknown")));
        if (data.value(QStringLiteral("metadata")).isObject()) {
            event.extra.insert(QStringLiteral("metadata"), data.value(QStringLiteral("metadata")));
        }
        break;
    }
    }

    if (event.context.isEmpty()) {
        setLearningError(errorOut, LearningErrorCode::InvalidEvent,
                         QStringLiteral("%1 event without context").arg(typeName));
        return std::nullopt;
    }
    if (event.action.isEmpty()) {
        event.action = kDefaultAction;
    }
    return event;
}

QJsonObject OutcomeEvent::learningMetadata() const
{
    QJsonObject metadata = extra;
    metadata.insert(QStringLiteral("event_type"), outcomeEventTypeToString(type));
    if (!eventId.isEmpty()) {
        metadata.insert(QStringLiteral("event_id"), eventId);
    }
    if (!correlationId.isEmpty()) {
        metadata.insert(QStringLiteral("correlation_id"), correlationId);
    }
    if (!sourceService.isEmpty()) {
        metadata.insert(QStringLiteral("source_service"), sourceService);
    }
    metadata.insert(QStringLiteral("event_timestamp"), timestamp.toString(Qt::ISODateWithMs));
    if (!metrics.isEmpty()) {
        metadata.insert(QStringLiteral("metrics"), metrics);
    }
    if (type == OutcomeEventType::CampaignPerformanceUpdated) {
        metadata.insert(QStringLiteral("improvement"), improvement);
    }
    return metadata;
}

} // namespace crl
