#pragma once

#include "core/learning/reward_calculator.h"
#include "core/shared/learning_error.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>

#include <optional>

namespace crl {

enum class OutcomeEventType {
    TrafficRequestCompleted,     // traffic.request_completed
    CampaignPerformanceUpdated,  // campaign.performance_updated
    StrategyFeedback,            // rl.strategy_feedback
};

QString outcomeEventTypeToString(OutcomeEventType type);
std::optional<OutcomeEventType> outcomeEventTypeFromString(const QString& str);

// One inbound outcome notification, already flattened out of its
// transport envelope.
struct OutcomeEvent {
    OutcomeEventType type = OutcomeEventType::TrafficRequestCompleted;
    QString eventId;
    QString correlationId;
    QString sourceService;
    QDateTime timestamp;

    QString context;
    QString action;
    bool success = false;       // traffic.request_completed
    bool improvement = false;   // campaign.performance_updated
    double reward = 0.0;        // rl.strategy_feedback

    RewardSignals rewardSignals;
    QJsonObject metrics;        // as reported
    QJsonObject extra;          // request_id, campaign_id, feedback_source, ...

    // Accepts either a flat object or an envelope with the payload under
    // "data". The type comes from "type" or "event_type".
    static std::optional<OutcomeEvent> fromJson(const QJsonObject& json,
                                                LearningError* errorOut = nullptr);

    // Metadata stored with the resulting experience.
    QJsonObject learningMetadata() const;
};

} // namespace crl
