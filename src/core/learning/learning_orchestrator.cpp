#include "core/learning/learning_orchestrator.h"
#include "core/learning/reward_calculator.h"
#include "core/store/persistence_gateway.h"
#include "core/store/persistence_worker.h"
#include "core/shared/logging.h"

#include <QJsonArray>
#include <QJsonValue>

namespace crl {

namespace {

QString nowIso()
{
    return QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
}

CampaignMetrics metricsFromJson(const QJsonObject& json)
{
    CampaignMetrics metrics;
    metrics.ctr = json.value(QStringLiteral("ctr")).toDouble(metrics.ctr);
    metrics.cpm = json.value(QStringLiteral("cpm")).toDouble(metrics.cpm);
    metrics.cpc = json.value(QStringLiteral("cpc")).toDouble(metrics.cpc);
    metrics.impressions = countFromJson(json.value(QStringLiteral("impressions")), metrics.impressions);
    metrics.clicks = countFromJson(json.value(QStringLiteral("clicks")), metrics.clicks);
    metrics.conversions = countFromJson(json.value(QStringLiteral("conversions")), metrics.conversions);
    metrics.spend = json.value(QStringLiteral("spend")).toDouble(metrics.spend);
    metrics.revenue = json.value(QStringLiteral("revenue")).toDouble(metrics.revenue);
    metrics.roas = json.value(QStringLiteral("roas")).toDouble(metrics.roas);
    metrics.budgetUtilization = json.value(QStringLiteral("budget_utilization"))
                                    .toDouble(metrics.budgetUtilization);
    metrics.reach = countFromJson(json.value(QStringLiteral("reach")), metrics.reach);
    metrics.frequency = json.value(QStringLiteral("frequency")).toDouble(metrics.frequency);
    return metrics;
}

QString stringField(const QJsonObject& json, const char* key, const QString& fallback)
{
    const QString value = json.value(QLatin1String(key)).toString();
    return value.trimmed().isEmpty() ? fallback : value;
}

} // namespace

// ── Value types ─────────────────────────────────────────────

QJsonObject LearnAck::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("status")] = QStringLiteral("accepted");
    json[QStringLiteral("experience_id")] = experience.id;
    json[QStringLiteral("context")] = experience.context;
    json[QStringLiteral("action")] = experience.action;
    json[QStringLiteral("reward")] = experience.reward;
    json[QStringLiteral("overflow_dropped")] = overflowDropped;
    json[QStringLiteral("batch_processed")] = batch.has_value();
    if (batch) {
        json[QStringLiteral("batch")] = batch->toJson();
    }
    json[QStringLiteral("buffer_status")] = buffer.toJson();
    return json;
}

ActionRequest ActionRequest::fromJson(const QJsonObject& json)
{
    ActionRequest request;
    CampaignContext& ctx = request.context;
    ctx.strategicContext = json.value(QStringLiteral("strategic_context")).toString(
        json.value(QStringLiteral("context")).toString());

    if (const auto type = campaignTypeFromString(json.value(QStringLiteral("campaign_type")).toString())) {
        ctx.campaignType = *type;
    }
    if (const auto risk = riskAppetiteFromString(json.value(QStringLiteral("risk_appetite")).toString())) {
        ctx.riskAppetite = *risk;
    }
    if (const auto competition = competitionFromString(
            json.value(QStringLiteral("competition_level")).toString(
                json.value(QStringLiteral("competition")).toString()))) {
        ctx.competition = *competition;
    }
    ctx.timeOfDay = stringField(json, "time_of_day", ctx.timeOfDay);
    ctx.dayOfWeek = stringField(json, "day_of_week", ctx.dayOfWeek);
    ctx.seasonality = stringField(json, "seasonality", ctx.seasonality);
    ctx.marketConditions = stringField(json, "market_conditions", ctx.marketConditions);
    ctx.region = stringField(json, "region", ctx.region);

    request.metrics = metricsFromJson(json.value(QStringLiteral("metrics")).toObject());

    const QJsonArray candidates = json.value(QStringLiteral("candidate_actions")).toArray();
    for (const QJsonValue& value : candidates) {
        request.candidateActions.push_back(value.toString());
    }
    return request;
}

QJsonObject ActionResponse::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("action")] = actionTypeToString(decision.action);
    json[QStringLiteral("confidence")] = decision.confidence;
    json[QStringLiteral("reasoning")] = decision.reasoning;
    json[QStringLiteral("decision_path")] = decisionPathToString(decision.path);
    json[QStringLiteral("normalized_context")] = decision.normalizedContext;
    json[QStringLiteral("timestamp")] = timestamp.toString(Qt::ISODateWithMs);
    json[QStringLiteral("buffer_status")] = buffer.toJson();
    return json;
}

// ── Orchestrator ────────────────────────────────────────────

LearningOrchestrator::LearningOrchestrator(QLearningEngine* engine,
                                           PersistenceWorker* persistence,
                                           QObject* parent)
    : QObject(parent)
    , m_engine(engine)
    , m_persistence(persistence)
{
}

std::optional<LearnAck> LearningOrchestrator::learnFromExperience(const QString& context,
                                                                  const QString& action,
                                                                  double reward,
                                                                  const QJsonObject& metadata,
                                                                  LearningError* errorOut)
{
    std::optional<AddExperienceResult> added
        = m_engine->addExperience(context, action, reward, metadata, errorOut);
    if (!added) {
        return std::nullopt;
    }

    LearnAck ack;
    ack.experience = added->experience;
    ack.overflowDropped = added->overflowDropped.has_value();
    ack.batch = added->batch;
    ack.buffer = m_engine->bufferStatus();

    requestPersistence();

    QJsonObject payload;
    payload[QStringLiteral("experience_id")] = ack.experience.id;
    payload[QStringLiteral("context")] = ack.experience.context;
    payload[QStringLiteral("action")] = ack.experience.action;
    payload[QStringLiteral("reward")] = ack.experience.reward;
    payload[QStringLiteral("overflow_dropped")] = ack.overflowDropped;
    payload[QStringLiteral("buffer_status")] = ack.buffer.toJson();
    payload[QStringLiteral("timestamp")] = nowIso();
    if (metadata.contains(QStringLiteral("correlation_id"))) {
        payload[QStringLiteral("correlation_id")] = metadata.value(QStringLiteral("correlation_id"));
    }
    emit experienceLearned(payload);

    if (ack.batch && !ack.batch->isEmpty()) {
        publishBatch(*ack.batch);
    }
    return ack;
}

BatchStats LearningOrchestrator::processExperiences()
{
    const BatchStats stats = m_engine->processExperiences();
    if (stats.isEmpty()) {
        LOG_DEBUG(crlLearning, "Force-process found nothing to learn");
        return stats;
    }
    requestPersistence();
    publishBatch(stats);
    return stats;
}

std::optional<ActionResponse> LearningOrchestrator::generateAction(const ActionRequest& request,
                                                                   LearningError* errorOut)
{
    QVector<ActionType> candidates;
    candidates.reserve(request.candidateActions.size());
    for (const QString& name : request.candidateActions) {
        const std::optional<ActionType> action = actionTypeFromString(name);
        if (!action) {
            setLearningError(errorOut, LearningErrorCode::InvalidAction,
                             QStringLiteral("unknown candidate action: '%1'").arg(name));
            return std::nullopt;
        }
        if (!candidates.contains(*action)) {
            candidates.push_back(*action);
        }
    }

    std::optional<ActionDecision> decision
        = m_engine->generateAction(request.context, request.metrics, candidates, errorOut);
    if (!decision) {
        return std::nullopt;
    }

    ActionResponse response;
    response.decision = *decision;
    response.buffer = m_engine->bufferStatus();
    response.timestamp = QDateTime::currentDateTimeUtc();
    return response;
}

bool LearningOrchestrator::handleOutcomeEvent(const OutcomeEvent& event, LearningError* errorOut)
{
    const double reward = rewardForEvent(event);
    LOG_DEBUG(crlEvents, "%s for %s -> %s: reward %.3f",
              qUtf8Printable(outcomeEventTypeToString(event.type)),
              qUtf8Printable(event.context), qUtf8Printable(event.action), reward);

    const std::optional<LearnAck> ack = learnFromExperience(event.context, event.action, reward,
                                                            event.learningMetadata(), errorOut);
    if (!ack) {
        return false;
    }

    LOG_INFO(crlEvents, "Learned from %s: %s -> %s (reward=%.3f, correlation_id=%s)",
             qUtf8Printable(outcomeEventTypeToString(event.type)),
             qUtf8Printable(ack->experience.context), qUtf8Printable(ack->experience.action),
             reward, qUtf8Printable(event.correlationId));
    return true;
}

double LearningOrchestrator::rewardForEvent(const OutcomeEvent& event)
{
    switch (event.type) {
    case OutcomeEventType::TrafficRequestCompleted:
        return RewardCalculator::forCompletedRequest(event.success, event.rewardSignals);
    case OutcomeEventType::CampaignPerformanceUpdated:
        return RewardCalculator::forPerformanceUpdate(event.improvement, event.rewardSignals);
    case OutcomeEventType::StrategyFeedback:
        return RewardCalculator::forExplicitFeedback(event.reward);
    }
    return 0.0;
}

bool LearningOrchestrator::restoreFromStore(PersistenceGateway& gateway, LearningError* errorOut)
{
    const std::optional<QVector<Strategy>> strategies = gateway.loadStrategies();
    const std::optional<QVector<QTableEntry>> qEntries = gateway.loadQTable();
    const std::optional<QVector<Experience>> active = gateway.loadExperiences();
    const std::optional<QVector<Experience>> history = gateway.loadHistory();

    if (!strategies || !qEntries || !active || !history) {
        LOG_WARN(crlLearning, "Persisted learning state unavailable; starting empty");
        setLearningError(errorOut, LearningErrorCode::PersistenceUnavailable,
                         QStringLiteral("failed to load persisted learning state"));
        return false;
    }

    m_engine->restoreState(*strategies, *qEntries, *active, *history);
    // Hydration may have re-archived invalid entries; save that right away.
    requestPersistence();
    return true;
}

bool LearningOrchestrator::shutdown(int timeoutMs)
{
    if (!m_persistence) {
        return true;
    }
    requestPersistence();
    const bool flushed = m_persistence->flush(timeoutMs);
    const PersistenceWorkerStats stats = m_persistence->stats();
    if (!flushed || stats.hasUnsavedChanges) {
        LOG_WARN(crlLearning, "Shutdown with unsaved learning state (%s)",
                 qUtf8Printable(stats.lastError));
        return false;
    }
    return true;
}

void LearningOrchestrator::requestPersistence()
{
    if (!m_persistence) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_persistenceMutex);
    m_persistence->request(m_engine->takePersistenceDelta());
}

void LearningOrchestrator::publishBatch(const BatchStats& stats)
{
    QJsonObject payload = stats.toJson();
    payload[QStringLiteral("timestamp")] = nowIso();
    emit batchProcessed(payload);
}

} // namespace crl
