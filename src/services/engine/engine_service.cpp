#include "engine_service.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

#include <string>

namespace crl {

namespace {

uint64_t requestId(const QJsonObject& request)
{
    return static_cast<uint64_t>(request.value(QStringLiteral("id")).toInteger());
}

EventIngestConfig ingestConfigFor(const Settings& settings)
{
    EventIngestConfig config;
    config.capacity = static_cast<size_t>(settings.eventQueueDepth);
    config.overflowPolicy = settings.eventOverflowPolicy;
    config.submitTimeoutMs = settings.eventSubmitTimeoutMs;
    return config;
}

} // namespace

EngineService::EngineService(const Settings& settings, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
{
}

EngineService::~EngineService()
{
    shutdown();
}

bool EngineService::initialize()
{
    if (m_settings.persistenceEnabled) {
        QString error;
        m_store = SQLiteLearningStore::open(m_settings.dbPath, &error);
        if (!m_store) {
            LOG_WARN(crlCore, "Learning store unavailable (%s); running without persistence",
                     qUtf8Printable(error));
        }
    }

    m_engine = std::make_unique<QLearningEngine>(m_settings.engine);
    if (m_store) {
        m_persistence = std::make_unique<PersistenceWorker>(m_store.get());
    }
    m_orchestrator = std::make_unique<LearningOrchestrator>(m_engine.get(), m_persistence.get());

    if (m_store) {
        LearningError error;
        if (!m_orchestrator->restoreFromStore(*m_store, &error)) {
            LOG_WARN(crlCore, "Starting with empty learning state: %s",
                     qUtf8Printable(error.message));
        }
        m_persistence->start();
    }

    connect(m_orchestrator.get(), &LearningOrchestrator::experienceLearned, this,
            [this](const QJsonObject& payload) {
                writeLine(makeNotification(QStringLiteral("experience_learned"), payload));
            }, Qt::DirectConnection);
    connect(m_orchestrator.get(), &LearningOrchestrator::batchProcessed, this,
            [this](const QJsonObject& payload) {
                writeLine(makeNotification(QStringLiteral("batch_processed"), payload));
            }, Qt::DirectConnection);

    LearningOrchestrator* orchestrator = m_orchestrator.get();
    m_ingest = std::make_unique<EventIngestActor>(
        ingestConfigFor(m_settings),
        [orchestrator](const OutcomeEvent& event, LearningError* errorOut) {
            return orchestrator->handleOutcomeEvent(event, errorOut);
        });
    m_ingest->start();

    LOG_INFO(crlCore, "Engine service initialized (persistence=%s)",
             m_store ? qUtf8Printable(m_settings.dbPath) : "off");
    return true;
}

int EngineService::run(std::istream& input, std::ostream& output)
{
    {
        std::lock_guard<std::mutex> lock(m_outputMutex);
        m_output = &output;
    }
    writeLine(makeNotification(QStringLiteral("ready"), QJsonObject()));

    std::string raw;
    while (!m_shutdownRequested && std::getline(input, raw)) {
        const QByteArray line = QByteArray::fromStdString(raw).trimmed();
        if (line.isEmpty()) {
            continue;
        }

        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(line, &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            writeLine(makeError(0, LearningErrorCode::InvalidEvent,
                                QStringLiteral("malformed request: %1")
                                    .arg(parseError.errorString())));
            continue;
        }
        writeLine(handleRequest(doc.object()));
    }

    shutdown();
    {
        std::lock_guard<std::mutex> lock(m_outputMutex);
        m_output = nullptr;
    }
    return 0;
}

QJsonObject EngineService::handleRequest(const QJsonObject& request)
{
    const QString method = request.value(QStringLiteral("method")).toString();
    const uint64_t id = requestId(request);
    const QJsonObject params = request.value(QStringLiteral("params")).toObject();

    if (method == QLatin1String("learn")) {
        return handleLearn(id, params);
    }
    if (method == QLatin1String("outcome")) {
        return handleOutcome(id, params);
    }
    if (method == QLatin1String("action")) {
        return handleAction(id, params);
    }
    if (method == QLatin1String("process")) {
        return handleProcess(id);
    }
    if (method == QLatin1String("metrics")) {
        return handleMetrics(id);
    }
    if (method == QLatin1String("strategies")) {
        return handleStrategies(id, params);
    }
    if (method == QLatin1String("ping")) {
        return handlePing(id);
    }
    if (method == QLatin1String("shutdown")) {
        m_shutdownRequested = true;
        QJsonObject result;
        result[QStringLiteral("status")] = QStringLiteral("shutting_down");
        return makeResponse(id, result);
    }

    LOG_WARN(crlCore, "Unknown method '%s'", qUtf8Printable(method));
    return makeError(id, LearningErrorCode::InvalidEvent,
                     QStringLiteral("Unknown method: %1").arg(method));
}

void EngineService::shutdown()
{
    if (m_shutDown) {
        return;
    }
    m_shutDown = true;

    if (m_ingest) {
        m_ingest->stop();
    }
    if (m_orchestrator && !m_orchestrator->shutdown()) {
        LOG_WARN(crlCore, "Some learning state could not be saved before exit");
    }
    if (m_persistence) {
        m_persistence->stop();
    }
    LOG_INFO(crlCore, "Engine service stopped");
}

// ── Handlers ────────────────────────────────────────────────

QJsonObject EngineService::handleLearn(uint64_t id, const QJsonObject& params)
{
    const QJsonValue rewardValue = params.value(QStringLiteral("reward"));
    if (!rewardValue.isDouble()) {
        return makeError(id, LearningErrorCode::InvalidReward,
                         QStringLiteral("reward must be a number in [-1, 1]"));
    }

    LearningError error;
    const std::optional<LearnAck> ack = m_orchestrator->learnFromExperience(
        params.value(QStringLiteral("context")).toString(),
        params.value(QStringLiteral("action")).toString(),
        rewardValue.toDouble(),
        params.value(QStringLiteral("metadata")).toObject(),
        &error);
    if (!ack) {
        return makeError(id, error.code, error.message);
    }
    return makeResponse(id, ack->toJson());
}

QJsonObject EngineService::handleOutcome(uint64_t id, const QJsonObject& params)
{
    LearningError error;
    const std::optional<OutcomeEvent> event = OutcomeEvent::fromJson(params, &error);
    if (!event) {
        return makeError(id, error.code, error.message);
    }
    if (!m_ingest->submit(*event, &error)) {
        return makeError(id, error.code, error.message);
    }

    QJsonObject result;
    result[QStringLiteral("status")] = QStringLiteral("queued");
    result[QStringLiteral("event_type")] = outcomeEventTypeToString(event->type);
    result[QStringLiteral("queue_depth")] = static_cast<qint64>(m_ingest->depth());
    return makeResponse(id, result);
}

QJsonObject EngineService::handleAction(uint64_t id, const QJsonObject& params)
{
    LearningError error;
    const std::optional<ActionResponse> response
        = m_orchestrator->generateAction(ActionRequest::fromJson(params), &error);
    if (!response) {
        return makeError(id, error.code, error.message);
    }
    return makeResponse(id, response->toJson());
}

QJsonObject EngineService::handleProcess(uint64_t id)
{
    const BatchStats stats = m_orchestrator->processExperiences();
    QJsonObject result = stats.toJson();
    result[QStringLiteral("status")] = stats.isEmpty() ? QStringLiteral("no_experiences")
                                                       : QStringLiteral("processed");
    return makeResponse(id, result);
}

QJsonObject EngineService::handleMetrics(uint64_t id)
{
    QJsonObject result = m_engine->learningMetrics().toJson();

    const EventIngestStats ingest = m_ingest->stats();
    QJsonObject events;
    events[QStringLiteral("queue_depth")] = static_cast<qint64>(ingest.depth);
    events[QStringLiteral("accepted")] = static_cast<qint64>(ingest.accepted);
    events[QStringLiteral("dropped_queue_full")] = static_cast<qint64>(ingest.droppedQueueFull);
    events[QStringLiteral("blocked_timeouts")] = static_cast<qint64>(ingest.blockedTimeouts);
    events[QStringLiteral("handled")] = static_cast<qint64>(ingest.handled);
    events[QStringLiteral("failed")] = static_cast<qint64>(ingest.failed);
    result[QStringLiteral("events")] = events;

    QJsonObject persistence;
    persistence[QStringLiteral("enabled")] = m_persistence != nullptr;
    if (m_persistence) {
        const PersistenceWorkerStats stats = m_persistence->stats();
        persistence[QStringLiteral("saves")] = static_cast<qint64>(stats.saves);
        persistence[QStringLiteral("failures")] = static_cast<qint64>(stats.failures);
        persistence[QStringLiteral("coalesced")] = static_cast<qint64>(stats.coalesced);
        persistence[QStringLiteral("unsaved_changes")] = stats.hasUnsavedChanges;
        if (!stats.lastError.isEmpty()) {
            persistence[QStringLiteral("last_error")] = stats.lastError;
        }
    }
    result[QStringLiteral("persistence")] = persistence;
    return makeResponse(id, result);
}

QJsonObject EngineService::handleStrategies(uint64_t id, const QJsonObject& params)
{
    const QString context = params.value(QStringLiteral("context")).toString();
    QJsonObject result;

    if (!context.trimmed().isEmpty()) {
        const std::optional<Strategy> strategy = m_engine->strategy(context);
        if (!strategy) {
            return makeError(id, LearningErrorCode::NoActionsRecorded,
                             QStringLiteral("no strategy learned for '%1'").arg(context));
        }
        result[QStringLiteral("strategy")] = strategy->toJson();
        return makeResponse(id, result);
    }

    QJsonArray list;
    for (const Strategy& strategy : m_engine->strategies()) {
        list.append(strategy.toJson());
    }
    result[QStringLiteral("strategies")] = list;
    result[QStringLiteral("count")] = list.size();
    return makeResponse(id, result);
}

QJsonObject EngineService::handlePing(uint64_t id)
{
    QJsonObject result;
    result[QStringLiteral("pong")] = true;
    result[QStringLiteral("timestamp")] = QDateTime::currentMSecsSinceEpoch();
    result[QStringLiteral("service")] = QStringLiteral("campaign-rl-engine");
    return makeResponse(id, result);
}

// ── Wire format ─────────────────────────────────────────────

QJsonObject EngineService::makeResponse(uint64_t id, const QJsonObject& result)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("response");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("result")] = result;
    return json;
}

QJsonObject EngineService::makeError(uint64_t id, LearningErrorCode code, const QString& message)
{
    QJsonObject error;
    error[QStringLiteral("code")] = learningErrorCodeToString(code);
    error[QStringLiteral("message")] = message;

    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("error");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("error")] = error;
    return json;
}

QJsonObject EngineService::makeNotification(const QString& method, const QJsonObject& params)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("notification");
    json[QStringLiteral("method")] = method;
    json[QStringLiteral("params")] = params;
    return json;
}

void EngineService::writeLine(const QJsonObject& json)
{
    std::lock_guard<std::mutex> lock(m_outputMutex);
    if (!m_output) {
        return;
    }
    const QByteArray line = QJsonDocument(json).toJson(QJsonDocument::Compact);
    *m_output << line.toStdString() << std::endl;
}

} // namespace crl
