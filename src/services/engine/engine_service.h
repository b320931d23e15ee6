#pragma once

#include "core/events/event_ingest_actor.h"
#include "core/learning/learning_orchestrator.h"
#include "core/learning/q_learning_engine.h"
#include "core/shared/learning_error.h"
#include "core/shared/settings.h"
#include "core/store/persistence_worker.h"
#include "core/store/sqlite_learning_store.h"

#include <QJsonObject>
#include <QObject>
#include <QString>

#include <cstdint>
#include <istream>
#include <memory>
#include <mutex>
#include <ostream>

namespace crl {

// EngineService -- line-oriented JSON front end for the learning core.
//
// Each input line is a request {"id", "method", "params"}; each output line
// is a response, an error, or a notification. Methods: learn, outcome,
// action, process, metrics, strategies, ping, shutdown. Outcome events go
// through the bounded ingest queue and are acknowledged as queued.
class EngineService : public QObject {
    Q_OBJECT
public:
    explicit EngineService(const Settings& settings, QObject* parent = nullptr);
    ~EngineService() override;

    // Opens the store (when enabled), hydrates the engine and starts the
    // worker threads. A store that cannot be opened is logged and the
    // service runs in memory.
    bool initialize();

    // Reads requests until EOF or "shutdown". Returns the exit code.
    int run(std::istream& input, std::ostream& output);

    QJsonObject handleRequest(const QJsonObject& request);

    void shutdown();

    LearningOrchestrator* orchestrator() const { return m_orchestrator.get(); }
    EventIngestActor* ingest() const { return m_ingest.get(); }
    bool persistenceActive() const { return m_store != nullptr; }

    static QJsonObject makeResponse(uint64_t id, const QJsonObject& result);
    static QJsonObject makeError(uint64_t id, LearningErrorCode code, const QString& message);
    static QJsonObject makeNotification(const QString& method, const QJsonObject& params);

private:
    QJsonObject handleLearn(uint64_t id, const QJsonObject& params);
    QJsonObject handleOutcome(uint64_t id, const QJsonObject& params);
    QJsonObject handleAction(uint64_t id, const QJsonObject& params);
    QJsonObject handleProcess(uint64_t id);
    QJsonObject handleMetrics(uint64_t id);
    QJsonObject handleStrategies(uint64_t id, const QJsonObject& params);
    QJsonObject handlePing(uint64_t id);

    void writeLine(const QJsonObject& json);

    Settings m_settings;
    std::unique_ptr<SQLiteLearningStore> m_store;
    std::unique_ptr<QLearningEngine> m_engine;
    std::unique_ptr<PersistenceWorker> m_persistence;
    std::unique_ptr<LearningOrchestrator> m_orchestrator;
    std::unique_ptr<EventIngestActor> m_ingest;

    std::mutex m_outputMutex;
    std::ostream* m_output = nullptr;
    bool m_shutdownRequested = false;
    bool m_shutDown = false;
};

} // namespace crl
