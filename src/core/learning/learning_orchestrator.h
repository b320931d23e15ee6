#pragma once

#include "core/events/outcome_event.h"
#include "core/learning/q_learning_engine.h"
#include "core/shared/learning_error.h"
#include "core/shared/types.h"

#include <QDateTime>
#include <QJsonObject>
#include <QObject>
#include <QStringList>

#include <mutex>
#include <optional>

namespace crl {

class PersistenceGateway;
class PersistenceWorker;

struct LearnAck {
    Experience experience;
    bool overflowDropped = false;
    std::optional<BatchStats> batch;
    BufferStatus buffer;

    QJsonObject toJson() const;
};

struct ActionRequest {
    CampaignContext context;
    CampaignMetrics metrics;
    QStringList candidateActions;   // wire names; empty means all

    // Missing fields keep their defaults; validation happens in
    // LearningOrchestrator::generateAction().
    static ActionRequest fromJson(const QJsonObject& json);
};

struct ActionResponse {
    ActionDecision decision;
    BufferStatus buffer;
    QDateTime timestamp;

    QJsonObject toJson() const;
};

// LearningOrchestrator -- application boundary around the engine.
//
// Turns requests and outcome events into engine calls, hands changed state
// to the persistence worker after every learning step and publishes
// notifications. Signals are emitted on the calling thread, which for
// queued outcome events is the ingest worker.
class LearningOrchestrator : public QObject {
    Q_OBJECT
public:
    // persistence may be null, in which case nothing is saved.
    explicit LearningOrchestrator(QLearningEngine* engine,
                                  PersistenceWorker* persistence = nullptr,
                                  QObject* parent = nullptr);

    std::optional<LearnAck> learnFromExperience(const QString& context,
                                                const QString& action,
                                                double reward,
                                                const QJsonObject& metadata = QJsonObject(),
                                                LearningError* errorOut = nullptr);

    // Force-process regardless of the auto-process threshold.
    BatchStats processExperiences();

    std::optional<ActionResponse> generateAction(const ActionRequest& request,
                                                 LearningError* errorOut = nullptr);

    bool handleOutcomeEvent(const OutcomeEvent& event, LearningError* errorOut = nullptr);

    // Hydrates the engine from the last saved snapshot. On failure the
    // engine keeps its current (empty) state.
    bool restoreFromStore(PersistenceGateway& gateway, LearningError* errorOut = nullptr);

    // Saves whatever is still unsaved and waits for the worker.
    bool shutdown(int timeoutMs = 10000);

    QLearningEngine* engine() const { return m_engine; }

    static double rewardForEvent(const OutcomeEvent& event);

signals:
    void experienceLearned(const QJsonObject& payload);
    void batchProcessed(const QJsonObject& payload);

private:
    void requestPersistence();
    void publishBatch(const BatchStats& stats);

    QLearningEngine* m_engine = nullptr;
    PersistenceWorker* m_persistence = nullptr;
    // Serializes take-delta + request so deltas reach the worker in order.
    std::mutex m_persistenceMutex;
};

} // namespace crl
