#pragma once

#include "core/learning/dual_buffer.h"
#include "core/learning/experience.h"
#include "core/learning/q_table.h"
#include "core/learning/strategy.h"
#include "core/shared/learning_error.h"
#include "core/shared/settings.h"
#include "core/shared/types.h"
#include "core/store/persistence_gateway.h"

#include <QHash>
#include <QJsonObject>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QVector>

#include <mutex>
#include <optional>
#include <random>
#include <vector>

namespace crl {

struct BatchStats {
    int strategiesCreated = 0;
    int strategiesUpdated = 0;
    int experiencesProcessed = 0;
    int experiencesDropped = 0;
    double avgQValue = 0.0;
    int totalStrategies = 0;
    QStringList touchedContexts;

    bool isEmpty() const { return experiencesProcessed == 0 && experiencesDropped == 0; }
    QJsonObject toJson() const;
};

struct AddExperienceResult {
    Experience experience;
    std::optional<Experience> overflowDropped;
    std::optional<BatchStats> batch;
};

enum class DecisionPath {
    Exploration,
    Exploitation,
    Heuristic,
};

QString decisionPathToString(DecisionPath path);

struct ActionDecision {
    ActionType action = ActionType::OptimizeBiddingStrategy;
    double confidence = 0.0;
    QString reasoning;
    DecisionPath path = DecisionPath::Heuristic;
    QString normalizedContext;
};

struct BufferStatus {
    int activeSize = 0;
    int activeMax = 0;
    int historySize = 0;
    int historyMax = 0;
    double activeUtilizationPct = 0.0;
    double historyUtilizationPct = 0.0;
    int strategyCount = 0;

    QJsonObject toJson() const;
};

struct LearningMetrics {
    qint64 totalActionsGenerated = 0;
    qint64 totalLearningBatches = 0;
    qint64 totalExperiencesProcessed = 0;
    qint64 totalExperiencesDropped = 0;
    int totalStrategies = 0;
    int qTableContexts = 0;
    int qTableEntries = 0;
    double avgConfidence = 0.0;
    double avgReward = 0.0;
    double avgQValue = 0.0;
    double maxQValue = 0.0;
    BufferStatus buffer;
    EngineConfig config;

    QJsonObject toJson() const;
};

// QLearningEngine -- tabular Q-learning over normalized campaign contexts.
//
// Owns the Q-table, the dual buffer and the per-context strategies. Every
// public method takes m_mutex, so adds, batches and action generation are
// serialized; a batch runs to completion inside the lock. Configuration is
// fixed at construction.
class QLearningEngine {
public:
    static constexpr int kMetricsHistoryCap = 1000;
    static constexpr int kMetricsHistoryKeep = 500;

    explicit QLearningEngine(const EngineConfig& config = EngineConfig());

    QLearningEngine(const QLearningEngine&) = delete;
    QLearningEngine& operator=(const QLearningEngine&) = delete;

    // Validates before any state changes. When the buffer reaches the
    // auto-process threshold a batch runs synchronously.
    std::optional<AddExperienceResult> addExperience(const QString& context,
                                                     const QString& action,
                                                     double reward,
                                                     const QJsonObject& metadata = QJsonObject(),
                                                     LearningError* errorOut = nullptr);

    // Drains the active buffer and applies one Q-update per experience.
    // An empty buffer is a no-op.
    BatchStats processExperiences();

    // Epsilon-greedy selection. Fails only when the strategic context is
    // empty. An empty candidate list means the full vocabulary.
    std::optional<ActionDecision> generateAction(const CampaignContext& context,
                                                 const CampaignMetrics& metrics = CampaignMetrics(),
                                                 const QVector<ActionType>& candidates = {},
                                                 LearningError* errorOut = nullptr);
    std::optional<ActionDecision> generateAction(const QString& context,
                                                 const QVector<ActionType>& candidates = {},
                                                 LearningError* errorOut = nullptr);

    LearningMetrics learningMetrics() const;
    BufferStatus bufferStatus() const;

    std::optional<Strategy> strategy(const QString& context) const;
    QVector<Strategy> strategies() const;
    double qValue(const QString& context, ActionType action) const;
    QVector<Experience> activeSnapshot() const;
    QVector<Experience> historySnapshot() const;

    // Replaces all learned state with a persisted snapshot. Strategies whose
    // context has no Q-table row are re-derived from their action details.
    void restoreState(const QVector<Strategy>& strategies,
                      const QVector<QTableEntry>& qEntries,
                      const QVector<Experience>& active,
                      const QVector<Experience>& history);

    // Hands everything changed since the previous call to persistence.
    // Deltas carry an increasing sequence number.
    PersistenceDelta takePersistenceDelta();

    const EngineConfig& config() const { return m_config; }

    // Deterministic fallback for contexts without recorded actions.
    static ActionType heuristicAction(const QString& normalizedContext,
                                      const CampaignMetrics& metrics,
                                      const QVector<ActionType>& candidates);

private:
    BatchStats processExperiencesUnlocked();
    BufferStatus bufferStatusUnlocked() const;
    ActionDecision decideUnlocked(const QString& normalizedContext,
                                  const CampaignMetrics& metrics,
                                  const QVector<ActionType>& candidates);
    static bool isValidExperience(const Experience& experience, QString* reasonOut);
    static void pushSample(std::vector<double>& samples, double value);

    const EngineConfig m_config;

    mutable std::mutex m_mutex;
    QTable m_qTable;
    DualBuffer m_buffer;
    QHash<QString, Strategy> m_strategies;
    QStringList m_strategyOrder;
    QSet<QString> m_dirtyContexts;
    bool m_bufferDirty = false;
    uint64_t m_deltaSequence = 0;

    std::mt19937 m_rng;
    std::uniform_real_distribution<double> m_unit{0.0, 1.0};

    qint64 m_totalActionsGenerated = 0;
    qint64 m_totalLearningBatches = 0;
    qint64 m_totalExperiencesProcessed = 0;
    qint64 m_totalExperiencesDropped = 0;
    std::vector<double> m_confidenceHistory;
    std::vector<double> m_rewardHistory;
    std::vector<double> m_qValueHistory;
};

} // namespace crl
