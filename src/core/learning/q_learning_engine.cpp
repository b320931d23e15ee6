#include "core/learning/q_learning_engine.h"
#include "core/learning/context_normalizer.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QJsonArray>
#include <QRandomGenerator>
#include <QUuid>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace crl {

namespace {

DualBufferConfig bufferConfigFor(const EngineConfig& config)
{
    DualBufferConfig bufferConfig;
    bufferConfig.maxActive = config.maxActiveBuffer;
    bufferConfig.maxHistory = config.maxHistoryBuffer;
    bufferConfig.autoProcessThreshold = config.autoProcessThreshold;
    bufferConfig.historyRetentionHours = config.historyRetentionHours;
    return bufferConfig;
}

uint32_t seedFor(const EngineConfig& config)
{
    return config.randomSeed != 0 ? config.randomSeed : QRandomGenerator::global()->generate();
}

double mean(const std::vector<double>& samples)
{
    if (samples.empty()) {
        return 0.0;
    }
    return std::accumulate(samples.begin(), samples.end(), 0.0)
        / static_cast<double>(samples.size());
}

bool isValidReward(double reward)
{
    return std::isfinite(reward) && reward >= -1.0 && reward <= 1.0;
}

} // namespace

QString decisionPathToString(DecisionPath path)
{
    switch (path) {
    case DecisionPath::Exploration:  return QStringLiteral("exploration");
    case DecisionPath::Exploitation: return QStringLiteral("exploitation");
    case DecisionPath::Heuristic:    return QStringLiteral("heuristic");
    }
    return QStringLiteral("heuristic");
}

QJsonObject BatchStats::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("strategies_created")] = strategiesCreated;
    json[QStringLiteral("strategies_updated")] = strategiesUpdated;
    json[QStringLiteral("experiences_processed")] = experiencesProcessed;
    json[QStringLiteral("experiences_dropped")] = experiencesDropped;
    json[QStringLiteral("avg_q_value")] = avgQValue;
    json[QStringLiteral("total_strategies")] = totalStrategies;
    json[QStringLiteral("affected_contexts")] = QJsonArray::fromStringList(touchedContexts);
    return json;
}

QJsonObject BufferStatus::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("active_buffer_size")] = activeSize;
    json[QStringLiteral("active_buffer_max")] = activeMax;
    json[QStringLiteral("history_buffer_size")] = historySize;
    json[QStringLiteral("history_buffer_max")] = historyMax;
    json[QStringLiteral("active_utilization_pct")] = activeUtilizationPct;
    json[QStringLiteral("history_utilization_pct")] = historyUtilizationPct;
    json[QStringLiteral("strategies_count")] = strategyCount;
    return json;
}

QJsonObject LearningMetrics::toJson() const
{
    QJsonObject hyper;
    hyper[QStringLiteral("learning_rate")] = config.learningRate;
    hyper[QStringLiteral("discount_factor")] = config.discountFactor;
    hyper[QStringLiteral("exploration_rate")] = config.explorationRate;
    hyper[QStringLiteral("auto_process_threshold")] = config.autoProcessThreshold;
    hyper[QStringLiteral("history_retention_hours")] = config.historyRetentionHours;

    QJsonObject json;
    json[QStringLiteral("total_actions_generated")] = totalActionsGenerated;
    json[QStringLiteral("total_learning_batches")] = totalLearningBatches;
    json[QStringLiteral("total_experiences_processed")] = totalExperiencesProcessed;
    json[QStringLiteral("total_experiences_dropped")] = totalExperiencesDropped;
    json[QStringLiteral("total_strategies")] = totalStrategies;
    json[QStringLiteral("q_table_contexts")] = qTableContexts;
    json[QStringLiteral("q_table_entries")] = qTableEntries;
    json[QStringLiteral("avg_confidence")] = avgConfidence;
    json[QStringLiteral("avg_reward")] = avgReward;
    json[QStringLiteral("avg_q_value")] = avgQValue;
    json[QStringLiteral("max_q_value")] = maxQValue;
    json[QStringLiteral("buffer_status")] = buffer.toJson();
    json[QStringLiteral("hyperparameters")] = hyper;
    return json;
}

QLearningEngine::QLearningEngine(const EngineConfig& config)
    : m_config(config)
    , m_qTable(config.learningRate, config.discountFactor)
    , m_buffer(bufferConfigFor(config))
    , m_rng(seedFor(config))
{
    LOG_INFO(crlLearning, "Q-learning engine ready (alpha=%.3f gamma=%.3f epsilon=%.3f "
                          "active=%d history=%d threshold=%d)",
             m_config.learningRate, m_config.discountFactor, m_config.explorationRate,
             m_buffer.maxActive(), m_buffer.maxHistory(), m_config.autoProcessThreshold);
}

// ── Learning ────────────────────────────────────────────────────

std::optional<AddExperienceResult> QLearningEngine::addExperience(const QString& context,
                                                                  const QString& action,
                                                                  double reward,
                                                                  const QJsonObject& metadata,
                                                                  LearningError* errorOut)
{
    if (!isValidReward(reward)) {
        setLearningError(errorOut, LearningErrorCode::InvalidReward,
                         QStringLiteral("reward must be a number in [-1, 1]"));
        return std::nullopt;
    }

    const std::optional<QString> normalized = ContextNormalizer::normalize(context);
    if (!normalized) {
        setLearningError(errorOut, LearningErrorCode::InvalidContext,
                         QStringLiteral("context must not be empty"));
        return std::nullopt;
    }

    const std::optional<ActionType> actionType = actionTypeFromString(action);
    if (!actionType) {
        setLearningError(errorOut, LearningErrorCode::InvalidAction,
                         action.trimmed().isEmpty()
                             ? QStringLiteral("action must not be empty")
                             : QStringLiteral("unknown action: %1").arg(action));
        return std::nullopt;
    }

    const QDateTime now = QDateTime::currentDateTimeUtc();
    Experience experience;
    experience.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    experience.context = *normalized;
    experience.action = actionTypeToString(*actionType);
    experience.reward = reward;
    experience.timestamp = now;
    experience.metadata = metadata;

    std::lock_guard<std::mutex> lock(m_mutex);

    AddExperienceResult result;
    result.experience = experience;
    result.overflowDropped = m_buffer.add(experience, now);
    if (result.overflowDropped) {
        ++m_totalExperiencesDropped;
    }
    m_bufferDirty = true;

    LOG_DEBUG(crlLearning, "Experience %s added: %s -> %s (reward=%.3f, active=%d)",
              qUtf8Printable(experience.id), qUtf8Printable(experience.context),
              qUtf8Printable(experience.action), reward, m_buffer.activeSize());

    if (m_buffer.shouldAutoProcess()) {
        result.batch = processExperiencesUnlocked();
    }
    return result;
}

BatchStats QLearningEngine::processExperiences()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return processExperiencesUnlocked();
}

BatchStats QLearningEngine::processExperiencesUnlocked()
{
    BatchStats stats;
    QVector<Experience> drained = m_buffer.drainUnprocessed();
    if (drained.isEmpty()) {
        stats.totalStrategies = m_strategies.size();
        return stats;
    }

    const QDateTime now = QDateTime::currentDateTimeUtc();
    QVector<Experience> processed;
    QVector<Experience> rejected;
    QSet<QString> created;
    QSet<QString> updated;
    double qSum = 0.0;

    for (Experience& experience : drained) {
        QString reason;
        if (!isValidExperience(experience, &reason)) {
            LOG_WARN(crlLearning, "Dropping malformed experience %s: %s",
                     qUtf8Printable(experience.id), qUtf8Printable(reason));
            rejected.push_back(std::move(experience));
            continue;
        }

        const ActionType action = *actionTypeFromString(experience.action);
        // The next state is approximated by the same context.
        const double q = m_qTable.updateValue(experience.context, action,
                                              experience.reward, experience.context);

        auto it = m_strategies.find(experience.context);
        if (it == m_strategies.end()) {
            Strategy strategy;
            strategy.context = experience.context;
            strategy.createdAt = now;
            it = m_strategies.insert(experience.context, strategy);
            m_strategyOrder.push_back(experience.context);
            created.insert(experience.context);
        } else if (!created.contains(experience.context)) {
            updated.insert(experience.context);
        }
        it.value().recordOutcome(action, q, experience.reward, now);

        if (!stats.touchedContexts.contains(experience.context)) {
            stats.touchedContexts.push_back(experience.context);
        }
        qSum += q;
        pushSample(m_rewardHistory, experience.reward);
        pushSample(m_qValueHistory, q);
        processed.push_back(std::move(experience));
    }

    for (const QString& context : stats.touchedContexts) {
        Strategy& strategy = m_strategies[context];
        strategy.recompute(m_qTable.actionValues(context), now);
        pushSample(m_confidenceHistory, strategy.confidence());
        m_dirtyContexts.insert(context);
    }

    m_buffer.moveToHistory(processed, ExperienceState::Processed, QString(), now);
    if (!rejected.isEmpty()) {
        m_buffer.moveToHistory(rejected, ExperienceState::Dropped, kDropReasonValidation, now);
    }
    m_bufferDirty = true;

    stats.strategiesCreated = created.size();
    stats.strategiesUpdated = updated.size();
    stats.experiencesProcessed = processed.size();
    stats.experiencesDropped = rejected.size();
    stats.avgQValue = processed.isEmpty() ? 0.0 : qSum / processed.size();
    stats.totalStrategies = m_strategies.size();

    ++m_totalLearningBatches;
    m_totalExperiencesProcessed += stats.experiencesProcessed;
    m_totalExperiencesDropped += stats.experiencesDropped;

    LOG_INFO(crlLearning, "Batch processed: %d experiences, %d dropped, %d created, %d updated, "
                          "avg Q=%.4f, strategies=%d",
             stats.experiencesProcessed, stats.experiencesDropped, stats.strategiesCreated,
             stats.strategiesUpdated, stats.avgQValue, stats.totalStrategies);
    return stats;
}

bool QLearningEngine::isValidExperience(const Experience& experience, QString* reasonOut)
{
    if (experience.context.trimmed().isEmpty()) {
        *reasonOut = QStringLiteral("empty context");
        return false;
    }
    if (!actionTypeFromString(experience.action)) {
        *reasonOut = QStringLiteral("unknown action '%1'").arg(experience.action);
        return false;
    }
    if (!isValidReward(experience.reward)) {
        *reasonOut = QStringLiteral("reward out of range");
        return false;
    }
    return true;
}

// ── Action selection ────────────────────────────────────────────

std::optional<ActionDecision> QLearningEngine::generateAction(const CampaignContext& context,
                                                              const CampaignMetrics& metrics,
                                                              const QVector<ActionType>& candidates,
                                                              LearningError* errorOut)
{
    const std::optional<QString> normalized = ContextNormalizer::normalize(context);
    if (!normalized) {
        setLearningError(errorOut, LearningErrorCode::InvalidContext,
                         QStringLiteral("context must not be empty"));
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    return decideUnlocked(*normalized, metrics, candidates);
}

std::optional<ActionDecision> QLearningEngine::generateAction(const QString& context,
                                                              const QVector<ActionType>& candidates,
                                                              LearningError* errorOut)
{
    CampaignContext campaignContext;
    campaignContext.strategicContext = context;
    return generateAction(campaignContext, CampaignMetrics(), candidates, errorOut);
}

ActionDecision QLearningEngine::decideUnlocked(const QString& normalizedContext,
                                               const CampaignMetrics& metrics,
                                               const QVector<ActionType>& candidates)
{
    ActionDecision decision;
    decision.normalizedContext = normalizedContext;

    const auto strategyIt = m_strategies.constFind(normalizedContext);
    const double strategyConfidence = strategyIt != m_strategies.constEnd()
        ? strategyIt.value().confidence()
        : 0.0;

    if (m_unit(m_rng) < m_config.explorationRate) {
        decision.action = QTable::randomAction(candidates, m_rng);
        decision.path = DecisionPath::Exploration;
        decision.confidence = strategyConfidence;
        decision.reasoning = QStringLiteral("exploration: random action (epsilon=%1)")
                                 .arg(m_config.explorationRate);
    } else if (const std::optional<ActionValue> best
               = m_qTable.bestAction(normalizedContext, candidates)) {
        decision.action = best->action;
        decision.path = DecisionPath::Exploitation;
        decision.confidence = strategyConfidence;
        decision.reasoning = QStringLiteral("exploitation: best learned action (Q=%1)")
                                 .arg(best->value, 0, 'f', 4);
    } else {
        decision.action = heuristicAction(normalizedContext, metrics, candidates);
        decision.path = DecisionPath::Heuristic;
        decision.confidence = 0.0;
        decision.reasoning = QStringLiteral("heuristic: unknown context, goal-based default");
    }

    ++m_totalActionsGenerated;
    pushSample(m_confidenceHistory, decision.confidence);

    LOG_DEBUG(crlLearning, "Action for %s: %s via %s (confidence=%.3f)",
              qUtf8Printable(normalizedContext),
              qUtf8Printable(actionTypeToString(decision.action)),
              qUtf8Printable(decisionPathToString(decision.path)), decision.confidence);
    return decision;
}

ActionType QLearningEngine::heuristicAction(const QString& normalizedContext,
                                            const CampaignMetrics& metrics,
                                            const QVector<ActionType>& candidates)
{
    const QString goal = normalizedContext.toLower();

    ActionType pick = ActionType::OptimizeBiddingStrategy;
    if (goal.contains(QLatin1String("cpa"))) {
        pick = metrics.roas < 2.0 ? ActionType::FocusHighValueAudiences
                                  : ActionType::ReduceBidConservative;
    } else if (goal.contains(QLatin1String("roas"))) {
        pick = ActionType::FocusHighValueAudiences;
    } else if (goal.contains(QLatin1String("awareness"))) {
        pick = ActionType::ExpandReachCampaigns;
    } else if (goal.contains(QLatin1String("conversion"))) {
        pick = ActionType::IncreaseBidConversionKeywords;
    } else if (goal.contains(QLatin1String("reach"))) {
        pick = ActionType::ExpandReachCampaigns;
    } else if (goal.contains(QLatin1String("ctr"))) {
        pick = ActionType::OptimizeForCtr;
    }

    if (!candidates.isEmpty() && !candidates.contains(pick)) {
        return candidates.front();
    }
    return pick;
}

// ── Introspection ───────────────────────────────────────────────

LearningMetrics QLearningEngine::learningMetrics() const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    LearningMetrics metrics;
    metrics.totalActionsGenerated = m_totalActionsGenerated;
    metrics.totalLearningBatches = m_totalLearningBatches;
    metrics.totalExperiencesProcessed = m_totalExperiencesProcessed;
    metrics.totalExperiencesDropped = m_totalExperiencesDropped;
    metrics.totalStrategies = m_strategies.size();
    metrics.qTableContexts = m_qTable.contextCount();
    metrics.qTableEntries = m_qTable.size();
    metrics.avgConfidence = mean(m_confidenceHistory);
    metrics.avgReward = mean(m_rewardHistory);
    metrics.avgQValue = mean(m_qValueHistory);
    if (!m_qValueHistory.empty()) {
        metrics.maxQValue = *std::max_element(m_qValueHistory.begin(), m_qValueHistory.end());
    }
    metrics.buffer = bufferStatusUnlocked();
    metrics.config = m_config;
    return metrics;
}

BufferStatus QLearningEngine::bufferStatus() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return bufferStatusUnlocked();
}

BufferStatus QLearningEngine::bufferStatusUnlocked() const
{
    BufferStatus status;
    status.activeSize = m_buffer.activeSize();
    status.activeMax = m_buffer.maxActive();
    status.historySize = m_buffer.historySize();
    status.historyMax = m_buffer.maxHistory();
    status.activeUtilizationPct = m_buffer.activeUtilizationPct();
    status.historyUtilizationPct = m_buffer.historyUtilizationPct();
    status.strategyCount = m_strategies.size();
    return status;
}

std::optional<Strategy> QLearningEngine::strategy(const QString& context) const
{
    const std::optional<QString> normalized = ContextNormalizer::normalize(context);
    if (!normalized) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_strategies.constFind(*normalized);
    if (it == m_strategies.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

QVector<Strategy> QLearningEngine::strategies() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    QVector<Strategy> out;
    out.reserve(m_strategyOrder.size());
    for (const QString& context : m_strategyOrder) {
        out.push_back(m_strategies.value(context));
    }
    return out;
}

double QLearningEngine::qValue(const QString& context, ActionType action) const
{
    const std::optional<QString> normalized = ContextNormalizer::normalize(context);
    if (!normalized) {
        return 0.0;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_qTable.value(*normalized, action);
}

QVector<Experience> QLearningEngine::activeSnapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_buffer.activeSnapshot();
}

QVector<Experience> QLearningEngine::historySnapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_buffer.historySnapshot();
}

// ── Persistence hand-off ────────────────────────────────────────

void QLearningEngine::restoreState(const QVector<Strategy>& strategies,
                                   const QVector<QTableEntry>& qEntries,
                                   const QVector<Experience>& active,
                                   const QVector<Experience>& history)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const QDateTime now = QDateTime::currentDateTimeUtc();

    QVector<QTableEntry> entries = qEntries;
    QSet<QString> contextsWithValues;
    for (const QTableEntry& entry : qEntries) {
        contextsWithValues.insert(entry.context);
    }
    for (const Strategy& strategy : strategies) {
        if (contextsWithValues.contains(strategy.context)) {
            continue;
        }
        for (const ActionDetail& detail : strategy.actionDetails) {
            entries.push_back(QTableEntry{strategy.context, detail.action, detail.qValue});
        }
    }
    m_qTable.restore(entries);

    m_strategies.clear();
    m_strategyOrder.clear();
    for (Strategy strategy : strategies) {
        if (strategy.context.isEmpty() || m_strategies.contains(strategy.context)) {
            continue;
        }
        strategy.recompute(m_qTable.actionValues(strategy.context), now);
        m_strategyOrder.push_back(strategy.context);
        m_strategies.insert(strategy.context, strategy);
    }

    m_buffer.restore(active, history, now);
    m_dirtyContexts.clear();
    m_bufferDirty = false;

    LOG_INFO(crlLearning, "Restored %d strategies, %d Q-values, %d active and %d history entries",
             static_cast<int>(m_strategies.size()), m_qTable.size(), m_buffer.activeSize(), m_buffer.historySize());
}

PersistenceDelta QLearningEngine::takePersistenceDelta()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    PersistenceDelta delta;
    QStringList dirty;
    for (const QString& context : m_strategyOrder) {
        if (m_dirtyContexts.contains(context)) {
            dirty.push_back(context);
            delta.strategies.push_back(m_strategies.value(context));
        }
    }
    delta.qEntries = m_qTable.entriesForContexts(dirty);
    delta.archived = m_buffer.takeArchived();
    if (m_bufferDirty) {
        delta.activeBuffer = m_buffer.activeSnapshot();
        delta.hasActiveBuffer = true;
    }
    delta.historyCutoff = QDateTime::currentDateTimeUtc().addSecs(
        -static_cast<qint64>(m_buffer.config().historyRetentionHours) * 3600);
    delta.historyCapacity = m_buffer.maxHistory();
    delta.sequence = ++m_deltaSequence;

    m_dirtyContexts.clear();
    m_bufferDirty = false;
    return delta;
}

void QLearningEngine::pushSample(std::vector<double>& samples, double value)
{
    samples.push_back(value);
    if (static_cast<int>(samples.size()) > kMetricsHistoryCap) {
        samples.erase(samples.begin(), samples.end() - kMetricsHistoryKeep);
    }
}

} // namespace crl
