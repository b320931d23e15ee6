#pragma once

#include "core/learning/q_table.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QVector>

namespace crl {

struct ActionDetail {
    ActionType action = ActionType::OptimizeBiddingStrategy;
    int count = 0;
    double totalReward = 0.0;
    double avgReward = 0.0;
    double qValue = 0.0;
    QDateTime lastUsed;
};

// Strategy -- per-context summary derived from the Q-table.
//
// bestAction is the argmax over QTable[context] at the last recompute();
// confidence depends only on totalExperiences.
struct Strategy {
    static constexpr const char* kAlgorithmVersion = "q_learning_v1";
    static constexpr double kConfidenceHalfSaturation = 10.0;

    QString context;
    ActionType bestAction = ActionType::OptimizeBiddingStrategy;
    double bestValue = 0.0;
    int totalExperiences = 0;
    QVector<ActionDetail> actionDetails;
    QDateTime createdAt;
    QDateTime updatedAt;
    QString algorithmVersion = QString::fromLatin1(kAlgorithmVersion);

    // n / (n + 10): 0 with no evidence, strictly below 1.
    double confidence() const;
    static double confidenceFor(int totalExperiences);

    void recordOutcome(ActionType action, double qValue, double reward, const QDateTime& now);

    // Re-derives the best action from the context's Q-table row and syncs
    // per-action Q-values. Returns false when the row is empty.
    bool recompute(const QVector<ActionValue>& row, const QDateTime& now);

    const ActionDetail* detailFor(ActionType action) const;
    int actionsCount() const { return actionDetails.size(); }

    QJsonObject toJson() const;
    static Strategy fromJson(const QJsonObject& json, bool* okOut = nullptr);
    static QJsonObject actionDetailsToJson(const QVector<ActionDetail>& details);
    static QVector<ActionDetail> actionDetailsFromJson(const QJsonObject& json);
};

} // namespace crl
