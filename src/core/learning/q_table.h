#pragma once

#include "core/shared/types.h"

#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>
#include <random>

namespace crl {

struct ActionValue {
    ActionType action = ActionType::OptimizeBiddingStrategy;
    double value = 0.0;
};

struct QTableEntry {
    QString context;
    ActionType action = ActionType::OptimizeBiddingStrategy;
    double value = 0.0;
};

// QTable -- (context, action) -> learned value.
//
// Pairs that were never written read as 0.0. Actions keep their
// first-insertion order per context, which makes argmax ties
// deterministic. Not thread-safe; the engine serializes access.
class QTable {
public:
    QTable(double learningRate = 0.1, double discountFactor = 0.95);

    double value(const QString& context, ActionType action) const;

    // Q(s,a) <- Q(s,a) + alpha * (R + gamma * max_a' Q(s',a') - Q(s,a))
    // (s,a) is recorded before the look-ahead is read, so s' == s sees it.
    double updateValue(const QString& context,
                       ActionType action,
                       double reward,
                       const QString& nextContext);

    // nullopt when the context has no recorded actions (among the
    // candidates, when given).
    std::optional<ActionValue> bestAction(const QString& context) const;
    std::optional<ActionValue> bestAction(const QString& context,
                                          const QVector<ActionType>& candidates) const;

    // Uniform pick; an empty candidate list means the full vocabulary.
    static ActionType randomAction(const QVector<ActionType>& candidates, std::mt19937& rng);

    bool hasContext(const QString& context) const;
    QVector<ActionValue> actionValues(const QString& context) const;
    QStringList contexts() const;
    QVector<QTableEntry> entries() const;
    QVector<QTableEntry> entriesForContexts(const QStringList& contexts) const;

    // Replaces the whole table.
    void restore(const QVector<QTableEntry>& entries);

    int contextCount() const;
    int size() const;

    double learningRate() const { return m_learningRate; }
    double discountFactor() const { return m_discountFactor; }

private:
    double maxValue(const QString& context) const;
    ActionValue& slot(const QString& context, ActionType action);

    double m_learningRate = 0.1;
    double m_discountFactor = 0.95;
    QHash<QString, QVector<ActionValue>> m_table;
    QStringList m_contextOrder;
};

} // namespace crl
