#include "core/learning/q_table.h"

#include <algorithm>

namespace crl {

QTable::QTable(double learningRate, double discountFactor)
    : m_learningRate(learningRate)
    , m_discountFactor(discountFactor)
{
}

double QTable::value(const QString& context, ActionType action) const
{
    const auto it = m_table.constFind(context);
    if (it == m_table.constEnd()) {
        return 0.0;
    }
    for (const ActionValue& entry : it.value()) {
        if (entry.action == action) {
            return entry.value;
        }
    }
    return 0.0;
}

double QTable::updateValue(const QString& context,
                           ActionType action,
                           double reward,
                           const QString& nextContext)
{
    ActionValue& current = slot(context, action);
    const double oldValue = current.value;
    const double lookAhead = maxValue(nextContext);
    current.value = oldValue
        + m_learningRate * (reward + m_discountFactor * lookAhead - oldValue);
    return current.value;
}

std::optional<ActionValue> QTable::bestAction(const QString& context) const
{
    const auto it = m_table.constFind(context);
    if (it == m_table.constEnd() || it.value().isEmpty()) {
        return std::nullopt;
    }

    const QVector<ActionValue>& row = it.value();
    ActionValue best = row.front();
    for (int i = 1; i < row.size(); ++i) {
        if (row[i].value > best.value) {
            best = row[i];
        }
    }
    return best;
}

std::optional<ActionValue> QTable::bestAction(const QString& context,
                                              const QVector<ActionType>& candidates) const
{
    if (candidates.isEmpty()) {
        return bestAction(context);
    }

    const auto it = m_table.constFind(context);
    if (it == m_table.constEnd()) {
        return std::nullopt;
    }

    std::optional<ActionValue> best;
    for (const ActionValue& entry : it.value()) {
        if (!candidates.contains(entry.action)) {
            continue;
        }
        if (!best || entry.value > best->value) {
            best = entry;
        }
    }
    return best;
}

ActionType QTable::randomAction(const QVector<ActionType>& candidates, std::mt19937& rng)
{
    const QVector<ActionType>& pool = candidates.isEmpty() ? allActionTypes() : candidates;
    std::uniform_int_distribution<int> pick(0, static_cast<int>(pool.size()) - 1);
    return pool.at(pick(rng));
}

bool QTable::hasContext(const QString& context) const
{
    const auto it = m_table.constFind(context);
    return it != m_table.constEnd() && !it.value().isEmpty();
}

QVector<ActionValue> QTable::actionValues(const QString& context) const
{
    return m_table.value(context);
}

QStringList QTable::contexts() const
{
    return m_contextOrder;
}

QVector<QTableEntry> QTable::entries() const
{
    return entriesForContexts(m_contextOrder);
}

QVector<QTableEntry> QTable::entriesForContexts(const QStringList& contexts) const
{
    QVector<QTableEntry> out;
    for (const QString& context : contexts) {
        const auto it = m_table.constFind(context);
        if (it == m_table.constEnd()) {
            continue;
        }
        for (const ActionValue& entry : it.value()) {
            out.push_back(QTableEntry{context, entry.action, entry.value});
        }
    }
    return out;
}

void QTable::restore(const QVector<QTableEntry>& entries)
{
    m_table.clear();
    m_contextOrder.clear();
    for (const QTableEntry& entry : entries) {
        slot(entry.context, entry.action).value = entry.value;
    }
}

int QTable::contextCount() const
{
    return m_contextOrder.size();
}

int QTable::size() const
{
    int total = 0;
    for (auto it = m_table.constBegin(); it != m_table.constEnd(); ++it) {
        total += it.value().size();
    }
    return total;
}

double QTable::maxValue(const QString& context) const
{
    const auto it = m_table.constFind(context);
    if (it == m_table.constEnd() || it.value().isEmpty()) {
        return 0.0;
    }
    const QVector<ActionValue>& row = it.value();
    double best = row.front().value;
    for (const ActionValue& entry : row) {
        best = std::max(best, entry.value);
    }
    return best;
}

ActionValue& QTable::slot(const QString& context, ActionType action)
{
    auto it = m_table.find(context);
    if (it == m_table.end()) {
        it = m_table.insert(context, QVector<ActionValue>());
        m_contextOrder.push_back(context);
    }

    QVector<ActionValue>& row = it.value();
    for (ActionValue& entry : row) {
        if (entry.action == action) {
            return entry;
        }
    }
    row.push_back(ActionValue{action, 0.0});
    return row.back();
}

} // namespace crl
