#include "core/store/persistence_gateway.h"

#include <QHash>
#include <QPair>

#include <algorithm>

namespace crl {

void PersistenceDelta::merge(const PersistenceDelta& other)
{
    const bool otherIsNewer = other.sequence >= sequence;

    for (const Strategy& strategy : other.strategies) {
        bool found = false;
        for (Strategy& existing : strategies) {
            if (existing.context == strategy.context) {
                if (otherIsNewer) {
                    existing = strategy;
                }
                found = true;
                break;
            }
        }
        if (!found) {
            strategies.push_back(strategy);
        }
    }

    QHash<QPair<QString, int>, int> entryIndex;
    for (int i = 0; i < qEntries.size(); ++i) {
        entryIndex.insert(qMakePair(qEntries[i].context, static_cast<int>(qEntries[i].action)), i);
    }
    for (const QTableEntry& entry : other.qEntries) {
        const auto key = qMakePair(entry.context, static_cast<int>(entry.action));
        const auto it = entryIndex.constFind(key);
        if (it == entryIndex.constEnd()) {
            entryIndex.insert(key, qEntries.size());
            qEntries.push_back(entry);
        } else if (otherIsNewer) {
            qEntries[it.value()] = entry;
        }
    }

    archived += other.archived;
    if (other.hasActiveBuffer && (otherIsNewer || !hasActiveBuffer)) {
        activeBuffer = other.activeBuffer;
        hasActiveBuffer = true;
    }
    if (other.historyCutoff.isValid()
        && (!historyCutoff.isValid() || other.historyCutoff > historyCutoff)) {
        historyCutoff = other.historyCutoff;
    }
    if (other.historyCapacity > 0 && (otherIsNewer || historyCapacity == 0)) {
        historyCapacity = other.historyCapacity;
    }
    sequence = std::max(sequence, other.sequence);
}

bool PersistenceGateway::saveDelta(const PersistenceDelta& delta, QString* errorOut)
{
    if (!delta.strategies.isEmpty() && !saveStrategies(delta.strategies, errorOut)) {
        return false;
    }
    if (!delta.qEntries.isEmpty() && !saveQTable(delta.qEntries, errorOut)) {
        return false;
    }
    if (delta.hasActiveBuffer && !replaceActiveBuffer(delta.activeBuffer, errorOut)) {
        return false;
    }
    if (!delta.archived.isEmpty() && !saveToHistory(delta.archived, errorOut)) {
        return false;
    }
    if (delta.historyCutoff.isValid() && delta.historyCapacity > 0
        && cleanupOldHistory(delta.historyCutoff, delta.historyCapacity) < 0) {
        if (errorOut) {
            *errorOut = QStringLiteral("history_cleanup_failed");
        }
        return false;
    }
    return true;
}

} // namespace crl
