#pragma once

#include "core/learning/experience.h"
#include "core/learning/q_table.h"
#include "core/learning/strategy.h"

#include <QDateTime>
#include <QString>
#include <QVector>

#include <cstdint>
#include <optional>

namespace crl {

// Everything that changed since the previous save request.
struct PersistenceDelta {
    QVector<Strategy> strategies;       // touched contexts only
    QVector<QTableEntry> qEntries;      // rows of touched contexts
    QVector<Experience> activeBuffer;   // full replacement
    QVector<Experience> archived;       // appended to history
    QDateTime historyCutoff;            // entries older than this are purged
    int historyCapacity = 0;
    bool hasActiveBuffer = false;
    uint64_t sequence = 0;              // engine order; higher is newer

    bool isEmpty() const
    {
        return strategies.isEmpty() && qEntries.isEmpty() && archived.isEmpty()
            && !hasActiveBuffer;
    }

    // Folds another delta into this one. Per key the side with the higher
    // sequence wins, so merge order does not matter; archived entries are
    // always kept.
    void merge(const PersistenceDelta& other);
};

// PersistenceGateway -- durable store contract for learning state.
//
// Writes return false (with a message in errorOut) when the store is
// unreachable; loads return nullopt. In-memory state stays authoritative
// either way.
class PersistenceGateway {
public:
    virtual ~PersistenceGateway() = default;

    virtual bool saveStrategies(const QVector<Strategy>& strategies,
                                QString* errorOut = nullptr) = 0;
    virtual std::optional<QVector<Strategy>> loadStrategies() = 0;

    virtual bool saveQTable(const QVector<QTableEntry>& entries,
                            QString* errorOut = nullptr) = 0;
    virtual std::optional<QVector<QTableEntry>> loadQTable() = 0;

    virtual bool saveExperience(const Experience& experience,
                                QString* errorOut = nullptr) = 0;
    virtual bool replaceActiveBuffer(const QVector<Experience>& active,
                                     QString* errorOut = nullptr) = 0;
    virtual std::optional<QVector<Experience>> loadExperiences() = 0;

    virtual bool saveToHistory(const QVector<Experience>& experiences,
                               QString* errorOut = nullptr) = 0;
    virtual std::optional<QVector<Experience>> loadHistory() = 0;

    // Deletes history older than `cutoff`, then trims to `maxEntries`
    // newest rows. Returns the number of deleted rows, or -1 on failure.
    virtual int cleanupOldHistory(const QDateTime& cutoff, int maxEntries) = 0;

    // Applies a whole delta. The default runs the individual calls in order.
    virtual bool saveDelta(const PersistenceDelta& delta, QString* errorOut = nullptr);
};

} // namespace crl
