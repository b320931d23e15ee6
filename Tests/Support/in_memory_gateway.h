#pragma once

#include "core/store/persistence_gateway.h"

#include <atomic>
#include <mutex>

namespace crl::test {

// PersistenceGateway kept in process memory. setAvailable(false) makes
// every call fail the way an unreachable database would.
class InMemoryGateway : public PersistenceGateway {
public:
    void setAvailable(bool available) { m_available.store(available); }

    bool saveStrategies(const QVector<Strategy>& strategies, QString* errorOut = nullptr) override;
    std::optional<QVector<Strategy>> loadStrategies() override;

    bool saveQTable(const QVector<QTableEntry>& entries, QString* errorOut = nullptr) override;
    std::optional<QVector<QTableEntry>> loadQTable() override;

    bool saveExperience(const Experience& experience, QString* errorOut = nullptr) override;
    bool replaceActiveBuffer(const QVector<Experience>& active, QString* errorOut = nullptr) override;
    std::optional<QVector<Experience>> loadExperiences() override;

    bool saveToHistory(const QVector<Experience>& experiences, QString* errorOut = nullptr) override;
    std::optional<QVector<Experience>> loadHistory() override;

    int cleanupOldHistory(const QDateTime& cutoff, int maxEntries) override;

    int strategyCount() const;
    int historyCount() const;
    int activeCount() const;
    int saveCalls() const { return m_saveCalls.load(); }

private:
    bool unavailable(QString* errorOut);

    std::atomic<bool> m_available{true};
    std::atomic<int> m_saveCalls{0};

    mutable std::mutex m_mutex;
    QVector<Strategy> m_strategies;
    QVector<QTableEntry> m_qEntries;
    QVector<Experience> m_active;
    QVector<Experience> m_history;
};

} // namespace crl::test
