#pragma once

#include "core/store/persistence_gateway.h"

#include <QString>

#include <memory>
#include <mutex>

struct sqlite3;
struct sqlite3_stmt;

namespace crl {

// SQLiteLearningStore -- PersistenceGateway on a single SQLite file.
//
// Multi-row writes run in one transaction each; a failed statement rolls
// the whole call back. Calls are serialized by an internal mutex so the
// persistence worker and the startup path may share one instance.
class SQLiteLearningStore : public PersistenceGateway {
public:
    ~SQLiteLearningStore() override;

    SQLiteLearningStore(const SQLiteLearningStore&) = delete;
    SQLiteLearningStore& operator=(const SQLiteLearningStore&) = delete;

    // Open or create the database at the given path. ":memory:" is accepted.
    static std::unique_ptr<SQLiteLearningStore> open(const QString& dbPath,
                                                     QString* errorOut = nullptr);

    bool saveStrategies(const QVector<Strategy>& strategies,
                        QString* errorOut = nullptr) override;
    std::optional<QVector<Strategy>> loadStrategies() override;

    bool saveQTable(const QVector<QTableEntry>& entries,
                    QString* errorOut = nullptr) override;
    std::optional<QVector<QTableEntry>> loadQTable() override;

    bool saveExperience(const Experience& experience,
                        QString* errorOut = nullptr) override;
    bool replaceActiveBuffer(const QVector<Experience>& active,
                             QString* errorOut = nullptr) override;
    std::optional<QVector<Experience>> loadExperiences() override;

    bool saveToHistory(const QVector<Experience>& experiences,
                       QString* errorOut = nullptr) override;
    std::optional<QVector<Experience>> loadHistory() override;

    int cleanupOldHistory(const QDateTime& cutoff, int maxEntries) override;

    // One transaction for the whole delta.
    bool saveDelta(const PersistenceDelta& delta, QString* errorOut = nullptr) override;

    int schemaVersion();
    const QString& path() const { return m_path; }

private:
    SQLiteLearningStore() = default;

    bool init(const QString& dbPath, QString* errorOut);
    bool execSql(const char* sql, QString* errorOut = nullptr);
    bool prepare(const char* sql, sqlite3_stmt** stmt, QString* errorOut);
    bool stepDone(sqlite3_stmt* stmt, QString* errorOut);

    // Unlocked bodies; callers hold m_mutex and a transaction.
    bool writeStrategies(const QVector<Strategy>& strategies, QString* errorOut);
    bool writeQTable(const QVector<QTableEntry>& entries, QString* errorOut);
    bool writeActiveBuffer(const QVector<Experience>& active, QString* errorOut);
    bool writeHistory(const QVector<Experience>& experiences, QString* errorOut);
    bool insertActive(const Experience& experience, int seq, QString* errorOut);
    int deleteHistory(const QDateTime& cutoff, int maxEntries);

    template <typename Fn>
    bool inTransaction(Fn&& body, QString* errorOut);

    sqlite3* m_db = nullptr;
    QString m_path;
    std::mutex m_mutex;
};

} // namespace crl
