#include "core/store/sqlite_learning_store.h"
#include "core/store/schema.h"
#include "core/shared/logging.h"

#include <sqlite3.h>

#include <QFile>
#include <QHash>
#include <QJsonDocument>

namespace crl {

namespace {

QString isoString(const QDateTime& value)
{
    return value.isValid() ? value.toUTC().toString(Qt::ISODateWithMs) : QString();
}

QDateTime fromIsoString(const QString& value)
{
    if (value.isEmpty()) {
        return QDateTime();
    }
    QDateTime parsed = QDateTime::fromString(value, Qt::ISODateWithMs);
    return parsed.isValid() ? parsed.toUTC() : QDateTime();
}

QString columnText(sqlite3_stmt* stmt, int column)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
}

void bindText(sqlite3_stmt* stmt, int index, const QString& value)
{
    if (value.isNull()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    const QByteArray utf8 = value.toUtf8();
    sqlite3_bind_text(stmt, index, utf8.constData(), utf8.size(), SQLITE_TRANSIENT);
}

QString jsonText(const QJsonObject& json)
{
    return QString::fromUtf8(QJsonDocument(json).toJson(QJsonDocument::Compact));
}

QJsonObject parseJsonObject(const QString& text)
{
    const QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8());
    return doc.isObject() ? doc.object() : QJsonObject();
}

void setError(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
}

} // namespace

SQLiteLearningStore::~SQLiteLearningStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::unique_ptr<SQLiteLearningStore> SQLiteLearningStore::open(const QString& dbPath,
                                                               QString* errorOut)
{
    std::unique_ptr<SQLiteLearningStore> store(new SQLiteLearningStore());
    if (!store->init(dbPath, errorOut)) {
        return nullptr;
    }
    return store;
}

bool SQLiteLearningStore::init(const QString& dbPath, QString* errorOut)
{
    m_path = dbPath;
    const int rc = sqlite3_open_v2(dbPath.toUtf8().constData(), &m_db,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE
                                       | SQLITE_OPEN_FULLMUTEX,
                                   nullptr);
    if (rc != SQLITE_OK) {
        const QString message = QStringLiteral("failed to open database: %1")
                                    .arg(QString::fromUtf8(sqlite3_errmsg(m_db)));
        LOG_ERROR(crlStore, "%s", qUtf8Printable(message));
        setError(errorOut, message);
        return false;
    }

    sqlite3_busy_timeout(m_db, 5000);

    if (!execSql(kConnectionPragmas, errorOut)) {
        LOG_ERROR(crlStore, "Failed to set connection pragmas");
        return false;
    }

    bool schemaExists = false;
    {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db,
                "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='rl_strategies'",
                -1, &stmt, nullptr) == SQLITE_OK
            && sqlite3_step(stmt) == SQLITE_ROW) {
            schemaExists = sqlite3_column_int(stmt, 0) > 0;
        }
        sqlite3_finalize(stmt);
    }

    if (!schemaExists) {
        if (!execSql(kDatabasePragmas, errorOut)) {
            LOG_ERROR(crlStore, "Failed to set database pragmas");
            return false;
        }
        if (!execSql(kSchemaV1, errorOut)) {
            LOG_ERROR(crlStore, "Failed to create schema");
            return false;
        }
        if (!execSql(kDefaultSettings, errorOut)) {
            LOG_ERROR(crlStore, "Failed to insert default settings");
            return false;
        }
    }

    const int version = schemaVersion();
    if (version > kCurrentSchemaVersion) {
        const QString message = QStringLiteral("schema version %1 is newer than supported %2")
                                    .arg(version)
                                    .arg(kCurrentSchemaVersion);
        LOG_ERROR(crlStore, "%s", qUtf8Printable(message));
        setError(errorOut, message);
        return false;
    }

    if (dbPath != QLatin1String(":memory:")) {
        QFile dbFile(dbPath);
        dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    }

    LOG_INFO(crlStore, "Learning store opened: %s (schema v%d)", qUtf8Printable(dbPath), version);
    return true;
}

int SQLiteLearningStore::schemaVersion()
{
    sqlite3_stmt* stmt = nullptr;
    int version = 0;
    if (sqlite3_prepare_v2(m_db, "SELECT value FROM settings WHERE key = 'schema_version'",
                           -1, &stmt, nullptr) == SQLITE_OK
        && sqlite3_step(stmt) == SQLITE_ROW) {
        version = columnText(stmt, 0).toInt();
    }
    sqlite3_finalize(stmt);
    return version;
}

bool SQLiteLearningStore::execSql(const char* sql, QString* errorOut)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        const QString message = QString::fromUtf8(errMsg ? errMsg : "unknown");
        LOG_ERROR(crlStore, "SQL error: %s", qUtf8Printable(message));
        setError(errorOut, message);
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

bool SQLiteLearningStore::prepare(const char* sql, sqlite3_stmt** stmt, QString* errorOut)
{
    if (sqlite3_prepare_v2(m_db, sql, -1, stmt, nullptr) != SQLITE_OK) {
        const QString message = QString::fromUtf8(sqlite3_errmsg(m_db));
        LOG_ERROR(crlStore, "Failed to prepare statement: %s", qUtf8Printable(message));
        setError(errorOut, message);
        sqlite3_finalize(*stmt);
        *stmt = nullptr;
        return false;
    }
    return true;
}

bool SQLiteLearningStore::stepDone(sqlite3_stmt* stmt, QString* errorOut)
{
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        const QString message = QString::fromUtf8(sqlite3_errmsg(m_db));
        LOG_ERROR(crlStore, "Statement failed: %s", qUtf8Printable(message));
        setError(errorOut, message);
        return false;
    }
    return true;
}

template <typename Fn>
bool SQLiteLearningStore::inTransaction(Fn&& body, QString* errorOut)
{
    if (!execSql("BEGIN IMMEDIATE TRANSACTION", errorOut)) {
        return false;
    }
    if (!body()) {
        execSql("ROLLBACK");
        return false;
    }
    if (!execSql("COMMIT", errorOut)) {
        execSql("ROLLBACK");
        return false;
    }
    return true;
}

// ── Strategies ──────────────────────────────────────────────

bool SQLiteLearningStore::saveStrategies(const QVector<Strategy>& strategies, QString* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return inTransaction([&] { return writeStrategies(strategies, errorOut); }, errorOut);
}

bool SQLiteLearningStore::writeStrategies(const QVector<Strategy>& strategies, QString* errorOut)
{
    const char* sql = R"(
        INSERT INTO rl_strategies (context, best_action, best_q_value, total_experiences,
                                   action_details, algorithm_version, created_at, updated_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)
        ON CONFLICT(context) DO UPDATE SET
            best_action = excluded.best_action,
            best_q_value = excluded.best_q_value,
            total_experiences = excluded.total_experiences,
            action_details = excluded.action_details,
            algorithm_version = excluded.algorithm_version,
            updated_at = excluded.updated_at
    )";

    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql, &stmt, errorOut)) {
        return false;
    }

    bool ok = true;
    for (const Strategy& strategy : strategies) {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        bindText(stmt, 1, strategy.context);
        bindText(stmt, 2, actionTypeToString(strategy.bestAction));
        sqlite3_bind_double(stmt, 3, strategy.bestValue);
        sqlite3_bind_int(stmt, 4, strategy.totalExperiences);
        bindText(stmt, 5, jsonText(Strategy::actionDetailsToJson(strategy.actionDetails)));
        bindText(stmt, 6, strategy.algorithmVersion);
        bindText(stmt, 7, isoString(strategy.createdAt));
        bindText(stmt, 8, isoString(strategy.updatedAt));
        if (!stepDone(stmt, errorOut)) {
            ok = false;
            break;
        }
    }
    sqlite3_finalize(stmt);
    return ok;
}

std::optional<QVector<Strategy>> SQLiteLearningStore::loadStrategies()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const char* sql = R"(
        SELECT context, best_action, best_q_value, total_experiences, action_details,
               algorithm_version, created_at, updated_at
        FROM rl_strategies
        ORDER BY created_at ASC, context ASC
    )";

    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql, &stmt, nullptr)) {
        return std::nullopt;
    }

    QVector<Strategy> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const QString bestActionName = columnText(stmt, 1);
        const std::optional<ActionType> bestAction = actionTypeFromString(bestActionName);
        if (!bestAction) {
            LOG_WARN(crlStore, "Skipping strategy %s with unknown best action '%s'",
                     qUtf8Printable(columnText(stmt, 0)), qUtf8Printable(bestActionName));
            continue;
        }

        Strategy strategy;
        strategy.context = columnText(stmt, 0);
        strategy.bestAction = *bestAction;
        strategy.bestValue = sqlite3_column_double(stmt, 2);
        strategy.totalExperiences = sqlite3_column_int(stmt, 3);
        strategy.actionDetails = Strategy::actionDetailsFromJson(
            parseJsonObject(columnText(stmt, 4)));
        strategy.algorithmVersion = columnText(stmt, 5);
        strategy.createdAt = fromIsoString(columnText(stmt, 6));
        strategy.updatedAt = fromIsoString(columnText(stmt, 7));
        out.push_back(strategy);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR(crlStore, "Failed to read strategies: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return out;
}

// ── Q-table ─────────────────────────────────────────────────

bool SQLiteLearningStore::saveQTable(const QVector<QTableEntry>& entries, QString* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return inTransaction([&] { return writeQTable(entries, errorOut); }, errorOut);
}

bool SQLiteLearningStore::writeQTable(const QVector<QTableEntry>& entries, QString* errorOut)
{
    const char* sql = R"(
        INSERT INTO rl_q_values (context, action, q_value, position, updated_at)
        VALUES (?1, ?2, ?3, ?4, ?5)
        ON CONFLICT(context, action) DO UPDATE SET
            q_value = excluded.q_value,
            updated_at = excluded.updated_at
    )";

    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql, &stmt, errorOut)) {
        return false;
    }

    const QString now = isoString(QDateTime::currentDateTimeUtc());
    QHash<QString, int> positions;
    bool ok = true;
    for (const QTableEntry& entry : entries) {
        // Position only matters for first inserts; it keeps argmax ties stable.
        const int position = positions.value(entry.context, 0);
        positions.insert(entry.context, position + 1);

        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        bindText(stmt, 1, entry.context);
        bindText(stmt, 2, actionTypeToString(entry.action));
        sqlite3_bind_double(stmt, 3, entry.value);
        sqlite3_bind_int(stmt, 4, position);
        bindText(stmt, 5, now);
        if (!stepDone(stmt, errorOut)) {
            ok = false;
            break;
        }
    }
    sqlite3_finalize(stmt);
    return ok;
}

std::optional<QVector<QTableEntry>> SQLiteLearningStore::loadQTable()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const char* sql = R"(
        SELECT q.context, q.action, q.q_value
        FROM rl_q_values q
        LEFT JOIN rl_strategies s ON s.context = q.context
        ORDER BY s.created_at ASC, q.context ASC, q.position ASC
    )";

    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql, &stmt, nullptr)) {
        return std::nullopt;
    }

    QVector<QTableEntry> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const std::optional<ActionType> action = actionTypeFromString(columnText(stmt, 1));
        if (!action) {
            LOG_WARN(crlStore, "Skipping Q-value with unknown action '%s'",
                     qUtf8Printable(columnText(stmt, 1)));
            continue;
        }
        out.push_back(QTableEntry{columnText(stmt, 0), *action, sqlite3_column_double(stmt, 2)});
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR(crlStore, "Failed to read Q-values: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return out;
}

// ── Experiences ─────────────────────────────────────────────

bool SQLiteLearningStore::saveExperience(const Experience& experience, QString* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!experience.isUnprocessed()) {
        return inTransaction([&] { return writeHistory({experience}, errorOut); }, errorOut);
    }

    return inTransaction([&] {
        sqlite3_stmt* stmt = nullptr;
        if (!prepare("SELECT COALESCE(MAX(seq), -1) + 1 FROM rl_active_buffer", &stmt, errorOut)) {
            return false;
        }
        int seq = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            seq = sqlite3_column_int(stmt, 0);
        }
        sqlite3_finalize(stmt);
        return insertActive(experience, seq, errorOut);
    }, errorOut);
}

bool SQLiteLearningStore::replaceActiveBuffer(const QVector<Experience>& active, QString* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return inTransaction([&] { return writeActiveBuffer(active, errorOut); }, errorOut);
}

bool SQLiteLearningStore::writeActiveBuffer(const QVector<Experience>& active, QString* errorOut)
{
    if (!execSql("DELETE FROM rl_active_buffer", errorOut)) {
        return false;
    }
    for (int i = 0; i < active.size(); ++i) {
        if (!insertActive(active[i], i, errorOut)) {
            return false;
        }
    }
    return true;
}

bool SQLiteLearningStore::insertActive(const Experience& experience, int seq, QString* errorOut)
{
    const char* sql = R"(
        INSERT OR REPLACE INTO rl_active_buffer (id, seq, context, action, reward, timestamp, metadata)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql, &stmt, errorOut)) {
        return false;
    }
    bindText(stmt, 1, experience.id);
    sqlite3_bind_int(stmt, 2, seq);
    bindText(stmt, 3, experience.context);
    bindText(stmt, 4, experience.action);
    sqlite3_bind_double(stmt, 5, experience.reward);
    bindText(stmt, 6, isoString(experience.timestamp));
    bindText(stmt, 7, jsonText(experience.metadata));
    const bool ok = stepDone(stmt, errorOut);
    sqlite3_finalize(stmt);
    return ok;
}

std::optional<QVector<Experience>> SQLiteLearningStore::loadExperiences()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const char* sql = R"(
        SELECT id, context, action, reward, timestamp, metadata
        FROM rl_active_buffer
        ORDER BY seq ASC
    )";

    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql, &stmt, nullptr)) {
        return std::nullopt;
    }

    QVector<Experience> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Experience experience;
        experience.id = columnText(stmt, 0);
        experience.context = columnText(stmt, 1);
        experience.action = columnText(stmt, 2);
        experience.reward = sqlite3_column_double(stmt, 3);
        experience.timestamp = fromIsoString(columnText(stmt, 4));
        experience.metadata = parseJsonObject(columnText(stmt, 5));
        experience.state = ExperienceState::Unprocessed;
        out.push_back(experience);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR(crlStore, "Failed to read active buffer: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return out;
}

// ── History ─────────────────────────────────────────────────

bool SQLiteLearningStore::saveToHistory(const QVector<Experience>& experiences, QString* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return inTransaction([&] { return writeHistory(experiences, errorOut); }, errorOut);
}

bool SQLiteLearningStore::writeHistory(const QVector<Experience>& experiences, QString* errorOut)
{
    const char* sql = R"(
        INSERT OR IGNORE INTO rl_history (id, context, action, reward, timestamp, state,
                                          processed_at, drop_reason, metadata)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql, &stmt, errorOut)) {
        return false;
    }

    bool ok = true;
    for (const Experience& experience : experiences) {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        bindText(stmt, 1, experience.id);
        bindText(stmt, 2, experience.context);
        bindText(stmt, 3, experience.action);
        sqlite3_bind_double(stmt, 4, experience.reward);
        bindText(stmt, 5, isoString(experience.timestamp));
        bindText(stmt, 6, experienceStateToString(experience.state));
        bindText(stmt, 7, isoString(experience.processedAt));
        bindText(stmt, 8, experience.dropReason.isEmpty() ? QString() : experience.dropReason);
        bindText(stmt, 9, jsonText(experience.metadata));
        if (!stepDone(stmt, errorOut)) {
            ok = false;
            break;
        }
    }
    sqlite3_finalize(stmt);
    if (!ok) {
        return false;
    }

    // An archived experience is no longer pending.
    sqlite3_stmt* del = nullptr;
    if (!prepare("DELETE FROM rl_active_buffer WHERE id = ?1", &del, errorOut)) {
        return false;
    }
    for (const Experience& experience : experiences) {
        sqlite3_reset(del);
        bindText(del, 1, experience.id);
        if (!stepDone(del, errorOut)) {
            ok = false;
            break;
        }
    }
    sqlite3_finalize(del);
    return ok;
}

std::optional<QVector<Experience>> SQLiteLearningStore::loadHistory()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const char* sql = R"(
        SELECT id, context, action, reward, timestamp, state, processed_at, drop_reason, metadata
        FROM rl_history
        ORDER BY row_id ASC
    )";

    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql, &stmt, nullptr)) {
        return std::nullopt;
    }

    QVector<Experience> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Experience experience;
        experience.id = columnText(stmt, 0);
        experience.context = columnText(stmt, 1);
        experience.action = columnText(stmt, 2);
        experience.reward = sqlite3_column_double(stmt, 3);
        experience.timestamp = fromIsoString(columnText(stmt, 4));
        experience.state = experienceStateFromString(columnText(stmt, 5));
        experience.processedAt = fromIsoString(columnText(stmt, 6));
        experience.dropReason = columnText(stmt, 7);
        experience.metadata = parseJsonObject(columnText(stmt, 8));
        out.push_back(experience);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR(crlStore, "Failed to read history: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return out;
}

int SQLiteLearningStore::cleanupOldHistory(const QDateTime& cutoff, int maxEntries)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    int deleted = -1;
    const bool ok = inTransaction([&] {
        deleted = deleteHistory(cutoff, maxEntries);
        return deleted >= 0;
    }, nullptr);
    return ok ? deleted : -1;
}

int SQLiteLearningStore::deleteHistory(const QDateTime& cutoff, int maxEntries)
{
    int deleted = 0;

    if (cutoff.isValid()) {
        // Same policy as DualBuffer::evictHistory: age is the observation time.
        sqlite3_stmt* stmt = nullptr;
        if (!prepare("DELETE FROM rl_history WHERE timestamp < ?1", &stmt, nullptr)) {
            return -1;
        }
        bindText(stmt, 1, isoString(cutoff));
        const bool ok = stepDone(stmt, nullptr);
        sqlite3_finalize(stmt);
        if (!ok) {
            return -1;
        }
        deleted += sqlite3_changes(m_db);
    }

    if (maxEntries > 0) {
        const char* sql = R"(
            DELETE FROM rl_history
            WHERE row_id NOT IN (
                SELECT row_id FROM rl_history ORDER BY row_id DESC LIMIT ?1
            )
        )";
        sqlite3_stmt* stmt = nullptr;
        if (!prepare(sql, &stmt, nullptr)) {
            return -1;
        }
        sqlite3_bind_int(stmt, 1, maxEntries);
        const bool ok = stepDone(stmt, nullptr);
        sqlite3_finalize(stmt);
        if (!ok) {
            return -1;
        }
        deleted += sqlite3_changes(m_db);
    }

    if (deleted > 0) {
        LOG_DEBUG(crlStore, "History cleanup removed %d rows", deleted);
    }
    return deleted;
}

// ── Delta ───────────────────────────────────────────────────

bool SQLiteLearningStore::saveDelta(const PersistenceDelta& delta, QString* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return inTransaction([&] {
        if (!delta.strategies.isEmpty() && !writeStrategies(delta.strategies, errorOut)) {
            return false;
        }
        if (!delta.qEntries.isEmpty() && !writeQTable(delta.qEntries, errorOut)) {
            return false;
        }
        if (!delta.archived.isEmpty() && !writeHistory(delta.archived, errorOut)) {
            return false;
        }
        if (delta.hasActiveBuffer && !writeActiveBuffer(delta.activeBuffer, errorOut)) {
            return false;
        }
        if (delta.historyCutoff.isValid() && delta.historyCapacity > 0
            && deleteHistory(delta.historyCutoff, delta.historyCapacity) < 0) {
            setError(errorOut, QStringLiteral("history_cleanup_failed"));
            return false;
        }
        return true;
    }, errorOut);
}

} // namespace crl
