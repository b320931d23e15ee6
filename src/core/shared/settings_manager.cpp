#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <algorithm>
#include <cmath>

namespace crl {

namespace {

QString resolvePath(const QString& filePath)
{
    return filePath.isEmpty() ? SettingsManager::settingsFilePath() : filePath;
}

QString overflowPolicyToString(QueueOverflowPolicy policy)
{
    return policy == QueueOverflowPolicy::Block ? QStringLiteral("block")
                                                : QStringLiteral("drop");
}

QueueOverflowPolicy overflowPolicyFromString(const QString& raw, QueueOverflowPolicy fallback)
{
    const QString normalized = raw.trimmed().toLower();
    if (normalized == QLatin1String("block")) {
        return QueueOverflowPolicy::Block;
    }
    if (normalized == QLatin1String("drop")) {
        return QueueOverflowPolicy::Drop;
    }
    return fallback;
}

double clampRate(const char* name, double value)
{
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        const double clamped = std::isfinite(value) ? std::clamp(value, 0.0, 1.0) : 0.0;
        LOG_WARN(crlCore, "Setting %s=%f out of range, using %f", name, value, clamped);
        return clamped;
    }
    return value;
}

int atLeastOne(const char* name, int value)
{
    if (value < 1) {
        LOG_WARN(crlCore, "Setting %s=%d out of range, using 1", name, value);
        return 1;
    }
    return value;
}

void overrideDouble(const QProcessEnvironment& env, const QString& key, double* target)
{
    if (!env.contains(key)) {
        return;
    }
    bool ok = false;
    const double parsed = env.value(key).trimmed().toDouble(&ok);
    if (ok) {
        *target = parsed;
    } else {
        LOG_WARN(crlCore, "Ignoring unparseable %s=%s", qUtf8Printable(key),
                 qUtf8Printable(env.value(key)));
    }
}

void overrideInt(const QProcessEnvironment& env, const QString& key, int* target)
{
    if (!env.contains(key)) {
        return;
    }
    bool ok = false;
    const int parsed = env.value(key).trimmed().toInt(&ok);
    if (ok) {
        *target = parsed;
    } else {
        LOG_WARN(crlCore, "Ignoring unparseable %s=%s", qUtf8Printable(key),
                 qUtf8Printable(env.value(key)));
    }
}

} // namespace

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    const QString path = resolvePath(filePath);
    QFile file(path);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(crlCore, "Failed to open settings file for read: %s", qUtf8Printable(path));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(crlCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(path),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QString path = resolvePath(filePath);
    const QString parentDir = QFileInfo(path).absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(crlCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(crlCore, "Failed to open settings file for write: %s", qUtf8Printable(path));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(crlCore, "Failed to write settings file: %s", qUtf8Printable(path));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/campaign-rl/settings.json");
}

QString SettingsManager::defaultDbPath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/campaign-rl/learning.db");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject engine;
    engine.insert(QStringLiteral("learningRate"), settings.engine.learningRate);
    engine.insert(QStringLiteral("discountFactor"), settings.engine.discountFactor);
    engine.insert(QStringLiteral("explorationRate"), settings.engine.explorationRate);
    engine.insert(QStringLiteral("maxActiveBuffer"), settings.engine.maxActiveBuffer);
    engine.insert(QStringLiteral("maxHistoryBuffer"), settings.engine.maxHistoryBuffer);
    engine.insert(QStringLiteral("autoProcessThreshold"), settings.engine.autoProcessThreshold);
    engine.insert(QStringLiteral("historyRetentionHours"), settings.engine.historyRetentionHours);
    engine.insert(QStringLiteral("randomSeed"), static_cast<qint64>(settings.engine.randomSeed));

    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("persistenceEnabled"), settings.persistenceEnabled);
    json.insert(QStringLiteral("engine"), engine);
    json.insert(QStringLiteral("eventQueueDepth"), settings.eventQueueDepth);
    json.insert(QStringLiteral("eventOverflowPolicy"),
                overflowPolicyToString(settings.eventOverflowPolicy));
    json.insert(QStringLiteral("eventSubmitTimeoutMs"), settings.eventSubmitTimeoutMs);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);
    settings.persistenceEnabled = json.value(QStringLiteral("persistenceEnabled"))
                                      .toBool(settings.persistenceEnabled);

    const QJsonObject engine = json.value(QStringLiteral("engine")).toObject();
    EngineConfig& cfg = settings.engine;
    cfg.learningRate = engine.value(QStringLiteral("learningRate")).toDouble(cfg.learningRate);
    cfg.discountFactor = engine.value(QStringLiteral("discountFactor")).toDouble(cfg.discountFactor);
    cfg.explorationRate = engine.value(QStringLiteral("explorationRate")).toDouble(cfg.explorationRate);
    cfg.maxActiveBuffer = engine.value(QStringLiteral("maxActiveBuffer")).toInt(cfg.maxActiveBuffer);
    cfg.maxHistoryBuffer = engine.value(QStringLiteral("maxHistoryBuffer")).toInt(cfg.maxHistoryBuffer);
    cfg.autoProcessThreshold = engine.value(QStringLiteral("autoProcessThreshold"))
                                   .toInt(cfg.autoProcessThreshold);
    cfg.historyRetentionHours = engine.value(QStringLiteral("historyRetentionHours"))
                                    .toInt(cfg.historyRetentionHours);
    if (engine.contains(QStringLiteral("randomSeed"))) {
        cfg.randomSeed = static_cast<uint32_t>(
            engine.value(QStringLiteral("randomSeed")).toVariant().toULongLong());
    }

    settings.eventQueueDepth = json.value(QStringLiteral("eventQueueDepth"))
                                   .toInt(settings.eventQueueDepth);
    settings.eventOverflowPolicy = overflowPolicyFromString(
        json.value(QStringLiteral("eventOverflowPolicy")).toString(),
        settings.eventOverflowPolicy);
    settings.eventSubmitTimeoutMs = json.value(QStringLiteral("eventSubmitTimeoutMs"))
                                        .toInt(settings.eventSubmitTimeoutMs);

    return settings;
}

Settings SettingsManager::applyEnvironment(Settings settings, const QProcessEnvironment& env)
{
    EngineConfig& cfg = settings.engine;
    overrideDouble(env, QStringLiteral("CRL_LEARNING_RATE"), &cfg.learningRate);
    overrideDouble(env, QStringLiteral("CRL_DISCOUNT_FACTOR"), &cfg.discountFactor);
    overrideDouble(env, QStringLiteral("CRL_EXPLORATION_RATE"), &cfg.explorationRate);
    overrideInt(env, QStringLiteral("CRL_MAX_ACTIVE_BUFFER"), &cfg.maxActiveBuffer);
    overrideInt(env, QStringLiteral("CRL_MAX_HISTORY_BUFFER"), &cfg.maxHistoryBuffer);
    overrideInt(env, QStringLiteral("CRL_AUTO_PROCESS_THRESHOLD"), &cfg.autoProcessThreshold);
    overrideInt(env, QStringLiteral("CRL_HISTORY_RETENTION_HOURS"), &cfg.historyRetentionHours);
    overrideInt(env, QStringLiteral("CRL_EVENT_QUEUE_DEPTH"), &settings.eventQueueDepth);

    if (env.contains(QStringLiteral("CRL_DB_PATH"))) {
        settings.dbPath = env.value(QStringLiteral("CRL_DB_PATH")).trimmed();
    }
    if (env.contains(QStringLiteral("CRL_EVENT_OVERFLOW_POLICY"))) {
        settings.eventOverflowPolicy = overflowPolicyFromString(
            env.value(QStringLiteral("CRL_EVENT_OVERFLOW_POLICY")),
            settings.eventOverflowPolicy);
    }
    return settings;
}

Settings SettingsManager::sanitized(Settings settings)
{
    EngineConfig& cfg = settings.engine;
    cfg.learningRate = clampRate("learningRate", cfg.learningRate);
    cfg.discountFactor = clampRate("discountFactor", cfg.discountFactor);
    cfg.explorationRate = clampRate("explorationRate", cfg.explorationRate);
    cfg.maxActiveBuffer = atLeastOne("maxActiveBuffer", cfg.maxActiveBuffer);
    cfg.maxHistoryBuffer = atLeastOne("maxHistoryBuffer", cfg.maxHistoryBuffer);
    cfg.historyRetentionHours = atLeastOne("historyRetentionHours", cfg.historyRetentionHours);
    if (cfg.autoProcessThreshold > cfg.maxActiveBuffer) {
        LOG_WARN(crlCore, "autoProcessThreshold=%d exceeds maxActiveBuffer=%d; "
                          "batches will only run when forced",
                 cfg.autoProcessThreshold, cfg.maxActiveBuffer);
    }

    settings.eventQueueDepth = atLeastOne("eventQueueDepth", settings.eventQueueDepth);
    settings.eventSubmitTimeoutMs = std::max(0, settings.eventSubmitTimeoutMs);
    if (settings.dbPath.isEmpty()) {
        settings.dbPath = defaultDbPath();
    }
    return settings;
}

} // namespace crl
