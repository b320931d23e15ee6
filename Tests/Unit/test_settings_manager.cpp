#include <QtTest/QtTest>

#include "core/shared/settings_manager.h"

#include <QTemporaryDir>

#include <limits>

class TestSettingsManager : public QObject {
    Q_OBJECT

private slots:
    void testDefaults();
    void testSaveLoadRoundTrip();
    void testMissingFileReturnsNullopt();
    void testMalformedFileReturnsNullopt();
    void testPartialJsonKeepsDefaults();
    void testEnvironmentOverrides();
    void testUnparseableEnvironmentIgnored();
    void testSanitizedClampsOutOfRange();
};

void TestSettingsManager::testDefaults()
{
    const crl::Settings settings;
    QCOMPARE(settings.engine.learningRate, 0.1);
    QCOMPARE(settings.engine.discountFactor, 0.95);
    QCOMPARE(settings.engine.explorationRate, 0.15);
    QCOMPARE(settings.engine.maxActiveBuffer, 25);
    QCOMPARE(settings.engine.maxHistoryBuffer, 1000);
    QCOMPARE(settings.engine.autoProcessThreshold, 15);
    QCOMPARE(settings.engine.historyRetentionHours, 72);
    QVERIFY(settings.persistenceEnabled);
    QCOMPARE(settings.eventOverflowPolicy, crl::QueueOverflowPolicy::Drop);
}

void TestSettingsManager::testSaveLoadRoundTrip()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.path() + QStringLiteral("/nested/settings.json");

    crl::Settings settings;
    settings.dbPath = dir.path() + QStringLiteral("/learning.db");
    settings.persistenceEnabled = false;
    settings.engine.learningRate = 0.2;
    settings.engine.explorationRate = 0.05;
    settings.engine.autoProcessThreshold = 10;
    settings.engine.randomSeed = 1234;
    settings.eventQueueDepth = 64;
    settings.eventOverflowPolicy = crl::QueueOverflowPolicy::Block;
    settings.eventSubmitTimeoutMs = 500;

    QVERIFY(crl::SettingsManager::save(settings, path));

    const auto loaded = crl::SettingsManager::load(path);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->dbPath, settings.dbPath);
    QCOMPARE(loaded->persistenceEnabled, false);
    QCOMPARE(loaded->engine.learningRate, 0.2);
    QCOMPARE(loaded->engine.explorationRate, 0.05);
    QCOMPARE(loaded->engine.autoProcessThreshold, 10);
    QCOMPARE(loaded->engine.randomSeed, uint32_t(1234));
    QCOMPARE(loaded->eventQueueDepth, 64);
    QCOMPARE(loaded->eventOverflowPolicy, crl::QueueOverflowPolicy::Block);
    QCOMPARE(loaded->eventSubmitTimeoutMs, 500);
}

void TestSettingsManager::testMissingFileReturnsNullopt()
{
    QTemporaryDir dir;
    QVERIFY(!crl::SettingsManager::load(dir.path() + QStringLiteral("/none.json")).has_value());
}

void TestSettingsManager::testMalformedFileReturnsNullopt()
{
    QTemporaryDir dir;
    const QString path = dir.path() + QStringLiteral("/settings.json");
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();

    QVERIFY(!crl::SettingsManager::load(path).has_value());
}

void TestSettingsManager::testPartialJsonKeepsDefaults()
{
    QJsonObject engine;
    engine[QStringLiteral("explorationRate")] = 0.3;
    QJsonObject json;
    json[QStringLiteral("engine")] = engine;
    json[QStringLiteral("eventOverflowPolicy")] = QStringLiteral("sideways");

    const crl::Settings settings = crl::SettingsManager::fromJson(json);
    QCOMPARE(settings.engine.explorationRate, 0.3);
    QCOMPARE(settings.engine.learningRate, 0.1);
    QCOMPARE(settings.engine.maxActiveBuffer, 25);
    QCOMPARE(settings.eventOverflowPolicy, crl::QueueOverflowPolicy::Drop);
    QVERIFY(settings.persistenceEnabled);
}

void TestSettingsManager::testEnvironmentOverrides()
{
    QProcessEnvironment env;
    env.insert(QStringLiteral("CRL_LEARNING_RATE"), QStringLiteral("0.25"));
    env.insert(QStringLiteral("CRL_EXPLORATION_RATE"), QStringLiteral(" 0.0 "));
    env.insert(QStringLiteral("CRL_MAX_ACTIVE_BUFFER"), QStringLiteral("40"));
    env.insert(QStringLiteral("CRL_AUTO_PROCESS_THRESHOLD"), QStringLiteral("0"));
    env.insert(QStringLiteral("CRL_DB_PATH"), QStringLiteral("/tmp/crl-test.db"));
    env.insert(QStringLiteral("CRL_EVENT_OVERFLOW_POLICY"), QStringLiteral("BLOCK"));

    const crl::Settings settings = crl::SettingsManager::applyEnvironment(crl::Settings(), env);
    QCOMPARE(settings.engine.learningRate, 0.25);
    QCOMPARE(settings.engine.explorationRate, 0.0);
    QCOMPARE(settings.engine.maxActiveBuffer, 40);
    QCOMPARE(settings.engine.autoProcessThreshold, 0);
    QCOMPARE(settings.engine.discountFactor, 0.95);
    QCOMPARE(settings.dbPath, QStringLiteral("/tmp/crl-test.db"));
    QCOMPARE(settings.eventOverflowPolicy, crl::QueueOverflowPolicy::Block);
}

void TestSettingsManager::testUnparseableEnvironmentIgnored()
{
    QProcessEnvironment env;
    env.insert(QStringLiteral("CRL_DISCOUNT_FACTOR"), QStringLiteral("ninety"));
    env.insert(QStringLiteral("CRL_MAX_HISTORY_BUFFER"), QStringLiteral("lots"));

    const crl::Settings settings = crl::SettingsManager::applyEnvironment(crl::Settings(), env);
    QCOMPARE(settings.engine.discountFactor, 0.95);
    QCOMPARE(settings.engine.maxHistoryBuffer, 1000);
}

void TestSettingsManager::testSanitizedClampsOutOfRange()
{
    crl::Settings settings;
    settings.engine.learningRate = 1.5;
    settings.engine.discountFactor = std::numeric_limits<double>::quiet_NaN();
    settings.engine.explorationRate = -0.2;
    settings.engine.maxActiveBuffer = 0;
    settings.engine.maxHistoryBuffer = -10;
    settings.engine.historyRetentionHours = 0;
    settings.eventQueueDepth = 0;
    settings.eventSubmitTimeoutMs = -5;

    const crl::Settings clean = crl::SettingsManager::sanitized(settings);
    QCOMPARE(clean.engine.learningRate, 1.0);
    QCOMPARE(clean.engine.discountFactor, 0.0);
    QCOMPARE(clean.engine.explorationRate, 0.0);
    QCOMPARE(clean.engine.maxActiveBuffer, 1);
    QCOMPARE(clean.engine.maxHistoryBuffer, 1);
    QCOMPARE(clean.engine.historyRetentionHours, 1);
    QCOMPARE(clean.eventQueueDepth, 1);
    QCOMPARE(clean.eventSubmitTimeoutMs, 0);
    QCOMPARE(clean.dbPath, crl::SettingsManager::defaultDbPath());
}

QTEST_MAIN(TestSettingsManager)
#include "test_settings_manager.moc"
