#include "engine_service.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QProcessEnvironment>

#include <iostream>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("campaign-rl-engine"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Q-learning decision engine for campaign optimization"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption settingsOption(QStringLiteral("settings"),
                                            QStringLiteral("Settings JSON file."),
                                            QStringLiteral("path"));
    const QCommandLineOption dbOption(QStringLiteral("db"),
                                      QStringLiteral("SQLite database path."),
                                      QStringLiteral("path"));
    const QCommandLineOption memoryOption(QStringLiteral("in-memory"),
                                          QStringLiteral("Disable persistence."));
    parser.addOption(settingsOption);
    parser.addOption(dbOption);
    parser.addOption(memoryOption);
    parser.process(app);

    crl::Settings settings = crl::SettingsManager::load(parser.value(settingsOption))
                                 .value_or(crl::Settings());
    settings = crl::SettingsManager::applyEnvironment(settings,
                                                      QProcessEnvironment::systemEnvironment());
    if (parser.isSet(dbOption)) {
        settings.dbPath = parser.value(dbOption);
    }
    if (parser.isSet(memoryOption)) {
        settings.persistenceEnabled = false;
    }
    settings = crl::SettingsManager::sanitized(settings);

    crl::EngineService service(settings);
    if (!service.initialize()) {
        LOG_ERROR(crlCore, "Engine service failed to initialize");
        return 1;
    }
    return service.run(std::cin, std::cout);
}
