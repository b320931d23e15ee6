#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QProcessEnvironment>
#include <QString>

#include <optional>

namespace crl {

// SettingsManager -- JSON save/load for engine settings.
//
// Settings are stored as a JSON file at:
//   <GenericDataLocation>/campaign-rl/settings.json
// unless an explicit path is given.
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if the file doesn't exist
    // or cannot be parsed.
    static std::optional<Settings> load(const QString& filePath = QString());

    // Save settings to disk. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const Settings& settings, const QString& filePath = QString());

    static QString settingsFilePath();
    static QString defaultDbPath();

    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);

    // CRL_* environment variables override file values.
    static Settings applyEnvironment(Settings settings,
                                     const QProcessEnvironment& env
                                     = QProcessEnvironment::systemEnvironment());

    // Clamp rates to [0, 1] and sizes to >= 1. Logs every adjustment.
    static Settings sanitized(Settings settings);
};

} // namespace crl
