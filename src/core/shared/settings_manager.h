#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace cdir {

// SettingsManager -- JSON save/load for application settings.
//
// The settings file is looked up at:
//   $CDIR_CONFIG, else <GenericConfigLocation>/cdir/config.json
class SettingsManager {
public:
    // Environment variable overriding the settings file location.
    static constexpr const char* kConfigEnvVar = "CDIR_CONFIG";

    // Load settings from `filePath`. A missing file yields defaults.
    // Returns nullopt if the file exists but cannot be read or parsed.
    static std::optional<Settings> load(const QString& filePath);

    // Save settings to `filePath`. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const Settings& settings, const QString& filePath);

    // Resolves the settings file path: explicit argument, then $CDIR_CONFIG,
    // then the default location.
    static QString settingsFilePath(const QString& explicitPath = {});

    static Settings defaults();

    // Convert settings to/from JSON.
    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace cdir
