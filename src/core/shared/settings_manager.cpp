#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>
#include <QtGlobal>

namespace cdir {

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    const QFileInfo info(filePath);
    if (!info.exists()) {
        // Nothing is written until the first `save`
        LOG_INFO(cdirCore, "No settings file at %s, using defaults", qUtf8Printable(filePath));
        return defaults();
    }
    if (info.isDir()) {
        LOG_WARN(cdirCore, "Settings path %s is a directory", qUtf8Printable(filePath));
        return std::nullopt;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(cdirCore, "Cannot read %s: %s", qUtf8Printable(filePath),
                 qUtf8Printable(file.errorString()));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        LOG_WARN(cdirCore, "%s: offset %d: %s", qUtf8Printable(filePath), parseError.offset,
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }
    if (!doc.isObject()) {
        LOG_WARN(cdirCore, "%s: expected a JSON object at top level", qUtf8Printable(filePath));
        return std::nullopt;
    }

    Settings settings = fromJson(doc.object());
    LOG_DEBUG(cdirCore, "Settings from %s, database %s", qUtf8Printable(filePath),
              qUtf8Printable(settings.dbPath));
    return settings;
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QString configDir = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(configDir)) {
        LOG_ERROR(cdirCore, "Cannot create config directory %s", qUtf8Printable(configDir));
        return false;
    }

    // Written aside and renamed on commit, so a crash never leaves a
    // truncated file that the next start would reject
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        LOG_ERROR(cdirCore, "Cannot write %s: %s", qUtf8Printable(filePath),
                  qUtf8Printable(file.errorString()));
        return false;
    }
    file.write(QJsonDocument(toJson(settings)).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        LOG_ERROR(cdirCore, "Cannot commit %s: %s", qUtf8Printable(filePath),
                  qUtf8Printable(file.errorString()));
        return false;
    }
    return true;
}

QString SettingsManager::settingsFilePath(const QString& explicitPath)
{
    if (!explicitPath.isEmpty()) {
        return explicitPath;
    }
    const QString fromEnv = qEnvironmentVariable(kConfigEnvVar);
    if (!fromEnv.isEmpty()) {
        return fromEnv;
    }
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    return basePath + QStringLiteral("/cdir/config.json");
}

Settings SettingsManager::defaults()
{
    Settings settings;
    settings.dbPath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
                      + QStringLiteral("/cdir/cdir.db");
    settings.homeDirectory = QDir::homePath();
    return settings;
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("logRules"), settings.logRules);
    json.insert(QStringLiteral("dateFormat"), settings.dateFormat);
    json.insert(QStringLiteral("pathSearchIncludeShortcuts"), settings.pathSearchIncludeShortcuts);
    json.insert(QStringLiteral("smartSuggestionsActive"), settings.smartSuggestionsActive);
    json.insert(QStringLiteral("smartSuggestionsDepth"), static_cast<int>(settings.smartSuggestionsDepth));
    json.insert(QStringLiteral("smartSuggestionsCount"), static_cast<int>(settings.smartSuggestionsCount));
    json.insert(QStringLiteral("homeDirectory"), settings.homeDirectory);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings = defaults();

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);
    settings.logRules = json.value(QStringLiteral("logRules")).toString(settings.logRules);
    settings.dateFormat = json.value(QStringLiteral("dateFormat")).toString(settings.dateFormat);
    settings.homeDirectory = json.value(QStringLiteral("homeDirectory")).toString(settings.homeDirectory);

    settings.pathSearchIncludeShortcuts = json.value(QStringLiteral("pathSearchIncludeShortcuts"))
                                              .toBool(settings.pathSearchIncludeShortcuts);
    settings.smartSuggestionsActive = json.value(QStringLiteral("smartSuggestionsActive"))
                                          .toBool(settings.smartSuggestionsActive);

    if (json.contains(QStringLiteral("smartSuggestionsDepth"))) {
        const int depth = json.value(QStringLiteral("smartSuggestionsDepth")).toInt(-1);
        if (depth >= 0 && static_cast<uint32_t>(depth) <= kMaxSmartSuggestionsDepth) {
            settings.smartSuggestionsDepth = static_cast<uint32_t>(depth);
        } else {
            LOG_WARN(cdirCore, "Ignoring invalid smartSuggestionsDepth in settings");
        }
    }

    if (json.contains(QStringLiteral("smartSuggestionsCount"))) {
        const int count = json.value(QStringLiteral("smartSuggestionsCount")).toInt(-1);
        if (count >= 0 && static_cast<uint32_t>(count) <= kMaxSmartSuggestionsCount) {
            settings.smartSuggestionsCount = static_cast<uint32_t>(count);
        } else {
            LOG_WARN(cdirCore, "Ignoring invalid smartSuggestionsCount in settings");
        }
    }

    return settings;
}

} // namespace cdir
