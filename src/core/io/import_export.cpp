#include "core/io/import_export.h"
#include "core/index/path_index.h"
#include "core/index/shortcut_registry.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>

#include <yaml-cpp/yaml.h>

namespace cdir {

namespace {

bool isYamlFile(const QString& filePath)
{
    const QString suffix = QFileInfo(filePath).suffix().toLower();
    return suffix == QLatin1String("yaml") || suffix == QLatin1String("yml");
}

// A YAML sequence of flat maps becomes the same rows a JSON file gives.
// Scalars keep their text, so `date: 100` and `date: '100'` read alike;
// `null` values are dropped.
std::optional<QJsonArray> yamlToRows(const QByteArray& content, const QString& filePath)
{
    YAML::Node root;
    try {
        root = YAML::Load(content.toStdString());
    } catch (const YAML::Exception& e) {
        LOG_ERROR(cdirCore, "Failed to parse the file %s: %s", qUtf8Printable(filePath), e.what());
        return std::nullopt;
    }
    if (!root.IsSequence()) {
        LOG_ERROR(cdirCore, "Failed to parse the file %s: expected a YAML sequence",
                  qUtf8Printable(filePath));
        return std::nullopt;
    }

    QJsonArray rows;
    for (YAML::const_iterator item = root.begin(); item != root.end(); ++item) {
        QJsonObject row;
        if (item->IsMap()) {
            for (YAML::const_iterator field = item->begin(); field != item->end(); ++field) {
                if (field->first.IsScalar() && field->second.IsScalar()) {
                    row.insert(QString::fromStdString(field->first.Scalar()),
                               QString::fromStdString(field->second.Scalar()));
                }
            }
        }
        // Non-map items stay as empty rows so row numbers in warnings match the file
        rows.append(row);
    }
    return rows;
}

QByteArray rowsToYaml(const QJsonArray& rows)
{
    YAML::Emitter out;
    out << YAML::BeginSeq;
    for (const QJsonValue& value : rows) {
        const QJsonObject row = value.toObject();
        out << YAML::BeginMap;
        for (auto it = row.constBegin(); it != row.constEnd(); ++it) {
            out << YAML::Key << it.key().toStdString()
                << YAML::Value << it.value().toString().toStdString();
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    return QByteArray(out.c_str()) + '\n';
}

} // namespace

ImportExport::ImportExport(PathIndex& paths, ShortcutRegistry& shortcuts)
    : m_paths(paths)
    , m_shortcuts(shortcuts)
{
}

std::optional<QJsonArray> ImportExport::readArray(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        LOG_ERROR(cdirCore, "File %s does not exist", qUtf8Printable(filePath));
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_ERROR(cdirCore, "Failed to read file %s: %s",
                  qUtf8Printable(filePath), qUtf8Printable(file.errorString()));
        return std::nullopt;
    }
    const QByteArray content = file.readAll();

    if (isYamlFile(filePath)) {
        return yamlToRows(content, filePath);
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(content, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        LOG_ERROR(cdirCore, "Failed to parse the file %s: %s",
                  qUtf8Printable(filePath), qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }
    if (!doc.isArray()) {
        LOG_ERROR(cdirCore, "Failed to parse the file %s: expected a JSON array",
                  qUtf8Printable(filePath));
        return std::nullopt;
    }
    return doc.array();
}

bool ImportExport::writeArray(const QJsonArray& rows, const QString& filePath)
{
    const QString parentDir = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(cdirCore, "Failed to create directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QByteArray content = isYamlFile(filePath)
        ? rowsToYaml(rows)
        : QJsonDocument(rows).toJson(QJsonDocument::Indented);

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        LOG_ERROR(cdirCore, "Failed to open %s for write: %s",
                  qUtf8Printable(filePath), qUtf8Printable(file.errorString()));
        return false;
    }
    file.write(content);
    if (!file.commit()) {
        LOG_ERROR(cdirCore, "Failed to write %s: %s",
                  qUtf8Printable(filePath), qUtf8Printable(file.errorString()));
        return false;
    }
    LOG_INFO(cdirCore, "Exported %d rows to %s", static_cast<int>(rows.size()),
             qUtf8Printable(filePath));
    return true;
}

std::optional<ImportReport> ImportExport::importPathsFile(const QString& filePath)
{
    const std::optional<QJsonArray> rows = readArray(filePath);
    if (!rows) {
        return std::nullopt;
    }
    return importPaths(*rows);
}

std::optional<ImportReport> ImportExport::importShortcutsFile(const QString& filePath)
{
    const std::optional<QJsonArray> rows = readArray(filePath);
    if (!rows) {
        return std::nullopt;
    }
    return importShortcuts(*rows);
}

ImportReport ImportExport::importPaths(const QJsonArray& rows)
{
    ImportReport report;
    for (int i = 0; i < rows.size(); ++i) {
        const QJsonObject row = rows.at(i).toObject();
        const QString path = row.value(QStringLiteral("path")).toString();
        const QJsonValue dateValue = row.value(QStringLiteral("date"));

        if (path.isEmpty() || !dateValue.isString()) {
            LOG_WARN(cdirCore, "Path row %d: missing 'path' or 'date', skipped", i);
            ++report.skipped;
            continue;
        }

        bool ok = false;
        const qlonglong seconds = dateValue.toString().toLongLong(&ok);
        if (!ok || seconds < 0) {
            LOG_WARN(cdirCore, "Path row %d: invalid date '%s', skipped",
                     i, qUtf8Printable(dateValue.toString()));
            ++report.skipped;
            continue;
        }

        const StoreStatus status = m_paths.addPath(path, seconds);
        if (!status) {
            LOG_ERROR(cdirCore, "Path row %d: %s", i, qUtf8Printable(status.error().toString()));
            ++report.skipped;
            continue;
        }
        ++report.imported;
    }

    LOG_INFO(cdirCore, "Imported %d paths, skipped %d", report.imported, report.skipped);
    return report;
}

ImportReport ImportExport::importShortcuts(const QJsonArray& rows)
{
    ImportReport report;
    for (int i = 0; i < rows.size(); ++i) {
        const QJsonObject row = rows.at(i).toObject();
        const QString name = row.value(QStringLiteral("name")).toString();
        const QString path = row.value(QStringLiteral("path")).toString();

        if (name.isEmpty() || path.isEmpty()) {
            LOG_WARN(cdirCore, "Shortcut row %d: missing 'name' or 'path', skipped", i);
            ++report.skipped;
            continue;
        }

        std::optional<QString> description;
        const QJsonValue descriptionValue = row.value(QStringLiteral("description"));
        if (descriptionValue.isString()) {
            description = descriptionValue.toString();
        }

        const StoreStatus status = m_shortcuts.addShortcut(name, path, description);
        if (!status) {
            LOG_ERROR(cdirCore, "Shortcut row %d: %s", i, qUtf8Printable(status.error().toString()));
            ++report.skipped;
            continue;
        }
        ++report.imported;
    }

    LOG_INFO(cdirCore, "Imported %d shortcuts, skipped %d", report.imported, report.skipped);
    return report;
}

bool ImportExport::exportPaths(const QString& filePath) const
{
    const StoreResult<std::vector<PathEntry>> paths = m_paths.listAllPaths();
    if (paths.isError()) {
        LOG_ERROR(cdirCore, "Export failed: %s", qUtf8Printable(paths.error().toString()));
        return false;
    }
    return writeArray(pathsToJson(paths.value()), filePath);
}

bool ImportExport::exportShortcuts(const QString& filePath) const
{
    const StoreResult<std::vector<ShortcutEntry>> shortcuts = m_shortcuts.listAllShortcuts();
    if (shortcuts.isError()) {
        LOG_ERROR(cdirCore, "Export failed: %s", qUtf8Printable(shortcuts.error().toString()));
        return false;
    }
    return writeArray(shortcutsToJson(shortcuts.value()), filePath);
}

QJsonArray ImportExport::pathsToJson(const std::vector<PathEntry>& paths)
{
    QJsonArray rows;
    for (const PathEntry& entry : paths) {
        QJsonObject row;
        row.insert(QStringLiteral("date"), QString::number(entry.timestamp));
        row.insert(QStringLiteral("path"), entry.path);
        rows.append(row);
    }
    return rows;
}

QJsonArray ImportExport::shortcutsToJson(const std::vector<ShortcutEntry>& shortcuts)
{
    QJsonArray rows;
    for (const ShortcutEntry& entry : shortcuts) {
        QJsonObject row;
        row.insert(QStringLiteral("name"), entry.name);
        row.insert(QStringLiteral("path"), entry.path);
        if (entry.description) {
            row.insert(QStringLiteral("description"), *entry.description);
        }
        rows.append(row);
    }
    return rows;
}

} // namespace cdir
