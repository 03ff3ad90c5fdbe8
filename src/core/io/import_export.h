#pragma once

#include "core/shared/types.h"

#include <QJsonArray>
#include <QString>

#include <optional>
#include <vector>

namespace cdir {

class PathIndex;
class ShortcutRegistry;

struct ImportReport {
    int imported = 0;
    int skipped = 0;
};

// Bulk import/export of paths and shortcuts as JSON arrays.
//
//   paths:     [{"date": "<unix seconds>", "path": "/some/dir"}, ...]
//   shortcuts: [{"name": "docs", "path": "/some/dir", "description": "..."}, ...]
//
// Files named *.yaml or *.yml hold the same rows as a YAML sequence of maps,
// the format older cdir releases exported:
//
//   - date: '1700000000'
//     path: /some/dir
//
// Imported rows go through PathIndex::addPath and
// ShortcutRegistry::addShortcut. Bad rows are logged and skipped; the rest
// of the batch still goes in.
class ImportExport {
public:
    ImportExport(PathIndex& paths, ShortcutRegistry& shortcuts);

    // nullopt if the file is missing or unreadable, or holds no array.
    std::optional<ImportReport> importPathsFile(const QString& filePath);
    std::optional<ImportReport> importShortcutsFile(const QString& filePath);

    ImportReport importPaths(const QJsonArray& rows);
    ImportReport importShortcuts(const QJsonArray& rows);

    // Current path set (oldest first) and all shortcuts.
    bool exportPaths(const QString& filePath) const;
    bool exportShortcuts(const QString& filePath) const;

    static QJsonArray pathsToJson(const std::vector<PathEntry>& paths);
    static QJsonArray shortcutsToJson(const std::vector<ShortcutEntry>& shortcuts);

private:
    static std::optional<QJsonArray> readArray(const QString& filePath);
    static bool writeArray(const QJsonArray& rows, const QString& filePath);

    PathIndex& m_paths;
    ShortcutRegistry& m_shortcuts;
};

} // namespace cdir
