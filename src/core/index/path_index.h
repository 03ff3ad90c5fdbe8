#pragma once

#include "core/query/list_source.h"
#include "core/shared/settings.h"
#include "core/shared/store_result.h"
#include "core/shared/types.h"

#include <QByteArray>
#include <QString>

#include <cstdint>
#include <vector>

namespace cdir {

class SchemaStore;
class ShortcutRegistry;

// Visited directories: the deduplicated current set (table `paths`) and the
// append-only visit log (table `paths_history`).
//
// Listings are decorated with each entry's most specific shortcut. Search
// behaviour follows the Settings passed at construction, read on every call.
class PathIndex : public ListSource<PathEntry> {
public:
    PathIndex(SchemaStore& store, ShortcutRegistry& shortcuts, const Settings& settings);

    // Records a visit: replaces the current-set row for `path` and appends
    // a history row, both in one transaction.
    StoreStatus addPath(const QString& path, int64_t timestamp);
    StoreStatus addPath(const QString& path);

    // Removes a current-set row. History is kept. Unknown ids are a no-op.
    StoreStatus deletePath(int64_t id);

    // Current set, newest first. An empty filter lists everything, preceded
    // by smart suggestions when they are enabled. `fuzzy` with a non-empty
    // filter ranks by fuzzy score instead.
    StoreResult<std::vector<PathEntry>> listPaths(std::size_t offset, std::size_t limit,
                                                  const QString& filter, bool fuzzy) const;

    // Visit log, newest first.
    StoreResult<std::vector<PathEntry>> listPathHistory(std::size_t offset, std::size_t limit,
                                                        const QString& filter) const;

    // Whole current set, oldest first (export order).
    StoreResult<std::vector<PathEntry>> listAllPaths() const;

    StoreResult<std::vector<PathEntry>> list(std::size_t offset, std::size_t limit,
                                             const QString& filter, bool fuzzy) override;

private:
    StoreResult<std::vector<PathEntry>> listExact(std::size_t offset, std::size_t limit,
                                                  const QString& filter,
                                                  const std::vector<ShortcutEntry>& shortcuts) const;
    StoreResult<std::vector<PathEntry>> listFuzzy(std::size_t offset, std::size_t limit,
                                                  const QString& filter,
                                                  const std::vector<ShortcutEntry>& shortcuts) const;
    StoreResult<std::vector<PathEntry>> predictedEntries(
        const std::vector<ShortcutEntry>& shortcuts) const;
    StoreResult<std::vector<PathEntry>> queryRows(const char* table, std::size_t offset,
                                                  std::size_t limit, const QString& filter) const;
    StoreStatus execPathWrite(const char* sql, const QByteArray& pathUtf8, int64_t timestamp,
                              const char* what);

    SchemaStore& m_store;
    ShortcutRegistry& m_shortcuts;
    const Settings& m_settings;
};

} // namespace cdir
