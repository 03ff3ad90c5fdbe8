#pragma once

#include "core/query/list_source.h"
#include "core/shared/store_result.h"
#include "core/shared/types.h"

#include <QString>

#include <optional>
#include <vector>

namespace cdir {

class SchemaStore;

// CRUD over named directory bookmarks (table `shortcuts`).
// Names are unique: adding an existing name replaces the old row.
class ShortcutRegistry : public ListSource<ShortcutEntry> {
public:
    explicit ShortcutRegistry(SchemaStore& store);

    StoreStatus addShortcut(const QString& name, const QString& path,
                            const std::optional<QString>& description = std::nullopt);

    // Unknown names/ids are a no-op.
    StoreStatus deleteShortcut(const QString& name);
    StoreStatus deleteShortcutById(int64_t id);

    StoreResult<std::optional<ShortcutEntry>> findShortcut(const QString& name) const;

    // Ordered by name ascending, id descending. A non-empty filter keeps
    // shortcuts whose name, path or description contains it
    // (case-insensitive); with `fuzzy` the same fields are fuzzy-scored and
    // the best matches come first.
    StoreResult<std::vector<ShortcutEntry>> listShortcuts(std::size_t offset, std::size_t limit,
                                                          const QString& filter, bool fuzzy) const;

    StoreResult<std::vector<ShortcutEntry>> listAllShortcuts() const;

    StoreResult<std::vector<ShortcutEntry>> list(std::size_t offset, std::size_t limit,
                                                 const QString& filter, bool fuzzy) override;

private:
    StoreResult<std::vector<ShortcutEntry>> listExact(std::size_t offset, std::size_t limit,
                                                      const QString& filter) const;
    StoreResult<std::vector<ShortcutEntry>> listFuzzy(std::size_t offset, std::size_t limit,
                                                      const QString& filter) const;

    SchemaStore& m_store;
};

} // namespace cdir
