#pragma once

#include "core/shared/types.h"

#include <QString>

#include <optional>
#include <vector>

namespace cdir {

// Picks the most specific shortcut for a directory: the ancestor shortcut
// with the longest path string. Equal-length candidates keep the first one
// assigned.
class ShortcutResolver {
public:
    // True if `shortcutPath` equals `path` or is a parent directory of it.
    // "/home/use" is not an ancestor of "/home/user".
    // Same rule as the SQL shortcut filter in PathIndex, so "/" and
    // "/home/" match only themselves.
    static bool isAncestor(const QString& shortcutPath, const QString& path);

    // Longest-path ancestor of `path` among `shortcuts`, if any.
    static std::optional<ShortcutEntry> bestMatch(const QString& path,
                                                  const std::vector<ShortcutEntry>& shortcuts);

    // Decorates `entry` with its best shortcut. An already assigned shortcut
    // is only replaced by a strictly longer one.
    static void assign(PathEntry& entry, const std::vector<ShortcutEntry>& shortcuts);
    static void assignAll(std::vector<PathEntry>& entries,
                          const std::vector<ShortcutEntry>& shortcuts);
};

} // namespace cdir
