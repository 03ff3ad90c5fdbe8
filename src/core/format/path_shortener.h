#pragma once

#include "core/shared/types.h"

#include <QString>

#include <optional>
#include <vector>

namespace cdir {

// Renders a directory for display in at most `maxWidth` characters.
//
// When a shortcut covers the path, its name replaces the covered prefix:
//   /home/user/docs/project  ->  [docs]/project
// Otherwise the home directory is abbreviated:
//   /home/user/project       ->  ~/project
// Text that does not fit is cut from the left and marked with '*'.
class PathShortener {
public:
    explicit PathShortener(const QString& homeDirectory);

    // Shortcut rendering, or nullopt when no shortcut covers `path`.
    // With `allowExactMatch` false a shortcut whose path equals `path` is
    // ignored.
    std::optional<QString> shortenWithShortcut(const QString& path,
                                               const std::vector<ShortcutEntry>& shortcuts,
                                               int maxWidth,
                                               bool allowExactMatch = true) const;

    // Home rendering ("~" prefix) or plain left truncation.
    QString reducePath(const QString& path, int maxWidth) const;

    // Shortcut rendering if possible, home rendering otherwise.
    QString prettyPrint(const QString& path,
                        const std::vector<ShortcutEntry>& shortcuts,
                        int maxWidth) const;

private:
    static QString truncateLeft(const QString& text, int maxWidth);

    QString m_homeDirectory;
};

} // namespace cdir
