#include "core/ranking/shortcut_resolver.h"

namespace cdir {

namespace {

constexpr QChar kSeparator = QLatin1Char('/');

} // namespace

bool ShortcutResolver::isAncestor(const QString& shortcutPath, const QString& path)
{
    if (shortcutPath.isEmpty() || !path.startsWith(shortcutPath)) {
        return false;
    }
    if (path.length() == shortcutPath.length()) {
        return true;
    }
    return path.at(shortcutPath.length()) == kSeparator;
}

std::optional<ShortcutEntry> ShortcutResolver::bestMatch(
    const QString& path, const std::vector<ShortcutEntry>& shortcuts)
{
    const ShortcutEntry* best = nullptr;
    for (const ShortcutEntry& shortcut : shortcuts) {
        if (!isAncestor(shortcut.path, path)) {
            continue;
        }
        if (!best || shortcut.path.length() > best->path.length()) {
            best = &shortcut;
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return *best;
}

void ShortcutResolver::assign(PathEntry& entry, const std::vector<ShortcutEntry>& shortcuts)
{
    for (const ShortcutEntry& shortcut : shortcuts) {
        if (!isAncestor(shortcut.path, entry.path)) {
            continue;
        }
        if (!entry.shortcut || shortcut.path.length() > entry.shortcut->path.length()) {
            entry.shortcut = shortcut;
        }
    }
}

void ShortcutResolver::assignAll(std::vector<PathEntry>& entries,
                                 const std::vector<ShortcutEntry>& shortcuts)
{
    if (shortcuts.empty()) {
        return;
    }
    for (PathEntry& entry : entries) {
        assign(entry, shortcuts);
    }
}

} // namespace cdir
