#include "core/format/path_shortener.h"
#include "core/ranking/shortcut_resolver.h"

namespace cdir {

namespace {

const QString kEllipsis = QStringLiteral("*");
const QString kTilde = QStringLiteral("~");

// Keeps the last `room - 1` characters of `suffix` behind a '*'.
QString cutSuffix(const QString& suffix, int room)
{
    if (suffix.length() <= room) {
        return suffix;
    }
    return kEllipsis + suffix.right(room - 1);
}

} // namespace

PathShortener::PathShortener(const QString& homeDirectory)
    : m_homeDirectory(homeDirectory)
{
}

std::optional<QString> PathShortener::shortenWithShortcut(
    const QString& path, const std::vector<ShortcutEntry>& shortcuts,
    int maxWidth, bool allowExactMatch) const
{
    if (maxWidth <= 0) {
        return std::nullopt;
    }

    const ShortcutEntry* best = nullptr;
    for (const ShortcutEntry& shortcut : shortcuts) {
        if (!allowExactMatch && path == shortcut.path) {
            continue;
        }
        if (ShortcutResolver::isAncestor(shortcut.path, path)
            && (!best || shortcut.path.length() > best->path.length())) {
            best = &shortcut;
        }
    }
    if (!best) {
        return std::nullopt;
    }

    const QString label = QLatin1Char('[') + best->name + QLatin1Char(']');
    const int labelWidth = label.length() + 1;  // the label plus '/' or '*'

    if (labelWidth == maxWidth) {
        return label + kEllipsis;
    }
    if (labelWidth > maxWidth) {
        return kEllipsis;
    }
    if (path == best->path) {
        return label;
    }

    QString suffix = path.mid(best->path.length());
    if (suffix.startsWith(QLatin1Char('/'))) {
        suffix.remove(0, 1);
    }
    return label + QLatin1Char('/') + cutSuffix(suffix, maxWidth - labelWidth);
}

QString PathShortener::reducePath(const QString& path, int maxWidth) const
{
    if (maxWidth <= 0) {
        return QString();
    }

    if (m_homeDirectory.isEmpty()
        || !(path == m_homeDirectory || path.startsWith(m_homeDirectory + QLatin1Char('/')))) {
        return truncateLeft(path, maxWidth);
    }

    if (path == m_homeDirectory) {
        return kTilde;
    }

    switch (maxWidth) {
    case 1:
        return kEllipsis;
    case 2:
        return kTilde + kEllipsis;
    case 3:
        return kTilde + QStringLiteral("/*");
    default:
        break;
    }

    const QString suffix = path.mid(m_homeDirectory.length() + 1);
    return kTilde + QLatin1Char('/') + cutSuffix(suffix, maxWidth - 2);
}

QString PathShortener::prettyPrint(const QString& path,
                                   const std::vector<ShortcutEntry>& shortcuts,
                                   int maxWidth) const
{
    const std::optional<QString> shortened = shortenWithShortcut(path, shortcuts, maxWidth);
    if (shortened) {
        return *shortened;
    }
    return reducePath(path, maxWidth);
}

QString PathShortener::truncateLeft(const QString& text, int maxWidth)
{
    if (text.length() <= maxWidth) {
        return text;
    }
    return kEllipsis + text.right(maxWidth - 1);
}

} // namespace cdir
