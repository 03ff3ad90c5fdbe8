#pragma once

#include <QString>
#include <cstdint>
#include <optional>

namespace cdir {

// Named directory bookmark (table `shortcuts`)
struct ShortcutEntry {
    int64_t id = 0;
    QString name;
    QString path;
    std::optional<QString> description;
};

// One directory occurrence, read from `paths` or `paths_history`.
// `shortcut` is resolved at read time and never persisted.
// `isPredicted` marks entries synthesized by SmartSuggester.
struct PathEntry {
    int64_t id = 0;
    QString path;
    int64_t timestamp = 0;
    std::optional<ShortcutEntry> shortcut;
    bool isPredicted = false;
};

} // namespace cdir
