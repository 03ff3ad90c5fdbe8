#pragma once

#include <QString>
#include <cstdint>

namespace cdir {

// Upper bounds for the smart suggestion window. They keep every summed
// SmartRanker weight inside 64 bits.
constexpr uint32_t kMaxSmartSuggestionsDepth = 1000;
constexpr uint32_t kMaxSmartSuggestionsCount = 32;

struct Settings {
    // Database
    QString dbPath;

    // Logging filter rules, QLoggingCategory::setFilterRules() syntax
    QString logRules;

    // Date format used when printing path timestamps
    QString dateFormat = QStringLiteral("dd-MMM-yy HH:mm:ss");

    // Exact and fuzzy path search also match shortcut names/descriptions
    bool pathSearchIncludeShortcuts = true;

    // Predicted entries prepended to the unfiltered path listing
    bool smartSuggestionsActive = false;
    uint32_t smartSuggestionsDepth = 5;
    uint32_t smartSuggestionsCount = 3;

    // Skipped by the suggester and abbreviated to '~' when printing.
    QString homeDirectory;

    // Anchor for smart suggestions. Empty means the most recent history entry.
    QString currentDirectory;
};

} // namespace cdir
