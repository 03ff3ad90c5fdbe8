#pragma once

#include "core/shared/store_result.h"
#include "core/shared/types.h"

#include <QHash>
#include <QString>

#include <cstdint>
#include <vector>

namespace cdir {

class SchemaStore;

// Accumulates weighted "came next" observations and ranks them.
//
// An observation is a path seen `rank` steps after the anchor occurrence
// `anchorIndex` (0 = most recent anchor). Its weight is
//   ((1 << (count - 1 - rank)) << 2) + (depth - anchorIndex - 1)
// so proximity dominates and anchor recency only breaks ties. Weights of the
// same path are summed.
class SmartRanker {
public:
    SmartRanker(uint32_t depth, uint32_t count);

    void addPath(uint32_t anchorIndex, const QString& path, uint32_t rank);

    // Paths by descending total weight, ties in first-seen order, at most
    // `count` of them.
    std::vector<QString> collectRows() const;

    uint64_t scoreOf(const QString& path) const;
    bool isEmpty() const { return m_candidates.empty(); }

private:
    struct Candidate {
        QString path;
        uint64_t score = 0;
    };

    uint32_t m_depth;
    uint32_t m_count;
    std::vector<Candidate> m_candidates;  // first-seen order
    QHash<QString, size_t> m_index;
};

// Predicts the next directories from the history log by mining what
// followed earlier visits of the current directory.
class SmartSuggester {
public:
    // `homeDirectory` is never suggested.
    SmartSuggester(SchemaStore& store, const QString& homeDirectory);

    // Up to `count` predicted entries, best first, all flagged isPredicted.
    // Empty when matchPath is empty or depth/count is zero.
    StoreResult<std::vector<PathEntry>> suggest(const QString& matchPath,
                                                uint32_t depth,
                                                uint32_t count,
                                                const std::vector<ShortcutEntry>& shortcuts) const;

    // Path of the most recent history row, or an empty string.
    StoreResult<QString> latestHistoryPath() const;

private:
    StoreResult<std::vector<int64_t>> fetchAnchors(const QString& matchPath, uint32_t depth) const;

    SchemaStore& m_store;
    QString m_homeDirectory;
};

} // namespace cdir
