#include "core/ranking/smart_suggester.h"
#include "core/index/schema_store.h"
#include "core/ranking/shortcut_resolver.h"
#include "core/shared/settings.h"
#include "core/shared/logging.h"

#include <QStringList>
#include <sqlite3.h>

#include <algorithm>

namespace cdir {

// ── SmartRanker ─────────────────────────────────────────────

SmartRanker::SmartRanker(uint32_t depth, uint32_t count)
    : m_depth(depth)
    , m_count(count)
{
    if (m_depth == 0 || m_count == 0) {
        LOG_WARN(cdirRanking, "SmartRanker created with depth=%u count=%u, nothing will be ranked",
                 m_depth, m_count);
    }
    if (m_count > kMaxSmartSuggestionsCount) {
        LOG_WARN(cdirRanking, "SmartRanker count %u exceeds %u, ranking only the first %u",
                 m_count, kMaxSmartSuggestionsCount, kMaxSmartSuggestionsCount);
        m_count = kMaxSmartSuggestionsCount;
    }
}

void SmartRanker::addPath(uint32_t anchorIndex, const QString& path, uint32_t rank)
{
    if (rank >= m_count) {
        LOG_WARN(cdirRanking, "Skipping '%s': rank %u out of bounds (count=%u)",
                 qUtf8Printable(path), rank, m_count);
        return;
    }
    if (anchorIndex >= m_depth) {
        LOG_WARN(cdirRanking, "Skipping '%s': anchor %u out of bounds (depth=%u)",
                 qUtf8Printable(path), anchorIndex, m_depth);
        return;
    }

    const uint64_t weight = ((uint64_t(1) << (m_count - 1 - rank)) << 2)
                            + (m_depth - anchorIndex - 1);

    const auto it = m_index.constFind(path);
    if (it != m_index.constEnd()) {
        m_candidates[it.value()].score += weight;
        return;
    }
    m_index.insert(path, m_candidates.size());
    m_candidates.push_back({path, weight});
}

std::vector<QString> SmartRanker::collectRows() const
{
    std::vector<Candidate> sorted = m_candidates;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Candidate& a, const Candidate& b) { return a.score > b.score; });

    std::vector<QString> rows;
    const size_t keep = std::min<size_t>(sorted.size(), m_count);
    rows.reserve(keep);
    for (size_t i = 0; i < keep; ++i) {
        rows.push_back(sorted[i].path);
    }
    return rows;
}

uint64_t SmartRanker::scoreOf(const QString& path) const
{
    const auto it = m_index.constFind(path);
    return it != m_index.constEnd() ? m_candidates[it.value()].score : 0;
}

// ── SmartSuggester ──────────────────────────────────────────

SmartSuggester::SmartSuggester(SchemaStore& store, const QString& homeDirectory)
    : m_store(store)
    , m_homeDirectory(homeDirectory)
{
}

StoreResult<std::vector<int64_t>> SmartSuggester::fetchAnchors(const QString& matchPath,
                                                               uint32_t depth) const
{
    static constexpr const char* kSql = R"(
        SELECT id FROM paths_history
        WHERE path = ?1
        ORDER BY date DESC, id DESC
        LIMIT ?2
    )";

    sqlite3* db = m_store.rawDb();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(cdirRanking, "fetchAnchors prepare failed: %s", sqlite3_errmsg(db));
        return m_store.lastError(StoreErrorCode::PrepareFailed, QStringLiteral("fetch anchors"));
    }

    const QByteArray pathUtf8 = matchPath.toUtf8();
    sqlite3_bind_text(stmt, 1, pathUtf8.constData(), pathUtf8.size(), SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(depth));

    std::vector<int64_t> anchors;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        anchors.push_back(sqlite3_column_int64(stmt, 0));
    }

    if (rc != SQLITE_DONE) {
        LOG_ERROR(cdirRanking, "fetchAnchors step failed: %s", sqlite3_errmsg(db));
        StoreError error = m_store.lastError(StoreErrorCode::StepFailed, QStringLiteral("fetch anchors"));
        sqlite3_finalize(stmt);
        return error;
    }
    sqlite3_finalize(stmt);
    return anchors;
}

StoreResult<std::vector<PathEntry>> SmartSuggester::suggest(
    const QString& matchPath, uint32_t depth, uint32_t count,
    const std::vector<ShortcutEntry>& shortcuts) const
{
    std::vector<PathEntry> suggestions;
    if (matchPath.isEmpty() || depth == 0 || count == 0) {
        return suggestions;
    }
    if (depth > kMaxSmartSuggestionsDepth || count > kMaxSmartSuggestionsCount) {
        LOG_WARN(cdirRanking, "Smart suggestion window %ux%u clamped to %ux%u", depth, count,
                 std::min(depth, kMaxSmartSuggestionsDepth),
                 std::min(count, kMaxSmartSuggestionsCount));
        depth = std::min(depth, kMaxSmartSuggestionsDepth);
        count = std::min(count, kMaxSmartSuggestionsCount);
    }

    StoreResult<std::vector<int64_t>> anchors = fetchAnchors(matchPath, depth);
    if (anchors.isError()) {
        return anchors.error();
    }
    if (anchors->empty()) {
        LOG_DEBUG(cdirRanking, "No history for '%s', no suggestions", qUtf8Printable(matchPath));
        return suggestions;
    }

    static constexpr const char* kForwardSql = R"(
        SELECT id, path, date FROM paths_history
        WHERE id > ?1
        ORDER BY id ASC
    )";

    sqlite3* db = m_store.rawDb();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, kForwardSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(cdirRanking, "suggest prepare failed: %s", sqlite3_errmsg(db));
        return m_store.lastError(StoreErrorCode::PrepareFailed, QStringLiteral("scan history"));
    }

    SmartRanker ranker(depth, count);
    QHash<QString, PathEntry> firstSeen;

    for (uint32_t anchorIndex = 0; anchorIndex < anchors->size(); ++anchorIndex) {
        sqlite3_reset(stmt);
        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(anchors->at(anchorIndex)));

        QStringList collected;
        int rc = SQLITE_ROW;
        while (static_cast<uint32_t>(collected.size()) < count
               && (rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            const char* rawPath = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
            const QString path = rawPath ? QString::fromUtf8(rawPath) : QString();
            if (path == matchPath) {
                // The sequence looped back to the anchor
                break;
            }
            if (path.isEmpty() || path == m_homeDirectory || collected.contains(path)) {
                continue;
            }

            ranker.addPath(anchorIndex, path, static_cast<uint32_t>(collected.size()));
            collected.append(path);

            if (!firstSeen.contains(path)) {
                PathEntry entry;
                entry.id = sqlite3_column_int64(stmt, 0);
                entry.path = path;
                entry.timestamp = sqlite3_column_int64(stmt, 2);
                entry.isPredicted = true;
                firstSeen.insert(path, entry);
            }
        }

        if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
            LOG_ERROR(cdirRanking, "suggest step failed: %s", sqlite3_errmsg(db));
            StoreError error = m_store.lastError(StoreErrorCode::StepFailed,
                                                 QStringLiteral("scan history"));
            sqlite3_finalize(stmt);
            return error;
        }
    }
    sqlite3_finalize(stmt);

    for (const QString& path : ranker.collectRows()) {
        PathEntry entry = firstSeen.value(path);
        ShortcutResolver::assign(entry, shortcuts);
        suggestions.push_back(entry);
    }

    LOG_DEBUG(cdirRanking, "suggest('%s', depth=%u, count=%u): %d anchors, %d suggestions",
              qUtf8Printable(matchPath), depth, count,
              static_cast<int>(anchors->size()), static_cast<int>(suggestions.size()));
    return suggestions;
}

StoreResult<QString> SmartSuggester::latestHistoryPath() const
{
    static constexpr const char* kSql =
        "SELECT path FROM paths_history ORDER BY date DESC, id DESC LIMIT 1";

    sqlite3* db = m_store.rawDb();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(cdirRanking, "latestHistoryPath prepare failed: %s", sqlite3_errmsg(db));
        return m_store.lastError(StoreErrorCode::PrepareFailed, QStringLiteral("latest history path"));
    }

    QString path;
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        const char* rawPath = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        path = rawPath ? QString::fromUtf8(rawPath) : QString();
    } else if (rc != SQLITE_DONE) {
        StoreError error = m_store.lastError(StoreErrorCode::StepFailed,
                                             QStringLiteral("latest history path"));
        sqlite3_finalize(stmt);
        return error;
    }
    sqlite3_finalize(stmt);
    return path;
}

} // namespace cdir
