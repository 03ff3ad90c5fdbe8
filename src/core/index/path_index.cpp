#include "core/index/path_index.h"
#include "core/index/schema_store.h"
#include "core/index/shortcut_registry.h"
#include "core/index/sql_util.h"
#include "core/ranking/fuzzy_matcher.h"
#include "core/ranking/shortcut_resolver.h"
#include "core/ranking/smart_suggester.h"
#include "core/shared/logging.h"

#include <QDateTime>

#include <sqlite3.h>

#include <algorithm>

namespace cdir {

namespace {

constexpr const char* kPathsTable = "paths";
constexpr const char* kHistoryTable = "paths_history";

PathEntry readPath(sqlite3_stmt* stmt)
{
    PathEntry entry;
    entry.id = sqlite3_column_int64(stmt, 0);
    entry.path = columnString(stmt, 1);
    entry.timestamp = sqlite3_column_int64(stmt, 2);
    return entry;
}

QString shortcutHaystack(const QString& path, const ShortcutEntry& shortcut)
{
    QString text = path + QLatin1Char(' ') + shortcut.name;
    if (shortcut.description) {
        text += QLatin1Char(' ') + *shortcut.description;
    }
    return text;
}

} // namespace

PathIndex::PathIndex(SchemaStore& store, ShortcutRegistry& shortcuts, const Settings& settings)
    : m_store(store)
    , m_shortcuts(shortcuts)
    , m_settings(settings)
{
}

// ── Writes ──────────────────────────────────────────────────

StoreStatus PathIndex::execPathWrite(const char* sql, const QByteArray& pathUtf8,
                                     int64_t timestamp, const char* what)
{
    sqlite3* db = m_store.rawDb();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(cdirStore, "%s: prepare failed: %s", what, sqlite3_errmsg(db));
        return m_store.lastError(StoreErrorCode::PrepareFailed, QString::fromLatin1(what));
    }

    bindUtf8(stmt, 1, pathUtf8);
    if (sqlite3_bind_parameter_count(stmt) >= 2) {
        sqlite3_bind_int64(stmt, 2, timestamp);
    }

    const int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(cdirStore, "%s failed for '%s': %s", what, pathUtf8.constData(), sqlite3_errmsg(db));
        StoreError error = m_store.lastError(StoreErrorCode::StepFailed, QString::fromLatin1(what));
        sqlite3_finalize(stmt);
        return error;
    }
    sqlite3_finalize(stmt);
    return true;
}

StoreStatus PathIndex::addPath(const QString& path, int64_t timestamp)
{
    LOG_DEBUG(cdirStore, "addPath path=%s epoch=%lld", qUtf8Printable(path),
              static_cast<long long>(timestamp));

    if (!m_store.beginTransaction()) {
        return m_store.lastError(StoreErrorCode::TransactionFailed, QStringLiteral("add path"));
    }

    const QByteArray pathUtf8 = path.toUtf8();
    StoreStatus status = execPathWrite("DELETE FROM paths WHERE path = ?1",
                                       pathUtf8, timestamp, "delete path");
    if (status) {
        status = execPathWrite("INSERT INTO paths (path, date) VALUES (?1, ?2)",
                               pathUtf8, timestamp, "insert path");
    }
    if (status) {
        status = execPathWrite("INSERT INTO paths_history (path, date) VALUES (?1, ?2)",
                               pathUtf8, timestamp, "insert path history");
    }
    if (!status) {
        m_store.rollbackTransaction();
        return status;
    }

    if (!m_store.commitTransaction()) {
        StoreError error = m_store.lastError(StoreErrorCode::TransactionFailed, QStringLiteral("add path"));
        m_store.rollbackTransaction();
        return error;
    }
    return true;
}

StoreStatus PathIndex::addPath(const QString& path)
{
    return addPath(path, QDateTime::currentSecsSinceEpoch());
}

StoreStatus PathIndex::deletePath(int64_t id)
{
    sqlite3* db = m_store.rawDb();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM paths WHERE id = ?1", -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(cdirStore, "deletePath prepare failed: %s", sqlite3_errmsg(db));
        return m_store.lastError(StoreErrorCode::PrepareFailed, QStringLiteral("delete path"));
    }

    sqlite3_bind_int64(stmt, 1, id);
    const int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(cdirStore, "Failed to delete path by id %lld: %s",
                  static_cast<long long>(id), sqlite3_errmsg(db));
        StoreError error = m_store.lastError(StoreErrorCode::StepFailed, QStringLiteral("delete path"));
        sqlite3_finalize(stmt);
        return error;
    }
    sqlite3_finalize(stmt);
    return true;
}

// ── Listings ────────────────────────────────────────────────

StoreResult<std::vector<PathEntry>> PathIndex::list(std::size_t offset, std::size_t limit,
                                                    const QString& filter, bool fuzzy)
{
    return listPaths(offset, limit, filter, fuzzy);
}

StoreResult<std::vector<PathEntry>> PathIndex::listPaths(std::size_t offset, std::size_t limit,
                                                         const QString& filter, bool fuzzy) const
{
    LOG_DEBUG(cdirSearch, "listPaths offset=%zu limit=%zu filter=%s fuzzy=%d",
              offset, limit, qUtf8Printable(filter), fuzzy ? 1 : 0);

    StoreResult<std::vector<ShortcutEntry>> shortcuts = m_shortcuts.listAllShortcuts();
    if (shortcuts.isError()) {
        return shortcuts.error();
    }

    if (fuzzy && !filter.trimmed().isEmpty()) {
        return listFuzzy(offset, limit, filter, shortcuts.value());
    }
    return listExact(offset, limit, filter, shortcuts.value());
}

StoreResult<std::vector<PathEntry>> PathIndex::listPathHistory(std::size_t offset,
                                                               std::size_t limit,
                                                               const QString& filter) const
{
    LOG_DEBUG(cdirSearch, "listPathHistory offset=%zu limit=%zu filter=%s",
              offset, limit, qUtf8Printable(filter));
    if (limit == 0) {
        return std::vector<PathEntry>();
    }

    StoreResult<std::vector<ShortcutEntry>> shortcuts = m_shortcuts.listAllShortcuts();
    if (shortcuts.isError()) {
        return shortcuts.error();
    }

    StoreResult<std::vector<PathEntry>> rows = queryRows(kHistoryTable, offset, limit, filter);
    if (rows.isError()) {
        return rows;
    }
    ShortcutResolver::assignAll(rows.value(), shortcuts.value());
    return rows;
}

StoreResult<std::vector<PathEntry>> PathIndex::listAllPaths() const
{
    static constexpr const char* kSql =
        "SELECT id, path, date FROM paths ORDER BY date ASC, id ASC";

    sqlite3* db = m_store.rawDb();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(cdirStore, "listAllPaths prepare failed: %s", sqlite3_errmsg(db));
        return m_store.lastError(StoreErrorCode::PrepareFailed, QStringLiteral("list all paths"));
    }

    std::vector<PathEntry> rows;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        rows.push_back(readPath(stmt));
    }
    if (rc != SQLITE_DONE) {
        StoreError error = m_store.lastError(StoreErrorCode::StepFailed, QStringLiteral("list all paths"));
        sqlite3_finalize(stmt);
        LOG_ERROR(cdirStore, "listAllPaths failed: %s", qUtf8Printable(error.message));
        return error;
    }
    sqlite3_finalize(stmt);
    return rows;
}

StoreResult<std::vector<PathEntry>> PathIndex::predictedEntries(
    const std::vector<ShortcutEntry>& shortcuts) const
{
    SmartSuggester suggester(m_store, m_settings.homeDirectory);

    QString anchor = m_settings.currentDirectory;
    if (anchor.isEmpty()) {
        StoreResult<QString> latest = suggester.latestHistoryPath();
        if (latest.isError()) {
            return latest.error();
        }
        anchor = latest.value();
    }

    StoreResult<std::vector<PathEntry>> predicted = suggester.suggest(
        anchor, m_settings.smartSuggestionsDepth, m_settings.smartSuggestionsCount, shortcuts);
    if (predicted.isError()) {
        return predicted;
    }
    // Best guess goes last, right above the most recent real entry
    std::reverse(predicted->begin(), predicted->end());
    return predicted;
}

StoreResult<std::vector<PathEntry>> PathIndex::listExact(
    std::size_t offset, std::size_t limit, const QString& filter,
    const std::vector<ShortcutEntry>& shortcuts) const
{
    std::vector<PathEntry> page;
    std::size_t realOffset = offset;
    std::size_t realLimit = limit;

    if (filter.isEmpty() && m_settings.smartSuggestionsActive) {
        StoreResult<std::vector<PathEntry>> predicted = predictedEntries(shortcuts);
        if (predicted.isError()) {
            return predicted;
        }

        // Predicted rows occupy the first positions of the listing
        const std::size_t predictedCount = predicted->size();
        for (std::size_t i = offset; i < predictedCount && page.size() < limit; ++i) {
            page.push_back(predicted->at(i));
        }
        realOffset = offset > predictedCount ? offset - predictedCount : 0;
        realLimit = limit - page.size();
    }

    if (realLimit == 0) {
        return page;
    }

    StoreResult<std::vector<PathEntry>> rows = queryRows(kPathsTable, realOffset, realLimit, filter);
    if (rows.isError()) {
        return rows;
    }
    ShortcutResolver::assignAll(rows.value(), shortcuts);
    page.insert(page.end(), rows->begin(), rows->end());
    return page;
}

StoreResult<std::vector<PathEntry>> PathIndex::listFuzzy(
    std::size_t offset, std::size_t limit, const QString& filter,
    const std::vector<ShortcutEntry>& shortcuts) const
{
    StoreResult<std::vector<PathEntry>> rows = queryRows(kPathsTable, 0, 0, QString());
    if (rows.isError()) {
        return rows;
    }

    const FuzzyMatcher matcher(filter);
    const bool includeShortcuts = m_settings.pathSearchIncludeShortcuts;

    std::vector<std::pair<int, PathEntry>> scored;
    for (PathEntry& entry : rows.value()) {
        std::optional<int> best = matcher.score(entry.path);
        if (includeShortcuts) {
            for (const ShortcutEntry& shortcut : shortcuts) {
                if (!ShortcutResolver::isAncestor(shortcut.path, entry.path)) {
                    continue;
                }
                const std::optional<int> score = matcher.score(shortcutHaystack(entry.path, shortcut));
                if (score && (!best || *score > *best)) {
                    best = score;
                }
            }
        }
        if (best) {
            scored.emplace_back(*best, std::move(entry));
        }
    }

    // Rows come newest first, so equal scores keep recency order
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<PathEntry> page;
    for (std::size_t i = offset; i < scored.size() && page.size() < limit; ++i) {
        PathEntry entry = std::move(scored[i].second);
        ShortcutResolver::assign(entry, shortcuts);
        page.push_back(std::move(entry));
    }

    LOG_DEBUG(cdirSearch, "fuzzy '%s': %d of %d paths matched",
              qUtf8Printable(filter), static_cast<int>(scored.size()),
              static_cast<int>(rows->size()));
    return page;
}

// `limit` 0 means no limit.
StoreResult<std::vector<PathEntry>> PathIndex::queryRows(const char* table, std::size_t offset,
                                                         std::size_t limit,
                                                         const QString& filter) const
{
    static constexpr const char* kSqlTemplate = R"(
        SELECT p.id, p.path, p.date FROM %1 p
        WHERE ?1 = ''
           OR instr(lower(p.path), lower(?1)) > 0
           OR (?4 AND EXISTS (
                SELECT 1 FROM shortcuts s
                WHERE (instr(lower(s.name), lower(?1)) > 0
                       OR instr(lower(coalesce(s.description, '')), lower(?1)) > 0)
                  AND (p.path = s.path
                       OR substr(p.path, 1, length(s.path) + 1) = s.path || '/')))
        ORDER BY p.date DESC, p.id DESC
        LIMIT ?2 OFFSET ?3
    )";

    const QByteArray sql = QString::fromLatin1(kSqlTemplate).arg(QLatin1String(table)).toUtf8();

    sqlite3* db = m_store.rawDb();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(cdirSearch, "%s listing prepare failed: %s", table, sqlite3_errmsg(db));
        return m_store.lastError(StoreErrorCode::PrepareFailed,
                                 QStringLiteral("list %1").arg(QLatin1String(table)));
    }

    const QByteArray filterUtf8 = filter.toUtf8();
    bindUtf8(stmt, 1, filterUtf8);
    sqlite3_bind_int64(stmt, 2, limit == 0 ? -1 : static_cast<sqlite3_int64>(limit));
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(offset));
    sqlite3_bind_int(stmt, 4, m_settings.pathSearchIncludeShortcuts ? 1 : 0);

    std::vector<PathEntry> rows;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        rows.push_back(readPath(stmt));
    }
    if (rc != SQLITE_DONE) {
        StoreError error = m_store.lastError(StoreErrorCode::StepFailed,
                                             QStringLiteral("list %1").arg(QLatin1String(table)));
        sqlite3_finalize(stmt);
        LOG_ERROR(cdirSearch, "%s listing failed: %s", table, qUtf8Printable(error.message));
        return error;
    }
    sqlite3_finalize(stmt);
    return rows;
}

} // namespace cdir
