#include "core/index/shortcut_registry.h"
#include "core/index/schema_store.h"
#include "core/index/sql_util.h"
#include "core/ranking/fuzzy_matcher.h"
#include "core/shared/logging.h"

#include <sqlite3.h>

#include <algorithm>

namespace cdir {

namespace {

constexpr const char* kShortcutColumns = "id, name, path, description";

ShortcutEntry readShortcut(sqlite3_stmt* stmt)
{
    ShortcutEntry entry;
    entry.id = sqlite3_column_int64(stmt, 0);
    entry.name = columnString(stmt, 1);
    entry.path = columnString(stmt, 2);
    entry.description = columnOptionalString(stmt, 3);
    return entry;
}

QString fuzzyHaystack(const ShortcutEntry& entry)
{
    QString text = entry.name + QLatin1Char(' ') + entry.path;
    if (entry.description) {
        text += QLatin1Char(' ') + *entry.description;
    }
    return text;
}

} // namespace

ShortcutRegistry::ShortcutRegistry(SchemaStore& store)
    : m_store(store)
{
}

StoreStatus ShortcutRegistry::addShortcut(const QString& name, const QString& path,
                                          const std::optional<QString>& description)
{
    LOG_DEBUG(cdirStore, "addShortcut name=%s path=%s", qUtf8Printable(name), qUtf8Printable(path));

    if (!m_store.beginTransaction()) {
        return m_store.lastError(StoreErrorCode::TransactionFailed, QStringLiteral("add shortcut"));
    }

    sqlite3* db = m_store.rawDb();
    const QByteArray nameUtf8 = name.toUtf8();
    const QByteArray pathUtf8 = path.toUtf8();
    const QByteArray descriptionUtf8 = description ? description->toUtf8() : QByteArray();

    sqlite3_stmt* deleteStmt = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM shortcuts WHERE name = ?1", -1, &deleteStmt, nullptr)
        != SQLITE_OK) {
        LOG_ERROR(cdirStore, "addShortcut: delete prepare failed: %s", sqlite3_errmsg(db));
        StoreError error = m_store.lastError(StoreErrorCode::PrepareFailed, QStringLiteral("add shortcut"));
        m_store.rollbackTransaction();
        return error;
    }
    bindUtf8(deleteStmt, 1, nameUtf8);
    int rc = sqlite3_step(deleteStmt);
    sqlite3_finalize(deleteStmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(cdirStore, "Failed to delete shortcut '%s': %s",
                  qUtf8Printable(name), sqlite3_errmsg(db));
        StoreError error = m_store.lastError(StoreErrorCode::StepFailed, QStringLiteral("add shortcut"));
        m_store.rollbackTransaction();
        return error;
    }

    sqlite3_stmt* insertStmt = nullptr;
    if (sqlite3_prepare_v2(db,
            "INSERT INTO shortcuts (name, path, description) VALUES (?1, ?2, ?3)",
            -1, &insertStmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(cdirStore, "addShortcut: insert prepare failed: %s", sqlite3_errmsg(db));
        StoreError error = m_store.lastError(StoreErrorCode::PrepareFailed, QStringLiteral("add shortcut"));
        m_store.rollbackTransaction();
        return error;
    }
    bindUtf8(insertStmt, 1, nameUtf8);
    bindUtf8(insertStmt, 2, pathUtf8);
    if (description) {
        bindUtf8(insertStmt, 3, descriptionUtf8);
    } else {
        sqlite3_bind_null(insertStmt, 3);
    }
    rc = sqlite3_step(insertStmt);
    sqlite3_finalize(insertStmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(cdirStore, "Failed to insert shortcut name='%s' path='%s': %s",
                  qUtf8Printable(name), qUtf8Printable(path), sqlite3_errmsg(db));
        StoreError error = m_store.lastError(StoreErrorCode::StepFailed, QStringLiteral("add shortcut"));
        m_store.rollbackTransaction();
        return error;
    }

    if (!m_store.commitTransaction()) {
        StoreError error = m_store.lastError(StoreErrorCode::TransactionFailed, QStringLiteral("add shortcut"));
        m_store.rollbackTransaction();
        return error;
    }
    return true;
}

StoreStatus ShortcutRegistry::deleteShortcut(const QString& name)
{
    sqlite3* db = m_store.rawDb();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM shortcuts WHERE name = ?1", -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(cdirStore, "deleteShortcut prepare failed: %s", sqlite3_errmsg(db));
        return m_store.lastError(StoreErrorCode::PrepareFailed, QStringLiteral("delete shortcut"));
    }

    const QByteArray nameUtf8 = name.toUtf8();
    bindUtf8(stmt, 1, nameUtf8);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(cdirStore, "Failed to delete shortcut '%s': %s", qUtf8Printable(name), sqlite3_errmsg(db));
        return m_store.lastError(StoreErrorCode::StepFailed, QStringLiteral("delete shortcut"));
    }
    return true;
}

StoreStatus ShortcutRegistry::deleteShortcutById(int64_t id)
{
    sqlite3* db = m_store.rawDb();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM shortcuts WHERE id = ?1", -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(cdirStore, "deleteShortcutById prepare failed: %s", sqlite3_errmsg(db));
        return m_store.lastError(StoreErrorCode::PrepareFailed, QStringLiteral("delete shortcut by id"));
    }

    sqlite3_bind_int64(stmt, 1, id);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(cdirStore, "Failed to delete shortcut by id %lld: %s",
                  static_cast<long long>(id), sqlite3_errmsg(db));
        return m_store.lastError(StoreErrorCode::StepFailed, QStringLiteral("delete shortcut by id"));
    }
    return true;
}

StoreResult<std::optional<ShortcutEntry>> ShortcutRegistry::findShortcut(const QString& name) const
{
    LOG_DEBUG(cdirStore, "findShortcut %s", qUtf8Printable(name));

    const QString sql = QStringLiteral("SELECT %1 FROM shortcuts WHERE name = ?1 ORDER BY id DESC LIMIT 1")
                            .arg(QLatin1String(kShortcutColumns));
    const QByteArray sqlUtf8 = sql.toUtf8();

    sqlite3* db = m_store.rawDb();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sqlUtf8.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(cdirStore, "findShortcut prepare failed: %s", sqlite3_errmsg(db));
        return m_store.lastError(StoreErrorCode::PrepareFailed, QStringLiteral("find shortcut"));
    }

    const QByteArray nameUtf8 = name.toUtf8();
    bindUtf8(stmt, 1, nameUtf8);

    std::optional<ShortcutEntry> found;
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        found = readShortcut(stmt);
    } else if (rc != SQLITE_DONE) {
        StoreError error = m_store.lastError(StoreErrorCode::StepFailed, QStringLiteral("find shortcut"));
        sqlite3_finalize(stmt);
        LOG_ERROR(cdirStore, "findShortcut failed: %s", qUtf8Printable(error.message));
        return error;
    }
    sqlite3_finalize(stmt);
    return found;
}

StoreResult<std::vector<ShortcutEntry>> ShortcutRegistry::listShortcuts(
    std::size_t offset, std::size_t limit, const QString& filter, bool fuzzy) const
{
    LOG_DEBUG(cdirSearch, "listShortcuts offset=%zu limit=%zu filter=%s fuzzy=%d",
              offset, limit, qUtf8Printable(filter), fuzzy ? 1 : 0);
    if (fuzzy && !filter.trimmed().isEmpty()) {
        return listFuzzy(offset, limit, filter);
    }
    return listExact(offset, limit, filter);
}

StoreResult<std::vector<ShortcutEntry>> ShortcutRegistry::list(
    std::size_t offset, std::size_t limit, const QString& filter, bool fuzzy)
{
    return listShortcuts(offset, limit, filter, fuzzy);
}

StoreResult<std::vector<ShortcutEntry>> ShortcutRegistry::listAllShortcuts() const
{
    const QString sql = QStringLiteral("SELECT %1 FROM shortcuts ORDER BY name ASC, id DESC")
                            .arg(QLatin1String(kShortcutColumns));
    const QByteArray sqlUtf8 = sql.toUtf8();

    sqlite3* db = m_store.rawDb();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sqlUtf8.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(cdirStore, "listAllShortcuts prepare failed: %s", sqlite3_errmsg(db));
        return m_store.lastError(StoreErrorCode::PrepareFailed, QStringLiteral("list all shortcuts"));
    }

    std::vector<ShortcutEntry> shortcuts;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        shortcuts.push_back(readShortcut(stmt));
    }
    if (rc != SQLITE_DONE) {
        StoreError error = m_store.lastError(StoreErrorCode::StepFailed, QStringLiteral("list all shortcuts"));
        sqlite3_finalize(stmt);
        LOG_ERROR(cdirStore, "listAllShortcuts failed: %s", qUtf8Printable(error.message));
        return error;
    }
    sqlite3_finalize(stmt);
    return shortcuts;
}

StoreResult<std::vector<ShortcutEntry>> ShortcutRegistry::listExact(
    std::size_t offset, std::size_t limit, const QString& filter) const
{
    static constexpr const char* kSql = R"(
        SELECT id, name, path, description FROM shortcuts
        WHERE ?1 = ''
           OR instr(lower(name), lower(?1)) > 0
           OR instr(lower(path), lower(?1)) > 0
           OR instr(lower(coalesce(description, '')), lower(?1)) > 0
        ORDER BY name ASC, id DESC
        LIMIT ?2 OFFSET ?3
    )";

    sqlite3* db = m_store.rawDb();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(cdirSearch, "listShortcuts prepare failed: %s", sqlite3_errmsg(db));
        return m_store.lastError(StoreErrorCode::PrepareFailed, QStringLiteral("list shortcuts"));
    }

    const QByteArray filterUtf8 = filter.toUtf8();
    bindUtf8(stmt, 1, filterUtf8);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(limit));
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(offset));

    std::vector<ShortcutEntry> shortcuts;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        shortcuts.push_back(readShortcut(stmt));
    }
    if (rc != SQLITE_DONE) {
        StoreError error = m_store.lastError(StoreErrorCode::StepFailed, QStringLiteral("list shortcuts"));
        sqlite3_finalize(stmt);
        LOG_ERROR(cdirSearch, "listShortcuts failed: %s", qUtf8Printable(error.message));
        return error;
    }
    sqlite3_finalize(stmt);
    return shortcuts;
}

StoreResult<std::vector<ShortcutEntry>> ShortcutRegistry::listFuzzy(
    std::size_t offset, std::size_t limit, const QString& filter) const
{
    StoreResult<std::vector<ShortcutEntry>> all = listAllShortcuts();
    if (all.isError()) {
        return all.error();
    }

    const FuzzyMatcher matcher(filter);
    std::vector<std::pair<int, ShortcutEntry>> scored;
    for (ShortcutEntry& entry : all.value()) {
        const std::optional<int> score = matcher.score(fuzzyHaystack(entry));
        if (score) {
            scored.emplace_back(*score, std::move(entry));
        }
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<ShortcutEntry> page;
    for (std::size_t i = offset; i < scored.size() && page.size() < limit; ++i) {
        page.push_back(std::move(scored[i].second));
    }
    return page;
}

} // namespace cdir
