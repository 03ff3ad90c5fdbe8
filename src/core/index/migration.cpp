#include "core/index/migration.h"
#include "core/index/schema.h"
#include "core/shared/logging.h"
#include <sqlite3.h>

namespace cdir {

namespace {

bool execScript(sqlite3* db, const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(cdirStore, "Migration SQL failed: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

} // namespace

int currentSchemaVersion(sqlite3* db)
{
    const char* sql = "SELECT MAX(version) FROM version";
    sqlite3_stmt* stmt = nullptr;
    int version = 0;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW
            && sqlite3_column_type(stmt, 0) != SQLITE_NULL) {
            version = sqlite3_column_int(stmt, 0);
        }
    } else {
        LOG_INFO(cdirStore, "No readable version table, assuming schema version 0");
    }
    sqlite3_finalize(stmt);
    return version;
}

bool stampSchemaVersion(sqlite3* db, int version)
{
    if (!execScript(db, "DELETE FROM version")) {
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "INSERT INTO version (version) VALUES (?1)", -1, &stmt, nullptr)
        != SQLITE_OK) {
        LOG_ERROR(cdirStore, "Failed to prepare version stamp: %s", sqlite3_errmsg(db));
        return false;
    }
    sqlite3_bind_int(stmt, 1, version);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(cdirStore, "Failed to stamp schema version %d: %s", version, sqlite3_errmsg(db));
        return false;
    }
    return true;
}

bool applyMigrations(sqlite3* db, int targetVersion,
                     const char* const* scripts, std::size_t scriptCount)
{
    int current = currentSchemaVersion(db);

    if (current > targetVersion) {
        LOG_ERROR(cdirStore, "Schema version %d is newer than app version %d, downgrade not supported",
                  current, targetVersion);
        return false;
    }

    if (current == targetVersion) {
        return true;
    }

    while (current < targetVersion) {
        if (static_cast<std::size_t>(current) >= scriptCount || !scripts[current]) {
            LOG_ERROR(cdirStore, "No upgrade script for schema version %d", current);
            return false;
        }

        LOG_INFO(cdirStore, "Applying schema migration %d -> %d", current, current + 1);

        if (!execScript(db, "BEGIN IMMEDIATE")) {
            return false;
        }
        if (!execScript(db, scripts[current]) || !stampSchemaVersion(db, current + 1)) {
            execScript(db, "ROLLBACK");
            return false;
        }
        if (!execScript(db, "COMMIT")) {
            execScript(db, "ROLLBACK");
            return false;
        }

        ++current;
    }

    LOG_INFO(cdirStore, "Schema migrations complete: version %d", current);
    return true;
}

bool applyMigrations(sqlite3* db, int targetVersion)
{
    return applyMigrations(db, targetVersion, kUpgradeScripts, kUpgradeScriptCount);
}

} // namespace cdir
