#include "core/index/schema_store.h"
#include "core/index/schema.h"
#include "core/index/migration.h"
#include "core/shared/logging.h"
#include <sqlite3.h>
#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace cdir {

namespace {

const QString kInMemoryPath = QStringLiteral(":memory:");

} // namespace

SchemaStore::~SchemaStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

StoreResult<SchemaStore> SchemaStore::open(const QString& dbPath)
{
    SchemaStore store;
    StoreResult<bool> status = store.init(dbPath);
    if (status.isError()) {
        return status.error();
    }
    return StoreResult<SchemaStore>(std::move(store));
}

StoreResult<SchemaStore> SchemaStore::openInMemory()
{
    return open(kInMemoryPath);
}

StoreResult<bool> SchemaStore::init(const QString& dbPath)
{
    LOG_INFO(cdirStore, "db file=%s", qUtf8Printable(dbPath));

    const bool inMemory = (dbPath == kInMemoryPath);
    if (!inMemory) {
        const QString parentDir = QFileInfo(dbPath).absolutePath();
        if (!QDir().mkpath(parentDir)) {
            LOG_ERROR(cdirStore, "Failed to create directory '%s'", qUtf8Printable(parentDir));
            return StoreError{StoreErrorCode::OpenFailed, SQLITE_CANTOPEN,
                              QStringLiteral("cannot create directory ") + parentDir};
        }
    }

    int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        const StoreError error = lastError(StoreErrorCode::OpenFailed,
                                           QStringLiteral("open ") + dbPath);
        LOG_ERROR(cdirStore, "Failed to open database '%s': %s",
                  qUtf8Printable(dbPath), sqlite3_errmsg(m_db));
        sqlite3_close(m_db);
        m_db = nullptr;
        return error;
    }

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(cdirStore, "Failed to set connection pragmas");
        return lastError(StoreErrorCode::OpenFailed, QStringLiteral("connection pragmas"));
    }

    if (!hasSchema()) {
        LOG_INFO(cdirStore, "Initializing the database schema at version %d", kCurrentSchemaVersion);
        if (!beginTransaction()) {
            return lastError(StoreErrorCode::MigrationFailed, QStringLiteral("bootstrap begin"));
        }
        if (!execSql(kBootstrapSchema) || !stampSchemaVersion(m_db, kCurrentSchemaVersion)) {
            const StoreError error = lastError(StoreErrorCode::MigrationFailed,
                                               QStringLiteral("bootstrap schema"));
            rollbackTransaction();
            LOG_ERROR(cdirStore, "Failed to create schema");
            return error;
        }
        if (!commitTransaction()) {
            return lastError(StoreErrorCode::MigrationFailed, QStringLiteral("bootstrap commit"));
        }
    } else if (!applyMigrations(m_db, kCurrentSchemaVersion)) {
        LOG_ERROR(cdirStore, "Migration failed");
        return lastError(StoreErrorCode::MigrationFailed,
                         QStringLiteral("upgrade to schema version %1").arg(kCurrentSchemaVersion));
    }

    if (!inMemory) {
        // Shell history is private: owner-only permissions (0600)
        QFile dbFile(dbPath);
        if (!dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner)) {
            LOG_WARN(cdirStore, "Failed to restrict permissions on %s", qUtf8Printable(dbPath));
        }
    }

    LOG_INFO(cdirStore, "Database opened successfully: %s (schema version %d)",
             qUtf8Printable(dbPath), schemaVersion());
    return true;
}

bool SchemaStore::hasSchema() const
{
    bool exists = false;
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(m_db,
        "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='paths'",
        -1, &stmt, nullptr);
    if (rc == SQLITE_OK && sqlite3_step(stmt) == SQLITE_ROW) {
        exists = (sqlite3_column_int(stmt, 0) > 0);
    }
    sqlite3_finalize(stmt);
    return exists;
}

int SchemaStore::schemaVersion() const
{
    return m_db ? currentSchemaVersion(m_db) : 0;
}

bool SchemaStore::execSql(const char* sql)
{
    if (!m_db) {
        return false;
    }
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(cdirStore, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

StoreError SchemaStore::lastError(StoreErrorCode code, const QString& context) const
{
    StoreError error;
    error.code = code;
    if (!m_db) {
        error.code = StoreErrorCode::NotOpen;
        error.message = context + QStringLiteral(": database is not open");
        return error;
    }
    error.sqliteCode = sqlite3_extended_errcode(m_db);
    error.message = context + QStringLiteral(": ") + QString::fromUtf8(sqlite3_errmsg(m_db));
    return error;
}

// ── Transactions ────────────────────────────────────────────

bool SchemaStore::beginTransaction()
{
    return execSql("BEGIN TRANSACTION");
}

bool SchemaStore::commitTransaction()
{
    return execSql("COMMIT");
}

bool SchemaStore::rollbackTransaction()
{
    return execSql("ROLLBACK");
}

} // namespace cdir
