#pragma once

#include "core/shared/store_result.h"

#include <QString>

#include <sqlite3.h>

namespace cdir {

// Single owner of the SQLite connection.
// Opens (or creates) the database and brings its schema to
// kCurrentSchemaVersion before anything else may use it. PathIndex,
// ShortcutRegistry and SmartSuggester borrow the connection by reference.
class SchemaStore {
public:
    ~SchemaStore();

    // Move-only (owns sqlite3* handle)
    SchemaStore(SchemaStore&& other) noexcept : m_db(other.m_db) { other.m_db = nullptr; }
    SchemaStore& operator=(SchemaStore&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            other.m_db = nullptr;
        }
        return *this;
    }
    SchemaStore(const SchemaStore&) = delete;
    SchemaStore& operator=(const SchemaStore&) = delete;

    // Open or create the database at `dbPath` (":memory:" for a private
    // in-memory database). A fresh database gets the bootstrap schema;
    // an existing one is migrated. Migration failure is returned as
    // StoreErrorCode::MigrationFailed and must be treated as fatal.
    static StoreResult<SchemaStore> open(const QString& dbPath);

    static StoreResult<SchemaStore> openInMemory();

    bool isOpen() const { return m_db != nullptr; }

    // Applied schema level, as stamped in the version table.
    int schemaVersion() const;

    // ── Transactions ────────────────────────────────────────

    bool beginTransaction();
    bool commitTransaction();
    bool rollbackTransaction();

    bool execSql(const char* sql);

    // Builds a StoreError from the connection's last SQLite error.
    StoreError lastError(StoreErrorCode code, const QString& context) const;

    // Raw handle, borrowed by the index/registry/suggester.
    sqlite3* rawDb() const { return m_db; }

private:
    SchemaStore() = default;
    StoreResult<bool> init(const QString& dbPath);
    bool hasSchema() const;

    sqlite3* m_db = nullptr;
};

} // namespace cdir
