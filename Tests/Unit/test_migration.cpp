#include <QtTest/QtTest>

#include "core/index/migration.h"
#include "core/index/schema.h"

#include <sqlite3.h>

namespace {

// Layout written by the first releases: no version table, no description.
constexpr const char* kVersionZeroSchema = R"(
CREATE TABLE paths (id INTEGER PRIMARY KEY AUTOINCREMENT, path TEXT NOT NULL, date INTEGER NOT NULL);
CREATE TABLE shortcuts (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL, path TEXT NOT NULL);
INSERT INTO paths (path, date) VALUES ('/old/a', 10);
INSERT INTO paths (path, date) VALUES ('/old/b', 20);
INSERT INTO shortcuts (name, path) VALUES ('old', '/old');
)";

int countRows(sqlite3* db, const char* sql)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return -1;
    }
    int count = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

} // namespace

class TestMigration : public QObject {
    Q_OBJECT

private slots:
    void testCurrentVersionMissingTableDefaultsToZero();
    void testApplyMigrationsFromVersionZero();
    void testHistorySeededFromCurrentSet();
    void testNoOpWhenAlreadyCurrent();
    void testRejectsDowngrade();
    void testRejectsUnsupportedTargetVersion();
    void testFailedScriptKeepsLastCommittedVersion();
};

void TestMigration::testCurrentVersionMissingTableDefaultsToZero()
{
    sqlite3* db = nullptr;
    QCOMPARE(sqlite3_open(":memory:", &db), SQLITE_OK);
    QVERIFY(db != nullptr);

    QCOMPARE(cdir::currentSchemaVersion(db), 0);

    // Table present but empty
    QCOMPARE(sqlite3_exec(db, "CREATE TABLE version (version INTEGER PRIMARY KEY);",
                          nullptr, nullptr, nullptr),
             SQLITE_OK);
    QCOMPARE(cdir::currentSchemaVersion(db), 0);

    sqlite3_close(db);
}

void TestMigration::testApplyMigrationsFromVersionZero()
{
    sqlite3* db = nullptr;
    QCOMPARE(sqlite3_open(":memory:", &db), SQLITE_OK);
    QCOMPARE(sqlite3_exec(db, kVersionZeroSchema, nullptr, nullptr, nullptr), SQLITE_OK);

    QVERIFY(cdir::applyMigrations(db, cdir::kCurrentSchemaVersion));
    QCOMPARE(cdir::currentSchemaVersion(db), cdir::kCurrentSchemaVersion);
    QCOMPARE(countRows(db, "SELECT COUNT(*) FROM version"), 1);

    // description column added by 1 -> 2
    QCOMPARE(sqlite3_exec(db,
                          "INSERT INTO shortcuts (name, path, description) VALUES ('n', '/n', 'd');",
                          nullptr, nullptr, nullptr),
             SQLITE_OK);
    QCOMPARE(countRows(db, "SELECT COUNT(*) FROM shortcuts WHERE description IS NULL"), 1);

    sqlite3_close(db);
}

void TestMigration::testHistorySeededFromCurrentSet()
{
    sqlite3* db = nullptr;
    QCOMPARE(sqlite3_open(":memory:", &db), SQLITE_OK);
    QCOMPARE(sqlite3_exec(db, kVersionZeroSchema, nullptr, nullptr, nullptr), SQLITE_OK);

    QVERIFY(cdir::applyMigrations(db, cdir::kCurrentSchemaVersion));
    QCOMPARE(countRows(db, "SELECT COUNT(*) FROM paths_history"), 2);
    QCOMPARE(countRows(db,
                       "SELECT COUNT(*) FROM paths p JOIN paths_history h "
                       "ON h.path = p.path AND h.date = p.date"),
             2);

    sqlite3_close(db);
}

void TestMigration::testNoOpWhenAlreadyCurrent()
{
    sqlite3* db = nullptr;
    QCOMPARE(sqlite3_open(":memory:", &db), SQLITE_OK);
    QCOMPARE(sqlite3_exec(db, cdir::kBootstrapSchema, nullptr, nullptr, nullptr), SQLITE_OK);
    QVERIFY(cdir::stampSchemaVersion(db, cdir::kCurrentSchemaVersion));

    QVERIFY(cdir::applyMigrations(db, cdir::kCurrentSchemaVersion));
    QCOMPARE(cdir::currentSchemaVersion(db), cdir::kCurrentSchemaVersion);

    sqlite3_close(db);
}

void TestMigration::testRejectsDowngrade()
{
    sqlite3* db = nullptr;
    QCOMPARE(sqlite3_open(":memory:", &db), SQLITE_OK);
    QCOMPARE(sqlite3_exec(db, cdir::kBootstrapSchema, nullptr, nullptr, nullptr), SQLITE_OK);
    QVERIFY(cdir::stampSchemaVersion(db, 5));

    QVERIFY(!cdir::applyMigrations(db, cdir::kCurrentSchemaVersion));
    QCOMPARE(cdir::currentSchemaVersion(db), 5);

    sqlite3_close(db);
}

void TestMigration::testRejectsUnsupportedTargetVersion()
{
    sqlite3* db = nullptr;
    QCOMPARE(sqlite3_open(":memory:", &db), SQLITE_OK);
    QCOMPARE(sqlite3_exec(db, kVersionZeroSchema, nullptr, nullptr, nullptr), SQLITE_OK);

    QVERIFY(!cdir::applyMigrations(db, cdir::kCurrentSchemaVersion + 1));
    QCOMPARE(cdir::currentSchemaVersion(db), cdir::kCurrentSchemaVersion);

    sqlite3_close(db);
}

void TestMigration::testFailedScriptKeepsLastCommittedVersion()
{
    const char* const scripts[] = {
        "CREATE TABLE version (version INTEGER PRIMARY KEY);",
        "CREATE TABLE step_two (id INTEGER);",
        "THIS IS NOT SQL;",
    };

    sqlite3* db = nullptr;
    QCOMPARE(sqlite3_open(":memory:", &db), SQLITE_OK);

    QVERIFY(!cdir::applyMigrations(db, 3, scripts, 3));
    QCOMPARE(cdir::currentSchemaVersion(db), 2);
    QCOMPARE(countRows(db, "SELECT COUNT(*) FROM sqlite_master WHERE name = 'step_two'"), 1);

    sqlite3_close(db);
}

QTEST_MAIN(TestMigration)
#include "test_migration.moc"
