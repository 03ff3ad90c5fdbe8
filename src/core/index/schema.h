#pragma once

#include <cstddef>

namespace cdir {

// Compiled-in schema level. A database stamped lower than this is upgraded
// on open; one stamped higher is refused.
constexpr int kCurrentSchemaVersion = 3;

// Per-connection pragmas, safe on every open.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 5000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
)";

// Fresh database, already at kCurrentSchemaVersion. The version row is
// stamped by the caller.
constexpr const char* kBootstrapSchema = R"(
CREATE TABLE IF NOT EXISTS version (
    version INTEGER PRIMARY KEY
);

CREATE TABLE IF NOT EXISTS paths (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    path TEXT NOT NULL,
    date INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS paths_date ON paths (date);

CREATE TABLE IF NOT EXISTS shortcuts (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    name TEXT NOT NULL,
    path TEXT NOT NULL,
    description TEXT
);
CREATE INDEX IF NOT EXISTS shortcuts_name ON shortcuts (name);

CREATE TABLE IF NOT EXISTS paths_history (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    path TEXT NOT NULL,
    date INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS paths_history_path_date_id ON paths_history (path, date DESC, id DESC);
)";

// kUpgradeScripts[v] takes the schema from version v to v + 1.
//
// Version 0 is the first released layout: `paths` and `shortcuts(name, path)`
// without any version table.
constexpr const char* kUpgradeScripts[] = {
    // 0 -> 1
    R"(
CREATE TABLE IF NOT EXISTS version (
    version INTEGER PRIMARY KEY
);
)",
    // 1 -> 2
    R"(
ALTER TABLE shortcuts ADD COLUMN description TEXT;
)",
    // 2 -> 3: the history log starts as a copy of the current set
    R"(
CREATE TABLE IF NOT EXISTS paths_history (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    path TEXT NOT NULL,
    date INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS paths_history_path_date_id ON paths_history (path, date DESC, id DESC);
INSERT INTO paths_history (path, date) SELECT path, date FROM paths ORDER BY date ASC, id ASC;
)",
};

constexpr std::size_t kUpgradeScriptCount = sizeof(kUpgradeScripts) / sizeof(kUpgradeScripts[0]);

static_assert(kUpgradeScriptCount == static_cast<std::size_t>(kCurrentSchemaVersion),
              "one upgrade script per schema version");

} // namespace cdir
