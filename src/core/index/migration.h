#pragma once

#include <cstddef>

struct sqlite3;

namespace cdir {

// Read the applied schema level from the `version` table.
// Returns 0 if the table or its row does not exist (oldest layout).
int currentSchemaVersion(sqlite3* db);

// Overwrite the single `version` row with `version`.
bool stampSchemaVersion(sqlite3* db, int version);

// Bring the schema from its stored level up to `targetVersion` by running
// scripts[v] for every v in [stored, targetVersion), in order, each step in
// its own transaction and stamped on commit. Fails (and leaves the last
// committed level in place) on a downgrade, a missing script or a SQL error.
bool applyMigrations(sqlite3* db, int targetVersion,
                     const char* const* scripts, std::size_t scriptCount);

// Same, with the compiled-in upgrade scripts.
bool applyMigrations(sqlite3* db, int targetVersion);

} // namespace cdir
