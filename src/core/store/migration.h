#pragma once

struct sqlite3;

namespace tp {

// Bring the database up to targetVersion. Each step runs in its own
// transaction and bumps PRAGMA user_version.
bool applyMigrations(sqlite3* db, int targetVersion);

// PRAGMA user_version; 0 for a fresh file.
int currentSchemaVersion(sqlite3* db);

} // namespace tp
