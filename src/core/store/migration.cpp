#include "core/store/migration.h"
#include "core/store/schema.h"
#include "core/shared/logging.h"

#include <sqlite3.h>

#include <string>

namespace tp {

int currentSchemaVersion(sqlite3* db)
{
    sqlite3_stmt* stmt = nullptr;
    int version = 0;
    if (sqlite3_prepare_v2(db, "PRAGMA user_version", -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            version = sqlite3_column_int(stmt, 0);
        }
    }
    sqlite3_finalize(stmt);
    return version;
}

bool applyMigrations(sqlite3* db, int targetVersion)
{
    int current = currentSchemaVersion(db);

    if (current > targetVersion) {
        LOG_ERROR(tpStore, "Schema version %d is newer than supported version %d",
                  current, targetVersion);
        return false;
    }

    if (current == targetVersion) {
        return true;
    }

    auto exec = [db](const char* sql) -> bool {
        char* errMsg = nullptr;
        const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            LOG_ERROR(tpStore, "Migration SQL failed: %s", errMsg ? errMsg : "unknown");
            sqlite3_free(errMsg);
            return false;
        }
        return true;
    };

    auto step = [&](int version, const char* sql) -> bool {
        LOG_INFO(tpStore, "Applying schema migration %d -> %d", version - 1, version);
        if (!exec("BEGIN IMMEDIATE")) {
            return false;
        }
        const std::string bump = "PRAGMA user_version = " + std::to_string(version) + ";";
        if (!exec(sql) || !exec(bump.c_str())) {
            exec("ROLLBACK");
            return false;
        }
        return exec("COMMIT");
    };

    if (current < 1 && targetVersion >= 1) {
        if (!step(1, kSchemaV1)) {
            return false;
        }
        current = 1;
    }

    if (current < 2 && targetVersion >= 2) {
        if (!step(2, kSchemaV2)) {
            return false;
        }
        current = 2;
    }

    return current == targetVersion;
}

} // namespace tp
