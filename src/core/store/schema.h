#pragma once

namespace tp {

constexpr int kCurrentSchemaVersion = 2;

// Per-connection pragmas, safe on every open. busy_timeout lets the snapshot
// writer and the activity log share the file.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 10000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
)";

// Database-level pragmas, run once when creating the file.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x54504C54;
)";

// Schema v1: learning state.
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS engine_state (
    key   TEXT PRIMARY KEY,
    value TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS entity_state (
    entity_id                  TEXT PRIMARY KEY,
    total_recommendations      INTEGER NOT NULL DEFAULT 0,
    successful_recommendations INTEGER NOT NULL DEFAULT 0,
    personalized_bias          REAL NOT NULL DEFAULT 0,
    last_update                TEXT
);

CREATE TABLE IF NOT EXISTS q_values (
    entity_id    TEXT NOT NULL REFERENCES entity_state(entity_id) ON DELETE CASCADE,
    outdoor_band TEXT NOT NULL,
    target_band  TEXT NOT NULL,
    room         TEXT NOT NULL,
    action       TEXT NOT NULL,
    q_value      REAL NOT NULL,
    visits       INTEGER NOT NULL DEFAULT 0,
    PRIMARY KEY (entity_id, outdoor_band, target_band, room, action)
);

CREATE TABLE IF NOT EXISTS adaptation_history (
    id         INTEGER PRIMARY KEY AUTOINCREMENT,
    entity_id  TEXT NOT NULL REFERENCES entity_state(entity_id) ON DELETE CASCADE,
    timestamp  TEXT NOT NULL,
    adjustment INTEGER NOT NULL,
    reward     REAL NOT NULL,
    bias       REAL NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_adaptation_history_entity ON adaptation_history(entity_id, id);
)";

// Schema v2: activity log and per-day rollups.
constexpr const char* kSchemaV2 = R"(
CREATE TABLE IF NOT EXISTS activity_log (
    id         INTEGER PRIMARY KEY AUTOINCREMENT,
    event_type TEXT NOT NULL,
    entity_id  TEXT NOT NULL,
    timestamp  TEXT NOT NULL,
    payload    TEXT NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_activity_log_entity ON activity_log(entity_id, timestamp DESC);
CREATE INDEX IF NOT EXISTS idx_activity_log_timestamp ON activity_log(timestamp);

CREATE TABLE IF NOT EXISTS daily_stats (
    entity_id                TEXT NOT NULL,
    day                      TEXT NOT NULL,
    recommendations_applied  INTEGER NOT NULL DEFAULT 0,
    adjustments_made         INTEGER NOT NULL DEFAULT 0,
    successful               INTEGER NOT NULL DEFAULT 0,
    energy_saved             REAL NOT NULL DEFAULT 0,
    total_confidence         REAL NOT NULL DEFAULT 0,
    PRIMARY KEY (entity_id, day)
);
)";

} // namespace tp
