#pragma once

namespace crl {

constexpr int kCurrentSchemaVersion = 1;

// Per-connection pragmas, applied on every open.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 5000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
)";

// Database-level pragmas, applied once when the file is created.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x43524C;
PRAGMA user_version = 1;
)";

// Timestamps are ISO-8601 UTC text with milliseconds.
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS settings (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS rl_strategies (
    context TEXT PRIMARY KEY,
    best_action TEXT NOT NULL,
    best_q_value REAL NOT NULL DEFAULT 0.0,
    total_experiences INTEGER NOT NULL DEFAULT 0,
    action_details TEXT NOT NULL DEFAULT '{}',
    algorithm_version TEXT NOT NULL,
    created_at TEXT NOT NULL,
    updated_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS rl_q_values (
    context TEXT NOT NULL,
    action TEXT NOT NULL,
    q_value REAL NOT NULL,
    position INTEGER NOT NULL DEFAULT 0,
    updated_at TEXT NOT NULL,
    PRIMARY KEY (context, action)
);

CREATE TABLE IF NOT EXISTS rl_active_buffer (
    id TEXT PRIMARY KEY,
    seq INTEGER NOT NULL,
    context TEXT NOT NULL,
    action TEXT NOT NULL,
    reward REAL NOT NULL,
    timestamp TEXT NOT NULL,
    metadata TEXT NOT NULL DEFAULT '{}'
);

CREATE INDEX IF NOT EXISTS idx_rl_active_buffer_seq ON rl_active_buffer(seq);

CREATE TABLE IF NOT EXISTS rl_history (
    row_id INTEGER PRIMARY KEY AUTOINCREMENT,
    id TEXT NOT NULL UNIQUE,
    context TEXT NOT NULL,
    action TEXT NOT NULL,
    reward REAL NOT NULL,
    timestamp TEXT NOT NULL,
    state TEXT NOT NULL,
    processed_at TEXT,
    drop_reason TEXT,
    metadata TEXT NOT NULL DEFAULT '{}'
);

CREATE INDEX IF NOT EXISTS idx_rl_history_timestamp ON rl_history(timestamp);
CREATE INDEX IF NOT EXISTS idx_rl_history_context ON rl_history(context);
)";

constexpr const char* kDefaultSettings = R"(
INSERT OR IGNORE INTO settings (key, value) VALUES ('schema_version', '1');
)";

} // namespace crl
