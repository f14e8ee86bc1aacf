#pragma once

namespace nr {

constexpr int kRegistrySchemaVersion = 1;

// Per-connection pragmas, safe on every open.
constexpr const char* kRegistryConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
)";

// Database-level pragmas, run once when creating the registry.
constexpr const char* kRegistryDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x4E5253;
PRAGMA user_version = 1;
)";

// Timestamps are seconds since the Unix epoch (REAL), NULL when unknown.
constexpr const char* kRegistrySchemaV1 = R"(
CREATE TABLE IF NOT EXISTS sources (
    id TEXT PRIMARY KEY,
    name TEXT NOT NULL,
    tier TEXT NOT NULL DEFAULT 'tier3'
        CHECK (tier IN ('whitelist', 'tier1', 'tier2', 'tier3', 'blacklist')),
    base_trust REAL,
    is_active INTEGER NOT NULL DEFAULT 1,
    failure_count INTEGER NOT NULL DEFAULT 0,
    last_crawled REAL,
    last_success REAL
);

CREATE INDEX IF NOT EXISTS idx_sources_active ON sources(is_active, tier);
)";

} // namespace nr
