#pragma once

namespace mc {

// Per-connection pragmas: no write lock required, safe on every open.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
PRAGMA wal_autocheckpoint = 10000;
PRAGMA cache_size = -16384;
)";

// Database-level pragmas: require write lock, run once when creating the DB.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x4D454D;
PRAGMA user_version = 2;
)";

constexpr int kCurrentSchemaVersion = 2;

// Primary record store. row_id is the stable integer identity the lexical
// index keys on; id is the external memory identifier. revision increases on
// every change to the embedded text; embedded_revision is the revision the
// stored embedding was computed from.
constexpr const char* kSchema = R"(
CREATE TABLE IF NOT EXISTS memories (
    row_id INTEGER PRIMARY KEY AUTOINCREMENT,
    id TEXT NOT NULL UNIQUE,
    project_id TEXT NOT NULL,
    key TEXT NOT NULL,
    content TEXT NOT NULL,
    tags TEXT NOT NULL DEFAULT '[]',
    embedding TEXT,
    revision INTEGER NOT NULL DEFAULT 1,
    embedded_revision INTEGER,
    archived_at REAL,
    created_at REAL NOT NULL,
    updated_at REAL NOT NULL,
    UNIQUE(project_id, key)
);

CREATE INDEX IF NOT EXISTS idx_memories_project ON memories(project_id, archived_at);
CREATE INDEX IF NOT EXISTS idx_memories_pending_embedding
    ON memories(created_at, row_id) WHERE archived_at IS NULL;
)";

// v1 databases predate revision tracking. Their existing embeddings keep a
// NULL embedded_revision and are never considered stale.
constexpr const char* kMigrateV1ToV2 = R"(
ALTER TABLE memories ADD COLUMN revision INTEGER NOT NULL DEFAULT 1;
ALTER TABLE memories ADD COLUMN embedded_revision INTEGER;
DROP INDEX IF EXISTS idx_memories_missing_embedding;
PRAGMA user_version = 2;
)";

// Lexical index: FTS5 external-content table over memories(key, content, tags).
// Kept in sync through the store's write hooks, not triggers.
constexpr const char* kLexicalIndexTable = "memories_fts";

constexpr const char* kLexicalIndexSchema = R"(
CREATE VIRTUAL TABLE IF NOT EXISTS memories_fts USING fts5(
    key,
    content,
    tags,
    content='memories',
    content_rowid='row_id',
    tokenize='porter unicode61'
);
)";

constexpr const char* kLexicalIndexRebuild =
    "INSERT INTO memories_fts(memories_fts) VALUES('rebuild')";

constexpr const char* kLexicalIndexInsert =
    "INSERT INTO memories_fts(rowid, key, content, tags) VALUES(?1, ?2, ?3, ?4)";

constexpr const char* kLexicalIndexDelete =
    "INSERT INTO memories_fts(memories_fts, rowid, key, content, tags) "
    "VALUES('delete', ?1, ?2, ?3, ?4)";

constexpr const char* kLexicalIndexSearch = R"(
SELECT m.id
FROM memories_fts
JOIN memories m ON m.row_id = memories_fts.rowid
WHERE memories_fts MATCH ?1
  AND m.project_id = ?2
  AND m.archived_at IS NULL
ORDER BY rank
LIMIT ?3
)";

} // namespace mc
