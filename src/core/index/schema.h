#pragma once

namespace mc {

// Per-connection pragmas, safe on every open.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
PRAGMA cache_size = -16384;
)";

// Database-level pragmas, run once when creating the DB.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x4D4341;
PRAGMA user_version = 1;
)";

// Embeddings are packed float32 arrays; embedding_dims mirrors their length
// so dimension checks do not need to decode the blob.
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS media_items (
    id TEXT PRIMARY KEY,
    title TEXT NOT NULL,
    type TEXT NOT NULL,
    content TEXT,
    description TEXT,
    source_path TEXT,
    source_url TEXT,
    mime_type TEXT,
    embedding BLOB,
    embedding_dims INTEGER NOT NULL DEFAULT 0,
    created_at REAL NOT NULL,
    updated_at REAL NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_media_items_type ON media_items(type);
CREATE INDEX IF NOT EXISTS idx_media_items_created_at ON media_items(created_at DESC);
CREATE INDEX IF NOT EXISTS idx_media_items_embedded ON media_items(embedding_dims);
)";

} // namespace mc
