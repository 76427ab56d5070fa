#include "storage/schema.hpp"
#include "storage/database.hpp"

namespace lockbox::storage {

namespace sql {

const char* CREATE_TABLES = R"(
    CREATE TABLE IF NOT EXISTS schema_version (
        version INTEGER PRIMARY KEY
    );

    CREATE TABLE IF NOT EXISTS rooms (
        id TEXT PRIMARY KEY,
        owner_id TEXT NOT NULL,
        name TEXT NOT NULL,
        description TEXT,
        created_at INTEGER NOT NULL
    );

    CREATE TABLE IF NOT EXISTS invites (
        id TEXT PRIMARY KEY,
        room_id TEXT NOT NULL REFERENCES rooms(id),
        creator_id TEXT NOT NULL,
        allowed_email TEXT,
        token_hash TEXT NOT NULL UNIQUE,
        max_uses INTEGER CHECK (max_uses IS NULL OR max_uses > 0),
        single_use INTEGER NOT NULL DEFAULT 0,
        uses_count INTEGER NOT NULL DEFAULT 0 CHECK (uses_count >= 0),
        grant_hours INTEGER CHECK (grant_hours IS NULL OR grant_hours > 0),
        expires_at INTEGER,
        revoked INTEGER NOT NULL DEFAULT 0,
        created_at INTEGER NOT NULL,
        CHECK (single_use = 0 OR max_uses = 1),
        CHECK (max_uses IS NULL OR uses_count <= max_uses)
    );

    CREATE TABLE IF NOT EXISTS shares (
        id TEXT PRIMARY KEY,
        room_id TEXT NOT NULL REFERENCES rooms(id),
        user_id TEXT NOT NULL,
        invite_id TEXT REFERENCES invites(id),
        role TEXT NOT NULL CHECK (role IN ('owner', 'guest')),
        expires_at INTEGER,
        revoked INTEGER NOT NULL DEFAULT 0,
        created_at INTEGER NOT NULL,
        UNIQUE (room_id, user_id)
    );

    CREATE TABLE IF NOT EXISTS documents (
        id TEXT PRIMARY KEY,
        room_id TEXT NOT NULL REFERENCES rooms(id),
        uploaded_by TEXT NOT NULL,
        filename TEXT NOT NULL,
        content_type TEXT NOT NULL,
        size_bytes INTEGER NOT NULL CHECK (size_bytes >= 0),
        sha256 TEXT,
        storage_key TEXT NOT NULL UNIQUE,
        uploaded_at INTEGER NOT NULL
    );

    CREATE TABLE IF NOT EXISTS downloads (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        room_id TEXT NOT NULL,
        document_id TEXT NOT NULL,
        user_id TEXT NOT NULL,
        filename TEXT NOT NULL,
        timestamp INTEGER NOT NULL,
        signature BLOB NOT NULL
    );

    CREATE TABLE IF NOT EXISTS audit_events (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        user_id TEXT,
        action TEXT NOT NULL,
        object_type TEXT,
        object_id TEXT,
        details TEXT,
        ip_address TEXT,
        user_agent TEXT,
        timestamp INTEGER NOT NULL,
        signature BLOB NOT NULL
    );

    CREATE INDEX IF NOT EXISTS idx_invites_room ON invites(room_id);
    CREATE INDEX IF NOT EXISTS idx_shares_user ON shares(user_id);
    CREATE INDEX IF NOT EXISTS idx_documents_room ON documents(room_id);
    CREATE INDEX IF NOT EXISTS idx_downloads_room ON downloads(room_id, timestamp);
    CREATE INDEX IF NOT EXISTS idx_audit_timestamp ON audit_events(timestamp);
    CREATE INDEX IF NOT EXISTS idx_audit_user ON audit_events(user_id);
    CREATE INDEX IF NOT EXISTS idx_audit_object ON audit_events(object_id);
)";

// Invites are audit evidence, revocation is one-way, audit rows are immutable
const char* CREATE_TRIGGERS = R"(
    CREATE TRIGGER IF NOT EXISTS invites_no_delete
    BEFORE DELETE ON invites
    BEGIN
        SELECT RAISE(ABORT, 'invites are permanent');
    END;

    CREATE TRIGGER IF NOT EXISTS invites_revocation_one_way
    BEFORE UPDATE OF revoked ON invites
    WHEN OLD.revoked <> 0 AND NEW.revoked = 0
    BEGIN
        SELECT RAISE(ABORT, 'invite revocation is irreversible');
    END;

    CREATE TRIGGER IF NOT EXISTS shares_revocation_one_way
    BEFORE UPDATE OF revoked ON shares
    WHEN OLD.revoked <> 0 AND NEW.revoked = 0
    BEGIN
        SELECT RAISE(ABORT, 'share revocation is irreversible');
    END;

    CREATE TRIGGER IF NOT EXISTS downloads_no_update
    BEFORE UPDATE ON downloads
    BEGIN
        SELECT RAISE(ABORT, 'downloads are append-only');
    END;

    CREATE TRIGGER IF NOT EXISTS downloads_no_delete
    BEFORE DELETE ON downloads
    BEGIN
        SELECT RAISE(ABORT, 'downloads are append-only');
    END;

    CREATE TRIGGER IF NOT EXISTS audit_events_no_update
    BEFORE UPDATE ON audit_events
    BEGIN
        SELECT RAISE(ABORT, 'audit events are append-only');
    END;

    CREATE TRIGGER IF NOT EXISTS audit_events_no_delete
    BEFORE DELETE ON audit_events
    BEGIN
        SELECT RAISE(ABORT, 'audit events are append-only');
    END;
)";

const char* RECORD_VERSION =
    "INSERT OR IGNORE INTO schema_version (version) VALUES (?)";

} // namespace sql

void applySchema(Connection& conn) {
    Transaction tx(conn, Transaction::Mode::Immediate);
    conn.exec(sql::CREATE_TABLES);
    conn.exec(sql::CREATE_TRIGGERS);

    auto stmt = conn.prepare(sql::RECORD_VERSION);
    stmt.bindInt64(1, SCHEMA_VERSION);
    stmt.run();

    tx.commit();
}

} // namespace lockbox::storage
