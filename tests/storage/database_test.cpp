#include "core/errors.hpp"
#include "storage/database.hpp"
#include "storage/schema.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include "test_config.h"

using namespace lockbox;
using namespace lockbox::storage;

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        testOutputPath = std::filesystem::path(TEST_OUTPUT_DIR) /
                         (std::string("database_") + info->name());
        std::filesystem::remove_all(testOutputPath);
        std::filesystem::create_directories(testOutputPath);
        dbPath_ = (testOutputPath / "test.db").string();
        db_ = std::make_unique<Database>(dbPath_);

        auto conn = db_->acquire();
        conn->exec("INSERT INTO rooms (id, owner_id, name, created_at) "
                   "VALUES ('room-1', 'owner', 'Room', 0)");
    }

    void TearDown() override {
        db_.reset();
        std::filesystem::remove_all(testOutputPath);
    }

    std::filesystem::path testOutputPath;
    std::string dbPath_;
    std::unique_ptr<Database> db_;
};

TEST_F(DatabaseTest, AppliesSchema) {
    EXPECT_EQ(db_->schemaVersion(), SCHEMA_VERSION);

    // Reopening is a no-op
    db_.reset();
    db_ = std::make_unique<Database>(dbPath_);
    EXPECT_EQ(db_->schemaVersion(), SCHEMA_VERSION);
}

TEST_F(DatabaseTest, BindsAndReadsColumns) {
    auto conn = db_->acquire();
    conn->prepare("INSERT INTO invites (id, room_id, creator_id, allowed_email, token_hash, "
                  "max_uses, created_at) VALUES (?, ?, ?, ?, ?, ?, ?)")
        .bindText(1, "invite-1")
        .bindText(2, "room-1")
        .bindText(3, "owner")
        .bindOptionalText(4, std::nullopt)
        .bindText(5, "hash")
        .bindOptionalInt64(6, 3)
        .bindInt64(7, 42)
        .run();

    auto stmt = conn->prepare(
        "SELECT allowed_email, max_uses, uses_count, revoked, created_at FROM invites WHERE id = ?");
    stmt.bindText(1, "invite-1");
    ASSERT_TRUE(stmt.step());
    EXPECT_FALSE(stmt.optionalText(0).has_value());
    EXPECT_EQ(stmt.optionalInt64(1), 3);
    EXPECT_EQ(stmt.int64(2), 0);
    EXPECT_FALSE(stmt.boolean(3));
    EXPECT_EQ(stmt.int64(4), 42);
    EXPECT_FALSE(stmt.step());
}

TEST_F(DatabaseTest, InvitesCannotBeDeletedOrUnrevoked) {
    auto conn = db_->acquire();
    conn->exec("INSERT INTO invites (id, room_id, creator_id, token_hash, revoked, created_at) "
               "VALUES ('invite-1', 'room-1', 'owner', 'hash', 1, 0)");

    EXPECT_THROW(conn->exec("DELETE FROM invites WHERE id = 'invite-1'"), core::ConflictError);
    EXPECT_THROW(conn->exec("UPDATE invites SET revoked = 0 WHERE id = 'invite-1'"),
                 core::ConflictError);
}

TEST_F(DatabaseTest, UseCountCannotPassMaxUses) {
    auto conn = db_->acquire();
    conn->exec("INSERT INTO invites (id, room_id, creator_id, token_hash, max_uses, uses_count, "
               "created_at) VALUES ('invite-1', 'room-1', 'owner', 'hash', 1, 1, 0)");

    EXPECT_THROW(conn->exec("UPDATE invites SET uses_count = 2 WHERE id = 'invite-1'"),
                 core::ConflictError);
}

TEST_F(DatabaseTest, ShareRevocationIsOneWay) {
    auto conn = db_->acquire();
    conn->exec("INSERT INTO shares (id, room_id, user_id, role, revoked, created_at) "
               "VALUES ('share-1', 'room-1', 'guest', 'guest', 1, 0)");

    EXPECT_THROW(conn->exec("UPDATE shares SET revoked = 0 WHERE id = 'share-1'"),
                 core::ConflictError);
}

TEST_F(DatabaseTest, ShareIsUniquePerRoomAndUser) {
    auto conn = db_->acquire();
    conn->exec("INSERT INTO shares (id, room_id, user_id, role, created_at) "
               "VALUES ('share-1', 'room-1', 'guest', 'guest', 0)");

    EXPECT_THROW(conn->exec("INSERT INTO shares (id, room_id, user_id, role, created_at) "
                            "VALUES ('share-2', 'room-1', 'guest', 'guest', 0)"),
                 core::ConflictError);
}

TEST_F(DatabaseTest, AuditTablesAreAppendOnly) {
    auto conn = db_->acquire();
    conn->exec("INSERT INTO downloads (room_id, document_id, user_id, filename, timestamp, "
               "signature) VALUES ('room-1', 'doc', 'guest', 'a.pdf', 0, x'00')");
    conn->exec("INSERT INTO audit_events (action, timestamp, signature) "
               "VALUES ('create_room', 0, x'00')");

    EXPECT_THROW(conn->exec("UPDATE downloads SET user_id = 'other'"), core::ConflictError);
    EXPECT_THROW(conn->exec("DELETE FROM downloads"), core::ConflictError);
    EXPECT_THROW(conn->exec("UPDATE audit_events SET action = 'other'"), core::ConflictError);
    EXPECT_THROW(conn->exec("DELETE FROM audit_events"), core::ConflictError);
}

TEST_F(DatabaseTest, TransactionRollsBackUnlessCommitted) {
    auto conn = db_->acquire();
    {
        Transaction tx(*conn);
        conn->exec("INSERT INTO rooms (id, owner_id, name, created_at) "
                   "VALUES ('room-2', 'owner', 'Other', 0)");
    }
    EXPECT_FALSE(conn->inTransaction());

    auto stmt = conn->prepare("SELECT COUNT(*) FROM rooms");
    ASSERT_TRUE(stmt.step());
    EXPECT_EQ(stmt.int64(0), 1);
}

TEST_F(DatabaseTest, BusyDatabaseIsTransient) {
    auto conn = db_->acquire();
    Transaction writer(*conn, Transaction::Mode::Immediate);

    Connection other(dbPath_, 0);
    try {
        Transaction blocked(other, Transaction::Mode::Immediate);
        FAIL() << "Expected the write lock to be busy";
    } catch (const core::Error& e) {
        EXPECT_EQ(e.kind(), core::ErrorKind::Transient);
        EXPECT_TRUE(e.isRetryable());
    }
}

TEST_F(DatabaseTest, MapsResultCodes) {
    EXPECT_THROW(throwSqliteError(nullptr, SQLITE_BUSY, "busy"), core::TransientStorageError);
    EXPECT_THROW(throwSqliteError(nullptr, SQLITE_LOCKED, "locked"), core::TransientStorageError);
    EXPECT_THROW(throwSqliteError(nullptr, SQLITE_CONSTRAINT_UNIQUE, "unique"),
                 core::ConflictError);
    EXPECT_THROW(throwSqliteError(nullptr, SQLITE_CORRUPT, "corrupt"), core::StorageError);
}

TEST_F(DatabaseTest, PoolReusesReleasedConnections) {
    Database pooled((testOutputPath / "pooled.db").string(), DatabaseOptions{1, 1000});
    sqlite3* first = nullptr;
    {
        auto conn = pooled.acquire();
        first = conn->handle();
    }
    auto again = pooled.acquire();
    EXPECT_EQ(again->handle(), first);
}
