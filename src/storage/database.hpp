#pragma once

#include "core/core_export.hpp"
#include <sqlite3.h>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lockbox::storage {

/**
 * @brief Map a failed SQLite result code to the error taxonomy and throw
 *
 * BUSY, LOCKED, IOERR, FULL and CANTOPEN become TransientStorageError,
 * CONSTRAINT becomes ConflictError, everything else StorageError.
 */
[[noreturn]] LOCKBOX_CORE_EXPORT void throwSqliteError(sqlite3* db, int rc,
                                                       const std::string& context);

/**
 * @brief Prepared statement, finalized on destruction
 *
 * Bind indices and column indices follow SQLite: binds start at 1,
 * columns at 0.
 */
class LOCKBOX_CORE_EXPORT Statement {
public:
    Statement(sqlite3* db, const char* sql);
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bindText(int index, std::string_view value);
    Statement& bindOptionalText(int index, const std::optional<std::string>& value);
    Statement& bindInt64(int index, int64_t value);
    Statement& bindOptionalInt64(int index, const std::optional<int64_t>& value);
    Statement& bindBool(int index, bool value);
    Statement& bindBlob(int index, const std::vector<uint8_t>& value);
    Statement& bindNull(int index);

    /**
     * @brief Advance to the next row
     * @return true if a row is available, false when done
     */
    bool step();

    /**
     * @brief Execute a statement that returns no rows
     */
    void run();

    void reset();

    bool isNull(int column) const;
    std::string text(int column) const;
    std::optional<std::string> optionalText(int column) const;
    int64_t int64(int column) const;
    std::optional<int64_t> optionalInt64(int column) const;
    bool boolean(int column) const;
    std::vector<uint8_t> blob(int column) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;

    void check(int rc, const char* what);
};

/**
 * @brief One SQLite connection
 */
class LOCKBOX_CORE_EXPORT Connection {
public:
    Connection(const std::string& path, int busyTimeoutMs);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    sqlite3* handle() const { return db_; }

    Statement prepare(const char* sql);

    /**
     * @brief Run one or more statements without parameters
     */
    void exec(const char* sql);

    /**
     * @brief Rows modified by the most recent INSERT, UPDATE or DELETE
     */
    int changes() const;

    bool inTransaction() const;

private:
    sqlite3* db_ = nullptr;
};

/**
 * @brief Scoped transaction, rolled back unless committed
 */
class LOCKBOX_CORE_EXPORT Transaction {
public:
    enum class Mode {
        Deferred,   // Read lock taken on first read
        Immediate   // Write lock taken at BEGIN, waits on busy_timeout
    };

    explicit Transaction(Connection& conn, Mode mode = Mode::Immediate);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Connection& conn_;
    bool active_;
};

struct DatabaseOptions {
    size_t poolSize = 4;        // Upper bound on open connections
    int busyTimeoutMs = 5000;   // How long a writer waits for the lock
};

/**
 * @brief Pool of connections to one SQLite database
 *
 * Each request leases its own connection, so independent operations run in
 * parallel and SQLite's file lock serializes writers. An in-memory database
 * (":memory:") is private to a connection and is therefore limited to a pool
 * of one.
 */
class LOCKBOX_CORE_EXPORT Database {
public:
    class LOCKBOX_CORE_EXPORT Lease {
    public:
        Lease(Database& owner, std::unique_ptr<Connection> conn);
        ~Lease();

        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&&) = delete;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        Connection& operator*() const { return *conn_; }
        Connection* operator->() const { return conn_.get(); }

    private:
        Database* owner_;
        std::unique_ptr<Connection> conn_;
    };

    /**
     * @brief Open the database and apply the schema
     * @param path File path or ":memory:"
     * @param options Pool settings
     * @throws core::TransientStorageError if the file cannot be opened
     */
    explicit Database(std::string path, DatabaseOptions options = {});
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Borrow a connection, blocking while all are in use
     */
    Lease acquire();

    const std::string& path() const { return path_; }

    int schemaVersion();

private:
    std::string path_;
    DatabaseOptions options_;
    std::mutex mutex_;
    std::condition_variable available_;
    std::vector<std::unique_ptr<Connection>> idle_;
    size_t open_ = 0;

    std::unique_ptr<Connection> openConnection();
    void release(std::unique_ptr<Connection> conn);
};

} // namespace lockbox::storage
