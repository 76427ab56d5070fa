#include "storage/database.hpp"
#include "storage/schema.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include <limits>
#include <stdexcept>

namespace lockbox::storage {

namespace {

constexpr const char* MEMORY_PATH = ":memory:";

bool isTransient(int rc) {
    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
        case SQLITE_PROTOCOL:
            return true;
        default:
            return false;
    }
}

} // namespace

void throwSqliteError(sqlite3* db, int rc, const std::string& context) {
    std::string detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    std::string message = context + ": " + detail;

    if (isTransient(rc)) {
        throw core::TransientStorageError(message);
    }
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        throw core::ConflictError(message);
    }
    throw core::StorageError(message);
}

// Statement

Statement::Statement(sqlite3* db, const char* sql)
    : db_(db), stmt_(nullptr) {
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        throwSqliteError(db_, rc, "Failed to prepare statement");
    }
}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        db_ = other.db_;
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

void Statement::check(int rc, const char* what) {
    if (rc != SQLITE_OK) {
        throwSqliteError(db_, rc, what);
    }
}

Statement& Statement::bindText(int index, std::string_view value) {
    if (value.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw core::ValidationError("Value too large to store");
    }
    check(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                            SQLITE_TRANSIENT),
          "Failed to bind text");
    return *this;
}

Statement& Statement::bindOptionalText(int index, const std::optional<std::string>& value) {
    return value ? bindText(index, *value) : bindNull(index);
}

Statement& Statement::bindInt64(int index, int64_t value) {
    check(sqlite3_bind_int64(stmt_, index, value), "Failed to bind integer");
    return *this;
}

Statement& Statement::bindOptionalInt64(int index, const std::optional<int64_t>& value) {
    return value ? bindInt64(index, *value) : bindNull(index);
}

Statement& Statement::bindBool(int index, bool value) {
    return bindInt64(index, value ? 1 : 0);
}

Statement& Statement::bindBlob(int index, const std::vector<uint8_t>& value) {
    if (value.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw core::ValidationError("Value too large to store");
    }
    check(sqlite3_bind_blob(stmt_, index, value.data(), static_cast<int>(value.size()),
                            SQLITE_TRANSIENT),
          "Failed to bind blob");
    return *this;
}

Statement& Statement::bindNull(int index) {
    check(sqlite3_bind_null(stmt_, index), "Failed to bind null");
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throwSqliteError(db_, rc, "Statement failed");
}

void Statement::run() {
    while (step()) {
    }
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

std::string Statement::text(int column) const {
    const unsigned char* value = sqlite3_column_text(stmt_, column);
    if (!value) {
        return {};
    }
    int size = sqlite3_column_bytes(stmt_, column);
    return std::string(reinterpret_cast<const char*>(value), static_cast<size_t>(size));
}

std::optional<std::string> Statement::optionalText(int column) const {
    if (isNull(column)) {
        return std::nullopt;
    }
    return text(column);
}

int64_t Statement::int64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

std::optional<int64_t> Statement::optionalInt64(int column) const {
    if (isNull(column)) {
        return std::nullopt;
    }
    return int64(column);
}

bool Statement::boolean(int column) const {
    return sqlite3_column_int64(stmt_, column) != 0;
}

std::vector<uint8_t> Statement::blob(int column) const {
    const void* data = sqlite3_column_blob(stmt_, column);
    int size = sqlite3_column_bytes(stmt_, column);
    if (!data || size <= 0) {
        return {};
    }
    return std::vector<uint8_t>(static_cast<const uint8_t*>(data),
                                static_cast<const uint8_t*>(data) + size);
}

// Connection

Connection::Connection(const std::string& path, int busyTimeoutMs) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_URI;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string detail = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw core::TransientStorageError("Failed to open database " + path + ": " + detail);
    }

    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, busyTimeoutMs);

    try {
        exec("PRAGMA foreign_keys = ON;");
        if (path != MEMORY_PATH) {
            exec("PRAGMA journal_mode = WAL;");
            exec("PRAGMA synchronous = NORMAL;");
        }
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

Connection::~Connection() {
    if (db_) {
        sqlite3_close(db_);
    }
}

Statement Connection::prepare(const char* sql) {
    return Statement(db_, sql);
}

void Connection::exec(const char* sql) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : sqlite3_errstr(rc);
        sqlite3_free(errMsg);
        throwSqliteError(nullptr, rc, "Failed to execute SQL: " + error);
    }
}

int Connection::changes() const {
    return sqlite3_changes(db_);
}

bool Connection::inTransaction() const {
    return sqlite3_get_autocommit(db_) == 0;
}

// Transaction

Transaction::Transaction(Connection& conn, Mode mode)
    : conn_(conn), active_(false) {
    conn_.exec(mode == Mode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
    active_ = true;
}

Transaction::~Transaction() {
    if (active_ && conn_.inTransaction()) {
        char* errMsg = nullptr;
        if (sqlite3_exec(conn_.handle(), "ROLLBACK;", nullptr, nullptr, &errMsg) != SQLITE_OK) {
            core::Log::warning("storage", std::string("Rollback failed: ") +
                                              (errMsg ? errMsg : "unknown error"));
        }
        sqlite3_free(errMsg);
    }
}

void Transaction::commit() {
    conn_.exec("COMMIT;");
    active_ = false;
}

// Database

Database::Lease::Lease(Database& owner, std::unique_ptr<Connection> conn)
    : owner_(&owner), conn_(std::move(conn)) {}

Database::Lease::Lease(Lease&& other) noexcept
    : owner_(other.owner_), conn_(std::move(other.conn_)) {
    other.owner_ = nullptr;
}

Database::Lease::~Lease() {
    if (owner_ && conn_) {
        owner_->release(std::move(conn_));
    }
}

Database::Database(std::string path, DatabaseOptions options)
    : path_(std::move(path)), options_(options) {
    if (path_.empty()) {
        throw std::invalid_argument("Database path must not be empty");
    }
    if (path_ == MEMORY_PATH || options_.poolSize == 0) {
        options_.poolSize = 1;
    }

    auto first = openConnection();
    applySchema(*first);
    idle_.push_back(std::move(first));
    open_ = 1;
}

Database::~Database() = default;

std::unique_ptr<Connection> Database::openConnection() {
    return std::make_unique<Connection>(path_, options_.busyTimeoutMs);
}

Database::Lease Database::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait(lock, [this] {
        return !idle_.empty() || open_ < options_.poolSize;
    });

    if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Lease(*this, std::move(conn));
    }

    ++open_;
    lock.unlock();
    try {
        return Lease(*this, openConnection());
    } catch (...) {
        lock.lock();
        --open_;
        available_.notify_one();
        throw;
    }
}

void Database::release(std::unique_ptr<Connection> conn) {
    if (conn->inTransaction()) {
        // A leaked transaction would hold the write lock for the next borrower
        sqlite3_exec(conn->handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push_back(std::move(conn));
    }
    available_.notify_one();
}

int Database::schemaVersion() {
    auto conn = acquire();
    auto stmt = conn->prepare("SELECT MAX(version) FROM schema_version");
    if (!stmt.step() || stmt.isNull(0)) {
        return 0;
    }
    return static_cast<int>(stmt.int64(0));
}

} // namespace lockbox::storage
