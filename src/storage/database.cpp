#include "storage/database.hpp"

namespace lantern::storage {

// ============================================================================
// Statement
// ============================================================================

Status Statement::bind_text(int index, std::string_view text) {
    int rc = sqlite3_bind_text(stmt_.get(), index, text.data(),
                               static_cast<int>(text.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Status::err(Error{"Failed to bind text", rc});
    }
    return Status::ok();
}

Status Statement::bind_int(int index, int value) {
    int rc = sqlite3_bind_int(stmt_.get(), index, value);
    if (rc != SQLITE_OK) {
        return Status::err(Error{"Failed to bind int", rc});
    }
    return Status::ok();
}

Status Statement::bind_int64(int index, int64_t value) {
    int rc = sqlite3_bind_int64(stmt_.get(), index, value);
    if (rc != SQLITE_OK) {
        return Status::err(Error{"Failed to bind int64", rc});
    }
    return Status::ok();
}

Status Statement::bind_null(int index) {
    int rc = sqlite3_bind_null(stmt_.get(), index);
    if (rc != SQLITE_OK) {
        return Status::err(Error{"Failed to bind null", rc});
    }
    return Status::ok();
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    return reinterpret_cast<const char*>(text);
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Result<bool, Error> Statement::step() {
    std::unique_lock<std::recursive_mutex> lock;
    if (connection_lock_) lock = std::unique_lock<std::recursive_mutex>(*connection_lock_);

    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    const char* msg = sqlite3_errmsg(sqlite3_db_handle(stmt_.get()));
    return Result<bool, Error>::err(Error{msg ? msg : "Step failed", rc});
}

Status Statement::reset() {
    int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Status::err(Error{"Reset failed", rc});
    }
    return Status::ok();
}

// ============================================================================
// Database
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_), mu_(std::move(other.mu_)) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        mu_ = std::move(other.mu_);
        other.db_ = nullptr;
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db ? sqlite3_errmsg(db) : "Unknown error";
        if (db) sqlite3_close(db);
        return Result<Database, Error>::err(Error{error, rc});
    }

    Database database(db);

    auto pragmas = database.execute("PRAGMA foreign_keys = ON;");
    if (pragmas.is_err()) {
        return Result<Database, Error>::err(pragmas.unwrap_err());
    }

    // WAL does not apply to in-memory databases.
    if (path != ":memory:") {
        auto wal = database.execute("PRAGMA journal_mode = WAL;");
        if (wal.is_err()) {
            return Result<Database, Error>::err(wal.unwrap_err());
        }
    }

    sqlite3_busy_timeout(db, 5000);

    return Result<Database, Error>::ok(std::move(database));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result<Statement, Error> Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(Error{last_error(), rc});
    }
    return Result<Statement, Error>::ok(Statement(stmt, mu_.get()));
}

Status Database::execute(const std::string& sql) {
    auto lock = connection_lock();
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Status::err(Error{error, rc});
    }
    return Status::ok();
}

Status Database::begin_transaction() {
    return execute("BEGIN TRANSACTION;");
}

Status Database::commit() {
    return execute("COMMIT;");
}

Status Database::rollback() {
    return execute("ROLLBACK;");
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

} // namespace lantern::storage
