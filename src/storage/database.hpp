#pragma once

#include "core/result.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace lantern::storage {

/**
 * Prepared SQLite statement, finalized when the last copy goes away.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt, std::recursive_mutex* connection_lock = nullptr)
        : stmt_(stmt, sqlite3_finalize), connection_lock_(connection_lock) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    // Bind helpers (1-based indices)
    Status bind_text(int index, std::string_view text);
    Status bind_int(int index, int value);
    Status bind_int64(int index, int64_t value);
    Status bind_null(int index);

    // Column getters (0-based indices)
    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    /**
     * Advance; ok(true) when a row is available, ok(false) when done.
     */
    Result<bool, Error> step();
    Status reset();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
    std::recursive_mutex* connection_lock_ = nullptr;
};

/**
 * Database - SQLite connection owner.
 *
 * The connection is opened in serialized (full mutex) mode: the scan cycle
 * and background fingerprint tasks share it from different threads. Every
 * step and execute takes the connection lock, and transaction() holds it
 * until commit or rollback, so another thread's statements never land inside
 * an open transaction.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    /**
     * Private in-memory database (tests).
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }
    void close();

    [[nodiscard]] sqlite3* handle() const { return db_; }

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);

    /**
     * Run one or more statements that return no rows.
     */
    [[nodiscard]] Status execute(const std::string& sql);

    [[nodiscard]] Status begin_transaction();
    [[nodiscard]] Status commit();
    [[nodiscard]] Status rollback();

    /**
     * Run `f` inside a transaction; commit on ok, roll back on err.
     * `f` runs on the calling thread with the connection lock held.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());
        auto lock = connection_lock();

        auto begin_result = begin_transaction();
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();
        if (result.is_err()) {
            auto rollback_result = rollback();
            if (rollback_result.is_err()) {
                return ResultType::err(Error{
                    result.unwrap_err().message + " (rollback failed: " +
                    rollback_result.unwrap_err().message + ")",
                    result.unwrap_err().code});
            }
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            return ResultType::err(commit_result.unwrap_err());
        }
        return result;
    }

    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    [[nodiscard]] std::unique_lock<std::recursive_mutex> connection_lock() const {
        return mu_ ? std::unique_lock<std::recursive_mutex>(*mu_)
                   : std::unique_lock<std::recursive_mutex>();
    }

    sqlite3* db_ = nullptr;
    std::unique_ptr<std::recursive_mutex> mu_ = std::make_unique<std::recursive_mutex>();
};

} // namespace lantern::storage
