#include "storage/migrations.hpp"

#include "core/types.hpp"

namespace lantern::storage {

Result<int, Error> MigrationRunner::current_version() {
    auto created = db_.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL
        );
    )SQL");
    if (created.is_err()) {
        return Result<int, Error>::err(created.unwrap_err());
    }

    auto stmt_result = db_.prepare("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto row = stmt.step();
    if (row.is_err()) {
        return Result<int, Error>::err(row.unwrap_err());
    }
    return Result<int, Error>::ok(row.unwrap() ? stmt.column_int(0) : 0);
}

Status MigrationRunner::apply(const Migration& m) {
    auto schema = db_.execute(m.up_sql);
    if (schema.is_err()) {
        return Status::err(Error(
            "schema step " + std::to_string(m.version) + " (" + m.name + "): " +
                schema.unwrap_err().message,
            schema.unwrap_err().code));
    }

    auto stmt_result = db_.prepare(
        "INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?);");
    if (stmt_result.is_err()) {
        return Status::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int(1, m.version);
    stmt.bind_text(2, m.name);
    stmt.bind_int64(3, Timestamp::now().millis());

    auto stamped = stmt.step();
    if (stamped.is_err()) {
        return Status::err(stamped.unwrap_err());
    }
    return Status::ok();
}

Result<int, Error> MigrationRunner::migrate_to(int target_version) {
    auto version = current_version();
    if (version.is_err()) {
        return version;
    }

    const int current = version.unwrap();
    if (current > latest_version()) {
        return Result<int, Error>::err(Error(
            "database schema version " + std::to_string(current) +
            " is newer than this build supports (" + std::to_string(latest_version()) + ")"));
    }

    int applied = 0;
    for (const auto& m : ALL_MIGRATIONS) {
        if (m.version <= current || m.version > target_version) continue;

        auto step = db_.transaction([&]() -> Status { return apply(m); });
        if (step.is_err()) {
            return Result<int, Error>::err(step.unwrap_err());
        }
        ++applied;
    }
    return Result<int, Error>::ok(applied);
}

} // namespace lantern::storage
