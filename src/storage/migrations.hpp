#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace lantern::storage {

/**
 * Migration - one versioned schema step.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
};

/**
 * All migrations in order.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "device_registry",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS devices (
                id TEXT PRIMARY KEY,
                mac TEXT NOT NULL UNIQUE,
                ip TEXT NOT NULL,
                name TEXT NOT NULL DEFAULT '',
                vendor TEXT NOT NULL DEFAULT '',
                type TEXT NOT NULL DEFAULT 'unknown',
                os TEXT NOT NULL DEFAULT '',
                details TEXT NOT NULL DEFAULT '',
                status TEXT NOT NULL DEFAULT 'online',
                first_seen INTEGER NOT NULL,
                last_seen INTEGER NOT NULL,
                tags TEXT NOT NULL DEFAULT ''
            );
            CREATE INDEX IF NOT EXISTS idx_devices_ip ON devices(ip);

            CREATE TABLE IF NOT EXISTS device_ports (
                device_id TEXT NOT NULL REFERENCES devices(id) ON DELETE CASCADE,
                port INTEGER NOT NULL,
                protocol TEXT NOT NULL,
                service TEXT NOT NULL DEFAULT '',
                state TEXT NOT NULL DEFAULT 'open',
                PRIMARY KEY (device_id, port, protocol)
            );
        )SQL"
    },
    {
        .version = 2,
        .name = "history_and_events",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS device_history (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                device_id TEXT NOT NULL REFERENCES devices(id) ON DELETE CASCADE,
                status TEXT NOT NULL,
                latency_ms INTEGER,
                timestamp INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_history_device ON device_history(device_id, timestamp);

            CREATE TABLE IF NOT EXISTS events (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                kind TEXT NOT NULL,
                message TEXT NOT NULL,
                device_id TEXT REFERENCES devices(id) ON DELETE SET NULL,
                timestamp INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_events_device ON events(device_id);
            CREATE INDEX IF NOT EXISTS idx_events_timestamp ON events(timestamp);

            CREATE TABLE IF NOT EXISTS event_metadata (
                event_id INTEGER NOT NULL REFERENCES events(id) ON DELETE CASCADE,
                key TEXT NOT NULL,
                value TEXT NOT NULL,
                PRIMARY KEY (event_id, key)
            );
        )SQL"
    },
    {
        .version = 3,
        .name = "settings",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS settings (
                key TEXT PRIMARY KEY,
                value TEXT NOT NULL
            );
        )SQL"
    }
};

/**
 * MigrationRunner - applies ALL_MIGRATIONS, tracking progress in
 * `schema_migrations`. Each pending step runs in its own transaction.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    /**
     * Apply every pending migration. Returns how many were applied.
     * A database stamped with a version this build does not know is refused
     * untouched.
     */
    [[nodiscard]] Result<int, Error> migrate() { return migrate_to(latest_version()); }
    [[nodiscard]] Result<int, Error> migrate_to(int target_version);

    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Status apply(const Migration& m);
};

/**
 * Bring a freshly opened database up to the latest schema.
 */
[[nodiscard]] inline Status initialize_database(Database& db) {
    auto applied = MigrationRunner(db).migrate();
    if (applied.is_err()) return Status::err(applied.unwrap_err());
    return Status::ok();
}

} // namespace lantern::storage
