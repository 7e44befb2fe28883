#include "storage/event_repository.hpp"

namespace lantern::storage {

// ============================================================================
// History
// ============================================================================

Status EventRepository::append_history(
    const Uuid& device_id,
    DeviceStatus status,
    std::optional<int> latency_ms,
    Timestamp timestamp)
{
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO device_history (device_id, status, latency_ms, timestamp)
        VALUES (?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Status::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, device_id.to_string());
    stmt.bind_text(2, to_string(status));
    if (latency_ms) {
        stmt.bind_int(3, *latency_ms);
    } else {
        stmt.bind_null(3);
    }
    stmt.bind_int64(4, timestamp.millis());

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Status::err(step_result.unwrap_err());
    }
    return Status::ok();
}

Result<std::vector<DeviceHistoryEntry>, Error> EventRepository::history_for(const Uuid& device_id) {
    std::vector<DeviceHistoryEntry> entries;

    auto stmt_result = db_.prepare(R"SQL(
        SELECT id, device_id, status, latency_ms, timestamp
        FROM device_history
        WHERE device_id = ?
        ORDER BY timestamp, id;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<std::vector<DeviceHistoryEntry>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, device_id.to_string());

    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<DeviceHistoryEntry>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;

        DeviceHistoryEntry entry{
            .id = stmt.column_int64(0),
            .device_id = Uuid::parse(stmt.column_text(1)).value_or(Uuid{}),
            .status = device_status_from_string(stmt.column_text(2)),
            .latency_ms = std::nullopt,
            .timestamp = Timestamp(stmt.column_int64(4))
        };
        if (!stmt.column_is_null(3)) {
            entry.latency_ms = stmt.column_int(3);
        }
        entries.push_back(std::move(entry));
    }

    return Result<std::vector<DeviceHistoryEntry>, Error>::ok(std::move(entries));
}

Result<int64_t, Error> EventRepository::count_history(const Uuid& device_id) {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM device_history WHERE device_id = ?;");
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, device_id.to_string());

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t, Error>::err(step_result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(stmt.column_int64(0));
}

Result<int64_t, Error> EventRepository::prune_history_before(Timestamp cutoff) {
    auto stmt_result = db_.prepare("DELETE FROM device_history WHERE timestamp < ?;");
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, cutoff.millis());

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t, Error>::err(step_result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(static_cast<int64_t>(sqlite3_changes(db_.handle())));
}

// ============================================================================
// Events
// ============================================================================

Result<int64_t, Error> EventRepository::append_event(const DomainEvent& event) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO events (kind, message, device_id, timestamp)
        VALUES (?, ?, ?, ?)
        RETURNING id;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, to_string(event.kind));
    stmt.bind_text(2, event.message);
    if (event.device_id) {
        stmt.bind_text(3, event.device_id->to_string());
    } else {
        stmt.bind_null(3);
    }
    stmt.bind_int64(4, event.timestamp.millis());

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<int64_t, Error>::err(Error{"Event insert returned no id"});
    }
    const int64_t event_id = stmt.column_int64(0);

    auto done = stmt.step();
    if (done.is_err()) {
        return Result<int64_t, Error>::err(done.unwrap_err());
    }

    if (event.metadata.empty()) {
        return Result<int64_t, Error>::ok(event_id);
    }

    auto meta_result = db_.prepare(
        "INSERT INTO event_metadata (event_id, key, value) VALUES (?, ?, ?);");
    if (meta_result.is_err()) {
        return Result<int64_t, Error>::err(meta_result.unwrap_err());
    }

    auto meta = std::move(meta_result).unwrap();
    for (const auto& [key, value] : event.metadata) {
        meta.bind_int64(1, event_id);
        meta.bind_text(2, key);
        meta.bind_text(3, value);

        auto meta_step = meta.step();
        if (meta_step.is_err()) {
            return Result<int64_t, Error>::err(meta_step.unwrap_err());
        }
        auto reset_result = meta.reset();
        if (reset_result.is_err()) {
            return Result<int64_t, Error>::err(reset_result.unwrap_err());
        }
    }

    return Result<int64_t, Error>::ok(event_id);
}

Status EventRepository::load_metadata(DomainEvent& event) {
    auto stmt_result = db_.prepare(
        "SELECT key, value FROM event_metadata WHERE event_id = ?;");
    if (stmt_result.is_err()) {
        return Status::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, event.id);

    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Status::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;

        event.metadata[stmt.column_text(0)] = stmt.column_text(1);
    }
    return Status::ok();
}

Result<std::vector<DomainEvent>, Error> EventRepository::query_events(
    const std::string& sql, const std::optional<std::string>& device_key, int limit)
{
    std::vector<DomainEvent> events;

    auto stmt_result = db_.prepare(sql);
    if (stmt_result.is_err()) {
        return Result<std::vector<DomainEvent>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    if (device_key) {
        stmt.bind_text(1, *device_key);
    } else {
        stmt.bind_int(1, limit);
    }

    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<DomainEvent>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;

        DomainEvent event{
            .id = stmt.column_int64(0),
            .kind = event_kind_from_string(stmt.column_text(1)).value_or(EventKind::NewDevice),
            .message = stmt.column_text(2),
            .device_id = std::nullopt,
            .timestamp = Timestamp(stmt.column_int64(4)),
            .metadata = {}
        };
        if (!stmt.column_is_null(3)) {
            event.device_id = Uuid::parse(stmt.column_text(3));
        }
        events.push_back(std::move(event));
    }

    for (auto& event : events) {
        auto meta_result = load_metadata(event);
        if (meta_result.is_err()) {
            return Result<std::vector<DomainEvent>, Error>::err(meta_result.unwrap_err());
        }
    }

    return Result<std::vector<DomainEvent>, Error>::ok(std::move(events));
}

Result<std::vector<DomainEvent>, Error> EventRepository::events(int limit) {
    return query_events(R"SQL(
        SELECT id, kind, message, device_id, timestamp
        FROM events
        ORDER BY timestamp DESC, id DESC
        LIMIT ?;
    )SQL", std::nullopt, limit);
}

Result<std::vector<DomainEvent>, Error> EventRepository::events_for_device(const Uuid& device_id) {
    return query_events(R"SQL(
        SELECT id, kind, message, device_id, timestamp
        FROM events
        WHERE device_id = ?
        ORDER BY timestamp, id;
    )SQL", device_id.to_string(), 0);
}

Result<int64_t, Error> EventRepository::count_events(EventKind kind) {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM events WHERE kind = ?;");
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, to_string(kind));

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t, Error>::err(step_result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(stmt.column_int64(0));
}

} // namespace lantern::storage
