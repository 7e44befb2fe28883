#include "storage/device_repository.hpp"

namespace lantern::storage {

namespace {

constexpr const char* kDeviceColumns =
    "id, mac, ip, name, vendor, type, os, details, status, first_seen, last_seen, tags";

std::string select_devices(const std::string& where_clause) {
    return std::string("SELECT ") + kDeviceColumns + " FROM devices " + where_clause;
}

} // namespace

std::string join_tags(const std::set<std::string>& tags) {
    std::string out;
    for (const auto& tag : tags) {
        if (tag.empty()) continue;
        if (!out.empty()) out += ',';
        out += tag;
    }
    return out;
}

std::set<std::string> split_tags(const std::string& text) {
    std::set<std::string> tags;
    size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find(',', start);
        if (end == std::string::npos) end = text.size();
        if (end > start) tags.insert(text.substr(start, end - start));
        start = end + 1;
    }
    return tags;
}

Device DeviceRepository::row_to_device(Statement& stmt) {
    return Device{
        .id = Uuid::parse(stmt.column_text(0)).value_or(Uuid{}),
        .mac = stmt.column_text(1),
        .ip = stmt.column_text(2),
        .name = stmt.column_text(3),
        .vendor = stmt.column_text(4),
        .type = device_type_from_string(stmt.column_text(5)),
        .os = stmt.column_text(6),
        .details = stmt.column_text(7),
        .status = device_status_from_string(stmt.column_text(8)),
        .first_seen = Timestamp(stmt.column_int64(9)),
        .last_seen = Timestamp(stmt.column_int64(10)),
        .tags = split_tags(stmt.column_text(11))
    };
}

Result<std::optional<Device>, Error> DeviceRepository::find_one(
    const std::string& sql, const std::string& key)
{
    auto stmt_result = db_.prepare(sql);
    if (stmt_result.is_err()) {
        return Result<std::optional<Device>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, key);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<Device>, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<Device>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<Device>, Error>::ok(row_to_device(stmt));
}

Result<std::optional<Device>, Error> DeviceRepository::find_by_mac(const std::string& mac) {
    return find_one(select_devices("WHERE mac = ?;"), mac);
}

Result<std::optional<Device>, Error> DeviceRepository::find_by_id(const Uuid& id) {
    return find_one(select_devices("WHERE id = ?;"), id.to_string());
}

Result<std::optional<Device>, Error> DeviceRepository::find_by_ip(const std::string& ip) {
    return find_one(select_devices("WHERE ip = ? ORDER BY last_seen DESC LIMIT 1;"), ip);
}

Result<std::vector<Device>, Error> DeviceRepository::all() {
    std::vector<Device> devices;

    auto stmt_result = db_.prepare(select_devices("ORDER BY first_seen, mac;"));
    if (stmt_result.is_err()) {
        return Result<std::vector<Device>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<Device>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;

        devices.push_back(row_to_device(stmt));
    }

    return Result<std::vector<Device>, Error>::ok(std::move(devices));
}

Result<int64_t, Error> DeviceRepository::count() {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM devices;");
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t, Error>::err(step_result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(stmt.column_int64(0));
}

Status DeviceRepository::insert(const Device& device) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO devices (id, mac, ip, name, vendor, type, os, details, status,
                             first_seen, last_seen, tags)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Status::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, device.id.to_string());
    stmt.bind_text(2, device.mac);
    stmt.bind_text(3, device.ip);
    stmt.bind_text(4, device.name);
    stmt.bind_text(5, device.vendor);
    stmt.bind_text(6, to_string(device.type));
    stmt.bind_text(7, device.os);
    stmt.bind_text(8, device.details);
    stmt.bind_text(9, to_string(device.status));
    stmt.bind_int64(10, device.first_seen.millis());
    stmt.bind_int64(11, device.last_seen.millis());
    stmt.bind_text(12, join_tags(device.tags));

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Status::err(step_result.unwrap_err());
    }
    return Status::ok();
}

Status DeviceRepository::update(const Device& device) {
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE devices SET
            ip = ?, name = ?, vendor = ?,
            type = CASE WHEN type = 'unknown' THEN ? ELSE type END,
            status = ?, last_seen = ?
        WHERE id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return Status::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, device.ip);
    stmt.bind_text(2, device.name);
    stmt.bind_text(3, device.vendor);
    stmt.bind_text(4, to_string(device.type));
    stmt.bind_text(5, to_string(device.status));
    stmt.bind_int64(6, device.last_seen.millis());
    stmt.bind_text(7, device.id.to_string());

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Status::err(step_result.unwrap_err());
    }
    return Status::ok();
}

Status DeviceRepository::set_status(const Uuid& id, DeviceStatus status) {
    auto stmt_result = db_.prepare("UPDATE devices SET status = ? WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Status::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, to_string(status));
    stmt.bind_text(2, id.to_string());

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Status::err(step_result.unwrap_err());
    }
    return Status::ok();
}

Status DeviceRepository::set_tags(const Uuid& id, const std::set<std::string>& tags) {
    auto stmt_result = db_.prepare("UPDATE devices SET tags = ? WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Status::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, join_tags(tags));
    stmt.bind_text(2, id.to_string());

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Status::err(step_result.unwrap_err());
    }
    return Status::ok();
}

Status DeviceRepository::remove(const Uuid& id) {
    auto stmt_result = db_.prepare("DELETE FROM devices WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Status::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, id.to_string());

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Status::err(step_result.unwrap_err());
    }
    return Status::ok();
}

Result<bool, Error> DeviceRepository::apply_fingerprint(
    const Uuid& id,
    const std::string& os,
    const std::string& details,
    DeviceType classified_type,
    const std::vector<OpenPort>& ports)
{
    return db_.transaction([&]() -> Result<bool, Error> {
        auto claimed = claim_fingerprint(id, os, details, classified_type);
        if (claimed.is_err() || !claimed.unwrap()) {
            return claimed;
        }

        auto replaced = replace_ports(id, ports);
        if (replaced.is_err()) {
            return Result<bool, Error>::err(replaced.unwrap_err());
        }
        return claimed;
    });
}

Result<bool, Error> DeviceRepository::claim_fingerprint(
    const Uuid& id,
    const std::string& os,
    const std::string& details,
    DeviceType classified_type)
{
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE devices SET
            os = ?,
            details = ?,
            type = CASE WHEN type = 'unknown' THEN ? ELSE type END
        WHERE id = ? AND os = ''
        RETURNING id;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<bool, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, os);
    stmt.bind_text(2, details);
    stmt.bind_text(3, to_string(classified_type));
    stmt.bind_text(4, id.to_string());

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<bool, Error>::err(step_result.unwrap_err());
    }
    const bool claimed = step_result.unwrap();

    // RETURNING rows must be drained for the update to complete.
    while (claimed) {
        auto more = stmt.step();
        if (more.is_err()) {
            return Result<bool, Error>::err(more.unwrap_err());
        }
        if (!more.unwrap()) break;
    }
    return Result<bool, Error>::ok(claimed);
}

Status DeviceRepository::clear_fingerprint(const Uuid& id) {
    return db_.transaction([&]() -> Status {
        auto stmt_result = db_.prepare("UPDATE devices SET os = '', details = '' WHERE id = ?;");
        if (stmt_result.is_err()) {
            return Status::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        stmt.bind_text(1, id.to_string());

        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Status::err(step_result.unwrap_err());
        }
        return replace_ports(id, {});
    });
}

Status DeviceRepository::replace_ports(const Uuid& id, const std::vector<OpenPort>& ports) {
    auto delete_result = db_.prepare("DELETE FROM device_ports WHERE device_id = ?;");
    if (delete_result.is_err()) {
        return Status::err(delete_result.unwrap_err());
    }

    auto del = std::move(delete_result).unwrap();
    del.bind_text(1, id.to_string());
    auto del_step = del.step();
    if (del_step.is_err()) {
        return Status::err(del_step.unwrap_err());
    }

    auto insert_result = db_.prepare(R"SQL(
        INSERT OR REPLACE INTO device_ports (device_id, port, protocol, service, state)
        VALUES (?, ?, ?, ?, ?);
    )SQL");
    if (insert_result.is_err()) {
        return Status::err(insert_result.unwrap_err());
    }

    auto stmt = std::move(insert_result).unwrap();
    for (const auto& port : ports) {
        stmt.bind_text(1, id.to_string());
        stmt.bind_int(2, port.port);
        stmt.bind_text(3, port.protocol);
        stmt.bind_text(4, port.service);
        stmt.bind_text(5, port.state);

        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Status::err(step_result.unwrap_err());
        }
        auto reset_result = stmt.reset();
        if (reset_result.is_err()) {
            return reset_result;
        }
    }
    return Status::ok();
}

Result<std::vector<OpenPort>, Error> DeviceRepository::ports(const Uuid& id) {
    std::vector<OpenPort> ports;

    auto stmt_result = db_.prepare(R"SQL(
        SELECT port, protocol, service, state FROM device_ports
        WHERE device_id = ? ORDER BY port, protocol;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<std::vector<OpenPort>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, id.to_string());

    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<OpenPort>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;

        ports.push_back(OpenPort{
            .port = stmt.column_int(0),
            .protocol = stmt.column_text(1),
            .service = stmt.column_text(2),
            .state = stmt.column_text(3)
        });
    }

    return Result<std::vector<OpenPort>, Error>::ok(std::move(ports));
}

} // namespace lantern::storage
