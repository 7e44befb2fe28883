#include "storage/settings_repository.hpp"

#include "core/device.hpp"
#include <charconv>

namespace lantern::storage {

std::optional<bool> parse_bool_setting(std::string_view value) {
    const auto lower = to_lower(value);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    return std::nullopt;
}

std::optional<int64_t> parse_int_setting(std::string_view value) {
    int64_t out = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (ec != std::errc{} || ptr != value.data() + value.size()) return std::nullopt;
    return out;
}

Result<std::optional<std::string>, Error> SettingsRepository::get(std::string_view key) {
    auto stmt_result = db_.prepare("SELECT value FROM settings WHERE key = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<std::string>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, key);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<std::string>, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<std::string>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<std::string>, Error>::ok(stmt.column_text(0));
}

Status SettingsRepository::set(std::string_view key, std::string_view value) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO settings (key, value) VALUES (?, ?)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value;
    )SQL");
    if (stmt_result.is_err()) {
        return Status::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, key);
    stmt.bind_text(2, value);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Status::err(step_result.unwrap_err());
    }
    return Status::ok();
}

Status SettingsRepository::unset(std::string_view key) {
    auto stmt_result = db_.prepare("DELETE FROM settings WHERE key = ?;");
    if (stmt_result.is_err()) {
        return Status::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, key);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Status::err(step_result.unwrap_err());
    }
    return Status::ok();
}

Status SettingsRepository::set_bool(std::string_view key, bool value) {
    return set(key, value ? "true" : "false");
}

Status SettingsRepository::set_int(std::string_view key, int64_t value) {
    return set(key, std::to_string(value));
}

Status SettingsRepository::set_last_scan(Timestamp when) {
    return set_int(setting_keys::kLastScan, when.millis());
}

Result<ScanSettings, Error> SettingsRepository::load() {
    ScanSettings settings;

    auto stmt_result = db_.prepare("SELECT key, value FROM settings;");
    if (stmt_result.is_err()) {
        return Result<ScanSettings, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<ScanSettings, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;

        const auto key = stmt.column_text(0);
        const auto value = stmt.column_text(1);

        if (key == setting_keys::kIpRange) {
            if (!value.empty()) settings.ip_range = value;
        } else if (key == setting_keys::kDnsServer) {
            if (!value.empty()) settings.dns_server = value;
        } else if (key == setting_keys::kScanIntervalMinutes) {
            auto minutes = parse_int_setting(value);
            if (minutes && *minutes > 0) {
                settings.scan_interval_minutes = static_cast<int>(*minutes);
            }
        } else if (key == setting_keys::kNotifyOnline) {
            settings.notify_online = parse_bool_setting(value).value_or(settings.notify_online);
        } else if (key == setting_keys::kNotifyOffline) {
            settings.notify_offline = parse_bool_setting(value).value_or(settings.notify_offline);
        } else if (key == setting_keys::kNotifyNewDevice) {
            settings.notify_new_device = parse_bool_setting(value).value_or(settings.notify_new_device);
        } else if (key == setting_keys::kNotifyIpChange) {
            settings.notify_ip_change = parse_bool_setting(value).value_or(settings.notify_ip_change);
        } else if (key == setting_keys::kLastScan) {
            if (auto millis = parse_int_setting(value)) {
                settings.last_scan = Timestamp(*millis);
            }
        }
    }

    return Result<ScanSettings, Error>::ok(std::move(settings));
}

} // namespace lantern::storage
