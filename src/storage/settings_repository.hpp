#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace lantern::storage {

namespace setting_keys {
inline constexpr std::string_view kIpRange = "ip_range";
inline constexpr std::string_view kDnsServer = "dns_server";
inline constexpr std::string_view kScanIntervalMinutes = "scan_interval_minutes";
inline constexpr std::string_view kNotifyOnline = "notify_online";
inline constexpr std::string_view kNotifyOffline = "notify_offline";
inline constexpr std::string_view kNotifyNewDevice = "notify_new_device";
inline constexpr std::string_view kNotifyIpChange = "notify_ip_change";
inline constexpr std::string_view kLastScan = "last_scan";
} // namespace setting_keys

inline constexpr int kDefaultScanIntervalMinutes = 5;

/**
 * ScanSettings - typed view over the settings table, read once per cycle.
 */
struct ScanSettings {
    std::optional<std::string> ip_range;
    std::optional<std::string> dns_server;
    int scan_interval_minutes = kDefaultScanIntervalMinutes;
    bool notify_online = false;
    bool notify_offline = false;
    bool notify_new_device = true;
    bool notify_ip_change = true;
    std::optional<Timestamp> last_scan;
};

/**
 * SettingsRepository - string key/value settings with typed accessors.
 *
 * Missing or malformed values fall back to the ScanSettings defaults.
 */
class SettingsRepository {
public:
    explicit SettingsRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<std::string>, Error> get(std::string_view key);
    [[nodiscard]] Status set(std::string_view key, std::string_view value);
    [[nodiscard]] Status unset(std::string_view key);

    [[nodiscard]] Status set_bool(std::string_view key, bool value);
    [[nodiscard]] Status set_int(std::string_view key, int64_t value);

    [[nodiscard]] Result<ScanSettings, Error> load();
    [[nodiscard]] Status set_last_scan(Timestamp when);

private:
    Database& db_;
};

/**
 * "true"/"1"/"yes"/"on" (any case) are true; "false"/"0"/"no"/"off" false.
 */
[[nodiscard]] std::optional<bool> parse_bool_setting(std::string_view value);
[[nodiscard]] std::optional<int64_t> parse_int_setting(std::string_view value);

} // namespace lantern::storage
