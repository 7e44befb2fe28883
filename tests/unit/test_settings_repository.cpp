#include <catch2/catch_test_macros.hpp>
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/settings_repository.hpp"

using namespace lantern;
using namespace lantern::storage;

TEST_CASE("Settings defaults", "[storage][settings]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    SettingsRepository repo(db);

    auto settings = repo.load().unwrap();
    REQUIRE_FALSE(settings.ip_range.has_value());
    REQUIRE_FALSE(settings.dns_server.has_value());
    REQUIRE(settings.scan_interval_minutes == kDefaultScanIntervalMinutes);
    REQUIRE_FALSE(settings.notify_online);
    REQUIRE_FALSE(settings.notify_offline);
    REQUIRE(settings.notify_new_device);
    REQUIRE(settings.notify_ip_change);
    REQUIRE_FALSE(settings.last_scan.has_value());
}

TEST_CASE("Settings round trip", "[storage][settings]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    SettingsRepository repo(db);

    REQUIRE(repo.set(setting_keys::kIpRange, "10.1.0.0/16").is_ok());
    REQUIRE(repo.set(setting_keys::kDnsServer, "10.1.0.1").is_ok());
    REQUIRE(repo.set_int(setting_keys::kScanIntervalMinutes, 15).is_ok());
    REQUIRE(repo.set_bool(setting_keys::kNotifyOnline, true).is_ok());
    REQUIRE(repo.set_bool(setting_keys::kNotifyNewDevice, false).is_ok());
    REQUIRE(repo.set_last_scan(Timestamp(123456)).is_ok());

    auto settings = repo.load().unwrap();
    REQUIRE(settings.ip_range == "10.1.0.0/16");
    REQUIRE(settings.dns_server == "10.1.0.1");
    REQUIRE(settings.scan_interval_minutes == 15);
    REQUIRE(settings.notify_online);
    REQUIRE_FALSE(settings.notify_new_device);
    REQUIRE(settings.last_scan == Timestamp(123456));

    SECTION("Set overwrites") {
        REQUIRE(repo.set(setting_keys::kIpRange, "10.2.0.0/16").is_ok());
        REQUIRE(repo.get(setting_keys::kIpRange).unwrap() == "10.2.0.0/16");
    }

    SECTION("Unset restores the default") {
        REQUIRE(repo.unset(setting_keys::kScanIntervalMinutes).is_ok());
        REQUIRE_FALSE(repo.get(setting_keys::kScanIntervalMinutes).unwrap().has_value());
        REQUIRE(repo.load().unwrap().scan_interval_minutes == kDefaultScanIntervalMinutes);
    }

    SECTION("Malformed values fall back to defaults") {
        REQUIRE(repo.set(setting_keys::kScanIntervalMinutes, "soon").is_ok());
        REQUIRE(repo.set(setting_keys::kNotifyIpChange, "maybe").is_ok());
        REQUIRE(repo.set(setting_keys::kIpRange, "").is_ok());

        auto reloaded = repo.load().unwrap();
        REQUIRE(reloaded.scan_interval_minutes == kDefaultScanIntervalMinutes);
        REQUIRE(reloaded.notify_ip_change);
        REQUIRE_FALSE(reloaded.ip_range.has_value());
    }

    SECTION("Non-positive interval is ignored") {
        REQUIRE(repo.set_int(setting_keys::kScanIntervalMinutes, 0).is_ok());
        REQUIRE(repo.load().unwrap().scan_interval_minutes == kDefaultScanIntervalMinutes);
    }
}

TEST_CASE("Setting value parsers", "[storage][settings]") {
    REQUIRE(parse_bool_setting("true") == true);
    REQUIRE(parse_bool_setting("YES") == true);
    REQUIRE(parse_bool_setting("1") == true);
    REQUIRE(parse_bool_setting("Off") == false);
    REQUIRE(parse_bool_setting("0") == false);
    REQUIRE_FALSE(parse_bool_setting("").has_value());
    REQUIRE_FALSE(parse_bool_setting("sometimes").has_value());

    REQUIRE(parse_int_setting("42") == 42);
    REQUIRE(parse_int_setting("-3") == -3);
    REQUIRE_FALSE(parse_int_setting("4x").has_value());
    REQUIRE_FALSE(parse_int_setting("").has_value());
}
