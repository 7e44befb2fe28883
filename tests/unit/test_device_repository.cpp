#include <catch2/catch_test_macros.hpp>
#include "storage/database.hpp"
#include "storage/device_repository.hpp"
#include "storage/migrations.hpp"

#include <set>
#include <string>
#include <vector>

using namespace lantern;
using namespace lantern::storage;

namespace {

Device make_device(const std::string& mac, const std::string& ip, int64_t seen) {
    auto device = create_device(mac, ip, std::string(kDefaultDeviceName), "", DeviceType::Unknown);
    device.first_seen = Timestamp(seen);
    device.last_seen = Timestamp(seen);
    return device;
}

} // namespace

TEST_CASE("DeviceRepository CRUD", "[storage][devices]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    DeviceRepository repo(db);

    auto device = make_device("AA:BB:CC:00:00:01", "192.168.1.10", 1000);
    device.vendor = "Apple, Inc.";
    device.type = DeviceType::Mobile;
    device.tags = {"notify:online", "family"};
    REQUIRE(repo.insert(device).is_ok());

    SECTION("Find by MAC, id and IP") {
        auto by_mac = repo.find_by_mac("AA:BB:CC:00:00:01").unwrap();
        REQUIRE(by_mac.has_value());
        REQUIRE(*by_mac == device);

        REQUIRE(repo.find_by_id(device.id).unwrap()->mac == device.mac);
        REQUIRE(repo.find_by_ip("192.168.1.10").unwrap()->id == device.id);

        REQUIRE_FALSE(repo.find_by_mac("AA:BB:CC:00:00:99").unwrap().has_value());
        REQUIRE_FALSE(repo.find_by_ip("192.168.1.99").unwrap().has_value());
    }

    SECTION("MAC is unique") {
        auto twin = make_device("AA:BB:CC:00:00:01", "192.168.1.11", 2000);
        REQUIRE(repo.insert(twin).is_err());
        REQUIRE(repo.count().unwrap() == 1);
    }

    SECTION("Update overwrites sighting columns") {
        device.ip = "192.168.1.20";
        device.name = "Phone";
        device.status = DeviceStatus::Offline;
        device.last_seen = Timestamp(5000);
        REQUIRE(repo.update(device).is_ok());

        auto stored = repo.find_by_id(device.id).unwrap();
        REQUIRE(stored->ip == "192.168.1.20");
        REQUIRE(stored->name == "Phone");
        REQUIRE(stored->status == DeviceStatus::Offline);
        REQUIRE(stored->last_seen == Timestamp(5000));
        REQUIRE(stored->first_seen == Timestamp(1000));
    }

    SECTION("Update leaves tags set in the meantime") {
        auto stale = *repo.find_by_id(device.id).unwrap();
        REQUIRE(repo.set_tags(device.id, {"notify:offline"}).is_ok());

        stale.last_seen = Timestamp(7000);
        REQUIRE(repo.update(stale).is_ok());

        auto stored = repo.find_by_id(device.id).unwrap();
        REQUIRE(stored->tags == std::set<std::string>{"notify:offline"});
        REQUIRE(stored->last_seen == Timestamp(7000));
    }

    SECTION("Status and tags") {
        REQUIRE(repo.set_status(device.id, DeviceStatus::Offline).is_ok());
        REQUIRE(repo.find_by_id(device.id).unwrap()->status == DeviceStatus::Offline);

        REQUIRE(repo.set_tags(device.id, {"notify:offline"}).is_ok());
        auto stored = repo.find_by_id(device.id).unwrap();
        REQUIRE(has_tag(*stored, kTagNotifyOffline));
        REQUIRE_FALSE(has_tag(*stored, kTagNotifyOnline));
    }

    SECTION("find_by_ip prefers the most recently seen holder") {
        auto stale = make_device("AA:BB:CC:00:00:02", "192.168.1.30", 100);
        auto fresh = make_device("AA:BB:CC:00:00:03", "192.168.1.30", 9000);
        REQUIRE(repo.insert(stale).is_ok());
        REQUIRE(repo.insert(fresh).is_ok());

        REQUIRE(repo.find_by_ip("192.168.1.30").unwrap()->id == fresh.id);
    }

    SECTION("all() orders by first sighting") {
        auto older = make_device("AA:BB:CC:00:00:04", "192.168.1.40", 10);
        REQUIRE(repo.insert(older).is_ok());

        auto all = repo.all().unwrap();
        REQUIRE(all.size() == 2);
        REQUIRE(all[0].id == older.id);
        REQUIRE(all[1].id == device.id);
    }

    SECTION("Remove") {
        REQUIRE(repo.remove(device.id).is_ok());
        REQUIRE(repo.count().unwrap() == 0);
    }
}

TEST_CASE("DeviceRepository fingerprint claim", "[storage][devices]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    DeviceRepository repo(db);

    auto device = make_device("AA:BB:CC:00:00:10", "10.0.0.10", 1000);
    REQUIRE(repo.insert(device).is_ok());

    SECTION("First claim applies and recomputes an unknown type") {
        REQUIRE(repo.apply_fingerprint(device.id, "Linux 5.4", "{}", DeviceType::Server, {}).unwrap());

        auto stored = repo.find_by_id(device.id).unwrap();
        REQUIRE(stored->os == "Linux 5.4");
        REQUIRE(stored->details == "{}");
        REQUIRE(stored->type == DeviceType::Server);

        SECTION("Second claim is rejected") {
            REQUIRE_FALSE(repo.apply_fingerprint(device.id, "Windows", "{\"x\":1}",
                                                 DeviceType::Laptop, {}).unwrap());
            auto again = repo.find_by_id(device.id).unwrap();
            REQUIRE(again->os == "Linux 5.4");
            REQUIRE(again->type == DeviceType::Server);
        }
    }

    SECTION("A stale update does not undo the fingerprint") {
        auto stale = *repo.find_by_id(device.id).unwrap();
        REQUIRE(repo.apply_fingerprint(device.id, "Linux 5.4", "{}", DeviceType::Server, {}).unwrap());

        stale.last_seen = Timestamp(9000);
        REQUIRE(repo.update(stale).is_ok());
        REQUIRE(repo.find_by_id(device.id).unwrap()->os == "Linux 5.4");
        REQUIRE(repo.find_by_id(device.id).unwrap()->type == DeviceType::Server);

        REQUIRE(repo.clear_fingerprint(device.id).is_ok());
        auto cleared = repo.find_by_id(device.id).unwrap();
        REQUIRE(cleared->os.empty());
        REQUIRE(cleared->details.empty());
    }

    SECTION("Known type is kept") {
        device.type = DeviceType::Router;
        REQUIRE(repo.update(device).is_ok());

        REQUIRE(repo.apply_fingerprint(device.id, "Linux 3.x", "{}", DeviceType::Server, {}).unwrap());
        REQUIRE(repo.find_by_id(device.id).unwrap()->type == DeviceType::Router);
    }

    SECTION("Ports are stored with the claim") {
        const std::vector<OpenPort> ports{{.port = 22, .protocol = "tcp", .service = "ssh"}};
        REQUIRE(repo.apply_fingerprint(device.id, "Linux 5.4", "{}", DeviceType::Server, ports)
                    .unwrap());
        REQUIRE(repo.ports(device.id).unwrap() == ports);
    }

    SECTION("A failed port write leaves the device untouched") {
        const std::vector<OpenPort> before{{.port = 80, .protocol = "tcp", .service = "http"}};
        REQUIRE(repo.replace_ports(device.id, before).is_ok());
        REQUIRE(db.execute(R"SQL(
            CREATE TRIGGER reject_ports BEFORE INSERT ON device_ports
            BEGIN SELECT RAISE(ABORT, 'disk full'); END;
        )SQL").is_ok());

        auto applied = repo.apply_fingerprint(
            device.id, "Linux 5.4", "{}", DeviceType::Server,
            {{.port = 22, .protocol = "tcp", .service = "ssh"}});
        REQUIRE(applied.is_err());

        auto stored = repo.find_by_id(device.id).unwrap();
        REQUIRE(stored->os.empty());
        REQUIRE(stored->details.empty());
        REQUIRE(stored->type == DeviceType::Unknown);
        REQUIRE(repo.ports(device.id).unwrap() == before);

        SECTION("and a later attempt can still claim it") {
            REQUIRE(db.execute("DROP TRIGGER reject_ports;").is_ok());
            REQUIRE(repo.apply_fingerprint(device.id, "Linux 5.4", "{}", DeviceType::Server, {})
                        .unwrap());
        }
    }

    SECTION("Unknown id is not claimed") {
        REQUIRE_FALSE(repo.apply_fingerprint(Uuid::generate(), "Linux", "{}",
                                             DeviceType::Server, {}).unwrap());
    }
}

TEST_CASE("DeviceRepository port snapshots", "[storage][devices]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    DeviceRepository repo(db);

    auto device = make_device("AA:BB:CC:00:00:20", "10.0.0.20", 1000);
    REQUIRE(repo.insert(device).is_ok());

    const std::vector<OpenPort> first{
        {.port = 22, .protocol = "tcp", .service = "ssh"},
        {.port = 80, .protocol = "tcp", .service = "http"},
    };
    REQUIRE(repo.replace_ports(device.id, first).is_ok());
    REQUIRE(repo.ports(device.id).unwrap() == first);

    const std::vector<OpenPort> second{
        {.port = 443, .protocol = "tcp", .service = "https"},
    };
    REQUIRE(repo.replace_ports(device.id, second).is_ok());
    REQUIRE(repo.ports(device.id).unwrap() == second);

    REQUIRE(repo.replace_ports(device.id, {}).is_ok());
    REQUIRE(repo.ports(device.id).unwrap().empty());

    SECTION("Ports go with the device") {
        REQUIRE(repo.replace_ports(device.id, first).is_ok());
        REQUIRE(repo.remove(device.id).is_ok());
        REQUIRE(repo.ports(device.id).unwrap().empty());
    }
}

TEST_CASE("Tag column encoding", "[storage][devices]") {
    REQUIRE(join_tags({}).empty());
    REQUIRE(join_tags({"b", "a"}) == "a,b");
    REQUIRE(split_tags("") == std::set<std::string>{});
    REQUIRE(split_tags("a,b") == std::set<std::string>{"a", "b"});
    REQUIRE(split_tags("a,,b,") == std::set<std::string>{"a", "b"});
}
