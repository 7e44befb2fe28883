#include <catch2/catch_test_macros.hpp>
#include "integration/fakes.hpp"

using namespace lantern;
using namespace lantern::testing;

namespace {

network::Fingerprint linux_box(std::vector<OpenPort> ports) {
    return network::Fingerprint{
        .os_guess = "Linux 4.4",
        .open_ports = std::move(ports),
        .details_json = R"({"os":"Linux 4.4"})"
    };
}

Device insert_device(Harness& h, const std::string& mac, const std::string& ip,
                     const std::string& vendor, DeviceType type) {
    auto device = create_device(mac, ip, std::string(kDefaultDeviceName), vendor, type);
    h.devices.insert(device).unwrap();
    return device;
}

} // namespace

TEST_CASE("Fingerprint applies once", "[integration][fingerprint]") {
    Harness h;
    auto device = insert_device(h, "AA:BB:CC:00:02:01", "192.168.1.40", "", DeviceType::Unknown);
    h.prober.fingerprints["192.168.1.40"] = linux_box({{.port = 22, .protocol = "tcp", .service = "ssh"}});

    auto first = h.fingerprinter.run(device.id, device.ip);
    REQUIRE(first.is_ok());
    REQUIRE(first.unwrap());

    auto stored = h.devices.find_by_id(device.id).unwrap();
    REQUIRE(stored->os == "Linux 4.4");
    REQUIRE(stored->details == R"({"os":"Linux 4.4"})");
    REQUIRE(stored->type == DeviceType::Server);
    REQUIRE(h.devices.ports(device.id).unwrap().size() == 1);

    SECTION("A second request leaves the device untouched") {
        h.prober.fingerprints["192.168.1.40"] = network::Fingerprint{
            .os_guess = "Windows 10", .open_ports = {}, .details_json = "{}"};

        auto second = h.fingerprinter.run(device.id, device.ip);
        REQUIRE(second.is_ok());
        REQUIRE_FALSE(second.unwrap());
        REQUIRE(h.prober.fingerprint_calls == 1);
        REQUIRE(h.devices.find_by_id(device.id).unwrap()->os == "Linux 4.4");
        REQUIRE(h.devices.ports(device.id).unwrap().size() == 1);
    }

    SECTION("Clearing the OS allows a fresh probe that replaces the ports") {
        h.devices.clear_fingerprint(device.id).unwrap();
        REQUIRE(h.devices.ports(device.id).unwrap().empty());

        h.prober.fingerprints["192.168.1.40"] = linux_box({
            {.port = 80, .protocol = "tcp", .service = "http"},
            {.port = 443, .protocol = "tcp", .service = "https"},
        });
        REQUIRE(h.fingerprinter.run(device.id, device.ip).unwrap());

        auto ports = h.devices.ports(device.id).unwrap();
        REQUIRE(ports.size() == 2);
        REQUIRE(ports[0].port == 80);
        REQUIRE(ports[1].port == 443);
    }
}

TEST_CASE("Fingerprint keeps a known type", "[integration][fingerprint]") {
    Harness h;
    auto device = insert_device(h, "AA:BB:CC:00:02:02", "192.168.1.1", "Ubiquiti Networks",
                                DeviceType::Router);
    h.prober.fingerprints["192.168.1.1"] = linux_box({});

    REQUIRE(h.fingerprinter.run(device.id, device.ip).unwrap());
    auto stored = h.devices.find_by_id(device.id).unwrap();
    REQUIRE(stored->os == "Linux 4.4");
    REQUIRE(stored->type == DeviceType::Router);
}

TEST_CASE("Fingerprint recomputes type from vendor and OS", "[integration][fingerprint]") {
    Harness h;
    auto device = insert_device(h, "AA:BB:CC:00:02:03", "192.168.1.60", "Microsoft Corporation",
                                DeviceType::Unknown);
    h.prober.fingerprints["192.168.1.60"] = linux_box({});

    REQUIRE(h.fingerprinter.run(device.id, device.ip).unwrap());
    REQUIRE(h.devices.find_by_id(device.id).unwrap()->type == DeviceType::Vm);
}

TEST_CASE("Fingerprint failures", "[integration][fingerprint]") {
    Harness h;

    SECTION("Probe failure leaves the device unchanged") {
        auto device = insert_device(h, "AA:BB:CC:00:02:04", "192.168.1.70", "", DeviceType::Unknown);
        auto result = h.fingerprinter.run(device.id, device.ip);
        REQUIRE(result.is_err());
        REQUIRE(h.devices.find_by_id(device.id).unwrap()->os.empty());
    }

    SECTION("Unknown device is skipped without probing") {
        auto result = h.fingerprinter.run(Uuid::generate(), "192.168.1.71");
        REQUIRE(result.is_ok());
        REQUIRE_FALSE(result.unwrap());
        REQUIRE(h.prober.fingerprint_calls == 0);
    }
}

TEST_CASE("Manual fingerprint trigger", "[integration][fingerprint]") {
    Harness h;
    auto device = insert_device(h, "AA:BB:CC:00:02:05", "192.168.1.80", "", DeviceType::Unknown);
    h.prober.fingerprints["192.168.1.80"] = linux_box({});

    REQUIRE_FALSE(h.orchestrator.trigger_fingerprint("192.168.1.99"));

    REQUIRE(h.orchestrator.trigger_fingerprint("192.168.1.80"));
    h.fingerprinter.wait_idle();
    REQUIRE(h.devices.find_by_id(device.id).unwrap()->os == "Linux 4.4");
    REQUIRE(h.fingerprinter.pending() == 0);

    REQUIRE(h.orchestrator.trigger_fingerprint("192.168.1.80"));
    h.fingerprinter.wait_idle();
    REQUIRE(h.prober.fingerprint_calls == 1);
}

TEST_CASE("New devices are fingerprinted after the cycle", "[integration][fingerprint]") {
    Harness h;
    h.prober.set_hosts({host("192.168.1.90", "AA:BB:CC:00:02:06")});
    h.prober.fingerprints["192.168.1.90"] = linux_box({{.port = 22, .protocol = "tcp", .service = "ssh"}});

    REQUIRE(h.cycle().has_value());
    auto device = h.device("AA:BB:CC:00:02:06");
    REQUIRE(device.os == "Linux 4.4");
    REQUIRE(device.type == DeviceType::Server);
    REQUIRE(h.log_contains("Queuing deep scan for new device: 192.168.1.90"));

    SECTION("Known devices are not re-probed") {
        REQUIRE(h.cycle().has_value());
        REQUIRE(h.prober.fingerprint_calls == 1);
    }
}
