#include <catch2/catch_test_macros.hpp>
#include "core/classifier.hpp"

#include <string>
#include <vector>

using namespace lantern;

namespace {

struct Case {
    std::string vendor;
    std::string os;
    DeviceType expected;
};

} // namespace

TEST_CASE("Classifier fixture table", "[classifier]") {
    const std::vector<Case> cases{
        {"VMware, Inc.", "", DeviceType::Vm},
        {"Oracle VirtualBox virtual NIC", "", DeviceType::Vm},
        {"QEMU virtual NIC", "Linux 5.x", DeviceType::Vm},
        {"Proxmox Server Solutions", "", DeviceType::Vm},
        {"Microsoft Corporation", "Linux 4.15", DeviceType::Vm},
        {"Apple, Inc.", "", DeviceType::Mobile},
        {"Samsung Electronics", "Android", DeviceType::Mobile},
        {"Google, Inc.", "", DeviceType::Mobile},
        {"Xiaomi Communications", "", DeviceType::Mobile},
        {"Dell Inc.", "", DeviceType::Laptop},
        {"Hewlett Packard", "", DeviceType::Laptop},
        {"Lenovo", "", DeviceType::Laptop},
        {"Philips Lighting BV", "", DeviceType::Iot},
        {"Raspberry Pi Trading", "Linux 6.1", DeviceType::Iot},
        {"Espressif Inc.", "", DeviceType::Iot},
        {"Sonos, Inc.", "", DeviceType::Iot},
        {"Ubiquiti Networks", "", DeviceType::Router},
        {"Cisco Systems", "", DeviceType::Router},
        {"TP-LINK TECHNOLOGIES", "", DeviceType::Router},
        {"Netgear", "", DeviceType::Router},
        {"Synology Incorporated", "Linux 4.4", DeviceType::Server},
        {"QNAP Systems", "", DeviceType::Server},
        {"", "Microsoft Windows 10", DeviceType::Laptop},
        {"Intel Corporate", "Windows Server 2019", DeviceType::Laptop},
        {"", "Linux 5.4 - 5.15", DeviceType::Server},
        {"Microsoft Corporation", "", DeviceType::Unknown},
        {"Some Unknown Vendor", "", DeviceType::Unknown},
        {"", "", DeviceType::Unknown},
    };

    for (const auto& c : cases) {
        INFO("vendor='" << c.vendor << "' os='" << c.os << "'");
        REQUIRE(classify(c.vendor, c.os) == c.expected);
    }
}

TEST_CASE("Classifier rule order", "[classifier]") {
    SECTION("Virtualization beats everything") {
        REQUIRE(classify("VMware", "Microsoft Windows 11") == DeviceType::Vm);
    }

    SECTION("Vendor beats OS") {
        REQUIRE(classify("Apple", "Linux") == DeviceType::Mobile);
        REQUIRE(classify("Cisco", "Windows") == DeviceType::Router);
    }

    SECTION("Windows beats Linux when both appear") {
        REQUIRE(classify("", "Windows Subsystem for Linux") == DeviceType::Laptop);
    }
}

TEST_CASE("Classifier is case independent", "[classifier]") {
    REQUIRE(classify("APPLE", "") == DeviceType::Mobile);
    REQUIRE(classify("apple", "") == DeviceType::Mobile);
    REQUIRE(classify("", "LINUX") == DeviceType::Server);
    REQUIRE(classify("mIcRoSoFt", "linux") == DeviceType::Vm);
}
