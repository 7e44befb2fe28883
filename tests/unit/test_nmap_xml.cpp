#include <catch2/catch_test_macros.hpp>
#include "network/nmap_xml.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

using namespace lantern;
using namespace lantern::network;

namespace {

const QByteArray kSweepXml = R"XML(<?xml version="1.0" encoding="UTF-8"?>
<!DOCTYPE nmaprun>
<nmaprun scanner="nmap" args="nmap -sn -oX - 192.168.1.0/24" version="7.94">
<host><status state="up" reason="arp-response"/>
<address addr="192.168.1.1" addrtype="ipv4"/>
<address addr="f0:9f:c2:aa:bb:01" addrtype="mac" vendor="Ubiquiti Networks"/>
<hostnames><hostname name="gateway.lan" type="PTR"/><hostname name="router" type="user"/></hostnames>
</host>
<host><status state="up" reason="arp-response"/>
<address addr="192.168.1.23" addrtype="ipv4"/>
<address addr="3C:22:FB:00:11:22" addrtype="mac" vendor="Apple"/>
<hostnames/>
</host>
<host><status state="down" reason="no-response"/>
<address addr="192.168.1.50" addrtype="ipv4"/>
</host>
<host><status state="up" reason="localhost-response"/>
<address addr="192.168.1.5" addrtype="ipv4"/>
<hostnames/>
</host>
<runstats><finished time="1700000000"/><hosts up="3" down="253" total="256"/></runstats>
</nmaprun>
)XML";

const QByteArray kFingerprintXml = R"XML(<?xml version="1.0" encoding="UTF-8"?>
<nmaprun scanner="nmap" args="nmap -O -oX - 192.168.1.40">
<host><status state="up"/>
<address addr="192.168.1.40" addrtype="ipv4"/>
<address addr="00:11:32:AA:BB:CC" addrtype="mac" vendor="Synology Incorporated"/>
<hostnames><hostname name="nas.lan" type="PTR"/></hostnames>
<ports>
<extraports state="closed" count="995"/>
<port protocol="tcp" portid="22"><state state="open"/><service name="ssh"/></port>
<port protocol="tcp" portid="139"><state state="filtered"/><service name="netbios-ssn"/></port>
<port protocol="tcp" portid="445"><state state="open"/><service name="microsoft-ds"/></port>
<port protocol="tcp" portid="5000"><state state="open"/></port>
</ports>
<os>
<portused state="open" proto="tcp" portid="22"/>
<osmatch name="Linux 3.10 - 4.11" accuracy="94"/>
<osmatch name="Linux 4.4" accuracy="98"/>
<osmatch name="Linux 2.6.32" accuracy="90"/>
</os>
</host>
</nmaprun>
)XML";

} // namespace

TEST_CASE("nmap sweep report", "[nmap]") {
    auto result = parse_nmap_sweep(kSweepXml);
    REQUIRE(result.is_ok());

    const auto& hosts = result.unwrap();
    REQUIRE(hosts.size() == 3);

    REQUIRE(hosts[0].ip == "192.168.1.1");
    REQUIRE(hosts[0].mac == "F0:9F:C2:AA:BB:01");
    REQUIRE(hosts[0].vendor == "Ubiquiti Networks");
    REQUIRE(hosts[0].hostname == "gateway.lan");

    REQUIRE(hosts[1].ip == "192.168.1.23");
    REQUIRE(hosts[1].mac == "3C:22:FB:00:11:22");
    REQUIRE_FALSE(hosts[1].hostname.has_value());

    SECTION("Local host appears without a MAC") {
        REQUIRE(hosts[2].ip == "192.168.1.5");
        REQUIRE_FALSE(hosts[2].mac.has_value());
        REQUIRE_FALSE(hosts[2].vendor.has_value());
    }
}

TEST_CASE("nmap fingerprint report", "[nmap]") {
    auto result = parse_nmap_fingerprint(kFingerprintXml);
    REQUIRE(result.is_ok());

    const auto& fp = result.unwrap();
    REQUIRE(fp.os_guess == "Linux 4.4");

    REQUIRE(fp.open_ports.size() == 3);
    REQUIRE(fp.open_ports[0] == OpenPort{.port = 22, .protocol = "tcp", .service = "ssh"});
    REQUIRE(fp.open_ports[1].port == 445);
    REQUIRE(fp.open_ports[2].port == 5000);
    REQUIRE(fp.open_ports[2].service.empty());

    const auto details = QJsonDocument::fromJson(QByteArray::fromStdString(fp.details_json)).object();
    REQUIRE(details["ip"].toString() == QStringLiteral("192.168.1.40"));
    REQUIRE(details["os"].toString() == QStringLiteral("Linux 4.4"));
    REQUIRE(details["osAccuracy"].toInt() == 98);
    REQUIRE(details["openPorts"].toArray().size() == 3);
}

TEST_CASE("nmap fingerprint without OS match", "[nmap]") {
    const QByteArray xml = R"XML(<nmaprun><host><status state="up"/>
<address addr="10.0.0.9" addrtype="ipv4"/><ports/></host></nmaprun>)XML";

    auto fp = parse_nmap_fingerprint(xml).unwrap();
    REQUIRE(fp.os_guess.empty());
    REQUIRE(fp.open_ports.empty());
}

TEST_CASE("nmap parse failures", "[nmap]") {
    REQUIRE(parse_nmap_sweep("").is_err());
    REQUIRE(parse_nmap_sweep("<html><body/></html>").is_err());
    REQUIRE(parse_nmap_sweep("<nmaprun><host><status state=\"up\"/>").is_err());
    REQUIRE(parse_nmap_fingerprint("<nmaprun></nmaprun>").unwrap_err().message ==
            "nmap reported no host");
    REQUIRE(parse_nmap_sweep("<nmaprun></nmaprun>").unwrap().empty());
}
