#include "network/nmap_xml.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QXmlStreamReader>

namespace lantern::network {
namespace {

struct OsMatch {
    QString name;
    int accuracy = 0;
};

struct HostRecord {
    QString state;
    QString ipv4;
    QString mac;
    QString vendor;
    QString hostname;
    std::vector<OpenPort> ports;
    std::vector<OsMatch> os_matches;
};

void read_port(QXmlStreamReader& xml, HostRecord& host) {
    OpenPort port;
    port.port = xml.attributes().value(QStringLiteral("portid")).toInt();
    port.protocol = xml.attributes().value(QStringLiteral("protocol")).toString().toStdString();
    QString state;

    while (xml.readNextStartElement()) {
        if (xml.name() == QStringLiteral("state")) {
            state = xml.attributes().value(QStringLiteral("state")).toString();
        } else if (xml.name() == QStringLiteral("service")) {
            port.service = xml.attributes().value(QStringLiteral("name")).toString().toStdString();
        }
        xml.skipCurrentElement();
    }

    if (state == QStringLiteral("open") && port.port > 0) {
        port.state = "open";
        host.ports.push_back(std::move(port));
    }
}

void read_host(QXmlStreamReader& xml, HostRecord& host) {
    while (xml.readNextStartElement()) {
        const auto name = xml.name();
        const auto attrs = xml.attributes();

        if (name == QStringLiteral("status")) {
            host.state = attrs.value(QStringLiteral("state")).toString();
            xml.skipCurrentElement();
        } else if (name == QStringLiteral("address")) {
            const auto type = attrs.value(QStringLiteral("addrtype"));
            if (type == QStringLiteral("ipv4")) {
                host.ipv4 = attrs.value(QStringLiteral("addr")).toString();
            } else if (type == QStringLiteral("mac")) {
                host.mac = attrs.value(QStringLiteral("addr")).toString();
                host.vendor = attrs.value(QStringLiteral("vendor")).toString();
            }
            xml.skipCurrentElement();
        } else if (name == QStringLiteral("hostnames")) {
            while (xml.readNextStartElement()) {
                if (xml.name() == QStringLiteral("hostname") && host.hostname.isEmpty()) {
                    host.hostname = xml.attributes().value(QStringLiteral("name")).toString();
                }
                xml.skipCurrentElement();
            }
        } else if (name == QStringLiteral("ports")) {
            while (xml.readNextStartElement()) {
                if (xml.name() == QStringLiteral("port")) {
                    read_port(xml, host);
                } else {
                    xml.skipCurrentElement();
                }
            }
        } else if (name == QStringLiteral("os")) {
            while (xml.readNextStartElement()) {
                if (xml.name() == QStringLiteral("osmatch")) {
                    host.os_matches.push_back(OsMatch{
                        .name = xml.attributes().value(QStringLiteral("name")).toString(),
                        .accuracy = xml.attributes().value(QStringLiteral("accuracy")).toInt()
                    });
                }
                xml.skipCurrentElement();
            }
        } else {
            xml.skipCurrentElement();
        }
    }
}

Result<std::vector<HostRecord>, Error> read_hosts(const QByteArray& data) {
    std::vector<HostRecord> hosts;
    QXmlStreamReader xml(data);

    if (!xml.readNextStartElement() || xml.name() != QStringLiteral("nmaprun")) {
        return Result<std::vector<HostRecord>, Error>::err(Error{"not an nmap XML report"});
    }

    while (xml.readNextStartElement()) {
        if (xml.name() == QStringLiteral("host")) {
            HostRecord host;
            read_host(xml, host);
            hosts.push_back(std::move(host));
        } else {
            xml.skipCurrentElement();
        }
    }

    if (xml.hasError()) {
        return Result<std::vector<HostRecord>, Error>::err(Error{
            "malformed nmap XML: " + xml.errorString().toStdString()});
    }
    return Result<std::vector<HostRecord>, Error>::ok(std::move(hosts));
}

std::optional<std::string> non_empty(const QString& value) {
    if (value.trimmed().isEmpty()) return std::nullopt;
    return value.trimmed().toStdString();
}

} // namespace

Result<std::vector<SweptHost>, Error> parse_nmap_sweep(const QByteArray& xml) {
    auto hosts_result = read_hosts(xml);
    if (hosts_result.is_err()) {
        return Result<std::vector<SweptHost>, Error>::err(hosts_result.unwrap_err());
    }

    std::vector<SweptHost> swept;
    for (const auto& host : hosts_result.unwrap()) {
        if (!host.state.isEmpty() && host.state != QStringLiteral("up")) continue;
        if (host.ipv4.isEmpty()) continue;

        swept.push_back(SweptHost{
            .ip = host.ipv4.toStdString(),
            .mac = normalize_mac(host.mac.toStdString()),
            .vendor = non_empty(host.vendor),
            .hostname = non_empty(host.hostname)
        });
    }
    return Result<std::vector<SweptHost>, Error>::ok(std::move(swept));
}

Result<Fingerprint, Error> parse_nmap_fingerprint(const QByteArray& xml) {
    auto hosts_result = read_hosts(xml);
    if (hosts_result.is_err()) {
        return Result<Fingerprint, Error>::err(hosts_result.unwrap_err());
    }

    const auto& hosts = hosts_result.unwrap();
    if (hosts.empty()) {
        return Result<Fingerprint, Error>::err(Error{"nmap reported no host"});
    }
    const auto& host = hosts.front();

    Fingerprint fp;
    const OsMatch* best = nullptr;
    for (const auto& match : host.os_matches) {
        if (!best || match.accuracy > best->accuracy) best = &match;
    }
    if (best) fp.os_guess = best->name.toStdString();
    fp.open_ports = host.ports;

    QJsonObject details;
    details["ip"] = host.ipv4;
    details["mac"] = host.mac;
    details["vendor"] = host.vendor;
    details["hostname"] = host.hostname;
    details["os"] = best ? best->name : QString{};
    details["osAccuracy"] = best ? best->accuracy : 0;

    QJsonArray ports;
    for (const auto& port : host.ports) {
        QJsonObject entry;
        entry["port"] = port.port;
        entry["protocol"] = QString::fromStdString(port.protocol);
        entry["service"] = QString::fromStdString(port.service);
        ports.append(entry);
    }
    details["openPorts"] = ports;

    fp.details_json = QJsonDocument(details).toJson(QJsonDocument::Compact).toStdString();
    return Result<Fingerprint, Error>::ok(std::move(fp));
}

} // namespace lantern::network
