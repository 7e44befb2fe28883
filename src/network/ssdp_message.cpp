#include "network/ssdp_message.hpp"

#include <QList>
#include <QXmlStreamReader>

namespace lantern::network {

QByteArray build_msearch(const std::string& search_target, int mx_seconds) {
    QByteArray out;
    out += "M-SEARCH * HTTP/1.1\r\n";
    out += "HOST: 239.255.255.250:1900\r\n";
    out += "MAN: \"ssdp:discover\"\r\n";
    out += "MX: " + QByteArray::number(mx_seconds) + "\r\n";
    out += "ST: " + QByteArray::fromStdString(search_target) + "\r\n";
    out += "\r\n";
    return out;
}

Result<SsdpResponse, Error> parse_ssdp_response(const QByteArray& datagram) {
    const QList<QByteArray> lines = datagram.split('\n');
    if (lines.isEmpty()) {
        return Result<SsdpResponse, Error>::err(Error{"empty response"});
    }

    const QByteArray status = lines.front().trimmed();
    const QList<QByteArray> status_parts = status.split(' ');
    if (status_parts.size() < 2 || !status_parts[0].startsWith("HTTP/1.") ||
        status_parts[1] != "200") {
        return Result<SsdpResponse, Error>::err(Error{"not a 200 response: " + status.toStdString()});
    }

    SsdpResponse response;
    for (qsizetype i = 1; i < lines.size(); ++i) {
        const QByteArray line = lines[i].trimmed();
        if (line.isEmpty()) break;

        const auto colon = line.indexOf(':');
        if (colon <= 0) continue;

        const QByteArray key = line.left(colon).trimmed().toUpper();
        const std::string value = line.mid(colon + 1).trimmed().toStdString();

        if (key == "LOCATION") {
            response.location = value;
        } else if (key == "SERVER") {
            response.server = value;
        } else if (key == "USN") {
            response.usn = value;
        } else if (key == "ST") {
            response.search_target = value;
        }
    }

    if (response.location.empty()) {
        return Result<SsdpResponse, Error>::err(Error{"response has no LOCATION"});
    }
    return Result<SsdpResponse, Error>::ok(std::move(response));
}

std::optional<std::string> parse_friendly_name(const QByteArray& description) {
    QXmlStreamReader xml(description);
    while (!xml.atEnd()) {
        if (xml.readNext() != QXmlStreamReader::StartElement) continue;
        if (xml.name() != QStringLiteral("friendlyName")) continue;

        const auto text = xml.readElementText().trimmed();
        if (!text.isEmpty()) {
            return text.toStdString();
        }
    }
    return std::nullopt;
}

} // namespace lantern::network
