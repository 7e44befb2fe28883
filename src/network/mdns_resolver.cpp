#include "network/mdns_resolver.hpp"

#include "core/device.hpp"
#include "core/subnet.hpp"
#include "network/dns_packet.hpp"
#include "network/log.hpp"

#include <QElapsedTimer>
#include <QHostAddress>
#include <QUdpSocket>

namespace lantern::network {
namespace {

const QHostAddress kMdnsGroup(QStringLiteral("224.0.0.251"));
constexpr quint16 kMdnsPort = 5353;

} // namespace

std::string strip_mdns_suffix(std::string_view host_name) {
    std::string name(host_name);
    while (!name.empty() && name.back() == '.') name.pop_back();

    constexpr std::string_view kLocal = ".local";
    if (name.size() > kLocal.size() &&
        to_lower(std::string_view(name).substr(name.size() - kLocal.size())) == kLocal) {
        name.resize(name.size() - kLocal.size());
    }
    return name;
}

NameMap MdnsResolver::resolve(const std::vector<std::string>& ips) {
    NameMap names;
    if (ips.empty()) return names;

    QUdpSocket socket;
    socket.setSocketOption(QAbstractSocket::MulticastTtlOption, 1);
    if (!socket.bind(QHostAddress::AnyIPv4, 0)) {
        qCWarning(lanternResolverLog) << "mdns: bind failed:" << socket.errorString();
        return names;
    }

    uint16_t id = 0;
    for (const auto& ip : ips) {
        auto qname = reverse_pointer_name(ip);
        if (!qname) continue;

        auto query = encode_ptr_query(++id, *qname);
        if (query.is_err()) continue;

        if (socket.writeDatagram(query.unwrap(), kMdnsGroup, kMdnsPort) < 0) {
            qCDebug(lanternResolverLog) << "mdns: send failed for" << QString::fromStdString(ip)
                                        << socket.errorString();
        }
    }

    QElapsedTimer elapsed;
    elapsed.start();
    while (true) {
        const auto remaining = window_.count() - elapsed.elapsed();
        if (remaining <= 0) break;
        if (!socket.waitForReadyRead(static_cast<int>(remaining))) continue;

        while (socket.hasPendingDatagrams()) {
            QByteArray datagram;
            datagram.resize(static_cast<int>(socket.pendingDatagramSize()));
            socket.readDatagram(datagram.data(), datagram.size());

            auto records = parse_ptr_records(datagram);
            if (records.is_err()) continue;

            for (const auto& record : records.unwrap()) {
                auto ip = ip_from_reverse_pointer_name(record.owner);
                if (!ip || names.count(*ip)) continue;

                auto host = strip_mdns_suffix(record.target);
                if (!host.empty()) names.emplace(*ip, std::move(host));
            }
        }
    }

    qCDebug(lanternResolverLog) << "mdns: named" << names.size() << "of" << ips.size();
    return names;
}

#ifdef LANTERN_HAS_AVAHI
// Defined in platform/linux/avahi_mdns_resolver.cpp
std::unique_ptr<NameResolver> create_avahi_mdns_resolver(std::chrono::milliseconds window);
#endif

std::unique_ptr<NameResolver> create_mdns_resolver(std::chrono::milliseconds window) {
#ifdef LANTERN_HAS_AVAHI
    const auto backend = qEnvironmentVariable("LANTERN_MDNS_BACKEND").trimmed().toLower();
    if (backend != QStringLiteral("multicast")) {
        if (auto avahi = create_avahi_mdns_resolver(window)) {
            return avahi;
        }
        qCInfo(lanternResolverLog) << "mdns: Avahi unavailable, using multicast queries";
    }
#endif
    return std::make_unique<MdnsResolver>(window);
}

} // namespace lantern::network
