#include "network/local_host.hpp"

#include "core/device.hpp"

#include <QHostInfo>
#include <QNetworkInterface>

namespace lantern::network {

std::optional<Subnet> LocalInterface::subnet() const {
    auto address = parse_ipv4(ip);
    if (!address) return std::nullopt;
    return Subnet::from_interface(*address, netmask);
}

Result<LocalInterface, Error> detect_local_interface() {
    const auto hostname = QHostInfo::localHostName().toStdString();

    for (const auto& iface : QNetworkInterface::allInterfaces()) {
        const auto flags = iface.flags();
        if (!flags.testFlag(QNetworkInterface::IsUp) ||
            !flags.testFlag(QNetworkInterface::IsRunning) ||
            flags.testFlag(QNetworkInterface::IsLoopBack)) {
            continue;
        }

        for (const auto& entry : iface.addressEntries()) {
            const auto address = entry.ip();
            if (address.protocol() != QAbstractSocket::IPv4Protocol || address.isLoopback()) {
                continue;
            }

            return Result<LocalInterface, Error>::ok(LocalInterface{
                .ip = address.toString().toStdString(),
                .netmask = entry.netmask().toIPv4Address(),
                .mac = normalize_mac(iface.hardwareAddress().toStdString()),
                .hostname = hostname
            });
        }
    }

    return Result<LocalInterface, Error>::err(Error{"no non-loopback IPv4 interface"});
}

} // namespace lantern::network
