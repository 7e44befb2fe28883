#include "network/ssdp_resolver.hpp"

#include "network/log.hpp"
#include "network/ssdp_message.hpp"

#include <QElapsedTimer>
#include <QEventLoop>
#include <QHostAddress>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUdpSocket>
#include <QUrl>

#include <set>

namespace lantern::network {
namespace {

const QHostAddress kSsdpGroup(QStringLiteral("239.255.255.250"));
constexpr quint16 kSsdpPort = 1900;

} // namespace

std::map<std::string, std::string> SsdpResolver::collect_locations(
    const std::vector<std::string>& ips)
{
    std::map<std::string, std::string> locations;
    const std::set<std::string> wanted(ips.begin(), ips.end());

    QUdpSocket socket;
    socket.setSocketOption(QAbstractSocket::MulticastTtlOption, 2);
    if (!socket.bind(QHostAddress::AnyIPv4, 0)) {
        qCWarning(lanternResolverLog) << "ssdp: bind failed:" << socket.errorString();
        return locations;
    }

    if (socket.writeDatagram(build_msearch(), kSsdpGroup, kSsdpPort) < 0) {
        qCWarning(lanternResolverLog) << "ssdp: M-SEARCH failed:" << socket.errorString();
        return locations;
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
            QHostAddress sender;
            socket.readDatagram(datagram.data(), datagram.size(), &sender);

            const auto ip = QHostAddress(sender.toIPv4Address()).toString().toStdString();
            if (!wanted.count(ip) || locations.count(ip)) continue;

            auto response = parse_ssdp_response(datagram);
            if (response.is_ok()) {
                locations.emplace(ip, response.unwrap().location);
            }
        }
    }
    return locations;
}

NameMap SsdpResolver::fetch_names(const std::map<std::string, std::string>& locations) {
    NameMap names;
    if (locations.empty()) return names;

    QNetworkAccessManager manager;
    manager.setTransferTimeout(static_cast<int>(fetch_timeout_.count()));

    QEventLoop loop;
    int outstanding = 0;

    for (const auto& [ip, location] : locations) {
        const QUrl url(QString::fromStdString(location));
        if (!url.isValid() || url.scheme() != QStringLiteral("http")) continue;

        QNetworkReply* reply = manager.get(QNetworkRequest(url));
        ++outstanding;

        QObject::connect(reply, &QNetworkReply::finished, &loop,
                         [&names, &outstanding, &loop, reply, ip = ip]() {
            if (reply->error() == QNetworkReply::NoError) {
                if (auto friendly = parse_friendly_name(reply->readAll())) {
                    names.emplace(ip, std::move(*friendly));
                }
            } else {
                qCDebug(lanternResolverLog) << "ssdp: fetch failed for"
                                            << QString::fromStdString(ip) << reply->errorString();
            }
            reply->deleteLater();
            if (--outstanding == 0) loop.quit();
        });
    }

    if (outstanding > 0) {
        QTimer::singleShot(fetch_timeout_ + std::chrono::milliseconds(250), &loop, &QEventLoop::quit);
        loop.exec();
    }

    // Replies still in flight are aborted and destroyed with the manager.
    for (auto* reply : manager.findChildren<QNetworkReply*>()) {
        reply->disconnect();
        reply->abort();
    }
    return names;
}

NameMap SsdpResolver::resolve(const std::vector<std::string>& ips) {
    if (ips.empty()) return {};

    const auto locations = collect_locations(ips);
    auto names = fetch_names(locations);

    qCDebug(lanternResolverLog) << "ssdp:" << locations.size() << "responders,"
                                << names.size() << "named";
    return names;
}

} // namespace lantern::network
