#include "network/dns_resolver.hpp"

#include "core/subnet.hpp"
#include "network/log.hpp"

#include <QDnsLookup>
#include <QEventLoop>
#include <QHostAddress>
#include <QTimer>

#include <memory>

namespace lantern::network {

NameMap DnsResolver::resolve(const std::vector<std::string>& ips) {
    NameMap names;
    if (ips.empty()) return names;

    QHostAddress server;
    if (nameserver_ && !server.setAddress(QString::fromStdString(*nameserver_))) {
        qCWarning(lanternResolverLog) << "dns: ignoring invalid nameserver"
                                      << QString::fromStdString(*nameserver_);
    }

    QEventLoop loop;
    int outstanding = 0;
    std::vector<std::unique_ptr<QDnsLookup>> lookups;

    for (const auto& ip : ips) {
        auto qname = reverse_pointer_name(ip);
        if (!qname) continue;

        auto lookup = std::make_unique<QDnsLookup>(QDnsLookup::PTR, QString::fromStdString(*qname));
        if (!server.isNull()) {
            lookup->setNameserver(server);
        }

        QDnsLookup* raw = lookup.get();
        QObject::connect(raw, &QDnsLookup::finished, &loop,
                         [&names, &outstanding, &loop, raw, ip = ip]() {
            if (raw->error() == QDnsLookup::NoError) {
                const auto records = raw->pointerRecords();
                if (!records.isEmpty()) {
                    auto host = records.front().value().toStdString();
                    while (!host.empty() && host.back() == '.') host.pop_back();
                    if (!host.empty()) names.emplace(ip, std::move(host));
                }
            }
            if (--outstanding == 0) loop.quit();
        });

        ++outstanding;
        lookups.push_back(std::move(lookup));
    }

    if (outstanding == 0) return names;

    for (auto& lookup : lookups) {
        lookup->lookup();
    }

    QTimer::singleShot(timeout_, &loop, &QEventLoop::quit);
    loop.exec();

    for (auto& lookup : lookups) {
        if (!lookup->isFinished()) {
            lookup->disconnect();
            lookup->abort();
        }
    }

    qCDebug(lanternResolverLog) << "dns: named" << names.size() << "of" << ips.size();
    return names;
}

} // namespace lantern::network
