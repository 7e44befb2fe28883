#pragma once

#include "network/active_prober.hpp"

#include <QString>
#include <QStringList>

namespace lantern::network {

/**
 * NmapProber - ActiveProber backed by the nmap binary.
 *
 * Sweeps run `nmap -sn -oX - <cidr>`, fingerprints `nmap -O -oX - <ip>`.
 * OS detection needs raw sockets, so fingerprints fail without root.
 */
class NmapProber final : public ActiveProber {
public:
    explicit NmapProber(QString program = QStringLiteral("nmap"));

    Result<std::vector<SweptHost>, Error> sweep(
        const Subnet& subnet, std::chrono::milliseconds timeout) override;

    Result<Fingerprint, Error> fingerprint(
        const std::string& ip, std::chrono::milliseconds timeout) override;

private:
    Result<QByteArray, Error> run(const QStringList& args, std::chrono::milliseconds timeout);

    QString program_;
};

} // namespace lantern::network
