#include "network/nmap_prober.hpp"

#include "network/log.hpp"
#include "network/nmap_xml.hpp"

#include <QProcess>

namespace lantern::network {

NmapProber::NmapProber(QString program)
    : program_(std::move(program))
{
}

Result<QByteArray, Error> NmapProber::run(const QStringList& args,
                                          std::chrono::milliseconds timeout) {
    QProcess process;
    process.setProcessChannelMode(QProcess::SeparateChannels);
    process.start(program_, args);

    if (!process.waitForStarted(5000)) {
        return Result<QByteArray, Error>::err(Error{
            "failed to start " + program_.toStdString() + ": " +
            process.errorString().toStdString()});
    }

    if (!process.waitForFinished(static_cast<int>(timeout.count()))) {
        process.kill();
        process.waitForFinished(1000);
        return Result<QByteArray, Error>::err(Error{
            program_.toStdString() + " timed out after " +
            std::to_string(timeout.count()) + " ms"});
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        const auto stderr_text = QString::fromUtf8(process.readAllStandardError()).trimmed();
        return Result<QByteArray, Error>::err(Error{
            program_.toStdString() + " exited with code " +
            std::to_string(process.exitCode()) + ": " + stderr_text.toStdString(),
            process.exitCode()});
    }

    return Result<QByteArray, Error>::ok(process.readAllStandardOutput());
}

Result<std::vector<SweptHost>, Error> NmapProber::sweep(const Subnet& subnet,
                                                        std::chrono::milliseconds timeout) {
    const auto cidr = QString::fromStdString(subnet.to_string());
    qCInfo(lanternProberLog) << "sweep" << cidr;

    auto output = run({QStringLiteral("-sn"), QStringLiteral("-oX"), QStringLiteral("-"), cidr},
                      timeout);
    if (output.is_err()) {
        return Result<std::vector<SweptHost>, Error>::err(output.unwrap_err());
    }

    auto hosts = parse_nmap_sweep(output.unwrap());
    if (hosts.is_ok()) {
        qCInfo(lanternProberLog) << "sweep" << cidr << "found" << hosts.unwrap().size() << "hosts";
    }
    return hosts;
}

Result<Fingerprint, Error> NmapProber::fingerprint(const std::string& ip,
                                                   std::chrono::milliseconds timeout) {
    const auto target = QString::fromStdString(ip);
    qCDebug(lanternProberLog) << "fingerprint" << target;

    auto output = run({QStringLiteral("-O"), QStringLiteral("-oX"), QStringLiteral("-"), target},
                      timeout);
    if (output.is_err()) {
        return Result<Fingerprint, Error>::err(output.unwrap_err());
    }
    return parse_nmap_fingerprint(output.unwrap());
}

} // namespace lantern::network
