#include "network/netbios_resolver.hpp"

#include "network/log.hpp"
#include "network/netbios_status.hpp"

#include <QEventLoop>
#include <QProcess>
#include <QTimer>

#include <deque>
#include <functional>
#include <memory>

namespace lantern::network {

NameMap NetbiosResolver::resolve(const std::vector<std::string>& ips) {
    NameMap names;
    if (ips.empty()) return names;

    QEventLoop loop;
    std::deque<std::string> queue(ips.begin(), ips.end());
    std::vector<std::unique_ptr<QProcess>> processes;
    int running = 0;
    bool failed_to_start = false;

    std::function<void()> launch_next = [&]() {
        while (running < kNetbiosMaxInFlight && !queue.empty() && !failed_to_start) {
            const std::string ip = queue.front();
            queue.pop_front();

            auto process = std::make_unique<QProcess>();
            QProcess* raw = process.get();

            auto* deadline = new QTimer(raw);
            deadline->setSingleShot(true);
            QObject::connect(deadline, &QTimer::timeout, raw, [raw]() { raw->kill(); });

            QObject::connect(raw, &QProcess::finished, &loop,
                             [&, raw, ip](int exit_code, QProcess::ExitStatus status) {
                if (status == QProcess::NormalExit && exit_code == 0) {
                    const auto output = raw->readAllStandardOutput().toStdString();
                    if (auto host = parse_nmblookup_status(output)) {
                        names.emplace(ip, std::move(*host));
                    }
                }
                --running;
                launch_next();
                if (running == 0 && queue.empty()) loop.quit();
            });

            QObject::connect(raw, &QProcess::errorOccurred, &loop,
                             [&, raw](QProcess::ProcessError error) {
                if (error != QProcess::FailedToStart) return;
                qCInfo(lanternResolverLog) << "netbios:" << program_ << "unavailable:"
                                           << raw->errorString();
                failed_to_start = true;
                queue.clear();
                --running;
                if (running == 0) loop.quit();
            });

            ++running;
            processes.push_back(std::move(process));
            raw->start(program_, {QStringLiteral("-A"), QString::fromStdString(ip)});
            deadline->start(per_host_);
        }
    };

    launch_next();

    if (running > 0) {
        const auto batches = (static_cast<int64_t>(ips.size()) + kNetbiosMaxInFlight - 1) /
                             kNetbiosMaxInFlight;
        QTimer::singleShot(per_host_ * batches + std::chrono::milliseconds(500),
                           &loop, &QEventLoop::quit);
        loop.exec();
    }

    for (auto& process : processes) {
        process->disconnect();
        if (process->state() != QProcess::NotRunning) {
            process->kill();
            process->waitForFinished(200);
        }
    }

    qCDebug(lanternResolverLog) << "netbios: named" << names.size() << "of" << ips.size();
    return names;
}

} // namespace lantern::network
