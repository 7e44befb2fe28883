#include "scan/fingerprinter.hpp"

#include "core/classifier.hpp"
#include "network/log.hpp"

#include <exception>

namespace lantern::scan {

Fingerprinter::Fingerprinter(network::ActiveProber& prober,
                             storage::DeviceRepository& devices,
                             std::chrono::milliseconds timeout)
    : prober_(prober)
    , devices_(devices)
    , timeout_(timeout)
{
}

Fingerprinter::~Fingerprinter() {
    wait_idle();
}

Result<bool, Error> Fingerprinter::run(const Uuid& device_id, const std::string& ip) {
    auto found = devices_.find_by_id(device_id);
    if (found.is_err()) {
        return Result<bool, Error>::err(found.unwrap_err());
    }
    if (!found.unwrap()) {
        return Result<bool, Error>::ok(false);
    }

    const Device device = *found.unwrap();
    if (!device.os.empty()) {
        qCDebug(lanternProberLog) << "fingerprint skipped, OS known for" << QString::fromStdString(ip);
        return Result<bool, Error>::ok(false);
    }

    auto probed = prober_.fingerprint(ip, timeout_);
    if (probed.is_err()) {
        return Result<bool, Error>::err(probed.unwrap_err());
    }
    const auto& fp = probed.unwrap();

    const auto type = classify(device.vendor, fp.os_guess);
    auto claimed = devices_.apply_fingerprint(device_id, fp.os_guess, fp.details_json, type,
                                              fp.open_ports);
    if (claimed.is_err() || !claimed.unwrap()) {
        return claimed;
    }

    qCInfo(lanternProberLog) << "fingerprint" << QString::fromStdString(ip)
                             << "os:" << QString::fromStdString(fp.os_guess)
                             << "ports:" << fp.open_ports.size();
    return Result<bool, Error>::ok(true);
}

void Fingerprinter::dispatch(const Uuid& device_id, const std::string& ip) {
    std::lock_guard lock(mu_);
    prune_finished();

    tasks_.push_back(std::async(std::launch::async, [this, device_id, ip]() {
        auto result = run(device_id, ip);
        if (result.is_err()) {
            qCWarning(lanternProberLog) << "fingerprint failed for" << QString::fromStdString(ip)
                                        << QString::fromStdString(result.unwrap_err().message);
        }
    }));
}

void Fingerprinter::prune_finished() {
    std::erase_if(tasks_, [](std::future<void>& task) {
        if (task.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return false;
        try {
            task.get();
        } catch (const std::exception& e) {
            qCWarning(lanternProberLog) << "fingerprint task threw:" << e.what();
        }
        return true;
    });
}

void Fingerprinter::wait_idle() {
    while (true) {
        std::vector<std::future<void>> tasks;
        {
            std::lock_guard lock(mu_);
            tasks.swap(tasks_);
        }
        if (tasks.empty()) return;

        for (auto& task : tasks) {
            try {
                task.get();
            } catch (const std::exception& e) {
                qCWarning(lanternProberLog) << "fingerprint task threw:" << e.what();
            }
        }
    }
}

size_t Fingerprinter::pending() const {
    std::lock_guard lock(mu_);
    size_t running = 0;
    for (const auto& task : tasks_) {
        if (task.wait_for(std::chrono::seconds(0)) != std::future_status::ready) ++running;
    }
    return running;
}

} // namespace lantern::scan
