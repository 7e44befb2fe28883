#pragma once

#include "core/result.hpp"
#include "network/active_prober.hpp"
#include "storage/device_repository.hpp"

#include <chrono>
#include <future>
#include <mutex>
#include <vector>

namespace lantern::scan {

inline constexpr std::chrono::milliseconds kDefaultFingerprintTimeout{180000};

/**
 * Fingerprinter - background deep probes for single devices.
 *
 * A device whose OS is already known is never probed again; the check is
 * repeated atomically when the result is written, so overlapping tasks for
 * one device apply at most once. Tasks run outside the scan gate and may
 * overlap the next cycle.
 */
class Fingerprinter {
public:
    Fingerprinter(network::ActiveProber& prober,
                  storage::DeviceRepository& devices,
                  std::chrono::milliseconds timeout = kDefaultFingerprintTimeout);

    /**
     * Waits for every task still running.
     */
    ~Fingerprinter();

    Fingerprinter(const Fingerprinter&) = delete;
    Fingerprinter& operator=(const Fingerprinter&) = delete;

    /**
     * Start run() on a background task. Returns immediately.
     */
    void dispatch(const Uuid& device_id, const std::string& ip);

    /**
     * Probe and store synchronously. ok(true) when the fingerprint was
     * applied, ok(false) when it was skipped because the device is gone or
     * already has an OS.
     */
    [[nodiscard]] Result<bool, Error> run(const Uuid& device_id, const std::string& ip);

    void wait_idle();
    [[nodiscard]] size_t pending() const;

private:
    void prune_finished();

    network::ActiveProber& prober_;
    storage::DeviceRepository& devices_;
    std::chrono::milliseconds timeout_;

    mutable std::mutex mu_;
    std::vector<std::future<void>> tasks_;
};

} // namespace lantern::scan
