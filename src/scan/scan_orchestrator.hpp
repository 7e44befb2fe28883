#pragma once

#include "core/result.hpp"
#include "core/subnet.hpp"
#include "network/active_prober.hpp"
#include "network/local_host.hpp"
#include "network/name_resolver.hpp"
#include "scan/fingerprinter.hpp"
#include "scan/notification_sink.hpp"
#include "scan/reconciler.hpp"
#include "scan/scan_state.hpp"
#include "storage/device_repository.hpp"
#include "storage/event_repository.hpp"
#include "storage/settings_repository.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace lantern::scan {

/**
 * Vendor recorded for the scanning host itself when the sweep omits it.
 */
inline constexpr std::string_view kSelfVendor = "Self (Lantern Host)";

enum class CyclePhase {
    Idle,
    Sweeping,
    Resolving,
    Reconciling
};

/**
 * CycleReport - summary of one completed cycle.
 */
struct CycleReport {
    Subnet subnet;
    size_t swept_hosts = 0;
    size_t named_hosts = 0;
    ReconcileReport reconcile;
    Timestamp started;
    Timestamp finished;
};

struct OrchestratorOptions {
    std::chrono::milliseconds sweep_timeout{120000};
    std::chrono::milliseconds grace_period{2000};
};

using LocalInterfaceProvider = std::function<Result<network::LocalInterface, Error>()>;

/**
 * Builds the resolvers for one cycle, highest merge priority first.
 */
using ResolverFactory = std::function<
    std::vector<std::unique_ptr<network::NameResolver>>(const storage::ScanSettings&)>;

/**
 * mDNS, SSDP, reverse DNS (honouring the dns_server setting), NetBIOS.
 */
[[nodiscard]] std::vector<std::unique_ptr<network::NameResolver>> make_default_resolvers(
    const storage::ScanSettings& settings);

/**
 * ScanOrchestrator - runs discovery cycles: sweep, resolve, reconcile.
 *
 * At most one cycle runs at a time. start_cycle() runs it on a worker thread
 * owned by the orchestrator; run_cycle() runs it on the caller's thread.
 * After a successful cycle the scanning flag stays set for the grace period.
 */
class ScanOrchestrator {
public:
    ScanOrchestrator(storage::DeviceRepository& devices,
                     storage::EventRepository& events,
                     storage::SettingsRepository& settings,
                     network::ActiveProber& prober,
                     Fingerprinter& fingerprinter,
                     NotificationSink& sink,
                     ScanState& state,
                     ResolverFactory resolvers = make_default_resolvers,
                     LocalInterfaceProvider local_interface = network::detect_local_interface,
                     OrchestratorOptions options = {});

    /**
     * Joins a cycle still running.
     */
    ~ScanOrchestrator();

    ScanOrchestrator(const ScanOrchestrator&) = delete;
    ScanOrchestrator& operator=(const ScanOrchestrator&) = delete;

    /**
     * Begin a cycle in the background. Returns false, doing nothing, when a
     * cycle is already running.
     */
    bool start_cycle();

    /**
     * Run a cycle synchronously. nullopt when another cycle holds the gate or
     * the cycle aborted before reconciling.
     */
    std::optional<CycleReport> run_cycle();

    /**
     * Block until a cycle started with start_cycle() has finished.
     */
    void wait();

    [[nodiscard]] ScanStatus status() const { return state_.status(); }
    [[nodiscard]] CyclePhase phase() const { return phase_.load(); }

    /**
     * Re-probe the device currently holding `ip`. False when no device has
     * it; a device with a known OS is left unchanged.
     */
    bool trigger_fingerprint(const std::string& ip);

private:
    std::optional<CycleReport> run_gated();
    std::optional<CycleReport> execute_cycle();

    [[nodiscard]] std::optional<Subnet> choose_subnet(
        const storage::ScanSettings& settings,
        const Result<network::LocalInterface, Error>& local);
    [[nodiscard]] std::vector<NameMap> resolve_all(const storage::ScanSettings& settings,
                                                   const std::vector<std::string>& ips);

    storage::DeviceRepository& devices_;
    storage::EventRepository& events_;
    storage::SettingsRepository& settings_;
    network::ActiveProber& prober_;
    Fingerprinter& fingerprinter_;
    NotificationSink& sink_;
    ScanState& state_;
    ResolverFactory resolvers_;
    LocalInterfaceProvider local_interface_;
    OrchestratorOptions options_;

    std::atomic<CyclePhase> phase_{CyclePhase::Idle};
    std::mutex worker_mu_;
    std::thread worker_;
};

} // namespace lantern::scan
