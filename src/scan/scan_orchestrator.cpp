#include "scan/scan_orchestrator.hpp"

#include "core/classifier.hpp"
#include "core/name_merge.hpp"
#include "network/dns_resolver.hpp"
#include "network/log.hpp"
#include "network/mdns_resolver.hpp"
#include "network/netbios_resolver.hpp"
#include "network/ssdp_resolver.hpp"

#include <algorithm>
#include <exception>
#include <future>

namespace lantern::scan {

std::vector<std::unique_ptr<network::NameResolver>> make_default_resolvers(
    const storage::ScanSettings& settings)
{
    std::vector<std::unique_ptr<network::NameResolver>> resolvers;
    resolvers.push_back(network::create_mdns_resolver());
    resolvers.push_back(std::make_unique<network::SsdpResolver>());
    resolvers.push_back(std::make_unique<network::DnsResolver>(settings.dns_server));
    resolvers.push_back(std::make_unique<network::NetbiosResolver>());
    return resolvers;
}

ScanOrchestrator::ScanOrchestrator(storage::DeviceRepository& devices,
                                   storage::EventRepository& events,
                                   storage::SettingsRepository& settings,
                                   network::ActiveProber& prober,
                                   Fingerprinter& fingerprinter,
                                   NotificationSink& sink,
                                   ScanState& state,
                                   ResolverFactory resolvers,
                                   LocalInterfaceProvider local_interface,
                                   OrchestratorOptions options)
    : devices_(devices)
    , events_(events)
    , settings_(settings)
    , prober_(prober)
    , fingerprinter_(fingerprinter)
    , sink_(sink)
    , state_(state)
    , resolvers_(std::move(resolvers))
    , local_interface_(std::move(local_interface))
    , options_(options)
{
}

ScanOrchestrator::~ScanOrchestrator() {
    wait();
}

bool ScanOrchestrator::start_cycle() {
    if (!state_.try_begin()) {
        return false;
    }

    std::lock_guard lock(worker_mu_);
    if (worker_.joinable()) {
        worker_.join();
    }
    worker_ = std::thread([this]() { run_gated(); });
    return true;
}

std::optional<CycleReport> ScanOrchestrator::run_cycle() {
    if (!state_.try_begin()) {
        return std::nullopt;
    }
    return run_gated();
}

void ScanOrchestrator::wait() {
    std::lock_guard lock(worker_mu_);
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::optional<CycleReport> ScanOrchestrator::run_gated() {
    std::optional<CycleReport> report;
    try {
        report = execute_cycle();
    } catch (const std::exception& e) {
        state_.log(std::string("Fatal Error: ") + e.what());
    }

    if (report && options_.grace_period.count() > 0) {
        std::this_thread::sleep_for(options_.grace_period);
    }
    phase_.store(CyclePhase::Idle);
    state_.finish();
    return report;
}

std::optional<Subnet> ScanOrchestrator::choose_subnet(
    const storage::ScanSettings& settings,
    const Result<network::LocalInterface, Error>& local)
{
    if (settings.ip_range) {
        auto parsed = Subnet::parse(*settings.ip_range);
        if (!parsed) {
            state_.log("Fatal Error: invalid ip_range setting '" + *settings.ip_range + "'");
        }
        return parsed;
    }

    if (local.is_err()) {
        state_.log("Fatal Error: cannot determine local subnet: " + local.unwrap_err().message);
        return std::nullopt;
    }

    auto derived = local.unwrap().subnet();
    if (!derived) {
        state_.log("Fatal Error: interface " + local.unwrap().ip + " has an unusable netmask");
    }
    return derived;
}

std::vector<NameMap> ScanOrchestrator::resolve_all(const storage::ScanSettings& settings,
                                                   const std::vector<std::string>& ips) {
    auto resolvers = resolvers_ ? resolvers_(settings)
                                : std::vector<std::unique_ptr<network::NameResolver>>{};

    std::vector<std::future<NameMap>> pending;
    pending.reserve(resolvers.size());
    for (auto& resolver : resolvers) {
        network::NameResolver* raw = resolver.get();
        pending.push_back(std::async(std::launch::async, [raw, &ips]() -> NameMap {
            try {
                return raw->resolve(ips);
            } catch (const std::exception& e) {
                qCWarning(lanternResolverLog) << QString::fromStdString(raw->name())
                                              << "resolver failed:" << e.what();
                return {};
            }
        }));
    }

    std::vector<NameMap> ranked;
    ranked.reserve(pending.size());
    for (size_t i = 0; i < pending.size(); ++i) {
        ranked.push_back(pending[i].get());
        qCDebug(lanternResolverLog) << QString::fromStdString(resolvers[i]->name())
                                    << "returned" << ranked.back().size() << "names";
    }
    return ranked;
}

std::optional<CycleReport> ScanOrchestrator::execute_cycle() {
    state_.clear_log();
    state_.log("Starting network scan...");

    CycleReport report;
    report.started = Timestamp::now();

    // Sweeping
    phase_.store(CyclePhase::Sweeping);

    auto settings_result = settings_.load();
    if (settings_result.is_err()) {
        state_.log("Fatal Error: cannot read settings: " + settings_result.unwrap_err().message);
        return std::nullopt;
    }
    const auto settings = std::move(settings_result).unwrap();

    const auto local = local_interface_
        ? local_interface_()
        : Result<network::LocalInterface, Error>::err(Error{"no interface provider"});

    auto subnet = choose_subnet(settings, local);
    if (!subnet) {
        return std::nullopt;
    }
    report.subnet = *subnet;
    state_.log("Scanning subnet: " + subnet->to_string());

    auto swept = prober_.sweep(*subnet, options_.sweep_timeout);
    if (swept.is_err()) {
        state_.log("Scan Error: " + swept.unwrap_err().message);
        return std::nullopt;
    }
    auto hosts = std::move(swept).unwrap();
    state_.log("Sweep complete. Found " + std::to_string(hosts.size()) + " hosts.");

    if (local.is_ok()) {
        const auto& self = local.unwrap();
        const auto hostname = self.hostname.empty() ? std::nullopt
                                                    : std::optional<std::string>(self.hostname);
        auto it = std::find_if(hosts.begin(), hosts.end(),
                               [&](const network::SweptHost& h) { return h.ip == self.ip; });
        if (it == hosts.end()) {
            hosts.push_back(network::SweptHost{
                .ip = self.ip,
                .mac = self.mac,
                .vendor = std::string(kSelfVendor),
                .hostname = hostname
            });
        } else if (!it->mac) {
            // nmap never reports a MAC for the scanning host itself.
            it->mac = self.mac;
            if (!it->vendor) it->vendor = std::string(kSelfVendor);
            if (!it->hostname) it->hostname = hostname;
        }
    }
    report.swept_hosts = hosts.size();

    // Resolving
    phase_.store(CyclePhase::Resolving);
    state_.log("Resolving hostnames...");

    std::vector<std::string> ips;
    for (const auto& host : hosts) {
        if (host.mac) ips.push_back(host.ip);
    }
    const auto ranked = ips.empty() ? std::vector<NameMap>{} : resolve_all(settings, ips);

    std::vector<ObservedHost> observed;
    observed.reserve(hosts.size());
    for (const auto& host : hosts) {
        ObservedHost entry{
            .ip = host.ip,
            .mac = host.mac,
            .vendor = host.vendor,
            .resolved_name = std::nullopt,
            .type = classify(host.vendor.value_or(""), "")
        };
        if (host.mac) {
            entry.resolved_name = merge_name(host.ip, ranked, host.hostname);
            if (entry.resolved_name) ++report.named_hosts;
        }
        observed.push_back(std::move(entry));
    }

    // Reconciling
    phase_.store(CyclePhase::Reconciling);

    Reconciler reconciler(devices_, events_, sink_, state_,
                          [this](const Uuid& id, const std::string& ip) {
                              fingerprinter_.dispatch(id, ip);
                          });

    const auto now = Timestamp::now();
    auto reconciled = reconciler.reconcile(observed, settings, now);
    if (reconciled.is_err()) {
        state_.log("Scan Error: " + reconciled.unwrap_err().message);
        return std::nullopt;
    }
    report.reconcile = std::move(reconciled).unwrap();

    auto stamped = settings_.set_last_scan(now);
    if (stamped.is_err()) {
        qCWarning(lanternStorageLog) << "last_scan not recorded:"
                                     << QString::fromStdString(stamped.unwrap_err().message);
    }

    report.finished = Timestamp::now();
    state_.log("Scan Complete.");
    return report;
}

bool ScanOrchestrator::trigger_fingerprint(const std::string& ip) {
    auto found = devices_.find_by_ip(ip);
    if (found.is_err()) {
        qCWarning(lanternStorageLog) << "trigger_fingerprint" << QString::fromStdString(ip)
                                     << QString::fromStdString(found.unwrap_err().message);
        return false;
    }
    if (!found.unwrap()) {
        return false;
    }

    fingerprinter_.dispatch(found.unwrap()->id, ip);
    return true;
}

} // namespace lantern::scan
