#pragma once

#include "core/device.hpp"
#include "core/result.hpp"
#include "scan/notification_sink.hpp"
#include "scan/scan_state.hpp"
#include "storage/device_repository.hpp"
#include "storage/event_repository.hpp"
#include "storage/settings_repository.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lantern::scan {

/**
 * ObservedHost - a swept host after name resolution and classification.
 */
struct ObservedHost {
    std::string ip;
    std::optional<std::string> mac;
    std::optional<std::string> vendor;
    std::optional<std::string> resolved_name;
    DeviceType type = DeviceType::Unknown;
};

/**
 * ReconcileReport - what one reconciliation pass changed.
 */
struct ReconcileReport {
    int created = 0;
    int updated = 0;
    int came_online = 0;
    int went_offline = 0;
    int ip_changes = 0;
    int skipped_without_mac = 0;
    int skipped_duplicate_mac = 0;
    int failed = 0;
    bool first_run = false;
    std::vector<Uuid> new_device_ids;
};

/**
 * Reconciler - merges one cycle's observations into the device registry.
 *
 * Hosts are processed in order; a storage failure for one host is logged and
 * counted and the next host proceeds. A MAC seen again later in the same
 * batch is ignored, so the first address reported for it wins. After all hosts every registry device
 * not observed this cycle receives an offline history row and, if it was
 * online, is flipped offline.
 */
class Reconciler {
public:
    using FingerprintDispatch = std::function<void(const Uuid& device_id, const std::string& ip)>;

    Reconciler(storage::DeviceRepository& devices,
               storage::EventRepository& events,
               NotificationSink& sink,
               ScanState& state,
               FingerprintDispatch dispatch_fingerprint);

    /**
     * Fails only when the registry cannot be read at all (initial count or
     * the offline pass).
     */
    [[nodiscard]] Result<ReconcileReport, Error> reconcile(
        const std::vector<ObservedHost>& hosts,
        const storage::ScanSettings& settings,
        Timestamp now);

private:
    [[nodiscard]] Status update_existing(Device existing,
                                         const ObservedHost& host,
                                         const storage::ScanSettings& settings,
                                         Timestamp now,
                                         ReconcileReport& report);
    [[nodiscard]] Status create_new(const std::string& mac,
                                    const ObservedHost& host,
                                    const storage::ScanSettings& settings,
                                    Timestamp now,
                                    ReconcileReport& report);
    [[nodiscard]] Status mark_absent(const std::set<std::string>& observed_macs,
                                     const storage::ScanSettings& settings,
                                     Timestamp now,
                                     ReconcileReport& report);

    [[nodiscard]] Status record_event(EventKind kind,
                                      std::string message,
                                      const Uuid& device_id,
                                      Timestamp now,
                                      std::map<std::string, std::string> metadata = {});
    void send(Notification notification);

    storage::DeviceRepository& devices_;
    storage::EventRepository& events_;
    NotificationSink& sink_;
    ScanState& state_;
    FingerprintDispatch dispatch_fingerprint_;
};

} // namespace lantern::scan
