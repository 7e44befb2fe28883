#include "scan/reconciler.hpp"

#include "network/log.hpp"

#include <exception>

namespace lantern::scan {

Reconciler::Reconciler(storage::DeviceRepository& devices,
                       storage::EventRepository& events,
                       NotificationSink& sink,
                       ScanState& state,
                       FingerprintDispatch dispatch_fingerprint)
    : devices_(devices)
    , events_(events)
    , sink_(sink)
    , state_(state)
    , dispatch_fingerprint_(std::move(dispatch_fingerprint))
{
}

void Reconciler::send(Notification notification) {
    try {
        sink_.notify(notification);
    } catch (const std::exception& e) {
        qCWarning(lanternNotifyLog) << "notification dropped:" << e.what();
    }
}

Status Reconciler::record_event(EventKind kind,
                                std::string message,
                                const Uuid& device_id,
                                Timestamp now,
                                std::map<std::string, std::string> metadata) {
    auto appended = events_.append_event(DomainEvent{
        .id = 0,
        .kind = kind,
        .message = std::move(message),
        .device_id = device_id,
        .timestamp = now,
        .metadata = std::move(metadata)
    });
    if (appended.is_err()) {
        return Status::err(appended.unwrap_err());
    }
    return Status::ok();
}

Result<ReconcileReport, Error> Reconciler::reconcile(const std::vector<ObservedHost>& hosts,
                                                     const storage::ScanSettings& settings,
                                                     Timestamp now) {
    ReconcileReport report;

    auto count = devices_.count();
    if (count.is_err()) {
        return Result<ReconcileReport, Error>::err(count.unwrap_err());
    }
    report.first_run = count.unwrap() == 0;

    std::set<std::string> observed_macs;
    for (const auto& host : hosts) {
        if (!host.mac) {
            ++report.skipped_without_mac;
            continue;
        }
        const auto& mac = *host.mac;
        if (!observed_macs.insert(mac).second) {
            // Proxy-ARP extenders answer for several addresses with one MAC.
            ++report.skipped_duplicate_mac;
            state_.log("Ignoring " + host.ip + ": " + mac + " already seen this cycle");
            continue;
        }

        Status outcome = Status::ok();
        auto existing = devices_.find_by_mac(mac);
        if (existing.is_err()) {
            outcome = Status::err(existing.unwrap_err());
        } else if (existing.unwrap()) {
            outcome = update_existing(*existing.unwrap(), host, settings, now, report);
        } else {
            outcome = create_new(mac, host, settings, now, report);
        }

        if (outcome.is_err()) {
            ++report.failed;
            state_.log("Failed to record " + host.ip + " (" + mac + "): " +
                       outcome.unwrap_err().message);
            qCWarning(lanternStorageLog) << "reconcile" << QString::fromStdString(mac)
                                         << QString::fromStdString(outcome.unwrap_err().message);
        }
    }

    if (report.created > 0) {
        state_.log("Registered " + std::to_string(report.created) + " new devices");
    }

    auto absent = mark_absent(observed_macs, settings, now, report);
    if (absent.is_err()) {
        return Result<ReconcileReport, Error>::err(absent.unwrap_err());
    }

    if (report.first_run && report.created > 0) {
        send(Notification{
            .kind = NotificationKind::NewDevice,
            .title = "Initial Scan Complete",
            .message = "Discovered " + std::to_string(report.created) + " devices on the network",
            .metadata = {{"count", std::to_string(report.created)}}
        });
    }

    return Result<ReconcileReport, Error>::ok(std::move(report));
}

Status Reconciler::update_existing(Device existing,
                                   const ObservedHost& host,
                                   const storage::ScanSettings& settings,
                                   Timestamp now,
                                   ReconcileReport& report) {
    const auto old_ip = existing.ip;
    const bool was_offline = existing.status == DeviceStatus::Offline;
    const bool ip_changed = old_ip != host.ip;
    const bool user_named = has_user_set_name(existing);

    Device updated = existing;
    updated.ip = host.ip;
    if (updated.vendor.empty() && host.vendor) {
        updated.vendor = *host.vendor;
    }
    if (updated.type == DeviceType::Unknown) {
        updated.type = host.type;
    }
    if (!user_named && host.resolved_name) {
        updated.name = *host.resolved_name;
    }
    updated.status = DeviceStatus::Online;
    updated.last_seen = now;

    auto saved = devices_.update(updated);
    if (saved.is_err()) return saved;
    ++report.updated;

    if (ip_changed) {
        ++report.ip_changes;
        auto event = record_event(
            EventKind::IpChange,
            "Device " + display_label(updated) + " changed IP from " + old_ip + " to " + host.ip,
            updated.id, now,
            {{"old_ip", old_ip}, {"new_ip", host.ip}});
        if (event.is_err()) return event;

        if (settings.notify_ip_change) {
            send(Notification{
                .kind = NotificationKind::IpChange,
                .title = "IP Address Changed",
                .message = display_label(updated) + " moved from " + old_ip + " to " + host.ip,
                .metadata = {{"deviceId", updated.id.to_string()},
                             {"old_ip", old_ip},
                             {"new_ip", host.ip}}
            });
        }
    }

    auto history = events_.append_history(updated.id, DeviceStatus::Online, std::nullopt, now);
    if (history.is_err()) return history;

    if (was_offline) {
        ++report.came_online;
        auto event = record_event(EventKind::Online,
                                  "Device " + display_label(updated) + " coming online",
                                  updated.id, now);
        if (event.is_err()) return event;

        if (settings.notify_online || has_tag(existing, kTagNotifyOnline)) {
            send(Notification{
                .kind = NotificationKind::DeviceStatus,
                .title = "Device Online",
                .message = display_label(updated) + " (" + updated.ip + ") is back online",
                .metadata = {{"deviceId", updated.id.to_string()}, {"status", "online"}}
            });
        }
    }

    return Status::ok();
}

Status Reconciler::create_new(const std::string& mac,
                              const ObservedHost& host,
                              const storage::ScanSettings& settings,
                              Timestamp now,
                              ReconcileReport& report) {
    auto device = create_device(mac,
                                host.ip,
                                host.resolved_name.value_or(std::string(kDefaultDeviceName)),
                                host.vendor.value_or(""),
                                host.type);
    device.first_seen = now;
    device.last_seen = now;

    auto inserted = devices_.insert(device);
    if (inserted.is_err()) return inserted;
    ++report.created;
    report.new_device_ids.push_back(device.id);

    auto event = record_event(EventKind::NewDevice,
                              "New Device found: " + device.ip + " (" + device.mac + ")",
                              device.id, now);
    if (event.is_err()) return event;

    auto history = events_.append_history(device.id, DeviceStatus::Online, std::nullopt, now);
    if (history.is_err()) return history;

    if (dispatch_fingerprint_) {
        state_.log("Queuing deep scan for new device: " + device.ip);
        dispatch_fingerprint_(device.id, device.ip);
    }

    if (!report.first_run && settings.notify_new_device) {
        send(Notification{
            .kind = NotificationKind::NewDevice,
            .title = "New Device Detected",
            .message = display_label(device) + " (" + device.ip + ", " + device.mac +
                       ") joined the network",
            .metadata = {{"deviceId", device.id.to_string()},
                         {"ip", device.ip},
                         {"mac", device.mac}}
        });
    }

    return Status::ok();
}

Status Reconciler::mark_absent(const std::set<std::string>& observed_macs,
                               const storage::ScanSettings& settings,
                               Timestamp now,
                               ReconcileReport& report) {
    auto all = devices_.all();
    if (all.is_err()) {
        return Status::err(all.unwrap_err());
    }

    for (const auto& device : all.unwrap()) {
        if (observed_macs.count(device.mac)) continue;

        auto history = events_.append_history(device.id, DeviceStatus::Offline, std::nullopt, now);
        if (history.is_err()) {
            ++report.failed;
            qCWarning(lanternStorageLog) << "offline history" << QString::fromStdString(device.mac)
                                         << QString::fromStdString(history.unwrap_err().message);
            continue;
        }

        if (device.status != DeviceStatus::Online) continue;

        state_.log("Device went offline: " + display_label(device));

        auto flipped = devices_.set_status(device.id, DeviceStatus::Offline);
        if (flipped.is_err()) {
            ++report.failed;
            qCWarning(lanternStorageLog) << "offline status" << QString::fromStdString(device.mac)
                                         << QString::fromStdString(flipped.unwrap_err().message);
            continue;
        }
        ++report.went_offline;

        auto event = record_event(EventKind::Offline,
                                  "Device " + display_label(device) + " went offline",
                                  device.id, now);
        if (event.is_err()) {
            ++report.failed;
            qCWarning(lanternStorageLog) << "offline event" << QString::fromStdString(device.mac)
                                         << QString::fromStdString(event.unwrap_err().message);
        }

        if (settings.notify_offline || has_tag(device, kTagNotifyOffline)) {
            send(Notification{
                .kind = NotificationKind::DeviceStatus,
                .title = "Device Offline",
                .message = display_label(device) + " (" + device.ip + ") went offline",
                .metadata = {{"deviceId", device.id.to_string()}, {"status", "offline"}}
            });
        }
    }

    return Status::ok();
}

} // namespace lantern::scan
