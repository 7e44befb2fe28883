#pragma once

#include "core/types.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace lantern {

/**
 * Coarse device category shown next to each registry entry.
 */
enum class DeviceType {
    Unknown,
    Vm,
    Mobile,
    Laptop,
    Iot,
    Router,
    Server
};

enum class DeviceStatus {
    Online,
    Offline
};

enum class EventKind {
    NewDevice,
    IpChange,
    Online,
    Offline
};

[[nodiscard]] inline std::string_view to_string(DeviceType type) {
    switch (type) {
        case DeviceType::Vm: return "vm";
        case DeviceType::Mobile: return "mobile";
        case DeviceType::Laptop: return "laptop";
        case DeviceType::Iot: return "iot";
        case DeviceType::Router: return "router";
        case DeviceType::Server: return "server";
        case DeviceType::Unknown: break;
    }
    return "unknown";
}

[[nodiscard]] inline DeviceType device_type_from_string(std::string_view str) {
    for (auto type : {DeviceType::Vm, DeviceType::Mobile, DeviceType::Laptop,
                      DeviceType::Iot, DeviceType::Router, DeviceType::Server}) {
        if (to_string(type) == str) return type;
    }
    return DeviceType::Unknown;
}

[[nodiscard]] inline std::string_view to_string(DeviceStatus status) {
    return status == DeviceStatus::Online ? "online" : "offline";
}

[[nodiscard]] inline DeviceStatus device_status_from_string(std::string_view str) {
    return str == "online" ? DeviceStatus::Online : DeviceStatus::Offline;
}

[[nodiscard]] inline std::string_view to_string(EventKind kind) {
    switch (kind) {
        case EventKind::NewDevice: return "new_device";
        case EventKind::IpChange: return "ip_change";
        case EventKind::Online: return "online";
        case EventKind::Offline: return "offline";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<EventKind> event_kind_from_string(std::string_view str) {
    for (auto kind : {EventKind::NewDevice, EventKind::IpChange,
                      EventKind::Online, EventKind::Offline}) {
        if (to_string(kind) == str) return kind;
    }
    return std::nullopt;
}

/**
 * Name given to devices no resolver could name.
 */
inline constexpr std::string_view kDefaultDeviceName = "New Device";

/**
 * Per-device notification opt-in tags.
 */
inline constexpr std::string_view kTagNotifyOnline = "notify:online";
inline constexpr std::string_view kTagNotifyOffline = "notify:offline";

/**
 * OpenPort - one entry of a device's last fingerprint.
 */
struct OpenPort {
    int port = 0;
    std::string protocol;
    std::string service;
    std::string state = "open";

    bool operator==(const OpenPort&) const = default;
};

/**
 * Device - one physical network interface ever observed.
 *
 * Identity is the MAC address; the IP is an attribute that may migrate
 * between devices as DHCP leases move.
 */
struct Device {
    Uuid id;
    std::string mac;
    std::string ip;
    std::string name;
    std::string vendor;
    DeviceType type = DeviceType::Unknown;
    std::string os;
    std::string details;
    DeviceStatus status = DeviceStatus::Online;
    Timestamp first_seen;
    Timestamp last_seen;
    std::set<std::string> tags;

    bool operator==(const Device&) const = default;
};

/**
 * DeviceHistoryEntry - status observed for one device in one cycle.
 */
struct DeviceHistoryEntry {
    int64_t id = 0;
    Uuid device_id;
    DeviceStatus status = DeviceStatus::Online;
    std::optional<int> latency_ms;
    Timestamp timestamp;
};

/**
 * DomainEvent - append-only record of a registry state change.
 */
struct DomainEvent {
    int64_t id = 0;
    EventKind kind = EventKind::NewDevice;
    std::string message;
    std::optional<Uuid> device_id;
    Timestamp timestamp;
    std::map<std::string, std::string> metadata;
};

// ============================================================================
// Pure helpers
// ============================================================================

/**
 * Canonical MAC form: upper-case, colon separated. Returns nullopt for
 * anything that is not six hex octets, and for the all-zero address that
 * containers report for interfaces without hardware.
 */
[[nodiscard]] inline std::optional<std::string> normalize_mac(std::string_view raw) {
    std::string hex;
    for (char c : raw) {
        if (c == ':' || c == '-' || c == '.') continue;
        if (!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
        hex += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (hex.size() != 12) return std::nullopt;
    if (hex.find_first_not_of('0') == std::string::npos) return std::nullopt;

    std::string mac;
    for (size_t i = 0; i < 12; i += 2) {
        if (!mac.empty()) mac += ':';
        mac.append(hex, i, 2);
    }
    return mac;
}

[[nodiscard]] inline std::string to_lower(std::string_view str) {
    std::string out(str);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/**
 * A name counts as user-set once it differs from the default placeholder and
 * from the device's own IP literal.
 */
[[nodiscard]] inline bool has_user_set_name(const Device& device) {
    return !device.name.empty() &&
           device.name != kDefaultDeviceName &&
           device.name != device.ip;
}

[[nodiscard]] inline bool has_tag(const Device& device, std::string_view tag) {
    return device.tags.count(std::string(tag)) > 0;
}

/**
 * Human readable label used in event messages.
 */
[[nodiscard]] inline std::string display_label(const Device& device) {
    return device.name.empty() ? device.ip : device.name;
}

/**
 * Create a registry entry for a first sighting.
 */
[[nodiscard]] inline Device create_device(
    std::string mac,
    std::string ip,
    std::string name,
    std::string vendor,
    DeviceType type
) {
    auto now = Timestamp::now();
    return Device{
        .id = Uuid::generate(),
        .mac = std::move(mac),
        .ip = std::move(ip),
        .name = std::move(name),
        .vendor = std::move(vendor),
        .type = type,
        .os = {},
        .details = {},
        .status = DeviceStatus::Online,
        .first_seen = now,
        .last_seen = now,
        .tags = {}
    };
}

} // namespace lantern
