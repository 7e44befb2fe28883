#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lantern::scan {

enum class NotificationKind {
    NewDevice,
    IpChange,
    DeviceStatus
};

[[nodiscard]] inline std::string_view to_string(NotificationKind kind) {
    switch (kind) {
        case NotificationKind::NewDevice: return "new_device";
        case NotificationKind::IpChange: return "ip_change";
        case NotificationKind::DeviceStatus: return "device_status";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<NotificationKind> notification_kind_from_string(std::string_view str) {
    for (auto kind : {NotificationKind::NewDevice, NotificationKind::IpChange,
                      NotificationKind::DeviceStatus}) {
        if (to_string(kind) == str) return kind;
    }
    return std::nullopt;
}

/**
 * Notification - a user-facing message requested by reconciliation.
 */
struct Notification {
    NotificationKind kind = NotificationKind::NewDevice;
    std::string title;
    std::string message;
    std::map<std::string, std::string> metadata;
};

/**
 * NotificationSink - delivery of notifications.
 *
 * Fire-and-forget: callers catch and log anything notify() throws, and a
 * failed delivery never changes registry state.
 */
class NotificationSink {
public:
    virtual ~NotificationSink() = default;
    virtual void notify(const Notification& notification) = 0;
};

/**
 * Writes each notification to the lantern.notify log category only.
 */
class LoggingNotificationSink final : public NotificationSink {
public:
    void notify(const Notification& notification) override;
};

/**
 * Forwards to every registered sink; one failing sink does not stop the rest.
 */
class FanoutNotificationSink final : public NotificationSink {
public:
    void add(std::shared_ptr<NotificationSink> sink);
    void notify(const Notification& notification) override;

private:
    std::vector<std::shared_ptr<NotificationSink>> sinks_;
};

} // namespace lantern::scan
