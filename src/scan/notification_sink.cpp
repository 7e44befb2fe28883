#include "scan/notification_sink.hpp"

#include "network/log.hpp"

#include <exception>

namespace lantern::scan {

void LoggingNotificationSink::notify(const Notification& notification) {
    qCInfo(lanternNotifyLog).noquote()
        << QString::fromLatin1(to_string(notification.kind).data(),
                               static_cast<qsizetype>(to_string(notification.kind).size()))
        << QString::fromStdString(notification.title) << "-"
        << QString::fromStdString(notification.message);
}

void FanoutNotificationSink::add(std::shared_ptr<NotificationSink> sink) {
    if (sink) sinks_.push_back(std::move(sink));
}

void FanoutNotificationSink::notify(const Notification& notification) {
    for (const auto& sink : sinks_) {
        try {
            sink->notify(notification);
        } catch (const std::exception& e) {
            qCWarning(lanternNotifyLog) << "notification sink failed:" << e.what();
        }
    }
}

} // namespace lantern::scan
