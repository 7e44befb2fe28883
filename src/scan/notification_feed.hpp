#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "scan/notification_sink.hpp"

#include <QMutex>
#include <QString>

namespace lantern::scan {

/**
 * FeedEntry - one stored notification.
 */
struct FeedEntry {
    Uuid id;
    NotificationKind kind = NotificationKind::NewDevice;
    std::string title;
    std::string message;
    Timestamp timestamp;
    bool read = false;
    std::map<std::string, std::string> metadata;
};

/**
 * NotificationFeed - the most recent notifications kept in a JSON file.
 *
 * Entries are ordered newest first and capped at kMaxEntries; every change
 * is written through to disk. Thread-safe.
 */
class NotificationFeed final : public NotificationSink {
public:
    static constexpr size_t kMaxEntries = 100;

    explicit NotificationFeed(QString path);

    void notify(const Notification& notification) override;

    [[nodiscard]] std::vector<FeedEntry> all() const;
    [[nodiscard]] size_t unread_count() const;

    /**
     * Returns false when no entry has `id`.
     */
    bool mark_read(const Uuid& id);
    bool remove(const Uuid& id);
    [[nodiscard]] Status clear();

    [[nodiscard]] const QString& path() const { return path_; }

private:
    void load();
    [[nodiscard]] Status save() const;

    QString path_;
    mutable QMutex mu_;
    std::vector<FeedEntry> entries_;
};

} // namespace lantern::scan
