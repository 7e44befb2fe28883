#include "scan/notification_feed.hpp"

#include "network/log.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>

#include <algorithm>

namespace lantern::scan {
namespace {

QJsonObject to_json(const FeedEntry& entry) {
    QJsonObject metadata;
    for (const auto& [key, value] : entry.metadata) {
        metadata[QString::fromStdString(key)] = QString::fromStdString(value);
    }

    const auto kind = to_string(entry.kind);

    QJsonObject obj;
    obj["id"] = QString::fromStdString(entry.id.to_string());
    obj["type"] = QString::fromLatin1(kind.data(), static_cast<qsizetype>(kind.size()));
    obj["title"] = QString::fromStdString(entry.title);
    obj["message"] = QString::fromStdString(entry.message);
    obj["timestamp"] = QString::fromStdString(entry.timestamp.to_iso_string());
    obj["read"] = entry.read;
    obj["metadata"] = metadata;
    return obj;
}

std::optional<FeedEntry> from_json(const QJsonObject& obj) {
    auto id = Uuid::parse(obj["id"].toString().toStdString());
    auto kind = notification_kind_from_string(obj["type"].toString().toStdString());
    const auto when = QDateTime::fromString(obj["timestamp"].toString(), Qt::ISODateWithMs);
    if (!id || !kind || !when.isValid()) {
        return std::nullopt;
    }

    FeedEntry entry{
        .id = *id,
        .kind = *kind,
        .title = obj["title"].toString().toStdString(),
        .message = obj["message"].toString().toStdString(),
        .timestamp = Timestamp(when.toMSecsSinceEpoch()),
        .read = obj["read"].toBool(),
        .metadata = {}
    };

    const auto metadata = obj["metadata"].toObject();
    for (auto it = metadata.begin(); it != metadata.end(); ++it) {
        entry.metadata[it.key().toStdString()] = it.value().toString().toStdString();
    }
    return entry;
}

} // namespace

NotificationFeed::NotificationFeed(QString path)
    : path_(std::move(path))
{
    load();
}

void NotificationFeed::load() {
    QFile file(path_);
    if (!file.exists()) return;
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lanternNotifyLog) << "feed: cannot read" << path_ << file.errorString();
        return;
    }

    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isArray()) {
        qCWarning(lanternNotifyLog) << "feed: ignoring unreadable" << path_ << err.errorString();
        return;
    }

    for (const auto& value : doc.array()) {
        if (auto entry = from_json(value.toObject())) {
            entries_.push_back(std::move(*entry));
        }
    }

    std::stable_sort(entries_.begin(), entries_.end(), [](const FeedEntry& a, const FeedEntry& b) {
        return a.timestamp > b.timestamp;
    });
    if (entries_.size() > kMaxEntries) {
        entries_.resize(kMaxEntries);
    }
}

Status NotificationFeed::save() const {
    const QFileInfo info(path_);
    QDir().mkpath(info.absolutePath());

    QJsonArray array;
    for (const auto& entry : entries_) {
        array.append(to_json(entry));
    }

    QSaveFile file(path_);
    if (!file.open(QIODevice::WriteOnly)) {
        return Status::err(Error{"cannot write " + path_.toStdString() + ": " +
                                 file.errorString().toStdString()});
    }
    file.write(QJsonDocument(array).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        return Status::err(Error{"cannot commit " + path_.toStdString() + ": " +
                                 file.errorString().toStdString()});
    }
    return Status::ok();
}

void NotificationFeed::notify(const Notification& notification) {
    QMutexLocker lock(&mu_);

    entries_.insert(entries_.begin(), FeedEntry{
        .id = Uuid::generate(),
        .kind = notification.kind,
        .title = notification.title,
        .message = notification.message,
        .timestamp = Timestamp::now(),
        .read = false,
        .metadata = notification.metadata
    });
    if (entries_.size() > kMaxEntries) {
        entries_.resize(kMaxEntries);
    }

    auto saved = save();
    if (saved.is_err()) {
        qCWarning(lanternNotifyLog) << "feed:" << QString::fromStdString(saved.unwrap_err().message);
    }
}

std::vector<FeedEntry> NotificationFeed::all() const {
    QMutexLocker lock(&mu_);
    return entries_;
}

size_t NotificationFeed::unread_count() const {
    QMutexLocker lock(&mu_);
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                             [](const FeedEntry& e) { return !e.read; }));
}

bool NotificationFeed::mark_read(const Uuid& id) {
    QMutexLocker lock(&mu_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const FeedEntry& e) { return e.id == id; });
    if (it == entries_.end()) return false;

    it->read = true;
    auto saved = save();
    if (saved.is_err()) {
        qCWarning(lanternNotifyLog) << "feed:" << QString::fromStdString(saved.unwrap_err().message);
    }
    return true;
}

bool NotificationFeed::remove(const Uuid& id) {
    QMutexLocker lock(&mu_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const FeedEntry& e) { return e.id == id; });
    if (it == entries_.end()) return false;

    entries_.erase(it);
    auto saved = save();
    if (saved.is_err()) {
        qCWarning(lanternNotifyLog) << "feed:" << QString::fromStdString(saved.unwrap_err().message);
    }
    return true;
}

Status NotificationFeed::clear() {
    QMutexLocker lock(&mu_);
    entries_.clear();
    return save();
}

} // namespace lantern::scan
