#include <catch2/catch_test_macros.hpp>
#include "scan/notification_feed.hpp"

#include <QFile>
#include <QTemporaryDir>

#include <memory>
#include <stdexcept>

using namespace lantern;
using namespace lantern::scan;

namespace {

Notification make(const std::string& title) {
    return Notification{
        .kind = NotificationKind::NewDevice,
        .title = title,
        .message = title + " joined the network",
        .metadata = {{"ip", "192.168.1.9"}}
    };
}

} // namespace

TEST_CASE("Notification feed persists newest first", "[notifications]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("feed/notifications.json"));

    {
        NotificationFeed feed(path);
        REQUIRE(feed.all().empty());

        feed.notify(make("first"));
        feed.notify(make("second"));

        auto entries = feed.all();
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].title == "second");
        REQUIRE(entries[1].title == "first");
        REQUIRE(feed.unread_count() == 2);
        REQUIRE(QFile::exists(path));
    }

    NotificationFeed reloaded(path);
    auto entries = reloaded.all();
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].title == "second");
    REQUIRE(entries[0].kind == NotificationKind::NewDevice);
    REQUIRE(entries[0].metadata.at("ip") == "192.168.1.9");
    REQUIRE_FALSE(entries[0].read);

    SECTION("Mark read and remove") {
        REQUIRE(reloaded.mark_read(entries[1].id));
        REQUIRE(reloaded.unread_count() == 1);
        REQUIRE_FALSE(reloaded.mark_read(Uuid::generate()));

        REQUIRE(reloaded.remove(entries[0].id));
        REQUIRE_FALSE(reloaded.remove(entries[0].id));

        NotificationFeed again(path);
        REQUIRE(again.all().size() == 1);
        REQUIRE(again.all()[0].read);
    }

    SECTION("Clear") {
        REQUIRE(reloaded.clear().is_ok());
        REQUIRE(reloaded.all().empty());
        REQUIRE(NotificationFeed(path).all().empty());
    }
}

TEST_CASE("Notification feed is capped", "[notifications]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    NotificationFeed feed(dir.filePath(QStringLiteral("notifications.json")));

    for (size_t i = 0; i < NotificationFeed::kMaxEntries + 5; ++i) {
        feed.notify(make("n" + std::to_string(i)));
    }

    auto entries = feed.all();
    REQUIRE(entries.size() == NotificationFeed::kMaxEntries);
    REQUIRE(entries.front().title == "n" + std::to_string(NotificationFeed::kMaxEntries + 4));
}

TEST_CASE("Unreadable feed file starts empty", "[notifications]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("notifications.json"));

    QFile file(path);
    REQUIRE(file.open(QIODevice::WriteOnly));
    file.write("{not json");
    file.close();

    NotificationFeed feed(path);
    REQUIRE(feed.all().empty());
    feed.notify(make("fresh"));
    REQUIRE(NotificationFeed(path).all().size() == 1);
}

TEST_CASE("Fan-out sink isolates failures", "[notifications]") {
    struct Throwing : NotificationSink {
        void notify(const Notification&) override { throw std::runtime_error("boom"); }
    };
    struct Counting : NotificationSink {
        int calls = 0;
        void notify(const Notification&) override { ++calls; }
    };

    FanoutNotificationSink fanout;
    auto counting = std::make_shared<Counting>();
    fanout.add(std::make_shared<Throwing>());
    fanout.add(counting);

    REQUIRE_NOTHROW(fanout.notify(make("x")));
    REQUIRE(counting->calls == 1);
}
