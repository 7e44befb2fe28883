#include <catch2/catch_test_macros.hpp>
#include "daemon/logging.hpp"

#include <QFile>
#include <QTemporaryDir>

using namespace lantern::daemon;

TEST_CASE("Log lines carry time, level and category", "[daemon][logging]") {
    const auto when = QDateTime::fromMSecsSinceEpoch(0).toUTC();

    REQUIRE(format_log_line(QtWarningMsg, QStringLiteral("lantern.scan"),
                            QStringLiteral("sweep failed"), when) ==
            QStringLiteral("1970-01-01T00:00:00.000Z W lantern.scan sweep failed\n"));
    REQUIRE(format_log_line(QtDebugMsg, QString(), QStringLiteral("x"), when)
                .startsWith(QStringLiteral("1970-01-01T00:00:00.000Z D  x")));
}

TEST_CASE("Default log file lives under app data", "[daemon][logging]") {
    REQUIRE(default_log_file_path().endsWith(QStringLiteral("logs/lantern.log")));
}

TEST_CASE("Log rotation", "[daemon][logging]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("lantern.log"));

    auto write = [](const QString& p, const QByteArray& bytes) {
        QFile f(p);
        REQUIRE(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
        f.write(bytes);
    };

    SECTION("Missing file is left alone") {
        REQUIRE_FALSE(rotate_if_needed(path, 10));
    }

    SECTION("Small file is kept") {
        write(path, "short");
        REQUIRE_FALSE(rotate_if_needed(path, 10));
        REQUIRE(QFile::exists(path));
    }

    SECTION("Full file moves to the backup slot") {
        write(path + QStringLiteral(".1"), "old backup");
        write(path, "0123456789abc");
        REQUIRE(rotate_if_needed(path, 10));
        REQUIRE_FALSE(QFile::exists(path));

        QFile backup(path + QStringLiteral(".1"));
        REQUIRE(backup.open(QIODevice::ReadOnly));
        REQUIRE(backup.readAll() == QByteArray("0123456789abc"));
    }
}
