#include "daemon/config.hpp"

#include "core/subnet.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QHostAddress>
#include <QSettings>
#include <QStandardPaths>

namespace lantern::daemon {
namespace {

QString absolute_with_parent(const QString& path) {
    QFileInfo info(path);
    QDir dir(info.absolutePath());
    if (!dir.exists()) {
        dir.mkpath(".");
    }
    return info.absoluteFilePath();
}

QString data_file(const QString& name) {
    QString dataPath = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir dir(dataPath);
    if (!dir.exists()) {
        dir.mkpath(".");
    }
    return dataPath + "/" + name;
}

} // namespace

QString resolve_database_path(const QString& override_path) {
    if (!override_path.isEmpty()) {
        return absolute_with_parent(override_path);
    }

    const auto envPath = qEnvironmentVariable("LANTERN_DB_PATH");
    if (!envPath.isEmpty()) {
        return absolute_with_parent(envPath);
    }

    QSettings settings;
    const auto stored = settings.value("database/path").toString();
    if (!stored.isEmpty()) {
        return absolute_with_parent(stored);
    }

    return data_file("lantern.db");
}

QString resolve_notifications_path(const QString& override_path) {
    if (!override_path.isEmpty()) {
        return absolute_with_parent(override_path);
    }

    QSettings settings;
    const auto stored = settings.value("notifications/path").toString();
    if (!stored.isEmpty()) {
        return absolute_with_parent(stored);
    }

    return data_file("notifications.json");
}

Result<Config, Error> parse_config(const QStringList& arguments) {
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Lantern LAN discovery daemon"));
    const auto helpOption = parser.addHelpOption();
    const auto versionOption = parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Database path (overrides LANTERN_DB_PATH and database/path)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption subnetOption(
        QStringList{QStringLiteral("subnet")},
        QStringLiteral("Subnet to sweep, in CIDR notation (stored as ip_range)."),
        QStringLiteral("cidr"));
    parser.addOption(subnetOption);

    const QCommandLineOption dnsServerOption(
        QStringList{QStringLiteral("dns-server")},
        QStringLiteral("Nameserver for reverse DNS lookups (stored as dns_server)."),
        QStringLiteral("addr"));
    parser.addOption(dnsServerOption);

    const QCommandLineOption intervalOption(
        QStringList{QStringLiteral("interval")},
        QStringLiteral("Minutes between scans (stored as scan_interval_minutes)."),
        QStringLiteral("minutes"));
    parser.addOption(intervalOption);

    const QCommandLineOption onceOption(
        QStringList{QStringLiteral("once")},
        QStringLiteral("Run a single scan cycle, wait for fingerprints, and exit."));
    parser.addOption(onceOption);

    const QCommandLineOption debugOption(
        QStringList{QStringLiteral("debug")},
        QStringLiteral("Enable debug logging for all lantern categories."));
    parser.addOption(debugOption);

    const QCommandLineOption notificationsOption(
        QStringList{QStringLiteral("notifications")},
        QStringLiteral("Notification feed file (overrides notifications/path)."),
        QStringLiteral("path"));
    parser.addOption(notificationsOption);

    if (!parser.parse(arguments)) {
        return Result<Config, Error>::err(Error{parser.errorText().toStdString()});
    }
    if (!parser.positionalArguments().isEmpty()) {
        return Result<Config, Error>::err(
            Error{"unexpected argument: " + parser.positionalArguments().first().toStdString()});
    }

    Config config;
    config.show_help = parser.isSet(helpOption);
    config.show_version = parser.isSet(versionOption);
    config.help_text = parser.helpText();
    if (config.show_help || config.show_version) {
        return Result<Config, Error>::ok(std::move(config));
    }

    if (parser.isSet(subnetOption)) {
        const auto value = parser.value(subnetOption).toStdString();
        if (!Subnet::parse(value)) {
            return Result<Config, Error>::err(Error{"invalid --subnet '" + value + "'"});
        }
        config.subnet = value;
    }

    if (parser.isSet(dnsServerOption)) {
        const auto value = parser.value(dnsServerOption);
        if (QHostAddress(value).isNull()) {
            return Result<Config, Error>::err(
                Error{"invalid --dns-server '" + value.toStdString() + "'"});
        }
        config.dns_server = value.toStdString();
    }

    if (parser.isSet(intervalOption)) {
        bool ok = false;
        const int minutes = parser.value(intervalOption).toInt(&ok);
        if (!ok || minutes <= 0) {
            return Result<Config, Error>::err(
                Error{"invalid --interval '" + parser.value(intervalOption).toStdString() + "'"});
        }
        config.interval_minutes = minutes;
    }

    config.once = parser.isSet(onceOption);
    config.debug = parser.isSet(debugOption);
    config.database_path = resolve_database_path(parser.value(dbPathOption));
    config.notifications_path = resolve_notifications_path(parser.value(notificationsOption));

    return Result<Config, Error>::ok(std::move(config));
}

Status apply_overrides(const Config& config, storage::SettingsRepository& settings) {
    namespace keys = storage::setting_keys;

    if (config.subnet) {
        auto saved = settings.set(keys::kIpRange, *config.subnet);
        if (saved.is_err()) return saved;
    }
    if (config.dns_server) {
        auto saved = settings.set(keys::kDnsServer, *config.dns_server);
        if (saved.is_err()) return saved;
    }
    if (config.interval_minutes) {
        auto saved = settings.set_int(keys::kScanIntervalMinutes, *config.interval_minutes);
        if (saved.is_err()) return saved;
    }
    return Status::ok();
}

} // namespace lantern::daemon
