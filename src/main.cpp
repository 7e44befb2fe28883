#include <QCoreApplication>
#include <QLoggingCategory>
#include <QTextStream>

#include "daemon/config.hpp"
#include "daemon/logging.hpp"
#include "network/log.hpp"
#include "network/nmap_prober.hpp"
#include "scan/fingerprinter.hpp"
#include "scan/notification_feed.hpp"
#include "scan/notification_sink.hpp"
#include "scan/scan_orchestrator.hpp"
#include "scan/scan_scheduler.hpp"
#include "scan/scan_state.hpp"
#include "storage/database.hpp"
#include "storage/device_repository.hpp"
#include "storage/event_repository.hpp"
#include "storage/migrations.hpp"
#include "storage/settings_repository.hpp"

#include <memory>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("Lantern");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Lantern");
    app.setOrganizationDomain("lantern.local");

    auto parsed = lantern::daemon::parse_config(app.arguments());
    if (parsed.is_err()) {
        QTextStream(stderr) << QString::fromStdString(parsed.unwrap_err().message) << QLatin1Char('\n');
        return 2;
    }
    const auto config = std::move(parsed).unwrap();
    if (config.show_help) {
        QTextStream(stdout) << config.help_text;
        return 0;
    }
    if (config.show_version) {
        QTextStream(stdout) << app.applicationName() << ' ' << app.applicationVersion() << '\n';
        return 0;
    }

    lantern::daemon::install_file_logging();
    if (config.debug) {
        QLoggingCategory::setFilterRules(QStringLiteral("lantern.*.debug=true\n"));
    }
    qInfo() << "Lantern: logging to" << lantern::daemon::default_log_file_path();
    qInfo() << "Lantern: database" << config.database_path;

    auto opened = lantern::storage::Database::open(config.database_path.toStdString());
    if (opened.is_err()) {
        qCCritical(lanternStorageLog) << "cannot open database:"
                                      << opened.unwrap_err().message.c_str();
        return 1;
    }
    auto db = std::move(opened).unwrap();

    auto migrated = lantern::storage::initialize_database(db);
    if (migrated.is_err()) {
        qCCritical(lanternStorageLog) << "migration failed:"
                                      << migrated.unwrap_err().message.c_str();
        return 1;
    }

    lantern::storage::DeviceRepository devices(db);
    lantern::storage::EventRepository events(db);
    lantern::storage::SettingsRepository settings(db);

    auto overridden = lantern::daemon::apply_overrides(config, settings);
    if (overridden.is_err()) {
        qCCritical(lanternStorageLog) << "cannot store settings:"
                                      << overridden.unwrap_err().message.c_str();
        return 1;
    }

    lantern::network::NmapProber prober;
    lantern::scan::Fingerprinter fingerprinter(prober, devices);

    lantern::scan::FanoutNotificationSink sink;
    sink.add(std::make_shared<lantern::scan::LoggingNotificationSink>());
    sink.add(std::make_shared<lantern::scan::NotificationFeed>(config.notifications_path));

    lantern::scan::ScanState state;
    lantern::scan::ScanOrchestrator orchestrator(devices, events, settings, prober,
                                                 fingerprinter, sink, state);

    if (config.once) {
        auto report = orchestrator.run_cycle();
        fingerprinter.wait_idle();
        if (!report) {
            qCWarning(lanternScanLog) << "scan cycle did not complete";
            return 1;
        }
        const auto& r = report->reconcile;
        qCInfo(lanternScanLog) << "cycle done:" << report->swept_hosts << "hosts,"
                               << r.created << "new," << r.updated << "updated,"
                               << r.went_offline << "offline";
        return r.failed > 0 ? 1 : 0;
    }

    lantern::scan::ScanScheduler scheduler(orchestrator, settings);
    QObject::connect(&app, &QCoreApplication::aboutToQuit, &app, [&]() {
        scheduler.stop();
        orchestrator.wait();
        fingerprinter.wait_idle();
    });
    scheduler.start();

    return app.exec();
}
