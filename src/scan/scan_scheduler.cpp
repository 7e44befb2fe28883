#include "scan/scan_scheduler.hpp"

#include "network/log.hpp"

#include <QTimer>

namespace lantern::scan {

ScanScheduler::ScanScheduler(ScanOrchestrator& orchestrator,
                             storage::SettingsRepository& settings,
                             std::chrono::milliseconds initial_delay,
                             QObject* parent)
    : QObject(parent)
    , orchestrator_(orchestrator)
    , settings_(settings)
    , initial_delay_(initial_delay)
    , timer_(std::make_unique<QTimer>())
{
    timer_->setSingleShot(true);
    connect(timer_.get(), &QTimer::timeout, this, &ScanScheduler::onTimeout);
}

ScanScheduler::~ScanScheduler() {
    stop();
}

void ScanScheduler::start() {
    qCInfo(lanternScanLog) << "first scan in" << initial_delay_.count() << "ms";
    timer_->start(initial_delay_);
}

void ScanScheduler::stop() {
    timer_->stop();
}

bool ScanScheduler::isActive() const {
    return timer_->isActive();
}

std::chrono::milliseconds ScanScheduler::nextInterval() {
    int minutes = storage::kDefaultScanIntervalMinutes;
    auto loaded = settings_.load();
    if (loaded.is_ok()) {
        minutes = loaded.unwrap().scan_interval_minutes;
    } else {
        qCWarning(lanternStorageLog) << "scheduler: settings unreadable, using default interval:"
                                     << QString::fromStdString(loaded.unwrap_err().message);
    }
    return std::chrono::minutes(minutes);
}

void ScanScheduler::onTimeout() {
    const bool started = orchestrator_.start_cycle();
    if (!started) {
        qCInfo(lanternScanLog) << "scan already running, skipping this tick";
    }
    emit cycleTriggered(started);

    const auto interval = nextInterval();
    qCInfo(lanternScanLog) << "next scan in"
                           << std::chrono::duration_cast<std::chrono::minutes>(interval).count()
                           << "min";
    timer_->start(interval);
}

} // namespace lantern::scan
