#pragma once

#include "scan/scan_orchestrator.hpp"
#include "storage/settings_repository.hpp"

#include <QObject>

#include <chrono>
#include <memory>

class QTimer;

namespace lantern::scan {

inline constexpr std::chrono::milliseconds kDefaultInitialDelay{5000};

/**
 * ScanScheduler - periodic cycle trigger on the Qt event loop.
 *
 * The first cycle starts after the initial delay; after each trigger the
 * timer is re-armed with scan_interval_minutes as stored at that moment, so
 * interval changes apply from the next tick.
 */
class ScanScheduler : public QObject {
    Q_OBJECT

public:
    ScanScheduler(ScanOrchestrator& orchestrator,
                  storage::SettingsRepository& settings,
                  std::chrono::milliseconds initial_delay = kDefaultInitialDelay,
                  QObject* parent = nullptr);
    ~ScanScheduler() override;

    void start();
    void stop();

    [[nodiscard]] bool isActive() const;

    /**
     * Interval the timer will be armed with after the next trigger.
     */
    [[nodiscard]] std::chrono::milliseconds nextInterval();

signals:
    void cycleTriggered(bool started);

private slots:
    void onTimeout();

private:
    ScanOrchestrator& orchestrator_;
    storage::SettingsRepository& settings_;
    std::chrono::milliseconds initial_delay_;
    std::unique_ptr<QTimer> timer_;
};

} // namespace lantern::scan
