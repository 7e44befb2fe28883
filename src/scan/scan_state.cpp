#include "scan/scan_state.hpp"

#include "network/log.hpp"

namespace lantern::scan {

void ScanState::log(std::string_view message) {
    log_at(QTime::currentTime(), message);
}

void ScanState::log_at(const QTime& time, std::string_view message) {
    const auto text = QString::fromUtf8(message.data(), static_cast<qsizetype>(message.size()));
    qCInfo(lanternScanLog).noquote() << text;

    const auto line = QStringLiteral("[%1] %2")
                          .arg(time.toString(QStringLiteral("HH:mm:ss")), text)
                          .toStdString();

    QMutexLocker lock(&mu_);
    lines_.push_back(line);
    while (lines_.size() > kMaxLogLines) {
        lines_.pop_front();
    }
}

void ScanState::clear_log() {
    QMutexLocker lock(&mu_);
    lines_.clear();
}

std::vector<std::string> ScanState::recent_log_lines() const {
    QMutexLocker lock(&mu_);
    return {lines_.begin(), lines_.end()};
}

ScanStatus ScanState::status() const {
    return ScanStatus{
        .is_scanning = is_scanning(),
        .recent_log_lines = recent_log_lines()
    };
}

} // namespace lantern::scan
