#pragma once

#include <QMutex>
#include <QTime>

#include <atomic>
#include <deque>
#include <string>
#include <string_view>
#include <vector>

namespace lantern::scan {

/**
 * ScanStatus - snapshot exposed to callers polling for progress.
 */
struct ScanStatus {
    bool is_scanning = false;
    std::vector<std::string> recent_log_lines;
};

/**
 * ScanState - process-wide scan gate and progress log.
 *
 * try_begin() is the only way to enter a cycle; it succeeds for exactly one
 * caller until finish(). The log keeps the kMaxLogLines most recent lines.
 */
class ScanState {
public:
    static constexpr size_t kMaxLogLines = 50;

    [[nodiscard]] bool try_begin() noexcept {
        bool expected = false;
        return scanning_.compare_exchange_strong(expected, true);
    }

    void finish() noexcept { scanning_.store(false); }

    [[nodiscard]] bool is_scanning() const noexcept { return scanning_.load(); }

    /**
     * Append "[HH:mm:ss] message" and echo it to the lantern.scan category.
     */
    void log(std::string_view message);
    void log_at(const QTime& time, std::string_view message);

    void clear_log();

    [[nodiscard]] std::vector<std::string> recent_log_lines() const;
    [[nodiscard]] ScanStatus status() const;

private:
    std::atomic<bool> scanning_{false};
    mutable QMutex mu_;
    std::deque<std::string> lines_;
};

} // namespace lantern::scan
