#pragma once

#include <QDateTime>
#include <QString>
#include <QtGlobal>

namespace lantern::daemon {

/**
 * The log file is rotated to `<path>.1` once it grows past this size.
 */
inline constexpr qint64 kMaxLogFileBytes = 1024 * 1024;

// Installs a Qt message handler that appends to the log file and echoes every
// line to stderr, so a daemon started by a service manager keeps its journal.
void install_file_logging();

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

// One log line: "<ISO time> <level> <category> <message>\n"
[[nodiscard]] QString format_log_line(QtMsgType type,
                                      const QString& category,
                                      const QString& message,
                                      const QDateTime& when);

/**
 * Move `path` to `path.1` (replacing an older backup) when it has reached
 * `max_bytes`. Returns true when a rotation happened.
 */
bool rotate_if_needed(const QString& path, qint64 max_bytes);

} // namespace lantern::daemon
