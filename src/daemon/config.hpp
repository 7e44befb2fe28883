#pragma once

#include "core/result.hpp"
#include "storage/settings_repository.hpp"

#include <QString>
#include <QStringList>

#include <optional>
#include <string>

namespace lantern::daemon {

/**
 * Config - process-level configuration of lanternd.
 *
 * Paths are resolved at parse time: command line first, then the
 * LANTERN_DB_PATH environment variable (database only), then QSettings
 * (`database/path`, `notifications/path`), then the application data
 * directory. Scan overrides are optional and, when present, are written to
 * the settings table by apply_overrides().
 */
struct Config {
    QString database_path;
    QString notifications_path;

    std::optional<std::string> subnet;
    std::optional<std::string> dns_server;
    std::optional<int> interval_minutes;

    bool once = false;
    bool debug = false;

    bool show_help = false;
    bool show_version = false;
    QString help_text;
};

/**
 * Parse `arguments` (argv, program name first). Unknown options and invalid
 * values yield an error with a user-facing message.
 */
[[nodiscard]] Result<Config, Error> parse_config(const QStringList& arguments);

[[nodiscard]] QString resolve_database_path(const QString& override_path);
[[nodiscard]] QString resolve_notifications_path(const QString& override_path);

/**
 * Persist the command-line scan overrides into the settings table.
 */
[[nodiscard]] Status apply_overrides(const Config& config, storage::SettingsRepository& settings);

} // namespace lantern::daemon
