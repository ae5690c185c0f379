#pragma once

#include "core/result.hpp"

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lanternDiscoveryLog)
Q_DECLARE_LOGGING_CATEGORY(lanternSessionLog)
Q_DECLARE_LOGGING_CATEGORY(lanternAvahiLog)

namespace lantern {

// LANTERN_LOG_FILE if set, otherwise logs/lantern.log under the app data
// directory. Empty when no writable location exists.
[[nodiscard]] QString default_log_file_path();

/**
 * Route Qt messages to `path` (appending) and echo warnings and worse to
 * stderr. Calling it again switches to the new file. Fails without touching
 * the current handler if the file cannot be opened.
 */
Result<void, Error> install_file_logging(const QString& path);

// Restores the handler that was active before install_file_logging().
void uninstall_file_logging();

// Toggles the debug level of the lantern.* categories.
void enable_debug_logging(bool enabled);

} // namespace lantern
