#pragma once

#include "core/result.hpp"

#include <QDateTime>
#include <QString>
#include <QtGlobal>

namespace marginalia::ui {

struct LogOptions {
    // Empty means default_log_file_path().
    QString file_path;
    // Enables marginalia.* debug output and echoes it to stderr.
    bool verbose = false;
    // Lowest level copied to stderr when not verbose.
    QtMsgType echo_threshold = QtWarningMsg;
};

/**
 * Routes Qt messages to the log file and echoes the severe ones to stderr.
 *
 * Can be called again to switch file or verbosity. When the file cannot be
 * opened, logging continues on stderr only and the error is returned.
 */
Result<void> install_logging(const LogOptions& options = {});

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

// "<utc time> <level> <category> <message>", one line per message.
QString format_log_line(QtMsgType type, const char* category, const QString& msg, const QDateTime& when);

} // namespace marginalia::ui
