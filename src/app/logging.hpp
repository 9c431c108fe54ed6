#pragma once

#include <QDateTime>
#include <QString>
#include <QtGlobal>

namespace listall::app {

struct LogConfig {
    // Empty: no log file, stderr only.
    QString file_path;
    bool mirror_to_stderr = true;
};

// LISTALL_LOG_PATH when set, else <AppLocalDataLocation>/logs/listall.log.
// Empty when no writable location exists.
QString default_log_file_path();

/**
 * One log record: `<ISO time> <LEVEL> <category> <message>`.
 *
 * Continuation lines of a multi-line message (validation summaries, conflict
 * lists) are indented by two spaces so every record starts at column 0.
 */
QString format_log_record(const QDateTime& when, QtMsgType type,
                          const QString& category, const QString& message);

/**
 * Install the listall message handler. Debug output of categories outside
 * listall.* is dropped.
 *
 * Returns false when the log file cannot be opened; messages still reach
 * stderr when mirroring is on.
 */
bool install_file_logging(const LogConfig& config);
bool install_file_logging();

// Close the log file and restore the handler that was active before.
void uninstall_file_logging();

} // namespace listall::app
