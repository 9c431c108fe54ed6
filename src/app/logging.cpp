#include "app/logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>

#include <cstdio>

namespace listall::app {
namespace {

const char* level_name(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "DEBUG";
        case QtInfoMsg: return "INFO";
        case QtWarningMsg: return "WARN";
        case QtCriticalMsg: return "ERROR";
        case QtFatalMsg: return "FATAL";
    }
    return "?";
}

bool is_listall_category(const QString& category) {
    return category.startsWith(QStringLiteral("listall."));
}

struct LoggerState {
    QMutex mu;
    QFile file;
    bool mirror = true;
    bool installed = false;
    QtMessageHandler previous = nullptr;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

bool open_log_file(QFile& file, const QString& path) {
    const QDir dir(QFileInfo(path).absolutePath());
    if (!dir.mkpath(QStringLiteral("."))) {
        std::fprintf(stderr, "listall: cannot create log directory %s\n", qPrintable(dir.absolutePath()));
        return false;
    }
    file.setFileName(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "listall: cannot open log file %s: %s\n",
                     qPrintable(path), qPrintable(file.errorString()));
        return false;
    }
    return true;
}

void message_handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    const auto category = ctx.category ? QString::fromLatin1(ctx.category) : QString{};
    if (type == QtDebugMsg && !is_listall_category(category)) {
        return;
    }

    const auto bytes =
        format_log_record(QDateTime::currentDateTimeUtc(), type, category, msg).toUtf8();

    auto& s = state();
    QMutexLocker lock(&s.mu);
    if (s.file.isOpen()) {
        s.file.write(bytes);
        s.file.flush();
    }
    if (s.mirror) {
        std::fwrite(bytes.constData(), 1, static_cast<size_t>(bytes.size()), stderr);
    }
}

} // namespace

QString default_log_file_path() {
    const auto override_path = qEnvironmentVariable("LISTALL_LOG_PATH");
    if (!override_path.isEmpty()) {
        return QFileInfo(override_path).absoluteFilePath();
    }
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/listall.log"));
}

QString format_log_record(const QDateTime& when, QtMsgType type,
                          const QString& category, const QString& message) {
    auto body = message.trimmed();
    body.replace(QLatin1Char('\n'), QStringLiteral("\n  "));
    return QStringLiteral("%1 %2 %3 %4\n")
        .arg(when.toUTC().toString(Qt::ISODateWithMs),
             QString::fromLatin1(level_name(type)),
             category.isEmpty() ? QStringLiteral("-") : category,
             body);
}

bool install_file_logging(const LogConfig& config) {
    auto& s = state();
    bool opened = true;
    {
        QMutexLocker lock(&s.mu);
        if (s.file.isOpen()) {
            s.file.close();
        }
        s.mirror = config.mirror_to_stderr;
        if (!config.file_path.isEmpty()) {
            opened = open_log_file(s.file, config.file_path);
        }
    }
    if (!s.installed) {
        s.previous = qInstallMessageHandler(message_handler);
        s.installed = true;
    }
    return opened;
}

bool install_file_logging() {
    return install_file_logging(LogConfig{.file_path = default_log_file_path()});
}

void uninstall_file_logging() {
    auto& s = state();
    if (s.installed) {
        qInstallMessageHandler(s.previous);
        s.installed = false;
        s.previous = nullptr;
    }
    QMutexLocker lock(&s.mu);
    s.file.close();
}

} // namespace listall::app
