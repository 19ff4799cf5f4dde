#include "ui/logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMutex>
#include <QStandardPaths>

#include <cstdio>

namespace marginalia::ui {
namespace {

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

// QtMsgType is not ordered by severity (QtInfoMsg comes last).
int severity(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return 0;
        case QtInfoMsg: return 1;
        case QtWarningMsg: return 2;
        case QtCriticalMsg: return 3;
        case QtFatalMsg: return 4;
    }
    return 4;
}

struct LogSink {
    QMutex mu;
    QFile file;
    int echo_from = severity(QtWarningMsg);

    bool echoes(QtMsgType type) const { return severity(type) >= echo_from; }
};

LogSink& sink() {
    static LogSink s{};
    return s;
}

Result<void> reopen(LogSink& s, const QString& path) {
    if (s.file.isOpen()) {
        s.file.close();
    }
    if (path.isEmpty()) {
        return Result<void>::err(Error::io("no_log_path", "No writable location for the log file"));
    }
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        return Result<void>::err(Error::io("log_dir_failed",
                                           "Cannot create log directory for " + path.toStdString()));
    }
    s.file.setFileName(path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return Result<void>::err(Error::io("log_open_failed",
                                           "Cannot open " + path.toStdString() + ": " +
                                               s.file.errorString().toStdString()));
    }
    return Result<void>::ok();
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = sink();
    QMutexLocker lock(&s.mu);

    const auto line = format_log_line(type, ctx.category, msg, QDateTime::currentDateTimeUtc());
    if (s.file.isOpen()) {
        s.file.write(line.toUtf8());
        s.file.flush();
    }

    if (s.echoes(type)) {
        const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QString{};
        std::fputs(qUtf8Printable(QStringLiteral("%1: %2\n").arg(cat, msg)), stderr);
    }
}

} // namespace

QString format_log_line(QtMsgType type, const char* category, const QString& msg, const QDateTime& when) {
    return QStringLiteral("%1 %2 %3 %4\n")
        .arg(when.toUTC().toString(Qt::ISODateWithMs),
             QString::fromLatin1(level_tag(type)),
             category ? QString::fromLatin1(category) : QString{},
             msg);
}

QString default_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/marginalia.log"));
}

Result<void> install_logging(const LogOptions& options) {
    QLoggingCategory::setFilterRules(options.verbose ? QStringLiteral("marginalia.*.debug=true")
                                                     : QStringLiteral("marginalia.*.debug=false"));

    Result<void> opened = Result<void>::ok();
    {
        auto& s = sink();
        QMutexLocker lock(&s.mu);
        s.echo_from = severity(options.verbose ? QtDebugMsg : options.echo_threshold);
        opened = reopen(s, options.file_path.isEmpty() ? default_log_file_path() : options.file_path);
    }

    qInstallMessageHandler(message_handler);
    return opened;
}

} // namespace marginalia::ui
