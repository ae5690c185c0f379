#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QtGlobal>

#include <cstdio>

Q_LOGGING_CATEGORY(lanternDiscoveryLog, "lantern.discovery")
Q_LOGGING_CATEGORY(lanternSessionLog, "lantern.session")
Q_LOGGING_CATEGORY(lanternAvahiLog, "lantern.avahi")

namespace lantern {
namespace {

struct FileLog {
    QMutex mu;
    QFile file;
    QtMessageHandler previous = nullptr;
    bool installed = false;
};

FileLog& file_log() {
    static FileLog log;
    return log;
}

char level_letter(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return 'D';
        case QtInfoMsg: return 'I';
        case QtWarningMsg: return 'W';
        case QtCriticalMsg: return 'C';
        case QtFatalMsg: return 'F';
    }
    return '?';
}

void write_message(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    const QString category = ctx.category ? QString::fromLatin1(ctx.category) : QString{};
    const QByteArray line = QStringLiteral("%1 %2 %3 %4\n")
                                .arg(QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs))
                                .arg(QChar::fromLatin1(level_letter(type)))
                                .arg(category, msg)
                                .toUtf8();

    auto& log = file_log();
    {
        QMutexLocker lock(&log.mu);
        if (log.file.isOpen()) {
            log.file.write(line);
            log.file.flush();
        }
    }

    if (type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg) {
        std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
    }
}

} // namespace

QString default_log_file_path() {
    const QString overridden = qEnvironmentVariable("LANTERN_LOG_FILE");
    if (!overridden.isEmpty()) {
        return overridden;
    }

    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/lantern.log"));
}

Result<void, Error> install_file_logging(const QString& path) {
    if (path.isEmpty()) {
        return Result<void, Error>::err(
            Error{"No writable location for the log file", ErrorCode::ConfigurationError});
    }

    const QString dir = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(dir)) {
        return Result<void, Error>::err(Error{
            "Cannot create log directory " + dir.toStdString(), ErrorCode::ConfigurationError});
    }

    auto& log = file_log();
    QMutexLocker lock(&log.mu);

    QFile next(path);
    if (!next.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return Result<void, Error>::err(Error{
            "Cannot open log file " + path.toStdString() + ": " + next.errorString().toStdString(),
            ErrorCode::ConfigurationError});
    }
    next.close();

    log.file.close();
    log.file.setFileName(path);
    if (!log.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return Result<void, Error>::err(
            Error{"Cannot open log file " + path.toStdString(), ErrorCode::ConfigurationError});
    }

    if (!log.installed) {
        log.previous = qInstallMessageHandler(write_message);
        log.installed = true;
    }
    return Result<void, Error>::ok();
}

void uninstall_file_logging() {
    auto& log = file_log();
    QMutexLocker lock(&log.mu);
    if (log.installed) {
        qInstallMessageHandler(log.previous);
        log.previous = nullptr;
        log.installed = false;
    }
    log.file.close();
}

void enable_debug_logging(bool enabled) {
    QLoggingCategory::setFilterRules(enabled
        ? QStringLiteral("lantern.*.debug=true\n")
        : QStringLiteral("lantern.*.debug=false\n"));
}

} // namespace lantern
