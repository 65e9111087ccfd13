#include "logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QMutexLocker>

#include <cstdio>

namespace ab::common {

QString to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return QStringLiteral("DEBUG");
        case LogLevel::Info:
            return QStringLiteral("INFO");
        case LogLevel::Warn:
            return QStringLiteral("WARN");
        case LogLevel::Error:
            return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

Logger::Logger(QObject *parent) : QObject(parent) {}

Logger &Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::log(LogLevel level, const QString &category, const QString &message) {
    const QDateTime timestamp = QDateTime::currentDateTime();
    {
        QMutexLocker locker(&mutex_);
        if (level < minimumLevel_) {
            return;
        }
        const QByteArray line = format(level, category, message, timestamp).toUtf8();
        if (consoleEnabled_) {
            std::fwrite(line.constData(), 1, static_cast<std::size_t>(line.size()), stderr);
            std::fflush(stderr);
        }
        if (file_.isOpen()) {
            file_.write(line);
            file_.flush();
        }
    }
    emit messageLogged(level, category, message, timestamp);
}

void Logger::setMinimumLevel(LogLevel level) {
    QMutexLocker locker(&mutex_);
    minimumLevel_ = level;
}

LogLevel Logger::minimumLevel() const {
    QMutexLocker locker(&mutex_);
    return minimumLevel_;
}

bool Logger::setLogFile(const QString &path, QString *error) {
    QMutexLocker locker(&mutex_);
    if (file_.isOpen()) {
        file_.close();
    }
    if (path.isEmpty()) {
        return true;
    }
    const QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        if (error) {
            *error = QStringLiteral("cannot create log directory %1").arg(info.absolutePath());
        }
        return false;
    }
    file_.setFileName(path);
    if (!file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        if (error) {
            *error = file_.errorString();
        }
        return false;
    }
    return true;
}

QString Logger::logFile() const {
    QMutexLocker locker(&mutex_);
    return file_.isOpen() ? file_.fileName() : QString();
}

void Logger::setConsoleEnabled(bool enabled) {
    QMutexLocker locker(&mutex_);
    consoleEnabled_ = enabled;
}

QString Logger::format(LogLevel level, const QString &category, const QString &message,
                       const QDateTime &timestamp) const {
    return QStringLiteral("%1 - %2 - %3 - %4\n")
        .arg(timestamp.toString(QStringLiteral("yyyy-MM-dd hh:mm:ss.zzz")), category, to_string(level), message);
}

}  // namespace ab::common
