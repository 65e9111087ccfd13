#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QFile>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QString>

namespace ab::common {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error,
};

QString to_string(LogLevel level);

class Logger : public QObject {
    Q_OBJECT

public:
    static Logger &instance();

    void log(LogLevel level, const QString &category, const QString &message);

    void setMinimumLevel(LogLevel level);
    LogLevel minimumLevel() const;

    // Appends every record to the given file in addition to stderr. An empty
    // path closes the current file.
    bool setLogFile(const QString &path, QString *error = nullptr);
    QString logFile() const;

    void setConsoleEnabled(bool enabled);

signals:
    void messageLogged(LogLevel level, QString category, QString message, QDateTime timestamp);

private:
    explicit Logger(QObject *parent = nullptr);

    QString format(LogLevel level, const QString &category, const QString &message,
                   const QDateTime &timestamp) const;

    mutable QMutex mutex_;
    LogLevel minimumLevel_ = LogLevel::Info;
    bool consoleEnabled_ = true;
    QFile file_;
};

}  // namespace ab::common
