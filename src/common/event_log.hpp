#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QObject>
#include <QtCore/QStringList>
#include <QtCore/QVector>

namespace ab::common {

enum class EventKind {
    System,
    Config,
    TcpServer,
    TcpError,
    TcpCommand,
    TcpWarning,
    TcpCapture,
    MappingFound,
    MappingError,
    AutomatorError,
    HttpTrigger,
    HttpSuccess,
    HttpTransportError,
    HttpTimeout,
    HttpStatusError,
    CatalogRefresh,
};

QString to_string(EventKind kind);

struct EventEntry {
    QDateTime timestamp;
    EventKind kind = EventKind::System;
    QString detail;

    QString toLine() const;
};

// Operator-facing history of what the bridge did with each trigger. Bounded;
// the oldest entries are dropped once maxEntries is exceeded.
class EventLog : public QObject {
    Q_OBJECT

public:
    static constexpr int kDefaultMaxEntries = 200;
    static constexpr int kDefaultRecent = 100;

    explicit EventLog(int maxEntries = kDefaultMaxEntries, QObject *parent = nullptr);

    void append(EventKind kind, const QString &detail);

    QVector<EventEntry> recent(int count = kDefaultRecent) const;
    QStringList toLines(int count = kDefaultRecent) const;
    int size() const;
    int maxEntries() const;
    void clear();

signals:
    void appended(const ab::common::EventEntry &entry);

private:
    int maxEntries_;
    QVector<EventEntry> entries_;
};

}  // namespace ab::common
