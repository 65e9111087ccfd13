#pragma once

#include "common/config.hpp"
#include "connection_model.hpp"

#include <QtCore/QMap>
#include <QtCore/QObject>
#include <QtCore/QPair>
#include <QtCore/QVector>
#include <QtNetwork/QHostAddress>

namespace ab::common {
class EventLog;
}

class Listener;

struct ReconcileReport {
    QVector<quint16> started;
    QVector<quint16> stopped;
    // Port and the socket error text.
    QVector<QPair<quint16, QString>> failed;
    QVector<quint16> unchanged;

    bool converged() const { return started.isEmpty() && stopped.isEmpty() && failed.isEmpty(); }
};

struct ListenerState {
    quint16 port = 0;
    QString name;
    bool running = false;
    int connections = 0;
};

// Owns the live listener set and keeps it equal to the enabled entries of the
// configuration.
class ListenerManager : public QObject {
    Q_OBJECT

public:
    explicit ListenerManager(ab::common::EventLog *events = nullptr, QObject *parent = nullptr);
    ~ListenerManager() override;

    void setBindAddress(const QHostAddress &address);

    ReconcileReport reconcile(const QVector<ab::config::ListenerEntry> &desired);

    // A port already running is a no-op with a warning and returns true.
    bool startListener(quint16 port, const QString &name = QString(), QString *error = nullptr);
    // Stopping a port that is not running is a no-op.
    void stopListener(quint16 port);
    void stopAll();

    bool isRunning(quint16 port) const;
    QVector<quint16> runningPorts() const;
    int connectionCount(quint16 port) const;
    QVector<ListenerState> states() const;
    ConnectionModel *connections();

signals:
    void lineReceived(quint16 port, const QString &trigger, const QString &peer);
    void listenerStarted(quint16 port);
    void listenerStopped(quint16 port);

private:
    ab::common::EventLog *events_;
    QHostAddress bindAddress_ = QHostAddress::Any;
    QMap<quint16, Listener *> listeners_;
    ConnectionModel connections_;
};
