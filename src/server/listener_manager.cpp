#include "listener_manager.hpp"

#include "common/event_log.hpp"
#include "common/logger.hpp"
#include "listener.hpp"

#include <QtCore/QSet>

using ab::common::EventKind;
using ab::common::LogLevel;
using ab::common::Logger;

namespace {

const QString kCategory = QStringLiteral("listener");

}  // namespace

ListenerManager::ListenerManager(ab::common::EventLog *events, QObject *parent)
    : QObject(parent), events_(events) {}

ListenerManager::~ListenerManager() {
    stopAll();
}

void ListenerManager::setBindAddress(const QHostAddress &address) {
    bindAddress_ = address;
}

ReconcileReport ListenerManager::reconcile(const QVector<ab::config::ListenerEntry> &desired) {
    ReconcileReport report;

    QMap<quint16, QString> wanted;
    for (const auto &entry : desired) {
        if (entry.enabled && !wanted.contains(entry.port)) {
            wanted.insert(entry.port, entry.name);
        }
    }

    const QVector<quint16> running = runningPorts();
    for (quint16 port : running) {
        if (!wanted.contains(port)) {
            stopListener(port);
            report.stopped.append(port);
        }
    }

    for (auto it = wanted.cbegin(); it != wanted.cend(); ++it) {
        if (listeners_.contains(it.key())) {
            report.unchanged.append(it.key());
            continue;
        }
        QString error;
        if (startListener(it.key(), it.value(), &error)) {
            report.started.append(it.key());
        } else {
            report.failed.append(qMakePair(it.key(), error));
        }
    }

    if (!report.converged()) {
        Logger::instance().log(LogLevel::Info, kCategory,
                               QStringLiteral("Reconciled listeners: %1 started, %2 stopped, %3 failed, %4 unchanged")
                                   .arg(report.started.size())
                                   .arg(report.stopped.size())
                                   .arg(report.failed.size())
                                   .arg(report.unchanged.size()));
    }
    return report;
}

bool ListenerManager::startListener(quint16 port, const QString &name, QString *error) {
    if (listeners_.contains(port)) {
        if (events_) {
            events_->append(EventKind::TcpWarning, QStringLiteral("Server already running on port %1").arg(port));
        }
        Logger::instance().log(LogLevel::Warn, kCategory, QStringLiteral("TCP server already running on port %1").arg(port));
        return true;
    }

    auto *listener = new Listener(name, this);
    QString bindError;
    if (!listener->start(port, bindAddress_, &bindError)) {
        delete listener;
        if (events_) {
            events_->append(EventKind::TcpError,
                            QStringLiteral("Failed to start server on port %1: %2").arg(port).arg(bindError));
        }
        if (error) {
            *error = bindError;
        }
        return false;
    }

    connect(listener, &Listener::lineReceived, this, &ListenerManager::lineReceived);
    connect(listener, &Listener::connectionUpdated, this, [this](const ConnectionRow &row) {
        // A closing worker reports its final status before connectionClosed.
        if (row.status == QLatin1String("connected") || row.status == QLatin1String("active")) {
            connections_.upsert(row);
        }
    });
    connect(listener, &Listener::connectionClosed, this, [this](const QString &id) {
        connections_.remove(id);
    });
    if (events_) {
        connect(listener, &Listener::invalidLine, this, [this](quint16 listenerPort, const QString &peer, const QString &reason) {
            events_->append(EventKind::TcpError,
                            QStringLiteral("Invalid line on port %1 from %2: %3").arg(listenerPort).arg(peer, reason));
        });
    }

    listeners_.insert(port, listener);
    if (events_) {
        events_->append(EventKind::TcpServer, QStringLiteral("Started on port %1").arg(port));
    }
    emit listenerStarted(port);
    return true;
}

void ListenerManager::stopListener(quint16 port) {
    auto it = listeners_.find(port);
    if (it == listeners_.end()) {
        return;
    }
    Listener *listener = it.value();
    listeners_.erase(it);
    listener->stop();
    connections_.removePort(port);
    listener->deleteLater();
    if (events_) {
        events_->append(EventKind::TcpServer, QStringLiteral("Stopped on port %1").arg(port));
    }
    emit listenerStopped(port);
}

void ListenerManager::stopAll() {
    const QVector<quint16> ports = runningPorts();
    for (quint16 port : ports) {
        stopListener(port);
    }
}

bool ListenerManager::isRunning(quint16 port) const {
    auto it = listeners_.constFind(port);
    return it != listeners_.constEnd() && it.value()->isListening();
}

QVector<quint16> ListenerManager::runningPorts() const {
    QVector<quint16> ports;
    for (auto it = listeners_.cbegin(); it != listeners_.cend(); ++it) {
        ports.append(it.key());
    }
    return ports;
}

int ListenerManager::connectionCount(quint16 port) const {
    return connections_.countForPort(port);
}

QVector<ListenerState> ListenerManager::states() const {
    QVector<ListenerState> result;
    const QHash<quint16, int> counts = connections_.countsByPort();
    for (auto it = listeners_.cbegin(); it != listeners_.cend(); ++it) {
        ListenerState state;
        state.port = it.key();
        state.name = it.value()->name();
        state.running = it.value()->isListening();
        state.connections = counts.value(it.key(), 0);
        result.append(state);
    }
    return result;
}

ConnectionModel *ListenerManager::connections() {
    return &connections_;
}
