#include "listener.hpp"

#include <QtCore/QDateTime>
#include <QtCore/QStringList>
#include <QtCore/QUuid>

#include "common/logger.hpp"
#include "session_worker.hpp"

using ab::common::LogLevel;
using ab::common::Logger;

namespace {

const QString kCategory = QStringLiteral("listener");

}  // namespace

Listener::Listener(QString name, QObject *parent)
    : QObject(parent), server_(new QTcpServer(this)), name_(std::move(name)) {
    connect(server_, &QTcpServer::newConnection, this, &Listener::handleNewConnection);
}

Listener::~Listener() {
    stop();
}

bool Listener::start(quint16 port, const QHostAddress &address, QString *error) {
    if (server_->isListening()) {
        stop();
    }
    if (!server_->listen(address, port)) {
        const QString message = server_->errorString();
        Logger::instance().log(LogLevel::Error, kCategory,
                               QStringLiteral("Failed to start TCP listener on port %1: %2").arg(port).arg(message));
        if (error) {
            *error = message;
        }
        return false;
    }
    port_ = server_->serverPort();
    Logger::instance().log(LogLevel::Info, kCategory,
                           QStringLiteral("TCP listener started on port %1 (%2)").arg(port_).arg(name_));
    emit listening(port_);
    return true;
}

void Listener::stop() {
    QStringList sessionIds;
    for (const auto &[id, worker] : sessions_) {
        sessionIds.append(id);
    }
    // stop() emits finished synchronously, which removes the session.
    for (const QString &id : sessionIds) {
        auto it = sessions_.find(id);
        if (it != sessions_.end() && it->second) {
            it->second->stop();
        }
    }
    sessions_.clear();

    const bool wasListening = server_->isListening();
    if (wasListening) {
        server_->close();
    }
    // Peers accepted by the OS but not yet handed out.
    while (server_->hasPendingConnections()) {
        QTcpSocket *pending = server_->nextPendingConnection();
        if (pending) {
            pending->abort();
            pending->deleteLater();
        }
    }
    if (wasListening) {
        Logger::instance().log(LogLevel::Info, kCategory, QStringLiteral("TCP listener stopped on port %1").arg(port_));
        emit stopped(port_);
    }
}

bool Listener::isListening() const {
    return server_ && server_->isListening();
}

quint16 Listener::port() const {
    return port_;
}

QString Listener::name() const {
    return name_;
}

int Listener::connectionCount() const {
    return static_cast<int>(sessions_.size());
}

void Listener::handleNewConnection() {
    while (server_->hasPendingConnections()) {
        auto socket = server_->nextPendingConnection();
        if (!socket) {
            continue;
        }
        const QString id = QUuid::createUuid().toString(QUuid::WithoutBraces);
        auto *worker = new SessionWorker(socket, id, port_, this);

        connect(worker, &SessionWorker::connectionUpdated, this, &Listener::connectionUpdated);
        connect(worker, &SessionWorker::lineReceived, this, [this](const QString &connectionId, const QString &trigger) {
            emit lineReceived(port_, trigger, peerOf(connectionId));
        });
        connect(worker, &SessionWorker::invalidLine, this, [this](const QString &connectionId, const QString &reason) {
            Logger::instance().log(LogLevel::Warn, kCategory,
                                   QStringLiteral("Invalid line on port %1 from %2: %3")
                                       .arg(port_)
                                       .arg(peerOf(connectionId), reason));
            emit invalidLine(port_, peerOf(connectionId), reason);
        });
        connect(worker, &SessionWorker::finished, this, [this](const QString &connectionId) {
            removeSession(connectionId);
        });
        connect(worker, &SessionWorker::finished, worker, &QObject::deleteLater);

        sessions_.emplace(id, worker);
        const ConnectionRow row = worker->row();
        Logger::instance().log(LogLevel::Debug, kCategory,
                               QStringLiteral("TCP client connected from %1:%2 on port %3")
                                   .arg(row.address)
                                   .arg(row.peerPort)
                                   .arg(port_));
        worker->start();
    }
}

void Listener::removeSession(const QString &id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return;
    }
    const ConnectionRow row = it->second ? it->second->row() : ConnectionRow();
    sessions_.erase(it);
    Logger::instance().log(LogLevel::Debug, kCategory,
                           QStringLiteral("TCP client disconnected: %1:%2").arg(row.address).arg(row.peerPort));
    emit connectionClosed(id);
}

QString Listener::peerOf(const QString &id) const {
    auto it = sessions_.find(id);
    if (it == sessions_.end() || !it->second) {
        return {};
    }
    const ConnectionRow row = it->second->row();
    return QStringLiteral("%1:%2").arg(row.address).arg(row.peerPort);
}
