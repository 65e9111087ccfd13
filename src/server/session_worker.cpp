#include "session_worker.hpp"

#include <QtCore/QDateTime>

#include "common/logger.hpp"
#include "common/protocol.hpp"

using namespace ab::protocol;
using ab::common::LogLevel;
using ab::common::Logger;

SessionWorker::SessionWorker(QTcpSocket *socket, QString connectionId, quint16 listenerPort, QObject *parent)
    : QObject(parent),
      socket_(socket),
      connectionId_(std::move(connectionId)),
      parser_(std::make_unique<LineParser>()) {
    currentRow_.id = connectionId_;
    currentRow_.listenerPort = listenerPort;
    if (socket_) {
        socket_->setParent(this);
        currentRow_.address = socket_->peerAddress().toString();
        currentRow_.peerPort = socket_->peerPort();
    }
    currentRow_.status = QStringLiteral("connected");
    currentRow_.connectedAt = QDateTime::currentDateTimeUtc();
    currentRow_.lastActive = currentRow_.connectedAt;
}

SessionWorker::~SessionWorker() = default;

void SessionWorker::start() {
    if (!socket_) {
        finish(QStringLiteral("closed"));
        return;
    }
    connect(socket_.data(), &QTcpSocket::readyRead, this, &SessionWorker::onReadyRead);
    connect(socket_.data(), &QTcpSocket::disconnected, this, &SessionWorker::onDisconnected);
    connect(socket_.data(), &QTcpSocket::errorOccurred, this, &SessionWorker::onErrorOccurred);
    emit connectionUpdated(currentRow_);

    // Data may have arrived between accept and start.
    if (socket_->bytesAvailable() > 0) {
        onReadyRead();
    }
}

void SessionWorker::stop() {
    if (finished_) {
        return;
    }
    if (socket_) {
        disconnect(socket_.data(), nullptr, this, nullptr);
        socket_->abort();
    }
    finish(QStringLiteral("closed"));
}

QString SessionWorker::connectionId() const {
    return connectionId_;
}

ConnectionRow SessionWorker::row() const {
    return currentRow_;
}

void SessionWorker::onReadyRead() {
    if (!socket_ || finished_) {
        return;
    }
    parser_->append(socket_->readAll());
    while (!finished_) {
        LineError error = LineError::None;
        QString reason;
        const auto line = parser_->nextLine(&error, &reason);
        if (!line.has_value()) {
            if (error != LineError::None) {
                emit invalidLine(connectionId_, reason);
                continue;
            }
            break;
        }
        deliver(*line);
    }
}

void SessionWorker::onDisconnected() {
    if (finished_) {
        return;
    }
    if (socket_ && socket_->bytesAvailable() > 0) {
        onReadyRead();
    }
    // The peer may close without a final newline.
    const QByteArray rest = parser_->takeRemainder();
    if (!rest.isEmpty()) {
        deliver(rest);
    }
    finish(QStringLiteral("disconnected"));
}

void SessionWorker::onErrorOccurred(QAbstractSocket::SocketError error) {
    if (error == QAbstractSocket::RemoteHostClosedError || finished_) {
        return;
    }
    Logger::instance().log(LogLevel::Warn, QStringLiteral("listener"),
                           QStringLiteral("Error handling TCP client %1:%2: %3")
                               .arg(currentRow_.address)
                               .arg(currentRow_.peerPort)
                               .arg(socket_ ? socket_->errorString() : QString()));
    if (socket_) {
        disconnect(socket_.data(), nullptr, this, nullptr);
        socket_->abort();
    }
    finish(QStringLiteral("error"));
}

void SessionWorker::deliver(const QByteArray &line) {
    const QString trigger = decode_trigger(line);
    if (trigger.isEmpty()) {
        return;
    }
    currentRow_.lastActive = QDateTime::currentDateTimeUtc();
    currentRow_.status = QStringLiteral("active");
    currentRow_.lines += 1;
    emit connectionUpdated(currentRow_);
    emit lineReceived(connectionId_, trigger);
}

void SessionWorker::finish(const QString &status) {
    if (finished_) {
        return;
    }
    finished_ = true;
    currentRow_.status = status;
    currentRow_.lastActive = QDateTime::currentDateTimeUtc();
    emit connectionUpdated(currentRow_);
    emit finished(connectionId_);
}
