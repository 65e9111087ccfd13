#include "trigger_client.hpp"

#include "common/logger.hpp"
#include "common/protocol.hpp"

using namespace ab::protocol;
using ab::common::LogLevel;
using ab::common::Logger;

namespace {

const QString kCategory = QStringLiteral("client");

}  // namespace

TriggerClient::TriggerClient(QObject *parent) : QObject(parent) {
    connect(&socket_, &QTcpSocket::connected, this, &TriggerClient::onConnected);
    connect(&socket_, &QTcpSocket::disconnected, this, &TriggerClient::onDisconnected);
    connect(&socket_, &QTcpSocket::errorOccurred, this, &TriggerClient::onErrorOccurred);
    connect(&socket_, &QTcpSocket::bytesWritten, this, &TriggerClient::onBytesWritten);

    connect(&roundTimer_, &QTimer::timeout, this, &TriggerClient::sendRound);

    reconnectTimer_.setInterval(3000);
    reconnectTimer_.setSingleShot(true);
    connect(&reconnectTimer_, &QTimer::timeout, this, &TriggerClient::attemptReconnect);

    connect(this, &TriggerClient::logMessage, this, [](const QString &message) {
        Logger::instance().log(LogLevel::Info, kCategory, message);
    });
}

void TriggerClient::connectToHost(const QString &host, quint16 port) {
    host_ = host;
    port_ = port;
    shouldReconnect_ = reconnect_;
    finishing_ = false;
    reconnectTimer_.stop();
    emit statusChanged(QStringLiteral("connecting"));
    emit logMessage(QStringLiteral("Connecting to %1:%2").arg(host).arg(port));
    socket_.connectToHost(host, port);
}

void TriggerClient::disconnectFromHost() {
    roundTimer_.stop();
    shouldReconnect_ = false;
    reconnectTimer_.stop();
    socket_.disconnectFromHost();
}

bool TriggerClient::sendTrigger(const QString &trigger) {
    if (socket_.state() != QAbstractSocket::ConnectedState) {
        emit logMessage(QStringLiteral("Not connected, cannot send '%1'").arg(trigger));
        if (shouldReconnect_ && !reconnectTimer_.isActive()) {
            reconnectTimer_.start();
        }
        return false;
    }
    const QByteArray line = build_line(trigger);
    if (socket_.write(line) != line.size()) {
        emit logMessage(QStringLiteral("Write failed: %1").arg(socket_.errorString()));
        return false;
    }
    sentCount_++;
    emit logMessage(QStringLiteral("Sent: %1").arg(trigger.trimmed()));
    emit statisticsUpdated(sentCount_);
    return true;
}

void TriggerClient::setTriggers(const QStringList &triggers) {
    triggers_ = triggers;
}

void TriggerClient::setRepeat(int intervalMs, int rounds) {
    intervalMs_ = intervalMs;
    rounds_ = rounds;
    if (intervalMs_ > 0) {
        roundTimer_.setInterval(intervalMs_);
    }
}

void TriggerClient::setReconnect(bool enabled, int delayMs) {
    reconnect_ = enabled;
    reconnectTimer_.setInterval(delayMs);
}

int TriggerClient::sentCount() const {
    return sentCount_;
}

int TriggerClient::roundsCompleted() const {
    return roundsCompleted_;
}

void TriggerClient::onConnected() {
    emit statusChanged(QStringLiteral("connected"));
    emit logMessage(QStringLiteral("Connected to %1:%2").arg(host_).arg(port_));
    emit connected();
    sendRound();
    if (intervalMs_ > 0 && !allRoundsSent()) {
        roundTimer_.start();
    }
}

void TriggerClient::onDisconnected() {
    emit statusChanged(QStringLiteral("disconnected"));
    emit logMessage(QStringLiteral("Disconnected from %1:%2").arg(host_).arg(port_));
    emit disconnected();
    roundTimer_.stop();
    if (shouldReconnect_ && !allRoundsSent()) {
        emit logMessage(QStringLiteral("Reconnecting in %1 ms").arg(reconnectTimer_.interval()));
        reconnectTimer_.start();
    }
}

void TriggerClient::onErrorOccurred(QAbstractSocket::SocketError error) {
    if (error == QAbstractSocket::RemoteHostClosedError && !shouldReconnect_) {
        return;
    }
    emit statusChanged(QStringLiteral("error"));
    emit logMessage(QStringLiteral("Network error: %1").arg(socket_.errorString()));
    if (shouldReconnect_) {
        if (!reconnectTimer_.isActive()) {
            reconnectTimer_.start();
        }
        return;
    }
    emit failed(socket_.errorString());
}

void TriggerClient::onBytesWritten(qint64) {
    if (finishing_ && socket_.bytesToWrite() == 0) {
        finishing_ = false;
        emit finished();
    }
}

void TriggerClient::sendRound() {
    if (allRoundsSent()) {
        roundTimer_.stop();
        return;
    }
    for (const QString &trigger : triggers_) {
        if (!sendTrigger(trigger)) {
            return;
        }
    }
    roundsCompleted_++;
    if (allRoundsSent()) {
        roundTimer_.stop();
        if (socket_.bytesToWrite() == 0) {
            emit finished();
        } else {
            finishing_ = true;
        }
    }
}

void TriggerClient::attemptReconnect() {
    if (!shouldReconnect_) {
        return;
    }
    if (host_.isEmpty() || port_ == 0) {
        emit logMessage(QStringLiteral("No target to reconnect to"));
        return;
    }
    emit logMessage(QStringLiteral("Reconnecting to %1:%2").arg(host_).arg(port_));
    socket_.abort();
    socket_.connectToHost(host_, port_);
    emit statusChanged(QStringLiteral("connecting"));
}

bool TriggerClient::allRoundsSent() const {
    if (intervalMs_ <= 0) {
        return roundsCompleted_ >= 1;
    }
    return rounds_ > 0 && roundsCompleted_ >= rounds_;
}
