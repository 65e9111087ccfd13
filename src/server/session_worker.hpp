#pragma once

#include "connection_model.hpp"

#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtNetwork/QTcpSocket>

#include <memory>

namespace ab::protocol {
class LineParser;
}

// Reads newline-terminated triggers from one accepted peer until EOF, a read
// error or stop(). Nothing is written back.
class SessionWorker : public QObject {
    Q_OBJECT

public:
    SessionWorker(QTcpSocket *socket, QString connectionId, quint16 listenerPort, QObject *parent = nullptr);
    ~SessionWorker() override;

    void start();
    void stop();

    QString connectionId() const;
    ConnectionRow row() const;

signals:
    void connectionUpdated(const ConnectionRow &row);
    void lineReceived(const QString &connectionId, const QString &trigger);
    void invalidLine(const QString &connectionId, const QString &reason);
    void finished(const QString &connectionId);

private slots:
    void onReadyRead();
    void onDisconnected();
    void onErrorOccurred(QAbstractSocket::SocketError error);

private:
    void deliver(const QByteArray &line);
    void finish(const QString &status);

    QPointer<QTcpSocket> socket_;
    QString connectionId_;
    std::unique_ptr<ab::protocol::LineParser> parser_;
    ConnectionRow currentRow_;
    bool finished_ = false;
};
