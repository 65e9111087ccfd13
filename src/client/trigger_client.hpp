#pragma once

#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QTimer>
#include <QtNetwork/QAbstractSocket>
#include <QtNetwork/QTcpSocket>

// Sends trigger lines to a bridge listener, optionally in rounds on a timer,
// and reconnects when the connection drops.
class TriggerClient : public QObject {
    Q_OBJECT

public:
    explicit TriggerClient(QObject *parent = nullptr);

    void connectToHost(const QString &host, quint16 port);
    void disconnectFromHost();
    bool sendTrigger(const QString &trigger);

    void setTriggers(const QStringList &triggers);
    // intervalMs <= 0 sends a single round. rounds <= 0 repeats until stopped.
    void setRepeat(int intervalMs, int rounds);
    void setReconnect(bool enabled, int delayMs = 3000);

    int sentCount() const;
    int roundsCompleted() const;

signals:
    void statusChanged(QString status);
    void logMessage(QString message);
    void statisticsUpdated(int sent);
    void connected();
    void disconnected();
    void failed(QString reason);
    // Every requested round was written and flushed.
    void finished();

private slots:
    void onConnected();
    void onDisconnected();
    void onErrorOccurred(QAbstractSocket::SocketError error);
    void onBytesWritten(qint64 bytes);
    void sendRound();
    void attemptReconnect();

private:
    bool allRoundsSent() const;

    QTcpSocket socket_;
    QTimer roundTimer_;
    QTimer reconnectTimer_;
    QStringList triggers_;
    int intervalMs_ = 0;
    int rounds_ = 1;
    int roundsCompleted_ = 0;
    bool reconnect_ = false;
    bool shouldReconnect_ = false;
    bool finishing_ = false;
    QString host_;
    quint16 port_ = 0;
    int sentCount_ = 0;
};
