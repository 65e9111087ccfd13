#pragma once

#include "connection_model.hpp"

#include <QtCore/QObject>
#include <QtNetwork/QHostAddress>
#include <QtNetwork/QTcpServer>

#include <unordered_map>

class SessionWorker;

// One bound TCP port. Every accepted peer gets a SessionWorker on the same
// event loop.
class Listener : public QObject {
    Q_OBJECT

public:
    explicit Listener(QString name = QString(), QObject *parent = nullptr);
    ~Listener() override;

    bool start(quint16 port, const QHostAddress &address = QHostAddress::Any, QString *error = nullptr);
    // Aborts every accepted peer and releases the socket before returning.
    void stop();
    bool isListening() const;
    quint16 port() const;
    QString name() const;
    int connectionCount() const;

signals:
    void listening(quint16 port);
    void stopped(quint16 port);
    void connectionUpdated(const ConnectionRow &row);
    void connectionClosed(const QString &id);
    void lineReceived(quint16 port, const QString &trigger, const QString &peer);
    void invalidLine(quint16 port, const QString &peer, const QString &reason);

private slots:
    void handleNewConnection();

private:
    void removeSession(const QString &id);
    QString peerOf(const QString &id) const;

    QTcpServer *server_ = nullptr;
    QString name_;
    quint16 port_ = 0;
    std::unordered_map<QString, SessionWorker *> sessions_;
};
