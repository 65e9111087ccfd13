#pragma once

#include <QtCore/QAbstractTableModel>
#include <QtCore/QDateTime>
#include <QtCore/QHash>
#include <QtCore/QVector>

struct ConnectionRow {
    QString id;
    quint16 listenerPort = 0;
    QString address;
    quint16 peerPort = 0;
    QString status;
    QDateTime connectedAt;
    QDateTime lastActive;
    int lines = 0;
};

// Live peers of every listener, one row per accepted connection.
class ConnectionModel : public QAbstractTableModel {
    Q_OBJECT

public:
    enum Column {
        Id = 0,
        ListenerPort,
        Address,
        PeerPort,
        Status,
        LastActive,
        Lines,
        ColumnCount
    };

    explicit ConnectionModel(QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    int columnCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role) const override;
    QVariant headerData(int section, Qt::Orientation orientation, int role) const override;

    void upsert(const ConnectionRow &row);
    // Returns false when the connection was already removed.
    bool remove(const QString &id);
    void removePort(quint16 listenerPort);

    int countForPort(quint16 listenerPort) const;
    QHash<quint16, int> countsByPort() const;
    QVector<ConnectionRow> rows() const;

private:
    int findRow(const QString &id) const;
    QVector<ConnectionRow> rows_;
};
