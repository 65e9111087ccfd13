#include "connection_model.hpp"

ConnectionModel::ConnectionModel(QObject *parent) : QAbstractTableModel(parent) {}

int ConnectionModel::rowCount(const QModelIndex &parent) const {
    if (parent.isValid()) {
        return 0;
    }
    return rows_.size();
}

int ConnectionModel::columnCount(const QModelIndex &parent) const {
    if (parent.isValid()) {
        return 0;
    }
    return ColumnCount;
}

QVariant ConnectionModel::data(const QModelIndex &index, int role) const {
    if (!index.isValid() || index.row() >= rows_.size()) {
        return {};
    }

    const auto &row = rows_.at(index.row());
    if (role == Qt::DisplayRole) {
        switch (index.column()) {
            case Id:
                return row.id;
            case ListenerPort:
                return row.listenerPort;
            case Address:
                return row.address;
            case PeerPort:
                return row.peerPort;
            case Status:
                return row.status;
            case LastActive:
                return row.lastActive.toString(Qt::ISODate);
            case Lines:
                return row.lines;
            default:
                return {};
        }
    }
    return {};
}

QVariant ConnectionModel::headerData(int section, Qt::Orientation orientation, int role) const {
    if (orientation == Qt::Horizontal && role == Qt::DisplayRole) {
        switch (section) {
            case Id:
                return QStringLiteral("Connection");
            case ListenerPort:
                return QStringLiteral("Listener");
            case Address:
                return QStringLiteral("Peer address");
            case PeerPort:
                return QStringLiteral("Peer port");
            case Status:
                return QStringLiteral("Status");
            case LastActive:
                return QStringLiteral("Last active");
            case Lines:
                return QStringLiteral("Lines");
            default:
                return {};
        }
    }
    return QAbstractTableModel::headerData(section, orientation, role);
}

void ConnectionModel::upsert(const ConnectionRow &row) {
    const int idx = findRow(row.id);
    if (idx == -1) {
        beginInsertRows(QModelIndex(), rows_.size(), rows_.size());
        rows_.push_back(row);
        endInsertRows();
    } else {
        rows_[idx] = row;
        const QModelIndex top = index(idx, 0);
        const QModelIndex bottom = index(idx, ColumnCount - 1);
        emit dataChanged(top, bottom);
    }
}

bool ConnectionModel::remove(const QString &id) {
    const int idx = findRow(id);
    if (idx == -1) {
        return false;
    }
    beginRemoveRows(QModelIndex(), idx, idx);
    rows_.removeAt(idx);
    endRemoveRows();
    return true;
}

void ConnectionModel::removePort(quint16 listenerPort) {
    for (int i = rows_.size() - 1; i >= 0; --i) {
        if (rows_.at(i).listenerPort == listenerPort) {
            beginRemoveRows(QModelIndex(), i, i);
            rows_.removeAt(i);
            endRemoveRows();
        }
    }
}

int ConnectionModel::countForPort(quint16 listenerPort) const {
    int count = 0;
    for (const auto &row : rows_) {
        if (row.listenerPort == listenerPort) {
            ++count;
        }
    }
    return count;
}

QHash<quint16, int> ConnectionModel::countsByPort() const {
    QHash<quint16, int> counts;
    for (const auto &row : rows_) {
        counts[row.listenerPort] += 1;
    }
    return counts;
}

QVector<ConnectionRow> ConnectionModel::rows() const {
    return rows_;
}

int ConnectionModel::findRow(const QString &id) const {
    for (int i = 0; i < rows_.size(); ++i) {
        if (rows_.at(i).id == id) {
            return i;
        }
    }
    return -1;
}
