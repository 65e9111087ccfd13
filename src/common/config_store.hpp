#pragma once

#include "config.hpp"

#include <QtCore/QFileSystemWatcher>
#include <QtCore/QMetaType>
#include <QtCore/QObject>

#include <optional>

namespace ab::config {

// Partial update of the configuration document; unset lists are left alone.
struct ConfigUpdate {
    std::optional<QVector<ListenerEntry>> listeners;
    std::optional<QVector<TcpCommand>> commands;
    std::optional<QVector<AutomatorInstance>> automators;
    std::optional<QVector<CommandMapping>> mappings;
};

class ConfigStore : public QObject {
    Q_OBJECT

public:
    explicit ConfigStore(QString path, QObject *parent = nullptr);

    static QString defaultDirectory();
    static QString defaultConfigPath();

    QString path() const;

    // Reads the document from disk, migrating legacy layouts. A missing file
    // is created with an empty configuration.
    bool load(QString *error = nullptr);
    bool save(QString *error = nullptr) const;

    ConfigSnapshot snapshot() const;

    // Publishes config as the next revision and persists it.
    bool replace(BridgeConfig config, QString *error = nullptr);
    bool applyUpdate(const ConfigUpdate &update, QString *error = nullptr);

    bool addAutomator(AutomatorInstance automator, QString *error = nullptr);
    bool updateAutomator(const QString &id, const AutomatorInstance &automator, QString *error = nullptr);
    QVector<CommandMapping> orphanedMappings(const QString &automatorId) const;
    // Returns the number of mappings removed along with the instance.
    int removeAutomator(const QString &id, bool deleteMappings);

    void setWatchEnabled(bool enabled);

signals:
    void configChanged(ab::config::ConfigSnapshot snapshot);
    void loadFailed(QString reason);

private slots:
    void handleFileChanged(const QString &path);

private:
    void publish(BridgeConfig config);
    bool writeDocument(const QJsonObject &document, QString *error) const;
    void rearmWatch();

    QString path_;
    ConfigSnapshot current_;
    QFileSystemWatcher watcher_;
    bool watchEnabled_ = false;
    mutable QByteArray lastWritten_;
};

}  // namespace ab::config

Q_DECLARE_METATYPE(ab::config::ConfigSnapshot)
