#pragma once

#include "item_type.hpp"

#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVector>

#include <memory>
#include <optional>

namespace ab::config {

constexpr char kConfigVersion[] = "1.1.0";

struct ListenerEntry {
    quint16 port = 0;
    QString name;
    bool enabled = false;
};

struct TcpCommand {
    QString id;
    QString name;
    QString trigger;
    QString description;
};

struct AutomatorInstance {
    QString id;
    QString name;
    QString url;
    QString apiKey;
    bool enabled = false;

    // url with a scheme and without a trailing slash; empty when unset.
    QString normalizedUrl() const;
};

struct CommandMapping {
    QString tcpCommandId;
    QString automatorId;
    QString targetItemId;
    QString targetItemName;
    std::optional<ItemType> itemType;
};

// Immutable view of the configuration document. Published as a
// ConfigSnapshot and replaced as a whole on every change.
struct BridgeConfig {
    quint64 revision = 0;
    QVector<ListenerEntry> listeners;
    QVector<TcpCommand> commands;
    QVector<AutomatorInstance> automators;
    QVector<CommandMapping> mappings;
    // Keys of the document the bridge does not interpret (theme, web_port, ...).
    QJsonObject extra;

    const TcpCommand *findCommandByTrigger(const QString &trigger) const;
    const CommandMapping *findMapping(const QString &tcpCommandId) const;
    const AutomatorInstance *findAutomator(const QString &id) const;
};

using ConfigSnapshot = std::shared_ptr<const BridgeConfig>;

QString normalize_url(const QString &url);

// Picks the instance a request targets: the one with the given id, or when id
// is empty the only enabled instance. Returns nullptr and sets error when the
// choice is missing or ambiguous.
const AutomatorInstance *select_automator(const BridgeConfig &config, const QString &id, QString *error = nullptr);

bool triggers_match(const QString &configured, const QString &received);

// Triggers configured on more than one command; resolution uses the first.
QStringList duplicate_triggers(const BridgeConfig &config);

bool needs_migration(const QJsonObject &document);
QJsonObject migrate_document(const QJsonObject &legacy);

BridgeConfig config_from_json(const QJsonObject &document, QStringList *warnings = nullptr);
QJsonObject config_to_json(const BridgeConfig &config);

QJsonObject listener_to_json(const ListenerEntry &entry);
QJsonObject command_to_json(const TcpCommand &command);
QJsonObject automator_to_json(const AutomatorInstance &automator);
QJsonObject mapping_to_json(const CommandMapping &mapping);

ListenerEntry listener_from_json(const QJsonObject &object);
TcpCommand command_from_json(const QJsonObject &object);
AutomatorInstance automator_from_json(const QJsonObject &object);
CommandMapping mapping_from_json(const QJsonObject &object);

QString generate_automator_id();

}  // namespace ab::config
