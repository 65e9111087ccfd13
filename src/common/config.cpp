#include "config.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QSet>
#include <QtCore/QUuid>

namespace ab::config {

namespace {

const QString kListenersKey = QStringLiteral("tcp_listeners");
const QString kCommandsKey = QStringLiteral("tcp_commands");
const QString kAutomatorsKey = QStringLiteral("automators");
const QString kMappingsKey = QStringLiteral("command_mappings");
const QString kVersionKey = QStringLiteral("config_version");
const QString kLegacyAutomatorKey = QStringLiteral("automator");

// Ids are strings in the document, but hand-edited files sometimes carry
// plain numbers.
QString json_string(const QJsonValue &value) {
    if (value.isString()) {
        return value.toString();
    }
    if (value.isDouble()) {
        return QString::number(value.toDouble(), 'g', 17);
    }
    return {};
}

QString first_string(const QJsonObject &object, std::initializer_list<const char *> keys) {
    for (const char *key : keys) {
        const QJsonValue value = object.value(QLatin1String(key));
        if (!value.isUndefined() && !value.isNull()) {
            return json_string(value);
        }
    }
    return {};
}

}  // namespace

QString AutomatorInstance::normalizedUrl() const {
    return normalize_url(url);
}

const TcpCommand *BridgeConfig::findCommandByTrigger(const QString &trigger) const {
    for (const auto &command : commands) {
        if (triggers_match(command.trigger, trigger)) {
            return &command;
        }
    }
    return nullptr;
}

const CommandMapping *BridgeConfig::findMapping(const QString &tcpCommandId) const {
    for (const auto &mapping : mappings) {
        if (mapping.tcpCommandId == tcpCommandId) {
            return &mapping;
        }
    }
    return nullptr;
}

const AutomatorInstance *BridgeConfig::findAutomator(const QString &id) const {
    for (const auto &automator : automators) {
        if (automator.id == id) {
            return &automator;
        }
    }
    return nullptr;
}

QString normalize_url(const QString &url) {
    QString value = url.trimmed();
    if (value.isEmpty()) {
        return {};
    }
    if (!value.startsWith(QLatin1String("http://"), Qt::CaseInsensitive) &&
        !value.startsWith(QLatin1String("https://"), Qt::CaseInsensitive)) {
        value.prepend(QLatin1String("http://"));
    }
    while (value.endsWith(QLatin1Char('/'))) {
        value.chop(1);
    }
    return value;
}

const AutomatorInstance *select_automator(const BridgeConfig &config, const QString &id, QString *error) {
    if (!id.isEmpty()) {
        const AutomatorInstance *automator = config.findAutomator(id);
        if (!automator && error) {
            *error = QStringLiteral("Automator %1 not found").arg(id);
        }
        return automator;
    }
    const AutomatorInstance *only = nullptr;
    int enabled = 0;
    for (const auto &automator : config.automators) {
        if (automator.enabled) {
            only = &automator;
            ++enabled;
        }
    }
    if (enabled == 1) {
        return only;
    }
    if (error) {
        *error = enabled == 0 ? QStringLiteral("No Automator specified and none is enabled")
                              : QStringLiteral("No Automator specified and %1 are enabled").arg(enabled);
    }
    return nullptr;
}

bool triggers_match(const QString &configured, const QString &received) {
    return configured.compare(received, Qt::CaseInsensitive) == 0;
}

QStringList duplicate_triggers(const BridgeConfig &config) {
    QStringList duplicates;
    QSet<QString> seen;
    for (const auto &command : config.commands) {
        const QString key = command.trigger.toUpper();
        if (seen.contains(key)) {
            if (!duplicates.contains(command.trigger, Qt::CaseInsensitive)) {
                duplicates.append(command.trigger);
            }
            continue;
        }
        seen.insert(key);
    }
    return duplicates;
}

bool needs_migration(const QJsonObject &document) {
    if (document.contains(kLegacyAutomatorKey)) {
        return true;
    }
    const QString version = document.value(kVersionKey).toString(QStringLiteral("1.0.0"));
    return version < QLatin1String(kConfigVersion);
}

QJsonObject migrate_document(const QJsonObject &legacy) {
    QJsonObject migrated = legacy;
    migrated.remove(kLegacyAutomatorKey);
    migrated.insert(kVersionKey, QLatin1String(kConfigVersion));
    migrated.insert(kListenersKey, legacy.value(kListenersKey).toArray());
    migrated.insert(kCommandsKey, legacy.value(kCommandsKey).toArray());
    migrated.insert(QStringLiteral("first_run"), false);

    const QJsonObject oldAutomator = legacy.value(kLegacyAutomatorKey).toObject();
    const QString url = oldAutomator.value(QStringLiteral("url")).toString();
    if (url.isEmpty()) {
        // Mappings cannot be linked without an instance to point at.
        migrated.insert(kAutomatorsKey, legacy.value(kAutomatorsKey).toArray());
        migrated.insert(kMappingsKey, legacy.contains(kAutomatorsKey) ? legacy.value(kMappingsKey).toArray()
                                                                      : QJsonArray());
        return migrated;
    }

    const QString automatorId = generate_automator_id();
    QJsonObject automator;
    automator.insert(QStringLiteral("id"), automatorId);
    automator.insert(QStringLiteral("name"), QStringLiteral("Primary Automator"));
    automator.insert(QStringLiteral("url"), url);
    automator.insert(QStringLiteral("api_key"), oldAutomator.value(QStringLiteral("api_key")).toString());
    automator.insert(QStringLiteral("enabled"), oldAutomator.value(QStringLiteral("enabled")).toBool(false));
    migrated.insert(kAutomatorsKey, QJsonArray{automator});

    QJsonArray mappings;
    for (const auto &value : legacy.value(kMappingsKey).toArray()) {
        QJsonObject mapping = value.toObject();
        mapping.insert(QStringLiteral("automator_id"), automatorId);
        if (!mapping.contains(QStringLiteral("item_type"))) {
            mapping.insert(QStringLiteral("item_type"), QStringLiteral("macro"));
        }
        mappings.append(mapping);
    }
    migrated.insert(kMappingsKey, mappings);
    return migrated;
}

ListenerEntry listener_from_json(const QJsonObject &object) {
    ListenerEntry entry;
    const int port = object.value(QStringLiteral("port")).toInt(0);
    entry.port = (port > 0 && port <= 65535) ? static_cast<quint16>(port) : 0;
    entry.name = object.value(QStringLiteral("name")).toString();
    entry.enabled = object.value(QStringLiteral("enabled")).toBool(false);
    return entry;
}

TcpCommand command_from_json(const QJsonObject &object) {
    TcpCommand command;
    command.id = json_string(object.value(QStringLiteral("id")));
    command.name = object.value(QStringLiteral("name")).toString();
    command.trigger = first_string(object, {"trigger", "tcp_trigger"});
    command.description = object.value(QStringLiteral("description")).toString();
    return command;
}

AutomatorInstance automator_from_json(const QJsonObject &object) {
    AutomatorInstance automator;
    automator.id = json_string(object.value(QStringLiteral("id")));
    automator.name = object.value(QStringLiteral("name")).toString();
    automator.url = object.value(QStringLiteral("url")).toString();
    automator.apiKey = object.value(QStringLiteral("api_key")).toString();
    automator.enabled = object.value(QStringLiteral("enabled")).toBool(false);
    return automator;
}

CommandMapping mapping_from_json(const QJsonObject &object) {
    CommandMapping mapping;
    mapping.tcpCommandId = json_string(object.value(QStringLiteral("tcp_command_id")));
    mapping.automatorId = json_string(object.value(QStringLiteral("automator_id")));
    mapping.targetItemId = first_string(object, {"target_item_id", "automator_macro_id"});
    mapping.targetItemName = first_string(object, {"target_item_name", "automator_macro_name"});
    mapping.itemType = parse_item_type(first_string(object, {"item_type", "automator_macro_type"}));
    return mapping;
}

QJsonObject listener_to_json(const ListenerEntry &entry) {
    QJsonObject object;
    object.insert(QStringLiteral("port"), entry.port);
    object.insert(QStringLiteral("name"), entry.name);
    object.insert(QStringLiteral("enabled"), entry.enabled);
    return object;
}

QJsonObject command_to_json(const TcpCommand &command) {
    QJsonObject object;
    object.insert(QStringLiteral("id"), command.id);
    object.insert(QStringLiteral("name"), command.name);
    object.insert(QStringLiteral("trigger"), command.trigger);
    object.insert(QStringLiteral("description"), command.description);
    return object;
}

QJsonObject automator_to_json(const AutomatorInstance &automator) {
    QJsonObject object;
    object.insert(QStringLiteral("id"), automator.id);
    object.insert(QStringLiteral("name"), automator.name);
    object.insert(QStringLiteral("url"), automator.url);
    object.insert(QStringLiteral("api_key"), automator.apiKey);
    object.insert(QStringLiteral("enabled"), automator.enabled);
    return object;
}

QJsonObject mapping_to_json(const CommandMapping &mapping) {
    QJsonObject object;
    object.insert(QStringLiteral("tcp_command_id"), mapping.tcpCommandId);
    object.insert(QStringLiteral("automator_id"), mapping.automatorId);
    object.insert(QStringLiteral("target_item_id"), mapping.targetItemId);
    object.insert(QStringLiteral("target_item_name"), mapping.targetItemName);
    if (mapping.itemType) {
        object.insert(QStringLiteral("item_type"), to_string(*mapping.itemType));
    }
    return object;
}

BridgeConfig config_from_json(const QJsonObject &document, QStringList *warnings) {
    auto warn = [warnings](const QString &text) {
        if (warnings) {
            warnings->append(text);
        }
    };

    BridgeConfig config;
    config.extra = document;
    for (const auto &key : {kListenersKey, kCommandsKey, kAutomatorsKey, kMappingsKey}) {
        config.extra.remove(key);
    }

    QSet<quint16> ports;
    for (const auto &value : document.value(kListenersKey).toArray()) {
        const ListenerEntry entry = listener_from_json(value.toObject());
        if (entry.port == 0) {
            warn(QStringLiteral("Ignoring listener '%1' with invalid port").arg(entry.name));
            continue;
        }
        if (ports.contains(entry.port)) {
            warn(QStringLiteral("Ignoring duplicate listener on port %1").arg(entry.port));
            continue;
        }
        ports.insert(entry.port);
        config.listeners.push_back(entry);
    }

    QSet<QString> commandIds;
    for (const auto &value : document.value(kCommandsKey).toArray()) {
        const TcpCommand command = command_from_json(value.toObject());
        if (commandIds.contains(command.id)) {
            warn(QStringLiteral("Duplicate TCP command id '%1'").arg(command.id));
        }
        commandIds.insert(command.id);
        config.commands.push_back(command);
    }

    QSet<QString> automatorIds;
    for (const auto &value : document.value(kAutomatorsKey).toArray()) {
        const AutomatorInstance automator = automator_from_json(value.toObject());
        if (automatorIds.contains(automator.id)) {
            warn(QStringLiteral("Duplicate Automator id '%1'").arg(automator.id));
        }
        automatorIds.insert(automator.id);
        config.automators.push_back(automator);
    }

    QSet<QString> mappedCommands;
    for (const auto &value : document.value(kMappingsKey).toArray()) {
        const CommandMapping mapping = mapping_from_json(value.toObject());
        if (mappedCommands.contains(mapping.tcpCommandId)) {
            warn(QStringLiteral("Command '%1' has more than one mapping, the first one is used")
                     .arg(mapping.tcpCommandId));
        }
        mappedCommands.insert(mapping.tcpCommandId);
        config.mappings.push_back(mapping);
    }

    for (const auto &trigger : duplicate_triggers(config)) {
        warn(QStringLiteral("Trigger '%1' is defined by more than one command, the first one is used").arg(trigger));
    }
    return config;
}

QJsonObject config_to_json(const BridgeConfig &config) {
    QJsonObject document = config.extra;
    if (!document.contains(kVersionKey)) {
        document.insert(kVersionKey, QLatin1String(kConfigVersion));
    }

    QJsonArray listeners;
    for (const auto &entry : config.listeners) {
        listeners.append(listener_to_json(entry));
    }
    QJsonArray commands;
    for (const auto &command : config.commands) {
        commands.append(command_to_json(command));
    }
    QJsonArray automators;
    for (const auto &automator : config.automators) {
        automators.append(automator_to_json(automator));
    }
    QJsonArray mappings;
    for (const auto &mapping : config.mappings) {
        mappings.append(mapping_to_json(mapping));
    }

    document.insert(kListenersKey, listeners);
    document.insert(kCommandsKey, commands);
    document.insert(kAutomatorsKey, automators);
    document.insert(kMappingsKey, mappings);
    return document;
}

QString generate_automator_id() {
    const QString hex = QUuid::createUuid().toString(QUuid::Id128);
    return QStringLiteral("auto_%1").arg(hex.left(8));
}

}  // namespace ab::config
