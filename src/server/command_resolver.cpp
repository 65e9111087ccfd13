#include "command_resolver.hpp"

#include "automator/catalog_cache.hpp"
#include "common/event_log.hpp"
#include "common/logger.hpp"

using ab::common::EventKind;
using ab::common::LogLevel;
using ab::common::Logger;

QString to_string(ResolveResult::Status status) {
    switch (status) {
        case ResolveResult::Status::Resolved:
            return QStringLiteral("resolved");
        case ResolveResult::Status::NoCommand:
            return QStringLiteral("no command");
        case ResolveResult::Status::NoMapping:
            return QStringLiteral("no mapping");
        case ResolveResult::Status::MappingError:
            return QStringLiteral("mapping error");
    }
    return QStringLiteral("no command");
}

CommandResolver::CommandResolver(ab::automator::CatalogCache &catalog, ab::common::EventLog &events)
    : catalog_(catalog), events_(events), config_(std::make_shared<const ab::config::BridgeConfig>()) {}

void CommandResolver::setConfig(ab::config::ConfigSnapshot snapshot) {
    if (snapshot) {
        config_ = std::move(snapshot);
    }
}

ab::config::ConfigSnapshot CommandResolver::config() const {
    return config_;
}

ResolveResult CommandResolver::resolve(const QString &trigger, quint16 port) {
    // Held for the whole call; event handlers may swap config_ meanwhile.
    const ab::config::ConfigSnapshot config = config_;

    ResolveResult result;
    result.trigger = trigger;
    result.port = port;

    events_.append(EventKind::TcpCommand, QStringLiteral("Received '%1' on port %2").arg(trigger).arg(port));

    const ab::config::TcpCommand *command = config->findCommandByTrigger(trigger);
    if (!command) {
        result.status = ResolveResult::Status::NoCommand;
        events_.append(EventKind::TcpWarning, QStringLiteral("No definition for command '%1'").arg(trigger));
        return result;
    }
    result.commandId = command->id;
    result.commandName = command->name;

    const ab::config::CommandMapping *mapping = config->findMapping(command->id);
    if (!mapping) {
        result.status = ResolveResult::Status::NoMapping;
        events_.append(EventKind::TcpWarning, QStringLiteral("No mapping for '%1'").arg(command->name));
        return result;
    }
    if (mapping->automatorId.isEmpty()) {
        result.status = ResolveResult::Status::MappingError;
        events_.append(EventKind::MappingError, QStringLiteral("No Automator specified for '%1'").arg(command->name));
        return result;
    }

    result.automatorId = mapping->automatorId;
    result.itemId = mapping->targetItemId;
    result.itemName = mapping->targetItemName.isEmpty() ? mapping->targetItemId : mapping->targetItemName;
    events_.append(EventKind::MappingFound, QStringLiteral("%1 → %2").arg(command->name, result.itemName));

    if (mapping->itemType) {
        result.itemType = *mapping->itemType;
    } else {
        result.itemType = catalog_.inferItemType(mapping->automatorId, mapping->targetItemId);
        result.typeInferred = true;
        Logger::instance().log(LogLevel::Debug, QStringLiteral("resolver"),
                               QStringLiteral("Auto-detected type '%1' for %2")
                                   .arg(ab::to_string(result.itemType), result.itemName));
    }
    result.status = ResolveResult::Status::Resolved;
    return result;
}
