#pragma once

#include "common/config.hpp"
#include "common/item_type.hpp"

#include <QtCore/QString>

namespace ab::common {
class EventLog;
}

namespace ab::automator {
class CatalogCache;
}

struct ResolveResult {
    enum class Status {
        Resolved,
        NoCommand,
        NoMapping,
        MappingError,
    };

    Status status = Status::NoCommand;
    QString trigger;
    quint16 port = 0;
    QString commandId;
    QString commandName;
    QString automatorId;
    QString itemId;
    QString itemName;
    ab::ItemType itemType = ab::ItemType::Macro;
    // The item type came from the catalog instead of the mapping.
    bool typeInferred = false;

    bool resolved() const { return status == Status::Resolved; }
};

QString to_string(ResolveResult::Status status);

// Maps a received trigger to the Automator item it should execute, using the
// current configuration snapshot.
class CommandResolver {
public:
    CommandResolver(ab::automator::CatalogCache &catalog, ab::common::EventLog &events);

    void setConfig(ab::config::ConfigSnapshot snapshot);
    ab::config::ConfigSnapshot config() const;

    ResolveResult resolve(const QString &trigger, quint16 port);

private:
    ab::automator::CatalogCache &catalog_;
    ab::common::EventLog &events_;
    ab::config::ConfigSnapshot config_;
};
