#include "item_type.hpp"

namespace ab {

QString to_string(ItemType type) {
    switch (type) {
        case ItemType::Macro:
            return QStringLiteral("macro");
        case ItemType::Button:
            return QStringLiteral("button");
        case ItemType::Shortcut:
            return QStringLiteral("shortcut");
        case ItemType::Unknown:
            return QStringLiteral("unknown");
    }
    return QStringLiteral("unknown");
}

std::optional<ItemType> parse_item_type(const QString &text) {
    const QString value = text.trimmed().toLower();
    if (value.isEmpty()) {
        return std::nullopt;
    }
    if (value == QLatin1String("macro")) {
        return ItemType::Macro;
    }
    if (value == QLatin1String("button")) {
        return ItemType::Button;
    }
    if (value == QLatin1String("shortcut")) {
        return ItemType::Shortcut;
    }
    return ItemType::Unknown;
}

}  // namespace ab
