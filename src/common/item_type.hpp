#pragma once

#include <QtCore/QString>

#include <optional>

namespace ab {

enum class ItemType {
    Macro,
    Button,
    Shortcut,
    Unknown,
};

QString to_string(ItemType type);

// Maps "macro"/"button"/"shortcut" (any case) to its type. Other non-empty
// text yields Unknown; empty text yields nullopt.
std::optional<ItemType> parse_item_type(const QString &text);

}  // namespace ab
