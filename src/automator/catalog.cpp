#include "catalog.hpp"

#include <QtCore/QHash>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonParseError>
#include <QtCore/QStringList>

namespace ab::automator {

namespace {

const QString kMacrosKey = QStringLiteral("macros");
const QString kButtonsKey = QStringLiteral("buttons");
const QString kShortcutsKey = QStringLiteral("shortcuts");
const QString kLastUpdatedKey = QStringLiteral("last_updated");

QJsonArray items_to_json(const QVector<CatalogItem> &items) {
    QJsonArray array;
    for (const auto &item : items) {
        array.append(item_to_json(item));
    }
    return array;
}

QVector<CatalogItem> items_from_json(const QJsonArray &array, ItemType listType) {
    QVector<CatalogItem> items;
    items.reserve(array.size());
    for (const auto &value : array) {
        if (value.isObject()) {
            items.push_back(item_from_json(value.toObject(), listType));
        }
    }
    return items;
}

}  // namespace

QVector<CatalogItem> Catalog::allItems() const {
    QVector<CatalogItem> all;
    all.reserve(size());
    all += macros;
    all += buttons;
    all += shortcuts;
    return all;
}

const CatalogItem *Catalog::find(const QString &itemId) const {
    for (const auto *list : {&macros, &buttons, &shortcuts}) {
        for (const auto &item : *list) {
            if (item.id == itemId) {
                return &item;
            }
        }
    }
    return nullptr;
}

int Catalog::size() const {
    return macros.size() + buttons.size() + shortcuts.size();
}

bool Catalog::isEmpty() const {
    return size() == 0;
}

bool CatalogFetch::anySucceeded() const {
    return macros.has_value() || buttons.has_value() || shortcuts.has_value();
}

QString shortcut_title(const QJsonObject &shortcut) {
    QStringList parts;
    if (shortcut.value(QStringLiteral("control")).toBool()) {
        parts.append(QStringLiteral("Ctrl"));
    }
    if (shortcut.value(QStringLiteral("alt")).toBool()) {
        parts.append(QStringLiteral("Alt"));
    }
    if (shortcut.value(QStringLiteral("shift")).toBool()) {
        parts.append(QStringLiteral("Shift"));
    }
    const QString key = shortcut.value(QStringLiteral("key")).toString();
    parts.append(key.isEmpty() ? QStringLiteral("Unknown") : key);
    return parts.join(QStringLiteral(" + "));
}

QString item_id_from_json(const QJsonValue &value) {
    if (value.isString()) {
        return value.toString();
    }
    if (value.isDouble()) {
        return QString::number(value.toDouble(), 'g', 17);
    }
    return {};
}

CatalogItem item_from_json(QJsonObject object, ItemType listType) {
    if (listType == ItemType::Shortcut) {
        // The shortcut listing has neither a type nor a title.
        object.insert(QStringLiteral("type"), to_string(ItemType::Shortcut));
        object.insert(QStringLiteral("title"), shortcut_title(object));
    }

    CatalogItem item;
    item.id = item_id_from_json(object.value(QStringLiteral("id")));
    item.title = object.value(QStringLiteral("title")).toString();
    if (item.title.isEmpty()) {
        item.title = object.value(QStringLiteral("name")).toString();
    }
    if (item.title.isEmpty()) {
        item.title = item.id;
    }
    // Only a type the bridge can dispatch overrides the listing it came from.
    const auto recorded = parse_item_type(object.value(QStringLiteral("type")).toString());
    item.type = (recorded && *recorded != ItemType::Unknown) ? *recorded : listType;
    item.raw = object;
    return item;
}

QJsonObject item_to_json(const CatalogItem &item) {
    QJsonObject object = item.raw;
    if (!object.contains(QStringLiteral("id"))) {
        object.insert(QStringLiteral("id"), item.id);
    }
    if (!object.contains(QStringLiteral("title"))) {
        object.insert(QStringLiteral("title"), item.title);
    }
    if (!object.contains(QStringLiteral("type"))) {
        object.insert(QStringLiteral("type"), to_string(item.type));
    }
    return object;
}

std::optional<QVector<CatalogItem>> parse_item_list(const QByteArray &body, ItemType listType, QString *error) {
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error) {
            *error = parseError.errorString();
        }
        return std::nullopt;
    }
    if (!document.isArray()) {
        if (error) {
            *error = QStringLiteral("expected a JSON array");
        }
        return std::nullopt;
    }
    return items_from_json(document.array(), listType);
}

QVector<CatalogItem> merge_items(const QVector<CatalogItem> &existing, const QVector<CatalogItem> &fetched,
                                 MergeStats *stats) {
    QHash<QString, int> previous;
    for (int i = 0; i < existing.size(); ++i) {
        previous.insert(existing.at(i).id, i);
    }

    QVector<CatalogItem> merged;
    QHash<QString, int> position;
    MergeStats local;
    for (const auto &item : fetched) {
        auto it = position.find(item.id);
        if (it != position.end()) {
            // Same id listed twice upstream: keep the first slot, latest data.
            merged[it.value()] = item;
            continue;
        }
        position.insert(item.id, merged.size());
        merged.push_back(item);
        if (previous.contains(item.id)) {
            ++local.updated;
        } else {
            ++local.added;
        }
    }
    for (auto it = previous.cbegin(); it != previous.cend(); ++it) {
        if (!position.contains(it.key())) {
            ++local.removed;
        }
    }
    if (stats) {
        *stats = local;
    }
    return merged;
}

MergeStats merge_catalog(Catalog &catalog, const CatalogFetch &fetch) {
    MergeStats total;
    auto apply = [&total](QVector<CatalogItem> &target, const std::optional<QVector<CatalogItem>> &fetched) {
        if (!fetched) {
            return;
        }
        MergeStats stats;
        target = merge_items(target, *fetched, &stats);
        total.added += stats.added;
        total.updated += stats.updated;
        total.removed += stats.removed;
    };
    apply(catalog.macros, fetch.macros);
    apply(catalog.buttons, fetch.buttons);
    apply(catalog.shortcuts, fetch.shortcuts);
    if (fetch.anySucceeded()) {
        catalog.lastUpdated = QDateTime::currentDateTime();
    }
    return total;
}

ItemType infer_item_type(const Catalog &catalog, const QString &itemId) {
    const CatalogItem *item = catalog.find(itemId);
    return item ? item->type : ItemType::Macro;
}

QJsonObject catalog_to_json(const Catalog &catalog) {
    QJsonObject object;
    object.insert(kMacrosKey, items_to_json(catalog.macros));
    object.insert(kButtonsKey, items_to_json(catalog.buttons));
    object.insert(kShortcutsKey, items_to_json(catalog.shortcuts));
    object.insert(kLastUpdatedKey, catalog.lastUpdated.isValid()
                                       ? QJsonValue(catalog.lastUpdated.toString(Qt::ISODateWithMs))
                                       : QJsonValue());
    return object;
}

Catalog catalog_from_json(const QString &automatorId, const QJsonObject &object) {
    Catalog catalog;
    catalog.automatorId = automatorId;
    catalog.macros = items_from_json(object.value(kMacrosKey).toArray(), ItemType::Macro);
    catalog.buttons = items_from_json(object.value(kButtonsKey).toArray(), ItemType::Button);
    // Stored shortcuts already carry their synthesized fields.
    for (const auto &value : object.value(kShortcutsKey).toArray()) {
        if (!value.isObject()) {
            continue;
        }
        QJsonObject raw = value.toObject();
        CatalogItem item;
        item.id = item_id_from_json(raw.value(QStringLiteral("id")));
        item.title = raw.value(QStringLiteral("title")).toString();
        if (item.title.isEmpty()) {
            item.title = shortcut_title(raw);
        }
        item.type = ItemType::Shortcut;
        item.raw = raw;
        catalog.shortcuts.push_back(item);
    }
    const QString stamp = object.value(kLastUpdatedKey).toString();
    if (!stamp.isEmpty()) {
        catalog.lastUpdated = QDateTime::fromString(stamp, Qt::ISODateWithMs);
    }
    return catalog;
}

}  // namespace ab::automator
