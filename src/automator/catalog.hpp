#pragma once

#include "common/item_type.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QDateTime>
#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <optional>

namespace ab::automator {

struct CatalogItem {
    QString id;
    QString title;
    ItemType type = ItemType::Macro;
    // The object as the Automator reported it (plus synthesized fields).
    QJsonObject raw;
};

struct Catalog {
    QString automatorId;
    QVector<CatalogItem> macros;
    QVector<CatalogItem> buttons;
    QVector<CatalogItem> shortcuts;
    QDateTime lastUpdated;

    // Macros, then buttons, then shortcuts.
    QVector<CatalogItem> allItems() const;
    const CatalogItem *find(const QString &itemId) const;
    int size() const;
    bool isEmpty() const;
};

// Result of one refresh; a type is set only if its fetch succeeded.
struct CatalogFetch {
    std::optional<QVector<CatalogItem>> macros;
    std::optional<QVector<CatalogItem>> buttons;
    std::optional<QVector<CatalogItem>> shortcuts;

    bool anySucceeded() const;
};

struct MergeStats {
    int added = 0;
    int updated = 0;
    int removed = 0;
};

// "Ctrl + Alt + Shift + <key>" from the control/alt/shift flags and key name.
QString shortcut_title(const QJsonObject &shortcut);

// Item ids come back as strings or numbers depending on the Automator build.
QString item_id_from_json(const QJsonValue &value);

CatalogItem item_from_json(QJsonObject object, ItemType listType);
QJsonObject item_to_json(const CatalogItem &item);

// Parses a listing response body (a JSON array of objects).
std::optional<QVector<CatalogItem>> parse_item_list(const QByteArray &body, ItemType listType,
                                                    QString *error = nullptr);

// Replaces existing items with fetched ones keyed by id: ids only in existing
// are dropped, ids only in fetched are added, no id appears twice.
QVector<CatalogItem> merge_items(const QVector<CatalogItem> &existing, const QVector<CatalogItem> &fetched,
                                 MergeStats *stats = nullptr);

// Applies every successful part of fetch to catalog and stamps lastUpdated.
MergeStats merge_catalog(Catalog &catalog, const CatalogFetch &fetch);

// Type recorded for itemId in the catalog, Macro when the item is unknown.
ItemType infer_item_type(const Catalog &catalog, const QString &itemId);

QJsonObject catalog_to_json(const Catalog &catalog);
Catalog catalog_from_json(const QString &automatorId, const QJsonObject &object);

}  // namespace ab::automator
