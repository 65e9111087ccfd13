#pragma once

#include "catalog.hpp"
#include "common/config.hpp"
#include "http_client.hpp"

#include <QtCore/QHash>
#include <QtCore/QList>
#include <QtCore/QObject>
#include <QtCore/QSet>
#include <QtCore/QStringList>

#include <functional>
#include <memory>

namespace ab::common {
class EventLog;
}

namespace ab::automator {

constexpr char kMacroListPath[] = "/api/macro/";
constexpr char kButtonListPath[] = "/api/trigger/button/";
constexpr char kShortcutListPath[] = "/api/trigger/shortcut/";

struct RefreshOptions {
    // Return the previous catalog when every fetch fails.
    bool useCacheOnFailure = true;
};

struct RefreshResult {
    QString automatorId;
    Catalog catalog;
    // At least one of the three fetches succeeded and was merged.
    bool fetched = false;
    int failedFetches = 0;
    MergeStats stats;
    QStringList errors;
};

// Per-instance store of the items each Automator offers, persisted as one
// JSON document. Refreshes of one instance run one at a time; different
// instances refresh independently.
class CatalogCache : public QObject {
    Q_OBJECT

public:
    using Callback = std::function<void(const RefreshResult &)>;

    CatalogCache(HttpClient &http, QString path, common::EventLog *events = nullptr, QObject *parent = nullptr);

    static QString defaultCachePath();

    QString path() const;
    bool load(QString *error = nullptr);
    bool save(QString *error = nullptr) const;

    void setConfig(config::ConfigSnapshot snapshot);
    void setFetchTimeout(int timeoutMs);

    // Creates an empty catalog for the instance on first access.
    const Catalog &catalog(const QString &automatorId);
    bool contains(const QString &automatorId) const;
    int itemCount(const QString &automatorId) const;
    QVector<CatalogItem> items(const QString &automatorId);
    ItemType inferItemType(const QString &automatorId, const QString &itemId);

    // Merges fetch into the instance's catalog and writes the store.
    MergeStats merge(const QString &automatorId, const CatalogFetch &fetch);

    // An empty automatorId selects the only enabled instance. The callback
    // always runs from the event loop, never from inside this call.
    void refresh(const QString &automatorId, Callback callback = {}, RefreshOptions options = {});
    bool isRefreshing(const QString &automatorId) const;

signals:
    void catalogUpdated(const QString &automatorId);

private:
    struct Pending {
        Callback callback;
        RefreshOptions options;
    };

    struct Job {
        config::AutomatorInstance automator;
        Pending request;
        CatalogFetch fetch;
        int outstanding = 0;
        QStringList errors;
    };

    void startRefresh(const config::AutomatorInstance &automator, Pending request);
    void fetchList(const std::shared_ptr<Job> &job, const QString &url, ItemType type);
    void finishFetch(const std::shared_ptr<Job> &job);
    void complete(const RefreshResult &result, const Callback &callback);
    void startNext(const QString &automatorId);

    HttpClient &http_;
    QString path_;
    common::EventLog *events_;
    config::ConfigSnapshot config_;
    int fetchTimeoutMs_ = 5000;
    QHash<QString, Catalog> catalogs_;
    QSet<QString> running_;
    QHash<QString, QList<Pending>> waiting_;
};

}  // namespace ab::automator
