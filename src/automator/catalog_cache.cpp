#include "catalog_cache.hpp"

#include "common/config_store.hpp"
#include "common/event_log.hpp"
#include "common/logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonParseError>
#include <QtCore/QPointer>
#include <QtCore/QSaveFile>
#include <QtCore/QTimer>

namespace ab::automator {

namespace {

using common::EventKind;
using common::LogLevel;
using common::Logger;

const QString kCategory = QStringLiteral("catalog");

QString list_name(ItemType type) {
    switch (type) {
        case ItemType::Button:
            return QStringLiteral("buttons");
        case ItemType::Shortcut:
            return QStringLiteral("shortcuts");
        default:
            return QStringLiteral("macros");
    }
}

}  // namespace

CatalogCache::CatalogCache(HttpClient &http, QString path, common::EventLog *events, QObject *parent)
    : QObject(parent),
      http_(http),
      path_(std::move(path)),
      events_(events),
      config_(std::make_shared<const config::BridgeConfig>()) {}

QString CatalogCache::defaultCachePath() {
    return QDir(config::ConfigStore::defaultDirectory()).filePath(QStringLiteral("automator_cache.json"));
}

QString CatalogCache::path() const {
    return path_;
}

bool CatalogCache::load(QString *error) {
    QFile file(path_);
    if (!file.exists()) {
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = file.errorString();
        }
        Logger::instance().log(LogLevel::Error, kCategory,
                               QStringLiteral("Error loading Automator cache: %1").arg(file.errorString()));
        return false;
    }
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        const QString reason = parseError.error != QJsonParseError::NoError ? parseError.errorString()
                                                                            : QStringLiteral("not an object");
        if (error) {
            *error = reason;
        }
        Logger::instance().log(LogLevel::Error, kCategory,
                               QStringLiteral("Ignoring corrupt Automator cache %1: %2").arg(path_, reason));
        return false;
    }

    catalogs_.clear();
    const QJsonObject root = document.object();
    for (auto it = root.begin(); it != root.end(); ++it) {
        catalogs_.insert(it.key(), catalog_from_json(it.key(), it.value().toObject()));
    }
    Logger::instance().log(LogLevel::Info, kCategory,
                           QStringLiteral("Automator cache loaded from %1 (%2 instances)").arg(path_).arg(root.size()));
    return true;
}

bool CatalogCache::save(QString *error) const {
    QJsonObject root;
    for (auto it = catalogs_.cbegin(); it != catalogs_.cend(); ++it) {
        root.insert(it.key(), catalog_to_json(it.value()));
    }

    const QFileInfo info(path_);
    if (!QDir().mkpath(info.absolutePath())) {
        if (error) {
            *error = QStringLiteral("cannot create %1").arg(info.absolutePath());
        }
        return false;
    }
    QSaveFile file(path_);
    if (!file.open(QIODevice::WriteOnly)) {
        if (error) {
            *error = file.errorString();
        }
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        if (error) {
            *error = file.errorString();
        }
        return false;
    }
    return true;
}

void CatalogCache::setConfig(config::ConfigSnapshot snapshot) {
    config_ = std::move(snapshot);
}

void CatalogCache::setFetchTimeout(int timeoutMs) {
    fetchTimeoutMs_ = timeoutMs;
}

const Catalog &CatalogCache::catalog(const QString &automatorId) {
    auto it = catalogs_.find(automatorId);
    if (it == catalogs_.end()) {
        Catalog empty;
        empty.automatorId = automatorId;
        it = catalogs_.insert(automatorId, empty);
    }
    return it.value();
}

bool CatalogCache::contains(const QString &automatorId) const {
    return catalogs_.contains(automatorId);
}

int CatalogCache::itemCount(const QString &automatorId) const {
    auto it = catalogs_.constFind(automatorId);
    return it == catalogs_.constEnd() ? 0 : it->size();
}

QVector<CatalogItem> CatalogCache::items(const QString &automatorId) {
    return catalog(automatorId).allItems();
}

ItemType CatalogCache::inferItemType(const QString &automatorId, const QString &itemId) {
    return infer_item_type(catalog(automatorId), itemId);
}

MergeStats CatalogCache::merge(const QString &automatorId, const CatalogFetch &fetch) {
    catalog(automatorId);
    Catalog &target = catalogs_[automatorId];
    const MergeStats stats = merge_catalog(target, fetch);

    QString error;
    if (!save(&error)) {
        Logger::instance().log(LogLevel::Error, kCategory, QStringLiteral("Error saving Automator cache: %1").arg(error));
    }
    emit catalogUpdated(automatorId);
    return stats;
}

void CatalogCache::refresh(const QString &automatorId, Callback callback, RefreshOptions options) {
    QString error;
    const config::AutomatorInstance *automator = config::select_automator(*config_, automatorId, &error);
    if (!automator) {
        RefreshResult result;
        result.automatorId = automatorId;
        result.errors.append(error);
        Logger::instance().log(LogLevel::Info, kCategory, error);
        complete(result, callback);
        return;
    }

    Pending request{std::move(callback), options};
    if (running_.contains(automator->id)) {
        waiting_[automator->id].append(std::move(request));
        return;
    }
    startRefresh(*automator, std::move(request));
}

bool CatalogCache::isRefreshing(const QString &automatorId) const {
    return running_.contains(automatorId);
}

void CatalogCache::startRefresh(const config::AutomatorInstance &automator, Pending request) {
    const QString base = automator.normalizedUrl();
    if (base.isEmpty()) {
        Logger::instance().log(LogLevel::Info, kCategory,
                               QStringLiteral("No URL for Automator %1, using cached data").arg(automator.name));
        RefreshResult result;
        result.automatorId = automator.id;
        result.catalog = catalog(automator.id);
        result.errors.append(QStringLiteral("URL not configured"));
        complete(result, request.callback);
        startNext(automator.id);
        return;
    }

    running_.insert(automator.id);
    auto job = std::make_shared<Job>();
    job->automator = automator;
    job->request = std::move(request);
    job->outstanding = 3;
    fetchList(job, base + QLatin1String(kMacroListPath), ItemType::Macro);
    fetchList(job, base + QLatin1String(kButtonListPath), ItemType::Button);
    fetchList(job, base + QLatin1String(kShortcutListPath), ItemType::Shortcut);
}

void CatalogCache::fetchList(const std::shared_ptr<Job> &job, const QString &url, ItemType type) {
    // close() on a longer-lived client may complete this after the cache is gone.
    QPointer<CatalogCache> self(this);
    http_.get(
        QUrl(url),
        [this, self, job, type](const HttpResult &reply) {
            if (!self) {
                return;
            }
            const QString what = list_name(type);
            if (!reply.ok()) {
                job->errors.append(QStringLiteral("%1: %2").arg(what, reply.errorString));
                Logger::instance().log(LogLevel::Error, kCategory,
                                       QStringLiteral("Error fetching Automator %1 from %2: %3")
                                           .arg(what, job->automator.name, reply.errorString));
            } else {
                QString parseError;
                auto items = parse_item_list(reply.body, type, &parseError);
                if (!items) {
                    job->errors.append(QStringLiteral("%1: %2").arg(what, parseError));
                    Logger::instance().log(LogLevel::Error, kCategory,
                                           QStringLiteral("Invalid %1 listing from %2: %3")
                                               .arg(what, job->automator.name, parseError));
                } else {
                    Logger::instance().log(LogLevel::Info, kCategory,
                                           QStringLiteral("Fetched %1 %2 from %3")
                                               .arg(items->size())
                                               .arg(what, job->automator.name));
                    switch (type) {
                        case ItemType::Button:
                            job->fetch.buttons = std::move(items);
                            break;
                        case ItemType::Shortcut:
                            job->fetch.shortcuts = std::move(items);
                            break;
                        default:
                            job->fetch.macros = std::move(items);
                            break;
                    }
                }
            }
            finishFetch(job);
        },
        fetchTimeoutMs_);
}

void CatalogCache::finishFetch(const std::shared_ptr<Job> &job) {
    if (--job->outstanding > 0) {
        return;
    }

    const QString id = job->automator.id;
    RefreshResult result;
    result.automatorId = id;
    result.errors = job->errors;
    result.failedFetches = job->errors.size();

    if (job->fetch.anySucceeded()) {
        result.fetched = true;
        result.stats = merge(id, job->fetch);
        result.catalog = catalog(id);
        Logger::instance().log(LogLevel::Info, kCategory,
                               QStringLiteral("Merged Automator data for %1: %2 added, %3 updated, %4 removed")
                                   .arg(job->automator.name)
                                   .arg(result.stats.added)
                                   .arg(result.stats.updated)
                                   .arg(result.stats.removed));
        if (events_) {
            events_->append(EventKind::CatalogRefresh, QStringLiteral("[%1] Loaded %2 items")
                                                           .arg(job->automator.name)
                                                           .arg(result.catalog.size()));
        }
    } else {
        result.catalog.automatorId = id;
        if (job->request.options.useCacheOnFailure) {
            result.catalog = catalog(id);
        }
        if (events_) {
            events_->append(EventKind::AutomatorError, QStringLiteral("[%1] Catalog refresh failed: %2")
                                                           .arg(job->automator.name, job->errors.join(QStringLiteral("; "))));
        }
    }

    running_.remove(id);
    complete(result, job->request.callback);
    startNext(id);
}

void CatalogCache::complete(const RefreshResult &result, const Callback &callback) {
    if (!callback) {
        return;
    }
    QTimer::singleShot(0, this, [callback, result]() { callback(result); });
}

void CatalogCache::startNext(const QString &automatorId) {
    auto it = waiting_.find(automatorId);
    if (it == waiting_.end()) {
        return;
    }
    Pending next = it->takeFirst();
    if (it->isEmpty()) {
        waiting_.erase(it);
    }
    // The instance may have been reconfigured while this request waited.
    const config::AutomatorInstance *automator = config_->findAutomator(automatorId);
    if (!automator) {
        RefreshResult result;
        result.automatorId = automatorId;
        result.errors.append(QStringLiteral("Automator %1 not found").arg(automatorId));
        complete(result, next.callback);
        startNext(automatorId);
        return;
    }
    startRefresh(*automator, std::move(next));
}

}  // namespace ab::automator
