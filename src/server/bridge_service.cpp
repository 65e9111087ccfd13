#include "bridge_service.hpp"

#include "common/logger.hpp"

#include <QtCore/QJsonArray>

using ab::common::EventKind;
using ab::common::LogLevel;
using ab::common::Logger;

namespace {

const QString kCategory = QStringLiteral("bridge");

QString connection_state(const ab::automator::ConnectionStatus &status) {
    using Kind = ab::automator::ConnectionStatus::Kind;
    switch (status.kind) {
        case Kind::Connected:
            return QStringLiteral("connected");
        case Kind::NotSelected:
        case Kind::NotFound:
        case Kind::NotConfigured:
            return QStringLiteral("not_configured");
        case Kind::Timeout:
            return QStringLiteral("timeout");
        case Kind::Unreachable:
            return QStringLiteral("unreachable");
        case Kind::HttpError:
            return QStringLiteral("http_error");
        case Kind::Other:
            return QStringLiteral("error");
    }
    return QStringLiteral("error");
}

}  // namespace

BridgeService::BridgeService(ab::config::ConfigStore &store, BridgeOptions options, QObject *parent)
    : QObject(parent),
      store_(store),
      options_(std::move(options)),
      events_(options_.maxEvents),
      http_(options_.http),
      cache_(http_, options_.cachePath.isEmpty() ? ab::automator::CatalogCache::defaultCachePath() : options_.cachePath,
             &events_),
      dispatch_(http_, events_, options_.dispatch),
      resolver_(cache_, events_),
      capture_(&events_),
      listeners_(&events_),
      config_(std::make_shared<const ab::config::BridgeConfig>()) {
    listeners_.setBindAddress(options_.bindAddress);
    connect(&listeners_, &ListenerManager::lineReceived, this, &BridgeService::handleLine);
}

BridgeService::~BridgeService() {
    shutdown();
    http_.close();
}

bool BridgeService::start(QString *error) {
    if (running_) {
        return true;
    }
    if (http_.isClosed()) {
        if (error) {
            *error = QStringLiteral("Service has been shut down");
        }
        return false;
    }
    uptime_.start();
    startedAt_ = QDateTime::currentDateTime();
    events_.append(EventKind::System, QStringLiteral("Starting automator-bridge"));

    QString cacheError;
    if (cache_.load(&cacheError)) {
        events_.append(EventKind::System, QStringLiteral("Loaded cached Automator data"));
    } else {
        // A corrupt store is dropped; the next refresh rebuilds it.
        events_.append(EventKind::System, QStringLiteral("Automator cache not loaded: %1").arg(cacheError));
    }

    connect(&store_, &ab::config::ConfigStore::configChanged, this,
            [this](ab::config::ConfigSnapshot snapshot) { applyConfig(std::move(snapshot)); });
    running_ = true;

    const ReconcileReport report = applyConfig(store_.snapshot());
    if (!report.failed.isEmpty() && error) {
        QStringList ports;
        for (const auto &failure : report.failed) {
            ports.append(QStringLiteral("%1 (%2)").arg(failure.first).arg(failure.second));
        }
        *error = QStringLiteral("Failed to start listeners: %1").arg(ports.join(QStringLiteral(", ")));
    }
    events_.append(EventKind::System, QStringLiteral("Server startup complete"));
    return report.failed.isEmpty();
}

void BridgeService::shutdown() {
    if (!running_) {
        return;
    }
    running_ = false;
    events_.append(EventKind::System, QStringLiteral("Shutting down server"));
    disconnect(&store_, nullptr, this, nullptr);
    capture_.cancel();
    listeners_.stopAll();
    // Pending callbacks capture the dispatch client and the cache.
    http_.close();
    QString error;
    if (!cache_.save(&error)) {
        Logger::instance().log(LogLevel::Error, kCategory, QStringLiteral("Error saving Automator cache: %1").arg(error));
    }
}

bool BridgeService::isRunning() const {
    return running_;
}

QJsonObject BridgeService::status() const {
    QJsonObject status;
    status.insert(QStringLiteral("running"), running_);
    status.insert(QStringLiteral("started_at"), startedAt_.toString(Qt::ISODate));
    status.insert(QStringLiteral("uptime_seconds"), running_ ? static_cast<qint64>(uptime_.elapsed() / 1000) : 0);
    status.insert(QStringLiteral("config_revision"), static_cast<qint64>(config_->revision));

    QJsonArray listeners;
    for (const auto &state : listeners_.states()) {
        QJsonObject entry;
        entry.insert(QStringLiteral("port"), state.port);
        entry.insert(QStringLiteral("name"), state.name);
        entry.insert(QStringLiteral("running"), state.running);
        entry.insert(QStringLiteral("connections"), state.connections);
        listeners.append(entry);
    }
    status.insert(QStringLiteral("tcp_listeners"), listeners);

    const auto probes = dispatch_.lastConnectionStatus();
    QJsonArray automators;
    for (const auto &automator : config_->automators) {
        QJsonObject entry;
        entry.insert(QStringLiteral("id"), automator.id);
        entry.insert(QStringLiteral("name"), automator.name);
        entry.insert(QStringLiteral("url"), automator.normalizedUrl());
        entry.insert(QStringLiteral("enabled"), automator.enabled);
        auto probe = probes.constFind(automator.id);
        if (probe != probes.constEnd()) {
            entry.insert(QStringLiteral("connected"), probe->connected());
            entry.insert(QStringLiteral("state"), connection_state(*probe));
            entry.insert(QStringLiteral("message"), probe->message);
            entry.insert(QStringLiteral("last_check"), probe->lastCheck.toString(Qt::ISODate));
        } else {
            entry.insert(QStringLiteral("connected"), false);
            entry.insert(QStringLiteral("state"), QStringLiteral("unknown"));
        }
        if (cache_.contains(automator.id)) {
            entry.insert(QStringLiteral("cached_items"), cache_.itemCount(automator.id));
        }
        automators.append(entry);
    }
    status.insert(QStringLiteral("automators"), automators);

    status.insert(QStringLiteral("capture"), to_string(capture_.state()));

    QJsonObject http;
    http.insert(QStringLiteral("in_flight"), http_.inFlight());
    http.insert(QStringLiteral("queued"), http_.queued());
    status.insert(QStringLiteral("http"), http);
    status.insert(QStringLiteral("events"), events_.size());
    return status;
}

void BridgeService::refreshCatalog(const QString &automatorId, ab::automator::CatalogCache::Callback done) {
    cache_.refresh(automatorId, std::move(done));
}

void BridgeService::refreshAllCatalogs() {
    for (const auto &automator : config_->automators) {
        if (automator.enabled) {
            cache_.refresh(automator.id);
        }
    }
}

QVector<ab::automator::CatalogItem> BridgeService::catalogItems(const QString &automatorId) {
    return cache_.items(automatorId);
}

ab::automator::DispatchOutcome BridgeService::dispatchItem(const ab::automator::DispatchRequest &request,
                                                           ab::automator::DispatchClient::Callback done) {
    return dispatch_.trigger(request, std::move(done));
}

void BridgeService::testConnection(const QString &automatorId, ab::automator::DispatchClient::ProbeCallback done) {
    dispatch_.checkConnection(automatorId, std::move(done));
}

void BridgeService::startCapture() {
    capture_.start();
}

CapturePoll BridgeService::pollCapture() {
    return capture_.poll();
}

void BridgeService::cancelCapture() {
    capture_.cancel();
}

QVector<ab::common::EventEntry> BridgeService::recentEvents(int count) const {
    return events_.recent(count);
}

ReconcileReport BridgeService::applyConfig(ab::config::ConfigSnapshot snapshot) {
    if (!snapshot) {
        return {};
    }
    config_ = snapshot;
    cache_.setConfig(snapshot);
    dispatch_.setConfig(snapshot);
    resolver_.setConfig(snapshot);

    for (const auto &trigger : ab::config::duplicate_triggers(*snapshot)) {
        events_.append(EventKind::Config,
                       QStringLiteral("Trigger '%1' is defined more than once; the first command wins").arg(trigger));
    }

    ReconcileReport report;
    if (running_) {
        report = listeners_.reconcile(snapshot->listeners);
    }
    Logger::instance().log(LogLevel::Info, kCategory,
                           QStringLiteral("Applied configuration revision %1").arg(snapshot->revision));
    emit configApplied(snapshot->revision, report);
    return report;
}

ab::common::EventLog &BridgeService::events() {
    return events_;
}

ListenerManager &BridgeService::listeners() {
    return listeners_;
}

ab::automator::CatalogCache &BridgeService::catalogCache() {
    return cache_;
}

void BridgeService::handleLine(quint16 port, const QString &trigger, const QString &peer) {
    capture_.offer(trigger, port, peer);

    const ResolveResult result = resolver_.resolve(trigger, port);
    if (result.resolved()) {
        ab::automator::DispatchRequest request;
        request.automatorId = result.automatorId;
        request.itemId = result.itemId;
        request.itemName = result.itemName;
        request.itemType = result.itemType;
        dispatch_.trigger(request);
    }
    emit triggerHandled(result);
}
