#pragma once

#include "automator/catalog_cache.hpp"
#include "automator/dispatch_client.hpp"
#include "automator/http_client.hpp"
#include "capture_session.hpp"
#include "command_resolver.hpp"
#include "common/config_store.hpp"
#include "common/event_log.hpp"
#include "listener_manager.hpp"

#include <QtCore/QDateTime>
#include <QtCore/QElapsedTimer>
#include <QtCore/QJsonObject>
#include <QtCore/QObject>
#include <QtNetwork/QHostAddress>

struct BridgeOptions {
    ab::automator::HttpClientOptions http;
    ab::automator::DispatchOptions dispatch;
    QHostAddress bindAddress = QHostAddress::Any;
    QString cachePath;
    int maxEvents = ab::common::EventLog::kDefaultMaxEntries;
};

// The running bridge: listeners feed triggers through capture, resolution and
// dispatch; the public methods are the operational surface used by the
// configuration UI.
class BridgeService : public QObject {
    Q_OBJECT

public:
    explicit BridgeService(ab::config::ConfigStore &store, BridgeOptions options = {}, QObject *parent = nullptr);
    ~BridgeService() override;

    // Loads the catalog store, applies the current configuration and follows
    // later configuration changes. Fails once shutdown() has run.
    bool start(QString *error = nullptr);
    // Stops every listener and closes the HTTP client for good. Idempotent.
    void shutdown();
    bool isRunning() const;

    QJsonObject status() const;

    void refreshCatalog(const QString &automatorId, ab::automator::CatalogCache::Callback done = {});
    void refreshAllCatalogs();
    QVector<ab::automator::CatalogItem> catalogItems(const QString &automatorId);

    ab::automator::DispatchOutcome dispatchItem(const ab::automator::DispatchRequest &request,
                                                ab::automator::DispatchClient::Callback done = {});
    void testConnection(const QString &automatorId, ab::automator::DispatchClient::ProbeCallback done = {});

    void startCapture();
    CapturePoll pollCapture();
    void cancelCapture();

    QVector<ab::common::EventEntry> recentEvents(int count = ab::common::EventLog::kDefaultRecent) const;

    ReconcileReport applyConfig(ab::config::ConfigSnapshot snapshot);

    ab::common::EventLog &events();
    ListenerManager &listeners();
    ab::automator::CatalogCache &catalogCache();

signals:
    void triggerHandled(const ResolveResult &result);
    void configApplied(quint64 revision, const ReconcileReport &report);

private slots:
    void handleLine(quint16 port, const QString &trigger, const QString &peer);

private:
    ab::config::ConfigStore &store_;
    BridgeOptions options_;
    ab::common::EventLog events_;
    ab::automator::HttpClient http_;
    ab::automator::CatalogCache cache_;
    ab::automator::DispatchClient dispatch_;
    CommandResolver resolver_;
    CaptureSession capture_;
    ListenerManager listeners_;
    ab::config::ConfigSnapshot config_;
    QElapsedTimer uptime_;
    QDateTime startedAt_;
    bool running_ = false;
};
