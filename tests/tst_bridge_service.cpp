#include <QtTest/QtTest>

#include <QtCore/QJsonArray>
#include <QtCore/QTemporaryDir>
#include <QtNetwork/QTcpServer>

#include "common/logger.hpp"
#include "server/bridge_service.hpp"
#include "support/fake_automator.hpp"
#include "support/test_helpers.hpp"

using namespace ab;
using common::EventKind;

namespace {

bool has_event(const BridgeService &service, EventKind kind) {
    for (const auto &entry : service.recentEvents()) {
        if (entry.kind == kind) {
            return true;
        }
    }
    return false;
}

}  // namespace

class TestBridgeService : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();
    void triggerLineDispatchesOnce();
    void unknownTriggerMakesNoCall();
    void captureSeesTriggerAndDispatchStillRuns();
    void configChangeMovesListener();
    void statusReportsListenersAndInstances();
    void startReportsBindFailure();
    void shutdownIsIdempotent();
    void startAfterShutdownFails();

private:
    BridgeOptions options() const;

    std::unique_ptr<QTemporaryDir> dir_;
    std::unique_ptr<FakeAutomator> automator_;
    std::unique_ptr<config::ConfigStore> store_;
    quint16 port_ = 0;
};

void TestBridgeService::initTestCase() {
    common::Logger::instance().setConsoleEnabled(false);
}

void TestBridgeService::init() {
    dir_ = std::make_unique<QTemporaryDir>();
    automator_ = std::make_unique<FakeAutomator>();
    QVERIFY(automator_->start());
    automator_->setAcceptAll(true);

    store_ = std::make_unique<config::ConfigStore>(dir_->filePath(QStringLiteral("config.json")));
    QVERIFY(store_->load());
    port_ = test_helpers::free_port();
    QVERIFY(store_->replace(test_helpers::single_route_config(port_, automator_->baseUrl())));
}

void TestBridgeService::cleanup() {
    store_.reset();
    automator_.reset();
    dir_.reset();
}

BridgeOptions TestBridgeService::options() const {
    BridgeOptions options;
    options.bindAddress = QHostAddress::LocalHost;
    options.cachePath = dir_->filePath(QStringLiteral("automator_cache.json"));
    return options;
}

void TestBridgeService::triggerLineDispatchesOnce() {
    BridgeService service(*store_, options());
    QString error;
    QVERIFY2(service.start(&error), qPrintable(error));

    QVector<ResolveResult> handled;
    connect(&service, &BridgeService::triggerHandled, this,
            [&handled](const ResolveResult &result) { handled.append(result); });

    auto socket = test_helpers::open_and_send(port_, "LIGHT_ON\n");
    QVERIFY(socket);

    QTRY_COMPARE(automator_->requestCount(QStringLiteral("/api/macro/m5")), 1);
    QCOMPARE(handled.size(), 1);
    QVERIFY(handled.first().resolved());
    QCOMPARE(handled.first().port, port_);

    QTest::qWait(100);
    QCOMPARE(automator_->requests(), QStringList{QStringLiteral("/api/macro/m5")});

    QTRY_VERIFY(has_event(service, EventKind::HttpSuccess));
}

void TestBridgeService::unknownTriggerMakesNoCall() {
    BridgeService service(*store_, options());
    QVERIFY(service.start());

    int handled = 0;
    connect(&service, &BridgeService::triggerHandled, this, [&handled](const ResolveResult &) { ++handled; });
    auto socket = test_helpers::open_and_send(port_, "SOMETHING_ELSE\n");
    QVERIFY(socket);

    QTRY_COMPARE(handled, 1);
    QTest::qWait(100);
    QVERIFY(automator_->requests().isEmpty());
    QVERIFY(service.recentEvents(1).first().kind == EventKind::TcpWarning);
}

void TestBridgeService::captureSeesTriggerAndDispatchStillRuns() {
    BridgeService service(*store_, options());
    QVERIFY(service.start());

    service.startCapture();
    QVERIFY(service.pollCapture().state == CapturePoll::State::Listening);

    auto socket = test_helpers::open_and_send(port_, "light_on\n");
    QVERIFY(socket);
    QTRY_COMPARE(automator_->requestCount(QStringLiteral("/api/macro/m5")), 1);

    const CapturePoll poll = service.pollCapture();
    QVERIFY(poll.state == CapturePoll::State::Captured);
    QCOMPARE(poll.result->trigger, QStringLiteral("light_on"));
    QCOMPARE(poll.result->port, port_);
    QVERIFY(service.pollCapture().state == CapturePoll::State::Idle);
}

void TestBridgeService::configChangeMovesListener() {
    BridgeService service(*store_, options());
    QVERIFY(service.start());
    QVERIFY(service.listeners().isRunning(port_));

    int applied = 0;
    connect(&service, &BridgeService::configApplied, this,
            [&applied](quint64, const ReconcileReport &) { ++applied; });
    const quint16 next = test_helpers::free_port();
    config::BridgeConfig config = *store_->snapshot();
    config.listeners[0].port = next;
    QVERIFY(store_->replace(config));

    QTRY_COMPARE(applied, 1);
    QVERIFY(service.listeners().isRunning(next));
    QVERIFY(!service.listeners().isRunning(port_));

    auto socket = test_helpers::open_and_send(next, "LIGHT_ON\n");
    QVERIFY(socket);
    QTRY_COMPARE(automator_->requestCount(QStringLiteral("/api/macro/m5")), 1);
}

void TestBridgeService::statusReportsListenersAndInstances() {
    BridgeService service(*store_, options());
    QVERIFY(service.start());

    bool probed = false;
    service.testConnection(QStringLiteral("a1"), [&probed](const automator::ConnectionStatus &) { probed = true; });
    QTRY_VERIFY(probed);

    const QJsonObject status = service.status();
    QVERIFY(status.value(QStringLiteral("running")).toBool());
    QCOMPARE(status.value(QStringLiteral("config_revision")).toInt(), int(store_->snapshot()->revision));
    QCOMPARE(status.value(QStringLiteral("capture")).toString(), QStringLiteral("idle"));

    const QJsonArray listeners = status.value(QStringLiteral("tcp_listeners")).toArray();
    QCOMPARE(listeners.size(), 1);
    QCOMPARE(listeners.first().toObject().value(QStringLiteral("port")).toInt(), int(port_));
    QCOMPARE(listeners.first().toObject().value(QStringLiteral("name")).toString(), QStringLiteral("Desk"));

    const QJsonArray automators = status.value(QStringLiteral("automators")).toArray();
    QCOMPARE(automators.size(), 1);
    const QJsonObject main = automators.first().toObject();
    QCOMPARE(main.value(QStringLiteral("id")).toString(), QStringLiteral("a1"));
    QVERIFY(main.value(QStringLiteral("connected")).toBool());
}

void TestBridgeService::startReportsBindFailure() {
    QTcpServer blocker;
    QVERIFY(blocker.listen(QHostAddress::LocalHost, port_));

    BridgeService service(*store_, options());
    QString error;
    QVERIFY(!service.start(&error));
    QVERIFY(error.contains(QString::number(port_)));
    QVERIFY(service.isRunning());
    QVERIFY(!service.listeners().isRunning(port_));
}

void TestBridgeService::shutdownIsIdempotent() {
    BridgeService service(*store_, options());
    QVERIFY(service.start());
    service.shutdown();
    QVERIFY(!service.isRunning());
    QVERIFY(!service.listeners().isRunning(port_));
    const int events = service.recentEvents().size();
    service.shutdown();
    QCOMPARE(service.recentEvents().size(), events);

    QTcpServer rebind;
    QVERIFY(rebind.listen(QHostAddress::LocalHost, port_));
}

void TestBridgeService::startAfterShutdownFails() {
    BridgeService service(*store_, options());
    QVERIFY(service.start());
    service.shutdown();

    QString error;
    QVERIFY(!service.start(&error));
    QVERIFY(!error.isEmpty());
    QVERIFY(!service.isRunning());
    QVERIFY(!service.listeners().isRunning(port_));
}

QTEST_GUILESS_MAIN(TestBridgeService)
#include "tst_bridge_service.moc"
