#include <QtTest/QtTest>

#include <QtNetwork/QTcpServer>
#include <QtNetwork/QTcpSocket>

#include "common/event_log.hpp"
#include "common/logger.hpp"
#include "server/listener_manager.hpp"
#include "support/test_helpers.hpp"

using ab::common::EventKind;
using ab::common::EventLog;
using ab::config::ListenerEntry;

namespace {

ListenerEntry entry(quint16 port, bool enabled = true, const QString &name = QString()) {
    ListenerEntry e;
    e.port = port;
    e.enabled = enabled;
    e.name = name.isEmpty() ? QStringLiteral("Port %1").arg(port) : name;
    return e;
}

struct ReceivedLine {
    quint16 port = 0;
    QString trigger;
    QString peer;
};

}  // namespace

class TestListenerManager : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();
    void reconcileBindsEnabledPorts();
    void reconcileIsIdempotent();
    void reconcileStopsRemovedPorts();
    void duplicateStartIsWarning();
    void bindFailureIsReported();
    void deliversLinesWithPort();
    void unterminatedLineDeliveredOnClose();
    void terminatedThenUnterminatedKeepOrder();
    void overlongLineIsReportedAndSkipped();
    void connectionCountsPerPort();
    void stopClosesPeers();

private:
    std::unique_ptr<EventLog> events_;
    std::unique_ptr<ListenerManager> manager_;
    QVector<ReceivedLine> lines_;
};

void TestListenerManager::initTestCase() {
    ab::common::Logger::instance().setConsoleEnabled(false);
}

void TestListenerManager::init() {
    events_ = std::make_unique<EventLog>();
    manager_ = std::make_unique<ListenerManager>(events_.get());
    manager_->setBindAddress(QHostAddress::LocalHost);
    lines_.clear();
    connect(manager_.get(), &ListenerManager::lineReceived, this,
            [this](quint16 port, const QString &trigger, const QString &peer) {
                lines_.append(ReceivedLine{port, trigger, peer});
            });
}

void TestListenerManager::cleanup() {
    manager_.reset();
    events_.reset();
}

void TestListenerManager::reconcileBindsEnabledPorts() {
    const quint16 a = test_helpers::free_port();
    const quint16 b = test_helpers::free_port();
    const quint16 disabled = test_helpers::free_port();

    const ReconcileReport report = manager_->reconcile({entry(a), entry(b), entry(disabled, false), entry(a)});
    QCOMPARE(report.started.size(), 2);
    QVERIFY(report.failed.isEmpty());
    QVERIFY(manager_->isRunning(a));
    QVERIFY(manager_->isRunning(b));
    QVERIFY(!manager_->isRunning(disabled));
    QCOMPARE(manager_->runningPorts().size(), 2);

    QTcpSocket socket;
    socket.connectToHost(QHostAddress::LocalHost, disabled);
    QVERIFY(!socket.waitForConnected(500));
}

void TestListenerManager::reconcileIsIdempotent() {
    const quint16 a = test_helpers::free_port();
    const QVector<ListenerEntry> desired{entry(a)};
    QCOMPARE(manager_->reconcile(desired).started.size(), 1);

    const int before = events_->size();
    const ReconcileReport again = manager_->reconcile(desired);
    QVERIFY(again.converged());
    QCOMPARE(again.unchanged, QVector<quint16>{a});
    QCOMPARE(events_->size(), before);
}

void TestListenerManager::reconcileStopsRemovedPorts() {
    const quint16 a = test_helpers::free_port();
    const quint16 b = test_helpers::free_port();
    manager_->reconcile({entry(a), entry(b)});

    QSignalSpy stopped(manager_.get(), &ListenerManager::listenerStopped);
    const ReconcileReport report = manager_->reconcile({entry(a), entry(b, false)});
    QCOMPARE(report.stopped, QVector<quint16>{b});
    QCOMPARE(stopped.count(), 1);
    QVERIFY(manager_->isRunning(a));
    QVERIFY(!manager_->isRunning(b));
    QCOMPARE(events_->recent(1).first().detail, QStringLiteral("Stopped on port %1").arg(b));

    // The port is free again.
    QTcpServer rebind;
    QVERIFY(rebind.listen(QHostAddress::LocalHost, b));
}

void TestListenerManager::duplicateStartIsWarning() {
    const quint16 a = test_helpers::free_port();
    QVERIFY(manager_->startListener(a));
    QVERIFY(manager_->startListener(a));
    QCOMPARE(manager_->runningPorts().size(), 1);
    QVERIFY(events_->recent(1).first().kind == EventKind::TcpWarning);
    QCOMPARE(events_->recent(1).first().detail, QStringLiteral("Server already running on port %1").arg(a));
}

void TestListenerManager::bindFailureIsReported() {
    QTcpServer blocker;
    QVERIFY(blocker.listen(QHostAddress::LocalHost, 0));
    const quint16 taken = blocker.serverPort();
    const quint16 free = test_helpers::free_port();

    const ReconcileReport report = manager_->reconcile({entry(taken), entry(free)});
    QCOMPARE(report.failed.size(), 1);
    QCOMPARE(report.failed.first().first, taken);
    QVERIFY(!report.failed.first().second.isEmpty());
    QCOMPARE(report.started, QVector<quint16>{free});
    QVERIFY(!manager_->isRunning(taken));

    bool logged = false;
    for (const auto &e : events_->recent()) {
        if (e.kind == EventKind::TcpError &&
            e.detail.startsWith(QStringLiteral("Failed to start server on port %1").arg(taken))) {
            logged = true;
        }
    }
    QVERIFY(logged);
}

void TestListenerManager::deliversLinesWithPort() {
    const quint16 a = test_helpers::free_port();
    const quint16 b = test_helpers::free_port();
    manager_->reconcile({entry(a), entry(b)});

    auto first = test_helpers::open_and_send(a, "LIGHT_ON\r\n\nSCENE_2\n");
    QVERIFY(first);
    auto second = test_helpers::open_and_send(b, "  PAUSE  \n");
    QVERIFY(second);

    QTRY_COMPARE(lines_.size(), 3);
    QStringList fromA;
    for (const auto &line : lines_) {
        if (line.port == a) {
            fromA.append(line.trigger);
            QVERIFY(line.peer.startsWith(QStringLiteral("127.0.0.1:")));
        } else {
            QCOMPARE(line.port, b);
            QCOMPARE(line.trigger, QStringLiteral("PAUSE"));
        }
    }
    QCOMPARE(fromA, (QStringList{QStringLiteral("LIGHT_ON"), QStringLiteral("SCENE_2")}));
}

void TestListenerManager::unterminatedLineDeliveredOnClose() {
    const quint16 a = test_helpers::free_port();
    manager_->reconcile({entry(a)});
    QVERIFY(test_helpers::send_raw(a, "FINAL"));
    QTRY_COMPARE(lines_.size(), 1);
    QCOMPARE(lines_.first().trigger, QStringLiteral("FINAL"));
}

void TestListenerManager::terminatedThenUnterminatedKeepOrder() {
    const quint16 a = test_helpers::free_port();
    manager_->reconcile({entry(a)});
    QVERIFY(test_helpers::send_raw(a, "FIRST\nFINAL"));
    QTRY_COMPARE(lines_.size(), 2);
    QCOMPARE(lines_.at(0).trigger, QStringLiteral("FIRST"));
    QCOMPARE(lines_.at(1).trigger, QStringLiteral("FINAL"));
    QTest::qWait(50);
    QCOMPARE(lines_.size(), 2);
}

void TestListenerManager::overlongLineIsReportedAndSkipped() {
    const quint16 a = test_helpers::free_port();
    manager_->reconcile({entry(a)});

    QByteArray payload(5000, 'X');
    payload.append("\nAFTER\n");
    auto socket = test_helpers::open_and_send(a, payload);
    QVERIFY(socket);

    QTRY_COMPARE(lines_.size(), 1);
    QCOMPARE(lines_.first().trigger, QStringLiteral("AFTER"));
    bool reported = false;
    for (const auto &e : events_->recent()) {
        if (e.kind == EventKind::TcpError && e.detail.startsWith(QStringLiteral("Invalid line on port %1").arg(a))) {
            reported = true;
        }
    }
    QVERIFY(reported);
}

void TestListenerManager::connectionCountsPerPort() {
    const quint16 a = test_helpers::free_port();
    const quint16 b = test_helpers::free_port();
    manager_->reconcile({entry(a), entry(b)});

    auto s1 = test_helpers::open_and_send(a, "X\n");
    auto s2 = test_helpers::open_and_send(a, "Y\n");
    auto s3 = test_helpers::open_and_send(b, "Z\n");
    QVERIFY(s1 && s2 && s3);

    QTRY_COMPARE(manager_->connectionCount(a), 2);
    QTRY_COMPARE(manager_->connectionCount(b), 1);
    QCOMPARE(manager_->connections()->rowCount(), 3);

    s1->disconnectFromHost();
    QTRY_COMPARE(manager_->connectionCount(a), 1);
    QCOMPARE(manager_->connectionCount(b), 1);

    // The row is gone exactly once even after more traffic on other peers.
    s2->write("W\n");
    QTRY_COMPARE(lines_.size(), 4);
    QCOMPARE(manager_->connectionCount(a), 1);

    const auto states = manager_->states();
    QCOMPARE(states.size(), 2);
    for (const auto &state : states) {
        QVERIFY(state.running);
        QCOMPARE(state.connections, 1);
    }
}

void TestListenerManager::stopClosesPeers() {
    const quint16 a = test_helpers::free_port();
    manager_->reconcile({entry(a)});
    auto socket = test_helpers::open_and_send(a, "HELLO\n");
    QVERIFY(socket);
    QTRY_COMPARE(manager_->connectionCount(a), 1);

    manager_->stopListener(a);
    QCOMPARE(manager_->connectionCount(a), 0);
    QCOMPARE(manager_->connections()->rowCount(), 0);
    QTRY_VERIFY(socket->state() == QAbstractSocket::UnconnectedState);

    // Stopping again is a no-op.
    const int before = events_->size();
    manager_->stopListener(a);
    QCOMPARE(events_->size(), before);
}

QTEST_GUILESS_MAIN(TestListenerManager)
#include "tst_listener_manager.moc"
