#include <QtTest/QtTest>

#include "common/event_log.hpp"
#include "common/logger.hpp"

using namespace ab::common;

class TestEventLog : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void dropsOldestBeyondCapacity();
    void recentReturnsNewestInOrder();
    void rendersLines();
    void mirrorsToLogger();
};

void TestEventLog::initTestCase() {
    Logger::instance().setConsoleEnabled(false);
}

void TestEventLog::dropsOldestBeyondCapacity() {
    EventLog log(3);
    for (int i = 0; i < 5; ++i) {
        log.append(EventKind::TcpCommand, QStringLiteral("event %1").arg(i));
    }
    QCOMPARE(log.size(), 3);
    const auto entries = log.recent(10);
    QCOMPARE(entries.size(), 3);
    QCOMPARE(entries.first().detail, QStringLiteral("event 2"));
    QCOMPARE(entries.last().detail, QStringLiteral("event 4"));
}

void TestEventLog::recentReturnsNewestInOrder() {
    EventLog log;
    QCOMPARE(log.maxEntries(), EventLog::kDefaultMaxEntries);
    for (int i = 0; i < 150; ++i) {
        log.append(EventKind::System, QString::number(i));
    }
    const auto entries = log.recent();
    QCOMPARE(entries.size(), EventLog::kDefaultRecent);
    QCOMPARE(entries.first().detail, QStringLiteral("50"));
    QCOMPARE(entries.last().detail, QStringLiteral("149"));
    QVERIFY(log.recent(0).isEmpty());

    log.clear();
    QCOMPARE(log.size(), 0);
}

void TestEventLog::rendersLines() {
    EventLog log;
    log.append(EventKind::TcpWarning, QStringLiteral("No definition for command 'X'"));
    const QStringList lines = log.toLines();
    QCOMPARE(lines.size(), 1);
    QVERIFY(lines.first().startsWith(QLatin1Char('[')));
    QVERIFY(lines.first().endsWith(QStringLiteral("] TCP Warning: No definition for command 'X'")));
}

void TestEventLog::mirrorsToLogger() {
    EventLog log;
    QVector<LogLevel> levels;
    QStringList categories;
    auto connection = connect(&Logger::instance(), &Logger::messageLogged, this,
                              [&](LogLevel level, const QString &category, const QString &, const QDateTime &) {
                                  levels.append(level);
                                  categories.append(category);
                              });
    int appended = 0;
    connect(&log, &EventLog::appended, this, [&appended](const EventEntry &) { ++appended; });

    log.append(EventKind::HttpStatusError, QStringLiteral("[Main] Failed to trigger macro Lights: HTTP 500"));
    log.append(EventKind::HttpSuccess, QStringLiteral("[Main] Triggered macro: Lights"));
    disconnect(connection);

    QCOMPARE(appended, 2);
    QCOMPARE(levels.size(), 2);
    QVERIFY(levels.at(0) == LogLevel::Warn);
    QVERIFY(levels.at(1) == LogLevel::Info);
    QCOMPARE(categories, (QStringList{QStringLiteral("event"), QStringLiteral("event")}));
}

QTEST_GUILESS_MAIN(TestEventLog)
#include "tst_event_log.moc"
