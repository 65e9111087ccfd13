#include <QtTest/QtTest>

#include <QtCore/QFile>
#include <QtCore/QTemporaryDir>

#include "automator/catalog_cache.hpp"
#include "common/event_log.hpp"
#include "common/logger.hpp"
#include "support/fake_automator.hpp"
#include "support/test_helpers.hpp"

using namespace ab;
using namespace ab::automator;

namespace {

config::ConfigSnapshot one_instance(const QString &url, bool enabled = true) {
    config::BridgeConfig config;
    config::AutomatorInstance automator;
    automator.id = QStringLiteral("a1");
    automator.name = QStringLiteral("Main");
    automator.url = url;
    automator.enabled = enabled;
    config.automators.append(automator);
    return test_helpers::make_snapshot(config);
}

QStringList ids(const QVector<CatalogItem> &items) {
    QStringList result;
    for (const auto &item : items) {
        result.append(item.id);
    }
    return result;
}

}  // namespace

class TestCatalogCache : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();
    void refreshFetchesAllThreeLists();
    void refreshMergesByIdAcrossRefreshes();
    void partialFailureKeepsFailedType();
    void totalFailureReturnsPreviousCatalog();
    void totalFailureWithoutFallbackReturnsEmpty();
    void instanceWithoutUrlUsesCache();
    void unknownInstanceReportsError();
    void sameInstanceRefreshesAreSerialized();
    void slowListTimesOutAsPartialFailure();
    void closingClientCompletesRefreshes();
    void storeIsPersistedAndReloaded();
    void corruptStoreIsIgnored();

private:
    RefreshResult refreshAndWait(CatalogCache &cache, RefreshOptions options = {});

    std::unique_ptr<QTemporaryDir> dir_;
    std::unique_ptr<FakeAutomator> automator_;
    std::unique_ptr<HttpClient> http_;
    std::unique_ptr<common::EventLog> events_;
};

void TestCatalogCache::initTestCase() {
    common::Logger::instance().setConsoleEnabled(false);
}

void TestCatalogCache::init() {
    dir_ = std::make_unique<QTemporaryDir>();
    automator_ = std::make_unique<FakeAutomator>();
    QVERIFY(automator_->start());
    http_ = std::make_unique<HttpClient>();
    events_ = std::make_unique<common::EventLog>();
}

void TestCatalogCache::cleanup() {
    http_->close();
    http_.reset();
    automator_.reset();
    events_.reset();
    dir_.reset();
}

RefreshResult TestCatalogCache::refreshAndWait(CatalogCache &cache, RefreshOptions options) {
    std::optional<RefreshResult> result;
    cache.refresh(QStringLiteral("a1"), [&result](const RefreshResult &r) { result = r; }, options);
    QTRY_VERIFY_WITH_TIMEOUT(result.has_value(), 10000);
    return result.value_or(RefreshResult());
}

void TestCatalogCache::refreshFetchesAllThreeLists() {
    automator_->setRoute(QLatin1String(kMacroListPath), 200, R"([{"id": "m1", "title": "Lights", "type": "macro"}])");
    automator_->setRoute(QLatin1String(kButtonListPath), 200, R"([{"id": "b1", "title": "Cam 1"}])");
    automator_->setRoute(QLatin1String(kShortcutListPath), 200, R"([{"id": 7, "control": true, "key": "F5"}])");

    CatalogCache cache(*http_, dir_->filePath(QStringLiteral("cache.json")), events_.get());
    cache.setConfig(one_instance(automator_->baseUrl()));
    QSignalSpy updated(&cache, &CatalogCache::catalogUpdated);

    const RefreshResult result = refreshAndWait(cache);
    QVERIFY(result.fetched);
    QCOMPARE(result.failedFetches, 0);
    QCOMPARE(result.catalog.size(), 3);
    QCOMPARE(updated.count(), 1);
    QCOMPARE(ids(cache.items(QStringLiteral("a1"))),
             (QStringList{QStringLiteral("m1"), QStringLiteral("b1"), QStringLiteral("7")}));
    QCOMPARE(cache.catalog(QStringLiteral("a1")).shortcuts.first().title, QStringLiteral("Ctrl + F5"));
    QVERIFY(cache.inferItemType(QStringLiteral("a1"), QStringLiteral("b1")) == ItemType::Button);
    QVERIFY(QFile::exists(cache.path()));
    QVERIFY(events_->recent(1).first().kind == common::EventKind::CatalogRefresh);
}

void TestCatalogCache::refreshMergesByIdAcrossRefreshes() {
    automator_->setAcceptAll(false);
    automator_->setRoute(QLatin1String(kButtonListPath), 200, "[]");
    automator_->setRoute(QLatin1String(kShortcutListPath), 200, "[]");
    automator_->setRoute(QLatin1String(kMacroListPath), 200, R"([{"id": 1, "title": "A"}, {"id": 2, "title": "B"}])");

    CatalogCache cache(*http_, dir_->filePath(QStringLiteral("cache.json")));
    cache.setConfig(one_instance(automator_->baseUrl()));
    refreshAndWait(cache);

    automator_->setRoute(QLatin1String(kMacroListPath), 200, R"([{"id": 1, "title": "A-renamed"}, {"id": 3, "title": "C"}])");
    const RefreshResult result = refreshAndWait(cache);
    QCOMPARE(ids(result.catalog.macros), (QStringList{QStringLiteral("1"), QStringLiteral("3")}));
    QCOMPARE(result.catalog.find(QStringLiteral("1"))->title, QStringLiteral("A-renamed"));
    QCOMPARE(result.stats.added, 1);
    QCOMPARE(result.stats.updated, 1);
    QCOMPARE(result.stats.removed, 1);
}

void TestCatalogCache::partialFailureKeepsFailedType() {
    automator_->setRoute(QLatin1String(kMacroListPath), 200, R"([{"id": "m1"}])");
    automator_->setRoute(QLatin1String(kButtonListPath), 200, R"([{"id": "b1"}])");
    automator_->setRoute(QLatin1String(kShortcutListPath), 200, "[]");

    CatalogCache cache(*http_, dir_->filePath(QStringLiteral("cache.json")));
    cache.setConfig(one_instance(automator_->baseUrl()));
    refreshAndWait(cache);

    automator_->setRoute(QLatin1String(kMacroListPath), 200, R"([{"id": "m2"}])");
    automator_->setRoute(QLatin1String(kButtonListPath), 500, "{}");
    const RefreshResult result = refreshAndWait(cache);
    QVERIFY(result.fetched);
    QCOMPARE(result.failedFetches, 1);
    QCOMPARE(ids(result.catalog.macros), QStringList{QStringLiteral("m2")});
    QCOMPARE(ids(result.catalog.buttons), QStringList{QStringLiteral("b1")});
}

void TestCatalogCache::totalFailureReturnsPreviousCatalog() {
    automator_->setRoute(QLatin1String(kMacroListPath), 200, R"([{"id": "m1"}])");
    automator_->setRoute(QLatin1String(kButtonListPath), 200, "[]");
    automator_->setRoute(QLatin1String(kShortcutListPath), 200, "[]");

    CatalogCache cache(*http_, dir_->filePath(QStringLiteral("cache.json")), events_.get());
    cache.setConfig(one_instance(automator_->baseUrl()));
    refreshAndWait(cache);

    automator_->stop();
    const RefreshResult result = refreshAndWait(cache);
    QVERIFY(!result.fetched);
    QCOMPARE(result.failedFetches, 3);
    QCOMPARE(ids(result.catalog.macros), QStringList{QStringLiteral("m1")});
    QCOMPARE(cache.catalog(QStringLiteral("a1")).size(), 1);
    QVERIFY(events_->recent(1).first().kind == common::EventKind::AutomatorError);
}

void TestCatalogCache::totalFailureWithoutFallbackReturnsEmpty() {
    automator_->setRoute(QLatin1String(kMacroListPath), 200, R"([{"id": "m1"}])");
    automator_->setRoute(QLatin1String(kButtonListPath), 200, "[]");
    automator_->setRoute(QLatin1String(kShortcutListPath), 200, "[]");

    CatalogCache cache(*http_, dir_->filePath(QStringLiteral("cache.json")));
    cache.setConfig(one_instance(automator_->baseUrl()));
    refreshAndWait(cache);

    automator_->stop();
    RefreshOptions options;
    options.useCacheOnFailure = false;
    const RefreshResult result = refreshAndWait(cache, options);
    QVERIFY(result.catalog.isEmpty());
    // The stored catalog is untouched either way.
    QCOMPARE(cache.catalog(QStringLiteral("a1")).size(), 1);
}

void TestCatalogCache::instanceWithoutUrlUsesCache() {
    CatalogCache cache(*http_, dir_->filePath(QStringLiteral("cache.json")));
    cache.setConfig(one_instance(QString()));
    const RefreshResult result = refreshAndWait(cache);
    QVERIFY(!result.fetched);
    QVERIFY(result.catalog.isEmpty());
    QVERIFY(automator_->requests().isEmpty());
}

void TestCatalogCache::unknownInstanceReportsError() {
    CatalogCache cache(*http_, dir_->filePath(QStringLiteral("cache.json")));
    cache.setConfig(one_instance(automator_->baseUrl()));
    std::optional<RefreshResult> result;
    cache.refresh(QStringLiteral("nope"), [&result](const RefreshResult &r) { result = r; });
    // Delivered from the event loop, not from inside refresh().
    QVERIFY(!result.has_value());
    QTRY_VERIFY(result.has_value());
    QCOMPARE(result->errors, QStringList{QStringLiteral("Automator nope not found")});
}

void TestCatalogCache::sameInstanceRefreshesAreSerialized() {
    automator_->setAcceptAll(true);
    automator_->setRoute(QLatin1String(kMacroListPath), 200, "[]");
    automator_->setRoute(QLatin1String(kButtonListPath), 200, "[]");
    automator_->setRoute(QLatin1String(kShortcutListPath), 200, "[]");

    CatalogCache cache(*http_, dir_->filePath(QStringLiteral("cache.json")));
    cache.setConfig(one_instance(automator_->baseUrl()));

    int finished = 0;
    cache.refresh(QStringLiteral("a1"), [&finished](const RefreshResult &) { ++finished; });
    QVERIFY(cache.isRefreshing(QStringLiteral("a1")));
    cache.refresh(QStringLiteral("a1"), [&finished](const RefreshResult &) { ++finished; });
    // The second refresh waits; only the first one's three fetches are out.
    QCOMPARE(http_->inFlight() + http_->queued(), 3);

    QTRY_COMPARE_WITH_TIMEOUT(finished, 2, 10000);
    QCOMPARE(automator_->requests().size(), 6);
    QVERIFY(!cache.isRefreshing(QStringLiteral("a1")));
}

void TestCatalogCache::slowListTimesOutAsPartialFailure() {
    automator_->setHang(QLatin1String(kMacroListPath));
    automator_->setRoute(QLatin1String(kButtonListPath), 200, R"([{"id": "b1"}])");
    automator_->setRoute(QLatin1String(kShortcutListPath), 200, "[]");

    CatalogCache cache(*http_, dir_->filePath(QStringLiteral("cache.json")));
    cache.setConfig(one_instance(automator_->baseUrl()));
    cache.setFetchTimeout(200);
    const RefreshResult result = refreshAndWait(cache);
    QVERIFY(result.fetched);
    QCOMPARE(result.failedFetches, 1);
    QCOMPARE(result.errors, QStringList{QStringLiteral("macros: request timed out")});
    QCOMPARE(ids(result.catalog.buttons), QStringList{QStringLiteral("b1")});
    QVERIFY(!cache.isRefreshing(QStringLiteral("a1")));
}

void TestCatalogCache::closingClientCompletesRefreshes() {
    automator_->setHang(QLatin1String(kMacroListPath));
    automator_->setHang(QLatin1String(kButtonListPath));
    automator_->setHang(QLatin1String(kShortcutListPath));

    CatalogCache cache(*http_, dir_->filePath(QStringLiteral("cache.json")));
    cache.setConfig(one_instance(automator_->baseUrl()));

    std::optional<RefreshResult> first;
    std::optional<RefreshResult> second;
    cache.refresh(QStringLiteral("a1"), [&first](const RefreshResult &r) { first = r; });
    cache.refresh(QStringLiteral("a1"), [&second](const RefreshResult &r) { second = r; });
    QTRY_COMPARE(automator_->requests().size(), 3);

    http_->close();
    QTRY_VERIFY(first.has_value());
    QTRY_VERIFY(second.has_value());
    QVERIFY(!first->fetched);
    QCOMPARE(first->failedFetches, 3);
    QVERIFY(!second->fetched);
    QCOMPARE(second->failedFetches, 3);
    QVERIFY(second->errors.contains(QStringLiteral("macros: HTTP client is closed")));
    QVERIFY(!cache.isRefreshing(QStringLiteral("a1")));

    // A refresh started after close fails the same way instead of hanging.
    const RefreshResult late = refreshAndWait(cache);
    QCOMPARE(late.failedFetches, 3);
    QVERIFY(!cache.isRefreshing(QStringLiteral("a1")));
}

void TestCatalogCache::storeIsPersistedAndReloaded() {
    automator_->setRoute(QLatin1String(kMacroListPath), 200, R"([{"id": "m1", "title": "Lights"}])");
    automator_->setRoute(QLatin1String(kButtonListPath), 200, "[]");
    automator_->setRoute(QLatin1String(kShortcutListPath), 200, R"([{"id": "s1", "shift": true, "key": "Z"}])");

    const QString path = dir_->filePath(QStringLiteral("cache.json"));
    {
        CatalogCache cache(*http_, path);
        cache.setConfig(one_instance(automator_->baseUrl()));
        refreshAndWait(cache);
    }

    CatalogCache reloaded(*http_, path);
    QVERIFY(reloaded.load());
    QVERIFY(reloaded.contains(QStringLiteral("a1")));
    QCOMPARE(reloaded.itemCount(QStringLiteral("a1")), 2);
    QCOMPARE(reloaded.catalog(QStringLiteral("a1")).shortcuts.first().title, QStringLiteral("Shift + Z"));
    QVERIFY(reloaded.catalog(QStringLiteral("a1")).lastUpdated.isValid());
}

void TestCatalogCache::corruptStoreIsIgnored() {
    const QString path = dir_->filePath(QStringLiteral("cache.json"));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ broken");
    file.close();

    CatalogCache cache(*http_, path);
    QString error;
    QVERIFY(!cache.load(&error));
    QVERIFY(!error.isEmpty());
    QVERIFY(!cache.contains(QStringLiteral("a1")));
    QVERIFY(cache.items(QStringLiteral("a1")).isEmpty());
}

QTEST_GUILESS_MAIN(TestCatalogCache)
#include "tst_catalog_cache.moc"
