#include <QtTest/QtTest>

#include "core/index/path_index.h"
#include "core/index/schema_store.h"
#include "core/index/shortcut_registry.h"
#include "core/query/windowed_result_cache.h"

#include <memory>
#include <utility>

namespace {

// In-memory source of the integers [0, size) that counts list() calls.
class CountingSource : public cdir::ListSource<int> {
public:
    explicit CountingSource(int size) : m_size(size) {}

    cdir::StoreResult<std::vector<int>> list(std::size_t offset, std::size_t limit,
                                             const QString& filter, bool fuzzy) override
    {
        ++calls;
        lastFilter = filter;
        lastFuzzy = fuzzy;
        if (failNext) {
            failNext = false;
            return cdir::StoreError{cdir::StoreErrorCode::StepFailed, 1, QStringLiteral("boom")};
        }

        std::vector<int> matching;
        for (int i = 0; i < m_size; ++i) {
            if (filter.isEmpty() || QString::number(i).contains(filter)) {
                matching.push_back(i);
            }
        }
        std::vector<int> page;
        for (std::size_t i = offset; i < matching.size() && page.size() < limit; ++i) {
            page.push_back(matching[i]);
        }
        return page;
    }

    void resize(int size) { m_size = size; }

    int calls = 0;
    QString lastFilter;
    bool lastFuzzy = false;
    bool failNext = false;

private:
    int m_size;
};

std::vector<int> window(int from, int to)
{
    std::vector<int> out;
    for (int i = from; i < to; ++i) {
        out.push_back(i);
    }
    return out;
}

} // namespace

class TestWindowedResultCache : public QObject {
    Q_OBJECT

private slots:
    void testStartsEmpty();
    void testSubsetServedWithoutSource();
    void testForceAlwaysFetches();
    void testScrollPastEndKeepsWindow();
    void testShortResultOutsideWindowReplacesIt();
    void testEmptyForcedResultClears();
    void testRelativeScrollClampsAtZero();
    void testFilterRefetchesFromTop();
    void testFuzzyBypassesSubsetReuse();
    void testSetFuzzyMatchRefetches();
    void testReloadAfterRemoval();
    void testSourceErrorKeepsWindow();
    void testDataStateSignal();
    void testScrollOverPathListing();
};

void TestWindowedResultCache::testStartsEmpty()
{
    CountingSource source(10);
    cdir::WindowedResultCache<int> cache(source, QStringLiteral("ints"));
    QVERIFY(!cache.entries().has_value());
    QVERIFY(!cache.isSubsetOf(0, 0));
    QCOMPARE(cache.first(), size_t(0));
    QCOMPARE(cache.length(), size_t(0));
    QCOMPARE(source.calls, 0);
}

void TestWindowedResultCache::testSubsetServedWithoutSource()
{
    CountingSource source(10);
    cdir::WindowedResultCache<int> cache(source, QStringLiteral("ints"));

    QVERIFY(cache.update(0, 4, false));
    QCOMPARE(source.calls, 1);
    QCOMPARE(*cache.entries(), window(0, 4));

    QVERIFY(!cache.update(1, 2, false));
    QCOMPARE(source.calls, 1);
    QCOMPARE(cache.first(), size_t(1));
    QCOMPARE(cache.length(), size_t(2));
    QCOMPARE(*cache.entries(), window(1, 3));

    // The window shrank, so [0, 4) is no longer cached
    QVERIFY(!cache.isSubsetOf(0, 4));
    QVERIFY(cache.update(0, 4, false));
    QCOMPARE(source.calls, 2);
}

void TestWindowedResultCache::testForceAlwaysFetches()
{
    CountingSource source(10);
    cdir::WindowedResultCache<int> cache(source, QStringLiteral("ints"));
    QVERIFY(cache.update(0, 4, false));
    QVERIFY(cache.update(1, 2, true));
    QCOMPARE(source.calls, 2);
    QCOMPARE(*cache.entries(), window(1, 3));
}

void TestWindowedResultCache::testScrollPastEndKeepsWindow()
{
    CountingSource source(5);
    cdir::WindowedResultCache<int> cache(source, QStringLiteral("ints"));

    QVERIFY(cache.update(3, 2, false));
    QCOMPARE(*cache.entries(), window(3, 5));

    // Source yields only [4], already visible
    QVERIFY(!cache.update(4, 2, false));
    QCOMPARE(source.calls, 2);
    QCOMPARE(cache.first(), size_t(3));
    QCOMPARE(*cache.entries(), window(3, 5));

    // Nothing at all past the end
    QVERIFY(!cache.update(5, 2, false));
    QCOMPARE(cache.first(), size_t(3));
    QCOMPARE(*cache.entries(), window(3, 5));
}

void TestWindowedResultCache::testShortResultOutsideWindowReplacesIt()
{
    CountingSource source(5);
    cdir::WindowedResultCache<int> cache(source, QStringLiteral("ints"));

    QVERIFY(cache.update(2, 2, false));
    QVERIFY(cache.update(4, 2, false));
    QCOMPARE(cache.first(), size_t(4));
    QCOMPARE(*cache.entries(), window(4, 5));

    QVERIFY(!cache.update(5, 2, false));
    QCOMPARE(cache.first(), size_t(4));
    QCOMPARE(*cache.entries(), window(4, 5));
}

void TestWindowedResultCache::testEmptyForcedResultClears()
{
    CountingSource source(3);
    cdir::WindowedResultCache<int> cache(source, QStringLiteral("ints"));
    QVERIFY(cache.update(0, 3, false));

    source.resize(0);
    QVERIFY(cache.update(0, 3, true));
    QVERIFY(!cache.entries().has_value());
    QCOMPARE(cache.length(), size_t(0));
}

void TestWindowedResultCache::testRelativeScrollClampsAtZero()
{
    CountingSource source(20);
    cdir::WindowedResultCache<int> cache(source, QStringLiteral("ints"));
    QVERIFY(cache.update(5, 3, false));

    QVERIFY(cache.updateToOffset(2, 3));
    QCOMPARE(cache.first(), size_t(7));

    QVERIFY(cache.updateToOffset(-100, 3));
    QCOMPARE(cache.first(), size_t(0));
    QCOMPARE(*cache.entries(), window(0, 3));
}

void TestWindowedResultCache::testFilterRefetchesFromTop()
{
    CountingSource source(30);
    cdir::WindowedResultCache<int> cache(source, QStringLiteral("ints"));
    QVERIFY(cache.update(10, 5, false));

    QVERIFY(cache.updateFilter(5, QStringLiteral("2"), false));
    QCOMPARE(cache.first(), size_t(0));
    QCOMPARE(cache.filter(), QStringLiteral("2"));
    QCOMPARE(source.lastFilter, QStringLiteral("2"));
    QCOMPARE(*cache.entries(), (std::vector<int>{2, 12, 20, 21, 22}));
}

void TestWindowedResultCache::testFuzzyBypassesSubsetReuse()
{
    CountingSource source(10);
    cdir::WindowedResultCache<int> cache(source, QStringLiteral("ints"), true);
    QVERIFY(cache.isFuzzyMatch());

    QVERIFY(cache.update(0, 4, false));
    QVERIFY(cache.update(1, 2, false));
    QCOMPARE(source.calls, 2);
    QVERIFY(source.lastFuzzy);
}

void TestWindowedResultCache::testSetFuzzyMatchRefetches()
{
    CountingSource source(10);
    cdir::WindowedResultCache<int> cache(source, QStringLiteral("ints"));
    QVERIFY(cache.update(2, 3, false));

    cache.setFuzzyMatch(false);
    QCOMPARE(source.calls, 1);

    cache.setFuzzyMatch(true);
    QCOMPARE(source.calls, 2);
    QVERIFY(source.lastFuzzy);
    QCOMPARE(cache.first(), size_t(2));
    QCOMPARE(*cache.entries(), window(2, 5));
}

void TestWindowedResultCache::testReloadAfterRemoval()
{
    CountingSource source(4);
    cdir::WindowedResultCache<int> cache(source, QStringLiteral("ints"));
    QVERIFY(cache.update(2, 2, false));

    source.resize(3);
    cache.reload();
    QCOMPARE(cache.first(), size_t(2));
    QCOMPARE(*cache.entries(), window(2, 3));

    source.resize(0);
    cache.reload();
    QVERIFY(!cache.entries().has_value());
}

void TestWindowedResultCache::testSourceErrorKeepsWindow()
{
    CountingSource source(10);
    cdir::WindowedResultCache<int> cache(source, QStringLiteral("ints"));
    QVERIFY(cache.update(0, 3, false));

    source.failNext = true;
    QVERIFY(!cache.update(5, 3, true));
    QCOMPARE(cache.first(), size_t(0));
    QCOMPARE(*cache.entries(), window(0, 3));
}

void TestWindowedResultCache::testDataStateSignal()
{
    CountingSource source(3);
    cdir::WindowedResultCache<int> cache(source, QStringLiteral("ints"));
    QSignalSpy spy(&cache.notifier(), &cdir::ResultCacheNotifier::dataStateChanged);

    QVERIFY(cache.update(0, 2, false));
    QCOMPARE(spy.count(), 1);
    auto payload = spy.takeFirst().at(0).value<cdir::DataStatePayload>();
    QCOMPARE(payload.objectsType, QStringLiteral("ints"));
    QVERIFY(!payload.isEmpty);

    // Served from cache, still announced
    QVERIFY(!cache.update(1, 1, false));
    QCOMPARE(spy.count(), 1);
    spy.clear();

    source.resize(0);
    QVERIFY(cache.updateFilter(2, QString(), false));
    QCOMPARE(spy.count(), 1);
    payload = spy.takeFirst().at(0).value<cdir::DataStatePayload>();
    QVERIFY(payload.isEmpty);
}

void TestWindowedResultCache::testScrollOverPathListing()
{
    auto opened = cdir::SchemaStore::openInMemory();
    QVERIFY(!opened.isError());
    cdir::SchemaStore store = std::move(opened.value());
    cdir::Settings settings;
    cdir::ShortcutRegistry shortcuts(store);
    cdir::PathIndex paths(store, shortcuts, settings);

    int64_t now = 100;
    for (const char* path : {"/5", "/4", "/3", "/2", "/1"}) {
        QVERIFY(!paths.addPath(QString::fromLatin1(path), ++now).isError());
    }

    cdir::WindowedResultCache<cdir::PathEntry> cache(paths, QStringLiteral("paths"));
    const auto shown = [&cache]() {
        QStringList out;
        for (const auto& entry : *cache.entries()) {
            out << entry.path;
        }
        return out;
    };

    cache.update(0, 2, false);
    QCOMPARE(cache.first(), size_t(0));
    QCOMPARE(shown(), (QStringList{QStringLiteral("/1"), QStringLiteral("/2")}));

    cache.update(1, 2, false);
    QCOMPARE(shown(), (QStringList{QStringLiteral("/2"), QStringLiteral("/3")}));

    cache.update(2, 2, false);
    QCOMPARE(shown(), (QStringList{QStringLiteral("/3"), QStringLiteral("/4")}));

    cache.update(3, 2, false);
    QCOMPARE(cache.first(), size_t(3));
    QCOMPARE(shown(), (QStringList{QStringLiteral("/4"), QStringLiteral("/5")}));

    // Only "/5" left, already on screen
    cache.update(4, 2, false);
    QCOMPARE(cache.first(), size_t(3));
    QCOMPARE(shown(), (QStringList{QStringLiteral("/4"), QStringLiteral("/5")}));

    cache.update(5, 2, false);
    QCOMPARE(cache.first(), size_t(3));
    QCOMPARE(shown(), (QStringList{QStringLiteral("/4"), QStringLiteral("/5")}));

    cache.update(2, 2, false);
    QCOMPARE(cache.first(), size_t(2));
    QCOMPARE(shown(), (QStringList{QStringLiteral("/3"), QStringLiteral("/4")}));

    // "/5" is not visible from [2, 4)
    cache.update(4, 2, false);
    QCOMPARE(cache.first(), size_t(4));
    QCOMPARE(shown(), QStringList{QStringLiteral("/5")});

    cache.update(5, 2, false);
    QCOMPARE(cache.first(), size_t(4));
    QCOMPARE(shown(), QStringList{QStringLiteral("/5")});
}

QTEST_MAIN(TestWindowedResultCache)
#include "test_windowed_result_cache.moc"
