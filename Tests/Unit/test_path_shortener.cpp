#include <QtTest/QtTest>

#include "core/format/path_shortener.h"

namespace {

std::vector<cdir::ShortcutEntry> docsShortcut()
{
    cdir::ShortcutEntry docs;
    docs.id = 1;
    docs.name = QStringLiteral("docs");
    docs.path = QStringLiteral("/home/user/docs");
    return {docs};
}

} // namespace

class TestPathShortener : public QObject {
    Q_OBJECT

private slots:
    void testShortcutRendering_data();
    void testShortcutRendering();
    void testShortcutExactMatch();
    void testNoCoveringShortcut();
    void testReduceHome_data();
    void testReduceHome();
    void testReduceOutsideHome();
    void testPrettyPrintFallsBackToHome();
};

void TestPathShortener::testShortcutRendering_data()
{
    QTest::addColumn<int>("width");
    QTest::addColumn<QString>("expected");

    QTest::newRow("fits") << 14 << QString("[docs]/project");
    QTest::newRow("roomy") << 80 << QString("[docs]/project");
    QTest::newRow("cut 13") << 13 << QString("[docs]/*oject");
    QTest::newRow("cut 9") << 9 << QString("[docs]/*t");
    QTest::newRow("cut 8") << 8 << QString("[docs]/*");
    QTest::newRow("label only") << 7 << QString("[docs]*");
    QTest::newRow("too narrow") << 6 << QString("*");
}

void TestPathShortener::testShortcutRendering()
{
    QFETCH(int, width);
    QFETCH(QString, expected);

    const cdir::PathShortener shortener(QStringLiteral("/home/user"));
    const auto shortened = shortener.shortenWithShortcut(QStringLiteral("/home/user/docs/project"),
                                                         docsShortcut(), width);
    QVERIFY(shortened.has_value());
    QCOMPARE(*shortened, expected);
}

void TestPathShortener::testShortcutExactMatch()
{
    const cdir::PathShortener shortener(QString());
    auto shortened = shortener.shortenWithShortcut(QStringLiteral("/home/user/docs"),
                                                   docsShortcut(), 40);
    QCOMPARE(shortened.value_or(QString()), QStringLiteral("[docs]"));

    shortened = shortener.shortenWithShortcut(QStringLiteral("/home/user/docs"),
                                              docsShortcut(), 40, false);
    QVERIFY(!shortened.has_value());
}

void TestPathShortener::testNoCoveringShortcut()
{
    const cdir::PathShortener shortener(QString());
    QVERIFY(!shortener.shortenWithShortcut(QStringLiteral("/home/user/docsx"),
                                           docsShortcut(), 40).has_value());
    QVERIFY(!shortener.shortenWithShortcut(QStringLiteral("/srv"), {}, 40).has_value());
}

void TestPathShortener::testReduceHome_data()
{
    QTest::addColumn<int>("width");
    QTest::addColumn<QString>("expected");

    QTest::newRow("fits") << 9 << QString("~/project");
    QTest::newRow("cut 8") << 8 << QString("~/*oject");
    QTest::newRow("cut 4") << 4 << QString("~/*t");
    QTest::newRow("three") << 3 << QString("~/*");
    QTest::newRow("two") << 2 << QString("~*");
    QTest::newRow("one") << 1 << QString("*");
}

void TestPathShortener::testReduceHome()
{
    QFETCH(int, width);
    QFETCH(QString, expected);

    const cdir::PathShortener shortener(QStringLiteral("/home/testuser"));
    QCOMPARE(shortener.reducePath(QStringLiteral("/home/testuser/project"), width), expected);
}

void TestPathShortener::testReduceOutsideHome()
{
    const cdir::PathShortener shortener(QStringLiteral("/home/testuser"));
    QCOMPARE(shortener.reducePath(QStringLiteral("/home/testuser"), 10), QStringLiteral("~"));
    QCOMPARE(shortener.reducePath(QStringLiteral("/var/log"), 20), QStringLiteral("/var/log"));
    QCOMPARE(shortener.reducePath(QStringLiteral("/var/log/nginx"), 6), QStringLiteral("*nginx"));
    // Sibling of home is not abbreviated
    QCOMPARE(shortener.reducePath(QStringLiteral("/home/testuser2"), 40),
             QStringLiteral("/home/testuser2"));
}

void TestPathShortener::testPrettyPrintFallsBackToHome()
{
    const cdir::PathShortener shortener(QStringLiteral("/home/user"));
    QCOMPARE(shortener.prettyPrint(QStringLiteral("/home/user/docs/a"), docsShortcut(), 40),
             QStringLiteral("[docs]/a"));
    QCOMPARE(shortener.prettyPrint(QStringLiteral("/home/user/music"), docsShortcut(), 40),
             QStringLiteral("~/music"));
}

QTEST_MAIN(TestPathShortener)
#include "test_path_shortener.moc"
