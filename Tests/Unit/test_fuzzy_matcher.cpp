#include <QtTest/QtTest>

#include "core/ranking/fuzzy_matcher.h"

using cdir::FuzzyMatcher;

class TestFuzzyMatcher : public QObject {
    Q_OBJECT

private slots:
    void testEmptyPatternMatchesNothing();
    void testSubsequenceMatch();
    void testAllAtomsMustMatch();
    void testCaseInsensitive();
    void testUnicode();
    void testConsecutiveBeatsScattered();
    void testWordBoundaryBonus();
    void testGapPenaltyIsCapped();
    void testAtomLongerThanHaystack();
};

void TestFuzzyMatcher::testEmptyPatternMatchesNothing()
{
    FuzzyMatcher matcher(QStringLiteral("  \t "));
    QVERIFY(matcher.isEmpty());
    QVERIFY(!matcher.score(QStringLiteral("/anything")).has_value());
}

void TestFuzzyMatcher::testSubsequenceMatch()
{
    FuzzyMatcher matcher(QStringLiteral("hud"));
    QVERIFY(matcher.score(QStringLiteral("/home/user/documents")).has_value());
    QVERIFY(!matcher.score(QStringLiteral("/var/log")).has_value());
    // Order matters
    QVERIFY(!FuzzyMatcher(QStringLiteral("duh")).score(QStringLiteral("/home/user")).has_value());
}

void TestFuzzyMatcher::testAllAtomsMustMatch()
{
    FuzzyMatcher matcher(QStringLiteral("doc ment"));
    QVERIFY(matcher.score(QStringLiteral("/home/user/documents")).has_value());
    QVERIFY(!matcher.score(QStringLiteral("/home/user/docs")).has_value());

    // Atoms are matched independently of each other
    QVERIFY(FuzzyMatcher(QStringLiteral("ment doc")).score(QStringLiteral("/documents")).has_value());
}

void TestFuzzyMatcher::testCaseInsensitive()
{
    const auto lower = FuzzyMatcher(QStringLiteral("docs")).score(QStringLiteral("/home/DOCS"));
    const auto upper = FuzzyMatcher(QStringLiteral("DOCS")).score(QStringLiteral("/home/docs"));
    QVERIFY(lower.has_value());
    QVERIFY(upper.has_value());
    QCOMPARE(*lower, *upper);
}

void TestFuzzyMatcher::testUnicode()
{
    FuzzyMatcher matcher(QStringLiteral("ÉTÉ"));
    QVERIFY(matcher.score(QStringLiteral("/photos/été")).has_value());
    QVERIFY(FuzzyMatcher(QStringLiteral("😀")).score(QStringLiteral("/emoji/😀/x")).has_value());
    QVERIFY(!FuzzyMatcher(QStringLiteral("😀")).score(QStringLiteral("/emoji/x")).has_value());
}

void TestFuzzyMatcher::testConsecutiveBeatsScattered()
{
    FuzzyMatcher matcher(QStringLiteral("log"));
    const auto tight = matcher.score(QStringLiteral("/var/log"));
    const auto loose = matcher.score(QStringLiteral("/xlxxoxxg"));
    QVERIFY(tight && loose);
    QVERIFY(*tight > *loose);
}

void TestFuzzyMatcher::testWordBoundaryBonus()
{
    FuzzyMatcher matcher(QStringLiteral("b"));
    const auto boundary = matcher.score(QStringLiteral("a/b"));
    const auto inside = matcher.score(QStringLiteral("aab"));
    QCOMPARE(*boundary, FuzzyMatcher::kMatchScore + FuzzyMatcher::kBoundaryBonus);
    QCOMPARE(*inside, FuzzyMatcher::kMatchScore);
}

void TestFuzzyMatcher::testGapPenaltyIsCapped()
{
    FuzzyMatcher matcher(QStringLiteral("xy"));
    const auto near = matcher.score(QStringLiteral("qxaay"));
    const auto far = matcher.score(QStringLiteral("qxaaaaaaaaaaaay"));
    QCOMPARE(*near, 2 * FuzzyMatcher::kMatchScore - 2);
    QCOMPARE(*far, 2 * FuzzyMatcher::kMatchScore - FuzzyMatcher::kMaxGapPenalty);
}

void TestFuzzyMatcher::testAtomLongerThanHaystack()
{
    QVERIFY(!FuzzyMatcher(QStringLiteral("abcdef")).score(QStringLiteral("abc")).has_value());
    QVERIFY(!FuzzyMatcher(QStringLiteral("a")).score(QString()).has_value());
}

QTEST_MAIN(TestFuzzyMatcher)
#include "test_fuzzy_matcher.moc"
