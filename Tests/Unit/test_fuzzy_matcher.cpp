#include <QtTest/QtTest>
#include "core/fuzzy/fuzzy_matcher.h"
#include "core/shared/engine_config.h"
#include "catalog_fixtures.h"

class TestFuzzyMatcher : public QObject {
    Q_OBJECT

private slots:
    void testExactContainmentScoresOne();
    void testPrefixMatchScoresPointNine();
    void testUnmatchedWordsArePenalized();
    void testEmptyQueryScoresZero();
    void testTypoBelowMinScoreIsRejected();
    void testTypoMatchesContractTitle();
    void testBestFieldWinsAndSortsDescending();
    void testRestrictedFields();
    void testContentSnippetIsTruncated();
    void testLimitTruncates();
    void testFindFuzzyMatchesPositions();
};

void TestFuzzyMatcher::testExactContainmentScoresOne()
{
    QCOMPARE(mc::FuzzyMatcher::fuzzyMatch(QStringLiteral("Intro to Contract Law"),
                                          QStringLiteral("contract law"), 0.3),
             1.0);
}

void TestFuzzyMatcher::testPrefixMatchScoresPointNine()
{
    // Both words are prefixes; their Levenshtein similarities stay below 0.6
    const double score = mc::FuzzyMatcher::fuzzyMatch(QStringLiteral("contracts explained"),
                                                      QStringLiteral("contr expl"), 0.3);
    QVERIFY(qAbs(score - 0.9) < 1e-9);
}

void TestFuzzyMatcher::testUnmatchedWordsArePenalized()
{
    // "databse" -> 0.875, "zzzzzz" finds nothing: (0.875 + 0) / 2
    const double score = mc::FuzzyMatcher::fuzzyMatch(QStringLiteral("database design"),
                                                      QStringLiteral("databse zzzzzz"), 0.5);
    QVERIFY(qAbs(score - 0.4375) < 1e-9);
}

void TestFuzzyMatcher::testEmptyQueryScoresZero()
{
    QCOMPARE(mc::FuzzyMatcher::fuzzyMatch(QStringLiteral("anything"), QStringLiteral("   "), 0.3),
             0.0);
}

void TestFuzzyMatcher::testTypoBelowMinScoreIsRejected()
{
    const std::vector<mc::MediaRecord> records = {
        mc::test::makeRecord(QStringLiteral("Property Rights")),
    };

    const auto matches = mc::FuzzyMatcher::fieldSearch(
        records, QStringLiteral("contarct"), 0.9,
        {mc::FuzzyField::Title, mc::FuzzyField::Description, mc::FuzzyField::Content}, 10);
    QVERIFY(matches.empty());
}

void TestFuzzyMatcher::testTypoMatchesContractTitle()
{
    const std::vector<mc::MediaRecord> records = mc::test::legalCorpus();

    const auto matches = mc::FuzzyMatcher::fieldSearch(
        records, QStringLiteral("contarct"), 0.7, {mc::FuzzyField::Title}, 10);
    QCOMPARE(static_cast<int>(matches.size()), 3);
    for (const auto& match : matches) {
        QVERIFY(match.record.title.contains(QStringLiteral("Contract")));
        QCOMPARE(match.matchedField, mc::FuzzyField::Title);
        QCOMPARE(match.matchedText, match.record.title);
        QVERIFY(qAbs(match.fuzzyScore - 0.75) < 1e-9);
    }
}

void TestFuzzyMatcher::testBestFieldWinsAndSortsDescending()
{
    const std::vector<mc::MediaRecord> records = {
        mc::test::makeRecord(QStringLiteral("Weekly roundup"), mc::MediaType::Audio,
                             QStringLiteral("A podcast about gardening")),
        mc::test::makeRecord(QStringLiteral("Podcast pilot"), mc::MediaType::Audio),
        mc::test::makeRecord(QStringLiteral("Unrelated"), mc::MediaType::Text,
                             QStringLiteral("Nothing to see")),
    };

    const auto matches = mc::FuzzyMatcher::fieldSearch(
        records, QStringLiteral("podcast gardening"), 0.3,
        {mc::FuzzyField::Title, mc::FuzzyField::Description, mc::FuzzyField::Content}, 10);

    QCOMPARE(static_cast<int>(matches.size()), 2);
    QCOMPARE(matches[0].record.title, QStringLiteral("Weekly roundup"));
    QCOMPARE(matches[0].matchedField, mc::FuzzyField::Description);
    QCOMPARE(matches[0].fuzzyScore, 1.0);
    QCOMPARE(matches[1].record.title, QStringLiteral("Podcast pilot"));
    QCOMPARE(matches[1].matchedField, mc::FuzzyField::Title);
    QVERIFY(matches[1].fuzzyScore < matches[0].fuzzyScore);
}

void TestFuzzyMatcher::testRestrictedFields()
{
    const std::vector<mc::MediaRecord> records = {
        mc::test::makeRecord(QStringLiteral("Weekly roundup"), mc::MediaType::Audio,
                             QStringLiteral("A podcast about gardening")),
    };

    const auto matches = mc::FuzzyMatcher::fieldSearch(
        records, QStringLiteral("gardening"), 0.5, {mc::FuzzyField::Title}, 10);
    QVERIFY(matches.empty());
}

void TestFuzzyMatcher::testContentSnippetIsTruncated()
{
    const QString content = QStringLiteral("transcript ") + QString(300, QLatin1Char('x'));
    const std::vector<mc::MediaRecord> records = {
        mc::test::makeRecord(QStringLiteral("Episode"), mc::MediaType::Audio, QString(), content),
    };

    const auto matches = mc::FuzzyMatcher::fieldSearch(
        records, QStringLiteral("transcript"), 0.5, {mc::FuzzyField::Content}, 10, 40);
    QCOMPARE(static_cast<int>(matches.size()), 1);
    QCOMPARE(matches[0].matchedField, mc::FuzzyField::Content);
    QCOMPARE(matches[0].matchedText.size(), 40);
    QVERIFY(matches[0].matchedText.startsWith(QStringLiteral("transcript")));
}

void TestFuzzyMatcher::testLimitTruncates()
{
    const auto matches = mc::FuzzyMatcher::fieldSearch(
        mc::test::legalCorpus(), QStringLiteral("contract"), 0.3,
        {mc::FuzzyField::Title, mc::FuzzyField::Description, mc::FuzzyField::Content}, 2);
    QCOMPARE(static_cast<int>(matches.size()), 2);
}

void TestFuzzyMatcher::testFindFuzzyMatchesPositions()
{
    const auto matches = mc::FuzzyMatcher::findFuzzyMatches(
        QStringLiteral("the quick brown fox"), QStringLiteral("brown"), 0.8);
    QVERIFY(!matches.empty());
    QCOMPARE(matches[0].score, 1.0);
    QVERIFY(matches[0].matchedText.contains(QStringLiteral("brown")));

    for (size_t i = 1; i < matches.size(); ++i) {
        QVERIFY(matches[i - 1].score >= matches[i].score);
    }
}

QTEST_MAIN(TestFuzzyMatcher)
#include "test_fuzzy_matcher.moc"
