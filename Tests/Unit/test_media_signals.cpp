#include <QtTest/QtTest>
#include "core/query/intent_classifier.h"
#include "core/query/query_terms.h"
#include "core/ranking/media_signals.h"

using mc::MediaSignals;

class TestMediaSignals : public QObject {
    Q_OBJECT

private slots:
    void testMeaningfulWordsDropStopWords();
    void testNormalizeCollapsesWhitespace();
    void testTypeMatch();
    void testPlatformNeedsUrlAndQuery();
    void testPlatformAliasesMatchWholeTokens();
    void testFormatFromMimeOrExtension();
    void testKeywordStrengthScales();
    void testFieldTiers_data();
    void testFieldTiers();
    void testTranscriptUsesMarkerTail();
    void testIntentTableOrder();
};

void TestMediaSignals::testMeaningfulWordsDropStopWords()
{
    const QStringList words = mc::QueryTerms::meaningfulWords(
        QStringLiteral("What are the requirements for a valid contract"));
    QCOMPARE(words, QStringList({QStringLiteral("requirements"), QStringLiteral("valid"),
                                 QStringLiteral("contract")}));
    QVERIFY(mc::QueryTerms::isStopWord(QStringLiteral("The")));
}

void TestMediaSignals::testNormalizeCollapsesWhitespace()
{
    const mc::NormalizedQuery query = mc::QueryTerms::normalize(QStringLiteral("  Jazz \t Piano\n"));
    QCOMPARE(query.normalized, QStringLiteral("Jazz Piano"));
    QCOMPARE(query.lower, QStringLiteral("jazz piano"));
}

void TestMediaSignals::testTypeMatch()
{
    QCOMPARE(MediaSignals::typeMatch(mc::MediaType::Video, QStringLiteral("cooking video")),
             std::optional<QString>(QStringLiteral("exact")));
    QCOMPARE(MediaSignals::typeMatch(mc::MediaType::Video, QStringLiteral("short film")),
             std::optional<QString>(QStringLiteral("synonym")));
    QVERIFY(!MediaSignals::typeMatch(mc::MediaType::Audio, QStringLiteral("short film")));
    QVERIFY(!MediaSignals::typeMatch(mc::MediaType::Image, QStringLiteral("podcast")));
}

void TestMediaSignals::testPlatformNeedsUrlAndQuery()
{
    const QString url = QStringLiteral("https://youtu.be/xyz");
    QCOMPARE(MediaSignals::platformMatch(url, QStringLiteral("youtube talk")),
             std::optional<QString>(QStringLiteral("youtube")));
    QVERIFY(!MediaSignals::platformMatch(url, QStringLiteral("vimeo talk")));
    QVERIFY(!MediaSignals::platformMatch(QString(), QStringLiteral("youtube talk")));
}

void TestMediaSignals::testPlatformAliasesMatchWholeTokens()
{
    const QString instagram = QStringLiteral("https://www.instagram.com/p/abc");
    QVERIFY(!MediaSignals::platformMatch(instagram, QStringLiteral("big band recording")));
    QCOMPARE(MediaSignals::platformMatch(instagram, QStringLiteral("ig reel")),
             std::optional<QString>(QStringLiteral("instagram")));
    QCOMPARE(MediaSignals::platformMatch(instagram, QStringLiteral("cats (ig)")),
             std::optional<QString>(QStringLiteral("instagram")));

    const QString youtube = QStringLiteral("https://www.youtube.com/watch?v=1");
    QVERIFY(!MediaSignals::platformMatch(youtube, QStringLiteral("python bytes")));
    QCOMPARE(MediaSignals::platformMatch(youtube, QStringLiteral("yt lecture")),
             std::optional<QString>(QStringLiteral("youtube")));

    QCOMPARE(MediaSignals::platformMatch(QStringLiteral("https://www.tiktok.com/@a/video/1"),
                                         QStringLiteral("tik tok dance")),
             std::optional<QString>(QStringLiteral("tiktok")));
}

void TestMediaSignals::testFormatFromMimeOrExtension()
{
    QCOMPARE(MediaSignals::formatMatch(QStringLiteral("video/quicktime"), QString(),
                                       QStringLiteral("quicktime export")),
             std::optional<QString>(QStringLiteral("mov")));
    QCOMPARE(MediaSignals::formatMatch(QString(), QStringLiteral("https://cdn.example/a.flac"),
                                       QStringLiteral("flac rip")),
             std::optional<QString>(QStringLiteral("flac")));
    QVERIFY(!MediaSignals::formatMatch(QStringLiteral("audio/wav"), QString(),
                                       QStringLiteral("mp3 version")));
}

void TestMediaSignals::testKeywordStrengthScales()
{
    const auto one = MediaSignals::keywordMatch(mc::MediaType::Video, QStringLiteral("film"));
    QVERIFY(one.has_value());
    QVERIFY(qAbs(one->strength - 0.85) < 1e-9);

    // video, clip, video clip, mp4
    const auto many = MediaSignals::keywordMatch(mc::MediaType::Video,
                                                 QStringLiteral("video clip mp4"));
    QVERIFY(many.has_value());
    QCOMPARE(many->keywords.size(), 4);
    QCOMPARE(many->strength, 1.0);

    QVERIFY(!MediaSignals::keywordMatch(mc::MediaType::Text, QStringLiteral("video")));
}

void TestMediaSignals::testFieldTiers_data()
{
    QTest::addColumn<QString>("field");
    QTest::addColumn<QString>("query");
    QTest::addColumn<int>("tier");

    QTest::newRow("exact") << "Intro to Sourdough Baking" << "sourdough baking"
                           << static_cast<int>(MediaSignals::FieldTier::ExactPhrase);
    QTest::newRow("all") << "Baking bread with sourdough" << "sourdough baking"
                         << static_cast<int>(MediaSignals::FieldTier::AllWords);
    QTest::newRow("most") << "Sourdough starter and baking" << "sourdough baking tips"
                          << static_cast<int>(MediaSignals::FieldTier::MostWords);
    QTest::newRow("some") << "Sourdough starter" << "sourdough baking tips"
                          << static_cast<int>(MediaSignals::FieldTier::SomeWords);
    QTest::newRow("none") << "Knitting basics" << "sourdough baking"
                          << static_cast<int>(MediaSignals::FieldTier::None);
    QTest::newRow("empty") << "" << "sourdough"
                           << static_cast<int>(MediaSignals::FieldTier::None);
}

void TestMediaSignals::testFieldTiers()
{
    QFETCH(QString, field);
    QFETCH(QString, query);
    QFETCH(int, tier);

    const QString lower = query.toLower();
    const auto result = MediaSignals::fieldMatch(field, lower,
                                                 mc::QueryTerms::meaningfulWords(lower));
    QCOMPARE(static_cast<int>(result), tier);
}

void TestMediaSignals::testTranscriptUsesMarkerTail()
{
    const QString content = QStringLiteral("Episode notes about gardening.\n"
                                           "Transcription: welcome back to the kitchen");
    const QString query = QStringLiteral("gardening");
    const auto none = MediaSignals::transcriptMatch(content, query,
                                                    mc::QueryTerms::meaningfulWords(query));
    QCOMPARE(none.tier, MediaSignals::TranscriptTier::None);

    const QString phraseQuery = QStringLiteral("back kitchen welcome");
    const auto sub = MediaSignals::transcriptMatch(
        QStringLiteral("Transcription: welcome back to the kitchen, back kitchen tour"),
        phraseQuery, mc::QueryTerms::meaningfulWords(phraseQuery));
    QCOMPARE(sub.tier, MediaSignals::TranscriptTier::SubPhrase);
    QVERIFY(sub.phrase);
    QCOMPARE(sub.strength, 0.9);

    // Without a marker the whole content is the transcript
    const auto some = MediaSignals::transcriptMatch(QStringLiteral("kitchen sounds"),
                                                    QStringLiteral("kitchen garden"),
                                                    {QStringLiteral("kitchen"),
                                                     QStringLiteral("garden")});
    QCOMPARE(some.tier, MediaSignals::TranscriptTier::SomeWords);
    QVERIFY(!some.phrase);
    QCOMPARE(some.strength, 0.5);
}

void TestMediaSignals::testIntentTableOrder()
{
    QCOMPARE(mc::IntentClassifier::classify(QStringLiteral("guitar lesson review"),
                                            mc::MediaType::Video),
             std::optional<QString>(QStringLiteral("tutorial")));
    QCOMPARE(mc::IntentClassifier::classify(QStringLiteral("breaking news"),
                                            mc::MediaType::Audio),
             std::optional<QString>(QStringLiteral("news")));
    QVERIFY(!mc::IntentClassifier::classify(QStringLiteral("album"), mc::MediaType::Video));
    QVERIFY(!mc::IntentClassifier::classify(QString(), mc::MediaType::Audio));
}

QTEST_MAIN(TestMediaSignals)
#include "test_media_signals.moc"
