#include <QtTest/QtTest>
#include <QElapsedTimer>
#include "core/embedding/backfill.h"
#include "catalog_fixtures.h"
#include "fake_embedding_provider.h"

class TestBackfill : public QObject {
    Q_OBJECT

private slots:
    void testEmbedsPendingRecords();
    void testAlreadyEmbeddedRecordsAreLeftAlone();
    void testFailuresAreCountedAndRunContinues();
    void testOpenCircuitFailsRemainingRecords();
    void testThrottlesBetweenCalls();
    void testOpenCircuitSkipsThrottle();
};

void TestBackfill::testEmbedsPendingRecords()
{
    mc::SQLiteStore store = mc::test::openMemoryStore();
    for (const auto& record : mc::test::legalCorpus()) {
        QVERIFY(store.insertRecord(record));
    }

    mc::test::FakeEmbeddingProvider provider;
    const mc::EngineConfig config = mc::test::testConfig();
    mc::EmbeddingGateway gateway(provider, config.embedding);
    mc::EmbeddingBackfill backfill(store, gateway, config.embedding);

    const auto report = backfill.run();
    QVERIFY(report.has_value());
    QCOMPARE(report->scanned, 4);
    QCOMPARE(report->embedded, 4);
    QCOMPARE(report->failed, 0);
    QCOMPARE(store.countRecords(true), std::optional<int>(4));

    // Prepared text, not just the title, is what gets embedded
    QVERIFY(provider.embeddedTexts().contains(
        QStringLiteral("Property Rights Ownership of land and real estate "
                       "Easements, deeds and title transfer govern real property.")));
}

void TestBackfill::testAlreadyEmbeddedRecordsAreLeftAlone()
{
    mc::SQLiteStore store = mc::test::openMemoryStore();
    mc::test::FakeEmbeddingProvider provider;
    mc::test::insertEmbedded(store, provider, mc::test::makeRecord(QStringLiteral("Done")));
    QVERIFY(store.insertRecord(mc::test::makeRecord(QStringLiteral("Pending"))));

    const int callsBefore = provider.callCount();
    const mc::EngineConfig config = mc::test::testConfig();
    mc::EmbeddingGateway gateway(provider, config.embedding);
    const auto report = mc::EmbeddingBackfill(store, gateway, config.embedding).run();
    QVERIFY(report.has_value());
    QCOMPARE(report->scanned, 1);
    QCOMPARE(report->embedded, 1);
    QCOMPARE(provider.callCount(), callsBefore + 1);
}

void TestBackfill::testFailuresAreCountedAndRunContinues()
{
    mc::SQLiteStore store = mc::test::openMemoryStore();
    const auto first = store.insertRecord(mc::test::makeRecord(QStringLiteral("First")));
    QVERIFY(first.has_value());

    mc::test::FakeEmbeddingProvider provider;
    provider.setOutputDimensions(16);
    const mc::EngineConfig config = mc::test::testConfig();
    mc::EmbeddingGateway gateway(provider, config.embedding);
    mc::EmbeddingBackfill backfill(store, gateway, config.embedding);

    mc::CatalogError error;
    QTest::ignoreMessage(QtWarningMsg,
                         QRegularExpression(QStringLiteral("First failed \\[PROVIDER_ERROR\\]")));
    const auto report = backfill.run(&error);
    QVERIFY(report.has_value());
    QCOMPARE(report->failed, 1);
    QCOMPARE(report->failedIds, QStringList{first->id});
    QCOMPARE(store.countRecords(true), std::optional<int>(0));

    // A later run picks the record up again
    provider.setOutputDimensions(mc::test::FakeEmbeddingProvider::kDefaultDimensions);
    const auto retry = backfill.run();
    QVERIFY(retry.has_value());
    QCOMPARE(retry->embedded, 1);
}

void TestBackfill::testOpenCircuitFailsRemainingRecords()
{
    mc::SQLiteStore store = mc::test::openMemoryStore();
    for (int i = 0; i < 7; ++i) {
        QVERIFY(store.insertRecord(mc::test::makeRecord(QStringLiteral("Item %1").arg(i))));
    }

    mc::test::FakeEmbeddingProvider provider;
    provider.setFailing(true);
    const mc::EngineConfig config = mc::test::testConfig();
    mc::EmbeddingGateway gateway(provider, config.embedding);

    const auto report = mc::EmbeddingBackfill(store, gateway, config.embedding).run();
    QVERIFY(report.has_value());
    QCOMPARE(report->failed, 7);
    QCOMPARE(provider.callCount(), config.embedding.circuitOpenThreshold);
}

void TestBackfill::testThrottlesBetweenCalls()
{
    mc::SQLiteStore store = mc::test::openMemoryStore();
    for (int i = 0; i < 3; ++i) {
        QVERIFY(store.insertRecord(mc::test::makeRecord(QStringLiteral("Clip %1").arg(i))));
    }

    mc::test::FakeEmbeddingProvider provider;
    mc::EngineConfig config = mc::test::testConfig();
    config.embedding.backfillDelayMs = 25;
    mc::EmbeddingGateway gateway(provider, config.embedding);

    QElapsedTimer timer;
    timer.start();
    const auto report = mc::EmbeddingBackfill(store, gateway, config.embedding).run();
    QVERIFY(report.has_value());
    QCOMPARE(report->embedded, 3);
    QVERIFY(timer.elapsed() >= 45);
}

void TestBackfill::testOpenCircuitSkipsThrottle()
{
    mc::SQLiteStore store = mc::test::openMemoryStore();
    for (int i = 0; i < 7; ++i) {
        QVERIFY(store.insertRecord(mc::test::makeRecord(QStringLiteral("Reel %1").arg(i))));
    }

    mc::test::FakeEmbeddingProvider provider;
    provider.setFailing(true);
    mc::EngineConfig config = mc::test::testConfig();
    config.embedding.circuitOpenThreshold = 5;
    config.embedding.backfillDelayMs = 200;
    mc::EmbeddingGateway gateway(provider, config.embedding);

    QElapsedTimer timer;
    timer.start();
    const auto report = mc::EmbeddingBackfill(store, gateway, config.embedding).run();
    const qint64 elapsed = timer.elapsed();

    QVERIFY(report.has_value());
    QCOMPARE(report->failed, 7);
    QCOMPARE(provider.callCount(), 5);
    // Four delays before the breaker opens, none for the two records after it
    QVERIFY(elapsed >= 750);
    QVERIFY2(elapsed < 1100, qPrintable(QStringLiteral("elapsed %1 ms").arg(elapsed)));
}

QTEST_MAIN(TestBackfill)
#include "test_backfill.moc"
