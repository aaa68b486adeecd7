#include <QtTest/QtTest>
#include "core/recommend/recommendation_engine.h"
#include "catalog_fixtures.h"
#include "fake_embedding_provider.h"

#include <limits>

namespace {

// Corpus order: Basics, Elements, Breach, Property
struct EngineHarness {
    explicit EngineHarness(const mc::EngineConfig& config = mc::test::testConfig())
        : store(mc::test::openMemoryStore())
        , gateway(provider, config.embedding)
        , retriever(store, store)
        , engine(store, gateway, retriever, config)
    {
        for (const auto& record : mc::test::legalCorpus()) {
            ids.append(mc::test::insertEmbedded(store, provider, record).id);
        }
    }

    mc::SQLiteStore store;
    mc::test::FakeEmbeddingProvider provider;
    mc::EmbeddingGateway gateway;
    mc::CandidateRetriever retriever;
    mc::RecommendationEngine engine;
    QStringList ids;
};

mc::RecommendationResult scored(const QString& id, double score, const QString& reason)
{
    mc::RecommendationResult result;
    result.record.id = id;
    result.record.title = id;
    result.similarity = score;
    result.recommendationScore = score;
    result.reason = reason;
    return result;
}

QStringList titlesOf(const mc::RecommendationResponse& response)
{
    QStringList titles;
    for (const auto& rec : response.recommendations) {
        titles.append(rec.record.title);
    }
    return titles;
}

} // namespace

class TestRecommendationEngine : public QObject {
    Q_OBJECT

private slots:
    // mergeHybrid
    void testMergeWeightsSharedRecord();
    void testMergeSingleSourceRecords();
    void testMergeTruncatesAfterSorting();

    // strategies
    void testItemBasedExcludesSource();
    void testItemBasedRelaxesUntilLimit();
    void testItemBasedErrors();
    void testMultiItemUsesCentroid();
    void testMultiItemSkipsUnembeddedSources();
    void testContentBasedReason();
    void testContentBasedRejectsEmptyQuery();
    void testHybridCombinesBothParts();
    void testHybridToleratesMissingSourceItem();
    void testHybridPropagatesProviderFailure();
    void testHybridRejectsInvalidInput();
    void testRecommendDispatchesAndAppliesDefaults();

    // summarize
    void testSummarize();
};

void TestRecommendationEngine::testMergeWeightsSharedRecord()
{
    const auto merged = mc::RecommendationEngine::mergeHybrid(
        {scored(QStringLiteral("x"), 0.85, QStringLiteral("Similar to \"A\""))},
        {scored(QStringLiteral("x"), 0.70, QStringLiteral("Matches your interest: \"b\""))},
        mc::HybridWeights{0.6, 0.4}, 10);

    QCOMPARE(static_cast<int>(merged.size()), 1);
    QVERIFY(qAbs(merged.front().recommendationScore - 0.79) < 1e-9);
    QCOMPARE(merged.front().reason,
             QStringLiteral("Similar to \"A\"; Matches your interest: \"b\""));
}

void TestRecommendationEngine::testMergeSingleSourceRecords()
{
    const auto merged = mc::RecommendationEngine::mergeHybrid(
        {scored(QStringLiteral("item-only"), 0.9, QString())},
        {scored(QStringLiteral("content-only"), 0.8, QString())},
        mc::HybridWeights{0.3, 0.7}, 10);

    QCOMPARE(static_cast<int>(merged.size()), 2);
    QCOMPARE(merged[0].record.id, QStringLiteral("content-only"));
    QVERIFY(qAbs(merged[0].recommendationScore - 0.56) < 1e-9);
    QCOMPARE(merged[1].record.id, QStringLiteral("item-only"));
    QVERIFY(qAbs(merged[1].recommendationScore - 0.27) < 1e-9);
    // Raw similarity is carried through unweighted
    QCOMPARE(merged[1].similarity, 0.9);
}

void TestRecommendationEngine::testMergeTruncatesAfterSorting()
{
    const auto merged = mc::RecommendationEngine::mergeHybrid(
        {scored(QStringLiteral("a"), 0.2, QString()), scored(QStringLiteral("b"), 0.4, QString())},
        {scored(QStringLiteral("c"), 0.9, QString())},
        mc::HybridWeights{1.0, 1.0}, 2);

    QCOMPARE(static_cast<int>(merged.size()), 2);
    QCOMPARE(merged[0].record.id, QStringLiteral("c"));
    QCOMPARE(merged[1].record.id, QStringLiteral("b"));
}

void TestRecommendationEngine::testItemBasedExcludesSource()
{
    EngineHarness h;
    const QString elements = h.ids.at(1);

    const auto response = h.engine.itemBased(elements, 6, 0.5, {});
    QVERIFY(response.has_value());
    QCOMPARE(response->strategy, mc::RecommendationStrategy::ItemBased);
    QCOMPARE(response->sourceItems, QStringList{elements});
    QCOMPARE(static_cast<int>(response->recommendations.size()), 3);
    for (const auto& rec : response->recommendations) {
        QVERIFY(rec.record.id != elements);
        QCOMPARE(rec.reason, QStringLiteral("Similar to \"Elements of a Valid Contract\""));
        QCOMPARE(rec.recommendationScore, rec.similarity);
    }

    const auto excluding = h.engine.itemBased(elements, 6, 0.5, {h.ids.at(3)});
    QVERIFY(excluding.has_value());
    QVERIFY(!titlesOf(*excluding).contains(QStringLiteral("Property Rights")));
}

void TestRecommendationEngine::testItemBasedRelaxesUntilLimit()
{
    EngineHarness h;

    // Nothing reaches 0.5; 0.4 already yields two
    const auto response = h.engine.itemBased(h.ids.at(1), 2, 0.5, {});
    QVERIFY(response.has_value());
    QCOMPARE(titlesOf(*response),
             (QStringList{QStringLiteral("Breach of Contract Remedies"),
                          QStringLiteral("Contract Law Basics")}));
    QCOMPARE(response->metadata.effectiveMinSimilarity, 0.4);
    QCOMPARE(response->metadata.filteredResults, 2);
    QCOMPARE(response->metadata.totalCandidates, 3);
}

void TestRecommendationEngine::testItemBasedErrors()
{
    EngineHarness h;

    mc::CatalogError error;
    QVERIFY(!h.engine.itemBased(QStringLiteral("missing"), 6, 0.5, {}, &error));
    QCOMPARE(error.code, mc::ErrorCode::NotFound);

    const auto bare = h.store.insertRecord(mc::test::makeRecord(QStringLiteral("Bare")));
    QVERIFY(bare.has_value());
    error = {};
    QVERIFY(!h.engine.itemBased(bare->id, 6, 0.5, {}, &error));
    QCOMPARE(error.code, mc::ErrorCode::MissingEmbedding);

    error = {};
    QVERIFY(!h.engine.itemBased(QStringLiteral(" "), 6, 0.5, {}, &error));
    QCOMPARE(error.code, mc::ErrorCode::InvalidInput);
}

void TestRecommendationEngine::testMultiItemUsesCentroid()
{
    EngineHarness h;
    const QStringList sources{h.ids.at(0), h.ids.at(1)};

    const auto response = h.engine.multiItem(sources, 6, 0.5, {});
    QVERIFY(response.has_value());
    QCOMPARE(response->strategy, mc::RecommendationStrategy::MultiItem);
    QCOMPARE(response->sourceItems, sources);
    QCOMPARE(titlesOf(*response),
             (QStringList{QStringLiteral("Breach of Contract Remedies"),
                          QStringLiteral("Property Rights")}));
    // Breach sits closer to the centroid than to either source alone
    QVERIFY(response->recommendations.front().similarity > 0.5);
    QCOMPARE(response->recommendations.front().reason,
             QStringLiteral("Similar to your preferences (Contract Law Basics, "
                            "Elements of a Valid Contract)"));
}

void TestRecommendationEngine::testMultiItemSkipsUnembeddedSources()
{
    EngineHarness h;
    const auto bare = h.store.insertRecord(mc::test::makeRecord(QStringLiteral("Bare")));
    QVERIFY(bare.has_value());

    const auto response = h.engine.multiItem({bare->id, h.ids.at(1)}, 6, 0.5, {});
    QVERIFY(response.has_value());
    QCOMPARE(response->recommendations.front().reason,
             QStringLiteral("Similar to \"Elements of a Valid Contract\""));
    QVERIFY(!titlesOf(*response).contains(QStringLiteral("Bare")));

    mc::CatalogError error;
    QVERIFY(!h.engine.multiItem({bare->id}, 6, 0.5, {}, &error));
    QCOMPARE(error.code, mc::ErrorCode::MissingEmbedding);

    error = {};
    QVERIFY(!h.engine.multiItem({QStringLiteral("nope")}, 6, 0.5, {}, &error));
    QCOMPARE(error.code, mc::ErrorCode::NotFound);

    error = {};
    QVERIFY(!h.engine.multiItem({}, 6, 0.5, {}, &error));
    QCOMPARE(error.code, mc::ErrorCode::InvalidInput);
}

void TestRecommendationEngine::testContentBasedReason()
{
    EngineHarness h;

    const auto response = h.engine.contentBased(QStringLiteral("  valid   contract "), 3, 0.5, {});
    QVERIFY(response.has_value());
    QCOMPARE(response->sourceQuery, QStringLiteral("valid contract"));
    QCOMPARE(titlesOf(*response),
             (QStringList{QStringLiteral("Contract Law Basics"),
                          QStringLiteral("Elements of a Valid Contract"),
                          QStringLiteral("Breach of Contract Remedies")}));
    QCOMPARE(response->metadata.effectiveMinSimilarity, 0.5);
    QCOMPARE(response->recommendations.front().reason,
             QStringLiteral("Matches your interest: \"valid contract\""));
}

void TestRecommendationEngine::testContentBasedRejectsEmptyQuery()
{
    EngineHarness h;
    mc::CatalogError error;
    QVERIFY(!h.engine.contentBased(QString(), 3, 0.5, {}, &error));
    QCOMPARE(error.code, mc::ErrorCode::InvalidInput);
}

void TestRecommendationEngine::testHybridCombinesBothParts()
{
    EngineHarness h;

    mc::RecommendationRequest request;
    request.itemIds = {h.ids.at(1)};
    request.query = QStringLiteral("valid contract");

    const auto response = h.engine.hybrid(request);
    QVERIFY(response.has_value());
    QCOMPARE(response->strategy, mc::RecommendationStrategy::Hybrid);
    QCOMPARE(response->sourceQuery, QStringLiteral("valid contract"));
    QCOMPARE(titlesOf(*response),
             (QStringList{QStringLiteral("Contract Law Basics"),
                          QStringLiteral("Breach of Contract Remedies"),
                          QStringLiteral("Property Rights")}));

    // Basics: 0.402 * 0.5 + 0.667 * 0.5
    const auto& top = response->recommendations.front();
    QVERIFY(qAbs(top.recommendationScore - 0.5345) < 0.001);
    QVERIFY(top.reason.contains(QStringLiteral("; ")));
    QCOMPARE(response->metadata.totalCandidates, 3);
}

void TestRecommendationEngine::testHybridToleratesMissingSourceItem()
{
    EngineHarness h;

    mc::RecommendationRequest request;
    request.itemIds = {QStringLiteral("deleted-item")};
    request.query = QStringLiteral("valid contract");
    request.limit = 3;

    const auto response = h.engine.hybrid(request);
    QVERIFY(response.has_value());
    QCOMPARE(static_cast<int>(response->recommendations.size()), 3);
    QCOMPARE(response->recommendations.front().record.title,
             QStringLiteral("Contract Law Basics"));
    QVERIFY(qAbs(response->recommendations.front().recommendationScore - 0.3333) < 0.001);

    // Without a query there is nothing left to fall back on
    request.query.clear();
    mc::CatalogError error;
    QVERIFY(!h.engine.hybrid(request, &error));
    QCOMPARE(error.code, mc::ErrorCode::NotFound);
}

void TestRecommendationEngine::testHybridPropagatesProviderFailure()
{
    EngineHarness h;
    h.provider.setFailing(true);

    mc::RecommendationRequest request;
    request.itemIds = {h.ids.at(1)};
    request.query = QStringLiteral("valid contract");

    mc::CatalogError error;
    QVERIFY(!h.engine.hybrid(request, &error));
    QCOMPARE(error.code, mc::ErrorCode::ProviderError);
}

void TestRecommendationEngine::testHybridRejectsInvalidInput()
{
    EngineHarness h;

    mc::CatalogError error;
    QVERIFY(!h.engine.hybrid(mc::RecommendationRequest{}, &error));
    QCOMPARE(error.code, mc::ErrorCode::InvalidInput);

    mc::RecommendationRequest request;
    request.query = QStringLiteral("valid contract");
    request.weights = mc::HybridWeights{-0.5, 1.0};
    error = {};
    QVERIFY(!h.engine.hybrid(request, &error));
    QCOMPARE(error.code, mc::ErrorCode::InvalidInput);

    request.weights = mc::HybridWeights{std::numeric_limits<double>::quiet_NaN(), 1.0};
    error = {};
    QVERIFY(!h.engine.hybrid(request, &error));
    QCOMPARE(error.code, mc::ErrorCode::InvalidInput);

    // Weights need not sum to one
    request.weights = mc::HybridWeights{2.0, 2.0};
    QVERIFY(h.engine.hybrid(request).has_value());
}

void TestRecommendationEngine::testRecommendDispatchesAndAppliesDefaults()
{
    EngineHarness h;

    mc::RecommendationRequest request;
    request.itemIds = {h.ids.at(1)};

    const auto response = h.engine.recommend(mc::RecommendationStrategy::ItemBased, request);
    QVERIFY(response.has_value());
    QCOMPARE(response->strategy, mc::RecommendationStrategy::ItemBased);
    // Default limit 6 cannot be met, so relaxation bottoms out
    QCOMPARE(static_cast<int>(response->recommendations.size()), 3);
    QCOMPARE(response->metadata.effectiveMinSimilarity, 0.0);

    mc::CatalogError error;
    QVERIFY(!h.engine.recommend(mc::RecommendationStrategy::ItemBased,
                                mc::RecommendationRequest{}, &error));
    QCOMPARE(error.code, mc::ErrorCode::InvalidInput);

    // Several ids belong to multi-item, not silently to the first one
    mc::RecommendationRequest several;
    several.itemIds = {h.ids.at(0), h.ids.at(1)};
    error = mc::CatalogError{};
    QVERIFY(!h.engine.recommend(mc::RecommendationStrategy::ItemBased, several, &error));
    QCOMPARE(error.code, mc::ErrorCode::InvalidInput);
    QVERIFY(error.message.contains(QStringLiteral("multi-item")));
    const auto multi = h.engine.recommend(mc::RecommendationStrategy::MultiItem, several);
    QVERIFY(multi.has_value());
    QCOMPARE(multi->strategy, mc::RecommendationStrategy::MultiItem);

    request.itemIds.clear();
    request.query = QStringLiteral("valid contract");
    const auto content = h.engine.recommend(mc::RecommendationStrategy::ContentBased, request);
    QVERIFY(content.has_value());
    QCOMPARE(content->strategy, mc::RecommendationStrategy::ContentBased);
}

void TestRecommendationEngine::testSummarize()
{
    const auto empty = mc::RecommendationEngine::summarize({}, 4, 0.2);
    QCOMPARE(empty.totalCandidates, 4);
    QCOMPARE(empty.filteredResults, 0);
    QCOMPARE(empty.averageSimilarity, 0.0);

    const auto metadata = mc::RecommendationEngine::summarize(
        {scored(QStringLiteral("a"), 0.8, QString()), scored(QStringLiteral("b"), 0.4, QString())},
        5, 0.3);
    QCOMPARE(metadata.filteredResults, 2);
    QVERIFY(qAbs(metadata.averageSimilarity - 0.6) < 1e-9);
    QCOMPARE(metadata.minSimilarity, 0.4);
    QCOMPARE(metadata.maxSimilarity, 0.8);
    QCOMPARE(metadata.effectiveMinSimilarity, 0.3);
}

QTEST_MAIN(TestRecommendationEngine)
#include "test_recommendation_engine.moc"
