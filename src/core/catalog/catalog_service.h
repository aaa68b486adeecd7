#pragma once

#include "core/embedding/backfill.h"
#include "core/embedding/embedding_gateway.h"
#include "core/embedding/embedding_provider.h"
#include "core/index/record_store.h"
#include "core/ranking/semantic_ranker.h"
#include "core/recommend/recommendation_engine.h"
#include "core/shared/engine_config.h"
#include "core/shared/search_result.h"
#include "core/vector/candidate_retriever.h"
#include "core/vector/candidate_store.h"

#include <optional>
#include <vector>

namespace mc {

struct EmbeddingStats {
    int totalItems = 0;
    int itemsWithEmbeddings = 0;
    int itemsWithoutEmbeddings = 0;
    double percentageWithEmbeddings = 0.0; // Rounded to 2 decimals
};

// Upward-facing entry point of the catalog. Owns the ranking components and
// borrows the stores and the embedding provider, which must outlive it.
class CatalogService {
public:
    CatalogService(RecordStore& records, VectorCandidateStore& candidates,
                   EmbeddingProvider& provider, const EngineConfig& config = {},
                   BoostTraceSink traceSink = {});

    CatalogService(const CatalogService&) = delete;
    CatalogService& operator=(const CatalogService&) = delete;

    // Stores the record, then embeds its prepared text. An embedding
    // failure leaves the record stored without a vector for a later backfill.
    std::optional<MediaRecord> createItem(const MediaRecord& draft,
                                          CatalogError* errorOut = nullptr);
    std::optional<std::vector<MediaRecord>> allItems(CatalogError* errorOut = nullptr);
    std::optional<MediaRecord> item(const QString& id, CatalogError* errorOut = nullptr);
    bool removeItem(const QString& id, CatalogError* errorOut = nullptr);

    std::optional<EmbeddingStats> embeddingStats(CatalogError* errorOut = nullptr);
    std::optional<BackfillReport> backfillEmbeddings(CatalogError* errorOut = nullptr);

    std::optional<std::vector<RankedResult>> search(const QString& query, int limit,
                                                    std::optional<double> maxDistance = std::nullopt,
                                                    DistanceMetric metric = DistanceMetric::Cosine,
                                                    CatalogError* errorOut = nullptr);

    std::optional<SemanticSearchResponse> semanticSearch(const QString& query, int limit,
                                                         const SemanticSearchOptions& options = {},
                                                         CatalogError* errorOut = nullptr);

    // limit, minScore and fields fall back to the configured defaults when
    // non-positive, unset or empty.
    std::optional<std::vector<FuzzyMatch>> fuzzySearch(const QString& query, int limit,
                                                       std::optional<double> minScore = std::nullopt,
                                                       const std::vector<FuzzyField>& fields = {},
                                                       CatalogError* errorOut = nullptr);

    std::optional<std::vector<RankedResult>> findSimilar(const QString& recordId, int limit,
                                                         std::optional<double> maxDistance = std::nullopt,
                                                         DistanceMetric metric = DistanceMetric::Cosine,
                                                         CatalogError* errorOut = nullptr);

    std::optional<RecommendationResponse> recommend(RecommendationStrategy strategy,
                                                    const RecommendationRequest& request,
                                                    CatalogError* errorOut = nullptr);

    const EngineConfig& config() const { return m_config; }

private:
    RecordStore& m_records;
    EngineConfig m_config;
    EmbeddingGateway m_gateway;
    CandidateRetriever m_retriever;
    SemanticRanker m_ranker;
    RecommendationEngine m_recommender;
    EmbeddingBackfill m_backfill;
};

} // namespace mc
