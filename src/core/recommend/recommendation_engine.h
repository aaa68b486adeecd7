#pragma once

#include "core/embedding/embedding_gateway.h"
#include "core/index/record_store.h"
#include "core/shared/engine_config.h"
#include "core/shared/search_result.h"
#include "core/vector/candidate_retriever.h"

#include <optional>
#include <vector>

namespace mc {

// Item-based, multi-item (centroid), content-based and hybrid
// recommendations over the shared candidate retrieval primitive.
// Every strategy relaxes its similarity bar until `limit` results survive.
class RecommendationEngine {
public:
    RecommendationEngine(RecordStore& records, EmbeddingGateway& gateway,
                         const CandidateRetriever& retriever, const EngineConfig& config = {});

    std::optional<RecommendationResponse> recommend(RecommendationStrategy strategy,
                                                    const RecommendationRequest& request,
                                                    CatalogError* errorOut = nullptr) const;

    std::optional<RecommendationResponse> itemBased(const QString& itemId, int limit,
                                                    double minSimilarity,
                                                    const QStringList& excludeIds,
                                                    CatalogError* errorOut = nullptr) const;

    std::optional<RecommendationResponse> multiItem(const QStringList& itemIds, int limit,
                                                    double minSimilarity,
                                                    const QStringList& excludeIds,
                                                    CatalogError* errorOut = nullptr) const;

    std::optional<RecommendationResponse> contentBased(const QString& query, int limit,
                                                       double minSimilarity,
                                                       const QStringList& excludeIds,
                                                       CatalogError* errorOut = nullptr) const;

    std::optional<RecommendationResponse> hybrid(const RecommendationRequest& request,
                                                 CatalogError* errorOut = nullptr) const;

    // Merges by record id. A record in both lists scores
    // item * weights.itemBased + content * weights.contentBased, a record
    // in one list scores its own score times that list's weight. Sorted by
    // score descending and truncated to limit.
    static std::vector<RecommendationResult> mergeHybrid(
        const std::vector<RecommendationResult>& itemResults,
        const std::vector<RecommendationResult>& contentResults,
        const HybridWeights& weights, int limit);

    static RecommendationMetadata summarize(const std::vector<RecommendationResult>& results,
                                            int totalCandidates, double effectiveMinSimilarity);

private:
    // Retrieval, relaxation and annotation shared by the single-source strategies.
    std::optional<RecommendationResponse> rankFromVector(RecommendationStrategy strategy,
                                                         const Embedding& vector, int limit,
                                                         double minSimilarity,
                                                         const QStringList& excludeIds,
                                                         const QString& reason,
                                                         CatalogError* errorOut) const;

    int resolveLimit(int limit) const;
    double resolveMinSimilarity(const std::optional<double>& minSimilarity) const;

    RecordStore& m_records;
    EmbeddingGateway& m_gateway;
    const CandidateRetriever& m_retriever;
    EngineConfig m_config;
};

} // namespace mc
