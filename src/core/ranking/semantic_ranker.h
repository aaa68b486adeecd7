#pragma once

#include "core/embedding/embedding_gateway.h"
#include "core/ranking/context_booster.h"
#include "core/ranking/relevance_booster.h"
#include "core/shared/engine_config.h"
#include "core/shared/search_result.h"
#include "core/vector/candidate_retriever.h"

#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace mc {

// Embedding-based retrieval followed by threshold relaxation, relevance
// boosting and context boosting. One pass per request; provider and store
// failures abort the request.
class SemanticRanker {
public:
    SemanticRanker(EmbeddingGateway& gateway, const CandidateRetriever& retriever,
                   const EngineConfig& config = {}, BoostTraceSink traceSink = {});

    // Plain nearest-neighbour search under the given metric, no boosting.
    // maxDistance defaults to the metric's configured maximum.
    std::optional<std::vector<RankedResult>> search(const QString& query, int limit,
                                                    std::optional<double> maxDistance,
                                                    DistanceMetric metric,
                                                    CatalogError* errorOut = nullptr) const;

    std::optional<SemanticSearchResponse> semanticSearch(const QString& query, int limit,
                                                         const SemanticSearchOptions& options = {},
                                                         CatalogError* errorOut = nullptr) const;

    // Neighbours of an embedded record, excluding the record itself.
    std::optional<std::vector<RankedResult>> findSimilar(const MediaRecord& source, int limit,
                                                         std::optional<double> maxDistance,
                                                         DistanceMetric metric,
                                                         CatalogError* errorOut = nullptr) const;

    // Title words and the first three description words of the top five
    // results that are longer than three characters, not stop words and
    // unrelated to any query word. First-seen order, at most maxConcepts.
    static QStringList extractRelatedConcepts(const std::vector<RankedResult>& results,
                                              const QString& query, int maxConcepts = 5);

private:
    RankedResult toRankedResult(const ScoredCandidate& candidate) const;

    EmbeddingGateway& m_gateway;
    const CandidateRetriever& m_retriever;
    EngineConfig m_config;
    RelevanceBooster m_booster;
    ContextBooster m_contextBooster;
};

} // namespace mc
