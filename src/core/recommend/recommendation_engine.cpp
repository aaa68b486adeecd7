#include "core/recommend/recommendation_engine.h"
#include "core/query/query_terms.h"
#include "core/ranking/threshold_relaxer.h"
#include "core/shared/logging.h"
#include "core/vector/vector_math.h"

#include <QHash>
#include <QSet>

#include <algorithm>
#include <cmath>

namespace mc {

namespace {

constexpr int kMaxReasonTitles = 3;

bool isRecoverableSubStrategyError(ErrorCode code)
{
    return code == ErrorCode::NotFound || code == ErrorCode::MissingEmbedding;
}

} // namespace

RecommendationEngine::RecommendationEngine(RecordStore& records, EmbeddingGateway& gateway,
                                           const CandidateRetriever& retriever,
                                           const EngineConfig& config)
    : m_records(records)
    , m_gateway(gateway)
    , m_retriever(retriever)
    , m_config(config)
{
}

int RecommendationEngine::resolveLimit(int limit) const
{
    return mc::resolveLimit(m_config, limit, m_config.recommendations.defaultLimit);
}

double RecommendationEngine::resolveMinSimilarity(const std::optional<double>& minSimilarity) const
{
    return clampSimilarity(minSimilarity.value_or(m_config.recommendations.defaultMinSimilarity));
}

std::optional<RecommendationResponse> RecommendationEngine::recommend(
    RecommendationStrategy strategy, const RecommendationRequest& request,
    CatalogError* errorOut) const
{
    const int limit = resolveLimit(request.limit);
    const double minSimilarity = resolveMinSimilarity(request.minSimilarity);

    switch (strategy) {
    case RecommendationStrategy::ItemBased:
        if (request.itemIds.isEmpty()) {
            setError(errorOut, ErrorCode::InvalidInput,
                     QStringLiteral("An item id is required for item-based recommendations"));
            return std::nullopt;
        }
        if (request.itemIds.size() > 1) {
            setError(errorOut, ErrorCode::InvalidInput,
                     QStringLiteral("Item-based recommendations take exactly one item id; "
                                    "use multi-item for several"));
            return std::nullopt;
        }
        return itemBased(request.itemIds.first(), limit, minSimilarity, request.excludeIds,
                         errorOut);
    case RecommendationStrategy::MultiItem:
        return multiItem(request.itemIds, limit, minSimilarity, request.excludeIds, errorOut);
    case RecommendationStrategy::ContentBased:
        return contentBased(request.query, limit, minSimilarity, request.excludeIds, errorOut);
    case RecommendationStrategy::Hybrid:
        return hybrid(request, errorOut);
    }

    setError(errorOut, ErrorCode::InvalidInput, QStringLiteral("Unknown recommendation strategy"));
    return std::nullopt;
}

std::optional<RecommendationResponse> RecommendationEngine::rankFromVector(
    RecommendationStrategy strategy, const Embedding& vector, int limit, double minSimilarity,
    const QStringList& excludeIds, const QString& reason, CatalogError* errorOut) const
{
    const auto candidates = m_retriever.findSimilar(
        vector, limit * m_config.limits.candidateMultiplier, excludeIds,
        DistanceMetric::Cosine, errorOut);
    if (!candidates) {
        return std::nullopt;
    }

    ThresholdRelaxer::Outcome relaxed = ThresholdRelaxer::relax(
        *candidates, minSimilarity, m_config.recommendations.progressiveThresholds, limit,
        ThresholdRelaxer::Policy::UntilTargetCount);
    if (static_cast<int>(relaxed.results.size()) > limit) {
        relaxed.results.resize(static_cast<size_t>(limit));
    }

    RecommendationResponse response;
    response.strategy = strategy;
    for (const auto& candidate : relaxed.results) {
        RecommendationResult result;
        result.record = candidate.record;
        result.similarity = candidate.similarity;
        result.distance = candidate.distance;
        result.recommendationScore = candidate.similarity;
        result.reason = reason;
        response.recommendations.push_back(std::move(result));
    }
    response.metadata = summarize(response.recommendations,
                                  static_cast<int>(candidates->size()),
                                  relaxed.effectiveThreshold);

    LOG_DEBUG(mcRecommend, "%s: candidates=%d kept=%d threshold=%.2f",
              qUtf8Printable(recommendationStrategyToString(strategy)),
              response.metadata.totalCandidates, response.metadata.filteredResults,
              relaxed.effectiveThreshold);
    return response;
}

std::optional<RecommendationResponse> RecommendationEngine::itemBased(
    const QString& itemId, int limit, double minSimilarity, const QStringList& excludeIds,
    CatalogError* errorOut) const
{
    if (itemId.trimmed().isEmpty()) {
        setError(errorOut, ErrorCode::InvalidInput, QStringLiteral("Item id must not be empty"));
        return std::nullopt;
    }

    const auto source = m_records.getRecord(itemId, errorOut);
    if (!source) {
        return std::nullopt;
    }
    if (!source->hasEmbedding()) {
        setError(errorOut, ErrorCode::MissingEmbedding,
                 QStringLiteral("Source item %1 does not have an embedding").arg(itemId));
        return std::nullopt;
    }

    QStringList exclude = excludeIds;
    exclude.prepend(itemId);

    auto response = rankFromVector(RecommendationStrategy::ItemBased, source->embedding,
                                   limit, minSimilarity, exclude,
                                   QStringLiteral("Similar to \"%1\"").arg(source->title),
                                   errorOut);
    if (response) {
        response->sourceItems = QStringList{itemId};
    }
    return response;
}

std::optional<RecommendationResponse> RecommendationEngine::multiItem(
    const QStringList& itemIds, int limit, double minSimilarity, const QStringList& excludeIds,
    CatalogError* errorOut) const
{
    if (itemIds.isEmpty()) {
        setError(errorOut, ErrorCode::InvalidInput,
                 QStringLiteral("At least one source item id is required"));
        return std::nullopt;
    }

    const auto sources = m_records.getRecords(itemIds, errorOut);
    if (!sources) {
        return std::nullopt;
    }
    if (sources->empty()) {
        setError(errorOut, ErrorCode::NotFound, QStringLiteral("No source items found"));
        return std::nullopt;
    }

    std::vector<Embedding> embeddings;
    QStringList titles;
    for (const auto& source : *sources) {
        if (!source.hasEmbedding()) {
            LOG_DEBUG(mcRecommend, "multi-item: source %s has no embedding, skipped",
                      qUtf8Printable(source.id));
            continue;
        }
        embeddings.push_back(source.embedding);
        titles.append(source.title);
    }
    if (embeddings.empty()) {
        setError(errorOut, ErrorCode::MissingEmbedding,
                 QStringLiteral("None of the source items have embeddings"));
        return std::nullopt;
    }

    const auto centroid = VectorMath::centroid(embeddings, errorOut);
    if (!centroid) {
        return std::nullopt;
    }

    const QStringList reasonTitles = titles.mid(0, kMaxReasonTitles);
    const QString reason = reasonTitles.size() == 1
        ? QStringLiteral("Similar to \"%1\"").arg(reasonTitles.first())
        : QStringLiteral("Similar to your preferences (%1)")
              .arg(reasonTitles.join(QStringLiteral(", ")));

    QStringList exclude = itemIds;
    exclude.append(excludeIds);

    auto response = rankFromVector(RecommendationStrategy::MultiItem, *centroid, limit,
                                   minSimilarity, exclude, reason, errorOut);
    if (response) {
        response->sourceItems = itemIds;
    }
    return response;
}

std::optional<RecommendationResponse> RecommendationEngine::contentBased(
    const QString& query, int limit, double minSimilarity, const QStringList& excludeIds,
    CatalogError* errorOut) const
{
    const NormalizedQuery normalized = QueryTerms::normalize(query);
    if (normalized.normalized.isEmpty()) {
        setError(errorOut, ErrorCode::InvalidInput,
                 QStringLiteral("A query is required for content-based recommendations"));
        return std::nullopt;
    }

    const auto embedding = m_gateway.embed(normalized.normalized, errorOut);
    if (!embedding) {
        return std::nullopt;
    }

    auto response = rankFromVector(
        RecommendationStrategy::ContentBased, *embedding, limit, minSimilarity, excludeIds,
        QStringLiteral("Matches your interest: \"%1\"").arg(normalized.normalized), errorOut);
    if (response) {
        response->sourceQuery = normalized.normalized;
    }
    return response;
}

std::optional<RecommendationResponse> RecommendationEngine::hybrid(
    const RecommendationRequest& request, CatalogError* errorOut) const
{
    const bool wantItems = !request.itemIds.isEmpty();
    const bool wantContent = !request.query.trimmed().isEmpty();
    if (!wantItems && !wantContent) {
        setError(errorOut, ErrorCode::InvalidInput,
                 QStringLiteral("Either item ids or a query must be provided for hybrid "
                                "recommendations"));
        return std::nullopt;
    }

    const HybridWeights weights = request.weights.value_or(
        HybridWeights{m_config.recommendations.itemWeight, m_config.recommendations.contentWeight});
    if (!std::isfinite(weights.itemBased) || !std::isfinite(weights.contentBased)
        || weights.itemBased < 0.0 || weights.contentBased < 0.0) {
        setError(errorOut, ErrorCode::InvalidInput,
                 QStringLiteral("Hybrid weights must be non-negative numbers"));
        return std::nullopt;
    }

    const int limit = resolveLimit(request.limit);
    const double minSimilarity = resolveMinSimilarity(request.minSimilarity);
    const int subLimit = limit * 2;

    std::optional<RecommendationResponse> itemResponse;
    std::optional<RecommendationResponse> contentResponse;
    CatalogError itemError;
    CatalogError contentError;

    if (wantItems) {
        itemResponse = request.itemIds.size() == 1
            ? itemBased(request.itemIds.first(), subLimit, minSimilarity, request.excludeIds,
                        &itemError)
            : multiItem(request.itemIds, subLimit, minSimilarity, request.excludeIds,
                        &itemError);
        if (!itemResponse) {
            if (!isRecoverableSubStrategyError(itemError.code) || !wantContent) {
                setError(errorOut, itemError.code, itemError.message);
                return std::nullopt;
            }
            LOG_WARN(mcRecommend, "hybrid: item-based part failed [%s]: %s",
                     qUtf8Printable(errorCodeToString(itemError.code)),
                     qUtf8Printable(itemError.message));
        }
    }

    if (wantContent) {
        // Source items are never recommended back, whichever part finds them
        QStringList contentExclude = request.excludeIds;
        contentExclude.append(request.itemIds);
        contentResponse = contentBased(request.query, subLimit, minSimilarity, contentExclude,
                                       &contentError);
        if (!contentResponse) {
            if (!isRecoverableSubStrategyError(contentError.code) || !itemResponse) {
                setError(errorOut, contentError.code, contentError.message);
                return std::nullopt;
            }
            LOG_WARN(mcRecommend, "hybrid: content-based part failed [%s]: %s",
                     qUtf8Printable(errorCodeToString(contentError.code)),
                     qUtf8Printable(contentError.message));
        }
    }

    static const std::vector<RecommendationResult> kNone;
    const auto& itemResults = itemResponse ? itemResponse->recommendations : kNone;
    const auto& contentResults = contentResponse ? contentResponse->recommendations : kNone;

    RecommendationResponse response;
    response.strategy = RecommendationStrategy::Hybrid;
    response.sourceItems = request.itemIds;
    if (wantContent) {
        response.sourceQuery = QueryTerms::normalize(request.query).normalized;
    }

    // Every merged record before truncation
    const auto merged = mergeHybrid(itemResults, contentResults, weights, 0);
    response.recommendations = merged;
    if (static_cast<int>(response.recommendations.size()) > limit) {
        response.recommendations.resize(static_cast<size_t>(limit));
    }

    double effective = minSimilarity;
    if (itemResponse) {
        effective = std::min(effective, itemResponse->metadata.effectiveMinSimilarity);
    }
    if (contentResponse) {
        effective = std::min(effective, contentResponse->metadata.effectiveMinSimilarity);
    }
    response.metadata = summarize(response.recommendations, static_cast<int>(merged.size()),
                                  effective);

    LOG_DEBUG(mcRecommend, "hybrid: item=%d content=%d merged=%d returned=%d",
              static_cast<int>(itemResults.size()), static_cast<int>(contentResults.size()),
              static_cast<int>(merged.size()), response.metadata.filteredResults);
    return response;
}

std::vector<RecommendationResult> RecommendationEngine::mergeHybrid(
    const std::vector<RecommendationResult>& itemResults,
    const std::vector<RecommendationResult>& contentResults,
    const HybridWeights& weights, int limit)
{
    std::vector<RecommendationResult> merged;
    QHash<QString, size_t> indexById;

    for (const auto& rec : itemResults) {
        if (indexById.contains(rec.record.id)) {
            continue;
        }
        RecommendationResult entry = rec;
        entry.recommendationScore = rec.recommendationScore * weights.itemBased;
        indexById.insert(rec.record.id, merged.size());
        merged.push_back(std::move(entry));
    }

    QSet<QString> inContent;
    for (const auto& rec : contentResults) {
        if (inContent.contains(rec.record.id)) {
            continue;
        }
        inContent.insert(rec.record.id);

        auto it = indexById.constFind(rec.record.id);
        if (it != indexById.constEnd()) {
            RecommendationResult& existing = merged[it.value()];
            existing.recommendationScore += rec.recommendationScore * weights.contentBased;
            existing.reason = existing.reason + QStringLiteral("; ") + rec.reason;
            continue;
        }

        RecommendationResult entry = rec;
        entry.recommendationScore = rec.recommendationScore * weights.contentBased;
        indexById.insert(rec.record.id, merged.size());
        merged.push_back(std::move(entry));
    }

    std::stable_sort(merged.begin(), merged.end(),
                     [](const RecommendationResult& a, const RecommendationResult& b) {
                         return a.recommendationScore > b.recommendationScore;
                     });
    if (limit > 0 && static_cast<int>(merged.size()) > limit) {
        merged.resize(static_cast<size_t>(limit));
    }
    return merged;
}

RecommendationMetadata RecommendationEngine::summarize(
    const std::vector<RecommendationResult>& results, int totalCandidates,
    double effectiveMinSimilarity)
{
    RecommendationMetadata metadata;
    metadata.totalCandidates = totalCandidates;
    metadata.filteredResults = static_cast<int>(results.size());
    metadata.effectiveMinSimilarity = effectiveMinSimilarity;
    if (results.empty()) {
        return metadata;
    }

    double sum = 0.0;
    metadata.minSimilarity = results.front().similarity;
    metadata.maxSimilarity = results.front().similarity;
    for (const auto& result : results) {
        sum += result.similarity;
        metadata.minSimilarity = std::min(metadata.minSimilarity, result.similarity);
        metadata.maxSimilarity = std::max(metadata.maxSimilarity, result.similarity);
    }
    metadata.averageSimilarity = sum / static_cast<double>(results.size());
    return metadata;
}

} // namespace mc
