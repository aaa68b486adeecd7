#include "core/catalog/catalog_service.h"
#include "core/embedding/text_preparer.h"
#include "core/fuzzy/fuzzy_matcher.h"
#include "core/shared/logging.h"

#include <cmath>

namespace mc {

CatalogService::CatalogService(RecordStore& records, VectorCandidateStore& candidates,
                               EmbeddingProvider& provider, const EngineConfig& config,
                               BoostTraceSink traceSink)
    : m_records(records)
    , m_config(config)
    , m_gateway(provider, config.embedding)
    , m_retriever(records, candidates)
    , m_ranker(m_gateway, m_retriever, config, std::move(traceSink))
    , m_recommender(records, m_gateway, m_retriever, config)
    , m_backfill(records, m_gateway, config.embedding)
{
}

std::optional<MediaRecord> CatalogService::createItem(const MediaRecord& draft,
                                                      CatalogError* errorOut)
{
    MediaRecord pending = draft;
    pending.embedding.clear();

    auto stored = m_records.insertRecord(pending, errorOut);
    if (!stored) {
        return std::nullopt;
    }

    const QString text = TextPreparer::prepare(*stored);
    if (text.trimmed().isEmpty()) {
        return stored;
    }

    CatalogError embedError;
    const auto embedding = m_gateway.embed(text, &embedError);
    if (!embedding) {
        LOG_WARN(mcCore, "createItem: %s stored without embedding [%s]: %s",
                 qUtf8Printable(stored->id), qUtf8Printable(errorCodeToString(embedError.code)),
                 qUtf8Printable(embedError.message));
        return stored;
    }
    if (!m_records.setEmbedding(stored->id, *embedding, &embedError)) {
        LOG_WARN(mcCore, "createItem: failed to save embedding for %s [%s]: %s",
                 qUtf8Printable(stored->id), qUtf8Printable(errorCodeToString(embedError.code)),
                 qUtf8Printable(embedError.message));
        return stored;
    }

    stored->embedding = *embedding;
    LOG_INFO(mcCore, "createItem: %s (%s) embedded with %d dimensions",
             qUtf8Printable(stored->title), qUtf8Printable(mediaTypeToString(stored->type)),
             static_cast<int>(embedding->size()));
    return stored;
}

std::optional<std::vector<MediaRecord>> CatalogService::allItems(CatalogError* errorOut)
{
    return m_records.allRecords(errorOut);
}

std::optional<MediaRecord> CatalogService::item(const QString& id, CatalogError* errorOut)
{
    return m_records.getRecord(id, errorOut);
}

bool CatalogService::removeItem(const QString& id, CatalogError* errorOut)
{
    return m_records.removeRecord(id, errorOut);
}

std::optional<EmbeddingStats> CatalogService::embeddingStats(CatalogError* errorOut)
{
    const auto total = m_records.countRecords(false, errorOut);
    if (!total) {
        return std::nullopt;
    }
    const auto embedded = m_records.countRecords(true, errorOut);
    if (!embedded) {
        return std::nullopt;
    }

    EmbeddingStats stats;
    stats.totalItems = *total;
    stats.itemsWithEmbeddings = *embedded;
    stats.itemsWithoutEmbeddings = *total - *embedded;
    if (*total > 0) {
        const double pct = 100.0 * static_cast<double>(*embedded) / static_cast<double>(*total);
        stats.percentageWithEmbeddings = std::round(pct * 100.0) / 100.0;
    }
    return stats;
}

std::optional<BackfillReport> CatalogService::backfillEmbeddings(CatalogError* errorOut)
{
    return m_backfill.run(errorOut);
}

std::optional<std::vector<RankedResult>> CatalogService::search(const QString& query, int limit,
                                                                std::optional<double> maxDistance,
                                                                DistanceMetric metric,
                                                                CatalogError* errorOut)
{
    return m_ranker.search(query, limit, maxDistance, metric, errorOut);
}

std::optional<SemanticSearchResponse> CatalogService::semanticSearch(
    const QString& query, int limit, const SemanticSearchOptions& options,
    CatalogError* errorOut)
{
    return m_ranker.semanticSearch(query, limit, options, errorOut);
}

std::optional<std::vector<FuzzyMatch>> CatalogService::fuzzySearch(
    const QString& query, int limit, std::optional<double> minScore,
    const std::vector<FuzzyField>& fields, CatalogError* errorOut)
{
    if (query.trimmed().isEmpty()) {
        return std::vector<FuzzyMatch>{};
    }

    const auto records = m_records.allRecords(errorOut);
    if (!records) {
        return std::nullopt;
    }

    return FuzzyMatcher::fieldSearch(*records, query,
                                     minScore.value_or(m_config.fuzzy.defaultMinScore),
                                     fields.empty() ? m_config.fuzzy.defaultFields : fields,
                                     resolveLimit(m_config, limit, m_config.fuzzy.defaultLimit),
                                     m_config.fuzzy.previewLength);
}

std::optional<std::vector<RankedResult>> CatalogService::findSimilar(
    const QString& recordId, int limit, std::optional<double> maxDistance,
    DistanceMetric metric, CatalogError* errorOut)
{
    const auto source = m_records.getRecord(recordId, errorOut);
    if (!source) {
        return std::nullopt;
    }
    return m_ranker.findSimilar(*source, limit, maxDistance, metric, errorOut);
}

std::optional<RecommendationResponse> CatalogService::recommend(
    RecommendationStrategy strategy, const RecommendationRequest& request,
    CatalogError* errorOut)
{
    return m_recommender.recommend(strategy, request, errorOut);
}

} // namespace mc
