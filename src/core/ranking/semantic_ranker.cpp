#include "core/ranking/semantic_ranker.h"
#include "core/query/query_terms.h"
#include "core/ranking/threshold_relaxer.h"
#include "core/shared/logging.h"

#include <QRegularExpression>
#include <QSet>

#include <algorithm>
#include <cmath>

namespace mc {

namespace {

constexpr int kRelatedSourceResults = 5;
constexpr int kRelatedDescriptionWords = 3;
constexpr int kRelatedMinWordLength = 4;

double roundTo(double value, int decimals)
{
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

QStringList whitespaceWords(const QString& text)
{
    static const QRegularExpression kWhitespace(QStringLiteral("\\s+"));
    return text.toLower().split(kWhitespace, Qt::SkipEmptyParts);
}

void sortByRelevance(std::vector<RankedResult>& results)
{
    std::stable_sort(results.begin(), results.end(),
                     [](const RankedResult& a, const RankedResult& b) {
                         return a.relevanceScore > b.relevanceScore;
                     });
}

} // namespace

SemanticRanker::SemanticRanker(EmbeddingGateway& gateway, const CandidateRetriever& retriever,
                               const EngineConfig& config, BoostTraceSink traceSink)
    : m_gateway(gateway)
    , m_retriever(retriever)
    , m_config(config)
    , m_booster(config.boost, std::move(traceSink))
    , m_contextBooster(config.semantic)
{
}

RankedResult SemanticRanker::toRankedResult(const ScoredCandidate& candidate) const
{
    RankedResult result;
    result.record = candidate.record;
    result.similarity = candidate.similarity;
    result.distance = candidate.distance;
    result.relevanceScore = candidate.similarity;
    result.semanticMatch = candidate.similarity >= m_config.similarity.strongMatchThreshold;
    return result;
}

std::optional<std::vector<RankedResult>> SemanticRanker::search(const QString& query, int limit,
                                                                std::optional<double> maxDistance,
                                                                DistanceMetric metric,
                                                                CatalogError* errorOut) const
{
    const NormalizedQuery normalized = QueryTerms::normalize(query);
    if (normalized.normalized.isEmpty()) {
        setError(errorOut, ErrorCode::InvalidInput, QStringLiteral("Query must not be empty"));
        return std::nullopt;
    }

    const int validatedLimit = resolveLimit(m_config, limit, m_config.limits.defaultSearchLimit);
    const double threshold = maxDistance.value_or(maxDistanceForMetric(m_config, metric));

    const auto embedding = m_gateway.embed(normalized.normalized, errorOut);
    if (!embedding) {
        return std::nullopt;
    }

    const auto candidates = m_retriever.findSimilar(
        *embedding, validatedLimit * m_config.limits.candidateMultiplier, {}, metric, errorOut);
    if (!candidates) {
        return std::nullopt;
    }

    std::vector<RankedResult> results;
    for (const auto& candidate : *candidates) {
        if (candidate.distance > threshold) {
            continue;
        }
        results.push_back(toRankedResult(candidate));
        if (static_cast<int>(results.size()) >= validatedLimit) {
            break;
        }
    }

    LOG_DEBUG(mcRanking, "search: metric=%s maxDistance=%.3f candidates=%d returned=%d",
              qUtf8Printable(distanceMetricToString(metric)), threshold,
              static_cast<int>(candidates->size()), static_cast<int>(results.size()));
    return results;
}

std::optional<SemanticSearchResponse> SemanticRanker::semanticSearch(
    const QString& query, int limit, const SemanticSearchOptions& options,
    CatalogError* errorOut) const
{
    const NormalizedQuery normalized = QueryTerms::normalize(query);
    if (normalized.normalized.isEmpty()) {
        setError(errorOut, ErrorCode::InvalidInput, QStringLiteral("Query must not be empty"));
        return std::nullopt;
    }

    const int validatedLimit = resolveLimit(m_config, limit, m_config.limits.defaultSearchLimit);
    const double minSimilarity =
        options.minSimilarity.value_or(m_config.semantic.defaultMinSimilarity);
    const bool includeRelated = options.includeRelated.value_or(m_config.semantic.includeRelated);
    const bool contextBoost = options.contextBoost.value_or(m_config.semantic.contextBoost);

    SemanticSearchResponse response;
    response.query = query;
    response.metadata.effectiveMinSimilarity = minSimilarity;

    const auto embedding = m_gateway.embed(normalized.normalized, errorOut);
    if (!embedding) {
        return std::nullopt;
    }

    const auto pool = m_retriever.findSimilar(
        *embedding, validatedLimit * m_config.limits.semanticCandidateMultiplier, {},
        DistanceMetric::Cosine, errorOut);
    if (!pool) {
        return std::nullopt;
    }

    response.metadata.totalCandidates = static_cast<int>(pool->size());
    if (pool->empty()) {
        response.diagnosticMessage = QStringLiteral(
            "No items have embeddings. Create items or run the embedding backfill "
            "to generate them.");
        LOG_INFO(mcRanking, "semanticSearch: empty candidate pool for '%s'",
                 qUtf8Printable(normalized.normalized));
        return response;
    }

    LOG_DEBUG(mcRanking, "semanticSearch: %d candidates, closest distance=%.3f similarity=%.3f",
              static_cast<int>(pool->size()), pool->front().distance, pool->front().similarity);

    std::vector<ScoredCandidate> inRange;
    for (const auto& candidate : *pool) {
        if (candidate.distance <= m_config.distance.semanticAdaptiveMaxDistance) {
            inRange.push_back(candidate);
        }
    }

    const ThresholdRelaxer::Outcome relaxed = ThresholdRelaxer::relax(
        inRange, minSimilarity, m_config.similarity.progressiveThresholds, validatedLimit,
        ThresholdRelaxer::Policy::UntilNonEmpty);
    response.metadata.effectiveMinSimilarity = relaxed.effectiveThreshold;

    std::vector<RankedResult> results;
    results.reserve(relaxed.results.size());
    for (const auto& candidate : relaxed.results) {
        RankedResult result = toRankedResult(candidate);
        BoostOutcome boosted = m_booster.boost(candidate.record, normalized.normalized,
                                               candidate.similarity);
        result.similarity = boosted.finalSimilarity;
        result.boostTrace = std::move(boosted.trace);
        result.relevanceScore = contextBoost
            ? m_contextBooster.apply(candidate.record, normalized.normalized, result.similarity)
            : result.similarity;
        result.semanticMatch = result.similarity >= m_config.similarity.strongMatchThreshold;
        results.push_back(std::move(result));
    }

    sortByRelevance(results);
    if (static_cast<int>(results.size()) > validatedLimit) {
        results.resize(static_cast<size_t>(validatedLimit));
    }

    double averageSimilarity = 0.0;
    if (!results.empty()) {
        for (const auto& result : results) {
            averageSimilarity += result.similarity;
        }
        averageSimilarity /= static_cast<double>(results.size());
    }

    response.metadata.filteredResults = static_cast<int>(results.size());
    response.metadata.averageSimilarity = roundTo(averageSimilarity, 3);

    if (includeRelated && !results.empty()) {
        response.relatedConcepts = extractRelatedConcepts(results, normalized.normalized,
                                                          m_config.semantic.maxRelatedConcepts);
    }

    if (results.empty()) {
        const ScoredCandidate& closest = pool->front();
        response.diagnosticMessage = QStringLiteral(
            "No results found. Closest match has %1% similarity (distance: %2). "
            "The catalog may not contain content related to \"%3\". Try adding items "
            "about this topic, using fuzzy search, or broader search terms.")
            .arg(closest.similarity * 100.0, 0, 'f', 1)
            .arg(closest.distance, 0, 'f', 3)
            .arg(normalized.normalized);
    } else if (relaxed.effectiveThreshold <= 0.0
               && averageSimilarity < m_config.similarity.lowConfidenceAverage) {
        response.metadata.lowConfidence = true;
        response.diagnosticMessage = QStringLiteral(
            "Found %1 results, but they have low similarity (avg: %2%). These may not be "
            "very relevant to your query. Consider adding more related content.")
            .arg(static_cast<int>(results.size()))
            .arg(averageSimilarity * 100.0, 0, 'f', 1);
    }

    response.results = std::move(results);
    LOG_INFO(mcRanking, "semanticSearch: query='%s' candidates=%d results=%d threshold=%.2f",
             qUtf8Printable(normalized.normalized), response.metadata.totalCandidates,
             response.metadata.filteredResults, response.metadata.effectiveMinSimilarity);
    return response;
}

std::optional<std::vector<RankedResult>> SemanticRanker::findSimilar(
    const MediaRecord& source, int limit, std::optional<double> maxDistance,
    DistanceMetric metric, CatalogError* errorOut) const
{
    if (!source.hasEmbedding()) {
        setError(errorOut, ErrorCode::MissingEmbedding,
                 QStringLiteral("Media item %1 does not have an embedding").arg(source.id));
        return std::nullopt;
    }

    const int validatedLimit = resolveLimit(m_config, limit, m_config.limits.defaultSearchLimit);
    const double threshold = maxDistance.value_or(maxDistanceForMetric(m_config, metric));

    const auto candidates = m_retriever.findSimilar(source.embedding, validatedLimit,
                                                    QStringList{source.id}, metric, errorOut);
    if (!candidates) {
        return std::nullopt;
    }

    std::vector<RankedResult> results;
    for (const auto& candidate : *candidates) {
        if (candidate.distance > threshold) {
            continue;
        }
        RankedResult result = toRankedResult(candidate);
        BoostOutcome boosted = m_booster.boost(candidate.record, QString(), candidate.similarity);
        result.similarity = boosted.finalSimilarity;
        result.relevanceScore = boosted.finalSimilarity;
        result.boostTrace = std::move(boosted.trace);
        result.semanticMatch = result.similarity >= m_config.similarity.strongMatchThreshold;
        results.push_back(std::move(result));
    }

    sortByRelevance(results);
    return results;
}

QStringList SemanticRanker::extractRelatedConcepts(const std::vector<RankedResult>& results,
                                                   const QString& query, int maxConcepts)
{
    auto qualifies = [](const QString& word) {
        return word.size() >= kRelatedMinWordLength && !QueryTerms::isStopWord(word);
    };

    QStringList concepts;
    QSet<QString> seen;
    auto add = [&](const QString& word) {
        if (!seen.contains(word)) {
            seen.insert(word);
            concepts.append(word);
        }
    };

    const size_t sourceCount = std::min(results.size(), static_cast<size_t>(kRelatedSourceResults));
    for (size_t i = 0; i < sourceCount; ++i) {
        const MediaRecord& record = results[i].record;
        for (const QString& word : whitespaceWords(record.title)) {
            if (qualifies(word)) {
                add(word);
            }
        }

        int taken = 0;
        for (const QString& word : whitespaceWords(record.description)) {
            if (taken >= kRelatedDescriptionWords) {
                break;
            }
            if (qualifies(word)) {
                add(word);
                ++taken;
            }
        }
    }

    const QStringList queryWords = whitespaceWords(query);
    QStringList related;
    for (const QString& term : concepts) {
        const bool overlapsQuery = std::any_of(queryWords.begin(), queryWords.end(),
                                               [&term](const QString& qw) {
                                                   return term.contains(qw) || qw.contains(term);
                                               });
        if (overlapsQuery) {
            continue;
        }
        related.append(term);
        if (related.size() >= maxConcepts) {
            break;
        }
    }
    return related;
}

} // namespace mc
