#include "core/vector/candidate_retriever.h"
#include "core/shared/logging.h"
#include "core/vector/vector_math.h"

#include <QHash>

namespace mc {

CandidateRetriever::CandidateRetriever(RecordStore& records, VectorCandidateStore& candidates)
    : m_records(records)
    , m_candidates(candidates)
{
}

std::optional<std::vector<ScoredCandidate>> CandidateRetriever::findSimilar(
    const Embedding& vector, int limit, const QStringList& excludeIds,
    DistanceMetric metric, CatalogError* errorOut) const
{
    const auto hits = m_candidates.query(vector, limit, excludeIds, metric, errorOut);
    if (!hits) {
        return std::nullopt;
    }

    std::vector<ScoredCandidate> scored;
    if (hits->empty()) {
        return scored;
    }

    QStringList ids;
    ids.reserve(static_cast<int>(hits->size()));
    for (const auto& hit : *hits) {
        ids.append(hit.recordId);
    }

    const auto records = m_records.getRecords(ids, errorOut);
    if (!records) {
        return std::nullopt;
    }

    QHash<QString, const MediaRecord*> byId;
    for (const auto& record : *records) {
        byId.insert(record.id, &record);
    }

    scored.reserve(hits->size());
    for (const auto& hit : *hits) {
        const MediaRecord* record = byId.value(hit.recordId, nullptr);
        if (!record) {
            LOG_DEBUG(mcIndex, "findSimilar: dropping stale hit %s", qUtf8Printable(hit.recordId));
            continue;
        }
        scored.push_back({*record, hit.distance,
                          VectorMath::similarityFromDistance(hit.distance, metric)});
    }

    LOG_DEBUG(mcRanking, "findSimilar: metric=%s limit=%d hits=%d",
              qUtf8Printable(distanceMetricToString(metric)), limit,
              static_cast<int>(scored.size()));
    return scored;
}

} // namespace mc
