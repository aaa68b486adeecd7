#pragma once

#include "core/index/record_store.h"
#include "core/shared/search_result.h"
#include "core/vector/candidate_store.h"

#include <optional>
#include <vector>

namespace mc {

// The one retrieval primitive shared by search and recommendations:
// nearest-neighbour hits from the candidate store, hydrated into records
// with their metric-specific similarity.
class CandidateRetriever {
public:
    CandidateRetriever(RecordStore& records, VectorCandidateStore& candidates);

    // Ordered by ascending distance. Hits whose record has vanished since
    // the lookup are dropped.
    std::optional<std::vector<ScoredCandidate>> findSimilar(const Embedding& vector,
                                                            int limit,
                                                            const QStringList& excludeIds,
                                                            DistanceMetric metric,
                                                            CatalogError* errorOut = nullptr) const;

private:
    RecordStore& m_records;
    VectorCandidateStore& m_candidates;
};

} // namespace mc
