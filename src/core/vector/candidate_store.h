#pragma once

#include "core/shared/errors.h"
#include "core/shared/search_result.h"
#include "core/shared/types.h"

#include <QStringList>

#include <optional>
#include <vector>

namespace mc {

// Nearest-neighbour lookup over embedded records. Implementations return
// hits ordered by ascending distance, never return records without an
// embedding, and treat "no match" as an empty list rather than a failure.
class VectorCandidateStore {
public:
    virtual ~VectorCandidateStore() = default;

    virtual std::optional<std::vector<CandidateHit>> query(const Embedding& vector,
                                                           int limit,
                                                           const QStringList& excludeIds,
                                                           DistanceMetric metric,
                                                           CatalogError* errorOut = nullptr) = 0;
};

} // namespace mc
