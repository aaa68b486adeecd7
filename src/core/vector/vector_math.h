#pragma once

#include "core/shared/errors.h"
#include "core/shared/types.h"

#include <optional>
#include <vector>

namespace mc {

class VectorMath {
public:
    // Callers guarantee equal lengths; extra elements of the longer input are ignored.
    static double dot(const Embedding& a, const Embedding& b);
    static double norm(const Embedding& v);

    // 0 when either vector has zero length.
    static double cosineSimilarity(const Embedding& a, const Embedding& b);

    static double distance(const Embedding& a, const Embedding& b, DistanceMetric metric);
    static double similarityFromDistance(double distance, DistanceMetric metric);

    // Element-wise arithmetic mean. Fails with InvalidInput on an empty set
    // or when the vectors disagree on dimension.
    static std::optional<Embedding> centroid(const std::vector<Embedding>& vectors,
                                             CatalogError* errorOut = nullptr);
};

} // namespace mc
