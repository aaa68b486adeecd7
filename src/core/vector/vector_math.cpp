#include "core/vector/vector_math.h"

#include <algorithm>
#include <cmath>

namespace mc {

double VectorMath::dot(const Embedding& a, const Embedding& b)
{
    const size_t n = std::min(a.size(), b.size());
    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        sum += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    }
    return sum;
}

double VectorMath::norm(const Embedding& v)
{
    return std::sqrt(dot(v, v));
}

double VectorMath::cosineSimilarity(const Embedding& a, const Embedding& b)
{
    const double denom = norm(a) * norm(b);
    if (denom <= 0.0) {
        return 0.0;
    }
    return dot(a, b) / denom;
}

double VectorMath::distance(const Embedding& a, const Embedding& b, DistanceMetric metric)
{
    switch (metric) {
    case DistanceMetric::Cosine:
        return 1.0 - cosineSimilarity(a, b);
    case DistanceMetric::L2: {
        const size_t n = std::min(a.size(), b.size());
        double sum = 0.0;
        for (size_t i = 0; i < n; ++i) {
            const double d = static_cast<double>(a[i]) - static_cast<double>(b[i]);
            sum += d * d;
        }
        return std::sqrt(sum);
    }
    case DistanceMetric::InnerProduct:
        return -dot(a, b);
    }
    return 0.0;
}

double VectorMath::similarityFromDistance(double distance, DistanceMetric metric)
{
    switch (metric) {
    case DistanceMetric::Cosine:
        return 1.0 - distance;
    case DistanceMetric::L2:
        return 1.0 / (1.0 + distance);
    case DistanceMetric::InnerProduct:
        return -distance;
    }
    return 0.0;
}

std::optional<Embedding> VectorMath::centroid(const std::vector<Embedding>& vectors,
                                              CatalogError* errorOut)
{
    if (vectors.empty()) {
        setError(errorOut, ErrorCode::InvalidInput,
                 QStringLiteral("Cannot average an empty set of embeddings"));
        return std::nullopt;
    }

    const size_t dims = vectors.front().size();
    std::vector<double> sums(dims, 0.0);
    for (const auto& v : vectors) {
        if (v.size() != dims) {
            setError(errorOut, ErrorCode::InvalidInput,
                     QStringLiteral("Embedding dimension mismatch: expected %1, got %2")
                         .arg(static_cast<int>(dims)).arg(static_cast<int>(v.size())));
            return std::nullopt;
        }
        for (size_t i = 0; i < dims; ++i) {
            sums[i] += static_cast<double>(v[i]);
        }
    }

    Embedding mean(dims);
    const double count = static_cast<double>(vectors.size());
    for (size_t i = 0; i < dims; ++i) {
        mean[i] = static_cast<float>(sums[i] / count);
    }
    return mean;
}

} // namespace mc
