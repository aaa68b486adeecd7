#include "core/shared/search_result.h"

namespace mc {

QString recommendationStrategyToString(RecommendationStrategy strategy)
{
    switch (strategy) {
    case RecommendationStrategy::ItemBased:    return QStringLiteral("item-based");
    case RecommendationStrategy::MultiItem:    return QStringLiteral("multi-item");
    case RecommendationStrategy::ContentBased: return QStringLiteral("content-based");
    case RecommendationStrategy::Hybrid:       return QStringLiteral("hybrid");
    }
    return QStringLiteral("unknown");
}

} // namespace mc
