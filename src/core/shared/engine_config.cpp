#include "core/shared/engine_config.h"

#include <algorithm>

namespace mc {

QString fuzzyFieldToString(FuzzyField field)
{
    switch (field) {
    case FuzzyField::Title:       return QStringLiteral("title");
    case FuzzyField::Description: return QStringLiteral("description");
    case FuzzyField::Content:     return QStringLiteral("content");
    }
    return QStringLiteral("title");
}

std::optional<StrictnessLevel> strictnessLevelFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("strict"))          return StrictnessLevel::Strict;
    if (lower == QLatin1String("moderate"))        return StrictnessLevel::Moderate;
    if (lower == QLatin1String("default"))         return StrictnessLevel::Default;
    if (lower == QLatin1String("permissive"))      return StrictnessLevel::Permissive;
    if (lower == QLatin1String("very-permissive")) return StrictnessLevel::VeryPermissive;
    return std::nullopt;
}

double thresholdForLevel(const EngineConfig& config, StrictnessLevel level)
{
    switch (level) {
    case StrictnessLevel::Strict:         return config.similarity.strictMinSimilarity;
    case StrictnessLevel::Moderate:       return config.similarity.moderateMinSimilarity;
    case StrictnessLevel::Default:        return config.similarity.defaultMinSimilarity;
    case StrictnessLevel::Permissive:     return config.similarity.permissiveMinSimilarity;
    case StrictnessLevel::VeryPermissive: return config.similarity.veryPermissiveMinSimilarity;
    }
    return config.similarity.defaultMinSimilarity;
}

double maxDistanceForMetric(const EngineConfig& config, DistanceMetric metric)
{
    switch (metric) {
    case DistanceMetric::Cosine:       return config.distance.cosineMaxDistance;
    case DistanceMetric::L2:           return config.distance.l2MaxDistance;
    case DistanceMetric::InnerProduct: return config.distance.innerProductMaxDistance;
    }
    return config.distance.cosineMaxDistance;
}

int clampLimit(const EngineConfig& config, int limit)
{
    return std::max(config.limits.minLimit, std::min(config.limits.maxLimit, limit));
}

int resolveLimit(const EngineConfig& config, int limit, int defaultLimit)
{
    return clampLimit(config, limit > 0 ? limit : defaultLimit);
}

double clampSimilarity(double similarity)
{
    return std::clamp(similarity, 0.0, 1.0);
}

} // namespace mc
