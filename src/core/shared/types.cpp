#include "core/shared/types.h"

namespace mc {

QString mediaTypeToString(MediaType type)
{
    switch (type) {
    case MediaType::Text:  return QStringLiteral("text");
    case MediaType::Audio: return QStringLiteral("audio");
    case MediaType::Video: return QStringLiteral("video");
    case MediaType::Image: return QStringLiteral("image");
    }
    return QStringLiteral("text");
}

std::optional<MediaType> mediaTypeFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("text"))  return MediaType::Text;
    if (lower == QLatin1String("audio")) return MediaType::Audio;
    if (lower == QLatin1String("video")) return MediaType::Video;
    if (lower == QLatin1String("image")) return MediaType::Image;
    return std::nullopt;
}

QString distanceMetricToString(DistanceMetric metric)
{
    switch (metric) {
    case DistanceMetric::Cosine:       return QStringLiteral("cosine");
    case DistanceMetric::L2:           return QStringLiteral("l2");
    case DistanceMetric::InnerProduct: return QStringLiteral("inner_product");
    }
    return QStringLiteral("cosine");
}

} // namespace mc
