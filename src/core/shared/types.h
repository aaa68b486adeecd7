#pragma once

#include <QString>
#include <cstdint>
#include <optional>
#include <vector>

namespace mc {

// Media classification of a catalog record
enum class MediaType {
    Text,
    Audio,
    Video,
    Image,
};

QString mediaTypeToString(MediaType type);
std::optional<MediaType> mediaTypeFromString(const QString& str);

// Distance metric requested from the vector candidate store.
//   Cosine:       distance = 1 - cos(a, b),    similarity = 1 - distance
//   L2:           distance = |a - b|,          similarity = 1 / (1 + distance)
//   InnerProduct: distance = -(a . b),         similarity = -distance
enum class DistanceMetric {
    Cosine,
    L2,
    InnerProduct,
};

QString distanceMetricToString(DistanceMetric metric);

using Embedding = std::vector<float>;

struct MediaRecord {
    QString id;
    QString title;
    MediaType type = MediaType::Text;
    QString content;        // Text body or transcription payload
    QString description;
    QString sourcePath;     // Uploaded file location
    QString sourceUrl;      // Linked media location
    QString mimeType;
    Embedding embedding;    // Empty when not yet embedded
    double createdAt = 0.0; // Epoch seconds
    double updatedAt = 0.0; // Epoch seconds

    bool hasEmbedding() const { return !embedding.empty(); }
};

} // namespace mc
