#pragma once

#include "core/shared/engine_config.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace mc {

// ConfigLoader -- JSON save/load for EngineConfig.
//
// Keys are grouped into objects ("similarity", "distance", "limits",
// "semantic", "recommendations", "boost", "fuzzy", "embedding"). Missing
// keys keep their defaults.
class ConfigLoader {
public:
    // Returns nullopt if the file doesn't exist, cannot be parsed, or
    // fails validation.
    static std::optional<EngineConfig> load(const QString& filePath);

    // Creates the parent directory if needed. Returns true on success.
    static bool save(const EngineConfig& config, const QString& filePath);

    static QJsonObject toJson(const EngineConfig& config);
    static EngineConfig fromJson(const QJsonObject& json);

    // Rejects relaxation sequences that are not strictly decreasing,
    // non-positive candidate multipliers, boost multipliers below 1 and a
    // total boost cap below 1.
    static bool validate(const EngineConfig& config, QString* errorOut = nullptr);
};

} // namespace mc
