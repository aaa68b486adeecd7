#pragma once

#include "core/shared/types.h"

#include <QString>
#include <vector>

namespace mc {

enum class BoostMode {
    Multiplicative, // final = base * product
    Additive,       // final = base * (1 + sum of (factor - 1))
};

enum class FuzzyField {
    Title,
    Description,
    Content,
};

QString fuzzyFieldToString(FuzzyField field);

struct SimilaritySettings {
    double defaultMinSimilarity = 0.3;
    double strictMinSimilarity = 0.7;
    double moderateMinSimilarity = 0.5;
    double permissiveMinSimilarity = 0.1;
    double veryPermissiveMinSimilarity = 0.0;
    // Tried in order when nothing clears the initial bar (strictly decreasing)
    std::vector<double> progressiveThresholds = {0.2, 0.1, 0.05, 0.0};
    double strongMatchThreshold = 0.5;
    // Mean similarity under which a fallback result set is flagged
    double lowConfidenceAverage = 0.2;
};

struct DistanceSettings {
    double cosineMaxDistance = 0.5;
    double l2MaxDistance = 1.0;
    double innerProductMaxDistance = 0.5;
    double semanticAdaptiveMaxDistance = 1.0;
};

struct LimitSettings {
    int defaultSearchLimit = 10;
    int minLimit = 1;
    int maxLimit = 100;
    int candidateMultiplier = 2;
    int semanticCandidateMultiplier = 5;
};

struct SemanticSettings {
    double defaultMinSimilarity = 0.3;
    bool includeRelated = true;
    bool contextBoost = true;
    double titleMatchBoost = 0.1;
    double partialWordMatchBoost = 0.05;
    double descriptionMatchBoost = 0.05;
    int maxRelatedConcepts = 5;
};

struct RecommendationSettings {
    double defaultMinSimilarity = 0.5;
    int defaultLimit = 6;
    double itemWeight = 0.5;
    double contentWeight = 0.5;
    std::vector<double> progressiveThresholds = {0.4, 0.3, 0.2, 0.1, 0.05, 0.0};
};

// Multipliers applied by the relevance booster when a heuristic holds.
struct BoostSettings {
    double typeMatchBoost = 1.15;
    double platformMatchBoost = 1.10;
    double titleMatchBoost = 1.20;
    double descriptionMatchBoost = 1.10;
    double formatMatchBoost = 1.05;
    double keywordBoost = 1.10;
    double intentMatchBoost = 1.08;
    double transcriptionMatchBoost = 1.15;
    double phraseMatchBoost = 1.25;
    double recencyBoost = 1.05;
    int recencyWindowDays = 30;
    double maxTotalBoost = 1.5;
    double minSimilarityForBoost = 0.1;
    BoostMode mode = BoostMode::Multiplicative;
    bool mediaTypesOnly = true; // Only audio/video records receive factors
};

struct FuzzySettings {
    double defaultMinScore = 0.3;
    int defaultLimit = 20;
    int previewLength = 100;
    std::vector<FuzzyField> defaultFields = {
        FuzzyField::Title, FuzzyField::Description, FuzzyField::Content};
};

struct EmbeddingSettings {
    int dimensions = 768;
    int backfillDelayMs = 100;
    int circuitOpenThreshold = 5;
    int circuitHalfOpenDelayMs = 30000;
};

// Every tunable of the ranking and recommendation engine. Components take
// this by value and never consult process-wide state.
struct EngineConfig {
    SimilaritySettings similarity;
    DistanceSettings distance;
    LimitSettings limits;
    SemanticSettings semantic;
    RecommendationSettings recommendations;
    BoostSettings boost;
    FuzzySettings fuzzy;
    EmbeddingSettings embedding;
};

enum class StrictnessLevel {
    Strict,
    Moderate,
    Default,
    Permissive,
    VeryPermissive,
};

std::optional<StrictnessLevel> strictnessLevelFromString(const QString& str);

double thresholdForLevel(const EngineConfig& config, StrictnessLevel level);
double maxDistanceForMetric(const EngineConfig& config, DistanceMetric metric);
int clampLimit(const EngineConfig& config, int limit);
// A limit <= 0 selects defaultLimit; the result is clamped.
int resolveLimit(const EngineConfig& config, int limit, int defaultLimit);
double clampSimilarity(double similarity);

} // namespace mc
