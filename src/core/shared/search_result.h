#pragma once

#include "core/shared/engine_config.h"
#include "core/shared/types.h"

#include <QString>
#include <QStringList>
#include <optional>
#include <vector>

namespace mc {

// Raw hit from the vector candidate store, ordered by ascending distance.
struct CandidateHit {
    QString recordId;
    double distance = 0.0;
};

// Hydrated candidate. Distance and similarity are never modified after the
// store produced them; only set membership changes downstream.
struct ScoredCandidate {
    MediaRecord record;
    double distance = 0.0;
    double similarity = 0.0;
};

// One applied boost factor, e.g. {"type:synonym", 1.15}
struct BoostFactor {
    QString name;
    double multiplier = 1.0;
};

struct RankedResult {
    MediaRecord record;
    double similarity = 0.0;     // After relevance boosting
    double distance = 0.0;
    double relevanceScore = 0.0; // After context boosting (equals similarity when disabled)
    bool semanticMatch = false;
    std::vector<BoostFactor> boostTrace;
};

struct FuzzyMatch {
    MediaRecord record;
    double fuzzyScore = 0.0;
    FuzzyField matchedField = FuzzyField::Title;
    QString matchedText;
};

struct SearchMetadata {
    int totalCandidates = 0;
    int filteredResults = 0;
    double averageSimilarity = 0.0;
    double effectiveMinSimilarity = 0.0;
    bool lowConfidence = false;
};

struct SemanticSearchOptions {
    std::optional<double> minSimilarity;
    std::optional<bool> includeRelated;
    std::optional<bool> contextBoost;
};

struct SemanticSearchResponse {
    QString query;
    std::vector<RankedResult> results;
    std::optional<QStringList> relatedConcepts;
    std::optional<QString> diagnosticMessage;
    SearchMetadata metadata;
};

enum class RecommendationStrategy {
    ItemBased,
    MultiItem,
    ContentBased,
    Hybrid,
};

QString recommendationStrategyToString(RecommendationStrategy strategy);

struct RecommendationResult {
    MediaRecord record;
    double similarity = 0.0;
    double distance = 0.0;
    double recommendationScore = 0.0;
    QString reason;
};

struct RecommendationMetadata {
    int totalCandidates = 0;
    int filteredResults = 0;
    double averageSimilarity = 0.0;
    double minSimilarity = 0.0;
    double maxSimilarity = 0.0;
    double effectiveMinSimilarity = 0.0;
};

struct RecommendationResponse {
    RecommendationStrategy strategy = RecommendationStrategy::ItemBased;
    QStringList sourceItems;
    QString sourceQuery;
    std::vector<RecommendationResult> recommendations;
    RecommendationMetadata metadata;
};

struct HybridWeights {
    double itemBased = 0.5;
    double contentBased = 0.5;
};

struct RecommendationRequest {
    QStringList itemIds;
    QString query;
    int limit = 0;                       // 0 selects the configured default
    std::optional<double> minSimilarity; // unset selects the configured default
    QStringList excludeIds;
    std::optional<HybridWeights> weights;
};

} // namespace mc
