#pragma once

#include "core/shared/engine_config.h"
#include "core/shared/search_result.h"

#include <QString>

#include <functional>
#include <vector>

namespace mc {

struct BoostOutcome {
    double baseSimilarity = 0.0;
    double finalSimilarity = 0.0;
    std::vector<BoostFactor> trace; // In evaluation order, only factors that fired
};

// Diagnostic hook receiving every non-empty boost trace.
using BoostTraceSink = std::function<void(const MediaRecord& record, const BoostOutcome& outcome)>;

// Applies a capped stack of heuristic multipliers (type, platform, field,
// format, keyword, intent, transcription, recency) to a retrieval
// similarity. Each heuristic is evaluated independently into a
// (name, factor) pair; the pairs are then folded into one score.
class RelevanceBooster {
public:
    explicit RelevanceBooster(const BoostSettings& settings = {}, BoostTraceSink sink = {});

    // Result lies in [base, min(1, base * maxTotalBoost)] and equals base
    // when no factor fires or base < minSimilarityForBoost.
    BoostOutcome boost(const MediaRecord& record, const QString& query,
                       double baseSimilarity) const;
    BoostOutcome boost(const MediaRecord& record, const QString& query,
                       double baseSimilarity, double nowEpoch) const;

    // Every factor that fires for record and query. Factors are >= 1.
    std::vector<BoostFactor> computeFactors(const MediaRecord& record, const QString& query,
                                            double nowEpoch) const;

    // Linear decay from recencyBoost at age 0 to 1.0 at the window edge.
    double computeRecencyFactor(double createdAtEpoch, double nowEpoch) const;

    // Fold factors into a final similarity under the configured mode and caps.
    double combine(double baseSimilarity, const std::vector<BoostFactor>& factors) const;

    const BoostSettings& settings() const { return m_settings; }

private:
    // 1 + (boost - 1) * strength
    static double scaled(double boost, double strength);

    BoostSettings m_settings;
    BoostTraceSink m_sink;
};

} // namespace mc
