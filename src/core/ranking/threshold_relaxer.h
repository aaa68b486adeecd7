#pragma once

#include "core/shared/search_result.h"

#include <vector>

namespace mc {

// Lowers a similarity cutoff step by step until enough candidates survive.
// Pure: input order is kept and candidates are never re-scored.
class ThresholdRelaxer {
public:
    enum class Policy {
        UntilNonEmpty,    // relax only when nothing clears the initial bar
        UntilTargetCount, // relax while fewer than targetCount survive
    };

    struct Outcome {
        std::vector<ScoredCandidate> results;
        double effectiveThreshold = 0.0;
        bool usedFallback = false;
    };

    // Filters candidates by similarity >= initialThreshold, then walks the
    // strictly decreasing sequence (entries >= the current bar are skipped).
    // When every step is empty the fallback keeps the targetCount most
    // similar candidates and reports an effective threshold of 0.
    static Outcome relax(const std::vector<ScoredCandidate>& candidates,
                         double initialThreshold,
                         const std::vector<double>& sequence,
                         int targetCount,
                         Policy policy);

    static std::vector<ScoredCandidate> filterAtLeast(const std::vector<ScoredCandidate>& candidates,
                                                      double threshold);
};

} // namespace mc
