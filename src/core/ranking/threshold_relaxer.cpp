#include "core/ranking/threshold_relaxer.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace mc {

std::vector<ScoredCandidate> ThresholdRelaxer::filterAtLeast(
    const std::vector<ScoredCandidate>& candidates, double threshold)
{
    std::vector<ScoredCandidate> kept;
    kept.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        if (candidate.similarity >= threshold) {
            kept.push_back(candidate);
        }
    }
    return kept;
}

ThresholdRelaxer::Outcome ThresholdRelaxer::relax(const std::vector<ScoredCandidate>& candidates,
                                                  double initialThreshold,
                                                  const std::vector<double>& sequence,
                                                  int targetCount,
                                                  Policy policy)
{
    const size_t target = static_cast<size_t>(std::max(targetCount, 1));
    auto satisfied = [&](const std::vector<ScoredCandidate>& set) {
        if (policy == Policy::UntilNonEmpty) {
            return !set.empty();
        }
        return set.size() >= target;
    };

    Outcome outcome;
    outcome.results = filterAtLeast(candidates, initialThreshold);
    outcome.effectiveThreshold = initialThreshold;

    if (satisfied(outcome.results)) {
        return outcome;
    }

    for (double threshold : sequence) {
        if (threshold >= outcome.effectiveThreshold) {
            continue;
        }
        std::vector<ScoredCandidate> step = filterAtLeast(candidates, threshold);
        if (step.empty()) {
            continue;
        }

        outcome.results = std::move(step);
        outcome.effectiveThreshold = threshold;
        LOG_DEBUG(mcRanking, "relax: threshold %.3f -> %.3f kept %d of %d",
                  initialThreshold, threshold,
                  static_cast<int>(outcome.results.size()),
                  static_cast<int>(candidates.size()));
        if (satisfied(outcome.results)) {
            return outcome;
        }
    }

    if (!outcome.results.empty() || candidates.empty()) {
        return outcome;
    }

    // Nothing cleared any bar: keep the most similar candidates in input order.
    std::vector<size_t> order(candidates.size());
    for (size_t i = 0; i < order.size(); ++i) {
        order[i] = i;
    }
    std::stable_sort(order.begin(), order.end(), [&candidates](size_t a, size_t b) {
        return candidates[a].similarity > candidates[b].similarity;
    });
    order.resize(std::min(order.size(), target));
    std::sort(order.begin(), order.end());

    outcome.results.clear();
    for (size_t index : order) {
        outcome.results.push_back(candidates[index]);
    }
    outcome.effectiveThreshold = 0.0;
    outcome.usedFallback = true;
    LOG_INFO(mcRanking, "relax: fallback to top %d of %d candidates",
             static_cast<int>(outcome.results.size()),
             static_cast<int>(candidates.size()));
    return outcome;
}

} // namespace mc
