#pragma once

#include "core/shared/search_result.h"

#include <QString>
#include <vector>

namespace mc {

// Typo-tolerant text matching on top of Levenshtein similarity.
// Unindexed: cost is O(records x fields x query words x text words x edit cost).
class FuzzyMatcher {
public:
    struct WindowMatch {
        double score = 0.0;
        QString matchedText;
        int position = 0;
    };

    static constexpr double kPrefixMatchScore = 0.9;
    static constexpr int kWindowPreviewLength = 100;

    // Score in [0, 1] for how well query matches text.
    //   1.0 when text contains query verbatim (case-insensitive)
    //   otherwise the mean, over all query words, of each word's best score
    //   against the text words: 0.9 for a prefix hit, Levenshtein similarity
    //   when it reaches threshold. Unmatched query words contribute 0.
    static double fuzzyMatch(const QString& text, const QString& query, double threshold);

    // Best (score, field, snippet) per record over the requested fields,
    // kept when score >= minScore, sorted by score descending and truncated
    // to limit (limit <= 0 keeps everything).
    static std::vector<FuzzyMatch> fieldSearch(const std::vector<MediaRecord>& records,
                                               const QString& query,
                                               double minScore,
                                               const std::vector<FuzzyField>& fields,
                                               int limit,
                                               int previewLength = 100);

    // Slides a window of 2 x |query words| tokens across text and scores
    // each window with fuzzyMatch. Sorted by score descending.
    static std::vector<WindowMatch> findFuzzyMatches(const QString& text,
                                                     const QString& query,
                                                     double threshold);

    static QStringList splitWords(const QString& text);
};

} // namespace mc
