#pragma once

#include <QString>

namespace mc {

// Plain Levenshtein edit distance (insertions, deletions, substitutions).
class Levenshtein {
public:
    // Minimum number of single-character edits turning a into b.
    // Compares characters exactly; lower-case inputs for case-insensitive use.
    static int distance(const QString& a, const QString& b);

    // 1 - distance / max(|a|, |b|) over the lower-cased inputs.
    // Two empty strings are identical (1.0).
    static double similarity(const QString& a, const QString& b);
};

} // namespace mc
