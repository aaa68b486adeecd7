#include "core/fuzzy/levenshtein.h"

#include <QVector>

#include <algorithm>

namespace mc {

int Levenshtein::distance(const QString& a, const QString& b)
{
    const int aLen = a.size();
    const int bLen = b.size();

    if (a == b) {
        return 0;
    }
    if (aLen == 0) {
        return bLen;
    }
    if (bLen == 0) {
        return aLen;
    }

    // Two rolling rows of the (aLen + 1) x (bLen + 1) distance matrix
    QVector<int> prev(bLen + 1);
    QVector<int> curr(bLen + 1);
    for (int j = 0; j <= bLen; ++j) {
        prev[j] = j;
    }

    for (int i = 1; i <= aLen; ++i) {
        curr[0] = i;
        for (int j = 1; j <= bLen; ++j) {
            if (a[i - 1] == b[j - 1]) {
                curr[j] = prev[j - 1];
                continue;
            }
            const int deletion = prev[j] + 1;
            const int insertion = curr[j - 1] + 1;
            const int substitution = prev[j - 1] + 1;
            curr[j] = std::min({deletion, insertion, substitution});
        }
        prev.swap(curr);
    }

    return prev[bLen];
}

double Levenshtein::similarity(const QString& a, const QString& b)
{
    // Lowercasing may change length (U+0130), so measure the folded strings
    const QString aLower = a.toLower();
    const QString bLower = b.toLower();
    const int maxLength = std::max(aLower.size(), bLower.size());
    if (maxLength == 0) {
        return 1.0;
    }

    const int dist = distance(aLower, bLower);
    return 1.0 - static_cast<double>(dist) / static_cast<double>(maxLength);
}

} // namespace mc
