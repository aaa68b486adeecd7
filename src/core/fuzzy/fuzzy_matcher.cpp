#include "core/fuzzy/fuzzy_matcher.h"
#include "core/fuzzy/levenshtein.h"
#include "core/shared/logging.h"

#include <QRegularExpression>

#include <algorithm>

namespace mc {

namespace {

const QString& fieldText(const MediaRecord& record, FuzzyField field)
{
    switch (field) {
    case FuzzyField::Title:       return record.title;
    case FuzzyField::Description: return record.description;
    case FuzzyField::Content:     return record.content;
    }
    return record.title;
}

bool containsField(const std::vector<FuzzyField>& fields, FuzzyField field)
{
    return std::find(fields.begin(), fields.end(), field) != fields.end();
}

} // namespace

QStringList FuzzyMatcher::splitWords(const QString& text)
{
    static const QRegularExpression whitespace(QStringLiteral(R"(\s+)"));
    return text.split(whitespace, Qt::SkipEmptyParts);
}

double FuzzyMatcher::fuzzyMatch(const QString& text, const QString& query, double threshold)
{
    const QString textLower = text.toLower();
    const QString queryLower = query.toLower();

    const QStringList queryWords = splitWords(queryLower);
    if (queryWords.isEmpty()) {
        return 0.0;
    }

    if (textLower.contains(queryLower)) {
        return 1.0;
    }

    const QStringList textWords = splitWords(textLower);

    double totalScore = 0.0;
    int matchedWords = 0;

    for (const QString& queryWord : queryWords) {
        double bestScore = 0.0;

        for (const QString& textWord : textWords) {
            if (textWord.startsWith(queryWord)) {
                bestScore = std::max(bestScore, kPrefixMatchScore);
            }

            const double similarity = Levenshtein::similarity(queryWord, textWord);
            if (similarity >= threshold) {
                bestScore = std::max(bestScore, similarity);
            }
        }

        if (bestScore > 0.0) {
            totalScore += bestScore;
            ++matchedWords;
        }
    }

    // Denominator is every query word, so partial coverage is penalized
    return matchedWords > 0 ? totalScore / static_cast<double>(queryWords.size()) : 0.0;
}

std::vector<FuzzyMatch> FuzzyMatcher::fieldSearch(const std::vector<MediaRecord>& records,
                                                  const QString& query,
                                                  double minScore,
                                                  const std::vector<FuzzyField>& fields,
                                                  int limit,
                                                  int previewLength)
{
    std::vector<FuzzyMatch> matches;

    const QString queryLower = query.trimmed().toLower();
    if (queryLower.isEmpty()) {
        return matches;
    }

    static const FuzzyField kFieldOrder[] = {
        FuzzyField::Title, FuzzyField::Description, FuzzyField::Content};

    for (const MediaRecord& record : records) {
        double bestScore = 0.0;
        std::optional<FuzzyField> bestField;
        QString matchedText;

        for (FuzzyField field : kFieldOrder) {
            if (!containsField(fields, field)) {
                continue;
            }
            const QString& text = fieldText(record, field);
            if (text.isEmpty()) {
                continue;
            }

            const double score = fuzzyMatch(text, queryLower, minScore);
            if (score > bestScore) {
                bestScore = score;
                bestField = field;
                matchedText = field == FuzzyField::Title ? text : text.left(previewLength);
            }
        }

        if (bestField.has_value() && bestScore >= minScore) {
            FuzzyMatch match;
            match.record = record;
            match.fuzzyScore = bestScore;
            match.matchedField = *bestField;
            match.matchedText = matchedText;
            matches.push_back(std::move(match));
        }
    }

    std::stable_sort(matches.begin(), matches.end(),
                     [](const FuzzyMatch& a, const FuzzyMatch& b) {
                         return a.fuzzyScore > b.fuzzyScore;
                     });

    if (limit > 0 && static_cast<int>(matches.size()) > limit) {
        matches.resize(static_cast<size_t>(limit));
    }

    LOG_DEBUG(mcFuzzy, "fieldSearch: query='%s' scanned=%zu matched=%zu",
              qUtf8Printable(queryLower), records.size(), matches.size());
    return matches;
}

std::vector<FuzzyMatcher::WindowMatch> FuzzyMatcher::findFuzzyMatches(const QString& text,
                                                                      const QString& query,
                                                                      double threshold)
{
    std::vector<WindowMatch> matches;

    const QString queryLower = query.toLower();
    const QStringList queryWords = splitWords(queryLower);
    if (queryWords.isEmpty()) {
        return matches;
    }

    // Tokens interleaved with their separators so positions stay exact
    static const QRegularExpression tokenRegex(QStringLiteral(R"(\S+|\s+)"));
    QStringList parts;
    auto it = tokenRegex.globalMatch(text.toLower());
    while (it.hasNext()) {
        parts.append(it.next().captured(0));
    }

    const int windowParts = static_cast<int>(queryWords.size()) * 2;
    int position = 0;
    for (int i = 0; i + static_cast<int>(queryWords.size()) <= parts.size(); ++i) {
        const QString window = parts.mid(i, windowParts).join(QString()).trimmed();
        if (!window.isEmpty()) {
            const double score = fuzzyMatch(window, queryLower, threshold);
            if (score > 0.0) {
                matches.push_back(WindowMatch{score, window.left(kWindowPreviewLength), position});
            }
        }
        position += static_cast<int>(parts[i].size());
    }

    std::stable_sort(matches.begin(), matches.end(),
                     [](const WindowMatch& a, const WindowMatch& b) {
                         return a.score > b.score;
                     });
    return matches;
}

} // namespace mc
