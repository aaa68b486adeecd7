#pragma once

#include <QString>
#include <QStringList>

namespace mc {

struct NormalizedQuery {
    QString original;
    QString normalized; // trimmed, whitespace runs collapsed
    QString lower;      // normalized, lower-cased
};

class QueryTerms {
public:
    static NormalizedQuery normalize(const QString& raw);

    // Lower-cased words longer than two characters that are not stop words.
    static QStringList meaningfulWords(const QString& query);

    static bool isStopWord(const QString& word);
};

} // namespace mc
