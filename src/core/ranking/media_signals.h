#pragma once

#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <optional>

namespace mc {

// Query-versus-record heuristics feeding the relevance booster. Each check
// is independent and side-effect free; queryLower must already be
// lower-cased and queryWords come from QueryTerms::meaningfulWords().
class MediaSignals {
public:
    enum class FieldTier {
        None,
        ExactPhrase,
        AllWords,
        MostWords, // >= 60% of words, more than one query word
        SomeWords,
    };

    enum class TranscriptTier {
        None,
        ExactPhrase,
        SubPhrase, // any two consecutive query words
        AllWords,
        MostWords,
        SomeWords,
    };

    struct KeywordMatch {
        QStringList keywords;
        double strength = 1.0;
    };

    struct TranscriptMatch {
        TranscriptTier tier = TranscriptTier::None;
        double strength = 1.0;
        bool phrase = false;
    };

    // "exact" when the type name occurs in the query, "synonym" for a
    // type-specific synonym (podcast, movie, ...).
    static std::optional<QString> typeMatch(MediaType type, const QString& queryLower);

    // Platform name when the URL is hosted there AND the query mentions it.
    static std::optional<QString> platformMatch(const QString& url, const QString& queryLower);

    // Canonical format name when MIME type or URL extension maps to a format
    // the query also mentions.
    static std::optional<QString> formatMatch(const QString& mimeType, const QString& url,
                                              const QString& queryLower);

    static std::optional<KeywordMatch> keywordMatch(MediaType type, const QString& queryLower);

    static FieldTier fieldMatch(const QString& fieldText, const QString& queryLower,
                                const QStringList& queryWords);

    static TranscriptMatch transcriptMatch(const QString& content, const QString& queryLower,
                                           const QStringList& queryWords);

    static QString fieldTierToString(FieldTier tier);
    static QString transcriptTierToString(TranscriptTier tier);

private:
    static int countContained(const QString& text, const QStringList& words);
};

} // namespace mc
