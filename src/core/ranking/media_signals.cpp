#include "core/ranking/media_signals.h"

#include <QRegularExpression>

#include <algorithm>

namespace mc {

namespace {

struct PlatformPattern {
    const char* name;
    const char* aliases[3];
    const char* urlPattern;
};

const PlatformPattern kPlatforms[] = {
    {"youtube",     {"youtube", "yt", "youtu.be"}, R"(youtube|youtu\.be)"},
    {"vimeo",       {"vimeo", nullptr, nullptr},   "vimeo"},
    {"dailymotion", {"dailymotion", "dailymo", nullptr}, "dailymotion"},
    {"tiktok",      {"tiktok", "tik tok", nullptr}, "tiktok"},
    {"instagram",   {"instagram", "ig", nullptr},   "instagram"},
};

struct FormatPattern {
    const char* names[2];
    const char* mimePattern;
};

const FormatPattern kFormats[] = {
    {{"mp3", "mpeg"},       R"(audio/mpeg|audio/mp3)"},
    {{"mp4", "mpeg4"},      R"(video/mp4)"},
    {{"wav", "wave"},       R"(audio/wav|audio/wave)"},
    {{"webm", nullptr},     R"(video/webm|audio/webm)"},
    {{"ogg", "ogv"},        R"(audio/ogg|video/ogg)"},
    {{"flac", nullptr},     R"(audio/flac)"},
    {{"aac", nullptr},      R"(audio/aac)"},
    {{"mov", "quicktime"},  R"(video/quicktime|video/mov)"},
    {{"avi", nullptr},      R"(video/x-msvideo|video/avi)"},
};

// Short aliases such as "ig" must stand alone, so "big" does not count
bool mentionsAlias(const QString& queryLower, const char* alias)
{
    const QRegularExpression aliasRegex(
        QStringLiteral("(^|[^a-z0-9])")
        + QRegularExpression::escape(QString::fromLatin1(alias))
        + QStringLiteral("($|[^a-z0-9])"));
    return aliasRegex.match(queryLower).hasMatch();
}

const QStringList& audioSynonyms()
{
    static const QStringList terms = {
        QStringLiteral("audio"), QStringLiteral("sound"), QStringLiteral("podcast"),
        QStringLiteral("music"), QStringLiteral("song"), QStringLiteral("track"),
        QStringLiteral("recording"),
    };
    return terms;
}

const QStringList& videoSynonyms()
{
    static const QStringList terms = {
        QStringLiteral("video"), QStringLiteral("movie"), QStringLiteral("clip"),
        QStringLiteral("film"), QStringLiteral("recording"), QStringLiteral("stream"),
        QStringLiteral("playback"),
    };
    return terms;
}

const QStringList& audioKeywords()
{
    static const QStringList keywords = {
        QStringLiteral("audio"), QStringLiteral("sound"), QStringLiteral("recording"),
        QStringLiteral("podcast"), QStringLiteral("music"), QStringLiteral("song"),
        QStringLiteral("track"), QStringLiteral("audio file"), QStringLiteral("sound file"),
        QStringLiteral("audio recording"), QStringLiteral("music track"),
        QStringLiteral("podcast episode"), QStringLiteral("audio clip"),
        QStringLiteral("sound clip"), QStringLiteral("audio stream"),
        QStringLiteral("mp3"), QStringLiteral("wav"), QStringLiteral("flac"),
        QStringLiteral("aac"), QStringLiteral("ogg"),
    };
    return keywords;
}

const QStringList& videoKeywords()
{
    static const QStringList keywords = {
        QStringLiteral("video"), QStringLiteral("movie"), QStringLiteral("clip"),
        QStringLiteral("film"), QStringLiteral("recording"), QStringLiteral("stream"),
        QStringLiteral("playback"), QStringLiteral("video file"), QStringLiteral("video clip"),
        QStringLiteral("video recording"), QStringLiteral("movie clip"),
        QStringLiteral("film clip"), QStringLiteral("video stream"),
        QStringLiteral("online video"), QStringLiteral("video link"),
        QStringLiteral("mp4"), QStringLiteral("webm"), QStringLiteral("mov"),
        QStringLiteral("avi"), QStringLiteral("youtube"), QStringLiteral("vimeo"),
    };
    return keywords;
}

bool anyContained(const QString& text, const QStringList& terms)
{
    return std::any_of(terms.begin(), terms.end(),
                       [&text](const QString& term) { return text.contains(term); });
}

constexpr double kMostWordsRatio = 0.6;

} // namespace

std::optional<QString> MediaSignals::typeMatch(MediaType type, const QString& queryLower)
{
    if (queryLower.contains(mediaTypeToString(type))) {
        return QStringLiteral("exact");
    }

    if (type == MediaType::Audio && anyContained(queryLower, audioSynonyms())) {
        return QStringLiteral("synonym");
    }
    if (type == MediaType::Video && anyContained(queryLower, videoSynonyms())) {
        return QStringLiteral("synonym");
    }
    return std::nullopt;
}

std::optional<QString> MediaSignals::platformMatch(const QString& url, const QString& queryLower)
{
    if (url.isEmpty()) {
        return std::nullopt;
    }

    for (const auto& platform : kPlatforms) {
        const QRegularExpression urlRegex(QString::fromLatin1(platform.urlPattern),
                                          QRegularExpression::CaseInsensitiveOption);
        if (!urlRegex.match(url).hasMatch()) {
            continue;
        }
        for (const char* alias : platform.aliases) {
            if (alias && mentionsAlias(queryLower, alias)) {
                return QString::fromLatin1(platform.name);
            }
        }
    }
    return std::nullopt;
}

std::optional<QString> MediaSignals::formatMatch(const QString& mimeType, const QString& url,
                                                 const QString& queryLower)
{
    const QString urlLower = url.toLower();

    for (const auto& format : kFormats) {
        bool queryMentions = false;
        bool urlHasExtension = false;
        for (const char* name : format.names) {
            if (!name) {
                continue;
            }
            queryMentions = queryMentions || queryLower.contains(QLatin1String(name));
            urlHasExtension = urlHasExtension
                || (!urlLower.isEmpty()
                    && urlLower.contains(QLatin1Char('.') + QLatin1String(name)));
        }
        if (!queryMentions) {
            continue;
        }

        bool mimeMatches = false;
        if (!mimeType.isEmpty()) {
            const QRegularExpression mimeRegex(QString::fromLatin1(format.mimePattern),
                                               QRegularExpression::CaseInsensitiveOption);
            mimeMatches = mimeRegex.match(mimeType).hasMatch();
        }

        if (mimeMatches || urlHasExtension) {
            return QString::fromLatin1(format.names[0]);
        }
    }
    return std::nullopt;
}

std::optional<MediaSignals::KeywordMatch> MediaSignals::keywordMatch(MediaType type,
                                                                     const QString& queryLower)
{
    const QStringList* keywords = nullptr;
    if (type == MediaType::Audio) {
        keywords = &audioKeywords();
    } else if (type == MediaType::Video) {
        keywords = &videoKeywords();
    } else {
        return std::nullopt;
    }

    KeywordMatch match;
    for (const QString& keyword : *keywords) {
        if (queryLower.contains(keyword)) {
            match.keywords.append(keyword);
        }
    }
    if (match.keywords.isEmpty()) {
        return std::nullopt;
    }

    match.strength = std::min(1.0, 0.8 + 0.05 * static_cast<double>(match.keywords.size()));
    return match;
}

int MediaSignals::countContained(const QString& text, const QStringList& words)
{
    return static_cast<int>(std::count_if(words.begin(), words.end(),
                                          [&text](const QString& w) { return text.contains(w); }));
}

MediaSignals::FieldTier MediaSignals::fieldMatch(const QString& fieldText,
                                                 const QString& queryLower,
                                                 const QStringList& queryWords)
{
    if (fieldText.isEmpty() || queryLower.isEmpty()) {
        return FieldTier::None;
    }

    const QString fieldLower = fieldText.toLower();
    if (fieldLower.contains(queryLower)) {
        return FieldTier::ExactPhrase;
    }
    if (queryWords.isEmpty()) {
        return FieldTier::None;
    }

    const int matching = countContained(fieldLower, queryWords);
    if (matching == queryWords.size()) {
        return FieldTier::AllWords;
    }

    const double ratio = static_cast<double>(matching) / static_cast<double>(queryWords.size());
    if (ratio >= kMostWordsRatio && queryWords.size() > 1) {
        return FieldTier::MostWords;
    }
    if (matching > 0) {
        return FieldTier::SomeWords;
    }
    return FieldTier::None;
}

MediaSignals::TranscriptMatch MediaSignals::transcriptMatch(const QString& content,
                                                            const QString& queryLower,
                                                            const QStringList& queryWords)
{
    TranscriptMatch match;
    if (content.isEmpty() || queryLower.isEmpty()) {
        return match;
    }

    QString transcript = content.toLower();
    static const QString kMarker = QStringLiteral("transcription:");
    const int markerPos = static_cast<int>(transcript.indexOf(kMarker));
    if (markerPos >= 0) {
        const QString tail = transcript.mid(markerPos + kMarker.size()).trimmed();
        if (!tail.isEmpty()) {
            transcript = tail;
        }
    }

    if (transcript.contains(queryLower)) {
        return TranscriptMatch{TranscriptTier::ExactPhrase, 1.0, true};
    }

    for (int i = 0; i + 1 < queryWords.size(); ++i) {
        const QString phrase = queryWords[i] + QLatin1Char(' ') + queryWords[i + 1];
        if (transcript.contains(phrase)) {
            return TranscriptMatch{TranscriptTier::SubPhrase, 0.9, true};
        }
    }

    if (queryWords.isEmpty()) {
        return match;
    }

    const int matching = countContained(transcript, queryWords);
    if (matching == queryWords.size()) {
        return TranscriptMatch{TranscriptTier::AllWords, 0.85, false};
    }

    const double ratio = static_cast<double>(matching) / static_cast<double>(queryWords.size());
    if (ratio >= kMostWordsRatio && queryWords.size() > 1) {
        return TranscriptMatch{TranscriptTier::MostWords, 0.7, false};
    }
    if (matching > 0) {
        return TranscriptMatch{TranscriptTier::SomeWords, 0.5, false};
    }
    return match;
}

QString MediaSignals::fieldTierToString(FieldTier tier)
{
    switch (tier) {
    case FieldTier::None:        return QStringLiteral("none");
    case FieldTier::ExactPhrase: return QStringLiteral("exact phrase");
    case FieldTier::AllWords:    return QStringLiteral("all words");
    case FieldTier::MostWords:   return QStringLiteral("most words");
    case FieldTier::SomeWords:   return QStringLiteral("some words");
    }
    return QStringLiteral("none");
}

QString MediaSignals::transcriptTierToString(TranscriptTier tier)
{
    switch (tier) {
    case TranscriptTier::None:        return QStringLiteral("none");
    case TranscriptTier::ExactPhrase: return QStringLiteral("exact phrase");
    case TranscriptTier::SubPhrase:   return QStringLiteral("phrase");
    case TranscriptTier::AllWords:    return QStringLiteral("all words");
    case TranscriptTier::MostWords:   return QStringLiteral("most words");
    case TranscriptTier::SomeWords:   return QStringLiteral("some words");
    }
    return QStringLiteral("none");
}

} // namespace mc
