#include "core/embedding/text_preparer.h"

namespace mc {

QStringList TextPreparer::mediaKeywords(const MediaRecord& record)
{
    QStringList keywords;
    if (record.type != MediaType::Audio && record.type != MediaType::Video) {
        return keywords;
    }

    keywords.append(mediaTypeToString(record.type));

    // "audio/mpeg" -> "mpeg"
    const int slash = static_cast<int>(record.mimeType.indexOf(QLatin1Char('/')));
    if (slash >= 0 && slash + 1 < record.mimeType.size()) {
        keywords.append(record.mimeType.mid(slash + 1).toLower());
    }

    if (record.type == MediaType::Audio) {
        keywords << QStringLiteral("audio") << QStringLiteral("sound")
                 << QStringLiteral("recording");
    } else {
        keywords << QStringLiteral("video") << QStringLiteral("movie") << QStringLiteral("clip");
        if (!record.sourceUrl.isEmpty()) {
            keywords << QStringLiteral("online") << QStringLiteral("streaming");
        }
    }
    return keywords;
}

QString TextPreparer::prepare(const MediaRecord& record)
{
    QStringList parts;
    if (!record.title.trimmed().isEmpty()) {
        parts.append(record.title.trimmed());
    }
    if (!record.description.trimmed().isEmpty()) {
        parts.append(record.description.trimmed());
    }
    parts.append(mediaKeywords(record));
    if (!record.content.trimmed().isEmpty()) {
        parts.append(record.content.trimmed());
    }
    return parts.join(QLatin1Char(' '));
}

} // namespace mc
