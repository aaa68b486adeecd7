#include "core/ranking/context_booster.h"

#include <QStringList>

#include <algorithm>

namespace mc {

ContextBooster::ContextBooster(const SemanticSettings& settings)
    : m_settings(settings)
{
}

double ContextBooster::apply(const MediaRecord& record, const QString& query, double score) const
{
    const QString queryLower = query.toLower().trimmed();
    if (queryLower.isEmpty()) {
        return std::min(1.0, score);
    }

    if (!record.title.isEmpty()) {
        const QString titleLower = record.title.toLower();
        if (titleLower.contains(queryLower)) {
            score += m_settings.titleMatchBoost;
        }

        const QStringList queryWords = queryLower.split(QLatin1Char(' '), Qt::SkipEmptyParts);
        const QStringList titleWords = titleLower.split(QLatin1Char(' '), Qt::SkipEmptyParts);
        int matching = 0;
        for (const QString& qw : queryWords) {
            const bool hit = std::any_of(titleWords.begin(), titleWords.end(),
                                         [&qw](const QString& tw) {
                                             return tw.contains(qw) || qw.contains(tw);
                                         });
            if (hit) {
                ++matching;
            }
        }
        if (matching > 0) {
            score += (static_cast<double>(matching) / static_cast<double>(queryWords.size()))
                * m_settings.partialWordMatchBoost;
        }
    }

    if (!record.description.isEmpty()
        && record.description.toLower().contains(queryLower)) {
        score += m_settings.descriptionMatchBoost;
    }

    return std::min(1.0, score);
}

} // namespace mc
