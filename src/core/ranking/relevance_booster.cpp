#include "core/ranking/relevance_booster.h"
#include "core/ranking/media_signals.h"
#include "core/query/intent_classifier.h"
#include "core/query/query_terms.h"
#include "core/shared/logging.h"

#include <QDateTime>

#include <algorithm>

namespace mc {

namespace {

constexpr double kPartialFieldStrength = 0.9;
constexpr double kSecondsPerDay = 86400.0;

} // namespace

RelevanceBooster::RelevanceBooster(const BoostSettings& settings, BoostTraceSink sink)
    : m_settings(settings)
    , m_sink(std::move(sink))
{
}

double RelevanceBooster::scaled(double boost, double strength)
{
    return 1.0 + (boost - 1.0) * strength;
}

BoostOutcome RelevanceBooster::boost(const MediaRecord& record, const QString& query,
                                     double baseSimilarity) const
{
    return boost(record, query, baseSimilarity,
                 static_cast<double>(QDateTime::currentSecsSinceEpoch()));
}

BoostOutcome RelevanceBooster::boost(const MediaRecord& record, const QString& query,
                                     double baseSimilarity, double nowEpoch) const
{
    BoostOutcome outcome;
    outcome.baseSimilarity = baseSimilarity;
    outcome.finalSimilarity = baseSimilarity;

    if (baseSimilarity < m_settings.minSimilarityForBoost) {
        return outcome;
    }

    outcome.trace = computeFactors(record, query, nowEpoch);
    if (outcome.trace.empty()) {
        return outcome;
    }

    outcome.finalSimilarity = combine(baseSimilarity, outcome.trace);

    if (m_sink) {
        m_sink(record, outcome);
    }
    LOG_DEBUG(mcRanking, "boost: item='%s' base=%.3f final=%.3f factors=%d",
              qUtf8Printable(record.title), baseSimilarity, outcome.finalSimilarity,
              static_cast<int>(outcome.trace.size()));
    return outcome;
}

std::vector<BoostFactor> RelevanceBooster::computeFactors(const MediaRecord& record,
                                                          const QString& query,
                                                          double nowEpoch) const
{
    std::vector<BoostFactor> factors;

    if (m_settings.mediaTypesOnly
        && record.type != MediaType::Audio && record.type != MediaType::Video) {
        return factors;
    }

    const QString queryLower = query.toLower().trimmed();
    const QStringList queryWords = QueryTerms::meaningfulWords(queryLower);

    if (!queryLower.isEmpty()) {
        if (const auto typeMatch = MediaSignals::typeMatch(record.type, queryLower)) {
            factors.push_back({QStringLiteral("type:") + *typeMatch, m_settings.typeMatchBoost});
        }

        if (const auto platform = MediaSignals::platformMatch(record.sourceUrl, queryLower)) {
            factors.push_back({QStringLiteral("platform:") + *platform,
                               m_settings.platformMatchBoost});
        }

        auto addFieldFactor = [&](const QString& field, const QString& text, double boostValue) {
            const auto tier = MediaSignals::fieldMatch(text, queryLower, queryWords);
            if (tier == MediaSignals::FieldTier::None) {
                return;
            }
            const bool full = tier == MediaSignals::FieldTier::ExactPhrase
                || tier == MediaSignals::FieldTier::AllWords;
            factors.push_back({field + QLatin1Char(':') + MediaSignals::fieldTierToString(tier),
                               full ? boostValue : scaled(boostValue, kPartialFieldStrength)});
        };
        addFieldFactor(QStringLiteral("title"), record.title, m_settings.titleMatchBoost);
        addFieldFactor(QStringLiteral("description"), record.description,
                       m_settings.descriptionMatchBoost);

        if (const auto format = MediaSignals::formatMatch(record.mimeType, record.sourceUrl,
                                                          queryLower)) {
            factors.push_back({QStringLiteral("format:") + *format, m_settings.formatMatchBoost});
        }

        if (const auto keywords = MediaSignals::keywordMatch(record.type, queryLower)) {
            factors.push_back({QStringLiteral("keyword:") + keywords->keywords.join(QStringLiteral(",")),
                               scaled(m_settings.keywordBoost, keywords->strength)});
        }

        if (const auto intent = IntentClassifier::classify(queryLower, record.type)) {
            factors.push_back({QStringLiteral("intent:") + *intent, m_settings.intentMatchBoost});
        }

        const auto transcript = MediaSignals::transcriptMatch(record.content, queryLower,
                                                              queryWords);
        if (transcript.tier != MediaSignals::TranscriptTier::None) {
            const double boostValue = transcript.phrase ? m_settings.phraseMatchBoost
                                                        : m_settings.transcriptionMatchBoost;
            factors.push_back({QStringLiteral("transcription:")
                                   + MediaSignals::transcriptTierToString(transcript.tier),
                               scaled(boostValue, transcript.strength)});
        }
    }

    const double recency = computeRecencyFactor(record.createdAt, nowEpoch);
    if (recency > 1.0) {
        factors.push_back({QStringLiteral("recency"), recency});
    }

    return factors;
}

double RelevanceBooster::computeRecencyFactor(double createdAtEpoch, double nowEpoch) const
{
    if (createdAtEpoch <= 0.0 || m_settings.recencyWindowDays <= 0
        || m_settings.recencyBoost <= 1.0) {
        return 1.0;
    }

    // Future timestamps count as brand new
    const double ageDays = std::max(0.0, (nowEpoch - createdAtEpoch) / kSecondsPerDay);
    const double window = static_cast<double>(m_settings.recencyWindowDays);
    if (ageDays >= window) {
        return 1.0;
    }
    return scaled(m_settings.recencyBoost, 1.0 - ageDays / window);
}

double RelevanceBooster::combine(double baseSimilarity,
                                 const std::vector<BoostFactor>& factors) const
{
    // Nothing to gain outside (0, 1); inner-product similarities may exceed 1
    if (baseSimilarity <= 0.0 || baseSimilarity >= 1.0) {
        return baseSimilarity;
    }

    double boosted = baseSimilarity;
    if (m_settings.mode == BoostMode::Additive) {
        double excess = 0.0;
        for (const auto& factor : factors) {
            excess += factor.multiplier - 1.0;
        }
        boosted = baseSimilarity + baseSimilarity * excess;
    } else {
        double product = 1.0;
        for (const auto& factor : factors) {
            product *= factor.multiplier;
        }
        boosted = baseSimilarity * product;
    }

    boosted = std::min(boosted, baseSimilarity * m_settings.maxTotalBoost);
    return std::min(boosted, 1.0);
}

} // namespace mc
