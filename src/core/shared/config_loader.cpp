#include "core/shared/config_loader.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace mc {

namespace {

QJsonArray thresholdsToJson(const std::vector<double>& thresholds)
{
    QJsonArray array;
    for (double t : thresholds) {
        array.append(t);
    }
    return array;
}

void readThresholds(const QJsonObject& group, const QString& key,
                    std::vector<double>& target)
{
    if (!group.contains(key)) {
        return;
    }
    const QJsonArray array = group.value(key).toArray();
    target.clear();
    target.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue& value : array) {
        target.push_back(value.toDouble());
    }
}

void readDouble(const QJsonObject& group, const char* key, double& target)
{
    target = group.value(QLatin1String(key)).toDouble(target);
}

void readInt(const QJsonObject& group, const char* key, int& target)
{
    target = group.value(QLatin1String(key)).toInt(target);
}

void readBool(const QJsonObject& group, const char* key, bool& target)
{
    target = group.value(QLatin1String(key)).toBool(target);
}

bool isStrictlyDecreasing(const std::vector<double>& values)
{
    for (size_t i = 1; i < values.size(); ++i) {
        if (values[i] >= values[i - 1]) {
            return false;
        }
    }
    return true;
}

} // namespace

std::optional<EngineConfig> ConfigLoader::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(mcCore, "Failed to open config file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(mcCore,
                 "Failed to parse config JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    EngineConfig config = fromJson(doc.object());
    QString validationError;
    if (!validate(config, &validationError)) {
        LOG_WARN(mcCore, "Rejected config %s: %s",
                 qUtf8Printable(filePath), qUtf8Printable(validationError));
        return std::nullopt;
    }
    return config;
}

bool ConfigLoader::save(const EngineConfig& config, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(mcCore, "Failed to create config directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(config));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(mcCore, "Failed to open config file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(mcCore, "Failed to write config file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QJsonObject ConfigLoader::toJson(const EngineConfig& config)
{
    QJsonObject similarity;
    similarity.insert(QStringLiteral("defaultMinSimilarity"), config.similarity.defaultMinSimilarity);
    similarity.insert(QStringLiteral("strictMinSimilarity"), config.similarity.strictMinSimilarity);
    similarity.insert(QStringLiteral("moderateMinSimilarity"), config.similarity.moderateMinSimilarity);
    similarity.insert(QStringLiteral("permissiveMinSimilarity"), config.similarity.permissiveMinSimilarity);
    similarity.insert(QStringLiteral("veryPermissiveMinSimilarity"),
                      config.similarity.veryPermissiveMinSimilarity);
    similarity.insert(QStringLiteral("progressiveThresholds"),
                      thresholdsToJson(config.similarity.progressiveThresholds));
    similarity.insert(QStringLiteral("strongMatchThreshold"), config.similarity.strongMatchThreshold);
    similarity.insert(QStringLiteral("lowConfidenceAverage"), config.similarity.lowConfidenceAverage);

    QJsonObject distance;
    distance.insert(QStringLiteral("cosineMaxDistance"), config.distance.cosineMaxDistance);
    distance.insert(QStringLiteral("l2MaxDistance"), config.distance.l2MaxDistance);
    distance.insert(QStringLiteral("innerProductMaxDistance"), config.distance.innerProductMaxDistance);
    distance.insert(QStringLiteral("semanticAdaptiveMaxDistance"),
                    config.distance.semanticAdaptiveMaxDistance);

    QJsonObject limits;
    limits.insert(QStringLiteral("defaultSearchLimit"), config.limits.defaultSearchLimit);
    limits.insert(QStringLiteral("minLimit"), config.limits.minLimit);
    limits.insert(QStringLiteral("maxLimit"), config.limits.maxLimit);
    limits.insert(QStringLiteral("candidateMultiplier"), config.limits.candidateMultiplier);
    limits.insert(QStringLiteral("semanticCandidateMultiplier"),
                  config.limits.semanticCandidateMultiplier);

    QJsonObject semantic;
    semantic.insert(QStringLiteral("defaultMinSimilarity"), config.semantic.defaultMinSimilarity);
    semantic.insert(QStringLiteral("includeRelated"), config.semantic.includeRelated);
    semantic.insert(QStringLiteral("contextBoost"), config.semantic.contextBoost);
    semantic.insert(QStringLiteral("titleMatchBoost"), config.semantic.titleMatchBoost);
    semantic.insert(QStringLiteral("partialWordMatchBoost"), config.semantic.partialWordMatchBoost);
    semantic.insert(QStringLiteral("descriptionMatchBoost"), config.semantic.descriptionMatchBoost);
    semantic.insert(QStringLiteral("maxRelatedConcepts"), config.semantic.maxRelatedConcepts);

    QJsonObject recommendations;
    recommendations.insert(QStringLiteral("defaultMinSimilarity"),
                           config.recommendations.defaultMinSimilarity);
    recommendations.insert(QStringLiteral("defaultLimit"), config.recommendations.defaultLimit);
    recommendations.insert(QStringLiteral("itemWeight"), config.recommendations.itemWeight);
    recommendations.insert(QStringLiteral("contentWeight"), config.recommendations.contentWeight);
    recommendations.insert(QStringLiteral("progressiveThresholds"),
                           thresholdsToJson(config.recommendations.progressiveThresholds));

    QJsonObject boost;
    boost.insert(QStringLiteral("typeMatchBoost"), config.boost.typeMatchBoost);
    boost.insert(QStringLiteral("platformMatchBoost"), config.boost.platformMatchBoost);
    boost.insert(QStringLiteral("titleMatchBoost"), config.boost.titleMatchBoost);
    boost.insert(QStringLiteral("descriptionMatchBoost"), config.boost.descriptionMatchBoost);
    boost.insert(QStringLiteral("formatMatchBoost"), config.boost.formatMatchBoost);
    boost.insert(QStringLiteral("keywordBoost"), config.boost.keywordBoost);
    boost.insert(QStringLiteral("intentMatchBoost"), config.boost.intentMatchBoost);
    boost.insert(QStringLiteral("transcriptionMatchBoost"), config.boost.transcriptionMatchBoost);
    boost.insert(QStringLiteral("phraseMatchBoost"), config.boost.phraseMatchBoost);
    boost.insert(QStringLiteral("recencyBoost"), config.boost.recencyBoost);
    boost.insert(QStringLiteral("recencyWindowDays"), config.boost.recencyWindowDays);
    boost.insert(QStringLiteral("maxTotalBoost"), config.boost.maxTotalBoost);
    boost.insert(QStringLiteral("minSimilarityForBoost"), config.boost.minSimilarityForBoost);
    boost.insert(QStringLiteral("mode"), config.boost.mode == BoostMode::Additive
                                             ? QStringLiteral("additive")
                                             : QStringLiteral("multiplicative"));
    boost.insert(QStringLiteral("mediaTypesOnly"), config.boost.mediaTypesOnly);

    QJsonObject fuzzy;
    fuzzy.insert(QStringLiteral("defaultMinScore"), config.fuzzy.defaultMinScore);
    fuzzy.insert(QStringLiteral("defaultLimit"), config.fuzzy.defaultLimit);
    fuzzy.insert(QStringLiteral("previewLength"), config.fuzzy.previewLength);
    QJsonArray fields;
    for (FuzzyField field : config.fuzzy.defaultFields) {
        fields.append(fuzzyFieldToString(field));
    }
    fuzzy.insert(QStringLiteral("defaultFields"), fields);

    QJsonObject embedding;
    embedding.insert(QStringLiteral("dimensions"), config.embedding.dimensions);
    embedding.insert(QStringLiteral("backfillDelayMs"), config.embedding.backfillDelayMs);
    embedding.insert(QStringLiteral("circuitOpenThreshold"), config.embedding.circuitOpenThreshold);
    embedding.insert(QStringLiteral("circuitHalfOpenDelayMs"), config.embedding.circuitHalfOpenDelayMs);

    QJsonObject json;
    json.insert(QStringLiteral("similarity"), similarity);
    json.insert(QStringLiteral("distance"), distance);
    json.insert(QStringLiteral("limits"), limits);
    json.insert(QStringLiteral("semantic"), semantic);
    json.insert(QStringLiteral("recommendations"), recommendations);
    json.insert(QStringLiteral("boost"), boost);
    json.insert(QStringLiteral("fuzzy"), fuzzy);
    json.insert(QStringLiteral("embedding"), embedding);
    return json;
}

EngineConfig ConfigLoader::fromJson(const QJsonObject& json)
{
    EngineConfig config;

    const QJsonObject similarity = json.value(QStringLiteral("similarity")).toObject();
    readDouble(similarity, "defaultMinSimilarity", config.similarity.defaultMinSimilarity);
    readDouble(similarity, "strictMinSimilarity", config.similarity.strictMinSimilarity);
    readDouble(similarity, "moderateMinSimilarity", config.similarity.moderateMinSimilarity);
    readDouble(similarity, "permissiveMinSimilarity", config.similarity.permissiveMinSimilarity);
    readDouble(similarity, "veryPermissiveMinSimilarity",
               config.similarity.veryPermissiveMinSimilarity);
    readThresholds(similarity, QStringLiteral("progressiveThresholds"),
                   config.similarity.progressiveThresholds);
    readDouble(similarity, "strongMatchThreshold", config.similarity.strongMatchThreshold);
    readDouble(similarity, "lowConfidenceAverage", config.similarity.lowConfidenceAverage);

    const QJsonObject distance = json.value(QStringLiteral("distance")).toObject();
    readDouble(distance, "cosineMaxDistance", config.distance.cosineMaxDistance);
    readDouble(distance, "l2MaxDistance", config.distance.l2MaxDistance);
    readDouble(distance, "innerProductMaxDistance", config.distance.innerProductMaxDistance);
    readDouble(distance, "semanticAdaptiveMaxDistance", config.distance.semanticAdaptiveMaxDistance);

    const QJsonObject limits = json.value(QStringLiteral("limits")).toObject();
    readInt(limits, "defaultSearchLimit", config.limits.defaultSearchLimit);
    readInt(limits, "minLimit", config.limits.minLimit);
    readInt(limits, "maxLimit", config.limits.maxLimit);
    readInt(limits, "candidateMultiplier", config.limits.candidateMultiplier);
    readInt(limits, "semanticCandidateMultiplier", config.limits.semanticCandidateMultiplier);

    const QJsonObject semantic = json.value(QStringLiteral("semantic")).toObject();
    readDouble(semantic, "defaultMinSimilarity", config.semantic.defaultMinSimilarity);
    readBool(semantic, "includeRelated", config.semantic.includeRelated);
    readBool(semantic, "contextBoost", config.semantic.contextBoost);
    readDouble(semantic, "titleMatchBoost", config.semantic.titleMatchBoost);
    readDouble(semantic, "partialWordMatchBoost", config.semantic.partialWordMatchBoost);
    readDouble(semantic, "descriptionMatchBoost", config.semantic.descriptionMatchBoost);
    readInt(semantic, "maxRelatedConcepts", config.semantic.maxRelatedConcepts);

    const QJsonObject recommendations = json.value(QStringLiteral("recommendations")).toObject();
    readDouble(recommendations, "defaultMinSimilarity", config.recommendations.defaultMinSimilarity);
    readInt(recommendations, "defaultLimit", config.recommendations.defaultLimit);
    readDouble(recommendations, "itemWeight", config.recommendations.itemWeight);
    readDouble(recommendations, "contentWeight", config.recommendations.contentWeight);
    readThresholds(recommendations, QStringLiteral("progressiveThresholds"),
                   config.recommendations.progressiveThresholds);

    const QJsonObject boost = json.value(QStringLiteral("boost")).toObject();
    readDouble(boost, "typeMatchBoost", config.boost.typeMatchBoost);
    readDouble(boost, "platformMatchBoost", config.boost.platformMatchBoost);
    readDouble(boost, "titleMatchBoost", config.boost.titleMatchBoost);
    readDouble(boost, "descriptionMatchBoost", config.boost.descriptionMatchBoost);
    readDouble(boost, "formatMatchBoost", config.boost.formatMatchBoost);
    readDouble(boost, "keywordBoost", config.boost.keywordBoost);
    readDouble(boost, "intentMatchBoost", config.boost.intentMatchBoost);
    readDouble(boost, "transcriptionMatchBoost", config.boost.transcriptionMatchBoost);
    readDouble(boost, "phraseMatchBoost", config.boost.phraseMatchBoost);
    readDouble(boost, "recencyBoost", config.boost.recencyBoost);
    readInt(boost, "recencyWindowDays", config.boost.recencyWindowDays);
    readDouble(boost, "maxTotalBoost", config.boost.maxTotalBoost);
    readDouble(boost, "minSimilarityForBoost", config.boost.minSimilarityForBoost);
    if (boost.contains(QStringLiteral("mode"))) {
        config.boost.mode = boost.value(QStringLiteral("mode")).toString() == QLatin1String("additive")
            ? BoostMode::Additive
            : BoostMode::Multiplicative;
    }
    readBool(boost, "mediaTypesOnly", config.boost.mediaTypesOnly);

    const QJsonObject fuzzy = json.value(QStringLiteral("fuzzy")).toObject();
    readDouble(fuzzy, "defaultMinScore", config.fuzzy.defaultMinScore);
    readInt(fuzzy, "defaultLimit", config.fuzzy.defaultLimit);
    readInt(fuzzy, "previewLength", config.fuzzy.previewLength);
    if (fuzzy.contains(QStringLiteral("defaultFields"))) {
        config.fuzzy.defaultFields.clear();
        for (const QJsonValue& value : fuzzy.value(QStringLiteral("defaultFields")).toArray()) {
            const QString name = value.toString();
            if (name == QLatin1String("title")) {
                config.fuzzy.defaultFields.push_back(FuzzyField::Title);
            } else if (name == QLatin1String("description")) {
                config.fuzzy.defaultFields.push_back(FuzzyField::Description);
            } else if (name == QLatin1String("content")) {
                config.fuzzy.defaultFields.push_back(FuzzyField::Content);
            } else {
                LOG_WARN(mcCore, "Ignoring unknown fuzzy field '%s'", qUtf8Printable(name));
            }
        }
    }

    const QJsonObject embedding = json.value(QStringLiteral("embedding")).toObject();
    readInt(embedding, "dimensions", config.embedding.dimensions);
    readInt(embedding, "backfillDelayMs", config.embedding.backfillDelayMs);
    readInt(embedding, "circuitOpenThreshold", config.embedding.circuitOpenThreshold);
    readInt(embedding, "circuitHalfOpenDelayMs", config.embedding.circuitHalfOpenDelayMs);

    return config;
}

bool ConfigLoader::validate(const EngineConfig& config, QString* errorOut)
{
    auto fail = [errorOut](const QString& message) {
        if (errorOut) {
            *errorOut = message;
        }
        return false;
    };

    if (!isStrictlyDecreasing(config.similarity.progressiveThresholds)) {
        return fail(QStringLiteral("similarity.progressiveThresholds must be strictly decreasing"));
    }
    if (!isStrictlyDecreasing(config.recommendations.progressiveThresholds)) {
        return fail(QStringLiteral("recommendations.progressiveThresholds must be strictly decreasing"));
    }
    if (config.limits.candidateMultiplier <= 0 || config.limits.semanticCandidateMultiplier <= 0) {
        return fail(QStringLiteral("candidate multipliers must be positive"));
    }
    if (config.limits.minLimit <= 0 || config.limits.maxLimit < config.limits.minLimit) {
        return fail(QStringLiteral("limits.minLimit/maxLimit are inconsistent"));
    }
    const double multipliers[] = {
        config.boost.typeMatchBoost, config.boost.platformMatchBoost,
        config.boost.titleMatchBoost, config.boost.descriptionMatchBoost,
        config.boost.formatMatchBoost, config.boost.keywordBoost,
        config.boost.intentMatchBoost, config.boost.transcriptionMatchBoost,
        config.boost.phraseMatchBoost, config.boost.recencyBoost,
    };
    for (double multiplier : multipliers) {
        if (multiplier < 1.0) {
            return fail(QStringLiteral("boost multipliers must be at least 1.0"));
        }
    }
    if (config.boost.maxTotalBoost < 1.0) {
        return fail(QStringLiteral("boost.maxTotalBoost must be at least 1.0"));
    }
    if (config.boost.recencyWindowDays < 0) {
        return fail(QStringLiteral("boost.recencyWindowDays must not be negative"));
    }
    if (config.recommendations.itemWeight < 0.0 || config.recommendations.contentWeight < 0.0) {
        return fail(QStringLiteral("recommendation weights must not be negative"));
    }
    if (config.embedding.dimensions <= 0) {
        return fail(QStringLiteral("embedding.dimensions must be positive"));
    }
    return true;
}

} // namespace mc
