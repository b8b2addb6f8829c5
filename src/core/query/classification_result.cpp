#include "core/query/classification_result.h"

#include <QJsonArray>

#include <cmath>

namespace hq {

namespace {

double rounded(double value, int decimals = 3)
{
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

} // namespace

float meanConfidence(const std::vector<CanonicalEntity>& entities)
{
    if (entities.empty()) {
        return 0.0f;
    }
    double total = 0.0;
    for (const CanonicalEntity& entity : entities) {
        total += entity.confidence;
    }
    return static_cast<float>(total / static_cast<double>(entities.size()));
}

QJsonObject entityToJson(const ExtractedEntity& entity)
{
    QJsonObject span;
    span[QStringLiteral("start")] = entity.span.start;
    span[QStringLiteral("end")] = entity.span.end;

    QJsonObject json;
    json[QStringLiteral("type")] = entityTypeToString(entity.type);
    json[QStringLiteral("value")] = entity.value;
    json[QStringLiteral("confidence")] = rounded(entity.confidence);
    json[QStringLiteral("span")] = span;
    return json;
}

QJsonObject canonicalEntityToJson(const CanonicalEntity& entity)
{
    QJsonObject json;
    json[QStringLiteral("type")] = entityTypeToString(entity.type);
    json[QStringLiteral("value")] = entity.value;
    json[QStringLiteral("canonical")] = entity.canonical;
    json[QStringLiteral("confidence")] = rounded(entity.confidence);
    json[QStringLiteral("weight")] = rounded(entity.weight);
    json[QStringLiteral("occurrences")] = entity.occurrences;
    return json;
}

QJsonObject ClassificationResult::toJson() const
{
    QJsonArray entityArray;
    for (const ExtractedEntity& entity : entities) {
        entityArray.append(entityToJson(entity));
    }

    QJsonArray canonicalArray;
    for (const CanonicalEntity& entity : canonicalEntities) {
        canonicalArray.append(canonicalEntityToJson(entity));
    }

    QJsonObject scores;
    scores[QStringLiteral("intent_confidence")] = rounded(intentConfidence);
    scores[QStringLiteral("entity_confidence")] = rounded(entityConfidence);

    QJsonObject metadata;
    metadata[QStringLiteral("latency_ms")] = rounded(latencyMs);
    metadata[QStringLiteral("entity_count")] = static_cast<int>(entities.size());

    QJsonObject json;
    json[QStringLiteral("lane")] = laneToString(lane);
    json[QStringLiteral("lane_reason")] = laneReason;
    json[QStringLiteral("entities")] = entityArray;
    json[QStringLiteral("canonical_entities")] = canonicalArray;
    json[QStringLiteral("scores")] = scores;
    json[QStringLiteral("metadata")] = metadata;
    return json;
}

} // namespace hq
