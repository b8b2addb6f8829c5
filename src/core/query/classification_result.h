#pragma once

#include "core/query/query_types.h"

#include <QJsonObject>
#include <QString>

#include <vector>

namespace hq {

struct ClassificationResult {
    Lane lane = Lane::Unknown;
    QString laneReason;
    RuleFamily family = RuleFamily::Fallback;
    std::vector<ExtractedEntity> entities;
    std::vector<CanonicalEntity> canonicalEntities;
    float intentConfidence = 0.0f;
    float entityConfidence = 0.0f;
    double latencyMs = 0.0;

    QJsonObject toJson() const;
};

// Mean confidence of the canonical entities; 0 when there are none.
float meanConfidence(const std::vector<CanonicalEntity>& entities);

QJsonObject entityToJson(const ExtractedEntity& entity);
QJsonObject canonicalEntityToJson(const CanonicalEntity& entity);

} // namespace hq
