#include "core/query/lane_router.h"

#include "core/query/canonicalizer.h"
#include "core/query/entity_extractor.h"
#include "core/query/guard_stack.h"
#include "core/query/lane_classifier.h"
#include "core/query/query_normalizer.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <exception>

namespace hq {

namespace {

ClassificationResult resultFor(const LaneDecision& decision)
{
    ClassificationResult result;
    result.lane = decision.lane;
    result.laneReason = decision.reason;
    result.family = decision.family;
    result.intentConfidence = decision.confidence;
    return result;
}

ClassificationResult internalErrorResult()
{
    LaneDecision decision;
    decision.lane = Lane::Blocked;
    decision.reason = QStringLiteral("internal_error");
    decision.family = RuleFamily::Guard;
    decision.confidence = 1.0f;
    return resultFor(decision);
}

} // namespace

LaneRouter::LaneRouter() = default;

LaneRouter::LaneRouter(const RouterSettings& settings)
    : m_settings(settings)
{
}

ClassificationResult LaneRouter::classify(const QString& query) const
{
    QElapsedTimer timer;
    timer.start();

    ClassificationResult result;
    try {
        result = classifyUnchecked(query);
    } catch (const std::exception& ex) {
        LOG_ERROR(hqRouter, "Classification failed: %s", ex.what());
        result = internalErrorResult();
    } catch (...) {
        LOG_ERROR(hqRouter, "Classification failed with unknown exception");
        result = internalErrorResult();
    }

    result.latencyMs = static_cast<double>(timer.nsecsElapsed()) / 1e6;
    return result;
}

ClassificationResult LaneRouter::classifyUnchecked(const QString& query) const
{
    if (const auto invalid = GuardStack::validate(query, m_settings)) {
        return resultFor(*invalid);
    }

    const NormalizedQuery normalized = QueryNormalizer::normalize(query);
    if (const auto blocked = GuardStack::evaluate(normalized, m_settings)) {
        return resultFor(*blocked);
    }

    ClassificationResult result = resultFor(LaneClassifier::classify(normalized.stripped));

    result.entities = EntityExtractor::extract(query);
    result.canonicalEntities =
        Canonicalizer::mergeDuplicates(Canonicalizer::canonicalize(result.entities));
    result.entityConfidence = meanConfidence(result.canonicalEntities);

    LOG_DEBUG(hqRouter, "Routed to %s (%s), %d entities",
              qUtf8Printable(laneToString(result.lane)), qUtf8Printable(result.laneReason),
              static_cast<int>(result.entities.size()));
    return result;
}

} // namespace hq
