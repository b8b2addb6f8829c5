#include "core/query/entity_extractor.h"

#include "core/query/identifier_scanner.h"
#include "core/query/pattern_tables.h"
#include "core/query/phrase_matcher.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <utility>

namespace hq {

namespace {

struct IdentifierMapping {
    EntityType type;
    float confidence;
};

IdentifierMapping mappingFor(IdentifierKind kind)
{
    switch (kind) {
    case IdentifierKind::FaultCode:         return {EntityType::FaultCode, 0.95f};
    case IdentifierKind::WorkOrder:         return {EntityType::WorkOrder, 0.95f};
    case IdentifierKind::EquipmentCode:     return {EntityType::Equipment, 0.95f};
    case IdentifierKind::NumberedEquipment: return {EntityType::Equipment, 0.92f};
    case IdentifierKind::PartNumber:        return {EntityType::Part, 0.95f};
    case IdentifierKind::ModelNumber:       return {EntityType::Equipment, 0.92f};
    case IdentifierKind::Measurement:       return {EntityType::Measurement, 0.90f};
    }
    return {EntityType::MaritimeTerm, 0.0f};
}

bool outranks(const ExtractedEntity& a, const ExtractedEntity& b)
{
    if (a.confidence != b.confidence) {
        return a.confidence > b.confidence;
    }
    const int specificityA = entityTypeSpecificity(a.type);
    const int specificityB = entityTypeSpecificity(b.type);
    if (specificityA != specificityB) {
        return specificityA > specificityB;
    }
    if (a.span.length() != b.span.length()) {
        return a.span.length() > b.span.length();
    }
    return a.span.start < b.span.start;
}

} // namespace

std::vector<ExtractedEntity> EntityExtractor::extract(const QString& originalQuery)
{
    std::vector<ExtractedEntity> candidates;
    if (originalQuery.trimmed().isEmpty()) {
        return candidates;
    }

    // Dictionary phrases are matched on folded text and mapped back.
    const PatternTables& tables = PatternTables::instance();
    const FoldedText folded = PhraseMatcher::fold(originalQuery);
    for (const PhraseMatch& match : tables.entityVocabulary().findAll(folded.text)) {
        const VocabularyEntry& entry = tables.vocabularyEntry(match.id);
        ExtractedEntity entity;
        entity.type = entry.type;
        entity.confidence = entry.confidence;
        entity.span.start = folded.origin[static_cast<size_t>(match.start)];
        entity.span.end = folded.origin[static_cast<size_t>(match.end - 1)] + 1;
        entity.value = originalQuery.mid(entity.span.start, entity.span.length());
        candidates.push_back(entity);
    }

    for (const IdentifierMatch& identifier : IdentifierScanner::scan(originalQuery)) {
        const IdentifierMapping mapping = mappingFor(identifier.kind);
        ExtractedEntity entity;
        entity.type = mapping.type;
        entity.confidence = mapping.confidence;
        entity.span = Span{identifier.start, identifier.end};
        entity.value = identifier.text;
        candidates.push_back(entity);
    }

    std::vector<ExtractedEntity> entities = resolveOverlaps(std::move(candidates));
    LOG_DEBUG(hqExtraction, "Extracted %d entities", static_cast<int>(entities.size()));
    return entities;
}

std::vector<ExtractedEntity> EntityExtractor::resolveOverlaps(std::vector<ExtractedEntity> candidates)
{
    std::sort(candidates.begin(), candidates.end(), outranks);

    std::vector<ExtractedEntity> kept;
    kept.reserve(candidates.size());
    for (ExtractedEntity& candidate : candidates) {
        const bool overlaps = std::any_of(kept.begin(), kept.end(),
                                          [&candidate](const ExtractedEntity& existing) {
                                              return existing.span.overlaps(candidate.span);
                                          });
        if (!overlaps) {
            kept.push_back(std::move(candidate));
        }
    }

    std::sort(kept.begin(), kept.end(), [](const ExtractedEntity& a, const ExtractedEntity& b) {
        return a.span.start < b.span.start;
    });
    return kept;
}

} // namespace hq
