#pragma once

#include "core/query/query_types.h"

#include <QString>

#include <vector>

namespace hq {

class Canonicalizer {
public:
    // One canonical entry per extracted entity, in the same order.
    static std::vector<CanonicalEntity> canonicalize(const std::vector<ExtractedEntity>& extracted);

    // Recomputes canonical forms from existing canonical values; leaves an
    // already canonical list unchanged.
    static std::vector<CanonicalEntity> recanonicalize(const std::vector<CanonicalEntity>& entities);

    // Collapses equal (type, canonical) pairs in order of first appearance,
    // keeping the highest confidence and summing occurrences.
    static std::vector<CanonicalEntity> mergeDuplicates(const std::vector<CanonicalEntity>& entities);

    static QString canonicalForm(EntityType type, const QString& value);
    static float entityWeight(EntityType type);
};

} // namespace hq
