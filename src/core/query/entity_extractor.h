#pragma once

#include "core/query/query_types.h"

#include <QString>

#include <vector>

namespace hq {

// Dictionary phrases, structured identifiers and measurements found in the
// original query. Independent of lane classification: the result depends
// only on the query text.
class EntityExtractor {
public:
    static std::vector<ExtractedEntity> extract(const QString& originalQuery);

    // Keeps the winner of every overlapping group: higher confidence, then
    // the more specific type, then the longer span, then the earlier one.
    // Result is ordered by span start.
    static std::vector<ExtractedEntity> resolveOverlaps(std::vector<ExtractedEntity> candidates);
};

} // namespace hq
