#pragma once

#include "core/query/classification_result.h"
#include "core/shared/settings.h"

#include <QString>

namespace hq {

// Entry point: validation, guards, lane cascade, entity extraction and
// canonicalization. classify() is const and never throws; any internal
// fault yields BLOCKED with reason "internal_error".
class LaneRouter {
public:
    LaneRouter();
    explicit LaneRouter(const RouterSettings& settings);

    ClassificationResult classify(const QString& query) const;

    const RouterSettings& settings() const { return m_settings; }

private:
    ClassificationResult classifyUnchecked(const QString& query) const;

    RouterSettings m_settings;
};

} // namespace hq
