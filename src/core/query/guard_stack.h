#pragma once

#include "core/query/query_normalizer.h"
#include "core/query/query_types.h"
#include "core/shared/settings.h"

#include <QString>

#include <optional>
#include <vector>

namespace hq {

using GuardCheck = std::optional<LaneDecision> (*)(const NormalizedQuery&, const RouterSettings&);

struct GuardRule {
    const char* name;
    GuardCheck check;
};

// Ordered rejection checks run before any classification. A guard either
// passes the query on (nullopt) or ends classification with its decision.
class GuardStack {
public:
    // Malformed input: empty, oversized, too little text, bare short numbers.
    static std::optional<LaneDecision> validate(const QString& raw, const RouterSettings& settings);

    // Runs every guard in order. Internal faults fail closed to BLOCKED.
    static std::optional<LaneDecision> evaluate(const NormalizedQuery& query,
                                                const RouterSettings& settings);

    static const std::vector<GuardRule>& rules();

    static std::optional<LaneDecision> pasteDumpGuard(const NormalizedQuery& query,
                                                      const RouterSettings& settings);
    static std::optional<LaneDecision> nonDomainGuard(const NormalizedQuery& query,
                                                      const RouterSettings& settings);
    static std::optional<LaneDecision> injectionGuard(const NormalizedQuery& query,
                                                      const RouterSettings& settings);
    static std::optional<LaneDecision> clauseGuard(const NormalizedQuery& query,
                                                   const RouterSettings& settings);

    static bool containsNonDomain(const QString& normalized);
    static bool containsInjection(const QString& folded);
};

} // namespace hq
