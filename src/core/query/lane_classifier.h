#pragma once

#include "core/query/identifier_scanner.h"
#include "core/query/query_types.h"

#include <QString>

#include <optional>
#include <vector>

namespace hq {

// Everything the cascade looks at, computed once per query.
struct QuerySignals {
    QString text;
    int tokenCount = 0;
    std::vector<IdentifierMatch> identifiers;

    bool hasLookupIdentifier = false;  // any identifier other than a measurement
    bool hasNumberedEquipment = false;
    bool hasNumber = false;
    bool hasDomainNoun = false;
    bool hasMutationVerb = false;
    bool hasProblemWord = false;
    bool hasTemporalContext = false;
    bool hasDiagnosisIntent = false;

    // Domain noun or identifier after the leading command / lookup phrase.
    bool commandWithObject = false;
    bool lookupWithObject = false;

    bool hasDiagnosticSignal() const
    {
        return hasProblemWord || hasTemporalContext || hasDiagnosisIntent;
    }
};

struct PatternRule {
    RuleFamily family;
    Lane lane;
    const char* reason;
    float confidence;
    bool (*matches)(const QuerySignals&);
};

// Ordered cascade of pattern families. The first matching rule decides the
// lane; when nothing matches the query stays UNKNOWN. The classifier never
// sees extracted entities.
class LaneClassifier {
public:
    // strippedText is QueryNormalizer output with politeness removed.
    static LaneDecision classify(const QString& strippedText);

    // First matching rule of a single family, ignoring earlier families.
    static std::optional<LaneDecision> evaluateFamily(RuleFamily family,
                                                      const QString& strippedText);

    static QuerySignals analyze(const QString& strippedText);
    static const std::vector<PatternRule>& cascade();
};

} // namespace hq
