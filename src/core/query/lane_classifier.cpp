#include "core/query/lane_classifier.h"

#include "core/query/pattern_tables.h"
#include "core/shared/logging.h"

#include <QStringList>

namespace hq {

namespace {

constexpr int kMaxFragmentTokens = 8;
constexpr int kMaxHoursFragmentTokens = 3;

bool isNumberToken(const QString& token)
{
    bool sawDigit = false;
    int separators = 0;
    for (QChar ch : token) {
        if (ch.unicode() >= '0' && ch.unicode() <= '9') {
            sawDigit = true;
        } else if (ch == QLatin1Char('.') || ch == QLatin1Char(',')) {
            ++separators;
        } else {
            return false;
        }
    }
    return sawDigit && separators <= 1;
}

bool hasObjectAfter(const QuerySignals& query, const std::vector<PhraseMatch>& nouns, int from)
{
    for (const PhraseMatch& noun : nouns) {
        if (noun.start >= from) {
            return true;
        }
    }
    for (const IdentifierMatch& identifier : query.identifiers) {
        if (identifier.start >= from && identifier.kind != IdentifierKind::Measurement) {
            return true;
        }
    }
    return false;
}

LaneDecision decisionFor(const PatternRule& rule)
{
    LaneDecision decision;
    decision.lane = rule.lane;
    decision.reason = QString::fromLatin1(rule.reason);
    decision.family = rule.family;
    decision.confidence = rule.confidence;
    return decision;
}

// Elliptical

bool isBareEquipmentAbbreviation(const QuerySignals& query)
{
    if (query.tokenCount != 1) {
        return false;
    }
    if (PatternTables::instance().bareAbbreviations().matches(query.text)) {
        return true;
    }
    return query.identifiers.size() == 1
        && query.identifiers.front().kind == IdentifierKind::NumberedEquipment
        && query.identifiers.front().start == 0
        && query.identifiers.front().end == query.text.size();
}

bool isWorkOrderFragment(const QuerySignals& query)
{
    return query.tokenCount <= kMaxFragmentTokens
        && PatternTables::instance().workOrderFragments().matches(query.text);
}

bool isHoursFragment(const QuerySignals& query)
{
    if (query.tokenCount > kMaxHoursFragmentTokens || !query.hasNumber) {
        return false;
    }
    bool hasEquipmentCode = query.hasNumberedEquipment;
    for (const IdentifierMatch& identifier : query.identifiers) {
        if (identifier.kind == IdentifierKind::EquipmentCode) {
            hasEquipmentCode = true;
        }
    }
    return hasEquipmentCode && PatternTables::instance().hoursWords().matches(query.text);
}

// Implicit action

bool isCompletedWork(const QuerySignals& query)
{
    return query.hasDomainNoun && !query.hasDiagnosisIntent
        && PatternTables::instance().completedWork().matches(query.text);
}

bool isStockDepletion(const QuerySignals& query)
{
    return query.hasDomainNoun && !query.hasDiagnosisIntent
        && PatternTables::instance().stockDepletion().matches(query.text);
}

bool isStatedReading(const QuerySignals& query)
{
    return query.hasDomainNoun && query.hasNumber && !query.hasDiagnosticSignal()
        && !query.lookupWithObject
        && PatternTables::instance().readingPhrases().matches(query.text);
}

// Command

bool isCommand(const QuerySignals& query)
{
    return query.commandWithObject;
}

// Direct lookup

bool isIdentifierLookup(const QuerySignals& query)
{
    return query.hasLookupIdentifier && !query.hasMutationVerb
        && !query.hasDiagnosticSignal();
}

bool isListFilterLookup(const QuerySignals& query)
{
    return !query.hasMutationVerb && !query.hasDiagnosticSignal()
        && PatternTables::instance().listFilters().matches(query.text);
}

bool isPhraseLookup(const QuerySignals& query)
{
    return query.lookupWithObject && !query.hasMutationVerb
        && !query.hasDiagnosticSignal();
}

// GPT triggers; each needs something from the domain to reason about.

bool hasDiagnosisIntent(const QuerySignals& query)
{
    return query.hasDomainNoun && query.hasDiagnosisIntent;
}

bool hasProblemVocabulary(const QuerySignals& query)
{
    return query.hasDomainNoun && query.hasProblemWord;
}

bool hasTemporalContext(const QuerySignals& query)
{
    return query.hasDomainNoun && query.hasTemporalContext;
}

const PatternRule kFallback = {
    RuleFamily::Fallback, Lane::Unknown, "no_pattern_matched", 0.0f, nullptr,
};

} // namespace

const std::vector<PatternRule>& LaneClassifier::cascade()
{
    static const std::vector<PatternRule> kCascade = {
        {RuleFamily::Elliptical,     Lane::RulesOnly, "elliptical_equipment_abbrev",    0.80f, &isBareEquipmentAbbreviation},
        {RuleFamily::Elliptical,     Lane::RulesOnly, "elliptical_work_order",          0.80f, &isWorkOrderFragment},
        {RuleFamily::Elliptical,     Lane::RulesOnly, "elliptical_log_hours",           0.78f, &isHoursFragment},
        {RuleFamily::ImplicitAction, Lane::RulesOnly, "implicit_action_completed_work", 0.75f, &isCompletedWork},
        {RuleFamily::ImplicitAction, Lane::RulesOnly, "implicit_action_reorder",        0.72f, &isStockDepletion},
        {RuleFamily::ImplicitAction, Lane::RulesOnly, "implicit_action_reading",        0.72f, &isStatedReading},
        {RuleFamily::Command,        Lane::RulesOnly, "command_verb",                   0.90f, &isCommand},
        {RuleFamily::DirectLookup,   Lane::NoLlm,     "direct_lookup_identifier",       0.92f, &isIdentifierLookup},
        {RuleFamily::DirectLookup,   Lane::NoLlm,     "direct_lookup_list_filter",      0.88f, &isListFilterLookup},
        {RuleFamily::DirectLookup,   Lane::NoLlm,     "direct_lookup_phrase",           0.85f, &isPhraseLookup},
        {RuleFamily::GptTrigger,     Lane::Gpt,       "gpt_diagnosis_intent",           0.80f, &hasDiagnosisIntent},
        {RuleFamily::GptTrigger,     Lane::Gpt,       "gpt_problem_vocabulary",         0.75f, &hasProblemVocabulary},
        {RuleFamily::GptTrigger,     Lane::Gpt,       "gpt_temporal_context",           0.65f, &hasTemporalContext},
    };
    return kCascade;
}

QuerySignals LaneClassifier::analyze(const QString& strippedText)
{
    const PatternTables& tables = PatternTables::instance();

    QuerySignals query;
    query.text = strippedText;

    const QStringList tokens = strippedText.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    query.tokenCount = tokens.size();
    for (const QString& token : tokens) {
        if (isNumberToken(token)) {
            query.hasNumber = true;
            break;
        }
    }

    query.identifiers = IdentifierScanner::scan(strippedText);
    for (const IdentifierMatch& identifier : query.identifiers) {
        if (identifier.kind == IdentifierKind::Measurement) {
            query.hasNumber = true;
            continue;
        }
        query.hasLookupIdentifier = true;
        if (identifier.kind == IdentifierKind::NumberedEquipment) {
            query.hasNumberedEquipment = true;
        }
    }

    const std::vector<PhraseMatch> nouns = tables.domainNouns().findAll(strippedText);
    query.hasDomainNoun = !nouns.empty() || query.hasLookupIdentifier;
    query.hasMutationVerb = tables.mutationVerbs().matches(strippedText);
    query.hasProblemWord = tables.problemVocabulary().matches(strippedText);
    query.hasTemporalContext = tables.temporalContext().matches(strippedText);
    query.hasDiagnosisIntent = tables.diagnosisIntent().matches(strippedText);

    if (const auto lead = tables.commandVerbs().findFirst(strippedText)) {
        query.commandWithObject = hasObjectAfter(query, nouns, lead->end);
    }
    if (const auto lead = tables.lookupLeads().findFirst(strippedText)) {
        query.lookupWithObject = hasObjectAfter(query, nouns, lead->end);
    }

    return query;
}

LaneDecision LaneClassifier::classify(const QString& strippedText)
{
    const QuerySignals query = analyze(strippedText);
    for (const PatternRule& rule : cascade()) {
        if (rule.matches(query)) {
            return decisionFor(rule);
        }
    }
    LOG_DEBUG(hqRouter, "No pattern matched (%d tokens)", query.tokenCount);
    return decisionFor(kFallback);
}

std::optional<LaneDecision> LaneClassifier::evaluateFamily(RuleFamily family,
                                                           const QString& strippedText)
{
    const QuerySignals query = analyze(strippedText);
    for (const PatternRule& rule : cascade()) {
        if (rule.family == family && rule.matches(query)) {
            return decisionFor(rule);
        }
    }
    return std::nullopt;
}

} // namespace hq
