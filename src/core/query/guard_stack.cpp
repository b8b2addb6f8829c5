#include "core/query/guard_stack.h"

#include "core/query/pattern_tables.h"
#include "core/shared/logging.h"

#include <QSet>
#include <QStringList>

#include <exception>

namespace hq {

namespace {

constexpr int kMinAlphanumeric = 2;
constexpr int kMinBareNumberLength = 6;

LaneDecision guardDecision(Lane lane, const char* reason, RuleFamily family = RuleFamily::Guard)
{
    LaneDecision decision;
    decision.lane = lane;
    decision.reason = QString::fromLatin1(reason);
    decision.family = family;
    decision.confidence = lane == Lane::Blocked ? 1.0f : 0.0f;
    return decision;
}

bool isAsciiDigit(QChar ch)
{
    return ch.unicode() >= '0' && ch.unicode() <= '9';
}

bool digitsAt(const QString& text, int pos, int count)
{
    if (pos < 0 || pos + count > text.size()) {
        return false;
    }
    for (int i = pos; i < pos + count; ++i) {
        if (!isAsciiDigit(text.at(i))) {
            return false;
        }
    }
    return true;
}

// Log-line timestamps such as "2024-03-01 12:30" or "2024-03-01T12:30".
bool hasLogTimestamp(const QString& text)
{
    for (int i = 0; i + 16 <= text.size(); ++i) {
        if (!digitsAt(text, i, 4)) {
            continue;
        }
        const bool isDate = text.at(i + 4) == QLatin1Char('-') && digitsAt(text, i + 5, 2)
            && text.at(i + 7) == QLatin1Char('-') && digitsAt(text, i + 8, 2);
        if (!isDate) {
            continue;
        }
        const QChar separator = text.at(i + 10);
        if (separator != QLatin1Char(' ') && separator != QLatin1Char('t')) {
            continue;
        }
        if (digitsAt(text, i + 11, 2) && text.at(i + 13) == QLatin1Char(':')
            && digitsAt(text, i + 14, 2)) {
            return true;
        }
    }
    return false;
}

bool isArithmeticNumber(const QString& token)
{
    QString digits = token;
    if (digits.endsWith(QLatin1Char('%'))) {
        digits.chop(1);
    }
    bool sawDigit = false;
    for (QChar ch : digits) {
        if (isAsciiDigit(ch)) {
            sawDigit = true;
        } else if (ch != QLatin1Char('.') && ch != QLatin1Char(',')) {
            return false;
        }
    }
    return sawDigit;
}

// "whats 25% of 80", "calculate 12 times 7": nothing but numbers and
// arithmetic words after an optional question lead.
bool isArithmeticQuestion(const QString& normalized)
{
    static const QSet<QString> kLeads = {
        QStringLiteral("whats"), QStringLiteral("what"), QStringLiteral("is"),
        QStringLiteral("calculate"), QStringLiteral("compute"), QStringLiteral("how"),
        QStringLiteral("much"),
    };
    static const QSet<QString> kOperators = {
        QStringLiteral("of"), QStringLiteral("plus"), QStringLiteral("minus"),
        QStringLiteral("times"), QStringLiteral("x"), QStringLiteral("divided"),
        QStringLiteral("by"), QStringLiteral("+"), QStringLiteral("-"), QStringLiteral("*"),
        QStringLiteral("/"), QStringLiteral("="), QStringLiteral("percent"),
        QStringLiteral("squared"),
    };

    const QStringList tokens = normalized.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    int i = 0;
    while (i < tokens.size() && kLeads.contains(tokens.at(i))) {
        ++i;
    }

    int numbers = 0;
    int operators = 0;
    for (; i < tokens.size(); ++i) {
        if (isArithmeticNumber(tokens.at(i))) {
            ++numbers;
        } else if (kOperators.contains(tokens.at(i))) {
            ++operators;
        } else {
            return false;
        }
    }
    return numbers >= 2 && operators >= 1;
}

} // namespace

std::optional<LaneDecision> GuardStack::validate(const QString& raw, const RouterSettings& settings)
{
    const QString trimmed = raw.trimmed();
    if (trimmed.isEmpty() || raw.size() > settings.maxQueryLength) {
        return guardDecision(Lane::Unknown, "empty_or_invalid", RuleFamily::Validation);
    }

    int alphanumeric = 0;
    bool digitsOnly = true;
    for (QChar ch : trimmed) {
        if (ch.isLetterOrNumber()) {
            ++alphanumeric;
        }
        if (!ch.isDigit()) {
            digitsOnly = false;
        }
    }

    if (alphanumeric < kMinAlphanumeric) {
        return guardDecision(Lane::Unknown, "empty_or_invalid", RuleFamily::Validation);
    }
    if (digitsOnly && trimmed.size() < kMinBareNumberLength) {
        return guardDecision(Lane::Unknown, "numeric_only", RuleFamily::Validation);
    }
    return std::nullopt;
}

const std::vector<GuardRule>& GuardStack::rules()
{
    static const std::vector<GuardRule> kRules = {
        {"paste_dump", &GuardStack::pasteDumpGuard},
        {"non_domain", &GuardStack::nonDomainGuard},
        {"injection",  &GuardStack::injectionGuard},
        {"clause",     &GuardStack::clauseGuard},
    };
    return kRules;
}

std::optional<LaneDecision> GuardStack::evaluate(const NormalizedQuery& query,
                                                 const RouterSettings& settings)
{
    try {
        for (const GuardRule& rule : rules()) {
            std::optional<LaneDecision> decision = rule.check(query, settings);
            if (decision) {
                LOG_DEBUG(hqGuard, "Guard %s fired: %s", rule.name, qUtf8Printable(decision->reason));
                return decision;
            }
        }
    } catch (const std::exception& ex) {
        LOG_ERROR(hqGuard, "Guard evaluation failed: %s", ex.what());
        return guardDecision(Lane::Blocked, "internal_error");
    } catch (...) {
        LOG_ERROR(hqGuard, "Guard evaluation failed with unknown exception");
        return guardDecision(Lane::Blocked, "internal_error");
    }
    return std::nullopt;
}

std::optional<LaneDecision> GuardStack::pasteDumpGuard(const NormalizedQuery& query,
                                                       const RouterSettings& settings)
{
    const QString& text = query.original;
    if (text.size() >= settings.pasteDumpMinLength) {
        int letters = 0;
        for (QChar ch : text) {
            if (ch.isLetter()) {
                ++letters;
            }
        }
        const double ratio = static_cast<double>(letters) / static_cast<double>(text.size());
        if (ratio < settings.pasteDumpAlphaRatio) {
            return guardDecision(Lane::Unknown, "paste_dump_low_alpha");
        }
    }

    if (PatternTables::instance().pasteSignatures().matches(query.folded)
        || hasLogTimestamp(query.folded)) {
        return guardDecision(Lane::Unknown, "paste_dump_signature");
    }
    return std::nullopt;
}

std::optional<LaneDecision> GuardStack::nonDomainGuard(const NormalizedQuery& query,
                                                       const RouterSettings&)
{
    if (containsNonDomain(query.normalized)) {
        return guardDecision(Lane::Blocked, "non_domain");
    }
    return std::nullopt;
}

std::optional<LaneDecision> GuardStack::injectionGuard(const NormalizedQuery& query,
                                                       const RouterSettings&)
{
    if (containsInjection(query.folded)) {
        return guardDecision(Lane::Blocked, "injection_token");
    }
    return std::nullopt;
}

std::optional<LaneDecision> GuardStack::clauseGuard(const NormalizedQuery& query,
                                                    const RouterSettings&)
{
    const QStringList clauses = QueryNormalizer::splitClauses(query.folded);
    if (clauses.size() < 2) {
        return std::nullopt;
    }

    for (const QString& clause : clauses) {
        const QString normalized = QueryNormalizer::stripNoise(clause);
        // A greeting or thanks clause ("hi, show me ME1") is not a topic change.
        if (QueryNormalizer::isPolitenessOnly(normalized)
            || PatternTables::instance().greetingClauses().matches(normalized)) {
            continue;
        }
        if (containsNonDomain(normalized)) {
            return guardDecision(Lane::Blocked, "clause_non_domain");
        }
        if (containsInjection(clause)) {
            return guardDecision(Lane::Blocked, "clause_injection_token");
        }
    }
    return std::nullopt;
}

bool GuardStack::containsNonDomain(const QString& normalized)
{
    const PatternTables& tables = PatternTables::instance();
    if (tables.nonDomainPhrases().matches(normalized)) {
        return true;
    }
    // "where is australia", "how far is paris from london"; the place must
    // follow the question directly.
    if (const auto question = tables.placeQuestions().findFirst(normalized)) {
        QString rest = normalized.mid(question->end).trimmed();
        if (rest.startsWith(QLatin1String("the "))) {
            rest = rest.mid(4);
        }
        const auto place = tables.placeNames().findFirst(rest);
        if (place && place->start == 0) {
            return true;
        }
    }
    return isArithmeticQuestion(normalized);
}

bool GuardStack::containsInjection(const QString& folded)
{
    return PatternTables::instance().injectionTokens().matches(folded);
}

} // namespace hq
