#include "core/query/query_normalizer.h"

#include "core/query/pattern_tables.h"
#include "core/query/phrase_matcher.h"

#include <algorithm>
#include <vector>

namespace hq {

namespace {

bool isNoisePunctuation(QChar ch)
{
    switch (ch.unicode()) {
    case '!':
    case '?':
    case '$':
    case '@':
    case '#':
    case '^':
    case '&':
    case '*':
    case '(':
    case ')':
    case '{':
    case '}':
    case '[':
    case ']':
    case '~':
    case '`':
    case '"':
    case '\'':
        return true;
    default:
        return false;
    }
}

bool isEdgePunctuation(QChar ch)
{
    switch (ch.unicode()) {
    case ',':
    case ';':
    case ':':
    case '.':
    case '-':
    case ' ':
        return true;
    default:
        return false;
    }
}

QString trimEdgePunctuation(const QString& text)
{
    int start = 0;
    int end = text.size();
    while (start < end && isEdgePunctuation(text.at(start))) {
        ++start;
    }
    while (end > start && isEdgePunctuation(text.at(end - 1))) {
        --end;
    }
    return text.mid(start, end - start);
}

struct ClauseCut {
    int start = 0;  // first character removed
    int end = 0;    // first character of the next clause
};

bool isSentencePunctuation(const QString& text, int i)
{
    const QChar ch = text.at(i);
    const bool followedBySpace = i + 1 >= text.size() || text.at(i + 1) == QLatin1Char(' ');
    switch (ch.unicode()) {
    case ';':
    case '?':
    case '!':
    case ':':
    case ',':
    case 0x2026: // ellipsis
        return true;
    case '.':
        return followedBySpace;
    case '-': {
        const bool precededBySpace = i > 0 && text.at(i - 1) == QLatin1Char(' ');
        return precededBySpace || (followedBySpace && i > 0 && text.at(i - 1) == QLatin1Char('-'));
    }
    default:
        return false;
    }
}

} // namespace

NormalizedQuery QueryNormalizer::normalize(const QString& raw)
{
    NormalizedQuery result;
    result.original = raw;
    result.folded = PhraseMatcher::foldedString(raw);
    result.normalized = stripNoise(result.folded);
    result.stripped = stripPoliteness(result.normalized);
    return result;
}

QString QueryNormalizer::stripNoise(const QString& folded)
{
    QString working = folded.trimmed();
    if (working.size() >= 2) {
        const QChar first = working.front();
        const QChar last = working.back();
        const bool hasDoubleQuotes = first == QLatin1Char('"') && last == QLatin1Char('"');
        const bool hasSingleQuotes = first == QLatin1Char('\'') && last == QLatin1Char('\'');
        if (hasDoubleQuotes || hasSingleQuotes) {
            working = working.mid(1, working.size() - 2);
        }
    }

    QString normalized;
    normalized.reserve(working.size());

    for (QChar ch : working) {
        if (isNoisePunctuation(ch)) {
            continue;
        }

        if (ch.isSpace()) {
            if (normalized.isEmpty()) {
                continue;
            }

            const QChar previous = normalized.back();
            if (previous.isSpace() || previous == QLatin1Char('-')) {
                continue;
            }

            normalized.append(QLatin1Char(' '));
            continue;
        }

        if (ch == QLatin1Char('-')) {
            if (!normalized.isEmpty()) {
                const QChar previous = normalized.back();
                if (previous == QLatin1Char('-')) {
                    continue;
                }

                if (previous.isSpace()) {
                    normalized.chop(1);
                    if (!normalized.isEmpty() && normalized.back() == QLatin1Char('-')) {
                        continue;
                    }
                }
            }

            normalized.append(QLatin1Char('-'));
            continue;
        }

        normalized.append(ch.toLower());
    }

    while (!normalized.isEmpty()
           && (normalized.back().isSpace() || normalized.back() == QLatin1Char('.')
               || normalized.back() == QLatin1Char(',') || normalized.back() == QLatin1Char(';')
               || normalized.back() == QLatin1Char(':'))) {
        normalized.chop(1);
    }
    return normalized.trimmed();
}

QString QueryNormalizer::stripPoliteness(const QString& normalized)
{
    const PatternTables& tables = PatternTables::instance();
    QString working = normalized;

    if (const auto prefix = tables.politePrefixes().findFirst(working)) {
        const QString remainder = trimEdgePunctuation(working.mid(prefix->end));
        if (!remainder.isEmpty()) {
            working = remainder;
        }
    }

    // All suffix matches end at the text end; the leftmost is the longest.
    if (const auto suffix = tables.politeSuffixes().findFirst(working)) {
        const QString remainder = trimEdgePunctuation(working.left(suffix->start));
        if (!remainder.isEmpty()) {
            working = remainder;
        }
    }

    return working;
}

bool QueryNormalizer::isPolitenessOnly(const QString& normalized)
{
    if (normalized.isEmpty()) {
        return false;
    }
    const PatternTables& tables = PatternTables::instance();
    const auto prefix = tables.politePrefixes().findFirst(normalized);
    if (prefix && prefix->end == normalized.size()) {
        return true;
    }
    const auto suffix = tables.politeSuffixes().findFirst(normalized);
    return suffix && suffix->start == 0;
}

QStringList QueryNormalizer::splitClauses(const QString& folded)
{
    std::vector<ClauseCut> cuts;

    // Leftmost-longest, non-overlapping conjunctions ("and then" over "and").
    std::vector<PhraseMatch> conjunctions =
        PatternTables::instance().clauseConjunctions().findAll(folded);
    std::sort(conjunctions.begin(), conjunctions.end(),
              [](const PhraseMatch& a, const PhraseMatch& b) {
                  if (a.start != b.start) {
                      return a.start < b.start;
                  }
                  return a.end > b.end;
              });
    int consumed = 0;
    for (const PhraseMatch& match : conjunctions) {
        if (match.start < consumed) {
            continue;
        }
        cuts.push_back(ClauseCut{match.start, match.end});
        consumed = match.end;
    }

    for (int i = 0; i < folded.size(); ++i) {
        if (isSentencePunctuation(folded, i)) {
            cuts.push_back(ClauseCut{i + 1, i + 1});
        }
    }

    std::sort(cuts.begin(), cuts.end(), [](const ClauseCut& a, const ClauseCut& b) {
        return a.start < b.start;
    });

    QStringList clauses;
    int clauseStart = 0;
    for (const ClauseCut& cut : cuts) {
        if (cut.start < clauseStart) {
            continue;
        }
        const QString clause = folded.mid(clauseStart, cut.start - clauseStart).trimmed();
        if (!clause.isEmpty()) {
            clauses.append(clause);
        }
        clauseStart = cut.end;
    }
    const QString tail = folded.mid(clauseStart).trimmed();
    if (!tail.isEmpty()) {
        clauses.append(tail);
    }
    return clauses;
}

} // namespace hq
