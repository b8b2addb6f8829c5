#include "core/query/phrase_matcher.h"

#include <algorithm>
#include <deque>

namespace hq {

namespace {

QChar foldChar(QChar ch)
{
    switch (ch.unicode()) {
    case 0x2018: // left single quote
    case 0x2019: // right single quote
    case 0x201B:
    case 0x2032:
        return QLatin1Char('\'');
    case 0x201C:
    case 0x201D:
    case 0x201F:
    case 0x2033:
        return QLatin1Char('"');
    case 0x2010:
    case 0x2011:
    case 0x2012:
    case 0x2013:
    case 0x2014:
    case 0x2212:
        return QLatin1Char('-');
    case 0xFF1C:
        return QLatin1Char('<');
    case 0xFF1E:
        return QLatin1Char('>');
    default:
        break;
    }
    return ch.toLower();
}

} // namespace

PhraseMatcher::PhraseMatcher()
{
    m_nodes.emplace_back();
}

PhraseMatcher::PhraseMatcher(const std::vector<PhraseRule>& rules)
{
    m_nodes.emplace_back();
    m_rules.reserve(rules.size());
    m_lengths.reserve(rules.size());

    for (const PhraseRule& source : rules) {
        PhraseRule rule = source;
        rule.phrase = foldedString(source.phrase);
        if (rule.phrase.isEmpty()) {
            continue;
        }
        const int index = static_cast<int>(m_rules.size());
        m_rules.push_back(rule);
        m_lengths.push_back(static_cast<int>(rule.phrase.size()));
        insert(rule.phrase, index);
    }

    buildLinks();
}

void PhraseMatcher::insert(const QString& phrase, int ruleIndex)
{
    int state = 0;
    for (QChar ch : phrase) {
        const char16_t key = ch.unicode();
        auto it = m_nodes[state].next.find(key);
        if (it == m_nodes[state].next.end()) {
            const int created = static_cast<int>(m_nodes.size());
            m_nodes[state].next.emplace(key, created);
            m_nodes.emplace_back();
            state = created;
        } else {
            state = it->second;
        }
    }
    m_nodes[state].outputs.push_back(ruleIndex);
}

void PhraseMatcher::buildLinks()
{
    // Breadth-first so every failure target is finished before its users.
    std::deque<int> queue;
    for (const auto& edge : m_nodes[0].next) {
        m_nodes[edge.second].fail = 0;
        queue.push_back(edge.second);
    }

    while (!queue.empty()) {
        const int current = queue.front();
        queue.pop_front();

        for (const auto& edge : m_nodes[current].next) {
            const char16_t key = edge.first;
            const int child = edge.second;

            int fallback = m_nodes[current].fail;
            while (fallback != 0 && m_nodes[fallback].next.find(key) == m_nodes[fallback].next.end()) {
                fallback = m_nodes[fallback].fail;
            }
            auto target = m_nodes[fallback].next.find(key);
            int fail = 0;
            if (target != m_nodes[fallback].next.end() && target->second != child) {
                fail = target->second;
            }

            m_nodes[child].fail = fail;
            m_nodes[child].outputLink = m_nodes[fail].outputs.empty()
                ? m_nodes[fail].outputLink
                : fail;
            queue.push_back(child);
        }
    }
}

int PhraseMatcher::step(int state, char16_t ch) const
{
    while (true) {
        const auto& next = m_nodes[state].next;
        auto it = next.find(ch);
        if (it != next.end()) {
            return it->second;
        }
        if (state == 0) {
            return 0;
        }
        state = m_nodes[state].fail;
    }
}

bool PhraseMatcher::accept(const PhraseRule& rule, const QString& text, int start, int end) const
{
    switch (rule.anchor) {
    case PhraseAnchor::Anywhere:
        break;
    case PhraseAnchor::TextStart:
        if (start != 0) {
            return false;
        }
        break;
    case PhraseAnchor::TextEnd:
        if (end != text.size()) {
            return false;
        }
        break;
    case PhraseAnchor::WholeText:
        if (start != 0 || end != text.size()) {
            return false;
        }
        break;
    }

    if (!rule.wordBoundary) {
        return true;
    }

    if (isWordChar(text.at(start)) && start > 0 && isWordChar(text.at(start - 1))) {
        return false;
    }
    if (isWordChar(text.at(end - 1)) && end < text.size() && isWordChar(text.at(end))) {
        return false;
    }
    return true;
}

template <typename Visitor>
void PhraseMatcher::scan(const QString& folded, Visitor&& visit) const
{
    if (m_rules.empty() || folded.isEmpty()) {
        return;
    }

    int state = 0;
    for (int i = 0; i < folded.size(); ++i) {
        state = step(state, folded.at(i).unicode());

        int emit = m_nodes[state].outputs.empty() ? m_nodes[state].outputLink : state;
        while (emit >= 0) {
            for (int ruleIndex : m_nodes[emit].outputs) {
                const int end = i + 1;
                const int start = end - m_lengths[ruleIndex];
                const PhraseRule& rule = m_rules[ruleIndex];
                if (accept(rule, folded, start, end)) {
                    if (!visit(PhraseMatch{rule.id, start, end})) {
                        return;
                    }
                }
            }
            emit = m_nodes[emit].outputLink;
        }
    }
}

std::vector<PhraseMatch> PhraseMatcher::findAll(const QString& folded) const
{
    std::vector<PhraseMatch> results;
    scan(folded, [&results](const PhraseMatch& match) {
        results.push_back(match);
        return true;
    });

    // Output-link order is longest suffix first; report shorter starts last.
    std::stable_sort(results.begin(), results.end(),
                     [](const PhraseMatch& a, const PhraseMatch& b) {
                         if (a.end != b.end) {
                             return a.end < b.end;
                         }
                         return a.start < b.start;
                     });
    return results;
}

std::optional<PhraseMatch> PhraseMatcher::findFirst(const QString& folded) const
{
    std::optional<PhraseMatch> best;
    scan(folded, [&best](const PhraseMatch& match) {
        if (!best
            || match.start < best->start
            || (match.start == best->start && match.end > best->end)) {
            best = match;
        }
        return true;
    });
    return best;
}

bool PhraseMatcher::matches(const QString& folded) const
{
    bool found = false;
    scan(folded, [&found](const PhraseMatch&) {
        found = true;
        return false;
    });
    return found;
}

FoldedText PhraseMatcher::fold(const QString& source)
{
    FoldedText folded;
    folded.text.reserve(source.size());
    folded.origin.reserve(static_cast<size_t>(source.size()));

    for (int i = 0; i < source.size(); ++i) {
        const QChar ch = source.at(i);
        // Zero-width and other format characters ("ig\u200bnore") are invisible.
        if (ch.category() == QChar::Other_Format) {
            continue;
        }
        if (ch.isSpace()) {
            if (folded.text.isEmpty() || folded.text.back() == QLatin1Char(' ')) {
                continue;
            }
            folded.text.append(QLatin1Char(' '));
            folded.origin.push_back(i);
            continue;
        }
        folded.text.append(foldChar(ch));
        folded.origin.push_back(i);
    }

    if (!folded.text.isEmpty() && folded.text.back() == QLatin1Char(' ')) {
        folded.text.chop(1);
        folded.origin.pop_back();
    }
    return folded;
}

QString PhraseMatcher::foldedString(const QString& source)
{
    return fold(source).text;
}

bool PhraseMatcher::isWordChar(QChar ch)
{
    return ch.isLetterOrNumber() || ch == QLatin1Char('_');
}

} // namespace hq
