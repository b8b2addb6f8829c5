#pragma once

#include <QString>

#include <optional>
#include <unordered_map>
#include <vector>

namespace hq {

enum class PhraseAnchor {
    Anywhere,
    TextStart,  // match must begin at offset 0
    TextEnd,    // match must end at the last character
    WholeText,  // match must cover the whole text
};

struct PhraseRule {
    QString phrase;
    int id = 0;
    PhraseAnchor anchor = PhraseAnchor::Anywhere;
    // When set, a phrase edge that is a word character may not touch another
    // word character ("gen" does not match inside "general").
    bool wordBoundary = true;
};

struct PhraseMatch {
    int id = 0;
    int start = 0;
    int end = 0;
};

// Lowercased, whitespace-collapsed text with a map back to source offsets.
// origin[i] is the index in the source of folded character i.
struct FoldedText {
    QString text;
    std::vector<int> origin;
};

// Multi-phrase matcher over folded text. Phrases are compiled into an
// Aho-Corasick automaton; scanning is a single pass over the input with no
// backtracking, so cost is linear in input length plus reported matches.
class PhraseMatcher {
public:
    PhraseMatcher();
    explicit PhraseMatcher(const std::vector<PhraseRule>& rules);

    // Every match that satisfies its rule's anchor and boundary constraints,
    // ordered by end offset, then by start offset.
    std::vector<PhraseMatch> findAll(const QString& folded) const;

    // Leftmost match; on equal start the longest one.
    std::optional<PhraseMatch> findFirst(const QString& folded) const;

    bool matches(const QString& folded) const;

    int ruleCount() const { return static_cast<int>(m_rules.size()); }
    const PhraseRule& rule(int index) const { return m_rules.at(index); }

    static FoldedText fold(const QString& source);
    static QString foldedString(const QString& source);
    static bool isWordChar(QChar ch);

private:
    struct Node {
        std::unordered_map<char16_t, int> next;
        int fail = 0;
        // Nearest proper suffix state that terminates at least one phrase.
        int outputLink = -1;
        std::vector<int> outputs;
    };

    void insert(const QString& phrase, int ruleIndex);
    void buildLinks();
    int step(int state, char16_t ch) const;
    bool accept(const PhraseRule& rule, const QString& text, int start, int end) const;

    template <typename Visitor>
    void scan(const QString& folded, Visitor&& visit) const;

    std::vector<PhraseRule> m_rules;
    std::vector<int> m_lengths;
    std::vector<Node> m_nodes;
};

} // namespace hq
