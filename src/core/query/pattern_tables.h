#pragma once

#include "core/query/phrase_matcher.h"
#include "core/query/query_types.h"

#include <QHash>
#include <QString>

#include <optional>
#include <vector>

namespace hq {

struct VocabularyEntry {
    EntityType type = EntityType::MaritimeTerm;
    float confidence = 0.0f;
};

// Immutable rule data shared by every classification. Built on first use
// and never modified afterwards, so concurrent readers need no locking.
//
// Matchers documented as "folded" run on PhraseMatcher::fold output (quotes
// and symbols intact); "normalized" ones run on QueryNormalizer output
// (noise punctuation and apostrophes removed).
class PatternTables {
public:
    static const PatternTables& instance();

    PatternTables(const PatternTables&) = delete;
    PatternTables& operator=(const PatternTables&) = delete;

    // Guards
    const PhraseMatcher& injectionTokens() const { return m_injection; }      // folded
    const PhraseMatcher& nonDomainPhrases() const { return m_nonDomain; }     // normalized
    const PhraseMatcher& pasteSignatures() const { return m_paste; }          // folded
    const PhraseMatcher& clauseConjunctions() const { return m_conjunctions; } // folded
    const PhraseMatcher& placeQuestions() const { return m_placeQuestions; }  // normalized
    const PhraseMatcher& placeNames() const { return m_placeNames; }          // normalized
    const PhraseMatcher& greetingClauses() const { return m_greetings; }      // normalized

    // Politeness
    const PhraseMatcher& politePrefixes() const { return m_politePrefixes; }
    const PhraseMatcher& politeSuffixes() const { return m_politeSuffixes; }

    // Lane cascade (normalized)
    const PhraseMatcher& bareAbbreviations() const { return m_bareAbbreviations; }
    const PhraseMatcher& workOrderFragments() const { return m_workOrderFragments; }
    const PhraseMatcher& hoursWords() const { return m_hoursWords; }
    const PhraseMatcher& completedWork() const { return m_completedWork; }
    const PhraseMatcher& stockDepletion() const { return m_stockDepletion; }
    const PhraseMatcher& readingPhrases() const { return m_readingPhrases; }
    const PhraseMatcher& commandVerbs() const { return m_commandVerbs; }
    const PhraseMatcher& mutationVerbs() const { return m_mutationVerbs; }
    const PhraseMatcher& lookupLeads() const { return m_lookupLeads; }
    const PhraseMatcher& listFilters() const { return m_listFilters; }
    const PhraseMatcher& problemVocabulary() const { return m_problem; }
    const PhraseMatcher& temporalContext() const { return m_temporal; }
    const PhraseMatcher& diagnosisIntent() const { return m_diagnosis; }
    const PhraseMatcher& domainNouns() const { return m_domainNouns; }

    // Entity dictionary (folded); match ids index vocabularyEntry().
    const PhraseMatcher& entityVocabulary() const { return m_vocabulary; }
    const VocabularyEntry& vocabularyEntry(int id) const;

    std::optional<QString> canonicalAlias(const QString& key) const;
    const QHash<QString, QString>& canonicalAliases() const { return m_aliases; }

private:
    PatternTables();

    PhraseMatcher m_injection;
    PhraseMatcher m_nonDomain;
    PhraseMatcher m_paste;
    PhraseMatcher m_conjunctions;
    PhraseMatcher m_placeQuestions;
    PhraseMatcher m_placeNames;
    PhraseMatcher m_greetings;
    PhraseMatcher m_politePrefixes;
    PhraseMatcher m_politeSuffixes;
    PhraseMatcher m_bareAbbreviations;
    PhraseMatcher m_workOrderFragments;
    PhraseMatcher m_hoursWords;
    PhraseMatcher m_completedWork;
    PhraseMatcher m_stockDepletion;
    PhraseMatcher m_readingPhrases;
    PhraseMatcher m_commandVerbs;
    PhraseMatcher m_mutationVerbs;
    PhraseMatcher m_lookupLeads;
    PhraseMatcher m_listFilters;
    PhraseMatcher m_problem;
    PhraseMatcher m_temporal;
    PhraseMatcher m_diagnosis;
    PhraseMatcher m_domainNouns;
    PhraseMatcher m_vocabulary;

    std::vector<VocabularyEntry> m_entries;
    QHash<QString, QString> m_aliases;
};

} // namespace hq
