#pragma once

#include <QString>
#include <QStringList>

namespace hq {

struct NormalizedQuery {
    QString original;
    QString folded;      // lowercased, whitespace collapsed, punctuation intact
    QString normalized;  // folded with noise punctuation removed
    QString stripped;    // normalized minus one politeness prefix and suffix
};

class QueryNormalizer {
public:
    static NormalizedQuery normalize(const QString& raw);

    static QString stripNoise(const QString& folded);

    // Removes at most one leading and one trailing politeness phrase, and
    // only when something is left afterwards.
    static QString stripPoliteness(const QString& normalized);
    static bool isPolitenessOnly(const QString& normalized);

    // Splits folded text on coordinating conjunctions and sentence
    // punctuation. Terminating punctuation stays with its clause.
    static QStringList splitClauses(const QString& folded);
};

} // namespace hq
