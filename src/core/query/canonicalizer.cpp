#include "core/query/canonicalizer.h"

#include "core/query/identifier_scanner.h"
#include "core/query/pattern_tables.h"
#include "core/query/phrase_matcher.h"

#include <QHash>
#include <QPair>

#include <algorithm>

namespace hq {

namespace {

QString aliasKey(const QString& value)
{
    QString spaced = value;
    spaced.replace(QLatin1Char('_'), QLatin1Char(' '));
    return PhraseMatcher::foldedString(spaced);
}

QString upperSnake(const QString& value)
{
    QString result;
    result.reserve(value.size());
    for (QChar ch : value) {
        if (ch.isLetterOrNumber()) {
            result.append(ch.toUpper());
        } else if (!result.isEmpty() && result.back() != QLatin1Char('_')) {
            result.append(QLatin1Char('_'));
        }
    }
    while (result.endsWith(QLatin1Char('_'))) {
        result.chop(1);
    }
    if (result.isEmpty()) {
        return value.trimmed().toUpper();
    }
    return result;
}

} // namespace

QString Canonicalizer::canonicalForm(EntityType type, const QString& value)
{
    // Codes and readings only take identifier forms; names go through aliases.
    const bool structured = type == EntityType::FaultCode || type == EntityType::WorkOrder
        || type == EntityType::Measurement;
    if (!structured) {
        if (const auto alias = PatternTables::instance().canonicalAlias(aliasKey(value))) {
            return *alias;
        }
    }

    if (const auto identifier = IdentifierScanner::parseWhole(value)) {
        return identifier->canonical;
    }

    // Model canonical forms join manufacturer and model with '_'.
    if (value.contains(QLatin1Char('_'))) {
        QString spaced = value;
        spaced.replace(QLatin1Char('_'), QLatin1Char(' '));
        if (const auto identifier = IdentifierScanner::parseWhole(spaced)) {
            if (identifier->kind == IdentifierKind::ModelNumber) {
                return identifier->canonical;
            }
        }
    }

    return upperSnake(value);
}

float Canonicalizer::entityWeight(EntityType type)
{
    switch (type) {
    case EntityType::FaultCode:    return 1.00f;
    case EntityType::WorkOrder:    return 0.95f;
    case EntityType::Equipment:    return 0.95f;
    case EntityType::Part:         return 0.80f;
    case EntityType::System:       return 0.90f;
    case EntityType::Measurement:  return 0.85f;
    case EntityType::MaritimeTerm: return 0.75f;
    }
    return 0.0f;
}

std::vector<CanonicalEntity> Canonicalizer::canonicalize(const std::vector<ExtractedEntity>& extracted)
{
    std::vector<CanonicalEntity> result;
    result.reserve(extracted.size());
    for (const ExtractedEntity& entity : extracted) {
        CanonicalEntity canonical;
        canonical.type = entity.type;
        canonical.value = entity.value;
        canonical.canonical = canonicalForm(entity.type, entity.value);
        canonical.confidence = std::clamp(entity.confidence, 0.0f, 1.0f);
        canonical.weight = entityWeight(entity.type);
        canonical.occurrences = 1;
        result.push_back(canonical);
    }
    return result;
}

std::vector<CanonicalEntity> Canonicalizer::recanonicalize(const std::vector<CanonicalEntity>& entities)
{
    std::vector<CanonicalEntity> result;
    result.reserve(entities.size());
    for (const CanonicalEntity& entity : entities) {
        CanonicalEntity copy = entity;
        copy.canonical = canonicalForm(entity.type, entity.canonical);
        copy.weight = entityWeight(entity.type);
        result.push_back(copy);
    }
    return result;
}

std::vector<CanonicalEntity> Canonicalizer::mergeDuplicates(const std::vector<CanonicalEntity>& entities)
{
    std::vector<CanonicalEntity> merged;
    QHash<QPair<int, QString>, size_t> indexByKey;

    for (const CanonicalEntity& entity : entities) {
        const QPair<int, QString> key(static_cast<int>(entity.type), entity.canonical);
        const auto it = indexByKey.constFind(key);
        if (it == indexByKey.constEnd()) {
            indexByKey.insert(key, merged.size());
            merged.push_back(entity);
            continue;
        }

        CanonicalEntity& existing = merged[it.value()];
        existing.confidence = std::max(existing.confidence, entity.confidence);
        existing.occurrences += entity.occurrences;
    }
    return merged;
}

} // namespace hq
