#include "core/query/query_types.h"

namespace hq {

QString laneToString(Lane lane)
{
    switch (lane) {
    case Lane::Blocked:   return QStringLiteral("BLOCKED");
    case Lane::Unknown:   return QStringLiteral("UNKNOWN");
    case Lane::NoLlm:     return QStringLiteral("NO_LLM");
    case Lane::RulesOnly: return QStringLiteral("RULES_ONLY");
    case Lane::Gpt:       return QStringLiteral("GPT");
    }
    return QStringLiteral("UNKNOWN");
}

Lane laneFromString(const QString& str)
{
    const QString upper = str.trimmed().toUpper();
    if (upper == QLatin1String("BLOCKED"))    return Lane::Blocked;
    if (upper == QLatin1String("NO_LLM"))     return Lane::NoLlm;
    if (upper == QLatin1String("RULES_ONLY")) return Lane::RulesOnly;
    if (upper == QLatin1String("GPT"))        return Lane::Gpt;
    return Lane::Unknown;
}

QString ruleFamilyToString(RuleFamily family)
{
    switch (family) {
    case RuleFamily::Validation:     return QStringLiteral("validation");
    case RuleFamily::Guard:          return QStringLiteral("guard");
    case RuleFamily::Elliptical:     return QStringLiteral("elliptical");
    case RuleFamily::ImplicitAction: return QStringLiteral("implicit_action");
    case RuleFamily::Command:        return QStringLiteral("command");
    case RuleFamily::DirectLookup:   return QStringLiteral("direct_lookup");
    case RuleFamily::GptTrigger:     return QStringLiteral("gpt_trigger");
    case RuleFamily::Fallback:       return QStringLiteral("fallback");
    }
    return QStringLiteral("fallback");
}

QString entityTypeToString(EntityType type)
{
    switch (type) {
    case EntityType::FaultCode:    return QStringLiteral("fault_code");
    case EntityType::WorkOrder:    return QStringLiteral("work_order");
    case EntityType::Equipment:    return QStringLiteral("equipment");
    case EntityType::Part:         return QStringLiteral("part");
    case EntityType::System:       return QStringLiteral("system");
    case EntityType::Measurement:  return QStringLiteral("measurement");
    case EntityType::MaritimeTerm: return QStringLiteral("maritime_term");
    }
    return QStringLiteral("maritime_term");
}

std::optional<EntityType> entityTypeFromString(const QString& str)
{
    if (str == QLatin1String("fault_code"))    return EntityType::FaultCode;
    if (str == QLatin1String("work_order"))    return EntityType::WorkOrder;
    if (str == QLatin1String("equipment"))     return EntityType::Equipment;
    if (str == QLatin1String("part"))          return EntityType::Part;
    if (str == QLatin1String("system"))        return EntityType::System;
    if (str == QLatin1String("measurement"))   return EntityType::Measurement;
    if (str == QLatin1String("maritime_term")) return EntityType::MaritimeTerm;
    return std::nullopt;
}

int entityTypeSpecificity(EntityType type)
{
    switch (type) {
    case EntityType::FaultCode:    return 7;
    case EntityType::WorkOrder:    return 6;
    case EntityType::Equipment:    return 5;
    case EntityType::Part:         return 4;
    case EntityType::System:       return 3;
    case EntityType::Measurement:  return 2;
    case EntityType::MaritimeTerm: return 1;
    }
    return 0;
}

} // namespace hq
