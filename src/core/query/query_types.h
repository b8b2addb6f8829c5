#pragma once

#include <QString>

#include <optional>

namespace hq {

// Exactly one lane is assigned per query.
enum class Lane {
    Blocked,
    Unknown,
    NoLlm,
    RulesOnly,
    Gpt,
};

enum class RuleFamily {
    Validation,
    Guard,
    Elliptical,
    ImplicitAction,
    Command,
    DirectLookup,
    GptTrigger,
    Fallback,
};

enum class EntityType {
    FaultCode,
    WorkOrder,
    Equipment,
    Part,
    System,
    Measurement,
    MaritimeTerm,
};

// Half-open [start, end) offsets into the original query, in UTF-16 units.
struct Span {
    int start = 0;
    int end = 0;

    int length() const { return end - start; }
    bool overlaps(const Span& other) const { return start < other.end && other.start < end; }
};

struct ExtractedEntity {
    EntityType type = EntityType::MaritimeTerm;
    QString value;
    float confidence = 0.0f;
    Span span;
};

struct CanonicalEntity {
    EntityType type = EntityType::MaritimeTerm;
    QString value;
    QString canonical;
    float confidence = 0.0f;
    float weight = 0.0f;
    // Number of extracted detections represented by this entry.
    int occurrences = 1;
};

struct LaneDecision {
    Lane lane = Lane::Unknown;
    QString reason;
    RuleFamily family = RuleFamily::Fallback;
    float confidence = 0.0f;
};

QString laneToString(Lane lane);
Lane laneFromString(const QString& str);

QString ruleFamilyToString(RuleFamily family);

QString entityTypeToString(EntityType type);
std::optional<EntityType> entityTypeFromString(const QString& str);

// Higher is more specific; used to break confidence ties on overlapping spans.
int entityTypeSpecificity(EntityType type);

} // namespace hq
