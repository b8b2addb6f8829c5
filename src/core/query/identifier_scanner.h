#pragma once

#include <QString>

#include <optional>
#include <vector>

namespace hq {

enum class IdentifierKind {
    FaultCode,
    WorkOrder,
    EquipmentCode,      // ME-S-001, GEN-001, NAV-RAD-001
    NumberedEquipment,  // ME1, DG2, GEN-3
    PartNumber,         // ENG-0008-103
    ModelNumber,        // CAT 3512, 16V2000
    Measurement,        // 24v, 2,5 bar, 85 degrees c
};

struct IdentifierMatch {
    IdentifierKind kind = IdentifierKind::FaultCode;
    QString text;       // source substring covered by the match
    int start = 0;
    int end = 0;
    QString canonical;  // normalized identifier, e.g. "ME-S-001" or "2.5_BAR"
};

// Single left-to-right pass over the input. Tokens are runs of letters and
// digits joined by '-', '.', '/', '_' (and ',' between digits); each match
// consumes the tokens it covers, so matches never overlap.
class IdentifierScanner {
public:
    static std::vector<IdentifierMatch> scan(const QString& text);

    // The single identifier spanning all of value, if there is one.
    static std::optional<IdentifierMatch> parseWhole(const QString& value);

    static std::optional<QString> manufacturerName(const QString& word);
    static std::optional<QString> unitName(const QString& unit, bool attached);
};

} // namespace hq
