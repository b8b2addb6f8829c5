#include "core/query/identifier_scanner.h"

#include <QHash>
#include <QSet>
#include <QStringList>

#include <algorithm>

namespace hq {

namespace {

constexpr int kMaxWindow = 4;

struct Token {
    int start = 0;
    int end = 0;
    QString upper;
};

struct Candidate {
    IdentifierKind kind;
    QString canonical;
};

bool isTokenChar(QChar ch)
{
    return ch.isLetterOrNumber() || ch.unicode() == 0x00B0 || ch == QLatin1Char('%');
}

bool isConnector(QChar ch)
{
    switch (ch.unicode()) {
    case '-':
    case '.':
    case '/':
    case '_':
    case ',':
        return true;
    default:
        return false;
    }
}

bool isAsciiDigit(QChar ch)
{
    return ch.unicode() >= '0' && ch.unicode() <= '9';
}

bool isAsciiUpper(QChar ch)
{
    return ch.unicode() >= 'A' && ch.unicode() <= 'Z';
}

bool allDigits(const QString& s)
{
    if (s.isEmpty()) {
        return false;
    }
    for (QChar ch : s) {
        if (!isAsciiDigit(ch)) {
            return false;
        }
    }
    return true;
}

std::vector<Token> tokenize(const QString& text)
{
    std::vector<Token> tokens;
    const int n = text.size();
    int i = 0;
    while (i < n) {
        if (!isTokenChar(text.at(i))) {
            ++i;
            continue;
        }

        const int start = i;
        ++i;
        while (i < n) {
            const QChar ch = text.at(i);
            if (isTokenChar(ch)) {
                ++i;
                continue;
            }
            if (isConnector(ch) && i + 1 < n && isTokenChar(text.at(i + 1))) {
                if (ch == QLatin1Char(',')
                    && !(isAsciiDigit(text.at(i - 1)) && isAsciiDigit(text.at(i + 1)))) {
                    break;
                }
                i += 2;
                continue;
            }
            break;
        }

        tokens.push_back(Token{start, i, text.mid(start, i - start).toUpper()});
    }
    return tokens;
}

// Uppercase token text with separators removed; empty if anything other
// than ASCII letters, digits and separators is present.
QString compactOf(const QString& upper)
{
    QString compact;
    compact.reserve(upper.size());
    for (QChar ch : upper) {
        if (isAsciiUpper(ch) || isAsciiDigit(ch)) {
            compact.append(ch);
        } else if (ch == QLatin1Char('-') || ch == QLatin1Char('.') || ch == QLatin1Char('_')) {
            continue;
        } else {
            return QString();
        }
    }
    return compact;
}

bool splitLettersDigits(const QString& compact, QString* letters, QString* digits)
{
    int i = 0;
    while (i < compact.size() && isAsciiUpper(compact.at(i))) {
        ++i;
    }
    if (i == 0 || i == compact.size()) {
        return false;
    }
    const QString tail = compact.mid(i);
    if (!allDigits(tail)) {
        return false;
    }
    *letters = compact.left(i);
    *digits = tail;
    return true;
}

bool gapIsJoinable(const QString& text, int from, int to)
{
    if (to <= from) {
        return false;
    }
    for (int i = from; i < to; ++i) {
        const QChar ch = text.at(i);
        if (!(ch.isSpace() || ch == QLatin1Char('-') || ch == QLatin1Char('#')
              || ch == QLatin1Char(':'))) {
            return false;
        }
    }
    return true;
}

bool gapIsSpace(const QString& text, int from, int to)
{
    if (to <= from) {
        return false;
    }
    for (int i = from; i < to; ++i) {
        if (!text.at(i).isSpace()) {
            return false;
        }
    }
    return true;
}

std::optional<QString> workOrderCanonical(const QString& compact)
{
    QString letters;
    QString digits;
    if (!splitLettersDigits(compact, &letters, &digits)) {
        return std::nullopt;
    }
    if (letters != QLatin1String("WO") && letters != QLatin1String("WORKORDER")) {
        return std::nullopt;
    }
    if (digits.size() > 10) {
        return std::nullopt;
    }
    if (digits.size() == 7) {
        return QStringLiteral("WO-%1-%2").arg(digits.left(4), digits.mid(4));
    }
    return QStringLiteral("WO-") + digits;
}

std::optional<QString> partNumberCanonical(const QString& compact)
{
    static const QSet<QString> kPrefixes = {
        QStringLiteral("ENG"), QStringLiteral("PMP"), QStringLiteral("FLT"),
        QStringLiteral("HYD"), QStringLiteral("GEN"), QStringLiteral("NAV"),
        QStringLiteral("ELE"), QStringLiteral("ELEC"), QStringLiteral("PRT"),
    };

    QString letters;
    QString digits;
    if (!splitLettersDigits(compact, &letters, &digits)) {
        return std::nullopt;
    }
    if (!kPrefixes.contains(letters) || digits.size() != 7) {
        return std::nullopt;
    }
    return QStringLiteral("%1-%2-%3").arg(letters, digits.left(4), digits.mid(4));
}

std::optional<QString> equipmentCodeCanonical(const QString& compact, bool windowed)
{
    static const QHash<QString, QString> kSubtyped = {
        {QStringLiteral("MES"),    QStringLiteral("ME-S")},
        {QStringLiteral("MEP"),    QStringLiteral("ME-P")},
        {QStringLiteral("THRB"),   QStringLiteral("THR-B")},
        {QStringLiteral("THRS"),   QStringLiteral("THR-S")},
        {QStringLiteral("FWP"),    QStringLiteral("FW-P")},
        {QStringLiteral("FWS"),    QStringLiteral("FW-S")},
        {QStringLiteral("NAVRAD"), QStringLiteral("NAV-RAD")},
        {QStringLiteral("NAVAP"),  QStringLiteral("NAV-AP")},
    };
    static const QSet<QString> kPlain = {
        QStringLiteral("ME"),   QStringLiteral("GEN"), QStringLiteral("DG"),
        QStringLiteral("AE"),   QStringLiteral("HVAC"), QStringLiteral("WM"),
        QStringLiteral("HYD"),  QStringLiteral("STP"), QStringLiteral("FIRE"),
        QStringLiteral("AUX"),  QStringLiteral("SEW"), QStringLiteral("EL"),
        QStringLiteral("ELEC"), QStringLiteral("BLG"), QStringLiteral("STR"),
    };

    QString letters;
    QString digits;
    if (!splitLettersDigits(compact, &letters, &digits) || digits.size() != 3) {
        return std::nullopt;
    }
    const auto subtyped = kSubtyped.constFind(letters);
    if (subtyped != kSubtyped.constEnd()) {
        return subtyped.value() + QLatin1Char('-') + digits;
    }
    // "me 100" across tokens is ordinary text; plain codes must be one token.
    if (!windowed && kPlain.contains(letters)) {
        return letters + QLatin1Char('-') + digits;
    }
    return std::nullopt;
}

// SPN <n> [FMI <m>], J1939 suspect parameter / failure mode.
std::optional<QString> spnCanonical(const QString& compact)
{
    if (!compact.startsWith(QLatin1String("SPN"))) {
        return std::nullopt;
    }
    int i = 3;
    const int spnStart = i;
    while (i < compact.size() && isAsciiDigit(compact.at(i))) {
        ++i;
    }
    const int spnLength = i - spnStart;
    if (spnLength == 0 || spnLength > 6) {
        return std::nullopt;
    }
    const QString spn = compact.mid(spnStart, spnLength);
    if (i == compact.size()) {
        return QStringLiteral("SPN-") + spn;
    }

    if (compact.mid(i, 3) != QLatin1String("FMI")) {
        return std::nullopt;
    }
    const QString fmi = compact.mid(i + 3);
    if (!allDigits(fmi) || fmi.size() > 2) {
        return std::nullopt;
    }
    return QStringLiteral("SPN-%1-FMI-%2").arg(spn, fmi);
}

std::optional<QString> alarmCanonical(const QString& compact, bool windowed)
{
    static const QSet<QString> kWindowPrefixes = {
        QStringLiteral("AL"), QStringLiteral("ALM"), QStringLiteral("ALARM"),
        QStringLiteral("ERR"), QStringLiteral("FLT"),
    };
    static const QSet<QString> kTokenPrefixes = {
        QStringLiteral("SD"), QStringLiteral("SHDN"), QStringLiteral("TRIP"),
        QStringLiteral("WARN"), QStringLiteral("FAULT"),
    };

    QString letters;
    QString digits;
    if (!splitLettersDigits(compact, &letters, &digits) || digits.size() > 4) {
        return std::nullopt;
    }
    if (kWindowPrefixes.contains(letters) || (!windowed && kTokenPrefixes.contains(letters))) {
        return letters + QLatin1Char('-') + digits;
    }
    return std::nullopt;
}

std::optional<QString> numberedEquipmentCanonical(const QString& compact)
{
    static const QHash<QString, QString> kPrefixes = {
        {QStringLiteral("ME"),  QStringLiteral("MAIN_ENGINE")},
        {QStringLiteral("DG"),  QStringLiteral("GENERATOR")},
        {QStringLiteral("GEN"), QStringLiteral("GENERATOR")},
        {QStringLiteral("AE"),  QStringLiteral("AUX_ENGINE")},
        {QStringLiteral("WM"),  QStringLiteral("WATERMAKER")},
    };

    QString letters;
    QString digits;
    if (!splitLettersDigits(compact, &letters, &digits) || digits.size() > 2) {
        return std::nullopt;
    }
    const auto it = kPrefixes.constFind(letters);
    if (it == kPrefixes.constEnd()) {
        return std::nullopt;
    }
    return it.value() + QLatin1Char('_') + QString::number(digits.toInt());
}

std::optional<QString> faultCodeCanonical(const QString& compact, bool hyphenated)
{
    QString letters;
    QString digits;
    if (!splitLettersDigits(compact, &letters, &digits)) {
        return std::nullopt;
    }

    if (letters.size() == 1) {
        const char16_t prefix = letters.at(0).unicode();
        const bool manufacturerFamily = prefix == 'E' || prefix == 'G' || prefix == 'H' || prefix == 'F';
        const bool obdFamily = prefix == 'P' || prefix == 'B' || prefix == 'C' || prefix == 'U';
        if (manufacturerFamily && (digits.size() == 3 || digits.size() == 4)) {
            return compact;
        }
        if (obdFamily && digits.size() == 4) {
            return compact;
        }
        return std::nullopt;
    }

    if (hyphenated && letters.size() <= 4 && (digits.size() == 2 || digits.size() == 3)) {
        return letters + QLatin1Char('-') + digits;
    }
    return std::nullopt;
}

// 16V2000, 12V4000M93
std::optional<QString> veeModelCanonical(const QString& compact)
{
    int i = 0;
    while (i < compact.size() && isAsciiDigit(compact.at(i))) {
        ++i;
    }
    if (i == 0 || i > 2 || i >= compact.size() || compact.at(i) != QLatin1Char('V')) {
        return std::nullopt;
    }
    const int modelStart = ++i;
    while (i < compact.size() && isAsciiDigit(compact.at(i))) {
        ++i;
    }
    const int modelDigits = i - modelStart;
    if (modelDigits < 3 || modelDigits > 4 || compact.size() - i > 3) {
        return std::nullopt;
    }
    return compact;
}

// C32, 3512C, QSM11, D13 following a manufacturer name.
bool hasModelShape(const QString& compact)
{
    if (compact.isEmpty() || compact.size() > 10) {
        return false;
    }
    int i = 0;
    while (i < compact.size() && isAsciiUpper(compact.at(i))) {
        ++i;
    }
    if (i > 3 || i == compact.size() || !isAsciiDigit(compact.at(i))) {
        return false;
    }
    int digits = 0;
    for (QChar ch : compact) {
        if (isAsciiDigit(ch)) {
            ++digits;
        }
    }
    return digits >= 2;
}

std::optional<QString> parseNumber(const QString& s)
{
    int separator = -1;
    for (int i = 0; i < s.size(); ++i) {
        const QChar ch = s.at(i);
        if (isAsciiDigit(ch)) {
            continue;
        }
        if ((ch == QLatin1Char('.') || ch == QLatin1Char(',')) && separator < 0) {
            separator = i;
            continue;
        }
        return std::nullopt;
    }

    if (separator < 0) {
        if (s.isEmpty() || s.size() > 7) {
            return std::nullopt;
        }
        return s;
    }

    const QString whole = s.left(separator);
    const QString fraction = s.mid(separator + 1);
    if (whole.isEmpty() || whole.size() > 7 || fraction.isEmpty() || fraction.size() > 3) {
        return std::nullopt;
    }
    // "1,800" groups thousands; "2,5" is a decimal comma.
    if (s.at(separator) == QLatin1Char(',') && fraction.size() == 3 && whole.size() <= 3) {
        return whole + fraction;
    }
    return whole + QLatin1Char('.') + fraction;
}

std::optional<QString> attachedMeasurement(const QString& upper)
{
    int i = 0;
    while (i < upper.size()
           && (isAsciiDigit(upper.at(i)) || upper.at(i) == QLatin1Char('.')
               || upper.at(i) == QLatin1Char(','))) {
        ++i;
    }
    if (i == 0 || i == upper.size()) {
        return std::nullopt;
    }

    const auto value = parseNumber(upper.left(i));
    if (!value) {
        return std::nullopt;
    }

    int unitStart = i;
    if (upper.at(unitStart) == QLatin1Char('_')) {
        ++unitStart;
    }
    const auto unit = IdentifierScanner::unitName(upper.mid(unitStart).toLower(), true);
    if (!unit) {
        return std::nullopt;
    }
    return *value + QLatin1Char('_') + *unit;
}

std::optional<Candidate> classifyWindow(const QString& compact, bool windowed)
{
    if (compact.isEmpty()) {
        return std::nullopt;
    }
    if (auto c = spnCanonical(compact)) {
        return Candidate{IdentifierKind::FaultCode, *c};
    }
    if (auto c = workOrderCanonical(compact)) {
        return Candidate{IdentifierKind::WorkOrder, *c};
    }
    if (auto c = partNumberCanonical(compact)) {
        return Candidate{IdentifierKind::PartNumber, *c};
    }
    if (auto c = equipmentCodeCanonical(compact, windowed)) {
        return Candidate{IdentifierKind::EquipmentCode, *c};
    }
    if (auto c = alarmCanonical(compact, true)) {
        return Candidate{IdentifierKind::FaultCode, *c};
    }
    return std::nullopt;
}

std::optional<Candidate> classifyToken(const QString& upper)
{
    if (auto measurement = attachedMeasurement(upper)) {
        return Candidate{IdentifierKind::Measurement, *measurement};
    }

    const QString compact = compactOf(upper);
    if (compact.isEmpty()) {
        return std::nullopt;
    }
    if (auto c = classifyWindow(compact, false)) {
        return c;
    }
    if (auto c = alarmCanonical(compact, false)) {
        return Candidate{IdentifierKind::FaultCode, *c};
    }
    if (auto c = numberedEquipmentCanonical(compact)) {
        return Candidate{IdentifierKind::NumberedEquipment, *c};
    }
    if (auto c = faultCodeCanonical(compact, upper.contains(QLatin1Char('-')))) {
        return Candidate{IdentifierKind::FaultCode, *c};
    }
    if (auto c = veeModelCanonical(compact)) {
        return Candidate{IdentifierKind::ModelNumber, *c};
    }
    return std::nullopt;
}

IdentifierMatch makeMatch(const QString& text, int start, int end, const Candidate& candidate)
{
    IdentifierMatch match;
    match.kind = candidate.kind;
    match.text = text.mid(start, end - start);
    match.start = start;
    match.end = end;
    match.canonical = candidate.canonical;
    return match;
}

} // namespace

std::optional<QString> IdentifierScanner::manufacturerName(const QString& word)
{
    static const QHash<QString, QString> kManufacturers = {
        {QStringLiteral("cat"),         QStringLiteral("CATERPILLAR")},
        {QStringLiteral("caterpillar"), QStringLiteral("CATERPILLAR")},
        {QStringLiteral("mtu"),         QStringLiteral("MTU")},
        {QStringLiteral("cummins"),     QStringLiteral("CUMMINS")},
        {QStringLiteral("volvo"),       QStringLiteral("VOLVO")},
        {QStringLiteral("yanmar"),      QStringLiteral("YANMAR")},
        {QStringLiteral("perkins"),     QStringLiteral("PERKINS")},
        {QStringLiteral("detroit"),     QStringLiteral("DETROIT")},
        {QStringLiteral("kohler"),      QStringLiteral("KOHLER")},
        {QStringLiteral("onan"),        QStringLiteral("ONAN")},
        {QStringLiteral("scania"),      QStringLiteral("SCANIA")},
        {QStringLiteral("deere"),       QStringLiteral("DEERE")},
        {QStringLiteral("wartsila"),    QStringLiteral("WARTSILA")},
        {QStringLiteral("northern"),    QStringLiteral("NORTHERN_LIGHTS")},
    };

    const auto it = kManufacturers.constFind(word.toLower());
    if (it == kManufacturers.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

std::optional<QString> IdentifierScanner::unitName(const QString& unit, bool attached)
{
    static const QHash<QString, QString> kUnits = {
        {QStringLiteral("v"),          QStringLiteral("V")},
        {QStringLiteral("volt"),       QStringLiteral("V")},
        {QStringLiteral("volts"),      QStringLiteral("V")},
        {QStringLiteral("vdc"),        QStringLiteral("V")},
        {QStringLiteral("vac"),        QStringLiteral("V")},
        {QStringLiteral("a"),          QStringLiteral("A")},
        {QStringLiteral("amp"),        QStringLiteral("A")},
        {QStringLiteral("amps"),       QStringLiteral("A")},
        {QStringLiteral("ampere"),     QStringLiteral("A")},
        {QStringLiteral("amperes"),    QStringLiteral("A")},
        {QStringLiteral("ma"),         QStringLiteral("MA")},
        {QStringLiteral("c"),          QStringLiteral("C")},
        {QStringLiteral("°c"),    QStringLiteral("C")},
        {QStringLiteral("degc"),       QStringLiteral("C")},
        {QStringLiteral("celsius"),    QStringLiteral("C")},
        {QStringLiteral("f"),          QStringLiteral("F")},
        {QStringLiteral("°f"),    QStringLiteral("F")},
        {QStringLiteral("degf"),       QStringLiteral("F")},
        {QStringLiteral("fahrenheit"), QStringLiteral("F")},
        {QStringLiteral("°"),     QStringLiteral("DEG")},
        {QStringLiteral("deg"),        QStringLiteral("DEG")},
        {QStringLiteral("degree"),     QStringLiteral("DEG")},
        {QStringLiteral("degrees"),    QStringLiteral("DEG")},
        {QStringLiteral("bar"),        QStringLiteral("BAR")},
        {QStringLiteral("mbar"),       QStringLiteral("MBAR")},
        {QStringLiteral("psi"),        QStringLiteral("PSI")},
        {QStringLiteral("kpa"),        QStringLiteral("KPA")},
        {QStringLiteral("mpa"),        QStringLiteral("MPA")},
        {QStringLiteral("rpm"),        QStringLiteral("RPM")},
        {QStringLiteral("rev/min"),    QStringLiteral("RPM")},
        {QStringLiteral("r/min"),      QStringLiteral("RPM")},
        {QStringLiteral("hz"),         QStringLiteral("HZ")},
        {QStringLiteral("khz"),        QStringLiteral("KHZ")},
        {QStringLiteral("kw"),         QStringLiteral("KW")},
        {QStringLiteral("kva"),        QStringLiteral("KVA")},
        {QStringLiteral("w"),          QStringLiteral("W")},
        {QStringLiteral("watt"),       QStringLiteral("W")},
        {QStringLiteral("watts"),      QStringLiteral("W")},
        {QStringLiteral("hp"),         QStringLiteral("HP")},
        {QStringLiteral("bhp"),        QStringLiteral("HP")},
        {QStringLiteral("%"),          QStringLiteral("PCT")},
        {QStringLiteral("pct"),        QStringLiteral("PCT")},
        {QStringLiteral("percent"),    QStringLiteral("PCT")},
        {QStringLiteral("lph"),        QStringLiteral("LPH")},
        {QStringLiteral("l/h"),        QStringLiteral("LPH")},
        {QStringLiteral("lpm"),        QStringLiteral("LPM")},
        {QStringLiteral("l/min"),      QStringLiteral("LPM")},
        {QStringLiteral("gph"),        QStringLiteral("GPH")},
        {QStringLiteral("gpm"),        QStringLiteral("GPM")},
        {QStringLiteral("kn"),         QStringLiteral("KN")},
        {QStringLiteral("kt"),         QStringLiteral("KN")},
        {QStringLiteral("kts"),        QStringLiteral("KN")},
        {QStringLiteral("knot"),       QStringLiteral("KN")},
        {QStringLiteral("knots"),      QStringLiteral("KN")},
    };

    const auto it = kUnits.constFind(unit);
    if (it == kUnits.constEnd()) {
        return std::nullopt;
    }
    // A bare letter only reads as a unit when glued to its number ("24v").
    if (!attached && unit.size() == 1 && unit.at(0).isLetter()) {
        return std::nullopt;
    }
    return it.value();
}

std::vector<IdentifierMatch> IdentifierScanner::scan(const QString& text)
{
    std::vector<IdentifierMatch> matches;
    const std::vector<Token> tokens = tokenize(text);
    const size_t count = tokens.size();

    size_t i = 0;
    while (i < count) {
        const Token& first = tokens[i];

        // Multi-token structured identifiers: "ENG 0008 103", "spn 100 fmi 3".
        bool matched = false;
        for (size_t width = std::min<size_t>(kMaxWindow, count - i); width >= 2; --width) {
            QString joined;
            bool joinable = true;
            for (size_t k = i; k < i + width; ++k) {
                if (k > i && !gapIsJoinable(text, tokens[k - 1].end, tokens[k].start)) {
                    joinable = false;
                    break;
                }
                joined += tokens[k].upper;
            }
            if (!joinable) {
                continue;
            }
            const auto candidate = classifyWindow(compactOf(joined), true);
            if (candidate) {
                const Token& last = tokens[i + width - 1];
                matches.push_back(makeMatch(text, first.start, last.end, *candidate));
                i += width;
                matched = true;
                break;
            }
        }
        if (matched) {
            continue;
        }

        // Manufacturer followed by a model designation: "CAT 3512".
        if (i + 1 < count && gapIsSpace(text, first.end, tokens[i + 1].start)) {
            const auto manufacturer = manufacturerName(first.upper);
            const QString model = compactOf(tokens[i + 1].upper);
            if (manufacturer && hasModelShape(model)) {
                const Candidate candidate{IdentifierKind::ModelNumber,
                                          *manufacturer + QLatin1Char('_') + model};
                matches.push_back(makeMatch(text, first.start, tokens[i + 1].end, candidate));
                i += 2;
                continue;
            }
        }

        // Number followed by a unit word: "3 bar", "95 degrees c".
        if (i + 1 < count && gapIsSpace(text, first.end, tokens[i + 1].start)) {
            const auto value = parseNumber(first.upper);
            const auto unit = unitName(tokens[i + 1].upper.toLower(), false);
            if (value && unit) {
                size_t last = i + 1;
                QString resolvedUnit = *unit;
                if (resolvedUnit == QLatin1String("DEG") && i + 2 < count
                    && gapIsSpace(text, tokens[i + 1].end, tokens[i + 2].start)) {
                    const QString scale = tokens[i + 2].upper.toLower();
                    if (scale == QLatin1String("c") || scale == QLatin1String("celsius")) {
                        resolvedUnit = QStringLiteral("C");
                        last = i + 2;
                    } else if (scale == QLatin1String("f") || scale == QLatin1String("fahrenheit")) {
                        resolvedUnit = QStringLiteral("F");
                        last = i + 2;
                    }
                }
                const Candidate candidate{IdentifierKind::Measurement,
                                          *value + QLatin1Char('_') + resolvedUnit};
                matches.push_back(makeMatch(text, first.start, tokens[last].end, candidate));
                i = last + 1;
                continue;
            }
        }

        if (const auto candidate = classifyToken(first.upper)) {
            matches.push_back(makeMatch(text, first.start, first.end, *candidate));
            ++i;
            continue;
        }

        // "E047/E048": try each slash-separated piece on its own.
        if (first.upper.contains(QLatin1Char('/'))) {
            int pieceStart = first.start;
            const QString source = text.mid(first.start, first.end - first.start);
            const QStringList pieces = source.split(QLatin1Char('/'));
            for (const QString& piece : pieces) {
                const auto candidate = classifyToken(piece.toUpper());
                if (candidate && candidate->kind != IdentifierKind::Measurement) {
                    matches.push_back(makeMatch(text, pieceStart, pieceStart + piece.size(), *candidate));
                }
                pieceStart += piece.size() + 1;
            }
        }
        ++i;
    }

    return matches;
}

std::optional<IdentifierMatch> IdentifierScanner::parseWhole(const QString& value)
{
    const QString trimmed = value.trimmed();
    if (trimmed.isEmpty()) {
        return std::nullopt;
    }
    const std::vector<IdentifierMatch> matches = scan(trimmed);
    if (matches.size() != 1) {
        return std::nullopt;
    }
    if (matches.front().start != 0 || matches.front().end != trimmed.size()) {
        return std::nullopt;
    }
    return matches.front();
}

} // namespace hq
