#include <QtTest/QtTest>
#include <QJsonArray>
#include <QJsonDocument>

#include "core/query/classification_result.h"

class TestClassificationResult : public QObject {
    Q_OBJECT

private slots:
    void testLaneStrings();
    void testLaneFromStringIsLenient();
    void testEntityTypeStrings();
    void testMeanConfidence();
    void testJsonShape();
    void testJsonRoundsScores();
};

void TestClassificationResult::testLaneStrings()
{
    QCOMPARE(hq::laneToString(hq::Lane::Blocked), QStringLiteral("BLOCKED"));
    QCOMPARE(hq::laneToString(hq::Lane::Unknown), QStringLiteral("UNKNOWN"));
    QCOMPARE(hq::laneToString(hq::Lane::NoLlm), QStringLiteral("NO_LLM"));
    QCOMPARE(hq::laneToString(hq::Lane::RulesOnly), QStringLiteral("RULES_ONLY"));
    QCOMPARE(hq::laneToString(hq::Lane::Gpt), QStringLiteral("GPT"));

    for (hq::Lane lane : {hq::Lane::Blocked, hq::Lane::Unknown, hq::Lane::NoLlm,
                          hq::Lane::RulesOnly, hq::Lane::Gpt}) {
        QCOMPARE(hq::laneFromString(hq::laneToString(lane)), lane);
    }
}

void TestClassificationResult::testLaneFromStringIsLenient()
{
    QCOMPARE(hq::laneFromString(QStringLiteral("no_llm")), hq::Lane::NoLlm);
    QCOMPARE(hq::laneFromString(QStringLiteral(" Rules_Only ")), hq::Lane::RulesOnly);
    QCOMPARE(hq::laneFromString(QStringLiteral("garbage")), hq::Lane::Unknown);
    QCOMPARE(hq::laneFromString(QString()), hq::Lane::Unknown);
}

void TestClassificationResult::testEntityTypeStrings()
{
    for (hq::EntityType type : {hq::EntityType::FaultCode, hq::EntityType::WorkOrder,
                                hq::EntityType::Equipment, hq::EntityType::Part,
                                hq::EntityType::System, hq::EntityType::Measurement,
                                hq::EntityType::MaritimeTerm}) {
        const std::optional<hq::EntityType> parsed =
            hq::entityTypeFromString(hq::entityTypeToString(type));
        QVERIFY(parsed.has_value());
        QCOMPARE(*parsed, type);
    }
    QCOMPARE(hq::entityTypeToString(hq::EntityType::FaultCode), QStringLiteral("fault_code"));
    QVERIFY(!hq::entityTypeFromString(QStringLiteral("person")).has_value());
}

void TestClassificationResult::testMeanConfidence()
{
    QCOMPARE(hq::meanConfidence({}), 0.0f);

    hq::CanonicalEntity high;
    high.confidence = 0.9f;
    hq::CanonicalEntity low;
    low.confidence = 0.7f;
    QVERIFY(qAbs(hq::meanConfidence({high, low}) - 0.8f) < 1e-6f);
}

void TestClassificationResult::testJsonShape()
{
    hq::ClassificationResult result;
    result.lane = hq::Lane::NoLlm;
    result.laneReason = QStringLiteral("direct_lookup_identifier");
    result.family = hq::RuleFamily::DirectLookup;
    result.intentConfidence = 0.92f;

    hq::ExtractedEntity entity;
    entity.type = hq::EntityType::Equipment;
    entity.value = QStringLiteral("ME1");
    entity.confidence = 0.92f;
    entity.span = hq::Span{8, 11};
    result.entities.push_back(entity);

    hq::CanonicalEntity canonical;
    canonical.type = hq::EntityType::Equipment;
    canonical.value = QStringLiteral("ME1");
    canonical.canonical = QStringLiteral("MAIN_ENGINE_1");
    canonical.confidence = 0.92f;
    canonical.weight = 0.95f;
    canonical.occurrences = 1;
    result.canonicalEntities.push_back(canonical);
    result.entityConfidence = hq::meanConfidence(result.canonicalEntities);
    result.latencyMs = 0.25;

    const QJsonObject json = result.toJson();
    QCOMPARE(json.value(QStringLiteral("lane")).toString(), QStringLiteral("NO_LLM"));
    QCOMPARE(json.value(QStringLiteral("lane_reason")).toString(),
             QStringLiteral("direct_lookup_identifier"));

    const QJsonArray entities = json.value(QStringLiteral("entities")).toArray();
    QCOMPARE(entities.size(), 1);
    const QJsonObject first = entities.at(0).toObject();
    QCOMPARE(first.value(QStringLiteral("type")).toString(), QStringLiteral("equipment"));
    QCOMPARE(first.value(QStringLiteral("value")).toString(), QStringLiteral("ME1"));
    const QJsonObject span = first.value(QStringLiteral("span")).toObject();
    QCOMPARE(span.value(QStringLiteral("start")).toInt(), 8);
    QCOMPARE(span.value(QStringLiteral("end")).toInt(), 11);

    const QJsonArray canonicalEntities = json.value(QStringLiteral("canonical_entities")).toArray();
    QCOMPARE(canonicalEntities.size(), 1);
    const QJsonObject canonicalJson = canonicalEntities.at(0).toObject();
    QCOMPARE(canonicalJson.value(QStringLiteral("canonical")).toString(),
             QStringLiteral("MAIN_ENGINE_1"));
    QCOMPARE(canonicalJson.value(QStringLiteral("weight")).toDouble(), 0.95);
    QCOMPARE(canonicalJson.value(QStringLiteral("occurrences")).toInt(), 1);

    const QJsonObject scores = json.value(QStringLiteral("scores")).toObject();
    QVERIFY(scores.contains(QStringLiteral("intent_confidence")));
    QVERIFY(scores.contains(QStringLiteral("entity_confidence")));

    const QJsonObject metadata = json.value(QStringLiteral("metadata")).toObject();
    QCOMPARE(metadata.value(QStringLiteral("entity_count")).toInt(), 1);
    QCOMPARE(metadata.value(QStringLiteral("latency_ms")).toDouble(), 0.25);

    // Serializes cleanly.
    QVERIFY(!QJsonDocument(json).toJson(QJsonDocument::Compact).isEmpty());
}

void TestClassificationResult::testJsonRoundsScores()
{
    hq::ClassificationResult result;
    result.intentConfidence = 0.92f;
    result.entityConfidence = 0.0f;
    result.latencyMs = 1.23456;

    const QJsonObject json = result.toJson();
    const QJsonObject scores = json.value(QStringLiteral("scores")).toObject();
    QCOMPARE(scores.value(QStringLiteral("intent_confidence")).toDouble(), 0.92);
    QCOMPARE(scores.value(QStringLiteral("entity_confidence")).toDouble(), 0.0);
    QCOMPARE(json.value(QStringLiteral("metadata")).toObject()
                 .value(QStringLiteral("latency_ms")).toDouble(), 1.235);
    QCOMPARE(json.value(QStringLiteral("lane")).toString(), QStringLiteral("UNKNOWN"));
    QVERIFY(json.value(QStringLiteral("entities")).toArray().isEmpty());
}

QTEST_MAIN(TestClassificationResult)
#include "test_classification_result.moc"
