#include <QtTest/QtTest>

#include "core/query/lane_classifier.h"
#include "core/query/query_normalizer.h"

namespace {

hq::LaneDecision classify(const QString& raw)
{
    return hq::LaneClassifier::classify(hq::QueryNormalizer::normalize(raw).stripped);
}

QString stripped(const QString& raw)
{
    return hq::QueryNormalizer::normalize(raw).stripped;
}

} // namespace

class TestLaneClassifier : public QObject {
    Q_OBJECT

private slots:
    void testEllipticalAbbreviation();
    void testEllipticalWorkOrder();
    void testEllipticalLogHours();
    void testImplicitCompletedWork();
    void testImplicitReorder();
    void testImplicitReading();
    void testCommandVerb();
    void testCommandNeedsObject();
    void testDirectLookupIdentifier();
    void testDirectLookupListFilter();
    void testDirectLookupPhrase();
    void testMutationSuppressesLookup();
    void testDiagnosticSuppressesLookup();
    void testGptTriggers();
    void testUnknownFallback();
    void testCascadeOrder();
    void testEvaluateFamilyInIsolation();
    void testAnalyzeSignals();
};

void TestLaneClassifier::testEllipticalAbbreviation()
{
    for (const QString& raw : {QStringLiteral("ME1"), QStringLiteral("WM"),
                               QStringLiteral("dg2"), QStringLiteral("genset")}) {
        const hq::LaneDecision decision = classify(raw);
        QCOMPARE(decision.lane, hq::Lane::RulesOnly);
        QCOMPARE(decision.reason, QStringLiteral("elliptical_equipment_abbrev"));
        QCOMPARE(decision.family, hq::RuleFamily::Elliptical);
    }
}

void TestLaneClassifier::testEllipticalWorkOrder()
{
    const hq::LaneDecision decision = classify(QStringLiteral("new wo for bilge pump"));
    QCOMPARE(decision.lane, hq::Lane::RulesOnly);
    QCOMPARE(decision.reason, QStringLiteral("elliptical_work_order"));
}

void TestLaneClassifier::testEllipticalLogHours()
{
    const hq::LaneDecision decision = classify(QStringLiteral("ME1 hours 1200"));
    QCOMPARE(decision.lane, hq::Lane::RulesOnly);
    QCOMPARE(decision.reason, QStringLiteral("elliptical_log_hours"));
}

void TestLaneClassifier::testImplicitCompletedWork()
{
    for (const QString& raw : {QStringLiteral("replaced the impeller on the sea water pump"),
                               QStringLiteral("changed oil on ME1")}) {
        const hq::LaneDecision decision = classify(raw);
        QCOMPARE(decision.lane, hq::Lane::RulesOnly);
        QCOMPARE(decision.reason, QStringLiteral("implicit_action_completed_work"));
        QCOMPARE(decision.family, hq::RuleFamily::ImplicitAction);
    }
}

void TestLaneClassifier::testImplicitReorder()
{
    const hq::LaneDecision decision = classify(QStringLiteral("ran out of oil filters"));
    QCOMPARE(decision.lane, hq::Lane::RulesOnly);
    QCOMPARE(decision.reason, QStringLiteral("implicit_action_reorder"));
}

void TestLaneClassifier::testImplicitReading()
{
    const hq::LaneDecision decision = classify(QStringLiteral("ME1 hours are 1200"));
    QCOMPARE(decision.lane, hq::Lane::RulesOnly);
    QCOMPARE(decision.reason, QStringLiteral("implicit_action_reading"));
}

void TestLaneClassifier::testCommandVerb()
{
    for (const QString& raw : {QStringLiteral("create work order for bilge pump"),
                               QStringLiteral("please create a work order for the bilge pump thanks"),
                               QStringLiteral("add note to ME1")}) {
        const hq::LaneDecision decision = classify(raw);
        QCOMPARE(decision.lane, hq::Lane::RulesOnly);
        QCOMPARE(decision.reason, QStringLiteral("command_verb"));
        QCOMPARE(decision.family, hq::RuleFamily::Command);
        QCOMPARE(decision.confidence, 0.90f);
    }
}

void TestLaneClassifier::testCommandNeedsObject()
{
    const hq::LaneDecision decision = classify(QStringLiteral("create something nice"));
    QCOMPARE(decision.lane, hq::Lane::Unknown);
    QCOMPARE(decision.reason, QStringLiteral("no_pattern_matched"));
}

void TestLaneClassifier::testDirectLookupIdentifier()
{
    for (const QString& raw : {QStringLiteral("E047"), QStringLiteral("WO-2024-001"),
                               QStringLiteral("show me the oil filter for ME1")}) {
        const hq::LaneDecision decision = classify(raw);
        QCOMPARE(decision.lane, hq::Lane::NoLlm);
        QCOMPARE(decision.reason, QStringLiteral("direct_lookup_identifier"));
        QCOMPARE(decision.family, hq::RuleFamily::DirectLookup);
    }
}

void TestLaneClassifier::testDirectLookupListFilter()
{
    for (const QString& raw : {QStringLiteral("pending work orders"),
                               QStringLiteral("open work orders"),
                               QStringLiteral("out of stock parts")}) {
        const hq::LaneDecision decision = classify(raw);
        QCOMPARE(decision.lane, hq::Lane::NoLlm);
        QCOMPARE(decision.reason, QStringLiteral("direct_lookup_list_filter"));
    }
}

void TestLaneClassifier::testDirectLookupPhrase()
{
    const hq::LaneDecision decision = classify(QStringLiteral("where is the oil filter"));
    QCOMPARE(decision.lane, hq::Lane::NoLlm);
    QCOMPARE(decision.reason, QStringLiteral("direct_lookup_phrase"));

    // No domain object after the lead.
    QCOMPARE(classify(QStringLiteral("show me that")).lane, hq::Lane::Unknown);
}

void TestLaneClassifier::testMutationSuppressesLookup()
{
    const hq::LaneDecision decision = classify(QStringLiteral("show me ME1 and update the hours"));
    QVERIFY(decision.lane != hq::Lane::NoLlm);
}

void TestLaneClassifier::testDiagnosticSuppressesLookup()
{
    const hq::LaneDecision decision = classify(QStringLiteral("diagnose E047 on ME1"));
    QCOMPARE(decision.lane, hq::Lane::Gpt);
    QCOMPARE(decision.reason, QStringLiteral("gpt_diagnosis_intent"));
}

void TestLaneClassifier::testGptTriggers()
{
    const hq::LaneDecision problem = classify(QStringLiteral("bilge pump overheating"));
    QCOMPARE(problem.lane, hq::Lane::Gpt);
    QCOMPARE(problem.reason, QStringLiteral("gpt_problem_vocabulary"));

    const hq::LaneDecision temporal = classify(QStringLiteral("the watermaker again since yesterday"));
    QCOMPARE(temporal.lane, hq::Lane::Gpt);
    QCOMPARE(temporal.reason, QStringLiteral("gpt_temporal_context"));

    const hq::LaneDecision why = classify(QStringLiteral("why is the watermaker pressure low"));
    QCOMPARE(why.lane, hq::Lane::Gpt);
    QCOMPARE(why.reason, QStringLiteral("gpt_diagnosis_intent"));
}

void TestLaneClassifier::testUnknownFallback()
{
    // Diagnostic or problem wording with nothing from the domain to reason about.
    for (const QString& raw : {QStringLiteral("bilge manifold"),
                               QStringLiteral("main engine generator watermaker AC"),
                               QStringLiteral("why do cats purr at night"),
                               QStringLiteral("it's happening again"),
                               QStringLiteral("what a weird problem")}) {
        const hq::LaneDecision decision = classify(raw);
        QCOMPARE(decision.lane, hq::Lane::Unknown);
        QCOMPARE(decision.reason, QStringLiteral("no_pattern_matched"));
        QCOMPARE(decision.family, hq::RuleFamily::Fallback);
        QCOMPARE(decision.confidence, 0.0f);
    }
}

void TestLaneClassifier::testCascadeOrder()
{
    const std::vector<hq::PatternRule>& cascade = hq::LaneClassifier::cascade();
    QVERIFY(!cascade.empty());

    int previous = static_cast<int>(hq::RuleFamily::Elliptical);
    for (const hq::PatternRule& rule : cascade) {
        const int family = static_cast<int>(rule.family);
        QVERIFY(family >= previous);
        QVERIFY(rule.reason != nullptr && rule.reason[0] != '\0');
        QVERIFY(rule.matches != nullptr);
        QVERIFY(rule.lane != hq::Lane::Blocked);
        previous = family;
    }
    QCOMPARE(cascade.front().family, hq::RuleFamily::Elliptical);
    QCOMPARE(cascade.back().family, hq::RuleFamily::GptTrigger);

    // Completed work is reported even though ME1 alone would be a lookup.
    QCOMPARE(classify(QStringLiteral("replaced the impeller on ME1")).reason,
             QStringLiteral("implicit_action_completed_work"));
}

void TestLaneClassifier::testEvaluateFamilyInIsolation()
{
    const std::optional<hq::LaneDecision> lookup = hq::LaneClassifier::evaluateFamily(
        hq::RuleFamily::DirectLookup, stripped(QStringLiteral("replaced the impeller on ME1")));
    QVERIFY(lookup.has_value());
    QCOMPARE(lookup->reason, QStringLiteral("direct_lookup_identifier"));

    const std::optional<hq::LaneDecision> gpt = hq::LaneClassifier::evaluateFamily(
        hq::RuleFamily::GptTrigger, stripped(QStringLiteral("diagnose E047 on ME1")));
    QVERIFY(gpt.has_value());
    QCOMPARE(gpt->lane, hq::Lane::Gpt);

    QVERIFY(!hq::LaneClassifier::evaluateFamily(hq::RuleFamily::Command,
                                                stripped(QStringLiteral("ME1"))).has_value());
}

void TestLaneClassifier::testAnalyzeSignals()
{
    const hq::QuerySignals oil = hq::LaneClassifier::analyze(stripped(QStringLiteral("oil pressure 3 bar")));
    QVERIFY(oil.hasNumber);
    QVERIFY(!oil.hasLookupIdentifier);
    QVERIFY(oil.hasDomainNoun);
    QCOMPARE(oil.tokenCount, 4);

    const hq::QuerySignals command =
        hq::LaneClassifier::analyze(stripped(QStringLiteral("create work order for bilge pump")));
    QVERIFY(command.commandWithObject);
    QVERIFY(command.hasMutationVerb);
    QVERIFY(!command.hasDiagnosticSignal());
}

QTEST_MAIN(TestLaneClassifier)
#include "test_lane_classifier.moc"
