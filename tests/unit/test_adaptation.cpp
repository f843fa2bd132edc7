#include <gtest/gtest.h>
#include <roundabout/roundabout.hpp>

using namespace roundabout;
using namespace std::chrono_literals;

namespace {

FailureRecord failure(CognitivePhase phase, const std::string& error) {
    return FailureRecord{phase, error, Timestamp{}};
}

} // namespace

// ===========================================================================
// Failure analysis
// ===========================================================================

TEST(AdaptationTest, NoFailures) {
    auto a = analyze_failures({});
    EXPECT_EQ(a.severity, FailureSeverity::Minor);
    EXPECT_EQ(a.type, FailureType::Logic);
    EXPECT_EQ(a.pattern, "none");
    EXPECT_EQ(a.recommendation, "Retry with adjusted parameters");
}

TEST(AdaptationTest, SeverityGrowsWithCount) {
    std::vector<FailureRecord> f{failure(CognitivePhase::Emerge, "x")};
    EXPECT_EQ(analyze_failures(f).severity, FailureSeverity::Minor);
    EXPECT_EQ(analyze_failures(f).pattern, "isolated");

    f.push_back(failure(CognitivePhase::Emerge, "x"));
    EXPECT_EQ(analyze_failures(f).severity, FailureSeverity::Moderate);
    EXPECT_EQ(analyze_failures(f).pattern, "recurring-emerge");

    f.push_back(failure(CognitivePhase::Integrate, "x"));
    EXPECT_EQ(analyze_failures(f).severity, FailureSeverity::Critical);
    EXPECT_EQ(analyze_failures(f).pattern, "mixed-phase");
}

TEST(AdaptationTest, TypeFromMostRecentError) {
    auto type_of = [](const std::string& error) {
        return analyze_failures({failure(CognitivePhase::Emerge, error)}).type;
    };
    EXPECT_EQ(type_of("out of resource"), FailureType::Resource);
    EXPECT_EQ(type_of("quota hit"), FailureType::Resource);
    EXPECT_EQ(type_of("Model call timeout after 12000 ms"), FailureType::Timeout);
    EXPECT_EQ(type_of("external service down"), FailureType::External);
    EXPECT_EQ(type_of("API returned 500"), FailureType::External);
    EXPECT_EQ(type_of("bad reasoning"), FailureType::Logic);
}

TEST(AdaptationTest, RecommendationTable) {
    std::vector<FailureRecord> critical(3, failure(CognitivePhase::Emerge, "resource exhausted"));
    EXPECT_EQ(analyze_failures(critical).recommendation, "Halt and report resource exhaustion");

    std::vector<FailureRecord> moderate(2, failure(CognitivePhase::Emerge, "timeout"));
    EXPECT_EQ(analyze_failures(moderate).recommendation, "Break task into smaller chunks");
}

// ===========================================================================
// Strategic decision
// ===========================================================================

class StrategicDecisionTest : public ::testing::Test {
protected:
    DecisionFactors f;

    void SetUp() override {
        f.resources_available = true;
        f.failure_count = 1;
        f.recursion_depth = 0;
        f.max_recursion_depth = 5;
        f.time_elapsed = 1s;
        f.execution_time_budget_ms = 30000;
    }
};

TEST_F(StrategicDecisionTest, ProceedsWhenRecoverable) {
    auto d = make_strategic_decision(f);
    EXPECT_EQ(d.decision, Decision::Proceed);
    EXPECT_EQ(d.reason, "Failure is recoverable with new approach");
}

TEST_F(StrategicDecisionTest, HaltsWithoutResources) {
    f.resources_available = false;
    f.recursion_depth = 4;
    auto d = make_strategic_decision(f);
    EXPECT_EQ(d.decision, Decision::HaltAndReportFailure);
    EXPECT_EQ(d.reason, "Insufficient resources remaining");
}

TEST_F(StrategicDecisionTest, HaltsOnRepeatedCriticalFailures) {
    f.failure_count = 3;
    f.severity = FailureSeverity::Critical;
    EXPECT_EQ(make_strategic_decision(f).reason, "Multiple critical failures detected");

    f.severity = FailureSeverity::Moderate;
    EXPECT_EQ(make_strategic_decision(f).decision, Decision::Proceed);
}

TEST_F(StrategicDecisionTest, HaltsNearDepthLimit) {
    f.recursion_depth = 4;
    EXPECT_EQ(make_strategic_decision(f).reason, "Near maximum recursion depth");
    f.recursion_depth = 3;
    EXPECT_EQ(make_strategic_decision(f).decision, Decision::Proceed);
}

TEST_F(StrategicDecisionTest, HaltsPastEightyPercentOfTime) {
    f.time_elapsed = 24001ms;
    EXPECT_EQ(make_strategic_decision(f).reason, "Approaching execution time limit");
    f.time_elapsed = 24000ms;
    EXPECT_EQ(make_strategic_decision(f).decision, Decision::Proceed);
}

TEST_F(StrategicDecisionTest, ContextCarriesFactors) {
    f.failure_count = 2;
    auto d = make_strategic_decision(f);
    EXPECT_EQ(d.context.failure_count, 2u);
    EXPECT_STREQ(to_string(d.decision), "PROCEED");
}

// ===========================================================================
// Tactical plans
// ===========================================================================

TEST(TacticalPlanTest, ApproachFromFailureHistory) {
    EXPECT_EQ(select_approach({}), "conservative-retry-approach");
    EXPECT_EQ(select_approach({failure(CognitivePhase::Emerge, "execution failed")}),
              "alternative-logic-approach");
    EXPECT_EQ(select_approach({failure(CognitivePhase::Emerge, "execution failed"),
                               failure(CognitivePhase::Integrate, "no resource")}),
              "resource-optimized-approach");
}

TEST(TacticalPlanTest, ConfidenceFormula) {
    EXPECT_DOUBLE_EQ(plan_confidence("resource-optimized-approach", 1), 0.7);
    EXPECT_DOUBLE_EQ(plan_confidence("conservative-retry-approach", 1), 0.6);
    EXPECT_DOUBLE_EQ(plan_confidence("conservative-retry-approach", 10), 0.1);
    EXPECT_DOUBLE_EQ(plan_confidence("resource-optimized-approach", 0), 0.8);
}

TEST(TacticalPlanTest, SynthesizedPlan) {
    Timestamp now = Timestamp{} + 1h;
    auto plan = synthesize_tactical_plan("plan-1", {failure(CognitivePhase::Emerge, "x")}, now);
    EXPECT_EQ(plan.id, "plan-1");
    EXPECT_EQ(plan.approach, "conservative-retry-approach");
    EXPECT_DOUBLE_EQ(plan.confidence, 0.6);
    EXPECT_EQ(plan.created_at, now);
}

TEST(TacticalPlanTest, SuccessProbabilityClamped) {
    EXPECT_DOUBLE_EQ(success_probability(0, true), 0.8);
    EXPECT_DOUBLE_EQ(success_probability(2, true), 0.6);
    EXPECT_DOUBLE_EQ(success_probability(0, false), 0.5);
    EXPECT_DOUBLE_EQ(success_probability(9, true), 0.1);
}
