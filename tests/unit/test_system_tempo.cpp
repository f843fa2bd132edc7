#include <gtest/gtest.h>
#include <roundabout/roundabout.hpp>

using namespace roundabout;

// ===========================================================================
// Error-rate ladder
// ===========================================================================

TEST(SystemTempoTest, StartsAtHighPerformance) {
    SystemTempoController tempo;
    EXPECT_EQ(tempo.current(), SystemTempo::HighPerformance);
}

TEST(SystemTempoTest, DegradesOneStepPerEvaluation) {
    SystemTempoController tempo;

    // Even a signal above the sleep threshold moves one step only
    auto change = tempo.evaluate_error_rate(0.95);
    ASSERT_TRUE(change.has_value());
    EXPECT_EQ(change->from, SystemTempo::HighPerformance);
    EXPECT_EQ(change->to, SystemTempo::LowIntensity);

    change = tempo.evaluate_error_rate(0.95);
    ASSERT_TRUE(change.has_value());
    EXPECT_EQ(change->to, SystemTempo::Sleep);

    EXPECT_FALSE(tempo.evaluate_error_rate(0.95).has_value());
}

TEST(SystemTempoTest, HysteresisHoldsBetweenThresholds) {
    SystemTempoController tempo;
    tempo.evaluate_error_rate(0.6);
    ASSERT_EQ(tempo.current(), SystemTempo::LowIntensity);

    // Below degrade_to_low but above recover_to_high: stay
    EXPECT_FALSE(tempo.evaluate_error_rate(0.3).has_value());
    EXPECT_FALSE(tempo.evaluate_error_rate(0.05).has_value());
    EXPECT_EQ(tempo.current(), SystemTempo::LowIntensity);

    auto change = tempo.evaluate_error_rate(0.04);
    ASSERT_TRUE(change.has_value());
    EXPECT_EQ(change->to, SystemTempo::HighPerformance);
}

TEST(SystemTempoTest, RecoversFromSleepOneStepAtATime) {
    SystemTempoController tempo;
    tempo.set(SystemTempo::Sleep);

    EXPECT_FALSE(tempo.evaluate_error_rate(0.2).has_value());

    auto change = tempo.evaluate_error_rate(0.0);
    ASSERT_TRUE(change.has_value());
    EXPECT_EQ(change->from, SystemTempo::Sleep);
    EXPECT_EQ(change->to, SystemTempo::LowIntensity);

    change = tempo.evaluate_error_rate(0.0);
    ASSERT_TRUE(change.has_value());
    EXPECT_EQ(change->to, SystemTempo::HighPerformance);
}

// ===========================================================================
// Cost-spike ladder
// ===========================================================================

TEST(SystemTempoTest, CostSpikeUsesItsOwnThresholds) {
    SystemTempoController tempo;
    EXPECT_FALSE(tempo.evaluate_cost_spike(3.0).has_value());
    EXPECT_TRUE(tempo.evaluate_cost_spike(3.1).has_value());
    EXPECT_EQ(tempo.current(), SystemTempo::LowIntensity);

    EXPECT_FALSE(tempo.evaluate_cost_spike(1.3).has_value());
    EXPECT_TRUE(tempo.evaluate_cost_spike(1.1).has_value());
    EXPECT_EQ(tempo.current(), SystemTempo::HighPerformance);
}

TEST(SystemTempoTest, SetReportsOnlyRealChanges) {
    SystemTempoController tempo;
    EXPECT_FALSE(tempo.set(SystemTempo::HighPerformance).has_value());
    auto change = tempo.set(SystemTempo::Sleep);
    ASSERT_TRUE(change.has_value());
    EXPECT_EQ(change->from, SystemTempo::HighPerformance);
}

// ===========================================================================
// Estimate scaling
// ===========================================================================

TEST(SystemTempoTest, HighPerformanceLeavesEstimates) {
    SystemTempoController tempo;
    ResourceEstimate e{4, 40, 400, 12000};
    EXPECT_EQ(tempo.scale(OperationType::CloneAgent, e), e);
}

TEST(SystemTempoTest, LowIntensityHalvesCallsAndCompute) {
    SystemTempoController tempo;
    tempo.set(SystemTempo::LowIntensity);
    ResourceEstimate e{3, 41, 400, 12000};
    EXPECT_EQ(tempo.scale(OperationType::LlmCall, e), (ResourceEstimate{2, 21, 400, 12000}));
}

TEST(SystemTempoTest, SleepClampsAllButMemoryAccess) {
    SystemTempoController tempo;
    tempo.set(SystemTempo::Sleep);
    ResourceEstimate e{4, 40, 4096, 12000};

    EXPECT_EQ(tempo.scale(OperationType::ExternalApi, e), (ResourceEstimate{1, 1, 1024, 1000}));
    EXPECT_EQ(tempo.scale(OperationType::MemoryAccess, e), e);
}
