#include <gtest/gtest.h>
#include <roundabout/roundabout.hpp>

#include "test_support.hpp"

using namespace roundabout;
using namespace roundabout::testing;
using namespace std::chrono_literals;

// ===========================================================================
// Fixture: breaker on a manual clock with a low error threshold
// ===========================================================================

class CircuitBreakerTest : public ::testing::Test {
protected:
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<RecordingMonitor> monitor = std::make_shared<RecordingMonitor>();
    CircuitBreakerConfig cfg;
    std::unique_ptr<CircuitBreaker> breaker;

    void SetUp() override {
        cfg.error_rate_threshold = 0.3;
        breaker = std::make_unique<CircuitBreaker>(cfg, clock, monitor);
    }

    void record_errors(int n, std::size_t active = 1) {
        for (int i = 0; i < n; ++i) {
            breaker->record_error("agent-1", "boom", active);
        }
    }
};

// ===========================================================================
// Error rate
// ===========================================================================

TEST_F(CircuitBreakerTest, StartsClosed) {
    EXPECT_EQ(breaker->status(), CircuitStatus::Closed);
    EXPECT_FALSE(breaker->is_open());
    EXPECT_DOUBLE_EQ(breaker->error_rate(1), 0.0);
}

TEST_F(CircuitBreakerTest, ErrorRateUsesTenOperationsPerAgent) {
    record_errors(2, 1);
    EXPECT_DOUBLE_EQ(breaker->error_rate(1), 0.2);
    EXPECT_DOUBLE_EQ(breaker->error_rate(4), 0.05);
    // Never fewer than ten estimated operations
    EXPECT_DOUBLE_EQ(breaker->error_rate(0), 0.2);
}

TEST_F(CircuitBreakerTest, NeedsMinimumSamplesBeforeTripping) {
    record_errors(4);  // 0.4 > 0.3 but only four samples
    EXPECT_EQ(breaker->status(), CircuitStatus::Closed);

    auto signal = breaker->record_error("agent-1", "boom", 1);
    EXPECT_TRUE(signal.tripped);
    EXPECT_DOUBLE_EQ(signal.value, 0.5);
    EXPECT_EQ(breaker->status(), CircuitStatus::Open);
    EXPECT_EQ(monitor->count(EventType::CircuitBreakerOpened), 1u);
}

TEST_F(CircuitBreakerTest, OnlyTheTransitioningCallReportsTripped) {
    record_errors(5);
    auto again = breaker->record_error("agent-1", "boom", 1);
    EXPECT_FALSE(again.tripped);
    EXPECT_FALSE(breaker->trip("manual"));
    EXPECT_EQ(monitor->count(EventType::CircuitBreakerOpened), 1u);
}

TEST_F(CircuitBreakerTest, OldErrorsFallOutOfWindow) {
    record_errors(3);
    clock->advance(cfg.time_window);
    // Entries stamped exactly one window ago are dropped
    EXPECT_DOUBLE_EQ(breaker->error_rate(1), 0.0);
    EXPECT_TRUE(breaker->error_history().empty());
}

// ===========================================================================
// Cost spike
// ===========================================================================

TEST_F(CircuitBreakerTest, CostSpikeIsAverageOverBaseline) {
    breaker->record_cost("agent-1", 100.0);
    auto signal = breaker->record_cost("agent-1", 300.0);
    EXPECT_DOUBLE_EQ(signal.value, 2.0);
    EXPECT_FALSE(signal.tripped);
}

TEST_F(CircuitBreakerTest, CostSpikeTripsWithEnoughExpensiveSamples) {
    BreakerSignal last;
    for (int i = 0; i < 6; ++i) {
        last = breaker->record_cost("agent-1", 2000.0);
    }
    EXPECT_TRUE(last.tripped);
    EXPECT_DOUBLE_EQ(last.value, 20.0);
    EXPECT_TRUE(breaker->is_open());
}

TEST_F(CircuitBreakerTest, CheapSpikeDoesNotTrip) {
    // Ratio above threshold but average below the absolute floor
    CircuitBreakerConfig cheap = cfg;
    cheap.baseline_cost = 10.0;
    CircuitBreaker b(cheap, clock);
    for (int i = 0; i < 10; ++i) {
        b.record_cost("agent-1", 500.0);
    }
    EXPECT_EQ(b.status(), CircuitStatus::Closed);
}

// ===========================================================================
// Cooldown and half-open
// ===========================================================================

TEST_F(CircuitBreakerTest, CooldownMovesToHalfOpen) {
    ASSERT_TRUE(breaker->trip("test"));
    auto info = breaker->info(1);
    ASSERT_TRUE(info.next_retry_at.has_value());
    EXPECT_EQ(*info.next_retry_at, clock->now() + cfg.time_window);

    clock->advance(cfg.time_window - 1s);
    EXPECT_EQ(breaker->status(), CircuitStatus::Open);

    clock->advance(1s);
    EXPECT_EQ(breaker->status(), CircuitStatus::HalfOpen);
    EXPECT_EQ(monitor->count(EventType::CircuitBreakerHalfOpen), 1u);
}

TEST_F(CircuitBreakerTest, HalfOpenClosesAfterConsecutiveSuccesses) {
    breaker->trip("test");
    clock->advance(cfg.time_window);
    ASSERT_EQ(breaker->status(), CircuitStatus::HalfOpen);

    breaker->record_success();
    breaker->record_success();
    EXPECT_EQ(breaker->status(), CircuitStatus::HalfOpen);
    breaker->record_success();
    EXPECT_EQ(breaker->status(), CircuitStatus::Closed);
    EXPECT_EQ(monitor->count(EventType::CircuitBreakerClosed), 1u);
    EXPECT_FALSE(breaker->info(1).next_retry_at.has_value());
}

TEST_F(CircuitBreakerTest, TripInHalfOpenReopens) {
    breaker->trip("test");
    clock->advance(cfg.time_window);
    ASSERT_EQ(breaker->status(), CircuitStatus::HalfOpen);

    EXPECT_TRUE(breaker->trip("again"));
    EXPECT_EQ(breaker->status(), CircuitStatus::Open);
}

TEST_F(CircuitBreakerTest, SuccessWhileClosedIsIgnored) {
    breaker->record_success();
    EXPECT_EQ(breaker->status(), CircuitStatus::Closed);
    EXPECT_EQ(monitor->count(EventType::CircuitBreakerClosed), 0u);
}

// ===========================================================================
// Overrides and lifetime
// ===========================================================================

TEST_F(CircuitBreakerTest, ForceClosedCancelsCooldown) {
    breaker->trip("test");
    EXPECT_EQ(clock->pending_timers(), 1u);

    breaker->force_state(CircuitStatus::Closed);
    EXPECT_EQ(breaker->status(), CircuitStatus::Closed);
    EXPECT_EQ(clock->pending_timers(), 0u);
}

TEST_F(CircuitBreakerTest, ForceOpenRestartsCooldown) {
    breaker->force_state(CircuitStatus::Open);
    clock->advance(2min);
    breaker->force_state(CircuitStatus::Open);
    EXPECT_EQ(clock->pending_timers(), 1u);

    clock->advance(cfg.time_window - 1s);
    EXPECT_EQ(breaker->status(), CircuitStatus::Open);
    clock->advance(1s);
    EXPECT_EQ(breaker->status(), CircuitStatus::HalfOpen);
}

TEST_F(CircuitBreakerTest, DestroyedBreakerLeavesNoLiveTimer) {
    breaker->trip("test");
    breaker.reset();
    EXPECT_EQ(clock->pending_timers(), 0u);
    EXPECT_NO_THROW(clock->advance(cfg.time_window * 2));
}
