#include <gtest/gtest.h>
#include <roundabout/roundabout.hpp>

#include "test_support.hpp"

#include <string>
#include <vector>

using namespace roundabout;
using namespace roundabout::testing;

namespace {

MonitorEvent event_of(EventType type) {
    MonitorEvent e;
    e.type = type;
    e.timestamp = Timestamp{};
    return e;
}

MonitorEvent decision(bool approved, DenialKind kind = DenialKind::None) {
    MonitorEvent e = event_of(approved ? EventType::ApprovalGranted : EventType::ApprovalDenied);
    e.approved = approved;
    if (!approved) e.denial = kind;
    return e;
}

} // namespace

// ===========================================================================
// MetricsMonitor
// ===========================================================================

TEST(MetricsMonitorTest, CountsApprovalsAndDenialsByKind) {
    MetricsMonitor m;
    m.on_event(decision(true));
    m.on_event(decision(false, DenialKind::BudgetInsufficient));
    m.on_event(decision(false, DenialKind::BudgetInsufficient));
    m.on_event(decision(false, DenialKind::TempoRestricted));

    auto metrics = m.get_metrics();
    EXPECT_EQ(metrics.approvals_requested, 4u);
    EXPECT_EQ(metrics.approvals_granted, 1u);
    EXPECT_EQ(metrics.approvals_denied, 3u);
    EXPECT_EQ(metrics.denials_by_kind[DenialKind::BudgetInsufficient], 2u);
    EXPECT_EQ(metrics.denials_by_kind[DenialKind::TempoRestricted], 1u);
    EXPECT_DOUBLE_EQ(metrics.denial_ratio, 0.75);
}

TEST(MetricsMonitorTest, CountsLifecycleAndGovernanceEvents) {
    MetricsMonitor m;
    m.on_event(event_of(EventType::AgentCreated));
    m.on_event(event_of(EventType::ChildAgentCreated));
    m.on_event(event_of(EventType::AgentTerminated));
    m.on_event(event_of(EventType::PhaseTransition));
    m.on_event(event_of(EventType::PhaseFailed));
    m.on_event(event_of(EventType::CircuitBreakerOpened));
    m.on_event(event_of(EventType::TempoChanged));
    m.on_event(event_of(EventType::ErrorRecorded));
    m.on_event(event_of(EventType::QuotaViolated));

    auto metrics = m.get_metrics();
    EXPECT_EQ(metrics.agents_created, 2u);
    EXPECT_EQ(metrics.agents_terminated, 1u);
    EXPECT_EQ(metrics.phase_transitions, 1u);
    EXPECT_EQ(metrics.phase_failures, 1u);
    EXPECT_EQ(metrics.circuit_breaker_trips, 1u);
    EXPECT_EQ(metrics.tempo_changes, 1u);
    EXPECT_EQ(metrics.errors_recorded, 1u);
    EXPECT_EQ(metrics.quota_violations, 1u);
}

TEST(MetricsMonitorTest, SnapshotUpdatesActiveAgents) {
    MetricsMonitor m;
    SystemMetrics snapshot;
    snapshot.active_agents = 7;
    m.on_snapshot(snapshot);
    EXPECT_EQ(m.get_metrics().last_active_agents, 7u);
}

TEST(MetricsMonitorTest, ResetClearsCounters) {
    MetricsMonitor m;
    m.on_event(decision(false, DenialKind::QuotaViolation));
    m.reset_metrics();
    auto metrics = m.get_metrics();
    EXPECT_EQ(metrics.approvals_requested, 0u);
    EXPECT_TRUE(metrics.denials_by_kind.empty());
}

TEST(MetricsMonitorTest, DenialRatioAlertFiresPastMinimum) {
    MetricsMonitor m;
    std::vector<std::string> alerts;
    m.set_denial_ratio_alert(0.5, 4, [&](const std::string& msg) { alerts.push_back(msg); });

    m.on_event(decision(false, DenialKind::CircuitBreakerOpen));
    m.on_event(decision(true));
    m.on_event(decision(false, DenialKind::CircuitBreakerOpen));
    EXPECT_TRUE(alerts.empty());

    // Fourth request: 3 of 4 denied
    m.on_event(decision(false, DenialKind::CircuitBreakerOpen));
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_NE(alerts[0].find("Denial ratio"), std::string::npos);
}

// ===========================================================================
// CompositeMonitor
// ===========================================================================

TEST(CompositeMonitorTest, FansOutToEveryMonitor) {
    auto a = std::make_shared<RecordingMonitor>();
    auto b = std::make_shared<RecordingMonitor>();
    CompositeMonitor composite;
    composite.add_monitor(a);
    composite.add_monitor(b);

    composite.on_event(event_of(EventType::TempoChanged));
    composite.on_snapshot(SystemMetrics{});

    EXPECT_EQ(a->events().size(), 1u);
    EXPECT_EQ(b->events().size(), 1u);
    EXPECT_EQ(a->snapshots().size(), 1u);
    EXPECT_EQ(b->snapshots().size(), 1u);
}

// ===========================================================================
// ConsoleMonitor
// ===========================================================================

TEST(ConsoleMonitorTest, PrintsPrefixedImportantEvents) {
    ConsoleMonitor console(ConsoleMonitor::Verbosity::Normal);
    MonitorEvent e = decision(false, DenialKind::RecursionLimit);
    e.agent_id = "agent-1";
    e.operation = OperationType::CloneAgent;
    e.message = "Maximum recursion depth (5) exceeded";

    ::testing::internal::CaptureStdout();
    console.on_event(e);
    console.on_event(event_of(EventType::ResourceUsageUpdated));
    std::string out = ::testing::internal::GetCapturedStdout();

    EXPECT_NE(out.find("[Roundabout]"), std::string::npos);
    EXPECT_NE(out.find("agent=agent-1"), std::string::npos);
    EXPECT_NE(out.find("Maximum recursion depth (5) exceeded"), std::string::npos);
    EXPECT_EQ(out.find("ResourceUsageUpdated"), std::string::npos);
}

TEST(ConsoleMonitorTest, QuietPrintsNothing) {
    ConsoleMonitor console(ConsoleMonitor::Verbosity::Quiet);
    ::testing::internal::CaptureStdout();
    console.on_event(decision(false, DenialKind::RecursionLimit));
    console.on_snapshot(SystemMetrics{});
    EXPECT_TRUE(::testing::internal::GetCapturedStdout().empty());
}

TEST(MonitorTest, EventTypeNames) {
    EXPECT_STREQ(to_string(EventType::CircuitBreakerOpened), "CircuitBreakerOpened");
    EXPECT_STREQ(to_string(EventType::ApprovalDenied), "ApprovalDenied");
}
