#include <gtest/gtest.h>
#include <roundabout/roundabout.hpp>

#include "test_support.hpp"

#include <stdexcept>

using namespace roundabout;
using namespace roundabout::testing;
using namespace std::chrono_literals;

namespace {

// Records everything, but fails when one chosen agent reports its termination
class FailingSinkMonitor : public RecordingMonitor {
public:
    void fail_on_termination_of(const AgentId& id) { target_ = id; }

    void on_event(const MonitorEvent& event) override {
        RecordingMonitor::on_event(event);
        if (event.type == EventType::AgentTerminated && event.agent_id == target_) {
            throw std::runtime_error("monitor sink unavailable");
        }
    }

private:
    std::optional<AgentId> target_;
};

} // namespace

// ===========================================================================
// Fixture: root with three children, the middle one holding a grandchild
// ===========================================================================

class TerminationTest : public ::testing::Test {
protected:
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<FailingSinkMonitor> monitor = std::make_shared<FailingSinkMonitor>();
    std::shared_ptr<ScriptedRandom> random = std::make_shared<ScriptedRandom>();
    std::shared_ptr<ResourceGovernor> gov;
    std::unique_ptr<AgentFactory> factory;

    std::shared_ptr<CognitiveAgent> root;
    std::shared_ptr<CognitiveAgent> first;
    std::shared_ptr<CognitiveAgent> middle;
    std::shared_ptr<CognitiveAgent> last;
    std::shared_ptr<CognitiveAgent> grandchild;

    void SetUp() override {
        gov = std::make_shared<ResourceGovernor>(Config{}, clock, monitor);
        AgentServices services;
        services.governor = gov;
        services.random = random;
        services.monitor = monitor;
        factory = std::make_unique<AgentFactory>(services);

        ResourceBudget roomy{100, 1000, 1024 * 1024, 300000};
        root = factory->create_agent(make_profile("alice", roomy), AgentRole::Coordinator);
        first = root->clone(make_profile("alice"), "collect sources");
        middle = root->clone(make_profile("alice", factory->services().config.default_budget),
                             "write summary", AgentRole::Coordinator);
        last = root->clone(make_profile("alice"), "check citations");
        grandchild = middle->clone(make_profile("alice"), "format tables");
    }

    static const ChildTermination* find(const TerminationReport& report, const AgentId& id) {
        for (auto& c : report.children) {
            if (c.report.child_id == id) return &c;
        }
        return nullptr;
    }
};

// ===========================================================================
// Clean shutdown
// ===========================================================================

TEST_F(TerminationTest, CascadesThroughWholeTree) {
    clock->advance(2s);
    auto report = root->terminate();

    EXPECT_EQ(report.agent_id, root->id());
    ASSERT_EQ(report.children.size(), 3u);
    EXPECT_EQ(report.failed_children(), 0u);

    const ChildTermination* m = find(report, middle->id());
    ASSERT_NE(m, nullptr);
    EXPECT_EQ(m->report.status, ReportStatus::Completed);
    EXPECT_EQ(*m->report.result, "Child agent completed task: write summary");
    ASSERT_EQ(m->report.children.size(), 1u);
    EXPECT_EQ(m->report.children[0].child_id, grandchild->id());
    EXPECT_EQ(m->report.execution_time, Duration(2s));

    for (auto& agent : {root, first, middle, last, grandchild}) {
        EXPECT_FALSE(agent->is_active());
    }
    EXPECT_EQ(gov->registered_agent_count(), 0u);
    EXPECT_TRUE(gov->system_status().total_usage.is_zero());

    EXPECT_EQ(monitor->count(EventType::AgentTerminated), 5u);
    // Every non-root forwards its report upward
    EXPECT_EQ(monitor->count(EventType::ReportForwarded), 4u);
}

TEST_F(TerminationTest, SecondTerminateIsEmpty) {
    root->terminate();
    auto again = root->terminate();
    EXPECT_TRUE(again.children.empty());
    EXPECT_EQ(monitor->count(EventType::AgentTerminated), 5u);
}

TEST_F(TerminationTest, TerminatedAgentRejectsWork) {
    root->terminate();
    AgentInput input;
    input.text = "anything";
    EXPECT_THROW(root->process_input(input), AgentInactiveException);
    EXPECT_THROW(root->clone(make_profile("alice"), "late"), AgentInactiveException);
}

// ===========================================================================
// Failing child
// ===========================================================================

TEST_F(TerminationTest, FailingChildDoesNotStopSiblings) {
    monitor->fail_on_termination_of(first->id());

    TerminationReport report;
    ASSERT_NO_THROW(report = root->terminate());

    ASSERT_EQ(report.children.size(), 3u);
    EXPECT_EQ(report.failed_children(), 1u);

    const ChildTermination* failed = find(report, first->id());
    ASSERT_NE(failed, nullptr);
    EXPECT_FALSE(failed->ok());
    EXPECT_EQ(*failed->error, "monitor sink unavailable");
    EXPECT_EQ(failed->report.status, ReportStatus::Error);
    EXPECT_EQ(*failed->report.error, "monitor sink unavailable");
    EXPECT_EQ(failed->report.task_definition, "collect sources");

    for (auto* id : {&middle->id(), &last->id()}) {
        const ChildTermination* ok = find(report, *id);
        ASSERT_NE(ok, nullptr);
        EXPECT_TRUE(ok->ok());
        EXPECT_EQ(ok->report.status, ReportStatus::Completed);
    }

    auto failures = monitor->events_of(EventType::ChildTerminationFailed);
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(*failures[0].agent_id, root->id());
    EXPECT_EQ(*failures[0].target_agent_id, first->id());

    bool error_recorded = false;
    for (auto& e : monitor->events_of(EventType::ErrorRecorded)) {
        if (e.message == "Child agent termination failed: monitor sink unavailable") {
            error_recorded = true;
        }
    }
    EXPECT_TRUE(error_recorded);

    // Root still finishes its own shutdown
    EXPECT_FALSE(root->is_active());
    EXPECT_EQ(gov->registered_agent_count(), 0u);
}

TEST_F(TerminationTest, RemoveChildReportsFailure) {
    monitor->fail_on_termination_of(last->id());

    auto report = root->remove_child(last->id());
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->status, ReportStatus::Error);
    EXPECT_EQ(root->children().size(), 2u);
    EXPECT_EQ(root->child(last->id()), nullptr);
    EXPECT_FALSE(root->remove_child("agent-404").has_value());
}

// ===========================================================================
// Halted children
// ===========================================================================

TEST_F(TerminationTest, HaltedChildReportsFailed) {
    // Outlive the child's execution-time budget, then fail EMERGE so ADAPT halts
    clock->advance(std::chrono::milliseconds(first->context_thread().budget.execution_time_ms));
    random->push(0.99);
    EXPECT_THROW(first->execute_roundabout_loop(), EmergenceFailureException);
    EXPECT_THROW(first->execute_roundabout_loop(), StrategicHaltException);
    ASSERT_TRUE(first->is_halted());

    auto report = root->terminate();
    const ChildTermination* halted = find(report, first->id());
    ASSERT_NE(halted, nullptr);
    EXPECT_TRUE(halted->ok());
    EXPECT_EQ(halted->report.status, ReportStatus::Failed);
    EXPECT_EQ(halted->report.error->rfind("Agent halted: ", 0), 0u);
}
