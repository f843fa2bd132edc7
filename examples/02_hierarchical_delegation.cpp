// 02_hierarchical_delegation.cpp
//
// A Coordinator agent splits a goal into sub-tasks and clones one child
// per sub-task. Every clone is approved by the ResourceGovernor against
// the parent's budget, so delegation stops once the budget runs low.
//
// Scenario:
//   - The Coordinator asks a model provider whether coordination succeeds.
//     A keyword-based provider stands in for a real chat service.
//   - Children receive 30% of the parent's remaining budget each.
//   - Once projected usage would pass 90% of the parent's budget, the
//     remaining clones are refused.
//   - Terminating the root cascades through the tree and collects one
//     report per child.

#include <roundabout/roundabout.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>
#include <vector>

using namespace roundabout;

namespace {

// Answers FAILURE for tasks mentioning "blocked", SUCCESS otherwise
class KeywordModelProvider : public ModelProvider {
public:
    ModelResponse chat(const ModelRequest& request) override {
        std::string prompt = request.messages.empty() ? "" : request.messages.back().content;
        std::transform(prompt.begin(), prompt.end(), prompt.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (prompt.find("blocked") != std::string::npos) {
            return ModelResponse{"FAILURE: a dependency is blocked"};
        }
        return ModelResponse{"SUCCESS: sub-tasks assigned"};
    }
};

ConfigurationProfile worker_profile(const std::string& tool) {
    ConfigurationProfile p;
    p.llm_model = "local-small";
    p.toolkit = {tool};
    p.memory_scope = "user:bob";
    return p;
}

void print_report(const ChildAgentReport& report, int indent) {
    std::string pad(static_cast<std::size_t>(indent) * 2, ' ');
    std::cout << pad << "- " << report.child_id << " [" << to_string(report.status) << "] "
              << report.task_definition;
    if (report.result) std::cout << " -> " << *report.result;
    if (report.error) std::cout << " !! " << *report.error;
    std::cout << "\n" << pad << "  usage " << to_string(report.resource_usage) << "\n";
    for (const auto& child : report.children) {
        print_report(child, indent + 1);
    }
}

} // namespace

int main() {
    std::cout << "=== Roundabout: Hierarchical Delegation Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Governor, monitor and factory with a model provider attached.
    // ----------------------------------------------------------------
    auto monitor = std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Verbose);
    auto governor = std::make_shared<ResourceGovernor>(Config{}, nullptr, monitor);

    AgentServices services;
    services.governor = governor;
    services.random = std::make_shared<SeededRandomSource>(7);
    services.model = std::make_shared<KeywordModelProvider>();
    services.monitor = monitor;
    AgentFactory factory(services);

    // ----------------------------------------------------------------
    // 2. Root Coordinator with a small explicit budget.
    // ----------------------------------------------------------------
    ConfigurationProfile root_profile = worker_profile("planner");
    root_profile.resource_budget = ResourceBudget{10, 100, 1024, 30000};
    auto root = factory.create_agent(root_profile, AgentRole::Coordinator,
                                     "Ship the quarterly report", "Coordinate the report");

    AgentInput kickoff;
    kickoff.text = "Start coordinating the quarterly report";
    std::cout << "Root: " << root->process_input(kickoff).text << "\n\n";

    // ----------------------------------------------------------------
    // 3. Delegate sub-tasks until the governor says no.
    // ----------------------------------------------------------------
    std::vector<std::pair<std::string, std::string>> subtasks = {
        {"Collect revenue figures", "spreadsheet"},
        {"Draft the summary", "editor"},
        {"Review legal wording", "legal-db"},
    };

    std::vector<std::shared_ptr<CognitiveAgent>> workers;
    for (const auto& [task, tool] : subtasks) {
        std::cout << "--- Delegating: " << task << " ---\n";
        try {
            auto child = root->clone(worker_profile(tool), task, AgentRole::Core);
            std::cout << "Approved " << child->id() << " at depth "
                      << child->context_thread().recursion_depth << " with budget "
                      << to_string(child->context_thread().budget) << "\n\n";
            workers.push_back(child);
        } catch (const ApprovalDeniedException& e) {
            std::cout << "Denied (" << to_string(e.kind()) << "): " << e.reason()
                      << (e.retry_later() ? " [retry later]" : "") << "\n\n";
        }
    }

    // ----------------------------------------------------------------
    // 4. Let each worker run one loop iteration, then poll the reports.
    // ----------------------------------------------------------------
    for (auto& worker : workers) {
        AgentInput work;
        work.text = worker->context_thread().task_definition;
        try {
            std::cout << worker->id() << ": " << worker->process_input(work).text << "\n";
        } catch (const RoundaboutException& e) {
            std::cout << worker->id() << " failed: " << e.what() << "\n";
        }
    }

    std::cout << "\n=== Child reports ===\n";
    for (const auto& report : root->child_reports()) {
        print_report(report, 0);
    }

    // ----------------------------------------------------------------
    // 5. Cascade termination and print the collected tree.
    // ----------------------------------------------------------------
    TerminationReport final_report = root->terminate();
    std::cout << "\n=== Termination of " << final_report.agent_id << " ("
              << final_report.failed_children() << " failed) ===\n";
    for (const auto& child : final_report.children) {
        print_report(child.report, 0);
    }

    std::cout << "\nAgents still registered: " << governor->registered_agent_count() << "\n";
    std::cout << "\n=== Done ===\n";
    return 0;
}
