// 01_basic_loop.cpp
//
// Minimal Roundabout example: one Conscious agent talking to one user.
// Demonstrates the EMERGE -> ADAPT -> INTEGRATE loop and the relational
// delta that picks a communication strategy.
//
// Scenario:
//   - A ResourceGovernor with default limits gates every operation.
//   - The AgentFactory creates a root Conscious agent for user "alice".
//   - Each input runs one loop phase and produces a response.
//   - A failed EMERGE leaves the agent in ADAPT; the next inputs plan a
//     new approach and return to EMERGE, unless ADAPT decides to halt.

#include <roundabout/roundabout.hpp>

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace roundabout;

namespace {

UserState user_state(double fight, double flight, double fixes, double confidence) {
    UserState s;
    s.fight = fight;
    s.flight = flight;
    s.fixes = fixes;
    s.confidence = confidence;
    return s;
}

} // namespace

int main() {
    std::cout << "=== Roundabout: Basic Loop Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Create the governor with default configuration.
    //    A console monitor shows every governance and loop event.
    // ----------------------------------------------------------------
    auto monitor = std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Verbose);
    auto governor = std::make_shared<ResourceGovernor>(Config{}, nullptr, monitor);

    // ----------------------------------------------------------------
    // 2. Create the factory and a root agent.
    //    The memory scope names the user the agent works for.
    // ----------------------------------------------------------------
    AgentServices services;
    services.governor = governor;
    services.random = std::make_shared<SeededRandomSource>(42);
    services.monitor = monitor;
    AgentFactory factory(services);

    ConfigurationProfile profile;
    profile.llm_model = "local-small";
    profile.toolkit = {"search", "calendar"};
    profile.memory_scope = "user:alice";

    auto agent = factory.create_agent(profile, AgentRole::Conscious,
                                      "Help alice plan her week", "Chat with alice");
    std::cout << "Created agent " << agent->id() << " with budget "
              << to_string(agent->context_thread().budget) << "\n\n";

    // ----------------------------------------------------------------
    // 3. Feed a short conversation through the loop.
    // ----------------------------------------------------------------
    struct Turn {
        std::string text;
        UserState state;
    };
    std::vector<Turn> conversation = {
        {"Can you help me sort out my week?", user_state(0.1, 0.1, 0.4, 0.8)},
        {"I have too many meetings on Tuesday", user_state(0.3, 0.2, 0.5, 0.6)},
        {"Honestly I just want to cancel all of them", user_state(0.9, 0.7, 0.2, 0.2)},
        {"Ok, what would you move first?", user_state(0.2, 0.1, 0.7, 0.7)},
        {"Thanks, that works", user_state(0.0, 0.0, 0.3, 0.9)},
    };

    std::cout << std::fixed << std::setprecision(3);
    for (const auto& turn : conversation) {
        AgentInput input;
        input.text = turn.text;
        input.user_state = turn.state;

        std::cout << "--- User: " << turn.text << " ---\n";
        try {
            AgentResponse response = agent->process_input(input);
            std::cout << "Agent: " << response.text << "\n";
            if (response.relational_delta) {
                const auto& d = *response.relational_delta;
                std::cout << "  delta async=" << d.async_delta << " sync=" << d.sync_delta
                          << " magnitude=" << d.magnitude
                          << " strategy=" << to_string(d.strategy) << "\n";
            }
        } catch (const EmergenceFailureException& e) {
            std::cout << "EMERGE failed (" << e.detail() << "), agent moves to ADAPT\n";
        } catch (const TacticalPlanInvalidException& e) {
            std::cout << "INTEGRATE failed: " << e.detail() << "\n";
        } catch (const StrategicHaltException& e) {
            std::cout << "Agent halted: " << e.reason() << "\n\n";
            break;
        }
        std::cout << "  phase=" << to_string(agent->phase())
                  << " usage=" << to_string(agent->resource_usage()) << "\n\n";
    }

    // ----------------------------------------------------------------
    // 4. Inspect what the loop learned.
    // ----------------------------------------------------------------
    for (const auto& failure : agent->failure_history()) {
        std::cout << "Failure in " << to_string(failure.phase) << ": " << failure.error << "\n";
    }
    if (auto plan = agent->current_plan()) {
        std::cout << "Current plan: " << plan->approach << " (confidence "
                  << plan->confidence << ")\n";
    }

    auto metrics = governor->system_metrics();
    std::cout << "\nActive agents: " << metrics.active_agents
              << ", tempo: " << to_string(metrics.tempo)
              << ", breaker: " << to_string(metrics.circuit_breaker.status) << "\n";

    // ----------------------------------------------------------------
    // 5. Shut down.
    // ----------------------------------------------------------------
    factory.terminate_all();

    std::cout << "\n=== Done ===\n";
    return 0;
}
