// 03_circuit_breaker.cpp
//
// System-wide protection: the circuit breaker and the tempo ladder.
// Runs on a ManualClock so the five-minute cooldown passes instantly.
//
// Scenario:
//   - A burst of tool errors pushes the error rate past the threshold
//     and opens the breaker. Every approval is refused while open.
//   - After the cooldown the breaker goes half-open; three successful
//     approvals close it again.
//   - A runaway child then spends heavily. The cost-spike detector opens
//     the breaker, pauses the child's whole hierarchy and slows the
//     system tempo.

#include <roundabout/roundabout.hpp>

#include <iostream>
#include <string>

using namespace roundabout;

namespace {

void print_status(const ResourceGovernor& governor) {
    auto metrics = governor.system_metrics();
    std::cout << "  breaker=" << to_string(metrics.circuit_breaker.status)
              << " error_rate=" << metrics.circuit_breaker.error_rate
              << " cost_spike=" << metrics.circuit_breaker.cost_spike
              << " tempo=" << to_string(metrics.tempo)
              << " paused=" << metrics.paused_hierarchies.size() << "\n";
}

ApprovalResponse ask_memory(ResourceGovernor& governor, const CognitiveAgent& agent) {
    ApprovalRequest request;
    request.operation = OperationType::MemoryAccess;
    request.requesting_agent_id = agent.id();
    request.thread = agent.context_thread();
    return governor.request_approval(request);
}

} // namespace

int main() {
    std::cout << "=== Roundabout: Circuit Breaker Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Governor on simulated time with a sensitive breaker.
    // ----------------------------------------------------------------
    auto clock = std::make_shared<ManualClock>();
    auto console = std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal);
    auto metrics = std::make_shared<MetricsMonitor>();
    metrics->set_denial_ratio_alert(0.5, 4, [](const std::string& message) {
        std::cout << "  ALERT: " << message << "\n";
    });
    auto monitor = std::make_shared<CompositeMonitor>();
    monitor->add_monitor(console);
    monitor->add_monitor(metrics);

    Config config;
    config.circuit_breaker.error_rate_threshold = 0.3;
    auto governor = std::make_shared<ResourceGovernor>(config, clock, monitor);

    AgentServices services;
    services.governor = governor;
    services.random = std::make_shared<SeededRandomSource>(3);
    services.monitor = monitor;
    AgentFactory factory(services);

    ConfigurationProfile profile;
    profile.memory_scope = "user:carol";
    auto agent = factory.create_agent(profile, AgentRole::Coordinator);

    // ----------------------------------------------------------------
    // 2. Error burst opens the breaker.
    // ----------------------------------------------------------------
    std::cout << "--- Recording tool errors ---\n";
    for (int i = 1; i <= 5; ++i) {
        governor->record_error(agent->id(), "search tool timeout #" + std::to_string(i));
    }
    print_status(*governor);

    std::cout << "\n--- Requests while open ---\n";
    for (int i = 0; i < 3; ++i) {
        auto response = ask_memory(*governor, *agent);
        std::cout << "  memory access: " << (response.approved ? "approved" : response.reason)
                  << "\n";
    }

    // ----------------------------------------------------------------
    // 3. Cooldown, half-open probes, recovery.
    // ----------------------------------------------------------------
    std::cout << "\n--- Five minutes later ---\n";
    clock->advance(config.circuit_breaker.time_window);
    print_status(*governor);

    for (int i = 1; i <= 3; ++i) {
        auto response = ask_memory(*governor, *agent);
        std::cout << "  probe " << i << ": " << (response.approved ? "approved" : response.reason)
                  << "\n";
    }
    print_status(*governor);

    // ----------------------------------------------------------------
    // 4. Cost spike from a runaway child.
    // ----------------------------------------------------------------
    std::cout << "\n--- Runaway child ---\n";
    auto child = agent->clone(profile, "Crawl every page on the site");
    for (int i = 0; i < 6; ++i) {
        governor->update_resource_usage(child->id(), ResourceUsage{40, 1500, 0, 0});
    }
    print_status(*governor);

    try {
        agent->clone(profile, "One more crawler");
    } catch (const ApprovalDeniedException& e) {
        std::cout << "  clone refused (" << to_string(e.kind()) << "): " << e.reason() << "\n";
    }

    // ----------------------------------------------------------------
    // 5. Operator intervention.
    // ----------------------------------------------------------------
    std::cout << "\n--- Operator resets ---\n";
    child->terminate();
    governor->resume_agent_hierarchy(agent->id());
    governor->set_circuit_breaker_state(CircuitStatus::Closed);
    governor->set_system_tempo(SystemTempo::HighPerformance);
    print_status(*governor);

    auto m = metrics->get_metrics();
    std::cout << "\nApprovals: " << m.approvals_granted << " granted, " << m.approvals_denied
              << " denied; breaker trips: " << m.circuit_breaker_trips
              << "; tempo changes: " << m.tempo_changes << "\n";

    factory.terminate_all();
    std::cout << "\n=== Done ===\n";
    return 0;
}
