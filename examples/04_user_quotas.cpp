// 04_user_quotas.cpp
//
// Per-user tiered quotas. Usage from every agent a user owns is pooled
// into trailing one-hour and 24-hour windows and checked before each
// LLM call.
//
// Scenario:
//   - "dave" is on a custom free plan allowing 3 LLM calls per hour.
//   - dave's Coordinator agent loses model access once the hourly pool is
//     spent; "erin" on the default free tier is unaffected.
//   - Upgrading dave to premium lifts the limit immediately.
//   - After an hour of simulated time the window has emptied anyway.

#include <roundabout/roundabout.hpp>

#include <iostream>
#include <string>

using namespace roundabout;
using namespace std::chrono_literals;

namespace {

class AlwaysSucceedModel : public ModelProvider {
public:
    ModelResponse chat(const ModelRequest&) override {
        return ModelResponse{"SUCCESS: plan accepted"};
    }
};

ConfigurationProfile profile_for(const std::string& user) {
    ConfigurationProfile p;
    p.llm_model = "local-small";
    p.memory_scope = "user:" + user;
    return p;
}

void print_quota(ResourceGovernor& governor, const std::string& user) {
    QuotaCheck check = governor.check_user_quotas(user);
    UserResourceQuotas quotas = governor.user_quotas(user);
    std::cout << "  " << user << " [" << to_string(quotas.tier) << "] hourly llm "
              << check.hourly_usage.llm_calls << "/" << quotas.llm.max_calls_per_hour
              << ", daily llm " << check.daily_usage.llm_calls << "/"
              << quotas.llm.max_calls_per_day
              << (check.within_limits ? " (ok)" : " (over quota)") << "\n";
    for (const auto& v : check.violations) {
        std::cout << "    - " << v << "\n";
    }
}

void run(CognitiveAgent& agent, const std::string& text) {
    AgentInput input;
    input.text = text;
    try {
        std::cout << "  " << agent.id() << ": " << agent.process_input(input).text << "\n";
    } catch (const EmergenceFailureException& e) {
        std::cout << "  " << agent.id() << " EMERGE failed: " << e.detail() << "\n";
    } catch (const RoundaboutException& e) {
        std::cout << "  " << agent.id() << " stopped: " << e.what() << "\n";
    }
}

} // namespace

int main() {
    std::cout << "=== Roundabout: User Quotas Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Governor on simulated time; dave gets a tighter free plan.
    // ----------------------------------------------------------------
    auto clock = std::make_shared<ManualClock>();
    auto monitor = std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal);
    auto governor = std::make_shared<ResourceGovernor>(Config{}, clock, monitor);

    UserResourceQuotas tight = QuotaDefaults::free_tier();
    tight.llm.max_calls_per_hour = 3;
    governor->set_user_quotas("dave", tight);

    AgentServices services;
    services.governor = governor;
    services.random = std::make_shared<SeededRandomSource>(11);
    services.model = std::make_shared<AlwaysSucceedModel>();
    services.monitor = monitor;
    AgentFactory factory(services);

    auto dave = factory.create_agent(profile_for("dave"), AgentRole::Coordinator);
    auto erin = factory.create_agent(profile_for("erin"), AgentRole::Coordinator);

    // ----------------------------------------------------------------
    // 2. Spend dave's hourly pool.
    // ----------------------------------------------------------------
    std::cout << "--- dave works until the quota bites ---\n";
    for (const char* text : {"Plan sprint", "Assign tickets", "Book review"}) {
        run(*dave, text);
    }
    print_quota(*governor, "dave");

    std::cout << "\n--- erin has a separate quota ---\n";
    run(*erin, "Plan sprint");
    print_quota(*governor, "erin");

    // ----------------------------------------------------------------
    // 3. Upgrade dave.
    // ----------------------------------------------------------------
    std::cout << "\n--- dave upgrades to premium ---\n";
    governor->set_user_tier("dave", UserTier::Premium);
    print_quota(*governor, "dave");
    auto upgraded = factory.create_agent(profile_for("dave"), AgentRole::Coordinator);
    run(*upgraded, "Book review");

    // ----------------------------------------------------------------
    // 4. One hour later the window is empty.
    // ----------------------------------------------------------------
    std::cout << "\n--- One hour later ---\n";
    clock->advance(61min);
    print_quota(*governor, "dave");

    factory.terminate_all();
    std::cout << "\n=== Done ===\n";
    return 0;
}
