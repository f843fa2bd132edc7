#pragma once

#include "roundabout/cognitive_agent.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace roundabout {

// Creates and tracks root agents
class AgentFactory {
public:
    explicit AgentFactory(AgentServices services);

    AgentFactory(const AgentFactory&) = delete;
    AgentFactory& operator=(const AgentFactory&) = delete;

    // Throws SystemAgentCapExceededException once the profile's user holds
    // max_active_agents active roots
    std::shared_ptr<CognitiveAgent> create_agent(const ConfigurationProfile& profile,
                                                 AgentRole role,
                                                 std::string top_level_goal = "Process user input",
                                                 std::string task_definition = "Handle user request");

    // nullptr if unknown
    std::shared_ptr<CognitiveAgent> agent(const AgentId& id) const;

    std::vector<std::shared_ptr<CognitiveAgent>> active_agents() const;
    std::size_t active_agent_count() const;

    // Terminates every tracked root and forgets them
    std::vector<TerminationReport> terminate_all();

    const AgentServices& services() const noexcept { return services_; }

private:
    AgentServices services_;

    mutable std::mutex mutex_;
    std::unordered_map<AgentId, std::shared_ptr<CognitiveAgent>> agents_;
};

} // namespace roundabout
