#include "roundabout/agent_factory.hpp"
#include "roundabout/exceptions.hpp"

namespace roundabout {

AgentFactory::AgentFactory(AgentServices services)
    : services_(std::move(services))
{
    if (!services_.governor) {
        throw InvalidConfigurationException("AgentFactory requires a ResourceGovernor");
    }
    validate(services_.config);
    if (!services_.random) {
        services_.random = std::make_shared<SeededRandomSource>();
    }
    if (!services_.ids) {
        services_.ids = std::make_shared<IdGenerator>();
    }
}

std::shared_ptr<CognitiveAgent> AgentFactory::create_agent(const ConfigurationProfile& profile,
                                                           AgentRole role,
                                                           std::string top_level_goal,
                                                           std::string task_definition) {
    UserId user = user_from_memory_scope(profile.memory_scope);
    std::size_t limit = services_.governor->config().limits.max_active_agents;

    // Held across construction so two racing creations cannot both pass the limit
    std::lock_guard<std::mutex> lock(mutex_);

    // Terminated roots are dropped here so the map only holds live hierarchies
    std::size_t held = 0;
    for (auto it = agents_.begin(); it != agents_.end();) {
        const auto& a = it->second;
        if (!a->is_active()) {
            it = agents_.erase(it);
            continue;
        }
        if (user_from_memory_scope(a->context_thread().memory_scope) == user) {
            ++held;
        }
        ++it;
    }
    if (held >= limit) {
        throw SystemAgentCapExceededException(
            "Maximum active agents (" + std::to_string(limit) + ") reached for user " + user);
    }

    Timestamp now = services_.governor->clock()->now();
    ContextThread thread = make_root_thread(services_.ids->next("thread"),
                                            std::move(top_level_goal),
                                            std::move(task_definition), profile,
                                            services_.config.default_budget, now);

    auto created = std::make_shared<CognitiveAgent>(services_.ids->next("agent"), role,
                                                    std::move(thread), services_);
    agents_.emplace(created->id(), created);

    if (services_.monitor) {
        MonitorEvent event;
        event.type = EventType::AgentCreated;
        event.timestamp = now;
        event.message = std::string("Created ") + to_string(role) + " agent";
        event.agent_id = created->id();
        event.user_id = user;
        event.phase = created->phase();
        services_.monitor->on_event(event);
    }
    return created;
}

std::shared_ptr<CognitiveAgent> AgentFactory::agent(const AgentId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) return nullptr;
    return it->second;
}

std::vector<std::shared_ptr<CognitiveAgent>> AgentFactory::active_agents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<CognitiveAgent>> result;
    for (auto& [_, a] : agents_) {
        if (a->is_active()) result.push_back(a);
    }
    return result;
}

std::size_t AgentFactory::active_agent_count() const {
    return active_agents().size();
}

std::vector<TerminationReport> AgentFactory::terminate_all() {
    std::unordered_map<AgentId, std::shared_ptr<CognitiveAgent>> agents;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        agents.swap(agents_);
    }

    std::vector<TerminationReport> reports;
    reports.reserve(agents.size());
    for (auto& [_, a] : agents) {
        reports.push_back(a->terminate());
    }
    return reports;
}

} // namespace roundabout
