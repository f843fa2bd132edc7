#pragma once

#include "roundabout/types.hpp"
#include "roundabout/resource_budget.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace roundabout {

// Per-agent configuration injected at creation
struct ConfigurationProfile {
    std::string llm_model;
    std::vector<std::string> toolkit;
    std::string memory_scope;
    CognitivePhase entry_phase{CognitivePhase::Emerge};
    std::optional<int> max_recursion_depth;
    std::optional<ResourceBudget> resource_budget;
};

// Task context owned by exactly one agent. Children get a freshly derived
// thread, never their parent's.
struct ContextThread {
    ThreadId id;
    std::string top_level_goal;
    std::optional<AgentId> parent_agent_id;
    std::string task_definition;
    ConfigurationProfile profile;
    std::string memory_scope;
    ResourceBudget budget;
    int recursion_depth{0};
    Timestamp created_at{};
    Timestamp updated_at{};
};

// Thread for a root agent. The profile's budget wins over default_budget.
ContextThread make_root_thread(ThreadId id, std::string top_level_goal,
                               std::string task_definition, ConfigurationProfile profile,
                               const ResourceBudget& default_budget, Timestamp now);

// floor(ratio * max(0, budget - usage)) per dimension
ResourceBudget derive_child_budget(const ResourceBudget& parent_budget,
                                   const ResourceUsage& parent_usage, double ratio) noexcept;

// Thread for a child of parent_agent_id: shared goal, depth + 1, and either
// the child profile's explicit budget or a derived share of the parent's
// remaining budget
ContextThread derive_child_thread(const ContextThread& parent, const AgentId& parent_agent_id,
                                  ThreadId id, std::string task_definition,
                                  ConfigurationProfile child_profile,
                                  const ResourceUsage& parent_usage, double ratio,
                                  Timestamp now);

// "user:<id>" memory scopes name their user; anything else is "default-user"
UserId user_from_memory_scope(const std::string& memory_scope);

// Effective depth limit for a thread: its profile's limit, else fallback
int max_recursion_depth(const ContextThread& thread, int fallback) noexcept;

// Monotonic, process-unique identifiers such as "agent-7" or "thread-12"
class IdGenerator {
public:
    explicit IdGenerator(std::string prefix = {});

    std::string next(const std::string& kind);

private:
    std::string prefix_;
    std::atomic<std::uint64_t> counter_{0};
};

} // namespace roundabout
