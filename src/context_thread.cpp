#include "roundabout/context_thread.hpp"

namespace roundabout {

namespace {

const std::string kUserScopePrefix = "user:";
const std::string kDefaultUser = "default-user";

} // anonymous namespace

ContextThread make_root_thread(ThreadId id, std::string top_level_goal,
                               std::string task_definition, ConfigurationProfile profile,
                               const ResourceBudget& default_budget, Timestamp now) {
    ContextThread thread;
    thread.id = std::move(id);
    thread.top_level_goal = std::move(top_level_goal);
    thread.task_definition = std::move(task_definition);
    thread.memory_scope = profile.memory_scope;
    thread.budget = profile.resource_budget.value_or(default_budget);
    thread.profile = std::move(profile);
    thread.recursion_depth = 0;
    thread.created_at = now;
    thread.updated_at = now;
    return thread;
}

ResourceBudget derive_child_budget(const ResourceBudget& parent_budget,
                                   const ResourceUsage& parent_usage, double ratio) noexcept {
    return scaled_floor(remaining(parent_budget, parent_usage), ratio);
}

ContextThread derive_child_thread(const ContextThread& parent, const AgentId& parent_agent_id,
                                  ThreadId id, std::string task_definition,
                                  ConfigurationProfile child_profile,
                                  const ResourceUsage& parent_usage, double ratio,
                                  Timestamp now) {
    ContextThread thread;
    thread.id = std::move(id);
    thread.top_level_goal = parent.top_level_goal;
    thread.parent_agent_id = parent_agent_id;
    thread.task_definition = std::move(task_definition);
    thread.memory_scope = child_profile.memory_scope;
    if (child_profile.resource_budget) {
        thread.budget = *child_profile.resource_budget;
    } else {
        thread.budget = derive_child_budget(parent.budget, parent_usage, ratio);
    }
    thread.profile = std::move(child_profile);
    thread.recursion_depth = parent.recursion_depth + 1;
    thread.created_at = now;
    thread.updated_at = now;
    return thread;
}

UserId user_from_memory_scope(const std::string& memory_scope) {
    if (memory_scope.size() > kUserScopePrefix.size() &&
        memory_scope.compare(0, kUserScopePrefix.size(), kUserScopePrefix) == 0) {
        return memory_scope.substr(kUserScopePrefix.size());
    }
    return kDefaultUser;
}

int max_recursion_depth(const ContextThread& thread, int fallback) noexcept {
    return thread.profile.max_recursion_depth.value_or(fallback);
}

// ========== IdGenerator ==========

IdGenerator::IdGenerator(std::string prefix) : prefix_(std::move(prefix)) {}

std::string IdGenerator::next(const std::string& kind) {
    auto n = counter_.fetch_add(1) + 1;
    return prefix_ + kind + "-" + std::to_string(n);
}

} // namespace roundabout
