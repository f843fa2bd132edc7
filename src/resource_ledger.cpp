#include "roundabout/resource_ledger.hpp"

#include <algorithm>
#include <functional>

namespace roundabout {

ResourceLedger::ResourceLedger(std::size_t stripes) {
    if (stripes == 0) stripes = 1;
    agent_stripes_.reserve(stripes);
    user_stripes_.reserve(stripes);
    for (std::size_t i = 0; i < stripes; ++i) {
        agent_stripes_.push_back(std::make_unique<AgentStripe>());
        user_stripes_.push_back(std::make_unique<UserStripe>());
    }
}

ResourceLedger::AgentStripe& ResourceLedger::agent_stripe(const AgentId& id) const {
    return *agent_stripes_[std::hash<AgentId>{}(id) % agent_stripes_.size()];
}

ResourceLedger::UserStripe& ResourceLedger::user_stripe(const UserId& id) const {
    return *user_stripes_[std::hash<UserId>{}(id) % user_stripes_.size()];
}

// ==================== Agent entries ====================

ResourceUsage ResourceLedger::add(const AgentId& agent_id, const ResourceUsage& delta) {
    auto& stripe = agent_stripe(agent_id);
    std::lock_guard<std::mutex> lock(stripe.mutex);
    auto& entry = stripe.entries[agent_id];
    entry += delta;
    return entry;
}

ResourceUsage ResourceLedger::usage(const AgentId& agent_id) const {
    auto& stripe = agent_stripe(agent_id);
    std::lock_guard<std::mutex> lock(stripe.mutex);
    auto it = stripe.entries.find(agent_id);
    if (it == stripe.entries.end()) return ResourceUsage{};
    return it->second;
}

bool ResourceLedger::has_entry(const AgentId& agent_id) const {
    auto& stripe = agent_stripe(agent_id);
    std::lock_guard<std::mutex> lock(stripe.mutex);
    return stripe.entries.count(agent_id) > 0;
}

std::optional<ResourceUsage> ResourceLedger::remove(const AgentId& agent_id) {
    auto& stripe = agent_stripe(agent_id);
    std::lock_guard<std::mutex> lock(stripe.mutex);
    auto it = stripe.entries.find(agent_id);
    if (it == stripe.entries.end()) return std::nullopt;
    ResourceUsage held = it->second;
    stripe.entries.erase(it);
    return held;
}

ResourceUsage ResourceLedger::total_usage() const {
    ResourceUsage total;
    for (auto& stripe : agent_stripes_) {
        std::lock_guard<std::mutex> lock(stripe->mutex);
        for (auto& [_, usage] : stripe->entries) {
            total += usage;
        }
    }
    return total;
}

std::size_t ResourceLedger::entry_count() const {
    std::size_t count = 0;
    for (auto& stripe : agent_stripes_) {
        std::lock_guard<std::mutex> lock(stripe->mutex);
        count += stripe->entries.size();
    }
    return count;
}

// ==================== User history ====================

void ResourceLedger::attribute_to_user(const UserId& user_id, const AgentId& agent_id,
                                       const ResourceUsage& delta, Timestamp at,
                                       Timestamp retain_after) {
    auto& stripe = user_stripe(user_id);
    std::lock_guard<std::mutex> lock(stripe.mutex);
    auto& samples = stripe.history[user_id];
    samples.push_back(UsageSample{at, agent_id, delta});
    while (!samples.empty() && samples.front().timestamp < retain_after) {
        samples.pop_front();
    }
}

ResourceUsage ResourceLedger::aggregate(const UserId& user_id, Timestamp since) const {
    auto& stripe = user_stripe(user_id);
    std::lock_guard<std::mutex> lock(stripe.mutex);

    ResourceUsage result;
    auto it = stripe.history.find(user_id);
    if (it == stripe.history.end()) return result;

    for (auto& sample : it->second) {
        if (sample.timestamp < since) continue;
        result.llm_calls += sample.delta.llm_calls;
        result.compute_units += sample.delta.compute_units;
        result.execution_time_ms += sample.delta.execution_time_ms;
        result.storage_bytes = std::max(result.storage_bytes, sample.delta.storage_bytes);
    }
    return result;
}

void ResourceLedger::prune_user_history(Timestamp cutoff) {
    for (auto& stripe : user_stripes_) {
        std::lock_guard<std::mutex> lock(stripe->mutex);
        for (auto it = stripe->history.begin(); it != stripe->history.end();) {
            auto& samples = it->second;
            // Samples are appended in time order
            while (!samples.empty() && samples.front().timestamp < cutoff) {
                samples.pop_front();
            }
            if (samples.empty()) {
                it = stripe->history.erase(it);
            } else {
                ++it;
            }
        }
    }
}

std::vector<UsageSample> ResourceLedger::user_history(const UserId& user_id) const {
    auto& stripe = user_stripe(user_id);
    std::lock_guard<std::mutex> lock(stripe.mutex);
    auto it = stripe.history.find(user_id);
    if (it == stripe.history.end()) return {};
    return std::vector<UsageSample>(it->second.begin(), it->second.end());
}

} // namespace roundabout
