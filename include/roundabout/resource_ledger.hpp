#pragma once

#include "roundabout/types.hpp"
#include "roundabout/resource_budget.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace roundabout {

// One attributed usage delta in a user's history
struct UsageSample {
    Timestamp timestamp{};
    AgentId agent_id;
    ResourceUsage delta;
};

// Cumulative per-agent usage plus per-user time-stamped usage history.
// Agent entries are created lazily on first update and removed on
// termination. Both maps are lock-striped by key hash.
class ResourceLedger {
public:
    explicit ResourceLedger(std::size_t stripes = 16);

    ResourceLedger(const ResourceLedger&) = delete;
    ResourceLedger& operator=(const ResourceLedger&) = delete;

    // Adds delta to the agent's entry and returns the updated cumulative usage
    ResourceUsage add(const AgentId& agent_id, const ResourceUsage& delta);

    // Zero when the agent has no entry
    ResourceUsage usage(const AgentId& agent_id) const;
    bool has_entry(const AgentId& agent_id) const;

    // Drops the agent's entry; returns the usage it held, if any
    std::optional<ResourceUsage> remove(const AgentId& agent_id);

    // Sum across all live agent entries
    ResourceUsage total_usage() const;
    std::size_t entry_count() const;

    // Appends a sample and drops the user's samples older than retain_after
    void attribute_to_user(const UserId& user_id, const AgentId& agent_id,
                           const ResourceUsage& delta, Timestamp at, Timestamp retain_after);

    // Usage attributed to the user at or after `since`. Calls, compute and
    // time are summed; storage is the largest single sample.
    ResourceUsage aggregate(const UserId& user_id, Timestamp since) const;

    // Drops samples older than cutoff for every user
    void prune_user_history(Timestamp cutoff);

    std::vector<UsageSample> user_history(const UserId& user_id) const;

private:
    struct AgentStripe {
        mutable std::mutex mutex;
        std::unordered_map<AgentId, ResourceUsage> entries;
    };

    struct UserStripe {
        mutable std::mutex mutex;
        std::unordered_map<UserId, std::deque<UsageSample>> history;
    };

    std::vector<std::unique_ptr<AgentStripe>> agent_stripes_;
    std::vector<std::unique_ptr<UserStripe>> user_stripes_;

    AgentStripe& agent_stripe(const AgentId& id) const;
    UserStripe& user_stripe(const UserId& id) const;
};

} // namespace roundabout
