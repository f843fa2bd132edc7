#pragma once

#include "roundabout/types.hpp"
#include "roundabout/circuit_breaker.hpp"
#include "roundabout/clock.hpp"
#include "roundabout/config.hpp"
#include "roundabout/context_thread.hpp"
#include "roundabout/monitor.hpp"
#include "roundabout/quota_manager.hpp"
#include "roundabout/resource_budget.hpp"
#include "roundabout/resource_ledger.hpp"
#include "roundabout/system_tempo.hpp"

#include <future>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace roundabout {

// What the governor knows about an agent's place in its hierarchy
struct AgentRegistration {
    AgentId agent_id;
    std::optional<AgentId> parent_id;
    AgentId root_id;
    UserId user_id;
    ResourceBudget budget;
    int recursion_depth{0};
    // Context thread the agent was created with; clears the matching clone reservation
    ThreadId thread_id;
};

struct ApprovalRequest {
    OperationType operation{OperationType::MemoryAccess};
    AgentId requesting_agent_id;
    ResourceEstimate estimated_cost;
    // For clone_agent this is the prospective child's thread
    ContextThread thread;
};

struct ApprovalResponse {
    bool approved{false};
    std::string reason;
    DenialKind denial{DenialKind::None};
    std::vector<std::string> violations;
    // Projected parent usage on an approved clone
    std::optional<ResourceUsage> updated_budget;
    // Tempo-scaled estimate the approval was granted for
    std::optional<ResourceEstimate> approved_cost;
};

struct SystemStatus {
    std::size_t active_agents{0};
    ResourceUsage total_usage;
    CircuitStatus breaker_status{CircuitStatus::Closed};
};

// Single admission gate for every resource-consuming operation. Owns the
// usage ledger, circuit breaker, tempo ladder, user quotas and the set of
// paused hierarchies. Denials are returned, never thrown.
class ResourceGovernor {
public:
    explicit ResourceGovernor(Config config = Config{},
                              std::shared_ptr<Clock> clock = nullptr,
                              std::shared_ptr<Monitor> monitor = nullptr);
    ~ResourceGovernor();

    ResourceGovernor(const ResourceGovernor&) = delete;
    ResourceGovernor& operator=(const ResourceGovernor&) = delete;

    // ==================== Registry ====================

    // Also consumes the clone reservation held for registration.thread_id
    void register_agent(AgentRegistration registration);
    std::optional<AgentRegistration> registration(const AgentId& agent_id) const;
    std::size_t registered_agent_count() const;

    // Registered agents plus any agent with recorded usage
    std::size_t active_agent_count() const;

    // ==================== Admission ====================

    ApprovalResponse request_approval(const ApprovalRequest& request);
    std::future<ApprovalResponse> request_approval_async(ApprovalRequest request);

    // ==================== Accounting ====================

    // Adds delta to the agent's cumulative usage, attributes it to the
    // owning user and feeds the cost-spike detector
    void update_resource_usage(const AgentId& agent_id, const ResourceUsage& delta);
    ResourceUsage agent_usage(const AgentId& agent_id) const;

    // True if recorded usage fits the thread's budget in every dimension
    bool check_resource_limits(const AgentId& agent_id, const ContextThread& thread) const;

    void record_error(const AgentId& agent_id, const std::string& error);

    // Drops the agent's ledger entry, registration and clone reservations.
    // Later usage reports for the id are ignored until it registers again.
    void remove_agent(const AgentId& agent_id);

    // Frees the system slot an approved clone held for a child that was never registered
    void release_clone_reservation(const ThreadId& thread_id);

    // ==================== User quotas ====================

    void set_user_quotas(const UserId& user_id, UserResourceQuotas quotas);
    UserResourceQuotas user_quotas(const UserId& user_id);
    void set_user_tier(const UserId& user_id, UserTier tier);
    QuotaCheck check_user_quotas(const UserId& user_id);

    // ==================== Hierarchies ====================

    void pause_agent_hierarchy(const AgentId& root_id, const std::string& reason);
    void resume_agent_hierarchy(const AgentId& root_id);

    // True if the agent or any registered ancestor is paused
    bool is_hierarchy_paused(const AgentId& agent_id) const;
    std::vector<AgentId> paused_hierarchies() const;

    // Topmost registered ancestor, or the agent itself
    AgentId root_of(const AgentId& agent_id) const;

    // ==================== Breaker / tempo ====================

    void set_system_tempo(SystemTempo tempo);
    SystemTempo system_tempo() const;

    void set_circuit_breaker_state(CircuitStatus status);
    CircuitStatus circuit_breaker_status() const;

    // ==================== Queries ====================

    SystemStatus system_status() const;
    SystemMetrics system_metrics() const;

    // Pushes system_metrics() to the monitor
    void publish_snapshot() const;

    const Config& config() const noexcept { return config_; }
    const std::shared_ptr<Clock>& clock() const noexcept { return clock_; }

private:
    Config config_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<Monitor> monitor_;

    ResourceLedger ledger_;
    CircuitBreaker breaker_;
    SystemTempoController tempo_;
    QuotaManager quotas_;

    mutable std::shared_mutex registry_mutex_;
    std::unordered_map<AgentId, AgentRegistration> registry_;
    std::unordered_set<AgentId> active_agents_;
    // Approved clones not yet registered, keyed by child thread, valued by requester
    std::unordered_map<ThreadId, AgentId> clone_reservations_;
    std::unordered_set<AgentId> retired_;

    mutable std::shared_mutex paused_mutex_;
    std::unordered_set<AgentId> paused_;

    ApprovalResponse evaluate(const ApprovalRequest& request);
    ApprovalResponse validate_clone(const ApprovalRequest& request,
                                    const ResourceEstimate& estimate);
    ApprovalResponse validate_llm_call(const ApprovalRequest& request,
                                       const ResourceEstimate& estimate);

    bool is_paused_chain(const AgentId& agent_id,
                         const std::optional<AgentId>& fallback_parent) const;
    std::optional<UserId> user_of(const AgentId& agent_id) const;
    void apply_tempo_change(const std::optional<TempoChange>& change, const std::string& cause);

    void emit_event(EventType type, const std::string& message,
                    std::optional<AgentId> agent_id = std::nullopt,
                    std::optional<OperationType> operation = std::nullopt,
                    std::optional<bool> approved = std::nullopt,
                    std::optional<DenialKind> denial = std::nullopt,
                    std::optional<UserId> user_id = std::nullopt,
                    std::optional<double> value = std::nullopt) const;
};

} // namespace roundabout
