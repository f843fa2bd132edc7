#pragma once

#include "roundabout/types.hpp"
#include "roundabout/adaptation.hpp"
#include "roundabout/config.hpp"
#include "roundabout/context_thread.hpp"
#include "roundabout/exceptions.hpp"
#include "roundabout/model_provider.hpp"
#include "roundabout/monitor.hpp"
#include "roundabout/random_source.hpp"
#include "roundabout/resource_budget.hpp"
#include "roundabout/resource_governor.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace roundabout {

// Collaborators shared by every agent in a hierarchy
struct AgentServices {
    std::shared_ptr<ResourceGovernor> governor;
    std::shared_ptr<RandomSource> random;
    std::shared_ptr<ModelProvider> model;   // optional
    std::shared_ptr<Monitor> monitor;       // optional
    std::shared_ptr<IdGenerator> ids;
    AgentConfig config;
};

struct AgentStatus {
    AgentId id;
    CognitivePhase phase{CognitivePhase::Emerge};
    bool active{true};
    std::size_t child_count{0};
    ResourceUsage resource_usage;
    Timestamp last_activity{};
};

// Immutable once produced
struct ChildAgentReport {
    AgentId child_id;
    std::string task_definition;
    ReportStatus status{ReportStatus::Running};
    std::optional<std::string> result;
    std::optional<std::string> error;
    ResourceUsage resource_usage;
    Duration execution_time{};
    Timestamp timestamp{};
    // Reports the child collected from its own subtree at termination
    std::vector<ChildAgentReport> children;
};

// Outcome of terminating one child. error is set when the child's
// termination failed; the report then carries status Error.
struct ChildTermination {
    ChildAgentReport report;
    std::optional<std::string> error;

    bool ok() const noexcept { return !error.has_value(); }
};

struct TerminationReport {
    AgentId agent_id;
    std::vector<ChildTermination> children;

    std::size_t failed_children() const noexcept;
};

// Execution unit running the EMERGE -> ADAPT -> INTEGRATE loop. May spawn
// children through clone(), each gated by the governor. Thread-safe.
class CognitiveAgent {
public:
    // Registers the agent with the governor
    CognitiveAgent(AgentId id, AgentRole role, ContextThread thread, AgentServices services);

    CognitiveAgent(const CognitiveAgent&) = delete;
    CognitiveAgent& operator=(const CognitiveAgent&) = delete;

    const AgentId& id() const noexcept { return id_; }
    AgentRole role() const noexcept { return role_; }
    const std::optional<AgentId>& parent_id() const noexcept { return thread_.parent_agent_id; }
    const ContextThread& context_thread() const noexcept { return thread_; }

    // ==================== Loop ====================

    // One loop iteration, then a role-specific response. Any failure leaves
    // the agent in ADAPT and is rethrown.
    AgentResponse process_input(const AgentInput& input);

    // Runs the current phase once. Throws EmergenceFailureException,
    // StrategicHaltException or TacticalPlanInvalidException; a halted
    // agent keeps throwing StrategicHaltException.
    void execute_roundabout_loop();

    // ==================== Hierarchy ====================

    // Throws the ApprovalDeniedException subclass matching the denial
    std::shared_ptr<CognitiveAgent> clone(ConfigurationProfile child_profile,
                                          std::string task_definition,
                                          AgentRole child_role = AgentRole::Core);

    // Best-effort recursive shutdown. Never throws for a failing child.
    TerminationReport terminate();

    std::shared_ptr<CognitiveAgent> child(const AgentId& child_id) const;
    std::vector<std::shared_ptr<CognitiveAgent>> children() const;

    // On-demand poll of every child
    std::vector<ChildAgentReport> child_reports() const;

    // Terminates one child and returns its report; nullopt if unknown
    std::optional<ChildAgentReport> remove_child(const AgentId& child_id);

    // ==================== State ====================

    RelationalDelta calculate_relational_delta(const UserState& user_state) const;
    void update_state(const AgentStateUpdate& update);

    AgentState state() const;
    CognitivePhase phase() const;
    bool is_active() const;
    bool is_halted() const;
    AgentStatus status() const;
    ResourceUsage resource_usage() const;

    std::vector<FailureRecord> failure_history() const;
    std::optional<StrategicDecision> adaptation_context() const;
    std::optional<TacticalPlan> current_plan() const;

private:
    struct EmergenceResult {
        bool success{false};
        std::string detail;
    };

    const AgentId id_;
    const AgentRole role_;
    const ContextThread thread_;
    AgentServices services_;

    // Serializes loop iterations
    std::mutex loop_mutex_;
    // Serializes approval, registration and usage attribution in clone()
    std::mutex clone_mutex_;

    // Held across a usage report so terminate() deregisters after it, never before
    std::mutex accounting_mutex_;

    mutable std::mutex state_mutex_;
    CognitivePhase phase_;
    AgentState state_;
    bool active_{true};
    std::optional<std::string> halt_reason_;
    ResourceUsage usage_;
    Timestamp last_activity_;
    std::vector<FailureRecord> failures_;
    std::optional<StrategicDecision> adaptation_context_;
    std::optional<TacticalPlan> plan_;
    std::map<AgentId, std::shared_ptr<CognitiveAgent>> children_;

    void run_emerge();
    void run_adapt();
    void run_integrate();

    EmergenceResult attempt_closure();
    EmergenceResult coordinator_closure();
    EmergenceResult heuristic_closure(const char* success_text, const char* failure_text);

    std::string generate_response_text(const AgentInput& input,
                                       const std::optional<RelationalDelta>& delta) const;

    // Adds to local usage and reports the delta to the governor.
    // Throws AgentInactiveException once the agent is terminated.
    void consume(const ResourceUsage& delta);
    // As consume(), but charges nothing and returns false if the delta
    // would take usage past the thread budget
    bool try_consume(const ResourceUsage& delta);
    bool charge(const ResourceUsage& delta, bool enforce_budget);
    std::string shortfall(const std::string& what, const ResourceUsage& cost) const;
    // Records an EMERGE failure and builds the exception to throw for it
    EmergenceFailureException emergence_failure(const std::string& detail);
    bool resources_remaining() const;

    void transition_to(CognitivePhase next);
    void record_failure(CognitivePhase phase, const std::string& error);
    void touch();
    void ensure_active() const;

    Timestamp now() const;
    ChildAgentReport poll_report(const CognitiveAgent& child) const;
    ChildTermination terminate_child(CognitiveAgent& child);

    void emit(EventType type, const std::string& message,
              std::optional<CognitivePhase> phase = std::nullopt,
              std::optional<AgentId> target = std::nullopt) const;
};

} // namespace roundabout
