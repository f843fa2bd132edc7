#include "roundabout/resource_governor.hpp"

#include <algorithm>
#include <mutex>

namespace roundabout {

namespace {

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

ApprovalResponse deny(DenialKind kind, std::string reason) {
    ApprovalResponse r;
    r.approved = false;
    r.denial = kind;
    r.reason = std::move(reason);
    return r;
}

ApprovalResponse approve(std::string reason) {
    ApprovalResponse r;
    r.approved = true;
    r.reason = std::move(reason);
    return r;
}

Config validated(Config config) {
    validate(config);
    return config;
}

// Weighted cost fed to spike detection
double weighted_cost(const ResourceUsage& usage) {
    return static_cast<double>(usage.compute_units) +
           10.0 * static_cast<double>(usage.llm_calls);
}

} // anonymous namespace

ResourceGovernor::ResourceGovernor(Config config, std::shared_ptr<Clock> clock,
                                   std::shared_ptr<Monitor> monitor)
    : config_(validated(std::move(config)))
    , clock_(clock ? std::move(clock) : std::make_shared<SystemClock>())
    , monitor_(std::move(monitor))
    , ledger_(config_.ledger_stripes)
    , breaker_(config_.circuit_breaker, clock_, monitor_)
    , tempo_(config_.tempo)
    , quotas_(config_.quotas, config_.quota_hour_window, config_.quota_day_window, ledger_)
{
}

ResourceGovernor::~ResourceGovernor() = default;

// ==================== Registry ====================

void ResourceGovernor::register_agent(AgentRegistration registration) {
    std::unique_lock lock(registry_mutex_);
    AgentId id = registration.agent_id;
    if (!registration.thread_id.empty()) {
        clone_reservations_.erase(registration.thread_id);
    }
    retired_.erase(id);
    active_agents_.insert(id);
    registry_[id] = std::move(registration);
}

std::optional<AgentRegistration> ResourceGovernor::registration(const AgentId& agent_id) const {
    std::shared_lock lock(registry_mutex_);
    auto it = registry_.find(agent_id);
    if (it == registry_.end()) return std::nullopt;
    return it->second;
}

std::size_t ResourceGovernor::registered_agent_count() const {
    std::shared_lock lock(registry_mutex_);
    return registry_.size();
}

std::size_t ResourceGovernor::active_agent_count() const {
    std::shared_lock lock(registry_mutex_);
    return active_agents_.size();
}

// ==================== Admission ====================

ApprovalResponse ResourceGovernor::request_approval(const ApprovalRequest& request) {
    ApprovalResponse response = evaluate(request);

    if (response.approved) {
        breaker_.record_success();
        emit_event(EventType::ApprovalGranted, response.reason, request.requesting_agent_id,
                   request.operation, true);
    } else {
        if (response.denial == DenialKind::QuotaViolation) {
            emit_event(EventType::QuotaViolated, join(response.violations, "; "),
                       request.requesting_agent_id, request.operation, false,
                       DenialKind::QuotaViolation,
                       user_of(request.requesting_agent_id)
                           .value_or(user_from_memory_scope(request.thread.memory_scope)));
        }
        emit_event(EventType::ApprovalDenied, response.reason, request.requesting_agent_id,
                   request.operation, false, response.denial);
    }
    return response;
}

std::future<ApprovalResponse> ResourceGovernor::request_approval_async(ApprovalRequest request) {
    return std::async(std::launch::async, [this, request = std::move(request)] {
        return request_approval(request);
    });
}

ApprovalResponse ResourceGovernor::evaluate(const ApprovalRequest& request) {
    // 1. Paused hierarchy
    if (is_paused_chain(request.requesting_agent_id, request.thread.parent_agent_id)) {
        return deny(DenialKind::HierarchyPaused,
                    "Agent hierarchy is paused due to resource issues");
    }

    // 2. Breaker
    if (breaker_.is_open()) {
        return deny(DenialKind::CircuitBreakerOpen,
                    "System circuit breaker is open due to high error rate or cost spike");
    }

    // 3. Tempo
    ResourceEstimate estimate = tempo_.scale(request.operation, request.estimated_cost);
    if (tempo_.current() == SystemTempo::Sleep &&
        request.operation != OperationType::MemoryAccess) {
        return deny(DenialKind::TempoRestricted,
                    "System is in Sleep mode - only critical operations allowed");
    }

    // 4. Operation-specific policy
    ApprovalResponse response = deny(DenialKind::None, "Unknown operation type");
    switch (request.operation) {
        case OperationType::CloneAgent:
            response = validate_clone(request, estimate);
            break;
        case OperationType::LlmCall:
            response = validate_llm_call(request, estimate);
            break;
        case OperationType::MemoryAccess:
            response = approve("Memory access approved");
            break;
        case OperationType::ExternalApi:
            response = approve("External API call approved");
            break;
    }
    if (response.approved) {
        response.approved_cost = estimate;
    }
    return response;
}

ApprovalResponse ResourceGovernor::validate_clone(const ApprovalRequest& request,
                                                  const ResourceEstimate& estimate) {
    const auto& thread = request.thread;

    int max_depth = std::min(config_.limits.max_recursion_depth,
                             max_recursion_depth(thread, config_.limits.max_recursion_depth));
    if (thread.recursion_depth >= max_depth) {
        return deny(DenialKind::RecursionLimit,
                    "Maximum recursion depth (" + std::to_string(max_depth) + ") exceeded");
    }

    // Cap check and slot reservation happen under one lock so racing clones
    // cannot both take the last slot
    std::unique_lock lock(registry_mutex_);
    std::size_t reserved = clone_reservations_.size() - clone_reservations_.count(thread.id);
    if (active_agents_.size() + reserved >= config_.limits.max_system_agents) {
        return deny(DenialKind::SystemAgentCap,
                    "Maximum system agents (" +
                    std::to_string(config_.limits.max_system_agents) + ") exceeded");
    }

    // Validate against the parent's own budget, not the child's derived one
    ResourceBudget parent_budget = thread.budget;
    AgentId parent_id = thread.parent_agent_id.value_or(request.requesting_agent_id);
    auto parent = registry_.find(parent_id);
    if (parent != registry_.end()) {
        parent_budget = parent->second.budget;
    }

    ResourceUsage projected = ledger_.usage(request.requesting_agent_id) + estimate;
    if (exceeds_fraction(projected, parent_budget, config_.clone_budget_threshold)) {
        return deny(DenialKind::BudgetInsufficient,
                    "Insufficient resource budget for agent cloning");
    }

    clone_reservations_[thread.id] = request.requesting_agent_id;
    ApprovalResponse r = approve("Agent cloning approved");
    r.updated_budget = projected;
    return r;
}

ApprovalResponse ResourceGovernor::validate_llm_call(const ApprovalRequest& request,
                                                     const ResourceEstimate& estimate) {
    ResourceEstimate calls = estimate;
    if (calls.llm_calls == 0) calls.llm_calls = 1;

    ResourceUsage projected = ledger_.usage(request.requesting_agent_id) + calls;
    if (!fits_within(projected, request.thread.budget)) {
        return deny(DenialKind::BudgetInsufficient, "LLM call quota exceeded");
    }

    UserId user = user_of(request.requesting_agent_id)
                      .value_or(user_from_memory_scope(request.thread.memory_scope));
    QuotaCheck check = quotas_.check(user, clock_->now());
    if (!check.within_limits) {
        ApprovalResponse r = deny(DenialKind::QuotaViolation,
                                  "User quota violations: " + join(check.violations, ", "));
        r.violations = std::move(check.violations);
        return r;
    }

    return approve("LLM call approved");
}

// ==================== Accounting ====================

void ResourceGovernor::update_resource_usage(const AgentId& agent_id, const ResourceUsage& delta) {
    ResourceUsage updated;
    {
        std::unique_lock lock(registry_mutex_);
        if (retired_.count(agent_id)) return;
        updated = ledger_.add(agent_id, delta);
        active_agents_.insert(agent_id);
    }

    Timestamp now = clock_->now();
    if (auto user = user_of(agent_id)) {
        ledger_.attribute_to_user(*user, agent_id, delta, now, now - config_.quota_day_window);
    }

    emit_event(EventType::ResourceUsageUpdated, "Usage now " + to_string(updated), agent_id);

    // Spike detection works on the agent's cumulative cost
    BreakerSignal signal = breaker_.record_cost(agent_id, weighted_cost(updated));
    if (signal.tripped) {
        pause_agent_hierarchy(root_of(agent_id), "Cost spike detected");
    }
    apply_tempo_change(tempo_.evaluate_cost_spike(signal.value), "cost spike");
}

ResourceUsage ResourceGovernor::agent_usage(const AgentId& agent_id) const {
    return ledger_.usage(agent_id);
}

bool ResourceGovernor::check_resource_limits(const AgentId& agent_id,
                                             const ContextThread& thread) const {
    if (!ledger_.has_entry(agent_id)) return true;
    return fits_within(ledger_.usage(agent_id), thread.budget);
}

void ResourceGovernor::record_error(const AgentId& agent_id, const std::string& error) {
    emit_event(EventType::ErrorRecorded, error, agent_id);

    BreakerSignal signal = breaker_.record_error(agent_id, error, active_agent_count());
    apply_tempo_change(tempo_.evaluate_error_rate(signal.value), "error rate");
}

void ResourceGovernor::remove_agent(const AgentId& agent_id) {
    {
        std::unique_lock lock(registry_mutex_);
        retired_.insert(agent_id);
        ledger_.remove(agent_id);
        active_agents_.erase(agent_id);
        registry_.erase(agent_id);
        for (auto it = clone_reservations_.begin(); it != clone_reservations_.end();) {
            if (it->second == agent_id) {
                it = clone_reservations_.erase(it);
            } else {
                ++it;
            }
        }
    }
    emit_event(EventType::AgentDeregistered, "Agent removed from governor", agent_id);
}

void ResourceGovernor::release_clone_reservation(const ThreadId& thread_id) {
    std::unique_lock lock(registry_mutex_);
    clone_reservations_.erase(thread_id);
}

// ==================== User quotas ====================

void ResourceGovernor::set_user_quotas(const UserId& user_id, UserResourceQuotas quotas) {
    quotas_.set_quotas(user_id, std::move(quotas));
}

UserResourceQuotas ResourceGovernor::user_quotas(const UserId& user_id) {
    return quotas_.quotas(user_id);
}

void ResourceGovernor::set_user_tier(const UserId& user_id, UserTier tier) {
    quotas_.set_tier(user_id, tier);
}

QuotaCheck ResourceGovernor::check_user_quotas(const UserId& user_id) {
    return quotas_.check(user_id, clock_->now());
}

// ==================== Hierarchies ====================

void ResourceGovernor::pause_agent_hierarchy(const AgentId& root_id, const std::string& reason) {
    {
        std::unique_lock lock(paused_mutex_);
        paused_.insert(root_id);
    }
    emit_event(EventType::HierarchyPaused, "Paused agent hierarchy: " + reason, root_id);
}

void ResourceGovernor::resume_agent_hierarchy(const AgentId& root_id) {
    bool removed;
    {
        std::unique_lock lock(paused_mutex_);
        removed = paused_.erase(root_id) > 0;
    }
    if (removed) {
        emit_event(EventType::HierarchyResumed, "Resumed agent hierarchy", root_id);
    }
}

bool ResourceGovernor::is_hierarchy_paused(const AgentId& agent_id) const {
    return is_paused_chain(agent_id, std::nullopt);
}

std::vector<AgentId> ResourceGovernor::paused_hierarchies() const {
    std::shared_lock lock(paused_mutex_);
    return std::vector<AgentId>(paused_.begin(), paused_.end());
}

AgentId ResourceGovernor::root_of(const AgentId& agent_id) const {
    std::shared_lock lock(registry_mutex_);
    auto it = registry_.find(agent_id);
    if (it == registry_.end()) return agent_id;
    return it->second.root_id.empty() ? agent_id : it->second.root_id;
}

bool ResourceGovernor::is_paused_chain(const AgentId& agent_id,
                                       const std::optional<AgentId>& fallback_parent) const {
    // Collect the ancestor chain first so the two locks are never nested
    std::vector<AgentId> chain{agent_id};
    {
        std::shared_lock lock(registry_mutex_);
        AgentId current = agent_id;
        // Depth is bounded by max_system_agents even on a malformed registry
        for (std::size_t hops = 0; hops <= config_.limits.max_system_agents; ++hops) {
            auto it = registry_.find(current);
            if (it == registry_.end() || !it->second.parent_id) break;
            current = *it->second.parent_id;
            chain.push_back(current);
        }
    }
    if (fallback_parent) {
        chain.push_back(*fallback_parent);
    }

    std::shared_lock lock(paused_mutex_);
    if (paused_.empty()) return false;
    for (auto& id : chain) {
        if (paused_.count(id)) return true;
    }
    return false;
}

std::optional<UserId> ResourceGovernor::user_of(const AgentId& agent_id) const {
    std::shared_lock lock(registry_mutex_);
    auto it = registry_.find(agent_id);
    if (it == registry_.end()) return std::nullopt;
    return it->second.user_id;
}

// ==================== Breaker / tempo ====================

void ResourceGovernor::set_system_tempo(SystemTempo tempo) {
    apply_tempo_change(tempo_.set(tempo), "operator override");
}

SystemTempo ResourceGovernor::system_tempo() const {
    return tempo_.current();
}

void ResourceGovernor::apply_tempo_change(const std::optional<TempoChange>& change,
                                          const std::string& cause) {
    if (!change) return;

    if (monitor_) {
        MonitorEvent event;
        event.type = EventType::TempoChanged;
        event.timestamp = clock_->now();
        event.message = std::string("System tempo changed from ") + to_string(change->from) +
                        " to " + to_string(change->to) + " (" + cause + ")";
        event.tempo = change->to;
        monitor_->on_event(event);
    }
}

void ResourceGovernor::set_circuit_breaker_state(CircuitStatus status) {
    breaker_.force_state(status);
}

CircuitStatus ResourceGovernor::circuit_breaker_status() const {
    return breaker_.status();
}

// ==================== Queries ====================

SystemStatus ResourceGovernor::system_status() const {
    SystemStatus status;
    status.active_agents = active_agent_count();
    status.total_usage = ledger_.total_usage();
    status.breaker_status = breaker_.status();
    return status;
}

SystemMetrics ResourceGovernor::system_metrics() const {
    SystemMetrics metrics;
    metrics.timestamp = clock_->now();
    metrics.active_agents = active_agent_count();
    metrics.total_usage = ledger_.total_usage();
    metrics.circuit_breaker = breaker_.info(metrics.active_agents);
    metrics.tempo = tempo_.current();
    metrics.error_history = breaker_.error_history();
    metrics.paused_hierarchies = paused_hierarchies();
    return metrics;
}

void ResourceGovernor::publish_snapshot() const {
    if (!monitor_) return;
    monitor_->on_snapshot(system_metrics());
}

// ==================== Events ====================

void ResourceGovernor::emit_event(EventType type, const std::string& message,
                                  std::optional<AgentId> agent_id,
                                  std::optional<OperationType> operation,
                                  std::optional<bool> approved,
                                  std::optional<DenialKind> denial,
                                  std::optional<UserId> user_id,
                                  std::optional<double> value) const {
    if (!monitor_) return;

    MonitorEvent event;
    event.type = type;
    event.timestamp = clock_->now();
    event.message = message;
    event.agent_id = std::move(agent_id);
    event.operation = operation;
    event.approved = approved;
    event.denial = denial;
    event.user_id = std::move(user_id);
    event.value = value;
    monitor_->on_event(event);
}

} // namespace roundabout
