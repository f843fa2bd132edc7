#include "roundabout/cognitive_agent.hpp"
#include "roundabout/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace roundabout {

namespace {

constexpr double kRelationalDecayMs = 1000.0 * 60.0 * 5.0;

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool starts_with_ci(const std::string& text, const std::string& prefix) {
    if (text.size() < prefix.size()) return false;
    return lowercase(text.substr(0, prefix.size())) == lowercase(prefix);
}

// Drops "<tag>:" and following whitespace from the front of a model reply
std::string strip_tag(const std::string& text, const std::string& tag) {
    if (!starts_with_ci(text, tag)) return text;
    std::size_t pos = tag.size();
    if (pos < text.size() && text[pos] == ':') ++pos;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
    return text.substr(pos);
}

std::string interpret_emotion(const std::string& text) {
    std::string lower = lowercase(text);
    if (lower.find("angry") != std::string::npos || text.find('!') != std::string::npos) {
        return "frustrated";
    }
    if (lower.find("sad") != std::string::npos || lower.find("worried") != std::string::npos) {
        return "concerned";
    }
    return "engaged";
}

AgentServices checked(AgentServices services) {
    if (!services.governor) {
        throw InvalidConfigurationException("CognitiveAgent requires a ResourceGovernor");
    }
    validate(services.config);
    if (!services.random) {
        services.random = std::make_shared<SeededRandomSource>();
    }
    if (!services.ids) {
        services.ids = std::make_shared<IdGenerator>();
    }
    return services;
}

} // anonymous namespace

std::size_t TerminationReport::failed_children() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(children.begin(), children.end(),
                      [](const ChildTermination& c) { return !c.ok(); }));
}

CognitiveAgent::CognitiveAgent(AgentId id, AgentRole role, ContextThread thread,
                               AgentServices services)
    : id_(std::move(id))
    , role_(role)
    , thread_(std::move(thread))
    , services_(checked(std::move(services)))
    , phase_(thread_.profile.entry_phase)
{
    Timestamp t = now();
    state_.phase = phase_;
    state_.timestamp = t;
    last_activity_ = t;

    AgentRegistration reg;
    reg.agent_id = id_;
    reg.parent_id = thread_.parent_agent_id;
    reg.root_id = thread_.parent_agent_id
                      ? services_.governor->root_of(*thread_.parent_agent_id)
                      : id_;
    reg.user_id = user_from_memory_scope(thread_.memory_scope);
    reg.budget = thread_.budget;
    reg.recursion_depth = thread_.recursion_depth;
    reg.thread_id = thread_.id;
    services_.governor->register_agent(std::move(reg));
}

// ==================== Loop ====================

AgentResponse CognitiveAgent::process_input(const AgentInput& input) {
    ensure_active();
    touch();

    try {
        execute_roundabout_loop();

        std::optional<RelationalDelta> delta;
        if (input.user_state) {
            delta = calculate_relational_delta(*input.user_state);
        }

        AgentResponse response;
        response.text = generate_response_text(input, delta);
        response.type = ResponseType::Message;
        response.agent_state = state();
        response.relational_delta = delta;
        response.timestamp = now();

        ResourceQuantity compute = std::max<ResourceQuantity>(
            1, static_cast<ResourceQuantity>(input.text.size() / 100));
        ResourceUsage response_cost{1, compute, 0, 0};
        if (!try_consume(response_cost)) {
            throw emergence_failure(shortfall("response", response_cost));
        }
        return response;
    } catch (...) {
        transition_to(CognitivePhase::Adapt);
        throw;
    }
}

void CognitiveAgent::execute_roundabout_loop() {
    std::lock_guard<std::mutex> loop_lock(loop_mutex_);
    ensure_active();
    touch();

    CognitivePhase current;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (halt_reason_) {
            throw StrategicHaltException(*halt_reason_);
        }
        current = phase_;
    }

    try {
        switch (current) {
            case CognitivePhase::Emerge:
                run_emerge();
                break;
            case CognitivePhase::Adapt:
                run_adapt();
                break;
            case CognitivePhase::Integrate:
                run_integrate();
                break;
        }
    } catch (...) {
        if (phase() != CognitivePhase::Adapt) {
            transition_to(CognitivePhase::Adapt);
        }
        throw;
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.phase = phase_;
    state_.timestamp = now();
}

void CognitiveAgent::run_emerge() {
    EmergenceResult result = attempt_closure();

    if (!result.success) {
        throw emergence_failure(result.detail);
    }

    emit(EventType::PhaseSucceeded, "SUCCESS in EMERGE: " + result.detail,
         CognitivePhase::Emerge);
}

void CognitiveAgent::run_adapt() {
    std::vector<FailureRecord> failures = failure_history();
    FailureAnalysis analysis = analyze_failures(failures);

    DecisionFactors factors;
    factors.resources_available = resources_remaining();
    factors.failure_count = failures.size();
    factors.severity = analysis.severity;
    factors.type = analysis.type;
    factors.recursion_depth = thread_.recursion_depth;
    factors.max_recursion_depth =
        max_recursion_depth(thread_, services_.config.default_max_recursion_depth);
    factors.time_elapsed = now() - thread_.created_at;
    factors.execution_time_budget_ms = thread_.budget.execution_time_ms;

    StrategicDecision decision = make_strategic_decision(factors);

    emit(EventType::AdaptDecision,
         std::string("ADAPT decision: ") + to_string(decision.decision) + " - " +
             decision.reason + " (" + to_string(analysis.severity) + " " +
             to_string(analysis.type) + ", " + analysis.pattern + ": " +
             analysis.recommendation + ")",
         CognitivePhase::Adapt);

    if (decision.decision == Decision::Proceed) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            adaptation_context_ = decision;
        }
        transition_to(CognitivePhase::Integrate);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        halt_reason_ = decision.reason;
    }
    emit(EventType::PhaseFailed, "FAILURE in ADAPT: Agent halted: " + decision.reason,
         CognitivePhase::Adapt);
    throw StrategicHaltException(decision.reason);
}

void CognitiveAgent::run_integrate() {
    ResourceQuantity cost = services_.config.planning_cost;
    ResourceQuantity compute_left;
    std::vector<FailureRecord> failures;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        compute_left = remaining(thread_.budget, usage_).compute_units;
        failures = failures_;
    }

    if (compute_left < cost) {
        std::string detail = "insufficient compute budget for planning (" +
                             std::to_string(compute_left) + " < " +
                             std::to_string(cost) + ")";
        record_failure(CognitivePhase::Integrate, detail);
        emit(EventType::PhaseFailed, "FAILURE in INTEGRATE: " + detail,
             CognitivePhase::Integrate);
        throw TacticalPlanInvalidException(detail);
    }

    consume(ResourceUsage{0, cost, 0, 0});
    TacticalPlan plan = synthesize_tactical_plan(services_.ids->next("plan"), failures, now());
    std::string approach = plan.approach;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        plan_ = std::move(plan);
    }

    transition_to(CognitivePhase::Emerge);
    emit(EventType::PhaseSucceeded, "SUCCESS in INTEGRATE: New tactical plan " + approach,
         CognitivePhase::Integrate);
}

// ==================== EMERGE strategies ====================

CognitiveAgent::EmergenceResult CognitiveAgent::attempt_closure() {
    switch (role_) {
        case AgentRole::Coordinator:
            return coordinator_closure();
        case AgentRole::Conscious:
            if (!try_consume(ResourceUsage{0, 5, 0, 0})) {
                return EmergenceResult{false, shortfall("closure", ResourceUsage{0, 5, 0, 0})};
            }
            return heuristic_closure("User interaction handled successfully",
                                     "Failed to establish proper user connection");
        case AgentRole::Core:
            if (!try_consume(ResourceUsage{0, 3, 0, 0})) {
                return EmergenceResult{false, shortfall("closure", ResourceUsage{0, 3, 0, 0})};
            }
            return heuristic_closure("Core task executed successfully",
                                     "Core task execution failed");
    }
    return EmergenceResult{false, "Unknown agent role"};
}

CognitiveAgent::EmergenceResult CognitiveAgent::coordinator_closure() {
    if (!try_consume(ResourceUsage{0, 10, 0, 0})) {
        return EmergenceResult{false, shortfall("coordination", ResourceUsage{0, 10, 0, 0})};
    }

    const char* success_text = "Coordination tasks completed successfully";
    const char* failure_text = "Failed to coordinate sub-tasks effectively";

    if (!services_.model) {
        return heuristic_closure(success_text, failure_text);
    }

    ApprovalRequest approval_request;
    approval_request.operation = OperationType::LlmCall;
    approval_request.requesting_agent_id = id_;
    approval_request.estimated_cost = ResourceEstimate{1, 0, 0, 0};
    approval_request.thread = thread_;
    ApprovalResponse approval = services_.governor->request_approval(approval_request);
    if (!approval.approved) {
        return EmergenceResult{false, "LLM call denied: " + approval.reason};
    }

    const auto& cfg = services_.config;
    ModelRequest request;
    request.messages.push_back(ModelMessage{
        "system",
        "You are a Coordinator cognitive agent. Your task is to coordinate and manage "
        "sub-tasks effectively.\nCurrent context: " + thread_.task_definition +
        "\nGoal: " + thread_.top_level_goal +
        "\n\nAnalyze the current situation and determine if coordination tasks can be "
        "completed successfully.\nRespond with either \"SUCCESS: [brief explanation]\" or "
        "\"FAILURE: [brief explanation]\""});
    request.messages.push_back(ModelMessage{
        "user", "Please coordinate the following task: " + thread_.task_definition});
    request.max_tokens = cfg.model_max_tokens;
    request.temperature = cfg.model_temperature;
    request.provider_hint = cfg.model_provider_hint;
    Timestamp started = now();
    request.deadline = started + cfg.model_call_timeout;

    ModelResponse response;
    try {
        response = services_.model->chat(request);
    } catch (const std::exception& e) {
        emit(EventType::ModelFallback,
             std::string("Model call failed, using local heuristic: ") + e.what(),
             CognitivePhase::Emerge);
        return heuristic_closure(success_text, failure_text);
    }
    if (!try_consume(ResourceUsage{1, 0, 0, 0})) {
        return EmergenceResult{false, shortfall("model call", ResourceUsage{1, 0, 0, 0})};
    }

    if (now() > request.deadline) {
        return EmergenceResult{false, "Model call timeout after " +
                                          std::to_string(to_millis(now() - started)) + " ms"};
    }

    if (starts_with_ci(response.content, "SUCCESS")) {
        return EmergenceResult{true, strip_tag(response.content, "SUCCESS")};
    }
    return EmergenceResult{false, strip_tag(response.content, "FAILURE")};
}

CognitiveAgent::EmergenceResult CognitiveAgent::heuristic_closure(const char* success_text,
                                                                  const char* failure_text) {
    std::size_t failure_count;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        failure_count = failures_.size();
    }
    double p = success_probability(failure_count, resources_remaining());
    if (services_.random->next_unit() < p) {
        return EmergenceResult{true, success_text};
    }
    return EmergenceResult{false, failure_text};
}

std::string CognitiveAgent::generate_response_text(
    const AgentInput& input, const std::optional<RelationalDelta>& delta) const
{
    switch (role_) {
        case AgentRole::Coordinator:
            return "Coordinator agent processing: " + input.text;
        case AgentRole::Core:
            return "Core agent executing task: " + input.text;
        case AgentRole::Conscious:
            break;
    }

    if (delta) {
        switch (delta->strategy) {
            case CommunicationStrategy::Mirror:
                return "I understand you're feeling " + interpret_emotion(input.text) +
                       ". Let me reflect that back to you.";
            case CommunicationStrategy::Listen:
                return "I'm here to listen. Please tell me more about what you're experiencing.";
            case CommunicationStrategy::Harmonize:
                return "I hear you, and I'd like to help guide us toward a solution together.";
        }
    }
    return "I'm processing your input: " + input.text;
}

// ==================== Hierarchy ====================

std::shared_ptr<CognitiveAgent> CognitiveAgent::clone(ConfigurationProfile child_profile,
                                                      std::string task_definition,
                                                      AgentRole child_role) {
    ensure_active();
    touch();

    std::lock_guard<std::mutex> clone_lock(clone_mutex_);

    ResourceUsage parent_usage = resource_usage();
    ContextThread child_thread = derive_child_thread(
        thread_, id_, services_.ids->next("thread"), std::move(task_definition),
        std::move(child_profile), parent_usage, services_.config.child_budget_ratio, now());

    ApprovalRequest request;
    request.operation = OperationType::CloneAgent;
    request.requesting_agent_id = id_;
    request.estimated_cost = services_.config.clone_cost_estimate;
    request.thread = child_thread;

    ApprovalResponse approval = services_.governor->request_approval(request);
    if (!approval.approved) {
        services_.governor->record_error(id_, "Agent cloning denied: " + approval.reason);
        std::rethrow_exception(
            make_denial_exception(approval.denial, approval.reason, approval.violations));
    }

    ThreadId reserved_thread = child_thread.id;
    std::string task = child_thread.task_definition;
    std::shared_ptr<CognitiveAgent> child;
    try {
        // terminate() may have run while approval was pending
        ensure_active();
        child = std::make_shared<CognitiveAgent>(
            services_.ids->next("agent"), child_role, std::move(child_thread), services_);
    } catch (...) {
        services_.governor->release_clone_reservation(reserved_thread);
        throw;
    }

    bool adopted;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        adopted = active_;
        if (adopted) {
            children_.emplace(child->id(), child);
        }
    }
    if (!adopted) {
        child->terminate();
        throw AgentInactiveException(id_);
    }
    consume(approval.approved_cost.value_or(request.estimated_cost));

    emit(EventType::ChildAgentCreated, "Created child agent for task: " + task,
         std::nullopt, child->id());
    return child;
}

TerminationReport CognitiveAgent::terminate() {
    TerminationReport report;
    report.agent_id = id_;

    std::map<AgentId, std::shared_ptr<CognitiveAgent>> children;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!active_) return report;
        active_ = false;
        children.swap(children_);
    }

    for (auto& [_, c] : children) {
        report.children.push_back(terminate_child(*c));
    }

    if (thread_.parent_agent_id) {
        emit(EventType::ReportForwarded,
             "Reporting to parent: " + std::to_string(report.children.size()) +
                 " child agent results",
             std::nullopt, *thread_.parent_agent_id);
    }

    // Only after every child had its chance to terminate and report
    {
        std::lock_guard<std::mutex> accounting(accounting_mutex_);
        services_.governor->remove_agent(id_);
    }

    emit(EventType::AgentTerminated,
         "Agent terminated with " + std::to_string(report.children.size()) + " child reports");
    return report;
}

ChildTermination CognitiveAgent::terminate_child(CognitiveAgent& c) {
    ChildTermination outcome;
    try {
        TerminationReport sub = c.terminate();
        outcome.report = poll_report(c);
        for (auto& grandchild : sub.children) {
            outcome.report.children.push_back(std::move(grandchild.report));
        }
    } catch (const std::exception& e) {
        outcome.error = e.what();

        ChildAgentReport failed;
        failed.child_id = c.id();
        failed.task_definition = c.context_thread().task_definition;
        failed.status = ReportStatus::Error;
        failed.error = e.what();
        failed.resource_usage = c.resource_usage();
        failed.execution_time = now() - c.context_thread().created_at;
        failed.timestamp = now();
        outcome.report = std::move(failed);

        std::string message = std::string("Child agent termination failed: ") + e.what();
        services_.governor->record_error(id_, message);
        emit(EventType::ChildTerminationFailed, message, std::nullopt, c.id());
    }
    return outcome;
}

ChildAgentReport CognitiveAgent::poll_report(const CognitiveAgent& c) const {
    ChildAgentReport report;
    report.child_id = c.id();
    report.task_definition = c.context_thread().task_definition;
    report.timestamp = now();
    report.execution_time = report.timestamp - c.context_thread().created_at;

    bool active;
    CognitivePhase child_phase;
    Timestamp last_activity;
    std::optional<std::string> halt;
    {
        std::lock_guard<std::mutex> lock(c.state_mutex_);
        active = c.active_;
        child_phase = c.phase_;
        last_activity = c.last_activity_;
        halt = c.halt_reason_;
        report.resource_usage = c.usage_;
    }

    if (halt) {
        report.status = ReportStatus::Failed;
        report.error = "Agent halted: " + *halt;
    } else if (!active) {
        report.status = ReportStatus::Completed;
        report.result = "Child agent completed task: " + report.task_definition;
    } else if (child_phase == CognitivePhase::Adapt &&
               report.timestamp - last_activity > services_.config.stuck_in_adapt_threshold) {
        report.status = ReportStatus::Failed;
        report.error = "Child agent stuck in ADAPT phase with repeated failures";
    } else {
        report.status = ReportStatus::Running;
    }
    return report;
}

std::shared_ptr<CognitiveAgent> CognitiveAgent::child(const AgentId& child_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = children_.find(child_id);
    if (it == children_.end()) return nullptr;
    return it->second;
}

std::vector<std::shared_ptr<CognitiveAgent>> CognitiveAgent::children() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::vector<std::shared_ptr<CognitiveAgent>> result;
    result.reserve(children_.size());
    for (auto& [_, c] : children_) {
        result.push_back(c);
    }
    return result;
}

std::vector<ChildAgentReport> CognitiveAgent::child_reports() const {
    std::vector<ChildAgentReport> reports;
    for (auto& c : children()) {
        reports.push_back(poll_report(*c));
    }
    return reports;
}

std::optional<ChildAgentReport> CognitiveAgent::remove_child(const AgentId& child_id) {
    std::shared_ptr<CognitiveAgent> target = child(child_id);
    if (!target) return std::nullopt;

    ChildTermination outcome = terminate_child(*target);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        children_.erase(child_id);
    }

    emit(EventType::ChildAgentRemoved,
         std::string("Removed child agent, status: ") + to_string(outcome.report.status),
         std::nullopt, child_id);
    return outcome.report;
}

// ==================== State ====================

RelationalDelta CognitiveAgent::calculate_relational_delta(const UserState& user_state) const {
    AgentState own = state();

    double dt_ms = std::abs(static_cast<double>(to_millis(own.timestamp - user_state.timestamp)));
    double weight = std::exp(-dt_ms / kRelationalDecayMs);

    double alignment = 1.0 - std::abs(user_state.fixes - own.confidence);

    RelationalDelta delta;
    delta.async_delta = (1.0 - alignment) * weight;
    delta.sync_delta = own.resonance * weight;
    delta.magnitude = std::sqrt(delta.async_delta * delta.async_delta +
                                delta.sync_delta * delta.sync_delta);

    if (user_state.fight > 0.7 || user_state.flight > 0.7) {
        delta.strategy = CommunicationStrategy::Listen;
    } else if (delta.async_delta > 0.6) {
        delta.strategy = CommunicationStrategy::Mirror;
    } else {
        delta.strategy = CommunicationStrategy::Harmonize;
    }
    return delta;
}

void CognitiveAgent::update_state(const AgentStateUpdate& update) {
    Timestamp t = now();
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (update.phase) state_.phase = *update.phase;
    if (update.resonance) state_.resonance = *update.resonance;
    if (update.confidence) state_.confidence = *update.confidence;
    state_.timestamp = t;
    last_activity_ = t;
}

AgentState CognitiveAgent::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

CognitivePhase CognitiveAgent::phase() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return phase_;
}

bool CognitiveAgent::is_active() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return active_;
}

bool CognitiveAgent::is_halted() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return halt_reason_.has_value();
}

AgentStatus CognitiveAgent::status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    AgentStatus s;
    s.id = id_;
    s.phase = phase_;
    s.active = active_;
    s.child_count = children_.size();
    s.resource_usage = usage_;
    s.last_activity = last_activity_;
    return s;
}

ResourceUsage CognitiveAgent::resource_usage() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return usage_;
}

std::vector<FailureRecord> CognitiveAgent::failure_history() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return failures_;
}

std::optional<StrategicDecision> CognitiveAgent::adaptation_context() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return adaptation_context_;
}

std::optional<TacticalPlan> CognitiveAgent::current_plan() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return plan_;
}

// ==================== Internals ====================

void CognitiveAgent::consume(const ResourceUsage& delta) {
    charge(delta, false);
}

bool CognitiveAgent::try_consume(const ResourceUsage& delta) {
    return charge(delta, true);
}

bool CognitiveAgent::charge(const ResourceUsage& delta, bool enforce_budget) {
    std::lock_guard<std::mutex> accounting(accounting_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!active_) {
            throw AgentInactiveException(id_);
        }
        if (enforce_budget && !fits_within(usage_ + delta, thread_.budget)) {
            return false;
        }
        usage_ += delta;
    }
    services_.governor->update_resource_usage(id_, delta);
    return true;
}

std::string CognitiveAgent::shortfall(const std::string& what, const ResourceUsage& cost) const {
    ResourceUsage left;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        left = remaining(thread_.budget, usage_);
    }
    return "Insufficient resources for " + what + ": needs " + to_string(cost) +
           ", remaining " + to_string(left);
}

EmergenceFailureException CognitiveAgent::emergence_failure(const std::string& detail) {
    record_failure(CognitivePhase::Emerge, detail);
    transition_to(CognitivePhase::Adapt);
    emit(EventType::PhaseFailed, "FAILURE in EMERGE: " + detail, CognitivePhase::Emerge);
    return EmergenceFailureException(detail);
}

bool CognitiveAgent::resources_remaining() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return has_remaining(usage_, thread_.budget);
}

void CognitiveAgent::transition_to(CognitivePhase next) {
    CognitivePhase previous;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        previous = phase_;
        if (previous == next) return;
        phase_ = next;
        state_.phase = next;
        state_.timestamp = now();
    }
    emit(EventType::PhaseTransition,
         std::string(to_string(previous)) + " -> " + to_string(next), next);
}

void CognitiveAgent::record_failure(CognitivePhase phase, const std::string& error) {
    Timestamp t = now();
    std::lock_guard<std::mutex> lock(state_mutex_);
    failures_.push_back(FailureRecord{phase, error, t});
}

void CognitiveAgent::touch() {
    Timestamp t = now();
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_activity_ = t;
}

void CognitiveAgent::ensure_active() const {
    if (!is_active()) {
        throw AgentInactiveException(id_);
    }
}

Timestamp CognitiveAgent::now() const {
    return services_.governor->clock()->now();
}

void CognitiveAgent::emit(EventType type, const std::string& message,
                          std::optional<CognitivePhase> phase,
                          std::optional<AgentId> target) const {
    if (!services_.monitor) return;

    MonitorEvent event;
    event.type = type;
    event.timestamp = now();
    event.message = message;
    event.agent_id = id_;
    event.target_agent_id = std::move(target);
    event.phase = phase;
    event.user_id = user_from_memory_scope(thread_.memory_scope);
    services_.monitor->on_event(event);
}

} // namespace roundabout
