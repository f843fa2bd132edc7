#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <roundabout/roundabout.hpp>

using namespace roundabout;

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_roundabout, m) {
    m.doc() = "Roundabout: cognitive agent orchestration with resource governance";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_core(m);
    bind_monitors(m);
    bind_governor(m);
    bind_agents(m);
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<CognitivePhase>(m, "CognitivePhase")
        .value("Emerge",    CognitivePhase::Emerge)
        .value("Adapt",     CognitivePhase::Adapt)
        .value("Integrate", CognitivePhase::Integrate)
        .export_values();

    py::enum_<AgentRole>(m, "AgentRole")
        .value("Coordinator", AgentRole::Coordinator)
        .value("Conscious",   AgentRole::Conscious)
        .value("Core",        AgentRole::Core)
        .export_values();

    py::enum_<OperationType>(m, "OperationType")
        .value("CloneAgent",   OperationType::CloneAgent)
        .value("LlmCall",      OperationType::LlmCall)
        .value("MemoryAccess", OperationType::MemoryAccess)
        .value("ExternalApi",  OperationType::ExternalApi)
        .export_values();

    py::enum_<CircuitStatus>(m, "CircuitStatus")
        .value("Closed",   CircuitStatus::Closed)
        .value("Open",     CircuitStatus::Open)
        .value("HalfOpen", CircuitStatus::HalfOpen)
        .export_values();

    py::enum_<SystemTempo>(m, "SystemTempo")
        .value("HighPerformance", SystemTempo::HighPerformance)
        .value("LowIntensity",    SystemTempo::LowIntensity)
        .value("Sleep",           SystemTempo::Sleep)
        .export_values();

    py::enum_<UserTier>(m, "UserTier")
        .value("Free",       UserTier::Free)
        .value("Premium",    UserTier::Premium)
        .value("Enterprise", UserTier::Enterprise)
        .export_values();

    py::enum_<ReportStatus>(m, "ReportStatus")
        .value("Completed", ReportStatus::Completed)
        .value("Failed",    ReportStatus::Failed)
        .value("Running",   ReportStatus::Running)
        .value("Error",     ReportStatus::Error)
        .export_values();

    py::enum_<CommunicationStrategy>(m, "CommunicationStrategy")
        .value("Mirror",    CommunicationStrategy::Mirror)
        .value("Harmonize", CommunicationStrategy::Harmonize)
        .value("Listen",    CommunicationStrategy::Listen)
        .export_values();

    py::enum_<DenialKind>(m, "DenialKind")
        .value("NoDenial",           DenialKind::None)
        .value("HierarchyPaused",    DenialKind::HierarchyPaused)
        .value("CircuitBreakerOpen", DenialKind::CircuitBreakerOpen)
        .value("TempoRestricted",    DenialKind::TempoRestricted)
        .value("RecursionLimit",     DenialKind::RecursionLimit)
        .value("SystemAgentCap",     DenialKind::SystemAgentCap)
        .value("BudgetInsufficient", DenialKind::BudgetInsufficient)
        .value("QuotaViolation",     DenialKind::QuotaViolation)
        .export_values();

    py::enum_<InputType>(m, "InputType")
        .value("Chat",    InputType::Chat)
        .value("Edit",    InputType::Edit)
        .value("Command", InputType::Command)
        .export_values();

    py::enum_<ResponseType>(m, "ResponseType")
        .value("Message",    ResponseType::Message)
        .value("Action",     ResponseType::Action)
        .value("Suggestion", ResponseType::Suggestion)
        .export_values();

    py::enum_<FailureSeverity>(m, "FailureSeverity")
        .value("Minor",    FailureSeverity::Minor)
        .value("Moderate", FailureSeverity::Moderate)
        .value("Critical", FailureSeverity::Critical)
        .export_values();

    py::enum_<FailureType>(m, "FailureType")
        .value("Resource", FailureType::Resource)
        .value("Logic",    FailureType::Logic)
        .value("External", FailureType::External)
        .value("Timeout",  FailureType::Timeout)
        .export_values();

    py::enum_<Decision>(m, "Decision")
        .value("Proceed",              Decision::Proceed)
        .value("HaltAndReportFailure", Decision::HaltAndReportFailure)
        .export_values();

    py::enum_<EventType>(m, "EventType")
        .value("AgentCreated",           EventType::AgentCreated)
        .value("AgentTerminated",        EventType::AgentTerminated)
        .value("ChildAgentCreated",      EventType::ChildAgentCreated)
        .value("ChildAgentRemoved",      EventType::ChildAgentRemoved)
        .value("ChildTerminationFailed", EventType::ChildTerminationFailed)
        .value("ReportForwarded",        EventType::ReportForwarded)
        .value("PhaseTransition",        EventType::PhaseTransition)
        .value("PhaseSucceeded",         EventType::PhaseSucceeded)
        .value("PhaseFailed",            EventType::PhaseFailed)
        .value("AdaptDecision",          EventType::AdaptDecision)
        .value("ModelFallback",          EventType::ModelFallback)
        .value("ApprovalGranted",        EventType::ApprovalGranted)
        .value("ApprovalDenied",         EventType::ApprovalDenied)
        .value("ResourceUsageUpdated",   EventType::ResourceUsageUpdated)
        .value("ErrorRecorded",          EventType::ErrorRecorded)
        .value("QuotaViolated",          EventType::QuotaViolated)
        .value("CircuitBreakerOpened",   EventType::CircuitBreakerOpened)
        .value("CircuitBreakerHalfOpen", EventType::CircuitBreakerHalfOpen)
        .value("CircuitBreakerClosed",   EventType::CircuitBreakerClosed)
        .value("TempoChanged",           EventType::TempoChanged)
        .value("HierarchyPaused",        EventType::HierarchyPaused)
        .value("HierarchyResumed",       EventType::HierarchyResumed)
        .value("AgentDeregistered",      EventType::AgentDeregistered);

    py::enum_<ConsoleMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   ConsoleMonitor::Verbosity::Quiet)
        .value("Normal",  ConsoleMonitor::Verbosity::Normal)
        .value("Verbose", ConsoleMonitor::Verbosity::Verbose)
        .value("Debug",   ConsoleMonitor::Verbosity::Debug)
        .export_values();

    // ---- Resource vectors -------------------------------------------------

    // ResourceBudget, ResourceUsage and ResourceEstimate share one type
    py::class_<ResourceVector>(m, "ResourceVector")
        .def(py::init([](ResourceQuantity llm_calls, ResourceQuantity compute_units,
                         ResourceQuantity storage_bytes, ResourceQuantity execution_time_ms) {
                 return ResourceVector{llm_calls, compute_units, storage_bytes,
                                       execution_time_ms};
             }),
             py::arg("llm_calls") = 0, py::arg("compute_units") = 0,
             py::arg("storage_bytes") = 0, py::arg("execution_time_ms") = 0)
        .def_readwrite("llm_calls",         &ResourceVector::llm_calls)
        .def_readwrite("compute_units",     &ResourceVector::compute_units)
        .def_readwrite("storage_bytes",     &ResourceVector::storage_bytes)
        .def_readwrite("execution_time_ms", &ResourceVector::execution_time_ms)
        .def("is_zero", &ResourceVector::is_zero)
        .def("__add__", [](const ResourceVector& a, const ResourceVector& b) { return a + b; })
        .def("__eq__",  [](const ResourceVector& a, const ResourceVector& b) { return a == b; })
        .def("__repr__", [](const ResourceVector& v) {
            return "<ResourceVector " + to_string(v) + ">";
        });

    m.attr("ResourceBudget")   = m.attr("ResourceVector");
    m.attr("ResourceUsage")    = m.attr("ResourceVector");
    m.attr("ResourceEstimate") = m.attr("ResourceVector");

    m.def("remaining",        &remaining,        py::arg("budget"), py::arg("usage"));
    m.def("fits_within",      &fits_within,      py::arg("usage"), py::arg("budget"));
    m.def("exceeds_fraction", &exceeds_fraction, py::arg("usage"), py::arg("budget"),
          py::arg("ratio"));

    // ---- Configuration ----------------------------------------------------

    py::class_<SystemLimits>(m, "SystemLimits")
        .def(py::init<>())
        .def_readwrite("max_recursion_depth", &SystemLimits::max_recursion_depth)
        .def_readwrite("max_active_agents",   &SystemLimits::max_active_agents)
        .def_readwrite("max_system_agents",   &SystemLimits::max_system_agents);

    py::class_<CircuitBreakerConfig>(m, "CircuitBreakerConfig")
        .def(py::init<>())
        .def_readwrite("error_rate_threshold",        &CircuitBreakerConfig::error_rate_threshold)
        .def_readwrite("cost_spike_threshold",        &CircuitBreakerConfig::cost_spike_threshold)
        .def_readwrite("time_window",                 &CircuitBreakerConfig::time_window)
        .def_readwrite("min_error_samples",           &CircuitBreakerConfig::min_error_samples)
        .def_readwrite("min_cost_samples",            &CircuitBreakerConfig::min_cost_samples)
        .def_readwrite("min_average_cost",            &CircuitBreakerConfig::min_average_cost)
        .def_readwrite("baseline_cost",               &CircuitBreakerConfig::baseline_cost)
        .def_readwrite("half_open_success_threshold", &CircuitBreakerConfig::half_open_success_threshold);

    py::class_<TempoConfig>(m, "TempoConfig")
        .def(py::init<>())
        .def_readwrite("error_degrade_to_low",   &TempoConfig::error_degrade_to_low)
        .def_readwrite("error_degrade_to_sleep", &TempoConfig::error_degrade_to_sleep)
        .def_readwrite("error_recover_to_low",   &TempoConfig::error_recover_to_low)
        .def_readwrite("error_recover_to_high",  &TempoConfig::error_recover_to_high)
        .def_readwrite("cost_degrade_to_low",    &TempoConfig::cost_degrade_to_low)
        .def_readwrite("cost_degrade_to_sleep",  &TempoConfig::cost_degrade_to_sleep)
        .def_readwrite("cost_recover_to_low",    &TempoConfig::cost_recover_to_low)
        .def_readwrite("cost_recover_to_high",   &TempoConfig::cost_recover_to_high)
        .def_readwrite("low_intensity_scale",    &TempoConfig::low_intensity_scale)
        .def_readwrite("sleep_clamp",            &TempoConfig::sleep_clamp);

    py::class_<LlmQuota>(m, "LlmQuota")
        .def(py::init<>())
        .def_readwrite("max_calls_per_hour",  &LlmQuota::max_calls_per_hour)
        .def_readwrite("max_calls_per_day",   &LlmQuota::max_calls_per_day)
        .def_readwrite("max_tokens_per_call", &LlmQuota::max_tokens_per_call);

    py::class_<StorageQuota>(m, "StorageQuota")
        .def(py::init<>())
        .def_readwrite("max_total_bytes", &StorageQuota::max_total_bytes)
        .def_readwrite("max_file_size",   &StorageQuota::max_file_size);

    py::class_<ComputeQuota>(m, "ComputeQuota")
        .def(py::init<>())
        .def_readwrite("max_units_per_hour",        &ComputeQuota::max_units_per_hour)
        .def_readwrite("max_units_per_day",         &ComputeQuota::max_units_per_day)
        .def_readwrite("max_concurrent_operations", &ComputeQuota::max_concurrent_operations);

    py::class_<UserResourceQuotas>(m, "UserResourceQuotas")
        .def(py::init<>())
        .def_readwrite("user_id", &UserResourceQuotas::user_id)
        .def_readwrite("tier",    &UserResourceQuotas::tier)
        .def_readwrite("llm",     &UserResourceQuotas::llm)
        .def_readwrite("storage", &UserResourceQuotas::storage)
        .def_readwrite("compute", &UserResourceQuotas::compute)
        .def_static("free_tier",       &QuotaDefaults::free_tier)
        .def_static("premium_tier",    &QuotaDefaults::premium_tier)
        .def_static("enterprise_tier", &QuotaDefaults::enterprise_tier);

    py::class_<QuotaDefaults>(m, "QuotaDefaults")
        .def(py::init<>())
        .def_readwrite("free",       &QuotaDefaults::free)
        .def_readwrite("premium",    &QuotaDefaults::premium)
        .def_readwrite("enterprise", &QuotaDefaults::enterprise);

    // Config (governor-side, embeds the sub-configs)
    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("limits",                 &Config::limits)
        .def_readwrite("circuit_breaker",        &Config::circuit_breaker)
        .def_readwrite("tempo",                  &Config::tempo)
        .def_readwrite("quotas",                 &Config::quotas)
        .def_readwrite("clone_budget_threshold", &Config::clone_budget_threshold)
        .def_readwrite("quota_hour_window",      &Config::quota_hour_window)
        .def_readwrite("quota_day_window",       &Config::quota_day_window)
        .def_readwrite("ledger_stripes",         &Config::ledger_stripes)
        .def("validate", [](const Config& c) { validate(c); });

    py::class_<AgentConfig>(m, "AgentConfig")
        .def(py::init<>())
        .def_readwrite("child_budget_ratio",          &AgentConfig::child_budget_ratio)
        .def_readwrite("clone_cost_estimate",         &AgentConfig::clone_cost_estimate)
        .def_readwrite("default_budget",              &AgentConfig::default_budget)
        .def_readwrite("default_max_recursion_depth", &AgentConfig::default_max_recursion_depth)
        .def_readwrite("model_call_timeout",          &AgentConfig::model_call_timeout)
        .def_readwrite("model_max_tokens",            &AgentConfig::model_max_tokens)
        .def_readwrite("model_temperature",           &AgentConfig::model_temperature)
        .def_readwrite("model_provider_hint",         &AgentConfig::model_provider_hint)
        .def_readwrite("planning_cost",               &AgentConfig::planning_cost)
        .def_readwrite("stuck_in_adapt_threshold",    &AgentConfig::stuck_in_adapt_threshold)
        .def("validate", [](const AgentConfig& c) { validate(c); });

    // ---- Agent-facing records ---------------------------------------------

    py::class_<UserState>(m, "UserState")
        .def(py::init<>())
        .def_readwrite("fight",      &UserState::fight)
        .def_readwrite("flight",     &UserState::flight)
        .def_readwrite("fixes",      &UserState::fixes)
        .def_readwrite("confidence", &UserState::confidence)
        .def_readwrite("timestamp",  &UserState::timestamp);

    py::class_<AgentState>(m, "AgentState")
        .def(py::init<>())
        .def_readwrite("phase",      &AgentState::phase)
        .def_readwrite("resonance",  &AgentState::resonance)
        .def_readwrite("confidence", &AgentState::confidence)
        .def_readwrite("timestamp",  &AgentState::timestamp);

    py::class_<AgentStateUpdate>(m, "AgentStateUpdate")
        .def(py::init<>())
        .def_readwrite("phase",      &AgentStateUpdate::phase)
        .def_readwrite("resonance",  &AgentStateUpdate::resonance)
        .def_readwrite("confidence", &AgentStateUpdate::confidence);

    py::class_<RelationalDelta>(m, "RelationalDelta")
        .def(py::init<>())
        .def_readwrite("async_delta", &RelationalDelta::async_delta)
        .def_readwrite("sync_delta",  &RelationalDelta::sync_delta)
        .def_readwrite("magnitude",   &RelationalDelta::magnitude)
        .def_readwrite("strategy",    &RelationalDelta::strategy);

    py::class_<AgentInput>(m, "AgentInput")
        .def(py::init<>())
        .def(py::init([](std::string text) {
                 AgentInput in;
                 in.text = std::move(text);
                 return in;
             }),
             py::arg("text"))
        .def_readwrite("text",       &AgentInput::text)
        .def_readwrite("type",       &AgentInput::type)
        .def_readwrite("user_state", &AgentInput::user_state)
        .def_readwrite("timestamp",  &AgentInput::timestamp);

    py::class_<AgentResponse>(m, "AgentResponse")
        .def(py::init<>())
        .def_readwrite("text",             &AgentResponse::text)
        .def_readwrite("type",             &AgentResponse::type)
        .def_readwrite("agent_state",      &AgentResponse::agent_state)
        .def_readwrite("relational_delta", &AgentResponse::relational_delta)
        .def_readwrite("timestamp",        &AgentResponse::timestamp);

    py::class_<FailureRecord>(m, "FailureRecord")
        .def(py::init<>())
        .def_readwrite("phase",     &FailureRecord::phase)
        .def_readwrite("error",     &FailureRecord::error)
        .def_readwrite("timestamp", &FailureRecord::timestamp);

    py::class_<DecisionFactors>(m, "DecisionFactors")
        .def(py::init<>())
        .def_readwrite("resources_available",      &DecisionFactors::resources_available)
        .def_readwrite("failure_count",            &DecisionFactors::failure_count)
        .def_readwrite("severity",                 &DecisionFactors::severity)
        .def_readwrite("type",                     &DecisionFactors::type)
        .def_readwrite("recursion_depth",          &DecisionFactors::recursion_depth)
        .def_readwrite("max_recursion_depth",      &DecisionFactors::max_recursion_depth)
        .def_readwrite("time_elapsed",             &DecisionFactors::time_elapsed)
        .def_readwrite("execution_time_budget_ms", &DecisionFactors::execution_time_budget_ms);

    py::class_<StrategicDecision>(m, "StrategicDecision")
        .def(py::init<>())
        .def_readwrite("decision", &StrategicDecision::decision)
        .def_readwrite("reason",   &StrategicDecision::reason)
        .def_readwrite("context",  &StrategicDecision::context);

    py::class_<TacticalPlan>(m, "TacticalPlan")
        .def(py::init<>())
        .def_readwrite("id",         &TacticalPlan::id)
        .def_readwrite("approach",   &TacticalPlan::approach)
        .def_readwrite("confidence", &TacticalPlan::confidence)
        .def_readwrite("created_at", &TacticalPlan::created_at);

    // ---- Governance records -----------------------------------------------

    py::class_<CircuitBreakerInfo>(m, "CircuitBreakerInfo")
        .def(py::init<>())
        .def_readwrite("status",         &CircuitBreakerInfo::status)
        .def_readwrite("error_rate",     &CircuitBreakerInfo::error_rate)
        .def_readwrite("cost_spike",     &CircuitBreakerInfo::cost_spike)
        .def_readwrite("last_triggered", &CircuitBreakerInfo::last_triggered)
        .def_readwrite("next_retry_at",  &CircuitBreakerInfo::next_retry_at);

    py::class_<ErrorRecord>(m, "ErrorRecord")
        .def(py::init<>())
        .def_readwrite("agent_id",  &ErrorRecord::agent_id)
        .def_readwrite("timestamp", &ErrorRecord::timestamp)
        .def_readwrite("error",     &ErrorRecord::error);

    py::class_<QuotaCheck>(m, "QuotaCheck")
        .def(py::init<>())
        .def_readwrite("within_limits", &QuotaCheck::within_limits)
        .def_readwrite("violations",    &QuotaCheck::violations)
        .def_readwrite("hourly_usage",  &QuotaCheck::hourly_usage)
        .def_readwrite("daily_usage",   &QuotaCheck::daily_usage);

    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",            &MonitorEvent::type)
        .def_readwrite("timestamp",       &MonitorEvent::timestamp)
        .def_readwrite("message",         &MonitorEvent::message)
        .def_readwrite("agent_id",        &MonitorEvent::agent_id)
        .def_readwrite("target_agent_id", &MonitorEvent::target_agent_id)
        .def_readwrite("user_id",         &MonitorEvent::user_id)
        .def_readwrite("operation",       &MonitorEvent::operation)
        .def_readwrite("approved",        &MonitorEvent::approved)
        .def_readwrite("denial",          &MonitorEvent::denial)
        .def_readwrite("phase",           &MonitorEvent::phase)
        .def_readwrite("tempo",           &MonitorEvent::tempo)
        .def_readwrite("breaker_status",  &MonitorEvent::breaker_status)
        .def_readwrite("value",           &MonitorEvent::value);

    py::class_<SystemMetrics>(m, "SystemMetrics")
        .def(py::init<>())
        .def_readwrite("timestamp",          &SystemMetrics::timestamp)
        .def_readwrite("active_agents",      &SystemMetrics::active_agents)
        .def_readwrite("total_usage",        &SystemMetrics::total_usage)
        .def_readwrite("circuit_breaker",    &SystemMetrics::circuit_breaker)
        .def_readwrite("tempo",              &SystemMetrics::tempo)
        .def_readwrite("error_history",      &SystemMetrics::error_history)
        .def_readwrite("paused_hierarchies", &SystemMetrics::paused_hierarchies);

    // MetricsMonitor::Metrics (bound as module-level "Metrics")
    py::class_<MetricsMonitor::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readwrite("approvals_requested",   &MetricsMonitor::Metrics::approvals_requested)
        .def_readwrite("approvals_granted",     &MetricsMonitor::Metrics::approvals_granted)
        .def_readwrite("approvals_denied",      &MetricsMonitor::Metrics::approvals_denied)
        .def_readwrite("denials_by_kind",       &MetricsMonitor::Metrics::denials_by_kind)
        .def_readwrite("circuit_breaker_trips", &MetricsMonitor::Metrics::circuit_breaker_trips)
        .def_readwrite("tempo_changes",         &MetricsMonitor::Metrics::tempo_changes)
        .def_readwrite("phase_transitions",     &MetricsMonitor::Metrics::phase_transitions)
        .def_readwrite("phase_failures",        &MetricsMonitor::Metrics::phase_failures)
        .def_readwrite("agents_created",        &MetricsMonitor::Metrics::agents_created)
        .def_readwrite("agents_terminated",     &MetricsMonitor::Metrics::agents_terminated)
        .def_readwrite("errors_recorded",       &MetricsMonitor::Metrics::errors_recorded)
        .def_readwrite("quota_violations",      &MetricsMonitor::Metrics::quota_violations)
        .def_readwrite("last_active_agents",    &MetricsMonitor::Metrics::last_active_agents)
        .def_readwrite("denial_ratio",          &MetricsMonitor::Metrics::denial_ratio);
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_RoundaboutError =
        py::register_exception<RoundaboutException>(m, "RoundaboutError", PyExc_RuntimeError);

    // Derived from RoundaboutError
    static auto py_InvalidConfigurationError =
        py::register_exception<InvalidConfigurationException>(m, "InvalidConfigurationError", py_RoundaboutError.ptr());
    static auto py_AgentNotFoundError =
        py::register_exception<AgentNotFoundException>(m, "AgentNotFoundError", py_RoundaboutError.ptr());
    static auto py_AgentInactiveError =
        py::register_exception<AgentInactiveException>(m, "AgentInactiveError", py_RoundaboutError.ptr());
    static auto py_EmergenceFailureError =
        py::register_exception<EmergenceFailureException>(m, "EmergenceFailureError", py_RoundaboutError.ptr());
    static auto py_StrategicHaltError =
        py::register_exception<StrategicHaltException>(m, "StrategicHaltError", py_RoundaboutError.ptr());
    static auto py_TacticalPlanInvalidError =
        py::register_exception<TacticalPlanInvalidException>(m, "TacticalPlanInvalidError", py_RoundaboutError.ptr());

    static auto py_ApprovalDeniedError =
        py::register_exception<ApprovalDeniedException>(m, "ApprovalDeniedError", py_RoundaboutError.ptr());

    // Derived from ApprovalDeniedError
    static auto py_RecursionLimitExceededError =
        py::register_exception<RecursionLimitExceededException>(m, "RecursionLimitExceededError", py_ApprovalDeniedError.ptr());
    static auto py_SystemAgentCapExceededError =
        py::register_exception<SystemAgentCapExceededException>(m, "SystemAgentCapExceededError", py_ApprovalDeniedError.ptr());
    static auto py_BudgetInsufficientError =
        py::register_exception<BudgetInsufficientException>(m, "BudgetInsufficientError", py_ApprovalDeniedError.ptr());
    static auto py_CircuitBreakerOpenError =
        py::register_exception<CircuitBreakerOpenException>(m, "CircuitBreakerOpenError", py_ApprovalDeniedError.ptr());
    static auto py_HierarchyPausedError =
        py::register_exception<HierarchyPausedException>(m, "HierarchyPausedError", py_ApprovalDeniedError.ptr());
    static auto py_TempoRestrictedError =
        py::register_exception<TempoRestrictedException>(m, "TempoRestrictedError", py_ApprovalDeniedError.ptr());
    static auto py_QuotaViolationError =
        py::register_exception<QuotaViolationException>(m, "QuotaViolationError", py_ApprovalDeniedError.ptr());
}
