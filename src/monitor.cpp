#include "roundabout/monitor.hpp"

#include <iomanip>
#include <iostream>

namespace roundabout {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::AgentCreated:           return "AgentCreated";
        case EventType::AgentTerminated:        return "AgentTerminated";
        case EventType::ChildAgentCreated:      return "ChildAgentCreated";
        case EventType::ChildAgentRemoved:      return "ChildAgentRemoved";
        case EventType::ChildTerminationFailed: return "ChildTerminationFailed";
        case EventType::ReportForwarded:        return "ReportForwarded";
        case EventType::PhaseTransition:        return "PhaseTransition";
        case EventType::PhaseSucceeded:         return "PhaseSucceeded";
        case EventType::PhaseFailed:            return "PhaseFailed";
        case EventType::AdaptDecision:          return "AdaptDecision";
        case EventType::ModelFallback:          return "ModelFallback";
        case EventType::ApprovalGranted:        return "ApprovalGranted";
        case EventType::ApprovalDenied:         return "ApprovalDenied";
        case EventType::ResourceUsageUpdated:   return "ResourceUsageUpdated";
        case EventType::ErrorRecorded:          return "ErrorRecorded";
        case EventType::QuotaViolated:          return "QuotaViolated";
        case EventType::CircuitBreakerOpened:   return "CircuitBreakerOpened";
        case EventType::CircuitBreakerHalfOpen: return "CircuitBreakerHalfOpen";
        case EventType::CircuitBreakerClosed:   return "CircuitBreakerClosed";
        case EventType::TempoChanged:           return "TempoChanged";
        case EventType::HierarchyPaused:        return "HierarchyPaused";
        case EventType::HierarchyResumed:       return "HierarchyResumed";
        case EventType::AgentDeregistered:      return "AgentDeregistered";
    }
    return "Unknown";
}

namespace {

bool is_important_event(EventType t) {
    switch (t) {
        case EventType::AgentCreated:
        case EventType::AgentTerminated:
        case EventType::ChildAgentCreated:
        case EventType::ChildTerminationFailed:
        case EventType::PhaseFailed:
        case EventType::AdaptDecision:
        case EventType::ApprovalDenied:
        case EventType::QuotaViolated:
        case EventType::CircuitBreakerOpened:
        case EventType::CircuitBreakerHalfOpen:
        case EventType::CircuitBreakerClosed:
        case EventType::TempoChanged:
        case EventType::HierarchyPaused:
        case EventType::HierarchyResumed:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

// ========== ConsoleMonitor ==========

ConsoleMonitor::ConsoleMonitor(Verbosity v) : verbosity_(v) {}

void ConsoleMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (verbosity_ == Verbosity::Normal && !is_important_event(event.type)) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "[Roundabout] " << to_string(event.type);

    if (event.agent_id.has_value()) {
        std::cout << " agent=" << event.agent_id.value();
    }
    if (event.target_agent_id.has_value()) {
        std::cout << " target=" << event.target_agent_id.value();
    }
    if (event.user_id.has_value()) {
        std::cout << " user=" << event.user_id.value();
    }
    if (event.operation.has_value()) {
        std::cout << " op=" << to_string(event.operation.value());
    }
    if (event.approved.has_value()) {
        std::cout << " approved=" << (event.approved.value() ? "true" : "false");
    }
    if (event.denial.has_value() && event.denial.value() != DenialKind::None) {
        std::cout << " denial=" << to_string(event.denial.value());
    }
    if (event.phase.has_value()) {
        std::cout << " phase=" << to_string(event.phase.value());
    }
    if (event.tempo.has_value()) {
        std::cout << " tempo=" << to_string(event.tempo.value());
    }
    if (event.breaker_status.has_value()) {
        std::cout << " breaker=" << to_string(event.breaker_status.value());
    }
    if (verbosity_ == Verbosity::Debug && event.value.has_value()) {
        std::cout << " value=" << std::fixed << std::setprecision(3) << event.value.value();
    }

    if (!event.message.empty()) {
        std::cout << " | " << event.message;
    }

    std::cout << "\n";
}

void ConsoleMonitor::on_snapshot(const SystemMetrics& snapshot) {
    if (verbosity_ < Verbosity::Verbose) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "\n[Roundabout] === System Snapshot ===\n";
    std::cout << "  Active agents: " << snapshot.active_agents << "\n";
    std::cout << "  Total usage: " << to_string(snapshot.total_usage) << "\n";
    std::cout << "  Circuit breaker: " << to_string(snapshot.circuit_breaker.status)
              << " (error_rate=" << std::fixed << std::setprecision(2)
              << snapshot.circuit_breaker.error_rate
              << ", cost_spike=" << snapshot.circuit_breaker.cost_spike << ")\n";
    std::cout << "  Tempo: " << to_string(snapshot.tempo) << "\n";
    std::cout << "  Recent errors: " << snapshot.error_history.size() << "\n";
    std::cout << "  Paused hierarchies: " << snapshot.paused_hierarchies.size() << "\n";
    std::cout << "  ========================\n\n";
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    std::string alert;
    AlertCallback cb;

    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);

        switch (event.type) {
            case EventType::ApprovalGranted:
                metrics_.approvals_requested++;
                metrics_.approvals_granted++;
                break;
            case EventType::ApprovalDenied:
                metrics_.approvals_requested++;
                metrics_.approvals_denied++;
                metrics_.denials_by_kind[event.denial.value_or(DenialKind::None)]++;
                break;
            case EventType::CircuitBreakerOpened:
                metrics_.circuit_breaker_trips++;
                break;
            case EventType::TempoChanged:
                metrics_.tempo_changes++;
                break;
            case EventType::PhaseTransition:
                metrics_.phase_transitions++;
                break;
            case EventType::PhaseFailed:
                metrics_.phase_failures++;
                break;
            case EventType::AgentCreated:
            case EventType::ChildAgentCreated:
                metrics_.agents_created++;
                break;
            case EventType::AgentTerminated:
                metrics_.agents_terminated++;
                break;
            case EventType::ErrorRecorded:
                metrics_.errors_recorded++;
                break;
            case EventType::QuotaViolated:
                metrics_.quota_violations++;
                break;
            default:
                break;
        }

        if (metrics_.approvals_requested > 0) {
            metrics_.denial_ratio = static_cast<double>(metrics_.approvals_denied) /
                                    static_cast<double>(metrics_.approvals_requested);
        }

        if (event.type == EventType::ApprovalDenied && denial_cb_ &&
            metrics_.approvals_requested >= denial_min_requests_ &&
            metrics_.denial_ratio > denial_threshold_) {
            cb = denial_cb_;
            alert = "Denial ratio " + std::to_string(metrics_.denial_ratio) +
                    " exceeds threshold " + std::to_string(denial_threshold_);
        }
    }

    // Alert outside the lock so the callback may query metrics
    if (cb) {
        cb(alert);
    }
}

void MetricsMonitor::on_snapshot(const SystemMetrics& snapshot) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_.last_active_agents = snapshot.active_agents;
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
}

void MetricsMonitor::set_denial_ratio_alert(double threshold, std::uint64_t min_requests,
                                            AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    denial_threshold_ = threshold;
    denial_min_requests_ = min_requests;
    denial_cb_ = std::move(cb);
}

// ========== CompositeMonitor ==========

void CompositeMonitor::add_monitor(std::shared_ptr<Monitor> monitor) {
    monitors_.push_back(std::move(monitor));
}

void CompositeMonitor::on_event(const MonitorEvent& event) {
    for (auto& m : monitors_) {
        m->on_event(event);
    }
}

void CompositeMonitor::on_snapshot(const SystemMetrics& snapshot) {
    for (auto& m : monitors_) {
        m->on_snapshot(snapshot);
    }
}

} // namespace roundabout
