#pragma once

#include "roundabout/types.hpp"
#include "roundabout/resource_budget.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace roundabout {

enum class EventType {
    // Agent lifecycle
    AgentCreated,
    AgentTerminated,
    ChildAgentCreated,
    ChildAgentRemoved,
    ChildTerminationFailed,
    ReportForwarded,
    // Roundabout loop
    PhaseTransition,
    PhaseSucceeded,
    PhaseFailed,
    AdaptDecision,
    ModelFallback,
    // Governor
    ApprovalGranted,
    ApprovalDenied,
    ResourceUsageUpdated,
    ErrorRecorded,
    QuotaViolated,
    CircuitBreakerOpened,
    CircuitBreakerHalfOpen,
    CircuitBreakerClosed,
    TempoChanged,
    HierarchyPaused,
    HierarchyResumed,
    AgentDeregistered
};

// Structured record emitted for every lifecycle, loop and governance event
struct MonitorEvent {
    EventType type;
    Timestamp timestamp;
    std::string message;

    std::optional<AgentId> agent_id;
    std::optional<AgentId> target_agent_id;
    std::optional<UserId> user_id;
    std::optional<OperationType> operation;
    std::optional<bool> approved;
    std::optional<DenialKind> denial;
    std::optional<CognitivePhase> phase;
    std::optional<SystemTempo> tempo;
    std::optional<CircuitStatus> breaker_status;

    // Event-specific measurement (error rate, cost spike, ...)
    std::optional<double> value;
};

// Point-in-time view of the governor
struct SystemMetrics {
    Timestamp timestamp{};
    std::size_t active_agents{0};
    ResourceUsage total_usage;
    CircuitBreakerInfo circuit_breaker;
    SystemTempo tempo{SystemTempo::HighPerformance};
    std::vector<ErrorRecord> error_history;
    std::vector<AgentId> paused_hierarchies;
};

const char* to_string(EventType t);

// Abstract monitor interface
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
    virtual void on_snapshot(const SystemMetrics& snapshot) = 0;
};

// Console logger
class ConsoleMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose, Debug };

    explicit ConsoleMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const SystemMetrics& snapshot) override;

private:
    Verbosity verbosity_;
    mutable std::mutex output_mutex_;
};

// Metrics collector
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t approvals_requested{0};
        std::uint64_t approvals_granted{0};
        std::uint64_t approvals_denied{0};
        std::unordered_map<DenialKind, std::uint64_t> denials_by_kind;
        std::uint64_t circuit_breaker_trips{0};
        std::uint64_t tempo_changes{0};
        std::uint64_t phase_transitions{0};
        std::uint64_t phase_failures{0};
        std::uint64_t agents_created{0};
        std::uint64_t agents_terminated{0};
        std::uint64_t errors_recorded{0};
        std::uint64_t quota_violations{0};
        std::size_t last_active_agents{0};
        double denial_ratio{0.0};
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const SystemMetrics& snapshot) override;

    Metrics get_metrics() const;
    void reset_metrics();

    using AlertCallback = std::function<void(const std::string&)>;

    // Fires when the denial ratio exceeds threshold after at least min_requests
    void set_denial_ratio_alert(double threshold, std::uint64_t min_requests, AlertCallback cb);

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;

    double denial_threshold_{1.1};  // > 1.0 means disabled
    std::uint64_t denial_min_requests_{0};
    AlertCallback denial_cb_;
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const SystemMetrics& snapshot) override;

private:
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

} // namespace roundabout
