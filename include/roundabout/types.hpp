#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace roundabout {

// Identifiers
using AgentId = std::string;
using UserId = std::string;
using ThreadId = std::string;

// Resource quantity (integer units)
using ResourceQuantity = std::int64_t;

// Time types
using SteadyClock = std::chrono::steady_clock;
using Timestamp = SteadyClock::time_point;
using Duration = SteadyClock::duration;

inline std::int64_t to_millis(Duration d) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

// Phase of the Roundabout loop
enum class CognitivePhase {
    Emerge,
    Adapt,
    Integrate
};

enum class AgentRole {
    Coordinator,
    Conscious,
    Core
};

// Operations gated by the ResourceGovernor
enum class OperationType {
    CloneAgent,
    LlmCall,
    MemoryAccess,
    ExternalApi
};

enum class CircuitStatus {
    Closed,
    Open,
    HalfOpen
};

// Global throttling level
enum class SystemTempo {
    HighPerformance,
    LowIntensity,
    Sleep
};

enum class UserTier {
    Free,
    Premium,
    Enterprise
};

enum class ReportStatus {
    Completed,
    Failed,
    Running,
    Error
};

enum class CommunicationStrategy {
    Mirror,
    Harmonize,
    Listen
};

// Why an approval request was denied
enum class DenialKind {
    None,
    HierarchyPaused,
    CircuitBreakerOpen,
    TempoRestricted,
    RecursionLimit,
    SystemAgentCap,
    BudgetInsufficient,
    QuotaViolation
};

enum class InputType {
    Chat,
    Edit,
    Command
};

enum class ResponseType {
    Message,
    Action,
    Suggestion
};

// Emotional/cognitive state vector produced by the external analysis pipeline.
// All components are expected in [0,1].
struct UserState {
    double fight{0.0};
    double flight{0.0};
    double fixes{0.0};
    double confidence{0.0};
    Timestamp timestamp{};
};

// Internal state of an agent, mutated every loop iteration
struct AgentState {
    CognitivePhase phase{CognitivePhase::Emerge};
    double resonance{0.5};
    double confidence{0.7};
    Timestamp timestamp{};
};

// Partial update for AgentState
struct AgentStateUpdate {
    std::optional<CognitivePhase> phase;
    std::optional<double> resonance;
    std::optional<double> confidence;
};

struct RelationalDelta {
    double async_delta{0.0};
    double sync_delta{0.0};
    double magnitude{0.0};
    CommunicationStrategy strategy{CommunicationStrategy::Harmonize};
};

struct AgentInput {
    std::string text;
    InputType type{InputType::Chat};
    std::optional<UserState> user_state;
    Timestamp timestamp{};
};

struct AgentResponse {
    std::string text;
    ResponseType type{ResponseType::Message};
    AgentState agent_state;
    std::optional<RelationalDelta> relational_delta;
    Timestamp timestamp{};
};

// Process-wide breaker state
struct CircuitBreakerInfo {
    CircuitStatus status{CircuitStatus::Closed};
    double error_rate{0.0};
    double cost_spike{0.0};
    std::optional<Timestamp> last_triggered;
    std::optional<Timestamp> next_retry_at;
};

struct ErrorRecord {
    AgentId agent_id;
    Timestamp timestamp{};
    std::string error;
};

inline const char* to_string(CognitivePhase p) {
    switch (p) {
        case CognitivePhase::Emerge:    return "EMERGE";
        case CognitivePhase::Adapt:     return "ADAPT";
        case CognitivePhase::Integrate: return "INTEGRATE";
    }
    return "Unknown";
}

inline const char* to_string(AgentRole r) {
    switch (r) {
        case AgentRole::Coordinator: return "Coordinator";
        case AgentRole::Conscious:   return "Conscious";
        case AgentRole::Core:        return "Core";
    }
    return "Unknown";
}

inline const char* to_string(OperationType o) {
    switch (o) {
        case OperationType::CloneAgent:   return "clone_agent";
        case OperationType::LlmCall:      return "llm_call";
        case OperationType::MemoryAccess: return "memory_access";
        case OperationType::ExternalApi:  return "external_api";
    }
    return "Unknown";
}

inline const char* to_string(CircuitStatus s) {
    switch (s) {
        case CircuitStatus::Closed:   return "closed";
        case CircuitStatus::Open:     return "open";
        case CircuitStatus::HalfOpen: return "half-open";
    }
    return "Unknown";
}

inline const char* to_string(SystemTempo t) {
    switch (t) {
        case SystemTempo::HighPerformance: return "High-Performance";
        case SystemTempo::LowIntensity:    return "Low-Intensity";
        case SystemTempo::Sleep:           return "Sleep";
    }
    return "Unknown";
}

inline const char* to_string(UserTier t) {
    switch (t) {
        case UserTier::Free:       return "free";
        case UserTier::Premium:    return "premium";
        case UserTier::Enterprise: return "enterprise";
    }
    return "Unknown";
}

inline const char* to_string(ReportStatus s) {
    switch (s) {
        case ReportStatus::Completed: return "completed";
        case ReportStatus::Failed:    return "failed";
        case ReportStatus::Running:   return "running";
        case ReportStatus::Error:     return "error";
    }
    return "Unknown";
}

inline const char* to_string(CommunicationStrategy s) {
    switch (s) {
        case CommunicationStrategy::Mirror:    return "mirror";
        case CommunicationStrategy::Harmonize: return "harmonize";
        case CommunicationStrategy::Listen:    return "listen";
    }
    return "Unknown";
}

inline const char* to_string(DenialKind k) {
    switch (k) {
        case DenialKind::None:               return "None";
        case DenialKind::HierarchyPaused:    return "HierarchyPaused";
        case DenialKind::CircuitBreakerOpen: return "CircuitBreakerOpen";
        case DenialKind::TempoRestricted:    return "TempoRestricted";
        case DenialKind::RecursionLimit:     return "RecursionLimitExceeded";
        case DenialKind::SystemAgentCap:     return "SystemAgentCapExceeded";
        case DenialKind::BudgetInsufficient: return "BudgetInsufficient";
        case DenialKind::QuotaViolation:     return "QuotaViolation";
    }
    return "Unknown";
}

} // namespace roundabout
