#pragma once

#include "roundabout/types.hpp"
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace roundabout {

class RoundaboutException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidConfigurationException : public RoundaboutException {
public:
    explicit InvalidConfigurationException(const std::string& detail)
        : RoundaboutException("Invalid configuration: " + detail) {}
};

class AgentNotFoundException : public RoundaboutException {
public:
    explicit AgentNotFoundException(const AgentId& id)
        : RoundaboutException("Agent not found: " + id)
        , agent_id_(id) {}

    const AgentId& agent_id() const noexcept { return agent_id_; }

private:
    AgentId agent_id_;
};

class AgentInactiveException : public RoundaboutException {
public:
    explicit AgentInactiveException(const AgentId& id)
        : RoundaboutException("Agent is terminated: " + id)
        , agent_id_(id) {}

    const AgentId& agent_id() const noexcept { return agent_id_; }

private:
    AgentId agent_id_;
};

// ==================== Governor denials ====================

// Terminal for the requested operation only; the requesting agent stays alive.
class ApprovalDeniedException : public RoundaboutException {
public:
    ApprovalDeniedException(const std::string& reason, DenialKind kind)
        : RoundaboutException("Approval denied: " + reason)
        , reason_(reason)
        , kind_(kind) {}

    const std::string& reason() const noexcept { return reason_; }
    DenialKind kind() const noexcept { return kind_; }

    // Breaker and tempo denials clear on their own; the rest need a different request
    bool retry_later() const noexcept {
        return kind_ == DenialKind::CircuitBreakerOpen ||
               kind_ == DenialKind::TempoRestricted ||
               kind_ == DenialKind::HierarchyPaused;
    }

private:
    std::string reason_;
    DenialKind kind_;
};

class RecursionLimitExceededException : public ApprovalDeniedException {
public:
    explicit RecursionLimitExceededException(const std::string& reason)
        : ApprovalDeniedException(reason, DenialKind::RecursionLimit) {}
};

class SystemAgentCapExceededException : public ApprovalDeniedException {
public:
    explicit SystemAgentCapExceededException(const std::string& reason)
        : ApprovalDeniedException(reason, DenialKind::SystemAgentCap) {}
};

class BudgetInsufficientException : public ApprovalDeniedException {
public:
    explicit BudgetInsufficientException(const std::string& reason)
        : ApprovalDeniedException(reason, DenialKind::BudgetInsufficient) {}
};

class CircuitBreakerOpenException : public ApprovalDeniedException {
public:
    explicit CircuitBreakerOpenException(const std::string& reason)
        : ApprovalDeniedException(reason, DenialKind::CircuitBreakerOpen) {}
};

class HierarchyPausedException : public ApprovalDeniedException {
public:
    explicit HierarchyPausedException(const std::string& reason)
        : ApprovalDeniedException(reason, DenialKind::HierarchyPaused) {}
};

class TempoRestrictedException : public ApprovalDeniedException {
public:
    explicit TempoRestrictedException(const std::string& reason)
        : ApprovalDeniedException(reason, DenialKind::TempoRestricted) {}
};

class QuotaViolationException : public ApprovalDeniedException {
public:
    QuotaViolationException(const std::string& reason, std::vector<std::string> violations)
        : ApprovalDeniedException(reason, DenialKind::QuotaViolation)
        , violations_(std::move(violations)) {}

    const std::vector<std::string>& violations() const noexcept { return violations_; }

private:
    std::vector<std::string> violations_;
};

// Builds the typed exception matching a denial kind
std::exception_ptr make_denial_exception(DenialKind kind, const std::string& reason,
                                         const std::vector<std::string>& violations = {});

// ==================== Roundabout loop ====================

class EmergenceFailureException : public RoundaboutException {
public:
    explicit EmergenceFailureException(const std::string& detail)
        : RoundaboutException("EMERGE phase failed: " + detail)
        , detail_(detail) {}

    const std::string& detail() const noexcept { return detail_; }

private:
    std::string detail_;
};

// Terminal for the agent: the loop must not be resumed afterwards
class StrategicHaltException : public RoundaboutException {
public:
    explicit StrategicHaltException(const std::string& reason)
        : RoundaboutException("Agent halted: " + reason)
        , reason_(reason) {}

    const std::string& reason() const noexcept { return reason_; }

private:
    std::string reason_;
};

class TacticalPlanInvalidException : public RoundaboutException {
public:
    explicit TacticalPlanInvalidException(const std::string& detail)
        : RoundaboutException("Failed to create valid tactical plan: " + detail)
        , detail_(detail) {}

    const std::string& detail() const noexcept { return detail_; }

private:
    std::string detail_;
};

} // namespace roundabout
