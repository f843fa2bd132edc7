#include "roundabout/exceptions.hpp"

namespace roundabout {

std::exception_ptr make_denial_exception(DenialKind kind, const std::string& reason,
                                         const std::vector<std::string>& violations) {
    switch (kind) {
        case DenialKind::RecursionLimit:
            return std::make_exception_ptr(RecursionLimitExceededException(reason));
        case DenialKind::SystemAgentCap:
            return std::make_exception_ptr(SystemAgentCapExceededException(reason));
        case DenialKind::BudgetInsufficient:
            return std::make_exception_ptr(BudgetInsufficientException(reason));
        case DenialKind::CircuitBreakerOpen:
            return std::make_exception_ptr(CircuitBreakerOpenException(reason));
        case DenialKind::HierarchyPaused:
            return std::make_exception_ptr(HierarchyPausedException(reason));
        case DenialKind::TempoRestricted:
            return std::make_exception_ptr(TempoRestrictedException(reason));
        case DenialKind::QuotaViolation:
            return std::make_exception_ptr(QuotaViolationException(reason, violations));
        case DenialKind::None:
            break;
    }
    return std::make_exception_ptr(ApprovalDeniedException(reason, kind));
}

} // namespace roundabout
