#include "roundabout/adaptation.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace roundabout {

namespace {

bool contains(const std::string& text, const char* needle) {
    return text.find(needle) != std::string::npos;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string identify_pattern(const std::vector<FailureRecord>& failures) {
    if (failures.empty()) return "none";
    if (failures.size() == 1) return "isolated";

    std::set<CognitivePhase> phases;
    for (auto& f : failures) {
        phases.insert(f.phase);
    }
    if (phases.size() == 1) {
        return "recurring-" + lowercase(to_string(failures.front().phase));
    }
    return "mixed-phase";
}

std::string recommend(FailureSeverity severity, FailureType type) {
    switch (severity) {
        case FailureSeverity::Minor:
            switch (type) {
                case FailureType::Logic:    return "Retry with adjusted parameters";
                case FailureType::Resource: return "Optimize resource usage";
                case FailureType::External: return "Implement retry with backoff";
                case FailureType::Timeout:  return "Increase timeout limits";
            }
            break;
        case FailureSeverity::Moderate:
            switch (type) {
                case FailureType::Logic:    return "Revise approach strategy";
                case FailureType::Resource: return "Request additional resources";
                case FailureType::External: return "Switch to alternative service";
                case FailureType::Timeout:  return "Break task into smaller chunks";
            }
            break;
        case FailureSeverity::Critical:
            switch (type) {
                case FailureType::Logic:    return "Escalate to parent agent";
                case FailureType::Resource: return "Halt and report resource exhaustion";
                case FailureType::External: return "Activate fallback mode";
                case FailureType::Timeout:  return "Abort current approach";
            }
            break;
    }
    return "Unknown recommendation";
}

} // anonymous namespace

FailureAnalysis analyze_failures(const std::vector<FailureRecord>& failures) {
    FailureAnalysis analysis;

    if (failures.size() >= 3) {
        analysis.severity = FailureSeverity::Critical;
    } else if (failures.size() >= 2) {
        analysis.severity = FailureSeverity::Moderate;
    }

    if (!failures.empty()) {
        const std::string& last = failures.back().error;
        if (contains(last, "resource") || contains(last, "quota")) {
            analysis.type = FailureType::Resource;
        } else if (contains(last, "timeout") || contains(last, "time")) {
            analysis.type = FailureType::Timeout;
        } else if (contains(last, "external") || contains(last, "API")) {
            analysis.type = FailureType::External;
        }
    }

    analysis.pattern = identify_pattern(failures);
    analysis.recommendation = recommend(analysis.severity, analysis.type);
    return analysis;
}

StrategicDecision make_strategic_decision(const DecisionFactors& factors) {
    StrategicDecision d;
    d.context = factors;
    d.decision = Decision::HaltAndReportFailure;

    if (!factors.resources_available) {
        d.reason = "Insufficient resources remaining";
        return d;
    }
    if (factors.failure_count >= 3 && factors.severity == FailureSeverity::Critical) {
        d.reason = "Multiple critical failures detected";
        return d;
    }
    if (factors.recursion_depth >= factors.max_recursion_depth - 1) {
        d.reason = "Near maximum recursion depth";
        return d;
    }
    double elapsed_ms = static_cast<double>(to_millis(factors.time_elapsed));
    if (elapsed_ms > static_cast<double>(factors.execution_time_budget_ms) * 0.8) {
        d.reason = "Approaching execution time limit";
        return d;
    }

    d.decision = Decision::Proceed;
    d.reason = "Failure is recoverable with new approach";
    return d;
}

std::string select_approach(const std::vector<FailureRecord>& failures) {
    bool resource = false;
    bool logic = false;
    for (auto& f : failures) {
        if (contains(f.error, "resource")) resource = true;
        if (contains(f.error, "logic") || contains(f.error, "execution")) logic = true;
    }
    if (resource) return "resource-optimized-approach";
    if (logic) return "alternative-logic-approach";
    return "conservative-retry-approach";
}

TacticalPlan synthesize_tactical_plan(std::string plan_id,
                                      const std::vector<FailureRecord>& failures,
                                      Timestamp now) {
    TacticalPlan plan;
    plan.id = std::move(plan_id);
    plan.approach = select_approach(failures);
    plan.confidence = plan_confidence(plan.approach, failures.size());
    plan.created_at = now;
    return plan;
}

double plan_confidence(const std::string& approach, std::size_t failure_count) {
    double bonus = contains(approach, "optimized") ? 0.2 : 0.1;
    double value = 0.6 - 0.1 * static_cast<double>(failure_count) + bonus;
    return std::clamp(value, 0.1, 0.9);
}

double success_probability(std::size_t failure_count, bool resources_remaining) {
    double bonus = resources_remaining ? 0.1 : -0.2;
    double value = 0.7 - 0.1 * static_cast<double>(failure_count) + bonus;
    return std::clamp(value, 0.1, 0.9);
}

const char* to_string(FailureSeverity s) {
    switch (s) {
        case FailureSeverity::Minor:    return "minor";
        case FailureSeverity::Moderate: return "moderate";
        case FailureSeverity::Critical: return "critical";
    }
    return "unknown";
}

const char* to_string(FailureType t) {
    switch (t) {
        case FailureType::Resource: return "resource";
        case FailureType::Logic:    return "logic";
        case FailureType::External: return "external";
        case FailureType::Timeout:  return "timeout";
    }
    return "unknown";
}

const char* to_string(Decision d) {
    switch (d) {
        case Decision::Proceed:              return "PROCEED";
        case Decision::HaltAndReportFailure: return "HALT_AND_REPORT_FAILURE";
    }
    return "unknown";
}

} // namespace roundabout
