#pragma once

#include "roundabout/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace roundabout {

enum class FailureSeverity { Minor, Moderate, Critical };
enum class FailureType { Resource, Logic, External, Timeout };
enum class Decision { Proceed, HaltAndReportFailure };

struct FailureRecord {
    CognitivePhase phase{CognitivePhase::Emerge};
    std::string error;
    Timestamp timestamp{};
};

struct FailureAnalysis {
    FailureSeverity severity{FailureSeverity::Minor};
    FailureType type{FailureType::Logic};
    // "none", "isolated", "recurring-<phase>" or "mixed-phase"
    std::string pattern;
    std::string recommendation;
};

// Inputs to the ADAPT decision
struct DecisionFactors {
    bool resources_available{true};
    std::size_t failure_count{0};
    FailureSeverity severity{FailureSeverity::Minor};
    FailureType type{FailureType::Logic};
    int recursion_depth{0};
    int max_recursion_depth{5};
    Duration time_elapsed{};
    ResourceQuantity execution_time_budget_ms{0};
};

struct StrategicDecision {
    Decision decision{Decision::Proceed};
    std::string reason;
    DecisionFactors context;
};

struct TacticalPlan {
    std::string id;
    std::string approach;
    double confidence{0.0};
    Timestamp created_at{};
};

// Severity grows with failure count (2 moderate, 3+ critical); type comes
// from keywords in the most recent error
FailureAnalysis analyze_failures(const std::vector<FailureRecord>& failures);

// Rules in order, first match halts:
//   no resources remaining
//   3+ failures with critical severity
//   recursion depth within one of the maximum
//   more than 80% of the execution-time budget elapsed
StrategicDecision make_strategic_decision(const DecisionFactors& factors);

// resource failures -> "resource-optimized-approach",
// logic/execution failures -> "alternative-logic-approach",
// otherwise "conservative-retry-approach"
std::string select_approach(const std::vector<FailureRecord>& failures);

TacticalPlan synthesize_tactical_plan(std::string plan_id,
                                      const std::vector<FailureRecord>& failures,
                                      Timestamp now);

// clamp(0.6 - 0.1 * failures + (optimized ? 0.2 : 0.1), 0.1, 0.9)
double plan_confidence(const std::string& approach, std::size_t failure_count);

// clamp(0.7 - 0.1 * failures + (resources remaining ? 0.1 : -0.2), 0.1, 0.9)
double success_probability(std::size_t failure_count, bool resources_remaining);

const char* to_string(FailureSeverity s);
const char* to_string(FailureType t);
const char* to_string(Decision d);

} // namespace roundabout
