#pragma once

#include "roundabout/types.hpp"
#include "roundabout/resource_budget.hpp"
#include <cstddef>
#include <string>

namespace roundabout {

// Structural limits enforced on agent hierarchies
struct SystemLimits {
    int max_recursion_depth = 5;

    // Root agents one user may hold at once (enforced by AgentFactory)
    std::size_t max_active_agents = 10;

    // Registered agents across the whole system
    std::size_t max_system_agents = 100;
};

struct CircuitBreakerConfig {
    // recent errors / estimated operations
    double error_rate_threshold = 0.8;

    // average cost per update / baseline_cost
    double cost_spike_threshold = 5.0;

    // Sliding window for error and cost history; also the open -> half-open cooldown
    Duration time_window = std::chrono::minutes(5);

    // Errors needed in the window before the error rate may trip the breaker
    std::size_t min_error_samples = 5;

    // Cost samples needed in the window before a spike may trip the breaker
    std::size_t min_cost_samples = 6;

    // Average cost needed in the window before a spike may trip the breaker
    double min_average_cost = 1000.0;

    double baseline_cost = 100.0;

    // Consecutive approvals in half-open that close the breaker
    std::size_t half_open_success_threshold = 3;
};

// Hysteresis thresholds for the tempo ladder. Recovery thresholds must be
// strictly below the matching degrade thresholds.
struct TempoConfig {
    double error_degrade_to_low = 0.5;
    double error_degrade_to_sleep = 0.8;
    double error_recover_to_low = 0.1;
    double error_recover_to_high = 0.05;

    double cost_degrade_to_low = 3.0;
    double cost_degrade_to_sleep = 5.0;
    double cost_recover_to_low = 1.5;
    double cost_recover_to_high = 1.2;

    // Scale applied to LLM/compute estimates at Low-Intensity
    double low_intensity_scale = 0.5;

    // Fixed estimate non-memory operations are clamped to at Sleep
    ResourceEstimate sleep_clamp{1, 1, 1024, 1000};
};

struct LlmQuota {
    ResourceQuantity max_calls_per_hour{0};
    ResourceQuantity max_calls_per_day{0};
    ResourceQuantity max_tokens_per_call{0};
};

struct StorageQuota {
    ResourceQuantity max_total_bytes{0};
    ResourceQuantity max_file_size{0};
};

struct ComputeQuota {
    ResourceQuantity max_units_per_hour{0};
    ResourceQuantity max_units_per_day{0};
    ResourceQuantity max_concurrent_operations{0};
};

struct UserResourceQuotas {
    UserId user_id;
    UserTier tier{UserTier::Free};
    LlmQuota llm;
    StorageQuota storage;
    ComputeQuota compute;
};

// Tier baselines applied on first access to a user's quotas
struct QuotaDefaults {
    UserResourceQuotas free = free_tier();
    UserResourceQuotas premium = premium_tier();
    UserResourceQuotas enterprise = enterprise_tier();

    const UserResourceQuotas& for_tier(UserTier tier) const noexcept;

    static UserResourceQuotas free_tier();
    static UserResourceQuotas premium_tier();
    static UserResourceQuotas enterprise_tier();
};

// ResourceGovernor configuration
struct Config {
    SystemLimits limits;
    CircuitBreakerConfig circuit_breaker;
    TempoConfig tempo;
    QuotaDefaults quotas;

    // Clone is denied once projected usage exceeds this fraction of the
    // parent's budget in any dimension
    double clone_budget_threshold = 0.9;

    Duration quota_hour_window = std::chrono::hours(1);
    Duration quota_day_window = std::chrono::hours(24);

    // Number of lock stripes in the resource ledger
    std::size_t ledger_stripes = 16;
};

// CognitiveAgent / AgentFactory configuration
struct AgentConfig {
    // Share of the parent's remaining budget handed to a derived child budget
    double child_budget_ratio = 0.3;

    // Cost reserved against the parent for every clone
    ResourceEstimate clone_cost_estimate{4, 40, 400, 12000};

    // Budget for root threads whose profile carries none
    ResourceBudget default_budget{10, 100, 1024 * 1024, 30000};

    int default_max_recursion_depth = 5;

    Duration model_call_timeout = std::chrono::seconds(10);
    int model_max_tokens = 150;
    double model_temperature = 0.3;
    std::string model_provider_hint = "ultra-fast";

    // Compute units charged by INTEGRATE plan synthesis
    ResourceQuantity planning_cost = 5;

    // Child polled while stuck in ADAPT longer than this reports as failed
    Duration stuck_in_adapt_threshold = std::chrono::seconds(60);
};

// Throws InvalidConfigurationException on inconsistent settings
void validate(const Config& config);
void validate(const AgentConfig& config);

} // namespace roundabout
