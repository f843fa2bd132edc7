#include "roundabout/config.hpp"
#include "roundabout/exceptions.hpp"

namespace roundabout {

namespace {

constexpr ResourceQuantity kMiB = 1024 * 1024;
constexpr ResourceQuantity kGiB = 1024 * kMiB;

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw InvalidConfigurationException(message);
    }
}

} // anonymous namespace

UserResourceQuotas QuotaDefaults::free_tier() {
    UserResourceQuotas q;
    q.tier = UserTier::Free;
    q.llm = {50, 200, 4000};
    q.storage = {100 * kMiB, 10 * kMiB};
    q.compute = {1000, 5000, 3};
    return q;
}

UserResourceQuotas QuotaDefaults::premium_tier() {
    UserResourceQuotas q;
    q.tier = UserTier::Premium;
    q.llm = {200, 1000, 8000};
    q.storage = {kGiB, 100 * kMiB};
    q.compute = {5000, 25000, 10};
    return q;
}

UserResourceQuotas QuotaDefaults::enterprise_tier() {
    UserResourceQuotas q;
    q.tier = UserTier::Enterprise;
    q.llm = {1000, 10000, 16000};
    q.storage = {10 * kGiB, kGiB};
    q.compute = {25000, 100000, 50};
    return q;
}

const UserResourceQuotas& QuotaDefaults::for_tier(UserTier tier) const noexcept {
    switch (tier) {
        case UserTier::Free:       return free;
        case UserTier::Premium:    return premium;
        case UserTier::Enterprise: return enterprise;
    }
    return free;
}

void validate(const Config& config) {
    require(config.limits.max_recursion_depth >= 0,
            "max_recursion_depth must be >= 0");
    require(config.limits.max_system_agents > 0,
            "max_system_agents must be > 0");

    const auto& cb = config.circuit_breaker;
    require(cb.error_rate_threshold > 0.0, "error_rate_threshold must be > 0");
    require(cb.cost_spike_threshold > 0.0, "cost_spike_threshold must be > 0");
    require(cb.baseline_cost > 0.0, "baseline_cost must be > 0");
    require(cb.time_window > Duration::zero(), "time_window must be positive");
    require(cb.half_open_success_threshold > 0,
            "half_open_success_threshold must be > 0");

    const auto& t = config.tempo;
    require(t.error_recover_to_high < t.error_recover_to_low,
            "error_recover_to_high must be below error_recover_to_low");
    require(t.error_recover_to_low < t.error_degrade_to_low,
            "error recovery threshold must be below its degrade threshold");
    require(t.error_degrade_to_low <= t.error_degrade_to_sleep,
            "error_degrade_to_low must not exceed error_degrade_to_sleep");
    require(t.cost_recover_to_high < t.cost_recover_to_low,
            "cost_recover_to_high must be below cost_recover_to_low");
    require(t.cost_recover_to_low < t.cost_degrade_to_low,
            "cost recovery threshold must be below its degrade threshold");
    require(t.cost_degrade_to_low <= t.cost_degrade_to_sleep,
            "cost_degrade_to_low must not exceed cost_degrade_to_sleep");
    require(t.low_intensity_scale > 0.0 && t.low_intensity_scale <= 1.0,
            "low_intensity_scale must be in (0, 1]");
    require(t.sleep_clamp.is_non_negative(), "sleep_clamp must be non-negative");

    require(config.clone_budget_threshold > 0.0 && config.clone_budget_threshold <= 1.0,
            "clone_budget_threshold must be in (0, 1]");
    require(config.quota_hour_window > Duration::zero() &&
            config.quota_day_window >= config.quota_hour_window,
            "quota windows must be positive and day >= hour");
    require(config.ledger_stripes > 0, "ledger_stripes must be > 0");
}

void validate(const AgentConfig& config) {
    require(config.child_budget_ratio >= 0.0 && config.child_budget_ratio <= 1.0,
            "child_budget_ratio must be in [0, 1]");
    require(config.clone_cost_estimate.is_non_negative(),
            "clone_cost_estimate must be non-negative");
    require(config.default_budget.is_non_negative(),
            "default_budget must be non-negative");
    require(config.default_max_recursion_depth >= 0,
            "default_max_recursion_depth must be >= 0");
    require(config.planning_cost >= 0, "planning_cost must be >= 0");
}

} // namespace roundabout
