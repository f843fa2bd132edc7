#include "roundabout/quota_manager.hpp"

#include <mutex>

namespace roundabout {

namespace {

std::string ratio(ResourceQuantity used, ResourceQuantity limit) {
    return std::to_string(used) + "/" + std::to_string(limit);
}

} // anonymous namespace

QuotaManager::QuotaManager(QuotaDefaults defaults, Duration hour_window, Duration day_window,
                           const ResourceLedger& ledger)
    : defaults_(std::move(defaults))
    , hour_window_(hour_window)
    , day_window_(day_window)
    , ledger_(ledger) {}

void QuotaManager::set_quotas(const UserId& user_id, UserResourceQuotas quotas) {
    quotas.user_id = user_id;
    std::unique_lock lock(mutex_);
    quotas_[user_id] = std::move(quotas);
}

UserResourceQuotas QuotaManager::quotas(const UserId& user_id) {
    {
        std::shared_lock lock(mutex_);
        auto it = quotas_.find(user_id);
        if (it != quotas_.end()) return it->second;
    }

    std::unique_lock lock(mutex_);
    auto [it, inserted] = quotas_.try_emplace(user_id, defaults_.free);
    if (inserted) {
        it->second.user_id = user_id;
    }
    return it->second;
}

void QuotaManager::set_tier(const UserId& user_id, UserTier tier) {
    set_quotas(user_id, defaults_.for_tier(tier));
}

QuotaCheck QuotaManager::check(const UserId& user_id, Timestamp now) {
    UserResourceQuotas q = quotas(user_id);

    QuotaCheck result;
    result.hourly_usage = ledger_.aggregate(user_id, now - hour_window_);
    result.daily_usage = ledger_.aggregate(user_id, now - day_window_);
    const auto& hourly = result.hourly_usage;
    const auto& daily = result.daily_usage;

    if (hourly.llm_calls > q.llm.max_calls_per_hour) {
        result.violations.push_back("LLM calls per hour exceeded: " +
                                    ratio(hourly.llm_calls, q.llm.max_calls_per_hour));
    }
    if (daily.llm_calls > q.llm.max_calls_per_day) {
        result.violations.push_back("LLM calls per day exceeded: " +
                                    ratio(daily.llm_calls, q.llm.max_calls_per_day));
    }
    if (hourly.compute_units > q.compute.max_units_per_hour) {
        result.violations.push_back("Compute units per hour exceeded: " +
                                    ratio(hourly.compute_units, q.compute.max_units_per_hour));
    }
    if (daily.compute_units > q.compute.max_units_per_day) {
        result.violations.push_back("Compute units per day exceeded: " +
                                    ratio(daily.compute_units, q.compute.max_units_per_day));
    }
    if (daily.storage_bytes > q.storage.max_total_bytes) {
        result.violations.push_back("Storage quota exceeded: " +
                                    ratio(daily.storage_bytes, q.storage.max_total_bytes) +
                                    " bytes");
    }

    result.within_limits = result.violations.empty();
    return result;
}

} // namespace roundabout
