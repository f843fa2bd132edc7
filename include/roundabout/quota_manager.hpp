#pragma once

#include "roundabout/types.hpp"
#include "roundabout/config.hpp"
#include "roundabout/resource_ledger.hpp"

#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace roundabout {

struct QuotaCheck {
    bool within_limits{true};
    std::vector<std::string> violations;
    ResourceUsage hourly_usage;
    ResourceUsage daily_usage;
};

// Per-user tiered quotas checked against the ledger's trailing windows
class QuotaManager {
public:
    QuotaManager(QuotaDefaults defaults, Duration hour_window, Duration day_window,
                 const ResourceLedger& ledger);

    void set_quotas(const UserId& user_id, UserResourceQuotas quotas);

    // Installs the free-tier baseline on first access
    UserResourceQuotas quotas(const UserId& user_id);

    // Replaces the user's quotas with the tier baseline
    void set_tier(const UserId& user_id, UserTier tier);

    // Lists every violated limit, not just the first
    QuotaCheck check(const UserId& user_id, Timestamp now);

private:
    QuotaDefaults defaults_;
    Duration hour_window_;
    Duration day_window_;
    const ResourceLedger& ledger_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<UserId, UserResourceQuotas> quotas_;
};

} // namespace roundabout
