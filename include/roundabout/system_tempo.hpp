#pragma once

#include "roundabout/types.hpp"
#include "roundabout/config.hpp"
#include "roundabout/resource_budget.hpp"

#include <mutex>
#include <optional>

namespace roundabout {

struct TempoChange {
    SystemTempo from;
    SystemTempo to;
};

// Global throttling ladder High-Performance <-> Low-Intensity <-> Sleep.
// Each evaluation moves at most one step. Recovery uses lower thresholds
// than degradation.
class SystemTempoController {
public:
    explicit SystemTempoController(TempoConfig config = TempoConfig{});

    std::optional<TempoChange> evaluate_error_rate(double error_rate);
    std::optional<TempoChange> evaluate_cost_spike(double cost_spike);

    // Returns the change, or nullopt if tempo was already set
    std::optional<TempoChange> set(SystemTempo tempo);
    SystemTempo current() const;

    // Low-Intensity scales LLM and compute by ceil(x * low_intensity_scale).
    // Sleep clamps every operation but memory access to sleep_clamp.
    ResourceEstimate scale(OperationType op, const ResourceEstimate& estimate) const;

    const TempoConfig& config() const noexcept { return config_; }

private:
    TempoConfig config_;
    mutable std::mutex mutex_;
    SystemTempo tempo_{SystemTempo::HighPerformance};

    std::optional<TempoChange> step_locked(double signal, double degrade_to_low,
                                           double degrade_to_sleep, double recover_to_low,
                                           double recover_to_high);
};

} // namespace roundabout
