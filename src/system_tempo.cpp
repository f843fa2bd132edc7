#include "roundabout/system_tempo.hpp"

namespace roundabout {

SystemTempoController::SystemTempoController(TempoConfig config)
    : config_(std::move(config)) {}

std::optional<TempoChange> SystemTempoController::evaluate_error_rate(double error_rate) {
    std::lock_guard<std::mutex> lock(mutex_);
    return step_locked(error_rate,
                       config_.error_degrade_to_low, config_.error_degrade_to_sleep,
                       config_.error_recover_to_low, config_.error_recover_to_high);
}

std::optional<TempoChange> SystemTempoController::evaluate_cost_spike(double cost_spike) {
    std::lock_guard<std::mutex> lock(mutex_);
    return step_locked(cost_spike,
                       config_.cost_degrade_to_low, config_.cost_degrade_to_sleep,
                       config_.cost_recover_to_low, config_.cost_recover_to_high);
}

std::optional<TempoChange> SystemTempoController::step_locked(
    double signal, double degrade_to_low, double degrade_to_sleep,
    double recover_to_low, double recover_to_high)
{
    SystemTempo from = tempo_;
    switch (tempo_) {
        case SystemTempo::HighPerformance:
            if (signal > degrade_to_low) tempo_ = SystemTempo::LowIntensity;
            break;
        case SystemTempo::LowIntensity:
            if (signal > degrade_to_sleep) {
                tempo_ = SystemTempo::Sleep;
            } else if (signal < recover_to_high) {
                tempo_ = SystemTempo::HighPerformance;
            }
            break;
        case SystemTempo::Sleep:
            if (signal < recover_to_low) tempo_ = SystemTempo::LowIntensity;
            break;
    }

    if (tempo_ == from) return std::nullopt;
    return TempoChange{from, tempo_};
}

std::optional<TempoChange> SystemTempoController::set(SystemTempo tempo) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tempo_ == tempo) return std::nullopt;
    TempoChange change{tempo_, tempo};
    tempo_ = tempo;
    return change;
}

SystemTempo SystemTempoController::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tempo_;
}

ResourceEstimate SystemTempoController::scale(OperationType op,
                                              const ResourceEstimate& estimate) const {
    SystemTempo tempo = current();
    ResourceEstimate scaled = estimate;

    switch (tempo) {
        case SystemTempo::HighPerformance:
            break;
        case SystemTempo::LowIntensity: {
            auto halved = scaled_ceil(estimate, config_.low_intensity_scale);
            scaled.llm_calls = halved.llm_calls;
            scaled.compute_units = halved.compute_units;
            break;
        }
        case SystemTempo::Sleep:
            if (op != OperationType::MemoryAccess) {
                scaled = config_.sleep_clamp;
            }
            break;
    }
    return scaled;
}

} // namespace roundabout
