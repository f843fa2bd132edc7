#pragma once

#include "roundabout/types.hpp"
#include "roundabout/clock.hpp"
#include "roundabout/config.hpp"
#include "roundabout/monitor.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace roundabout {

// Outcome of feeding one sample into the breaker
struct BreakerSignal {
    // error rate or cost spike computed over the window after the sample
    double value{0.0};
    // true only for the call that performed the transition to open
    bool tripped{false};
};

// Process-wide closed/open/half-open fault detector.
//
// Opens when the windowed error rate or the cost spike crosses its threshold.
// Opening schedules a one-shot timer on the injected clock that moves the
// breaker to half-open after the cooldown. In half-open, consecutive
// successes close it again and any new trip reopens it.
class CircuitBreaker {
public:
    CircuitBreaker(CircuitBreakerConfig config, std::shared_ptr<Clock> clock,
                   std::shared_ptr<Monitor> monitor = nullptr);
    ~CircuitBreaker();

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    // Appends to the error history. error rate = recent errors /
    // max(active_agents * 10, 10).
    BreakerSignal record_error(const AgentId& agent_id, const std::string& error,
                               std::size_t active_agents);

    // Appends to the cost history. cost spike = average cost / baseline.
    BreakerSignal record_cost(const AgentId& agent_id, double cost);

    // closed/half-open -> open. Returns true only for the caller that made
    // the transition.
    bool trip(const std::string& reason);

    // Counts an approved request while half-open
    void record_success();

    // Operator override. Forcing open starts the cooldown like a trip.
    void force_state(CircuitStatus status);

    CircuitStatus status() const;
    bool is_open() const;

    CircuitBreakerInfo info(std::size_t active_agents) const;
    double error_rate(std::size_t active_agents) const;
    double cost_spike() const;
    std::vector<ErrorRecord> error_history() const;

    const CircuitBreakerConfig& config() const noexcept;

private:
    struct CostRecord {
        AgentId agent_id;
        Timestamp timestamp{};
        double cost{0.0};
    };

    // Shared with pending cooldown timers so a timer firing after
    // destruction finds nothing to do
    struct State {
        CircuitBreakerConfig config;
        std::shared_ptr<Clock> clock;
        std::shared_ptr<Monitor> monitor;

        mutable std::mutex mutex;
        CircuitStatus status{CircuitStatus::Closed};
        std::optional<Timestamp> last_triggered;
        std::optional<Timestamp> next_retry_at;
        std::optional<TimerId> cooldown_timer;
        std::size_t half_open_successes{0};
        std::deque<ErrorRecord> errors;
        std::deque<CostRecord> costs;
    };

    std::shared_ptr<State> state_;

    static void on_cooldown_elapsed(const std::shared_ptr<State>& state);
    static void emit(const State& state, EventType type, CircuitStatus status,
                     const std::string& message, std::optional<double> value = std::nullopt);

    // Callers hold state_->mutex
    void prune_locked(Timestamp now) const;
    double error_rate_locked(std::size_t active_agents) const;
    double cost_spike_locked() const;
    bool open_locked(Timestamp now);
};

} // namespace roundabout
