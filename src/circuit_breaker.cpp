#include "roundabout/circuit_breaker.hpp"

#include <algorithm>

namespace roundabout {

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config, std::shared_ptr<Clock> clock,
                               std::shared_ptr<Monitor> monitor)
    : state_(std::make_shared<State>())
{
    state_->config = std::move(config);
    state_->clock = std::move(clock);
    state_->monitor = std::move(monitor);
}

CircuitBreaker::~CircuitBreaker() {
    std::optional<TimerId> timer;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        timer = state_->cooldown_timer;
        state_->cooldown_timer.reset();
    }
    if (timer) {
        state_->clock->cancel(*timer);
    }
}

// ==================== Signals ====================

BreakerSignal CircuitBreaker::record_error(const AgentId& agent_id, const std::string& error,
                                           std::size_t active_agents) {
    BreakerSignal signal;
    bool tripped = false;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        Timestamp now = state_->clock->now();
        state_->errors.push_back(ErrorRecord{agent_id, now, error});
        prune_locked(now);

        signal.value = error_rate_locked(active_agents);
        if (state_->errors.size() >= state_->config.min_error_samples &&
            signal.value > state_->config.error_rate_threshold) {
            tripped = open_locked(now);
        }
    }

    if (tripped) {
        emit(*state_, EventType::CircuitBreakerOpened, CircuitStatus::Open,
             "Circuit breaker opened: High error rate detected", signal.value);
    }
    signal.tripped = tripped;
    return signal;
}

BreakerSignal CircuitBreaker::record_cost(const AgentId& agent_id, double cost) {
    BreakerSignal signal;
    bool tripped = false;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        Timestamp now = state_->clock->now();
        state_->costs.push_back(CostRecord{agent_id, now, cost});
        prune_locked(now);

        signal.value = cost_spike_locked();
        double average = signal.value * state_->config.baseline_cost;
        if (signal.value > state_->config.cost_spike_threshold &&
            average > state_->config.min_average_cost &&
            state_->costs.size() >= state_->config.min_cost_samples) {
            tripped = open_locked(now);
        }
    }

    if (tripped) {
        emit(*state_, EventType::CircuitBreakerOpened, CircuitStatus::Open,
             "Circuit breaker opened: Cost spike detected", signal.value);
    }
    signal.tripped = tripped;
    return signal;
}

bool CircuitBreaker::trip(const std::string& reason) {
    bool tripped;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        tripped = open_locked(state_->clock->now());
    }
    if (tripped) {
        emit(*state_, EventType::CircuitBreakerOpened, CircuitStatus::Open,
             "Circuit breaker opened: " + reason);
    }
    return tripped;
}

void CircuitBreaker::record_success() {
    bool closed = false;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->status != CircuitStatus::HalfOpen) return;

        state_->half_open_successes++;
        if (state_->half_open_successes >= state_->config.half_open_success_threshold) {
            state_->status = CircuitStatus::Closed;
            state_->half_open_successes = 0;
            state_->next_retry_at.reset();
            closed = true;
        }
    }
    if (closed) {
        emit(*state_, EventType::CircuitBreakerClosed, CircuitStatus::Closed,
             "Circuit breaker closed after successful half-open requests");
    }
}

void CircuitBreaker::force_state(CircuitStatus status) {
    std::optional<TimerId> stale_timer;
    bool opened = false;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (status == CircuitStatus::Open) {
            // Restart the cooldown even if already open
            stale_timer = state_->cooldown_timer;
            state_->cooldown_timer.reset();
            state_->status = CircuitStatus::Closed;
            opened = open_locked(state_->clock->now());
        } else {
            stale_timer = state_->cooldown_timer;
            state_->cooldown_timer.reset();
            state_->status = status;
            state_->half_open_successes = 0;
            if (status == CircuitStatus::Closed) {
                state_->next_retry_at.reset();
            }
        }
    }
    if (stale_timer) {
        state_->clock->cancel(*stale_timer);
    }

    switch (status) {
        case CircuitStatus::Open:
            if (opened) {
                emit(*state_, EventType::CircuitBreakerOpened, status,
                     "Circuit breaker forced open");
            }
            break;
        case CircuitStatus::HalfOpen:
            emit(*state_, EventType::CircuitBreakerHalfOpen, status,
                 "Circuit breaker forced half-open");
            break;
        case CircuitStatus::Closed:
            emit(*state_, EventType::CircuitBreakerClosed, status,
                 "Circuit breaker forced closed");
            break;
    }
}

// ==================== Queries ====================

CircuitStatus CircuitBreaker::status() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->status;
}

bool CircuitBreaker::is_open() const {
    return status() == CircuitStatus::Open;
}

CircuitBreakerInfo CircuitBreaker::info(std::size_t active_agents) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    prune_locked(state_->clock->now());

    CircuitBreakerInfo result;
    result.status = state_->status;
    result.error_rate = error_rate_locked(active_agents);
    result.cost_spike = cost_spike_locked();
    result.last_triggered = state_->last_triggered;
    result.next_retry_at = state_->next_retry_at;
    return result;
}

double CircuitBreaker::error_rate(std::size_t active_agents) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    prune_locked(state_->clock->now());
    return error_rate_locked(active_agents);
}

double CircuitBreaker::cost_spike() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    prune_locked(state_->clock->now());
    return cost_spike_locked();
}

std::vector<ErrorRecord> CircuitBreaker::error_history() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    prune_locked(state_->clock->now());
    return std::vector<ErrorRecord>(state_->errors.begin(), state_->errors.end());
}

const CircuitBreakerConfig& CircuitBreaker::config() const noexcept {
    return state_->config;
}

// ==================== Internals ====================

void CircuitBreaker::prune_locked(Timestamp now) const {
    Timestamp cutoff = now - state_->config.time_window;
    auto& errors = state_->errors;
    errors.erase(std::remove_if(errors.begin(), errors.end(),
                                [cutoff](const ErrorRecord& e) { return e.timestamp <= cutoff; }),
                 errors.end());
    auto& costs = state_->costs;
    costs.erase(std::remove_if(costs.begin(), costs.end(),
                               [cutoff](const CostRecord& c) { return c.timestamp <= cutoff; }),
                costs.end());
}

double CircuitBreaker::error_rate_locked(std::size_t active_agents) const {
    double operations = static_cast<double>(std::max<std::size_t>(active_agents * 10, 10));
    return static_cast<double>(state_->errors.size()) / operations;
}

double CircuitBreaker::cost_spike_locked() const {
    if (state_->costs.empty() || state_->config.baseline_cost <= 0.0) return 0.0;
    double sum = 0.0;
    for (auto& c : state_->costs) {
        sum += c.cost;
    }
    double average = sum / static_cast<double>(state_->costs.size());
    return average / state_->config.baseline_cost;
}

bool CircuitBreaker::open_locked(Timestamp now) {
    if (state_->status == CircuitStatus::Open) return false;

    state_->status = CircuitStatus::Open;
    state_->half_open_successes = 0;
    state_->last_triggered = now;
    state_->next_retry_at = now + state_->config.time_window;

    std::weak_ptr<State> weak = state_;
    state_->cooldown_timer = state_->clock->schedule_after(
        state_->config.time_window,
        [weak] {
            if (auto state = weak.lock()) {
                on_cooldown_elapsed(state);
            }
        });
    return true;
}

void CircuitBreaker::on_cooldown_elapsed(const std::shared_ptr<State>& state) {
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->cooldown_timer.reset();
        if (state->status != CircuitStatus::Open) return;
        state->status = CircuitStatus::HalfOpen;
        state->half_open_successes = 0;
    }
    emit(*state, EventType::CircuitBreakerHalfOpen, CircuitStatus::HalfOpen,
         "Circuit breaker moved to half-open state");
}

void CircuitBreaker::emit(const State& state, EventType type, CircuitStatus status,
                          const std::string& message, std::optional<double> value) {
    if (!state.monitor) return;

    MonitorEvent event;
    event.type = type;
    event.timestamp = state.clock->now();
    event.message = message;
    event.breaker_status = status;
    event.value = value;
    state.monitor->on_event(event);
}

} // namespace roundabout
