#pragma once

#include <roundabout/roundabout.hpp>

#include <algorithm>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace roundabout {
namespace testing {

// Captures every event for later inspection
class RecordingMonitor : public Monitor {
public:
    void on_event(const MonitorEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    void on_snapshot(const SystemMetrics& snapshot) override {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshots_.push_back(snapshot);
    }

    std::vector<MonitorEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::vector<MonitorEvent> events_of(EventType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<MonitorEvent> out;
        for (auto& e : events_) {
            if (e.type == type) out.push_back(e);
        }
        return out;
    }

    std::size_t count(EventType type) const { return events_of(type).size(); }

    std::vector<SystemMetrics> snapshots() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshots_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
        snapshots_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<MonitorEvent> events_;
    std::vector<SystemMetrics> snapshots_;
};

// Replays a fixed sequence of draws, then repeats the fallback forever
class ScriptedRandom : public RandomSource {
public:
    explicit ScriptedRandom(std::vector<double> script = {}, double fallback = 0.0)
        : script_(script.begin(), script.end()), fallback_(fallback) {}

    double next_unit() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (script_.empty()) return fallback_;
        double v = script_.front();
        script_.pop_front();
        return v;
    }

    void push(double v) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(v);
    }

private:
    std::mutex mutex_;
    std::deque<double> script_;
    double fallback_;
};

// Model provider driven by a callback; counts calls
class FakeModelProvider : public ModelProvider {
public:
    using Handler = std::function<ModelResponse(const ModelRequest&)>;

    explicit FakeModelProvider(Handler handler) : handler_(std::move(handler)) {}

    ModelResponse chat(const ModelRequest& request) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++calls_;
            last_request_ = request;
        }
        return handler_(request);
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    ModelRequest last_request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_request_;
    }

private:
    Handler handler_;
    mutable std::mutex mutex_;
    int calls_{0};
    ModelRequest last_request_;
};

inline ConfigurationProfile make_profile(const std::string& user = "alice",
                                         std::optional<ResourceBudget> budget = std::nullopt) {
    ConfigurationProfile p;
    p.llm_model = "test-model";
    p.toolkit = {"search", "summarize"};
    p.memory_scope = "user:" + user;
    p.resource_budget = budget;
    return p;
}

} // namespace testing
} // namespace roundabout
