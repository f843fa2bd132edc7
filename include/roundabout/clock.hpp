#pragma once

#include "roundabout/types.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

namespace roundabout {

using TimerId = std::uint64_t;

// Time and one-shot timer source. Injected into every component that reads
// the time or schedules deferred work.
class Clock {
public:
    using Task = std::function<void()>;

    virtual ~Clock() = default;

    virtual Timestamp now() const = 0;

    // Runs task once after delay. Returns an id usable with cancel().
    virtual TimerId schedule_after(Duration delay, Task task) = 0;

    // Returns false if the timer already fired or was never scheduled
    virtual bool cancel(TimerId id) = 0;
};

// Real steady clock. Timers fire on a dedicated background thread.
class SystemClock : public Clock {
public:
    SystemClock();
    ~SystemClock() override;

    SystemClock(const SystemClock&) = delete;
    SystemClock& operator=(const SystemClock&) = delete;

    Timestamp now() const override;
    TimerId schedule_after(Duration delay, Task task) override;
    bool cancel(TimerId id) override;

    std::size_t pending_timers() const;

private:
    // Owned jointly with the timer thread, which may outlive this object when
    // the last reference to the clock is dropped by a timer task
    struct Shared {
        std::mutex mutex;
        std::condition_variable cv;
        std::multimap<Timestamp, std::pair<TimerId, Task>> timers;
        TimerId next_id{1};
        bool stopping{false};
    };

    std::shared_ptr<Shared> shared_;
    std::thread timer_thread_;

    static void timer_loop(std::shared_ptr<Shared> shared);
};

// Virtual clock for deterministic tests. Time only moves on advance(); due
// timers run synchronously on the advancing thread, in due order.
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = Timestamp{} + std::chrono::hours(24 * 365));

    Timestamp now() const override;
    TimerId schedule_after(Duration delay, Task task) override;
    bool cancel(TimerId id) override;

    void advance(Duration delta);
    void set(Timestamp t);

    std::size_t pending_timers() const;

private:
    mutable std::mutex mutex_;
    Timestamp now_;
    std::multimap<Timestamp, std::pair<TimerId, Task>> timers_;
    TimerId next_id_{1};

    void run_due_timers();
};

} // namespace roundabout
