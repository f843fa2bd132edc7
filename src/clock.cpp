#include "roundabout/clock.hpp"

#include <vector>

namespace roundabout {

namespace {

using TimerMap = std::multimap<Timestamp, std::pair<TimerId, Clock::Task>>;

bool erase_timer(TimerMap& timers, TimerId id) {
    for (auto it = timers.begin(); it != timers.end(); ++it) {
        if (it->second.first == id) {
            timers.erase(it);
            return true;
        }
    }
    return false;
}

} // anonymous namespace

// ========== SystemClock ==========

SystemClock::SystemClock()
    : shared_(std::make_shared<Shared>())
    , timer_thread_(&SystemClock::timer_loop, shared_) {}

SystemClock::~SystemClock() {
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        shared_->stopping = true;
    }
    shared_->cv.notify_all();
    if (!timer_thread_.joinable()) return;
    if (timer_thread_.get_id() == std::this_thread::get_id()) {
        // Destroyed from inside a timer task; the loop exits once the task returns
        timer_thread_.detach();
    } else {
        timer_thread_.join();
    }
}

Timestamp SystemClock::now() const {
    return SteadyClock::now();
}

TimerId SystemClock::schedule_after(Duration delay, Task task) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        id = shared_->next_id++;
        shared_->timers.emplace(SteadyClock::now() + delay, std::make_pair(id, std::move(task)));
    }
    shared_->cv.notify_all();
    return id;
}

bool SystemClock::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return erase_timer(shared_->timers, id);
}

std::size_t SystemClock::pending_timers() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->timers.size();
}

void SystemClock::timer_loop(std::shared_ptr<Shared> shared) {
    std::unique_lock<std::mutex> lock(shared->mutex);
    while (!shared->stopping) {
        if (shared->timers.empty()) {
            shared->cv.wait(lock, [&shared] { return shared->stopping || !shared->timers.empty(); });
            continue;
        }

        auto due = shared->timers.begin()->first;
        if (SteadyClock::now() < due) {
            shared->cv.wait_until(lock, due);
            continue;
        }

        Task task = std::move(shared->timers.begin()->second.second);
        shared->timers.erase(shared->timers.begin());

        // Tasks may schedule or cancel timers. Captures are released before
        // relocking since dropping one may destroy the clock.
        lock.unlock();
        if (task) {
            task();
        }
        task = nullptr;
        lock.lock();
    }
}

// ========== ManualClock ==========

ManualClock::ManualClock(Timestamp start) : now_(start) {}

Timestamp ManualClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

TimerId ManualClock::schedule_after(Duration delay, Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    TimerId id = next_id_++;
    timers_.emplace(now_ + delay, std::make_pair(id, std::move(task)));
    return id;
}

bool ManualClock::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return erase_timer(timers_, id);
}

void ManualClock::advance(Duration delta) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += delta;
    }
    run_due_timers();
}

void ManualClock::set(Timestamp t) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = t;
    }
    run_due_timers();
}

std::size_t ManualClock::pending_timers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void ManualClock::run_due_timers() {
    for (;;) {
        Task task;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (timers_.empty() || timers_.begin()->first > now_) {
                return;
            }
            task = std::move(timers_.begin()->second.second);
            timers_.erase(timers_.begin());
        }
        if (task) {
            task();
        }
    }
}

} // namespace roundabout
