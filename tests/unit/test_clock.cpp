#include <gtest/gtest.h>
#include <roundabout/roundabout.hpp>

#include <atomic>
#include <future>
#include <memory>
#include <thread>
#include <vector>

using namespace roundabout;
using namespace std::chrono_literals;

// ===========================================================================
// ManualClock
// ===========================================================================

TEST(ManualClockTest, TimeMovesOnlyOnAdvance) {
    ManualClock clock;
    Timestamp start = clock.now();
    EXPECT_EQ(clock.now(), start);

    clock.advance(250ms);
    EXPECT_EQ(clock.now(), start + 250ms);
}

TEST(ManualClockTest, ScheduleNeverRunsInline) {
    ManualClock clock;
    bool ran = false;
    clock.schedule_after(Duration::zero(), [&] { ran = true; });
    EXPECT_FALSE(ran);
    EXPECT_EQ(clock.pending_timers(), 1u);

    clock.advance(Duration::zero());
    EXPECT_TRUE(ran);
    EXPECT_EQ(clock.pending_timers(), 0u);
}

TEST(ManualClockTest, DueTimersRunInOrder) {
    ManualClock clock;
    std::vector<int> order;
    clock.schedule_after(3s, [&] { order.push_back(3); });
    clock.schedule_after(1s, [&] { order.push_back(1); });
    clock.schedule_after(2s, [&] { order.push_back(2); });
    clock.schedule_after(10s, [&] { order.push_back(10); });

    clock.advance(5s);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(clock.pending_timers(), 1u);
}

TEST(ManualClockTest, CancelledTimerDoesNotFire) {
    ManualClock clock;
    bool ran = false;
    TimerId id = clock.schedule_after(1s, [&] { ran = true; });
    EXPECT_TRUE(clock.cancel(id));
    EXPECT_FALSE(clock.cancel(id));

    clock.advance(2s);
    EXPECT_FALSE(ran);
}

TEST(ManualClockTest, TaskMayScheduleAnother) {
    ManualClock clock;
    int fired = 0;
    clock.schedule_after(1s, [&] {
        ++fired;
        clock.schedule_after(Duration::zero(), [&] { ++fired; });
    });
    clock.advance(1s);
    EXPECT_EQ(fired, 2);
}

// ===========================================================================
// SystemClock
// ===========================================================================

TEST(SystemClockTest, FiresOnBackgroundThread) {
    SystemClock clock;
    std::promise<void> fired;
    auto done = fired.get_future();
    clock.schedule_after(10ms, [&] { fired.set_value(); });
    EXPECT_EQ(done.wait_for(2s), std::future_status::ready);
}

TEST(SystemClockTest, CancelBeforeDue) {
    SystemClock clock;
    std::atomic<bool> ran{false};
    TimerId id = clock.schedule_after(1h, [&] { ran = true; });
    EXPECT_EQ(clock.pending_timers(), 1u);
    EXPECT_TRUE(clock.cancel(id));
    EXPECT_EQ(clock.pending_timers(), 0u);
    EXPECT_FALSE(ran.load());
}

TEST(SystemClockTest, TimerTaskMayDropLastReferenceToClock) {
    auto clock = std::make_shared<SystemClock>();
    std::weak_ptr<SystemClock> watch = clock;

    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    auto holder = std::make_shared<std::shared_ptr<SystemClock>>(clock);
    clock->schedule_after(Duration::zero(), [holder, released] {
        released.wait();
        // Destroys the clock on its own timer thread
        holder->reset();
    });

    clock.reset();
    release.set_value();

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!watch.expired() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_TRUE(watch.expired());
}

// ===========================================================================
// SeededRandomSource
// ===========================================================================

TEST(RandomSourceTest, SameSeedSameSequence) {
    SeededRandomSource a(42);
    SeededRandomSource b(42);
    for (int i = 0; i < 100; ++i) {
        double x = a.next_unit();
        EXPECT_EQ(x, b.next_unit());
        EXPECT_GE(x, 0.0);
        EXPECT_LT(x, 1.0);
    }
}
