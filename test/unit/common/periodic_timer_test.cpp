#include <gtest/gtest.h>
#include "tiercache/common/periodic_timer.h"
#include "tiercache/core/error.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

namespace tiercache {
namespace common {
namespace {

using namespace std::chrono_literals;

// Polls `pred` until it holds or `timeout` passes.
template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(1ms);
    }
    return pred();
}

TEST(PeriodicTimerTest, FiresRepeatedly) {
    PeriodicTimer timer("test");
    std::atomic<int> calls{0};
    timer.start(5ms, [&] { calls.fetch_add(1); });

    EXPECT_TRUE(WaitFor([&] { return calls.load() >= 3; }));
    timer.stop();
    EXPECT_FALSE(timer.is_running());
}

TEST(PeriodicTimerTest, StopPreventsFurtherCallbacks) {
    PeriodicTimer timer("test");
    std::atomic<int> calls{0};
    timer.start(5ms, [&] { calls.fetch_add(1); });
    ASSERT_TRUE(WaitFor([&] { return calls.load() >= 1; }));

    timer.stop();
    const int after_stop = calls.load();
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(calls.load(), after_stop);
}

TEST(PeriodicTimerTest, StopWakesLongInterval) {
    PeriodicTimer timer("slow");
    timer.start(std::chrono::hours(1), [] {});

    auto begin = std::chrono::steady_clock::now();
    timer.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 1s);
}

TEST(PeriodicTimerTest, StopIsIdempotent) {
    PeriodicTimer timer("test");
    timer.stop();
    timer.start(10ms, [] {});
    timer.stop();
    timer.stop();
    EXPECT_FALSE(timer.is_running());
}

TEST(PeriodicTimerTest, StartWhileRunningKeepsFirstCallback) {
    PeriodicTimer timer("test");
    std::atomic<int> first{0};
    std::atomic<int> second{0};
    timer.start(5ms, [&] { first.fetch_add(1); });
    timer.start(5ms, [&] { second.fetch_add(1); });

    ASSERT_TRUE(WaitFor([&] { return first.load() >= 2; }));
    timer.stop();
    EXPECT_EQ(second.load(), 0);
}

TEST(PeriodicTimerTest, RejectsInvalidArguments) {
    PeriodicTimer timer("test");
    EXPECT_THROW(timer.start(0ms, [] {}), core::InvalidArgumentError);
    EXPECT_THROW(timer.start(-5ms, [] {}), core::InvalidArgumentError);
    EXPECT_THROW(timer.start(5ms, PeriodicTimer::Callback{}), core::InvalidArgumentError);
    EXPECT_FALSE(timer.is_running());
}

TEST(PeriodicTimerTest, CallbackExceptionDoesNotStopTimer) {
    PeriodicTimer timer("throwing");
    std::atomic<int> calls{0};
    timer.start(5ms, [&] {
        calls.fetch_add(1);
        throw std::runtime_error("boom");
    });

    EXPECT_TRUE(WaitFor([&] { return calls.load() >= 2; }));
    EXPECT_TRUE(timer.is_running());
    timer.stop();
}

TEST(PeriodicTimerTest, NonStandardExceptionDoesNotStopTimer) {
    PeriodicTimer timer("throwing-int");
    std::atomic<int> calls{0};
    timer.start(5ms, [&] {
        calls.fetch_add(1);
        throw 42;
    });

    EXPECT_TRUE(WaitFor([&] { return calls.load() >= 2; }));
    EXPECT_TRUE(timer.is_running());
    timer.stop();
}

TEST(PeriodicTimerTest, StopFromCallbackThenDestroy) {
    std::atomic<int> calls{0};
    auto timer = std::make_unique<PeriodicTimer>("self-stop");
    PeriodicTimer* raw = timer.get();
    timer->start(5ms, [&calls, raw] {
        calls.fetch_add(1);
        raw->stop();
    });

    ASSERT_TRUE(WaitFor([&] { return !raw->is_running(); }));
    timer.reset();
    EXPECT_EQ(calls.load(), 1);
}

TEST(PeriodicTimerTest, RestartAfterStopFromCallback) {
    PeriodicTimer timer("restart");
    std::atomic<int> first{0};
    timer.start(5ms, [&] {
        first.fetch_add(1);
        timer.stop();
    });
    ASSERT_TRUE(WaitFor([&] { return !timer.is_running(); }));

    std::atomic<int> second{0};
    timer.start(5ms, [&] { second.fetch_add(1); });
    EXPECT_TRUE(WaitFor([&] { return second.load() >= 2; }));
    timer.stop();
    EXPECT_EQ(first.load(), 1);
}

TEST(PeriodicTimerTest, SetIntervalChangesDelay) {
    PeriodicTimer timer("adaptive");
    std::atomic<int> calls{0};
    timer.start(std::chrono::hours(1), [&] { calls.fetch_add(1); });
    EXPECT_EQ(timer.interval(), std::chrono::milliseconds(std::chrono::hours(1)));

    timer.set_interval(25ms);
    EXPECT_EQ(timer.interval(), 25ms);
    timer.set_interval(0ms);
    EXPECT_EQ(timer.interval(), 25ms);
    timer.stop();
    EXPECT_EQ(calls.load(), 0);
}

TEST(PeriodicTimerTest, FireCountTracksCompletedCallbacks) {
    PeriodicTimer timer("count");
    std::atomic<int> calls{0};
    timer.start(5ms, [&] { calls.fetch_add(1); });
    ASSERT_TRUE(WaitFor([&] { return timer.fire_count() >= 2; }));
    timer.stop();
    EXPECT_EQ(timer.fire_count(), static_cast<uint64_t>(calls.load()));
}

TEST(PeriodicTimerTest, DestructorStopsTimer) {
    std::atomic<int> calls{0};
    {
        PeriodicTimer timer("scoped");
        timer.start(5ms, [&] { calls.fetch_add(1); });
        ASSERT_TRUE(WaitFor([&] { return calls.load() >= 1; }));
    }
    const int after = calls.load();
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(calls.load(), after);
}

} // namespace
} // namespace common
} // namespace tiercache
