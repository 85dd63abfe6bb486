#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace tiercache {
namespace common {

/**
 * @brief Runs a callback on a dedicated thread at a fixed (adjustable) interval
 *
 * The callback runs on the timer's own thread, so one invocation always
 * finishes before the next one is scheduled. stop() wakes the thread
 * immediately rather than waiting out the current interval, and joins it.
 */
class PeriodicTimer {
public:
    using Callback = std::function<void()>;

    /**
     * @param name Label used in log messages
     */
    explicit PeriodicTimer(std::string name);

    ~PeriodicTimer();

    PeriodicTimer(const PeriodicTimer&) = delete;
    PeriodicTimer& operator=(const PeriodicTimer&) = delete;
    PeriodicTimer(PeriodicTimer&&) = delete;
    PeriodicTimer& operator=(PeriodicTimer&&) = delete;

    /**
     * @brief Start firing callback every interval
     * @throws core::InvalidArgumentError if interval is not positive or callback is empty
     *
     * Idempotent: a running timer is left untouched.
     */
    void start(std::chrono::milliseconds interval, Callback callback);

    /**
     * @brief Stop the timer and wait for an in-flight callback to return
     *
     * Idempotent. When called from inside the callback it only requests the
     * stop; the worker exits once the callback returns and is joined by the
     * destructor or the next start().
     */
    void stop();

    bool is_running() const;

    /**
     * @brief Change the delay before the next firing
     */
    void set_interval(std::chrono::milliseconds interval);

    std::chrono::milliseconds interval() const;

    /**
     * @brief Number of completed callback invocations since start()
     */
    uint64_t fire_count() const;

private:
    void run();

    std::string name_;
    Callback callback_;

    std::atomic<int64_t> interval_ms_{0};
    std::atomic<uint64_t> fire_count_{0};
    std::atomic<bool> running_{false};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_{false};

    // Serializes start()/stop() against each other
    std::mutex lifecycle_mutex_;
    std::thread thread_;
    std::atomic<std::thread::id> worker_id_{};
};

} // namespace common
} // namespace tiercache
