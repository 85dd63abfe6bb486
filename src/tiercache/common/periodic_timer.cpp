#include "tiercache/common/periodic_timer.h"
#include "tiercache/common/logger.h"
#include "tiercache/core/error.h"

namespace tiercache {
namespace common {

PeriodicTimer::PeriodicTimer(std::string name) : name_(std::move(name)) {}

PeriodicTimer::~PeriodicTimer() {
    stop();
}

void PeriodicTimer::start(std::chrono::milliseconds interval, Callback callback) {
    if (interval.count() <= 0) {
        throw core::InvalidArgumentError("Timer interval must be positive: " + name_);
    }
    if (!callback) {
        throw core::InvalidArgumentError("Timer callback must not be empty: " + name_);
    }

    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_.load(std::memory_order_acquire)) {
        return;
    }

    if (thread_.joinable()) {
        // Left behind by a stop() issued from the callback
        thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    callback_ = std::move(callback);
    interval_ms_.store(interval.count(), std::memory_order_relaxed);
    fire_count_.store(0, std::memory_order_relaxed);
    running_.store(true, std::memory_order_release);
    thread_ = std::thread(&PeriodicTimer::run, this);

    TIERCACHE_DEBUG("Timer '{}' started with interval {}ms", name_, interval.count());
}

void PeriodicTimer::stop() {
    if (worker_id_.load(std::memory_order_acquire) == std::this_thread::get_id()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_requested_ = true;
        }
        running_.store(false, std::memory_order_release);
        TIERCACHE_DEBUG("Timer '{}' stop requested from its callback", name_);
        return;
    }

    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!running_.load(std::memory_order_acquire) && !thread_.joinable()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    worker_id_.store(std::thread::id(), std::memory_order_release);
    running_.store(false, std::memory_order_release);

    TIERCACHE_DEBUG("Timer '{}' stopped after {} firings", name_, fire_count());
}

bool PeriodicTimer::is_running() const {
    return running_.load(std::memory_order_acquire);
}

void PeriodicTimer::set_interval(std::chrono::milliseconds interval) {
    if (interval.count() <= 0) {
        return;
    }
    interval_ms_.store(interval.count(), std::memory_order_relaxed);
}

std::chrono::milliseconds PeriodicTimer::interval() const {
    return std::chrono::milliseconds(interval_ms_.load(std::memory_order_relaxed));
}

uint64_t PeriodicTimer::fire_count() const {
    return fire_count_.load(std::memory_order_relaxed);
}

void PeriodicTimer::run() {
    worker_id_.store(std::this_thread::get_id(), std::memory_order_release);
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        auto wait_for = std::chrono::milliseconds(interval_ms_.load(std::memory_order_relaxed));
        if (cv_.wait_for(lock, wait_for, [this] { return stop_requested_; })) {
            break;
        }

        lock.unlock();
        try {
            callback_();
        } catch (const std::exception& e) {
            TIERCACHE_ERROR("Timer '{}' callback failed: {}", name_, e.what());
        } catch (...) {
            TIERCACHE_ERROR("Timer '{}' callback failed with a non-standard exception", name_);
        }
        fire_count_.fetch_add(1, std::memory_order_relaxed);
        lock.lock();
    }
}

} // namespace common
} // namespace tiercache
