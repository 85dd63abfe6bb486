#pragma once

#include "tiercache/cache/cache_types.h"
#include "tiercache/core/clock.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace tiercache {
namespace cache {

/**
 * @brief Memory pressure level
 */
enum class MemoryState {
    NORMAL,
    WARNING,
    CRITICAL
};

const char* to_string(MemoryState state);

/**
 * @brief Threshold state machine, cleanup-level selection and leak detector
 *
 * Every sample is evaluated on its own: there is no hysteresis, so one
 * sample crossing a threshold changes the state for that tick.
 *
 * Not synchronized; the owning UnifiedManager serializes access.
 */
class MemoryMonitor {
public:
    /**
     * @throws core::ConfigurationError if the configuration is rejected
     */
    explicit MemoryMonitor(const MonitoringConfig& config = MonitoringConfig{});

    /**
     * @brief Classify a sample and make it the current state
     *
     * usage >= critical_threshold is CRITICAL, usage >= warning_threshold is
     * WARNING, anything else NORMAL.
     */
    MemoryState evaluate(size_t usage);

    MemoryState state() const { return state_; }

    // CRITICAL also counts as warning
    bool is_warning() const { return state_ != MemoryState::NORMAL; }
    bool is_critical() const { return state_ == MemoryState::CRITICAL; }

    /**
     * @brief usage / critical_threshold
     */
    double pressure(size_t usage) const;

    /**
     * @brief Effective level of a cleanup pass
     *
     * AGGRESSIVE when pressure > 0.9, when requested, or when a leak was
     * detected; MODERATE when pressure > 0.7 or requested; CONSERVATIVE
     * otherwise.
     */
    static CleanupStrategy select_cleanup_level(CleanupStrategy requested, double pressure,
                                                bool leak_detected);

    /**
     * @brief Feed one sample to the leak detector
     *
     * A sample counts as growth when it exceeds leak_growth_factor times the
     * previous sample; any other sample resets the growth count. A leak is
     * reported once leak_consecutive_samples growth samples have been seen
     * and more than leak_min_duration has passed since tracking began; the
     * detector then starts over.
     *
     * @return true when a leak is reported for this sample
     */
    bool detect_leak(size_t usage, core::TimePoint now);

    /**
     * @brief Adaptive monitor delay: 30s above 0.8 pressure, 60s above 0.5,
     *        120s otherwise
     */
    static std::chrono::milliseconds next_interval(double pressure);

    /**
     * @brief Back to NORMAL with an empty leak history
     */
    void reset();

    const MonitoringConfig& config() const { return config_; }

private:
    struct LeakTracking {
        size_t last_size = 0;
        uint32_t growth_count = 0;
        core::TimePoint first_seen;
    };

    MonitoringConfig config_;
    MemoryState state_ = MemoryState::NORMAL;
    std::optional<LeakTracking> leak_;
};

} // namespace cache
} // namespace tiercache
