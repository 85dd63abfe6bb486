#include "tiercache/cache/memory_monitor.h"
#include "tiercache/common/logger.h"

namespace tiercache {
namespace cache {

namespace {

const MonitoringConfig& validated(const MonitoringConfig& config) {
    config.validate();
    return config;
}

} // namespace

const char* to_string(MemoryState state) {
    switch (state) {
        case MemoryState::NORMAL: return "normal";
        case MemoryState::WARNING: return "warning";
        case MemoryState::CRITICAL: return "critical";
    }
    return "unknown";
}

MemoryMonitor::MemoryMonitor(const MonitoringConfig& config)
    : config_(validated(config)) {}

MemoryState MemoryMonitor::evaluate(size_t usage) {
    MemoryState next = MemoryState::NORMAL;
    if (usage >= config_.critical_threshold) {
        next = MemoryState::CRITICAL;
    } else if (usage >= config_.warning_threshold) {
        next = MemoryState::WARNING;
    }

    if (next != state_ && next != MemoryState::NORMAL) {
        TIERCACHE_WARN("Memory usage {} bytes entered {} state (warning={}, critical={})",
                       usage, to_string(next), config_.warning_threshold, config_.critical_threshold);
    }
    state_ = next;
    return state_;
}

double MemoryMonitor::pressure(size_t usage) const {
    return static_cast<double>(usage) / static_cast<double>(config_.critical_threshold);
}

CleanupStrategy MemoryMonitor::select_cleanup_level(CleanupStrategy requested, double pressure,
                                                    bool leak_detected) {
    if (pressure > 0.9 || requested == CleanupStrategy::AGGRESSIVE || leak_detected) {
        return CleanupStrategy::AGGRESSIVE;
    }
    if (pressure > 0.7 || requested == CleanupStrategy::MODERATE) {
        return CleanupStrategy::MODERATE;
    }
    return CleanupStrategy::CONSERVATIVE;
}

bool MemoryMonitor::detect_leak(size_t usage, core::TimePoint now) {
    if (!leak_) {
        leak_ = LeakTracking{usage, 0, now};
        return false;
    }

    LeakTracking& tracking = *leak_;
    if (static_cast<double>(usage) > static_cast<double>(tracking.last_size) * config_.leak_growth_factor) {
        ++tracking.growth_count;
        if (tracking.growth_count >= config_.leak_consecutive_samples &&
            now - tracking.first_seen > config_.leak_min_duration) {
            TIERCACHE_WARN("Potential memory leak detected: {} bytes after {} growth samples over {}ms",
                           usage, tracking.growth_count,
                           std::chrono::duration_cast<std::chrono::milliseconds>(now - tracking.first_seen).count());
            leak_.reset();
            return true;
        }
    } else {
        tracking.growth_count = 0;
    }
    tracking.last_size = usage;
    return false;
}

std::chrono::milliseconds MemoryMonitor::next_interval(double pressure) {
    if (pressure > 0.8) {
        return std::chrono::milliseconds(30000);
    }
    if (pressure > 0.5) {
        return std::chrono::milliseconds(60000);
    }
    return std::chrono::milliseconds(120000);
}

void MemoryMonitor::reset() {
    state_ = MemoryState::NORMAL;
    leak_.reset();
}

} // namespace cache
} // namespace tiercache
