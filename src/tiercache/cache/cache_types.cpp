#include "tiercache/cache/cache_types.h"
#include "tiercache/core/error.h"
#include <string>

namespace tiercache {
namespace cache {

const char* to_string(CachePriority priority) {
    switch (priority) {
        case CachePriority::HOT: return "hot";
        case CachePriority::WARM: return "warm";
        case CachePriority::COLD: return "cold";
    }
    return "unknown";
}

const char* to_string(CleanupStrategy strategy) {
    switch (strategy) {
        case CleanupStrategy::CONSERVATIVE: return "conservative";
        case CleanupStrategy::MODERATE: return "moderate";
        case CleanupStrategy::AGGRESSIVE: return "aggressive";
    }
    return "unknown";
}

void TieredCacheConfig::validate() const {
    if (l1_capacity == 0 || l2_capacity == 0 || l3_capacity == 0) {
        throw core::ConfigurationError(
            "Tier capacities must be greater than 0 (l1=" + std::to_string(l1_capacity) +
            ", l2=" + std::to_string(l2_capacity) + ", l3=" + std::to_string(l3_capacity) + ")");
    }
    if (promotion_threshold == 0) {
        throw core::ConfigurationError("Promotion threshold must be greater than 0");
    }
    if (promotion_window.count() <= 0) {
        throw core::ConfigurationError("Promotion window must be positive");
    }
    if (demotion_threshold.count() <= 0) {
        throw core::ConfigurationError("Demotion threshold must be positive");
    }
    if (access_retention.count() <= 0) {
        throw core::ConfigurationError("Access retention must be positive");
    }
    if (access_retention < promotion_window || access_retention < priority_window) {
        throw core::ConfigurationError(
            "Access retention must cover the promotion and priority windows");
    }
    if (priority_window.count() <= 0) {
        throw core::ConfigurationError("Priority window must be positive");
    }
    if (warm_access_threshold > hot_access_threshold) {
        throw core::ConfigurationError("Warm access threshold must not exceed hot access threshold");
    }
    if (!(frequency_weight > 0.0)) {
        throw core::ConfigurationError("Frequency weight must be positive");
    }
}

void WeakRefConfig::validate() const {
    if (max_refs == 0) {
        throw core::ConfigurationError("Maximum weak reference count must be greater than 0");
    }
}

void MonitoringConfig::validate() const {
    if (critical_threshold == 0) {
        throw core::ConfigurationError("Critical threshold must be greater than 0");
    }
    if (warning_threshold > critical_threshold) {
        throw core::ConfigurationError(
            "Warning threshold (" + std::to_string(warning_threshold) +
            ") must not exceed critical threshold (" + std::to_string(critical_threshold) + ")");
    }
    if (enabled && interval.count() <= 0) {
        throw core::ConfigurationError("Monitor interval must be positive");
    }
    if (leak_detection) {
        if (!(leak_growth_factor > 1.0)) {
            throw core::ConfigurationError("Leak growth factor must be greater than 1");
        }
        if (leak_consecutive_samples == 0) {
            throw core::ConfigurationError("Leak sample count must be greater than 0");
        }
    }
}

void CleanupConfig::validate() const {
    if (auto_cleanup && interval.count() <= 0) {
        throw core::ConfigurationError("Cleanup interval must be positive");
    }
}

void UnifiedManagerConfig::validate() const {
    tiered_cache.validate();
    monitoring.validate();
    weak_ref.validate();
    cleanup.validate();
}

} // namespace cache
} // namespace tiercache
