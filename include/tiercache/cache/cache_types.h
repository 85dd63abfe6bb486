#pragma once

#include "tiercache/core/clock.h"
#include "tiercache/core/value.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace tiercache {
namespace cache {

/**
 * @brief Cache priority, which is also the tier an item lives in
 */
enum class CachePriority {
    HOT,   // L1
    WARM,  // L2
    COLD   // L3
};

const char* to_string(CachePriority priority);

/**
 * @brief Aggressiveness of a cleanup pass
 */
enum class CleanupStrategy {
    CONSERVATIVE,  // expiry + demotion sweep only
    MODERATE,      // optimize, then drop half of the cold tier
    AGGRESSIVE     // drop every tier and every weak reference
};

const char* to_string(CleanupStrategy strategy);

/**
 * @brief Configuration for the three-tier cache
 */
struct TieredCacheConfig {
    // Tier capacities, in items
    size_t l1_capacity = 15;
    size_t l2_capacity = 30;
    size_t l3_capacity = 60;

    // Promotion: recent accesses inside promotion_window needed to move up one tier
    uint32_t promotion_threshold = 2;
    std::chrono::milliseconds promotion_window{10000};

    // Demotion: idle time before L1 -> L2 (L2 -> L3 uses twice this)
    std::chrono::milliseconds demotion_threshold{30000};

    // Access history retention per key
    std::chrono::milliseconds access_retention{120000};

    // Priority inference for sets without an explicit priority
    std::chrono::milliseconds priority_window{30000};
    uint32_t hot_access_threshold = 5;
    uint32_t warm_access_threshold = 2;

    // Resident item count above which set() sweeps expired items first
    size_t expiry_sweep_threshold = 100;

    // Scale of the frequency term in the eviction score
    double frequency_weight = 1000000.0;

    /**
     * @throws core::ConfigurationError on a rejected setting
     */
    void validate() const;

    size_t total_capacity() const { return l1_capacity + l2_capacity + l3_capacity; }
};

/**
 * @brief Configuration for weak reference tracking
 */
struct WeakRefConfig {
    bool enabled = true;
    size_t max_refs = 500;
    size_t sweep_threshold = 100;   // sweep dead refs before insert above this count

    void validate() const;
};

/**
 * @brief Configuration for memory monitoring
 */
struct MonitoringConfig {
    bool enabled = true;
    std::chrono::milliseconds interval{60000};
    size_t warning_threshold = 10 * 1024 * 1024;    // 10MB
    size_t critical_threshold = 20 * 1024 * 1024;   // 20MB

    // Reschedule the monitor by pressure (30s / 60s / 120s)
    bool adaptive_interval = false;

    // Leak detection on consecutive growth
    bool leak_detection = true;
    double leak_growth_factor = 1.3;
    uint32_t leak_consecutive_samples = 5;
    std::chrono::milliseconds leak_min_duration{600000};

    void validate() const;
};

/**
 * @brief Configuration for periodic cleanup
 */
struct CleanupConfig {
    CleanupStrategy strategy = CleanupStrategy::CONSERVATIVE;
    bool auto_cleanup = true;
    std::chrono::milliseconds interval{120000};

    void validate() const;
};

/**
 * @brief Configuration for the unified manager
 */
struct UnifiedManagerConfig {
    TieredCacheConfig tiered_cache;
    MonitoringConfig monitoring;
    WeakRefConfig weak_ref;
    CleanupConfig cleanup;

    void validate() const;
};

/**
 * @brief One cached value and its bookkeeping
 */
struct CacheItem {
    std::string key;
    core::Value value;
    size_t size = 0;
    CachePriority priority = CachePriority::COLD;
    uint64_t access_count = 0;
    core::TimePoint last_access_time;
    core::TimePoint create_time;
    std::optional<std::chrono::milliseconds> ttl;
    std::set<std::string> tags;

    bool is_expired(core::TimePoint now) const {
        return ttl && ttl->count() > 0 && (now - create_time) > *ttl;
    }

    void record_access(core::TimePoint now) {
        ++access_count;
        last_access_time = now;
    }
};

/**
 * @brief Optional hints for a set
 */
struct SetOptions {
    std::optional<CachePriority> priority;
    std::optional<std::chrono::milliseconds> ttl;
    std::set<std::string> tags;
    std::optional<size_t> size;
    bool weak = false;   // honored by UnifiedManager only
};

/**
 * @brief Snapshot of tiered cache counters
 */
struct TieredCacheStats {
    double hit_rate = 0.0;   // hits / (hits + misses), 0 without accesses
    size_t l1_size = 0;
    size_t l2_size = 0;
    size_t l3_size = 0;
    size_t total_size = 0;
    uint64_t eviction_count = 0;   // items discarded from L3
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t promotions = 0;
    uint64_t demotions = 0;
};

/**
 * @brief Estimated bytes held per tier
 */
struct MemoryUsage {
    size_t l1 = 0;
    size_t l2 = 0;
    size_t l3 = 0;
    size_t total = 0;
};

/**
 * @brief Snapshot of weak reference bookkeeping
 */
struct WeakRefStats {
    size_t count = 0;
    size_t total_size = 0;
};

} // namespace cache
} // namespace tiercache
