#pragma once

#include "tiercache/cache/cache_types.h"
#include "tiercache/cache/memory_monitor.h"
#include "tiercache/cache/memory_sampler.h"
#include "tiercache/cache/tiered_cache.h"
#include "tiercache/cache/weak_reference_manager.h"
#include "tiercache/common/periodic_timer.h"
#include "tiercache/core/clock.h"
#include "tiercache/core/value.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace tiercache {
namespace cache {

/**
 * @brief Snapshot of the manager's memory and cache state
 */
struct MemoryStats {
    size_t total_memory = 0;   // last sampled memory metric, bytes
    size_t cache_memory = 0;   // tier bytes, all tiers
    size_t l1_memory = 0;
    size_t l2_memory = 0;
    size_t l3_memory = 0;
    size_t l1_size = 0;
    size_t l2_size = 0;
    size_t l3_size = 0;
    size_t weak_ref_count = 0;
    size_t weak_ref_memory = 0;
    double cache_hit_rate = 0.0;
    uint64_t eviction_count = 0;

    MemoryState memory_state = MemoryState::NORMAL;
    bool is_warning = false;
    bool is_critical = false;
    std::optional<std::chrono::system_clock::time_point> last_cleanup;
};

/**
 * @brief Tier counters, memory breakdown and weak reference stats together
 */
struct CacheInfo {
    TieredCacheStats cache;
    MemoryUsage memory;
    WeakRefStats weak_ref;
};

/**
 * @brief Front door of the cache engine
 *
 * Owns the tiered cache, the weak reference table, the memory monitor and
 * two periodic timers:
 * - memory monitor: samples memory, evaluates thresholds and escalates to
 *   a moderate (warning) or aggressive (critical) cleanup pass
 * - auto cleanup: unconditional optimize() every cleanup interval
 *
 * All public calls are serialized by one mutex. destroy() stops both timers
 * and empties all storage; timer callbacks that fire afterwards do nothing.
 */
class UnifiedManager {
public:
    /**
     * @param config Aggregated configuration
     * @param sampler Memory metric; the engine's own footprint when null
     * @param clock Time source, the process steady clock when null
     * @throws core::ConfigurationError if the configuration is rejected
     */
    explicit UnifiedManager(const UnifiedManagerConfig& config = UnifiedManagerConfig{},
                            std::shared_ptr<MemorySampler> sampler = nullptr,
                            std::shared_ptr<const core::Clock> clock = nullptr);

    /**
     * @brief Calls destroy()
     */
    ~UnifiedManager();

    UnifiedManager(const UnifiedManager&) = delete;
    UnifiedManager& operator=(const UnifiedManager&) = delete;
    UnifiedManager(UnifiedManager&&) = delete;
    UnifiedManager& operator=(UnifiedManager&&) = delete;

    /**
     * @brief Tiered lookup; weak entries are only reachable via get_weak_ref()
     */
    std::optional<core::Value> get(const std::string& key);

    /**
     * @brief Store a value
     *
     * With options.weak set, weak references enabled and an array or object
     * value, the value is tracked weakly instead of cached. A key is either
     * cached or weakly tracked, never both.
     */
    void set(const std::string& key, core::Value value, const SetOptions& options = SetOptions{});

    /**
     * @brief Remove a key from the cache and the weak table
     * @return true if either held it
     */
    bool remove(const std::string& key);

    void clear();

    /**
     * @brief Track `target` weakly; no-op when weak references are disabled
     * @throws core::InvalidArgumentError if target is not an array or object
     */
    void create_weak_ref(const std::string& key, const core::Value& target,
                         std::optional<WeakRefMetadata> metadata = std::nullopt);

    std::optional<core::Value> get_weak_ref(const std::string& key);

    /**
     * @brief Optimize the tiers, run a cleanup pass, refresh stats
     */
    void optimize();

    /**
     * @brief Remove every cached item carrying `tag`
     */
    size_t invalidate_tag(const std::string& tag);

    MemoryStats get_stats();

    CacheInfo get_cache_info() const;

    /**
     * @brief Run one memory monitor tick now
     * @return The state the sample put the monitor in
     */
    MemoryState check_memory();

    /**
     * @brief Stop both timers, clear all storage and zero the stats
     *
     * Idempotent.
     */
    void destroy();

    bool is_destroyed() const { return destroyed_.load(std::memory_order_acquire); }

    bool timers_running() const;

    const UnifiedManagerConfig& config() const { return config_; }

private:
    void run_monitor_tick_locked();
    void optimize_locked();
    void perform_cleanup_locked(CleanupStrategy requested, size_t usage);
    size_t sample_memory_locked();
    void refresh_stats_locked();

    UnifiedManagerConfig config_;
    std::shared_ptr<MemorySampler> sampler_;
    std::shared_ptr<const core::Clock> clock_;

    mutable std::mutex mutex_;
    std::unique_ptr<TieredCache> tiered_cache_;
    std::unique_ptr<WeakReferenceManager> weak_refs_;
    MemoryMonitor monitor_;
    MemoryStats stats_;
    std::optional<std::chrono::system_clock::time_point> last_cleanup_;

    std::atomic<bool> destroyed_{false};

    // Declared last: stopped and joined before the state above goes away
    common::PeriodicTimer monitor_timer_;
    common::PeriodicTimer cleanup_timer_;
};

} // namespace cache
} // namespace tiercache
