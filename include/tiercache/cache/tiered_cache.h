#pragma once

#include "tiercache/cache/access_pattern_tracker.h"
#include "tiercache/cache/cache_tier.h"
#include "tiercache/cache/cache_types.h"
#include "tiercache/core/clock.h"
#include "tiercache/core/value.h"
#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tiercache {
namespace cache {

/**
 * @brief Three-level cache with L1 (hot), L2 (warm) and L3 (cold) tiers
 *
 * Every key lives in at most one tier. Lookups probe L1, then L2, then L3.
 *
 * Features:
 * - Insert into the tier matching the item priority (explicit or inferred
 *   from recent access frequency)
 * - Graceful demotion: a victim evicted from a full tier sinks one level;
 *   only a victim evicted from L3 is discarded
 * - Promotion of frequently read items one tier up on a hit
 * - Idle demotion and TTL expiry sweeps via optimize()
 */
class TieredCache {
public:
    /**
     * @brief Construct a new Tiered Cache
     * @param config Capacities, thresholds and windows
     * @param clock Time source, the process steady clock when null
     * @throws core::ConfigurationError if the configuration is rejected
     */
    explicit TieredCache(const TieredCacheConfig& config = TieredCacheConfig{},
                         std::shared_ptr<const core::Clock> clock = nullptr);

    ~TieredCache() = default;

    // Non-copyable, non-movable
    TieredCache(const TieredCache&) = delete;
    TieredCache& operator=(const TieredCache&) = delete;
    TieredCache(TieredCache&&) = delete;
    TieredCache& operator=(TieredCache&&) = delete;

    /**
     * @brief Look up a value
     * @return The value, or std::nullopt on a miss or an expired item
     */
    std::optional<core::Value> get(const std::string& key);

    /**
     * @brief Insert or replace a value
     * @param options Priority, TTL, tags and size hints
     */
    void set(const std::string& key, core::Value value, const SetOptions& options = SetOptions{});

    /**
     * @brief Remove a key from whichever tier holds it
     * @return true if the key was resident
     */
    bool remove(const std::string& key);

    /**
     * @brief Drop every tier, the access history and all counters
     */
    void clear();

    TieredCacheStats get_stats() const;

    MemoryUsage get_memory_usage() const;

    /**
     * @brief Expiry sweep followed by the idle demotion sweep
     */
    void optimize();

    /**
     * @brief Remove every item carrying `tag`
     * @return Number of items removed
     */
    size_t invalidate_tag(const std::string& tag);

    /**
     * @brief L3 keys, oldest insertion first
     */
    std::vector<std::string> l3_keys() const;

    /**
     * @brief Tier currently holding `key`
     */
    std::optional<CachePriority> tier_of(const std::string& key) const;

    /**
     * @brief Copy of an item's bookkeeping; does not count as an access
     */
    std::optional<CacheItem> get_metadata(const std::string& key) const;

    /**
     * @brief Total number of resident items
     */
    size_t size() const;

    /**
     * @brief Human-readable statistics block
     */
    std::string report() const;

    const TieredCacheConfig& config() const { return config_; }

private:
    static constexpr size_t kTierCount = 3;

    TieredCacheConfig config_;
    std::shared_ptr<const core::Clock> clock_;

    mutable std::mutex mutex_;
    std::array<std::unique_ptr<CacheTier>, kTierCount> tiers_;
    AccessPatternTracker tracker_;

    // Statistics
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> promotions_{0};
    std::atomic<uint64_t> demotions_{0};
    std::array<std::atomic<uint64_t>, kTierCount> tier_hits_{};

    /**
     * @brief Index of the tier holding `key`, or kTierCount if absent
     */
    size_t locate(const std::string& key) const;

    CachePriority infer_priority(const std::string& key, core::TimePoint now) const;

    /**
     * @brief Insert into tier `index`, cascading an eviction downwards first
     */
    void insert_into_tier(size_t index, CacheItem item, core::TimePoint now);

    void promote(const std::string& key, size_t from, core::TimePoint now);

    void remove_expired(core::TimePoint now);

    void demote_idle(core::TimePoint now);

    size_t total_size() const;
};

} // namespace cache
} // namespace tiercache
