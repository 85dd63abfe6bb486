/**
 * @file tiered_cache.cpp
 * @brief Three-tier (hot/warm/cold) cache implementation
 *
 * This file implements the multi-level cache used by the unified manager:
 * - L1: hot items, smallest capacity, probed first
 * - L2: warm items
 * - L3: cold items, largest capacity, the only tier that discards
 *
 * Key Features:
 * - Hybrid frequency/recency eviction score
 * - Eviction cascades one tier down instead of dropping data
 * - Sliding-window promotion on hits served from L2 or L3
 * - Idle demotion and TTL expiry sweeps
 * - Tag-based bulk invalidation
 *
 * Tier Exclusivity:
 * - A key lives in at most one tier; every move is take-then-insert under
 *   the cache mutex
 * - set() on a resident key replaces the old item wherever it lives
 *
 * Performance Characteristics:
 * - Lookup: O(1) average per tier
 * - Eviction candidate selection: O(tier size)
 * - optimize(): O(total resident items)
 */

#include "tiercache/cache/tiered_cache.h"
#include "tiercache/common/logger.h"
#include <iomanip>
#include <sstream>

namespace tiercache {
namespace cache {

namespace {

CachePriority priority_for_tier(size_t index) {
    switch (index) {
        case 0: return CachePriority::HOT;
        case 1: return CachePriority::WARM;
        default: return CachePriority::COLD;
    }
}

size_t tier_for_priority(CachePriority priority) {
    switch (priority) {
        case CachePriority::HOT: return 0;
        case CachePriority::WARM: return 1;
        case CachePriority::COLD: return 2;
    }
    return 2;
}

const TieredCacheConfig& validated(const TieredCacheConfig& config) {
    config.validate();
    return config;
}

} // namespace

/**
 * @brief Constructs a TieredCache with the specified configuration
 *
 * @param config Capacities, promotion/demotion thresholds and windows
 * @param clock Time source; when null the shared steady clock is used
 *
 * The configuration is validated before any tier is created.
 *
 * @throws core::ConfigurationError if a capacity is 0, the promotion
 *         threshold is 0, or a window or threshold is not positive
 */
TieredCache::TieredCache(const TieredCacheConfig& config, std::shared_ptr<const core::Clock> clock)
    : config_(validated(config)),
      clock_(clock ? std::move(clock) : core::default_clock()),
      tracker_(config_.access_retention) {
    tiers_[0] = std::make_unique<CacheTier>("L1", config_.l1_capacity);
    tiers_[1] = std::make_unique<CacheTier>("L2", config_.l2_capacity);
    tiers_[2] = std::make_unique<CacheTier>("L3", config_.l3_capacity);
    for (auto& counter : tier_hits_) {
        counter.store(0, std::memory_order_relaxed);
    }
}

/**
 * @brief Retrieves a value, probing L1, L2 and L3 in that order
 *
 * @param key The key to look up
 * @return The cached value, or std::nullopt when absent or expired
 *
 * On a hit:
 * - The item's access count and last access time are updated
 * - The access is recorded in the access pattern tracker
 * - A hit served from L2 or L3 moves the item up exactly one tier when
 *   it was accessed at least promotion_threshold times within
 *   promotion_window
 *
 * An item whose TTL has elapsed is removed on the spot and the lookup
 * counts as a miss.
 *
 * Thread Safety: Serialized by the cache mutex.
 */
std::optional<core::Value> TieredCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_->now();

    const size_t index = locate(key);
    if (index == kTierCount) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    CacheItem* item = tiers_[index]->find(key);
    if (item->is_expired(now)) {
        tiers_[index]->erase(key);
        tracker_.remove(key);
        misses_.fetch_add(1, std::memory_order_relaxed);
        TIERCACHE_DEBUG("Expired item '{}' removed from {} on lookup", key, tiers_[index]->name());
        return std::nullopt;
    }

    hits_.fetch_add(1, std::memory_order_relaxed);
    tier_hits_[index].fetch_add(1, std::memory_order_relaxed);
    item->record_access(now);
    tracker_.record_access(key, now);

    core::Value value = item->value;

    if (index > 0 &&
        tracker_.recent_access_count(key, config_.promotion_window, now) >= config_.promotion_threshold) {
        promote(key, index, now);
    }

    return value;
}

/**
 * @brief Stores a value in the tier matching its priority
 *
 * @param key The key to store under
 * @param value The value to cache
 * @param options Priority, TTL, tags and size hints
 *
 * Steps:
 * 1. Sweep expired items when more than expiry_sweep_threshold are resident
 * 2. Drop any previous item under the same key, in any tier
 * 3. Resolve the priority: explicit option, else inferred from the number
 *    of accesses within priority_window (hot / warm / cold)
 * 4. Insert into the matching tier, cascading an eviction if it is full
 * 5. Record the write as an access
 *
 * The size defaults to Value::estimated_size() when no hint is given.
 *
 * Thread Safety: Serialized by the cache mutex.
 */
void TieredCache::set(const std::string& key, core::Value value, const SetOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_->now();

    if (total_size() > config_.expiry_sweep_threshold) {
        remove_expired(now);
    }

    const size_t existing = locate(key);
    if (existing != kTierCount) {
        tiers_[existing]->erase(key);
    }

    CacheItem item;
    item.key = key;
    item.size = options.size ? *options.size : value.estimated_size();
    item.value = std::move(value);
    item.priority = options.priority ? *options.priority : infer_priority(key, now);
    item.access_count = 1;
    item.last_access_time = now;
    item.create_time = now;
    item.ttl = options.ttl;
    item.tags = options.tags;

    const size_t index = tier_for_priority(item.priority);
    insert_into_tier(index, std::move(item), now);
    tracker_.record_access(key, now);
}

/**
 * @brief Removes a key from whichever tier holds it
 *
 * @param key The key to remove
 * @return true if the key was resident
 *
 * The key's access history is dropped together with the item.
 */
bool TieredCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t index = locate(key);
    if (index == kTierCount) {
        return false;
    }
    tiers_[index]->erase(key);
    tracker_.remove(key);
    return true;
}

void TieredCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& tier : tiers_) {
        tier->clear();
    }
    tracker_.clear();
    hits_.store(0, std::memory_order_relaxed);
    misses_.store(0, std::memory_order_relaxed);
    evictions_.store(0, std::memory_order_relaxed);
    promotions_.store(0, std::memory_order_relaxed);
    demotions_.store(0, std::memory_order_relaxed);
    for (auto& counter : tier_hits_) {
        counter.store(0, std::memory_order_relaxed);
    }
}

TieredCacheStats TieredCache::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    TieredCacheStats stats;
    stats.hits = hits_.load(std::memory_order_relaxed);
    stats.misses = misses_.load(std::memory_order_relaxed);
    const uint64_t total_access = stats.hits + stats.misses;
    stats.hit_rate = total_access > 0 ? static_cast<double>(stats.hits) / total_access : 0.0;
    stats.l1_size = tiers_[0]->size();
    stats.l2_size = tiers_[1]->size();
    stats.l3_size = tiers_[2]->size();
    stats.total_size = stats.l1_size + stats.l2_size + stats.l3_size;
    stats.eviction_count = evictions_.load(std::memory_order_relaxed);
    stats.promotions = promotions_.load(std::memory_order_relaxed);
    stats.demotions = demotions_.load(std::memory_order_relaxed);
    return stats;
}

MemoryUsage TieredCache::get_memory_usage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    MemoryUsage usage;
    usage.l1 = tiers_[0]->memory_usage();
    usage.l2 = tiers_[1]->memory_usage();
    usage.l3 = tiers_[2]->memory_usage();
    usage.total = usage.l1 + usage.l2 + usage.l3;
    return usage;
}

/**
 * @brief Runs the expiry sweep, then the idle demotion sweep
 *
 * - Items whose TTL elapsed are removed from every tier
 * - L1 items idle longer than demotion_threshold move to L2
 * - L2 items idle longer than twice demotion_threshold move to L3, which
 *   includes items that were demoted from L1 in the same pass
 */
void TieredCache::optimize() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_->now();
    remove_expired(now);
    demote_idle(now);
}

size_t TieredCache::invalidate_tag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto& tier : tiers_) {
        for (const auto& key : tier->tagged_keys(tag)) {
            tier->erase(key);
            tracker_.remove(key);
            ++removed;
        }
    }
    if (removed > 0) {
        TIERCACHE_DEBUG("Invalidated {} items tagged '{}'", removed, tag);
    }
    return removed;
}

std::vector<std::string> TieredCache::l3_keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tiers_[2]->keys();
}

std::optional<CachePriority> TieredCache::tier_of(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t index = locate(key);
    if (index == kTierCount) {
        return std::nullopt;
    }
    return priority_for_tier(index);
}

std::optional<CacheItem> TieredCache::get_metadata(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t index = locate(key);
    if (index == kTierCount) {
        return std::nullopt;
    }
    return *tiers_[index]->find(key);
}

size_t TieredCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_size();
}

/**
 * @brief Renders counters and per-tier occupancy as text
 */
std::string TieredCache::report() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;
    oss << "Tiered Cache Stats:\n";
    oss << "==========================================\n";

    const uint64_t hits = hits_.load(std::memory_order_relaxed);
    const uint64_t misses = misses_.load(std::memory_order_relaxed);
    const uint64_t total_requests = hits + misses;

    oss << "Overall Statistics:\n";
    oss << "  Total requests: " << total_requests << "\n";
    oss << "  Total hits: " << hits << "\n";
    oss << "  Total misses: " << misses << "\n";
    if (total_requests > 0) {
        double hit_ratio = static_cast<double>(hits) / total_requests * 100.0;
        oss << "  Overall hit ratio: " << std::fixed << std::setprecision(2) << hit_ratio << "%\n";
    }
    oss << "  Promotions: " << promotions_.load(std::memory_order_relaxed) << "\n";
    oss << "  Demotions: " << demotions_.load(std::memory_order_relaxed) << "\n";
    oss << "  Evictions: " << evictions_.load(std::memory_order_relaxed) << "\n";

    static const char* const kLabels[kTierCount] = {"hot", "warm", "cold"};
    for (size_t i = 0; i < kTierCount; ++i) {
        const auto& tier = *tiers_[i];
        oss << "\n" << tier.name() << " Cache (" << kLabels[i] << "):\n";
        oss << "  Size: " << tier.size() << "/" << tier.capacity() << "\n";
        oss << "  Memory: " << tier.memory_usage() << " bytes\n";
        oss << "  Hits: " << tier_hits_[i].load(std::memory_order_relaxed) << "\n";
    }

    oss << "\nTracked keys: " << tracker_.tracked_keys() << "\n";
    return oss.str();
}

size_t TieredCache::locate(const std::string& key) const {
    for (size_t i = 0; i < kTierCount; ++i) {
        if (tiers_[i]->contains(key)) {
            return i;
        }
    }
    return kTierCount;
}

CachePriority TieredCache::infer_priority(const std::string& key, core::TimePoint now) const {
    const size_t recent = tracker_.recent_access_count(key, config_.priority_window, now);
    if (recent >= config_.hot_access_threshold) {
        return CachePriority::HOT;
    }
    if (recent >= config_.warm_access_threshold) {
        return CachePriority::WARM;
    }
    return CachePriority::COLD;
}

/**
 * @brief Inserts an item into a tier, making room first if needed
 *
 * @param index Destination tier (0 = L1, 1 = L2, 2 = L3)
 * @param item The item to insert; its priority is set to match the tier
 * @param now Current time for eviction scoring
 *
 * When the destination is full, the item with the lowest eviction score
 * is taken out. A victim from L1 or L2 is re-inserted one tier down (which
 * may cascade further); a victim from L3 is discarded and counted as an
 * eviction.
 */
void TieredCache::insert_into_tier(size_t index, CacheItem item, core::TimePoint now) {
    CacheTier& tier = *tiers_[index];

    if (tier.is_full()) {
        auto victim_key = tier.find_eviction_candidate(now, config_.frequency_weight);
        if (victim_key) {
            auto victim = tier.take(*victim_key);
            if (index + 1 < kTierCount) {
                demotions_.fetch_add(1, std::memory_order_relaxed);
                TIERCACHE_DEBUG("Evicted '{}' from {}, demoting to {}",
                                *victim_key, tier.name(), tiers_[index + 1]->name());
                insert_into_tier(index + 1, std::move(*victim), now);
            } else {
                tracker_.remove(*victim_key);
                evictions_.fetch_add(1, std::memory_order_relaxed);
                TIERCACHE_DEBUG("Discarded '{}' from {}", *victim_key, tier.name());
            }
        }
    }

    item.priority = priority_for_tier(index);
    tier.insert(std::move(item));
}

void TieredCache::promote(const std::string& key, size_t from, core::TimePoint now) {
    auto item = tiers_[from]->take(key);
    if (!item) {
        return;
    }
    promotions_.fetch_add(1, std::memory_order_relaxed);
    TIERCACHE_DEBUG("Promoting '{}' from {} to {}", key, tiers_[from]->name(), tiers_[from - 1]->name());
    insert_into_tier(from - 1, std::move(*item), now);
}

void TieredCache::remove_expired(core::TimePoint now) {
    for (auto& tier : tiers_) {
        for (const auto& key : tier->expired_keys(now)) {
            tier->erase(key);
            tracker_.remove(key);
        }
    }
}

void TieredCache::demote_idle(core::TimePoint now) {
    // L1 -> L2
    for (const auto& key : tiers_[0]->idle_keys(now, config_.demotion_threshold)) {
        auto item = tiers_[0]->take(key);
        if (item) {
            demotions_.fetch_add(1, std::memory_order_relaxed);
            insert_into_tier(1, std::move(*item), now);
        }
    }

    // L2 -> L3
    for (const auto& key : tiers_[1]->idle_keys(now, config_.demotion_threshold * 2)) {
        auto item = tiers_[1]->take(key);
        if (item) {
            demotions_.fetch_add(1, std::memory_order_relaxed);
            insert_into_tier(2, std::move(*item), now);
        }
    }
}

size_t TieredCache::total_size() const {
    size_t total = 0;
    for (const auto& tier : tiers_) {
        total += tier->size();
    }
    return total;
}

} // namespace cache
} // namespace tiercache
