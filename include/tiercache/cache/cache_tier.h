#pragma once

#include "tiercache/cache/cache_types.h"
#include "tiercache/core/clock.h"
#include <list>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tiercache {
namespace cache {

/**
 * @brief One bounded level of the tiered cache
 *
 * Items are kept in insertion order (list) with an index for O(1) lookup
 * (map of list iterators). The tier never evicts on its own: TieredCache
 * asks for an eviction candidate and decides where the item goes next.
 *
 * Not synchronized; the owning TieredCache serializes access.
 */
class CacheTier {
public:
    /**
     * @param name Label used in logs and reports ("L1", "L2", "L3")
     * @param capacity Maximum number of items
     * @throws core::InvalidArgumentError if capacity is 0
     */
    CacheTier(std::string name, size_t capacity);

    CacheTier(const CacheTier&) = delete;
    CacheTier& operator=(const CacheTier&) = delete;

    /**
     * @return Pointer to the resident item, nullptr if absent
     */
    CacheItem* find(const std::string& key);
    const CacheItem* find(const std::string& key) const;

    bool contains(const std::string& key) const;

    /**
     * @brief Append an item at the newest position
     *
     * The caller makes room first; inserting into a full tier or inserting
     * a key that is already resident throws core::InvalidArgumentError.
     */
    void insert(CacheItem item);

    /**
     * @brief Remove an item and hand it back
     */
    std::optional<CacheItem> take(const std::string& key);

    bool erase(const std::string& key);

    /**
     * @brief Key with the lowest eviction score
     *
     * score = (access_count / max(1, age_ms)) * frequency_weight - idle_ms.
     * Ties go to the oldest insertion.
     *
     * @return std::nullopt if the tier is empty
     */
    std::optional<std::string> find_eviction_candidate(core::TimePoint now,
                                                       double frequency_weight) const;

    /**
     * @brief Keys in insertion order, oldest first
     */
    std::vector<std::string> keys() const;

    /**
     * @brief Keys whose TTL has elapsed at `now`
     */
    std::vector<std::string> expired_keys(core::TimePoint now) const;

    /**
     * @brief Keys not accessed for longer than `idle`
     */
    std::vector<std::string> idle_keys(core::TimePoint now, std::chrono::milliseconds idle) const;

    /**
     * @brief Keys carrying `tag`
     */
    std::vector<std::string> tagged_keys(const std::string& tag) const;

    /**
     * @brief Sum of the resident items' size estimates
     */
    size_t memory_usage() const;

    size_t size() const { return items_.size(); }
    size_t capacity() const { return capacity_; }
    bool is_full() const { return items_.size() >= capacity_; }
    bool empty() const { return items_.empty(); }
    const std::string& name() const { return name_; }

    void clear();

private:
    using ItemList = std::list<CacheItem>;
    using ItemIterator = ItemList::iterator;
    using ItemMap = std::unordered_map<std::string, ItemIterator>;

    std::string name_;
    size_t capacity_;
    ItemList items_;
    ItemMap index_;
};

/**
 * @brief Eviction score of one item, lower is evicted first
 */
double eviction_score(const CacheItem& item, core::TimePoint now, double frequency_weight);

} // namespace cache
} // namespace tiercache
