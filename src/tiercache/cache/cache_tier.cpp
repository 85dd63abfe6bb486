#include "tiercache/cache/cache_tier.h"
#include "tiercache/core/error.h"
#include <algorithm>

namespace tiercache {
namespace cache {

namespace {

double elapsed_ms(core::TimePoint from, core::TimePoint to) {
    return std::chrono::duration<double, std::milli>(to - from).count();
}

} // namespace

double eviction_score(const CacheItem& item, core::TimePoint now, double frequency_weight) {
    const double age = std::max(1.0, elapsed_ms(item.create_time, now));
    const double idle = elapsed_ms(item.last_access_time, now);
    const double frequency = static_cast<double>(item.access_count) / age;
    return frequency * frequency_weight - idle;
}

CacheTier::CacheTier(std::string name, size_t capacity)
    : name_(std::move(name)), capacity_(capacity) {
    if (capacity == 0) {
        throw core::InvalidArgumentError("Tier " + name_ + " capacity must be greater than 0");
    }
}

CacheItem* CacheTier::find(const std::string& key) {
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : &*it->second;
}

const CacheItem* CacheTier::find(const std::string& key) const {
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : &*it->second;
}

bool CacheTier::contains(const std::string& key) const {
    return index_.count(key) > 0;
}

void CacheTier::insert(CacheItem item) {
    if (is_full()) {
        throw core::InvalidArgumentError("Tier " + name_ + " is full");
    }
    if (contains(item.key)) {
        throw core::InvalidArgumentError("Key '" + item.key + "' already resident in " + name_);
    }
    std::string key = item.key;
    items_.push_back(std::move(item));
    index_.emplace(std::move(key), std::prev(items_.end()));
}

std::optional<CacheItem> CacheTier::take(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return std::nullopt;
    }
    CacheItem item = std::move(*it->second);
    items_.erase(it->second);
    index_.erase(it);
    return item;
}

bool CacheTier::erase(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return false;
    }
    items_.erase(it->second);
    index_.erase(it);
    return true;
}

std::optional<std::string> CacheTier::find_eviction_candidate(core::TimePoint now,
                                                              double frequency_weight) const {
    const CacheItem* victim = nullptr;
    double lowest = 0.0;
    for (const auto& item : items_) {
        const double score = eviction_score(item, now, frequency_weight);
        // Strict comparison keeps the oldest item on ties
        if (victim == nullptr || score < lowest) {
            victim = &item;
            lowest = score;
        }
    }
    if (victim == nullptr) {
        return std::nullopt;
    }
    return victim->key;
}

std::vector<std::string> CacheTier::keys() const {
    std::vector<std::string> result;
    result.reserve(items_.size());
    for (const auto& item : items_) {
        result.push_back(item.key);
    }
    return result;
}

std::vector<std::string> CacheTier::expired_keys(core::TimePoint now) const {
    std::vector<std::string> result;
    for (const auto& item : items_) {
        if (item.is_expired(now)) {
            result.push_back(item.key);
        }
    }
    return result;
}

std::vector<std::string> CacheTier::idle_keys(core::TimePoint now,
                                              std::chrono::milliseconds idle) const {
    std::vector<std::string> result;
    for (const auto& item : items_) {
        if (now - item.last_access_time > idle) {
            result.push_back(item.key);
        }
    }
    return result;
}

std::vector<std::string> CacheTier::tagged_keys(const std::string& tag) const {
    std::vector<std::string> result;
    for (const auto& item : items_) {
        if (item.tags.count(tag) > 0) {
            result.push_back(item.key);
        }
    }
    return result;
}

size_t CacheTier::memory_usage() const {
    size_t total = 0;
    for (const auto& item : items_) {
        total += item.size;
    }
    return total;
}

void CacheTier::clear() {
    items_.clear();
    index_.clear();
}

} // namespace cache
} // namespace tiercache
