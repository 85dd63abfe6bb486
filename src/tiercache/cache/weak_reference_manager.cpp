#include "tiercache/cache/weak_reference_manager.h"
#include "tiercache/common/logger.h"
#include "tiercache/core/error.h"

namespace tiercache {
namespace cache {

namespace {

const WeakRefConfig& validated(const WeakRefConfig& config) {
    config.validate();
    return config;
}

} // namespace

WeakReferenceManager::WeakReferenceManager(const WeakRefConfig& config)
    : config_(validated(config)) {}

void WeakReferenceManager::create_ref(const std::string& key, const core::Value& target,
                                      std::optional<WeakRefMetadata> metadata) {
    if (!target.is_reference()) {
        throw core::InvalidArgumentError(
            std::string("Weak reference target must be an array or object, got ") +
            core::to_string(target.type()));
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (entries_.size() > config_.sweep_threshold) {
        sweep_locked();
    }

    remove_locked(key);

    if (entries_.size() >= config_.max_refs) {
        sweep_locked();
    }
    while (entries_.size() >= config_.max_refs) {
        TIERCACHE_DEBUG("Weak reference table full, dropping '{}'", entries_.front().key);
        index_.erase(entries_.front().key);
        entries_.pop_front();
    }

    entries_.push_back(Entry{key, core::WeakValue(target), std::move(metadata)});
    index_[key] = std::prev(entries_.end());
}

std::optional<core::Value> WeakReferenceManager::get_ref(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
        return std::nullopt;
    }

    auto target = it->second->ref.lock();
    if (!target) {
        entries_.erase(it->second);
        index_.erase(it);
        return std::nullopt;
    }
    return target;
}

bool WeakReferenceManager::remove_ref(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return remove_locked(key);
}

WeakRefStats WeakReferenceManager::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    WeakRefStats stats;
    for (const auto& entry : entries_) {
        if (entry.ref.expired()) {
            continue;
        }
        ++stats.count;
        if (entry.metadata) {
            stats.total_size += entry.metadata->size;
        }
    }
    return stats;
}

size_t WeakReferenceManager::sweep() {
    std::lock_guard<std::mutex> lock(mutex_);
    return sweep_locked();
}

void WeakReferenceManager::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    index_.clear();
}

size_t WeakReferenceManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t WeakReferenceManager::sweep_locked() {
    size_t dropped = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->ref.expired()) {
            index_.erase(it->key);
            it = entries_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    if (dropped > 0) {
        TIERCACHE_DEBUG("Swept {} dead weak references", dropped);
    }
    return dropped;
}

bool WeakReferenceManager::remove_locked(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return false;
    }
    entries_.erase(it->second);
    index_.erase(it);
    return true;
}

} // namespace cache
} // namespace tiercache
