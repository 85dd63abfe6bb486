#pragma once

#include "tiercache/cache/cache_types.h"
#include "tiercache/core/value.h"
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace tiercache {
namespace cache {

/**
 * @brief Bookkeeping attached to a weak reference
 */
struct WeakRefMetadata {
    size_t size = 0;
    std::string type;
};

/**
 * @brief Table of key -> weak handle associations
 *
 * A weak reference never keeps its target alive. Once every strong copy
 * of the target is gone, get_ref() reports it as absent and drops the stale
 * entry; sweep() drops all stale entries at once.
 */
class WeakReferenceManager {
public:
    /**
     * @throws core::ConfigurationError if the configuration is rejected
     */
    explicit WeakReferenceManager(const WeakRefConfig& config = WeakRefConfig{});

    WeakReferenceManager(const WeakReferenceManager&) = delete;
    WeakReferenceManager& operator=(const WeakReferenceManager&) = delete;

    /**
     * @brief Track `target` under `key`, replacing any previous reference
     *
     * Sweeps dead references first when more than sweep_threshold are held,
     * and drops the oldest reference when max_refs would be exceeded.
     *
     * @throws core::InvalidArgumentError if target is not an array or object
     */
    void create_ref(const std::string& key, const core::Value& target,
                    std::optional<WeakRefMetadata> metadata = std::nullopt);

    /**
     * @return The target while it is alive, std::nullopt otherwise
     */
    std::optional<core::Value> get_ref(const std::string& key);

    bool remove_ref(const std::string& key);

    /**
     * @brief Live references and the summed size of their metadata
     */
    WeakRefStats get_stats() const;

    /**
     * @brief Drop every reference whose target is gone
     * @return Number of entries dropped
     */
    size_t sweep();

    void clear();

    /**
     * @brief Entries held, live or not
     */
    size_t size() const;

private:
    struct Entry {
        std::string key;
        core::WeakValue ref;
        std::optional<WeakRefMetadata> metadata;
    };

    using EntryList = std::list<Entry>;

    size_t sweep_locked();
    bool remove_locked(const std::string& key);

    WeakRefConfig config_;
    mutable std::mutex mutex_;
    EntryList entries_;   // insertion order, oldest first
    std::unordered_map<std::string, EntryList::iterator> index_;
};

} // namespace cache
} // namespace tiercache
