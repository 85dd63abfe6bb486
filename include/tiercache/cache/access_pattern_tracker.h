#pragma once

#include "tiercache/core/clock.h"
#include <chrono>
#include <cstddef>
#include <deque>
#include <string>
#include <unordered_map>
#include <vector>

namespace tiercache {
namespace cache {

/**
 * @brief Sliding-window access history per key
 *
 * Keeps the timestamps of recent accesses for each key and answers
 * "how many accesses in the last N milliseconds". Timestamps older than
 * the retention window are discarded whenever the key is recorded again.
 *
 * Not synchronized; the owning TieredCache serializes access.
 */
class AccessPatternTracker {
public:
    explicit AccessPatternTracker(
        std::chrono::milliseconds retention = std::chrono::milliseconds(120000));

    /**
     * @brief Append an access at `now` and prune history older than retention
     */
    void record_access(const std::string& key, core::TimePoint now);

    /**
     * @brief Accesses of `key` strictly newer than `now - window`
     * @return 0 for an unknown key
     */
    size_t recent_access_count(const std::string& key,
                               std::chrono::milliseconds window,
                               core::TimePoint now) const;

    /**
     * @brief Forget the history of a key
     * @return true if the key was tracked
     */
    bool remove(const std::string& key);

    void clear();

    size_t tracked_keys() const { return history_.size(); }

    std::chrono::milliseconds retention() const { return retention_; }

private:
    std::chrono::milliseconds retention_;
    std::unordered_map<std::string, std::deque<core::TimePoint>> history_;
};

} // namespace cache
} // namespace tiercache
