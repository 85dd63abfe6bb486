#include "tiercache/cache/access_pattern_tracker.h"
#include "tiercache/core/error.h"
#include <algorithm>

namespace tiercache {
namespace cache {

AccessPatternTracker::AccessPatternTracker(std::chrono::milliseconds retention)
    : retention_(retention) {
    if (retention.count() <= 0) {
        throw core::InvalidArgumentError("Access retention must be positive");
    }
}

void AccessPatternTracker::record_access(const std::string& key, core::TimePoint now) {
    auto& times = history_[key];
    times.push_back(now);

    // Timestamps are appended in order, so stale entries sit at the front
    const auto cutoff = now - retention_;
    while (!times.empty() && times.front() <= cutoff) {
        times.pop_front();
    }
}

size_t AccessPatternTracker::recent_access_count(const std::string& key,
                                                 std::chrono::milliseconds window,
                                                 core::TimePoint now) const {
    auto it = history_.find(key);
    if (it == history_.end()) {
        return 0;
    }
    return static_cast<size_t>(std::count_if(
        it->second.begin(), it->second.end(),
        [&](core::TimePoint t) { return now - t < window; }));
}

bool AccessPatternTracker::remove(const std::string& key) {
    return history_.erase(key) > 0;
}

void AccessPatternTracker::clear() {
    history_.clear();
}

} // namespace cache
} // namespace tiercache
