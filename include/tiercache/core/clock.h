#ifndef TIERCACHE_CORE_CLOCK_H_
#define TIERCACHE_CORE_CLOCK_H_

#include <chrono>
#include <memory>

namespace tiercache {
namespace core {

using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

/**
 * @brief Interface for the monotonic time source used by the cache engine
 */
class Clock {
public:
    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;
};

/**
 * @brief Clock backed by std::chrono::steady_clock
 */
class SteadyClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::steady_clock::now(); }
};

/**
 * @brief Process-wide steady clock shared by components built without one
 */
std::shared_ptr<const Clock> default_clock();

} // namespace core
} // namespace tiercache

#endif // TIERCACHE_CORE_CLOCK_H_
