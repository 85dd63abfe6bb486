#include "tiercache/core/clock.h"

namespace tiercache {
namespace core {

std::shared_ptr<const Clock> default_clock() {
    static const std::shared_ptr<const Clock> clock = std::make_shared<SteadyClock>();
    return clock;
}

} // namespace core
} // namespace tiercache
