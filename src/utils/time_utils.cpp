#include "swarmbed/time_utils.hpp"

namespace swarmbed {
namespace time {

TimePoint now() {
    return Clock::now();
}

std::string describe(const std::optional<Milliseconds>& duration) {
    if (!duration) {
        return "unbounded";
    }
    return std::to_string(duration->count()) + "ms";
}

} // namespace time
} // namespace swarmbed
