#pragma once

#include "swarmbed/common.hpp"
#include "swarmbed/error.hpp"
#include <chrono>
#include <functional>
#include <string>

namespace swarmbed::node {

struct ReadinessPolicy {
    std::chrono::milliseconds initial_delay = constants::READY_INITIAL_DELAY;
    std::chrono::milliseconds retry_interval = constants::READY_RETRY_INTERVAL;
    uint32_t attempts = constants::READY_ATTEMPTS;
    // When false, running out of attempts returns an empty identity instead of ReadinessTimeout
    bool strict = true;
};

// Asks a running node for its peer identity
using IdentityQuery = std::function<Result<std::string>()>;

/**
 * Block until `query` returns a non-empty identity.
 *
 * Sleeps `initial_delay`, then makes up to `attempts` queries with
 * `retry_interval` between failures. The first non-empty (whitespace
 * trimmed) answer is returned.
 */
Result<std::string> wait_until_ready(const IdentityQuery& query, const ReadinessPolicy& policy = {});

} // namespace swarmbed::node
