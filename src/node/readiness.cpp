#include "node/readiness.hpp"
#include "swarmbed/time_utils.hpp"
#include "utils/logger.hpp"

namespace swarmbed::node {

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

Result<std::string> wait_until_ready(const IdentityQuery& query, const ReadinessPolicy& policy) {
    time::sleep_for(policy.initial_delay);

    std::string last_error = "no attempts made";
    for (uint32_t attempt = 1; attempt <= policy.attempts; ++attempt) {
        auto answer = query();
        if (answer.is_ok()) {
            auto identity = trim(answer.value());
            if (!identity.empty()) {
                SWARMBED_LOG_DEBUG("Node answered identity query on attempt {}", attempt);
                return Result<std::string>::Ok(identity);
            }
            last_error = "empty identity";
        } else {
            last_error = answer.error().to_string();
        }

        SWARMBED_LOG_DEBUG("get id error: {}, retrying ({}/{})", last_error, attempt, policy.attempts);
        if (attempt < policy.attempts) {
            time::sleep_for(policy.retry_interval);
        }
    }

    if (!policy.strict) {
        SWARMBED_LOG_WARN("Node never reported an identity after {} attempts; continuing without one",
            policy.attempts);
        return Result<std::string>::Ok(std::string());
    }

    return Result<std::string>::Err(ErrorCode::ReadinessTimeout,
        "node did not answer its identity query after " + std::to_string(policy.attempts) + " attempts",
        last_error);
}

} // namespace swarmbed::node
