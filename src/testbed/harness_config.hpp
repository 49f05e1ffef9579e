#pragma once

#include "swarmbed/common.hpp"
#include "node/node.hpp"
#include "utils/config.hpp"
#include <filesystem>
#include <string>

namespace swarmbed::testbed {

/**
 * Harness-wide settings read from swarmbed.conf
 *
 * Recognized keys (all optional):
 *   log_level, log_to_file, testbed_root,
 *   interrupt_wait_ms, quit_wait_ms, poll_interval_ms, kill_confirm_timeout_ms,
 *   ready_initial_delay_ms, ready_attempts, ready_retry_interval_ms, ready_strict,
 *   command_timeout_ms, lock_pid_file
 */
struct HarnessConfig {
    std::string log_level = "info";
    bool log_to_file = false;
    std::filesystem::path root;
    node::LifecycleSettings lifecycle;

    static HarnessConfig from_config(const utils::Config& config, const Environment& env);

    utils::Config to_config() const;
};

/**
 * $SWARMBED_ROOT, else $HOME/testbed, else ./testbed
 */
std::filesystem::path default_root(const Environment& env);

} // namespace swarmbed::testbed
