#include "testbed/harness_config.hpp"
#include "process/environment.hpp"

namespace swarmbed::testbed {

namespace {

std::chrono::milliseconds millis(const utils::Config& config, const std::string& key,
                                 std::chrono::milliseconds fallback) {
    auto value = config.get<int64_t>(key);
    if (!value || *value < 0) {
        return fallback;
    }
    return std::chrono::milliseconds(*value);
}

} // namespace

std::filesystem::path default_root(const Environment& env) {
    auto root = process::env_lookup(env, constants::ROOT_ENV_VAR);
    if (!root.empty()) {
        return root;
    }
    auto home = process::env_lookup(env, "HOME");
    if (!home.empty()) {
        return std::filesystem::path(home) / constants::DEFAULT_ROOT_DIR;
    }
    return constants::DEFAULT_ROOT_DIR;
}

HarnessConfig HarnessConfig::from_config(const utils::Config& config, const Environment& env) {
    HarnessConfig harness;
    harness.log_level = config.get_or<std::string>("log_level", "info");
    harness.log_to_file = config.get_or<bool>("log_to_file", false);

    // The environment wins over the file so one config can serve several roots
    auto env_root = process::env_lookup(env, constants::ROOT_ENV_VAR);
    if (!env_root.empty()) {
        harness.root = env_root;
    } else if (auto root = config.get<std::string>("testbed_root")) {
        harness.root = *root;
    } else {
        harness.root = default_root(env);
    }

    auto& escalation = harness.lifecycle.escalation;
    escalation.interrupt_wait = millis(config, "interrupt_wait_ms", escalation.interrupt_wait);
    escalation.quit_wait = millis(config, "quit_wait_ms", escalation.quit_wait);
    escalation.poll_interval = millis(config, "poll_interval_ms", escalation.poll_interval);
    if (auto bound = config.get<int64_t>("kill_confirm_timeout_ms"); bound && *bound > 0) {
        escalation.kill_confirm_timeout = std::chrono::milliseconds(*bound);
    }

    auto& readiness = harness.lifecycle.readiness;
    readiness.initial_delay = millis(config, "ready_initial_delay_ms", readiness.initial_delay);
    readiness.retry_interval = millis(config, "ready_retry_interval_ms", readiness.retry_interval);
    readiness.attempts = config.get_or<uint32_t>("ready_attempts", readiness.attempts);
    readiness.strict = config.get_or<bool>("ready_strict", readiness.strict);

    harness.lifecycle.command_timeout =
        millis(config, "command_timeout_ms", harness.lifecycle.command_timeout);
    harness.lifecycle.lock_pid_file = config.get_or<bool>("lock_pid_file", true);
    escalation.lock_pid_file = harness.lifecycle.lock_pid_file;

    return harness;
}

utils::Config HarnessConfig::to_config() const {
    const auto& escalation = lifecycle.escalation;
    const auto& readiness = lifecycle.readiness;

    utils::Config config;
    config.set("log_level", log_level);
    config.set("log_to_file", log_to_file);
    config.set("testbed_root", root.string());
    config.set("interrupt_wait_ms", escalation.interrupt_wait.count());
    config.set("quit_wait_ms", escalation.quit_wait.count());
    config.set("poll_interval_ms", escalation.poll_interval.count());
    if (escalation.kill_confirm_timeout) {
        config.set("kill_confirm_timeout_ms", escalation.kill_confirm_timeout->count());
    }
    config.set("ready_initial_delay_ms", readiness.initial_delay.count());
    config.set("ready_attempts", readiness.attempts);
    config.set("ready_retry_interval_ms", readiness.retry_interval.count());
    config.set("ready_strict", readiness.strict);
    config.set("command_timeout_ms", lifecycle.command_timeout.count());
    config.set("lock_pid_file", lifecycle.lock_pid_file);
    return config;
}

} // namespace swarmbed::testbed
