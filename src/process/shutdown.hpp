#pragma once

#include "swarmbed/common.hpp"
#include "swarmbed/error.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <vector>

namespace swarmbed::process {

/**
 * Timings of the shutdown escalation
 */
struct EscalationPolicy {
    std::chrono::milliseconds interrupt_wait = constants::INTERRUPT_WAIT;
    std::chrono::milliseconds quit_wait = constants::QUIT_WAIT;
    std::chrono::milliseconds poll_interval = constants::LIVENESS_POLL_INTERVAL;
    // Bound on the wait after SIGKILL; unset waits until the process is gone
    std::optional<std::chrono::milliseconds> kill_confirm_timeout;
    bool lock_pid_file = true;
};

/**
 * One rung of the escalation ladder
 */
struct EscalationStep {
    int signal;
    std::optional<std::chrono::milliseconds> wait;  // nullopt for the final unbounded wait
};

/**
 * The ladder `policy` describes: SIGINT, SIGINT, SIGQUIT, SIGKILL
 */
std::vector<EscalationStep> escalation_steps(const EscalationPolicy& policy);

/**
 * Poll `pid` every `interval` until it is gone or `timeout` elapses.
 * @return true once the process is gone
 */
bool wait_for_exit(Pid pid,
                   std::optional<std::chrono::milliseconds> timeout,
                   std::chrono::milliseconds interval);

/**
 * Stop the daemon recorded in `dir`'s PID file.
 *
 * Walks the escalation ladder, moving to the next signal only when the
 * previous wait times out, and removes the PID file once the process is
 * gone. Fails with NotRunning (no signal sent) when there is no PID file,
 * CorruptState when it does not parse and SignalFailed when a signal cannot
 * be delivered. ShutdownTimeout is only possible with kill_confirm_timeout.
 *
 * @throws ProcessException if the PID file cannot be removed afterwards
 */
Result<void> kill_daemon(const std::filesystem::path& dir, const EscalationPolicy& policy = {});

/**
 * Name of a termination signal for log lines
 */
const char* signal_name(int signal);

} // namespace swarmbed::process
