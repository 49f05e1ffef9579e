#include "process/shutdown.hpp"
#include "process/liveness.hpp"
#include "process/pid_file.hpp"
#include "swarmbed/time_utils.hpp"
#include "utils/logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

namespace swarmbed::process {

const char* signal_name(int signal) {
    switch (signal) {
        case SIGINT: return "SIGINT";
        case SIGQUIT: return "SIGQUIT";
        case SIGTERM: return "SIGTERM";
        case SIGKILL: return "SIGKILL";
        default: return "signal";
    }
}

std::vector<EscalationStep> escalation_steps(const EscalationPolicy& policy) {
    return {
        {SIGINT, policy.interrupt_wait},
        {SIGINT, policy.interrupt_wait},
        {SIGQUIT, policy.quit_wait},
        {SIGKILL, policy.kill_confirm_timeout},
    };
}

bool wait_for_exit(Pid pid,
                   std::optional<std::chrono::milliseconds> timeout,
                   std::chrono::milliseconds interval) {
    std::optional<time::Timeout> deadline;
    if (timeout) {
        deadline.emplace(*timeout);
    }

    while (true) {
        if (!is_pid_alive(pid)) {
            return true;
        }
        if (deadline && deadline->expired()) {
            return false;
        }
        time::sleep_for(interval);
    }
}

Result<void> kill_daemon(const std::filesystem::path& dir, const EscalationPolicy& policy) {
    PidFileLock lock;
    if (policy.lock_pid_file) {
        auto acquired = PidFileLock::acquire(dir);
        if (acquired.is_err()) {
            return acquired.error();
        }
        lock = std::move(acquired.value());
    }

    auto recorded = read_pid_file(dir);
    if (recorded.is_err()) {
        return Result<void>::Err(recorded.error().code(),
            "error killing daemon " + dir.string() + ": " + recorded.error().message(),
            recorded.error().details());
    }
    if (!recorded.value()) {
        return Result<void>::Err(ErrorCode::NotRunning,
            "error killing daemon " + dir.string() + ": no PID file");
    }
    const Pid pid = *recorded.value();

    time::Timer timer;
    const auto steps = escalation_steps(policy);
    for (size_t i = 0; i < steps.size(); ++i) {
        const auto& step = steps[i];

        if (::kill(pid, step.signal) != 0) {
            const int err = errno;
            const std::string reason = std::strerror(err);
            SWARMBED_LOG_ERROR("Sending {} to daemon {} (pid {}) failed: {}",
                signal_name(step.signal), dir.string(), pid, reason);
            if (err == ESRCH && !is_pid_alive(pid)) {
                // The daemon is gone; a stale record would fail every later kill
                remove_pid_file(dir);
            }
            return Result<void>::Err(ErrorCode::SignalFailed,
                "error killing daemon " + dir.string() + ": " + signal_name(step.signal) + " failed",
                reason);
        }

        if (i == 0) {
            SWARMBED_LOG_DEBUG("Sent {} to daemon {} (pid {})", signal_name(step.signal), dir.string(), pid);
        } else {
            SWARMBED_LOG_WARN("Daemon {} (pid {}) still running after {}ms, sent {} (wait {})",
                dir.string(), pid, timer.elapsed_milliseconds(),
                signal_name(step.signal), time::describe(step.wait));
        }

        if (wait_for_exit(pid, step.wait, policy.poll_interval)) {
            remove_pid_file(dir);
            SWARMBED_LOG_INFO("Stopped daemon {} (pid {}) after {} in {}ms",
                dir.string(), pid, signal_name(step.signal), timer.elapsed_milliseconds());
            return Result<void>::Ok();
        }
    }

    // Only reachable with a bounded kill_confirm_timeout
    SWARMBED_LOG_ERROR("Daemon {} (pid {}) survived SIGKILL for {}",
        dir.string(), pid, time::describe(policy.kill_confirm_timeout));
    return Result<void>::Err(ErrorCode::ShutdownTimeout,
        "daemon " + dir.string() + " did not exit after SIGKILL",
        "pid " + std::to_string(pid));
}

} // namespace swarmbed::process
