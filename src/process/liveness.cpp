#include "process/liveness.hpp"
#include "process/pid_file.hpp"
#include "utils/logger.hpp"

#include <cerrno>
#include <csignal>

#include <sys/wait.h>

namespace swarmbed::process {

bool is_pid_alive(Pid pid) {
    if (pid <= 0) {
        return false;
    }

    // Reap our own exited child; ECHILD for anything we did not fork
    int status = 0;
    Pid reaped = ::waitpid(pid, &status, WNOHANG);
    if (reaped == pid) {
        SWARMBED_LOG_DEBUG("Reaped exited child {}", pid);
        return false;
    }

    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

Result<bool> is_alive(const std::filesystem::path& dir) {
    auto pid = read_pid_file(dir);
    if (pid.is_err()) {
        return pid.error();
    }
    if (!pid.value()) {
        return Result<bool>::Ok(false);
    }
    return Result<bool>::Ok(is_pid_alive(*pid.value()));
}

} // namespace swarmbed::process
