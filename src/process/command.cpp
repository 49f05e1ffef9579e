#include "process/command.hpp"
#include "process/launcher.hpp"
#include "utils/logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace swarmbed::process {

namespace {

void read_fd(int fd, std::string& out) {
    constexpr size_t kBufferSize = 4096;
    char buffer[kBufferSize];
    while (true) {
        const ssize_t bytes_read = ::read(fd, buffer, kBufferSize);
        if (bytes_read > 0) {
            out.append(buffer, buffer + bytes_read);
            continue;
        }
        if (bytes_read < 0 && errno == EINTR) {
            continue;
        }
        break;
    }
    ::close(fd);
}

void close_pair(int (&fds)[2]) {
    for (int& fd : fds) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
}

std::string join_args(const Args& argv) {
    std::string joined;
    for (const auto& arg : argv) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += arg;
    }
    return joined;
}

} // namespace

Result<CommandOutput> run_subprocess(const CommandOptions& options) {
    if (options.argv.empty()) {
        return Result<CommandOutput>::Err(ErrorCode::InvalidArgument, "argv is empty");
    }

    auto executable = resolve_executable(options.argv.front(), options.env);
    if (!executable) {
        return Result<CommandOutput>::Err(ErrorCode::LaunchFailed,
            "cannot find executable '" + options.argv.front() + "'");
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (::pipe(stdout_pipe) != 0) {
        return Result<CommandOutput>::Err(ErrorCode::LaunchFailed, "pipe stdout failed", std::strerror(errno));
    }
    if (::pipe(stderr_pipe) != 0) {
        const std::string reason = std::strerror(errno);
        close_pair(stdout_pipe);
        return Result<CommandOutput>::Err(ErrorCode::LaunchFailed, "pipe stderr failed", reason);
    }

    std::vector<char*> argv_c;
    argv_c.reserve(options.argv.size() + 1);
    for (const auto& arg : options.argv) {
        argv_c.push_back(const_cast<char*>(arg.c_str()));
    }
    argv_c.push_back(nullptr);

    std::vector<char*> envp;
    envp.reserve(options.env.size() + 1);
    for (const auto& entry : options.env) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    const std::string exec_path = executable->string();
    const std::string workdir = options.working_dir ? options.working_dir->string() : std::string();

    const Pid pid = ::fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return Result<CommandOutput>::Err(ErrorCode::LaunchFailed, "fork failed", reason);
    }

    if (pid == 0) {
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::dup2(stderr_pipe[1], STDERR_FILENO);
        ::close(stdout_pipe[0]);
        ::close(stdout_pipe[1]);
        ::close(stderr_pipe[0]);
        ::close(stderr_pipe[1]);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }

        if (!workdir.empty() && ::chdir(workdir.c_str()) != 0) {
            ::_exit(127);
        }
        ::execve(exec_path.c_str(), argv_c.data(), envp.data());
        ::_exit(127);
    }

    ::close(stdout_pipe[1]);
    ::close(stderr_pipe[1]);

    CommandOutput output;
    std::thread stdout_thread(read_fd, stdout_pipe[0], std::ref(output.stdout_text));
    std::thread stderr_thread(read_fd, stderr_pipe[0], std::ref(output.stderr_text));

    int status = 0;
    const bool has_timeout = options.timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + options.timeout;
    bool wait_failed = false;

    while (true) {
        const Pid wait_result = ::waitpid(pid, &status, has_timeout ? WNOHANG : 0);
        if (wait_result == pid) {
            break;
        }
        if (wait_result == 0) {
            if (std::chrono::steady_clock::now() >= deadline) {
                output.timed_out = true;
                ::kill(pid, SIGKILL);
                ::waitpid(pid, &status, 0);
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }
        if (wait_result < 0 && errno == EINTR) {
            continue;
        }
        wait_failed = true;
        break;
    }

    stdout_thread.join();
    stderr_thread.join();

    if (wait_failed) {
        return Result<CommandOutput>::Err(ErrorCode::CommandFailed,
            "waitpid failed for '" + join_args(options.argv) + "'", std::strerror(errno));
    }

    if (WIFEXITED(status)) {
        output.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        output.signaled = true;
        output.signal = WTERMSIG(status);
        output.exit_code = 128 + output.signal;
    }

    return Result<CommandOutput>::Ok(std::move(output));
}

Result<std::string> run_command(const CommandOptions& options) {
    auto ran = run_subprocess(options);
    if (ran.is_err()) {
        return ran.error();
    }

    const auto& output = ran.value();
    if (output.timed_out) {
        return Result<std::string>::Err(ErrorCode::CommandFailed,
            "'" + join_args(options.argv) + "' timed out",
            output.stdout_text + " " + output.stderr_text);
    }
    if (output.exit_code != 0) {
        SWARMBED_LOG_DEBUG("'{}' exited with {}", join_args(options.argv), output.exit_code);
        return Result<std::string>::Err(ErrorCode::CommandFailed,
            "'" + join_args(options.argv) + "' exited with status " + std::to_string(output.exit_code),
            output.stdout_text + " " + output.stderr_text);
    }
    return Result<std::string>::Ok(output.stdout_text);
}

} // namespace swarmbed::process
