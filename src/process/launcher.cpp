#include "process/launcher.hpp"
#include "process/environment.hpp"
#include "process/liveness.hpp"
#include "process/pid_file.hpp"
#include "utils/logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace swarmbed::process {

namespace fs = std::filesystem;

namespace {

int open_log(const fs::path& path) {
    return ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
}

bool is_executable_file(const fs::path& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return false;
    }
    return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

std::vector<char*> to_cstrings(const std::vector<std::string>& items) {
    std::vector<char*> out;
    out.reserve(items.size() + 1);
    for (const auto& item : items) {
        out.push_back(const_cast<char*>(item.c_str()));
    }
    out.push_back(nullptr);
    return out;
}

// Child side of fork(): only async-signal-safe calls from here on
[[noreturn]] void exec_child(const char* path,
                             char* const* argv,
                             char* const* envp,
                             const char* workdir,
                             int stdout_fd,
                             int stderr_fd,
                             int status_fd,
                             int max_fd) {
    ::setpgid(0, 0);

    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        ::close(devnull);
    }
    ::dup2(stdout_fd, STDOUT_FILENO);
    ::dup2(stderr_fd, STDERR_FILENO);

    // Harness descriptors (log sinks, locks) stay with the harness
    for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd) {
        if (fd != status_fd) {
            ::close(fd);
        }
    }

    if (::chdir(workdir) == 0) {
        ::execve(path, argv, envp);
    }

    int err = errno;
    ssize_t ignored = ::write(status_fd, &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
}

} // namespace

std::optional<std::filesystem::path> resolve_executable(const std::string& binary, const Environment& env) {
    if (binary.empty()) {
        return std::nullopt;
    }
    if (binary.find('/') != std::string::npos) {
        fs::path candidate = fs::absolute(binary);
        if (is_executable_file(candidate)) {
            return candidate;
        }
        return std::nullopt;
    }

    std::string search_path = env_lookup(env, "PATH");
    if (search_path.empty()) {
        search_path = "/usr/local/bin:/usr/bin:/bin";
    }

    std::istringstream dirs(search_path);
    std::string entry;
    while (std::getline(dirs, entry, ':')) {
        fs::path candidate = fs::absolute(entry.empty() ? fs::path(".") : fs::path(entry)) / binary;
        if (is_executable_file(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::string read_log_tail(const std::filesystem::path& path, size_t max_bytes) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return {};
    }
    const std::streamoff size = file.tellg();
    const std::streamoff start = size > static_cast<std::streamoff>(max_bytes)
        ? size - static_cast<std::streamoff>(max_bytes)
        : 0;
    file.seekg(start, std::ios::beg);

    std::string tail(static_cast<size_t>(size - start), '\0');
    file.read(tail.data(), static_cast<std::streamsize>(tail.size()));
    tail.resize(static_cast<size_t>(file.gcount()));
    return tail;
}

Result<Pid> start_process(const LaunchSpec& spec) {
    PidFileLock lock;
    if (spec.lock_pid_file) {
        auto acquired = PidFileLock::acquire(spec.dir);
        if (acquired.is_err()) {
            return acquired.error();
        }
        lock = std::move(acquired.value());
    }

    // Re-checked on every start; another harness invocation may own this dir
    auto alive = is_alive(spec.dir);
    if (alive.is_err()) {
        return alive.error();
    }
    if (alive.value()) {
        return Result<Pid>::Err(ErrorCode::AlreadyRunning,
            "node is already running: " + spec.dir.string());
    }

    auto executable = resolve_executable(spec.binary, spec.env);
    if (!executable) {
        return Result<Pid>::Err(ErrorCode::LaunchFailed,
            "cannot find executable '" + spec.binary + "'");
    }

    const fs::path stdout_path = spec.dir / constants::STDOUT_FILE_NAME;
    const fs::path stderr_path = spec.dir / constants::STDERR_FILE_NAME;

    int stdout_fd = open_log(stdout_path);
    if (stdout_fd < 0) {
        return Result<Pid>::Err(ErrorCode::LaunchFailed,
            "cannot open " + stdout_path.string(), std::strerror(errno));
    }
    int stderr_fd = open_log(stderr_path);
    if (stderr_fd < 0) {
        const std::string reason = std::strerror(errno);
        ::close(stdout_fd);
        return Result<Pid>::Err(ErrorCode::LaunchFailed,
            "cannot open " + stderr_path.string(), reason);
    }

    // Close-on-exec pipe: EOF means exec succeeded, an errno means it did not
    int status_pipe[2] = {-1, -1};
    if (::pipe(status_pipe) != 0
        || ::fcntl(status_pipe[0], F_SETFD, FD_CLOEXEC) != 0
        || ::fcntl(status_pipe[1], F_SETFD, FD_CLOEXEC) != 0) {
        const std::string reason = std::strerror(errno);
        for (int fd : status_pipe) {
            if (fd >= 0) ::close(fd);
        }
        ::close(stdout_fd);
        ::close(stderr_fd);
        return Result<Pid>::Err(ErrorCode::LaunchFailed, "pipe failed", reason);
    }

    std::vector<std::string> argv_storage;
    argv_storage.reserve(spec.args.size() + 1);
    argv_storage.push_back(spec.binary);
    argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());
    auto argv = to_cstrings(argv_storage);
    auto envp = to_cstrings(spec.env);
    const std::string exec_path = executable->string();
    const std::string workdir = spec.dir.string();
    const long open_max = ::sysconf(_SC_OPEN_MAX);
    const int max_fd = open_max > 0 && open_max < 65536 ? static_cast<int>(open_max) : 65536;

    SWARMBED_LOG_DEBUG("Launching {} in {} with {} args", exec_path, workdir, spec.args.size());

    const Pid pid = ::fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        ::close(status_pipe[0]);
        ::close(status_pipe[1]);
        ::close(stdout_fd);
        ::close(stderr_fd);
        return Result<Pid>::Err(ErrorCode::LaunchFailed, "fork failed", reason);
    }

    if (pid == 0) {
        ::close(status_pipe[0]);
        exec_child(exec_path.c_str(), argv.data(), envp.data(), workdir.c_str(),
                   stdout_fd, stderr_fd, status_pipe[1], max_fd);
    }

    ::close(status_pipe[1]);
    ::close(stdout_fd);
    ::close(stderr_fd);

    int child_errno = 0;
    ssize_t got = 0;
    do {
        got = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    if (got > 0) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        return Result<Pid>::Err(ErrorCode::LaunchFailed,
            "exec of " + exec_path + " failed: " + std::strerror(child_errno),
            read_log_tail(stderr_path));
    }

    auto persisted = write_pid_file(spec.dir, pid);
    if (persisted.is_err()) {
        // An untracked daemon cannot be managed later; take it down now
        SWARMBED_LOG_ERROR("Daemon {} started as pid {} but its PID file could not be written: {}",
            spec.dir.string(), pid, persisted.error().to_string());
        if (::kill(pid, SIGKILL) == 0) {
            int status = 0;
            ::waitpid(pid, &status, 0);
        } else {
            SWARMBED_LOG_CRITICAL("Orphaned daemon pid {} could not be killed: {}", pid, std::strerror(errno));
        }
        return persisted.error();
    }

    SWARMBED_LOG_INFO("Started daemon {}, pid = {}", spec.dir.string(), pid);
    return Result<Pid>::Ok(pid);
}

} // namespace swarmbed::process
