#include "process/pid_file.hpp"
#include "utils/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace swarmbed::process {

namespace fs = std::filesystem;

std::filesystem::path pid_file_path(const std::filesystem::path& dir) {
    return dir / constants::PID_FILE_NAME;
}

std::optional<Pid> parse_pid(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::nullopt;
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    const std::string digits = text.substr(first, last - first + 1);

    long long value = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
        if (value > 0x7fffffffLL) {
            return std::nullopt;
        }
    }
    if (value <= 0) {
        return std::nullopt;
    }
    return static_cast<Pid>(value);
}

Result<std::optional<Pid>> read_pid_file(const std::filesystem::path& dir) {
    const auto path = pid_file_path(dir);

    std::ifstream file(path);
    if (!file.is_open()) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return Result<std::optional<Pid>>::Ok(std::nullopt);
        }
        return Result<std::optional<Pid>>::Err(ErrorCode::CorruptState,
            "PID file exists but cannot be read: " + path.string());
    }

    std::ostringstream contents;
    contents << file.rdbuf();

    auto pid = parse_pid(contents.str());
    if (!pid) {
        return Result<std::optional<Pid>>::Err(ErrorCode::CorruptState,
            "Unparsable PID file: " + path.string(),
            "contents: '" + contents.str() + "'");
    }
    return Result<std::optional<Pid>>::Ok(pid);
}

Result<void> write_pid_file(const std::filesystem::path& dir, Pid pid) {
    const auto path = pid_file_path(dir);
    auto staging = path;
    staging += ".tmp";

    {
        std::ofstream file(staging, std::ios::trunc);
        if (!file.is_open()) {
            return Result<void>::Err(ErrorCode::PersistFailed,
                "Failed to create PID file: " + staging.string(), std::strerror(errno));
        }
        file << pid;
        file.flush();
        if (!file) {
            return Result<void>::Err(ErrorCode::PersistFailed,
                "Failed to write PID file: " + staging.string());
        }
    }

    std::error_code ec;
    fs::rename(staging, path, ec);
    if (ec) {
        fs::remove(staging, ec);
        return Result<void>::Err(ErrorCode::PersistFailed,
            "Failed to move PID file into place: " + path.string(), ec.message());
    }

    SWARMBED_LOG_DEBUG("Wrote PID {} to {}", pid, path.string());
    return Result<void>::Ok();
}

bool remove_pid_file(const std::filesystem::path& dir) {
    const auto path = pid_file_path(dir);
    if (::unlink(path.c_str()) == 0) {
        return true;
    }
    if (errno == ENOENT) {
        return false;
    }
    const std::string reason = std::strerror(errno);
    SWARMBED_LOG_CRITICAL("Cannot remove PID file {}: {}", path.string(), reason);
    throw ProcessException(ErrorCode::PidFileRemoveFailed,
        "error removing pid file for daemon at " + dir.string() + ": " + reason);
}

PidFileLock::~PidFileLock() {
    release();
}

PidFileLock::PidFileLock(PidFileLock&& other) noexcept
    : fd_(other.fd_)
{
    other.fd_ = -1;
}

PidFileLock& PidFileLock::operator=(PidFileLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Result<PidFileLock> PidFileLock::acquire(const std::filesystem::path& dir) {
    const auto path = dir / constants::PID_LOCK_FILE_NAME;

    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Result<PidFileLock>::Err(ErrorCode::PersistFailed,
            "Failed to open PID lock file: " + path.string(), std::strerror(errno));
    }

    while (::flock(fd, LOCK_EX) != 0) {
        if (errno == EINTR) {
            continue;
        }
        const std::string reason = std::strerror(errno);
        ::close(fd);
        return Result<PidFileLock>::Err(ErrorCode::PersistFailed,
            "Failed to lock " + path.string(), reason);
    }

    return Result<PidFileLock>::Ok(PidFileLock(fd));
}

void PidFileLock::release() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace swarmbed::process
