#pragma once

#include "swarmbed/common.hpp"
#include "swarmbed/error.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace swarmbed::process {

/**
 * Path of the PID file inside a node directory
 */
std::filesystem::path pid_file_path(const std::filesystem::path& dir);

/**
 * Parse PID file contents. Surrounding whitespace is accepted; anything
 * else that is not a positive decimal integer yields nullopt.
 */
std::optional<Pid> parse_pid(const std::string& text);

/**
 * Read the PID recorded for a node directory.
 * @return nullopt if there is no PID file, CorruptState if it does not parse
 */
Result<std::optional<Pid>> read_pid_file(const std::filesystem::path& dir);

/**
 * Record `pid` for a node directory. The file is written next to its final
 * name and renamed into place, so readers never observe a partial write.
 * @return PersistFailed on any filesystem error
 */
Result<void> write_pid_file(const std::filesystem::path& dir, Pid pid);

/**
 * Remove the PID file.
 * @return true if a file was removed, false if it was already absent
 * @throws ProcessException if it exists and cannot be removed
 */
bool remove_pid_file(const std::filesystem::path& dir);

/**
 * Advisory exclusive lock serializing PID file read-modify-write sequences
 * between harness invocations. Holds flock() on daemon.pid.lock until
 * destroyed. A default constructed lock holds nothing.
 */
class PidFileLock {
public:
    PidFileLock() = default;
    ~PidFileLock();

    PidFileLock(PidFileLock&& other) noexcept;
    PidFileLock& operator=(PidFileLock&& other) noexcept;
    SWARMBED_DISALLOW_COPY(PidFileLock);

    /**
     * Block until the lock for `dir` is held
     */
    static Result<PidFileLock> acquire(const std::filesystem::path& dir);

    bool held() const { return fd_ >= 0; }

    void release();

private:
    explicit PidFileLock(int fd) : fd_(fd) {}

    int fd_ = -1;
};

} // namespace swarmbed::process
