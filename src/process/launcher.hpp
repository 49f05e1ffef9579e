#pragma once

#include "swarmbed/common.hpp"
#include "swarmbed/error.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace swarmbed::process {

/**
 * Everything needed to launch one daemon process
 */
struct LaunchSpec {
    std::string binary;              // name looked up on the child's PATH, or a path
    Args args;                       // argv[1..], subcommand first
    std::filesystem::path dir;       // node directory, also the working directory
    Environment env;                 // complete child environment
    bool lock_pid_file = true;       // hold daemon.pid.lock across check-and-launch
};

/**
 * Launch a daemon detached into its own process group.
 *
 * Refuses with AlreadyRunning when the directory's PID file names a live
 * process. Output is appended to daemon.stdout / daemon.stderr in the node
 * directory and the child PID is recorded in daemon.pid before returning.
 * Returns once the exec has succeeded, not once the daemon is ready.
 *
 * @return the child PID, or AlreadyRunning / LaunchFailed / PersistFailed /
 *         CorruptState
 */
Result<Pid> start_process(const LaunchSpec& spec);

/**
 * Resolve `binary` against the PATH found in `env` (or use it as-is when it
 * contains a '/'). Returns nullopt if no executable file matches.
 */
std::optional<std::filesystem::path> resolve_executable(const std::string& binary, const Environment& env);

/**
 * Last `max_bytes` of a log file, empty if it cannot be read
 */
std::string read_log_tail(const std::filesystem::path& path, size_t max_bytes = 2048);

} // namespace swarmbed::process
