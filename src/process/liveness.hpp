#pragma once

#include "swarmbed/common.hpp"
#include "swarmbed/error.hpp"
#include <filesystem>

namespace swarmbed::process {

/**
 * Zero-signal existence probe for a single process.
 *
 * A process we may not signal (EPERM) still counts as alive. If `pid` is an
 * exited child of this process it is reaped first, so a zombie left behind
 * by an in-process start reads as gone.
 */
bool is_pid_alive(Pid pid);

/**
 * Whether the process recorded in `dir`'s PID file is running.
 * @return false without a PID file, CorruptState if the file does not parse
 */
Result<bool> is_alive(const std::filesystem::path& dir);

} // namespace swarmbed::process
