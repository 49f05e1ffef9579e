#pragma once

#include "swarmbed/common.hpp"
#include "swarmbed/error.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace swarmbed::process {

/**
 * A short-lived command run against a node (identity query, stats, ...)
 */
struct CommandOptions {
    Args argv;                                        // argv[0] is resolved on the env's PATH
    Environment env;                                  // complete child environment
    std::optional<std::filesystem::path> working_dir;
    std::chrono::milliseconds timeout{0};             // 0 waits forever
};

struct CommandOutput {
    int exit_code = -1;
    bool timed_out = false;
    bool signaled = false;
    int signal = 0;
    std::string stdout_text;
    std::string stderr_text;
};

/**
 * Run a command to completion, capturing stdout and stderr separately.
 * @return the captured output whatever the exit code; LaunchFailed only if
 *         the command could not be started at all
 */
Result<CommandOutput> run_subprocess(const CommandOptions& options);

/**
 * Run a command and require a zero exit status.
 * @return stdout on success, CommandFailed with both streams otherwise
 */
Result<std::string> run_command(const CommandOptions& options);

} // namespace swarmbed::process
