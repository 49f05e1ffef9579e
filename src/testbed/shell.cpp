#include "testbed/shell.hpp"
#include "process/environment.hpp"
#include "process/launcher.hpp"
#include "utils/logger.hpp"

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace swarmbed::testbed {

Result<Environment> shell_environment(const Environment& base,
                                      const node::Node& active,
                                      const std::vector<node::Node>& cluster) {
    std::vector<process::EnvOverride> overrides{
        {active.flavor().path_env, active.dir().string()},
    };

    for (size_t i = 0; i < cluster.size(); ++i) {
        const auto& peer = cluster[i].peer_id();
        if (peer.empty()) {
            return Result<Environment>::Err(ErrorCode::IdentityMissing,
                "node " + std::to_string(i) + " has no peer id",
                "start it once so its identity is recorded in " + cluster[i].dir().string());
        }
        overrides.emplace_back("NODE" + std::to_string(i), peer);
    }

    return Result<Environment>::Ok(process::derive_environment(base, overrides));
}

Result<void> exec_shell(const node::Node& active, const std::vector<node::Node>& cluster) {
    const auto base = active.environment();
    const auto shell = process::env_lookup(base, "SHELL");
    if (shell.empty()) {
        return Result<void>::Err(ErrorCode::ShellNotFound, "$SHELL is not set");
    }

    SWARMBED_TRY_UNWRAP(env, shell_environment(base, active, cluster));

    auto executable = process::resolve_executable(shell, env);
    if (!executable) {
        return Result<void>::Err(ErrorCode::ShellNotFound, "cannot find shell '" + shell + "'");
    }

    if (::chdir(active.dir().c_str()) != 0) {
        return Result<void>::Err(ErrorCode::LaunchFailed,
            "cannot enter " + active.dir().string(), std::strerror(errno));
    }

    std::vector<char*> argv{const_cast<char*>(shell.c_str()), nullptr};
    std::vector<char*> envp;
    envp.reserve(env.size() + 1);
    for (auto& entry : env) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    SWARMBED_LOG_DEBUG("Spawning {} for node {}", executable->string(), active.dir().string());
    utils::Logger::get()->flush();

    ::execve(executable->c_str(), argv.data(), envp.data());
    return Result<void>::Err(ErrorCode::LaunchFailed,
        "cannot exec " + executable->string(), std::strerror(errno));
}

} // namespace swarmbed::testbed
