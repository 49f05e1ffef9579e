#pragma once

#include "swarmbed/common.hpp"
#include "swarmbed/error.hpp"
#include "node/node.hpp"
#include <vector>

namespace swarmbed::testbed {

/**
 * Environment for an interactive shell attached to `active`: its data
 * directory variable plus NODE<i>=<peer id> for every node of `cluster`.
 * Fails with IdentityMissing if any cluster node has no known peer id.
 */
Result<Environment> shell_environment(const Environment& base,
                                      const node::Node& active,
                                      const std::vector<node::Node>& cluster);

/**
 * Replace the current process with $SHELL running in `active`'s directory.
 * Only returns on failure (ShellNotFound, LaunchFailed, IdentityMissing).
 */
Result<void> exec_shell(const node::Node& active, const std::vector<node::Node>& cluster);

} // namespace swarmbed::testbed
