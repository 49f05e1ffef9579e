#pragma once

#include "swarmbed/common.hpp"
#include <string>
#include <utility>
#include <vector>

namespace swarmbed::process {

using EnvOverride = std::pair<std::string, std::string>;

/**
 * Snapshot of the current process environment as KEY=VALUE entries.
 * Reads `environ` once and never modifies it.
 */
Environment current_environment();

/**
 * Derive a child environment from `base`.
 *
 * For every override the first KEY= entry in `base` is replaced in place and
 * any later entries with the same key are dropped; keys not present are
 * appended in override order. Pure: `base` is not modified.
 */
Environment derive_environment(const Environment& base, const std::vector<EnvOverride>& overrides);

/**
 * Convenience for the common single-variable case (data directory variable)
 */
Environment derive_environment(const Environment& base, const std::string& key, const std::string& value);

/**
 * Key part of a KEY=VALUE entry (whole entry if it has no '=')
 */
std::string env_key(const std::string& entry);

/**
 * Value of `key` in `env`, empty if absent
 */
std::string env_lookup(const Environment& env, const std::string& key);

} // namespace swarmbed::process
