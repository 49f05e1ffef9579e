#pragma once

#include "swarmbed/common.hpp"
#include "swarmbed/error.hpp"
#include <string>

namespace swarmbed::node {

enum class FlavorKind {
    Ipfs,
    Filecoin
};

/**
 * Conventions of one daemon implementation: how it is named, where it keeps
 * its data, how it is initialized, started and asked for its identity.
 */
struct DaemonFlavor {
    FlavorKind kind;
    const char* name;               // "ipfs", "filecoin"
    const char* default_binary;     // executable looked up on PATH
    const char* path_env;           // data directory variable
    const char* api_env;            // API port variable, nullptr if unused
    Args init_args;                 // empty: init only creates the directory
    Args identity_args;             // prints the peer id on stdout
    bool identity_in_config;        // peer id readable from the config file
    bool api_port_in_config;        // API address lives in the config file
};

const DaemonFlavor& flavor_for(FlavorKind kind);

/**
 * "ipfs" / "go-ipfs" or "filecoin" / "go-filecoin"
 */
Result<FlavorKind> parse_flavor(const std::string& name);

/**
 * argv[1..] for starting the daemon: the `daemon` subcommand, the flags
 * binding its API to `api_port` and its swarm to an ephemeral loopback
 * port, then `extra_args`.
 */
Args daemon_args(const DaemonFlavor& flavor, uint16_t api_port, const Args& extra_args);

/**
 * Loopback multiaddress for a TCP port
 */
std::string loopback_multiaddr(uint16_t port);

} // namespace swarmbed::node
