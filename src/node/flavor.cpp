#include "node/flavor.hpp"

namespace swarmbed::node {

namespace {

const DaemonFlavor kIpfs{
    FlavorKind::Ipfs,
    "ipfs",
    "ipfs",
    "IPFS_PATH",
    nullptr,
    {"init", "-b=1024"},
    {"id", "-f=<id>"},
    true,
    true,
};

const DaemonFlavor kFilecoin{
    FlavorKind::Filecoin,
    "filecoin",
    "go-filecoin",
    "FIL_PATH",
    "FIL_API",
    {},
    {"id", "--format=<id>"},
    false,
    false,
};

} // namespace

const DaemonFlavor& flavor_for(FlavorKind kind) {
    switch (kind) {
        case FlavorKind::Ipfs: return kIpfs;
        case FlavorKind::Filecoin: return kFilecoin;
    }
    return kIpfs;
}

Result<FlavorKind> parse_flavor(const std::string& name) {
    if (name == "ipfs" || name == "go-ipfs") {
        return Result<FlavorKind>::Ok(FlavorKind::Ipfs);
    }
    if (name == "filecoin" || name == "go-filecoin") {
        return Result<FlavorKind>::Ok(FlavorKind::Filecoin);
    }
    return Result<FlavorKind>::Err(ErrorCode::InvalidArgument,
        "unrecognized node type: " + name, "expected ipfs or filecoin");
}

std::string loopback_multiaddr(uint16_t port) {
    return "/ip4/127.0.0.1/tcp/" + std::to_string(port);
}

Args daemon_args(const DaemonFlavor& flavor, uint16_t api_port, const Args& extra_args) {
    Args args{"daemon"};
    if (!flavor.api_port_in_config) {
        args.push_back("--cmdapiaddr=:" + std::to_string(api_port));
        args.push_back("--swarmlisten=" + loopback_multiaddr(0));
    }
    args.insert(args.end(), extra_args.begin(), extra_args.end());
    return args;
}

} // namespace swarmbed::node
