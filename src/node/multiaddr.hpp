#pragma once

#include "swarmbed/error.hpp"
#include <string>

namespace swarmbed::node {

/**
 * Convert a listen multiaddress to a host:port dial address.
 *
 *   /ip4/127.0.0.1/tcp/5001   -> 127.0.0.1:5001
 *   /ip6/::1/tcp/5001         -> [::1]:5001
 *   /dns4/localhost/tcp/5001  -> localhost:5001   (also dns, dns6)
 *
 * Any other shape yields InvalidFormat.
 */
Result<std::string> to_dial_address(const std::string& multiaddr);

} // namespace swarmbed::node
