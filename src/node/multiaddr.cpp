#include "node/multiaddr.hpp"

#include <sstream>
#include <vector>

namespace swarmbed::node {

namespace {

bool valid_port(const std::string& text) {
    if (text.empty() || text.size() > 5) {
        return false;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    const long port = std::stol(text);
    return port > 0 && port <= 65535;
}

} // namespace

Result<std::string> to_dial_address(const std::string& multiaddr) {
    // The api file is written by the daemon and may end in a newline
    std::string addr = multiaddr;
    while (!addr.empty() && (addr.back() == '\n' || addr.back() == '\r' || addr.back() == ' ')) {
        addr.pop_back();
    }

    if (addr.empty() || addr.front() != '/') {
        return Result<std::string>::Err(ErrorCode::InvalidFormat,
            "error parsing multiaddr: '" + addr + "'");
    }

    std::vector<std::string> parts;
    std::istringstream stream(addr.substr(1));
    std::string part;
    while (std::getline(stream, part, '/')) {
        parts.push_back(part);
    }

    if (parts.size() != 4 || parts[2] != "tcp" || parts[1].empty() || !valid_port(parts[3])) {
        return Result<std::string>::Err(ErrorCode::InvalidFormat,
            "error on multiaddr dialargs: '" + addr + "'",
            "expected /<ip4|ip6|dns|dns4|dns6>/<host>/tcp/<port>");
    }

    const std::string& proto = parts[0];
    const std::string& host = parts[1];
    const std::string& port = parts[3];

    if (proto == "ip4" || proto == "dns" || proto == "dns4" || proto == "dns6") {
        return Result<std::string>::Ok(host + ":" + port);
    }
    if (proto == "ip6") {
        return Result<std::string>::Ok("[" + host + "]:" + port);
    }

    return Result<std::string>::Err(ErrorCode::InvalidFormat,
        "error on multiaddr dialargs: unsupported protocol '" + proto + "'");
}

} // namespace swarmbed::node
