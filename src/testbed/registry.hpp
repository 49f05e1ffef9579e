#pragma once

#include "swarmbed/common.hpp"
#include "swarmbed/error.hpp"
#include "node/node.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace swarmbed::testbed {

/**
 * The set of nodes configured under a testbed root.
 *
 * Layout: <root>/testbed/<index>/nodespec.json, one directory per node,
 * indices starting at 0. The node directory itself is the daemon's data dir.
 */
class NodeRegistry {
public:
    explicit NodeRegistry(std::filesystem::path root, node::LifecycleSettings settings = {});

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path testbed_dir() const;
    std::filesystem::path node_dir(size_t index) const;

    /**
     * Every configured node, ordered by index
     */
    Result<std::vector<node::Node>> load_all() const;

    Result<node::Node> load(size_t index) const;

    /**
     * Persist a node's spec (including its discovered peer id)
     */
    Result<void> save(const node::Node& node) const;

    /**
     * Lay out `count` fresh node directories with specs; API ports are
     * assigned from `api_port_base` upwards. Refuses to overwrite an
     * existing testbed unless `force` is set, and never while any of its
     * nodes is running.
     */
    Result<std::vector<node::Node>> create(size_t count,
                                           node::FlavorKind kind,
                                           uint16_t api_port_base,
                                           const std::string& binary = "",
                                           bool force = false) const;

private:
    Result<node::Node> load_dir(const std::filesystem::path& dir) const;

    std::filesystem::path root_;
    node::LifecycleSettings settings_;
};

} // namespace swarmbed::testbed
