#pragma once

#include "swarmbed/common.hpp"
#include "swarmbed/error.hpp"
#include "node/bandwidth.hpp"
#include "node/flavor.hpp"
#include "node/readiness.hpp"
#include "process/shutdown.hpp"
#include "utils/config.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace swarmbed::node {

/**
 * What identifies a node on disk; persisted as nodespec.json
 */
struct NodeSpec {
    FlavorKind kind = FlavorKind::Ipfs;
    std::filesystem::path dir;
    uint16_t api_port = 0;
    std::string binary;     // empty: the flavor's default binary
    std::string peer_id;    // empty until discovered
};

void to_json(utils::json& j, const NodeSpec& spec);
void from_json(const utils::json& j, NodeSpec& spec);

/**
 * Timing and locking knobs shared by every node of a testbed
 */
struct LifecycleSettings {
    process::EscalationPolicy escalation;
    ReadinessPolicy readiness;
    bool lock_pid_file = true;
    std::chrono::milliseconds command_timeout{30000};
};

/**
 * One managed daemon instance and its data directory.
 *
 * A Node holds no process handle: whether it runs is always read back from
 * the PID file, so any invocation can manage a node another one started.
 */
class Node {
public:
    explicit Node(NodeSpec spec, LifecycleSettings settings = {});
    ~Node();

    Node(Node&&) noexcept;
    Node& operator=(Node&&) noexcept;
    SWARMBED_DISALLOW_COPY(Node);

    /**
     * Create the directory and bootstrap the daemon's on-disk state
     */
    Result<void> init();

    /**
     * Launch the daemon and wait until it answers identity queries.
     * The discovered peer id is recorded on the node.
     */
    Result<void> start(const Args& extra_args = {});

    /**
     * Stop the daemon through the shutdown escalation
     */
    Result<void> kill();

    Result<bool> is_alive() const;

    /**
     * Run `args` with this node's environment
     * @return stdout, or CommandFailed carrying both output streams
     */
    Result<std::string> run_cmd(const Args& args) const;

    /**
     * Ask the running daemon for its identity (one attempt)
     */
    Result<std::string> query_identity() const;

    /**
     * Dial address (host:port) read from the daemon's api file
     */
    Result<std::string> api_addr() const;

    /**
     * Attributes: id, path, api_port, api_addr, bw_in, bw_out
     */
    Result<std::string> get_attr(const std::string& name) const;
    Result<void> set_attr(const std::string& name, const std::string& value);

    Result<BandwidthStats> bandwidth() const;

    Result<utils::Config> get_config() const;
    Result<void> write_config(const utils::Config& config) const;

    /**
     * Environment the daemon and commands against it run with
     */
    Environment environment() const;

    std::filesystem::path stdout_path() const;
    std::filesystem::path stderr_path() const;

    const NodeSpec& spec() const;
    const DaemonFlavor& flavor() const;
    const std::filesystem::path& dir() const;
    const std::string& peer_id() const;
    void set_peer_id(std::string peer_id);
    std::string binary() const;
    uint16_t api_port() const;

    const LifecycleSettings& settings() const;
    void set_settings(LifecycleSettings settings);

    /**
     * Peer id, as the node introduces itself in listings
     */
    std::string to_string() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace swarmbed::node
