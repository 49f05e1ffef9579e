#include "node/node.hpp"
#include "node/multiaddr.hpp"
#include "process/command.hpp"
#include "process/environment.hpp"
#include "process/launcher.hpp"
#include "process/liveness.hpp"
#include "utils/logger.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace swarmbed::node {

namespace fs = std::filesystem;

void to_json(utils::json& j, const NodeSpec& spec) {
    j = utils::json{
        {"type", flavor_for(spec.kind).name},
        {"dir", spec.dir.string()},
        {"api_port", spec.api_port},
        {"bin", spec.binary},
        {"peer_id", spec.peer_id},
    };
}

void from_json(const utils::json& j, NodeSpec& spec) {
    auto kind = parse_flavor(j.at("type").get<std::string>());
    if (kind.is_err()) {
        throw ConfigException(ErrorCode::InvalidFormat, kind.error().message());
    }
    spec.kind = kind.value();
    spec.dir = j.at("dir").get<std::string>();
    spec.api_port = j.value("api_port", static_cast<uint16_t>(0));
    spec.binary = j.value("bin", std::string());
    spec.peer_id = j.value("peer_id", std::string());
}

class Node::Impl {
public:
    NodeSpec spec;
    LifecycleSettings settings;

    Impl(NodeSpec s, LifecycleSettings st)
        : spec(std::move(s)), settings(std::move(st)) {}

    const DaemonFlavor& flavor() const { return flavor_for(spec.kind); }

    std::string binary() const {
        return spec.binary.empty() ? std::string(flavor().default_binary) : spec.binary;
    }

    fs::path config_path() const {
        return spec.dir / constants::CONFIG_FILE_NAME;
    }
};

Node::Node(NodeSpec spec, LifecycleSettings settings)
    : impl_(std::make_unique<Impl>(std::move(spec), std::move(settings)))
{
    impl_->settings.escalation.lock_pid_file = impl_->settings.lock_pid_file;
}

Node::~Node() = default;
Node::Node(Node&&) noexcept = default;
Node& Node::operator=(Node&&) noexcept = default;

Result<void> Node::init() {
    std::error_code ec;
    fs::create_directories(impl_->spec.dir, ec);
    if (ec) {
        return Result<void>::Err(ErrorCode::PersistFailed,
            "cannot create node directory " + impl_->spec.dir.string(), ec.message());
    }

    const auto& fl = flavor();
    if (!fl.init_args.empty()) {
        Args args{binary()};
        args.insert(args.end(), fl.init_args.begin(), fl.init_args.end());
        SWARMBED_LOG_INFO("Initializing {} node in {}", fl.name, impl_->spec.dir.string());
        SWARMBED_TRY(run_cmd(args));
    }

    if (fl.api_port_in_config && impl_->spec.api_port != 0) {
        SWARMBED_TRY_UNWRAP(config, get_config());
        auto& addresses = config.data()["Addresses"];
        addresses["API"] = loopback_multiaddr(impl_->spec.api_port);
        addresses["Swarm"] = utils::json::array({loopback_multiaddr(0)});
        SWARMBED_TRY(write_config(config));
    }

    if (fl.identity_in_config) {
        SWARMBED_TRY_UNWRAP(config, get_config());
        impl_->spec.peer_id = config.get_path("Identity.PeerID").value_or("");
    }

    return Result<void>::Ok();
}

Result<void> Node::start(const Args& extra_args) {
    const auto& fl = flavor();

    process::LaunchSpec launch;
    launch.binary = binary();
    launch.args = daemon_args(fl, impl_->spec.api_port, extra_args);
    launch.dir = impl_->spec.dir;
    launch.env = environment();
    launch.lock_pid_file = impl_->settings.lock_pid_file;

    SWARMBED_TRY(process::start_process(launch));

    std::string config_peer;
    if (fl.identity_in_config) {
        auto config = get_config();
        if (config.is_ok()) {
            config_peer = config.value().get_path("Identity.PeerID").value_or("");
        } else {
            SWARMBED_LOG_WARN("Cannot read identity from config of {}: {}",
                impl_->spec.dir.string(), config.error().to_string());
        }
    }

    auto ready = wait_until_ready([this]() { return query_identity(); }, impl_->settings.readiness);
    if (ready.is_err()) {
        SWARMBED_LOG_ERROR("Daemon {} is running but never became ready; see {}",
            impl_->spec.dir.string(), stderr_path().string());
        if (!config_peer.empty()) {
            impl_->spec.peer_id = config_peer;
        }
        return ready.error();
    }

    std::string peer = ready.value();
    if (peer.empty()) {
        peer = config_peer;
    } else if (!config_peer.empty() && peer != config_peer) {
        SWARMBED_LOG_WARN("Node {} reports id {} but its config says {}",
            impl_->spec.dir.string(), peer, config_peer);
    }
    impl_->spec.peer_id = peer;

    SWARMBED_LOG_INFO("Node {} ready, peer id {}", impl_->spec.dir.string(),
        peer.empty() ? "<unknown>" : peer);
    return Result<void>::Ok();
}

Result<void> Node::kill() {
    return process::kill_daemon(impl_->spec.dir, impl_->settings.escalation);
}

Result<bool> Node::is_alive() const {
    return process::is_alive(impl_->spec.dir);
}

Result<std::string> Node::run_cmd(const Args& args) const {
    process::CommandOptions options;
    options.argv = args;
    options.env = environment();
    options.working_dir = impl_->spec.dir;
    options.timeout = impl_->settings.command_timeout;
    return process::run_command(options);
}

Result<std::string> Node::query_identity() const {
    Args args{binary()};
    const auto& id_args = flavor().identity_args;
    args.insert(args.end(), id_args.begin(), id_args.end());
    return run_cmd(args);
}

Result<std::string> Node::api_addr() const {
    const auto path = impl_->spec.dir / constants::API_FILE_NAME;
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<std::string>::Err(ErrorCode::NotRunning,
            "no api file for node " + impl_->spec.dir.string());
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return to_dial_address(contents.str());
}

Result<std::string> Node::get_attr(const std::string& name) const {
    if (name == "id") {
        return Result<std::string>::Ok(impl_->spec.peer_id);
    }
    if (name == "path") {
        return Result<std::string>::Ok(impl_->spec.dir.string());
    }
    if (name == "api_port") {
        return Result<std::string>::Ok(std::to_string(impl_->spec.api_port));
    }
    if (name == "api_addr") {
        return api_addr();
    }
    if (name == "bw_in" || name == "bw_out") {
        SWARMBED_TRY_UNWRAP(bw, bandwidth());
        return Result<std::string>::Ok(std::to_string(name == "bw_in" ? bw.total_in : bw.total_out));
    }
    return Result<std::string>::Err(ErrorCode::UnknownAttribute, "unrecognized attribute: " + name);
}

Result<void> Node::set_attr(const std::string& name, const std::string& value) {
    if (name == "api_port" && !flavor().api_port_in_config) {
        unsigned long port = 0;
        try {
            size_t used = 0;
            port = std::stoul(value, &used);
            if (used != value.size()) {
                port = 0;
            }
        } catch (const std::logic_error&) {
            port = 0;
        }
        if (port == 0 || port > 65535) {
            return Result<void>::Err(ErrorCode::InvalidArgument, "invalid port: " + value);
        }
        impl_->spec.api_port = static_cast<uint16_t>(port);
        return Result<void>::Ok();
    }
    return Result<void>::Err(ErrorCode::UnknownAttribute, "no attribute named " + name + " to set");
}

Result<BandwidthStats> Node::bandwidth() const {
    SWARMBED_TRY_UNWRAP(out, run_cmd({binary(), "stats", "bw", "--enc=json"}));
    return parse_bandwidth(out);
}

Result<utils::Config> Node::get_config() const {
    try {
        return Result<utils::Config>::Ok(utils::Config::load_from_file(impl_->config_path().string()));
    } catch (const ConfigException& e) {
        return Result<utils::Config>::Err(ErrorCode::ConfigReadFailed, e.what());
    }
}

Result<void> Node::write_config(const utils::Config& config) const {
    try {
        config.save_to_file(impl_->config_path().string());
    } catch (const ConfigException& e) {
        return Result<void>::Err(ErrorCode::ConfigWriteFailed, e.what());
    }
    return Result<void>::Ok();
}

Environment Node::environment() const {
    std::vector<process::EnvOverride> overrides{
        {flavor().path_env, impl_->spec.dir.string()},
    };
    if (flavor().api_env != nullptr && impl_->spec.api_port != 0) {
        overrides.emplace_back(flavor().api_env, std::to_string(impl_->spec.api_port));
    }
    return process::derive_environment(process::current_environment(), overrides);
}

std::filesystem::path Node::stdout_path() const {
    return impl_->spec.dir / constants::STDOUT_FILE_NAME;
}

std::filesystem::path Node::stderr_path() const {
    return impl_->spec.dir / constants::STDERR_FILE_NAME;
}

const NodeSpec& Node::spec() const {
    return impl_->spec;
}

const DaemonFlavor& Node::flavor() const {
    return impl_->flavor();
}

const std::filesystem::path& Node::dir() const {
    return impl_->spec.dir;
}

const std::string& Node::peer_id() const {
    return impl_->spec.peer_id;
}

void Node::set_peer_id(std::string peer_id) {
    impl_->spec.peer_id = std::move(peer_id);
}

std::string Node::binary() const {
    return impl_->binary();
}

uint16_t Node::api_port() const {
    return impl_->spec.api_port;
}

const LifecycleSettings& Node::settings() const {
    return impl_->settings;
}

void Node::set_settings(LifecycleSettings settings) {
    impl_->settings = std::move(settings);
    impl_->settings.escalation.lock_pid_file = impl_->settings.lock_pid_file;
}

std::string Node::to_string() const {
    return impl_->spec.peer_id;
}

} // namespace swarmbed::node
