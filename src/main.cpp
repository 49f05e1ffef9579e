#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "node/flavor.hpp"
#include "node/node.hpp"
#include "process/environment.hpp"
#include "testbed/harness_config.hpp"
#include "testbed/registry.hpp"
#include "testbed/shell.hpp"

#include "utils/logger.hpp"
#include "utils/config.hpp"
#include "swarmbed/common.hpp"

namespace {

using swarmbed::Args;
using swarmbed::ErrorCode;
using swarmbed::Result;
using swarmbed::node::Node;
using swarmbed::testbed::NodeRegistry;

void print_usage() {
    std::cerr <<
        "usage: swarmbed [--config <file>] [--log-level <level>] <command> [args]\n"
        "\n"
        "commands:\n"
        "  init -n <count> [--type ipfs|filecoin] [--port-base <port>] [--bin <path>] [--force]\n"
        "  start [<node>...] [-- <daemon args>]\n"
        "  kill [<node>...]\n"
        "  restart [<node>...] [-- <daemon args>]\n"
        "  alive <node>\n"
        "  get <attr> <node>          attr: id, path, api_port, api_addr, bw_in, bw_out\n"
        "  set <attr> <value> <node>  attr: api_port\n"
        "  run <node> -- <cmd>...\n"
        "  shell <node>\n"
        "  logs <node> [--stderr]\n"
        "  dial <node>\n";
}

int report(const swarmbed::Error& error) {
    SWARMBED_LOG_ERROR("{}", error.to_string());
    return 1;
}

Result<size_t> parse_index(const std::string& text) {
    size_t used = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != text.size()) {
        return Result<size_t>::Err(ErrorCode::InvalidArgument, "not a node index: " + text);
    }
    return Result<size_t>::Ok(static_cast<size_t>(value));
}

/**
 * Positional arguments before "--" and everything after it
 */
struct SplitArgs {
    Args positional;
    Args passthrough;
};

SplitArgs split_at_dashes(const Args& args) {
    SplitArgs split;
    bool after = false;
    for (const auto& arg : args) {
        if (!after && arg == "--") {
            after = true;
        } else if (after) {
            split.passthrough.push_back(arg);
        } else {
            split.positional.push_back(arg);
        }
    }
    return split;
}

/**
 * The nodes named by index, or every node when none is named
 */
Result<std::vector<Node>> select_nodes(const NodeRegistry& registry, const Args& indices) {
    if (indices.empty()) {
        return registry.load_all();
    }
    std::vector<Node> nodes;
    for (const auto& text : indices) {
        SWARMBED_TRY_UNWRAP(index, parse_index(text));
        SWARMBED_TRY_UNWRAP(loaded, registry.load(index));
        nodes.push_back(std::move(loaded));
    }
    return Result<std::vector<Node>>::Ok(std::move(nodes));
}

Result<Node> single_node(const NodeRegistry& registry, const std::string& text) {
    SWARMBED_TRY_UNWRAP(index, parse_index(text));
    return registry.load(index);
}

int cmd_init(const NodeRegistry& registry, const Args& args) {
    size_t count = 0;
    auto kind = swarmbed::node::FlavorKind::Ipfs;
    long port_base = swarmbed::constants::DEFAULT_API_PORT_BASE;
    std::string binary;
    bool force = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        const bool has_value = i + 1 < args.size();
        if ((arg == "-n" || arg == "--count") && has_value) {
            auto parsed = parse_index(args[++i]);
            if (parsed.is_err()) {
                return report(parsed.error());
            }
            count = parsed.value();
        } else if (arg == "--type" && has_value) {
            auto parsed = swarmbed::node::parse_flavor(args[++i]);
            if (parsed.is_err()) {
                return report(parsed.error());
            }
            kind = parsed.value();
        } else if (arg == "--port-base" && has_value) {
            auto parsed = parse_index(args[++i]);
            if (parsed.is_err() || parsed.value() == 0 || parsed.value() > 65535) {
                std::cerr << "invalid --port-base: " << args[i] << "\n";
                return 2;
            }
            port_base = static_cast<long>(parsed.value());
        } else if (arg == "--bin" && has_value) {
            binary = args[++i];
        } else if (arg == "--force" || arg == "-f") {
            force = true;
        } else {
            print_usage();
            return 2;
        }
    }
    if (count == 0) {
        print_usage();
        return 2;
    }

    auto created = registry.create(count, kind, static_cast<uint16_t>(port_base), binary, force);
    if (created.is_err()) {
        return report(created.error());
    }

    for (auto& node : created.value()) {
        auto initialized = node.init();
        if (initialized.is_err()) {
            return report(initialized.error());
        }
        auto saved = registry.save(node);
        if (saved.is_err()) {
            return report(saved.error());
        }
    }
    return 0;
}

int start_nodes(const NodeRegistry& registry, std::vector<Node>& nodes, const Args& extra) {
    int status = 0;
    for (auto& node : nodes) {
        auto started = node.start(extra);
        if (started.is_err()) {
            if (started.error().code() == ErrorCode::AlreadyRunning) {
                SWARMBED_LOG_WARN("Node {} is already running", node.dir().string());
            } else {
                status = report(started.error());
            }
        }
        // Keep whatever identity was learned, even from a failed readiness wait
        auto saved = registry.save(node);
        if (saved.is_err()) {
            status = report(saved.error());
        }
    }
    return status;
}

int kill_nodes(std::vector<Node>& nodes) {
    int status = 0;
    for (auto& node : nodes) {
        auto killed = node.kill();
        if (killed.is_err()) {
            if (killed.error().code() == ErrorCode::NotRunning) {
                SWARMBED_LOG_INFO("Node {} is not running", node.dir().string());
            } else {
                status = report(killed.error());
            }
        }
    }
    return status;
}

int cmd_start(const NodeRegistry& registry, const Args& args) {
    auto split = split_at_dashes(args);
    auto nodes = select_nodes(registry, split.positional);
    if (nodes.is_err()) {
        return report(nodes.error());
    }
    return start_nodes(registry, nodes.value(), split.passthrough);
}

int cmd_kill(const NodeRegistry& registry, const Args& args) {
    auto nodes = select_nodes(registry, args);
    if (nodes.is_err()) {
        return report(nodes.error());
    }
    return kill_nodes(nodes.value());
}

int cmd_restart(const NodeRegistry& registry, const Args& args) {
    auto split = split_at_dashes(args);
    auto nodes = select_nodes(registry, split.positional);
    if (nodes.is_err()) {
        return report(nodes.error());
    }
    int status = kill_nodes(nodes.value());
    if (status != 0) {
        return status;
    }
    return start_nodes(registry, nodes.value(), split.passthrough);
}

int cmd_alive(const NodeRegistry& registry, const Args& args) {
    if (args.size() != 1) {
        print_usage();
        return 2;
    }
    auto node = single_node(registry, args[0]);
    if (node.is_err()) {
        return report(node.error());
    }
    auto alive = node.value().is_alive();
    if (alive.is_err()) {
        return report(alive.error());
    }
    std::cout << (alive.value() ? "true" : "false") << std::endl;
    return alive.value() ? 0 : 1;
}

int cmd_get(const NodeRegistry& registry, const Args& args) {
    if (args.size() != 2) {
        print_usage();
        return 2;
    }
    auto node = single_node(registry, args[1]);
    if (node.is_err()) {
        return report(node.error());
    }
    auto value = node.value().get_attr(args[0]);
    if (value.is_err()) {
        return report(value.error());
    }
    std::cout << value.value() << std::endl;
    return 0;
}

int cmd_set(const NodeRegistry& registry, const Args& args) {
    if (args.size() != 3) {
        print_usage();
        return 2;
    }
    auto node = single_node(registry, args[2]);
    if (node.is_err()) {
        return report(node.error());
    }
    auto updated = node.value().set_attr(args[0], args[1]);
    if (updated.is_err()) {
        return report(updated.error());
    }
    auto saved = registry.save(node.value());
    if (saved.is_err()) {
        return report(saved.error());
    }
    return 0;
}

int cmd_run(const NodeRegistry& registry, const Args& args) {
    auto split = split_at_dashes(args);
    if (split.positional.size() != 1 || split.passthrough.empty()) {
        print_usage();
        return 2;
    }
    auto node = single_node(registry, split.positional[0]);
    if (node.is_err()) {
        return report(node.error());
    }
    auto out = node.value().run_cmd(split.passthrough);
    if (out.is_err()) {
        return report(out.error());
    }
    std::cout << out.value();
    return 0;
}

int cmd_shell(const NodeRegistry& registry, const Args& args) {
    if (args.size() != 1) {
        print_usage();
        return 2;
    }
    auto node = single_node(registry, args[0]);
    if (node.is_err()) {
        return report(node.error());
    }
    auto cluster = registry.load_all();
    if (cluster.is_err()) {
        return report(cluster.error());
    }
    // Returns only when the exec did not happen
    auto shell = swarmbed::testbed::exec_shell(node.value(), cluster.value());
    return report(shell.error());
}

int cmd_logs(const NodeRegistry& registry, const Args& args) {
    if (args.empty() || args.size() > 2 || (args.size() == 2 && args[1] != "--stderr")) {
        print_usage();
        return 2;
    }
    auto node = single_node(registry, args[0]);
    if (node.is_err()) {
        return report(node.error());
    }
    const auto path = args.size() == 2 ? node.value().stderr_path() : node.value().stdout_path();
    std::ifstream file(path);
    if (!file.is_open()) {
        return report(swarmbed::Error(ErrorCode::NotRunning,
            "no log at " + path.string(), "node was never started"));
    }
    std::cout << file.rdbuf();
    return 0;
}

int cmd_dial(const NodeRegistry& registry, const Args& args) {
    if (args.size() != 1) {
        print_usage();
        return 2;
    }
    auto node = single_node(registry, args[0]);
    if (node.is_err()) {
        return report(node.error());
    }
    auto addr = node.value().api_addr();
    if (addr.is_err()) {
        return report(addr.error());
    }
    std::cout << addr.value() << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        std::string config_path;
        std::string log_level_override;
        Args args;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (args.empty() && arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (args.empty() && arg == "--log-level" && i + 1 < argc) {
                log_level_override = argv[++i];
            } else if (args.empty() && (arg == "-h" || arg == "--help")) {
                print_usage();
                return 0;
            } else {
                args.push_back(arg);
            }
        }
        if (args.empty()) {
            print_usage();
            return 2;
        }

        const auto env = swarmbed::process::current_environment();

        // Load configuration (or use defaults if file doesn't exist)
        if (config_path.empty()) {
            config_path = (swarmbed::testbed::default_root(env) / swarmbed::constants::CONFIG_NAME).string();
        }
        swarmbed::utils::Config config;
        if (std::filesystem::exists(config_path)) {
            config = swarmbed::utils::Config::load_from_file(config_path);
        }
        auto harness = swarmbed::testbed::HarnessConfig::from_config(config, env);
        if (!log_level_override.empty()) {
            harness.log_level = log_level_override;
        }

        swarmbed::utils::Logger::init(harness.log_level, harness.log_to_file,
            (harness.root / "swarmbed.log").string());
        SWARMBED_LOG_DEBUG("swarmbed v{}.{}.{}, testbed root {}",
            SWARMBED_VERSION_MAJOR, SWARMBED_VERSION_MINOR, SWARMBED_VERSION_PATCH,
            harness.root.string());

        NodeRegistry registry(harness.root, harness.lifecycle);

        const std::string command = args[0];
        const Args rest(args.begin() + 1, args.end());

        if (command == "init") return cmd_init(registry, rest);
        if (command == "start") return cmd_start(registry, rest);
        if (command == "kill") return cmd_kill(registry, rest);
        if (command == "restart") return cmd_restart(registry, rest);
        if (command == "alive") return cmd_alive(registry, rest);
        if (command == "get") return cmd_get(registry, rest);
        if (command == "set") return cmd_set(registry, rest);
        if (command == "run") return cmd_run(registry, rest);
        if (command == "shell") return cmd_shell(registry, rest);
        if (command == "logs") return cmd_logs(registry, rest);
        if (command == "dial") return cmd_dial(registry, rest);

        std::cerr << "unknown command: " << command << "\n";
        print_usage();
        return 2;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
