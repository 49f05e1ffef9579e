#include "testbed/registry.hpp"
#include "process/liveness.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <system_error>

namespace swarmbed::testbed {

namespace fs = std::filesystem;

namespace {

// Node directories are short decimal numbers; anything longer is not ours
constexpr size_t MAX_INDEX_DIGITS = 9;

bool is_index(const std::string& name) {
    return !name.empty() && name.size() <= MAX_INDEX_DIGITS && std::all_of(name.begin(), name.end(),
        [](char c) { return c >= '0' && c <= '9'; });
}

} // namespace

NodeRegistry::NodeRegistry(std::filesystem::path root, node::LifecycleSettings settings)
    : root_(std::move(root))
    , settings_(std::move(settings))
{
}

std::filesystem::path NodeRegistry::testbed_dir() const {
    return root_ / "testbed";
}

std::filesystem::path NodeRegistry::node_dir(size_t index) const {
    return testbed_dir() / std::to_string(index);
}

Result<node::Node> NodeRegistry::load_dir(const std::filesystem::path& dir) const {
    const auto spec_path = dir / constants::NODESPEC_FILE_NAME;
    try {
        auto doc = utils::Config::load_from_file(spec_path.string());
        auto spec = doc.data().get<node::NodeSpec>();
        return Result<node::Node>::Ok(node::Node(std::move(spec), settings_));
    } catch (const ConfigException& e) {
        return Result<node::Node>::Err(ErrorCode::RegistryLoadFailed,
            "cannot load node spec " + spec_path.string(), e.what());
    } catch (const utils::json::exception& e) {
        return Result<node::Node>::Err(ErrorCode::RegistryLoadFailed,
            "malformed node spec " + spec_path.string(), e.what());
    }
}

Result<node::Node> NodeRegistry::load(size_t index) const {
    const auto dir = node_dir(index);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Result<node::Node>::Err(ErrorCode::RegistryLoadFailed,
            "no node " + std::to_string(index) + " in testbed " + testbed_dir().string());
    }
    return load_dir(dir);
}

Result<std::vector<node::Node>> NodeRegistry::load_all() const {
    std::error_code ec;
    std::vector<size_t> indices;
    for (fs::directory_iterator it(testbed_dir(), ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (it->is_directory() && is_index(name)) {
            indices.push_back(static_cast<size_t>(std::stoull(name)));
        }
    }
    if (ec) {
        return Result<std::vector<node::Node>>::Err(ErrorCode::RegistryLoadFailed,
            "cannot list testbed " + testbed_dir().string(), ec.message());
    }

    std::sort(indices.begin(), indices.end());

    std::vector<node::Node> nodes;
    nodes.reserve(indices.size());
    for (size_t index : indices) {
        SWARMBED_TRY_UNWRAP(loaded, load(index));
        nodes.push_back(std::move(loaded));
    }
    return Result<std::vector<node::Node>>::Ok(std::move(nodes));
}

Result<void> NodeRegistry::save(const node::Node& node) const {
    const auto spec_path = node.dir() / constants::NODESPEC_FILE_NAME;
    try {
        utils::Config doc(utils::json(node.spec()));
        doc.save_to_file(spec_path.string());
    } catch (const ConfigException& e) {
        return Result<void>::Err(ErrorCode::ConfigWriteFailed,
            "cannot write node spec " + spec_path.string(), e.what());
    }
    return Result<void>::Ok();
}

Result<std::vector<node::Node>> NodeRegistry::create(size_t count,
                                                     node::FlavorKind kind,
                                                     uint16_t api_port_base,
                                                     const std::string& binary,
                                                     bool force) const {
    if (count == 0) {
        return Result<std::vector<node::Node>>::Err(ErrorCode::InvalidArgument, "need at least one node");
    }
    if (static_cast<size_t>(api_port_base) + count - 1 > 65535) {
        return Result<std::vector<node::Node>>::Err(ErrorCode::InvalidArgument,
            "api ports starting at " + std::to_string(api_port_base) + " overflow for "
            + std::to_string(count) + " nodes");
    }

    std::error_code ec;
    const auto dir = testbed_dir();
    if (fs::exists(dir, ec)) {
        if (!force) {
            return Result<std::vector<node::Node>>::Err(ErrorCode::InvalidArgument,
                "testbed already exists at " + dir.string(), "pass --force to overwrite");
        }

        // Never pull a directory out from under a live daemon
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            auto alive = process::is_alive(it->path());
            if (alive.is_ok() && alive.value()) {
                return Result<std::vector<node::Node>>::Err(ErrorCode::AlreadyRunning,
                    "node in " + it->path().string() + " is still running");
            }
        }

        SWARMBED_LOG_INFO("Removing existing testbed at {}", dir.string());
        fs::remove_all(dir, ec);
        if (ec) {
            return Result<std::vector<node::Node>>::Err(ErrorCode::PersistFailed,
                "cannot remove old testbed " + dir.string(), ec.message());
        }
    }

    std::vector<node::Node> nodes;
    nodes.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        node::NodeSpec spec;
        spec.kind = kind;
        spec.dir = node_dir(i);
        spec.api_port = static_cast<uint16_t>(api_port_base + i);
        spec.binary = binary;

        fs::create_directories(spec.dir, ec);
        if (ec) {
            return Result<std::vector<node::Node>>::Err(ErrorCode::PersistFailed,
                "cannot create " + spec.dir.string(), ec.message());
        }

        node::Node created(std::move(spec), settings_);
        SWARMBED_TRY(save(created));
        nodes.push_back(std::move(created));
    }

    SWARMBED_LOG_INFO("Created testbed of {} {} nodes at {}",
        count, node::flavor_for(kind).name, dir.string());
    return Result<std::vector<node::Node>>::Ok(std::move(nodes));
}

} // namespace swarmbed::testbed
