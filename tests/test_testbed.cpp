#include "process/environment.hpp"
#include "process/pid_file.hpp"
#include "testbed/harness_config.hpp"
#include "testbed/registry.hpp"
#include "testbed/shell.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace swarmbed;
using namespace swarmbed::testbed;
using swarmbed::node::FlavorKind;
using swarmbed::node::Node;
using swarmbed::node::NodeSpec;
using swarmbed::testing::write_file;

namespace fs = std::filesystem;

class RegistryTest : public swarmbed::testing::ScratchDirTest {
protected:
    RegistryTest() : ScratchDirTest("test_registry_data") {}
};

TEST_F(RegistryTest, CreateLaysOutNumberedNodes) {
    NodeRegistry registry(test_dir);
    auto nodes = registry.create(3, FlavorKind::Ipfs, 5001);
    ASSERT_TRUE(nodes.is_ok()) << nodes.error().to_string();
    ASSERT_EQ(nodes.value().size(), 3u);

    for (size_t i = 0; i < 3; ++i) {
        const auto& node = nodes.value()[i];
        EXPECT_EQ(node.dir(), test_dir / "testbed" / std::to_string(i));
        EXPECT_EQ(node.api_port(), 5001 + i);
        EXPECT_TRUE(fs::exists(node.dir() / "nodespec.json"));
    }
}

TEST_F(RegistryTest, LoadAllIsOrderedByIndex) {
    NodeRegistry registry(test_dir);
    ASSERT_TRUE(registry.create(12, FlavorKind::Filecoin, 3000).is_ok());

    auto nodes = registry.load_all();
    ASSERT_TRUE(nodes.is_ok()) << nodes.error().to_string();
    ASSERT_EQ(nodes.value().size(), 12u);
    for (size_t i = 0; i < 12; ++i) {
        EXPECT_EQ(nodes.value()[i].dir(), registry.node_dir(i));
        EXPECT_EQ(nodes.value()[i].flavor().kind, FlavorKind::Filecoin);
    }
}

TEST_F(RegistryTest, SavedPeerIdSurvivesReload) {
    NodeRegistry registry(test_dir);
    auto nodes = registry.create(2, FlavorKind::Ipfs, 5001);
    ASSERT_TRUE(nodes.is_ok());

    auto& node = nodes.value()[1];
    node.set_peer_id("QmSaved");
    ASSERT_TRUE(registry.save(node).is_ok());

    auto loaded = registry.load(1);
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().peer_id(), "QmSaved");
    EXPECT_TRUE(registry.load(0).value().peer_id().empty());
}

TEST_F(RegistryTest, ExistingTestbedNeedsForce) {
    NodeRegistry registry(test_dir);
    ASSERT_TRUE(registry.create(2, FlavorKind::Ipfs, 5001).is_ok());

    auto again = registry.create(1, FlavorKind::Ipfs, 5001);
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.error().code(), ErrorCode::InvalidArgument);

    auto forced = registry.create(1, FlavorKind::Ipfs, 5001, "", true);
    ASSERT_TRUE(forced.is_ok());
    EXPECT_EQ(registry.load_all().value().size(), 1u);
}

TEST_F(RegistryTest, ForceRefusesWhileANodeRuns) {
    NodeRegistry registry(test_dir);
    ASSERT_TRUE(registry.create(1, FlavorKind::Ipfs, 5001).is_ok());

    // This test process stands in for a running daemon
    ASSERT_TRUE(process::write_pid_file(registry.node_dir(0), ::getpid()).is_ok());
    auto forced = registry.create(1, FlavorKind::Ipfs, 5001, "", true);
    ASSERT_TRUE(forced.is_err());
    EXPECT_EQ(forced.error().code(), ErrorCode::AlreadyRunning);
    EXPECT_TRUE(fs::exists(registry.node_dir(0)));
}

TEST_F(RegistryTest, BadArgumentsAreRejected) {
    NodeRegistry registry(test_dir);
    EXPECT_EQ(registry.create(0, FlavorKind::Ipfs, 5001).error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(registry.create(10, FlavorKind::Ipfs, 65530).error().code(), ErrorCode::InvalidArgument);
}

TEST_F(RegistryTest, MissingOrBrokenStateFailsToLoad) {
    NodeRegistry registry(test_dir);
    EXPECT_EQ(registry.load_all().error().code(), ErrorCode::RegistryLoadFailed);
    EXPECT_EQ(registry.load(0).error().code(), ErrorCode::RegistryLoadFailed);

    ASSERT_TRUE(registry.create(1, FlavorKind::Ipfs, 5001).is_ok());
    write_file(registry.node_dir(0) / "nodespec.json", "{\"type\": \"ipfs\"}");
    EXPECT_EQ(registry.load(0).error().code(), ErrorCode::RegistryLoadFailed);

    write_file(registry.node_dir(0) / "nodespec.json", "{\"type\": \"bitcoin\", \"dir\": \"/x\"}");
    EXPECT_EQ(registry.load(0).error().code(), ErrorCode::RegistryLoadFailed);
}

TEST_F(RegistryTest, NonNumericEntriesAreIgnored) {
    NodeRegistry registry(test_dir);
    ASSERT_TRUE(registry.create(2, FlavorKind::Ipfs, 5001).is_ok());
    fs::create_directories(registry.testbed_dir() / "scratch");
    fs::create_directories(registry.testbed_dir() / "123456789012345678901234567890");
    write_file(registry.testbed_dir() / "notes.txt", "hello");

    auto nodes = registry.load_all();
    ASSERT_TRUE(nodes.is_ok());
    EXPECT_EQ(nodes.value().size(), 2u);
}

namespace {

std::vector<Node> cluster_with_peers(const std::vector<std::string>& peers) {
    std::vector<Node> nodes;
    for (size_t i = 0; i < peers.size(); ++i) {
        NodeSpec spec;
        spec.kind = FlavorKind::Ipfs;
        spec.dir = "/testbed/" + std::to_string(i);
        spec.peer_id = peers[i];
        nodes.emplace_back(std::move(spec));
    }
    return nodes;
}

} // namespace

TEST(ShellEnvironmentTest, OneVariablePerNode) {
    auto cluster = cluster_with_peers({"QmA", "QmB", "QmC"});
    Environment base{"HOME=/root", "NODE1=stale", "IPFS_PATH=/elsewhere"};

    auto env = shell_environment(base, cluster[2], cluster);
    ASSERT_TRUE(env.is_ok()) << env.error().to_string();

    EXPECT_EQ(process::env_lookup(env.value(), "IPFS_PATH"), "/testbed/2");
    EXPECT_EQ(process::env_lookup(env.value(), "NODE0"), "QmA");
    EXPECT_EQ(process::env_lookup(env.value(), "NODE1"), "QmB");
    EXPECT_EQ(process::env_lookup(env.value(), "NODE2"), "QmC");
    EXPECT_EQ(process::env_lookup(env.value(), "HOME"), "/root");
    EXPECT_EQ(env.value().size(), 5u);
}

TEST(ShellEnvironmentTest, MissingIdentityIsAnError) {
    auto cluster = cluster_with_peers({"QmA", ""});
    auto env = shell_environment(Environment{}, cluster[0], cluster);
    ASSERT_TRUE(env.is_err());
    EXPECT_EQ(env.error().code(), ErrorCode::IdentityMissing);
}

TEST(HarnessConfigTest, DefaultsWithoutFile) {
    Environment env{"HOME=/home/tester"};
    auto harness = HarnessConfig::from_config(utils::Config(), env);

    EXPECT_EQ(harness.log_level, "info");
    EXPECT_FALSE(harness.log_to_file);
    EXPECT_EQ(harness.root, fs::path("/home/tester/testbed"));
    EXPECT_EQ(harness.lifecycle.escalation.interrupt_wait.count(), 1000);
    EXPECT_EQ(harness.lifecycle.escalation.quit_wait.count(), 5000);
    EXPECT_FALSE(harness.lifecycle.escalation.kill_confirm_timeout.has_value());
    EXPECT_EQ(harness.lifecycle.readiness.attempts, 10u);
    EXPECT_TRUE(harness.lifecycle.lock_pid_file);
}

TEST(HarnessConfigTest, FileOverridesDefaults) {
    auto config = utils::Config::load_from_json(R"({
        "log_level": "debug",
        "testbed_root": "/srv/bed",
        "interrupt_wait_ms": 250,
        "quit_wait_ms": 750,
        "kill_confirm_timeout_ms": 3000,
        "ready_attempts": 4,
        "ready_strict": false,
        "lock_pid_file": false
    })");
    auto harness = HarnessConfig::from_config(config, Environment{"HOME=/home/tester"});

    EXPECT_EQ(harness.log_level, "debug");
    EXPECT_EQ(harness.root, fs::path("/srv/bed"));
    EXPECT_EQ(harness.lifecycle.escalation.interrupt_wait.count(), 250);
    EXPECT_EQ(harness.lifecycle.escalation.quit_wait.count(), 750);
    ASSERT_TRUE(harness.lifecycle.escalation.kill_confirm_timeout.has_value());
    EXPECT_EQ(harness.lifecycle.escalation.kill_confirm_timeout->count(), 3000);
    EXPECT_EQ(harness.lifecycle.readiness.attempts, 4u);
    EXPECT_FALSE(harness.lifecycle.readiness.strict);
    EXPECT_FALSE(harness.lifecycle.lock_pid_file);
    EXPECT_FALSE(harness.lifecycle.escalation.lock_pid_file);

    auto round = HarnessConfig::from_config(harness.to_config(), Environment{});
    EXPECT_EQ(round.lifecycle.escalation.quit_wait.count(), 750);
}

TEST(HarnessConfigTest, EnvironmentRootWins) {
    auto config = utils::Config::load_from_json(R"({"testbed_root": "/srv/bed"})");
    auto harness = HarnessConfig::from_config(config, Environment{"SWARMBED_ROOT=/tmp/other"});
    EXPECT_EQ(harness.root, fs::path("/tmp/other"));

    EXPECT_EQ(default_root(Environment{}), fs::path("testbed"));
}
