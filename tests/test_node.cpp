#include "node/node.hpp"
#include "process/environment.hpp"
#include "process/pid_file.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace swarmbed;
using namespace swarmbed::node;
using swarmbed::testing::read_file;

namespace fs = std::filesystem;

class NodeTest : public swarmbed::testing::ScratchDirTest {
protected:
    NodeTest() : ScratchDirTest("test_node_data") {}

    static LifecycleSettings quick_settings() {
        LifecycleSettings settings;
        settings.escalation.interrupt_wait = std::chrono::milliseconds(100);
        settings.escalation.quit_wait = std::chrono::milliseconds(100);
        settings.escalation.kill_confirm_timeout = std::chrono::milliseconds(2000);
        settings.readiness.initial_delay = std::chrono::milliseconds(20);
        settings.readiness.retry_interval = std::chrono::milliseconds(50);
        settings.readiness.attempts = 20;
        settings.command_timeout = std::chrono::milliseconds(5000);
        return settings;
    }

    Node make_node(FlavorKind kind, uint16_t api_port, const std::string& name = "0") {
        NodeSpec spec;
        spec.kind = kind;
        spec.dir = test_dir / name;
        spec.api_port = api_port;
        spec.binary = SWARMBED_FAKE_DAEMON;
        return Node(std::move(spec), quick_settings());
    }

    void TearDown() override {
        for (const auto& name : {"0", "1"}) {
            if (process::read_pid_file(test_dir / name).value_or(std::nullopt)) {
                auto node = make_node(FlavorKind::Ipfs, 0, name);
                EXPECT_TRUE(node.kill().is_ok());
            }
        }
        ScratchDirTest::TearDown();
    }
};

TEST_F(NodeTest, InitBootstrapsIpfsNode) {
    auto node = make_node(FlavorKind::Ipfs, 45001);
    auto initialized = node.init();
    ASSERT_TRUE(initialized.is_ok()) << initialized.error().to_string();

    EXPECT_TRUE(fs::exists(node.dir() / "config"));
    EXPECT_EQ(node.peer_id().rfind("QmFake", 0), 0u);

    auto config = node.get_config();
    ASSERT_TRUE(config.is_ok());
    EXPECT_EQ(config.value().get_path("Addresses.API").value_or(""), "/ip4/127.0.0.1/tcp/45001");
    EXPECT_EQ(config.value().get_path("Identity.PeerID").value_or(""), node.peer_id());
}

TEST_F(NodeTest, StartDiscoversIdentityAndKillStops) {
    auto node = make_node(FlavorKind::Ipfs, 45002);
    ASSERT_TRUE(node.init().is_ok());
    const std::string config_peer = node.peer_id();
    node.set_peer_id("");

    auto started = node.start();
    ASSERT_TRUE(started.is_ok()) << started.error().to_string();
    EXPECT_EQ(node.peer_id(), config_peer);
    EXPECT_EQ(node.to_string(), config_peer);

    auto alive = node.is_alive();
    ASSERT_TRUE(alive.is_ok());
    EXPECT_TRUE(alive.value());
    EXPECT_TRUE(fs::exists(node.dir() / "daemon.pid"));

    auto addr = node.api_addr();
    ASSERT_TRUE(addr.is_ok()) << addr.error().to_string();
    EXPECT_EQ(addr.value(), "127.0.0.1:45002");
    EXPECT_EQ(node.get_attr("api_addr").value_or(""), "127.0.0.1:45002");

    auto killed = node.kill();
    ASSERT_TRUE(killed.is_ok()) << killed.error().to_string();
    EXPECT_FALSE(node.is_alive().value());
    EXPECT_FALSE(fs::exists(node.dir() / "daemon.pid"));
    EXPECT_NE(read_file(node.stderr_path()).find("shutting down"), std::string::npos);
}

TEST_F(NodeTest, StartingTwiceIsRefused) {
    auto node = make_node(FlavorKind::Ipfs, 45003);
    ASSERT_TRUE(node.init().is_ok());
    ASSERT_TRUE(node.start().is_ok());

    auto pid_before = read_file(node.dir() / "daemon.pid");
    auto again = node.start();
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.error().code(), ErrorCode::AlreadyRunning);
    EXPECT_EQ(read_file(node.dir() / "daemon.pid"), pid_before);
}

TEST_F(NodeTest, NodeCanBeRestarted) {
    auto node = make_node(FlavorKind::Ipfs, 45004);
    ASSERT_TRUE(node.init().is_ok());

    for (int round = 0; round < 3; ++round) {
        ASSERT_TRUE(node.start().is_ok());
        ASSERT_TRUE(node.kill().is_ok());
        EXPECT_FALSE(node.is_alive().value());
    }
}

TEST_F(NodeTest, SlowDaemonIsWaitedFor) {
    auto node = make_node(FlavorKind::Ipfs, 45005);
    ASSERT_TRUE(node.init().is_ok());

    auto started = node.start({"--slow-start=300"});
    ASSERT_TRUE(started.is_ok()) << started.error().to_string();
    EXPECT_FALSE(node.peer_id().empty());
}

TEST_F(NodeTest, DaemonThatNeverAnswersTimesOut) {
    auto settings = quick_settings();
    settings.readiness.attempts = 3;
    auto node = make_node(FlavorKind::Ipfs, 45006);
    node.set_settings(settings);
    ASSERT_TRUE(node.init().is_ok());

    auto started = node.start({"--never-ready"});
    ASSERT_TRUE(started.is_err());
    EXPECT_EQ(started.error().code(), ErrorCode::ReadinessTimeout);

    // The process is up and still tracked so it can be stopped
    EXPECT_TRUE(node.is_alive().value());
    ASSERT_TRUE(node.kill().is_ok());
}

TEST_F(NodeTest, LenientReadinessFallsBackToConfigIdentity) {
    auto settings = quick_settings();
    settings.readiness.attempts = 2;
    settings.readiness.strict = false;
    auto node = make_node(FlavorKind::Ipfs, 45007);
    node.set_settings(settings);
    ASSERT_TRUE(node.init().is_ok());
    const std::string config_peer = node.peer_id();

    auto started = node.start({"--never-ready"});
    ASSERT_TRUE(started.is_ok());
    EXPECT_EQ(node.peer_id(), config_peer);
}

TEST_F(NodeTest, StubbornDaemonIsStillStopped) {
    auto node = make_node(FlavorKind::Ipfs, 45008);
    ASSERT_TRUE(node.init().is_ok());
    ASSERT_TRUE(node.start({"--ignore-signals"}).is_ok());

    auto killed = node.kill();
    ASSERT_TRUE(killed.is_ok()) << killed.error().to_string();
    EXPECT_FALSE(node.is_alive().value());
}

TEST_F(NodeTest, FilecoinNodeUsesFlagsAndApiVariable) {
    auto node = make_node(FlavorKind::Filecoin, 46001);
    ASSERT_TRUE(node.init().is_ok());
    EXPECT_TRUE(fs::is_directory(node.dir()));
    EXPECT_FALSE(fs::exists(node.dir() / "config"));

    auto env = node.environment();
    EXPECT_EQ(process::env_lookup(env, "FIL_PATH"), node.dir().string());
    EXPECT_EQ(process::env_lookup(env, "FIL_API"), "46001");

    auto started = node.start();
    ASSERT_TRUE(started.is_ok()) << started.error().to_string();
    EXPECT_EQ(node.peer_id().rfind("QmFake", 0), 0u);
    EXPECT_EQ(node.api_addr().value_or(""), "127.0.0.1:46001");
}

TEST_F(NodeTest, EnvironmentCarriesDataDirectoryOnce) {
    auto node = make_node(FlavorKind::Ipfs, 0);
    auto env = node.environment();
    auto count = std::count_if(env.begin(), env.end(), [](const std::string& entry) {
        return process::env_key(entry) == "IPFS_PATH";
    });
    EXPECT_EQ(count, 1);
    EXPECT_EQ(process::env_lookup(env, "IPFS_PATH"), node.dir().string());
    EXPECT_EQ(process::env_lookup(env, "FIL_API"), process::env_lookup(process::current_environment(), "FIL_API"));
}

TEST_F(NodeTest, FailingCommandCarriesBothStreams) {
    auto node = make_node(FlavorKind::Ipfs, 0);
    ASSERT_TRUE(node.init().is_ok());

    auto out = node.run_cmd({node.binary(), "fail"});
    ASSERT_TRUE(out.is_err());
    EXPECT_EQ(out.error().code(), ErrorCode::CommandFailed);
    EXPECT_NE(out.error().details().find("something went wrong"), std::string::npos);
    EXPECT_NE(out.error().details().find("partial output"), std::string::npos);
}

TEST_F(NodeTest, AttributesAndBandwidth) {
    auto node = make_node(FlavorKind::Ipfs, 45009);
    ASSERT_TRUE(node.init().is_ok());

    EXPECT_EQ(node.get_attr("id").value_or(""), node.peer_id());
    EXPECT_EQ(node.get_attr("path").value_or(""), node.dir().string());
    EXPECT_EQ(node.get_attr("api_port").value_or(""), "45009");
    EXPECT_EQ(node.get_attr("bw_in").value_or(""), "1024");
    EXPECT_EQ(node.get_attr("bw_out").value_or(""), "2048");

    auto stats = node.bandwidth();
    ASSERT_TRUE(stats.is_ok());
    EXPECT_DOUBLE_EQ(stats.value().rate_in, 1.5);

    auto unknown = node.get_attr("color");
    ASSERT_TRUE(unknown.is_err());
    EXPECT_EQ(unknown.error().code(), ErrorCode::UnknownAttribute);
}

TEST_F(NodeTest, OnlyApiPortIsSettable) {
    auto node = make_node(FlavorKind::Filecoin, 46002);

    EXPECT_TRUE(node.set_attr("api_port", "46010").is_ok());
    EXPECT_EQ(node.api_port(), 46010);

    auto bad = node.set_attr("api_port", "70000");
    ASSERT_TRUE(bad.is_err());
    EXPECT_EQ(bad.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(node.set_attr("api_port", "12x").error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(node.set_attr("id", "QmOther").error().code(), ErrorCode::UnknownAttribute);
}

TEST_F(NodeTest, IpfsApiPortIsFixedByConfig) {
    auto node = make_node(FlavorKind::Ipfs, 45009);

    auto changed = node.set_attr("api_port", "46011");
    ASSERT_TRUE(changed.is_err());
    EXPECT_EQ(changed.error().code(), ErrorCode::UnknownAttribute);
    EXPECT_EQ(node.api_port(), 45009);
    EXPECT_EQ(node.get_attr("api_port").value(), "45009");
}

TEST_F(NodeTest, ApiAddressNeedsRunningNode) {
    auto node = make_node(FlavorKind::Ipfs, 45010);
    auto addr = node.api_addr();
    ASSERT_TRUE(addr.is_err());
    EXPECT_EQ(addr.error().code(), ErrorCode::NotRunning);
}

TEST_F(NodeTest, MissingBinaryFailsToLaunch) {
    NodeSpec spec;
    spec.kind = FlavorKind::Ipfs;
    spec.dir = test_dir / "0";
    spec.binary = "swarmbed-no-such-daemon";
    fs::create_directories(spec.dir);
    Node node(std::move(spec), quick_settings());

    auto started = node.start();
    ASSERT_TRUE(started.is_err());
    EXPECT_EQ(started.error().code(), ErrorCode::LaunchFailed);
    EXPECT_FALSE(node.is_alive().value());
}

TEST(NodeSpecTest, JsonShapeAndInvalidType) {
    NodeSpec spec;
    spec.kind = FlavorKind::Filecoin;
    spec.dir = "/tmp/testbed/3";
    spec.api_port = 3456;
    spec.peer_id = "QmPeer";

    utils::json j = spec;
    EXPECT_EQ(j["type"], "filecoin");
    EXPECT_EQ(j["dir"], "/tmp/testbed/3");
    EXPECT_EQ(j["api_port"], 3456);
    EXPECT_EQ(j["peer_id"], "QmPeer");

    auto back = j.get<NodeSpec>();
    EXPECT_EQ(back.kind, FlavorKind::Filecoin);
    EXPECT_EQ(back.api_port, 3456);

    j["type"] = "bitcoin";
    EXPECT_THROW(j.get<NodeSpec>(), ConfigException);
}
