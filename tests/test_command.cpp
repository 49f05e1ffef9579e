#include "process/command.hpp"
#include "process/environment.hpp"
#include "swarmbed/time_utils.hpp"
#include <gtest/gtest.h>
#include <filesystem>

using namespace swarmbed;
using namespace swarmbed::process;

namespace {

CommandOptions shell(const std::string& script) {
    CommandOptions options;
    options.argv = {"sh", "-c", script};
    options.env = current_environment();
    return options;
}

} // namespace

TEST(CommandTest, CapturesStreamsSeparately) {
    auto ran = run_subprocess(shell("echo out; echo err >&2; exit 4"));
    ASSERT_TRUE(ran.is_ok()) << ran.error().to_string();

    EXPECT_EQ(ran.value().exit_code, 4);
    EXPECT_EQ(ran.value().stdout_text, "out\n");
    EXPECT_EQ(ran.value().stderr_text, "err\n");
    EXPECT_FALSE(ran.value().timed_out);
}

TEST(CommandTest, ZeroExitReturnsStdout) {
    auto out = run_command(shell("printf QmPeer"));
    ASSERT_TRUE(out.is_ok());
    EXPECT_EQ(out.value(), "QmPeer");
}

TEST(CommandTest, NonZeroExitIsCommandFailed) {
    auto out = run_command(shell("echo partial; echo broken >&2; exit 1"));
    ASSERT_TRUE(out.is_err());
    EXPECT_EQ(out.error().code(), ErrorCode::CommandFailed);
    EXPECT_NE(out.error().details().find("partial"), std::string::npos);
    EXPECT_NE(out.error().details().find("broken"), std::string::npos);
}

TEST(CommandTest, ChildSeesGivenEnvironment) {
    auto options = shell("printf \"$IPFS_PATH\"");
    options.env = derive_environment(options.env, "IPFS_PATH", "/data/node7");
    auto out = run_command(options);
    ASSERT_TRUE(out.is_ok());
    EXPECT_EQ(out.value(), "/data/node7");
}

TEST(CommandTest, RunsInWorkingDirectory) {
    auto options = shell("pwd -P");
    options.working_dir = std::filesystem::path("/");
    auto out = run_command(options);
    ASSERT_TRUE(out.is_ok());
    EXPECT_EQ(out.value(), "/\n");
}

TEST(CommandTest, TimeoutKillsTheCommand) {
    auto options = shell("exec sleep 30");
    options.timeout = std::chrono::milliseconds(100);

    time::Timer timer;
    auto ran = run_subprocess(options);
    ASSERT_TRUE(ran.is_ok());
    EXPECT_TRUE(ran.value().timed_out);
    EXPECT_LT(timer.elapsed_milliseconds(), 5000u);

    auto out = run_command(options);
    ASSERT_TRUE(out.is_err());
    EXPECT_EQ(out.error().code(), ErrorCode::CommandFailed);
}

TEST(CommandTest, UnknownProgramCannotLaunch) {
    CommandOptions options;
    options.argv = {"swarmbed-no-such-program"};
    options.env = current_environment();

    auto ran = run_subprocess(options);
    ASSERT_TRUE(ran.is_err());
    EXPECT_EQ(ran.error().code(), ErrorCode::LaunchFailed);
}
