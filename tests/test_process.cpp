#include "test_helpers.hpp"
#include <platform/process.hpp>
#include <chrono>

#ifndef _WIN32

TEST(Process, CapturesStdoutAndStderr) {
    auto r = platform::run_shell("echo out; echo err >&2");
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.stdout_data, "out\n");
    EXPECT_EQ(r.stderr_data, "err\n");
    EXPECT_TRUE(r.success());
}

TEST(Process, ReportsExitCode) {
    auto r = platform::run_shell("exit 7");
    EXPECT_EQ(r.exit_code, 7);
    EXPECT_TRUE(r.failed());
    EXPECT_FALSE(r.timed_out);
}

TEST(Process, ArgumentsAreNotShellSplit) {
    auto r = platform::run_captured("printf", {"%s|", "a b", "$HOME"});
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.stdout_data, "a b|$HOME|");
}

TEST(Process, SpawnFailureIsReported) {
    auto r = platform::run_captured("twin-no-such-binary-anywhere", {});
    EXPECT_TRUE(r.spawn_failed);
    EXPECT_FALSE(r.stderr_data.empty());
}

TEST(Process, EnvironmentIsAdded) {
    platform::SpawnOptions opts;
    opts.env["TWIN_TEST_VALUE"] = "hello";
    auto r = platform::run_shell("printf %s \"$TWIN_TEST_VALUE\"", opts);
    EXPECT_EQ(r.stdout_data, "hello");
}

TEST(Process, TimeoutTerminatesGroup) {
    platform::SpawnOptions opts;
    opts.new_process_group = true;

    auto start = std::chrono::steady_clock::now();
    auto r = platform::run_shell("sleep 20 & sleep 20", opts, 300);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(r.timed_out);
    EXPECT_EQ(r.exit_code, -1);
    EXPECT_LT(elapsed, std::chrono::seconds(8));
}

class ProcessCwdTest : public ScratchTest {};

TEST_F(ProcessCwdTest, RunsInRequestedDirectory) {
    platform::SpawnOptions opts;
    opts.cwd = test_dir;
    auto r = platform::run_shell("touch here.txt", opts);
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_TRUE(fs::exists(test_dir / "here.txt"));
}

#endif
