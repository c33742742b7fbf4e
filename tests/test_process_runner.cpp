// =============================================================================
// Unit tests for process execution (src/process_runner.hpp)
// Relies on /bin/sh and the usual coreutils being present.
// =============================================================================
#include <gtest/gtest.h>
#include "process_runner.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace droid;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// runProcess
// ---------------------------------------------------------------------------
TEST(ProcessRunnerTest, CapturesStdout) {
    auto r = runProcess({"echo", "connected to 10.0.0.5:5555"}, 2000ms);
    ASSERT_TRUE(r.is_ok()) << r.error().describe();
    EXPECT_EQ(r.value().exit_code, 0);
    EXPECT_FALSE(r.value().timed_out);
    EXPECT_EQ(r.value().output, "connected to 10.0.0.5:5555\n");
}

TEST(ProcessRunnerTest, CapturesStderrAndExitCode) {
    auto r = runProcess({"sh", "-c", "echo oops >&2; exit 3"}, 2000ms);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().exit_code, 3);
    EXPECT_EQ(r.value().output, "oops\n");
}

TEST(ProcessRunnerTest, ArgumentsAreNotShellExpanded) {
    auto r = runProcess({"echo", "a;b", "$HOME"}, 2000ms);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().output, "a;b $HOME\n");
}

TEST(ProcessRunnerTest, TimeoutKillsChild) {
    auto start = std::chrono::steady_clock::now();
    auto r = runProcess({"sleep", "5"}, 200ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value().timed_out);
    EXPECT_EQ(r.value().exit_code, -1);
    EXPECT_LT(elapsed, 3s);
}

TEST(ProcessRunnerTest, MissingBinaryIsIoError) {
    auto r = runProcess({"droidmirror-no-such-binary"}, 2000ms);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::Io);
}

TEST(ProcessRunnerTest, EmptyArgvIsConfigurationError) {
    auto r = runProcess({}, 100ms);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::Configuration);
}

// Long-lived children forked from another thread must not inherit a capture
// pipe, otherwise the short run only sees EOF when they exit
TEST(ProcessRunnerTest, ConcurrentSpawnsDoNotHoldCaptureOpen) {
    std::atomic<bool> done{false};
    std::vector<ChildProcess> sleepers;
    std::thread spawner([&] {
        while (!done.load() && sleepers.size() < 40) {
            auto child = ChildProcess::spawn({"sleep", "5"});
            if (child.is_ok()) sleepers.push_back(std::move(child).value());
        }
    });

    for (int i = 0; i < 20; ++i) {
        const auto begin = std::chrono::steady_clock::now();
        auto r = runProcess({"echo", "ok"}, 4000ms);
        const auto took = std::chrono::steady_clock::now() - begin;
        EXPECT_LT(took, 2000ms) << "run " << i;
        if (!r.is_ok()) {
            ADD_FAILURE() << r.error().describe();
            continue;
        }
        EXPECT_FALSE(r.value().timed_out);
        EXPECT_EQ(r.value().output, "ok\n");
    }

    done = true;
    spawner.join();
    for (auto& s : sleepers) s.terminate(500ms);
}

// ---------------------------------------------------------------------------
// findExecutable
// ---------------------------------------------------------------------------
TEST(ProcessRunnerTest, FindExecutableSearchesPath) {
    auto sh = findExecutable("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_EQ(sh->back(), 'h');
    EXPECT_NE(sh->find('/'), std::string::npos);

    EXPECT_FALSE(findExecutable("droidmirror-no-such-binary").has_value());
    EXPECT_FALSE(findExecutable("").has_value());
}

// ---------------------------------------------------------------------------
// ChildProcess
// ---------------------------------------------------------------------------
TEST(ChildProcessTest, TerminateStopsLongRunningChild) {
    auto child = ChildProcess::spawn({"sleep", "30"});
    ASSERT_TRUE(child.is_ok()) << child.error().describe();
    ChildProcess proc = std::move(child).value();

    EXPECT_GT(proc.pid(), 0);
    EXPECT_FALSE(proc.hasExited());

    proc.terminate(500ms);
    EXPECT_TRUE(proc.hasExited());
}

TEST(ChildProcessTest, ObservesNaturalExit) {
    auto child = ChildProcess::spawn({"sh", "-c", "exit 4"});
    ASSERT_TRUE(child.is_ok());
    ChildProcess proc = std::move(child).value();

    for (int i = 0; i < 100 && !proc.hasExited(); ++i) {
        std::this_thread::sleep_for(20ms);
    }
    ASSERT_TRUE(proc.hasExited());
    EXPECT_EQ(proc.exitCode(), 4);
}

TEST(ChildProcessTest, MissingBinaryFailsBeforeFork) {
    auto child = ChildProcess::spawn({"droidmirror-no-such-binary", "--tcpip=10.0.0.5:5555"});
    ASSERT_TRUE(child.is_err());
    EXPECT_EQ(child.error().code, ErrorCode::Io);
}

TEST(ChildProcessTest, MoveTransfersOwnership) {
    auto child = ChildProcess::spawn({"sleep", "30"});
    ASSERT_TRUE(child.is_ok());
    ChildProcess a = std::move(child).value();
    const pid_t pid = a.pid();

    ChildProcess b = std::move(a);
    EXPECT_EQ(b.pid(), pid);
    b.terminate(500ms);
    EXPECT_TRUE(b.hasExited());
}
