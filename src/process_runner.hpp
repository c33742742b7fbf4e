// =============================================================================
// DroidMirror - External Process Execution
// =============================================================================
// argv-based fork/exec (no shell), bounded waits, and a handle for long-lived
// children such as the mirroring tool.
// =============================================================================
#pragma once

#include "result.hpp"
#include <sys/types.h>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace droid {

struct ProcessResult {
    int exit_code = -1;         // -1 when killed by a signal
    bool timed_out = false;     // killed after exceeding the wait bound
    std::string output;         // stdout + stderr, capped at MAX_PROCESS_OUTPUT
};

constexpr size_t MAX_PROCESS_OUTPUT = 1024 * 1024;

/**
 * Run argv[0] (PATH lookup) to completion, capturing stdout and stderr.
 * The child is killed once `timeout` elapses. Fails with Io when the
 * process cannot be started; a non-zero exit is reported in the result.
 */
Result<ProcessResult> runProcess(const std::vector<std::string>& argv,
                                 std::chrono::milliseconds timeout);

// Full path of an executable found via PATH (or the name itself if it
// contains a '/' and is executable)
std::optional<std::string> findExecutable(const std::string& name);

/**
 * Long-lived child process. Output goes to /dev/null; the child leads its
 * own process group so terminate() reaches anything it spawns.
 * Owns the pid: the destructor terminates and reaps a still-running child.
 */
class ChildProcess {
public:
    static Result<ChildProcess> spawn(const std::vector<std::string>& argv);

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ~ChildProcess();

    pid_t pid() const { return pid_; }

    // Non-blocking; reaps the child when it has exited
    bool hasExited();
    int exitCode() const { return exit_code_; }

    // SIGTERM, then SIGKILL after `grace` if still alive
    void terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(1500));

private:
    explicit ChildProcess(pid_t pid) : pid_(pid) {}

    pid_t pid_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;
};

} // namespace droid
