// =============================================================================
// DroidMirror - External Tool Capabilities
// =============================================================================
// Small interfaces for the three collaborators the session layer drives:
//   BridgeConnector     adb connect a.b.c.d:port
//   MirrorLauncher      scrcpy --tcpip=a.b.c.d:port (long-lived process)
//   ScreenToggleSender  xdotool keystroke into the scrcpy window
// The real implementations run the tools through a CommandRunner so their
// argv sequences and output handling can be tested without the tools.
// =============================================================================
#pragma once

#include "process_runner.hpp"
#include "result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace droid {

enum class ToolStatus {
    Success,
    Failure,
    AlreadyRunning   // bridge already up; counts as success
};

inline const char* toolStatusStr(ToolStatus s) {
    switch (s) {
        case ToolStatus::Success:        return "success";
        case ToolStatus::Failure:        return "failure";
        case ToolStatus::AlreadyRunning: return "already-running";
    }
    return "?";
}

struct ToolOutcome {
    ToolStatus status = ToolStatus::Failure;
    std::string reason;   // human-readable cause on Failure, tool output otherwise

    bool ok() const { return status != ToolStatus::Failure; }

    static ToolOutcome success(std::string detail = {}) { return {ToolStatus::Success, std::move(detail)}; }
    static ToolOutcome alreadyRunning(std::string detail = {}) { return {ToolStatus::AlreadyRunning, std::move(detail)}; }
    static ToolOutcome failure(std::string why) { return {ToolStatus::Failure, std::move(why)}; }
};

// argv -> captured result; defaults to runProcess
using CommandRunner = std::function<Result<ProcessResult>(const std::vector<std::string>& argv,
                                                          std::chrono::milliseconds timeout)>;

// PATH lookup used by the startup tool check
bool isToolAvailable(const std::string& name);

// =============================================================================
// Capability interfaces
// =============================================================================

class BridgeConnector {
public:
    virtual ~BridgeConnector() = default;
    virtual ToolOutcome connect(const std::string& address, uint16_t port) = 0;
};

class MirrorProcess {
public:
    virtual ~MirrorProcess() = default;
    virtual bool hasTerminated() = 0;
    virtual void terminate() = 0;
    virtual int pid() const = 0;
};

class MirrorLauncher {
public:
    virtual ~MirrorLauncher() = default;
    virtual Result<std::unique_ptr<MirrorProcess>> launch(const std::string& address, uint16_t port) = 0;
};

class ScreenToggleSender {
public:
    virtual ~ScreenToggleSender() = default;
    // turn_on=false sends the "display off" keystroke, true the "display on" one
    virtual ToolOutcome send(bool turn_on) = 0;
};

// =============================================================================
// adb
// =============================================================================

/**
 * Interpret `adb connect` output.
 *   "already connected to ..." -> AlreadyRunning
 *   "connected to ..."         -> Success
 *   anything else ("failed to connect", "cannot connect", "unable to connect") -> Failure
 * adb exits 0 on some failures, so the text decides, not the exit code alone.
 */
ToolOutcome classifyAdbConnectOutput(const std::string& output, int exit_code);

class AdbBridgeConnector : public BridgeConnector {
public:
    explicit AdbBridgeConnector(std::string adb_path = "adb",
                                std::chrono::milliseconds timeout = std::chrono::milliseconds(8000),
                                CommandRunner runner = runProcess);

    ToolOutcome connect(const std::string& address, uint16_t port) override;

private:
    std::string adb_path_;
    std::chrono::milliseconds timeout_;
    CommandRunner runner_;
};

// =============================================================================
// scrcpy
// =============================================================================

class ScrcpyProcess : public MirrorProcess {
public:
    explicit ScrcpyProcess(ChildProcess child) : child_(std::move(child)) {}

    bool hasTerminated() override { return child_.hasExited(); }
    void terminate() override { child_.terminate(); }
    int pid() const override { return static_cast<int>(child_.pid()); }

private:
    ChildProcess child_;
};

class ScrcpyMirrorLauncher : public MirrorLauncher {
public:
    explicit ScrcpyMirrorLauncher(std::string scrcpy_path = "scrcpy",
                                  std::vector<std::string> extra_args = {});

    // argv for one launch: scrcpy --tcpip=a.b.c.d:port [extra...]
    std::vector<std::string> buildArgs(const std::string& address, uint16_t port) const;

    Result<std::unique_ptr<MirrorProcess>> launch(const std::string& address, uint16_t port) override;

private:
    std::string scrcpy_path_;
    std::vector<std::string> extra_args_;
};

// =============================================================================
// xdotool
// =============================================================================

struct ScreenKeys {
    std::string off_keys = "alt+o";
    std::string on_keys = "alt+shift+o";
    std::chrono::milliseconds focus_delay{300};
};

// Window ids from `xdotool search` output, one per line; junk lines skipped
std::vector<std::string> parseWindowIds(const std::string& output);

class XdotoolScreenToggle : public ScreenToggleSender {
public:
    XdotoolScreenToggle(std::string xdotool_path = "xdotool",
                        ScreenKeys keys = {},
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(8000),
                        CommandRunner runner = runProcess);

    ToolOutcome send(bool turn_on) override;

    // Tries --class scrcpy, --name scrcpy, --onlyvisible --name .*scrcpy.*
    // in turn; the last id of the first non-empty search wins.
    Result<std::string> findMirrorWindow();

private:
    std::string xdotool_path_;
    ScreenKeys keys_;
    std::chrono::milliseconds timeout_;
    CommandRunner runner_;
};

} // namespace droid
