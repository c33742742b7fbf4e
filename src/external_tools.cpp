#include "external_tools.hpp"
#include "adb_security.hpp"
#include "droid_log.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <thread>

namespace droid {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// First non-empty line, for compact log/status messages
std::string firstLine(const std::string& s) {
    std::istringstream iss(s);
    std::string line;
    while (std::getline(iss, line)) {
        line = trim(line);
        if (!line.empty()) return line;
    }
    return "";
}

} // anonymous namespace

bool isToolAvailable(const std::string& name) {
    return findExecutable(name).has_value();
}

// =============================================================================
// adb
// =============================================================================

ToolOutcome classifyAdbConnectOutput(const std::string& output, int exit_code) {
    std::string lower = toLower(output);
    std::string summary = firstLine(output);

    if (lower.find("already connected to") != std::string::npos) {
        return ToolOutcome::alreadyRunning(summary);
    }
    // "failed to connect to", "cannot connect to", "unable to connect to"
    // all contain "connect to" but never "connected to"
    if (lower.find("connected to") != std::string::npos && exit_code == 0) {
        return ToolOutcome::success(summary);
    }
    if (summary.empty()) {
        summary = "adb connect exited with code " + std::to_string(exit_code);
    }
    return ToolOutcome::failure(summary);
}

AdbBridgeConnector::AdbBridgeConnector(std::string adb_path, std::chrono::milliseconds timeout,
                                       CommandRunner runner)
    : adb_path_(std::move(adb_path)), timeout_(timeout),
      runner_(runner ? std::move(runner) : CommandRunner(runProcess)) {}

ToolOutcome AdbBridgeConnector::connect(const std::string& address, uint16_t port) {
    std::string target = security::formatTcpTarget(address, port);
    if (!security::isValidTcpTarget(target)) {
        DLOG_ERROR("adb", "Rejected connect target: %s", target.c_str());
        return ToolOutcome::failure("invalid target " + target);
    }

    DLOG_INFO("adb", "adb connect %s", target.c_str());
    auto run = runner_({adb_path_, "connect", target}, timeout_);
    if (run.is_err()) {
        DLOG_ERROR("adb", "adb connect failed to run: %s", run.error().message.c_str());
        return ToolOutcome::failure(run.error().message);
    }
    const auto& proc = run.value();
    if (proc.timed_out) {
        DLOG_ERROR("adb", "adb connect %s timed out", target.c_str());
        return ToolOutcome::failure("adb connect timed out");
    }

    auto outcome = classifyAdbConnectOutput(proc.output, proc.exit_code);
    if (outcome.ok()) {
        DLOG_INFO("adb", "Bridge %s: %s", toolStatusStr(outcome.status), outcome.reason.c_str());
    } else {
        DLOG_WARN("adb", "Bridge connect failed: %s", outcome.reason.c_str());
    }
    return outcome;
}

// =============================================================================
// scrcpy
// =============================================================================

ScrcpyMirrorLauncher::ScrcpyMirrorLauncher(std::string scrcpy_path,
                                           std::vector<std::string> extra_args)
    : scrcpy_path_(std::move(scrcpy_path)), extra_args_(std::move(extra_args)) {}

std::vector<std::string> ScrcpyMirrorLauncher::buildArgs(const std::string& address,
                                                         uint16_t port) const {
    std::vector<std::string> argv;
    argv.reserve(2 + extra_args_.size());
    argv.push_back(scrcpy_path_);
    argv.push_back("--tcpip=" + security::formatTcpTarget(address, port));
    argv.insert(argv.end(), extra_args_.begin(), extra_args_.end());
    return argv;
}

Result<std::unique_ptr<MirrorProcess>> ScrcpyMirrorLauncher::launch(const std::string& address,
                                                                    uint16_t port) {
    if (!security::isValidTcpTarget(security::formatTcpTarget(address, port))) {
        return Err(ErrorCode::Configuration, "invalid mirror target " + address);
    }

    auto child = ChildProcess::spawn(buildArgs(address, port));
    if (child.is_err()) {
        DLOG_ERROR("scrcpy", "Launch failed: %s", child.error().message.c_str());
        return child.error();
    }

    std::unique_ptr<MirrorProcess> process =
        std::make_unique<ScrcpyProcess>(std::move(child).value());

    // scrcpy exits within a moment when the device refuses the connection
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    if (process->hasTerminated()) {
        return Err(ErrorCode::Io, "scrcpy exited immediately");
    }
    DLOG_INFO("scrcpy", "Mirroring %s:%u (pid %d)", address.c_str(), port, process->pid());
    return Result<std::unique_ptr<MirrorProcess>>(std::move(process));
}

// =============================================================================
// xdotool
// =============================================================================

std::vector<std::string> parseWindowIds(const std::string& output) {
    std::vector<std::string> ids;
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        line = trim(line);
        if (security::isValidWindowId(line)) ids.push_back(line);
    }
    return ids;
}

XdotoolScreenToggle::XdotoolScreenToggle(std::string xdotool_path, ScreenKeys keys,
                                         std::chrono::milliseconds timeout, CommandRunner runner)
    : xdotool_path_(std::move(xdotool_path)), keys_(std::move(keys)), timeout_(timeout),
      runner_(runner ? std::move(runner) : CommandRunner(runProcess)) {}

Result<std::string> XdotoolScreenToggle::findMirrorWindow() {
    const std::vector<std::vector<std::string>> searches = {
        {"search", "--class", "scrcpy"},
        {"search", "--name", "scrcpy"},
        {"search", "--onlyvisible", "--name", ".*scrcpy.*"},
    };

    for (const auto& args : searches) {
        std::vector<std::string> argv{xdotool_path_};
        argv.insert(argv.end(), args.begin(), args.end());

        auto run = runner_(argv, timeout_);
        if (run.is_err()) {
            return run.error();
        }
        auto ids = parseWindowIds(run.value().output);
        if (!ids.empty()) {
            DLOG_DEBUG("xdotool", "%zu window(s) via %s, using %s",
                       ids.size(), args[1].c_str(), ids.back().c_str());
            return ids.back();
        }
    }
    return Err(ErrorCode::NotFound, "scrcpy window not found");
}

ToolOutcome XdotoolScreenToggle::send(bool turn_on) {
    const std::string& keys = turn_on ? keys_.on_keys : keys_.off_keys;
    if (!security::isValidKeySpec(keys)) {
        return ToolOutcome::failure("invalid key spec '" + keys + "'");
    }

    auto window = findMirrorWindow();
    if (window.is_err()) {
        DLOG_WARN("xdotool", "No target window: %s", window.error().message.c_str());
        return ToolOutcome::failure(window.error().message);
    }
    const std::string& wid = window.value();

    auto activate = runner_({xdotool_path_, "windowactivate", "--sync", wid}, timeout_);
    if (activate.is_err()) {
        return ToolOutcome::failure(activate.error().message);
    }
    if (activate.value().timed_out || activate.value().exit_code != 0) {
        return ToolOutcome::failure("could not activate window " + wid + ": " +
                                    firstLine(activate.value().output));
    }

    if (keys_.focus_delay.count() > 0) {
        std::this_thread::sleep_for(keys_.focus_delay);
    }

    auto key = runner_({xdotool_path_, "key", keys}, timeout_);
    if (key.is_err()) {
        return ToolOutcome::failure(key.error().message);
    }
    if (key.value().timed_out || key.value().exit_code != 0) {
        return ToolOutcome::failure("xdotool key " + keys + " failed: " +
                                    firstLine(key.value().output));
    }

    DLOG_INFO("xdotool", "Sent %s to window %s (screen %s)",
              keys.c_str(), wid.c_str(), turn_on ? "on" : "off");
    return ToolOutcome::success(keys);
}

} // namespace droid
