// =============================================================================
// DroidMirror - Console Entry Point
// =============================================================================
// Loads configuration, checks the external tools, then runs a line-oriented
// command loop over the controller. Background results (scan progress,
// session transitions) are printed from event bus handlers.
// =============================================================================

#include "config_loader.hpp"
#include "droid_controller.hpp"
#include "droid_log.hpp"
#include "event_bus.hpp"
#include "external_tools.hpp"

#include <getopt.h>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

using namespace droid;

namespace {

std::mutex g_out_mutex;

void say(const std::string& line) {
    std::lock_guard<std::mutex> lock(g_out_mutex);
    std::cout << line << std::endl;
}

void printUsage(const char* prog) {
    std::printf(
        "Usage: %s [options]\n"
        "  -c, --config PATH       config file (default: config.json)\n"
        "  -s, --subnet CIDR       subnet to scan (default: detect local network)\n"
        "  -i, --interface NAME    interface used for detection\n"
        "  -p, --port N            ADB TCP port (default 5555)\n"
        "  -t, --timeout-ms N      probe timeout (default 500)\n"
        "  -w, --workers N         concurrent probes (default 100)\n"
        "  -l, --log-level LEVEL   trace|debug|info|warn|error\n"
        "  -f, --log-file PATH     also log to PATH\n"
        "  -n, --scan-now          start a scan immediately\n"
        "  -h, --help\n", prog);
}

void printHelp() {
    say("Commands:\n"
        "  scan            discover devices with the ADB port open\n"
        "  stop            cancel the running scan\n"
        "  rescan          scan the previous range again\n"
        "  list            show discovered devices\n"
        "  select <ip>     choose a device\n"
        "  connect         adb connect + start scrcpy for the selection\n"
        "  disconnect      end the mirroring session\n"
        "  screen          toggle the device display on/off\n"
        "  status          show scan and session state\n"
        "  help | quit");
}

// Non-negative integer option value
bool parseIntArg(const char* text, int& out) {
    char* end = nullptr;
    long v = std::strtol(text, &end, 10);
    if (!text[0] || *end != '\0' || v < 0 || v > INT32_MAX) return false;
    out = static_cast<int>(v);
    return true;
}

void checkTools(const config::AppConfig& cfg) {
    if (!isToolAvailable(cfg.tools.scrcpy_path)) {
        DLOG_WARN("main", "scrcpy not found (%s). Install it: sudo apt install scrcpy",
                  cfg.tools.scrcpy_path.c_str());
        say("Warning: scrcpy is not installed. Install it with: sudo apt install scrcpy");
    }
    if (!isToolAvailable(cfg.tools.adb_path)) {
        DLOG_WARN("main", "adb not found (%s)", cfg.tools.adb_path.c_str());
        say("Warning: adb is not installed. Install it with: sudo apt install adb");
    }
    if (!isToolAvailable(cfg.tools.xdotool_path)) {
        DLOG_WARN("main", "xdotool not found (%s); screen toggle unavailable",
                  cfg.tools.xdotool_path.c_str());
        say("Warning: xdotool is not installed; the screen toggle will not work.");
    }
}

void printDevices(DroidController& ctl) {
    auto devices = ctl.devices();
    if (devices.empty()) {
        say("No devices. Run 'scan' first.");
        return;
    }
    for (const auto& dev : devices) {
        say(std::string(dev.selected ? " * " : "   ") + dev.address + "  (" +
            reachabilityStr(dev.reachability) + ")");
    }
}

void printStatus(DroidController& ctl) {
    std::ostringstream oss;
    oss << "Scan: " << (ctl.isScanning() ? "running" : "idle");
    if (auto last = ctl.lastScan()) {
        oss << "  last: " << last->live.size() << " device(s), "
            << last->completed << "/" << last->total << " probed"
            << (last->cancelled ? " (cancelled)" : "");
    }
    auto sel = ctl.selectedDevice();
    oss << "\nSelected: " << (sel ? sel->address : std::string("none"));

    auto s = ctl.session();
    oss << "\nSession: " << sessionStateStr(s.state);
    if (s.id != 0) {
        oss << " #" << s.id << " " << s.device_address;
        if (s.state == SessionOrchestrator::State::Active) {
            oss << "  screen " << (s.screen_on ? "ON" : "OFF");
        }
        if (s.state == SessionOrchestrator::State::Ended) {
            oss << " (" << sessionOutcomeStr(s.outcome) << ")";
        }
        if (s.state == SessionOrchestrator::State::Failed) {
            oss << " at " << failedStepStr(s.failed_step) << ": " << s.failure_reason;
        }
    }
    say(oss.str());
}

void report(const VoidResult& r) {
    if (r.is_err()) say("Error: " + r.error().describe());
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config.json";
    std::string subnet, interface_name, log_level, log_file;
    int port = -1, timeout_ms = -1, workers = -1;
    bool scan_now = false;

    static const struct option long_opts[] = {
        {"config",     required_argument, nullptr, 'c'},
        {"subnet",     required_argument, nullptr, 's'},
        {"interface",  required_argument, nullptr, 'i'},
        {"port",       required_argument, nullptr, 'p'},
        {"timeout-ms", required_argument, nullptr, 't'},
        {"workers",    required_argument, nullptr, 'w'},
        {"log-level",  required_argument, nullptr, 'l'},
        {"log-file",   required_argument, nullptr, 'f'},
        {"scan-now",   no_argument,       nullptr, 'n'},
        {"help",       no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "c:s:i:p:t:w:l:f:nh", long_opts, nullptr)) != -1) {
        switch (opt) {
            case 'c': config_path = optarg; break;
            case 's': subnet = optarg; break;
            case 'i': interface_name = optarg; break;
            case 'p':
            case 't':
            case 'w': {
                int& target = opt == 'p' ? port : (opt == 't' ? timeout_ms : workers);
                if (!parseIntArg(optarg, target)) {
                    std::fprintf(stderr, "Invalid number: %s\n", optarg);
                    return 2;
                }
                break;
            }
            case 'l': log_level = optarg; break;
            case 'f': log_file = optarg; break;
            case 'n': scan_now = true; break;
            case 'h': printUsage(argv[0]); return 0;
            default:  printUsage(argv[0]); return 2;
        }
    }

    config::AppConfig cfg = config::loadConfig(config_path, true);
    config::applyEnvironmentOverrides(cfg);
    if (!subnet.empty()) cfg.scan.subnet = subnet;
    if (!interface_name.empty()) cfg.scan.interface_name = interface_name;
    if (port >= 0) cfg.scan.port = port;
    if (timeout_ms >= 0) cfg.scan.timeout_ms = timeout_ms;
    if (workers >= 0) cfg.scan.workers = workers;
    if (!log_level.empty()) cfg.log.level = log_level;
    if (!log_file.empty()) cfg.log.log_path = log_file;

    auto valid = config::validateConfig(cfg);
    if (valid.is_err()) {
        std::fprintf(stderr, "%s\n", valid.error().describe().c_str());
        return 2;
    }

    log::setLogLevel(*log::parseLevel(cfg.log.level));
    if (!cfg.log.log_path.empty()) {
        if (!log::openLogFile(cfg.log.log_path.c_str())) {
            std::fprintf(stderr, "Cannot open log file %s\n", cfg.log.log_path.c_str());
        } else {
            // Keep the prompt readable; details go to the file
            log::setConsoleOutput(false);
        }
    }
    DLOG_INFO("main", "DroidMirror starting (port %d, %d workers, timeout %dms)",
              cfg.scan.port, cfg.scan.workers, cfg.scan.timeout_ms);

    checkTools(cfg);

    DroidController ctl(ControllerOptions::fromConfig(cfg), ControllerTools::fromConfig(cfg));

    // --- event output ---
    const uint16_t scan_port = static_cast<uint16_t>(cfg.scan.port);
    auto sub_started = bus().subscribe<ScanStartedEvent>([](const ScanStartedEvent& e) {
        say("Scanning " + e.range + " (" + std::to_string(e.total) + " hosts) for port " +
            std::to_string(e.port) + "...");
    });
    auto sub_progress = bus().subscribe<ScanProgressEvent>([](const ScanProgressEvent& e) {
        // Roughly every 10%
        uint64_t step = e.total >= 10 ? e.total / 10 : 1;
        if (e.completed % step == 0 && e.completed != e.total) {
            say("  " + std::to_string(e.completed) + "/" + std::to_string(e.total) + " probed");
        }
    });
    auto sub_done = bus().subscribe<ScanCompletedEvent>([scan_port](const ScanCompletedEvent& e) {
        if (e.devices.empty()) {
            say(std::string(e.cancelled ? "Scan cancelled. " : "") +
                "No devices found. Ensure USB debugging is enabled and run "
                "'adb tcpip " + std::to_string(scan_port) + "' on the device once over USB.");
            return;
        }
        std::string line = std::string(e.cancelled ? "Scan cancelled. " : "") + "Found " +
                           std::to_string(e.devices.size()) + " device(s) with port " +
                           std::to_string(e.port) + " open:";
        for (const auto& d : e.devices) line += "\n   " + d;
        say(line);
    });
    auto sub_failed = bus().subscribe<ScanFailedEvent>([](const ScanFailedEvent& e) {
        say("Scan failed: " + e.error);
    });
    auto sub_session = bus().subscribe<SessionStateChangedEvent>([](const SessionStateChangedEvent& e) {
        std::string line = "Session #" + std::to_string(e.session_id) + " " + e.device_address +
                           ": " + e.state;
        if (e.state == "ended") line += " (" + e.outcome + ")";
        if (e.state == "failed") line += " at " + e.failed_step + ": " + e.reason;
        say(line);
    });
    auto sub_screen = bus().subscribe<ScreenStateChangedEvent>([](const ScreenStateChangedEvent& e) {
        say(std::string("Screen turned ") + (e.screen_on ? "ON" : "OFF"));
    });

    ctl.startMirrorMonitor();
    if (scan_now) report(ctl.startScan());

    say("DroidMirror ready. Type 'help' for commands.");
    std::string line;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(g_out_mutex);
            std::cout << "> " << std::flush;
        }
        if (!std::getline(std::cin, line)) break;

        std::istringstream iss(line);
        std::string cmd, arg;
        iss >> cmd >> arg;
        if (cmd.empty()) continue;

        if (cmd == "quit" || cmd == "exit") {
            break;
        } else if (cmd == "help") {
            printHelp();
        } else if (cmd == "scan") {
            report(ctl.startScan());
        } else if (cmd == "rescan" || cmd == "refresh") {
            report(ctl.rescan());
        } else if (cmd == "stop") {
            if (!ctl.isScanning()) {
                say("No scan running.");
            } else {
                ctl.stopScan();
                say("Stopping scan...");
            }
        } else if (cmd == "list") {
            printDevices(ctl);
        } else if (cmd == "select") {
            if (arg.empty()) {
                say("Usage: select <ip>");
                continue;
            }
            auto r = ctl.selectDevice(arg);
            if (r.is_err()) report(r);
            else say("Selected " + arg);
        } else if (cmd == "connect") {
            auto r = ctl.startSession();
            if (r.is_err()) say("Error: " + r.error().describe());
        } else if (cmd == "disconnect") {
            auto r = ctl.stopSession();
            if (r.is_err()) say("Error: " + r.error().describe());
        } else if (cmd == "screen") {
            auto r = ctl.toggleScreen();
            if (r.is_err()) say("Error: " + r.error().describe());
        } else if (cmd == "status") {
            printStatus(ctl);
        } else {
            say("Unknown command '" + cmd + "'. Type 'help'.");
        }
    }

    // The controller tears down scan, monitor and session on this event
    bus().publish(ShutdownEvent{});
    log::closeLogFile();
    return 0;
}
