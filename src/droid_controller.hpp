// =============================================================================
// DroidMirror - Controller
// =============================================================================
// Single owner of the discovery and session components. Front ends call the
// six trigger operations (scan, stop scan, select, connect, disconnect,
// toggle screen) and observe state through the event bus.
// =============================================================================
#pragma once

#include "config_loader.hpp"
#include "device_registry.hpp"
#include "event_bus.hpp"
#include "external_tools.hpp"
#include "result.hpp"
#include "scan_coordinator.hpp"
#include "screen_toggle_controller.hpp"
#include "session_orchestrator.hpp"
#include "subnet_enumerator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace droid {

struct ControllerOptions {
    ScanOptions scan;
    std::string subnet;             // explicit CIDR; empty = detect
    std::string interface_name;
    std::string fallback_subnet = "192.168.1.0/24";

    static ControllerOptions fromConfig(const config::AppConfig& cfg);
};

// Collaborators; any null member is replaced by the real tool
struct ControllerTools {
    ProbeFunction probe;
    std::unique_ptr<BridgeConnector> bridge;
    std::unique_ptr<MirrorLauncher> launcher;
    std::unique_ptr<ScreenToggleSender> screen;

    static ControllerTools fromConfig(const config::AppConfig& cfg);
};

class DroidController {
public:
    DroidController(ControllerOptions options, ControllerTools tools, EventBus& events = bus());
    ~DroidController();

    DroidController(const DroidController&) = delete;
    DroidController& operator=(const DroidController&) = delete;

    // --- discovery ---
    // Range from the explicit subnet, else the detected interface, else the
    // fallback subnet
    Result<AddressRange> resolveRange() const;

    // Starts a background scan; Busy while one runs
    VoidResult startScan();
    VoidResult startScan(const AddressRange& range);
    // Same range as the previous scan (resolved afresh if there was none)
    VoidResult rescan();
    void stopScan();
    // true once no scan is running
    bool waitForScan(std::chrono::milliseconds timeout);
    bool isScanning() const;
    std::optional<ScanRun> lastScan() const;

    // --- devices ---
    VoidResult selectDevice(const std::string& address);
    std::vector<Device> devices() const { return registry_.devices(); }
    std::optional<Device> selectedDevice() const { return registry_.currentSelection(); }

    // --- session ---
    Result<SessionOrchestrator::SessionInfo> startSession();
    Result<SessionOrchestrator::SessionInfo> stopSession();
    Result<bool> toggleScreen();
    bool pollMirror() { return orchestrator_.pollMirror(); }
    SessionOrchestrator::SessionInfo session() { return orchestrator_.session(); }

    // Background pollMirror() loop so a closed scrcpy window ends the session
    void startMirrorMonitor(std::chrono::milliseconds interval = std::chrono::milliseconds(500));
    void stopMirrorMonitor();

    // Stops the monitor, cancels and waits out any scan, then ends a live
    // session. Also runs when a ShutdownEvent is published on the bus.
    void shutdown(std::chrono::milliseconds scan_grace = std::chrono::seconds(5));

    const ControllerOptions& options() const { return options_; }

private:
    void scanThread(AddressRange range, ScanOptions options);
    void joinScanThread();

    ControllerOptions options_;
    EventBus& events_;

    DeviceRegistry registry_;
    ScanCoordinator coordinator_;
    std::unique_ptr<BridgeConnector> bridge_;
    std::unique_ptr<MirrorLauncher> launcher_;
    std::unique_ptr<ScreenToggleSender> screen_;
    SessionOrchestrator orchestrator_;
    ScreenToggleController toggler_;

    // Scan thread state
    mutable std::mutex scan_mutex_;
    std::condition_variable scan_cv_;
    std::thread scan_thread_;
    bool scanning_ = false;
    std::optional<AddressRange> last_range_;
    std::optional<ScanRun> last_scan_;

    // Mirror monitor
    std::mutex monitor_mutex_;
    std::condition_variable monitor_cv_;
    std::thread monitor_thread_;
    bool monitor_running_ = false;

    SubscriptionHandle shutdown_sub_;
};

} // namespace droid
