#include "droid_controller.hpp"
#include "droid_log.hpp"

#include <system_error>

namespace droid {

namespace {

template<typename Iface, typename Impl>
std::unique_ptr<Iface> orDefault(std::unique_ptr<Iface> given) {
    if (given) return given;
    return std::make_unique<Impl>();
}

SessionStateChangedEvent toEvent(const SessionOrchestrator::SessionInfo& s) {
    SessionStateChangedEvent ev;
    ev.session_id = s.id;
    ev.device_address = s.device_address;
    ev.state = sessionStateStr(s.state);
    ev.outcome = sessionOutcomeStr(s.outcome);
    ev.failed_step = failedStepStr(s.failed_step);
    ev.reason = s.failure_reason;
    return ev;
}

} // anonymous namespace

// =============================================================================
// Options / tools from config
// =============================================================================

ControllerOptions ControllerOptions::fromConfig(const config::AppConfig& cfg) {
    ControllerOptions opts;
    opts.scan.port = static_cast<uint16_t>(cfg.scan.port);
    opts.scan.timeout = std::chrono::milliseconds(cfg.scan.timeout_ms);
    opts.scan.workers = static_cast<size_t>(cfg.scan.workers);
    opts.subnet = cfg.scan.subnet;
    opts.interface_name = cfg.scan.interface_name;
    opts.fallback_subnet = cfg.scan.fallback_subnet;
    return opts;
}

ControllerTools ControllerTools::fromConfig(const config::AppConfig& cfg) {
    const std::chrono::milliseconds timeout(cfg.tools.command_timeout_ms);

    ScreenKeys keys;
    keys.off_keys = cfg.screen.off_keys;
    keys.on_keys = cfg.screen.on_keys;
    keys.focus_delay = std::chrono::milliseconds(cfg.screen.focus_delay_ms);

    ControllerTools tools;
    tools.probe = probePort;
    tools.bridge = std::make_unique<AdbBridgeConnector>(cfg.tools.adb_path, timeout);
    tools.launcher = std::make_unique<ScrcpyMirrorLauncher>(cfg.tools.scrcpy_path);
    tools.screen = std::make_unique<XdotoolScreenToggle>(cfg.tools.xdotool_path, keys, timeout);
    return tools;
}

// =============================================================================
// Construction
// =============================================================================

DroidController::DroidController(ControllerOptions options, ControllerTools tools, EventBus& events)
    : options_(std::move(options)),
      events_(events),
      coordinator_(tools.probe ? std::move(tools.probe) : ProbeFunction(probePort)),
      bridge_(orDefault<BridgeConnector, AdbBridgeConnector>(std::move(tools.bridge))),
      launcher_(orDefault<MirrorLauncher, ScrcpyMirrorLauncher>(std::move(tools.launcher))),
      screen_(orDefault<ScreenToggleSender, XdotoolScreenToggle>(std::move(tools.screen))),
      orchestrator_(registry_, *bridge_, *launcher_, options_.scan.port),
      toggler_(orchestrator_, *screen_) {

    registry_.setChangeCallback([this](const DeviceRegistry::Snapshot& snap) {
        DeviceListChangedEvent ev;
        ev.generation = snap.generation;
        for (const auto& dev : snap.devices) ev.devices.push_back(dev.address);
        events_.publish(ev);
    });

    orchestrator_.setStateCallback([this](const SessionOrchestrator::SessionInfo& s) {
        events_.publish(toEvent(s));
    });

    shutdown_sub_ = events_.subscribe<ShutdownEvent>([this](const ShutdownEvent&) {
        shutdown();
    });
}

DroidController::~DroidController() {
    shutdown_sub_ = SubscriptionHandle();
    stopMirrorMonitor();
    stopScan();
    joinScanThread();
    registry_.setChangeCallback(nullptr);
    orchestrator_.setStateCallback(nullptr);
}

// =============================================================================
// Discovery
// =============================================================================

Result<AddressRange> DroidController::resolveRange() const {
    if (!options_.subnet.empty()) {
        return AddressRange::fromCidr(options_.subnet);
    }

    auto detected = detectLocalRange(options_.interface_name);
    if (detected.is_ok()) {
        return detected;
    }
    DLOG_WARN("controller", "Local network detection failed (%s), falling back to %s",
              detected.error().message.c_str(), options_.fallback_subnet.c_str());
    if (options_.fallback_subnet.empty()) {
        return detected.error();
    }
    return AddressRange::fromCidr(options_.fallback_subnet);
}

VoidResult DroidController::startScan() {
    auto range = resolveRange();
    if (range.is_err()) {
        DLOG_ERROR("controller", "Cannot scan: %s", range.error().describe().c_str());
        return range.error();
    }
    return startScan(range.value());
}

VoidResult DroidController::startScan(const AddressRange& range) {
    const ScanOptions options = options_.scan;
    if (options.workers == 0 || options.port == 0 || options.timeout.count() <= 0) {
        return Err(ErrorCode::Configuration, "invalid scan options");
    }

    {
        std::lock_guard<std::mutex> lock(scan_mutex_);
        if (scanning_) {
            return Err(ErrorCode::Busy, "a scan is already running");
        }
        if (scan_thread_.joinable()) {
            scan_thread_.join();   // finished; just reap it
        }
        coordinator_.resetCancellation();
        scanning_ = true;
        last_range_ = range;
    }

    ScanStartedEvent started;
    started.range = range.toString();
    started.port = options.port;
    started.total = range.hostCount();
    events_.publish(started);

    std::lock_guard<std::mutex> lock(scan_mutex_);
    try {
        scan_thread_ = std::thread(&DroidController::scanThread, this, range, options);
    } catch (const std::system_error& e) {
        scanning_ = false;
        scan_cv_.notify_all();
        DLOG_ERROR("controller", "Could not start scan thread: %s", e.what());
        return Err(ErrorCode::Internal, std::string("could not start scan thread: ") + e.what());
    }
    return Ok();
}

VoidResult DroidController::rescan() {
    std::optional<AddressRange> range;
    {
        std::lock_guard<std::mutex> lock(scan_mutex_);
        range = last_range_;
    }
    if (!range) return startScan();
    DLOG_INFO("controller", "Rescanning %s", range->toString().c_str());
    return startScan(*range);
}

void DroidController::scanThread(AddressRange range, ScanOptions options) {
    auto result = coordinator_.run(range, options, [this](uint64_t completed, uint64_t total) {
        ScanProgressEvent ev;
        ev.completed = completed;
        ev.total = total;
        events_.publish(ev);
    });

    if (result.is_ok()) {
        const ScanRun& run = result.value();

        std::vector<Device> found;
        found.reserve(run.live.size());
        for (const auto& host : run.live) {
            Device dev;
            dev.address = host.address;
            dev.reachability = Device::Reachability::Reachable;
            dev.discovered_at = host.discovered_at;
            found.push_back(std::move(dev));
        }
        registry_.replace(std::move(found));

        ScanCompletedEvent ev;
        ev.devices = run.liveAddresses();
        ev.completed = run.completed;
        ev.total = run.total;
        ev.port = run.port;
        ev.cancelled = run.cancelled;
        ev.elapsed_ms = run.elapsed().count();

        {
            std::lock_guard<std::mutex> lock(scan_mutex_);
            last_scan_ = run;
        }
        events_.publish(ev);
    } else {
        DLOG_ERROR("controller", "Scan failed: %s", result.error().describe().c_str());
        ScanFailedEvent ev;
        ev.error = result.error().describe();
        events_.publish(ev);
    }

    {
        std::lock_guard<std::mutex> lock(scan_mutex_);
        scanning_ = false;
    }
    scan_cv_.notify_all();
}

void DroidController::stopScan() {
    std::lock_guard<std::mutex> lock(scan_mutex_);
    if (scanning_) {
        coordinator_.cancel();
    }
}

bool DroidController::waitForScan(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(scan_mutex_);
    return scan_cv_.wait_for(lock, timeout, [this] { return !scanning_; });
}

bool DroidController::isScanning() const {
    std::lock_guard<std::mutex> lock(scan_mutex_);
    return scanning_;
}

std::optional<ScanRun> DroidController::lastScan() const {
    std::lock_guard<std::mutex> lock(scan_mutex_);
    return last_scan_;
}

void DroidController::joinScanThread() {
    std::thread t;
    {
        std::lock_guard<std::mutex> lock(scan_mutex_);
        t = std::move(scan_thread_);
    }
    if (t.joinable()) t.join();
}

// =============================================================================
// Devices / session
// =============================================================================

VoidResult DroidController::selectDevice(const std::string& address) {
    auto r = registry_.select(address);
    if (r.is_err()) return r;

    DeviceSelectedEvent ev;
    ev.address = address;
    events_.publish(ev);
    return Ok();
}

Result<SessionOrchestrator::SessionInfo> DroidController::startSession() {
    return orchestrator_.startSession();
}

Result<SessionOrchestrator::SessionInfo> DroidController::stopSession() {
    return orchestrator_.stopSession();
}

Result<bool> DroidController::toggleScreen() {
    auto r = toggler_.toggle();
    if (r.is_err()) return r.error();

    ScreenStateChangedEvent ev;
    ev.session_id = r.value().session_id;
    ev.screen_on = r.value().screen_on;
    events_.publish(ev);
    return r.value().screen_on;
}

// =============================================================================
// Mirror monitor
// =============================================================================

void DroidController::startMirrorMonitor(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    if (monitor_running_) return;
    monitor_running_ = true;
    monitor_thread_ = std::thread([this, interval]() {
        std::unique_lock<std::mutex> lk(monitor_mutex_);
        while (monitor_running_) {
            monitor_cv_.wait_for(lk, interval, [this] { return !monitor_running_; });
            if (!monitor_running_) break;
            lk.unlock();
            orchestrator_.pollMirror();
            lk.lock();
        }
    });
}

void DroidController::stopMirrorMonitor() {
    std::thread t;
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        if (!monitor_running_) return;
        monitor_running_ = false;
        t = std::move(monitor_thread_);
    }
    monitor_cv_.notify_all();
    if (t.joinable()) t.join();
}

// =============================================================================
// Shutdown
// =============================================================================

void DroidController::shutdown(std::chrono::milliseconds scan_grace) {
    DLOG_INFO("controller", "Shutting down");
    stopMirrorMonitor();
    stopScan();
    if (!waitForScan(scan_grace)) {
        DLOG_WARN("controller", "Scan still running after %lld ms",
                  static_cast<long long>(scan_grace.count()));
    }

    auto s = orchestrator_.session();
    if (s.state == SessionOrchestrator::State::Active ||
        s.state == SessionOrchestrator::State::Connecting) {
        auto stopped = orchestrator_.stopSession();
        if (stopped.is_err()) {
            DLOG_WARN("controller", "Stopping session #%llu: %s",
                      static_cast<unsigned long long>(s.id), stopped.error().message.c_str());
        }
    }
}

} // namespace droid
