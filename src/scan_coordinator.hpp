// =============================================================================
// DroidMirror - Scan Coordinator
// =============================================================================
// Fans Port Probe out over every address of an AddressRange with a fixed
// worker budget. Workers pull addresses from one shared dispatch point, so
// each candidate is probed exactly once and at most `workers` probes are in
// flight. Cancellation is cooperative: it stops dispatch, lets in-flight
// probes finish, and returns the partial result.
// =============================================================================
#pragma once

#include "port_probe.hpp"
#include "result.hpp"
#include "subnet_enumerator.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace droid {

constexpr uint16_t DEFAULT_ADB_PORT = 5555;
constexpr int DEFAULT_PROBE_TIMEOUT_MS = 500;
constexpr size_t DEFAULT_SCAN_WORKERS = 100;

struct ScanOptions {
    uint16_t port = DEFAULT_ADB_PORT;
    std::chrono::milliseconds timeout{DEFAULT_PROBE_TIMEOUT_MS};
    size_t workers = DEFAULT_SCAN_WORKERS;
};

struct DiscoveredHost {
    std::string address;
    std::chrono::system_clock::time_point discovered_at;
};

// One execution of the discovery process
struct ScanRun {
    uint16_t port = 0;
    uint64_t total = 0;           // candidate count
    uint64_t dispatched = 0;      // probes handed to workers
    uint64_t completed = 0;       // probes that reported back
    uint64_t probe_errors = 0;    // probe failures counted as unreachable
    size_t peak_in_flight = 0;
    bool cancelled = false;
    std::vector<DiscoveredHost> live;   // in discovery order
    std::chrono::steady_clock::time_point started;
    std::chrono::steady_clock::time_point ended;

    std::chrono::milliseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(ended - started);
    }

    std::vector<std::string> liveAddresses() const;
};

class ScanCoordinator {
public:
    // (completed, total); invoked once per finished probe, in increasing order,
    // on a worker thread with no coordinator lock held. Calls never overlap,
    // and a slow observer does not hold up the other workers' probes.
    // Exceptions are logged and dropped.
    using ProgressCallback = std::function<void(uint64_t completed, uint64_t total)>;

    explicit ScanCoordinator(ProbeFunction probe = probePort);

    ScanCoordinator(const ScanCoordinator&) = delete;
    ScanCoordinator& operator=(const ScanCoordinator&) = delete;

    /**
     * Run a blocking scan. Returns the ScanRun on completion or cancellation.
     * Fails before dispatching anything on invalid options (Configuration)
     * or when another run is in progress on this coordinator (Busy).
     */
    Result<ScanRun> run(const AddressRange& range, const ScanOptions& options,
                        ProgressCallback progress = {});

    // Stop dispatching. Applies to the run in progress, or to the next run
    // if none has started yet. Safe from any thread, including from inside a
    // probe or progress callback.
    void cancel();

    // Drop a cancel request that did not reach any run. No effect while a
    // run is in progress.
    void resetCancellation();

    bool isRunning() const { return running_.load(); }

private:
    ProbeFunction probe_;
    std::atomic<bool> running_{false};
    std::atomic<bool> cancel_requested_{false};
};

} // namespace droid
