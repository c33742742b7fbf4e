#include "scan_coordinator.hpp"
#include "droid_log.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>

namespace droid {

std::vector<std::string> ScanRun::liveAddresses() const {
    std::vector<std::string> out;
    out.reserve(live.size());
    for (const auto& host : live) out.push_back(host.address);
    return out;
}

namespace {

// Clears the running and cancel flags on every exit path of run()
struct RunningGuard {
    std::atomic<bool>& running;
    std::atomic<bool>& cancel;
    ~RunningGuard() {
        cancel.store(false, std::memory_order_release);
        running.store(false);
    }
};

} // anonymous namespace

ScanCoordinator::ScanCoordinator(ProbeFunction probe)
    : probe_(probe ? std::move(probe) : ProbeFunction(probePort)) {}

void ScanCoordinator::cancel() {
    if (running_.load()) {
        DLOG_INFO("scan", "Cancellation requested");
    }
    cancel_requested_.store(true, std::memory_order_release);
}

void ScanCoordinator::resetCancellation() {
    if (!running_.load()) {
        cancel_requested_.store(false, std::memory_order_release);
    }
}

Result<ScanRun> ScanCoordinator::run(const AddressRange& range, const ScanOptions& options,
                                     ProgressCallback progress) {
    if (options.workers == 0) {
        return Err(ErrorCode::Configuration, "worker budget must be at least 1");
    }
    if (options.port == 0) {
        return Err(ErrorCode::Configuration, "scan port must be non-zero");
    }
    if (options.timeout.count() <= 0) {
        return Err(ErrorCode::Configuration, "probe timeout must be positive");
    }
    if (running_.exchange(true)) {
        return Err(ErrorCode::Busy, "a scan is already running");
    }
    RunningGuard guard{running_, cancel_requested_};

    // Shared between workers; everything below is guarded by state_mutex
    std::mutex state_mutex;
    HostSequence candidates = range.hosts();
    size_t in_flight = 0;

    ScanRun result;
    result.port = options.port;
    result.total = range.hostCount();
    result.started = std::chrono::steady_clock::now();

    const size_t worker_count = static_cast<size_t>(
        std::min<uint64_t>(options.workers, std::max<uint64_t>(result.total, 1)));

    DLOG_INFO("scan", "Scanning %s port %u: %llu candidates, %zu workers, timeout %lldms",
              range.toString().c_str(), options.port,
              (unsigned long long)result.total, worker_count,
              (long long)options.timeout.count());

    // Progress is delivered outside state_mutex, one call per completion in
    // increasing order. Whichever worker finds no report in flight drains the
    // pending counts; the others go straight back to probing. A throwing
    // observer is logged and the scan continues.
    std::mutex progress_mutex;
    uint64_t reported = 0;
    uint64_t pending = 0;
    bool reporting = false;
    const uint64_t total = result.total;

    auto report = [&](uint64_t ticket) {
        std::unique_lock<std::mutex> lock(progress_mutex);
        pending = std::max(pending, ticket);
        if (reporting) return;
        reporting = true;
        while (reported < pending) {
            const uint64_t next = ++reported;
            lock.unlock();
            try {
                progress(next, total);
            } catch (const std::exception& e) {
                DLOG_ERROR("scan", "Progress callback threw: %s", e.what());
            }
            lock.lock();
        }
        reporting = false;
    };

    auto worker = [&]() {
        while (true) {
            std::string host;
            {
                std::lock_guard<std::mutex> lock(state_mutex);
                if (cancel_requested_.load(std::memory_order_acquire)) {
                    if (candidates.remaining() > 0) result.cancelled = true;
                    return;
                }
                auto next = candidates.next();
                if (!next) return;
                host = std::move(*next);
                ++result.dispatched;
                ++in_flight;
                result.peak_in_flight = std::max(result.peak_in_flight, in_flight);
            }

            bool reachable = false;
            bool failed = false;
            try {
                auto outcome = probe_(host, options.port, options.timeout);
                if (outcome.is_ok()) {
                    reachable = outcome.value() == ProbeOutcome::Reachable;
                } else {
                    failed = true;
                    DLOG_WARN("scan", "Probe %s failed: %s", host.c_str(),
                              outcome.error().describe().c_str());
                }
            } catch (const std::exception& e) {
                failed = true;
                DLOG_ERROR("scan", "Probe %s threw: %s", host.c_str(), e.what());
            }

            uint64_t ticket = 0;
            {
                std::lock_guard<std::mutex> lock(state_mutex);
                --in_flight;
                ticket = ++result.completed;
                if (failed) ++result.probe_errors;
                if (reachable) {
                    result.live.push_back({host, std::chrono::system_clock::now()});
                    DLOG_INFO("scan", "Found %s:%u", host.c_str(), options.port);
                }
            }
            if (progress) report(ticket);
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    try {
        for (size_t i = 0; i < worker_count; ++i) {
            workers.emplace_back(worker);
        }
    } catch (const std::system_error& e) {
        // Thread limit hit: run with the workers we have
        DLOG_WARN("scan", "Started %zu of %zu workers: %s", workers.size(), worker_count, e.what());
    }
    for (auto& t : workers) {
        t.join();
    }
    if (workers.empty()) {
        return Err(ErrorCode::Internal, "could not start any scan worker");
    }

    result.ended = std::chrono::steady_clock::now();
    DLOG_INFO("scan", "Scan %s: %llu/%llu probes, %zu live, peak %zu in flight, %lldms",
              result.cancelled ? "cancelled" : "complete",
              (unsigned long long)result.completed, (unsigned long long)result.total,
              result.live.size(), result.peak_in_flight, (long long)result.elapsed().count());
    return result;
}

} // namespace droid
