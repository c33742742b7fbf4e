// =============================================================================
// DroidMirror - Port Probe
// =============================================================================
// Bounded-timeout TCP reachability check against one host:port pair.
// The socket is closed as soon as the handshake completes; nothing is sent.
// =============================================================================
#pragma once

#include "result.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace droid {

enum class ProbeOutcome {
    Reachable,    // listener accepted within the timeout
    Unreachable   // refused, network unreachable, or timed out
};

inline const char* probeOutcomeStr(ProbeOutcome o) {
    return o == ProbeOutcome::Reachable ? "reachable" : "unreachable";
}

// Seam used by the scan coordinator; tests substitute a fake
using ProbeFunction = std::function<Result<ProbeOutcome>(const std::string& host,
                                                         uint16_t port,
                                                         std::chrono::milliseconds timeout)>;

/**
 * Attempt a TCP connection to host:port.
 * Refusal and timeout are ordinary Unreachable outcomes; only malformed input
 * (non dotted-quad host, port 0) yields a Configuration error.
 */
Result<ProbeOutcome> probePort(const std::string& host, uint16_t port,
                               std::chrono::milliseconds timeout);

} // namespace droid
