#include "port_probe.hpp"
#include "subnet_enumerator.hpp"
#include "droid_log.hpp"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace droid {

namespace {

// Closes the descriptor on every return path
struct SocketGuard {
    int fd = -1;
    explicit SocketGuard(int f) : fd(f) {}
    ~SocketGuard() { if (fd >= 0) ::close(fd); }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;
};

} // anonymous namespace

Result<ProbeOutcome> probePort(const std::string& host, uint16_t port,
                               std::chrono::milliseconds timeout) {
    auto ip = parseIpv4(host);
    if (!ip) {
        return Err(ErrorCode::Configuration, "invalid probe address '" + host + "'");
    }
    if (port == 0) {
        return Err(ErrorCode::Configuration, "probe port must be non-zero");
    }

    // Close-on-exec: a mirror launched mid-scan must not inherit probe sockets
    SocketGuard sock(::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if (sock.fd < 0) {
        // fd exhaustion on this side says nothing about the host
        DLOG_WARN("probe", "socket() failed for %s: %s", host.c_str(), std::strerror(errno));
        return ProbeOutcome::Unreachable;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(*ip);

    int res = ::connect(sock.fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (res == 0) {
        return ProbeOutcome::Reachable;
    }
    if (errno != EINPROGRESS) {
        DLOG_TRACE("probe", "%s:%u connect: %s", host.c_str(), port, std::strerror(errno));
        return ProbeOutcome::Unreachable;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    struct pollfd pfd{};
    pfd.fd = sock.fd;
    pfd.events = POLLOUT;
    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            DLOG_TRACE("probe", "%s:%u timed out", host.c_str(), port);
            return ProbeOutcome::Unreachable;
        }
        int ready = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (ready > 0) break;
        if (ready == 0) {
            DLOG_TRACE("probe", "%s:%u timed out", host.c_str(), port);
            return ProbeOutcome::Unreachable;
        }
        if (errno != EINTR) {
            return ProbeOutcome::Unreachable;
        }
    }

    int soerr = 0;
    socklen_t len = sizeof(soerr);
    if (getsockopt(sock.fd, SOL_SOCKET, SO_ERROR, &soerr, &len) < 0 || soerr != 0) {
        DLOG_TRACE("probe", "%s:%u refused (%s)", host.c_str(), port, std::strerror(soerr));
        return ProbeOutcome::Unreachable;
    }

    DLOG_DEBUG("probe", "%s:%u reachable", host.c_str(), port);
    return ProbeOutcome::Reachable;
}

} // namespace droid
