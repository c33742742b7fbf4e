#pragma once
// =============================================================================
// adb_security.hpp
//
// Validation for every value that ends up on an external tool's command line
// (adb connect target, scrcpy --tcpip target, xdotool key specs and window
// ids). Processes are exec'd with argv vectors, but values are still checked
// here before any tool is invoked.
// =============================================================================

#include <cctype>
#include <cstdint>
#include <cstring>
#include <string>

#include "subnet_enumerator.hpp"

namespace droid {
namespace security {

// Characters that never belong in a host, key spec, or window id
constexpr const char* SHELL_METACHARACTERS = "|;&$`\\\"'<>(){}[]!#*?~\n\r ";

inline bool containsMetacharacters(const std::string& s) {
    for (char c : s) {
        if (std::strchr(SHELL_METACHARACTERS, c) != nullptr) return true;
    }
    return false;
}

/**
 * Strict dotted-quad IPv4 address ("192.168.1.23").
 * Hostnames are not accepted: discovery only ever produces addresses.
 */
inline bool isValidHostAddress(const std::string& address) {
    if (address.empty() || address.length() > 15) return false;
    return parseIpv4(address).has_value();
}

/**
 * "a.b.c.d:port" as passed to `adb connect` and `scrcpy --tcpip=`.
 */
inline bool isValidTcpTarget(const std::string& target) {
    size_t colon = target.rfind(':');
    if (colon == std::string::npos || colon + 1 >= target.size()) return false;
    if (!isValidHostAddress(target.substr(0, colon))) return false;

    std::string port = target.substr(colon + 1);
    if (port.size() > 5) return false;
    unsigned long value = 0;
    for (char c : port) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    return value > 0 && value <= 65535;
}

inline std::string formatTcpTarget(const std::string& address, uint16_t port) {
    return address + ":" + std::to_string(port);
}

/**
 * xdotool key combination: keysym names joined by '+', e.g. "alt+shift+o".
 */
inline bool isValidKeySpec(const std::string& keys) {
    if (keys.empty() || keys.length() > 64) return false;
    if (containsMetacharacters(keys)) return false;
    if (keys.front() == '+' || keys.back() == '+') return false;

    char prev = '\0';
    for (char c : keys) {
        if (c == '+' && prev == '+') return false;
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '_') {
            return false;
        }
        prev = c;
    }
    return true;
}

/**
 * X11 window id as printed by `xdotool search` (decimal).
 */
inline bool isValidWindowId(const std::string& id) {
    if (id.empty() || id.length() > 20) return false;
    for (char c : id) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace security
} // namespace droid
