#include "subnet_enumerator.hpp"
#include "droid_log.hpp"

#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <sys/socket.h>

#include <cctype>
#include <cstdlib>
#include <sstream>

namespace droid {

// =============================================================================
// Dotted quad helpers
// =============================================================================

std::optional<uint32_t> parseIpv4(const std::string& text) {
    if (text.empty() || text.size() > 15) return std::nullopt;

    uint32_t result = 0;
    int octets = 0;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t dot = text.find('.', pos);
        std::string part = text.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
        if (part.empty() || part.size() > 3) return std::nullopt;
        for (char c : part) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        }
        // "01" is ambiguous (octal in some resolvers)
        if (part.size() > 1 && part[0] == '0') return std::nullopt;
        int value = std::atoi(part.c_str());
        if (value > 255) return std::nullopt;
        result = (result << 8) | static_cast<uint32_t>(value);
        ++octets;
        if (dot == std::string::npos) break;
        pos = dot + 1;
    }
    if (octets != 4) return std::nullopt;
    return result;
}

std::string formatIpv4(uint32_t address) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%u.%u.%u.%u",
             (address >> 24) & 0xFF, (address >> 16) & 0xFF,
             (address >> 8) & 0xFF, address & 0xFF);
    return buf;
}

namespace {

uint32_t prefixToMask(int prefix) {
    if (prefix <= 0) return 0;
    if (prefix >= 32) return 0xFFFFFFFFu;
    return 0xFFFFFFFFu << (32 - prefix);
}

// Contiguous masks only: 255.255.255.0 -> 24, 255.0.255.0 -> nullopt
std::optional<int> maskToPrefix(uint32_t mask) {
    uint32_t inverted = ~mask;
    if ((inverted & (inverted + 1)) != 0) return std::nullopt;
    int prefix = 0;
    while (prefix < 32 && (mask & (0x80000000u >> prefix))) ++prefix;
    return prefix;
}

} // anonymous namespace

// =============================================================================
// HostSequence
// =============================================================================

std::optional<std::string> HostSequence::next() {
    if (remaining_ == 0) return std::nullopt;
    std::string out = formatIpv4(next_);
    --remaining_;
    if (remaining_ > 0) ++next_;
    return out;
}

// =============================================================================
// AddressRange
// =============================================================================

Result<AddressRange> AddressRange::fromAddressAndPrefix(const std::string& address, int prefix) {
    auto ip = parseIpv4(address);
    if (!ip) {
        return Err(ErrorCode::Configuration, "invalid IPv4 address '" + address + "'");
    }
    if (prefix < 0 || prefix > 32) {
        return Err(ErrorCode::Configuration, "prefix length out of range: " + std::to_string(prefix));
    }

    AddressRange range(*ip & prefixToMask(prefix), prefix);
    if (range.hostCount() == 0) {
        return Err(ErrorCode::Configuration, "empty usable range for " + range.toString());
    }
    return range;
}

Result<AddressRange> AddressRange::fromAddressAndMask(const std::string& address, const std::string& mask) {
    auto mask_value = parseIpv4(mask);
    if (!mask_value) {
        return Err(ErrorCode::Configuration, "invalid subnet mask '" + mask + "'");
    }
    auto prefix = maskToPrefix(*mask_value);
    if (!prefix) {
        return Err(ErrorCode::Configuration, "non-contiguous subnet mask '" + mask + "'");
    }
    return fromAddressAndPrefix(address, *prefix);
}

Result<AddressRange> AddressRange::fromCidr(const std::string& cidr) {
    size_t slash = cidr.find('/');
    if (slash == std::string::npos) {
        return fromAddressAndPrefix(cidr, 24);
    }

    std::string prefix_str = cidr.substr(slash + 1);
    if (prefix_str.empty() || prefix_str.size() > 2) {
        return Err(ErrorCode::Configuration, "invalid prefix in '" + cidr + "'");
    }
    for (char c : prefix_str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return Err(ErrorCode::Configuration, "invalid prefix in '" + cidr + "'");
        }
    }
    return fromAddressAndPrefix(cidr.substr(0, slash), std::atoi(prefix_str.c_str()));
}

uint32_t AddressRange::broadcast() const {
    return network_ | ~prefixToMask(prefix_);
}

uint32_t AddressRange::firstHost() const {
    return prefix_ >= 31 ? network_ : network_ + 1;
}

uint64_t AddressRange::hostCount() const {
    uint64_t block = 1ull << (32 - prefix_);
    return prefix_ >= 31 ? block : block - 2;
}

bool AddressRange::contains(const std::string& address) const {
    auto ip = parseIpv4(address);
    if (!ip) return false;
    uint64_t offset = static_cast<uint64_t>(*ip) - firstHost();
    return *ip >= firstHost() && offset < hostCount();
}

std::string AddressRange::toString() const {
    std::ostringstream oss;
    oss << formatIpv4(network_) << "/" << prefix_;
    return oss.str();
}

// =============================================================================
// Local interface detection
// =============================================================================

Result<AddressRange> detectLocalRange(const std::string& interface_name) {
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        return Err(ErrorCode::Io, "getifaddrs failed");
    }

    std::optional<Result<AddressRange>> found;
    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || !ifa->ifa_netmask) continue;
        if (ifa->ifa_addr->sa_family != AF_INET) continue;
        if (!interface_name.empty() && interface_name != ifa->ifa_name) continue;
        if (ifa->ifa_flags & IFF_LOOPBACK) continue;
        if (!(ifa->ifa_flags & IFF_UP)) continue;

        auto* addr = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        auto* netmask = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_netmask);
        std::string ip = formatIpv4(ntohl(addr->sin_addr.s_addr));
        std::string mask = formatIpv4(ntohl(netmask->sin_addr.s_addr));

        auto range = AddressRange::fromAddressAndMask(ip, mask);
        if (range.is_ok()) {
            DLOG_INFO("subnet", "Interface %s: %s (mask %s) -> %s",
                      ifa->ifa_name, ip.c_str(), mask.c_str(), range.value().toString().c_str());
            found = range;
            break;
        }
        DLOG_WARN("subnet", "Interface %s skipped: %s",
                  ifa->ifa_name, range.error().message.c_str());
    }
    freeifaddrs(ifaddr);

    if (!found) {
        return Err(ErrorCode::Configuration,
                   interface_name.empty() ? std::string("no usable IPv4 interface found")
                                          : "interface " + interface_name + " not found or not usable");
    }
    return *found;
}

} // namespace droid
