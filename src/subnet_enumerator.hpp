// =============================================================================
// DroidMirror - Subnet Enumerator
// =============================================================================
// Derives the candidate host addresses of an IPv4 block from an address and
// a mask or prefix length.
// =============================================================================
#pragma once

#include "result.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace droid {

// Dotted quad <-> host-order integer
std::optional<uint32_t> parseIpv4(const std::string& text);
std::string formatIpv4(uint32_t address);

/**
 * Single-pass host address sequence.
 * Yields addresses in ascending order; once exhausted it stays exhausted.
 */
class HostSequence {
public:
    HostSequence(uint32_t first, uint64_t count) : next_(first), remaining_(count) {}

    // Next host address, or nullopt when the range is exhausted
    std::optional<std::string> next();

    uint64_t remaining() const { return remaining_; }

private:
    uint32_t next_;
    uint64_t remaining_;
};

/**
 * Immutable IPv4 block. Usable hosts exclude the network and broadcast
 * addresses for prefixes shorter than /31; /31 yields both addresses and
 * /32 the single address.
 */
class AddressRange {
public:
    static Result<AddressRange> fromAddressAndPrefix(const std::string& address, int prefix);
    static Result<AddressRange> fromAddressAndMask(const std::string& address, const std::string& mask);
    // "192.168.1.0/24"; a bare address is treated as /24
    static Result<AddressRange> fromCidr(const std::string& cidr);

    uint32_t network() const { return network_; }
    int prefixLength() const { return prefix_; }
    std::string networkAddress() const { return formatIpv4(network_); }
    std::string broadcastAddress() const { return formatIpv4(broadcast()); }

    uint32_t firstHost() const;
    uint64_t hostCount() const;

    HostSequence hosts() const { return HostSequence(firstHost(), hostCount()); }

    bool contains(const std::string& address) const;

    // "192.168.1.0/24"
    std::string toString() const;

private:
    AddressRange(uint32_t network, int prefix) : network_(network), prefix_(prefix) {}
    uint32_t broadcast() const;

    uint32_t network_ = 0;
    int prefix_ = 0;
};

/**
 * Range of a local IPv4 interface (getifaddrs). An empty name picks the first
 * interface that is up and not loopback.
 */
Result<AddressRange> detectLocalRange(const std::string& interface_name = "");

} // namespace droid
