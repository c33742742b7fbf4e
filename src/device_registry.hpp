#pragma once
#include "result.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace droid {

// =============================================================================
// Device: one host that answered on the ADB port
// =============================================================================
struct Device {
    enum class Reachability : uint8_t { Unknown = 0, Reachable, Unreachable };

    std::string address;                                  // "192.168.1.23" (unique key)
    Reachability reachability = Reachability::Unknown;    // at last probe
    std::chrono::system_clock::time_point discovered_at{};
    bool selected = false;
};

const char* reachabilityStr(Device::Reachability r);

// =============================================================================
// DeviceRegistry: authoritative device list + current selection
// =============================================================================
// State lives in immutable snapshots. Every mutation builds a new snapshot and
// swaps the pointer under the lock, so a reader holding a snapshot always sees
// one complete device set, never a mix of two scan runs.
class DeviceRegistry {
public:
    struct Snapshot {
        std::vector<Device> devices;    // discovery order, unique addresses
        uint64_t generation = 0;        // bumped by replace()

        std::optional<Device> selected() const;
        const Device* find(const std::string& address) const;
    };

    DeviceRegistry();
    ~DeviceRegistry() = default;

    // Swap in a new scan's results. Duplicates keep their first occurrence.
    // Clears any selection.
    void replace(std::vector<Device> devices);

    // Mark exactly one device selected (NotFound if absent, no state change)
    VoidResult select(const std::string& address);
    void clearSelection();

    std::optional<Device> currentSelection() const;

    std::shared_ptr<const Snapshot> snapshot() const;
    std::vector<Device> devices() const;
    size_t deviceCount() const;
    uint64_t generation() const;

    // --- change notification (called outside the lock) ---
    using ChangeCallback = std::function<void(const Snapshot& snapshot)>;
    void setChangeCallback(ChangeCallback cb);

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const Snapshot> current_;
    ChangeCallback change_cb_;
};

} // namespace droid
