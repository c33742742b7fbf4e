#include "device_registry.hpp"
#include "droid_log.hpp"
#include <algorithm>
#include <unordered_set>

namespace droid {

const char* reachabilityStr(Device::Reachability r) {
    switch (r) {
        case Device::Reachability::Reachable:   return "reachable";
        case Device::Reachability::Unreachable: return "unreachable";
        case Device::Reachability::Unknown:     break;
    }
    return "unknown";
}

// =============================================================================
// Snapshot
// =============================================================================

std::optional<Device> DeviceRegistry::Snapshot::selected() const {
    for (const auto& dev : devices) {
        if (dev.selected) return dev;
    }
    return std::nullopt;
}

const Device* DeviceRegistry::Snapshot::find(const std::string& address) const {
    for (const auto& dev : devices) {
        if (dev.address == address) return &dev;
    }
    return nullptr;
}

// =============================================================================
// Registry
// =============================================================================

DeviceRegistry::DeviceRegistry() : current_(std::make_shared<Snapshot>()) {}

void DeviceRegistry::replace(std::vector<Device> devices) {
    auto next = std::make_shared<Snapshot>();
    next->devices.reserve(devices.size());

    std::unordered_set<std::string> seen;
    size_t duplicates = 0;
    for (auto& dev : devices) {
        if (!seen.insert(dev.address).second) {
            ++duplicates;
            continue;
        }
        dev.selected = false;
        next->devices.push_back(std::move(dev));
    }

    ChangeCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        next->generation = current_->generation + 1;
        current_ = next;
        cb = change_cb_;
    }
    DLOG_INFO("Registry", "Replaced contents: %zu device(s) (%zu duplicate(s) dropped), generation %llu",
              next->devices.size(), duplicates, (unsigned long long)next->generation);
    if (cb) cb(*next);
}

VoidResult DeviceRegistry::select(const std::string& address) {
    std::shared_ptr<const Snapshot> next;
    ChangeCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!current_->find(address)) {
            DLOG_WARN("Registry", "Select failed: %s not in registry", address.c_str());
            return Err(ErrorCode::NotFound, "device " + address + " is not in the device list");
        }
        auto copy = std::make_shared<Snapshot>(*current_);
        for (auto& dev : copy->devices) {
            dev.selected = (dev.address == address);
        }
        current_ = copy;
        next = copy;
        cb = change_cb_;
    }
    DLOG_INFO("Registry", "Selected %s", address.c_str());
    if (cb) cb(*next);
    return Ok();
}

void DeviceRegistry::clearSelection() {
    std::shared_ptr<const Snapshot> next;
    ChangeCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto copy = std::make_shared<Snapshot>(*current_);
        for (auto& dev : copy->devices) dev.selected = false;
        current_ = copy;
        next = copy;
        cb = change_cb_;
    }
    if (cb) cb(*next);
}

std::optional<Device> DeviceRegistry::currentSelection() const {
    return snapshot()->selected();
}

std::shared_ptr<const DeviceRegistry::Snapshot> DeviceRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

std::vector<Device> DeviceRegistry::devices() const {
    return snapshot()->devices;
}

size_t DeviceRegistry::deviceCount() const {
    return snapshot()->devices.size();
}

uint64_t DeviceRegistry::generation() const {
    return snapshot()->generation;
}

void DeviceRegistry::setChangeCallback(ChangeCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    change_cb_ = std::move(cb);
}

} // namespace droid
