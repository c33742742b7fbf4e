// =============================================================================
// DroidMirror - Event Bus
// =============================================================================
// Thread-safe, type-erased publish/subscribe event system.
// Decouples the controller core from the front end: scan progress, device
// list changes and session transitions arrive as events.
// Usage:
//   auto sub = droid::bus().subscribe<ScanCompletedEvent>([](const auto& e) { ... });
//   droid::bus().publish(ScanCompletedEvent{...});
// =============================================================================
#pragma once
#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>
#include "droid_log.hpp"

namespace droid {

// =============================================================================
// Event Types
// =============================================================================

struct Event {
    virtual ~Event() = default;
};

// Discovery
struct ScanStartedEvent : Event {
    std::string range;          // "192.168.1.0/24"
    uint16_t port = 0;
    uint64_t total = 0;
};

struct ScanProgressEvent : Event {
    uint64_t completed = 0;
    uint64_t total = 0;
};

struct ScanCompletedEvent : Event {
    std::vector<std::string> devices;   // discovery order
    uint64_t completed = 0;
    uint64_t total = 0;
    uint16_t port = 0;
    bool cancelled = false;
    int64_t elapsed_ms = 0;
};

struct ScanFailedEvent : Event {
    std::string error;
};

// Registry
struct DeviceListChangedEvent : Event {
    std::vector<std::string> devices;
    uint64_t generation = 0;
};

struct DeviceSelectedEvent : Event {
    std::string address;
};

// Session
struct SessionStateChangedEvent : Event {
    uint64_t session_id = 0;
    std::string device_address;
    std::string state;          // sessionStateStr()
    std::string outcome;        // sessionOutcomeStr()
    std::string failed_step;    // failedStepStr()
    std::string reason;
};

struct ScreenStateChangedEvent : Event {
    uint64_t session_id = 0;
    bool screen_on = true;
};

// System
struct ShutdownEvent : Event {};

// =============================================================================
// SubscriptionHandle - RAII unsubscribe
// =============================================================================

class SubscriptionHandle {
public:
    SubscriptionHandle() = default;
    explicit SubscriptionHandle(std::function<void()> unsub) : unsub_(std::move(unsub)) {}
    ~SubscriptionHandle() { if (unsub_) unsub_(); }

    SubscriptionHandle(SubscriptionHandle&& o) noexcept : unsub_(std::move(o.unsub_)) { o.unsub_ = nullptr; }
    SubscriptionHandle& operator=(SubscriptionHandle&& o) noexcept {
        if (unsub_) unsub_();
        unsub_ = std::move(o.unsub_);
        o.unsub_ = nullptr;
        return *this;
    }
    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    void release() { unsub_ = nullptr; }

private:
    std::function<void()> unsub_;
};

// =============================================================================
// EventBus
// =============================================================================
// Handlers run on the publishing thread, outside the bus lock. A throwing
// handler is logged and does not stop delivery to the others.
class EventBus {
public:
    using HandlerId = uint64_t;

    template<typename T>
    SubscriptionHandle subscribe(std::function<void(const T&)> handler) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        std::lock_guard<std::mutex> lock(mutex_);
        auto id = next_id_++;
        auto key = std::type_index(typeid(T));

        handlers_[key].push_back({id, [handler](const Event& e) {
            handler(static_cast<const T&>(e));
        }});

        return SubscriptionHandle([this, key, id]() {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(key);
            if (it != handlers_.end()) {
                auto& vec = it->second;
                vec.erase(std::remove_if(vec.begin(), vec.end(),
                    [id](const HandlerEntry& h) { return h.id == id; }), vec.end());
            }
        });
    }

    template<typename T>
    void publish(const T& event) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        std::vector<HandlerEntry> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(T)));
            if (it != handlers_.end()) {
                snapshot = it->second;
            }
        }

        for (auto& entry : snapshot) {
            try {
                entry.fn(event);
            } catch (const std::exception& e) {
                DLOG_ERROR("eventbus", "Handler %llu threw: %s",
                           (unsigned long long)entry.id, e.what());
            }
        }
    }

    template<typename T>
    size_t subscriberCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(T)));
        return it == handlers_.end() ? 0 : it->second.size();
    }

private:
    struct HandlerEntry {
        HandlerId id;
        std::function<void(const Event&)> fn;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, std::vector<HandlerEntry>> handlers_;
    HandlerId next_id_ = 1;
};

// Process-wide bus used by the console front end
inline EventBus& bus() {
    static EventBus instance;
    return instance;
}

} // namespace droid
