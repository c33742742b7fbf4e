#pragma once

#include "device_registry.hpp"
#include "external_tools.hpp"
#include "result.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace droid {

/**
 * Sequences "bridge connect -> mirror launch" for the selected device and
 * owns the lifecycle of the resulting session.
 *
 *   Idle -> Connecting -> Active -> Ended(Stopped | MirrorExited | Superseded)
 *                      -> Failed(bridge-connect | mirror-launch)
 *                      -> Ended(Cancelled)
 *
 * Exactly one session is current; starting a new one supersedes it. Starts
 * are serialized. stopSession() does not wait for an in-flight start: it
 * marks a Connecting session cancelled and the start discards whatever it
 * launched afterwards.
 */
class SessionOrchestrator {
public:
    enum class State { Idle, Connecting, Active, Ended, Failed };
    enum class Outcome { None, Stopped, MirrorExited, Superseded, Cancelled };
    enum class FailedStep { None, BridgeConnect, MirrorLaunch };

    struct SessionInfo {
        uint64_t id = 0;                 // 0 until the first start
        std::string device_address;      // copy for display
        State state = State::Idle;
        Outcome outcome = Outcome::None;
        FailedStep failed_step = FailedStep::None;
        std::string failure_reason;
        bool screen_on = true;           // assumed, never queried
        int mirror_pid = -1;
    };

    struct ScreenState {
        uint64_t session_id = 0;
        bool screen_on = true;
    };

    using StateCallback = std::function<void(const SessionInfo& session)>;

    SessionOrchestrator(DeviceRegistry& registry, BridgeConnector& bridge,
                        MirrorLauncher& launcher, uint16_t port = 5555);
    ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    // NoSelection (state unchanged), BridgeConnect, MirrorLaunch, or
    // Cancelled when stopSession() raced the start
    Result<SessionInfo> startSession();

    // Active -> Ended(Stopped), Connecting -> Ended(Cancelled);
    // SessionNotActive otherwise
    Result<SessionInfo> stopSession();

    // Observe mirror termination; true if the session just ended
    bool pollMirror();

    SessionInfo session();

    // Used by the screen toggle controller
    Result<ScreenState> activeScreenState();
    VoidResult commitScreenState(uint64_t session_id, bool screen_on);

    void setPort(uint16_t port);
    uint16_t port() const;

    void setStateCallback(StateCallback cb);

private:
    // Requires state_mutex_. Active with an exited mirror -> Ended(MirrorExited)
    bool observeMirrorLocked();
    // Requires state_mutex_. Orders a snapshot for notify()
    uint64_t stampLocked() { return ++notify_seq_; }
    // Delivers snapshots in stamp order; one older than the last delivered
    // is dropped so observers always end on the current state
    void notify(const SessionInfo& snapshot, uint64_t seq);

    DeviceRegistry& registry_;
    BridgeConnector& bridge_;
    MirrorLauncher& launcher_;

    std::mutex op_mutex_;                   // serializes startSession()
    mutable std::mutex state_mutex_;        // session_, mirror_, port_, cb
    SessionInfo session_;
    std::unique_ptr<MirrorProcess> mirror_;
    uint64_t next_id_ = 0;
    uint16_t port_;
    StateCallback state_cb_;
    uint64_t notify_seq_ = 0;

    // Held while the callback runs; re-entrant so a callback may stop the session
    std::recursive_mutex notify_mutex_;
    uint64_t delivered_seq_ = 0;
};

const char* sessionStateStr(SessionOrchestrator::State s);
const char* sessionOutcomeStr(SessionOrchestrator::Outcome o);
// "bridge-connect" / "mirror-launch"
const char* failedStepStr(SessionOrchestrator::FailedStep s);

} // namespace droid
