#include "session_orchestrator.hpp"
#include "droid_log.hpp"

namespace droid {

const char* sessionStateStr(SessionOrchestrator::State s) {
    switch (s) {
        case SessionOrchestrator::State::Idle:       return "idle";
        case SessionOrchestrator::State::Connecting: return "connecting";
        case SessionOrchestrator::State::Active:     return "active";
        case SessionOrchestrator::State::Ended:      return "ended";
        case SessionOrchestrator::State::Failed:     return "failed";
    }
    return "?";
}

const char* sessionOutcomeStr(SessionOrchestrator::Outcome o) {
    switch (o) {
        case SessionOrchestrator::Outcome::None:         return "none";
        case SessionOrchestrator::Outcome::Stopped:      return "stopped";
        case SessionOrchestrator::Outcome::MirrorExited: return "mirror-exited";
        case SessionOrchestrator::Outcome::Superseded:   return "superseded";
        case SessionOrchestrator::Outcome::Cancelled:    return "cancelled";
    }
    return "?";
}

const char* failedStepStr(SessionOrchestrator::FailedStep s) {
    switch (s) {
        case SessionOrchestrator::FailedStep::None:          return "none";
        case SessionOrchestrator::FailedStep::BridgeConnect: return "bridge-connect";
        case SessionOrchestrator::FailedStep::MirrorLaunch:  return "mirror-launch";
    }
    return "?";
}

SessionOrchestrator::SessionOrchestrator(DeviceRegistry& registry, BridgeConnector& bridge,
                                         MirrorLauncher& launcher, uint16_t port)
    : registry_(registry), bridge_(bridge), launcher_(launcher), port_(port) {}

SessionOrchestrator::~SessionOrchestrator() {
    std::unique_ptr<MirrorProcess> mirror;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        mirror = std::move(mirror_);
    }
    if (mirror && !mirror->hasTerminated()) {
        DLOG_INFO("session", "Shutting down mirror (pid %d)", mirror->pid());
        mirror->terminate();
    }
}

bool SessionOrchestrator::observeMirrorLocked() {
    if (session_.state != State::Active || !mirror_) return false;
    if (!mirror_->hasTerminated()) return false;

    DLOG_INFO("session", "Session %llu: mirror process %d exited",
              (unsigned long long)session_.id, mirror_->pid());
    session_.state = State::Ended;
    session_.outcome = Outcome::MirrorExited;
    mirror_.reset();
    return true;
}

void SessionOrchestrator::notify(const SessionInfo& snapshot, uint64_t seq) {
    std::lock_guard<std::recursive_mutex> order(notify_mutex_);
    if (seq <= delivered_seq_) {
        DLOG_DEBUG("session", "Dropping stale %s notice for session %llu",
                   sessionStateStr(snapshot.state), (unsigned long long)snapshot.id);
        return;
    }
    delivered_seq_ = seq;

    StateCallback cb;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        cb = state_cb_;
    }
    if (cb) cb(snapshot);
}

// =============================================================================
// Start
// =============================================================================

Result<SessionOrchestrator::SessionInfo> SessionOrchestrator::startSession() {
    std::lock_guard<std::mutex> op(op_mutex_);

    auto selected = registry_.currentSelection();
    if (!selected) {
        DLOG_WARN("session", "Start rejected: no device selected");
        return Err(ErrorCode::NoSelection, "no device selected");
    }
    const std::string address = selected->address;

    std::unique_ptr<MirrorProcess> superseded_mirror;
    SessionInfo exited;
    SessionInfo superseded;
    SessionInfo connecting;
    uint64_t exited_seq = 0;
    uint64_t superseded_seq = 0;
    uint64_t connecting_seq = 0;
    uint64_t id = 0;
    uint16_t port = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (observeMirrorLocked()) {
            exited = session_;
            exited_seq = stampLocked();
        }
        if (session_.state == State::Active) {
            session_.state = State::Ended;
            session_.outcome = Outcome::Superseded;
            superseded_mirror = std::move(mirror_);
            superseded = session_;
            superseded_seq = stampLocked();
        }
        id = ++next_id_;
        port = port_;
        session_ = SessionInfo{};
        session_.id = id;
        session_.device_address = address;
        session_.state = State::Connecting;
        connecting = session_;
        connecting_seq = stampLocked();
    }

    if (exited_seq != 0) notify(exited, exited_seq);
    if (superseded.id != 0) {
        DLOG_INFO("session", "Session %llu superseded", (unsigned long long)superseded.id);
        notify(superseded, superseded_seq);
    }
    if (superseded_mirror) superseded_mirror->terminate();

    DLOG_INFO("session", "Session %llu: connecting to %s:%u",
              (unsigned long long)id, address.c_str(), port);
    notify(connecting, connecting_seq);

    // --- step 1: bridge ---
    ToolOutcome bridge = bridge_.connect(address, port);
    if (!bridge.ok()) {
        SessionInfo snap;
        uint64_t seq = 0;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (session_.id != id || session_.state != State::Connecting) {
                return Err(ErrorCode::Cancelled, "session start was cancelled");
            }
            session_.state = State::Failed;
            session_.failed_step = FailedStep::BridgeConnect;
            session_.failure_reason = bridge.reason;
            snap = session_;
            seq = stampLocked();
        }
        DLOG_ERROR("session", "Session %llu failed at bridge-connect: %s",
                   (unsigned long long)id, bridge.reason.c_str());
        notify(snap, seq);
        return Err(ErrorCode::BridgeConnect, "adb connect to " + address + " failed: " + bridge.reason);
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (session_.id != id || session_.state != State::Connecting) {
            DLOG_INFO("session", "Session %llu cancelled after bridge connect", (unsigned long long)id);
            return Err(ErrorCode::Cancelled, "session start was cancelled");
        }
    }

    // --- step 2: mirror ---
    auto launched = launcher_.launch(address, port);
    if (launched.is_err()) {
        SessionInfo snap;
        uint64_t seq = 0;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (session_.id != id || session_.state != State::Connecting) {
                return Err(ErrorCode::Cancelled, "session start was cancelled");
            }
            session_.state = State::Failed;
            session_.failed_step = FailedStep::MirrorLaunch;
            session_.failure_reason = launched.error().message;
            snap = session_;
            seq = stampLocked();
        }
        DLOG_ERROR("session", "Session %llu failed at mirror-launch: %s",
                   (unsigned long long)id, launched.error().message.c_str());
        notify(snap, seq);
        return Err(ErrorCode::MirrorLaunch, "mirror launch for " + address + " failed: " +
                                            launched.error().message);
    }

    std::unique_ptr<MirrorProcess> process = std::move(launched).value();
    SessionInfo snap;
    uint64_t seq = 0;
    bool activated = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (session_.id == id && session_.state == State::Connecting) {
            session_.state = State::Active;
            session_.mirror_pid = process ? process->pid() : -1;
            mirror_ = std::move(process);
            snap = session_;
            seq = stampLocked();
            activated = true;
        }
    }
    if (!activated) {
        // Stopped while the mirror was starting
        if (process) {
            DLOG_INFO("session", "Session %llu cancelled during launch, discarding pid %d",
                      (unsigned long long)id, process->pid());
            process->terminate();
        }
        return Err(ErrorCode::Cancelled, "session start was cancelled");
    }

    DLOG_INFO("session", "Session %llu active (mirror pid %d)",
              (unsigned long long)id, snap.mirror_pid);
    notify(snap, seq);
    return snap;
}

// =============================================================================
// Stop / observe
// =============================================================================

Result<SessionOrchestrator::SessionInfo> SessionOrchestrator::stopSession() {
    std::unique_ptr<MirrorProcess> victim;
    SessionInfo snap;
    uint64_t seq = 0;
    bool exited = false;
    bool transitioned = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        exited = observeMirrorLocked();
        if (session_.state == State::Connecting) {
            session_.state = State::Ended;
            session_.outcome = Outcome::Cancelled;
            transitioned = true;
        } else if (session_.state == State::Active) {
            session_.state = State::Ended;
            session_.outcome = Outcome::Stopped;
            victim = std::move(mirror_);
            transitioned = true;
        }
        snap = session_;
        if (exited || transitioned) seq = stampLocked();
    }

    if (exited) notify(snap, seq);
    if (!transitioned) {
        return Err(ErrorCode::SessionNotActive,
                   std::string("no active session (state: ") + sessionStateStr(snap.state) + ")");
    }

    DLOG_INFO("session", "Session %llu %s", (unsigned long long)snap.id,
              sessionOutcomeStr(snap.outcome));
    notify(snap, seq);
    if (victim) victim->terminate();
    return snap;
}

bool SessionOrchestrator::pollMirror() {
    SessionInfo snap;
    uint64_t seq = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!observeMirrorLocked()) return false;
        snap = session_;
        seq = stampLocked();
    }
    notify(snap, seq);
    return true;
}

SessionOrchestrator::SessionInfo SessionOrchestrator::session() {
    SessionInfo snap;
    uint64_t seq = 0;
    bool exited = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        exited = observeMirrorLocked();
        snap = session_;
        if (exited) seq = stampLocked();
    }
    if (exited) notify(snap, seq);
    return snap;
}

// =============================================================================
// Screen state
// =============================================================================

Result<SessionOrchestrator::ScreenState> SessionOrchestrator::activeScreenState() {
    SessionInfo snap;
    uint64_t seq = 0;
    bool exited = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        exited = observeMirrorLocked();
        snap = session_;
        if (exited) seq = stampLocked();
    }
    if (exited) notify(snap, seq);
    if (snap.state != State::Active) {
        return Err(ErrorCode::SessionNotActive,
                   std::string("no active session (state: ") + sessionStateStr(snap.state) + ")");
    }
    return ScreenState{snap.id, snap.screen_on};
}

VoidResult SessionOrchestrator::commitScreenState(uint64_t session_id, bool screen_on) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (session_.id != session_id || session_.state != State::Active) {
        return Err(ErrorCode::SessionNotActive, "session ended during screen toggle");
    }
    session_.screen_on = screen_on;
    return Ok();
}

void SessionOrchestrator::setPort(uint16_t port) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    port_ = port;
}

uint16_t SessionOrchestrator::port() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return port_;
}

void SessionOrchestrator::setStateCallback(StateCallback cb) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_cb_ = std::move(cb);
}

} // namespace droid
