#pragma once

#include "external_tools.hpp"
#include "result.hpp"
#include "session_orchestrator.hpp"

#include <mutex>

namespace droid {

// =============================================================================
// ScreenToggleController
// =============================================================================
// Flips the remote display of the active session. The on/off state is
// assumed (starts "on" per session) and only changes after the keystroke
// was delivered; nothing reads the real display state back.
class ScreenToggleController {
public:
    ScreenToggleController(SessionOrchestrator& sessions, ScreenToggleSender& sender);

    // New assumed state of the session it was committed to. SessionNotActive
    // outside an Active session, ToggleCommand when the keystroke could not
    // be delivered.
    Result<SessionOrchestrator::ScreenState> toggle();

private:
    SessionOrchestrator& sessions_;
    ScreenToggleSender& sender_;
    std::mutex toggle_mutex_;
};

} // namespace droid
