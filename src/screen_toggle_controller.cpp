#include "screen_toggle_controller.hpp"
#include "droid_log.hpp"

namespace droid {

ScreenToggleController::ScreenToggleController(SessionOrchestrator& sessions,
                                               ScreenToggleSender& sender)
    : sessions_(sessions), sender_(sender) {}

Result<SessionOrchestrator::ScreenState> ScreenToggleController::toggle() {
    std::lock_guard<std::mutex> lock(toggle_mutex_);

    auto current = sessions_.activeScreenState();
    if (current.is_err()) {
        DLOG_WARN("screen", "Toggle rejected: %s", current.error().message.c_str());
        return current.error();
    }
    const auto state = current.value();
    const bool turn_on = !state.screen_on;

    ToolOutcome sent = sender_.send(turn_on);
    if (!sent.ok()) {
        DLOG_ERROR("screen", "Toggle to %s failed: %s", turn_on ? "on" : "off", sent.reason.c_str());
        return Err(ErrorCode::ToggleCommand,
                   std::string("could not turn screen ") + (turn_on ? "on" : "off") + ": " + sent.reason);
    }

    auto committed = sessions_.commitScreenState(state.session_id, turn_on);
    if (committed.is_err()) {
        // Session ended while the keystroke was in flight
        DLOG_WARN("screen", "%s", committed.error().message.c_str());
        return committed.error();
    }

    DLOG_INFO("screen", "Screen turned %s", turn_on ? "ON" : "OFF");
    return SessionOrchestrator::ScreenState{state.session_id, turn_on};
}

} // namespace droid
