/**
 * Session lifecycle names and transition rules.
 */

#include "session/session_state.h"

#include <stdexcept>
#include <string>

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::init:         return "INIT";
        case SessionState::signaling:    return "SIGNALING";
        case SessionState::connecting:   return "CONNECTING";
        case SessionState::channel_open: return "CHANNEL_OPEN";
        case SessionState::transferring: return "TRANSFERRING";
        case SessionState::verifying:    return "VERIFYING";
        case SessionState::done:         return "DONE";
        case SessionState::failed:       return "FAILED";
    }
    return "UNKNOWN";
}

void SessionStateMachine::advance(SessionState next) {
    if (terminal() || next == SessionState::failed ||
        static_cast<int>(next) != static_cast<int>(state_) + 1) {
        throw std::logic_error(std::string("illegal session transition ") +
                               to_string(state_) + " -> " + to_string(next));
    }
    state_ = next;
    last_active_ = next;
}

bool SessionStateMachine::fail(TransferError cause) {
    if (terminal()) {
        return false;
    }
    state_ = SessionState::failed;
    cause_ = cause;
    return true;
}
