#pragma once

#include "common/errors.h"

/**
 * INIT -> SIGNALING -> CONNECTING -> CHANNEL_OPEN -> TRANSFERRING ->
 * VERIFYING -> DONE, with FAILED reachable from every non-terminal state.
 */
enum class SessionState {
    init,
    signaling,
    connecting,
    channel_open,
    transferring,
    verifying,
    done,
    failed,
};

const char* to_string(SessionState state);

/**
 * Enforces the session lifecycle: forward one step at a time, or fail.
 */
class SessionStateMachine {
public:
    [[nodiscard]] SessionState state() const { return state_; }

    /// Last state before FAILED (or the current state when not failed).
    [[nodiscard]] SessionState last_active() const { return last_active_; }

    [[nodiscard]] TransferError cause() const { return cause_; }

    [[nodiscard]] bool terminal() const {
        return state_ == SessionState::done || state_ == SessionState::failed;
    }

    /// Move to the immediate successor. Throws std::logic_error otherwise.
    void advance(SessionState next);

    /// Enter FAILED with `cause`. Returns false if already terminal.
    bool fail(TransferError cause);

private:
    SessionState state_ = SessionState::init;
    SessionState last_active_ = SessionState::init;
    TransferError cause_ = TransferError::none;
};
