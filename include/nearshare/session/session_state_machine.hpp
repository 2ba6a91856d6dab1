#pragma once

#include "nearshare/transfer/transfer_state.hpp"
#include <variant>

namespace nearshare::session {

// Mirrors the alternative order of transfer::TransferState.
enum class Phase {
    IDLE,
    DISCOVERING,
    DEVICES_FOUND,
    CONNECTING,
    CONNECTED,
    TRANSFERRING,
    COMPLETED,
    FAILED,
    CANCELLED,
    PAUSED
};

static_assert(std::variant_size_v<transfer::TransferState> == 10,
              "Phase must list every TransferState alternative");

Phase phase_of(const transfer::TransferState& state);
bool is_terminal(Phase phase);

class SessionStateMachine {
public:
    SessionStateMachine() = default;

    const transfer::TransferState& current() const { return current_; }
    Phase phase() const { return phase_of(current_); }

    // has_transport: the session still holds a transport to reconnect with.
    bool can_transition(Phase to, bool has_transport) const;

    // Returns false and leaves the state unchanged when the transition is not allowed.
    bool transition(transfer::TransferState next, bool has_transport);

    static bool is_allowed(Phase from, Phase to, bool has_transport);

private:
    transfer::TransferState current_ = transfer::state::Idle{};
};

} // namespace nearshare::session
