#include "nearshare/session/session_state_machine.hpp"

namespace nearshare::session {

Phase phase_of(const transfer::TransferState& state) {
    return static_cast<Phase>(state.index());
}

bool is_terminal(Phase phase) {
    return phase == Phase::COMPLETED || phase == Phase::FAILED || phase == Phase::CANCELLED;
}

bool SessionStateMachine::can_transition(Phase to, bool has_transport) const {
    return is_allowed(phase(), to, has_transport);
}

bool SessionStateMachine::transition(transfer::TransferState next, bool has_transport) {
    if (!can_transition(phase_of(next), has_transport)) {
        return false;
    }
    current_ = std::move(next);
    return true;
}

bool SessionStateMachine::is_allowed(Phase from, Phase to, bool has_transport) {
    // Cancel is reachable from everywhere.
    if (to == Phase::CANCELLED) {
        return true;
    }

    switch (from) {
        case Phase::IDLE:
            return to == Phase::DISCOVERING || to == Phase::CONNECTING ||
                   to == Phase::CONNECTED || to == Phase::FAILED;

        case Phase::DISCOVERING:
            return to == Phase::DISCOVERING || to == Phase::DEVICES_FOUND ||
                   to == Phase::FAILED || to == Phase::IDLE;

        case Phase::DEVICES_FOUND:
            return to == Phase::DEVICES_FOUND || to == Phase::CONNECTING ||
                   to == Phase::DISCOVERING || to == Phase::FAILED || to == Phase::IDLE;

        case Phase::CONNECTING:
            return to == Phase::CONNECTED || to == Phase::FAILED;

        case Phase::CONNECTED:
            return to == Phase::TRANSFERRING || to == Phase::FAILED || to == Phase::IDLE;

        case Phase::TRANSFERRING:
            return to == Phase::TRANSFERRING || to == Phase::PAUSED ||
                   to == Phase::COMPLETED || to == Phase::FAILED;

        case Phase::PAUSED:
            return to == Phase::TRANSFERRING || to == Phase::FAILED;

        case Phase::COMPLETED:
        case Phase::CANCELLED:
            return to == Phase::DISCOVERING || to == Phase::IDLE;

        case Phase::FAILED:
            return to == Phase::DISCOVERING || to == Phase::FAILED || to == Phase::IDLE ||
                   (to == Phase::CONNECTING && has_transport);
    }
    return false;
}

} // namespace nearshare::session
