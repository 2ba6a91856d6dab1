#include "nearshare/core/session_signals.hpp"
#include "nearshare/core/logger.hpp"
#include "nearshare/session/session_state_machine.hpp"
#include "nearshare/session/transfer_coordinator.hpp"
#include <csignal>

namespace nearshare::core {

std::optional<SessionCommand> command_for_signal(int signal_number, bool paused) {
    switch (signal_number) {
        case SIGINT:
        case SIGTERM:
            return SessionCommand::CANCEL;
        case SIGTSTP:
            return paused ? SessionCommand::RESUME : SessionCommand::PAUSE;
        case SIGUSR1:
            return SessionCommand::PAUSE;
        case SIGUSR2:
            return SessionCommand::RESUME;
        default:
            return std::nullopt;
    }
}

void apply_command(session::TransferCoordinator& coordinator, SessionCommand command) {
    switch (command) {
        case SessionCommand::PAUSE:
            coordinator.pause();
            break;
        case SessionCommand::RESUME:
            coordinator.resume();
            break;
        case SessionCommand::CANCEL:
            coordinator.cancel();
            break;
    }
}

SessionSignals::SessionSignals(PausedQuery is_paused, Handler handler)
    : is_paused_(std::move(is_paused))
    , handler_(std::move(handler))
    , signals_(io_context_) {
    boost::system::error_code ec;
    for (int signal_number : {SIGINT, SIGTERM, SIGTSTP, SIGUSR1, SIGUSR2}) {
        signals_.add(signal_number, ec);
        if (ec) {
            LOG_WARN("Cannot watch signal {}: {}", signal_number, ec.message());
            ec.clear();
        }
    }
    wait_next();
    thread_ = std::thread([this]() { io_context_.run(); });
}

SessionSignals::SessionSignals(session::TransferCoordinator& coordinator)
    : SessionSignals(
          [&coordinator]() { return session::phase_of(coordinator.state()) == session::Phase::PAUSED; },
          [&coordinator](SessionCommand command) { apply_command(coordinator, command); }) {
}

SessionSignals::~SessionSignals() {
    boost::system::error_code ec;
    signals_.cancel(ec);
    io_context_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void SessionSignals::wait_next() {
    signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        bool paused = is_paused_ && is_paused_();
        if (auto command = command_for_signal(signal_number, paused)) {
            LOG_INFO("Signal {} received", signal_number);
            handler_(*command);
        }
        wait_next();
    });
}

} // namespace nearshare::core
