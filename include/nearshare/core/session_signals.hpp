#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <functional>
#include <optional>
#include <thread>

namespace nearshare::session {
class TransferCoordinator;
}

namespace nearshare::core {

enum class SessionCommand {
    PAUSE,
    RESUME,
    CANCEL
};

// SIGINT and SIGTERM cancel. SIGTSTP (Ctrl+Z) toggles pause, SIGUSR1 pauses
// and SIGUSR2 resumes.
std::optional<SessionCommand> command_for_signal(int signal_number, bool paused);

void apply_command(session::TransferCoordinator& coordinator, SessionCommand command);

// Turns process signals into session commands while a CLI command runs.
// The previous dispositions come back when this object is destroyed.
class SessionSignals {
public:
    using PausedQuery = std::function<bool()>;
    using Handler = std::function<void(SessionCommand)>;

    SessionSignals(PausedQuery is_paused, Handler handler);
    explicit SessionSignals(session::TransferCoordinator& coordinator);
    ~SessionSignals();

    SessionSignals(const SessionSignals&) = delete;
    SessionSignals& operator=(const SessionSignals&) = delete;

private:
    void wait_next();

    PausedQuery is_paused_;
    Handler handler_;
    boost::asio::io_context io_context_;
    boost::asio::signal_set signals_;
    std::thread thread_;
};

} // namespace nearshare::core
