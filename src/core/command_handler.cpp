#include "nearshare/core/command_handler.hpp"
#include "nearshare/core/logger.hpp"
#include "nearshare/core/session_signals.hpp"
#include "nearshare/core/utils.hpp"
#include "nearshare/session/session_state_machine.hpp"
#include "nearshare/session/transfer_coordinator.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>

namespace nearshare::core {

namespace state = transfer::state;
using session::Phase;
using session::TransferCoordinator;
using utils::StringUtils;

namespace {
    constexpr std::chrono::hours NO_DEADLINE{24};

    // Prints every state change for the lifetime of a command.
    class ConsoleReporter {
    public:
        explicit ConsoleReporter(TransferCoordinator& coordinator)
            : coordinator_(coordinator) {
            listener_id_ = coordinator_.add_listener([](const transfer::TransferState& current) {
                auto line = format_state_line(current);
                if (!line.empty()) {
                    std::cout << line << std::endl;
                }
            });
        }

        ~ConsoleReporter() {
            coordinator_.remove_listener(listener_id_);
        }

        ConsoleReporter(const ConsoleReporter&) = delete;
        ConsoleReporter& operator=(const ConsoleReporter&) = delete;

    private:
        TransferCoordinator& coordinator_;
        std::size_t listener_id_;
    };

    bool in_phase(const transfer::TransferState& current, std::initializer_list<Phase> phases) {
        Phase phase = session::phase_of(current);
        return std::find(phases.begin(), phases.end(), phase) != phases.end();
    }

    bool has_peer(const transfer::TransferState& current, const std::string& identity) {
        const auto* found = std::get_if<state::DevicesFound>(&current);
        if (!found) {
            return false;
        }
        return std::any_of(found->peers.begin(), found->peers.end(),
                           [&identity](const auto& peer) { return peer.identity == identity; });
    }

    CommandResult failure_result(const transfer::TransferState& current) {
        if (const auto* failed = std::get_if<state::Failed>(&current)) {
            return CommandResult::error(failed->error.describe());
        }
        if (transfer::holds<state::Cancelled>(current)) {
            return CommandResult::error("Transfer cancelled");
        }
        return CommandResult::error("Unexpected state: " + std::string(transfer::state_name(current)));
    }
}

std::string format_state_line(const transfer::TransferState& current) {
    return std::visit([](const auto& s) -> std::string {
        using T = std::decay_t<decltype(s)>;
        std::ostringstream out;

        if constexpr (std::is_same_v<T, state::Idle>) {
            return "";
        } else if constexpr (std::is_same_v<T, state::Discovering>) {
            out << "Searching for devices...";
        } else if constexpr (std::is_same_v<T, state::DevicesFound>) {
            out << "Found " << s.peers.size() << " device(s):";
            for (const auto& peer : s.peers) {
                out << "\n  " << peer.display_name << "  [" << peer.identity << "]  "
                    << transport::to_string(peer.medium);
            }
        } else if constexpr (std::is_same_v<T, state::Connecting>) {
            out << "Connecting to " << s.peer.display_name << "...";
        } else if constexpr (std::is_same_v<T, state::Connected>) {
            out << "Connected to " << s.peer.display_name;
        } else if constexpr (std::is_same_v<T, state::Transferring>) {
            out << s.current_file_name << ": " << s.progress_percent << "% ("
                << StringUtils::format_bytes(static_cast<std::uint64_t>(s.bytes_done)) << " / "
                << StringUtils::format_bytes(static_cast<std::uint64_t>(s.bytes_total)) << ") "
                << StringUtils::format_speed(s.bytes_per_second);
            if (s.eta_millis > 0) {
                out << ", " << StringUtils::format_duration(std::chrono::milliseconds(s.eta_millis)) << " left";
            }
        } else if constexpr (std::is_same_v<T, state::Completed>) {
            out << "Transferred " << s.file_count << " file(s), "
                << StringUtils::format_bytes(static_cast<std::uint64_t>(s.bytes_total)) << " in "
                << StringUtils::format_duration(std::chrono::milliseconds(s.duration_millis));
        } else if constexpr (std::is_same_v<T, state::Failed>) {
            out << "Failed: " << s.error.describe();
            if (s.can_retry) {
                out << " (retry possible)";
            }
        } else if constexpr (std::is_same_v<T, state::Cancelled>) {
            out << "Cancelled";
        } else if constexpr (std::is_same_v<T, state::Paused>) {
            out << "Paused at " << s.progress_percent << "%";
        }
        return out.str();
    }, current);
}

// DiscoverCommandHandler Implementation
DiscoverCommandHandler::DiscoverCommandHandler(CommandContext context)
    : context_(std::move(context)) {
}

CommandResult DiscoverCommandHandler::execute(const std::vector<std::string>& /*args*/) {
    if (!context_.coordinator) {
        return CommandResult::error("Coordinator is not available");
    }
    auto& coordinator = *context_.coordinator;

    LOG_INFO("Discovering devices for {}s over {}", context_.discovery_timeout.count(),
             transport::to_string(context_.selection));

    ConsoleReporter reporter(coordinator);
    coordinator.start_discovery(context_.selection);

    // Discovery over some media never ends on its own; run it for the timeout.
    coordinator.wait_until([](const auto& s) { return in_phase(s, {Phase::FAILED}); },
                           context_.discovery_timeout);
    coordinator.stop_discovery();
    coordinator.wait_until([](const auto& s) {
        return !in_phase(s, {Phase::DISCOVERING});
    }, std::chrono::seconds(2));

    auto current = coordinator.state();
    if (transfer::holds<state::Failed>(current)) {
        return failure_result(current);
    }

    auto peers = coordinator.discovered_peers();
    std::cout << peers.size() << " device(s) found\n";
    coordinator.disconnect();
    return CommandResult::ok();
}

// SendCommandHandler Implementation
SendCommandHandler::SendCommandHandler(CommandContext context)
    : context_(std::move(context)) {
}

CommandResult SendCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }
    if (!context_.coordinator) {
        return CommandResult::error("Coordinator is not available");
    }
    auto& coordinator = *context_.coordinator;

    std::string identity = args[1];
    std::vector<storage::ResourceHandle> handles;
    for (std::size_t i = 2; i < args.size(); ++i) {
        handles.push_back(utils::FileUtils::expand_home(args[i]).string());
    }

    LOG_INFO("Sending {} file(s) to {}", handles.size(), identity);
    ConsoleReporter reporter(coordinator);
    SessionSignals signals(coordinator);

    coordinator.start_discovery(context_.selection);
    bool found = coordinator.wait_until([&identity](const auto& s) {
        return in_phase(s, {Phase::FAILED, Phase::CANCELLED}) || has_peer(s, identity);
    }, context_.discovery_timeout);

    auto current = coordinator.state();
    if (in_phase(current, {Phase::FAILED, Phase::CANCELLED})) {
        return failure_result(current);
    }
    if (!found) {
        coordinator.disconnect();
        return CommandResult::error("Device not found: " + identity);
    }

    coordinator.select_peer(identity);
    coordinator.wait_until([](const auto& s) {
        return in_phase(s, {Phase::CONNECTED, Phase::FAILED, Phase::CANCELLED});
    }, NO_DEADLINE);

    current = coordinator.state();
    if (!transfer::holds<state::Connected>(current)) {
        return failure_result(current);
    }

    std::cout << "Ctrl+Z pauses or resumes, Ctrl+C cancels\n";
    coordinator.send(handles);
    coordinator.wait_until([](const auto& s) {
        return in_phase(s, {Phase::COMPLETED, Phase::FAILED, Phase::CANCELLED});
    }, NO_DEADLINE);

    current = coordinator.state();
    if (const auto* completed = std::get_if<state::Completed>(&current)) {
        return CommandResult::ok("Sent " + std::to_string(completed->file_count) + " file(s)");
    }
    return failure_result(current);
}

// ReceiveCommandHandler Implementation
ReceiveCommandHandler::ReceiveCommandHandler(CommandContext context)
    : context_(std::move(context)) {
}

CommandResult ReceiveCommandHandler::execute(const std::vector<std::string>& /*args*/) {
    if (!context_.coordinator) {
        return CommandResult::error("Coordinator is not available");
    }
    auto& coordinator = *context_.coordinator;

    std::cout << "Waiting for an incoming transfer... (Ctrl+Z pauses or resumes, Ctrl+C cancels)\n";
    ConsoleReporter reporter(coordinator);
    SessionSignals signals(coordinator);

    coordinator.receive(context_.selection);
    coordinator.wait_until([](const auto& s) {
        return in_phase(s, {Phase::COMPLETED, Phase::FAILED, Phase::CANCELLED});
    }, NO_DEADLINE);

    auto current = coordinator.state();
    if (const auto* completed = std::get_if<state::Completed>(&current)) {
        return CommandResult::ok("Received " + std::to_string(completed->file_count) + " file(s)");
    }
    return failure_result(current);
}

} // namespace nearshare::core
