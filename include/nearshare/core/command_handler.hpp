#pragma once

#include "nearshare/transfer/transfer_state.hpp"
#include "nearshare/transport/transport_kind.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace nearshare::session {
class TransferCoordinator;
}

namespace nearshare::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;

    static CommandResult ok(const std::string& msg = "") {
        return {true, msg, 0};
    }

    static CommandResult error(const std::string& msg, int code = 1) {
        return {false, msg, code};
    }
};

struct CommandContext {
    std::shared_ptr<session::TransferCoordinator> coordinator;
    transport::TransportSelection selection = transport::TransportSelection::AUTO;
    std::chrono::seconds discovery_timeout{10};
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    // args[0] is the command name.
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

class DiscoverCommandHandler : public CommandHandler {
public:
    explicit DiscoverCommandHandler(CommandContext context);

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List nearby devices"; }
    std::string get_usage() const override { return "nearshare discover [--timeout <seconds>]"; }

private:
    CommandContext context_;
};

class SendCommandHandler : public CommandHandler {
public:
    explicit SendCommandHandler(CommandContext context);

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Send files to a nearby device"; }
    std::string get_usage() const override { return "nearshare send <device-id> <file> [file...]"; }

private:
    CommandContext context_;
};

class ReceiveCommandHandler : public CommandHandler {
public:
    explicit ReceiveCommandHandler(CommandContext context);

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Wait for a device to send files"; }
    std::string get_usage() const override { return "nearshare receive"; }

private:
    CommandContext context_;
};

// One console line per state; empty for states that print nothing.
std::string format_state_line(const transfer::TransferState& state);

} // namespace nearshare::core
