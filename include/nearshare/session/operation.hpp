#pragma once

#include "nearshare/transfer/transfer_control.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace nearshare::session {

// One cancellable unit of session work on its own worker thread.
// cancel() raises the control's cancel flag and runs the interrupt that
// unblocks whatever the body is waiting on.
class Operation {
public:
    using Body = std::function<void(Operation&)>;
    using Interrupt = std::function<void()>;

    Operation(std::string name, std::uint64_t generation);
    ~Operation();

    Operation(const Operation&) = delete;
    Operation& operator=(const Operation&) = delete;

    void set_interrupt(Interrupt interrupt);
    void start(Body body);

    void cancel();
    void join();

    bool is_cancelled() const { return cancelled_; }
    bool is_finished() const { return finished_; }

    transfer::TransferControl& control() { return control_; }
    const std::string& name() const { return name_; }
    std::uint64_t generation() const { return generation_; }

private:
    std::string name_;
    std::uint64_t generation_;
    transfer::TransferControl control_;

    std::mutex interrupt_mutex_;
    Interrupt interrupt_;

    std::thread worker_;
    std::atomic<bool> cancelled_;
    std::atomic<bool> finished_;
};

} // namespace nearshare::session
