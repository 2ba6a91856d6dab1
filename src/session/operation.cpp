#include "nearshare/session/operation.hpp"
#include "nearshare/core/logger.hpp"

namespace nearshare::session {

Operation::Operation(std::string name, std::uint64_t generation)
    : name_(std::move(name))
    , generation_(generation)
    , cancelled_(false)
    , finished_(false) {
}

Operation::~Operation() {
    cancel();
    join();
}

void Operation::set_interrupt(Interrupt interrupt) {
    std::lock_guard<std::mutex> lock(interrupt_mutex_);
    interrupt_ = std::move(interrupt);
}

void Operation::start(Body body) {
    worker_ = std::thread([this, body = std::move(body)]() {
        LOG_DEBUG("Operation '{}' #{} started", name_, generation_);
        try {
            body(*this);
        } catch (const std::exception& e) {
            LOG_ERROR("Operation '{}' #{} terminated: {}", name_, generation_, e.what());
        }
        finished_ = true;
        LOG_DEBUG("Operation '{}' #{} finished", name_, generation_);
    });
}

void Operation::cancel() {
    if (cancelled_.exchange(true)) {
        return;
    }
    control_.cancel();

    Interrupt interrupt;
    {
        std::lock_guard<std::mutex> lock(interrupt_mutex_);
        interrupt = interrupt_;
    }
    if (interrupt && !finished_) {
        LOG_DEBUG("Interrupting operation '{}' #{}", name_, generation_);
        interrupt();
    }
}

void Operation::join() {
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

} // namespace nearshare::session
