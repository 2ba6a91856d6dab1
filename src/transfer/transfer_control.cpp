#include "nearshare/transfer/transfer_control.hpp"

namespace nearshare::transfer {

void TransferControl::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cancelled_) {
        paused_ = true;
    }
}

void TransferControl::resume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_ = false;
    }
    cv_.notify_all();
}

void TransferControl::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        paused_ = false;
    }
    cv_.notify_all();
}

void TransferControl::reset() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = false;
        paused_ = false;
    }
    cv_.notify_all();
}

bool TransferControl::is_paused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

bool TransferControl::is_cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool TransferControl::wait_while_paused() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !paused_ || cancelled_; });
    return !cancelled_;
}

} // namespace nearshare::transfer
