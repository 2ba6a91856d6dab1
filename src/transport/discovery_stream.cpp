#include "nearshare/transport/discovery_stream.hpp"
#include "nearshare/core/logger.hpp"

namespace nearshare::transport {

std::shared_ptr<DiscoveryStream> DiscoveryStream::create() {
    return std::shared_ptr<DiscoveryStream>(new DiscoveryStream());
}

DiscoveryStream::~DiscoveryStream() {
    release();
}

void DiscoveryStream::push(Event event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_ || cancelled_) {
            return;
        }
        pending_.push_back(std::move(event));
    }
    cv_.notify_all();
}

void DiscoveryStream::finish() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
    }
    cv_.notify_all();
}

void DiscoveryStream::on_release(ReleaseHook hook) {
    bool run_now = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (released_) {
            run_now = true;
        } else {
            release_hook_ = std::move(hook);
        }
    }
    if (run_now && hook) {
        hook();
    }
}

std::optional<DiscoveryStream::Event> DiscoveryStream::next() {
    bool timed_out = false;
    return next_for(std::chrono::milliseconds::zero(), timed_out);
}

std::optional<DiscoveryStream::Event> DiscoveryStream::next_for(std::chrono::milliseconds timeout,
                                                                bool& timed_out) {
    timed_out = false;
    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [this] { return cancelled_ || finished_ || !pending_.empty(); };

    if (timeout > std::chrono::milliseconds::zero()) {
        if (!cv_.wait_for(lock, timeout, ready)) {
            timed_out = true;
            return std::nullopt;
        }
    } else {
        cv_.wait(lock, ready);
    }

    if (cancelled_) {
        return std::nullopt;
    }

    if (!pending_.empty()) {
        auto event = std::move(pending_.front());
        pending_.pop_front();
        return event;
    }

    lock.unlock();
    release();
    return std::nullopt;
}

void DiscoveryStream::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        pending_.clear();
    }
    cv_.notify_all();
    release();
}

bool DiscoveryStream::is_finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_ || cancelled_;
}

bool DiscoveryStream::is_released() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return released_;
}

void DiscoveryStream::release() {
    ReleaseHook hook;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (released_) {
            return;
        }
        released_ = true;
        hook = std::move(release_hook_);
        release_hook_ = nullptr;
    }
    if (hook) {
        LOG_DEBUG("Releasing discovery listeners");
        hook();
    }
}

} // namespace nearshare::transport
