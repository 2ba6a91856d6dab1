#pragma once

#include "nearshare/core/result.hpp"
#include "nearshare/transport/peer.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace nearshare::transport {

// Push-driven sequence of discovery events. The medium's listeners push into
// it through a weak reference; the consumer blocks in next(). The release
// hook (unregister listeners, halt the scan) runs exactly once: on cancel(),
// when the consumer observes the end, or on destruction.
class DiscoveryStream {
public:
    using Event = core::Result<Peer>;
    using ReleaseHook = std::function<void()>;

    static std::shared_ptr<DiscoveryStream> create();

    ~DiscoveryStream();

    DiscoveryStream(const DiscoveryStream&) = delete;
    DiscoveryStream& operator=(const DiscoveryStream&) = delete;

    // Producer side
    void push(Event event);
    void finish();
    void on_release(ReleaseHook hook);

    // Consumer side. std::nullopt once finished and drained, or cancelled.
    std::optional<Event> next();
    std::optional<Event> next_for(std::chrono::milliseconds timeout, bool& timed_out);
    void cancel();

    bool is_finished() const;
    bool is_released() const;

private:
    DiscoveryStream() = default;

    void release();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> pending_;
    ReleaseHook release_hook_;
    bool finished_ = false;
    bool cancelled_ = false;
    bool released_ = false;
};

} // namespace nearshare::transport
