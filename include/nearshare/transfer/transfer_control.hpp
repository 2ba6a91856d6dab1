#pragma once

#include <condition_variable>
#include <mutex>

namespace nearshare::transfer {

// Pause/cancel signals polled by the send/receive loops between chunks.
class TransferControl {
public:
    void pause();
    void resume();
    void cancel();
    void reset();

    bool is_paused() const;
    bool is_cancelled() const;

    // Blocks while paused. Returns false once cancelled.
    bool wait_while_paused();

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool paused_ = false;
    bool cancelled_ = false;
};

} // namespace nearshare::transfer
