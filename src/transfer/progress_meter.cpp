#include "nearshare/transfer/progress_meter.hpp"
#include <algorithm>

namespace nearshare::transfer {

int compute_percent(std::int64_t bytes_done, std::int64_t total) {
    if (total <= 0) {
        return 100;
    }
    auto clamped = std::clamp<std::int64_t>(bytes_done, 0, total);
    return static_cast<int>(clamped * 100 / total);
}

std::uint64_t compute_speed(std::int64_t bytes_done, std::int64_t elapsed_ms) {
    if (elapsed_ms <= 0 || bytes_done <= 0) {
        return 0;
    }
    return static_cast<std::uint64_t>(bytes_done) * 1000 / static_cast<std::uint64_t>(elapsed_ms);
}

ProgressMeter::ProgressMeter(std::string file_name, std::int64_t file_size,
                             std::chrono::milliseconds interval, ProgressCallback callback,
                             ClockSource clock)
    : file_name_(std::move(file_name))
    , file_size_(file_size)
    , interval_(interval)
    , callback_(std::move(callback))
    , clock_(std::move(clock))
    , bytes_done_(0)
    , emitted_bytes_(0)
    , emitted_(0)
    , finished_(false) {
    start_time_ = now();
    last_emit_ = start_time_;
}

void ProgressMeter::update(std::int64_t bytes_done) {
    if (finished_) {
        return;
    }
    bytes_done_ = std::max(bytes_done_, bytes_done);

    auto current = now();
    if (current - last_emit_ >= interval_) {
        emit(compute_percent(bytes_done_, file_size_), current);
    }
}

void ProgressMeter::finish() {
    if (finished_) {
        return;
    }
    bytes_done_ = std::max(bytes_done_, file_size_);
    emit(100, now());
    finished_ = true;
}

void ProgressMeter::flush() {
    if (finished_ || bytes_done_ == emitted_bytes_) {
        return;
    }
    emit(compute_percent(bytes_done_, file_size_), now());
}

void ProgressMeter::emit(int percent, Clock::time_point current) {
    last_emit_ = current;
    emitted_bytes_ = bytes_done_;
    ++emitted_;
    if (!callback_) {
        return;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(current - start_time_).count();

    ProgressUpdate update;
    update.file_name = file_name_;
    update.file_size = file_size_;
    update.percent = percent;
    update.bytes_done = bytes_done_;
    update.bytes_per_second = compute_speed(bytes_done_, elapsed);
    callback_(update);
}

} // namespace nearshare::transfer
