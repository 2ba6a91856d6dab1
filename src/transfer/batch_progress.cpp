#include "nearshare/transfer/batch_progress.hpp"
#include <algorithm>

namespace nearshare::transfer {

BatchProgress::BatchProgress(std::int64_t bytes_total, ClockSource clock)
    : bytes_total_(bytes_total)
    , clock_(std::move(clock))
    , completed_bytes_(0)
    , current_file_bytes_(0)
    , files_completed_(0) {
    start_time_ = now();
}

void BatchProgress::begin_file(const std::string& file_name) {
    current_file_ = file_name;
    current_file_bytes_ = 0;
}

state::Transferring BatchProgress::on_file_progress(const ProgressUpdate& update) {
    if (update.file_name != current_file_) {
        begin_file(update.file_name);
    }
    current_file_bytes_ = std::max(current_file_bytes_, update.bytes_done);
    return snapshot();
}

void BatchProgress::end_file(std::int64_t file_size) {
    completed_bytes_ += std::max(current_file_bytes_, file_size);
    current_file_bytes_ = 0;
    ++files_completed_;
}

state::Transferring BatchProgress::snapshot() const {
    state::Transferring progress;
    progress.current_file_name = current_file_;
    progress.bytes_done = bytes_done();
    progress.bytes_total = bytes_total_;
    progress.progress_percent = compute_percent(progress.bytes_done, bytes_total_);
    progress.bytes_per_second = compute_speed(progress.bytes_done, elapsed_ms());
    progress.eta_millis = compute_eta_ms(progress.bytes_done, bytes_total_, progress.bytes_per_second);
    return progress;
}

std::int64_t BatchProgress::elapsed_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now() - start_time_).count();
}

std::int64_t BatchProgress::compute_eta_ms(std::int64_t bytes_done, std::int64_t bytes_total,
                                           std::uint64_t bytes_per_second) {
    if (bytes_per_second == 0 || bytes_done >= bytes_total) {
        return 0;
    }
    auto remaining = static_cast<std::uint64_t>(bytes_total - bytes_done);
    return static_cast<std::int64_t>(remaining * 1000 / bytes_per_second);
}

} // namespace nearshare::transfer
