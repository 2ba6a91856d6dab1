#pragma once

#include "nearshare/transfer/progress_meter.hpp"
#include "nearshare/transfer/transfer_state.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <cstdint>

namespace nearshare::transfer {

// Cumulative statistics across a sequential batch of files.
class BatchProgress {
public:
    using Clock = std::chrono::steady_clock;
    using ClockSource = std::function<Clock::time_point()>;

    explicit BatchProgress(std::int64_t bytes_total, ClockSource clock = nullptr);

    void begin_file(const std::string& file_name);

    // update.bytes_done is the per-file count reported by the protocol.
    state::Transferring on_file_progress(const ProgressUpdate& update);
    void end_file(std::int64_t file_size);

    state::Transferring snapshot() const;

    std::int64_t bytes_done() const { return completed_bytes_ + current_file_bytes_; }
    std::int64_t bytes_total() const { return bytes_total_; }
    std::size_t files_completed() const { return files_completed_; }
    std::int64_t elapsed_ms() const;

    static std::int64_t compute_eta_ms(std::int64_t bytes_done, std::int64_t bytes_total,
                                       std::uint64_t bytes_per_second);

private:
    Clock::time_point now() const { return clock_ ? clock_() : Clock::now(); }

    std::int64_t bytes_total_;
    ClockSource clock_;
    Clock::time_point start_time_;

    std::string current_file_;
    std::int64_t completed_bytes_;
    std::int64_t current_file_bytes_;
    std::size_t files_completed_;
};

} // namespace nearshare::transfer
