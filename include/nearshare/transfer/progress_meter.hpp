#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <cstdint>

namespace nearshare::transfer {

struct ProgressUpdate {
    std::string file_name;
    std::int64_t file_size = 0;
    int percent = 0;
    std::int64_t bytes_done = 0;
    std::uint64_t bytes_per_second = 0;
};

using ProgressCallback = std::function<void(const ProgressUpdate&)>;

int compute_percent(std::int64_t bytes_done, std::int64_t total);
std::uint64_t compute_speed(std::int64_t bytes_done, std::int64_t elapsed_ms);

// Rate-limits per-file progress: at most one sample per interval, plus a
// final 100% sample from finish() that is never suppressed.
class ProgressMeter {
public:
    using Clock = std::chrono::steady_clock;
    using ClockSource = std::function<Clock::time_point()>;

    ProgressMeter(std::string file_name, std::int64_t file_size,
                  std::chrono::milliseconds interval, ProgressCallback callback,
                  ClockSource clock = nullptr);

    void update(std::int64_t bytes_done);
    void finish();

    // Reports bytes not yet emitted, ignoring the rate limit. Used on abort.
    void flush();

    std::int64_t bytes_done() const { return bytes_done_; }
    std::size_t emitted() const { return emitted_; }

private:
    void emit(int percent, Clock::time_point now);
    Clock::time_point now() const { return clock_ ? clock_() : Clock::now(); }

    std::string file_name_;
    std::int64_t file_size_;
    std::chrono::milliseconds interval_;
    ProgressCallback callback_;
    ClockSource clock_;

    Clock::time_point start_time_;
    Clock::time_point last_emit_;
    std::int64_t bytes_done_;
    std::int64_t emitted_bytes_;
    std::size_t emitted_;
    bool finished_;
};

} // namespace nearshare::transfer
