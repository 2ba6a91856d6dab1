#pragma once

#include "nearshare/core/transfer_error.hpp"
#include "nearshare/transport/peer.hpp"
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <cstdint>

namespace nearshare::transfer {

namespace state {

struct Idle {};
struct Discovering {};

struct DevicesFound {
    std::vector<transport::Peer> peers;
};

struct Connecting {
    transport::Peer peer;
};

struct Connected {
    transport::Peer peer;
};

struct Transferring {
    int progress_percent = 0;
    std::int64_t bytes_done = 0;
    std::int64_t bytes_total = 0;
    std::uint64_t bytes_per_second = 0;
    std::int64_t eta_millis = 0;
    std::string current_file_name;
};

struct Completed {
    std::size_t file_count = 0;
    std::int64_t bytes_total = 0;
    std::int64_t duration_millis = 0;
};

struct Failed {
    core::TransferError error;
    bool can_retry = false;
};

struct Cancelled {};

struct Paused {
    int progress_percent = 0;
};

} // namespace state

using TransferState = std::variant<
    state::Idle,
    state::Discovering,
    state::DevicesFound,
    state::Connecting,
    state::Connected,
    state::Transferring,
    state::Completed,
    state::Failed,
    state::Cancelled,
    state::Paused>;

std::string_view state_name(const TransferState& state);
std::string describe(const TransferState& state);

inline state::Failed make_failed(core::TransferError error) {
    bool retry = error.is_retryable();
    return state::Failed{std::move(error), retry};
}

template<typename T>
bool holds(const TransferState& state) {
    return std::holds_alternative<T>(state);
}

} // namespace nearshare::transfer
