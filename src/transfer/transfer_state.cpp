#include "nearshare/transfer/transfer_state.hpp"
#include <spdlog/fmt/fmt.h>
#include <type_traits>

namespace nearshare::transfer {

namespace {
    template<typename>
    inline constexpr bool always_false = false;
}

std::string_view state_name(const TransferState& current) {
    return std::visit([](const auto& s) -> std::string_view {
        using S = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<S, state::Idle>) return "Idle";
        else if constexpr (std::is_same_v<S, state::Discovering>) return "Discovering";
        else if constexpr (std::is_same_v<S, state::DevicesFound>) return "DevicesFound";
        else if constexpr (std::is_same_v<S, state::Connecting>) return "Connecting";
        else if constexpr (std::is_same_v<S, state::Connected>) return "Connected";
        else if constexpr (std::is_same_v<S, state::Transferring>) return "Transferring";
        else if constexpr (std::is_same_v<S, state::Completed>) return "Completed";
        else if constexpr (std::is_same_v<S, state::Failed>) return "Failed";
        else if constexpr (std::is_same_v<S, state::Cancelled>) return "Cancelled";
        else if constexpr (std::is_same_v<S, state::Paused>) return "Paused";
        else static_assert(always_false<S>, "unhandled TransferState alternative");
    }, current);
}

std::string describe(const TransferState& current) {
    return std::visit([](const auto& s) -> std::string {
        using S = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<S, state::DevicesFound>) {
            return fmt::format("DevicesFound({} peers)", s.peers.size());
        } else if constexpr (std::is_same_v<S, state::Connecting>) {
            return fmt::format("Connecting({})", s.peer.display_name);
        } else if constexpr (std::is_same_v<S, state::Connected>) {
            return fmt::format("Connected({})", s.peer.display_name);
        } else if constexpr (std::is_same_v<S, state::Transferring>) {
            return fmt::format("Transferring({} {}% {}/{})", s.current_file_name,
                               s.progress_percent, s.bytes_done, s.bytes_total);
        } else if constexpr (std::is_same_v<S, state::Completed>) {
            return fmt::format("Completed({} files, {} bytes, {} ms)",
                               s.file_count, s.bytes_total, s.duration_millis);
        } else if constexpr (std::is_same_v<S, state::Failed>) {
            return fmt::format("Failed({}, retry={})", s.error.describe(), s.can_retry);
        } else if constexpr (std::is_same_v<S, state::Paused>) {
            return fmt::format("Paused({}%)", s.progress_percent);
        } else {
            return std::string(state_name(TransferState{s}));
        }
    }, current);
}

} // namespace nearshare::transfer
