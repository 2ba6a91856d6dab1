#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace nearshare::transport {

// Physical media. Ordered from lowest to highest throughput.
enum class TransportKind {
    SHORT_RANGE_RADIO,
    LOCAL_WIRELESS_GROUP
};

// AUTO is a selection policy only and never names a resolved medium.
enum class TransportSelection {
    AUTO,
    SHORT_RANGE_RADIO,
    LOCAL_WIRELESS_GROUP
};

inline std::string_view to_string(TransportKind kind) {
    switch (kind) {
        case TransportKind::SHORT_RANGE_RADIO: return "radio";
        case TransportKind::LOCAL_WIRELESS_GROUP: return "group";
    }
    return "unknown";
}

inline std::string_view to_string(TransportSelection selection) {
    switch (selection) {
        case TransportSelection::AUTO: return "auto";
        case TransportSelection::SHORT_RANGE_RADIO: return "radio";
        case TransportSelection::LOCAL_WIRELESS_GROUP: return "group";
    }
    return "unknown";
}

inline std::optional<TransportSelection> parse_selection(std::string_view text) {
    if (text == "auto") return TransportSelection::AUTO;
    if (text == "radio" || text == "bluetooth") return TransportSelection::SHORT_RANGE_RADIO;
    if (text == "group" || text == "wifi") return TransportSelection::LOCAL_WIRELESS_GROUP;
    return std::nullopt;
}

} // namespace nearshare::transport
