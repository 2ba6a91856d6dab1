#pragma once

#include "nearshare/transport/transport_kind.hpp"
#include <string>

namespace nearshare::transport {

struct Peer {
    std::string identity;
    std::string display_name;
    std::string address;
    TransportKind medium = TransportKind::SHORT_RANGE_RADIO;
    bool connected = false;

    bool operator==(const Peer& other) const = default;
};

} // namespace nearshare::transport
