#pragma once

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace nearshare::transport {

struct GroupDevice {
    std::string identity;
    std::string name;
    std::string address;
};

using GroupPeersListener = std::function<void(const std::vector<GroupDevice>&)>;
using GroupFailureListener = std::function<void(const std::string&)>;

// Platform side of the local wireless group medium.
class GroupAdapter {
public:
    virtual ~GroupAdapter() = default;

    virtual bool is_supported() const = 0;
    virtual bool is_enabled() const = 0;

    // Every callback carries the complete current peer list.
    virtual bool start_peer_discovery(GroupPeersListener on_peers, GroupFailureListener on_failure) = 0;
    virtual void stop_peer_discovery() = 0;

    // Joins the peer's group and resolves the endpoint of its file service.
    virtual std::optional<boost::asio::ip::tcp::endpoint> join(const std::string& identity,
                                                               boost::system::error_code& ec) = 0;
    virtual void leave() = 0;

    virtual std::optional<GroupDevice> identify(const boost::asio::ip::address& address) const = 0;

    virtual std::uint16_t service_port() const = 0;
};

} // namespace nearshare::transport
