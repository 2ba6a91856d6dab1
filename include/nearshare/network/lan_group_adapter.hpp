#pragma once

#include "nearshare/network/udp_discovery.hpp"
#include "nearshare/transport/group_adapter.hpp"
#include <map>
#include <memory>
#include <mutex>

namespace nearshare::network {

struct LanGroupOptions {
    std::string device_name = "nearshare";
    std::uint16_t service_port = 47800;
    UdpDiscoveryOptions discovery;
    bool allow_loopback = false;
};

// Group medium over an already formed IP network. Peers announce themselves
// over UDP; joining resolves the peer's TCP file service endpoint.
class LanGroupAdapter : public transport::GroupAdapter {
public:
    explicit LanGroupAdapter(LanGroupOptions options);
    ~LanGroupAdapter() override;

    bool is_supported() const override;
    bool is_enabled() const override;

    bool start_peer_discovery(transport::GroupPeersListener on_peers,
                              transport::GroupFailureListener on_failure) override;
    void stop_peer_discovery() override;

    std::optional<boost::asio::ip::tcp::endpoint> join(const std::string& identity,
                                                       boost::system::error_code& ec) override;
    void leave() override;

    std::optional<transport::GroupDevice> identify(const boost::asio::ip::address& address) const override;

    std::uint16_t service_port() const override { return options_.service_port; }
    std::uint64_t node_id() const { return node_id_; }

    static std::string format_identity(std::uint64_t node_id);

private:
    struct KnownNode {
        transport::GroupDevice device;
        std::uint16_t tcp_port;
    };

    void on_nodes_changed();

    LanGroupOptions options_;
    std::uint64_t node_id_;

    std::mutex discovery_mutex_;
    std::unique_ptr<UdpDiscovery> discovery_;
    // Stopped instance kept alive until the next start; stop may run on its own thread.
    std::unique_ptr<UdpDiscovery> retired_;
    transport::GroupPeersListener on_peers_;

    mutable std::mutex known_mutex_;
    std::map<std::string, KnownNode> known_;
};

} // namespace nearshare::network
