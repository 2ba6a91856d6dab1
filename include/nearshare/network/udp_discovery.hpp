#pragma once

#include "nearshare/network/announce_protocol.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace nearshare::network {

using boost::asio::ip::udp;

struct DiscoveredNode {
    std::uint64_t node_id;
    std::string ip_address;
    std::uint16_t tcp_port;
    std::string name;
    std::chrono::steady_clock::time_point last_seen;
};

struct UdpDiscoveryOptions {
    std::uint16_t bind_port = 47801;
    std::string target_address = "239.255.42.99";  // multicast group or a unicast host
    std::uint16_t target_port = 47801;
    std::chrono::milliseconds announcement_interval{2000};
    std::chrono::milliseconds peer_timeout{10000};
};

class UdpDiscovery {
public:
    using PeersChangedHandler = std::function<void()>;

    explicit UdpDiscovery(UdpDiscoveryOptions options);
    ~UdpDiscovery();

    UdpDiscovery(const UdpDiscovery&) = delete;
    UdpDiscovery& operator=(const UdpDiscovery&) = delete;

    bool start();
    void stop();
    bool is_running() const { return running_; }

    void announce_self(std::uint64_t node_id, std::uint16_t tcp_port, const std::string& name);
    void query_peers();

    std::vector<DiscoveredNode> get_discovered_peers() const;
    std::optional<DiscoveredNode> get_peer_info(std::uint64_t node_id) const;

    void set_peers_changed_handler(PeersChangedHandler handler) { peers_changed_handler_ = std::move(handler); }

    std::uint16_t local_port() const;

private:
    void do_receive();
    void handle_datagram(const udp::endpoint& sender, std::span<const std::uint8_t> data);
    void handle_announce(const udp::endpoint& sender, const AnnounceMessage& msg);
    void send_datagram(std::vector<std::uint8_t> message, const udp::endpoint& destination);
    void send_announcement(AnnounceType type, const udp::endpoint& destination);
    void cleanup_expired_peers();
    void discovery_loop();
    void notify_changed();

    UdpDiscoveryOptions options_;
    std::atomic<bool> running_;
    boost::asio::io_context io_context_;
    udp::socket socket_;
    udp::endpoint target_endpoint_;
    udp::endpoint sender_endpoint_;
    std::array<std::uint8_t, MAX_DATAGRAM_SIZE> receive_buffer_;

    std::thread io_thread_;
    std::thread discovery_thread_;

    std::atomic<std::uint64_t> local_node_id_;
    std::atomic<std::uint16_t> local_tcp_port_;
    std::string local_name_;
    mutable std::mutex local_mutex_;

    std::map<std::uint64_t, DiscoveredNode> discovered_peers_;
    mutable std::mutex peers_mutex_;

    PeersChangedHandler peers_changed_handler_;
};

} // namespace nearshare::network
