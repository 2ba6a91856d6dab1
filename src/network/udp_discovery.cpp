#include "nearshare/network/udp_discovery.hpp"
#include "nearshare/core/logger.hpp"
#include <boost/asio/ip/multicast.hpp>

namespace nearshare::network {

UdpDiscovery::UdpDiscovery(UdpDiscoveryOptions options)
    : options_(std::move(options))
    , running_(false)
    , io_context_()
    , socket_(io_context_)
    , target_endpoint_(boost::asio::ip::make_address(options_.target_address), options_.target_port)
    , receive_buffer_{}
    , local_node_id_(0)
    , local_tcp_port_(0) {

    LOG_DEBUG("UDP discovery configured on port {} targeting {}:{}",
              options_.bind_port, options_.target_address, options_.target_port);
}

UdpDiscovery::~UdpDiscovery() {
    stop();
}

bool UdpDiscovery::start() {
    if (running_) {
        LOG_WARN("UDP discovery already running");
        return false;
    }

    try {
        io_context_.restart();
        socket_.open(udp::v4());
        socket_.set_option(boost::asio::ip::udp::socket::reuse_address(true));
        socket_.bind(udp::endpoint(udp::v4(), options_.bind_port));

        if (target_endpoint_.address().is_multicast()) {
            socket_.set_option(boost::asio::ip::multicast::enable_loopback(true));
            socket_.set_option(boost::asio::ip::multicast::join_group(target_endpoint_.address()));
        }

        running_ = true;

        do_receive();

        io_thread_ = std::thread([this]() {
            LOG_DEBUG("UDP discovery IO thread started");
            while (running_) {
                try {
                    io_context_.run();
                    break;
                } catch (const std::exception& e) {
                    LOG_ERROR("UDP discovery IO error: {}", e.what());
                    if (!running_) break;
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                    io_context_.restart();
                }
            }
            LOG_DEBUG("UDP discovery IO thread stopped");
        });

        discovery_thread_ = std::thread([this]() {
            discovery_loop();
        });

        LOG_INFO("UDP discovery started on port {}", local_port());
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start UDP discovery: {}", e.what());
        running_ = false;
        boost::system::error_code ignored;
        socket_.close(ignored);
        return false;
    }
}

void UdpDiscovery::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Stopping UDP discovery");

    io_context_.stop();

    auto self = std::this_thread::get_id();
    for (auto* worker : {&io_thread_, &discovery_thread_}) {
        if (!worker->joinable()) {
            continue;
        }
        if (worker->get_id() == self) {
            worker->detach();
        } else {
            worker->join();
        }
    }

    boost::system::error_code ec;
    socket_.close(ec);

    std::lock_guard<std::mutex> lock(peers_mutex_);
    discovered_peers_.clear();
}

void UdpDiscovery::announce_self(std::uint64_t node_id, std::uint16_t tcp_port, const std::string& name) {
    local_node_id_ = node_id;
    local_tcp_port_ = tcp_port;
    {
        std::lock_guard<std::mutex> lock(local_mutex_);
        local_name_ = name;
    }

    LOG_INFO("Configured local node: ID={:016x}, TCP port={}, name='{}'", node_id, tcp_port, name);

    if (running_) {
        send_announcement(AnnounceType::ANNOUNCE, target_endpoint_);
    }
}

void UdpDiscovery::query_peers() {
    if (!running_) {
        return;
    }
    send_datagram(encode_datagram(AnnounceType::QUERY, {}), target_endpoint_);
}

std::vector<DiscoveredNode> UdpDiscovery::get_discovered_peers() const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    std::vector<DiscoveredNode> peers;
    peers.reserve(discovered_peers_.size());

    for (const auto& [id, info] : discovered_peers_) {
        peers.push_back(info);
    }

    return peers;
}

std::optional<DiscoveredNode> UdpDiscovery::get_peer_info(std::uint64_t node_id) const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    auto it = discovered_peers_.find(node_id);
    if (it != discovered_peers_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::uint16_t UdpDiscovery::local_port() const {
    boost::system::error_code ec;
    auto endpoint = socket_.local_endpoint(ec);
    return ec ? options_.bind_port : endpoint.port();
}

void UdpDiscovery::do_receive() {
    if (!running_) {
        return;
    }

    socket_.async_receive_from(
        boost::asio::buffer(receive_buffer_), sender_endpoint_,
        [this](boost::system::error_code ec, std::size_t bytes_received) {
            if (!ec && running_) {
                handle_datagram(sender_endpoint_,
                                std::span<const std::uint8_t>(receive_buffer_.data(), bytes_received));
                do_receive();
            } else if (ec != boost::asio::error::operation_aborted && running_) {
                LOG_WARN("UDP receive error: {}", ec.message());
                do_receive();
            }
        });
}

void UdpDiscovery::handle_datagram(const udp::endpoint& sender, std::span<const std::uint8_t> data) {
    try {
        if (data.size() < ANNOUNCE_HEADER_SIZE) {
            return;
        }

        auto header = AnnounceHeader::deserialize(data.subspan(0, ANNOUNCE_HEADER_SIZE));
        if (!header.is_valid() || data.size() < ANNOUNCE_HEADER_SIZE + header.payload_size) {
            return;
        }

        auto payload = data.subspan(ANNOUNCE_HEADER_SIZE, header.payload_size);
        if (!header.verify_checksum(payload)) {
            LOG_WARN("Discovery datagram checksum mismatch from {}", sender.address().to_string());
            return;
        }

        switch (header.type) {
            case AnnounceType::ANNOUNCE:
            case AnnounceType::RESPONSE:
                handle_announce(sender, AnnounceMessage::deserialize(payload));
                break;
            case AnnounceType::QUERY:
                send_announcement(AnnounceType::RESPONSE, sender);
                break;
        }

    } catch (const std::exception& e) {
        LOG_DEBUG("Dropping malformed discovery datagram from {}: {}",
                  sender.address().to_string(), e.what());
    }
}

void UdpDiscovery::handle_announce(const udp::endpoint& sender, const AnnounceMessage& msg) {
    if (msg.node_id == 0 || msg.node_id == local_node_id_) {
        return;
    }

    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);

        DiscoveredNode info{
            msg.node_id,
            sender.address().to_string(),
            msg.tcp_port,
            msg.device_name,
            std::chrono::steady_clock::now()
        };

        auto it = discovered_peers_.find(msg.node_id);
        if (it == discovered_peers_.end()) {
            LOG_INFO("Discovered node {:016x} '{}' at {}:{}", msg.node_id, msg.device_name,
                     info.ip_address, msg.tcp_port);
            changed = true;
        } else {
            changed = it->second.ip_address != info.ip_address ||
                      it->second.tcp_port != info.tcp_port ||
                      it->second.name != info.name;
        }
        discovered_peers_[msg.node_id] = info;
    }

    if (changed) {
        notify_changed();
    }
}

void UdpDiscovery::send_datagram(std::vector<std::uint8_t> message, const udp::endpoint& destination) {
    auto buffer = std::make_shared<std::vector<std::uint8_t>>(std::move(message));
    boost::asio::post(io_context_, [this, buffer, destination]() {
        if (!running_) {
            return;
        }
        socket_.async_send_to(
            boost::asio::buffer(*buffer), destination,
            [buffer, destination](boost::system::error_code ec, std::size_t bytes_sent) {
                if (ec) {
                    LOG_WARN("Failed to send discovery datagram to {}: {}",
                             destination.address().to_string(), ec.message());
                } else {
                    LOG_TRACE("Sent discovery datagram ({} bytes)", bytes_sent);
                }
            });
    });
}

void UdpDiscovery::send_announcement(AnnounceType type, const udp::endpoint& destination) {
    if (local_node_id_ == 0) {
        return;
    }

    AnnounceMessage msg;
    msg.node_id = local_node_id_;
    msg.tcp_port = local_tcp_port_;
    {
        std::lock_guard<std::mutex> lock(local_mutex_);
        msg.device_name = local_name_;
    }

    send_datagram(encode_datagram(type, msg.serialize()), destination);
}

void UdpDiscovery::cleanup_expired_peers() {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        auto now = std::chrono::steady_clock::now();

        auto it = discovered_peers_.begin();
        while (it != discovered_peers_.end()) {
            if (now - it->second.last_seen > options_.peer_timeout) {
                LOG_INFO("Node {:016x} ({}) timed out", it->second.node_id, it->second.ip_address);
                it = discovered_peers_.erase(it);
                changed = true;
            } else {
                ++it;
            }
        }
    }

    if (changed) {
        notify_changed();
    }
}

void UdpDiscovery::discovery_loop() {
    LOG_DEBUG("UDP discovery loop started");

    auto last_announcement = std::chrono::steady_clock::now() - options_.announcement_interval;

    while (running_) {
        auto now = std::chrono::steady_clock::now();

        if (now - last_announcement >= options_.announcement_interval) {
            send_announcement(AnnounceType::ANNOUNCE, target_endpoint_);
            last_announcement = now;
        }

        cleanup_expired_peers();

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    LOG_DEBUG("UDP discovery loop stopped");
}

void UdpDiscovery::notify_changed() {
    if (peers_changed_handler_) {
        peers_changed_handler_();
    }
}

} // namespace nearshare::network
