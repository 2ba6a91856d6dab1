#include "nearshare/network/lan_group_adapter.hpp"
#include "nearshare/core/logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <random>

namespace nearshare::network {

namespace {
    std::uint64_t generate_node_id() {
        static std::random_device rd;
        static std::mt19937_64 gen(rd());
        std::uint64_t id = 0;
        while (id == 0) {
            id = gen();
        }
        return id;
    }
}

LanGroupAdapter::LanGroupAdapter(LanGroupOptions options)
    : options_(std::move(options))
    , node_id_(generate_node_id()) {
}

LanGroupAdapter::~LanGroupAdapter() {
    stop_peer_discovery();
}

bool LanGroupAdapter::is_supported() const {
    return true;
}

bool LanGroupAdapter::is_enabled() const {
    ifaddrs* interfaces = nullptr;
    if (::getifaddrs(&interfaces) != 0) {
        return false;
    }

    bool usable = false;
    for (auto* entry = interfaces; entry != nullptr && !usable; entry = entry->ifa_next) {
        if (entry->ifa_addr == nullptr || entry->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if ((entry->ifa_flags & IFF_UP) == 0) {
            continue;
        }
        if ((entry->ifa_flags & IFF_LOOPBACK) != 0 && !options_.allow_loopback) {
            continue;
        }
        usable = true;
    }

    ::freeifaddrs(interfaces);
    return usable;
}

bool LanGroupAdapter::start_peer_discovery(transport::GroupPeersListener on_peers,
                                           transport::GroupFailureListener on_failure) {
    stop_peer_discovery();

    {
        std::lock_guard<std::mutex> lock(discovery_mutex_);
        retired_.reset();
        on_peers_ = std::move(on_peers);

        auto discovery = std::make_unique<UdpDiscovery>(options_.discovery);
        discovery->set_peers_changed_handler([this]() { on_nodes_changed(); });

        if (!discovery->start()) {
            on_peers_ = nullptr;
            if (on_failure) {
                on_failure("Cannot bind discovery port " + std::to_string(options_.discovery.bind_port));
            }
            return false;
        }

        discovery->announce_self(node_id_, options_.service_port, options_.device_name);
        discovery->query_peers();
        discovery_ = std::move(discovery);
    }

    on_nodes_changed();
    return true;
}

void LanGroupAdapter::stop_peer_discovery() {
    std::unique_ptr<UdpDiscovery> discovery;
    {
        std::lock_guard<std::mutex> lock(discovery_mutex_);
        on_peers_ = nullptr;
        discovery = std::move(discovery_);
    }
    if (discovery) {
        discovery->stop();
        std::lock_guard<std::mutex> lock(discovery_mutex_);
        retired_ = std::move(discovery);
    }
}

std::optional<boost::asio::ip::tcp::endpoint> LanGroupAdapter::join(const std::string& identity,
                                                                    boost::system::error_code& ec) {
    std::lock_guard<std::mutex> lock(known_mutex_);
    auto it = known_.find(identity);
    if (it == known_.end()) {
        ec = boost::asio::error::host_not_found;
        return std::nullopt;
    }

    auto address = boost::asio::ip::make_address(it->second.device.address, ec);
    if (ec) {
        return std::nullopt;
    }

    LOG_DEBUG("Joined LAN group of {} at {}:{}", identity, it->second.device.address, it->second.tcp_port);
    return boost::asio::ip::tcp::endpoint(address, it->second.tcp_port);
}

void LanGroupAdapter::leave() {
    LOG_DEBUG("Leaving LAN group");
}

std::optional<transport::GroupDevice> LanGroupAdapter::identify(const boost::asio::ip::address& address) const {
    std::lock_guard<std::mutex> lock(known_mutex_);
    auto text = address.to_string();
    for (const auto& [identity, node] : known_) {
        if (node.device.address == text) {
            return node.device;
        }
    }
    return std::nullopt;
}

std::string LanGroupAdapter::format_identity(std::uint64_t node_id) {
    return fmt::format("{:016x}", node_id);
}

void LanGroupAdapter::on_nodes_changed() {
    std::vector<DiscoveredNode> nodes;
    transport::GroupPeersListener listener;
    {
        std::lock_guard<std::mutex> lock(discovery_mutex_);
        if (!discovery_) {
            return;
        }
        nodes = discovery_->get_discovered_peers();
        listener = on_peers_;
    }

    std::vector<transport::GroupDevice> devices;
    devices.reserve(nodes.size());
    {
        std::lock_guard<std::mutex> lock(known_mutex_);
        for (const auto& node : nodes) {
            transport::GroupDevice device{format_identity(node.node_id), node.name, node.ip_address};
            known_[device.identity] = KnownNode{device, node.tcp_port};
            devices.push_back(std::move(device));
        }
    }

    if (listener && !devices.empty()) {
        listener(devices);
    }
}

} // namespace nearshare::network
