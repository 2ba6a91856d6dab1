#include "nearshare/transport/group_transport.hpp"
#include "nearshare/core/logger.hpp"
#include "nearshare/network/socket_stream.hpp"

namespace nearshare::transport {

using boost::asio::ip::tcp;
using core::Result;
using core::TransferError;

GroupTransport::GroupTransport(std::shared_ptr<GroupAdapter> adapter,
                               TransportOptions options,
                               std::shared_ptr<PermissionGate> permissions,
                               std::shared_ptr<storage::ContentResolver> resolver,
                               storage::StorageConfig storage)
    : StreamTransport(options, std::move(permissions), std::move(resolver), std::move(storage))
    , adapter_(std::move(adapter)) {
}

GroupTransport::~GroupTransport() {
    stop_discovery();
    disconnect();
}

bool GroupTransport::is_available() const {
    return adapter_ && adapter_->is_supported();
}

bool GroupTransport::is_enabled() const {
    return is_available() && adapter_->is_enabled();
}

std::shared_ptr<DiscoveryStream> GroupTransport::start_discovery() {
    stop_discovery();

    auto stream = DiscoveryStream::create();

    auto ready = check_ready();
    if (!ready) {
        LOG_WARN("Group discovery unavailable: {}", ready.error().describe());
        stream->push(ready.error());
        stream->finish();
        return stream;
    }

    std::weak_ptr<DiscoveryStream> weak = stream;
    auto on_peers = [weak](const std::vector<GroupDevice>& devices) {
        auto target = weak.lock();
        if (!target) {
            return;
        }
        for (const auto& device : devices) {
            if (device.identity.empty()) {
                continue;
            }
            target->push(to_peer(device));
        }
    };
    auto on_failure = [weak](const std::string& reason) {
        if (auto target = weak.lock()) {
            target->push(TransferError::unknown("Group discovery failed", reason));
        }
    };

    auto adapter = adapter_;
    stream->on_release([adapter] {
        adapter->stop_peer_discovery();
    });

    {
        std::lock_guard<std::mutex> lock(discovery_mutex_);
        active_discovery_ = stream;
    }

    if (!adapter_->start_peer_discovery(on_peers, on_failure)) {
        LOG_ERROR("Failed to start group peer discovery");
        stream->push(TransferError::unknown("Failed to start device discovery"));
        stream->finish();
        return stream;
    }

    LOG_INFO("Group discovery started");
    return stream;
}

void GroupTransport::stop_discovery() {
    std::shared_ptr<DiscoveryStream> stream;
    {
        std::lock_guard<std::mutex> lock(discovery_mutex_);
        stream = active_discovery_.lock();
        active_discovery_.reset();
    }
    if (stream) {
        LOG_DEBUG("Stopping group discovery");
        stream->cancel();
    }
}

Result<std::shared_ptr<ByteStream>> GroupTransport::open_stream(const Peer& peer) {
    if (peer.medium != TransportKind::LOCAL_WIRELESS_GROUP) {
        return TransferError::connection_failed("Peer is not reachable over the group", peer.identity);
    }

    boost::system::error_code ec;
    auto endpoint = adapter_->join(peer.identity, ec);
    if (ec || !endpoint) {
        return TransferError::connection_failed("Failed to join group of " + peer.display_name,
                                                ec ? ec.message() : std::string("peer unknown"));
    }

    auto stream = std::make_shared<network::TcpStream>(options_.io_timeout);
    if (!set_interrupt([stream] { stream->close(); })) {
        return TransferError::connection_failed("Connection attempt aborted");
    }

    stream->connect(*endpoint, options_.connect_timeout, ec);
    if (ec == boost::asio::error::timed_out) {
        return TransferError::timeout("Connecting to " + peer.display_name + " timed out");
    }
    if (ec) {
        return TransferError::connection_failed("Failed to connect to " + peer.display_name, ec.message());
    }

    boost::system::error_code ignored;
    stream->stream().set_option(tcp::no_delay(true), ignored);
    stream->set_remote_description(endpoint->address().to_string() + ":" + std::to_string(endpoint->port()));
    return std::shared_ptr<ByteStream>(stream);
}

Result<StreamTransport::Accepted> GroupTransport::accept_stream() {
    auto stream = std::make_shared<network::TcpStream>(options_.io_timeout);
    tcp::acceptor acceptor(stream->context());

    boost::system::error_code ec;
    tcp::endpoint local(tcp::v4(), adapter_->service_port());
    acceptor.open(local.protocol(), ec);
    if (!ec) acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor.bind(local, ec);
    if (!ec) acceptor.listen(1, ec);
    if (ec) {
        return TransferError::connection_failed("Cannot listen on port " +
                                                std::to_string(adapter_->service_port()), ec.message());
    }

    if (!set_interrupt([stream] { stream->close(); })) {
        return TransferError::connection_failed("Accept aborted");
    }

    stream->accept_from(acceptor, options_.accept_timeout, ec);
    boost::system::error_code ignored;
    acceptor.close(ignored);

    if (ec == boost::asio::error::timed_out) {
        return TransferError::timeout("No incoming group connection within " +
                                      std::to_string(options_.accept_timeout.count()) + " ms");
    }
    if (ec) {
        return TransferError::connection_failed("Failed to accept group connection", ec.message());
    }

    auto remote = stream->stream().remote_endpoint(ignored);
    stream->set_remote_description(remote.address().to_string() + ":" + std::to_string(remote.port()));
    stream->stream().set_option(tcp::no_delay(true), ignored);

    GroupDevice device;
    if (auto known = adapter_->identify(remote.address())) {
        device = *known;
    } else {
        device.identity = remote.address().to_string();
        device.name = remote.address().to_string();
        device.address = remote.address().to_string();
    }
    return Accepted{std::shared_ptr<ByteStream>(stream), to_peer(device)};
}

void GroupTransport::on_disconnected() {
    adapter_->leave();
}

Peer GroupTransport::to_peer(const GroupDevice& device) {
    Peer peer;
    peer.identity = device.identity;
    peer.address = device.address;
    peer.display_name = device.name.empty() ? device.identity : device.name;
    peer.medium = TransportKind::LOCAL_WIRELESS_GROUP;
    return peer;
}

} // namespace nearshare::transport
