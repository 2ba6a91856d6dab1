#include "nearshare/transport/radio_transport.hpp"
#include "nearshare/core/logger.hpp"
#include <boost/asio/error.hpp>

namespace nearshare::transport {

using core::Result;
using core::TransferError;

RadioTransport::RadioTransport(std::shared_ptr<RadioAdapter> adapter,
                               TransportOptions options,
                               std::shared_ptr<PermissionGate> permissions,
                               std::shared_ptr<storage::ContentResolver> resolver,
                               storage::StorageConfig storage)
    : StreamTransport(options, std::move(permissions), std::move(resolver), std::move(storage))
    , adapter_(std::move(adapter)) {
}

RadioTransport::~RadioTransport() {
    stop_discovery();
    disconnect();
}

bool RadioTransport::is_available() const {
    return adapter_ && adapter_->is_present();
}

bool RadioTransport::is_enabled() const {
    return is_available() && adapter_->is_powered();
}

std::shared_ptr<DiscoveryStream> RadioTransport::start_discovery() {
    stop_discovery();

    auto stream = DiscoveryStream::create();

    auto ready = check_ready();
    if (!ready) {
        LOG_WARN("Radio discovery unavailable: {}", ready.error().describe());
        stream->push(ready.error());
        stream->finish();
        return stream;
    }

    std::weak_ptr<DiscoveryStream> weak = stream;
    auto listener = [weak](const RadioScanEvent& event) {
        auto target = weak.lock();
        if (!target) {
            return;
        }
        switch (event.type) {
            case RadioScanEvent::Type::FOUND:
                if (event.device.address.empty()) {
                    LOG_DEBUG("Ignoring radio device without an address");
                    return;
                }
                target->push(to_peer(event.device));
                break;
            case RadioScanEvent::Type::FINISHED:
                LOG_DEBUG("Radio scan finished");
                target->finish();
                break;
            case RadioScanEvent::Type::FAILED:
                target->push(TransferError::unknown("Radio scan failed", event.message));
                target->finish();
                break;
        }
    };

    auto adapter = adapter_;
    stream->on_release([adapter] {
        adapter->cancel_scan();
    });

    {
        std::lock_guard<std::mutex> lock(discovery_mutex_);
        active_discovery_ = stream;
    }

    if (!adapter_->start_scan(listener)) {
        LOG_ERROR("Failed to start radio scan");
        stream->push(TransferError::unknown("Failed to start device discovery"));
        stream->finish();
        return stream;
    }

    LOG_INFO("Radio discovery started");
    return stream;
}

void RadioTransport::stop_discovery() {
    std::shared_ptr<DiscoveryStream> stream;
    {
        std::lock_guard<std::mutex> lock(discovery_mutex_);
        stream = active_discovery_.lock();
        active_discovery_.reset();
    }
    if (stream) {
        LOG_DEBUG("Stopping radio discovery");
        stream->cancel();
    }
}

Result<std::shared_ptr<ByteStream>> RadioTransport::open_stream(const Peer& peer) {
    if (peer.medium != TransportKind::SHORT_RANGE_RADIO) {
        return TransferError::connection_failed("Peer is not reachable over the radio", peer.identity);
    }

    auto address = peer.address.empty() ? peer.identity : peer.address;
    boost::system::error_code ec;
    auto stream = adapter_->open_channel(address, options_.connect_timeout,
                                         [this] { return abort_requested(); }, ec);
    if (ec == boost::asio::error::timed_out) {
        return TransferError::timeout("Connecting to " + peer.display_name + " timed out");
    }
    if (ec || !stream) {
        return TransferError::connection_failed("Failed to connect to " + peer.display_name,
                                                ec ? ec.message() : std::string("no channel"));
    }
    return stream;
}

Result<StreamTransport::Accepted> RadioTransport::accept_stream() {
    RadioDevice remote;
    boost::system::error_code ec;
    auto stream = adapter_->accept_channel(options_.accept_timeout,
                                           [this] { return abort_requested(); },
                                           remote, ec);

    if (ec == boost::asio::error::timed_out) {
        return TransferError::timeout("No incoming radio connection within " +
                                      std::to_string(options_.accept_timeout.count()) + " ms");
    }
    if (ec || !stream) {
        return TransferError::connection_failed("Failed to accept radio connection",
                                                ec ? ec.message() : std::string("no channel"));
    }
    return Accepted{stream, to_peer(remote)};
}

Peer RadioTransport::to_peer(const RadioDevice& device) {
    Peer peer;
    peer.identity = device.address;
    peer.address = device.address;
    peer.display_name = device.name.empty() ? UNKNOWN_DEVICE_NAME : device.name;
    peer.medium = TransportKind::SHORT_RANGE_RADIO;
    return peer;
}

} // namespace nearshare::transport
