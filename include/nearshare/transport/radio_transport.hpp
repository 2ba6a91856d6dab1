#pragma once

#include "nearshare/transport/radio_adapter.hpp"
#include "nearshare/transport/stream_transport.hpp"
#include <memory>
#include <mutex>

namespace nearshare::transport {

constexpr const char* UNKNOWN_DEVICE_NAME = "Unknown Device";

class RadioTransport : public StreamTransport {
public:
    RadioTransport(std::shared_ptr<RadioAdapter> adapter,
                   TransportOptions options,
                   std::shared_ptr<PermissionGate> permissions,
                   std::shared_ptr<storage::ContentResolver> resolver,
                   storage::StorageConfig storage);
    ~RadioTransport() override;

    TransportKind kind() const override { return TransportKind::SHORT_RANGE_RADIO; }

    bool is_available() const override;
    bool is_enabled() const override;

    std::shared_ptr<DiscoveryStream> start_discovery() override;
    void stop_discovery() override;

protected:
    core::Result<std::shared_ptr<ByteStream>> open_stream(const Peer& peer) override;
    core::Result<Accepted> accept_stream() override;

private:
    static Peer to_peer(const RadioDevice& device);

    std::shared_ptr<RadioAdapter> adapter_;

    std::mutex discovery_mutex_;
    std::weak_ptr<DiscoveryStream> active_discovery_;
};

} // namespace nearshare::transport
