#pragma once

#include "nearshare/transport/group_adapter.hpp"
#include "nearshare/transport/stream_transport.hpp"
#include <memory>
#include <mutex>

namespace nearshare::transport {

class GroupTransport : public StreamTransport {
public:
    GroupTransport(std::shared_ptr<GroupAdapter> adapter,
                   TransportOptions options,
                   std::shared_ptr<PermissionGate> permissions,
                   std::shared_ptr<storage::ContentResolver> resolver,
                   storage::StorageConfig storage);
    ~GroupTransport() override;

    TransportKind kind() const override { return TransportKind::LOCAL_WIRELESS_GROUP; }

    bool is_available() const override;
    bool is_enabled() const override;

    std::shared_ptr<DiscoveryStream> start_discovery() override;
    void stop_discovery() override;

protected:
    core::Result<std::shared_ptr<ByteStream>> open_stream(const Peer& peer) override;
    core::Result<Accepted> accept_stream() override;
    void on_disconnected() override;

private:
    static Peer to_peer(const GroupDevice& device);

    std::shared_ptr<GroupAdapter> adapter_;

    std::mutex discovery_mutex_;
    std::weak_ptr<DiscoveryStream> active_discovery_;
};

} // namespace nearshare::transport
