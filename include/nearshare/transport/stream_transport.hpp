#pragma once

#include "nearshare/storage/content_resolver.hpp"
#include "nearshare/storage/storage_config.hpp"
#include "nearshare/transfer/transfer_protocol.hpp"
#include "nearshare/transport/byte_stream.hpp"
#include "nearshare/transport/permission_gate.hpp"
#include "nearshare/transport/transport.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

namespace nearshare::transport {

// Connection bookkeeping and the shared transfer protocol for transports
// whose established link is a single ByteStream.
class StreamTransport : public Transport {
public:
    StreamTransport(TransportOptions options,
                    std::shared_ptr<PermissionGate> permissions,
                    std::shared_ptr<storage::ContentResolver> resolver,
                    storage::StorageConfig storage);
    ~StreamTransport() override;

    core::Result<void> connect(const Peer& peer, transfer::TransferControl& control) override;
    core::Result<Peer> accept(transfer::TransferControl& control) override;
    void disconnect() override;

    core::Result<void> send_file(const storage::TransferableFile& file,
                                 const transfer::ProgressCallback& on_progress,
                                 transfer::TransferControl& control) override;

    core::Result<std::optional<storage::TransferableFile>> receive_file(
        const transfer::ProgressCallback& on_progress,
        transfer::TransferControl& control) override;

    std::optional<Peer> get_connected_peer() const override;

    const TransportOptions& options() const { return options_; }

protected:
    using Accepted = std::pair<std::shared_ptr<ByteStream>, Peer>;

    virtual core::Result<std::shared_ptr<ByteStream>> open_stream(const Peer& peer) = 0;
    virtual core::Result<Accepted> accept_stream() = 0;

    // Called after the stream is closed on disconnect.
    virtual void on_disconnected() {}

    // Blocking open_stream()/accept_stream() implementations poll this or
    // register an interrupt that disconnect() invokes from another thread.
    // Both observe the control handed to connect()/accept().
    bool abort_requested() const;
    bool set_interrupt(std::function<void()> interrupt);

    bool permitted() const;
    core::Result<void> check_ready() const;

    TransportOptions options_;
    std::shared_ptr<PermissionGate> permissions_;

private:
    std::shared_ptr<ByteStream> current_stream() const;
    void adopt(std::shared_ptr<ByteStream> stream, Peer peer);
    bool begin_operation(transfer::TransferControl& control);
    void end_operation();
    void drop_connection();

    transfer::TransferProtocol protocol_;

    mutable std::mutex mutex_;
    std::shared_ptr<ByteStream> stream_;
    std::optional<Peer> peer_;

    transfer::TransferControl* active_control_ = nullptr;
    bool disconnected_during_operation_ = false;
    std::function<void()> interrupt_;
};

} // namespace nearshare::transport
