#pragma once

#include "nearshare/core/result.hpp"
#include "nearshare/storage/transferable_file.hpp"
#include "nearshare/transfer/progress_meter.hpp"
#include "nearshare/transfer/transfer_control.hpp"
#include "nearshare/transport/discovery_stream.hpp"
#include "nearshare/transport/peer.hpp"
#include "nearshare/transport/transport_kind.hpp"
#include <chrono>
#include <memory>
#include <optional>

namespace nearshare::core {
class Config;
}

namespace nearshare::transport {

struct TransportOptions {
    std::size_t chunk_size = 65536;
    std::chrono::milliseconds progress_interval{100};
    std::chrono::milliseconds accept_timeout{30000};
    std::chrono::milliseconds connect_timeout{15000};
    std::chrono::milliseconds io_timeout{0};

    static TransportOptions from_config(const core::Config& config, TransportKind kind);
};

// Peer discovery plus a byte stream over exactly one physical medium.
// Nothing thrown escapes these operations; failures come back as TransferError.
class Transport {
public:
    virtual ~Transport() = default;

    virtual TransportKind kind() const = 0;

    virtual bool is_available() const = 0;
    virtual bool is_enabled() const = 0;

    // Each call returns a fresh stream. Cancelling it, or reaching its end,
    // releases the medium's listeners and halts the scan.
    virtual std::shared_ptr<DiscoveryStream> start_discovery() = 0;
    virtual void stop_discovery() = 0;

    // The control belongs to the caller's operation. Cancelling it, even
    // before the call starts, ends the wait with TRANSFER_CANCELLED.
    virtual core::Result<void> connect(const Peer& peer, transfer::TransferControl& control) = 0;
    virtual core::Result<Peer> accept(transfer::TransferControl& control) = 0;
    virtual void disconnect() = 0;

    virtual core::Result<void> send_file(const storage::TransferableFile& file,
                                         const transfer::ProgressCallback& on_progress,
                                         transfer::TransferControl& control) = 0;

    // std::nullopt marks the end of the sender's batch.
    virtual core::Result<std::optional<storage::TransferableFile>> receive_file(
        const transfer::ProgressCallback& on_progress,
        transfer::TransferControl& control) = 0;

    virtual std::optional<Peer> get_connected_peer() const = 0;
};

} // namespace nearshare::transport
