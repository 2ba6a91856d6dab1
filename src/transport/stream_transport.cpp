#include "nearshare/transport/stream_transport.hpp"
#include "nearshare/core/config.hpp"
#include "nearshare/core/logger.hpp"

namespace nearshare::transport {

using core::Result;
using core::TransferError;

TransportOptions TransportOptions::from_config(const core::Config& config, TransportKind kind) {
    TransportOptions options;
    std::string prefix = kind == TransportKind::SHORT_RANGE_RADIO ? "radio." : "group.";

    options.chunk_size = static_cast<std::size_t>(
        config.get_int(prefix + "chunk_size", kind == TransportKind::SHORT_RANGE_RADIO ? 1024 : 65536));
    options.progress_interval = std::chrono::milliseconds(
        config.get_int(prefix + "progress_interval_ms", kind == TransportKind::SHORT_RANGE_RADIO ? 200 : 100));
    options.accept_timeout = std::chrono::milliseconds(config.get_int64(prefix + "accept_timeout_ms", 30000));
    options.connect_timeout = std::chrono::milliseconds(config.get_int64(prefix + "connect_timeout_ms", 15000));
    options.io_timeout = std::chrono::milliseconds(config.get_int64("transfer.io_timeout_ms", 0));
    return options;
}

StreamTransport::StreamTransport(TransportOptions options,
                                 std::shared_ptr<PermissionGate> permissions,
                                 std::shared_ptr<storage::ContentResolver> resolver,
                                 storage::StorageConfig storage)
    : options_(options)
    , permissions_(std::move(permissions))
    , protocol_(transfer::ProtocolOptions{options.chunk_size, options.progress_interval},
                std::move(resolver), std::move(storage)) {
}

StreamTransport::~StreamTransport() {
    std::shared_ptr<ByteStream> stream;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stream = std::move(stream_);
        peer_.reset();
    }
    if (stream) {
        stream->close();
    }
}

bool StreamTransport::permitted() const {
    return permissions_ && permissions_->has_required_permissions(kind());
}

Result<void> StreamTransport::check_ready() const {
    if (!permitted()) {
        return TransferError::permission_denied();
    }
    if (!is_available()) {
        return TransferError::unsupported(std::string(to_string(kind())) + " transport is not available");
    }
    if (!is_enabled()) {
        return TransferError::unsupported(std::string(to_string(kind())) + " transport is disabled");
    }
    return Result<void>::ok();
}

Result<void> StreamTransport::connect(const Peer& peer, transfer::TransferControl& control) {
    if (!permitted()) {
        LOG_WARN("Connect to {} refused: missing permission", peer.identity);
        return TransferError::permission_denied();
    }
    if (!is_available() || !is_enabled()) {
        return TransferError::connection_failed("Transport is not ready", std::string(to_string(kind())));
    }

    drop_connection();
    if (!begin_operation(control)) {
        return TransferError::connection_failed("Connection attempt cancelled");
    }

    LOG_INFO("Connecting to {} ({}) over {}", peer.display_name, peer.identity, to_string(kind()));
    auto opened = open_stream(peer);
    bool aborted = abort_requested();
    end_operation();
    if (!opened) {
        LOG_WARN("Connection to {} failed: {}", peer.identity, opened.error().describe());
        return opened.error();
    }
    if (aborted) {
        opened.value()->close();
        return TransferError::connection_failed("Connection attempt cancelled");
    }

    Peer connected = peer;
    connected.connected = true;
    adopt(std::move(opened).value(), connected);
    LOG_INFO("Connected to {}", peer.display_name);
    return Result<void>::ok();
}

Result<Peer> StreamTransport::accept(transfer::TransferControl& control) {
    auto ready = check_ready();
    if (!ready) {
        return ready.error();
    }

    drop_connection();
    if (!begin_operation(control)) {
        return TransferError::connection_failed("Accept cancelled");
    }

    LOG_INFO("Waiting up to {} ms for an incoming {} connection",
             options_.accept_timeout.count(), to_string(kind()));
    auto accepted = accept_stream();
    bool aborted = abort_requested();
    end_operation();
    if (!accepted) {
        return accepted.error();
    }

    auto [stream, peer] = std::move(accepted).value();
    if (aborted) {
        stream->close();
        return TransferError::connection_failed("Accept cancelled");
    }
    peer.connected = true;
    adopt(std::move(stream), peer);
    LOG_INFO("Accepted connection from {}", peer.display_name);
    return peer;
}

void StreamTransport::disconnect() {
    std::function<void()> interrupt;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_control_) {
            disconnected_during_operation_ = true;
        }
        interrupt = std::move(interrupt_);
        interrupt_ = nullptr;
    }
    if (interrupt) {
        interrupt();
    }

    drop_connection();
}

void StreamTransport::drop_connection() {
    std::shared_ptr<ByteStream> stream;
    bool had_peer = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stream = std::move(stream_);
        stream_.reset();
        had_peer = peer_.has_value();
        peer_.reset();
    }

    if (stream) {
        stream->close();
    }
    if (stream || had_peer) {
        LOG_DEBUG("Disconnected {} transport", to_string(kind()));
        on_disconnected();
    }
}

Result<void> StreamTransport::send_file(const storage::TransferableFile& file,
                                        const transfer::ProgressCallback& on_progress,
                                        transfer::TransferControl& control) {
    auto stream = current_stream();
    if (!stream) {
        return TransferError::connection_lost("Not connected");
    }
    return protocol_.send_file(*stream, file, on_progress, control);
}

Result<std::optional<storage::TransferableFile>> StreamTransport::receive_file(
    const transfer::ProgressCallback& on_progress,
    transfer::TransferControl& control) {

    auto stream = current_stream();
    if (!stream) {
        auto accepted = accept(control);
        if (!accepted) {
            return accepted.error();
        }
        stream = current_stream();
        if (!stream) {
            return TransferError::connection_lost("Connection closed");
        }
    }
    return protocol_.receive_file(*stream, on_progress, control);
}

std::optional<Peer> StreamTransport::get_connected_peer() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peer_;
}

std::shared_ptr<ByteStream> StreamTransport::current_stream() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_;
}

bool StreamTransport::begin_operation(transfer::TransferControl& control) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (control.is_cancelled()) {
        return false;
    }
    active_control_ = &control;
    disconnected_during_operation_ = false;
    return true;
}

void StreamTransport::end_operation() {
    std::lock_guard<std::mutex> lock(mutex_);
    active_control_ = nullptr;
    disconnected_during_operation_ = false;
    interrupt_ = nullptr;
}

bool StreamTransport::abort_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disconnected_during_operation_ || (active_control_ && active_control_->is_cancelled());
}

bool StreamTransport::set_interrupt(std::function<void()> interrupt) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disconnected_during_operation_ || (active_control_ && active_control_->is_cancelled())) {
        return false;
    }
    interrupt_ = std::move(interrupt);
    return true;
}

void StreamTransport::adopt(std::shared_ptr<ByteStream> stream, Peer peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_ = std::move(stream);
    peer_ = std::move(peer);
}

} // namespace nearshare::transport
