#pragma once

#include "nearshare/core/result.hpp"
#include "nearshare/storage/content_resolver.hpp"
#include "nearshare/storage/storage_config.hpp"
#include "nearshare/storage/transferable_file.hpp"
#include "nearshare/transfer/frame_codec.hpp"
#include "nearshare/transfer/progress_meter.hpp"
#include "nearshare/transfer/transfer_control.hpp"
#include "nearshare/transport/byte_stream.hpp"
#include <chrono>
#include <memory>
#include <optional>

namespace nearshare::transfer {

struct ProtocolOptions {
    std::size_t chunk_size = 65536;
    std::chrono::milliseconds progress_interval{100};
};

// Frames and streams one file per call over an established ByteStream.
// Chunking is local to each side; the receiver reads exactly `size` bytes.
class TransferProtocol {
public:
    TransferProtocol(ProtocolOptions options,
                     std::shared_ptr<storage::ContentResolver> resolver,
                     storage::StorageConfig storage);

    core::Result<void> send_file(transport::ByteStream& stream,
                                 const storage::TransferableFile& file,
                                 const ProgressCallback& on_progress,
                                 TransferControl& control);

    // std::nullopt when the sender closed the stream cleanly before a new frame.
    core::Result<std::optional<storage::TransferableFile>> receive_file(
        transport::ByteStream& stream,
        const ProgressCallback& on_progress,
        TransferControl& control);

    const ProtocolOptions& options() const { return options_; }
    const storage::StorageConfig& storage() const { return storage_; }

private:
    enum class ReadOutcome {
        COMPLETE,
        CLEAN_EOF,
        FAILED
    };

    ReadOutcome read_exact(transport::ByteStream& stream, std::span<std::uint8_t> buffer,
                           boost::system::error_code& ec);

    core::Result<FrameHeader> read_header(transport::ByteStream& stream, TransferControl& control,
                                          bool& end_of_batch);

    static core::TransferError stream_error(const boost::system::error_code& ec,
                                            const TransferControl& control,
                                            const std::string& context);

    ProtocolOptions options_;
    std::shared_ptr<storage::ContentResolver> resolver_;
    storage::StorageConfig storage_;
};

} // namespace nearshare::transfer
