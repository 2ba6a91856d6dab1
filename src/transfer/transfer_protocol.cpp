#include "nearshare/transfer/transfer_protocol.hpp"
#include "nearshare/core/logger.hpp"
#include <boost/asio/error.hpp>
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace nearshare::transfer {

using core::Result;
using core::TransferError;

TransferProtocol::TransferProtocol(ProtocolOptions options,
                                   std::shared_ptr<storage::ContentResolver> resolver,
                                   storage::StorageConfig storage)
    : options_(options)
    , resolver_(std::move(resolver))
    , storage_(std::move(storage)) {
    if (options_.chunk_size == 0) {
        options_.chunk_size = 1024;
    }
}

Result<void> TransferProtocol::send_file(transport::ByteStream& stream,
                                         const storage::TransferableFile& file,
                                         const ProgressCallback& on_progress,
                                         TransferControl& control) {
    if (!resolver_) {
        return TransferError::file_io("No content resolver configured");
    }

    auto input = resolver_->open(file);
    if (!input) {
        return TransferError::file_io("Cannot open " + file.name + " for reading");
    }

    FrameHeader header;
    header.name = file.safe_name();
    header.size = file.size_bytes;
    header.mime_type = file.mime_type.value_or("");

    std::vector<std::uint8_t> encoded;
    try {
        encoded = header.serialize();
    } catch (const std::exception& e) {
        return TransferError::file_io("Cannot encode frame for " + header.name, std::string(e.what()));
    }

    LOG_INFO("Sending {} ({} bytes)", header.name, header.size);

    boost::system::error_code ec;
    stream.write_all(encoded, ec);
    if (ec) {
        return stream_error(ec, control, "Failed to send file header");
    }

    ProgressMeter meter(header.name, header.size, options_.progress_interval, on_progress);
    std::vector<std::uint8_t> buffer(options_.chunk_size);
    std::int64_t sent = 0;

    while (sent < header.size) {
        if (!control.wait_while_paused()) {
            meter.flush();
            return TransferError::connection_lost("Transfer cancelled");
        }

        auto want = static_cast<std::size_t>(
            std::min<std::int64_t>(static_cast<std::int64_t>(buffer.size()), header.size - sent));
        input->read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(want));
        auto got = static_cast<std::size_t>(input->gcount());

        if (got == 0) {
            meter.flush();
            if (input->bad()) {
                return TransferError::file_io("Failed to read " + header.name);
            }
            return TransferError::file_io("Source ended before its declared size",
                                          header.name + ": " + std::to_string(sent) + " of " +
                                          std::to_string(header.size) + " bytes");
        }

        stream.write_all(std::span<const std::uint8_t>(buffer.data(), got), ec);
        if (ec) {
            meter.flush();
            return stream_error(ec, control, "Failed to send " + header.name);
        }

        sent += static_cast<std::int64_t>(got);
        meter.update(sent);
    }

    meter.finish();
    LOG_INFO("Sent {} ({} bytes)", header.name, sent);
    return Result<void>::ok();
}

Result<std::optional<storage::TransferableFile>> TransferProtocol::receive_file(
    transport::ByteStream& stream,
    const ProgressCallback& on_progress,
    TransferControl& control) {

    using Received = std::optional<storage::TransferableFile>;

    bool end_of_batch = false;
    auto header_result = read_header(stream, control, end_of_batch);
    if (end_of_batch) {
        LOG_DEBUG("Sender closed the stream at a frame boundary");
        return Received{};
    }
    if (!header_result) {
        return header_result.error();
    }

    auto header = std::move(header_result).value();
    auto safe_name = storage::sanitize_file_name(header.name);

    if (!storage_.create_directories()) {
        return TransferError::file_io("Cannot create download directory",
                                      storage_.download_directory.string());
    }
    if (!storage_.has_sufficient_space(static_cast<std::uint64_t>(header.size))) {
        return TransferError::file_io("Not enough space for " + safe_name);
    }

    auto destination = storage_.resolve_destination(safe_name);
    std::ofstream output(destination, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        return TransferError::file_io("Cannot create " + destination.string());
    }

    auto stored_name = destination.filename().string();
    LOG_INFO("Receiving {} ({} bytes) into {}", safe_name, header.size, destination.string());

    ProgressMeter meter(stored_name, header.size, options_.progress_interval, on_progress);
    std::vector<std::uint8_t> buffer(options_.chunk_size);
    std::int64_t received = 0;
    boost::system::error_code ec;

    while (received < header.size) {
        if (!control.wait_while_paused()) {
            meter.flush();
            return TransferError::connection_lost("Transfer cancelled");
        }

        auto want = static_cast<std::size_t>(
            std::min<std::int64_t>(static_cast<std::int64_t>(buffer.size()), header.size - received));
        auto got = stream.read_some(std::span<std::uint8_t>(buffer.data(), want), ec);
        if (ec || got == 0) {
            output.flush();
            meter.flush();
            if (!ec) {
                ec = boost::asio::error::eof;
            }
            return stream_error(ec, control,
                                "Stream closed after " + std::to_string(received) + " of " +
                                std::to_string(header.size) + " bytes of " + safe_name);
        }

        output.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(got));
        if (!output) {
            meter.flush();
            return TransferError::file_io("Failed to write " + destination.string());
        }

        received += static_cast<std::int64_t>(got);
        meter.update(received);
    }

    output.close();
    if (output.fail()) {
        return TransferError::file_io("Failed to finalize " + destination.string());
    }

    meter.finish();
    LOG_INFO("Received {} ({} bytes)", safe_name, received);

    storage::TransferableFile file;
    file.handle = destination.string();
    file.name = stored_name;
    file.size_bytes = header.size;
    file.mime_type = header.mime_type.empty() ? std::string(storage::DEFAULT_MIME_TYPE) : header.mime_type;
    return Received{std::move(file)};
}

TransferProtocol::ReadOutcome TransferProtocol::read_exact(transport::ByteStream& stream,
                                                           std::span<std::uint8_t> buffer,
                                                           boost::system::error_code& ec) {
    std::size_t filled = 0;
    while (filled < buffer.size()) {
        auto got = stream.read_some(buffer.subspan(filled), ec);
        if (ec || got == 0) {
            if (!ec) {
                ec = boost::asio::error::eof;
            }
            return filled == 0 && ec == boost::asio::error::eof ? ReadOutcome::CLEAN_EOF
                                                                : ReadOutcome::FAILED;
        }
        filled += got;
    }
    return ReadOutcome::COMPLETE;
}

Result<FrameHeader> TransferProtocol::read_header(transport::ByteStream& stream,
                                                  TransferControl& control,
                                                  bool& end_of_batch) {
    end_of_batch = false;
    if (!control.wait_while_paused()) {
        return TransferError::connection_lost("Transfer cancelled");
    }

    std::vector<std::uint8_t> raw(2);
    boost::system::error_code ec;

    auto outcome = read_exact(stream, raw, ec);
    if (outcome == ReadOutcome::CLEAN_EOF && !control.is_cancelled()) {
        end_of_batch = true;
        return TransferError::connection_lost("End of stream");
    }
    if (outcome != ReadOutcome::COMPLETE) {
        return stream_error(ec, control, "Failed to read file header");
    }

    std::size_t name_length = (static_cast<std::size_t>(raw[0]) << 8) | raw[1];
    raw.resize(2 + name_length + 8 + 2);
    if (read_exact(stream, std::span<std::uint8_t>(raw).subspan(2), ec) != ReadOutcome::COMPLETE) {
        return stream_error(ec, control, "Truncated file header");
    }

    std::size_t mime_length = (static_cast<std::size_t>(raw[raw.size() - 2]) << 8) | raw.back();
    auto fixed_size = raw.size();
    raw.resize(fixed_size + mime_length);
    if (mime_length > 0 &&
        read_exact(stream, std::span<std::uint8_t>(raw).subspan(fixed_size), ec) != ReadOutcome::COMPLETE) {
        return stream_error(ec, control, "Truncated file header");
    }

    try {
        std::span<const std::uint8_t> view(raw);
        return FrameHeader::deserialize(view);
    } catch (const std::exception& e) {
        return TransferError::unknown("Malformed file header", std::string(e.what()));
    }
}

TransferError TransferProtocol::stream_error(const boost::system::error_code& ec,
                                             const TransferControl& control,
                                             const std::string& context) {
    if (control.is_cancelled()) {
        return TransferError::connection_lost("Transfer cancelled");
    }
    if (ec == boost::asio::error::timed_out) {
        return TransferError::timeout(context + ": timed out");
    }
    return TransferError::connection_lost(context, ec.message());
}

} // namespace nearshare::transfer
