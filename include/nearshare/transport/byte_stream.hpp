#pragma once

#include <boost/system/error_code.hpp>
#include <span>
#include <string>
#include <cstdint>
#include <cstddef>

namespace nearshare::transport {

// An established, bidirectional byte stream handed out by a Transport.
// read_some/write_all block the calling worker; close() may be called from
// any thread and aborts an operation in flight.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Returns 0 with ec set on end of stream or failure.
    virtual std::size_t read_some(std::span<std::uint8_t> buffer, boost::system::error_code& ec) = 0;
    virtual void write_all(std::span<const std::uint8_t> data, boost::system::error_code& ec) = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;
    virtual std::string remote_description() const = 0;
};

} // namespace nearshare::transport
