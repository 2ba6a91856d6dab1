#pragma once

#include "nearshare/transport/byte_stream.hpp"
#include <boost/system/error_code.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace nearshare::transport {

struct RadioDevice {
    std::string address;
    std::string name;
};

struct RadioScanEvent {
    enum class Type {
        FOUND,
        FINISHED,
        FAILED
    };

    Type type;
    RadioDevice device;
    std::string message;
};

using RadioScanListener = std::function<void(const RadioScanEvent&)>;

// Platform side of the short-range radio medium.
class RadioAdapter {
public:
    virtual ~RadioAdapter() = default;

    virtual bool is_present() const = 0;
    virtual bool is_powered() const = 0;

    // Events may arrive on any thread until cancel_scan() returns.
    virtual bool start_scan(RadioScanListener listener) = 0;
    virtual void cancel_scan() = 0;

    // Both calls give up early once should_abort() returns true.
    virtual std::shared_ptr<ByteStream> open_channel(const std::string& address,
                                                     std::chrono::milliseconds timeout,
                                                     const std::function<bool()>& should_abort,
                                                     boost::system::error_code& ec) = 0;

    // Waits for a remote device to open a channel.
    virtual std::shared_ptr<ByteStream> accept_channel(std::chrono::milliseconds timeout,
                                                       const std::function<bool()>& should_abort,
                                                       RadioDevice& remote,
                                                       boost::system::error_code& ec) = 0;
};

} // namespace nearshare::transport
