#pragma once

#include "nearshare/transport/byte_stream.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>

namespace nearshare::network {

// Blocking ByteStream over any Boost.Asio stream. Every operation runs the
// stream's private io_context, optionally bounded by a deadline; close() from
// another thread stops that io_context and aborts the operation in flight.
template<typename Stream>
class SocketStream : public transport::ByteStream {
public:
    explicit SocketStream(std::chrono::milliseconds io_timeout = std::chrono::milliseconds::zero())
        : io_context_()
        , stream_(io_context_)
        , io_timeout_(io_timeout) {
    }

    ~SocketStream() override {
        boost::system::error_code ignored;
        stream_.close(ignored);
    }

    SocketStream(const SocketStream&) = delete;
    SocketStream& operator=(const SocketStream&) = delete;

    Stream& stream() { return stream_; }
    boost::asio::io_context& context() { return io_context_; }

    void set_remote_description(std::string description) { remote_description_ = std::move(description); }
    void set_io_timeout(std::chrono::milliseconds timeout) { io_timeout_ = timeout; }

    std::size_t read_some(std::span<std::uint8_t> buffer, boost::system::error_code& ec) override {
        std::size_t transferred = 0;
        run_operation(
            [&](auto handler) {
                stream_.async_read_some(boost::asio::buffer(buffer.data(), buffer.size()),
                    [handler, &transferred](const boost::system::error_code& e, std::size_t n) {
                        transferred = n;
                        handler(e);
                    });
            },
            [this] { cancel_stream(); },
            io_timeout_, ec);
        return transferred;
    }

    void write_all(std::span<const std::uint8_t> data, boost::system::error_code& ec) override {
        run_operation(
            [&](auto handler) {
                boost::asio::async_write(stream_, boost::asio::buffer(data.data(), data.size()),
                    [handler](const boost::system::error_code& e, std::size_t) {
                        handler(e);
                    });
            },
            [this] { cancel_stream(); },
            io_timeout_, ec);
    }

    template<typename Endpoint>
    void connect(const Endpoint& endpoint, std::chrono::milliseconds timeout, boost::system::error_code& ec) {
        run_operation(
            [&](auto handler) {
                stream_.async_connect(endpoint, [handler](const boost::system::error_code& e) {
                    handler(e);
                });
            },
            [this] {
                boost::system::error_code ignored;
                stream_.close(ignored);
            },
            timeout, ec);
    }

    // The acceptor must be bound to context().
    template<typename Acceptor>
    void accept_from(Acceptor& acceptor, std::chrono::milliseconds timeout, boost::system::error_code& ec) {
        run_operation(
            [&](auto handler) {
                acceptor.async_accept(stream_, [handler](const boost::system::error_code& e) {
                    handler(e);
                });
            },
            [&acceptor] {
                boost::system::error_code ignored;
                acceptor.close(ignored);
            },
            timeout, ec);
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        if (running_) {
            io_context_.stop();
        } else {
            boost::system::error_code ignored;
            stream_.close(ignored);
        }
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return !closed_ && stream_.is_open();
    }

    std::string remote_description() const override {
        return remote_description_;
    }

private:
    using Handler = std::function<void(const boost::system::error_code&)>;

    template<typename Start, typename Cancel>
    void run_operation(Start&& start, Cancel&& cancel, std::chrono::milliseconds timeout,
                       boost::system::error_code& ec) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                ec = boost::asio::error::bad_descriptor;
                return;
            }
            running_ = true;
            io_context_.restart();
        }

        bool done = false;
        boost::system::error_code result = boost::asio::error::would_block;
        start(Handler([&done, &result](const boost::system::error_code& e) {
            result = e;
            done = true;
        }));

        if (timeout > std::chrono::milliseconds::zero()) {
            io_context_.run_for(timeout);
        } else {
            io_context_.run();
        }

        bool aborted = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            aborted = closed_;
        }

        if (!done) {
            cancel();
            if (aborted) {
                boost::system::error_code ignored;
                stream_.close(ignored);
            }
            io_context_.restart();
            io_context_.run();
            result = aborted ? boost::asio::error::operation_aborted : boost::asio::error::timed_out;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
            if (closed_) {
                boost::system::error_code ignored;
                stream_.close(ignored);
            }
        }

        ec = result;
    }

    void cancel_stream() {
        boost::system::error_code ignored;
        stream_.cancel(ignored);
    }

    boost::asio::io_context io_context_;
    Stream stream_;
    std::chrono::milliseconds io_timeout_;
    std::string remote_description_;

    mutable std::mutex mutex_;
    bool running_ = false;
    bool closed_ = false;
};

using TcpStream = SocketStream<boost::asio::ip::tcp::socket>;
using LocalStream = SocketStream<boost::asio::local::stream_protocol::socket>;
using RfcommStream = SocketStream<boost::asio::generic::stream_protocol::socket>;

} // namespace nearshare::network
