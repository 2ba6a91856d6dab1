#pragma once

#include "nearshare/network/bluez_paths.hpp"
#include "nearshare/transport/radio_adapter.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace nearshare::network {

struct BluezOptions {
    std::string adapter = "hci0";
    std::string service_uuid = bluez::SERIAL_PORT_UUID;
    std::string profile_name = "NearShare";
    std::string profile_path = "/org/nearshare/profile";
    std::chrono::milliseconds io_timeout{0};
};

// Short-range radio through the BlueZ daemon on the system bus. Discovery
// drives org.bluez.Adapter1; RFCOMM channels arrive as file descriptors
// handed to a Profile1 object registered with org.bluez.ProfileManager1,
// both for ConnectProfile() calls and for incoming connections.
class BluezRadioAdapter : public transport::RadioAdapter {
public:
    explicit BluezRadioAdapter(BluezOptions options);
    ~BluezRadioAdapter() override;

    BluezRadioAdapter(const BluezRadioAdapter&) = delete;
    BluezRadioAdapter& operator=(const BluezRadioAdapter&) = delete;

    bool is_present() const override;
    bool is_powered() const override;

    bool start_scan(transport::RadioScanListener listener) override;
    void cancel_scan() override;

    std::shared_ptr<transport::ByteStream> open_channel(const std::string& address,
                                                        std::chrono::milliseconds timeout,
                                                        const std::function<bool()>& should_abort,
                                                        boost::system::error_code& ec) override;

    std::shared_ptr<transport::ByteStream> accept_channel(std::chrono::milliseconds timeout,
                                                          const std::function<bool()>& should_abort,
                                                          transport::RadioDevice& remote,
                                                          boost::system::error_code& ec) override;

private:
    struct Bus;
    struct Callbacks;

    struct Channel {
        int fd = -1;
        transport::RadioDevice device;
    };

    struct PendingConnect {
        std::string address;
        std::optional<Channel> channel;
        boost::system::error_code error;
        bool replied = false;
    };

    bool open_bus();
    void close_bus();
    void run_loop();
    void dispatch_scan_events();
    bool read_powered(bool& powered) const;
    std::shared_ptr<transport::ByteStream> make_stream(Channel channel, boost::system::error_code& ec) const;

    // Called with the bus lock held.
    void on_device_seen(const std::string& path, const transport::RadioDevice& seen);
    void on_discovery_stopped();
    bool on_new_connection(const std::string& device_path, int fd);
    void on_connect_reply(boost::system::error_code ec);

    BluezOptions options_;
    std::string adapter_path_;

    std::unique_ptr<Bus> bus_;
    mutable std::mutex bus_mutex_;
    std::atomic<bool> running_{false};
    std::thread loop_;

    std::recursive_mutex dispatch_mutex_;
    std::mutex state_mutex_;
    std::condition_variable state_cv_;
    transport::RadioScanListener listener_;
    bool scanning_ = false;
    std::vector<transport::RadioScanEvent> scan_events_;
    std::map<std::string, transport::RadioDevice> known_devices_;
    std::shared_ptr<PendingConnect> pending_connect_;
    bool accepting_ = false;
    std::deque<Channel> incoming_;
};

} // namespace nearshare::network
