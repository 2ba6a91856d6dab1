#include "nearshare/network/bluez_radio_adapter.hpp"
#include "nearshare/core/logger.hpp"
#include "nearshare/network/socket_stream.hpp"
#include <systemd/sd-bus.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace nearshare::network {

using transport::RadioDevice;
using transport::RadioScanEvent;

namespace {
    constexpr int RFCOMM_PROTOCOL = 3;
    constexpr std::uint64_t WAIT_USEC = 100000;
    constexpr std::chrono::milliseconds WAIT_SLICE{50};

    constexpr const char* OBJECT_MANAGER_INTERFACE = "org.freedesktop.DBus.ObjectManager";
    constexpr const char* PROPERTIES_INTERFACE = "org.freedesktop.DBus.Properties";

    struct Properties {
        std::optional<std::string> address;
        std::optional<std::string> name;
        std::optional<std::string> alias;
        std::optional<bool> discovering;
        bool rssi = false;
    };

    boost::system::error_code errno_code(int error) {
        return boost::system::error_code(error, boost::system::system_category());
    }

    void unref_slot(sd_bus_slot*& slot) {
        if (slot) {
            slot = sd_bus_slot_unref(slot);
        }
    }

    // Positioned at an a{sv}; keeps the entries the adapter cares about.
    int read_properties(sd_bus_message* m, Properties& props) {
        int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
        if (r < 0) {
            return r;
        }
        while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0) {
            const char* key = nullptr;
            r = sd_bus_message_read(m, "s", &key);
            if (r < 0) {
                return r;
            }

            const char* text = nullptr;
            int flag = 0;
            if (std::strcmp(key, "Address") == 0 || std::strcmp(key, "Name") == 0 ||
                std::strcmp(key, "Alias") == 0) {
                r = sd_bus_message_read(m, "v", "s", &text);
                if (r >= 0) {
                    auto& target = key[0] == 'N' ? props.name : key[1] == 'd' ? props.address : props.alias;
                    target = std::string(text);
                }
            } else if (std::strcmp(key, "Discovering") == 0) {
                r = sd_bus_message_read(m, "v", "b", &flag);
                if (r >= 0) {
                    props.discovering = flag != 0;
                }
            } else {
                props.rssi = props.rssi || std::strcmp(key, "RSSI") == 0;
                r = sd_bus_message_skip(m, "v");
            }
            if (r < 0) {
                return r;
            }

            r = sd_bus_message_exit_container(m);
            if (r < 0) {
                return r;
            }
        }
        if (r < 0) {
            return r;
        }
        return sd_bus_message_exit_container(m);
    }

    // Positioned at an a{sa{sv}}; fills props from org.bluez.Device1 if present.
    int read_interfaces(sd_bus_message* m, Properties& props, bool& has_device) {
        has_device = false;
        int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sa{sv}}");
        if (r < 0) {
            return r;
        }
        while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0) {
            const char* interface = nullptr;
            r = sd_bus_message_read(m, "s", &interface);
            if (r < 0) {
                return r;
            }
            if (std::strcmp(interface, bluez::DEVICE_INTERFACE) == 0) {
                has_device = true;
                r = read_properties(m, props);
            } else {
                r = sd_bus_message_skip(m, "a{sv}");
            }
            if (r < 0) {
                return r;
            }
            r = sd_bus_message_exit_container(m);
            if (r < 0) {
                return r;
            }
        }
        if (r < 0) {
            return r;
        }
        return sd_bus_message_exit_container(m);
    }

    RadioDevice to_device(const std::string& path, const Properties& props) {
        RadioDevice device;
        if (props.address) {
            device.address = bluez::normalize_address(*props.address).value_or(*props.address);
        } else {
            device.address = bluez::address_from_device_path(path).value_or("");
        }
        device.name = props.name.value_or(props.alias.value_or(""));
        return device;
    }
}

struct BluezRadioAdapter::Bus {
    sd_bus* bus = nullptr;
    sd_bus_slot* profile_slot = nullptr;
    sd_bus_slot* added_slot = nullptr;
    sd_bus_slot* changed_slot = nullptr;
    sd_bus_slot* connect_slot = nullptr;
    bool profile_registered = false;
};

// sd-bus entry points; each runs on the loop thread inside sd_bus_process().
struct BluezRadioAdapter::Callbacks {
    static int release(sd_bus_message* m, void*, sd_bus_error*) {
        LOG_DEBUG("BlueZ released the transfer profile");
        return sd_bus_reply_method_return(m, "");
    }

    static int request_disconnection(sd_bus_message* m, void*, sd_bus_error*) {
        const char* path = nullptr;
        if (sd_bus_message_read(m, "o", &path) >= 0 && path) {
            LOG_DEBUG("BlueZ requested disconnection of {}", path);
        }
        return sd_bus_reply_method_return(m, "");
    }

    static int new_connection(sd_bus_message* m, void* userdata, sd_bus_error* ret_error) {
        auto* self = static_cast<BluezRadioAdapter*>(userdata);
        const char* path = nullptr;
        int fd = -1;
        int r = sd_bus_message_read(m, "oh", &path, &fd);
        if (r < 0) {
            return r;
        }

        // The descriptor belongs to the message.
        int owned = ::fcntl(fd, F_DUPFD_CLOEXEC, 3);
        if (owned < 0) {
            return -errno;
        }

        LOG_DEBUG("New RFCOMM connection from {}", path);
        if (!self->on_new_connection(path, owned)) {
            return sd_bus_error_set(ret_error, "org.bluez.Error.Rejected", "No transfer is waiting for a connection");
        }
        return sd_bus_reply_method_return(m, "");
    }

    static int interfaces_added(sd_bus_message* m, void* userdata, sd_bus_error*) {
        auto* self = static_cast<BluezRadioAdapter*>(userdata);
        const char* path = nullptr;
        if (sd_bus_message_read(m, "o", &path) < 0) {
            return 0;
        }
        Properties props;
        bool has_device = false;
        if (read_interfaces(m, props, has_device) >= 0 && has_device) {
            self->on_device_seen(path, to_device(path, props));
        }
        return 0;
    }

    static int properties_changed(sd_bus_message* m, void* userdata, sd_bus_error*) {
        auto* self = static_cast<BluezRadioAdapter*>(userdata);
        const char* path = sd_bus_message_get_path(m);
        const char* interface = nullptr;
        if (!path || sd_bus_message_read(m, "s", &interface) < 0) {
            return 0;
        }

        Properties props;
        if (read_properties(m, props) < 0) {
            return 0;
        }

        if (std::strcmp(interface, bluez::DEVICE_INTERFACE) == 0) {
            if (props.name || props.alias || props.rssi) {
                self->on_device_seen(path, to_device(path, props));
            }
        } else if (std::strcmp(interface, bluez::ADAPTER_INTERFACE) == 0 && self->adapter_path_ == path) {
            if (props.discovering && !*props.discovering) {
                self->on_discovery_stopped();
            }
        }
        return 0;
    }

    static int connect_reply(sd_bus_message* m, void* userdata, sd_bus_error*) {
        auto* self = static_cast<BluezRadioAdapter*>(userdata);
        boost::system::error_code ec;
        if (const sd_bus_error* error = sd_bus_message_get_error(m)) {
            LOG_WARN("ConnectProfile failed: {} ({})", error->message ? error->message : "",
                     error->name ? error->name : "");
            int code = sd_bus_error_get_errno(error);
            ec = errno_code(code > 0 ? code : ECONNREFUSED);
        }
        self->on_connect_reply(ec);
        return 0;
    }

    static const sd_bus_vtable* profile_vtable() {
        static const sd_bus_vtable vtable[] = {
            SD_BUS_VTABLE_START(0),
            SD_BUS_METHOD("Release", "", "", &Callbacks::release, SD_BUS_VTABLE_UNPRIVILEGED),
            SD_BUS_METHOD("NewConnection", "oha{sv}", "", &Callbacks::new_connection, SD_BUS_VTABLE_UNPRIVILEGED),
            SD_BUS_METHOD("RequestDisconnection", "o", "", &Callbacks::request_disconnection,
                          SD_BUS_VTABLE_UNPRIVILEGED),
            SD_BUS_VTABLE_END
        };
        return vtable;
    }
};

BluezRadioAdapter::BluezRadioAdapter(BluezOptions options)
    : options_(std::move(options))
    , adapter_path_(bluez::adapter_path(options_.adapter))
    , bus_(std::make_unique<Bus>()) {
    if (!open_bus()) {
        close_bus();
        bus_.reset();
        return;
    }
    running_ = true;
    loop_ = std::thread([this]() { run_loop(); });
}

BluezRadioAdapter::~BluezRadioAdapter() {
    cancel_scan();

    if (bus_) {
        running_ = false;
        {
            std::lock_guard<std::mutex> lock(bus_mutex_);
            if (bus_->profile_registered) {
                sd_bus_error err = SD_BUS_ERROR_NULL;
                sd_bus_call_method(bus_->bus, bluez::SERVICE, bluez::PROFILE_MANAGER_PATH,
                                   bluez::PROFILE_MANAGER_INTERFACE, "UnregisterProfile", &err, nullptr,
                                   "o", options_.profile_path.c_str());
                sd_bus_error_free(&err);
                bus_->profile_registered = false;
            }
            // Wakes the loop thread out of sd_bus_wait().
            sd_bus_close(bus_->bus);
        }
        if (loop_.joinable()) {
            loop_.join();
        }
        close_bus();
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    for (auto& channel : incoming_) {
        ::close(channel.fd);
    }
    incoming_.clear();
}

bool BluezRadioAdapter::open_bus() {
    int r = sd_bus_open_system(&bus_->bus);
    if (r < 0 || !bus_->bus) {
        LOG_WARN("Cannot connect to the system bus: {}", std::strerror(-r));
        return false;
    }

    r = sd_bus_add_object_vtable(bus_->bus, &bus_->profile_slot, options_.profile_path.c_str(),
                                 bluez::PROFILE_INTERFACE, Callbacks::profile_vtable(), this);
    if (r < 0) {
        LOG_ERROR("Cannot export the transfer profile object: {}", std::strerror(-r));
        return false;
    }

    sd_bus_error err = SD_BUS_ERROR_NULL;
    r = sd_bus_call_method(bus_->bus, bluez::SERVICE, bluez::PROFILE_MANAGER_PATH,
                           bluez::PROFILE_MANAGER_INTERFACE, "RegisterProfile", &err, nullptr,
                           "osa{sv}", options_.profile_path.c_str(), options_.service_uuid.c_str(), 4,
                           "Name", "s", options_.profile_name.c_str(),
                           "RequireAuthentication", "b", 0,
                           "RequireAuthorization", "b", 0,
                           "AutoConnect", "b", 0);
    if (r < 0) {
        // Discovery still works without the profile; channels do not.
        LOG_WARN("RegisterProfile {} failed: {}", options_.service_uuid,
                 err.message ? err.message : std::strerror(-r));
    } else {
        bus_->profile_registered = true;
        LOG_INFO("Registered RFCOMM profile {} at {}", options_.service_uuid, options_.profile_path);
    }
    sd_bus_error_free(&err);
    return true;
}

void BluezRadioAdapter::close_bus() {
    if (!bus_) {
        return;
    }
    unref_slot(bus_->added_slot);
    unref_slot(bus_->changed_slot);
    unref_slot(bus_->connect_slot);
    unref_slot(bus_->profile_slot);
    if (bus_->bus) {
        bus_->bus = sd_bus_flush_close_unref(bus_->bus);
    }
}

void BluezRadioAdapter::run_loop() {
    while (running_) {
        {
            std::lock_guard<std::mutex> lock(bus_mutex_);
            while (sd_bus_process(bus_->bus, nullptr) > 0) {
            }
        }
        dispatch_scan_events();

        // The lock stays free while waiting so callers can issue method calls.
        if (sd_bus_wait(bus_->bus, WAIT_USEC) < 0 && running_) {
            std::this_thread::sleep_for(std::chrono::microseconds(WAIT_USEC));
        }
    }
}

void BluezRadioAdapter::dispatch_scan_events() {
    std::lock_guard<std::recursive_mutex> dispatch(dispatch_mutex_);
    std::vector<RadioScanEvent> events;
    transport::RadioScanListener listener;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!scanning_ || scan_events_.empty()) {
            return;
        }
        events.swap(scan_events_);
        listener = listener_;
    }
    for (const auto& event : events) {
        listener(event);
    }
}

bool BluezRadioAdapter::read_powered(bool& powered) const {
    if (!bus_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(bus_mutex_);
    sd_bus_error err = SD_BUS_ERROR_NULL;
    int value = 0;
    int r = sd_bus_get_property_trivial(bus_->bus, bluez::SERVICE, adapter_path_.c_str(),
                                        bluez::ADAPTER_INTERFACE, "Powered", &err, 'b', &value);
    sd_bus_error_free(&err);
    powered = value != 0;
    return r >= 0;
}

bool BluezRadioAdapter::is_present() const {
    bool powered = false;
    return read_powered(powered);
}

bool BluezRadioAdapter::is_powered() const {
    bool powered = false;
    return read_powered(powered) && powered;
}

bool BluezRadioAdapter::start_scan(transport::RadioScanListener listener) {
    if (!bus_) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        listener_ = std::move(listener);
        scanning_ = true;
        scan_events_.clear();
    }

    std::lock_guard<std::mutex> lock(bus_mutex_);
    int r = sd_bus_match_signal(bus_->bus, &bus_->added_slot, bluez::SERVICE, "/",
                                OBJECT_MANAGER_INTERFACE, "InterfacesAdded",
                                &Callbacks::interfaces_added, this);
    if (r >= 0) {
        r = sd_bus_match_signal(bus_->bus, &bus_->changed_slot, bluez::SERVICE, nullptr,
                                PROPERTIES_INTERFACE, "PropertiesChanged",
                                &Callbacks::properties_changed, this);
    }
    if (r < 0) {
        LOG_ERROR("Cannot subscribe to BlueZ signals: {}", std::strerror(-r));
        unref_slot(bus_->added_slot);
        unref_slot(bus_->changed_slot);
        std::lock_guard<std::mutex> state(state_mutex_);
        scanning_ = false;
        listener_ = nullptr;
        return false;
    }

    // Devices BlueZ already knows are reported before the fresh ones.
    sd_bus_error err = SD_BUS_ERROR_NULL;
    sd_bus_message* reply = nullptr;
    r = sd_bus_call_method(bus_->bus, bluez::SERVICE, "/", OBJECT_MANAGER_INTERFACE, "GetManagedObjects",
                           &err, &reply, "");
    if (r >= 0 && sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}") >= 0) {
        while (sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}") > 0) {
            const char* path = nullptr;
            Properties props;
            bool has_device = false;
            if (sd_bus_message_read(reply, "o", &path) < 0 || read_interfaces(reply, props, has_device) < 0) {
                break;
            }
            if (has_device && bluez::belongs_to_adapter(adapter_path_, path)) {
                on_device_seen(path, to_device(path, props));
            }
            if (sd_bus_message_exit_container(reply) < 0) {
                break;
            }
        }
    } else if (r < 0) {
        LOG_WARN("GetManagedObjects failed: {}", err.message ? err.message : std::strerror(-r));
    }
    if (reply) {
        sd_bus_message_unref(reply);
    }
    sd_bus_error_free(&err);

    err = SD_BUS_ERROR_NULL;
    r = sd_bus_call_method(bus_->bus, bluez::SERVICE, adapter_path_.c_str(), bluez::ADAPTER_INTERFACE,
                           "StartDiscovery", &err, nullptr, "");
    bool started = r >= 0 || sd_bus_error_has_name(&err, "org.bluez.Error.InProgress");
    if (!started) {
        LOG_ERROR("StartDiscovery on {} failed: {}", adapter_path_, err.message ? err.message : std::strerror(-r));
        unref_slot(bus_->added_slot);
        unref_slot(bus_->changed_slot);
        std::lock_guard<std::mutex> state(state_mutex_);
        scanning_ = false;
        listener_ = nullptr;
        scan_events_.clear();
    } else {
        LOG_DEBUG("Discovery started on {}", adapter_path_);
    }
    sd_bus_error_free(&err);
    return started;
}

void BluezRadioAdapter::cancel_scan() {
    std::lock_guard<std::recursive_mutex> dispatch(dispatch_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!scanning_) {
            return;
        }
        scanning_ = false;
        listener_ = nullptr;
        scan_events_.clear();
    }

    std::lock_guard<std::mutex> lock(bus_mutex_);
    unref_slot(bus_->added_slot);
    unref_slot(bus_->changed_slot);

    sd_bus_error err = SD_BUS_ERROR_NULL;
    int r = sd_bus_call_method(bus_->bus, bluez::SERVICE, adapter_path_.c_str(), bluez::ADAPTER_INTERFACE,
                               "StopDiscovery", &err, nullptr, "");
    if (r < 0) {
        LOG_DEBUG("StopDiscovery on {}: {}", adapter_path_, err.message ? err.message : std::strerror(-r));
    }
    sd_bus_error_free(&err);
}

std::shared_ptr<transport::ByteStream> BluezRadioAdapter::open_channel(const std::string& address,
                                                                       std::chrono::milliseconds timeout,
                                                                       const std::function<bool()>& should_abort,
                                                                       boost::system::error_code& ec) {
    if (!bus_ || !bus_->profile_registered) {
        ec = boost::asio::error::not_connected;
        return nullptr;
    }
    auto normalized = bluez::normalize_address(address);
    auto path = bluez::device_path(adapter_path_, address);
    if (!normalized || !path) {
        ec = boost::asio::error::invalid_argument;
        return nullptr;
    }

    auto pending = std::make_shared<PendingConnect>();
    pending->address = *normalized;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (pending_connect_) {
            ec = boost::asio::error::in_progress;
            return nullptr;
        }
        pending_connect_ = pending;
    }

    int r = 0;
    {
        std::lock_guard<std::mutex> lock(bus_mutex_);
        unref_slot(bus_->connect_slot);
        r = sd_bus_call_method_async(bus_->bus, &bus_->connect_slot, bluez::SERVICE, path->c_str(),
                                     bluez::DEVICE_INTERFACE, "ConnectProfile",
                                     &Callbacks::connect_reply, this, "s", options_.service_uuid.c_str());
    }
    if (r < 0) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pending_connect_.reset();
        ec = errno_code(-r);
        return nullptr;
    }

    LOG_DEBUG("ConnectProfile {} on {}", options_.service_uuid, *path);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::optional<Channel> channel;
    {
        std::unique_lock<std::mutex> lock(state_mutex_);
        while (true) {
            state_cv_.wait_for(lock, WAIT_SLICE, [&pending]() {
                return pending->channel.has_value() || (pending->replied && pending->error);
            });
            if (pending->channel) {
                channel = std::move(pending->channel);
                break;
            }
            if (pending->replied && pending->error) {
                ec = pending->error;
                break;
            }
            if (timeout > std::chrono::milliseconds::zero() && std::chrono::steady_clock::now() >= deadline) {
                ec = boost::asio::error::timed_out;
                break;
            }
            lock.unlock();
            bool abort = should_abort && should_abort();
            lock.lock();
            if (abort) {
                ec = boost::asio::error::operation_aborted;
                break;
            }
        }
        pending_connect_.reset();
    }

    {
        std::lock_guard<std::mutex> lock(bus_mutex_);
        unref_slot(bus_->connect_slot);
    }

    if (!channel) {
        return nullptr;
    }
    ec.clear();
    return make_stream(std::move(*channel), ec);
}

std::shared_ptr<transport::ByteStream> BluezRadioAdapter::accept_channel(std::chrono::milliseconds timeout,
                                                                         const std::function<bool()>& should_abort,
                                                                         RadioDevice& remote,
                                                                         boost::system::error_code& ec) {
    if (!bus_ || !bus_->profile_registered) {
        ec = boost::asio::error::not_connected;
        return nullptr;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::optional<Channel> channel;
    {
        std::unique_lock<std::mutex> lock(state_mutex_);
        accepting_ = true;
        while (true) {
            state_cv_.wait_for(lock, WAIT_SLICE, [this]() { return !incoming_.empty(); });
            if (!incoming_.empty()) {
                channel = std::move(incoming_.front());
                incoming_.pop_front();
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                ec = boost::asio::error::timed_out;
                break;
            }
            lock.unlock();
            bool abort = should_abort && should_abort();
            lock.lock();
            if (abort) {
                ec = boost::asio::error::operation_aborted;
                break;
            }
        }
        accepting_ = false;
    }

    if (!channel) {
        return nullptr;
    }
    remote = channel->device;
    return make_stream(std::move(*channel), ec);
}

std::shared_ptr<transport::ByteStream> BluezRadioAdapter::make_stream(Channel channel,
                                                                      boost::system::error_code& ec) const {
    auto stream = std::make_shared<RfcommStream>(options_.io_timeout);
    stream->stream().assign(boost::asio::generic::stream_protocol(AF_BLUETOOTH, RFCOMM_PROTOCOL), channel.fd, ec);
    if (ec) {
        LOG_ERROR("Cannot adopt RFCOMM socket from {}: {}", channel.device.address, ec.message());
        ::close(channel.fd);
        return nullptr;
    }
    stream->set_remote_description(channel.device.address);
    return stream;
}

void BluezRadioAdapter::on_device_seen(const std::string& path, const RadioDevice& seen) {
    if (!bluez::belongs_to_adapter(adapter_path_, path) || seen.address.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto& device = known_devices_[seen.address];
    device.address = seen.address;
    if (!seen.name.empty()) {
        device.name = seen.name;
    }
    if (scanning_) {
        scan_events_.push_back({RadioScanEvent::Type::FOUND, device, ""});
    }
}

void BluezRadioAdapter::on_discovery_stopped() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (scanning_) {
        LOG_INFO("Discovery on {} was stopped outside this session", adapter_path_);
        scan_events_.push_back({RadioScanEvent::Type::FINISHED, {}, ""});
    }
}

bool BluezRadioAdapter::on_new_connection(const std::string& device_path, int fd) {
    Channel channel;
    channel.fd = fd;
    channel.device.address = bluez::address_from_device_path(device_path).value_or(device_path);

    std::lock_guard<std::mutex> lock(state_mutex_);
    auto known = known_devices_.find(channel.device.address);
    if (known != known_devices_.end()) {
        channel.device.name = known->second.name;
    }

    if (pending_connect_ && !pending_connect_->channel && pending_connect_->address == channel.device.address) {
        pending_connect_->channel = std::move(channel);
        state_cv_.notify_all();
        return true;
    }
    if (accepting_) {
        incoming_.push_back(std::move(channel));
        state_cv_.notify_all();
        return true;
    }

    LOG_WARN("Rejecting RFCOMM connection from {}: no transfer is waiting", channel.device.address);
    ::close(fd);
    return false;
}

void BluezRadioAdapter::on_connect_reply(boost::system::error_code ec) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (pending_connect_) {
        pending_connect_->replied = true;
        pending_connect_->error = ec;
    }
    state_cv_.notify_all();
}

} // namespace nearshare::network
