#include <gtest/gtest.h>
#include "state_recorder.hpp"
#include "nearshare/network/socket_stream.hpp"
#include "nearshare/session/transfer_coordinator.hpp"
#include "nearshare/storage/content_resolver.hpp"
#include "nearshare/transport/radio_transport.hpp"
#include <boost/asio/error.hpp>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <thread>

using namespace nearshare;
using namespace std::chrono_literals;
using nearshare::test_support::StateRecorder;
using session::Phase;
using transport::RadioDevice;
namespace state = transfer::state;

namespace {

// Paces writes so a transfer stays in flight long enough to be interrupted.
class PacedStream : public transport::ByteStream {
public:
    PacedStream(std::shared_ptr<transport::ByteStream> inner, std::chrono::microseconds delay)
        : inner_(std::move(inner)), delay_(delay) {}

    std::size_t read_some(std::span<std::uint8_t> buffer, boost::system::error_code& ec) override {
        return inner_->read_some(buffer, ec);
    }

    void write_all(std::span<const std::uint8_t> data, boost::system::error_code& ec) override {
        std::this_thread::sleep_for(delay_);
        inner_->write_all(data, ec);
    }

    void close() override { inner_->close(); }
    bool is_open() const override { return inner_->is_open(); }
    std::string remote_description() const override { return inner_->remote_description(); }

private:
    std::shared_ptr<transport::ByteStream> inner_;
    std::chrono::microseconds delay_;
};

// Stands in for the air between radio adapters: devices that are in range
// and the channels waiting to be accepted by each of them.
class Airspace {
public:
    void add(const RadioDevice& device) {
        std::lock_guard<std::mutex> lock(mutex_);
        devices_[device.address] = device;
    }

    std::vector<RadioDevice> devices_except(const std::string& address) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<RadioDevice> result;
        for (const auto& [addr, device] : devices_) {
            if (addr != address) {
                result.push_back(device);
            }
        }
        return result;
    }

    bool knows(const std::string& address) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return devices_.count(address) > 0;
    }

    void deliver(const std::string& to, std::shared_ptr<transport::ByteStream> stream, const RadioDevice& from) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_[to].emplace_back(std::move(stream), from);
        }
        cv_.notify_all();
    }

    std::shared_ptr<transport::ByteStream> take(const std::string& address, std::chrono::milliseconds wait,
                                                RadioDevice& from) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, wait, [&] { return !pending_[address].empty(); })) {
            return nullptr;
        }
        auto [stream, device] = std::move(pending_[address].front());
        pending_[address].pop_front();
        from = device;
        return stream;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, RadioDevice> devices_;
    std::map<std::string, std::deque<std::pair<std::shared_ptr<transport::ByteStream>, RadioDevice>>> pending_;
};

class AirspaceRadioAdapter : public transport::RadioAdapter {
public:
    AirspaceRadioAdapter(std::shared_ptr<Airspace> air, RadioDevice self, std::chrono::microseconds write_delay)
        : air_(std::move(air)), self_(std::move(self)), write_delay_(write_delay) {
        air_->add(self_);
    }

    bool is_present() const override { return true; }
    bool is_powered() const override { return true; }

    bool start_scan(transport::RadioScanListener listener) override {
        for (const auto& device : air_->devices_except(self_.address)) {
            listener({transport::RadioScanEvent::Type::FOUND, device, ""});
        }
        listener({transport::RadioScanEvent::Type::FINISHED, {}, ""});
        return true;
    }

    void cancel_scan() override {}

    std::shared_ptr<transport::ByteStream> open_channel(const std::string& address,
                                                        std::chrono::milliseconds,
                                                        const std::function<bool()>& should_abort,
                                                        boost::system::error_code& ec) override {
        if (should_abort && should_abort()) {
            ec = boost::asio::error::operation_aborted;
            return nullptr;
        }
        if (!air_->knows(address)) {
            ec = boost::system::errc::make_error_code(boost::system::errc::host_unreachable);
            return nullptr;
        }
        auto local = std::make_shared<network::LocalStream>();
        auto remote = std::make_shared<network::LocalStream>();
        boost::asio::local::connect_pair(local->stream(), remote->stream(), ec);
        if (ec) {
            return nullptr;
        }
        air_->deliver(address, remote, self_);
        return std::make_shared<PacedStream>(local, write_delay_);
    }

    std::shared_ptr<transport::ByteStream> accept_channel(std::chrono::milliseconds timeout,
                                                          const std::function<bool()>& should_abort,
                                                          RadioDevice& remote,
                                                          boost::system::error_code& ec) override {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (should_abort && should_abort()) {
                ec = boost::asio::error::operation_aborted;
                return nullptr;
            }
            if (auto stream = air_->take(self_.address, 10ms, remote)) {
                return stream;
            }
        }
        ec = boost::asio::error::timed_out;
        return nullptr;
    }

private:
    std::shared_ptr<Airspace> air_;
    RadioDevice self_;
    std::chrono::microseconds write_delay_;
};

// Reports a larger size than the content holds for one file.
class ShortReadResolver : public storage::ContentResolver {
public:
    ShortReadResolver(std::string short_name, std::int64_t missing_bytes)
        : short_name_(std::move(short_name)), missing_bytes_(missing_bytes) {}

    std::optional<storage::TransferableFile> resolve(const storage::ResourceHandle& handle) override {
        auto file = local_.resolve(handle);
        if (file && file->name == short_name_) {
            file->size_bytes += missing_bytes_;
        }
        return file;
    }

    std::unique_ptr<std::istream> open(const storage::TransferableFile& file) override {
        return local_.open(file);
    }

private:
    storage::LocalContentResolver local_;
    std::string short_name_;
    std::int64_t missing_bytes_;
};

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace

class RadioTransferTest : public ::testing::Test {
protected:
    struct Device {
        std::shared_ptr<transport::RadioTransport> transport;
        std::shared_ptr<session::TransferCoordinator> coordinator;
        StateRecorder recorder;
    };

    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() / "nearshare_radio_integration";
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_ / "outbox");
        air_ = std::make_shared<Airspace>();
        permissions_ = std::make_shared<transport::StaticPermissionGate>(true, false);
    }

    void TearDown() override {
        for (auto* device : {&sender_, &receiver_}) {
            if (device->coordinator) {
                device->coordinator->stop();
            }
        }
        std::filesystem::remove_all(root_);
    }

    void setup_device(Device& device, const std::string& address, const std::string& name,
                      std::shared_ptr<storage::ContentResolver> resolver,
                      std::chrono::microseconds write_delay = std::chrono::microseconds::zero()) {
        transport::TransportOptions options;
        options.chunk_size = 1024;
        options.progress_interval = 5ms;
        options.accept_timeout = 5000ms;

        auto adapter = std::make_shared<AirspaceRadioAdapter>(air_, RadioDevice{address, name}, write_delay);
        device.transport = std::make_shared<transport::RadioTransport>(
            adapter, options, permissions_, resolver, storage::StorageConfig(root_ / name));

        session::TransportSelector selector;
        selector.add(device.transport);
        device.coordinator = std::make_shared<session::TransferCoordinator>(std::move(selector), permissions_, resolver);
        device.coordinator->start();
        device.coordinator->add_listener([&device](const transfer::TransferState& s) { device.recorder.record(s); });
    }

    std::string write_outbox(const std::string& name, std::size_t size) {
        std::string content(size, '\0');
        for (std::size_t i = 0; i < size; ++i) {
            content[i] = static_cast<char>('a' + (i % 26));
        }
        std::ofstream out(root_ / "outbox" / name, std::ios::binary);
        out << content;
        return content;
    }

    std::string outbox(const std::string& name) const {
        return (root_ / "outbox" / name).string();
    }

    void connect_sender() {
        sender_.coordinator->start_discovery(transport::TransportSelection::SHORT_RANGE_RADIO);
        ASSERT_TRUE(sender_.recorder.wait_for(Phase::DEVICES_FOUND));
        sender_.coordinator->select_peer("00:11:22:33:44:02");
        ASSERT_TRUE(sender_.recorder.wait_for(Phase::CONNECTED));
    }

    std::filesystem::path root_;
    std::shared_ptr<Airspace> air_;
    std::shared_ptr<transport::StaticPermissionGate> permissions_;
    Device sender_;
    Device receiver_;
};

TEST_F(RadioTransferTest, SendsBatchEndToEnd) {
    auto resolver = std::make_shared<storage::LocalContentResolver>();
    setup_device(sender_, "00:11:22:33:44:01", "sender", resolver);
    setup_device(receiver_, "00:11:22:33:44:02", "receiver", resolver);

    auto first = write_outbox("notes.txt", 5000);
    auto second = write_outbox("photo.jpg", 20000);

    receiver_.coordinator->receive(transport::TransportSelection::SHORT_RANGE_RADIO);
    connect_sender();

    auto found = sender_.recorder.last<state::DevicesFound>();
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->peers[0].display_name, "receiver");

    sender_.coordinator->send({outbox("notes.txt"), outbox("photo.jpg")});

    ASSERT_TRUE(sender_.recorder.wait_for(Phase::COMPLETED, 10s));
    ASSERT_TRUE(receiver_.recorder.wait_for(Phase::COMPLETED, 10s));

    auto sent = sender_.recorder.last<state::Completed>();
    EXPECT_EQ(sent->file_count, 2u);
    EXPECT_EQ(sent->bytes_total, 25000);

    auto received = receiver_.recorder.last<state::Completed>();
    EXPECT_EQ(received->file_count, 2u);
    EXPECT_EQ(received->bytes_total, 25000);

    EXPECT_EQ(read_file(root_ / "receiver" / "notes.txt"), first);
    EXPECT_EQ(read_file(root_ / "receiver" / "photo.jpg"), second);

    auto connected = receiver_.recorder.last<state::Connected>();
    ASSERT_TRUE(connected.has_value());
    EXPECT_EQ(connected->peer.identity, "00:11:22:33:44:01");
    EXPECT_EQ(connected->peer.display_name, "sender");
}

TEST_F(RadioTransferTest, SecondFileFailingMidStream) {
    constexpr std::int64_t missing = 3000;
    auto resolver = std::make_shared<ShortReadResolver>("second.bin", missing);
    setup_device(sender_, "00:11:22:33:44:01", "sender", resolver);
    setup_device(receiver_, "00:11:22:33:44:02", "receiver", resolver);

    auto first = write_outbox("first.bin", 4096);
    auto second = write_outbox("second.bin", 2500);

    receiver_.coordinator->receive(transport::TransportSelection::SHORT_RANGE_RADIO);
    connect_sender();
    sender_.coordinator->send({outbox("first.bin"), outbox("second.bin")});

    ASSERT_TRUE(sender_.recorder.wait_for(Phase::FAILED, 10s));
    auto failed = sender_.recorder.last<state::Failed>();
    EXPECT_EQ(failed->error.kind, core::TransferErrorKind::FILE_IO_ERROR);

    auto progress = sender_.recorder.last<state::Transferring>();
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->bytes_done, static_cast<std::int64_t>(first.size() + second.size()));
    EXPECT_EQ(progress->bytes_total, static_cast<std::int64_t>(first.size() + second.size()) + missing);

    ASSERT_TRUE(receiver_.recorder.wait_for(Phase::FAILED, 10s));
    EXPECT_EQ(receiver_.recorder.last<state::Failed>()->error.kind, core::TransferErrorKind::CONNECTION_LOST);

    EXPECT_EQ(read_file(root_ / "receiver" / "first.bin"), first);
    auto partial = root_ / "receiver" / "second.bin";
    ASSERT_TRUE(std::filesystem::exists(partial));
    EXPECT_EQ(std::filesystem::file_size(partial), second.size());
}

TEST_F(RadioTransferTest, CancelMidTransferClosesConnection) {
    auto resolver = std::make_shared<storage::LocalContentResolver>();
    setup_device(sender_, "00:11:22:33:44:01", "sender", resolver, std::chrono::microseconds(2000));
    setup_device(receiver_, "00:11:22:33:44:02", "receiver", resolver);

    write_outbox("large.bin", 1024 * 1024);

    receiver_.coordinator->receive(transport::TransportSelection::SHORT_RANGE_RADIO);
    connect_sender();
    sender_.coordinator->send({outbox("large.bin")});

    ASSERT_TRUE(sender_.recorder.wait_for([](const auto& s) {
        const auto* t = std::get_if<state::Transferring>(&s);
        return t && t->bytes_done > 0;
    }, 10s));

    sender_.coordinator->cancel();
    ASSERT_TRUE(sender_.recorder.wait_for(Phase::CANCELLED));

    EXPECT_FALSE(sender_.transport->get_connected_peer().has_value());
    EXPECT_FALSE(sender_.recorder.last<state::Completed>().has_value());

    ASSERT_TRUE(receiver_.recorder.wait_for(Phase::FAILED, 10s));
    EXPECT_EQ(receiver_.recorder.last<state::Failed>()->error.kind, core::TransferErrorKind::CONNECTION_LOST);
}

TEST_F(RadioTransferTest, UnreachablePeerFailsAndAllowsRetry) {
    auto resolver = std::make_shared<storage::LocalContentResolver>();
    setup_device(sender_, "00:11:22:33:44:01", "sender", resolver);

    transport::Peer ghost;
    ghost.identity = "00:11:22:33:44:99";
    ghost.address = ghost.identity;
    ghost.display_name = "Ghost";
    ghost.medium = transport::TransportKind::SHORT_RANGE_RADIO;

    sender_.coordinator->connect(ghost);
    ASSERT_TRUE(sender_.recorder.wait_for(Phase::FAILED));

    auto failed = sender_.recorder.last<state::Failed>();
    EXPECT_EQ(failed->error.kind, core::TransferErrorKind::CONNECTION_FAILED);
    EXPECT_TRUE(failed->can_retry);
    EXPECT_NE(sender_.coordinator->active_transport(), nullptr);

    setup_device(receiver_, "00:11:22:33:44:99", "ghost", resolver);
    receiver_.coordinator->receive(transport::TransportSelection::SHORT_RANGE_RADIO);
    sender_.coordinator->connect(ghost);
    ASSERT_TRUE(sender_.recorder.wait_for(Phase::CONNECTED));
}
