#include <gtest/gtest.h>
#include "state_recorder.hpp"
#include "nearshare/network/lan_group_adapter.hpp"
#include "nearshare/session/transfer_coordinator.hpp"
#include "nearshare/storage/content_resolver.hpp"
#include "nearshare/transport/group_transport.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>

using namespace nearshare;
using namespace std::chrono_literals;
using nearshare::test_support::StateRecorder;
using session::Phase;
namespace state = transfer::state;

namespace {
    constexpr std::uint16_t SENDER_DISCOVERY_PORT = 47911;
    constexpr std::uint16_t RECEIVER_DISCOVERY_PORT = 47912;
    constexpr std::uint16_t RECEIVER_SERVICE_PORT = 47913;
    constexpr std::uint16_t SENDER_SERVICE_PORT = 47914;

    network::LanGroupOptions loopback_options(const std::string& name, std::uint16_t bind_port,
                                              std::uint16_t target_port, std::uint16_t service_port) {
        network::LanGroupOptions options;
        options.device_name = name;
        options.service_port = service_port;
        options.allow_loopback = true;
        options.discovery.bind_port = bind_port;
        options.discovery.target_address = "127.0.0.1";
        options.discovery.target_port = target_port;
        options.discovery.announcement_interval = 200ms;
        options.discovery.peer_timeout = 5000ms;
        return options;
    }

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }
}

class GroupTransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() / "nearshare_group_integration";
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_ / "outbox");

        permissions_ = std::make_shared<transport::StaticPermissionGate>(false, true);
        resolver_ = std::make_shared<storage::LocalContentResolver>();

        transport::TransportOptions options;
        options.chunk_size = 8192;
        options.progress_interval = 10ms;
        options.accept_timeout = 10000ms;
        options.connect_timeout = 5000ms;

        receiver_adapter_ = std::make_shared<network::LanGroupAdapter>(
            loopback_options("receiver", RECEIVER_DISCOVERY_PORT, SENDER_DISCOVERY_PORT, RECEIVER_SERVICE_PORT));
        sender_adapter_ = std::make_shared<network::LanGroupAdapter>(
            loopback_options("sender", SENDER_DISCOVERY_PORT, RECEIVER_DISCOVERY_PORT, SENDER_SERVICE_PORT));

        receiver_ = make_coordinator(receiver_adapter_, options, "inbox");
        sender_ = make_coordinator(sender_adapter_, options, "sender_inbox");

        receiver_->add_listener([this](const transfer::TransferState& s) { receiver_states_.record(s); });
        sender_->add_listener([this](const transfer::TransferState& s) { sender_states_.record(s); });
    }

    void TearDown() override {
        sender_->stop();
        receiver_->stop();
        receiver_adapter_->stop_peer_discovery();
        std::filesystem::remove_all(root_);
    }

    std::shared_ptr<session::TransferCoordinator> make_coordinator(std::shared_ptr<network::LanGroupAdapter> adapter,
                                                                   const transport::TransportOptions& options,
                                                                   const std::string& inbox) {
        session::TransportSelector selector;
        selector.add(std::make_shared<transport::GroupTransport>(
            adapter, options, permissions_, resolver_, storage::StorageConfig(root_ / inbox)));
        auto coordinator = std::make_shared<session::TransferCoordinator>(std::move(selector), permissions_, resolver_);
        coordinator->start();
        return coordinator;
    }

    std::string write_outbox(const std::string& name, std::size_t size) {
        std::string content(size, '\0');
        for (std::size_t i = 0; i < size; ++i) {
            content[i] = static_cast<char>((i * 7) % 251);
        }
        std::ofstream out(root_ / "outbox" / name, std::ios::binary);
        out << content;
        return content;
    }

    std::filesystem::path root_;
    std::shared_ptr<transport::StaticPermissionGate> permissions_;
    std::shared_ptr<storage::LocalContentResolver> resolver_;
    std::shared_ptr<network::LanGroupAdapter> receiver_adapter_;
    std::shared_ptr<network::LanGroupAdapter> sender_adapter_;
    StateRecorder receiver_states_;
    StateRecorder sender_states_;
    std::shared_ptr<session::TransferCoordinator> receiver_;
    std::shared_ptr<session::TransferCoordinator> sender_;
};

TEST_F(GroupTransferTest, DiscoversAndSendsOverLoopback) {
    auto report = write_outbox("report.pdf", 150000);
    auto empty = write_outbox("empty.txt", 0);

    // The receiver announces itself while it waits for a connection.
    ASSERT_TRUE(receiver_adapter_->start_peer_discovery({}, {}));
    receiver_->receive(transport::TransportSelection::LOCAL_WIRELESS_GROUP);
    std::this_thread::sleep_for(200ms);

    auto receiver_identity = network::LanGroupAdapter::format_identity(receiver_adapter_->node_id());

    sender_->start_discovery(transport::TransportSelection::LOCAL_WIRELESS_GROUP);
    ASSERT_TRUE(sender_states_.wait_for([&receiver_identity](const transfer::TransferState& s) {
        const auto* found = std::get_if<state::DevicesFound>(&s);
        if (!found) {
            return false;
        }
        for (const auto& peer : found->peers) {
            if (peer.identity == receiver_identity) {
                return true;
            }
        }
        return false;
    }, 5s));

    auto found = sender_states_.last<state::DevicesFound>();
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->peers.front().display_name, "receiver");
    EXPECT_EQ(found->peers.front().medium, transport::TransportKind::LOCAL_WIRELESS_GROUP);

    sender_->select_peer(receiver_identity);
    ASSERT_TRUE(sender_states_.wait_for(Phase::CONNECTED, 5s));
    ASSERT_TRUE(receiver_states_.wait_for(Phase::CONNECTED, 5s));

    sender_->send({(root_ / "outbox" / "report.pdf").string(), (root_ / "outbox" / "empty.txt").string()});

    ASSERT_TRUE(sender_states_.wait_for(Phase::COMPLETED, 10s));
    ASSERT_TRUE(receiver_states_.wait_for(Phase::COMPLETED, 10s));

    auto sent = sender_states_.last<state::Completed>();
    EXPECT_EQ(sent->file_count, 2u);
    EXPECT_EQ(sent->bytes_total, 150000);

    auto received = receiver_states_.last<state::Completed>();
    EXPECT_EQ(received->file_count, 2u);
    EXPECT_EQ(received->bytes_total, 150000);

    EXPECT_EQ(read_file(root_ / "inbox" / "report.pdf"), report);
    ASSERT_TRUE(std::filesystem::exists(root_ / "inbox" / "empty.txt"));
    EXPECT_EQ(std::filesystem::file_size(root_ / "inbox" / "empty.txt"), 0u);
}

TEST_F(GroupTransferTest, AcceptTimesOutWithoutSender) {
    transport::TransportOptions options;
    options.accept_timeout = 300ms;

    session::TransportSelector selector;
    selector.add(std::make_shared<transport::GroupTransport>(
        receiver_adapter_, options, permissions_, resolver_, storage::StorageConfig(root_ / "idle")));
    session::TransferCoordinator lonely(std::move(selector), permissions_, resolver_);
    lonely.start();

    lonely.receive(transport::TransportSelection::LOCAL_WIRELESS_GROUP);
    ASSERT_TRUE(lonely.wait_until([](const auto& s) { return session::phase_of(s) == Phase::FAILED; }, 5s));

    auto current = lonely.state();
    const auto* failed = std::get_if<state::Failed>(&current);
    ASSERT_NE(failed, nullptr);
    EXPECT_EQ(failed->error.kind, core::TransferErrorKind::TIMEOUT);
    EXPECT_TRUE(failed->can_retry);
    lonely.stop();
}

TEST_F(GroupTransferTest, AcceptHonoursCancelIssuedBeforeTheWait) {
    transport::TransportOptions options;
    options.accept_timeout = 2000ms;
    transport::GroupTransport transport(receiver_adapter_, options, permissions_, resolver_,
                                        storage::StorageConfig(root_ / "idle"));

    transfer::TransferControl control;
    control.cancel();
    transport.disconnect();

    auto begun = std::chrono::steady_clock::now();
    auto accepted = transport.accept(control);
    EXPECT_LT(std::chrono::steady_clock::now() - begun, 500ms);
    ASSERT_FALSE(accepted);
    EXPECT_EQ(accepted.error().kind, core::TransferErrorKind::CONNECTION_FAILED);
    EXPECT_FALSE(transport.get_connected_peer().has_value());
}

TEST_F(GroupTransferTest, CancelDuringAcceptUnblocksIt) {
    transport::TransportOptions options;
    options.accept_timeout = 2000ms;
    transport::GroupTransport transport(receiver_adapter_, options, permissions_, resolver_,
                                        storage::StorageConfig(root_ / "idle"));

    transfer::TransferControl control;
    std::thread canceller([&] {
        std::this_thread::sleep_for(100ms);
        control.cancel();
        transport.disconnect();
    });

    auto begun = std::chrono::steady_clock::now();
    auto accepted = transport.accept(control);
    auto elapsed = std::chrono::steady_clock::now() - begun;
    canceller.join();

    EXPECT_FALSE(accepted);
    EXPECT_LT(elapsed, 1000ms);
}
