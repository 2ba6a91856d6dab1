#include <gtest/gtest.h>
#include "mock_transport.hpp"
#include "state_recorder.hpp"
#include "nearshare/session/transfer_coordinator.hpp"
#include <algorithm>
#include <atomic>
#include <map>
#include <thread>

using namespace nearshare;
using namespace nearshare::session;
using namespace std::chrono_literals;
using core::Result;
using core::TransferError;
using core::TransferErrorKind;
using nearshare::test_support::MockPermissionGate;
using nearshare::test_support::MockTransport;
using nearshare::test_support::StateRecorder;
using transport::Peer;
using transport::TransportKind;
using ::testing::_;
using ::testing::DoDefault;
using ::testing::NiceMock;
using ::testing::Return;
namespace state = transfer::state;

namespace {

class MapResolver : public storage::ContentResolver {
public:
    void add(const std::string& name, std::int64_t size) {
        storage::TransferableFile file;
        file.handle = "mem://" + name;
        file.name = name;
        file.size_bytes = size;
        files_[file.handle] = file;
    }

    std::optional<storage::TransferableFile> resolve(const storage::ResourceHandle& handle) override {
        auto it = files_.find(handle);
        if (it == files_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::unique_ptr<std::istream> open(const storage::TransferableFile&) override {
        return nullptr;
    }

private:
    std::map<std::string, storage::TransferableFile> files_;
};

// Connection bookkeeping shared by a mock transport's default actions.
struct Link {
    std::mutex mutex;
    std::optional<Peer> peer;
};

Peer make_peer(const std::string& identity, const std::string& name) {
    Peer peer;
    peer.identity = identity;
    peer.display_name = name;
    peer.address = identity;
    peer.medium = TransportKind::SHORT_RANGE_RADIO;
    return peer;
}

} // namespace

class TransferCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        radio_ = std::make_shared<NiceMock<MockTransport>>(TransportKind::SHORT_RANGE_RADIO);
        group_ = std::make_shared<NiceMock<MockTransport>>(TransportKind::LOCAL_WIRELESS_GROUP);
        permissions_ = std::make_shared<NiceMock<MockPermissionGate>>();
        resolver_ = std::make_shared<MapResolver>();

        ON_CALL(*permissions_, has_required_permissions(_)).WillByDefault(Return(true));

        // Only the low-throughput medium is usable.
        set_ready(*radio_, true, true);
        set_ready(*group_, true, false);
        model_link(*radio_, radio_link_);
        model_link(*group_, group_link_);

        phone_ = make_peer("aa:bb:cc:dd:ee:01", "Phone");
        tablet_ = make_peer("aa:bb:cc:dd:ee:02", "Tablet");
    }

    void TearDown() override {
        if (coordinator_) {
            coordinator_->stop();
            coordinator_.reset();
        }
    }

    void start() {
        TransportSelector selector;
        selector.add(radio_);
        selector.add(group_);
        coordinator_ = std::make_unique<TransferCoordinator>(std::move(selector), permissions_, resolver_);
        coordinator_->start();
        coordinator_->add_listener([this](const transfer::TransferState& s) { recorder_.record(s); });
        ASSERT_TRUE(recorder_.wait_for(Phase::IDLE));
    }

    static void set_ready(MockTransport& transport, bool available, bool enabled) {
        ON_CALL(transport, is_available()).WillByDefault(Return(available));
        ON_CALL(transport, is_enabled()).WillByDefault(Return(enabled));
    }

    static void model_link(MockTransport& transport, Link& link) {
        ON_CALL(transport, connect(_, _)).WillByDefault([&link](const Peer& peer, transfer::TransferControl&) {
            std::lock_guard<std::mutex> lock(link.mutex);
            link.peer = peer;
            link.peer->connected = true;
            return Result<void>::ok();
        });
        ON_CALL(transport, disconnect()).WillByDefault([&link]() {
            std::lock_guard<std::mutex> lock(link.mutex);
            link.peer.reset();
        });
        ON_CALL(transport, get_connected_peer()).WillByDefault([&link]() {
            std::lock_guard<std::mutex> lock(link.mutex);
            return link.peer;
        });
    }

    void connect_phone() {
        coordinator_->connect(phone_);
        ASSERT_TRUE(recorder_.wait_for(Phase::CONNECTED));
    }

    static bool transferring_at(const transfer::TransferState& s, std::int64_t bytes) {
        const auto* t = std::get_if<state::Transferring>(&s);
        return t && t->bytes_done == bytes;
    }

    Link radio_link_;
    Link group_link_;
    std::shared_ptr<NiceMock<MockTransport>> radio_;
    std::shared_ptr<NiceMock<MockTransport>> group_;
    std::shared_ptr<NiceMock<MockPermissionGate>> permissions_;
    std::shared_ptr<MapResolver> resolver_;
    Peer phone_;
    Peer tablet_;

    StateRecorder recorder_;
    std::unique_ptr<TransferCoordinator> coordinator_;
};

TEST_F(TransferCoordinatorTest, AutoDiscoveryUsesOnlyUsableMedium) {
    auto stream = transport::DiscoveryStream::create();
    EXPECT_CALL(*radio_, start_discovery()).WillOnce(Return(stream));
    EXPECT_CALL(*group_, start_discovery()).Times(0);

    start();
    coordinator_->start_discovery();
    ASSERT_TRUE(recorder_.wait_for(Phase::DISCOVERING));

    stream->push(phone_);
    ASSERT_TRUE(recorder_.wait_for(Phase::DEVICES_FOUND));

    EXPECT_EQ(recorder_.phases(), (std::vector<Phase>{Phase::IDLE, Phase::DISCOVERING, Phase::DEVICES_FOUND}));
    ASSERT_NE(coordinator_->active_transport(), nullptr);
    EXPECT_EQ(coordinator_->active_transport()->kind(), TransportKind::SHORT_RANGE_RADIO);
    ASSERT_EQ(coordinator_->discovered_peers().size(), 1u);
    EXPECT_EQ(coordinator_->discovered_peers()[0].identity, phone_.identity);
}

TEST_F(TransferCoordinatorTest, DuplicatePeersAreCoalesced) {
    auto stream = transport::DiscoveryStream::create();
    ON_CALL(*radio_, start_discovery()).WillByDefault(Return(stream));

    start();
    coordinator_->start_discovery();
    stream->push(phone_);
    stream->push(phone_);
    stream->push(tablet_);

    ASSERT_TRUE(recorder_.wait_for([](const auto& s) {
        const auto* found = std::get_if<state::DevicesFound>(&s);
        return found && found->peers.size() == 2;
    }));

    auto phases = recorder_.phases();
    EXPECT_EQ(std::count(phases.begin(), phases.end(), Phase::DEVICES_FOUND), 2);

    auto found = recorder_.last<state::DevicesFound>();
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->peers[0].identity, phone_.identity);
    EXPECT_EQ(found->peers[1].identity, tablet_.identity);
}

TEST_F(TransferCoordinatorTest, DiscoveryWithoutPeersFails) {
    auto stream = transport::DiscoveryStream::create();
    ON_CALL(*radio_, start_discovery()).WillByDefault(Return(stream));

    start();
    coordinator_->start_discovery();
    ASSERT_TRUE(recorder_.wait_for(Phase::DISCOVERING));
    stream->finish();

    ASSERT_TRUE(recorder_.wait_for(Phase::FAILED));
    auto failed = recorder_.last<state::Failed>();
    EXPECT_EQ(failed->error.kind, TransferErrorKind::PEER_NOT_FOUND);
    EXPECT_TRUE(failed->can_retry);
    EXPECT_TRUE(stream->is_released());
}

TEST_F(TransferCoordinatorTest, DiscoveryErrorBeforeAnyPeerFails) {
    auto stream = transport::DiscoveryStream::create();
    ON_CALL(*radio_, start_discovery()).WillByDefault(Return(stream));

    start();
    coordinator_->start_discovery();
    ASSERT_TRUE(recorder_.wait_for(Phase::DISCOVERING));
    stream->push(TransferError::connection_failed("Scan failed"));

    ASSERT_TRUE(recorder_.wait_for(Phase::FAILED));
    EXPECT_EQ(recorder_.last<state::Failed>()->error.kind, TransferErrorKind::CONNECTION_FAILED);
}

TEST_F(TransferCoordinatorTest, PermissionDeniedBlocksDiscovery) {
    ON_CALL(*permissions_, has_required_permissions(TransportKind::SHORT_RANGE_RADIO)).WillByDefault(Return(false));
    EXPECT_CALL(*radio_, start_discovery()).Times(0);

    start();
    coordinator_->start_discovery();

    ASSERT_TRUE(recorder_.wait_for(Phase::FAILED));
    auto failed = recorder_.last<state::Failed>();
    EXPECT_EQ(failed->error.kind, TransferErrorKind::PERMISSION_DENIED);
    EXPECT_FALSE(failed->can_retry);
}

TEST_F(TransferCoordinatorTest, NoUsableTransportIsUnsupported) {
    set_ready(*radio_, true, false);

    start();
    coordinator_->start_discovery();

    ASSERT_TRUE(recorder_.wait_for(Phase::FAILED));
    auto failed = recorder_.last<state::Failed>();
    EXPECT_EQ(failed->error.kind, TransferErrorKind::UNSUPPORTED_OPERATION);
    EXPECT_FALSE(failed->can_retry);
}

TEST_F(TransferCoordinatorTest, SelectPeerConnectsOverDiscoveringTransport) {
    auto stream = transport::DiscoveryStream::create();
    ON_CALL(*radio_, start_discovery()).WillByDefault(Return(stream));

    start();
    coordinator_->start_discovery();
    stream->push(phone_);
    ASSERT_TRUE(recorder_.wait_for(Phase::DEVICES_FOUND));

    coordinator_->select_peer(phone_.identity);
    ASSERT_TRUE(recorder_.wait_for(Phase::CONNECTED));

    EXPECT_EQ(recorder_.phases(), (std::vector<Phase>{Phase::IDLE, Phase::DISCOVERING, Phase::DEVICES_FOUND,
                                                      Phase::CONNECTING, Phase::CONNECTED}));
    EXPECT_TRUE(stream->is_released());
    auto peer = coordinator_->session_peer();
    ASSERT_TRUE(peer.has_value());
    EXPECT_EQ(peer->identity, phone_.identity);
    EXPECT_TRUE(peer->connected);
}

TEST_F(TransferCoordinatorTest, UnreachablePeerCanBeRetried) {
    EXPECT_CALL(*radio_, connect(_, _))
        .WillOnce(Return(Result<void>(TransferError::connection_failed("Peer unreachable"))))
        .WillRepeatedly(DoDefault());

    start();
    coordinator_->connect(phone_);
    ASSERT_TRUE(recorder_.wait_for(Phase::FAILED));

    auto failed = recorder_.last<state::Failed>();
    EXPECT_EQ(failed->error.kind, TransferErrorKind::CONNECTION_FAILED);
    EXPECT_TRUE(failed->can_retry);

    coordinator_->connect(phone_);
    ASSERT_TRUE(recorder_.wait_for(Phase::CONNECTED));
    EXPECT_EQ(recorder_.phases(), (std::vector<Phase>{Phase::IDLE, Phase::CONNECTING, Phase::FAILED,
                                                      Phase::CONNECTING, Phase::CONNECTED}));
}

TEST_F(TransferCoordinatorTest, SendsBatchToCompletion) {
    resolver_->add("a.txt", 1000);
    resolver_->add("b.txt", 3000);

    EXPECT_CALL(*radio_, send_file(_, _, _))
        .Times(2)
        .WillRepeatedly([](const storage::TransferableFile& file, const transfer::ProgressCallback& report,
                           transfer::TransferControl&) -> Result<void> {
            report(transfer::ProgressUpdate{file.safe_name(), file.size_bytes, 100, file.size_bytes, 0});
            return Result<void>::ok();
        });

    start();
    connect_phone();
    coordinator_->send({"mem://a.txt", "mem://b.txt"});

    ASSERT_TRUE(recorder_.wait_for(Phase::COMPLETED));
    auto completed = recorder_.last<state::Completed>();
    EXPECT_EQ(completed->file_count, 2u);
    EXPECT_EQ(completed->bytes_total, 4000);

    auto progress = recorder_.last<state::Transferring>();
    EXPECT_EQ(progress->bytes_done, 4000);
    EXPECT_EQ(progress->progress_percent, 100);

    int last_percent = 0;
    for (const auto& s : recorder_.states()) {
        if (const auto* t = std::get_if<state::Transferring>(&s)) {
            EXPECT_GE(t->progress_percent, last_percent);
            last_percent = t->progress_percent;
        }
    }
}

TEST_F(TransferCoordinatorTest, MidBatchFailureReportsPartialBytes) {
    resolver_->add("first.bin", 1000);
    resolver_->add("second.bin", 5000);

    EXPECT_CALL(*radio_, send_file(_, _, _))
        .WillOnce([](const storage::TransferableFile& file, const transfer::ProgressCallback& report,
                     transfer::TransferControl&) -> Result<void> {
            report(transfer::ProgressUpdate{file.safe_name(), file.size_bytes, 100, file.size_bytes, 0});
            return Result<void>::ok();
        })
        .WillOnce([](const storage::TransferableFile& file, const transfer::ProgressCallback& report,
                     transfer::TransferControl&) -> Result<void> {
            report(transfer::ProgressUpdate{file.safe_name(), file.size_bytes, 40, 2000, 0});
            return TransferError::connection_lost("Peer went away");
        });

    start();
    connect_phone();
    coordinator_->send({"mem://first.bin", "mem://second.bin"});

    ASSERT_TRUE(recorder_.wait_for(Phase::FAILED));
    auto failed = recorder_.last<state::Failed>();
    EXPECT_EQ(failed->error.kind, TransferErrorKind::CONNECTION_LOST);
    EXPECT_TRUE(failed->can_retry);

    auto progress = recorder_.last<state::Transferring>();
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->bytes_done, 3000);
    EXPECT_EQ(progress->bytes_total, 6000);
    EXPECT_EQ(progress->current_file_name, "second.bin");
}

TEST_F(TransferCoordinatorTest, SendSkipsMissingFilesAndFailsWhenNoneLeft) {
    start();
    connect_phone();
    EXPECT_CALL(*radio_, send_file(_, _, _)).Times(0);

    coordinator_->send({"mem://missing"});
    ASSERT_TRUE(recorder_.wait_for(Phase::FAILED));
    EXPECT_EQ(recorder_.last<state::Failed>()->error.kind, TransferErrorKind::FILE_IO_ERROR);
}

TEST_F(TransferCoordinatorTest, CancelMidTransferClosesConnection) {
    resolver_->add("big.bin", 100000);

    ON_CALL(*radio_, send_file(_, _, _))
        .WillByDefault([](const storage::TransferableFile& file, const transfer::ProgressCallback& report,
                          transfer::TransferControl& control) -> Result<void> {
            report(transfer::ProgressUpdate{file.safe_name(), file.size_bytes, 1, 1000, 0});
            while (!control.is_cancelled()) {
                std::this_thread::sleep_for(1ms);
            }
            return TransferError::connection_lost("Transfer cancelled");
        });

    start();
    connect_phone();
    coordinator_->send({"mem://big.bin"});
    ASSERT_TRUE(recorder_.wait_for([](const auto& s) { return transferring_at(s, 1000); }));

    coordinator_->cancel();
    ASSERT_TRUE(recorder_.wait_for(Phase::CANCELLED));

    EXPECT_FALSE(radio_->get_connected_peer().has_value());
    EXPECT_EQ(recorder_.phases().back(), Phase::CANCELLED);
    EXPECT_FALSE(recorder_.last<state::Failed>().has_value());
    EXPECT_EQ(coordinator_->active_transport(), nullptr);
}

TEST_F(TransferCoordinatorTest, PauseHoldsTransferUntilResume) {
    resolver_->add("movie.mp4", 1000);
    std::atomic<bool> release{false};
    std::atomic<bool> observed_pause{false};

    ON_CALL(*radio_, send_file(_, _, _))
        .WillByDefault([&](const storage::TransferableFile& file, const transfer::ProgressCallback& report,
                           transfer::TransferControl& control) -> Result<void> {
            report(transfer::ProgressUpdate{file.safe_name(), file.size_bytes, 50, 500, 0});
            while (!release) {
                if (control.is_paused()) {
                    observed_pause = true;
                }
                if (!control.wait_while_paused()) {
                    return TransferError::connection_lost("Transfer cancelled");
                }
                std::this_thread::sleep_for(1ms);
            }
            report(transfer::ProgressUpdate{file.safe_name(), file.size_bytes, 100, 1000, 0});
            return Result<void>::ok();
        });

    start();
    connect_phone();
    coordinator_->send({"mem://movie.mp4"});
    ASSERT_TRUE(recorder_.wait_for([](const auto& s) { return transferring_at(s, 500); }));

    coordinator_->pause();
    ASSERT_TRUE(recorder_.wait_for(Phase::PAUSED));
    EXPECT_EQ(recorder_.last<state::Paused>()->progress_percent, 50);

    coordinator_->resume();
    ASSERT_TRUE(recorder_.wait_for_sequence([](const std::vector<Phase>& phases) {
        auto paused = std::find(phases.begin(), phases.end(), Phase::PAUSED);
        return paused != phases.end() && std::find(paused, phases.end(), Phase::TRANSFERRING) != phases.end();
    }));

    release = true;
    ASSERT_TRUE(recorder_.wait_for(Phase::COMPLETED));
    EXPECT_TRUE(observed_pause);
    EXPECT_EQ(recorder_.last<state::Completed>()->file_count, 1u);
}

TEST_F(TransferCoordinatorTest, ReceivesBatch) {
    EXPECT_CALL(*radio_, accept(_)).WillOnce(Return(Result<Peer>(phone_)));

    int calls = 0;
    ON_CALL(*radio_, receive_file(_, _))
        .WillByDefault([&calls](const transfer::ProgressCallback& report, transfer::TransferControl&)
                           -> Result<std::optional<storage::TransferableFile>> {
            if (++calls > 1) {
                return std::optional<storage::TransferableFile>{};
            }
            report(transfer::ProgressUpdate{"photo.jpg", 2048, 100, 2048, 0});
            storage::TransferableFile file;
            file.handle = "/tmp/photo.jpg";
            file.name = "photo.jpg";
            file.size_bytes = 2048;
            return std::optional<storage::TransferableFile>(file);
        });

    start();
    coordinator_->receive();

    ASSERT_TRUE(recorder_.wait_for(Phase::COMPLETED));
    auto phases = recorder_.phases();
    EXPECT_EQ(phases[1], Phase::CONNECTED);
    EXPECT_EQ(recorder_.last<state::Connected>()->peer.identity, phone_.identity);

    auto completed = recorder_.last<state::Completed>();
    EXPECT_EQ(completed->file_count, 1u);
    EXPECT_EQ(completed->bytes_total, 2048);
}

TEST_F(TransferCoordinatorTest, ReceiveWithoutFilesFails) {
    ON_CALL(*radio_, accept(_)).WillByDefault(Return(Result<Peer>(phone_)));
    ON_CALL(*radio_, receive_file(_, _))
        .WillByDefault(Return(Result<std::optional<storage::TransferableFile>>(
            std::optional<storage::TransferableFile>{})));

    start();
    coordinator_->receive();

    ASSERT_TRUE(recorder_.wait_for(Phase::FAILED));
    EXPECT_EQ(recorder_.last<state::Failed>()->error.kind, TransferErrorKind::CONNECTION_LOST);
}

TEST_F(TransferCoordinatorTest, CancelRightAfterReceiveEndsAcceptPromptly) {
    std::atomic<bool> saw_cancel{false};
    ON_CALL(*radio_, accept(_)).WillByDefault([&saw_cancel](transfer::TransferControl& control) -> Result<Peer> {
        auto deadline = std::chrono::steady_clock::now() + 2s;
        while (std::chrono::steady_clock::now() < deadline) {
            if (control.is_cancelled()) {
                saw_cancel = true;
                return TransferError::connection_failed("Accept cancelled");
            }
            std::this_thread::sleep_for(1ms);
        }
        return TransferError::timeout("No incoming radio connection within 2000 ms");
    });
    EXPECT_CALL(*radio_, receive_file(_, _)).Times(0);

    start();
    auto begun = std::chrono::steady_clock::now();
    coordinator_->receive();
    coordinator_->cancel();

    ASSERT_TRUE(recorder_.wait_for(Phase::CANCELLED));
    auto elapsed = std::chrono::steady_clock::now() - begun;
    EXPECT_LT(elapsed, 1000ms);
    EXPECT_FALSE(recorder_.last<state::Failed>().has_value());
    EXPECT_EQ(recorder_.phases().back(), Phase::CANCELLED);
}

TEST_F(TransferCoordinatorTest, ReceiveAfterFailureTearsDownFirst) {
    ON_CALL(*radio_, accept(_)).WillByDefault(Return(Result<Peer>(TransferError::timeout("No incoming connection"))));

    start();
    coordinator_->receive();
    ASSERT_TRUE(recorder_.wait_for(Phase::FAILED));

    ON_CALL(*radio_, accept(_)).WillByDefault(Return(Result<Peer>(phone_)));
    ON_CALL(*radio_, receive_file(_, _))
        .WillByDefault(Return(Result<std::optional<storage::TransferableFile>>(
            std::optional<storage::TransferableFile>{})));
    coordinator_->receive();

    ASSERT_TRUE(recorder_.wait_for_sequence([](const std::vector<Phase>& phases) {
        return std::count(phases.begin(), phases.end(), Phase::FAILED) == 2;
    }));
    EXPECT_EQ(recorder_.phases(), (std::vector<Phase>{Phase::IDLE, Phase::FAILED, Phase::IDLE,
                                                      Phase::CONNECTED, Phase::FAILED}));
}

TEST_F(TransferCoordinatorTest, DisconnectReturnsToIdle) {
    EXPECT_CALL(*radio_, disconnect()).Times(::testing::AtLeast(1));

    start();
    connect_phone();
    coordinator_->disconnect();

    ASSERT_TRUE(recorder_.wait_for_sequence([](const std::vector<Phase>& phases) {
        return phases.size() > 1 && phases.back() == Phase::IDLE;
    }));
    EXPECT_FALSE(coordinator_->session_peer().has_value());
    EXPECT_FALSE(radio_->get_connected_peer().has_value());
}

TEST_F(TransferCoordinatorTest, LateListenerReceivesCurrentState) {
    start();
    connect_phone();

    StateRecorder late;
    auto id = coordinator_->add_listener([&late](const transfer::TransferState& s) { late.record(s); });
    ASSERT_TRUE(late.wait_for(Phase::CONNECTED));
    EXPECT_EQ(late.phases().front(), Phase::CONNECTED);

    coordinator_->remove_listener(id);
    coordinator_->disconnect();
    ASSERT_TRUE(coordinator_->wait_until([](const auto& s) { return phase_of(s) == Phase::IDLE; }, 3s));
}
