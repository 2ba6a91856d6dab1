#pragma once

#include "nearshare/session/discovery_aggregator.hpp"
#include "nearshare/session/operation.hpp"
#include "nearshare/session/session_state_machine.hpp"
#include "nearshare/session/transport_selector.hpp"
#include "nearshare/storage/content_resolver.hpp"
#include "nearshare/transfer/transfer_state.hpp"
#include "nearshare/transport/permission_gate.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace nearshare::session {

// Owns the session lifecycle and is the only writer of the TransferState.
//
// Commands are posted to a private io_context thread, which is the single
// owner of the session fields. Discovery, connect and transfer run as one
// Operation at a time on their own worker; they post results back tagged
// with a generation number, and results from a superseded operation are
// dropped. Listeners are called on the owner thread.
class TransferCoordinator {
public:
    using StateListener = std::function<void(const transfer::TransferState&)>;
    using StatePredicate = std::function<bool(const transfer::TransferState&)>;

    TransferCoordinator(TransportSelector selector,
                        std::shared_ptr<transport::PermissionGate> permissions,
                        std::shared_ptr<storage::ContentResolver> resolver);
    ~TransferCoordinator();

    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;

    void start();
    void stop();
    bool is_running() const { return running_; }

    // Commands. All return immediately.
    void start_discovery(transport::TransportSelection selection = transport::TransportSelection::AUTO);
    void stop_discovery();
    void select_peer(const std::string& identity);
    void connect();
    void connect(const transport::Peer& peer);
    void send(std::vector<storage::ResourceHandle> handles);
    void receive(transport::TransportSelection selection = transport::TransportSelection::AUTO);
    void pause();
    void resume();
    void cancel();
    void disconnect();

    // The listener first receives the current state, then every change.
    std::size_t add_listener(StateListener listener);
    void remove_listener(std::size_t id);

    // Consistent snapshots, safe from any thread.
    transfer::TransferState state() const;
    std::vector<transport::Peer> discovered_peers() const;
    std::shared_ptr<transport::Transport> active_transport() const;
    std::optional<transport::Peer> session_peer() const;

    bool wait_until(const StatePredicate& predicate, std::chrono::milliseconds timeout) const;

private:
    void run_io();

    // Owner thread only
    void do_start_discovery(transport::TransportSelection selection);
    void do_stop_discovery();
    void do_select_peer(const std::string& identity);
    void do_connect(const transport::Peer& peer);
    void do_send(const std::vector<storage::ResourceHandle>& handles);
    void do_receive(transport::TransportSelection selection);
    void do_pause();
    void do_resume();
    void do_cancel();
    void do_disconnect();

    void on_discovery_event(std::uint64_t generation, const core::Result<transport::Peer>& event);
    void on_discovery_finished(std::uint64_t generation);
    void on_connect_result(std::uint64_t generation, const core::Result<void>& result);
    void on_accepted(std::uint64_t generation, const transport::Peer& peer);
    void on_progress(std::uint64_t generation, const transfer::state::Transferring& progress);
    void on_operation_failed(std::uint64_t generation, const core::TransferError& error);
    void on_batch_completed(std::uint64_t generation, const transfer::state::Completed& completed);

    bool is_current(std::uint64_t generation) const { return operation_ && operation_->generation() == generation; }
    bool is_busy() const;
    Operation& begin_operation(const std::string& name);
    void finish_operation();
    void stop_operation();

    bool publish(transfer::TransferState next);
    void fail(const core::TransferError& error);
    void leave_paused();
    void teardown();
    void adopt_transport(std::shared_ptr<transport::Transport> transport);
    void refresh_snapshot();

    TransportSelector selector_;
    std::shared_ptr<transport::PermissionGate> permissions_;
    std::shared_ptr<storage::ContentResolver> resolver_;

    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::thread io_thread_;
    std::atomic<bool> running_;

    // Session, owner thread only
    SessionStateMachine machine_;
    DiscoveryAggregator aggregator_;
    std::shared_ptr<transport::Transport> transport_;
    std::optional<transport::Peer> peer_;
    std::optional<transport::Peer> selected_;
    std::unique_ptr<Operation> operation_;
    std::uint64_t next_generation_;
    transfer::state::Transferring last_progress_;

    std::map<std::size_t, StateListener> listeners_;
    std::atomic<std::size_t> next_listener_id_;

    // Published snapshot
    mutable std::mutex state_mutex_;
    mutable std::condition_variable state_cv_;
    transfer::TransferState state_snapshot_;
    std::vector<transport::Peer> peers_snapshot_;
    std::shared_ptr<transport::Transport> transport_snapshot_;
    std::optional<transport::Peer> peer_snapshot_;
};

} // namespace nearshare::session
