#include "nearshare/session/transfer_coordinator.hpp"
#include "nearshare/core/logger.hpp"
#include "nearshare/transfer/batch_progress.hpp"
#include <boost/asio/post.hpp>

namespace nearshare::session {

using core::Result;
using core::TransferError;
using transport::Peer;
using transport::TransportSelection;
namespace state = transfer::state;

TransferCoordinator::TransferCoordinator(TransportSelector selector,
                                         std::shared_ptr<transport::PermissionGate> permissions,
                                         std::shared_ptr<storage::ContentResolver> resolver)
    : selector_(std::move(selector))
    , permissions_(std::move(permissions))
    , resolver_(std::move(resolver))
    , running_(false)
    , next_generation_(0)
    , next_listener_id_(1)
    , state_snapshot_(state::Idle{}) {
}

TransferCoordinator::~TransferCoordinator() {
    stop();
}

void TransferCoordinator::start() {
    if (running_.exchange(true)) {
        return;
    }
    io_context_.restart();
    work_guard_.emplace(io_context_.get_executor());
    io_thread_ = std::thread([this]() { run_io(); });
    LOG_DEBUG("Transfer coordinator started");
}

void TransferCoordinator::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    boost::asio::post(io_context_, [this]() {
        stop_operation();
        teardown();
    });
    work_guard_.reset();

    if (io_thread_.joinable()) {
        if (io_thread_.get_id() == std::this_thread::get_id()) {
            io_thread_.detach();
        } else {
            io_thread_.join();
        }
    }
    LOG_DEBUG("Transfer coordinator stopped");
}

void TransferCoordinator::run_io() {
    try {
        io_context_.run();
    } catch (const std::exception& e) {
        LOG_ERROR("Coordinator event loop error: {}", e.what());
    }
}

// -- Commands ---------------------------------------------------------------

void TransferCoordinator::start_discovery(TransportSelection selection) {
    boost::asio::post(io_context_, [this, selection]() { do_start_discovery(selection); });
}

void TransferCoordinator::stop_discovery() {
    boost::asio::post(io_context_, [this]() { do_stop_discovery(); });
}

void TransferCoordinator::select_peer(const std::string& identity) {
    boost::asio::post(io_context_, [this, identity]() { do_select_peer(identity); });
}

void TransferCoordinator::connect() {
    boost::asio::post(io_context_, [this]() {
        if (!selected_) {
            LOG_WARN("Connect rejected: no peer selected");
            return;
        }
        do_connect(*selected_);
    });
}

void TransferCoordinator::connect(const Peer& peer) {
    boost::asio::post(io_context_, [this, peer]() {
        selected_ = peer;
        do_connect(peer);
    });
}

void TransferCoordinator::send(std::vector<storage::ResourceHandle> handles) {
    boost::asio::post(io_context_, [this, handles = std::move(handles)]() { do_send(handles); });
}

void TransferCoordinator::receive(TransportSelection selection) {
    boost::asio::post(io_context_, [this, selection]() { do_receive(selection); });
}

void TransferCoordinator::pause() {
    boost::asio::post(io_context_, [this]() { do_pause(); });
}

void TransferCoordinator::resume() {
    boost::asio::post(io_context_, [this]() { do_resume(); });
}

void TransferCoordinator::cancel() {
    boost::asio::post(io_context_, [this]() { do_cancel(); });
}

void TransferCoordinator::disconnect() {
    boost::asio::post(io_context_, [this]() { do_disconnect(); });
}

std::size_t TransferCoordinator::add_listener(StateListener listener) {
    std::size_t id = next_listener_id_++;
    boost::asio::post(io_context_, [this, id, listener = std::move(listener)]() {
        listener(machine_.current());
        listeners_.emplace(id, listener);
    });
    return id;
}

void TransferCoordinator::remove_listener(std::size_t id) {
    boost::asio::post(io_context_, [this, id]() { listeners_.erase(id); });
}

// -- Snapshots --------------------------------------------------------------

transfer::TransferState TransferCoordinator::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_snapshot_;
}

std::vector<Peer> TransferCoordinator::discovered_peers() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return peers_snapshot_;
}

std::shared_ptr<transport::Transport> TransferCoordinator::active_transport() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return transport_snapshot_;
}

std::optional<Peer> TransferCoordinator::session_peer() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return peer_snapshot_;
}

bool TransferCoordinator::wait_until(const StatePredicate& predicate, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return state_cv_.wait_for(lock, timeout, [&]() { return predicate(state_snapshot_); });
}

// -- Discovery --------------------------------------------------------------

void TransferCoordinator::do_start_discovery(TransportSelection selection) {
    Phase phase = machine_.phase();
    if (is_busy()) {
        LOG_WARN("Discovery rejected while {}", transfer::state_name(machine_.current()));
        return;
    }

    stop_operation();
    teardown();
    if (phase == Phase::CONNECTED) {
        publish(state::Idle{});
    }

    auto selected = selector_.select(selection);
    if (!selected) {
        fail(selected.error());
        return;
    }
    auto transport = selected.value();

    if (!permissions_ || !permissions_->has_required_permissions(transport->kind())) {
        LOG_WARN("Discovery refused: {} permission missing", transport::to_string(transport->kind()));
        fail(TransferError::permission_denied());
        return;
    }

    adopt_transport(transport);
    aggregator_.reset();
    refresh_snapshot();
    publish(state::Discovering{});

    LOG_INFO("Starting discovery over {}", transport::to_string(transport->kind()));
    auto stream = transport->start_discovery();

    Operation& op = begin_operation("discovery");
    op.set_interrupt([stream]() { stream->cancel(); });
    std::uint64_t generation = op.generation();
    op.start([this, stream, generation](Operation& self) {
        while (auto event = stream->next()) {
            if (self.is_cancelled()) {
                return;
            }
            boost::asio::post(io_context_, [this, generation, event = std::move(*event)]() {
                on_discovery_event(generation, event);
            });
        }
        if (!self.is_cancelled()) {
            boost::asio::post(io_context_, [this, generation]() { on_discovery_finished(generation); });
        }
    });
}

void TransferCoordinator::on_discovery_event(std::uint64_t generation, const Result<Peer>& event) {
    if (!is_current(generation)) {
        return;
    }

    if (!event) {
        if (aggregator_.empty()) {
            stop_operation();
            fail(event.error());
            teardown();
        } else {
            LOG_WARN("Ignoring discovery error: {}", event.error().describe());
        }
        return;
    }

    const Peer& peer = event.value();
    if (aggregator_.upsert(peer)) {
        LOG_DEBUG("Peer {} ({}) discovered", peer.display_name, peer.identity);
        refresh_snapshot();
        publish(state::DevicesFound{aggregator_.peers()});
    }
}

void TransferCoordinator::on_discovery_finished(std::uint64_t generation) {
    if (!is_current(generation)) {
        return;
    }
    finish_operation();

    if (aggregator_.empty()) {
        fail(TransferError::peer_not_found());
        teardown();
        return;
    }
    LOG_INFO("Discovery finished with {} device(s)", aggregator_.size());
}

void TransferCoordinator::do_stop_discovery() {
    Phase phase = machine_.phase();
    if (phase != Phase::DISCOVERING && phase != Phase::DEVICES_FOUND) {
        return;
    }

    stop_operation();
    if (transport_) {
        transport_->stop_discovery();
    }
    LOG_INFO("Discovery stopped");

    if (aggregator_.empty()) {
        teardown();
        publish(state::Idle{});
    }
}

// -- Connect ----------------------------------------------------------------

void TransferCoordinator::do_select_peer(const std::string& identity) {
    auto peer = aggregator_.find(identity);
    if (!peer) {
        LOG_WARN("Select rejected: peer {} was not discovered", identity);
        return;
    }
    selected_ = peer;
    do_connect(*peer);
}

void TransferCoordinator::do_connect(const Peer& peer) {
    if (is_busy()) {
        LOG_WARN("Connect rejected while {}", transfer::state_name(machine_.current()));
        return;
    }

    stop_operation();
    if (transport_) {
        transport_->stop_discovery();
    }

    Phase phase = machine_.phase();
    if (phase == Phase::CONNECTED || phase == Phase::COMPLETED || phase == Phase::CANCELLED) {
        teardown();
        publish(state::Idle{});
    }

    auto transport = transport_;
    if (!transport || transport->kind() != peer.medium) {
        transport = selector_.find(peer.medium);
        if (!transport) {
            fail(TransferError::unsupported(std::string("No ") + std::string(transport::to_string(peer.medium)) +
                                            " transport registered"));
            teardown();
            return;
        }
        if (transport_) {
            transport_->disconnect();
        }
    }

    if (!permissions_ || !permissions_->has_required_permissions(transport->kind())) {
        LOG_WARN("Connect refused: {} permission missing", transport::to_string(transport->kind()));
        fail(TransferError::permission_denied());
        teardown();
        return;
    }

    adopt_transport(transport);
    peer_ = peer;
    refresh_snapshot();
    if (!publish(state::Connecting{peer})) {
        return;
    }

    Operation& op = begin_operation("connect");
    op.set_interrupt([transport]() { transport->disconnect(); });
    std::uint64_t generation = op.generation();
    op.start([this, transport, peer, generation](Operation& self) {
        if (self.is_cancelled()) {
            return;
        }
        auto result = transport->connect(peer, self.control());
        if (self.is_cancelled()) {
            return;
        }
        boost::asio::post(io_context_, [this, generation, result]() { on_connect_result(generation, result); });
    });
}

void TransferCoordinator::on_connect_result(std::uint64_t generation, const Result<void>& result) {
    if (!is_current(generation)) {
        return;
    }
    finish_operation();

    if (!result || !transport_ || !peer_) {
        // Keep the transport and peer so a new connect can be issued.
        fail(result ? TransferError::connection_lost("Session closed while connecting") : result.error());
        return;
    }

    Peer connected = transport_->get_connected_peer().value_or(*peer_);
    connected.connected = true;
    peer_ = connected;
    refresh_snapshot();
    LOG_INFO("Connected to {} ({})", connected.display_name, connected.identity);
    publish(state::Connected{connected});
}

// -- Transfer ---------------------------------------------------------------

void TransferCoordinator::do_send(const std::vector<storage::ResourceHandle>& handles) {
    if (machine_.phase() != Phase::CONNECTED || !transport_) {
        LOG_WARN("Send rejected while {}", transfer::state_name(machine_.current()));
        return;
    }

    std::vector<storage::TransferableFile> files;
    std::int64_t bytes_total = 0;
    for (const auto& handle : handles) {
        std::optional<storage::TransferableFile> file;
        if (resolver_) {
            file = resolver_->resolve(handle);
        }
        if (!file) {
            LOG_WARN("Skipping unavailable file {}", handle);
            continue;
        }
        bytes_total += file->size_bytes;
        files.push_back(std::move(*file));
    }

    if (files.empty()) {
        fail(TransferError::file_io("No files available to send"));
        teardown();
        return;
    }

    LOG_INFO("Sending {} file(s), {} bytes total", files.size(), bytes_total);
    last_progress_ = state::Transferring{};
    last_progress_.bytes_total = bytes_total;
    last_progress_.current_file_name = files.front().safe_name();
    publish(last_progress_);

    auto transport = transport_;
    Operation& op = begin_operation("send");
    op.set_interrupt([transport]() { transport->disconnect(); });
    std::uint64_t generation = op.generation();
    op.start([this, transport, files, bytes_total, generation](Operation& self) {
        transfer::BatchProgress batch(bytes_total);

        for (const auto& file : files) {
            batch.begin_file(file.safe_name());
            auto report = [this, &batch, generation](const transfer::ProgressUpdate& update) {
                auto snapshot = batch.on_file_progress(update);
                boost::asio::post(io_context_, [this, generation, snapshot]() {
                    this->on_progress(generation, snapshot);
                });
            };

            auto result = transport->send_file(file, report, self.control());
            if (self.is_cancelled()) {
                return;
            }
            if (!result) {
                LOG_ERROR("Sending {} failed after {} of {} bytes", file.safe_name(),
                          batch.bytes_done(), batch.bytes_total());
                boost::asio::post(io_context_, [this, generation, error = result.error()]() {
                    on_operation_failed(generation, error);
                });
                return;
            }
            batch.end_file(file.size_bytes);
            LOG_INFO("Sent {} ({} bytes)", file.safe_name(), file.size_bytes);
        }

        state::Completed completed{files.size(), bytes_total, batch.elapsed_ms()};
        boost::asio::post(io_context_, [this, generation, completed]() { on_batch_completed(generation, completed); });
    });
}

void TransferCoordinator::do_receive(TransportSelection selection) {
    if (is_busy()) {
        LOG_WARN("Receive rejected while {}", transfer::state_name(machine_.current()));
        return;
    }

    stop_operation();

    Phase phase = machine_.phase();
    bool connected = phase == Phase::CONNECTED && transport_ && transport_->get_connected_peer();
    std::shared_ptr<transport::Transport> transport;

    if (connected) {
        transport = transport_;
    } else {
        teardown();
        if (phase != Phase::IDLE) {
            publish(state::Idle{});
        }

        auto selected = selector_.select(selection);
        if (!selected) {
            fail(selected.error());
            return;
        }
        transport = selected.value();

        if (!permissions_ || !permissions_->has_required_permissions(transport->kind())) {
            LOG_WARN("Receive refused: {} permission missing", transport::to_string(transport->kind()));
            fail(TransferError::permission_denied());
            return;
        }
        adopt_transport(transport);
        refresh_snapshot();
        LOG_INFO("Waiting for an incoming {} connection", transport::to_string(transport->kind()));
    }

    last_progress_ = state::Transferring{};

    Operation& op = begin_operation("receive");
    op.set_interrupt([transport]() { transport->disconnect(); });
    std::uint64_t generation = op.generation();
    op.start([this, transport, connected, generation](Operation& self) {
        if (self.is_cancelled()) {
            return;
        }
        if (!connected) {
            auto accepted = transport->accept(self.control());
            if (self.is_cancelled()) {
                return;
            }
            if (!accepted) {
                boost::asio::post(io_context_, [this, generation, error = accepted.error()]() {
                    on_operation_failed(generation, error);
                });
                return;
            }
            boost::asio::post(io_context_, [this, generation, peer = accepted.value()]() {
                on_accepted(generation, peer);
            });
        }

        auto started = std::chrono::steady_clock::now();
        std::size_t file_count = 0;
        std::int64_t bytes_total = 0;

        auto report = [this, generation](const transfer::ProgressUpdate& update) {
            state::Transferring snapshot;
            snapshot.progress_percent = update.percent;
            snapshot.bytes_done = update.bytes_done;
            snapshot.bytes_total = update.file_size;
            snapshot.bytes_per_second = update.bytes_per_second;
            snapshot.eta_millis = transfer::BatchProgress::compute_eta_ms(
                update.bytes_done, update.file_size, update.bytes_per_second);
            snapshot.current_file_name = update.file_name;
            boost::asio::post(io_context_, [this, generation, snapshot]() {
                this->on_progress(generation, snapshot);
            });
        };

        while (true) {
            auto received = transport->receive_file(report, self.control());
            if (self.is_cancelled()) {
                return;
            }
            if (!received) {
                boost::asio::post(io_context_, [this, generation, error = received.error()]() {
                    on_operation_failed(generation, error);
                });
                return;
            }
            if (!received.value()) {
                break;
            }
            ++file_count;
            bytes_total += received.value()->size_bytes;
            LOG_INFO("Received {} ({} bytes)", received.value()->name, received.value()->size_bytes);
        }

        if (file_count == 0) {
            boost::asio::post(io_context_, [this, generation]() {
                on_operation_failed(generation, TransferError::connection_lost("Sender closed before sending any file"));
            });
            return;
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        state::Completed completed{file_count, bytes_total, elapsed};
        boost::asio::post(io_context_, [this, generation, completed]() { on_batch_completed(generation, completed); });
    });
}

void TransferCoordinator::on_accepted(std::uint64_t generation, const Peer& peer) {
    if (!is_current(generation)) {
        return;
    }
    Peer connected = peer;
    connected.connected = true;
    peer_ = connected;
    refresh_snapshot();
    LOG_INFO("Accepted connection from {} ({})", connected.display_name, connected.identity);
    publish(state::Connected{connected});
}

void TransferCoordinator::on_progress(std::uint64_t generation, const state::Transferring& progress) {
    if (!is_current(generation)) {
        return;
    }
    last_progress_ = progress;
    if (machine_.phase() == Phase::PAUSED) {
        return;
    }
    publish(progress);
}

void TransferCoordinator::on_operation_failed(std::uint64_t generation, const TransferError& error) {
    if (!is_current(generation)) {
        return;
    }
    finish_operation();
    fail(error);
    teardown();
}

void TransferCoordinator::on_batch_completed(std::uint64_t generation, const state::Completed& completed) {
    if (!is_current(generation)) {
        return;
    }
    finish_operation();
    leave_paused();
    LOG_INFO("Batch completed: {} file(s), {} bytes in {} ms",
             completed.file_count, completed.bytes_total, completed.duration_millis);
    publish(completed);
    teardown();
}

// -- Pause / cancel / disconnect -----------------------------------------------

void TransferCoordinator::do_pause() {
    if (machine_.phase() != Phase::TRANSFERRING || !operation_) {
        LOG_WARN("Pause rejected while {}", transfer::state_name(machine_.current()));
        return;
    }
    operation_->control().pause();
    LOG_INFO("Transfer paused at {}%", last_progress_.progress_percent);
    publish(state::Paused{last_progress_.progress_percent});
}

void TransferCoordinator::do_resume() {
    if (machine_.phase() != Phase::PAUSED || !operation_) {
        LOG_WARN("Resume rejected while {}", transfer::state_name(machine_.current()));
        return;
    }
    operation_->control().resume();
    LOG_INFO("Transfer resumed");
    publish(last_progress_);
}

void TransferCoordinator::do_cancel() {
    LOG_INFO("Cancelling session in state {}", transfer::state_name(machine_.current()));
    stop_operation();
    teardown();
    publish(state::Cancelled{});
}

void TransferCoordinator::do_disconnect() {
    Phase phase = machine_.phase();
    if (is_busy()) {
        do_cancel();
        return;
    }

    stop_operation();
    teardown();
    if (phase != Phase::IDLE) {
        publish(state::Idle{});
    }
}

// -- Helpers ----------------------------------------------------------------

bool TransferCoordinator::is_busy() const {
    Phase phase = machine_.phase();
    return phase == Phase::CONNECTING || phase == Phase::TRANSFERRING || phase == Phase::PAUSED;
}

Operation& TransferCoordinator::begin_operation(const std::string& name) {
    stop_operation();
    operation_ = std::make_unique<Operation>(name, ++next_generation_);
    return *operation_;
}

void TransferCoordinator::finish_operation() {
    if (operation_) {
        operation_->join();
        operation_.reset();
    }
}

void TransferCoordinator::stop_operation() {
    if (!operation_) {
        return;
    }
    if (!operation_->is_finished()) {
        LOG_DEBUG("Stopping operation '{}'", operation_->name());
    }
    operation_->cancel();
    operation_->join();
    operation_.reset();
}

bool TransferCoordinator::publish(transfer::TransferState next) {
    std::string_view from = transfer::state_name(machine_.current());
    if (!machine_.transition(next, transport_ != nullptr)) {
        LOG_WARN("Rejected state transition {} -> {}", from, transfer::state_name(next));
        return false;
    }
    LOG_DEBUG("State {} -> {}", from, transfer::describe(machine_.current()));

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_snapshot_ = machine_.current();
    }
    state_cv_.notify_all();

    for (const auto& entry : listeners_) {
        entry.second(machine_.current());
    }
    return true;
}

void TransferCoordinator::fail(const TransferError& error) {
    LOG_ERROR("Session failed: {}", error.describe());
    Phase phase = machine_.phase();
    if (phase == Phase::COMPLETED || phase == Phase::CANCELLED) {
        publish(state::Idle{});
    }
    publish(transfer::make_failed(error));
}

void TransferCoordinator::leave_paused() {
    if (machine_.phase() == Phase::PAUSED) {
        publish(last_progress_);
    }
}

void TransferCoordinator::teardown() {
    if (transport_) {
        transport_->stop_discovery();
        transport_->disconnect();
    }
    transport_.reset();
    peer_.reset();
    selected_.reset();
    aggregator_.reset();
    refresh_snapshot();
}

void TransferCoordinator::adopt_transport(std::shared_ptr<transport::Transport> transport) {
    if (transport_ && transport_ != transport) {
        transport_->stop_discovery();
        transport_->disconnect();
    }
    transport_ = std::move(transport);
}

void TransferCoordinator::refresh_snapshot() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    peers_snapshot_ = aggregator_.peers();
    transport_snapshot_ = transport_;
    peer_snapshot_ = peer_;
}

} // namespace nearshare::session
