/*
 * PeerLink - peer node runtime implementation
 */

#include "node.hpp"

#include "errors.hpp"
#include "utils.hpp"

#include <algorithm>
#include <system_error>

namespace peerlink {

namespace {

// Secret service first, moving an older key file into it. The key file is
// kept where no secret service answers.
std::shared_ptr<KeyStore> open_key_store(KeyStoreKind kind, const std::filesystem::path& data_dir) {
    auto file_store = std::make_shared<FileKeyStore>(data_dir / "keys");
    if (kind == KeyStoreKind::File) {
        return file_store;
    }

    std::error_code ec;
    auto account = std::filesystem::absolute(data_dir, ec);
    auto secret_store = std::make_shared<SecretServiceKeyStore>(ec ? data_dir.string() : account.string());
    try {
        if (!secret_store->load_key()) {
            if (auto existing = file_store->load_key()) {
                secret_store->store_key(*existing);
                file_store->remove_key();
                log_info("Moved the at-rest key into the secret service");
            }
        }
        return secret_store;
    } catch (const PeerLinkError& ex) {
        if (kind == KeyStoreKind::SecretService) {
            throw;
        }
        log_warn(std::string("Secret service unavailable, keeping the at-rest key in a file: ") + ex.what());
        return file_store;
    }
}

} // namespace

PeerNode::PeerNode(NodeConfig config) : config_(std::move(config)) {}

PeerNode::~PeerNode() {
    stop();
}

void PeerNode::start() {
    if (running_) {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.data_dir, ec);
    if (ec) {
        throw PeerLinkError(ErrorKind::IoFailure,
                            "Cannot create data directory " + config_.data_dir.string() + ": " + ec.message());
    }

    encryptor_ = std::make_unique<AtRestEncryptor>(open_key_store(config_.key_store, config_.data_dir));

    trust_path_ = config_.data_dir / "trust.bin";
    try {
        if (trust_.load(trust_path_, *encryptor_)) {
            log_info("Loaded " + std::to_string(trust_.size()) + " pinned peer(s)");
        }
    } catch (const PeerLinkError& ex) {
        log_error(std::string("Pinned fingerprints unreadable, starting without pins: ") + ex.what());
    }

    history_ = std::make_unique<TransferHistoryStore>(config_.data_dir / "history.bin", *encryptor_);
    history_->load();

    listener_ = std::make_unique<SecureListener>(identity_, config_.bind_address, config_.listen_port);
    listen_port_ = listener_->port();

    SessionSettings settings;
    settings.local_id = config_.peer_id;
    settings.display_name = config_.display_name;
    settings.local_fingerprint = identity_.fingerprint();
    settings.download_dir = config_.effective_download_dir();
    settings.heartbeat_interval = std::chrono::milliseconds(config_.heartbeat_interval_ms);
    settings.heartbeat_timeout = std::chrono::milliseconds(config_.heartbeat_timeout_ms);
    settings.establish_timeout = std::chrono::milliseconds(config_.establish_timeout_ms);
    settings.file_transfer_enabled = config_.file_transfer_enabled;
    settings.chat_enabled = config_.chat_enabled;
    settings.voice_enabled = config_.voice_enabled;

    session_ = std::make_unique<Session>(std::move(settings), trust_, static_cast<SessionDelegate&>(*this));
    session_->set_observer(static_cast<SessionObserver*>(this));
    session_->set_record_sink(history_.get());
    session_->set_chat_sink(chat_sink_);
    session_->set_call_sink(call_sink_);

    running_ = true;
    event_thread_ = std::thread(&PeerNode::event_loop, this);
    accept_thread_ = std::thread(&PeerNode::accept_loop, this);

    log_info("Node " + short_id(config_.peer_id) + " (" + config_.display_name + ") listening on port " +
             std::to_string(listen_port_));
    log_info("Fingerprint " + format_fingerprint(identity_.fingerprint()));
}

void PeerNode::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    queue_.close();
    if (event_thread_.joinable()) {
        event_thread_.join();
    }

    if (listener_) {
        listener_->close();
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        for (auto& entry : channels_) {
            entry.second.cancel->store(true);
            if (entry.second.channel) {
                entry.second.channel->close();
            }
        }
        channels_.clear();
    }
    cancel_outbound();
    if (sender_thread_.joinable()) {
        sender_thread_.join();
    }

    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }

    // Discards any partial inbound file.
    session_.reset();
    log_info("Node stopped");
}

void PeerNode::post(SessionEvent event) {
    if (!queue_.push(std::move(event))) {
        log_debug("Dropping event posted after stop");
    }
}

bool PeerNode::reconnect() {
    std::string peer_id;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        peer_id = last_peer_id_;
    }
    if (peer_id.empty()) {
        log_warn("No previous peer to reconnect to");
        return false;
    }
    auto delay = retry_.next_delay();
    if (!delay) {
        log_warn("Reconnect attempts to " + short_id(peer_id) + " exhausted");
        return false;
    }
    log_info("Reconnecting to " + short_id(peer_id) + " in " + std::to_string(delay->count()) + " ms (attempt " +
             std::to_string(retry_.current_attempt()) + ")");
    {
        std::lock_guard<std::mutex> lock(schedule_mutex_);
        scheduled_connect_ = std::make_pair(std::chrono::steady_clock::now() + *delay, peer_id);
    }
    queue_.wake();
    return true;
}

ConnectionState PeerNode::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::optional<PeerIdentity> PeerNode::remote_peer() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return remote_;
}

bool PeerNode::wait_for_state(ConnectionStatus status, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return state_cv_.wait_for(lock, timeout, [this, status] { return state_.status == status; });
}

std::vector<TransferRecord> PeerNode::history() const {
    if (!history_) {
        return {};
    }
    return history_->entries();
}

// ---------------------------------------------------------------------------
// Threads

void PeerNode::event_loop() {
    const auto tick_interval = std::chrono::milliseconds(config_.tick_interval_ms);
    auto next_tick = std::chrono::steady_clock::now() + tick_interval;

    auto dispatch = [this](const SessionEvent& event) {
        try {
            session_->handle(event);
        } catch (const std::exception& ex) {
            log_error(std::string("Session event failed: ") + ex.what());
        }
    };

    while (running_) {
        auto wake_at = next_tick;
        {
            std::lock_guard<std::mutex> lock(schedule_mutex_);
            if (scheduled_connect_) {
                wake_at = std::min(wake_at, scheduled_connect_->first);
            }
        }
        std::optional<SessionEvent> event = queue_.pop(wake_at);
        if (!running_) {
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= next_tick) {
            dispatch(events::Tick{});
            next_tick = now + tick_interval;
        }
        std::optional<std::string> due;
        {
            std::lock_guard<std::mutex> lock(schedule_mutex_);
            if (scheduled_connect_ && now >= scheduled_connect_->first) {
                due = scheduled_connect_->second;
                scheduled_connect_.reset();
            }
        }
        if (due) {
            dispatch(events::ConnectIntent{*due});
        }
        if (event) {
            dispatch(*event);
        }
    }
}

void PeerNode::accept_loop() {
    while (running_) {
        std::unique_ptr<IncomingConnection> connection;
        try {
            connection = listener_->next_connection();
        } catch (const std::exception& ex) {
            log_error(std::string("Listener failed: ") + ex.what());
            break;
        }
        if (!connection) {
            break;
        }
        // The handshake runs on its own thread so a stalled client holds up no one else.
        std::shared_ptr<IncomingConnection> pending(std::move(connection));
        spawn([this, pending] { run_incoming(pending); });
    }
}

void PeerNode::run_incoming(std::shared_ptr<IncomingConnection> connection) {
    std::unique_ptr<SecureChannel> accepted;
    try {
        accepted = listener_->handshake(*connection, std::chrono::milliseconds(config_.establish_timeout_ms));
    } catch (const PeerLinkError& ex) {
        log_warn("Rejected connection from " + connection->remote_address() + ": " + ex.what());
        return;
    }

    const uint64_t generation = next_generation_++;
    std::shared_ptr<SecureChannel> channel(std::move(accepted));
    if (!register_channel(generation, channel)) {
        channel->close();
        return;
    }
    post(events::IncomingChannel{generation, channel->peer_fingerprint(), channel->remote_address()});
    read_loop(generation, channel);
}

void PeerNode::run_outgoing(uint64_t generation,
                            PeerCandidate peer,
                            std::optional<std::string> expected_fingerprint,
                            std::shared_ptr<std::atomic<bool>> cancel) {
    std::shared_ptr<SecureChannel> channel;
    try {
        channel = connect_secure(identity_, peer.host, peer.port, expected_fingerprint,
                                 std::chrono::milliseconds(config_.establish_timeout_ms), cancel.get());
    } catch (const PeerLinkError& ex) {
        post(events::ChannelFailed{generation, ex.kind(), ex.what()});
        return;
    } catch (const std::exception& ex) {
        post(events::ChannelFailed{generation, ErrorKind::ChannelFailure, ex.what()});
        return;
    }

    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        auto it = channels_.find(generation);
        if (it == channels_.end() || cancel->load()) {
            channel->close();
            return;
        }
        it->second.channel = channel;
    }
    post(events::ChannelOpened{generation, channel->peer_fingerprint()});
    read_loop(generation, channel);
}

void PeerNode::read_loop(uint64_t generation, std::shared_ptr<SecureChannel> channel) {
    while (true) {
        try {
            auto envelope = channel->receive_envelope();
            if (!envelope) {
                post(events::ChannelClosed{generation});
                return;
            }
            post(events::MessageReceived{generation, std::move(*envelope)});
        } catch (const PeerLinkError& ex) {
            if (is_protocol_error(ex.kind()) && ex.kind() != ErrorKind::FrameTooLarge) {
                log_warn(std::string("Dropping malformed frame: ") + ex.what());
                continue;
            }
            if (!channel->is_open()) {
                post(events::ChannelClosed{generation});
            } else {
                post(events::ChannelFailed{generation, ex.kind(), ex.what()});
            }
            return;
        }
    }
}

void PeerNode::spawn(std::function<void()> task) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
    workers_.push_back(Worker{std::thread([task = std::move(task), done] {
                                  try {
                                      task();
                                  } catch (const std::exception& ex) {
                                      log_error(std::string("Worker failed: ") + ex.what());
                                  }
                                  done->store(true);
                              }),
                              done});
}

bool PeerNode::register_channel(uint64_t generation, const std::shared_ptr<SecureChannel>& channel) {
    std::lock_guard<std::mutex> lock(channels_mutex_);
    if (!running_) {
        return false;
    }
    channels_[generation] = ChannelSlot{channel, std::make_shared<std::atomic<bool>>(false)};
    return true;
}

// ---------------------------------------------------------------------------
// SessionDelegate

uint64_t PeerNode::open_channel(const PeerCandidate& peer, const std::optional<std::string>& expected_fingerprint) {
    const uint64_t generation = next_generation_++;
    auto cancel = std::make_shared<std::atomic<bool>>(false);
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        channels_[generation] = ChannelSlot{nullptr, cancel};
    }
    spawn([this, generation, peer, expected_fingerprint, cancel] {
        run_outgoing(generation, peer, expected_fingerprint, cancel);
    });
    return generation;
}

void PeerNode::close_channel(uint64_t generation) {
    std::shared_ptr<SecureChannel> channel;
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        auto it = channels_.find(generation);
        if (it == channels_.end()) {
            return;
        }
        it->second.cancel->store(true);
        channel = it->second.channel;
        channels_.erase(it);
    }
    if (channel) {
        channel->close();
    }
}

bool PeerNode::send(uint64_t generation, const Envelope& envelope) {
    std::shared_ptr<SecureChannel> channel;
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        auto it = channels_.find(generation);
        if (it == channels_.end() || !it->second.channel) {
            return false;
        }
        channel = it->second.channel;
    }
    return channel->send_envelope(envelope);
}

void PeerNode::start_outbound(uint64_t generation,
                              const std::string& peer_id,
                              const std::vector<std::filesystem::path>& paths) {
    if (sender_thread_.joinable()) {
        sender_thread_.join();
    }
    auto sender = std::make_shared<FileSender>(
        config_.peer_id, peer_id, [this, generation](const Envelope& envelope) { return send(generation, envelope); },
        config_.chunk_size, std::chrono::milliseconds(config_.offer_response_timeout_ms));
    {
        std::lock_guard<std::mutex> lock(outbound_mutex_);
        outbound_ = sender;
    }
    sender_thread_ = std::thread([this, generation, sender, paths] {
        std::vector<TransferRecord> records;
        try {
            records = sender->send_files(paths, [this, generation](double progress) {
                post(events::OutboundProgress{generation, progress});
            });
        } catch (const std::exception& ex) {
            log_error(std::string("Outbound transfer aborted: ") + ex.what());
        }
        post(events::OutboundFinished{generation, std::move(records)});
    });
}

void PeerNode::cancel_outbound() {
    std::lock_guard<std::mutex> lock(outbound_mutex_);
    if (outbound_) {
        outbound_->cancel();
    }
}

bool PeerNode::resolve_outbound_offer(bool accepted, const std::optional<std::string>& reason) {
    std::lock_guard<std::mutex> lock(outbound_mutex_);
    return outbound_ && outbound_->resolve_offer(accepted, reason);
}

// ---------------------------------------------------------------------------
// SessionObserver

void PeerNode::on_state_changed(const ConnectionState& state) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = state;
        remote_ = session_->remote_peer();
        std::string current = session_->current_peer_id();
        if (!current.empty()) {
            last_peer_id_ = current;
        }
    }
    state_cv_.notify_all();
    if (state.status == ConnectionStatus::Connected) {
        retry_.reset();
    }
    if (external_observer_) {
        external_observer_->on_state_changed(state);
    }
}

void PeerNode::on_incoming_request(const PeerIdentity& peer) {
    if (external_observer_) {
        external_observer_->on_incoming_request(peer);
    }
}

void PeerNode::on_notice(const std::string& text) {
    if (external_observer_) {
        external_observer_->on_notice(text);
    }
}

void PeerNode::on_security_warning(const std::string& text) {
    if (external_observer_) {
        external_observer_->on_security_warning(text);
    }
}

void PeerNode::on_peer_pinned(const std::string& peer_id, const std::string& fingerprint) {
    log_info("Pinned " + short_id(peer_id) + " to " + format_fingerprint(fingerprint));
    save_trust();
    if (external_observer_) {
        external_observer_->on_peer_pinned(peer_id, fingerprint);
    }
}

void PeerNode::on_batch_complete(const BatchSummary& summary) {
    if (external_observer_) {
        external_observer_->on_batch_complete(summary);
    }
}

void PeerNode::save_trust() {
    try {
        trust_.save(trust_path_, *encryptor_);
    } catch (const PeerLinkError& ex) {
        log_error(std::string("Failed to persist pinned fingerprints: ") + ex.what());
    }
}

} // namespace peerlink
