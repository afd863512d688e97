/*
 * PeerLink - session state machine implementation
 */

#include "session.hpp"

#include "certificate.hpp"
#include "trust_store.hpp"
#include "utils.hpp"

#include <algorithm>
#include <utility>

namespace peerlink {

Session::Session(SessionSettings settings, TrustStore& trust, SessionDelegate& delegate, SessionClock clock)
    : settings_(std::move(settings)),
      trust_(trust),
      delegate_(delegate),
      clock_(clock ? std::move(clock) : SessionClock(monotonic_millis)) {
    state_entered_at_ = now();
}

Session::~Session() = default;

void Session::handle(const SessionEvent& event) {
    std::visit([this](const auto& e) { on_event(e); }, event);
}

std::vector<PeerCandidate> Session::discovered_peers() const {
    std::vector<PeerCandidate> peers;
    for (const auto& entry : discovered_) {
        peers.push_back(entry.second);
    }
    return peers;
}

// ---------------------------------------------------------------------------
// Discovery

void Session::on_event(const events::StartDiscovery&) {
    if (state_.status == ConnectionStatus::Discovering || state_.status == ConnectionStatus::PeerFound) {
        return;
    }
    if (!transition(ConnectionState::of(ConnectionStatus::Discovering))) {
        notice("Cannot browse for peers while " + state_.to_string());
        return;
    }
    if (!discovered_.empty()) {
        transition(ConnectionState::of(ConnectionStatus::PeerFound));
    }
}

void Session::on_event(const events::StopDiscovery&) {
    if (state_.status == ConnectionStatus::Discovering || state_.status == ConnectionStatus::PeerFound) {
        transition(ConnectionState::of(ConnectionStatus::Idle));
    }
}

void Session::on_event(const events::PeerDiscovered& event) {
    if (event.peer.id.empty()) {
        log_warn("Ignoring discovered peer without identifier");
        return;
    }
    discovered_[event.peer.id] = event.peer;
    log_debug("Discovered " + event.peer.display_name + " at " + event.peer.host + ":" +
              std::to_string(event.peer.port));
    if (state_.status == ConnectionStatus::Discovering) {
        transition(ConnectionState::of(ConnectionStatus::PeerFound));
    }
}

void Session::on_event(const events::PeerLost& event) {
    discovered_.erase(event.peer_id);
    if (state_.status == ConnectionStatus::PeerFound && discovered_.empty()) {
        transition(ConnectionState::of(ConnectionStatus::Discovering));
    }
}

// ---------------------------------------------------------------------------
// Connection establishment

void Session::on_event(const events::ConnectIntent& event) {
    auto it = discovered_.find(event.peer_id);
    if (it == discovered_.end()) {
        notice("Unknown peer " + short_id(event.peer_id));
        return;
    }
    if (state_.is_active()) {
        notice("Already " + state_.to_string() + "; disconnect first");
        return;
    }
    if (!breaker_.should_attempt(event.peer_id)) {
        notice("Not connecting to " + it->second.display_name + ": too many failed attempts");
        return;
    }

    if (state_.is_terminal()) {
        transition(ConnectionState::of(ConnectionStatus::Idle));
    }
    if (state_.status != ConnectionStatus::PeerFound) {
        transition(ConnectionState::of(ConnectionStatus::PeerFound));
    }
    if (!transition(ConnectionState::of(ConnectionStatus::Requesting))) {
        return;
    }

    role_ = Role::Outgoing;
    target_ = it->second;
    remote_.reset();
    remote_fingerprint_.clear();
    channel_open_ = false;
    generation_ = delegate_.open_channel(it->second, trust_.pinned(it->second.id));
    log_info("Connecting to " + it->second.display_name + " at " + it->second.host + ":" +
             std::to_string(it->second.port));
}

void Session::on_event(const events::ChannelOpened& event) {
    if (event.generation != generation_ || role_ != Role::Outgoing ||
        state_.status != ConnectionStatus::Requesting || !target_) {
        log_debug("Closing stale channel " + std::to_string(event.generation));
        delegate_.close_channel(event.generation);
        return;
    }

    channel_open_ = true;
    remote_fingerprint_ = event.peer_fingerprint;
    last_heard_at_ = now();

    switch (trust_.evaluate(target_->id, event.peer_fingerprint)) {
    case TrustDecision::Mismatch:
        breaker_.record_failure(target_->id);
        trust_failure(peer_label(), "presented key differs from the pinned key");
        return;
    case TrustDecision::FirstUse:
        if (observer_) {
            observer_->on_peer_pinned(target_->id, event.peer_fingerprint);
        }
        break;
    case TrustDecision::Match:
        break;
    }

    send(make_hello(settings_.local_id, local_identity()));
    send(make_connection_request(settings_.local_id));
}

void Session::on_event(const events::IncomingChannel& event) {
    PendingIncoming pending;
    pending.fingerprint = event.peer_fingerprint;
    pending.remote_address = event.remote_address;
    pending.opened_at = now();
    pending_[event.generation] = std::move(pending);
    log_info("Incoming channel from " + event.remote_address + " (" +
             format_fingerprint(event.peer_fingerprint).substr(0, 19) + "...)");
}

void Session::on_event(const events::AcceptIntent&) {
    if (state_.status != ConnectionStatus::IncomingRequest) {
        notice("No incoming request to accept");
        return;
    }
    send(make_connection_accept(settings_.local_id));
    send(make_hello(settings_.local_id, local_identity()));
    if (transition(ConnectionState::of(ConnectionStatus::Connecting))) {
        enter_connected();
    }
}

void Session::on_event(const events::RejectIntent& event) {
    if (state_.status != ConnectionStatus::IncomingRequest) {
        notice("No incoming request to reject");
        return;
    }
    send(make_connection_reject(settings_.local_id, event.reason));
    end_session(ConnectionState::rejected(event.reason.value_or("")), false);
}

void Session::on_event(const events::DisconnectIntent&) {
    if (!state_.is_active()) {
        notice("Not connected");
        return;
    }
    if (state_.status == ConnectionStatus::Requesting || state_.status == ConnectionStatus::Connecting) {
        if (channel_open_) {
            send(make_connection_cancel(settings_.local_id));
        }
        end_session(ConnectionState::of(ConnectionStatus::Disconnected), false);
        return;
    }
    end_session(ConnectionState::of(ConnectionStatus::Disconnected), true);
}

void Session::enter_connected() {
    if (!transition(ConnectionState::of(ConnectionStatus::Connected))) {
        return;
    }
    breaker_.record_success(remote_id());
    receiver_ = std::make_unique<FileReceiver>(settings_.download_dir, remote_id());
    inbound_active_ = false;
    outbound_active_ = false;
    last_heard_at_ = now();
    last_ping_at_ = last_heard_at_;
    notice("Connected to " + peer_label());
}

// ---------------------------------------------------------------------------
// Channel events

void Session::on_event(const events::ChannelFailed& event) {
    auto pending = pending_.find(event.generation);
    if (pending != pending_.end()) {
        log_warn("Incoming channel from " + pending->second.remote_address + " failed: " + event.reason);
        pending_.erase(pending);
        delegate_.close_channel(event.generation);
        return;
    }
    if (event.generation == 0 || event.generation != generation_) {
        log_debug("Ignoring failure of stale channel " + std::to_string(event.generation));
        return;
    }

    const bool establishing = state_.status == ConnectionStatus::Requesting ||
                              state_.status == ConnectionStatus::Connecting;
    if (role_ == Role::Outgoing && establishing) {
        breaker_.record_failure(remote_id());
    }
    if (event.kind == ErrorKind::FingerprintMismatch) {
        trust_failure(peer_label(), event.reason);
        return;
    }
    if (establishing || state_.status == ConnectionStatus::IncomingRequest) {
        fail("Could not connect to " + peer_label() + ": " + event.reason);
    } else {
        fail(event.reason);
    }
}

void Session::on_event(const events::ChannelClosed& event) {
    auto pending = pending_.find(event.generation);
    if (pending != pending_.end()) {
        log_debug("Incoming channel from " + pending->second.remote_address + " closed before a request");
        pending_.erase(pending);
        delegate_.close_channel(event.generation);
        return;
    }
    if (event.generation == 0 || event.generation != generation_) {
        return;
    }

    switch (state_.status) {
    case ConnectionStatus::Requesting:
    case ConnectionStatus::Connecting:
        if (role_ == Role::Outgoing) {
            breaker_.record_failure(remote_id());
        }
        fail("Connection closed by " + peer_label());
        break;
    case ConnectionStatus::IncomingRequest:
        notice(peer_label() + " went away");
        end_session(ConnectionState::of(ConnectionStatus::Disconnected), false);
        break;
    default:
        fail("Connection lost");
        break;
    }
}

void Session::on_event(const events::MessageReceived& event) {
    if (pending_.count(event.generation) != 0) {
        handle_pending_message(event.generation, event.envelope);
        return;
    }
    if (event.generation == 0 || event.generation != generation_ || !channel_open_) {
        log_debug(std::string("Ignoring ") + message_type_name(event.envelope.type) + " from stale channel");
        return;
    }

    last_heard_at_ = now();
    try {
        handle_message(event.envelope);
    } catch (const PeerLinkError& ex) {
        log_warn(std::string("Dropping ") + message_type_name(event.envelope.type) + " from " + peer_label() +
                 ": " + ex.what());
    }
}

void Session::handle_pending_message(uint64_t generation, const Envelope& envelope) {
    PendingIncoming& pending = pending_[generation];
    const std::string remote_address = pending.remote_address;
    auto drop_channel = [this, generation]() {
        pending_.erase(generation);
        delegate_.close_channel(generation);
    };

    try {
        switch (envelope.type) {
        case MessageType::Hello: {
            auto identity = decode_payload<PeerIdentity>(envelope);
            const std::string label =
                identity.display_name.empty() ? short_id(identity.id) : identity.display_name;
            bool mismatch = identity.certificate_fingerprint &&
                            !fingerprints_equal(*identity.certificate_fingerprint, pending.fingerprint);
            TrustDecision decision = TrustDecision::Mismatch;
            if (!mismatch) {
                decision = trust_.evaluate(identity.id, pending.fingerprint);
            }
            if (mismatch || decision == TrustDecision::Mismatch) {
                drop_channel();
                if (state_.is_active()) {
                    security_warning("Certificate fingerprint for " + label + " does not match the pinned key");
                } else {
                    trust_failure(label, "presented key differs from the pinned key");
                }
                return;
            }
            if (decision == TrustDecision::FirstUse && observer_) {
                observer_->on_peer_pinned(identity.id, pending.fingerprint);
            }
            pending.identity = std::move(identity);
            break;
        }
        case MessageType::ConnectionRequest: {
            if (!pending.identity) {
                log_warn("connectionRequest before hello from " + remote_address);
                drop_channel();
                return;
            }
            if (state_.is_active()) {
                delegate_.send(generation, make_connection_reject(settings_.local_id, std::string(kRejectBusy)));
                drop_channel();
                return;
            }
            if (state_.is_terminal() || state_.status == ConnectionStatus::Idle) {
                transition(ConnectionState::of(ConnectionStatus::Discovering));
            }
            if (!transition(ConnectionState::of(ConnectionStatus::IncomingRequest))) {
                drop_channel();
                return;
            }
            role_ = Role::Incoming;
            generation_ = generation;
            channel_open_ = true;
            target_.reset();
            remote_ = pending.identity;
            remote_fingerprint_ = pending.fingerprint;
            last_heard_at_ = now();
            pending_.erase(generation);
            if (observer_) {
                observer_->on_incoming_request(*remote_);
            }
            notice(peer_label() + " wants to connect");
            break;
        }
        case MessageType::Ping:
            delegate_.send(generation, make_pong(settings_.local_id));
            break;
        case MessageType::ConnectionCancel:
        case MessageType::Disconnect:
            drop_channel();
            break;
        default:
            log_debug(std::string("Ignoring ") + message_type_name(envelope.type) + " before a connection request");
            break;
        }
    } catch (const PeerLinkError& ex) {
        log_warn(std::string("Dropping ") + message_type_name(envelope.type) + " from " + remote_address + ": " +
                 ex.what());
    }
}

void Session::handle_message(const Envelope& envelope) {
    switch (envelope.type) {
    case MessageType::Hello:
        handle_hello(decode_payload<PeerIdentity>(envelope));
        return;
    case MessageType::ConnectionRequest:
        log_debug("Duplicate connectionRequest ignored");
        return;
    case MessageType::ConnectionAccept:
        if (role_ == Role::Outgoing && state_.status == ConnectionStatus::Requesting) {
            if (transition(ConnectionState::of(ConnectionStatus::Connecting))) {
                enter_connected();
            }
        }
        return;
    case MessageType::ConnectionReject:
        if (state_.status == ConnectionStatus::Requesting) {
            auto reason = reject_reason(envelope);
            notice(peer_label() + " declined the connection" + (reason ? ": " + *reason : std::string()));
            end_session(ConnectionState::rejected(reason.value_or("")), false);
        }
        return;
    case MessageType::ConnectionCancel:
        if (state_.status == ConnectionStatus::IncomingRequest || state_.status == ConnectionStatus::Connecting) {
            notice(peer_label() + " cancelled the request");
            end_session(ConnectionState::of(ConnectionStatus::Disconnected), false);
        }
        return;
    case MessageType::Disconnect:
        notice(peer_label() + " disconnected");
        end_session(ConnectionState::of(ConnectionStatus::Disconnected), false);
        return;
    case MessageType::Ping:
        send(make_pong(settings_.local_id));
        return;
    case MessageType::Pong:
        return;
    default:
        break;
    }

    if (!in_session()) {
        log_debug(std::string("Ignoring ") + message_type_name(envelope.type) + " while " + state_.to_string());
        return;
    }

    switch (envelope.type) {
    case MessageType::FileOffer:
        handle_file_offer(envelope);
        break;
    case MessageType::FileAccept:
        if (!outbound_active_ || !delegate_.resolve_outbound_offer(true, std::nullopt)) {
            log_debug("fileAccept with no offer pending");
        }
        break;
    case MessageType::FileReject:
        handle_file_reject(envelope);
        break;
    case MessageType::FileChunk:
        handle_file_chunk(envelope);
        break;
    case MessageType::FileComplete:
        handle_file_complete(envelope);
        break;
    case MessageType::BatchStart:
        if (settings_.file_transfer_enabled && receiver_) {
            receiver_->begin_batch(decode_payload<BatchMetadata>(envelope));
        }
        break;
    case MessageType::BatchComplete:
        if (receiver_) {
            receiver_->mark_batch_complete(decode_payload<BatchCompletePayload>(envelope).batch_id);
            report_finished_batch();
        }
        break;
    case MessageType::SdpOffer:
    case MessageType::SdpAnswer:
    case MessageType::IceCandidate:
    case MessageType::CallRequest:
    case MessageType::CallAccept:
    case MessageType::CallReject:
    case MessageType::CallEnd:
        handle_call_message(envelope);
        break;
    case MessageType::TextMessage:
    case MessageType::MediaMessage:
    case MessageType::ChatReject:
    case MessageType::MessageReceipt:
    case MessageType::TypingIndicator:
    case MessageType::Reaction:
        handle_chat_message(envelope);
        break;
    default:
        log_debug(std::string("Unhandled ") + message_type_name(envelope.type));
        break;
    }
}

void Session::handle_hello(const PeerIdentity& identity) {
    const std::string label = identity.display_name.empty() ? short_id(identity.id) : identity.display_name;
    if (identity.certificate_fingerprint &&
        !fingerprints_equal(*identity.certificate_fingerprint, remote_fingerprint_)) {
        trust_failure(label, "hello names a different key than the channel presented");
        return;
    }
    if (target_ && identity.id != target_->id) {
        // The pin was checked against the discovered id; the peer must claim the same one.
        if (trust_.evaluate(identity.id, remote_fingerprint_) == TrustDecision::Mismatch) {
            trust_failure(label, "presented key differs from the pinned key");
            return;
        }
        log_warn("Peer " + short_id(target_->id) + " introduced itself as " + short_id(identity.id));
    }
    remote_ = identity;
    log_info("Peer identified as " + label + " (" + short_id(identity.id) + ")");
}

// ---------------------------------------------------------------------------
// Transfers

void Session::on_event(const events::SendFilesIntent& event) {
    if (!settings_.file_transfer_enabled) {
        notice("File transfer is disabled");
        return;
    }
    if (state_.status != ConnectionStatus::Connected && state_.status != ConnectionStatus::Transferring) {
        notice("Connect to a peer before sending files");
        return;
    }
    if (outbound_active_) {
        notice("A transfer is already in progress");
        return;
    }
    if (event.paths.empty()) {
        return;
    }
    outbound_active_ = true;
    outbound_progress_ = 0.0;
    if (state_.status == ConnectionStatus::Connected) {
        transition(ConnectionState::transferring(0.0));
    }
    delegate_.start_outbound(generation_, remote_id(), event.paths);
}

void Session::on_event(const events::CancelTransferIntent&) {
    bool any = false;
    if (outbound_active_) {
        delegate_.cancel_outbound();
        any = true;
    }
    if (inbound_active_ && receiver_) {
        auto record_opt = receiver_->abort("cancelled by user");
        send(make_file_reject(settings_.local_id, std::string(kRejectCancelled)));
        receiver_->clear_batch();
        inbound_active_ = false;
        if (record_opt) {
            record(*record_opt);
        }
        settle_transfer_state();
        any = true;
    }
    if (!any) {
        notice("No transfer in progress");
    }
}

void Session::on_event(const events::OutboundProgress& event) {
    if (event.generation != generation_ || !outbound_active_) {
        return;
    }
    outbound_progress_ = std::max(outbound_progress_, event.progress);
    update_transfer_progress(outbound_progress_);
}

void Session::on_event(const events::OutboundFinished& event) {
    std::size_t succeeded = 0;
    for (const auto& entry : event.records) {
        record(entry);
        if (entry.success) {
            ++succeeded;
        }
    }
    if (event.generation != generation_ || !outbound_active_) {
        return;
    }
    outbound_active_ = false;
    notice("Sent " + std::to_string(succeeded) + " of " + std::to_string(event.records.size()) + " file(s)");
    settle_transfer_state();
}

void Session::handle_file_offer(const Envelope& envelope) {
    if (!settings_.file_transfer_enabled) {
        send(make_file_reject(settings_.local_id, std::string(kRejectFeatureDisabled)));
        return;
    }
    auto metadata = decode_payload<TransferMetadata>(envelope);
    if (!receiver_) {
        return;
    }
    OfferDecision decision = receiver_->handle_offer(metadata);
    if (decision.superseded) {
        record(*decision.superseded);
    }
    if (!decision.accepted) {
        inbound_active_ = false;
        send(make_file_reject(settings_.local_id, decision.reason));
        report_finished_batch();
        settle_transfer_state();
        return;
    }

    send(make_file_accept(settings_.local_id));
    inbound_active_ = true;
    if (state_.status == ConnectionStatus::Connected) {
        transition(ConnectionState::transferring(0.0));
    }
    notice("Receiving " + metadata.display_name() + " (" + std::to_string(metadata.file_size) + " bytes)");
}

void Session::handle_file_chunk(const Envelope& envelope) {
    if (!receiver_ || !inbound_active_) {
        log_debug("Dropping chunk with no transfer in flight");
        return;
    }
    ChunkOutcome outcome = receiver_->handle_chunk(raw_payload(envelope));
    if (outcome.failed) {
        inbound_active_ = false;
        record(*outcome.failed);
        report_finished_batch();
        settle_transfer_state();
        return;
    }
    update_transfer_progress(outcome.progress);
}

void Session::handle_file_complete(const Envelope& envelope) {
    auto complete = decode_payload<FileCompletePayload>(envelope);
    if (!receiver_) {
        return;
    }
    auto record_opt = receiver_->handle_complete(complete.hash);
    if (!record_opt) {
        log_debug("fileComplete with no transfer in flight");
        return;
    }
    inbound_active_ = false;
    record(*record_opt);
    if (record_opt->success) {
        notice("Received " + record_opt->file_name);
    } else {
        notice("Transfer of " + record_opt->file_name + " failed: " + record_opt->error.value_or("unknown error"));
    }
    report_finished_batch();
    settle_transfer_state();
}

void Session::handle_file_reject(const Envelope& envelope) {
    auto reason = reject_reason(envelope);
    // An answer to our own offer only concerns the outbound direction.
    if (outbound_active_ && delegate_.resolve_outbound_offer(false, reason)) {
        return;
    }
    if (reason && *reason != kRejectCancelled) {
        log_debug("Ignoring fileReject (" + *reason + ") with no offer pending");
        return;
    }

    // A cancel ends whatever the peer was part of.
    if (outbound_active_) {
        delegate_.cancel_outbound();
    }
    if (inbound_active_ && receiver_) {
        auto record_opt = receiver_->abort("cancelled by sender");
        receiver_->clear_batch();
        inbound_active_ = false;
        if (record_opt) {
            record(*record_opt);
        }
        report_finished_batch();
        settle_transfer_state();
    }
}

void Session::update_transfer_progress(double progress) {
    if (state_.status != ConnectionStatus::Transferring) {
        return;
    }
    progress = std::min(1.0, std::max(progress, state_.progress));
    if (progress > state_.progress) {
        transition(ConnectionState::transferring(progress));
    }
}

void Session::settle_transfer_state() {
    if (state_.status == ConnectionStatus::Transferring && !outbound_active_ && !inbound_active_) {
        transition(ConnectionState::of(ConnectionStatus::Connected));
    }
}

void Session::record(const TransferRecord& entry) {
    log_info(std::string(transfer_direction_name(entry.direction)) + " " + entry.file_name + ": " +
             (entry.success ? std::string("ok") : entry.error.value_or("failed")));
    if (record_sink_) {
        record_sink_->record_transfer(entry);
    }
}

void Session::report_finished_batch() {
    if (!receiver_) {
        return;
    }
    auto summary = receiver_->take_finished_batch();
    if (!summary) {
        return;
    }
    notice("Batch finished: " + std::to_string(summary->succeeded) + " of " +
           std::to_string(summary->total_files) + " file(s) received");
    if (observer_) {
        observer_->on_batch_complete(*summary);
    }
}

void Session::teardown_transfers() {
    if (outbound_active_) {
        delegate_.cancel_outbound();
        outbound_active_ = false;
    }
    outbound_progress_ = 0.0;
    if (receiver_) {
        auto record_opt = receiver_->abort("connection ended");
        if (record_opt) {
            record(*record_opt);
        }
        receiver_.reset();
    }
    inbound_active_ = false;
}

// ---------------------------------------------------------------------------
// Calls

void Session::on_event(const events::StartCallIntent&) {
    if (!settings_.voice_enabled) {
        notice("Voice calls are disabled");
        return;
    }
    if (state_.status != ConnectionStatus::Connected || call_outgoing_ || call_incoming_) {
        notice("Cannot start a call while " + state_.to_string());
        return;
    }
    if (send(make_call_request(settings_.local_id))) {
        call_outgoing_ = true;
    }
}

void Session::on_event(const events::AcceptCallIntent&) {
    if (!call_incoming_ || state_.status != ConnectionStatus::Connected) {
        notice("No incoming call");
        return;
    }
    call_incoming_ = false;
    send(make_call_accept(settings_.local_id));
    if (transition(ConnectionState::of(ConnectionStatus::VoiceCall)) && call_sink_) {
        call_sink_->on_call_started(remote_id());
    }
}

void Session::on_event(const events::RejectCallIntent& event) {
    if (!call_incoming_) {
        notice("No incoming call");
        return;
    }
    call_incoming_ = false;
    send(make_call_reject(settings_.local_id, event.reason));
}

void Session::on_event(const events::EndCallIntent&) {
    if (state_.status == ConnectionStatus::VoiceCall) {
        send(make_call_end(settings_.local_id));
        transition(ConnectionState::of(ConnectionStatus::Connected));
        if (call_sink_) {
            call_sink_->on_call_ended(remote_id());
        }
        return;
    }
    if (call_outgoing_) {
        send(make_call_end(settings_.local_id));
        call_outgoing_ = false;
        return;
    }
    notice("No call in progress");
}

void Session::handle_call_message(const Envelope& envelope) {
    switch (envelope.type) {
    case MessageType::CallRequest:
        if (!settings_.voice_enabled) {
            send(make_call_reject(settings_.local_id, std::string(kRejectFeatureDisabled)));
            return;
        }
        if (state_.status != ConnectionStatus::Connected || call_outgoing_) {
            send(make_call_reject(settings_.local_id, std::string(kRejectBusy)));
            return;
        }
        call_incoming_ = true;
        notice(peer_label() + " is calling");
        if (call_sink_) {
            call_sink_->on_call_request(remote_id());
        }
        return;
    case MessageType::CallAccept:
        if (call_outgoing_ && state_.status == ConnectionStatus::Connected) {
            call_outgoing_ = false;
            if (transition(ConnectionState::of(ConnectionStatus::VoiceCall)) && call_sink_) {
                call_sink_->on_call_started(remote_id());
            }
        }
        return;
    case MessageType::CallReject: {
        if (!call_outgoing_) {
            return;
        }
        call_outgoing_ = false;
        auto reason = reject_reason(envelope);
        notice(peer_label() + " declined the call" + (reason ? ": " + *reason : std::string()));
        if (call_sink_) {
            call_sink_->on_call_rejected(reason);
        }
        return;
    }
    case MessageType::CallEnd:
        call_incoming_ = false;
        call_outgoing_ = false;
        if (state_.status == ConnectionStatus::VoiceCall) {
            transition(ConnectionState::of(ConnectionStatus::Connected));
            if (call_sink_) {
                call_sink_->on_call_ended(remote_id());
            }
        }
        return;
    default:
        if (!settings_.voice_enabled) {
            return;
        }
        if (call_sink_) {
            call_sink_->on_signaling(envelope.type, raw_payload(envelope));
        }
        return;
    }
}

// ---------------------------------------------------------------------------
// Chat

void Session::on_event(const events::SendMessageIntent& event) {
    if (!settings_.chat_enabled) {
        notice("Chat is disabled");
        return;
    }
    if (!in_session()) {
        notice("Connect to a peer before chatting");
        return;
    }
    TextMessagePayload message;
    message.text = event.text;
    message.timestamp_ms = wall_clock_millis();
    message.sender_name = settings_.display_name;
    if (!send(make_text_message(settings_.local_id, message))) {
        notice("Message not delivered");
    }
}

void Session::handle_chat_message(const Envelope& envelope) {
    if (envelope.type == MessageType::ChatReject) {
        auto reason = reject_reason(envelope);
        notice(peer_label() + " did not accept the message" + (reason ? ": " + *reason : std::string()));
        if (chat_sink_) {
            chat_sink_->on_chat_rejected(reason);
        }
        return;
    }
    if (!settings_.chat_enabled) {
        if (envelope.type == MessageType::TextMessage || envelope.type == MessageType::MediaMessage) {
            send(make_chat_reject(settings_.local_id, std::string(kRejectFeatureDisabled)));
        }
        return;
    }

    const std::string peer_id = remote_id();
    switch (envelope.type) {
    case MessageType::TextMessage: {
        auto message = decode_payload<TextMessagePayload>(envelope);
        if (chat_sink_) {
            chat_sink_->on_text_message(peer_id, message);
        }
        break;
    }
    case MessageType::MediaMessage: {
        auto message = decode_payload<MediaMessagePayload>(envelope);
        if (chat_sink_) {
            chat_sink_->on_media_message(peer_id, message);
        }
        MessageReceiptPayload receipt;
        receipt.message_ids.push_back(message.id);
        receipt.receipt_type = ReceiptType::Delivered;
        receipt.timestamp_ms = wall_clock_millis();
        send(make_message_receipt(settings_.local_id, receipt));
        break;
    }
    case MessageType::MessageReceipt: {
        auto receipt = decode_payload<MessageReceiptPayload>(envelope);
        if (chat_sink_) {
            chat_sink_->on_receipt(peer_id, receipt);
        }
        break;
    }
    case MessageType::TypingIndicator: {
        auto typing = decode_payload<TypingIndicatorPayload>(envelope);
        if (chat_sink_) {
            chat_sink_->on_typing(peer_id, typing);
        }
        break;
    }
    case MessageType::Reaction: {
        auto reaction = decode_payload<ReactionPayload>(envelope);
        if (chat_sink_) {
            chat_sink_->on_reaction(peer_id, reaction);
        }
        break;
    }
    default:
        break;
    }
}

// ---------------------------------------------------------------------------
// Timers

void Session::on_event(const events::Tick&) {
    const uint64_t t = now();
    const auto establish = static_cast<uint64_t>(settings_.establish_timeout.count());

    for (auto it = pending_.begin(); it != pending_.end();) {
        if (t - it->second.opened_at > establish) {
            log_warn("Incoming channel from " + it->second.remote_address + " never asked to connect");
            delegate_.close_channel(it->first);
            it = pending_.erase(it);
        } else {
            ++it;
        }
    }

    switch (state_.status) {
    case ConnectionStatus::Requesting:
    case ConnectionStatus::IncomingRequest:
    case ConnectionStatus::Connecting:
        if (t - state_entered_at_ > establish) {
            if (role_ == Role::Outgoing) {
                breaker_.record_failure(remote_id());
                if (channel_open_) {
                    send(make_connection_cancel(settings_.local_id));
                }
            }
            fail("Connection timed out");
        }
        break;
    case ConnectionStatus::Connected:
    case ConnectionStatus::Transferring:
    case ConnectionStatus::VoiceCall:
        if (t - last_heard_at_ > static_cast<uint64_t>(settings_.heartbeat_timeout.count())) {
            log_warn("No traffic from " + peer_label() + " for " +
                     std::to_string(settings_.heartbeat_timeout.count()) + " ms");
            fail("timeout");
            break;
        }
        // Inbound chunks already prove the peer is alive.
        if (!inbound_active_ && t - last_ping_at_ >= static_cast<uint64_t>(settings_.heartbeat_interval.count())) {
            last_ping_at_ = t;
            send(make_ping(settings_.local_id));
        }
        break;
    default:
        break;
    }
}

// ---------------------------------------------------------------------------
// Helpers

bool Session::transition(const ConnectionState& target) {
    if (!can_transition(state_.status, target.status)) {
        log_warn(std::string("Ignoring invalid transition ") + status_name(state_.status) + " -> " +
                 status_name(target.status));
        return false;
    }
    const bool progress_only = state_.status == target.status;
    if (progress_only) {
        log_debug("State: " + target.to_string());
    } else {
        log_info(std::string("State: ") + status_name(state_.status) + " -> " + target.to_string());
        state_entered_at_ = now();
    }
    state_ = target;
    if (observer_) {
        observer_->on_state_changed(state_);
    }
    return true;
}

void Session::fail(const std::string& reason) {
    end_session(ConnectionState::failed(reason), false);
}

void Session::trust_failure(const std::string& peer_label_text, const std::string& detail) {
    security_warning("Certificate fingerprint for " + peer_label_text + " does not match the pinned key (" +
                     detail + ")");
    fail("Fingerprint mismatch for " + peer_label_text);
}

void Session::end_session(const ConnectionState& target, bool notify_peer) {
    if (notify_peer && channel_open_) {
        send(make_disconnect(settings_.local_id));
    }
    teardown_transfers();
    if (generation_ != 0) {
        delegate_.close_channel(generation_);
    }
    generation_ = 0;
    channel_open_ = false;
    role_ = Role::None;
    call_outgoing_ = false;
    call_incoming_ = false;
    transition(target);
}

bool Session::send(const Envelope& envelope) {
    if (generation_ == 0 || !channel_open_) {
        log_debug(std::string("Not sending ") + message_type_name(envelope.type) + ": no channel");
        return false;
    }
    if (!delegate_.send(generation_, envelope)) {
        log_warn(std::string("Failed to send ") + message_type_name(envelope.type) + " to " + peer_label());
        return false;
    }
    return true;
}

void Session::notice(const std::string& text) {
    log_info(text);
    if (observer_) {
        observer_->on_notice(text);
    }
}

void Session::security_warning(const std::string& text) {
    log_warn("SECURITY: " + text);
    if (observer_) {
        observer_->on_security_warning(text);
    }
}

PeerIdentity Session::local_identity() const {
    PeerIdentity identity;
    identity.id = settings_.local_id;
    identity.display_name = settings_.display_name;
    if (!settings_.local_fingerprint.empty()) {
        identity.certificate_fingerprint = settings_.local_fingerprint;
    }
    return identity;
}

std::string Session::peer_label() const {
    if (remote_ && !remote_->display_name.empty()) {
        return remote_->display_name;
    }
    if (target_ && !target_->display_name.empty()) {
        return target_->display_name;
    }
    const std::string id = remote_id();
    return id.empty() ? std::string("peer") : short_id(id);
}

std::string Session::remote_id() const {
    if (remote_) {
        return remote_->id;
    }
    if (target_) {
        return target_->id;
    }
    return {};
}

bool Session::in_session() const {
    return state_.status == ConnectionStatus::Connected || state_.status == ConnectionStatus::Transferring ||
           state_.status == ConnectionStatus::VoiceCall;
}

} // namespace peerlink
