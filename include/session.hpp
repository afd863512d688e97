/*
 * PeerLink - session state machine
 *
 * The session owns the single authoritative ConnectionState. Every input,
 * local intent or network observation alike, arrives as a SessionEvent and is
 * handled on one thread; the session talks back to the world only through its
 * delegate and observers. Channels are identified by a generation id so that
 * events from a channel the session has already given up on are ignored.
 */

#pragma once

#include "connection_state.hpp"
#include "errors.hpp"
#include "file_transfer.hpp"
#include "payloads.hpp"
#include "protocol.hpp"
#include "retry_policy.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace peerlink {

class TrustStore;

// Feature toggles answer an offer with this reason.
constexpr const char* kRejectFeatureDisabled = "featureDisabled";
constexpr const char* kRejectBusy = "busy";

struct PeerCandidate {
    std::string id;
    std::string display_name;
    std::string host;
    uint16_t port = 0;
};

namespace events {

struct StartDiscovery {};
struct StopDiscovery {};
struct PeerDiscovered {
    PeerCandidate peer;
};
struct PeerLost {
    std::string peer_id;
};

struct ConnectIntent {
    std::string peer_id;
};
struct AcceptIntent {};
struct RejectIntent {
    std::optional<std::string> reason;
};
struct DisconnectIntent {};
struct SendFilesIntent {
    std::vector<std::filesystem::path> paths;
};
struct CancelTransferIntent {};
struct StartCallIntent {};
struct AcceptCallIntent {};
struct RejectCallIntent {
    std::optional<std::string> reason;
};
struct EndCallIntent {};
struct SendMessageIntent {
    std::string text;
};

// Outgoing channel finished its handshake.
struct ChannelOpened {
    uint64_t generation = 0;
    std::string peer_fingerprint;
};
// A client completed the handshake with our listener.
struct IncomingChannel {
    uint64_t generation = 0;
    std::string peer_fingerprint;
    std::string remote_address;
};
struct ChannelFailed {
    uint64_t generation = 0;
    ErrorKind kind = ErrorKind::ChannelFailure;
    std::string reason;
};
struct ChannelClosed {
    uint64_t generation = 0;
};
struct MessageReceived {
    uint64_t generation = 0;
    Envelope envelope;
};

struct OutboundProgress {
    uint64_t generation = 0;
    double progress = 0.0;
};
struct OutboundFinished {
    uint64_t generation = 0;
    std::vector<TransferRecord> records;
};

struct Tick {};

} // namespace events

using SessionEvent = std::variant<events::StartDiscovery,
                                  events::StopDiscovery,
                                  events::PeerDiscovered,
                                  events::PeerLost,
                                  events::ConnectIntent,
                                  events::AcceptIntent,
                                  events::RejectIntent,
                                  events::DisconnectIntent,
                                  events::SendFilesIntent,
                                  events::CancelTransferIntent,
                                  events::StartCallIntent,
                                  events::AcceptCallIntent,
                                  events::RejectCallIntent,
                                  events::EndCallIntent,
                                  events::SendMessageIntent,
                                  events::ChannelOpened,
                                  events::IncomingChannel,
                                  events::ChannelFailed,
                                  events::ChannelClosed,
                                  events::MessageReceived,
                                  events::OutboundProgress,
                                  events::OutboundFinished,
                                  events::Tick>;

// Side effects the session asks for. Called on the session thread; none of
// these may block on the network.
class SessionDelegate {
public:
    virtual ~SessionDelegate() = default;

    // Starts a connection attempt and returns its generation. The outcome
    // comes back as ChannelOpened or ChannelFailed.
    virtual uint64_t open_channel(const PeerCandidate& peer,
                                  const std::optional<std::string>& expected_fingerprint) = 0;

    // Closes the channel or cancels the attempt.
    virtual void close_channel(uint64_t generation) = 0;

    virtual bool send(uint64_t generation, const Envelope& envelope) = 0;

    // Progress and the final records come back as OutboundProgress and
    // OutboundFinished with the same generation.
    virtual void start_outbound(uint64_t generation,
                                const std::string& peer_id,
                                const std::vector<std::filesystem::path>& paths) = 0;

    virtual void cancel_outbound() = 0;

    // Returns false when the outbound sender has no offer waiting for an answer.
    virtual bool resolve_outbound_offer(bool accepted, const std::optional<std::string>& reason) = 0;
};

class SessionObserver {
public:
    virtual ~SessionObserver() = default;
    virtual void on_state_changed(const ConnectionState& /*state*/) {}
    virtual void on_incoming_request(const PeerIdentity& /*peer*/) {}
    virtual void on_notice(const std::string& /*text*/) {}
    virtual void on_security_warning(const std::string& /*text*/) {}
    virtual void on_peer_pinned(const std::string& /*peer_id*/, const std::string& /*fingerprint*/) {}
    virtual void on_batch_complete(const BatchSummary& /*summary*/) {}
};

class ChatSink {
public:
    virtual ~ChatSink() = default;
    virtual void on_text_message(const std::string& peer_id, const TextMessagePayload& message) = 0;
    virtual void on_media_message(const std::string& /*peer_id*/, const MediaMessagePayload& /*message*/) {}
    virtual void on_receipt(const std::string& /*peer_id*/, const MessageReceiptPayload& /*receipt*/) {}
    virtual void on_typing(const std::string& /*peer_id*/, const TypingIndicatorPayload& /*typing*/) {}
    virtual void on_reaction(const std::string& /*peer_id*/, const ReactionPayload& /*reaction*/) {}
    virtual void on_chat_rejected(const std::optional<std::string>& /*reason*/) {}
};

class CallSink {
public:
    virtual ~CallSink() = default;
    virtual void on_call_request(const std::string& peer_id) = 0;
    virtual void on_call_started(const std::string& /*peer_id*/) {}
    virtual void on_call_rejected(const std::optional<std::string>& /*reason*/) {}
    virtual void on_call_ended(const std::string& /*peer_id*/) {}
    // sdpOffer, sdpAnswer and iceCandidate bytes, untouched.
    virtual void on_signaling(MessageType /*type*/, const std::vector<uint8_t>& /*data*/) {}
};

struct SessionSettings {
    std::string local_id;
    std::string display_name;
    std::string local_fingerprint;
    std::filesystem::path download_dir;
    std::chrono::milliseconds heartbeat_interval{10000};
    std::chrono::milliseconds heartbeat_timeout{30000};
    std::chrono::milliseconds establish_timeout{15000};
    bool file_transfer_enabled = true;
    bool chat_enabled = true;
    bool voice_enabled = true;
};

// Milliseconds on a monotonic scale.
using SessionClock = std::function<uint64_t()>;

class Session {
public:
    Session(SessionSettings settings,
            TrustStore& trust,
            SessionDelegate& delegate,
            SessionClock clock = nullptr);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void set_observer(SessionObserver* observer) { observer_ = observer; }
    void set_record_sink(TransferRecordSink* sink) { record_sink_ = sink; }
    void set_chat_sink(ChatSink* sink) { chat_sink_ = sink; }
    void set_call_sink(CallSink* sink) { call_sink_ = sink; }

    void handle(const SessionEvent& event);

    const ConnectionState& state() const { return state_; }

    // Identity of the peer of the current or last session.
    const std::optional<PeerIdentity>& remote_peer() const { return remote_; }

    // Identifier of the peer being talked to, empty when there is none yet.
    std::string current_peer_id() const { return remote_id(); }

    // Generation of the current channel, 0 when there is none.
    uint64_t generation() const { return generation_; }

    std::vector<PeerCandidate> discovered_peers() const;

    const CircuitBreaker& circuit_breaker() const { return breaker_; }

    const SessionSettings& settings() const { return settings_; }

private:
    enum class Role {
        None,
        Outgoing,
        Incoming
    };

    struct PendingIncoming {
        std::string fingerprint;
        std::string remote_address;
        std::optional<PeerIdentity> identity;
        uint64_t opened_at = 0;
    };

    void on_event(const events::StartDiscovery& event);
    void on_event(const events::StopDiscovery& event);
    void on_event(const events::PeerDiscovered& event);
    void on_event(const events::PeerLost& event);
    void on_event(const events::ConnectIntent& event);
    void on_event(const events::AcceptIntent& event);
    void on_event(const events::RejectIntent& event);
    void on_event(const events::DisconnectIntent& event);
    void on_event(const events::SendFilesIntent& event);
    void on_event(const events::CancelTransferIntent& event);
    void on_event(const events::StartCallIntent& event);
    void on_event(const events::AcceptCallIntent& event);
    void on_event(const events::RejectCallIntent& event);
    void on_event(const events::EndCallIntent& event);
    void on_event(const events::SendMessageIntent& event);
    void on_event(const events::ChannelOpened& event);
    void on_event(const events::IncomingChannel& event);
    void on_event(const events::ChannelFailed& event);
    void on_event(const events::ChannelClosed& event);
    void on_event(const events::MessageReceived& event);
    void on_event(const events::OutboundProgress& event);
    void on_event(const events::OutboundFinished& event);
    void on_event(const events::Tick& event);

    void handle_message(const Envelope& envelope);
    void handle_pending_message(uint64_t generation, const Envelope& envelope);
    void handle_hello(const PeerIdentity& identity);
    void enter_connected();
    void handle_file_offer(const Envelope& envelope);
    void handle_file_chunk(const Envelope& envelope);
    void handle_file_complete(const Envelope& envelope);
    void handle_file_reject(const Envelope& envelope);
    void handle_call_message(const Envelope& envelope);
    void handle_chat_message(const Envelope& envelope);

    bool transition(const ConnectionState& target);
    void fail(const std::string& reason);
    void trust_failure(const std::string& peer_label, const std::string& detail);
    void end_session(const ConnectionState& target, bool notify_peer);
    void teardown_transfers();
    void update_transfer_progress(double progress);
    void settle_transfer_state();
    void record(const TransferRecord& record);
    void report_finished_batch();
    bool send(const Envelope& envelope);
    void notice(const std::string& text);
    void security_warning(const std::string& text);
    PeerIdentity local_identity() const;
    std::string peer_label() const;
    std::string remote_id() const;
    bool in_session() const;
    uint64_t now() const { return clock_(); }

    SessionSettings settings_;
    TrustStore& trust_;
    SessionDelegate& delegate_;
    SessionClock clock_;

    SessionObserver* observer_ = nullptr;
    TransferRecordSink* record_sink_ = nullptr;
    ChatSink* chat_sink_ = nullptr;
    CallSink* call_sink_ = nullptr;

    ConnectionState state_;
    uint64_t state_entered_at_ = 0;

    std::map<std::string, PeerCandidate> discovered_;
    std::map<uint64_t, PendingIncoming> pending_;
    CircuitBreaker breaker_;

    Role role_ = Role::None;
    uint64_t generation_ = 0;
    bool channel_open_ = false;
    std::optional<PeerCandidate> target_;
    std::optional<PeerIdentity> remote_;
    std::string remote_fingerprint_;

    uint64_t last_heard_at_ = 0;
    uint64_t last_ping_at_ = 0;

    std::unique_ptr<FileReceiver> receiver_;
    bool outbound_active_ = false;
    bool inbound_active_ = false;
    double outbound_progress_ = 0.0;

    bool call_outgoing_ = false;
    bool call_incoming_ = false;
};

} // namespace peerlink
