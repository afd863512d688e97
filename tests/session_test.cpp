/*
 * PeerLink - session state machine tests
 *
 * The session is driven with scripted events, a fake delegate standing in for
 * the network and a hand-advanced clock.
 */

#include "hash_verifier.hpp"
#include "session.hpp"
#include "test_support.hpp"
#include "trust_store.hpp"

#include <algorithm>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

using namespace peerlink;
using peerlink_test::bytes_of;

namespace {

const std::string kFpA = sha256_hex(bytes_of("key-a"));
const std::string kFpB = sha256_hex(bytes_of("key-b"));
const std::string kFpC = sha256_hex(bytes_of("key-c"));
const std::string kFpEvil = sha256_hex(bytes_of("key-evil"));

struct SentMessage {
    uint64_t generation;
    Envelope envelope;
};

class FakeDelegate : public SessionDelegate {
public:
    uint64_t open_channel(const PeerCandidate& peer, const std::optional<std::string>& expected) override {
        opened.push_back(peer.id);
        expected_fingerprints.push_back(expected);
        return ++next_generation;
    }

    void close_channel(uint64_t generation) override { closed.push_back(generation); }

    bool send(uint64_t generation, const Envelope& envelope) override {
        sent.push_back(SentMessage{generation, envelope});
        return send_ok;
    }

    void start_outbound(uint64_t generation,
                        const std::string& peer_id,
                        const std::vector<std::filesystem::path>& paths) override {
        outbound_generation = generation;
        outbound_peer = peer_id;
        outbound_paths = paths;
    }

    void cancel_outbound() override { ++outbound_cancels; }

    bool resolve_outbound_offer(bool accepted, const std::optional<std::string>& reason) override {
        offer_answers.emplace_back(accepted, reason);
        return offer_pending;
    }

    std::vector<MessageType> sent_types() const {
        std::vector<MessageType> types;
        for (const auto& message : sent) {
            types.push_back(message.envelope.type);
        }
        return types;
    }

    bool was_sent(MessageType type) const {
        auto types = sent_types();
        return std::find(types.begin(), types.end(), type) != types.end();
    }

    const Envelope* last_of(MessageType type) const {
        for (auto it = sent.rbegin(); it != sent.rend(); ++it) {
            if (it->envelope.type == type) {
                return &it->envelope;
            }
        }
        return nullptr;
    }

    bool was_closed(uint64_t generation) const {
        return std::find(closed.begin(), closed.end(), generation) != closed.end();
    }

    uint64_t next_generation = 0;
    bool send_ok = true;
    std::vector<std::string> opened;
    std::vector<std::optional<std::string>> expected_fingerprints;
    std::vector<uint64_t> closed;
    std::vector<SentMessage> sent;
    uint64_t outbound_generation = 0;
    std::string outbound_peer;
    std::vector<std::filesystem::path> outbound_paths;
    int outbound_cancels = 0;
    bool offer_pending = true;
    std::vector<std::pair<bool, std::optional<std::string>>> offer_answers;
};

class Recorder : public SessionObserver, public ChatSink, public CallSink, public TransferRecordSink {
public:
    void on_state_changed(const ConnectionState& state) override { states.push_back(state); }
    void on_incoming_request(const PeerIdentity& peer) override { requests.push_back(peer); }
    void on_notice(const std::string& text) override { notices.push_back(text); }
    void on_security_warning(const std::string& text) override { warnings.push_back(text); }
    void on_peer_pinned(const std::string& peer_id, const std::string&) override { pinned.push_back(peer_id); }
    void on_batch_complete(const BatchSummary& summary) override { batches.push_back(summary); }

    void on_text_message(const std::string&, const TextMessagePayload& message) override {
        texts.push_back(message.text);
    }
    void on_media_message(const std::string&, const MediaMessagePayload& message) override {
        media.push_back(message.id);
    }
    void on_chat_rejected(const std::optional<std::string>& reason) override { chat_rejections.push_back(reason); }

    void on_call_request(const std::string& peer_id) override { call_requests.push_back(peer_id); }
    void on_call_started(const std::string&) override { ++calls_started; }
    void on_call_rejected(const std::optional<std::string>& reason) override { call_rejections.push_back(reason); }
    void on_call_ended(const std::string&) override { ++calls_ended; }
    void on_signaling(MessageType type, const std::vector<uint8_t>& data) override {
        signaling.emplace_back(type, data);
    }

    void record_transfer(const TransferRecord& record) override { records.push_back(record); }

    bool visited(ConnectionStatus status) const {
        return std::any_of(states.begin(), states.end(),
                           [status](const ConnectionState& state) { return state.status == status; });
    }

    bool noticed(const std::string& fragment) const {
        return std::any_of(notices.begin(), notices.end(),
                           [&](const std::string& text) { return text.find(fragment) != std::string::npos; });
    }

    std::vector<ConnectionState> states;
    std::vector<PeerIdentity> requests;
    std::vector<std::string> notices;
    std::vector<std::string> warnings;
    std::vector<std::string> pinned;
    std::vector<BatchSummary> batches;
    std::vector<std::string> texts;
    std::vector<std::string> media;
    std::vector<std::optional<std::string>> chat_rejections;
    std::vector<std::string> call_requests;
    int calls_started = 0;
    std::vector<std::optional<std::string>> call_rejections;
    int calls_ended = 0;
    std::vector<std::pair<MessageType, std::vector<uint8_t>>> signaling;
    std::vector<TransferRecord> records;
};

struct Harness {
    explicit Harness(const std::function<void(SessionSettings&)>& tweak = nullptr) {
        SessionSettings settings;
        settings.local_id = "PEER-A";
        settings.display_name = "Alpha";
        settings.local_fingerprint = kFpA;
        settings.download_dir = peerlink_test::temp_dir("peerlink_session_downloads");
        settings.heartbeat_interval = std::chrono::milliseconds(10000);
        settings.heartbeat_timeout = std::chrono::milliseconds(30000);
        settings.establish_timeout = std::chrono::milliseconds(15000);
        if (tweak) {
            tweak(settings);
        }
        session = std::make_unique<Session>(settings, trust, delegate, [this] { return now; });
        session->set_observer(&recorder);
        session->set_chat_sink(&recorder);
        session->set_call_sink(&recorder);
        session->set_record_sink(&recorder);
    }

    void handle(const SessionEvent& event) { session->handle(event); }

    void advance(uint64_t ms) { now += ms; }

    ConnectionStatus status() const { return session->state().status; }

    void discover(const std::string& id, const std::string& name) {
        handle(events::PeerDiscovered{PeerCandidate{id, name, "127.0.0.1", 7780}});
    }

    void from_peer(uint64_t generation, const Envelope& envelope) {
        handle(events::MessageReceived{generation, envelope});
    }

    // Outgoing connection to PEER-B, up to connected. Returns the generation.
    uint64_t connect_to_b() {
        handle(events::StartDiscovery{});
        discover("PEER-B", "Bravo");
        handle(events::ConnectIntent{"PEER-B"});
        uint64_t generation = session->generation();
        handle(events::ChannelOpened{generation, kFpB});
        from_peer(generation, make_hello("PEER-B", PeerIdentity{"PEER-B", "Bravo", kFpB}));
        from_peer(generation, make_connection_accept("PEER-B"));
        return generation;
    }

    // Incoming channel from PEER-C, hello and request delivered.
    void incoming_from_c(uint64_t generation, const std::string& presented = kFpC) {
        handle(events::IncomingChannel{generation, presented, "10.0.0.7:50000"});
        from_peer(generation, make_hello("PEER-C", PeerIdentity{"PEER-C", "Charlie", presented}));
        from_peer(generation, make_connection_request("PEER-C"));
    }

    uint64_t now = 1000;
    TrustStore trust;
    FakeDelegate delegate;
    Recorder recorder;
    std::unique_ptr<Session> session;
};

void test_discovery() {
    Harness h;
    CHECK(h.status() == ConnectionStatus::Idle);
    h.handle(events::StartDiscovery{});
    CHECK(h.status() == ConnectionStatus::Discovering);
    h.discover("PEER-B", "Bravo");
    CHECK(h.status() == ConnectionStatus::PeerFound);
    CHECK(h.session->discovered_peers().size() == 1);
    h.handle(events::PeerLost{"PEER-B"});
    CHECK(h.status() == ConnectionStatus::Discovering);
    h.handle(events::StopDiscovery{});
    CHECK(h.status() == ConnectionStatus::Idle);

    h.handle(events::ConnectIntent{"PEER-Z"});
    CHECK(h.status() == ConnectionStatus::Idle);
    CHECK(h.recorder.noticed("Unknown peer"));
    CHECK(h.delegate.opened.empty());
}

void test_outgoing_connection() {
    Harness h;
    uint64_t generation = h.connect_to_b();

    CHECK(h.status() == ConnectionStatus::Connected);
    CHECK(h.recorder.visited(ConnectionStatus::Requesting));
    CHECK(h.recorder.visited(ConnectionStatus::Connecting));
    CHECK(h.delegate.opened == std::vector<std::string>{"PEER-B"});
    CHECK(!h.delegate.expected_fingerprints.at(0).has_value());
    CHECK(h.trust.pinned("PEER-B") == std::optional<std::string>(kFpB));
    CHECK(h.recorder.pinned == std::vector<std::string>{"PEER-B"});

    auto types = h.delegate.sent_types();
    CHECK(types.size() >= 2 && types[0] == MessageType::Hello && types[1] == MessageType::ConnectionRequest);
    const Envelope* hello = h.delegate.last_of(MessageType::Hello);
    CHECK(hello && decode_payload<PeerIdentity>(*hello).certificate_fingerprint == std::optional<std::string>(kFpA));

    CHECK(h.session->remote_peer() && h.session->remote_peer()->display_name == "Bravo");
    CHECK(h.session->current_peer_id() == "PEER-B");
    CHECK(h.session->generation() == generation);
    CHECK(h.recorder.noticed("Connected to Bravo"));

    // The next attempt is verified against the pin.
    h.handle(events::DisconnectIntent{});
    CHECK(h.status() == ConnectionStatus::Disconnected);
    CHECK(h.delegate.was_sent(MessageType::Disconnect));
    CHECK(h.delegate.was_closed(generation));
    h.handle(events::ConnectIntent{"PEER-B"});
    CHECK(h.status() == ConnectionStatus::Requesting);
    CHECK(h.delegate.expected_fingerprints.back() == std::optional<std::string>(kFpB));
}

void test_outgoing_trust_mismatch() {
    Harness h;
    h.trust.evaluate("PEER-B", kFpB);
    h.handle(events::StartDiscovery{});
    h.discover("PEER-B", "Bravo");
    h.handle(events::ConnectIntent{"PEER-B"});
    uint64_t generation = h.session->generation();
    CHECK(h.delegate.expected_fingerprints.back() == std::optional<std::string>(kFpB));

    h.handle(events::ChannelOpened{generation, kFpEvil});
    CHECK(h.status() == ConnectionStatus::Failed);
    CHECK(h.session->state().reason.find("Fingerprint mismatch") == 0);
    CHECK(!h.recorder.visited(ConnectionStatus::Connecting));
    CHECK(!h.recorder.visited(ConnectionStatus::Connected));
    CHECK(!h.delegate.was_sent(MessageType::Hello));
    CHECK(h.delegate.was_closed(generation));
    CHECK(h.recorder.warnings.size() == 1);
    CHECK(h.trust.pinned("PEER-B") == std::optional<std::string>(kFpB));
    CHECK(h.session->circuit_breaker().failures("PEER-B") == 1);

    // The channel layer can detect the mismatch first.
    h.handle(events::ConnectIntent{"PEER-B"});
    generation = h.session->generation();
    h.handle(events::ChannelFailed{generation, ErrorKind::FingerprintMismatch, "pinned key differs"});
    CHECK(h.status() == ConnectionStatus::Failed);
    CHECK(h.session->state().reason.find("Fingerprint mismatch") == 0);
    CHECK(!h.recorder.visited(ConnectionStatus::Connecting));
}

void test_hello_must_match_channel() {
    Harness h;
    h.handle(events::StartDiscovery{});
    h.discover("PEER-B", "Bravo");
    h.handle(events::ConnectIntent{"PEER-B"});
    uint64_t generation = h.session->generation();
    h.handle(events::ChannelOpened{generation, kFpB});
    h.from_peer(generation, make_hello("PEER-B", PeerIdentity{"PEER-B", "Bravo", kFpEvil}));
    CHECK(h.status() == ConnectionStatus::Failed);
    CHECK(!h.recorder.visited(ConnectionStatus::Connecting));
}

void test_rejected_and_cancelled() {
    Harness h;
    h.handle(events::StartDiscovery{});
    h.discover("PEER-B", "Bravo");
    h.handle(events::ConnectIntent{"PEER-B"});
    uint64_t generation = h.session->generation();
    h.handle(events::ChannelOpened{generation, kFpB});
    h.from_peer(generation, make_connection_reject("PEER-B", std::string("not now")));
    CHECK(h.status() == ConnectionStatus::Rejected);
    CHECK(h.session->state().reason == "not now");
    CHECK(h.delegate.was_closed(generation));

    // Cancel while the request is outstanding.
    h.handle(events::ConnectIntent{"PEER-B"});
    generation = h.session->generation();
    h.handle(events::ChannelOpened{generation, kFpB});
    h.handle(events::DisconnectIntent{});
    CHECK(h.status() == ConnectionStatus::Disconnected);
    CHECK(h.delegate.sent.back().envelope.type == MessageType::ConnectionCancel);
    CHECK(h.delegate.was_closed(generation));

    // Peer closes the channel while we wait.
    h.handle(events::ConnectIntent{"PEER-B"});
    generation = h.session->generation();
    h.handle(events::ChannelOpened{generation, kFpB});
    h.handle(events::ChannelClosed{generation});
    CHECK(h.status() == ConnectionStatus::Failed);
    CHECK(h.session->state().reason == "Connection closed by Bravo");
}

void test_incoming_accept() {
    Harness h;
    h.incoming_from_c(100);
    CHECK(h.status() == ConnectionStatus::IncomingRequest);
    CHECK(h.recorder.requests.size() == 1);
    CHECK(!h.recorder.requests.empty() && h.recorder.requests[0].id == "PEER-C");
    CHECK(h.trust.pinned("PEER-C") == std::optional<std::string>(kFpC));
    CHECK(h.session->generation() == 100);

    h.handle(events::AcceptIntent{});
    CHECK(h.status() == ConnectionStatus::Connected);
    CHECK(h.recorder.visited(ConnectionStatus::Connecting));
    auto types = h.delegate.sent_types();
    CHECK(types.size() == 2 && types[0] == MessageType::ConnectionAccept && types[1] == MessageType::Hello);
    CHECK(h.delegate.sent[0].generation == 100);
    CHECK(h.session->current_peer_id() == "PEER-C");

    h.from_peer(100, make_disconnect("PEER-C"));
    CHECK(h.status() == ConnectionStatus::Disconnected);
    CHECK(h.delegate.was_closed(100));
}

void test_incoming_reject() {
    Harness h;
    h.incoming_from_c(7);
    h.handle(events::RejectIntent{std::string("busy right now")});
    CHECK(h.status() == ConnectionStatus::Rejected);
    const Envelope* reject = h.delegate.last_of(MessageType::ConnectionReject);
    CHECK(reject && reject_reason(*reject) == std::optional<std::string>("busy right now"));
    CHECK(h.delegate.was_closed(7));

    Harness quiet;
    quiet.incoming_from_c(8);
    quiet.handle(events::RejectIntent{});
    const Envelope* bare = quiet.delegate.last_of(MessageType::ConnectionReject);
    CHECK(bare && !bare->payload.has_value());

    Harness withdrawn;
    withdrawn.incoming_from_c(9);
    withdrawn.from_peer(9, make_connection_cancel("PEER-C"));
    CHECK(withdrawn.status() == ConnectionStatus::Disconnected);
}

void test_incoming_trust_failures() {
    Harness pinned;
    pinned.trust.evaluate("PEER-C", kFpC);
    pinned.incoming_from_c(5, kFpEvil);
    CHECK(pinned.status() == ConnectionStatus::Failed);
    CHECK(!pinned.recorder.visited(ConnectionStatus::IncomingRequest));
    CHECK(pinned.recorder.requests.empty());
    CHECK(pinned.delegate.was_closed(5));
    CHECK(pinned.trust.pinned("PEER-C") == std::optional<std::string>(kFpC));

    // A second mismatch while already failed replaces the reason.
    std::string first_reason = pinned.session->state().reason;
    pinned.trust.evaluate("PEER-B", kFpB);
    pinned.handle(events::IncomingChannel{8, kFpEvil, "10.0.0.8:50000"});
    pinned.from_peer(8, make_hello("PEER-B", PeerIdentity{"PEER-B", "Bravo", kFpEvil}));
    CHECK(pinned.status() == ConnectionStatus::Failed);
    CHECK(pinned.session->state().reason != first_reason);
    CHECK(pinned.session->state().reason.find("Bravo") != std::string::npos);
    CHECK(pinned.delegate.was_closed(8));

    // Hello naming a key other than the one on the channel.
    Harness lying;
    lying.handle(events::IncomingChannel{6, kFpC, "10.0.0.7:50000"});
    lying.from_peer(6, make_hello("PEER-C", PeerIdentity{"PEER-C", "Charlie", kFpEvil}));
    lying.from_peer(6, make_connection_request("PEER-C"));
    CHECK(lying.recorder.requests.empty());
    CHECK(lying.delegate.was_closed(6));
    CHECK(!lying.trust.pinned("PEER-C").has_value());

    // No hello at all.
    Harness anonymous;
    anonymous.handle(events::IncomingChannel{7, kFpC, "10.0.0.7:50000"});
    anonymous.from_peer(7, make_connection_request("PEER-C"));
    CHECK(anonymous.status() == ConnectionStatus::Idle);
    CHECK(anonymous.delegate.was_closed(7));
}

void test_busy_while_connected() {
    Harness h;
    uint64_t generation = h.connect_to_b();
    h.incoming_from_c(200);
    CHECK(h.status() == ConnectionStatus::Connected);
    CHECK(h.session->generation() == generation);
    CHECK(h.delegate.sent.back().generation == 200);
    CHECK(reject_reason(h.delegate.sent.back().envelope) == std::optional<std::string>(kRejectBusy));
    CHECK(h.delegate.was_closed(200));

    // A mismatch on a second channel only warns.
    h.trust.forget("PEER-C");
    h.trust.evaluate("PEER-C", kFpC);
    h.incoming_from_c(201, kFpEvil);
    CHECK(h.status() == ConnectionStatus::Connected);
    CHECK(!h.recorder.warnings.empty());
}

void test_stale_generations() {
    Harness h;
    uint64_t generation = h.connect_to_b();
    h.handle(events::ChannelOpened{generation + 50, kFpB});
    CHECK(h.delegate.was_closed(generation + 50));
    h.from_peer(generation + 50, make_disconnect("PEER-B"));
    h.handle(events::ChannelClosed{generation + 50});
    h.handle(events::ChannelFailed{generation + 50, ErrorKind::ChannelFailure, "boom"});
    CHECK(h.status() == ConnectionStatus::Connected);

    // Malformed payloads are dropped, not fatal.
    h.from_peer(generation, make_envelope(MessageType::FileOffer, "PEER-B", bytes_of("junk")));
    CHECK(h.status() == ConnectionStatus::Connected);

    h.handle(events::ChannelClosed{generation});
    CHECK(h.status() == ConnectionStatus::Failed);
    CHECK(h.session->state().reason == "Connection lost");
}

void test_establish_timeouts() {
    Harness h;
    h.handle(events::StartDiscovery{});
    h.discover("PEER-B", "Bravo");
    h.handle(events::ConnectIntent{"PEER-B"});
    uint64_t generation = h.session->generation();
    h.advance(15000);
    h.handle(events::Tick{});
    CHECK(h.status() == ConnectionStatus::Requesting);
    h.advance(1);
    h.handle(events::Tick{});
    CHECK(h.status() == ConnectionStatus::Failed);
    CHECK(h.session->state().reason == "Connection timed out");
    CHECK(h.delegate.was_closed(generation));
    CHECK(!h.delegate.was_sent(MessageType::ConnectionCancel));

    // Pending incoming channels that never ask are closed too.
    h.handle(events::IncomingChannel{300, kFpC, "10.0.0.9:1"});
    h.advance(15001);
    h.handle(events::Tick{});
    CHECK(h.delegate.was_closed(300));

    Harness waiting;
    waiting.incoming_from_c(11);
    waiting.advance(15001);
    waiting.handle(events::Tick{});
    CHECK(waiting.status() == ConnectionStatus::Failed);
    CHECK(waiting.session->circuit_breaker().failures("PEER-C") == 0);
}

void test_heartbeat() {
    Harness h;
    uint64_t generation = h.connect_to_b();
    std::size_t before = h.delegate.sent.size();

    h.advance(9999);
    h.handle(events::Tick{});
    CHECK(h.delegate.sent.size() == before);
    h.advance(1);
    h.handle(events::Tick{});
    CHECK(h.delegate.sent.size() == before + 1);
    CHECK(h.delegate.sent.back().envelope.type == MessageType::Ping);

    h.advance(5000);
    h.from_peer(generation, make_pong("PEER-B"));
    h.advance(29000);
    h.handle(events::Tick{});
    CHECK(h.status() == ConnectionStatus::Connected);

    h.from_peer(generation, make_ping("PEER-B"));
    CHECK(h.delegate.sent.back().envelope.type == MessageType::Pong);

    h.advance(30001);
    h.handle(events::Tick{});
    CHECK(h.status() == ConnectionStatus::Failed);
    CHECK(h.session->state().reason == "timeout");
    CHECK(h.delegate.was_closed(generation));
}

void test_circuit_breaker() {
    Harness h;
    h.handle(events::StartDiscovery{});
    h.discover("PEER-B", "Bravo");
    for (int attempt = 0; attempt < 3; ++attempt) {
        h.handle(events::ConnectIntent{"PEER-B"});
        CHECK(h.status() == ConnectionStatus::Requesting);
        h.handle(events::ChannelFailed{h.session->generation(), ErrorKind::ChannelFailure, "refused"});
        CHECK(h.status() == ConnectionStatus::Failed);
    }
    CHECK(h.session->state().reason == "Could not connect to Bravo: refused");
    CHECK(h.session->circuit_breaker().failures("PEER-B") == 3);

    h.handle(events::ConnectIntent{"PEER-B"});
    CHECK(h.status() == ConnectionStatus::Failed);
    CHECK(h.delegate.opened.size() == 3);
    CHECK(h.recorder.noticed("too many failed attempts"));
}

void test_success_resets_breaker() {
    Harness h;
    h.handle(events::StartDiscovery{});
    h.discover("PEER-B", "Bravo");
    h.handle(events::ConnectIntent{"PEER-B"});
    h.handle(events::ChannelFailed{h.session->generation(), ErrorKind::Timeout, "timed out"});
    CHECK(h.session->circuit_breaker().failures("PEER-B") == 1);
    h.connect_to_b();
    CHECK(h.status() == ConnectionStatus::Connected);
    CHECK(h.session->circuit_breaker().failures("PEER-B") == 0);
}

void test_outbound_transfer() {
    Harness h;
    uint64_t generation = h.connect_to_b();
    h.handle(events::SendFilesIntent{{"/tmp/a.txt", "/tmp/b.txt"}});
    CHECK(h.status() == ConnectionStatus::Transferring);
    CHECK(h.delegate.outbound_generation == generation);
    CHECK(h.delegate.outbound_peer == "PEER-B");
    CHECK(h.delegate.outbound_paths.size() == 2);

    h.handle(events::SendFilesIntent{{"/tmp/c.txt"}});
    CHECK(h.recorder.noticed("already in progress"));

    h.handle(events::OutboundProgress{generation, 0.5});
    CHECK(h.session->state().progress == 0.5);
    h.handle(events::OutboundProgress{generation, 0.3});
    CHECK(h.session->state().progress == 0.5);

    h.from_peer(generation, make_file_accept("PEER-B"));
    h.from_peer(generation, make_file_reject("PEER-B", std::string("insufficientStorage")));
    CHECK(h.delegate.offer_answers.size() == 2);
    CHECK(h.delegate.offer_answers[0].first);
    CHECK(!h.delegate.offer_answers[1].first);
    CHECK(h.delegate.offer_answers[1].second == std::optional<std::string>("insufficientStorage"));

    TransferRecord ok = make_transfer_record("a.txt", 10, TransferDirection::Sent, "PEER-B");
    ok.success = true;
    TransferRecord refused = make_transfer_record("b.txt", 10, TransferDirection::Sent, "PEER-B");
    refused.error = std::string("rejected");
    h.handle(events::OutboundFinished{generation, {ok, refused}});
    CHECK(h.status() == ConnectionStatus::Connected);
    CHECK(h.recorder.records.size() == 2);
    CHECK(h.recorder.noticed("Sent 1 of 2"));

    // Cancel mid-stream.
    h.handle(events::SendFilesIntent{{"/tmp/a.txt"}});
    h.handle(events::CancelTransferIntent{});
    CHECK(h.delegate.outbound_cancels == 1);
    h.handle(events::OutboundFinished{generation, {refused}});
    CHECK(h.status() == ConnectionStatus::Connected);

    // Session end stops the sender.
    h.handle(events::SendFilesIntent{{"/tmp/a.txt"}});
    h.handle(events::ChannelClosed{generation});
    CHECK(h.delegate.outbound_cancels == 2);
    CHECK(h.status() == ConnectionStatus::Failed);
}

void test_inbound_transfer() {
    Harness h;
    uint64_t generation = h.connect_to_b();
    auto content = bytes_of("hello over the wire");

    TransferMetadata metadata;
    metadata.file_name = "greeting.txt";
    metadata.file_size = content.size();
    metadata.sha256_hash = sha256_hex(content);
    h.from_peer(generation, make_file_offer("PEER-B", metadata));
    CHECK(h.delegate.sent.back().envelope.type == MessageType::FileAccept);
    CHECK(h.status() == ConnectionStatus::Transferring);

    // No pings while chunks are flowing.
    std::size_t before = h.delegate.sent.size();
    h.advance(10000);
    h.handle(events::Tick{});
    CHECK(h.delegate.sent.size() == before);

    h.from_peer(generation, make_file_chunk("PEER-B", content));
    CHECK(h.session->state().progress == 1.0);
    h.from_peer(generation, make_file_complete("PEER-B", metadata.sha256_hash));
    CHECK(h.status() == ConnectionStatus::Connected);
    CHECK(h.recorder.records.size() == 1);
    CHECK(!h.recorder.records.empty() && h.recorder.records[0].success);
    CHECK(!h.recorder.records.empty() && h.recorder.records[0].direction == TransferDirection::Received);
    auto saved = h.session->settings().download_dir / "greeting.txt";
    CHECK(std::filesystem::exists(saved));
    CHECK(sha256_file(saved) == metadata.sha256_hash);

    // Corrupted stream fails the record, not the session.
    metadata.file_name = "broken.txt";
    h.from_peer(generation, make_file_offer("PEER-B", metadata));
    auto corrupted = content;
    corrupted[0] ^= 0x01;
    h.from_peer(generation, make_file_chunk("PEER-B", corrupted));
    h.from_peer(generation, make_file_complete("PEER-B", metadata.sha256_hash));
    CHECK(h.status() == ConnectionStatus::Connected);
    CHECK(h.recorder.records.size() == 2);
    CHECK(h.recorder.records.size() == 2 && !h.recorder.records[1].success);
    CHECK(!std::filesystem::exists(h.session->settings().download_dir / "broken.txt"));

    // Local cancel tells the sender.
    metadata.file_name = "cancelled.txt";
    h.from_peer(generation, make_file_offer("PEER-B", metadata));
    h.handle(events::CancelTransferIntent{});
    const Envelope* reject = h.delegate.last_of(MessageType::FileReject);
    CHECK(reject && reject_reason(*reject) == std::optional<std::string>(kRejectCancelled));
    CHECK(h.status() == ConnectionStatus::Connected);
    CHECK(h.recorder.records.size() == 3);

    // Sender gives up mid-stream.
    metadata.file_name = "abandoned.txt";
    h.from_peer(generation, make_file_offer("PEER-B", metadata));
    h.from_peer(generation, make_file_reject("PEER-B", std::string(kRejectCancelled)));
    CHECK(h.status() == ConnectionStatus::Connected);
    CHECK(h.recorder.records.size() == 4);
}

void test_two_way_transfer() {
    Harness h;
    uint64_t generation = h.connect_to_b();
    h.handle(events::SendFilesIntent{{"/tmp/out.txt"}});

    auto content = bytes_of("inbound while our offer is open");
    TransferMetadata metadata;
    metadata.file_name = "inbound.txt";
    metadata.file_size = content.size();
    metadata.sha256_hash = sha256_hex(content);
    h.from_peer(generation, make_file_offer("PEER-B", metadata));
    h.from_peer(generation, make_file_chunk("PEER-B", content));

    // The reject answers our offer and leaves the inbound file alone.
    h.from_peer(generation, make_file_reject("PEER-B", std::string("invalidName")));
    CHECK(h.delegate.offer_answers.size() == 1);
    CHECK(!h.delegate.offer_answers.empty() && !h.delegate.offer_answers[0].first);
    CHECK(!h.delegate.offer_answers.empty() &&
          h.delegate.offer_answers[0].second == std::optional<std::string>("invalidName"));
    CHECK(h.delegate.outbound_cancels == 0);
    CHECK(h.recorder.records.empty());

    h.from_peer(generation, make_file_complete("PEER-B", metadata.sha256_hash));
    CHECK(h.recorder.records.size() == 1);
    CHECK(!h.recorder.records.empty() && h.recorder.records[0].success);
    CHECK(std::filesystem::exists(h.session->settings().download_dir / "inbound.txt"));

    // With no offer waiting, only a cancel aborts the inbound file.
    h.delegate.offer_pending = false;
    metadata.file_name = "second.txt";
    h.from_peer(generation, make_file_offer("PEER-B", metadata));
    h.from_peer(generation, make_file_reject("PEER-B", std::string("insufficientStorage")));
    CHECK(h.recorder.records.size() == 1);
    h.from_peer(generation, make_file_reject("PEER-B", std::string(kRejectCancelled)));
    CHECK(h.recorder.records.size() == 2);
    CHECK(h.recorder.records.size() == 2 && !h.recorder.records[1].success);
    CHECK(h.delegate.outbound_cancels == 1);

    h.handle(events::OutboundFinished{generation, {}});
    CHECK(h.status() == ConnectionStatus::Connected);
}

void test_inbound_batch() {
    Harness h;
    uint64_t generation = h.connect_to_b();
    h.from_peer(generation, make_batch_start("PEER-B", BatchMetadata{2, "BATCH-9"}));
    for (const char* name : {"one.txt", "two.txt"}) {
        auto content = bytes_of(name);
        TransferMetadata metadata;
        metadata.file_name = name;
        metadata.file_size = content.size();
        metadata.sha256_hash = sha256_hex(content);
        h.from_peer(generation, make_file_offer("PEER-B", metadata));
        h.from_peer(generation, make_file_chunk("PEER-B", content));
        h.from_peer(generation, make_file_complete("PEER-B", metadata.sha256_hash));
    }
    CHECK(h.recorder.batches.empty());
    h.from_peer(generation, make_batch_complete("PEER-B", "BATCH-9"));
    CHECK(h.recorder.batches.size() == 1);
    CHECK(!h.recorder.batches.empty() && h.recorder.batches[0].succeeded == 2);
}

void test_feature_toggles() {
    Harness h([](SessionSettings& settings) {
        settings.file_transfer_enabled = false;
        settings.chat_enabled = false;
        settings.voice_enabled = false;
    });
    uint64_t generation = h.connect_to_b();

    TransferMetadata metadata;
    metadata.file_name = "x.bin";
    metadata.file_size = 1;
    metadata.sha256_hash = sha256_hex(bytes_of("x"));
    h.from_peer(generation, make_file_offer("PEER-B", metadata));
    CHECK(reject_reason(h.delegate.sent.back().envelope) == std::optional<std::string>(kRejectFeatureDisabled));
    CHECK(h.delegate.sent.back().envelope.type == MessageType::FileReject);

    TextMessagePayload text;
    text.text = "hi";
    h.from_peer(generation, make_text_message("PEER-B", text));
    CHECK(h.delegate.sent.back().envelope.type == MessageType::ChatReject);
    CHECK(reject_reason(h.delegate.sent.back().envelope) == std::optional<std::string>(kRejectFeatureDisabled));
    CHECK(h.recorder.texts.empty());

    h.from_peer(generation, make_call_request("PEER-B"));
    CHECK(h.delegate.sent.back().envelope.type == MessageType::CallReject);
    CHECK(reject_reason(h.delegate.sent.back().envelope) == std::optional<std::string>(kRejectFeatureDisabled));
    CHECK(h.recorder.call_requests.empty());

    h.handle(events::SendFilesIntent{{"/tmp/a.txt"}});
    CHECK(h.delegate.outbound_paths.empty());
    h.handle(events::StartCallIntent{});
    CHECK(!h.delegate.was_sent(MessageType::CallRequest));
    CHECK(h.status() == ConnectionStatus::Connected);
}

void test_calls() {
    Harness h;
    uint64_t generation = h.connect_to_b();

    h.from_peer(generation, make_call_request("PEER-B"));
    CHECK(h.recorder.call_requests == std::vector<std::string>{"PEER-B"});
    h.handle(events::AcceptCallIntent{});
    CHECK(h.delegate.sent.back().envelope.type == MessageType::CallAccept);
    CHECK(h.status() == ConnectionStatus::VoiceCall);
    CHECK(h.recorder.calls_started == 1);

    h.from_peer(generation, make_sdp_offer("PEER-B", bytes_of("v=0")));
    h.from_peer(generation, make_ice_candidate("PEER-B", bytes_of("candidate:1")));
    CHECK(h.recorder.signaling.size() == 2);
    CHECK(h.recorder.signaling.size() == 2 && h.recorder.signaling[0].first == MessageType::SdpOffer);

    h.from_peer(generation, make_call_end("PEER-B"));
    CHECK(h.status() == ConnectionStatus::Connected);
    CHECK(h.recorder.calls_ended == 1);

    h.handle(events::StartCallIntent{});
    CHECK(h.delegate.sent.back().envelope.type == MessageType::CallRequest);
    h.from_peer(generation, make_call_reject("PEER-B", std::string("busy")));
    CHECK(h.recorder.call_rejections.size() == 1);
    CHECK(h.status() == ConnectionStatus::Connected);

    h.handle(events::StartCallIntent{});
    h.from_peer(generation, make_call_accept("PEER-B"));
    CHECK(h.status() == ConnectionStatus::VoiceCall);
    h.handle(events::EndCallIntent{});
    CHECK(h.delegate.sent.back().envelope.type == MessageType::CallEnd);
    CHECK(h.status() == ConnectionStatus::Connected);
}

void test_chat() {
    Harness h;
    h.handle(events::SendMessageIntent{"too early"});
    CHECK(h.delegate.sent.empty());

    uint64_t generation = h.connect_to_b();
    h.handle(events::SendMessageIntent{"hello bravo"});
    const Envelope* sent = h.delegate.last_of(MessageType::TextMessage);
    CHECK(sent != nullptr);
    if (sent) {
        auto message = decode_payload<TextMessagePayload>(*sent);
        CHECK(message.text == "hello bravo");
        CHECK(message.sender_name == std::optional<std::string>("Alpha"));
        CHECK(message.timestamp_ms > 0);
    }

    TextMessagePayload incoming;
    incoming.text = "hi alpha";
    h.from_peer(generation, make_text_message("PEER-B", incoming));
    CHECK(h.recorder.texts == std::vector<std::string>{"hi alpha"});

    MediaMessagePayload media;
    media.id = "MEDIA-7";
    media.file_name = "pic.png";
    media.file_size = 10;
    media.mime_type = "image/png";
    media.media_type = MediaType::Image;
    h.from_peer(generation, make_media_message("PEER-B", media));
    CHECK(h.recorder.media == std::vector<std::string>{"MEDIA-7"});
    const Envelope* receipt = h.delegate.last_of(MessageType::MessageReceipt);
    CHECK(receipt && decode_payload<MessageReceiptPayload>(*receipt).message_ids == std::vector<std::string>{"MEDIA-7"});

    h.from_peer(generation, make_chat_reject("PEER-B", std::string("featureDisabled")));
    CHECK(h.recorder.chat_rejections.size() == 1);
}

} // namespace

int main() {
    try {
        test_discovery();
        test_outgoing_connection();
        test_outgoing_trust_mismatch();
        test_hello_must_match_channel();
        test_rejected_and_cancelled();
        test_incoming_accept();
        test_incoming_reject();
        test_incoming_trust_failures();
        test_busy_while_connected();
        test_stale_generations();
        test_establish_timeouts();
        test_heartbeat();
        test_circuit_breaker();
        test_success_resets_breaker();
        test_outbound_transfer();
        test_inbound_transfer();
        test_two_way_transfer();
        test_inbound_batch();
        test_feature_toggles();
        test_calls();
        test_chat();
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << "\n";
        return 2;
    }
    return peerlink_test::finish("session_test");
}
