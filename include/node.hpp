/*
 * PeerLink - peer node runtime
 *
 * Wires a Session to real sockets. The session runs on the event thread; the
 * listener, one thread per accepted or attempted connection (handshake, then
 * reader) and the outbound sender only post events to it.
 */

#pragma once

#include "at_rest.hpp"
#include "certificate.hpp"
#include "config.hpp"
#include "event_queue.hpp"
#include "retry_policy.hpp"
#include "secure_channel.hpp"
#include "session.hpp"
#include "transfer_history.hpp"
#include "trust_store.hpp"

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
#include <utility>
#include <vector>

namespace peerlink {

class PeerNode : private SessionDelegate, private SessionObserver {
public:
    explicit PeerNode(NodeConfig config);
    ~PeerNode();

    PeerNode(const PeerNode&) = delete;
    PeerNode& operator=(const PeerNode&) = delete;

    // Sinks and the observer must be set before start(). They are called on
    // the event thread.
    void set_observer(SessionObserver* observer) { external_observer_ = observer; }
    void set_chat_sink(ChatSink* sink) { chat_sink_ = sink; }
    void set_call_sink(CallSink* sink) { call_sink_ = sink; }

    // Loads persisted state, binds the listener and starts the threads.
    // Throws PeerLinkError when the listener cannot be opened.
    void start();

    void stop();

    // Readers posting file chunks block while too many are waiting.
    void post(SessionEvent event);

    void add_peer(const PeerCandidate& peer) { post(events::PeerDiscovered{peer}); }
    void connect(const std::string& peer_id) { post(events::ConnectIntent{peer_id}); }
    void accept() { post(events::AcceptIntent{}); }
    void reject(const std::optional<std::string>& reason) { post(events::RejectIntent{reason}); }
    void disconnect() { post(events::DisconnectIntent{}); }
    void send_files(const std::vector<std::filesystem::path>& paths) { post(events::SendFilesIntent{paths}); }
    void cancel_transfer() { post(events::CancelTransferIntent{}); }
    void send_message(const std::string& text) { post(events::SendMessageIntent{text}); }
    void start_call() { post(events::StartCallIntent{}); }
    void accept_call() { post(events::AcceptCallIntent{}); }
    void reject_call(const std::optional<std::string>& reason) { post(events::RejectCallIntent{reason}); }
    void end_call() { post(events::EndCallIntent{}); }

    // Schedules a connection to the last peer after the next backoff delay.
    // False when there is no previous peer or the attempts are used up.
    bool reconnect();

    ConnectionState state() const;
    std::optional<PeerIdentity> remote_peer() const;

    bool wait_for_state(ConnectionStatus status, std::chrono::milliseconds timeout) const;

    uint16_t listen_port() const { return listen_port_; }
    const std::string& peer_id() const { return config_.peer_id; }
    const std::string& fingerprint() const { return identity_.fingerprint(); }
    const NodeConfig& config() const { return config_; }

    std::vector<TransferRecord> history() const;

private:
    struct ChannelSlot {
        std::shared_ptr<SecureChannel> channel;
        std::shared_ptr<std::atomic<bool>> cancel;
    };

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    // SessionDelegate
    uint64_t open_channel(const PeerCandidate& peer,
                          const std::optional<std::string>& expected_fingerprint) override;
    void close_channel(uint64_t generation) override;
    bool send(uint64_t generation, const Envelope& envelope) override;
    void start_outbound(uint64_t generation,
                        const std::string& peer_id,
                        const std::vector<std::filesystem::path>& paths) override;
    void cancel_outbound() override;
    bool resolve_outbound_offer(bool accepted, const std::optional<std::string>& reason) override;

    // SessionObserver
    void on_state_changed(const ConnectionState& state) override;
    void on_incoming_request(const PeerIdentity& peer) override;
    void on_notice(const std::string& text) override;
    void on_security_warning(const std::string& text) override;
    void on_peer_pinned(const std::string& peer_id, const std::string& fingerprint) override;
    void on_batch_complete(const BatchSummary& summary) override;

    void event_loop();
    void accept_loop();
    void run_incoming(std::shared_ptr<IncomingConnection> connection);
    void run_outgoing(uint64_t generation,
                      PeerCandidate peer,
                      std::optional<std::string> expected_fingerprint,
                      std::shared_ptr<std::atomic<bool>> cancel);
    void read_loop(uint64_t generation, std::shared_ptr<SecureChannel> channel);
    void spawn(std::function<void()> task);
    bool register_channel(uint64_t generation, const std::shared_ptr<SecureChannel>& channel);
    void save_trust();

    NodeConfig config_;
    CertificateManager identity_;
    TrustStore trust_;
    std::filesystem::path trust_path_;
    std::unique_ptr<AtRestEncryptor> encryptor_;
    std::unique_ptr<TransferHistoryStore> history_;
    std::unique_ptr<SecureListener> listener_;
    std::unique_ptr<Session> session_;
    uint16_t listen_port_ = 0;

    SessionObserver* external_observer_ = nullptr;
    ChatSink* chat_sink_ = nullptr;
    CallSink* call_sink_ = nullptr;

    std::atomic<bool> running_{false};
    std::thread event_thread_;
    std::thread accept_thread_;

    EventQueue queue_;
    std::mutex schedule_mutex_;
    std::optional<std::pair<std::chrono::steady_clock::time_point, std::string>> scheduled_connect_;

    std::atomic<uint64_t> next_generation_{1};
    std::mutex channels_mutex_;
    std::map<uint64_t, ChannelSlot> channels_;

    std::mutex workers_mutex_;
    std::vector<Worker> workers_;

    std::mutex outbound_mutex_;
    std::shared_ptr<FileSender> outbound_;
    std::thread sender_thread_;

    mutable std::mutex state_mutex_;
    mutable std::condition_variable state_cv_;
    ConnectionState state_;
    std::optional<PeerIdentity> remote_;
    std::string last_peer_id_;
    RetryController retry_;
};

} // namespace peerlink
