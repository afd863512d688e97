/*
 * PeerLink - TLS secure channel
 *
 * Both ends present the ephemeral certificate of their CertificateManager.
 * Trust is not decided by a certificate authority: a verify callback computes
 * the leaf fingerprint and hands it to a FingerprintVerifier while the
 * handshake is in progress. The verifier and what it saw live in the SSL
 * object itself, so every connection carries its own. Renegotiation is off.
 */

#pragma once

#include "certificate.hpp"
#include "protocol.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

typedef struct ssl_st SSL;
typedef struct ssl_ctx_st SSL_CTX;

namespace peerlink {

// Returns true to accept the presented leaf fingerprint.
using FingerprintVerifier = std::function<bool(const std::string& fingerprint)>;

struct SslCtxDeleter {
    void operator()(SSL_CTX* ctx) const;
};

using SslCtxPtr = std::unique_ptr<SSL_CTX, SslCtxDeleter>;

class SecureChannel {
public:
    // Takes ownership of the handshaken SSL object and its socket.
    SecureChannel(SSL* ssl, int socket_fd, std::string peer_fingerprint, std::string remote_address);
    ~SecureChannel();

    SecureChannel(const SecureChannel&) = delete;
    SecureChannel& operator=(const SecureChannel&) = delete;

    // Writes one whole frame; frames from concurrent callers never interleave.
    // Returns false once the channel is unusable.
    bool send_envelope(const Envelope& envelope);

    // Blocks for the next frame. nullopt on orderly close. Throws
    // PeerLinkError for protocol violations (the frame has been consumed) and
    // for transport failures.
    std::optional<Envelope> receive_envelope();

    // Safe from any thread; wakes a blocked reader.
    void close();

    bool is_open() const { return !closed_.load(); }

    const std::string& peer_fingerprint() const { return peer_fingerprint_; }
    const std::string& remote_address() const { return remote_address_; }

    bool allows_renegotiation() const;

private:
    enum class IoResult {
        Ok,
        Closed,
        Failed
    };

    IoResult read_exact(uint8_t* data, std::size_t len, bool& any_read);
    IoResult write_all(const uint8_t* data, std::size_t len);

    SSL* ssl_;
    int socket_fd_;
    std::string peer_fingerprint_;
    std::string remote_address_;
    std::atomic<bool> closed_{false};
    std::mutex ssl_mutex_;
    std::mutex write_mutex_;
};

// A TCP connection taken off the listen queue whose TLS handshake has not run.
// Closes the socket unless a handshake hands it on to a SecureChannel.
class IncomingConnection {
public:
    IncomingConnection(int socket_fd, std::string remote_address);
    ~IncomingConnection();

    IncomingConnection(const IncomingConnection&) = delete;
    IncomingConnection& operator=(const IncomingConnection&) = delete;

    const std::string& remote_address() const { return remote_address_; }

private:
    friend class SecureListener;

    int socket_fd_;
    std::string remote_address_;
};

class SecureListener {
public:
    // Binds and listens. An empty bind address means every interface, port 0
    // picks an ephemeral port. The verifier defaults to accepting any client.
    SecureListener(const CertificateManager& identity,
                   const std::string& bind_address,
                   uint16_t port,
                   FingerprintVerifier verifier = nullptr);
    ~SecureListener();

    SecureListener(const SecureListener&) = delete;
    SecureListener& operator=(const SecureListener&) = delete;

    uint16_t port() const { return port_; }

    // Blocks for the next TCP connection. nullptr once the listener is closed.
    std::unique_ptr<IncomingConnection> next_connection();

    // Runs the server side of the TLS handshake on one connection. Safe to
    // call from several threads at once. Throws PeerLinkError(FingerprintMismatch)
    // when the verifier refuses the client, PeerLinkError(Timeout) or
    // PeerLinkError(ChannelFailure) otherwise; closing the listener aborts it.
    std::unique_ptr<SecureChannel> handshake(IncomingConnection& connection,
                                             std::chrono::milliseconds timeout) const;

    void close();

private:
    FingerprintVerifier verifier_;
    SslCtxPtr ctx_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> closed_{false};
};

// Client role. With an expected fingerprint the handshake fails with
// PeerLinkError(FingerprintMismatch) unless the server presents exactly that
// key; without one any server is accepted and trust is left to the caller.
// Other failures throw PeerLinkError(Timeout) or PeerLinkError(ChannelFailure).
std::unique_ptr<SecureChannel> connect_secure(const CertificateManager& identity,
                                              const std::string& host,
                                              uint16_t port,
                                              const std::optional<std::string>& expected_fingerprint,
                                              std::chrono::milliseconds timeout,
                                              const std::atomic<bool>* cancel = nullptr);

} // namespace peerlink
