/*
 * PeerLink - TLS secure channel implementation
 */

#include "secure_channel.hpp"

#include "errors.hpp"
#include "utils.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstring>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

namespace peerlink {

namespace {
constexpr int kPollSliceMs = 200;
constexpr int kListenBacklog = 16;
constexpr std::size_t kMaxWriteSlice = 256 * 1024;
constexpr auto kWriteStallTimeout = std::chrono::seconds(30);

using Deadline = std::chrono::steady_clock::time_point;

enum class WaitOutcome {
    Ready,
    Timeout,
    Cancelled,
    Error
};

void init_tls() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        OPENSSL_init_ssl(0, nullptr);
        // A peer vanishing mid-write must surface as an I/O error.
        std::signal(SIGPIPE, SIG_IGN);
    });
}

std::string openssl_error() {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "unknown TLS error";
    }
    char buffer[256];
    ERR_error_string_n(err, buffer, sizeof(buffer));
    ERR_clear_error();
    return buffer;
}

bool set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

void set_nodelay(int fd) {
    int one = 1;
    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) != 0) {
        log_debug("TCP_NODELAY not applied: " + std::string(std::strerror(errno)));
    }
}

// One poll slice. POLLHUP/POLLERR count as ready so the next I/O call reports them.
WaitOutcome wait_socket(int fd, short events, int timeout_ms) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = events;
    int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc < 0) {
        return errno == EINTR ? WaitOutcome::Timeout : WaitOutcome::Error;
    }
    return rc == 0 ? WaitOutcome::Timeout : WaitOutcome::Ready;
}

WaitOutcome wait_until(int fd, short events, Deadline deadline, const std::atomic<bool>* cancel) {
    while (true) {
        if (cancel && cancel->load()) {
            return WaitOutcome::Cancelled;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return WaitOutcome::Timeout;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        int slice = static_cast<int>(std::min<long long>(left + 1, kPollSliceMs));
        WaitOutcome outcome = wait_socket(fd, events, slice);
        if (outcome != WaitOutcome::Timeout) {
            return outcome;
        }
    }
}

[[noreturn]] void throw_wait_failure(WaitOutcome outcome, const std::string& what) {
    switch (outcome) {
        case WaitOutcome::Timeout:
            throw PeerLinkError(ErrorKind::Timeout, what + " timed out");
        case WaitOutcome::Cancelled:
            throw PeerLinkError(ErrorKind::ChannelFailure, what + " cancelled");
        default:
            throw PeerLinkError(ErrorKind::ChannelFailure,
                                what + " failed: " + std::string(std::strerror(errno)));
    }
}

// Filled by the verify callback while one connection handshakes.
struct CertificateVerifyState {
    FingerprintVerifier verifier;
    std::string presented;
    bool rejected = false;
};

void free_verify_state(void*, void* ptr, CRYPTO_EX_DATA*, int, long, void*) {
    delete static_cast<CertificateVerifyState*>(ptr);
}

int verify_state_index() {
    static const int index = SSL_get_ex_new_index(0, nullptr, nullptr, nullptr, free_verify_state);
    return index;
}

CertificateVerifyState* verify_state_of(const SSL* ssl) {
    return static_cast<CertificateVerifyState*>(SSL_get_ex_data(ssl, verify_state_index()));
}

// The state is freed together with the SSL object. The caller keeps the socket.
SSL* new_connection_ssl(SSL_CTX* ctx, int fd, FingerprintVerifier verifier) {
    const int index = verify_state_index();
    if (index < 0) {
        throw PeerLinkError(ErrorKind::ChannelFailure, "No ex_data slot for the verify state: " + openssl_error());
    }
    SSL* ssl = SSL_new(ctx);
    if (!ssl) {
        throw PeerLinkError(ErrorKind::ChannelFailure, "SSL_new failed: " + openssl_error());
    }
    auto state = std::make_unique<CertificateVerifyState>();
    state->verifier = std::move(verifier);
    if (SSL_set_ex_data(ssl, index, state.get()) != 1) {
        SSL_free(ssl);
        throw PeerLinkError(ErrorKind::ChannelFailure, "SSL_set_ex_data failed: " + openssl_error());
    }
    state.release();
    if (SSL_set_fd(ssl, fd) != 1) {
        SSL_free(ssl);
        throw PeerLinkError(ErrorKind::ChannelFailure, "SSL_set_fd failed: " + openssl_error());
    }
    return ssl;
}

int verify_leaf_fingerprint(X509_STORE_CTX* store, void*) {
    auto* ssl = static_cast<SSL*>(X509_STORE_CTX_get_ex_data(store, SSL_get_ex_data_X509_STORE_CTX_idx()));
    CertificateVerifyState* state = ssl ? verify_state_of(ssl) : nullptr;
    if (!state) {
        X509_STORE_CTX_set_error(store, X509_V_ERR_APPLICATION_VERIFICATION);
        return 0;
    }
    X509* leaf = X509_STORE_CTX_get0_cert(store);
    if (!leaf) {
        state->rejected = true;
        return 0;
    }
    try {
        state->presented = fingerprint_of_certificate(leaf);
    } catch (const std::exception& ex) {
        log_warn(std::string("Cannot fingerprint peer certificate: ") + ex.what());
        state->rejected = true;
        return 0;
    }
    if (state->verifier && !state->verifier(state->presented)) {
        state->rejected = true;
        X509_STORE_CTX_set_error(store, X509_V_ERR_CERT_REJECTED);
        return 0;
    }
    return 1;
}

SslCtxPtr make_context(const CertificateManager& identity, bool server) {
    init_tls();
    SslCtxPtr ctx(SSL_CTX_new(server ? TLS_server_method() : TLS_client_method()));
    if (!ctx) {
        throw PeerLinkError(ErrorKind::ChannelFailure, "SSL_CTX_new failed: " + openssl_error());
    }
    if (SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION) != 1 ||
        SSL_CTX_use_certificate(ctx.get(), identity.certificate()) != 1 ||
        SSL_CTX_use_PrivateKey(ctx.get(), identity.private_key()) != 1 ||
        SSL_CTX_check_private_key(ctx.get()) != 1) {
        throw PeerLinkError(ErrorKind::ChannelFailure, "TLS context setup failed: " + openssl_error());
    }

    int mode = SSL_VERIFY_PEER;
    if (server) {
        mode |= SSL_VERIFY_FAIL_IF_NO_PEER_CERT;
    }
    SSL_CTX_set_verify(ctx.get(), mode, nullptr);
    SSL_CTX_set_cert_verify_callback(ctx.get(), verify_leaf_fingerprint, nullptr);
    // Every handshake must run the verify callback, and only one runs per channel.
    SSL_CTX_set_session_cache_mode(ctx.get(), SSL_SESS_CACHE_OFF);
    SSL_CTX_set_options(ctx.get(), SSL_OP_NO_TICKET | SSL_OP_IGNORE_UNEXPECTED_EOF | SSL_OP_NO_RENEGOTIATION);
    SSL_CTX_set_mode(ctx.get(), SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
    return ctx;
}

void drive_handshake(SSL* ssl, int fd, bool server, Deadline deadline, const std::atomic<bool>* cancel) {
    const CertificateVerifyState& state = *verify_state_of(ssl);
    while (true) {
        ERR_clear_error();
        int rc = server ? SSL_accept(ssl) : SSL_connect(ssl);
        if (rc == 1) {
            return;
        }
        int err = SSL_get_error(ssl, rc);
        short events = 0;
        if (err == SSL_ERROR_WANT_READ) {
            events = POLLIN;
        } else if (err == SSL_ERROR_WANT_WRITE) {
            events = POLLOUT;
        } else if (state.rejected) {
            ERR_clear_error();
            throw PeerLinkError(ErrorKind::FingerprintMismatch,
                                "Peer presented fingerprint " + state.presented +
                                    " which does not match the trusted fingerprint");
        } else {
            throw PeerLinkError(ErrorKind::ChannelFailure, "TLS handshake failed: " + openssl_error());
        }
        WaitOutcome outcome = wait_until(fd, events, deadline, cancel);
        if (outcome != WaitOutcome::Ready) {
            throw_wait_failure(outcome, "TLS handshake");
        }
    }
}

std::string peer_fingerprint_of(SSL* ssl) {
    X509* cert = SSL_get1_peer_certificate(ssl);
    if (!cert) {
        throw PeerLinkError(ErrorKind::ChannelFailure, "Peer presented no certificate");
    }
    std::string fingerprint;
    try {
        fingerprint = fingerprint_of_certificate(cert);
    } catch (const std::exception& ex) {
        X509_free(cert);
        throw PeerLinkError(ErrorKind::ChannelFailure, ex.what());
    }
    X509_free(cert);
    return fingerprint;
}

std::string describe_address(const sockaddr* addr) {
    char host[INET6_ADDRSTRLEN] = {0};
    uint16_t port = 0;
    if (addr->sa_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(addr);
        inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
        port = ntohs(in->sin_port);
    } else if (addr->sa_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        port = ntohs(in6->sin6_port);
    } else {
        return "unknown";
    }
    return std::string(host) + ":" + std::to_string(port);
}

int connect_tcp(const std::string& host,
                uint16_t port,
                Deadline deadline,
                const std::atomic<bool>* cancel) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* results = nullptr;
    int rc = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &results);
    if (rc != 0) {
        throw PeerLinkError(ErrorKind::ChannelFailure,
                            "Failed to resolve " + host + ": " + gai_strerror(rc));
    }

    std::string last_error = "no usable address";
    for (addrinfo* ai = results; ai; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::strerror(errno);
            continue;
        }
        if (!set_nonblocking(fd)) {
            last_error = std::strerror(errno);
            ::close(fd);
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            ::freeaddrinfo(results);
            return fd;
        }
        if (errno != EINPROGRESS) {
            last_error = std::strerror(errno);
            ::close(fd);
            continue;
        }

        WaitOutcome outcome = wait_until(fd, POLLOUT, deadline, cancel);
        if (outcome == WaitOutcome::Timeout || outcome == WaitOutcome::Cancelled) {
            ::close(fd);
            ::freeaddrinfo(results);
            throw_wait_failure(outcome, "Connection to " + host + ":" + std::to_string(port));
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (outcome == WaitOutcome::Ready &&
            getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 && so_error == 0) {
            ::freeaddrinfo(results);
            return fd;
        }
        last_error = std::strerror(so_error != 0 ? so_error : errno);
        ::close(fd);
    }
    ::freeaddrinfo(results);
    throw PeerLinkError(ErrorKind::ChannelFailure,
                        "Failed to connect to " + host + ":" + std::to_string(port) + ": " + last_error);
}
} // namespace

void SslCtxDeleter::operator()(SSL_CTX* ctx) const {
    SSL_CTX_free(ctx);
}

IncomingConnection::IncomingConnection(int socket_fd, std::string remote_address)
    : socket_fd_(socket_fd), remote_address_(std::move(remote_address)) {}

IncomingConnection::~IncomingConnection() {
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
    }
}

SecureChannel::SecureChannel(SSL* ssl,
                             int socket_fd,
                             std::string peer_fingerprint,
                             std::string remote_address)
    : ssl_(ssl),
      socket_fd_(socket_fd),
      peer_fingerprint_(std::move(peer_fingerprint)),
      remote_address_(std::move(remote_address)) {}

bool SecureChannel::allows_renegotiation() const {
    return (SSL_get_options(ssl_) & SSL_OP_NO_RENEGOTIATION) == 0;
}

SecureChannel::~SecureChannel() {
    close();
    SSL_free(ssl_);
    ::close(socket_fd_);
}

bool SecureChannel::send_envelope(const Envelope& envelope) {
    std::vector<uint8_t> frame = encode_frame(envelope);
    std::lock_guard<std::mutex> lock(write_mutex_);
    IoResult result = write_all(frame.data(), frame.size());
    if (result != IoResult::Ok) {
        if (!closed_) {
            log_warn("Write to " + remote_address_ + " failed");
        }
        return false;
    }
    return true;
}

std::optional<Envelope> SecureChannel::receive_envelope() {
    uint8_t header[kFrameHeaderSize];
    bool any_read = false;
    IoResult result = read_exact(header, sizeof(header), any_read);
    if (result == IoResult::Closed && (!any_read || closed_)) {
        return std::nullopt;
    }
    if (result != IoResult::Ok) {
        throw PeerLinkError(ErrorKind::ChannelFailure,
                            any_read ? "Connection closed mid-frame" : "Secure channel read failed");
    }

    uint32_t len = parse_frame_header(header);
    std::vector<uint8_t> body(len);
    if (len > 0) {
        result = read_exact(body.data(), body.size(), any_read);
        if (result == IoResult::Closed && closed_) {
            return std::nullopt;
        }
        if (result != IoResult::Ok) {
            throw PeerLinkError(ErrorKind::ChannelFailure, "Connection closed mid-frame");
        }
    }
    return decode_envelope(body);
}

void SecureChannel::close() {
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(ssl_mutex_);
        ERR_clear_error();
        if (SSL_shutdown(ssl_) < 0) {
            log_debug("close_notify not sent to " + remote_address_);
            ERR_clear_error();
        }
    }
    ::shutdown(socket_fd_, SHUT_RDWR);
}

SecureChannel::IoResult SecureChannel::read_exact(uint8_t* data, std::size_t len, bool& any_read) {
    std::size_t total = 0;
    while (total < len) {
        if (closed_) {
            return IoResult::Closed;
        }
        int rc = 0;
        int err = SSL_ERROR_NONE;
        {
            std::lock_guard<std::mutex> lock(ssl_mutex_);
            ERR_clear_error();
            rc = SSL_read(ssl_, data + total, static_cast<int>(std::min<std::size_t>(len - total, INT_MAX)));
            if (rc <= 0) {
                err = SSL_get_error(ssl_, rc);
            }
        }
        if (rc > 0) {
            total += static_cast<std::size_t>(rc);
            any_read = true;
            continue;
        }
        if (err == SSL_ERROR_ZERO_RETURN) {
            return IoResult::Closed;
        }
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
            short events = err == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT;
            if (wait_socket(socket_fd_, events, kPollSliceMs) == WaitOutcome::Error) {
                return IoResult::Failed;
            }
            continue;
        }
        return closed_ ? IoResult::Closed : IoResult::Failed;
    }
    return IoResult::Ok;
}

SecureChannel::IoResult SecureChannel::write_all(const uint8_t* data, std::size_t len) {
    std::size_t total = 0;
    auto stall_deadline = std::chrono::steady_clock::now() + kWriteStallTimeout;
    while (total < len) {
        if (closed_) {
            return IoResult::Closed;
        }
        int rc = 0;
        int err = SSL_ERROR_NONE;
        {
            std::lock_guard<std::mutex> lock(ssl_mutex_);
            ERR_clear_error();
            rc = SSL_write(ssl_, data + total, static_cast<int>(std::min(len - total, kMaxWriteSlice)));
            if (rc <= 0) {
                err = SSL_get_error(ssl_, rc);
            }
        }
        if (rc > 0) {
            total += static_cast<std::size_t>(rc);
            stall_deadline = std::chrono::steady_clock::now() + kWriteStallTimeout;
            continue;
        }
        if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ) {
            if (std::chrono::steady_clock::now() >= stall_deadline) {
                log_warn("Peer " + remote_address_ + " stopped reading");
                return IoResult::Failed;
            }
            short events = err == SSL_ERROR_WANT_WRITE ? POLLOUT : POLLIN;
            if (wait_socket(socket_fd_, events, kPollSliceMs) == WaitOutcome::Error) {
                return IoResult::Failed;
            }
            continue;
        }
        return closed_ ? IoResult::Closed : IoResult::Failed;
    }
    return IoResult::Ok;
}

SecureListener::SecureListener(const CertificateManager& identity,
                               const std::string& bind_address,
                               uint16_t port,
                               FingerprintVerifier verifier) {
    verifier_ = std::move(verifier);
    ctx_ = make_context(identity, true);

    listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
        throw PeerLinkError(ErrorKind::ChannelFailure,
                            "Failed to create socket: " + std::string(std::strerror(errno)));
    }

    int opt = 1;
    if (setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) != 0) {
        log_warn("SO_REUSEADDR not applied: " + std::string(std::strerror(errno)));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (bind_address.empty()) {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, bind_address.c_str(), &addr.sin_addr) != 1) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw std::invalid_argument("Invalid bind address: " + bind_address);
    }

    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int saved = errno;
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw PeerLinkError(ErrorKind::ChannelFailure, "Failed to bind: " + std::string(std::strerror(saved)));
    }
    if (::listen(listen_fd_, kListenBacklog) < 0 || !set_nonblocking(listen_fd_)) {
        int saved = errno;
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw PeerLinkError(ErrorKind::ChannelFailure, "Failed to listen: " + std::string(std::strerror(saved)));
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        port_ = ntohs(bound.sin_port);
    } else {
        port_ = port;
    }
    log_info("Secure listener on " + (bind_address.empty() ? std::string("0.0.0.0") : bind_address) + ":" +
             std::to_string(port_));
}

SecureListener::~SecureListener() {
    close();
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
    }
}

std::unique_ptr<IncomingConnection> SecureListener::next_connection() {
    while (!closed_) {
        WaitOutcome outcome = wait_socket(listen_fd_, POLLIN, kPollSliceMs);
        if (outcome == WaitOutcome::Timeout) {
            continue;
        }
        if (outcome == WaitOutcome::Error) {
            if (closed_) {
                break;
            }
            throw PeerLinkError(ErrorKind::ChannelFailure,
                                "poll on listener failed: " + std::string(std::strerror(errno)));
        }

        sockaddr_storage peer{};
        socklen_t peer_len = sizeof(peer);
        int fd = ::accept4(listen_fd_, reinterpret_cast<sockaddr*>(&peer), &peer_len,
                           SOCK_CLOEXEC | SOCK_NONBLOCK);
        if (fd < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            if (closed_) {
                break;
            }
            throw PeerLinkError(ErrorKind::ChannelFailure,
                                "accept failed: " + std::string(std::strerror(errno)));
        }
        set_nodelay(fd);
        return std::make_unique<IncomingConnection>(fd, describe_address(reinterpret_cast<sockaddr*>(&peer)));
    }
    return nullptr;
}

std::unique_ptr<SecureChannel> SecureListener::handshake(IncomingConnection& connection,
                                                         std::chrono::milliseconds timeout) const {
    if (connection.socket_fd_ < 0) {
        throw PeerLinkError(ErrorKind::ChannelFailure, "Connection from " + connection.remote_address_ +
                                                           " was already handed to a channel");
    }
    SSL* ssl = new_connection_ssl(ctx_.get(), connection.socket_fd_, verifier_);
    std::string fingerprint;
    try {
        drive_handshake(ssl, connection.socket_fd_, true, std::chrono::steady_clock::now() + timeout, &closed_);
        fingerprint = peer_fingerprint_of(ssl);
    } catch (const PeerLinkError&) {
        SSL_free(ssl);
        throw;
    }

    const int fd = connection.socket_fd_;
    connection.socket_fd_ = -1;
    log_info("Accepted secure channel from " + connection.remote_address_ + " (" + SSL_get_version(ssl) + ")");
    return std::make_unique<SecureChannel>(ssl, fd, fingerprint, connection.remote_address_);
}

void SecureListener::close() {
    closed_ = true;
}

std::unique_ptr<SecureChannel> connect_secure(const CertificateManager& identity,
                                              const std::string& host,
                                              uint16_t port,
                                              const std::optional<std::string>& expected_fingerprint,
                                              std::chrono::milliseconds timeout,
                                              const std::atomic<bool>* cancel) {
    const Deadline deadline = std::chrono::steady_clock::now() + timeout;

    SslCtxPtr ctx = make_context(identity, false);

    int fd = connect_tcp(host, port, deadline, cancel);
    set_nodelay(fd);

    sockaddr_storage peer{};
    socklen_t peer_len = sizeof(peer);
    std::string address = host + ":" + std::to_string(port);
    if (getpeername(fd, reinterpret_cast<sockaddr*>(&peer), &peer_len) == 0) {
        address = describe_address(reinterpret_cast<sockaddr*>(&peer));
    }

    SSL* ssl = nullptr;
    try {
        ssl = new_connection_ssl(ctx.get(), fd, [expected_fingerprint](const std::string& presented) {
            return !expected_fingerprint || fingerprints_equal(*expected_fingerprint, presented);
        });
    } catch (const PeerLinkError&) {
        ::close(fd);
        throw;
    }

    std::string fingerprint;
    try {
        drive_handshake(ssl, fd, false, deadline, cancel);
        fingerprint = peer_fingerprint_of(ssl);
    } catch (const PeerLinkError&) {
        SSL_free(ssl);
        ::close(fd);
        throw;
    }

    log_info("Secure channel established with " + address + " (" + SSL_get_version(ssl) + ")");
    return std::make_unique<SecureChannel>(ssl, fd, fingerprint, address);
}

} // namespace peerlink
