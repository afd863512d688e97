/*
 * PeerLink - TLS secure channel loopback tests
 */

#include "certificate.hpp"
#include "payloads.hpp"
#include "secure_channel.hpp"
#include "test_support.hpp"
#include "utils.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <memory>
#include <thread>

using namespace peerlink;
using peerlink_test::bytes_of;
using peerlink_test::throws_kind;
using std::chrono::milliseconds;

namespace {

// Takes the next connection off the listener and handshakes it; nullptr when
// the handshake fails or the listener closes first.
std::unique_ptr<SecureChannel> accept_one(SecureListener& listener, milliseconds timeout) {
    while (auto connection = listener.next_connection()) {
        try {
            return listener.handshake(*connection, timeout);
        } catch (const PeerLinkError& ex) {
            std::cerr << "handshake failed: " << ex.what() << "\n";
        }
    }
    return nullptr;
}

// Plain TCP connection that never speaks TLS.
int open_silent_socket(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (fd >= 0 && ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

void test_exchange_with_pinned_server() {
    CertificateManager server_identity;
    CertificateManager client_identity;
    SecureListener listener(server_identity, "127.0.0.1", 0);
    CHECK(listener.port() != 0);

    std::unique_ptr<SecureChannel> server_side;
    std::thread acceptor([&] { server_side = accept_one(listener, milliseconds(5000)); });

    auto client = connect_secure(client_identity, "127.0.0.1", listener.port(), server_identity.fingerprint(),
                                 milliseconds(5000));
    acceptor.join();

    CHECK(client != nullptr);
    CHECK(server_side != nullptr);
    if (!client || !server_side) {
        return;
    }
    CHECK(client->peer_fingerprint() == server_identity.fingerprint());
    CHECK(server_side->peer_fingerprint() == client_identity.fingerprint());
    CHECK(client->is_open());
    CHECK(!client->allows_renegotiation());
    CHECK(!server_side->allows_renegotiation());

    Envelope hello = make_connection_request("PEER-A");
    CHECK(client->send_envelope(hello));
    auto received = server_side->receive_envelope();
    CHECK(received && *received == hello);

    // Larger than one TLS record.
    std::vector<uint8_t> chunk = random_bytes(300 * 1024);
    std::thread writer([&] { CHECK(server_side->send_envelope(make_file_chunk("PEER-B", chunk))); });
    auto big = client->receive_envelope();
    writer.join();
    CHECK(big && big->type == MessageType::FileChunk);
    CHECK(big && big->payload && *big->payload == chunk);

    // Orderly close reads as end of stream.
    server_side->close();
    CHECK(!server_side->is_open());
    CHECK(!client->receive_envelope().has_value());
    CHECK(!server_side->send_envelope(make_ping("PEER-B")));
}

void test_unpinned_client_accepts_any_server() {
    CertificateManager server_identity;
    CertificateManager client_identity;
    SecureListener listener(server_identity, "127.0.0.1", 0);

    std::unique_ptr<SecureChannel> server_side;
    std::thread acceptor([&] { server_side = accept_one(listener, milliseconds(5000)); });
    auto client = connect_secure(client_identity, "127.0.0.1", listener.port(), std::nullopt, milliseconds(5000));
    acceptor.join();

    CHECK(client && client->peer_fingerprint() == server_identity.fingerprint());
    CHECK(server_side != nullptr);
}

void test_fingerprint_mismatch() {
    CertificateManager server_identity;
    CertificateManager client_identity;
    CertificateManager someone_else;
    SecureListener listener(server_identity, "127.0.0.1", 0);

    std::unique_ptr<SecureChannel> server_side;
    std::thread acceptor([&] { server_side = accept_one(listener, milliseconds(2000)); });

    CHECK(throws_kind(
        [&] {
            connect_secure(client_identity, "127.0.0.1", listener.port(), someone_else.fingerprint(),
                           milliseconds(5000));
        },
        ErrorKind::FingerprintMismatch));

    // The failed handshake is skipped; closing ends the accept loop.
    std::this_thread::sleep_for(milliseconds(100));
    listener.close();
    acceptor.join();
    CHECK(server_side == nullptr);
}

void test_stalled_client_does_not_block_others() {
    CertificateManager server_identity;
    CertificateManager client_identity;
    SecureListener listener(server_identity, "127.0.0.1", 0);

    int silent = open_silent_socket(listener.port());
    CHECK(silent >= 0);
    auto stalled = listener.next_connection();
    CHECK(stalled != nullptr);
    bool stalled_timed_out = false;
    std::thread stalled_handshake([&] {
        if (stalled) {
            stalled_timed_out = throws_kind([&] { listener.handshake(*stalled, milliseconds(3000)); },
                                            ErrorKind::Timeout);
        }
    });

    auto started = std::chrono::steady_clock::now();
    std::unique_ptr<SecureChannel> server_side;
    std::thread acceptor([&] {
        if (auto connection = listener.next_connection()) {
            server_side = listener.handshake(*connection, milliseconds(5000));
        }
    });
    auto client = connect_secure(client_identity, "127.0.0.1", listener.port(), server_identity.fingerprint(),
                                 milliseconds(5000));
    acceptor.join();
    auto elapsed = std::chrono::steady_clock::now() - started;

    CHECK(client != nullptr);
    CHECK(server_side && server_side->peer_fingerprint() == client_identity.fingerprint());
    CHECK(elapsed < milliseconds(2500));

    stalled_handshake.join();
    CHECK(stalled_timed_out);
    if (silent >= 0) {
        ::close(silent);
    }
}

void test_rejected_client_certificate() {
    CertificateManager server_identity;
    CertificateManager client_identity;
    CertificateManager other_client;
    SecureListener listener(server_identity, "127.0.0.1", 0, [&](const std::string& fingerprint) {
        return fingerprint == client_identity.fingerprint();
    });

    // Two handshakes at once keep separate verify results.
    bool refused = false;
    std::unique_ptr<SecureChannel> welcomed;
    std::thread acceptor([&] {
        auto first = listener.next_connection();
        auto second = listener.next_connection();
        if (!first || !second) {
            return;
        }
        std::thread other([&] {
            refused = throws_kind([&] { listener.handshake(*first, milliseconds(5000)); },
                                  ErrorKind::FingerprintMismatch);
        });
        welcomed = listener.handshake(*second, milliseconds(5000));
        other.join();
    });

    std::thread intruder([&] {
        try {
            connect_secure(other_client, "127.0.0.1", listener.port(), std::nullopt, milliseconds(5000));
        } catch (const PeerLinkError&) {
        }
    });
    std::this_thread::sleep_for(milliseconds(100));
    auto client = connect_secure(client_identity, "127.0.0.1", listener.port(), std::nullopt, milliseconds(5000));
    intruder.join();
    acceptor.join();

    CHECK(refused);
    CHECK(welcomed && welcomed->peer_fingerprint() == client_identity.fingerprint());
    CHECK(client != nullptr);
}

void test_connection_refused() {
    CertificateManager identity;
    uint16_t port = 0;
    {
        SecureListener listener(identity, "127.0.0.1", 0);
        port = listener.port();
    }
    CHECK(throws_kind([&] { connect_secure(identity, "127.0.0.1", port, std::nullopt, milliseconds(2000)); },
                      ErrorKind::ChannelFailure));
}

void test_cancelled_connect() {
    CertificateManager server_identity;
    CertificateManager client_identity;
    // Never accepts, so the handshake stalls until the flag is raised.
    SecureListener listener(server_identity, "127.0.0.1", 0);
    std::atomic<bool> cancel{true};
    CHECK(throws_kind(
        [&] {
            connect_secure(client_identity, "127.0.0.1", listener.port(), std::nullopt, milliseconds(5000), &cancel);
        },
        ErrorKind::ChannelFailure));
}

} // namespace

int main() {
    try {
        test_exchange_with_pinned_server();
        test_unpinned_client_accepts_any_server();
        test_fingerprint_mismatch();
        test_stalled_client_does_not_block_others();
        test_rejected_client_certificate();
        test_connection_refused();
        test_cancelled_connect();
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << "\n";
        return 2;
    }
    return peerlink_test::finish("secure_channel_test");
}
