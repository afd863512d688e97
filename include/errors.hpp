/*
 * PeerLink - error taxonomy
 *
 * Every classified failure travels as a PeerLinkError: the kind drives the
 * caller's recovery decision, the message is the human-readable reason that
 * ends up in logs, failed states and transfer records.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace peerlink {

enum class ErrorKind {
    // Protocol: fatal to a single message.
    MalformedEnvelope,
    UnsupportedVersion,
    MissingPayload,
    InvalidPayload,
    FrameTooLarge,
    // Trust: fatal to the handshake.
    FingerprintMismatch,
    // Transfer: fatal to that transfer.
    FinalizedHasher,
    DigestMismatch,
    PrematureEnd,
    SizeExceeded,
    TransferCancelled,
    TransferRejected,
    NotConnected,
    // Storage: fatal to the read/write call.
    AuthenticationFailure,
    InvalidFormat,
    KeyStoreFailure,
    IoFailure,
    // Channel.
    ChannelFailure,
    Timeout,
    CryptoFailure
};

const char* error_kind_name(ErrorKind kind);

// Generic human-readable text for a kind.
std::string describe(ErrorKind kind);

class PeerLinkError : public std::runtime_error {
public:
    PeerLinkError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    explicit PeerLinkError(ErrorKind kind)
        : std::runtime_error(describe(kind)), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

bool is_protocol_error(ErrorKind kind);

} // namespace peerlink
