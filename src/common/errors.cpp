/*
 * PeerLink - error taxonomy implementation
 */

#include "errors.hpp"

namespace peerlink {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedEnvelope:
            return "MalformedEnvelope";
        case ErrorKind::UnsupportedVersion:
            return "UnsupportedVersion";
        case ErrorKind::MissingPayload:
            return "MissingPayload";
        case ErrorKind::InvalidPayload:
            return "InvalidPayload";
        case ErrorKind::FrameTooLarge:
            return "FrameTooLarge";
        case ErrorKind::FingerprintMismatch:
            return "FingerprintMismatch";
        case ErrorKind::FinalizedHasher:
            return "FinalizedHasher";
        case ErrorKind::DigestMismatch:
            return "DigestMismatch";
        case ErrorKind::PrematureEnd:
            return "PrematureEnd";
        case ErrorKind::SizeExceeded:
            return "SizeExceeded";
        case ErrorKind::TransferCancelled:
            return "TransferCancelled";
        case ErrorKind::TransferRejected:
            return "TransferRejected";
        case ErrorKind::NotConnected:
            return "NotConnected";
        case ErrorKind::AuthenticationFailure:
            return "AuthenticationFailure";
        case ErrorKind::InvalidFormat:
            return "InvalidFormat";
        case ErrorKind::KeyStoreFailure:
            return "KeyStoreFailure";
        case ErrorKind::IoFailure:
            return "IoFailure";
        case ErrorKind::ChannelFailure:
            return "ChannelFailure";
        case ErrorKind::Timeout:
            return "Timeout";
        case ErrorKind::CryptoFailure:
            return "CryptoFailure";
    }
    return "Unknown";
}

std::string describe(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedEnvelope:
            return "Received a malformed message";
        case ErrorKind::UnsupportedVersion:
            return "Peer uses an incompatible protocol version";
        case ErrorKind::MissingPayload:
            return "Message is missing its payload";
        case ErrorKind::InvalidPayload:
            return "Message payload could not be read";
        case ErrorKind::FrameTooLarge:
            return "Message exceeds the maximum frame size";
        case ErrorKind::FingerprintMismatch:
            return "Peer certificate does not match the trusted fingerprint";
        case ErrorKind::FinalizedHasher:
            return "Hash already finalized";
        case ErrorKind::DigestMismatch:
            return "File integrity check failed";
        case ErrorKind::PrematureEnd:
            return "Transfer ended before all bytes arrived";
        case ErrorKind::SizeExceeded:
            return "Transfer carried more bytes than offered";
        case ErrorKind::TransferCancelled:
            return "Transfer cancelled";
        case ErrorKind::TransferRejected:
            return "File transfer was rejected";
        case ErrorKind::NotConnected:
            return "Not connected to a peer";
        case ErrorKind::AuthenticationFailure:
            return "Stored data failed authentication";
        case ErrorKind::InvalidFormat:
            return "Invalid encrypted data format";
        case ErrorKind::KeyStoreFailure:
            return "Key store unavailable";
        case ErrorKind::IoFailure:
            return "File I/O failed";
        case ErrorKind::ChannelFailure:
            return "Secure channel failed";
        case ErrorKind::Timeout:
            return "Operation timed out";
        case ErrorKind::CryptoFailure:
            return "Cryptographic operation failed";
    }
    return "Unknown error";
}

bool is_protocol_error(ErrorKind kind) {
    return kind == ErrorKind::MalformedEnvelope || kind == ErrorKind::UnsupportedVersion ||
           kind == ErrorKind::MissingPayload || kind == ErrorKind::InvalidPayload ||
           kind == ErrorKind::FrameTooLarge;
}

} // namespace peerlink
