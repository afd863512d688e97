/*
 * PeerLink - typed payload codecs
 *
 * Each message kind owns an independent payload schema encoded as a sequence
 * of tagged fields (tag:u8 | len:u32 | value). Decoders skip tags they do not
 * know and default optional fields that are absent, so either side can add
 * fields without breaking the other.
 */

#pragma once

#include "errors.hpp"
#include "protocol.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace peerlink {

constexpr std::size_t kMaxPeerIdLength = 128;

// Non-empty, at most kMaxPeerIdLength bytes, no whitespace or control bytes.
bool is_valid_peer_id(const std::string& id);

struct PeerIdentity {
    std::string id;
    std::string display_name;
    std::optional<std::string> certificate_fingerprint;

    bool operator==(const PeerIdentity& other) const {
        return id == other.id && display_name == other.display_name &&
               certificate_fingerprint == other.certificate_fingerprint;
    }
};

struct TransferMetadata {
    std::string file_name;
    uint64_t file_size = 0;
    std::optional<std::string> mime_type;
    std::string sha256_hash;
    std::optional<uint32_t> file_index;
    std::optional<uint32_t> total_files;
    bool is_directory = false;

    // Directories travel zipped; the user sees the name without ".zip".
    std::string display_name() const;

    bool operator==(const TransferMetadata& other) const {
        return file_name == other.file_name && file_size == other.file_size &&
               mime_type == other.mime_type && sha256_hash == other.sha256_hash &&
               file_index == other.file_index && total_files == other.total_files &&
               is_directory == other.is_directory;
    }
};

struct BatchMetadata {
    uint32_t total_files = 0;
    std::string batch_id;
};

struct FileCompletePayload {
    std::string hash;
};

struct BatchCompletePayload {
    std::string batch_id;
};

struct RejectionPayload {
    std::optional<std::string> reason;
};

struct TextMessagePayload {
    std::string text;
    int64_t timestamp_ms = 0;
    std::optional<std::string> reply_to_message_id;
    std::optional<std::string> reply_to_text;
    std::optional<std::string> reply_to_sender_name;
    std::optional<std::string> group_id;
    std::optional<std::string> sender_name;

    bool is_reply() const { return reply_to_message_id.has_value(); }
};

enum class MediaType : uint8_t {
    Image,
    Video,
    File,
    Voice
};

struct MediaMessagePayload {
    std::string id;
    MediaType media_type = MediaType::File;
    std::string file_name;
    uint64_t file_size = 0;
    std::string mime_type;
    std::optional<uint64_t> duration_ms;
    std::optional<std::vector<uint8_t>> thumbnail;
    int64_t timestamp_ms = 0;
};

enum class ReceiptType : uint8_t {
    Delivered,
    Read
};

struct MessageReceiptPayload {
    std::vector<std::string> message_ids;
    ReceiptType receipt_type = ReceiptType::Delivered;
    int64_t timestamp_ms = 0;
    std::optional<std::string> group_id;
    std::optional<std::string> sender_id;
};

struct TypingIndicatorPayload {
    bool is_typing = false;
    std::optional<std::string> group_id;
};

enum class ReactionAction : uint8_t {
    Add,
    Remove
};

struct ReactionPayload {
    std::string message_id;
    std::string emoji;
    ReactionAction action = ReactionAction::Add;
    int64_t timestamp_ms = 0;
};

std::vector<uint8_t> encode_payload(const PeerIdentity& value);
std::vector<uint8_t> encode_payload(const TransferMetadata& value);
std::vector<uint8_t> encode_payload(const BatchMetadata& value);
std::vector<uint8_t> encode_payload(const FileCompletePayload& value);
std::vector<uint8_t> encode_payload(const BatchCompletePayload& value);
std::vector<uint8_t> encode_payload(const RejectionPayload& value);
std::vector<uint8_t> encode_payload(const TextMessagePayload& value);
std::vector<uint8_t> encode_payload(const MediaMessagePayload& value);
std::vector<uint8_t> encode_payload(const MessageReceiptPayload& value);
std::vector<uint8_t> encode_payload(const TypingIndicatorPayload& value);
std::vector<uint8_t> encode_payload(const ReactionPayload& value);

// All of these throw PeerLinkError(InvalidPayload) when a required field is
// missing or a field value has the wrong shape.
void decode_payload_bytes(const std::vector<uint8_t>& bytes, PeerIdentity& out);
void decode_payload_bytes(const std::vector<uint8_t>& bytes, TransferMetadata& out);
void decode_payload_bytes(const std::vector<uint8_t>& bytes, BatchMetadata& out);
void decode_payload_bytes(const std::vector<uint8_t>& bytes, FileCompletePayload& out);
void decode_payload_bytes(const std::vector<uint8_t>& bytes, BatchCompletePayload& out);
void decode_payload_bytes(const std::vector<uint8_t>& bytes, RejectionPayload& out);
void decode_payload_bytes(const std::vector<uint8_t>& bytes, TextMessagePayload& out);
void decode_payload_bytes(const std::vector<uint8_t>& bytes, MediaMessagePayload& out);
void decode_payload_bytes(const std::vector<uint8_t>& bytes, MessageReceiptPayload& out);
void decode_payload_bytes(const std::vector<uint8_t>& bytes, TypingIndicatorPayload& out);
void decode_payload_bytes(const std::vector<uint8_t>& bytes, ReactionPayload& out);

template <typename T>
T decode_payload(const Envelope& envelope) {
    if (!envelope.payload) {
        throw PeerLinkError(ErrorKind::MissingPayload,
                            std::string(message_type_name(envelope.type)) + " carries no payload");
    }
    T out;
    decode_payload_bytes(*envelope.payload, out);
    return out;
}

template <typename T>
std::optional<T> decode_optional_payload(const Envelope& envelope) {
    if (!envelope.payload) {
        return std::nullopt;
    }
    T out;
    decode_payload_bytes(*envelope.payload, out);
    return out;
}

// Opaque bytes of fileChunk / sdpOffer / sdpAnswer / iceCandidate.
const std::vector<uint8_t>& raw_payload(const Envelope& envelope);

// Reason of a reject-family message, if the sender gave one.
std::optional<std::string> reject_reason(const Envelope& envelope);

Envelope make_hello(const std::string& sender_id, const PeerIdentity& identity);
Envelope make_connection_request(const std::string& sender_id);
Envelope make_connection_accept(const std::string& sender_id);
Envelope make_connection_reject(const std::string& sender_id,
                                const std::optional<std::string>& reason = std::nullopt);
Envelope make_connection_cancel(const std::string& sender_id);

Envelope make_file_offer(const std::string& sender_id, const TransferMetadata& metadata);
Envelope make_file_accept(const std::string& sender_id);
Envelope make_file_reject(const std::string& sender_id,
                          const std::optional<std::string>& reason = std::nullopt);
Envelope make_file_chunk(const std::string& sender_id, std::vector<uint8_t> chunk);
Envelope make_file_complete(const std::string& sender_id, const std::string& hash);
Envelope make_batch_start(const std::string& sender_id, const BatchMetadata& batch);
Envelope make_batch_complete(const std::string& sender_id, const std::string& batch_id);

Envelope make_sdp_offer(const std::string& sender_id, std::vector<uint8_t> sdp);
Envelope make_sdp_answer(const std::string& sender_id, std::vector<uint8_t> sdp);
Envelope make_ice_candidate(const std::string& sender_id, std::vector<uint8_t> candidate);
Envelope make_call_request(const std::string& sender_id);
Envelope make_call_accept(const std::string& sender_id);
Envelope make_call_reject(const std::string& sender_id,
                          const std::optional<std::string>& reason = std::nullopt);
Envelope make_call_end(const std::string& sender_id);

Envelope make_text_message(const std::string& sender_id, const TextMessagePayload& message);
Envelope make_media_message(const std::string& sender_id, const MediaMessagePayload& message);
Envelope make_chat_reject(const std::string& sender_id,
                          const std::optional<std::string>& reason = std::nullopt);
Envelope make_message_receipt(const std::string& sender_id, const MessageReceiptPayload& receipt);
Envelope make_typing_indicator(const std::string& sender_id, const TypingIndicatorPayload& typing);
Envelope make_reaction(const std::string& sender_id, const ReactionPayload& reaction);

Envelope make_disconnect(const std::string& sender_id);
Envelope make_ping(const std::string& sender_id);
Envelope make_pong(const std::string& sender_id);

} // namespace peerlink
