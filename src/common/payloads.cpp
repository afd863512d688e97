/*
 * PeerLink - typed payload codecs implementation
 */

#include "payloads.hpp"

#include <algorithm>
#include <utility>

namespace peerlink {

namespace {

class TlvWriter {
public:
    void put_string(uint8_t tag, const std::string& value) {
        header(tag, value.size());
        writer_.put_string(value);
    }

    void put_optional(uint8_t tag, const std::optional<std::string>& value) {
        if (value) {
            put_string(tag, *value);
        }
    }

    void put_bytes(uint8_t tag, const std::vector<uint8_t>& value) {
        header(tag, value.size());
        writer_.put_bytes(value);
    }

    void put_u64(uint8_t tag, uint64_t value) {
        header(tag, 8);
        writer_.put_u64(value);
    }

    void put_u32(uint8_t tag, uint32_t value) {
        header(tag, 4);
        writer_.put_u32(value);
    }

    void put_u8(uint8_t tag, uint8_t value) {
        header(tag, 1);
        writer_.put_u8(value);
    }

    std::vector<uint8_t> take() { return writer_.take(); }

private:
    void header(uint8_t tag, std::size_t len) {
        writer_.put_u8(tag);
        writer_.put_u32(static_cast<uint32_t>(len));
    }

    ByteWriter writer_;
};

class TlvFields {
public:
    TlvFields(const std::vector<uint8_t>& bytes, const char* schema) : schema_(schema) {
        ByteReader reader(bytes);
        while (!reader.at_end()) {
            uint8_t tag = 0;
            uint32_t len = 0;
            std::vector<uint8_t> value;
            if (!reader.read_u8(tag) || !reader.read_u32(len) || !reader.read_bytes(len, value)) {
                invalid("truncated field");
            }
            fields_.emplace_back(tag, std::move(value));
        }
    }

    const std::vector<uint8_t>* find(uint8_t tag) const {
        const std::vector<uint8_t>* found = nullptr;
        for (const auto& field : fields_) {
            if (field.first == tag) {
                found = &field.second;
            }
        }
        return found;
    }

    std::string string(uint8_t tag, const char* name) const {
        const auto* value = find(tag);
        if (!value) {
            invalid(std::string("missing ") + name);
        }
        return std::string(value->begin(), value->end());
    }

    std::optional<std::string> optional_string(uint8_t tag) const {
        const auto* value = find(tag);
        if (!value) {
            return std::nullopt;
        }
        return std::string(value->begin(), value->end());
    }

    std::vector<std::string> strings(uint8_t tag) const {
        std::vector<std::string> out;
        for (const auto& field : fields_) {
            if (field.first == tag) {
                out.emplace_back(field.second.begin(), field.second.end());
            }
        }
        return out;
    }

    std::optional<std::vector<uint8_t>> optional_bytes(uint8_t tag) const {
        const auto* value = find(tag);
        if (!value) {
            return std::nullopt;
        }
        return *value;
    }

    std::optional<uint64_t> optional_u64(uint8_t tag, const char* name) const {
        const auto* value = find(tag);
        if (!value) {
            return std::nullopt;
        }
        uint64_t out = 0;
        ByteReader reader(*value);
        if (value->size() != 8 || !reader.read_u64(out)) {
            invalid(std::string("bad ") + name);
        }
        return out;
    }

    uint64_t u64(uint8_t tag, const char* name) const {
        auto value = optional_u64(tag, name);
        if (!value) {
            invalid(std::string("missing ") + name);
        }
        return *value;
    }

    std::optional<uint32_t> optional_u32(uint8_t tag, const char* name) const {
        const auto* value = find(tag);
        if (!value) {
            return std::nullopt;
        }
        uint32_t out = 0;
        ByteReader reader(*value);
        if (value->size() != 4 || !reader.read_u32(out)) {
            invalid(std::string("bad ") + name);
        }
        return out;
    }

    uint32_t u32(uint8_t tag, const char* name) const {
        auto value = optional_u32(tag, name);
        if (!value) {
            invalid(std::string("missing ") + name);
        }
        return *value;
    }

    std::optional<uint8_t> optional_u8(uint8_t tag, const char* name) const {
        const auto* value = find(tag);
        if (!value) {
            return std::nullopt;
        }
        if (value->size() != 1) {
            invalid(std::string("bad ") + name);
        }
        return (*value)[0];
    }

    uint8_t u8(uint8_t tag, const char* name) const {
        auto value = optional_u8(tag, name);
        if (!value) {
            invalid(std::string("missing ") + name);
        }
        return *value;
    }

    [[noreturn]] void invalid(const std::string& what) const {
        throw PeerLinkError(ErrorKind::InvalidPayload,
                            std::string("Invalid ") + schema_ + " payload: " + what);
    }

private:
    const char* schema_;
    std::vector<std::pair<uint8_t, std::vector<uint8_t>>> fields_;
};

// Field tags per schema. Values are part of the wire format.
namespace identity_tag {
constexpr uint8_t kId = 1;
constexpr uint8_t kDisplayName = 2;
constexpr uint8_t kFingerprint = 3;
} // namespace identity_tag

namespace metadata_tag {
constexpr uint8_t kFileName = 1;
constexpr uint8_t kFileSize = 2;
constexpr uint8_t kMimeType = 3;
constexpr uint8_t kHash = 4;
constexpr uint8_t kFileIndex = 5;
constexpr uint8_t kTotalFiles = 6;
constexpr uint8_t kIsDirectory = 7;
} // namespace metadata_tag

namespace batch_tag {
constexpr uint8_t kTotalFiles = 1;
constexpr uint8_t kBatchId = 2;
} // namespace batch_tag

namespace text_tag {
constexpr uint8_t kText = 1;
constexpr uint8_t kTimestamp = 2;
constexpr uint8_t kReplyToId = 3;
constexpr uint8_t kReplyToText = 4;
constexpr uint8_t kReplyToSender = 5;
constexpr uint8_t kGroupId = 6;
constexpr uint8_t kSenderName = 7;
} // namespace text_tag

namespace media_tag {
constexpr uint8_t kId = 1;
constexpr uint8_t kMediaType = 2;
constexpr uint8_t kFileName = 3;
constexpr uint8_t kFileSize = 4;
constexpr uint8_t kMimeType = 5;
constexpr uint8_t kDuration = 6;
constexpr uint8_t kThumbnail = 7;
constexpr uint8_t kTimestamp = 8;
} // namespace media_tag

namespace receipt_tag {
constexpr uint8_t kMessageId = 1;
constexpr uint8_t kReceiptType = 2;
constexpr uint8_t kTimestamp = 3;
constexpr uint8_t kGroupId = 4;
constexpr uint8_t kSenderId = 5;
} // namespace receipt_tag

namespace reaction_tag {
constexpr uint8_t kMessageId = 1;
constexpr uint8_t kEmoji = 2;
constexpr uint8_t kAction = 3;
constexpr uint8_t kTimestamp = 4;
} // namespace reaction_tag

constexpr uint8_t kSingleFieldTag = 1;
constexpr uint8_t kTypingFlagTag = 1;
constexpr uint8_t kTypingGroupTag = 2;

Envelope with_payload(MessageType type, const std::string& sender_id, std::vector<uint8_t> bytes) {
    return make_envelope(type, sender_id, std::move(bytes));
}

Envelope rejection(MessageType type,
                   const std::string& sender_id,
                   const std::optional<std::string>& reason) {
    if (!reason) {
        return make_envelope(type, sender_id);
    }
    RejectionPayload payload;
    payload.reason = reason;
    return with_payload(type, sender_id, encode_payload(payload));
}

} // namespace

std::string TransferMetadata::display_name() const {
    static const std::string kZipSuffix = ".zip";
    if (is_directory && file_name.size() > kZipSuffix.size() &&
        file_name.compare(file_name.size() - kZipSuffix.size(), kZipSuffix.size(), kZipSuffix) == 0) {
        return file_name.substr(0, file_name.size() - kZipSuffix.size());
    }
    return file_name;
}

std::vector<uint8_t> encode_payload(const PeerIdentity& value) {
    TlvWriter writer;
    writer.put_string(identity_tag::kId, value.id);
    writer.put_string(identity_tag::kDisplayName, value.display_name);
    writer.put_optional(identity_tag::kFingerprint, value.certificate_fingerprint);
    return writer.take();
}

bool is_valid_peer_id(const std::string& id) {
    if (id.empty() || id.size() > kMaxPeerIdLength) {
        return false;
    }
    return std::none_of(id.begin(), id.end(), [](char ch) {
        const auto byte = static_cast<unsigned char>(ch);
        return byte <= 0x20 || byte == 0x7F;
    });
}

void decode_payload_bytes(const std::vector<uint8_t>& bytes, PeerIdentity& out) {
    TlvFields fields(bytes, "hello");
    out.id = fields.string(identity_tag::kId, "id");
    out.display_name = fields.optional_string(identity_tag::kDisplayName).value_or(std::string());
    out.certificate_fingerprint = fields.optional_string(identity_tag::kFingerprint);
    if (out.id.empty()) {
        fields.invalid("empty id");
    }
    if (!is_valid_peer_id(out.id)) {
        fields.invalid("id with whitespace or control characters");
    }
}

std::vector<uint8_t> encode_payload(const TransferMetadata& value) {
    TlvWriter writer;
    writer.put_string(metadata_tag::kFileName, value.file_name);
    writer.put_u64(metadata_tag::kFileSize, value.file_size);
    writer.put_optional(metadata_tag::kMimeType, value.mime_type);
    writer.put_string(metadata_tag::kHash, value.sha256_hash);
    if (value.file_index) {
        writer.put_u32(metadata_tag::kFileIndex, *value.file_index);
    }
    if (value.total_files) {
        writer.put_u32(metadata_tag::kTotalFiles, *value.total_files);
    }
    writer.put_u8(metadata_tag::kIsDirectory, value.is_directory ? 1 : 0);
    return writer.take();
}

void decode_payload_bytes(const std::vector<uint8_t>& bytes, TransferMetadata& out) {
    TlvFields fields(bytes, "fileOffer");
    out.file_name = fields.string(metadata_tag::kFileName, "fileName");
    out.file_size = fields.u64(metadata_tag::kFileSize, "fileSize");
    out.mime_type = fields.optional_string(metadata_tag::kMimeType);
    out.sha256_hash = fields.string(metadata_tag::kHash, "sha256Hash");
    out.file_index = fields.optional_u32(metadata_tag::kFileIndex, "fileIndex");
    out.total_files = fields.optional_u32(metadata_tag::kTotalFiles, "totalFiles");
    out.is_directory = fields.optional_u8(metadata_tag::kIsDirectory, "isDirectory").value_or(0) != 0;
}

std::vector<uint8_t> encode_payload(const BatchMetadata& value) {
    TlvWriter writer;
    writer.put_u32(batch_tag::kTotalFiles, value.total_files);
    writer.put_string(batch_tag::kBatchId, value.batch_id);
    return writer.take();
}

void decode_payload_bytes(const std::vector<uint8_t>& bytes, BatchMetadata& out) {
    TlvFields fields(bytes, "batchStart");
    out.total_files = fields.u32(batch_tag::kTotalFiles, "totalFiles");
    out.batch_id = fields.string(batch_tag::kBatchId, "batchID");
}

std::vector<uint8_t> encode_payload(const FileCompletePayload& value) {
    TlvWriter writer;
    writer.put_string(kSingleFieldTag, value.hash);
    return writer.take();
}

void decode_payload_bytes(const std::vector<uint8_t>& bytes, FileCompletePayload& out) {
    TlvFields fields(bytes, "fileComplete");
    out.hash = fields.string(kSingleFieldTag, "hash");
}

std::vector<uint8_t> encode_payload(const BatchCompletePayload& value) {
    TlvWriter writer;
    writer.put_string(kSingleFieldTag, value.batch_id);
    return writer.take();
}

void decode_payload_bytes(const std::vector<uint8_t>& bytes, BatchCompletePayload& out) {
    TlvFields fields(bytes, "batchComplete");
    out.batch_id = fields.string(kSingleFieldTag, "batchID");
}

std::vector<uint8_t> encode_payload(const RejectionPayload& value) {
    TlvWriter writer;
    writer.put_optional(kSingleFieldTag, value.reason);
    return writer.take();
}

void decode_payload_bytes(const std::vector<uint8_t>& bytes, RejectionPayload& out) {
    TlvFields fields(bytes, "rejection");
    out.reason = fields.optional_string(kSingleFieldTag);
}

std::vector<uint8_t> encode_payload(const TextMessagePayload& value) {
    TlvWriter writer;
    writer.put_string(text_tag::kText, value.text);
    writer.put_u64(text_tag::kTimestamp, static_cast<uint64_t>(value.timestamp_ms));
    writer.put_optional(text_tag::kReplyToId, value.reply_to_message_id);
    writer.put_optional(text_tag::kReplyToText, value.reply_to_text);
    writer.put_optional(text_tag::kReplyToSender, value.reply_to_sender_name);
    writer.put_optional(text_tag::kGroupId, value.group_id);
    writer.put_optional(text_tag::kSenderName, value.sender_name);
    return writer.take();
}

void decode_payload_bytes(const std::vector<uint8_t>& bytes, TextMessagePayload& out) {
    TlvFields fields(bytes, "textMessage");
    out.text = fields.string(text_tag::kText, "text");
    out.timestamp_ms = static_cast<int64_t>(fields.optional_u64(text_tag::kTimestamp, "timestamp").value_or(0));
    out.reply_to_message_id = fields.optional_string(text_tag::kReplyToId);
    out.reply_to_text = fields.optional_string(text_tag::kReplyToText);
    out.reply_to_sender_name = fields.optional_string(text_tag::kReplyToSender);
    out.group_id = fields.optional_string(text_tag::kGroupId);
    out.sender_name = fields.optional_string(text_tag::kSenderName);
}

std::vector<uint8_t> encode_payload(const MediaMessagePayload& value) {
    TlvWriter writer;
    writer.put_string(media_tag::kId, value.id);
    writer.put_u8(media_tag::kMediaType, static_cast<uint8_t>(value.media_type));
    writer.put_string(media_tag::kFileName, value.file_name);
    writer.put_u64(media_tag::kFileSize, value.file_size);
    writer.put_string(media_tag::kMimeType, value.mime_type);
    if (value.duration_ms) {
        writer.put_u64(media_tag::kDuration, *value.duration_ms);
    }
    if (value.thumbnail) {
        writer.put_bytes(media_tag::kThumbnail, *value.thumbnail);
    }
    writer.put_u64(media_tag::kTimestamp, static_cast<uint64_t>(value.timestamp_ms));
    return writer.take();
}

void decode_payload_bytes(const std::vector<uint8_t>& bytes, MediaMessagePayload& out) {
    TlvFields fields(bytes, "mediaMessage");
    out.id = fields.string(media_tag::kId, "id");
    uint8_t media_type = fields.u8(media_tag::kMediaType, "mediaType");
    if (media_type > static_cast<uint8_t>(MediaType::Voice)) {
        fields.invalid("unknown mediaType");
    }
    out.media_type = static_cast<MediaType>(media_type);
    out.file_name = fields.string(media_tag::kFileName, "fileName");
    out.file_size = fields.u64(media_tag::kFileSize, "fileSize");
    out.mime_type = fields.optional_string(media_tag::kMimeType).value_or("application/octet-stream");
    out.duration_ms = fields.optional_u64(media_tag::kDuration, "duration");
    out.thumbnail = fields.optional_bytes(media_tag::kThumbnail);
    out.timestamp_ms = static_cast<int64_t>(fields.optional_u64(media_tag::kTimestamp, "timestamp").value_or(0));
}

std::vector<uint8_t> encode_payload(const MessageReceiptPayload& value) {
    TlvWriter writer;
    for (const auto& id : value.message_ids) {
        writer.put_string(receipt_tag::kMessageId, id);
    }
    writer.put_u8(receipt_tag::kReceiptType, static_cast<uint8_t>(value.receipt_type));
    writer.put_u64(receipt_tag::kTimestamp, static_cast<uint64_t>(value.timestamp_ms));
    writer.put_optional(receipt_tag::kGroupId, value.group_id);
    writer.put_optional(receipt_tag::kSenderId, value.sender_id);
    return writer.take();
}

void decode_payload_bytes(const std::vector<uint8_t>& bytes, MessageReceiptPayload& out) {
    TlvFields fields(bytes, "messageReceipt");
    out.message_ids = fields.strings(receipt_tag::kMessageId);
    uint8_t receipt_type = fields.u8(receipt_tag::kReceiptType, "receiptType");
    if (receipt_type > static_cast<uint8_t>(ReceiptType::Read)) {
        fields.invalid("unknown receiptType");
    }
    out.receipt_type = static_cast<ReceiptType>(receipt_type);
    out.timestamp_ms = static_cast<int64_t>(fields.optional_u64(receipt_tag::kTimestamp, "timestamp").value_or(0));
    out.group_id = fields.optional_string(receipt_tag::kGroupId);
    out.sender_id = fields.optional_string(receipt_tag::kSenderId);
}

std::vector<uint8_t> encode_payload(const TypingIndicatorPayload& value) {
    TlvWriter writer;
    writer.put_u8(kTypingFlagTag, value.is_typing ? 1 : 0);
    writer.put_optional(kTypingGroupTag, value.group_id);
    return writer.take();
}

void decode_payload_bytes(const std::vector<uint8_t>& bytes, TypingIndicatorPayload& out) {
    TlvFields fields(bytes, "typingIndicator");
    out.is_typing = fields.u8(kTypingFlagTag, "isTyping") != 0;
    out.group_id = fields.optional_string(kTypingGroupTag);
}

std::vector<uint8_t> encode_payload(const ReactionPayload& value) {
    TlvWriter writer;
    writer.put_string(reaction_tag::kMessageId, value.message_id);
    writer.put_string(reaction_tag::kEmoji, value.emoji);
    writer.put_u8(reaction_tag::kAction, static_cast<uint8_t>(value.action));
    writer.put_u64(reaction_tag::kTimestamp, static_cast<uint64_t>(value.timestamp_ms));
    return writer.take();
}

void decode_payload_bytes(const std::vector<uint8_t>& bytes, ReactionPayload& out) {
    TlvFields fields(bytes, "reaction");
    out.message_id = fields.string(reaction_tag::kMessageId, "messageID");
    out.emoji = fields.string(reaction_tag::kEmoji, "emoji");
    uint8_t action = fields.u8(reaction_tag::kAction, "action");
    if (action > static_cast<uint8_t>(ReactionAction::Remove)) {
        fields.invalid("unknown action");
    }
    out.action = static_cast<ReactionAction>(action);
    out.timestamp_ms = static_cast<int64_t>(fields.optional_u64(reaction_tag::kTimestamp, "timestamp").value_or(0));
}

const std::vector<uint8_t>& raw_payload(const Envelope& envelope) {
    if (!envelope.payload) {
        throw PeerLinkError(ErrorKind::MissingPayload,
                            std::string(message_type_name(envelope.type)) + " carries no payload");
    }
    return *envelope.payload;
}

std::optional<std::string> reject_reason(const Envelope& envelope) {
    auto payload = decode_optional_payload<RejectionPayload>(envelope);
    if (!payload) {
        return std::nullopt;
    }
    return payload->reason;
}

Envelope make_hello(const std::string& sender_id, const PeerIdentity& identity) {
    return with_payload(MessageType::Hello, sender_id, encode_payload(identity));
}

Envelope make_connection_request(const std::string& sender_id) {
    return make_envelope(MessageType::ConnectionRequest, sender_id);
}

Envelope make_connection_accept(const std::string& sender_id) {
    return make_envelope(MessageType::ConnectionAccept, sender_id);
}

Envelope make_connection_reject(const std::string& sender_id, const std::optional<std::string>& reason) {
    return rejection(MessageType::ConnectionReject, sender_id, reason);
}

Envelope make_connection_cancel(const std::string& sender_id) {
    return make_envelope(MessageType::ConnectionCancel, sender_id);
}

Envelope make_file_offer(const std::string& sender_id, const TransferMetadata& metadata) {
    return with_payload(MessageType::FileOffer, sender_id, encode_payload(metadata));
}

Envelope make_file_accept(const std::string& sender_id) {
    return make_envelope(MessageType::FileAccept, sender_id);
}

Envelope make_file_reject(const std::string& sender_id, const std::optional<std::string>& reason) {
    return rejection(MessageType::FileReject, sender_id, reason);
}

Envelope make_file_chunk(const std::string& sender_id, std::vector<uint8_t> chunk) {
    return with_payload(MessageType::FileChunk, sender_id, std::move(chunk));
}

Envelope make_file_complete(const std::string& sender_id, const std::string& hash) {
    FileCompletePayload payload;
    payload.hash = hash;
    return with_payload(MessageType::FileComplete, sender_id, encode_payload(payload));
}

Envelope make_batch_start(const std::string& sender_id, const BatchMetadata& batch) {
    return with_payload(MessageType::BatchStart, sender_id, encode_payload(batch));
}

Envelope make_batch_complete(const std::string& sender_id, const std::string& batch_id) {
    BatchCompletePayload payload;
    payload.batch_id = batch_id;
    return with_payload(MessageType::BatchComplete, sender_id, encode_payload(payload));
}

Envelope make_sdp_offer(const std::string& sender_id, std::vector<uint8_t> sdp) {
    return with_payload(MessageType::SdpOffer, sender_id, std::move(sdp));
}

Envelope make_sdp_answer(const std::string& sender_id, std::vector<uint8_t> sdp) {
    return with_payload(MessageType::SdpAnswer, sender_id, std::move(sdp));
}

Envelope make_ice_candidate(const std::string& sender_id, std::vector<uint8_t> candidate) {
    return with_payload(MessageType::IceCandidate, sender_id, std::move(candidate));
}

Envelope make_call_request(const std::string& sender_id) {
    return make_envelope(MessageType::CallRequest, sender_id);
}

Envelope make_call_accept(const std::string& sender_id) {
    return make_envelope(MessageType::CallAccept, sender_id);
}

Envelope make_call_reject(const std::string& sender_id, const std::optional<std::string>& reason) {
    return rejection(MessageType::CallReject, sender_id, reason);
}

Envelope make_call_end(const std::string& sender_id) {
    return make_envelope(MessageType::CallEnd, sender_id);
}

Envelope make_text_message(const std::string& sender_id, const TextMessagePayload& message) {
    return with_payload(MessageType::TextMessage, sender_id, encode_payload(message));
}

Envelope make_media_message(const std::string& sender_id, const MediaMessagePayload& message) {
    return with_payload(MessageType::MediaMessage, sender_id, encode_payload(message));
}

Envelope make_chat_reject(const std::string& sender_id, const std::optional<std::string>& reason) {
    return rejection(MessageType::ChatReject, sender_id, reason);
}

Envelope make_message_receipt(const std::string& sender_id, const MessageReceiptPayload& receipt) {
    return with_payload(MessageType::MessageReceipt, sender_id, encode_payload(receipt));
}

Envelope make_typing_indicator(const std::string& sender_id, const TypingIndicatorPayload& typing) {
    return with_payload(MessageType::TypingIndicator, sender_id, encode_payload(typing));
}

Envelope make_reaction(const std::string& sender_id, const ReactionPayload& reaction) {
    return with_payload(MessageType::Reaction, sender_id, encode_payload(reaction));
}

Envelope make_disconnect(const std::string& sender_id) {
    return make_envelope(MessageType::Disconnect, sender_id);
}

Envelope make_ping(const std::string& sender_id) {
    return make_envelope(MessageType::Ping, sender_id);
}

Envelope make_pong(const std::string& sender_id) {
    return make_envelope(MessageType::Pong, sender_id);
}

} // namespace peerlink
