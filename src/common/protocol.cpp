/*
 * PeerLink - wire protocol implementation
 */

#include "protocol.hpp"

#include "errors.hpp"

#include <arpa/inet.h>

#include <cstring>
#include <limits>

namespace peerlink {

namespace {

struct MessageTypeEntry {
    MessageType type;
    const char* name;
    PayloadRequirement requirement;
};

constexpr MessageTypeEntry kMessageTable[] = {
    {MessageType::Hello, "hello", PayloadRequirement::Required},
    {MessageType::ConnectionRequest, "connectionRequest", PayloadRequirement::None},
    {MessageType::ConnectionAccept, "connectionAccept", PayloadRequirement::None},
    {MessageType::ConnectionReject, "connectionReject", PayloadRequirement::Optional},
    {MessageType::ConnectionCancel, "connectionCancel", PayloadRequirement::None},
    {MessageType::FileOffer, "fileOffer", PayloadRequirement::Required},
    {MessageType::FileAccept, "fileAccept", PayloadRequirement::None},
    {MessageType::FileReject, "fileReject", PayloadRequirement::Optional},
    {MessageType::FileChunk, "fileChunk", PayloadRequirement::Raw},
    {MessageType::FileComplete, "fileComplete", PayloadRequirement::Required},
    {MessageType::BatchStart, "batchStart", PayloadRequirement::Required},
    {MessageType::BatchComplete, "batchComplete", PayloadRequirement::Required},
    {MessageType::SdpOffer, "sdpOffer", PayloadRequirement::Raw},
    {MessageType::SdpAnswer, "sdpAnswer", PayloadRequirement::Raw},
    {MessageType::IceCandidate, "iceCandidate", PayloadRequirement::Raw},
    {MessageType::CallRequest, "callRequest", PayloadRequirement::None},
    {MessageType::CallAccept, "callAccept", PayloadRequirement::None},
    {MessageType::CallReject, "callReject", PayloadRequirement::Optional},
    {MessageType::CallEnd, "callEnd", PayloadRequirement::None},
    {MessageType::TextMessage, "textMessage", PayloadRequirement::Required},
    {MessageType::MediaMessage, "mediaMessage", PayloadRequirement::Required},
    {MessageType::ChatReject, "chatReject", PayloadRequirement::Optional},
    {MessageType::MessageReceipt, "messageReceipt", PayloadRequirement::Required},
    {MessageType::TypingIndicator, "typingIndicator", PayloadRequirement::Required},
    {MessageType::Reaction, "reaction", PayloadRequirement::Required},
    {MessageType::Disconnect, "disconnect", PayloadRequirement::None},
    {MessageType::Ping, "ping", PayloadRequirement::None},
    {MessageType::Pong, "pong", PayloadRequirement::None},
};

const MessageTypeEntry& entry_for(MessageType type) {
    for (const auto& entry : kMessageTable) {
        if (entry.type == type) {
            return entry;
        }
    }
    throw std::invalid_argument("unknown MessageType value");
}

[[noreturn]] void malformed(const std::string& what) {
    throw PeerLinkError(ErrorKind::MalformedEnvelope, "Malformed envelope: " + what);
}

} // namespace

const char* message_type_name(MessageType type) {
    return entry_for(type).name;
}

std::optional<MessageType> message_type_from_name(const std::string& name) {
    for (const auto& entry : kMessageTable) {
        if (name == entry.name) {
            return entry.type;
        }
    }
    return std::nullopt;
}

PayloadRequirement payload_requirement(MessageType type) {
    return entry_for(type).requirement;
}

const std::vector<MessageType>& all_message_types() {
    static const std::vector<MessageType> types = [] {
        std::vector<MessageType> out;
        for (const auto& entry : kMessageTable) {
            out.push_back(entry.type);
        }
        return out;
    }();
    return types;
}

Envelope make_envelope(MessageType type,
                       const std::string& sender_id,
                       std::optional<std::vector<uint8_t>> payload) {
    Envelope envelope;
    envelope.type = type;
    envelope.sender_id = sender_id;
    envelope.payload = std::move(payload);
    return envelope;
}

std::vector<uint8_t> encode_envelope(const Envelope& envelope) {
    const std::string type_name = message_type_name(envelope.type);
    if (envelope.sender_id.size() > std::numeric_limits<uint16_t>::max()) {
        throw std::invalid_argument("encode_envelope: sender id too long");
    }
    if (envelope.payload && envelope.payload->size() > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("encode_envelope: payload too large");
    }

    ByteWriter writer;
    writer.put_u8(envelope.version);
    writer.put_u16(static_cast<uint16_t>(type_name.size()));
    writer.put_string(type_name);
    if (envelope.payload) {
        writer.put_u8(1);
        writer.put_u32(static_cast<uint32_t>(envelope.payload->size()));
        writer.put_bytes(*envelope.payload);
    } else {
        writer.put_u8(0);
    }
    writer.put_u16(static_cast<uint16_t>(envelope.sender_id.size()));
    writer.put_string(envelope.sender_id);
    return writer.take();
}

Envelope decode_envelope(const std::vector<uint8_t>& bytes) {
    ByteReader reader(bytes);
    Envelope envelope;

    if (!reader.read_u8(envelope.version)) {
        malformed("empty input");
    }
    if (envelope.version != kCurrentProtocolVersion) {
        throw PeerLinkError(ErrorKind::UnsupportedVersion,
                            "Unsupported protocol version " + std::to_string(envelope.version));
    }

    uint16_t type_len = 0;
    std::string type_name;
    if (!reader.read_u16(type_len) || !reader.read_string(type_len, type_name)) {
        malformed("truncated type");
    }
    auto type = message_type_from_name(type_name);
    if (!type) {
        malformed("unknown message type '" + type_name + "'");
    }
    envelope.type = *type;

    uint8_t has_payload = 0;
    if (!reader.read_u8(has_payload)) {
        malformed("truncated payload flag");
    }
    if (has_payload == 1) {
        uint32_t payload_len = 0;
        std::vector<uint8_t> payload;
        if (!reader.read_u32(payload_len) || !reader.read_bytes(payload_len, payload)) {
            malformed("truncated payload");
        }
        envelope.payload = std::move(payload);
    } else if (has_payload != 0) {
        malformed("invalid payload flag");
    }

    uint16_t sender_len = 0;
    if (!reader.read_u16(sender_len) || !reader.read_string(sender_len, envelope.sender_id)) {
        malformed("truncated sender");
    }
    if (!reader.at_end()) {
        malformed("trailing bytes");
    }

    switch (payload_requirement(envelope.type)) {
        case PayloadRequirement::None:
            if (envelope.payload) {
                malformed("unexpected payload on " + type_name);
            }
            break;
        case PayloadRequirement::Required:
        case PayloadRequirement::Raw:
            if (!envelope.payload) {
                throw PeerLinkError(ErrorKind::MissingPayload, type_name + " carries no payload");
            }
            break;
        case PayloadRequirement::Optional:
            break;
    }
    return envelope;
}

std::vector<uint8_t> encode_frame(const Envelope& envelope) {
    std::vector<uint8_t> body = encode_envelope(envelope);
    if (body.size() > kMaxFrameSize) {
        throw PeerLinkError(ErrorKind::FrameTooLarge,
                            "Frame of " + std::to_string(body.size()) + " bytes exceeds limit");
    }
    std::vector<uint8_t> frame(kFrameHeaderSize);
    uint32_t len = htonl(static_cast<uint32_t>(body.size()));
    std::memcpy(frame.data(), &len, sizeof(uint32_t));
    frame.insert(frame.end(), body.begin(), body.end());
    return frame;
}

uint32_t parse_frame_header(const uint8_t* header) {
    uint32_t len = 0;
    std::memcpy(&len, header, sizeof(uint32_t));
    len = ntohl(len);
    if (len > kMaxFrameSize) {
        throw PeerLinkError(ErrorKind::FrameTooLarge,
                            "Peer announced a frame of " + std::to_string(len) + " bytes");
    }
    return len;
}

void ByteWriter::put_u8(uint8_t value) {
    buffer_.push_back(value);
}

void ByteWriter::put_u16(uint16_t value) {
    buffer_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    buffer_.push_back(static_cast<uint8_t>(value & 0xFF));
}

void ByteWriter::put_u32(uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

void ByteWriter::put_u64(uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

void ByteWriter::put_bytes(const uint8_t* data, std::size_t len) {
    buffer_.insert(buffer_.end(), data, data + len);
}

void ByteWriter::put_bytes(const std::vector<uint8_t>& data) {
    buffer_.insert(buffer_.end(), data.begin(), data.end());
}

void ByteWriter::put_string(const std::string& value) {
    buffer_.insert(buffer_.end(), value.begin(), value.end());
}

bool ByteReader::read_u8(uint8_t& out) {
    if (remaining() < 1) {
        return false;
    }
    out = data_[offset_++];
    return true;
}

bool ByteReader::read_u16(uint16_t& out) {
    if (remaining() < 2) {
        return false;
    }
    out = static_cast<uint16_t>((data_[offset_] << 8) | data_[offset_ + 1]);
    offset_ += 2;
    return true;
}

bool ByteReader::read_u32(uint32_t& out) {
    if (remaining() < 4) {
        return false;
    }
    out = 0;
    for (int i = 0; i < 4; ++i) {
        out = (out << 8) | data_[offset_ + i];
    }
    offset_ += 4;
    return true;
}

bool ByteReader::read_u64(uint64_t& out) {
    if (remaining() < 8) {
        return false;
    }
    out = 0;
    for (int i = 0; i < 8; ++i) {
        out = (out << 8) | data_[offset_ + i];
    }
    offset_ += 8;
    return true;
}

bool ByteReader::read_bytes(std::size_t len, std::vector<uint8_t>& out) {
    if (remaining() < len) {
        return false;
    }
    out.assign(data_ + offset_, data_ + offset_ + len);
    offset_ += len;
    return true;
}

bool ByteReader::read_string(std::size_t len, std::string& out) {
    if (remaining() < len) {
        return false;
    }
    out.assign(reinterpret_cast<const char*>(data_ + offset_), len);
    offset_ += len;
    return true;
}

} // namespace peerlink
