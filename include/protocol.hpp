/*
 * PeerLink - wire protocol header
 *
 * This header defines the versioned message envelope exchanged between two
 * peers, the closed set of message kinds together with their payload
 * requirements, and the length-prefixed framing used on the secure channel.
 *
 * Envelope layout (big-endian):
 *   version:u8 | type_len:u16 | type | has_payload:u8 | [payload_len:u32 | payload]
 *   | sender_len:u16 | sender
 *
 * The payload is opaque at this layer; typed codecs live in payloads.hpp.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace peerlink {

constexpr uint8_t kCurrentProtocolVersion = 1;
constexpr std::size_t kFrameHeaderSize = 4;
constexpr uint32_t kMaxFrameSize = 100u * 1024u * 1024u;

enum class MessageType : uint8_t {
    Hello,
    ConnectionRequest,
    ConnectionAccept,
    ConnectionReject,
    ConnectionCancel,
    FileOffer,
    FileAccept,
    FileReject,
    FileChunk,
    FileComplete,
    BatchStart,
    BatchComplete,
    SdpOffer,
    SdpAnswer,
    IceCandidate,
    CallRequest,
    CallAccept,
    CallReject,
    CallEnd,
    TextMessage,
    MediaMessage,
    ChatReject,
    MessageReceipt,
    TypingIndicator,
    Reaction,
    Disconnect,
    Ping,
    Pong
};

enum class PayloadRequirement {
    None,
    Optional,
    Required,
    Raw
};

const char* message_type_name(MessageType type);

std::optional<MessageType> message_type_from_name(const std::string& name);

PayloadRequirement payload_requirement(MessageType type);

const std::vector<MessageType>& all_message_types();

struct Envelope {
    uint8_t version = kCurrentProtocolVersion;
    MessageType type = MessageType::Ping;
    std::optional<std::vector<uint8_t>> payload;
    std::string sender_id;

    bool operator==(const Envelope& other) const {
        return version == other.version && type == other.type && payload == other.payload &&
               sender_id == other.sender_id;
    }
};

Envelope make_envelope(MessageType type,
                       const std::string& sender_id,
                       std::optional<std::vector<uint8_t>> payload = std::nullopt);

std::vector<uint8_t> encode_envelope(const Envelope& envelope);

// Throws PeerLinkError(UnsupportedVersion) before looking past the first
// byte, PeerLinkError(MalformedEnvelope) on any structural violation or a
// payload on a kind that takes none, and PeerLinkError(MissingPayload) when a
// kind that needs a payload arrives without one.
Envelope decode_envelope(const std::vector<uint8_t>& bytes);

// Length prefix followed by the encoded envelope.
std::vector<uint8_t> encode_frame(const Envelope& envelope);

// Returns the body length announced by a frame header. Throws
// PeerLinkError(FrameTooLarge) above kMaxFrameSize.
uint32_t parse_frame_header(const uint8_t* header);

class ByteWriter {
public:
    void put_u8(uint8_t value);
    void put_u16(uint16_t value);
    void put_u32(uint32_t value);
    void put_u64(uint64_t value);
    void put_bytes(const uint8_t* data, std::size_t len);
    void put_bytes(const std::vector<uint8_t>& data);
    void put_string(const std::string& value);

    const std::vector<uint8_t>& data() const { return buffer_; }
    std::vector<uint8_t> take() { return std::move(buffer_); }

private:
    std::vector<uint8_t> buffer_;
};

class ByteReader {
public:
    ByteReader(const uint8_t* data, std::size_t len) : data_(data), len_(len) {}
    explicit ByteReader(const std::vector<uint8_t>& data) : ByteReader(data.data(), data.size()) {}

    bool read_u8(uint8_t& out);
    bool read_u16(uint16_t& out);
    bool read_u32(uint32_t& out);
    bool read_u64(uint64_t& out);
    bool read_bytes(std::size_t len, std::vector<uint8_t>& out);
    bool read_string(std::size_t len, std::string& out);

    std::size_t remaining() const { return len_ - offset_; }
    bool at_end() const { return offset_ == len_; }

private:
    const uint8_t* data_;
    std::size_t len_;
    std::size_t offset_ = 0;
};

} // namespace peerlink
