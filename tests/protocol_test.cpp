/*
 * PeerLink - envelope and frame codec tests
 */

#include "payloads.hpp"
#include "protocol.hpp"
#include "test_support.hpp"
#include "utils.hpp"

#include <cstring>
#include <set>

using namespace peerlink;
using peerlink_test::bytes_of;
using peerlink_test::throws_kind;

namespace {

void test_message_names() {
    const auto& kinds = all_message_types();
    CHECK(kinds.size() == 28);
    std::set<std::string> seen;
    for (MessageType kind : kinds) {
        std::string name = message_type_name(kind);
        seen.insert(name);
        auto back = message_type_from_name(name);
        CHECK(back.has_value());
        CHECK(back && *back == kind);
    }
    CHECK(seen.size() == kinds.size());
    CHECK(std::string(message_type_name(MessageType::FileOffer)) == "fileOffer");
    CHECK(std::string(message_type_name(MessageType::IceCandidate)) == "iceCandidate");
    CHECK(!message_type_from_name("FileOffer").has_value());
    CHECK(!message_type_from_name("").has_value());
}

void test_payload_requirements() {
    CHECK(payload_requirement(MessageType::Hello) == PayloadRequirement::Required);
    CHECK(payload_requirement(MessageType::FileReject) == PayloadRequirement::Optional);
    CHECK(payload_requirement(MessageType::ConnectionReject) == PayloadRequirement::Optional);
    CHECK(payload_requirement(MessageType::FileChunk) == PayloadRequirement::Raw);
    CHECK(payload_requirement(MessageType::SdpAnswer) == PayloadRequirement::Raw);
    CHECK(payload_requirement(MessageType::Ping) == PayloadRequirement::None);
}

void test_round_trip() {
    Envelope bare = make_envelope(MessageType::Ping, "peer-a");
    CHECK(decode_envelope(encode_envelope(bare)) == bare);

    Envelope with_payload = make_envelope(MessageType::FileChunk, "peer-b", bytes_of("chunk bytes"));
    Envelope decoded = decode_envelope(encode_envelope(with_payload));
    CHECK(decoded == with_payload);
    CHECK(decoded.payload && *decoded.payload == bytes_of("chunk bytes"));

    // Present but empty is not the same as absent.
    Envelope empty_payload = make_envelope(MessageType::FileChunk, "", std::vector<uint8_t>());
    Envelope decoded_empty = decode_envelope(encode_envelope(empty_payload));
    CHECK(decoded_empty.payload.has_value());
    CHECK(decoded_empty.payload && decoded_empty.payload->empty());
    CHECK(decoded_empty.sender_id.empty());

    for (MessageType kind : all_message_types()) {
        Envelope env = make_envelope(kind, "sender");
        if (payload_requirement(kind) != PayloadRequirement::None) {
            env.payload = random_bytes(17);
        }
        CHECK(decode_envelope(encode_envelope(env)) == env);
    }
}

void test_payload_requirements_enforced() {
    auto ping_with_payload = encode_envelope(make_envelope(MessageType::Ping, "s", bytes_of("extra")));
    CHECK(throws_kind([&] { decode_envelope(ping_with_payload); }, ErrorKind::MalformedEnvelope));
    auto accept_with_payload = encode_envelope(make_envelope(MessageType::FileAccept, "s", std::vector<uint8_t>()));
    CHECK(throws_kind([&] { decode_envelope(accept_with_payload); }, ErrorKind::MalformedEnvelope));

    auto bare_text = encode_envelope(make_envelope(MessageType::TextMessage, "s"));
    CHECK(throws_kind([&] { decode_envelope(bare_text); }, ErrorKind::MissingPayload));
    auto bare_chunk = encode_envelope(make_envelope(MessageType::FileChunk, "s"));
    CHECK(throws_kind([&] { decode_envelope(bare_chunk); }, ErrorKind::MissingPayload));

    // The reject family may go either way.
    auto bare_reject = encode_envelope(make_envelope(MessageType::FileReject, "s"));
    CHECK(!decode_envelope(bare_reject).payload.has_value());
    auto reasoned = encode_envelope(make_envelope(MessageType::FileReject, "s", bytes_of("x")));
    CHECK(decode_envelope(reasoned).payload.has_value());
}

void test_wire_layout() {
    Envelope env = make_envelope(MessageType::Pong, "ab");
    auto bytes = encode_envelope(env);
    // version | u16 len | "pong" | flag 0 | u16 len | "ab"
    std::vector<uint8_t> expected = {1, 0, 4, 'p', 'o', 'n', 'g', 0, 0, 2, 'a', 'b'};
    CHECK(bytes == expected);
}

void test_unsupported_version() {
    auto bytes = encode_envelope(make_envelope(MessageType::Hello, "x", bytes_of("payload")));
    bytes[0] = 2;
    CHECK(throws_kind([&] { decode_envelope(bytes); }, ErrorKind::UnsupportedVersion));

    // Checked before anything else is parsed.
    std::vector<uint8_t> garbage = {0, 0xff, 0xff, 0xff};
    CHECK(throws_kind([&] { decode_envelope(garbage); }, ErrorKind::UnsupportedVersion));
    std::vector<uint8_t> only_version = {9};
    CHECK(throws_kind([&] { decode_envelope(only_version); }, ErrorKind::UnsupportedVersion));
}

void test_malformed() {
    CHECK(throws_kind([] { decode_envelope({}); }, ErrorKind::MalformedEnvelope));

    auto bytes = encode_envelope(make_envelope(MessageType::TextMessage, "sender", bytes_of("hello")));
    for (std::size_t cut = 1; cut < bytes.size(); ++cut) {
        std::vector<uint8_t> truncated(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(cut));
        CHECK(throws_kind([&] { decode_envelope(truncated); }, ErrorKind::MalformedEnvelope));
    }

    auto trailing = bytes;
    trailing.push_back(0);
    CHECK(throws_kind([&] { decode_envelope(trailing); }, ErrorKind::MalformedEnvelope));

    ByteWriter unknown;
    unknown.put_u8(kCurrentProtocolVersion);
    unknown.put_u16(8);
    unknown.put_string("teleport");
    CHECK(throws_kind([&] { decode_envelope(unknown.data()); }, ErrorKind::MalformedEnvelope));

    auto bad_flag = encode_envelope(make_envelope(MessageType::Ping, "s"));
    bad_flag[7] = 5;
    CHECK(throws_kind([&] { decode_envelope(bad_flag); }, ErrorKind::MalformedEnvelope));
}

void test_frames() {
    Envelope env = make_envelope(MessageType::FileComplete, "peer", bytes_of("digest"));
    auto frame = encode_frame(env);
    auto body = encode_envelope(env);
    CHECK(frame.size() == body.size() + kFrameHeaderSize);
    CHECK(parse_frame_header(frame.data()) == body.size());
    CHECK(std::memcmp(frame.data() + kFrameHeaderSize, body.data(), body.size()) == 0);

    uint8_t at_limit[4] = {0x06, 0x40, 0x00, 0x00};
    CHECK(parse_frame_header(at_limit) == kMaxFrameSize);
    uint8_t over_limit[4] = {0x06, 0x40, 0x00, 0x01};
    CHECK(throws_kind([&] { parse_frame_header(over_limit); }, ErrorKind::FrameTooLarge));
}

void test_byte_reader() {
    ByteWriter writer;
    writer.put_u16(0xBEEF);
    writer.put_u32(7);
    writer.put_u64(0x0102030405060708ull);
    ByteReader reader(writer.data());
    uint16_t a = 0;
    uint32_t b = 0;
    uint64_t c = 0;
    CHECK(reader.read_u16(a) && a == 0xBEEF);
    CHECK(reader.read_u32(b) && b == 7);
    CHECK(reader.read_u64(c) && c == 0x0102030405060708ull);
    CHECK(reader.at_end());
    uint8_t d = 0;
    CHECK(!reader.read_u8(d));
}

} // namespace

int main() {
    try {
        test_message_names();
        test_payload_requirements();
        test_round_trip();
        test_payload_requirements_enforced();
        test_wire_layout();
        test_unsupported_version();
        test_malformed();
        test_frames();
        test_byte_reader();
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << "\n";
        return 2;
    }
    return peerlink_test::finish("protocol_test");
}
