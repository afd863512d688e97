/*
 * PeerLink - transfer history tests
 */

#include "at_rest.hpp"
#include "test_support.hpp"
#include "transfer_history.hpp"
#include "utils.hpp"

#include <fstream>
#include <memory>

using namespace peerlink;
using peerlink_test::throws_kind;

namespace {

TransferRecord record_named(const std::string& name, bool success) {
    TransferRecord record = make_transfer_record(name, 1234, TransferDirection::Received, "PEER-B");
    record.success = success;
    if (!success) {
        record.error = "File integrity check failed";
    } else {
        record.local_path = "/downloads/" + name;
    }
    return record;
}

void write_raw(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

void test_newest_first_and_bounded() {
    auto dir = peerlink_test::temp_dir("peerlink_history_bounded");
    AtRestEncryptor encryptor(std::make_shared<MemoryKeyStore>());
    TransferHistoryStore store(dir / "history.bin", encryptor, 3);
    CHECK(store.load());
    CHECK(store.entries().empty());

    for (const char* name : {"a.txt", "b.txt", "c.txt", "d.txt"}) {
        store.record_transfer(record_named(name, true));
    }
    auto entries = store.entries();
    CHECK(entries.size() == 3);
    CHECK(entries.front().file_name == "d.txt");
    CHECK(entries.back().file_name == "b.txt");

    store.clear();
    CHECK(store.entries().empty());
}

void test_persisted_encrypted() {
    auto dir = peerlink_test::temp_dir("peerlink_history_persist");
    auto path = dir / "history.bin";
    AtRestEncryptor encryptor(std::make_shared<MemoryKeyStore>());
    {
        TransferHistoryStore store(path, encryptor);
        store.record_transfer(record_named("ok.bin", true));
        store.record_transfer(record_named("bad.bin", false));
    }
    auto raw = read_file_bytes(path);
    CHECK(raw && AtRestEncryptor::is_encrypted(*raw));

    TransferHistoryStore reloaded(path, encryptor);
    CHECK(reloaded.load());
    auto entries = reloaded.entries();
    CHECK(entries.size() == 2);
    if (entries.size() == 2) {
        CHECK(entries[0].file_name == "bad.bin");
        CHECK(!entries[0].success);
        CHECK(entries[0].error == std::optional<std::string>("File integrity check failed"));
        CHECK(!entries[0].local_path.has_value());
        CHECK(entries[1].success);
        CHECK(entries[1].local_path == std::optional<std::string>("/downloads/ok.bin"));
        CHECK(entries[1].file_size == 1234);
        CHECK(entries[1].direction == TransferDirection::Received);
        CHECK(entries[1].peer_id == "PEER-B");
    }

    // A different key cannot read it; the history starts empty.
    AtRestEncryptor stranger(std::make_shared<MemoryKeyStore>());
    TransferHistoryStore locked_out(path, stranger);
    CHECK(!locked_out.load());
    CHECK(locked_out.entries().empty());
}

void test_legacy_plaintext() {
    auto dir = peerlink_test::temp_dir("peerlink_history_legacy");
    auto path = dir / "history.bin";
    write_raw(path, encode_history({record_named("old.txt", true)}));

    AtRestEncryptor encryptor(std::make_shared<MemoryKeyStore>());
    TransferHistoryStore store(path, encryptor);
    CHECK(store.load());
    CHECK(store.entries().size() == 1);
    auto raw = read_file_bytes(path);
    CHECK(raw && AtRestEncryptor::is_encrypted(*raw));

    auto garbage = dir / "garbage.bin";
    write_raw(garbage, {9, 9, 9});
    TransferHistoryStore broken(garbage, encryptor);
    CHECK(!broken.load());
    CHECK(broken.entries().empty());
}

void test_decode_rejects_truncation() {
    auto bytes = encode_history({record_named("x", true)});
    bytes.resize(bytes.size() - 3);
    CHECK(throws_kind([&] { decode_history(bytes); }, ErrorKind::InvalidFormat));
    CHECK(throws_kind([] { decode_history({2, 0, 0, 0, 0}); }, ErrorKind::InvalidFormat));
    CHECK(decode_history(encode_history({})).empty());
}

} // namespace

int main() {
    try {
        test_newest_first_and_bounded();
        test_persisted_encrypted();
        test_legacy_plaintext();
        test_decode_rejects_truncation();
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << "\n";
        return 2;
    }
    return peerlink_test::finish("transfer_history_test");
}
