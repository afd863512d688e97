/*
 * PeerLink - encrypted transfer history implementation
 */

#include "transfer_history.hpp"

#include "at_rest.hpp"
#include "errors.hpp"
#include "protocol.hpp"
#include "utils.hpp"

#include <algorithm>
#include <limits>

namespace peerlink {

namespace {
constexpr uint8_t kHistoryFormat = 1;

void put_short_string(ByteWriter& writer, const std::string& value) {
    const std::size_t len = std::min<std::size_t>(value.size(), std::numeric_limits<uint16_t>::max());
    writer.put_u16(static_cast<uint16_t>(len));
    writer.put_bytes(reinterpret_cast<const uint8_t*>(value.data()), len);
}

void put_optional_string(ByteWriter& writer, const std::optional<std::string>& value) {
    writer.put_u8(value ? 1 : 0);
    if (value) {
        put_short_string(writer, *value);
    }
}

bool read_short_string(ByteReader& reader, std::string& out) {
    uint16_t len = 0;
    return reader.read_u16(len) && reader.read_string(len, out);
}

bool read_optional_string(ByteReader& reader, std::optional<std::string>& out) {
    uint8_t present = 0;
    if (!reader.read_u8(present)) {
        return false;
    }
    if (present == 0) {
        out.reset();
        return true;
    }
    std::string value;
    if (!read_short_string(reader, value)) {
        return false;
    }
    out = std::move(value);
    return true;
}
} // namespace

std::vector<uint8_t> encode_history(const std::vector<TransferRecord>& records) {
    ByteWriter writer;
    writer.put_u8(kHistoryFormat);
    writer.put_u32(static_cast<uint32_t>(records.size()));
    for (const auto& record : records) {
        put_short_string(writer, record.id);
        put_short_string(writer, record.file_name);
        writer.put_u64(record.file_size);
        writer.put_u8(static_cast<uint8_t>(record.direction));
        writer.put_u64(static_cast<uint64_t>(record.timestamp_ms));
        writer.put_u8(record.success ? 1 : 0);
        put_short_string(writer, record.peer_id);
        put_optional_string(writer, record.error);
        put_optional_string(writer, record.local_path);
    }
    return writer.take();
}

std::vector<TransferRecord> decode_history(const std::vector<uint8_t>& bytes) {
    ByteReader reader(bytes);
    uint8_t format = 0;
    uint32_t count = 0;
    if (!reader.read_u8(format) || format != kHistoryFormat || !reader.read_u32(count)) {
        throw PeerLinkError(ErrorKind::InvalidFormat, "Unrecognized transfer history format");
    }

    std::vector<TransferRecord> records;
    for (uint32_t i = 0; i < count; ++i) {
        TransferRecord record;
        uint8_t direction = 0;
        uint8_t success = 0;
        uint64_t timestamp = 0;
        if (!read_short_string(reader, record.id) || !read_short_string(reader, record.file_name) ||
            !reader.read_u64(record.file_size) || !reader.read_u8(direction) || !reader.read_u64(timestamp) ||
            !reader.read_u8(success) || !read_short_string(reader, record.peer_id) ||
            !read_optional_string(reader, record.error) || !read_optional_string(reader, record.local_path) ||
            direction > static_cast<uint8_t>(TransferDirection::Received)) {
            throw PeerLinkError(ErrorKind::InvalidFormat, "Truncated transfer history entry");
        }
        record.direction = static_cast<TransferDirection>(direction);
        record.timestamp_ms = static_cast<int64_t>(timestamp);
        record.success = success != 0;
        records.push_back(std::move(record));
    }
    return records;
}

TransferHistoryStore::TransferHistoryStore(std::filesystem::path path,
                                           AtRestEncryptor& encryptor,
                                           std::size_t max_entries)
    : path_(std::move(path)), encryptor_(encryptor), max_entries_(max_entries) {}

bool TransferHistoryStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return true;
    }
    try {
        encryptor_.migrate_file_if_needed(path_);
        entries_ = decode_history(encryptor_.read_and_decrypt(path_));
    } catch (const PeerLinkError& ex) {
        log_warn(std::string("Transfer history unrecoverable, starting empty: ") + ex.what());
        entries_.clear();
        return false;
    }
    if (entries_.size() > max_entries_) {
        entries_.resize(max_entries_);
    }
    log_debug("Loaded " + std::to_string(entries_.size()) + " transfer record(s)");
    return true;
}

void TransferHistoryStore::record_transfer(const TransferRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.insert(entries_.begin(), record);
    if (entries_.size() > max_entries_) {
        entries_.resize(max_entries_);
    }
    save_locked();
}

std::vector<TransferRecord> TransferHistoryStore::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

void TransferHistoryStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    save_locked();
}

void TransferHistoryStore::save_locked() {
    try {
        encryptor_.encrypt_and_write(path_, encode_history(entries_));
    } catch (const PeerLinkError& ex) {
        log_error(std::string("Failed to persist transfer history: ") + ex.what());
    }
}

} // namespace peerlink
