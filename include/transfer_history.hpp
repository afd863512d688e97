/*
 * PeerLink - encrypted transfer history
 */

#pragma once

#include "file_transfer.hpp"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <vector>

namespace peerlink {

class AtRestEncryptor;

constexpr std::size_t kMaxHistoryEntries = 200;

std::vector<uint8_t> encode_history(const std::vector<TransferRecord>& records);

// Throws PeerLinkError(InvalidFormat) on malformed input.
std::vector<TransferRecord> decode_history(const std::vector<uint8_t>& bytes);

// Newest first, bounded, persisted through the at-rest encryptor on every change.
class TransferHistoryStore : public TransferRecordSink {
public:
    TransferHistoryStore(std::filesystem::path path,
                         AtRestEncryptor& encryptor,
                         std::size_t max_entries = kMaxHistoryEntries);

    // Migrates a legacy plaintext file first. An unreadable file leaves the
    // history empty. Returns false in that case.
    bool load();

    void record_transfer(const TransferRecord& record) override;

    std::vector<TransferRecord> entries() const;

    void clear();

private:
    void save_locked();

    std::filesystem::path path_;
    AtRestEncryptor& encryptor_;
    std::size_t max_entries_;
    mutable std::mutex mutex_;
    std::vector<TransferRecord> entries_;
};

} // namespace peerlink
