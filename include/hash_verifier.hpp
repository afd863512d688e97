/*
 * PeerLink - incremental SHA-256 verification
 */

#pragma once

#include "crypto.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace peerlink {

constexpr std::size_t kDefaultChunkSize = 64 * 1024;

class HashVerifier {
public:
    HashVerifier();

    // Throws PeerLinkError(FinalizedHasher) once finalize() has run.
    void update(const uint8_t* data, std::size_t len);
    void update(const std::vector<uint8_t>& data);

    // Lowercase hex digest. Repeated calls return the same value.
    std::string finalize();

    // Finalizes if needed and compares case-insensitively.
    bool verify(const std::string& expected);

    void reset();

    bool is_finalized() const { return digest_.has_value(); }
    uint64_t bytes_processed() const { return bytes_processed_; }

private:
    std::unique_ptr<Sha256Context> context_;
    std::optional<std::string> digest_;
    uint64_t bytes_processed_ = 0;
};

std::string sha256_hex(const std::vector<uint8_t>& data);

// Streams the file through the hasher; memory is bounded by chunk_size.
// Throws PeerLinkError(IoFailure) when the file cannot be read.
std::string sha256_file(const std::filesystem::path& path, std::size_t chunk_size = kDefaultChunkSize);

} // namespace peerlink
