/*
 * PeerLink - incremental SHA-256 verification implementation
 */

#include "hash_verifier.hpp"

#include "certificate.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <fstream>

namespace peerlink {

HashVerifier::HashVerifier() : context_(std::make_unique<Sha256Context>()) {}

void HashVerifier::update(const uint8_t* data, std::size_t len) {
    if (digest_) {
        throw PeerLinkError(ErrorKind::FinalizedHasher);
    }
    context_->update(data, len);
    bytes_processed_ += len;
}

void HashVerifier::update(const std::vector<uint8_t>& data) {
    update(data.data(), data.size());
}

std::string HashVerifier::finalize() {
    if (!digest_) {
        digest_ = hex_encode(context_->finish());
    }
    return *digest_;
}

bool HashVerifier::verify(const std::string& expected) {
    return fingerprints_equal(finalize(), expected);
}

void HashVerifier::reset() {
    context_ = std::make_unique<Sha256Context>();
    digest_.reset();
    bytes_processed_ = 0;
}

std::string sha256_hex(const std::vector<uint8_t>& data) {
    return hex_encode(sha256(data));
}

std::string sha256_file(const std::filesystem::path& path, std::size_t chunk_size) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw PeerLinkError(ErrorKind::IoFailure, "Cannot open " + path.string());
    }
    if (chunk_size == 0) {
        chunk_size = kDefaultChunkSize;
    }

    HashVerifier verifier;
    std::vector<char> buffer(chunk_size);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got > 0) {
            verifier.update(reinterpret_cast<const uint8_t*>(buffer.data()), static_cast<std::size_t>(got));
        }
    }
    if (in.bad()) {
        throw PeerLinkError(ErrorKind::IoFailure, "Read error on " + path.string());
    }
    return verifier.finalize();
}

} // namespace peerlink
