/*
 * PeerLink - trust-on-first-use fingerprint pins
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace peerlink {

class AtRestEncryptor;

enum class TrustDecision {
    FirstUse,
    Match,
    Mismatch
};

const char* trust_decision_name(TrustDecision decision);

class TrustStore {
public:
    std::optional<std::string> pinned(const std::string& peer_id) const;

    // Pins on first use. A mismatch leaves the existing pin in place.
    TrustDecision evaluate(const std::string& peer_id, const std::string& fingerprint);

    // Throws PeerLinkError(FingerprintMismatch) instead of returning Mismatch.
    void verify_or_pin(const std::string& peer_id, const std::string& fingerprint);

    bool forget(const std::string& peer_id);

    std::size_t size() const;

    // Returns false when no pin file exists yet. Throws PeerLinkError when the
    // file exists but cannot be decrypted or parsed. When an identifier appears
    // twice the first pin is kept.
    bool load(const std::filesystem::path& path, AtRestEncryptor& encryptor);

    void save(const std::filesystem::path& path, AtRestEncryptor& encryptor) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> pins_;
};

} // namespace peerlink
