/*
 * PeerLink - trust-on-first-use fingerprint pins implementation
 *
 * Pins are persisted inside an at-rest container as a format byte followed by
 * length-prefixed (peer id, fingerprint) pairs. Older files held one
 * "<fingerprint> <peer id>" line per pin and are still read.
 */

#include "trust_store.hpp"

#include "at_rest.hpp"
#include "certificate.hpp"
#include "errors.hpp"
#include "protocol.hpp"
#include "utils.hpp"

#include <limits>
#include <sstream>

namespace peerlink {

namespace {
constexpr uint8_t kPinFormat = 2;

// The first pin read for an identifier is the one kept.
void add_loaded_pin(std::map<std::string, std::string>& pins,
                    const std::string& peer_id,
                    const std::string& fingerprint) {
    if (peer_id.empty() || !is_valid_fingerprint(fingerprint)) {
        log_warn("Skipping malformed trust entry");
        return;
    }
    if (!pins.emplace(peer_id, fingerprint).second) {
        log_warn("Ignoring duplicate trust entry for peer " + short_id(peer_id));
    }
}

void parse_pins(const std::vector<uint8_t>& plaintext, std::map<std::string, std::string>& pins) {
    ByteReader reader(plaintext);
    uint8_t format = 0;
    if (!reader.read_u8(format) || format != kPinFormat) {
        throw PeerLinkError(ErrorKind::InvalidFormat, "Unrecognized trust store format");
    }
    while (!reader.at_end()) {
        uint16_t id_len = 0;
        uint16_t fp_len = 0;
        std::string peer_id;
        std::string fingerprint;
        if (!reader.read_u16(id_len) || !reader.read_string(id_len, peer_id) || !reader.read_u16(fp_len) ||
            !reader.read_string(fp_len, fingerprint)) {
            throw PeerLinkError(ErrorKind::InvalidFormat, "Truncated trust store entry");
        }
        add_loaded_pin(pins, peer_id, normalize_fingerprint(fingerprint));
    }
}

void parse_legacy_lines(const std::vector<uint8_t>& plaintext, std::map<std::string, std::string>& pins) {
    std::istringstream iss(std::string(plaintext.begin(), plaintext.end()));
    std::string line;
    while (std::getline(iss, line)) {
        auto space = line.find(' ');
        if (space == std::string::npos) {
            continue;
        }
        add_loaded_pin(pins, line.substr(space + 1), normalize_fingerprint(line.substr(0, space)));
    }
}
} // namespace

const char* trust_decision_name(TrustDecision decision) {
    switch (decision) {
        case TrustDecision::FirstUse:
            return "first-use";
        case TrustDecision::Match:
            return "match";
        case TrustDecision::Mismatch:
            return "mismatch";
    }
    return "unknown";
}

std::optional<std::string> TrustStore::pinned(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pins_.find(peer_id);
    if (it == pins_.end()) {
        return std::nullopt;
    }
    return it->second;
}

TrustDecision TrustStore::evaluate(const std::string& peer_id, const std::string& fingerprint) {
    const std::string presented = normalize_fingerprint(fingerprint);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pins_.find(peer_id);
    if (it == pins_.end()) {
        pins_.emplace(peer_id, presented);
        log_info("Pinned fingerprint for peer " + short_id(peer_id) + " on first use");
        return TrustDecision::FirstUse;
    }
    if (it->second == presented) {
        return TrustDecision::Match;
    }
    log_warn("Fingerprint mismatch for peer " + short_id(peer_id) + ": pinned " +
             it->second.substr(0, 16) + ", presented " + presented.substr(0, 16));
    return TrustDecision::Mismatch;
}

void TrustStore::verify_or_pin(const std::string& peer_id, const std::string& fingerprint) {
    if (evaluate(peer_id, fingerprint) == TrustDecision::Mismatch) {
        throw PeerLinkError(ErrorKind::FingerprintMismatch,
                            "Certificate fingerprint for peer " + peer_id +
                                " does not match the pinned fingerprint");
    }
}

bool TrustStore::forget(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return pins_.erase(peer_id) > 0;
}

std::size_t TrustStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pins_.size();
}

bool TrustStore::load(const std::filesystem::path& path, AtRestEncryptor& encryptor) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return false;
    }
    encryptor.migrate_file_if_needed(path);
    auto plaintext = encryptor.read_and_decrypt(path);

    std::map<std::string, std::string> loaded;
    if (!plaintext.empty() && plaintext.front() == kPinFormat) {
        parse_pins(plaintext, loaded);
    } else {
        parse_legacy_lines(plaintext, loaded);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    pins_ = std::move(loaded);
    log_info("Loaded " + std::to_string(pins_.size()) + " pinned peer fingerprint(s)");
    return true;
}

void TrustStore::save(const std::filesystem::path& path, AtRestEncryptor& encryptor) const {
    ByteWriter writer;
    writer.put_u8(kPinFormat);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [peer_id, fingerprint] : pins_) {
            if (peer_id.size() > std::numeric_limits<uint16_t>::max()) {
                log_warn("Not persisting pin with oversized peer id");
                continue;
            }
            writer.put_u16(static_cast<uint16_t>(peer_id.size()));
            writer.put_string(peer_id);
            writer.put_u16(static_cast<uint16_t>(fingerprint.size()));
            writer.put_string(fingerprint);
        }
    }
    encryptor.encrypt_and_write(path, writer.take());
}

} // namespace peerlink
