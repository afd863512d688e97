/*
 * PeerLink - at-rest encryption
 *
 * Locally persisted data (transfer history, trust pins) is stored in a
 * self-describing container:
 *
 *   magic "PLEK" (4) | format version (1) | nonce (12) | ciphertext | tag (16)
 *
 * The 5-byte header is authenticated as associated data. One 256-bit key is
 * created on first use, kept in a KeyStore and cached for the process
 * lifetime.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace peerlink {

constexpr uint8_t kContainerMagic[4] = {'P', 'L', 'E', 'K'};
constexpr uint8_t kContainerVersion = 0x01;
constexpr std::size_t kContainerHeaderSize = 5;
constexpr std::size_t kContainerOverhead = 33;

class KeyStore {
public:
    virtual ~KeyStore() = default;

    // nullopt when no key has been stored yet.
    virtual std::optional<std::vector<uint8_t>> load_key() = 0;
    virtual void store_key(const std::vector<uint8_t>& key) = 0;
};

// Key kept by the desktop secret service through libsecret, hex encoded.
// Items are keyed by the user id and an account string, normally the data
// directory, so separate nodes keep separate keys. Every call throws
// PeerLinkError(KeyStoreFailure) when the secret service cannot be reached.
class SecretServiceKeyStore : public KeyStore {
public:
    explicit SecretServiceKeyStore(std::string account);

    std::optional<std::vector<uint8_t>> load_key() override;
    void store_key(const std::vector<uint8_t>& key) override;

    // False when no key was stored.
    bool remove_key();

    const std::string& account() const { return account_; }

private:
    std::string account_;
};

// Key file readable by the owner only, inside an owner-only directory.
// Used where no secret service runs.
class FileKeyStore : public KeyStore {
public:
    explicit FileKeyStore(std::filesystem::path directory);

    std::optional<std::vector<uint8_t>> load_key() override;
    void store_key(const std::vector<uint8_t>& key) override;

    const std::filesystem::path& key_path() const { return key_path_; }

    // False when there was no key file.
    bool remove_key();

private:
    std::filesystem::path directory_;
    std::filesystem::path key_path_;
};

class MemoryKeyStore : public KeyStore {
public:
    std::optional<std::vector<uint8_t>> load_key() override;
    void store_key(const std::vector<uint8_t>& key) override;

    int store_count() const { return store_count_; }

private:
    std::mutex mutex_;
    std::optional<std::vector<uint8_t>> key_;
    int store_count_ = 0;
};

class AtRestEncryptor {
public:
    explicit AtRestEncryptor(std::shared_ptr<KeyStore> key_store);

    AtRestEncryptor(const AtRestEncryptor&) = delete;
    AtRestEncryptor& operator=(const AtRestEncryptor&) = delete;

    // Check cache, else load or create, then cache: one critical section.
    std::vector<uint8_t> get_or_create_key();

    std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plaintext);

    // Throws PeerLinkError(InvalidFormat) or PeerLinkError(AuthenticationFailure).
    std::vector<uint8_t> decrypt(const std::vector<uint8_t>& container);

    static bool is_encrypted(const std::vector<uint8_t>& bytes);

    void encrypt_and_write(const std::filesystem::path& path, const std::vector<uint8_t>& plaintext);

    std::vector<uint8_t> read_and_decrypt(const std::filesystem::path& path);

    // Rewrites a legacy plaintext file as a container. Returns true when it did.
    bool migrate_file_if_needed(const std::filesystem::path& path);

private:
    std::shared_ptr<KeyStore> key_store_;
    std::mutex key_mutex_;
    std::optional<std::vector<uint8_t>> cached_key_;
};

} // namespace peerlink
