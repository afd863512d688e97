/*
 * PeerLink - cryptographic helpers
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

typedef struct evp_pkey_st EVP_PKEY;
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace peerlink {

constexpr std::size_t kAes256KeySize = 32;
constexpr std::size_t kGcmNonceSize = 12;
constexpr std::size_t kGcmTagSize = 16;
constexpr std::size_t kSha256Size = 32;

struct Ciphertext {
    std::vector<uint8_t> nonce;
    std::vector<uint8_t> data;
    std::vector<uint8_t> tag;
};

struct PKeyDeleter {
    void operator()(EVP_PKEY* key) const;
};

using PKeyPtr = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

// Fresh NIST P-256 key pair; never persisted.
PKeyPtr generate_p256_keypair();

// Uncompressed EC point (0x04 | X | Y) of the key's public half.
std::vector<uint8_t> encoded_public_key(EVP_PKEY* key);

std::vector<uint8_t> sha256(const uint8_t* data, std::size_t len);

std::vector<uint8_t> sha256(const std::vector<uint8_t>& data);

// Incremental SHA-256 over an EVP digest context.
class Sha256Context {
public:
    Sha256Context();
    ~Sha256Context();

    Sha256Context(const Sha256Context&) = delete;
    Sha256Context& operator=(const Sha256Context&) = delete;

    void update(const uint8_t* data, std::size_t len);
    std::vector<uint8_t> finish();

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

// The nonce is drawn inside the call; callers cannot supply one.
Ciphertext aes256_gcm_encrypt(const std::vector<uint8_t>& key,
                              const std::vector<uint8_t>& plaintext,
                              const std::vector<uint8_t>& aad);

// Returns nullopt when the tag does not authenticate.
std::optional<std::vector<uint8_t>> aes256_gcm_decrypt(const std::vector<uint8_t>& key,
                                                       const Ciphertext& ciphertext,
                                                       const std::vector<uint8_t>& aad);

} // namespace peerlink
