/*
 * PeerLink - cryptographic helpers implementation
 */

#include "crypto.hpp"

#include "utils.hpp"

#include <stdexcept>

#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>

namespace peerlink {

void PKeyDeleter::operator()(EVP_PKEY* key) const {
    EVP_PKEY_free(key);
}

PKeyPtr generate_p256_keypair() {
    EVP_PKEY_CTX* context = EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr);
    if (!context) {
        throw std::runtime_error("EVP_PKEY_CTX_new_id failed");
    }

    EVP_PKEY* key = nullptr;
    if (EVP_PKEY_keygen_init(context) <= 0 ||
        EVP_PKEY_CTX_set_ec_paramgen_curve_nid(context, NID_X9_62_prime256v1) <= 0 ||
        EVP_PKEY_keygen(context, &key) <= 0) {
        EVP_PKEY_CTX_free(context);
        throw std::runtime_error("EVP_PKEY_keygen(P-256) failed");
    }
    EVP_PKEY_CTX_free(context);
    return PKeyPtr(key);
}

std::vector<uint8_t> encoded_public_key(EVP_PKEY* key) {
    if (!key) {
        throw std::invalid_argument("encoded_public_key: null key");
    }
    unsigned char* encoded = nullptr;
    std::size_t len = EVP_PKEY_get1_encoded_public_key(key, &encoded);
    if (len == 0 || !encoded) {
        throw std::runtime_error("EVP_PKEY_get1_encoded_public_key failed");
    }
    std::vector<uint8_t> out(encoded, encoded + len);
    OPENSSL_free(encoded);
    return out;
}

std::vector<uint8_t> sha256(const uint8_t* data, std::size_t len) {
    Sha256Context ctx;
    ctx.update(data, len);
    return ctx.finish();
}

std::vector<uint8_t> sha256(const std::vector<uint8_t>& data) {
    return sha256(data.data(), data.size());
}

Sha256Context::Sha256Context() {
    ctx_ = EVP_MD_CTX_new();
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        ctx_ = nullptr;
        throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
    }
}

Sha256Context::~Sha256Context() {
    EVP_MD_CTX_free(ctx_);
}

void Sha256Context::update(const uint8_t* data, std::size_t len) {
    if (len == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_, data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

std::vector<uint8_t> Sha256Context::finish() {
    std::vector<uint8_t> digest(kSha256Size);
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, digest.data(), &len) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    digest.resize(len);
    return digest;
}

Ciphertext aes256_gcm_encrypt(const std::vector<uint8_t>& key,
                              const std::vector<uint8_t>& plaintext,
                              const std::vector<uint8_t>& aad) {
    if (key.size() != kAes256KeySize) {
        throw std::invalid_argument("AES-256 key must be 32 bytes");
    }

    Ciphertext result;
    result.nonce = random_bytes(kGcmNonceSize);
    result.data.resize(plaintext.size());
    result.tag.resize(kGcmTagSize);

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }

    if (EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, kGcmNonceSize, nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), result.nonce.data()) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("AES-GCM init failed");
    }

    int len = 0;
    if (!aad.empty()) {
        if (EVP_EncryptUpdate(ctx,
                              nullptr,
                              &len,
                              aad.data(),
                              static_cast<int>(aad.size())) != 1) {
            EVP_CIPHER_CTX_free(ctx);
            throw std::runtime_error("AES-GCM AAD update failed");
        }
    }

    int ciphertext_len = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx,
                              result.data.data(),
                              &len,
                              plaintext.data(),
                              static_cast<int>(plaintext.size())) != 1) {
            EVP_CIPHER_CTX_free(ctx);
            throw std::runtime_error("AES-GCM encrypt failed");
        }
        ciphertext_len = len;
    }

    if (EVP_EncryptFinal_ex(ctx,
                            result.data.data() + ciphertext_len,
                            &len) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("AES-GCM finalization failed");
    }
    ciphertext_len += len;
    result.data.resize(static_cast<std::size_t>(ciphertext_len));

    if (EVP_CIPHER_CTX_ctrl(ctx,
                            EVP_CTRL_GCM_GET_TAG,
                            kGcmTagSize,
                            result.tag.data()) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("AES-GCM get tag failed");
    }

    EVP_CIPHER_CTX_free(ctx);
    return result;
}

std::optional<std::vector<uint8_t>> aes256_gcm_decrypt(const std::vector<uint8_t>& key,
                                                       const Ciphertext& ciphertext,
                                                       const std::vector<uint8_t>& aad) {
    if (key.size() != kAes256KeySize) {
        throw std::invalid_argument("AES-256 key must be 32 bytes");
    }
    if (ciphertext.nonce.size() != kGcmNonceSize ||
        ciphertext.tag.size() != kGcmTagSize) {
        throw std::invalid_argument("Invalid AES-GCM parameters");
    }

    // One spare byte keeps data() valid for empty ciphertexts.
    std::vector<uint8_t> plaintext(ciphertext.data.size() + 1);

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }

    if (EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, kGcmNonceSize, nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.data(), ciphertext.nonce.data()) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("AES-GCM decrypt init failed");
    }

    int len = 0;
    if (!aad.empty()) {
        if (EVP_DecryptUpdate(ctx,
                              nullptr,
                              &len,
                              aad.data(),
                              static_cast<int>(aad.size())) != 1) {
            EVP_CIPHER_CTX_free(ctx);
            throw std::runtime_error("AES-GCM decrypt AAD update failed");
        }
    }

    int plaintext_len = 0;
    if (!ciphertext.data.empty()) {
        if (EVP_DecryptUpdate(ctx,
                              plaintext.data(),
                              &len,
                              ciphertext.data.data(),
                              static_cast<int>(ciphertext.data.size())) != 1) {
            EVP_CIPHER_CTX_free(ctx);
            throw std::runtime_error("AES-GCM decrypt failed");
        }
        plaintext_len = len;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx,
                            EVP_CTRL_GCM_SET_TAG,
                            kGcmTagSize,
                            const_cast<unsigned char*>(ciphertext.tag.data())) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("AES-GCM set tag failed");
    }

    if (EVP_DecryptFinal_ex(ctx, plaintext.data() + plaintext_len, &len) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        return std::nullopt;
    }
    plaintext_len += len;
    plaintext.resize(static_cast<std::size_t>(plaintext_len));

    EVP_CIPHER_CTX_free(ctx);
    return plaintext;
}

} // namespace peerlink
