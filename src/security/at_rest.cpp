/*
 * PeerLink - at-rest encryption implementation
 */

#include "at_rest.hpp"

#include "crypto.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>

#include <libsecret/secret.h>
#include <unistd.h>

namespace peerlink {

namespace {
constexpr const char* kKeyFileName = "at_rest.key";
constexpr const char* kSecretName = "peerlink-at-rest";
constexpr const char* kSecretLabel = "PeerLink at-rest encryption key";

const SecretSchema& at_rest_schema() {
    static const SecretSchema kSchema = {"org.peerlink.AtRestKey",
                                         SECRET_SCHEMA_NONE,
                                         {{"name", SECRET_SCHEMA_ATTRIBUTE_STRING},
                                          {"uid", SECRET_SCHEMA_ATTRIBUTE_STRING},
                                          {"account", SECRET_SCHEMA_ATTRIBUTE_STRING},
                                          {nullptr, SECRET_SCHEMA_ATTRIBUTE_STRING}}};
    return kSchema;
}

std::string current_uid() {
    return std::to_string(static_cast<unsigned long>(::getuid()));
}

// Turns a GError from a libsecret call into a KeyStoreFailure.
void throw_if_failed(GError* error, const std::string& what) {
    if (!error) {
        return;
    }
    std::string message = what + ": " + (error->message ? error->message : "secret service error");
    g_error_free(error);
    throw PeerLinkError(ErrorKind::KeyStoreFailure, message);
}

std::vector<uint8_t> container_header() {
    std::vector<uint8_t> header(std::begin(kContainerMagic), std::end(kContainerMagic));
    header.push_back(kContainerVersion);
    return header;
}
} // namespace

SecretServiceKeyStore::SecretServiceKeyStore(std::string account) : account_(std::move(account)) {}

std::optional<std::vector<uint8_t>> SecretServiceKeyStore::load_key() {
    GError* error = nullptr;
    const std::string uid = current_uid();
    gchar* secret = secret_password_lookup_sync(&at_rest_schema(), nullptr, &error, "name", kSecretName, "uid",
                                                uid.c_str(), "account", account_.c_str(), nullptr);
    throw_if_failed(error, "Secret service lookup failed");
    if (!secret) {
        return std::nullopt;
    }
    auto key = hex_decode(secret);
    secret_password_free(secret);
    if (!key || key->size() != kAes256KeySize) {
        throw PeerLinkError(ErrorKind::KeyStoreFailure, "Secret service holds a malformed at-rest key");
    }
    return key;
}

void SecretServiceKeyStore::store_key(const std::vector<uint8_t>& key) {
    GError* error = nullptr;
    const std::string uid = current_uid();
    const std::string hex = hex_encode(key);
    const gboolean stored =
        secret_password_store_sync(&at_rest_schema(), SECRET_COLLECTION_DEFAULT, kSecretLabel, hex.c_str(), nullptr,
                                   &error, "name", kSecretName, "uid", uid.c_str(), "account", account_.c_str(),
                                   nullptr);
    throw_if_failed(error, "Secret service store failed");
    if (!stored) {
        throw PeerLinkError(ErrorKind::KeyStoreFailure, "Secret service refused the at-rest key");
    }
}

bool SecretServiceKeyStore::remove_key() {
    GError* error = nullptr;
    const std::string uid = current_uid();
    const gboolean removed = secret_password_clear_sync(&at_rest_schema(), nullptr, &error, "name", kSecretName,
                                                        "uid", uid.c_str(), "account", account_.c_str(), nullptr);
    throw_if_failed(error, "Secret service removal failed");
    return removed != FALSE;
}

FileKeyStore::FileKeyStore(std::filesystem::path directory)
    : directory_(std::move(directory)), key_path_(directory_ / kKeyFileName) {}

std::optional<std::vector<uint8_t>> FileKeyStore::load_key() {
    std::error_code ec;
    if (!std::filesystem::exists(key_path_, ec)) {
        return std::nullopt;
    }
    auto bytes = read_file_bytes(key_path_);
    if (!bytes) {
        throw PeerLinkError(ErrorKind::KeyStoreFailure,
                            "Failed to read key file " + key_path_.string());
    }
    if (bytes->size() != kAes256KeySize) {
        throw PeerLinkError(ErrorKind::KeyStoreFailure,
                            "Key file " + key_path_.string() + " has unexpected length");
    }
    return bytes;
}

void FileKeyStore::store_key(const std::vector<uint8_t>& key) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw PeerLinkError(ErrorKind::KeyStoreFailure,
                            "Failed to create key directory: " + ec.message());
    }
    std::filesystem::permissions(directory_, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        throw PeerLinkError(ErrorKind::KeyStoreFailure,
                            "Failed to restrict key directory: " + ec.message());
    }
    if (!atomic_write_file(key_path_, key, ec)) {
        throw PeerLinkError(ErrorKind::KeyStoreFailure, "Failed to write key file: " + ec.message());
    }
}

bool FileKeyStore::remove_key() {
    std::error_code ec;
    const bool removed = std::filesystem::remove(key_path_, ec);
    if (ec) {
        throw PeerLinkError(ErrorKind::KeyStoreFailure, "Failed to remove key file: " + ec.message());
    }
    return removed;
}

std::optional<std::vector<uint8_t>> MemoryKeyStore::load_key() {
    std::lock_guard<std::mutex> lock(mutex_);
    return key_;
}

void MemoryKeyStore::store_key(const std::vector<uint8_t>& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    key_ = key;
    ++store_count_;
}

AtRestEncryptor::AtRestEncryptor(std::shared_ptr<KeyStore> key_store)
    : key_store_(std::move(key_store)) {
    if (!key_store_) {
        throw std::invalid_argument("AtRestEncryptor requires a key store");
    }
}

std::vector<uint8_t> AtRestEncryptor::get_or_create_key() {
    std::lock_guard<std::mutex> lock(key_mutex_);
    if (cached_key_) {
        return *cached_key_;
    }
    auto stored = key_store_->load_key();
    if (stored) {
        cached_key_ = std::move(stored);
        return *cached_key_;
    }
    auto key = random_bytes(kAes256KeySize);
    key_store_->store_key(key);
    log_info("Created at-rest encryption key");
    cached_key_ = key;
    return key;
}

std::vector<uint8_t> AtRestEncryptor::encrypt(const std::vector<uint8_t>& plaintext) {
    const auto key = get_or_create_key();
    const auto header = container_header();
    Ciphertext sealed = aes256_gcm_encrypt(key, plaintext, header);

    std::vector<uint8_t> container;
    container.reserve(kContainerOverhead + sealed.data.size());
    container.insert(container.end(), header.begin(), header.end());
    container.insert(container.end(), sealed.nonce.begin(), sealed.nonce.end());
    container.insert(container.end(), sealed.data.begin(), sealed.data.end());
    container.insert(container.end(), sealed.tag.begin(), sealed.tag.end());
    return container;
}

std::vector<uint8_t> AtRestEncryptor::decrypt(const std::vector<uint8_t>& container) {
    if (!is_encrypted(container)) {
        throw PeerLinkError(ErrorKind::InvalidFormat);
    }
    const auto header = container_header();

    Ciphertext sealed;
    auto nonce_begin = container.begin() + kContainerHeaderSize;
    auto data_begin = nonce_begin + kGcmNonceSize;
    auto tag_begin = container.end() - kGcmTagSize;
    sealed.nonce.assign(nonce_begin, data_begin);
    sealed.data.assign(data_begin, tag_begin);
    sealed.tag.assign(tag_begin, container.end());

    const auto key = get_or_create_key();
    auto plaintext = aes256_gcm_decrypt(key, sealed, header);
    if (!plaintext) {
        throw PeerLinkError(ErrorKind::AuthenticationFailure);
    }
    return std::move(*plaintext);
}

bool AtRestEncryptor::is_encrypted(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < kContainerOverhead) {
        return false;
    }
    return std::equal(std::begin(kContainerMagic), std::end(kContainerMagic), bytes.begin()) &&
           bytes[4] == kContainerVersion;
}

void AtRestEncryptor::encrypt_and_write(const std::filesystem::path& path,
                                        const std::vector<uint8_t>& plaintext) {
    auto container = encrypt(plaintext);
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    if (!atomic_write_file(path, container, ec)) {
        throw PeerLinkError(ErrorKind::IoFailure,
                            "Failed to write " + path.string() + ": " + ec.message());
    }
}

std::vector<uint8_t> AtRestEncryptor::read_and_decrypt(const std::filesystem::path& path) {
    auto bytes = read_file_bytes(path);
    if (!bytes) {
        throw PeerLinkError(ErrorKind::IoFailure, "Failed to read " + path.string());
    }
    return decrypt(*bytes);
}

bool AtRestEncryptor::migrate_file_if_needed(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return false;
    }
    auto bytes = read_file_bytes(path);
    if (!bytes) {
        throw PeerLinkError(ErrorKind::IoFailure, "Failed to read " + path.string());
    }
    if (is_encrypted(*bytes)) {
        return false;
    }
    encrypt_and_write(path, *bytes);
    log_info("Migrated plaintext file to encrypted storage: " + path.filename().string());
    return true;
}

} // namespace peerlink
