/*
 * PeerLink - ephemeral identity and fingerprints implementation
 */

#include "certificate.hpp"

#include "utils.hpp"

#include <cctype>
#include <stdexcept>

#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/x509.h>

namespace peerlink {

namespace {
constexpr long kValiditySeconds = 365L * 24 * 60 * 60;

void set_random_serial(X509* certificate) {
    BIGNUM* serial = BN_new();
    if (!serial) {
        throw std::runtime_error("BN_new failed");
    }
    if (BN_rand(serial, 63, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) != 1 ||
        !BN_to_ASN1_INTEGER(serial, X509_get_serialNumber(certificate))) {
        BN_free(serial);
        throw std::runtime_error("Failed to set certificate serial");
    }
    BN_free(serial);
}
} // namespace

void X509Deleter::operator()(X509* cert) const {
    X509_free(cert);
}

CertificateManager::CertificateManager() : key_(generate_p256_keypair()) {
    fingerprint_ = fingerprint_of_public_key(key_.get());
    common_name_ = "peerlink-" + random_uuid();

    X509Ptr certificate(X509_new());
    if (!certificate) {
        throw std::runtime_error("X509_new failed");
    }
    X509* cert = certificate.get();

    if (X509_set_version(cert, 2) != 1) {
        throw std::runtime_error("X509_set_version failed");
    }
    set_random_serial(cert);
    if (!X509_gmtime_adj(X509_getm_notBefore(cert), -60) ||
        !X509_gmtime_adj(X509_getm_notAfter(cert), kValiditySeconds)) {
        throw std::runtime_error("Failed to set certificate validity");
    }
    if (X509_set_pubkey(cert, key_.get()) != 1) {
        throw std::runtime_error("X509_set_pubkey failed");
    }

    X509_NAME* name = X509_get_subject_name(cert);
    if (X509_NAME_add_entry_by_txt(name,
                                   "CN",
                                   MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>(common_name_.c_str()),
                                   -1,
                                   -1,
                                   0) != 1 ||
        X509_set_issuer_name(cert, name) != 1) {
        throw std::runtime_error("Failed to set certificate subject");
    }

    if (X509_sign(cert, key_.get(), EVP_sha256()) <= 0) {
        throw std::runtime_error("X509_sign failed");
    }

    certificate_ = std::move(certificate);
    log_debug("Generated ephemeral identity " + common_name_);
}

std::string fingerprint_of_public_key(EVP_PKEY* key) {
    return hex_encode(sha256(encoded_public_key(key)));
}

std::string fingerprint_of_certificate(X509* certificate) {
    if (!certificate) {
        throw std::invalid_argument("fingerprint_of_certificate: null certificate");
    }
    EVP_PKEY* key = X509_get0_pubkey(certificate);
    if (!key) {
        throw std::runtime_error("Certificate carries no usable public key");
    }
    return fingerprint_of_public_key(key);
}

std::string normalize_fingerprint(const std::string& fingerprint) {
    return to_lower(trim(fingerprint));
}

bool fingerprints_equal(const std::string& a, const std::string& b) {
    return normalize_fingerprint(a) == normalize_fingerprint(b);
}

bool is_valid_fingerprint(const std::string& fingerprint) {
    if (fingerprint.size() != kSha256Size * 2) {
        return false;
    }
    for (char ch : fingerprint) {
        if (!std::isxdigit(static_cast<unsigned char>(ch))) {
            return false;
        }
    }
    return true;
}

std::string format_fingerprint(const std::string& fingerprint) {
    const std::string normalized = normalize_fingerprint(fingerprint);
    std::string out;
    for (std::size_t i = 0; i < normalized.size(); ++i) {
        if (i > 0 && i % 4 == 0) {
            out.push_back(' ');
        }
        out.push_back(normalized[i]);
    }
    return out;
}

} // namespace peerlink
