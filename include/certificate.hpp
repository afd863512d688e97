/*
 * PeerLink - ephemeral identity and fingerprints
 */

#pragma once

#include "crypto.hpp"

#include <memory>
#include <string>

typedef struct x509_st X509;

namespace peerlink {

struct X509Deleter {
    void operator()(X509* cert) const;
};

using X509Ptr = std::unique_ptr<X509, X509Deleter>;

// One P-256 key pair and a self-signed certificate over it, generated at
// construction and never written anywhere.
class CertificateManager {
public:
    CertificateManager();

    CertificateManager(const CertificateManager&) = delete;
    CertificateManager& operator=(const CertificateManager&) = delete;

    EVP_PKEY* private_key() const { return key_.get(); }
    X509* certificate() const { return certificate_.get(); }

    // Lowercase hex SHA-256 of the uncompressed public point.
    const std::string& fingerprint() const { return fingerprint_; }
    const std::string& common_name() const { return common_name_; }

private:
    PKeyPtr key_;
    X509Ptr certificate_;
    std::string fingerprint_;
    std::string common_name_;
};

std::string fingerprint_of_public_key(EVP_PKEY* key);

std::string fingerprint_of_certificate(X509* certificate);

std::string normalize_fingerprint(const std::string& fingerprint);

bool fingerprints_equal(const std::string& a, const std::string& b);

// 64 hex digits, either case.
bool is_valid_fingerprint(const std::string& fingerprint);

// "ab12 cd34 ..." grouping for reading a fingerprint aloud.
std::string format_fingerprint(const std::string& fingerprint);

} // namespace peerlink
