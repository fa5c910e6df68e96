// src/certificate.hpp
// Client certificate and private key, parsed from PEM.

#pragma once

#include "pushgate/config.hpp"

#include <openssl/evp.h>
#include <openssl/x509.h>

#include <memory>
#include <string>
#include <vector>

namespace pushgate {

struct X509Deleter {
    void operator()(X509* cert) const noexcept { X509_free(cert); }
};

struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* key) const noexcept { EVP_PKEY_free(key); }
};

using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

class Certificate {
public:
    // Parse a leaf certificate (optionally followed by chain certificates)
    // and its private key. Throws PushError (Certificate).
    static Certificate from_pem(const std::string& certificate_pem, const std::string& key_pem);

    // Read both files, then parse as from_pem. Throws PushError (Certificate).
    static Certificate from_files(const std::string& certificate_file, const std::string& key_file);

    // PEM blocks from the config when present, otherwise the files.
    static Certificate load(const ClientConfig& config);

    X509* leaf() const noexcept { return leaf_.get(); }
    EVP_PKEY* key() const noexcept { return key_.get(); }
    const std::vector<X509Ptr>& chain() const noexcept { return chain_; }

private:
    Certificate() = default;

    X509Ptr leaf_;
    std::vector<X509Ptr> chain_;
    EvpPkeyPtr key_;
};

// Drain the OpenSSL error queue into one line.
std::string openssl_error_string();

} // namespace pushgate
