// src/certificate.cpp
// PEM parsing for the client certificate and key.

#include "certificate.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>

#include <fstream>
#include <sstream>

namespace pushgate {

namespace {

struct BioDeleter {
    void operator()(BIO* bio) const noexcept { BIO_free(bio); }
};
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

BioPtr memory_bio(const std::string& pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw PushError::certificate("BIO_new_mem_buf() failed");
    }
    return bio;
}

std::string read_file(const std::string& path, const char* what) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        throw PushError::certificate(std::string("cannot open ") + what + " file: " + path);
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        throw PushError::certificate(std::string("cannot read ") + what + " file: " + path);
    }
    return contents.str();
}

} // namespace

std::string openssl_error_string() {
    std::string result;
    unsigned long code;
    while ((code = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!result.empty()) result += "; ";
        result += buf;
    }
    return result.empty() ? "unknown OpenSSL error" : result;
}

Certificate Certificate::from_pem(const std::string& certificate_pem, const std::string& key_pem) {
    if (certificate_pem.empty()) {
        throw PushError::certificate("no certificate PEM block");
    }
    if (key_pem.empty()) {
        throw PushError::certificate("no private key PEM block");
    }

    ERR_clear_error();
    Certificate cert;

    auto cert_bio = memory_bio(certificate_pem);
    cert.leaf_.reset(PEM_read_bio_X509(cert_bio.get(), nullptr, nullptr, nullptr));
    if (!cert.leaf_) {
        throw PushError::certificate("failed to parse certificate: " + openssl_error_string());
    }

    // Any further certificates in the block form the chain.
    while (X509* extra = PEM_read_bio_X509(cert_bio.get(), nullptr, nullptr, nullptr)) {
        cert.chain_.emplace_back(extra);
    }
    ERR_clear_error(); // end-of-input "no start line" after the last certificate

    auto key_bio = memory_bio(key_pem);
    cert.key_.reset(PEM_read_bio_PrivateKey(key_bio.get(), nullptr, nullptr, nullptr));
    if (!cert.key_) {
        throw PushError::certificate("failed to parse private key: " + openssl_error_string());
    }

    if (X509_check_private_key(cert.leaf_.get(), cert.key_.get()) != 1) {
        throw PushError::certificate("private key does not match certificate: " +
                                     openssl_error_string());
    }

    return cert;
}

Certificate Certificate::from_files(const std::string& certificate_file, const std::string& key_file) {
    return from_pem(read_file(certificate_file, "certificate"), read_file(key_file, "key"));
}

Certificate Certificate::load(const ClientConfig& config) {
    if (config.certificate_pem().empty() && config.key_pem().empty()) {
        if (config.certificate_file().empty() || config.key_file().empty()) {
            throw PushError::certificate("no certificate configured");
        }
        return from_files(config.certificate_file(), config.key_file());
    }
    return from_pem(config.certificate_pem(), config.key_pem());
}

} // namespace pushgate
