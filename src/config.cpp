// src/config.cpp
// Configuration builder and presets.

#include "pushgate/config.hpp"
#include "validation.hpp"

namespace pushgate {

// --- ClientConfig presets ---

ClientConfigBuilder ClientConfig::builder(const std::string& gateway) {
    return ClientConfigBuilder(gateway);
}

ClientConfig ClientConfig::production(const std::string& certificate_file,
                                      const std::string& key_file) {
    return ClientConfig::builder(kProductionGateway)
        .certificate_files(certificate_file, key_file)
        .build();
}

ClientConfig ClientConfig::sandbox(const std::string& certificate_file,
                                   const std::string& key_file) {
    return ClientConfig::builder(kSandboxGateway)
        .certificate_files(certificate_file, key_file)
        .build();
}

std::string ClientConfig::gateway_host() const {
    return validation::parse_gateway(gateway_).host;
}

// --- ClientConfigBuilder ---

ClientConfigBuilder::ClientConfigBuilder(const std::string& gateway) {
    config_.gateway_ = gateway;
}

ClientConfigBuilder& ClientConfigBuilder::certificate_files(std::string certificate_file,
                                                            std::string key_file) {
    config_.certificate_file_ = std::move(certificate_file);
    config_.key_file_ = std::move(key_file);
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::certificate_pem(std::string certificate_pem,
                                                          std::string key_pem) {
    config_.certificate_pem_ = std::move(certificate_pem);
    config_.key_pem_ = std::move(key_pem);
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::ca_file(std::string ca_file) {
    config_.ca_file_ = std::move(ca_file);
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::replay_capacity(size_t capacity) {
    config_.replay_capacity_ = capacity;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::sequence_bound(int32_t bound) {
    config_.sequence_bound_ = bound;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::network_timeout(std::chrono::milliseconds timeout) {
    config_.network_timeout_ = timeout;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::report_queue_size(size_t size) {
    config_.report_queue_size_ = size;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::on_failure(ClientConfig::FailureCallback callback) {
    config_.on_failure_ = std::move(callback);
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::logger(std::shared_ptr<spdlog::logger> logger) {
    config_.logger_ = std::move(logger);
    return *this;
}

ClientConfig ClientConfigBuilder::build() const {
    validation::parse_gateway(config_.gateway_);

    if (config_.replay_capacity_ == 0) {
        throw PushError::configuration("replay capacity must be positive");
    }
    if (config_.sequence_bound_ <= 0 ||
        config_.replay_capacity_ >= static_cast<size_t>(config_.sequence_bound_)) {
        throw PushError::configuration("replay capacity " +
            std::to_string(config_.replay_capacity_) +
            " must be less than the sequence bound " +
            std::to_string(config_.sequence_bound_));
    }
    if (config_.network_timeout_.count() <= 0) {
        throw PushError::configuration("network timeout must be positive");
    }
    if (config_.report_queue_size_ == 0) {
        throw PushError::configuration("report queue size must be positive");
    }
    if (config_.certificate_file_.empty() != config_.key_file_.empty()) {
        throw PushError::configuration("certificate file and key file must be set together");
    }
    if (config_.certificate_pem_.empty() != config_.key_pem_.empty()) {
        throw PushError::configuration("certificate PEM and key PEM must be set together");
    }

    return config_;
}

} // namespace pushgate
