// include/pushgate/config.hpp
// Flat configuration struct with builder pattern.

#pragma once

#include "error.hpp"
#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace pushgate {

class ClientConfigBuilder;

static constexpr const char* kProductionGateway = "gateway.push.apple.com:2195";
static constexpr const char* kSandboxGateway = "gateway.sandbox.push.apple.com:2195";

// Configuration for the push client.
class ClientConfig {
public:
    using FailureCallback = std::function<void(const DeliveryFailure&)>;

    static ClientConfigBuilder builder(const std::string& gateway);

    // Presets: certificate and key loaded from PEM files.
    static ClientConfig production(const std::string& certificate_file, const std::string& key_file);
    static ClientConfig sandbox(const std::string& certificate_file, const std::string& key_file);

    const std::string& gateway() const noexcept { return gateway_; }
    const std::string& certificate_file() const noexcept { return certificate_file_; }
    const std::string& key_file() const noexcept { return key_file_; }
    const std::string& certificate_pem() const noexcept { return certificate_pem_; }
    const std::string& key_pem() const noexcept { return key_pem_; }
    const std::string& ca_file() const noexcept { return ca_file_; }
    size_t replay_capacity() const noexcept { return replay_capacity_; }
    int32_t sequence_bound() const noexcept { return sequence_bound_; }
    std::chrono::milliseconds network_timeout() const noexcept { return network_timeout_; }
    size_t report_queue_size() const noexcept { return report_queue_size_; }
    const FailureCallback& on_failure() const noexcept { return on_failure_; }
    const std::shared_ptr<spdlog::logger>& logger() const noexcept { return logger_; }

    // Host part of the gateway address, used for SNI and hostname verification.
    std::string gateway_host() const;

private:
    friend class ClientConfigBuilder;

    std::string gateway_ = kProductionGateway;
    std::string certificate_file_;
    std::string key_file_;
    std::string certificate_pem_;
    std::string key_pem_;
    std::string ca_file_;
    size_t replay_capacity_ = 10000;
    int32_t sequence_bound_ = std::numeric_limits<int32_t>::max();
    std::chrono::milliseconds network_timeout_{60000};
    size_t report_queue_size_ = 10;
    FailureCallback on_failure_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Fluent builder for ClientConfig.
class ClientConfigBuilder {
public:
    explicit ClientConfigBuilder(const std::string& gateway);

    ClientConfigBuilder& certificate_files(std::string certificate_file, std::string key_file);
    ClientConfigBuilder& certificate_pem(std::string certificate_pem, std::string key_pem);
    // Trust anchors for the gateway certificate; empty = system default store.
    ClientConfigBuilder& ca_file(std::string ca_file);
    ClientConfigBuilder& replay_capacity(size_t capacity);
    ClientConfigBuilder& sequence_bound(int32_t bound);
    ClientConfigBuilder& network_timeout(std::chrono::milliseconds timeout);
    ClientConfigBuilder& report_queue_size(size_t size);
    ClientConfigBuilder& on_failure(ClientConfig::FailureCallback callback);
    ClientConfigBuilder& logger(std::shared_ptr<spdlog::logger> logger);

    // Build the config. Throws PushError on invalid settings.
    ClientConfig build() const;

private:
    ClientConfig config_;
};

} // namespace pushgate
