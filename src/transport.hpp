// src/transport.hpp
// TLS transport: TCP dial with timeout, OpenSSL handshake pinned to the gateway host.

#pragma once

#include "certificate.hpp"
#include "connection.hpp"
#include "pushgate/config.hpp"

#include <openssl/ssl.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace pushgate {

struct SslCtxDeleter {
    void operator()(SSL_CTX* ctx) const noexcept { SSL_CTX_free(ctx); }
};

struct SslDeleter {
    void operator()(SSL* ssl) const noexcept { SSL_free(ssl); }
};

using SslCtxPtr = std::unique_ptr<SSL_CTX, SslCtxDeleter>;
using SslPtr = std::unique_ptr<SSL, SslDeleter>;

// A handshaken TLS stream over a non-blocking socket.
//
// SSL calls are serialized by io_mutex_; the reader waits for readability
// without holding it so that a writer is never stuck behind an idle read.
class TlsConnection : public Connection {
public:
    TlsConnection(int fd, SslPtr ssl, std::chrono::milliseconds write_timeout);
    ~TlsConnection() override;

    TlsConnection(const TlsConnection&) = delete;
    TlsConnection& operator=(const TlsConnection&) = delete;

    bool write_all(const uint8_t* data, size_t len) override;
    bool read_exact(uint8_t* buf, size_t len) override;
    void close() override;

private:
    // poll() for events; timeout_ms < 0 waits indefinitely.
    bool wait_io(short events, int timeout_ms) const;

    int fd_;
    SslPtr ssl_;
    std::chrono::milliseconds write_timeout_;
    std::mutex io_mutex_;
    std::atomic<bool> closed_{false};
};

// Dials the configured gateway. The certificate and SSL_CTX are built on the
// first dial and cached; a failed load is retried by the next dial.
//
// Not thread-safe; the client calls dial() under its send lock.
class TlsDialer : public Dialer {
public:
    // Throws PushError (Configuration) on a malformed gateway address.
    explicit TlsDialer(ClientConfig config);

    std::shared_ptr<Connection> dial() override;

    const std::string& host() const noexcept { return host_; }
    uint16_t port() const noexcept { return port_; }

private:
    void ensure_context();
    int connect_tcp();
    void configure_socket(int fd);

    ClientConfig config_;
    std::string host_;
    uint16_t port_ = 0;
    std::chrono::milliseconds timeout_;
    SslCtxPtr ctx_;
};

} // namespace pushgate
