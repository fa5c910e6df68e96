// src/transport.cpp
// TLS transport over POSIX sockets and OpenSSL.

#include "transport.hpp"
#include "validation.hpp"

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <climits>
#include <csignal>
#include <cstring>
#include <mutex>

// POSIX sockets
#include <sys/time.h>
#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>
#include <poll.h>

namespace pushgate {

// --- TlsConnection ---

TlsConnection::TlsConnection(int fd, SslPtr ssl, std::chrono::milliseconds write_timeout)
    : fd_(fd), ssl_(std::move(ssl)), write_timeout_(write_timeout) {}

TlsConnection::~TlsConnection() {
    close();
    ssl_.reset();
    ::close(fd_);
}

void TlsConnection::close() {
    if (closed_.exchange(true)) return;
    // Wakes a reader blocked in poll(); the descriptor stays valid until destruction.
    ::shutdown(fd_, SHUT_RDWR);
}

bool TlsConnection::wait_io(short events, int timeout_ms) const {
    struct pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = events;

    int ret;
    do {
        ret = ::poll(&pfd, 1, timeout_ms);
    } while (ret < 0 && errno == EINTR);

    if (ret <= 0) return false;
    return (pfd.revents & POLLNVAL) == 0;
}

bool TlsConnection::write_all(const uint8_t* data, size_t len) {
    auto deadline = std::chrono::steady_clock::now() + write_timeout_;

    std::lock_guard<std::mutex> lock(io_mutex_);
    size_t sent = 0;
    while (sent < len) {
        if (closed_.load()) return false;

        int chunk = static_cast<int>(std::min<size_t>(len - sent, INT_MAX));
        ERR_clear_error();
        int n = SSL_write(ssl_.get(), data + sent, chunk);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }

        short events;
        switch (SSL_get_error(ssl_.get(), n)) {
            case SSL_ERROR_WANT_WRITE: events = POLLOUT; break;
            case SSL_ERROR_WANT_READ:  events = POLLIN; break;
            default: return false;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) return false;
        if (!wait_io(events, static_cast<int>(remaining.count()))) return false;
    }
    return true;
}

bool TlsConnection::read_exact(uint8_t* buf, size_t len) {
    size_t got = 0;
    while (got < len) {
        if (closed_.load()) return false;

        short events;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            ERR_clear_error();
            int n = SSL_read(ssl_.get(), buf + got, static_cast<int>(len - got));
            if (n > 0) {
                got += static_cast<size_t>(n);
                continue;
            }
            switch (SSL_get_error(ssl_.get(), n)) {
                case SSL_ERROR_WANT_READ:  events = POLLIN; break;
                case SSL_ERROR_WANT_WRITE: events = POLLOUT; break;
                default: return false; // peer close, local shutdown or error
            }
        }

        if (!wait_io(events, -1)) return false;
    }
    return true;
}

// --- TlsDialer ---

namespace {

// A write to a socket the peer has reset raises SIGPIPE; OpenSSL's socket
// BIO cannot pass MSG_NOSIGNAL, so the signal is ignored process-wide.
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

bool is_ip_literal(const std::string& host) {
    unsigned char buf[sizeof(struct in6_addr)];
    return ::inet_pton(AF_INET, host.c_str(), buf) == 1 ||
           ::inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

// Verify the peer certificate against the gateway host. An address is
// matched against IP SANs and is not sent as SNI.
bool pin_peer_name(SSL* ssl, const std::string& host) {
    if (is_ip_literal(host)) {
        return X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl), host.c_str()) == 1;
    }
    return SSL_set_tlsext_host_name(ssl, host.c_str()) == 1 &&
           SSL_set1_host(ssl, host.c_str()) == 1;
}

} // namespace

TlsDialer::TlsDialer(ClientConfig config)
    : config_(std::move(config)), timeout_(config_.network_timeout()) {
    auto addr = validation::parse_gateway(config_.gateway());
    host_ = std::move(addr.host);
    port_ = addr.port;
    ignore_sigpipe();
}

void TlsDialer::ensure_context() {
    if (ctx_) return;

    Certificate cert = Certificate::load(config_);

    ERR_clear_error();
    SslCtxPtr ctx(SSL_CTX_new(TLS_client_method()));
    if (!ctx) {
        throw PushError::connect("SSL_CTX_new() failed: " + openssl_error_string());
    }

    SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);

    if (SSL_CTX_use_certificate(ctx.get(), cert.leaf()) != 1) {
        throw PushError::certificate("SSL_CTX_use_certificate() failed: " + openssl_error_string());
    }
    for (const auto& extra : cert.chain()) {
        if (SSL_CTX_add1_chain_cert(ctx.get(), extra.get()) != 1) {
            throw PushError::certificate("SSL_CTX_add1_chain_cert() failed: " + openssl_error_string());
        }
    }
    if (SSL_CTX_use_PrivateKey(ctx.get(), cert.key()) != 1) {
        throw PushError::certificate("SSL_CTX_use_PrivateKey() failed: " + openssl_error_string());
    }

    if (!config_.ca_file().empty()) {
        if (SSL_CTX_load_verify_locations(ctx.get(), config_.ca_file().c_str(), nullptr) != 1) {
            throw PushError::certificate("cannot load CA file " + config_.ca_file() + ": " +
                                         openssl_error_string());
        }
    } else if (SSL_CTX_set_default_verify_paths(ctx.get()) != 1) {
        throw PushError::certificate("cannot load default trust store: " + openssl_error_string());
    }
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);

    ctx_ = std::move(ctx);
}

int TlsDialer::connect_tcp() {
    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    auto port_str = std::to_string(port_);
    int err = ::getaddrinfo(host_.c_str(), port_str.c_str(), &hints, &res);
    if (err != 0 || res == nullptr) {
        throw PushError::connect("DNS resolution failed for " + host_ + ": " + ::gai_strerror(err));
    }

    // Try each resolved address (IPv6/IPv4) until one connects.
    for (struct addrinfo* rp = res; rp != nullptr; rp = rp->ai_next) {
        int fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (fd < 0) continue;

        int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
            ::close(fd);
            continue;
        }

        int ret = ::connect(fd, rp->ai_addr, rp->ai_addrlen);
        if (ret != 0) {
            if (errno != EINPROGRESS) {
                ::close(fd);
                continue;
            }

            // Wait for connection with timeout
            struct pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;
            int poll_ret = ::poll(&pfd, 1, static_cast<int>(timeout_.count()));
            if (poll_ret <= 0) {
                ::close(fd);
                continue;
            }

            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
                ::close(fd);
                continue;
            }
        }

        // Connected, back to blocking mode for the handshake
        ::fcntl(fd, F_SETFL, flags);
        ::freeaddrinfo(res);
        configure_socket(fd);
        return fd;
    }

    ::freeaddrinfo(res);
    throw PushError::connect("connect failed to " + config_.gateway());
}

void TlsDialer::configure_socket(int fd) {
    int nodelay = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

    int keepalive = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));

    // Bounds the blocking handshake.
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout_.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout_.count() % 1000) * 1000);
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

std::shared_ptr<Connection> TlsDialer::dial() {
    ensure_context();

    int fd = connect_tcp();

    ERR_clear_error();
    SslPtr ssl(SSL_new(ctx_.get()));
    if (!ssl) {
        ::close(fd);
        throw PushError::connect("SSL_new() failed: " + openssl_error_string());
    }

    if (SSL_set_fd(ssl.get(), fd) != 1 || !pin_peer_name(ssl.get(), host_)) {
        ::close(fd);
        throw PushError::connect("SSL setup failed: " + openssl_error_string());
    }

    int ret = SSL_connect(ssl.get());
    if (ret != 1) {
        int ssl_err = SSL_get_error(ssl.get(), ret);
        std::string detail = openssl_error_string();
        long verify = SSL_get_verify_result(ssl.get());
        if (verify != X509_V_OK) {
            detail = X509_verify_cert_error_string(verify);
        }
        ::close(fd);
        throw PushError::connect("TLS handshake with " + config_.gateway() + " failed (" +
                                 std::to_string(ssl_err) + "): " + detail);
    }

    // Non-blocking from here on; writes are bounded by deadline, reads by poll().
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        ::close(fd);
        throw PushError::connect("cannot make socket non-blocking: " + std::string(std::strerror(errno)));
    }

    return std::make_shared<TlsConnection>(fd, std::move(ssl), timeout_);
}

} // namespace pushgate
