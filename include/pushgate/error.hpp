// include/pushgate/error.hpp
// Single error class with a kind enum for every failure the client surfaces.

#pragma once

#include <stdexcept>
#include <string>

namespace pushgate {

enum class ErrorKind {
    Configuration,  // Invalid config at construction
    NotRunning,     // Client already closed
    Certificate,    // Missing or unparseable key material
    Connect,        // Dial or TLS handshake failure
    Write,          // Socket write failure or deadline exceeded
    Serialization   // Notification could not be encoded
};

class PushError : public std::exception {
public:
    PushError(ErrorKind kind, std::string message)
        : kind_(kind), message_(std::move(message)) {}

    const char* what() const noexcept override { return message_.c_str(); }
    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }

    static PushError configuration(std::string msg) {
        return PushError(ErrorKind::Configuration, "configuration error: " + msg);
    }

    static PushError not_running() {
        return PushError(ErrorKind::NotRunning, "client is not running");
    }

    static PushError certificate(std::string msg) {
        return PushError(ErrorKind::Certificate, "certificate error: " + msg);
    }

    static PushError connect(std::string msg) {
        return PushError(ErrorKind::Connect, "connect error: " + msg);
    }

    static PushError write(std::string msg) {
        return PushError(ErrorKind::Write, "write error: " + msg);
    }

    static PushError serialization(std::string msg) {
        return PushError(ErrorKind::Serialization, "serialization error: " + msg);
    }

private:
    ErrorKind kind_;
    std::string message_;
};

} // namespace pushgate
