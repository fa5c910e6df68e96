// src/connection.hpp
// Gateway connection and dialer interfaces.

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

namespace pushgate {

// One live, encrypted stream to the gateway.
//
// write_all is called by the sender and read_exact by the connection's
// error-frame reader, possibly at the same time. close may be called from
// any thread, is idempotent, and makes a blocked read_exact return false.
class Connection {
public:
    virtual ~Connection() = default;

    // Write every byte before the write deadline. False on error or timeout.
    virtual bool write_all(const uint8_t* data, size_t len) = 0;

    // Block until exactly len bytes are read. False on error, peer close or local close.
    virtual bool read_exact(uint8_t* buf, size_t len) = 0;

    virtual void close() = 0;
};

// Opens connections to the configured gateway.
class Dialer {
public:
    virtual ~Dialer() = default;

    // Throws PushError (Certificate or Connect). Never returns nullptr.
    virtual std::shared_ptr<Connection> dial() = 0;
};

} // namespace pushgate
