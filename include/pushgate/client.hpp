// include/pushgate/client.hpp
// Push gateway client: resilient delivery over one persistent TLS connection.

#pragma once

#include "config.hpp"
#include "error.hpp"
#include "notification.hpp"
#include "types.hpp"
#include <memory>

namespace pushgate {

// The push gateway client.
//
// Created via Client::create(config). Ready to use immediately; the TLS
// connection is opened lazily by the first send. The gateway never
// acknowledges success, so failures arrive asynchronously through the
// config's on_failure callback, and notifications that may have been
// dropped after a reported failure are re-submitted automatically.
//
// Example:
//   auto client = Client::create(ClientConfig::sandbox("cert.pem", "key.pem"));
//   auto n = std::make_shared<Notification>(token, Payload().alert("Hello"));
//   client->send(n);
//   client->close();
class Client {
public:
    // Create a new client and spawn its background tasks.
    // Throws PushError on invalid configuration.
    static std::unique_ptr<Client> create(ClientConfig config);

    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    Client(Client&&) noexcept;
    Client& operator=(Client&&) noexcept;

    // Assign an identifier, encode and write the notification.
    // Throws PushError (NotRunning, Serialization, Certificate, Connect, Write).
    void send(std::shared_ptr<Notification> notification);

    // Open the gateway connection now instead of on the first send.
    void connect();

    // Stop accepting notifications and drop the connection. Idempotent.
    void close();

    bool running() const;

private:
    Client();
    struct Inner;
    std::unique_ptr<Inner> inner_;
};

} // namespace pushgate
