// src/client.cpp
// Client facade over the delivery engine and TLS dialer.

#include "pushgate/client.hpp"
#include "engine.hpp"
#include "transport.hpp"

namespace pushgate {

struct Client::Inner {
    std::unique_ptr<DeliveryEngine> engine;
};

Client::Client() : inner_(std::make_unique<Inner>()) {}

Client::~Client() = default;
Client::Client(Client&&) noexcept = default;
Client& Client::operator=(Client&&) noexcept = default;

std::unique_ptr<Client> Client::create(ClientConfig config) {
    auto dialer = std::make_shared<TlsDialer>(config);
    std::unique_ptr<Client> client(new Client());
    client->inner_->engine = std::make_unique<DeliveryEngine>(std::move(config), std::move(dialer));
    return client;
}

void Client::send(std::shared_ptr<Notification> notification) {
    inner_->engine->send(std::move(notification));
}

void Client::connect() {
    inner_->engine->connect();
}

void Client::close() {
    inner_->engine->close();
}

bool Client::running() const {
    return inner_->engine->running();
}

} // namespace pushgate
