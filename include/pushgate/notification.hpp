// include/pushgate/notification.hpp
// A single push notification and its binary frame encoding.

#pragma once

#include "error.hpp"
#include "payload.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace pushgate {

namespace detail {
struct IdentifierAccess;
}

static constexpr uint8_t kDefaultPriority = 10;

// One notification addressed to one device.
//
// The identifier is assigned by the client when the notification is sent
// and reassigned if it is re-submitted; callers only read it. Once handed
// to Client::send the object must not be sent again by the caller.
class Notification {
public:
    Notification() = default;
    Notification(std::string device_token, Payload payload)
        : device_token_(std::move(device_token)), payload_(std::move(payload)) {}

    Notification& device_token(std::string token) {
        device_token_ = std::move(token);
        return *this;
    }

    Notification& payload(Payload payload) {
        payload_ = std::move(payload);
        return *this;
    }

    // Unix seconds after which the gateway may discard the notification; 0 = never store.
    Notification& expiry(uint32_t expiry) {
        expiry_ = expiry;
        return *this;
    }

    // 10 = immediate, 5 = power-considerate.
    Notification& priority(uint8_t priority) {
        priority_ = priority;
        return *this;
    }

    const std::string& device_token() const noexcept { return device_token_; }
    const Payload& payload() const noexcept { return payload_; }
    uint32_t expiry() const noexcept { return expiry_; }
    uint8_t priority() const noexcept { return priority_; }
    int32_t identifier() const noexcept { return identifier_; }

    // Encode as a command-2 frame. Throws PushError (Serialization) on a
    // malformed device token or an oversized payload.
    std::vector<uint8_t> to_bytes() const;

private:
    friend struct detail::IdentifierAccess;

    std::string device_token_;
    Payload payload_;
    uint32_t expiry_ = 0;
    uint8_t priority_ = kDefaultPriority;
    int32_t identifier_ = 0;
};

} // namespace pushgate
