// include/pushgate/types.hpp
// Wire constants, gateway status codes and failure records.

#pragma once

#include "notification.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace pushgate {

// Command byte of a notification frame.
static constexpr uint8_t kPushCommand = 2;

// Command byte of the gateway's error-response frame.
static constexpr uint8_t kErrorResponseCommand = 8;

// Error-response frame: command(1) + status(1) + identifier(4, big-endian).
static constexpr size_t kErrorResponseLength = 6;

static constexpr size_t kMaxPayloadSize = 2048;
static constexpr size_t kDeviceTokenLength = 32;

// Status codes carried by an error-response frame.
enum class ResponseStatus : uint8_t {
    NoErrors           = 0,
    ProcessingError    = 1,
    MissingDeviceToken = 2,
    MissingTopic       = 3,
    MissingPayload     = 4,
    InvalidTokenSize   = 5,
    InvalidTopicSize   = 6,
    InvalidPayloadSize = 7,
    InvalidToken       = 8,
    Shutdown           = 10,
    Unknown            = 255,
};

// Human-readable reason for a status byte, or nullptr if the status is not known.
const char* status_reason(uint8_t status) noexcept;

// A parsed error-response frame.
struct FailureReport {
    uint8_t command = 0;
    uint8_t status = 0;
    int32_t identifier = 0;
};

// A notification that may not have been delivered.
//
// report is empty when the failure was a local connect/write error rather
// than a frame sent by the gateway.
struct DeliveryFailure {
    std::shared_ptr<Notification> notification;
    std::optional<FailureReport> report;
    std::string reason;
};

} // namespace pushgate
