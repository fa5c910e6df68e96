// src/notification.cpp
// Command-2 frame encoding and the gateway status table.

#include "pushgate/notification.hpp"
#include "pushgate/error.hpp"
#include "pushgate/types.hpp"
#include "encoding.hpp"
#include "validation.hpp"

#include <array>

namespace pushgate {

std::vector<uint8_t> Notification::to_bytes() const {
    std::array<uint8_t, kDeviceTokenLength> token{};
    if (!validation::decode_device_token(device_token_, token)) {
        throw PushError::serialization("device token must be " +
            std::to_string(kDeviceTokenLength * 2) + " hex characters");
    }

    auto json = payload_.to_json_bytes();
    if (json.size() > kMaxPayloadSize) {
        throw PushError::serialization("payload is " + std::to_string(json.size()) +
            " bytes, larger than the " + std::to_string(kMaxPayloadSize) + " byte limit");
    }

    uint8_t identifier[4];
    uint8_t expiry[4];
    uint32_t id = static_cast<uint32_t>(identifier_);
    for (int i = 0; i < 4; i++) {
        identifier[i] = static_cast<uint8_t>(id >> (24 - i * 8));
        expiry[i] = static_cast<uint8_t>(expiry_ >> (24 - i * 8));
    }

    std::vector<uint8_t> buf;
    buf.reserve(encoding::FRAME_HEADER_LENGTH + 5 * encoding::ITEM_HEADER_LENGTH +
                kDeviceTokenLength + json.size() + 4 + 4 + 1);

    size_t length_pos = encoding::begin_frame(buf, kPushCommand);
    encoding::write_item(buf, encoding::ITEM_DEVICE_TOKEN, token.data(), token.size());
    encoding::write_item(buf, encoding::ITEM_PAYLOAD, json.data(), json.size());
    encoding::write_item(buf, encoding::ITEM_IDENTIFIER, identifier, sizeof(identifier));
    encoding::write_item(buf, encoding::ITEM_EXPIRY, expiry, sizeof(expiry));
    encoding::write_item(buf, encoding::ITEM_PRIORITY, &priority_, 1);
    encoding::end_frame(buf, length_pos);

    return buf;
}

const char* status_reason(uint8_t status) noexcept {
    switch (static_cast<ResponseStatus>(status)) {
        case ResponseStatus::NoErrors:           return "No errors encountered";
        case ResponseStatus::ProcessingError:    return "Processing error";
        case ResponseStatus::MissingDeviceToken: return "Missing device token";
        case ResponseStatus::MissingTopic:       return "Missing topic";
        case ResponseStatus::MissingPayload:     return "Missing payload";
        case ResponseStatus::InvalidTokenSize:   return "Invalid token size";
        case ResponseStatus::InvalidTopicSize:   return "Invalid topic size";
        case ResponseStatus::InvalidPayloadSize: return "Invalid payload size";
        case ResponseStatus::InvalidToken:       return "Invalid token";
        case ResponseStatus::Shutdown:           return "Shutdown";
        case ResponseStatus::Unknown:            return "None (unknown)";
    }
    return nullptr;
}

} // namespace pushgate
