// src/payload.cpp
// Payload and alert JSON assembly.

#include "pushgate/payload.hpp"

namespace pushgate {

Fields Alert::to_fields() const {
    Fields f;
    if (!body.empty()) f.add("body", body);
    if (!action_loc_key.empty()) f.add("action-loc-key", action_loc_key);
    if (!loc_key.empty()) f.add("loc-key", loc_key);
    if (!loc_args.empty()) f.add("loc-args", loc_args);
    if (!launch_image.empty()) f.add("launch-image", launch_image);
    return f;
}

Payload& Payload::alert(std::string text) {
    alert_text_ = std::move(text);
    alert_dict_.reset();
    return *this;
}

Payload& Payload::alert(Alert alert) {
    alert_dict_ = std::move(alert);
    alert_text_.reset();
    return *this;
}

Payload& Payload::badge(int badge) {
    badge_ = badge;
    return *this;
}

Payload& Payload::sound(std::string sound) {
    sound_ = std::move(sound);
    return *this;
}

Payload& Payload::content_available(bool available) {
    content_available_ = available;
    return *this;
}

Payload& Payload::category(std::string category) {
    category_ = std::move(category);
    return *this;
}

Payload& Payload::custom(Fields fields) {
    custom_ = std::move(fields);
    return *this;
}

std::vector<uint8_t> Payload::to_json_bytes() const {
    Fields aps;
    if (alert_text_) {
        aps.add("alert", *alert_text_);
    } else if (alert_dict_) {
        aps.add("alert", alert_dict_->to_fields());
    }
    if (badge_) aps.add("badge", *badge_);
    if (!sound_.empty()) aps.add("sound", sound_);
    if (content_available_) aps.add("content-available", 1);
    if (!category_.empty()) aps.add("category", category_);

    auto aps_json = aps.to_json_bytes();
    const auto& custom_raw = custom_.raw();

    static const char kApsKey[] = "{\"aps\":";
    std::vector<uint8_t> buf;
    buf.reserve(sizeof(kApsKey) + aps_json.size() + custom_raw.size() + 2);
    buf.insert(buf.end(), kApsKey, kApsKey + sizeof(kApsKey) - 1);
    buf.insert(buf.end(), aps_json.begin(), aps_json.end());
    if (!custom_raw.empty()) {
        buf.push_back(',');
        buf.insert(buf.end(), custom_raw.begin(), custom_raw.end());
    }
    buf.push_back('}');
    return buf;
}

} // namespace pushgate
