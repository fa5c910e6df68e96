// include/pushgate/payload.hpp
// Notification payload builders: write JSON bytes directly, no DOM allocation.

#pragma once

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

namespace pushgate {

// Pre-serialized JSON object fields.
//
// Writes JSON bytes directly into a buffer, skipping any intermediate
// JSON DOM. Each string value is safely escaped.
//
// Example:
//   auto fields = Fields().add("thread", "inbox").add("unread", 3);
class Fields {
public:
    Fields() { buf_.reserve(128); }

    Fields& add(const std::string& key, const std::string& value) {
        begin_field(key);
        write_string(value.data(), value.size());
        return *this;
    }

    Fields& add(const std::string& key, const char* value) {
        begin_field(key);
        write_string(value, std::strlen(value));
        return *this;
    }

    Fields& add(const std::string& key, int64_t value) {
        begin_field(key);
        char tmp[24];
        int n = std::snprintf(tmp, sizeof(tmp), "%lld", static_cast<long long>(value));
        if (n > 0) buf_.insert(buf_.end(), tmp, tmp + n);
        return *this;
    }

    Fields& add(const std::string& key, int value) {
        begin_field(key);
        char tmp[16];
        int n = std::snprintf(tmp, sizeof(tmp), "%d", value);
        if (n > 0) buf_.insert(buf_.end(), tmp, tmp + n);
        return *this;
    }

    Fields& add(const std::string& key, double value) {
        begin_field(key);
        char tmp[64];
        int n = std::snprintf(tmp, sizeof(tmp), "%g", value);
        if (n > 0) buf_.insert(buf_.end(), tmp, tmp + n);
        return *this;
    }

    Fields& add(const std::string& key, bool value) {
        begin_field(key);
        const char* lit = value ? "true" : "false";
        buf_.insert(buf_.end(), lit, lit + (value ? 4 : 5));
        return *this;
    }

    // Array of strings, e.g. localization arguments.
    Fields& add(const std::string& key, const std::vector<std::string>& values) {
        begin_field(key);
        buf_.push_back('[');
        for (size_t i = 0; i < values.size(); i++) {
            if (i > 0) buf_.push_back(',');
            write_string(values[i].data(), values[i].size());
        }
        buf_.push_back(']');
        return *this;
    }

    // Nested object.
    Fields& add(const std::string& key, const Fields& nested) {
        begin_field(key);
        auto json = nested.to_json_bytes();
        buf_.insert(buf_.end(), json.begin(), json.end());
        return *this;
    }

    // Finish building and return the JSON bytes as "{...}".
    std::vector<uint8_t> to_json_bytes() const {
        std::vector<uint8_t> result;
        result.reserve(buf_.size() + 2);
        result.push_back('{');
        result.insert(result.end(), buf_.begin(), buf_.end());
        result.push_back('}');
        return result;
    }

    bool empty() const noexcept { return count_ == 0; }
    size_t size() const noexcept { return count_; }

    // Access raw inner bytes (without braces), for merging.
    const std::vector<uint8_t>& raw() const noexcept { return buf_; }

private:
    std::vector<uint8_t> buf_;
    size_t count_ = 0;

    void begin_field(const std::string& key) {
        if (count_ > 0) buf_.push_back(',');
        write_string(key.data(), key.size());
        buf_.push_back(':');
        count_++;
    }

    static bool needs_escape(char c) {
        return c == '"' || c == '\\' || static_cast<unsigned char>(c) < 0x20;
    }

    void write_string(const char* s, size_t len) {
        buf_.push_back('"');
        size_t i = 0;
        while (i < len) {
            size_t run_start = i;
            while (i < len && !needs_escape(s[i])) ++i;

            if (i > run_start) {
                buf_.insert(buf_.end(),
                    reinterpret_cast<const uint8_t*>(s + run_start),
                    reinterpret_cast<const uint8_t*>(s + i));
            }

            if (i < len) {
                char c = s[i];
                switch (c) {
                    case '"':  buf_.push_back('\\'); buf_.push_back('"'); break;
                    case '\\': buf_.push_back('\\'); buf_.push_back('\\'); break;
                    case '\b': buf_.push_back('\\'); buf_.push_back('b'); break;
                    case '\f': buf_.push_back('\\'); buf_.push_back('f'); break;
                    case '\n': buf_.push_back('\\'); buf_.push_back('n'); break;
                    case '\r': buf_.push_back('\\'); buf_.push_back('r'); break;
                    case '\t': buf_.push_back('\\'); buf_.push_back('t'); break;
                    default: {
                        char hex[7];
                        std::snprintf(hex, sizeof(hex), "\\u%04x", static_cast<unsigned char>(c));
                        buf_.insert(buf_.end(), hex, hex + 6);
                        break;
                    }
                }
                ++i;
            }
        }
        buf_.push_back('"');
    }
};

// Localized alert dictionary. Empty members are omitted from the JSON.
struct Alert {
    std::string body;
    std::string action_loc_key;
    std::string loc_key;
    std::vector<std::string> loc_args;
    std::string launch_image;

    Fields to_fields() const;
};

// The "aps" dictionary plus custom top-level fields.
//
// Example:
//   auto payload = Payload().alert("New message").badge(1).sound("default")
//                      .custom(Fields().add("thread", "inbox"));
class Payload {
public:
    Payload& alert(std::string text);
    Payload& alert(Alert alert);
    Payload& badge(int badge);
    Payload& sound(std::string sound);
    Payload& content_available(bool available);
    Payload& category(std::string category);
    Payload& custom(Fields fields);

    // {"aps":{...},<custom fields>}
    std::vector<uint8_t> to_json_bytes() const;

private:
    std::optional<std::string> alert_text_;
    std::optional<Alert> alert_dict_;
    std::optional<int> badge_;
    std::string sound_;
    bool content_available_ = false;
    std::string category_;
    Fields custom_;
};

} // namespace pushgate
