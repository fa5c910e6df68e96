// src/validation.hpp
// Internal input validation functions.

#pragma once

#include "pushgate/error.hpp"
#include "pushgate/types.hpp"
#include <array>
#include <cstdint>
#include <string>

namespace pushgate {
namespace validation {

struct GatewayAddress {
    std::string host;
    uint16_t port = 0;
};

// Split a "host:port" gateway address. An IPv6 host is written in
// brackets ("[::1]:2195") and returned without them.
// Throws PushError (Configuration).
inline GatewayAddress parse_gateway(const std::string& gateway) {
    std::string host;
    std::string port_str;
    if (!gateway.empty() && gateway[0] == '[') {
        auto close = gateway.find(']');
        if (close == std::string::npos || close == 1 || close + 1 >= gateway.size() ||
            gateway[close + 1] != ':') {
            throw PushError::configuration("gateway must be [ipv6]:port, got: " + gateway);
        }
        host = gateway.substr(1, close - 1);
        port_str = gateway.substr(close + 2);
    } else {
        auto colon = gateway.rfind(':');
        if (colon == std::string::npos || colon == 0) {
            throw PushError::configuration("gateway must be host:port, got: " + gateway);
        }
        host = gateway.substr(0, colon);
        if (host.find(':') != std::string::npos) {
            throw PushError::configuration("IPv6 gateway host must be in brackets, got: " + gateway);
        }
        port_str = gateway.substr(colon + 1);
    }

    if (port_str.empty() || port_str.size() > 5) {
        throw PushError::configuration("gateway port is not a valid number: " + gateway);
    }
    int port_int = 0;
    for (char c : port_str) {
        if (c < '0' || c > '9') {
            throw PushError::configuration("gateway port is not a valid number: " + gateway);
        }
        port_int = port_int * 10 + (c - '0');
    }
    if (port_int <= 0 || port_int > 65535) {
        throw PushError::configuration("gateway port must be 1-65535, got: " + std::to_string(port_int));
    }

    GatewayAddress addr;
    addr.host = std::move(host);
    addr.port = static_cast<uint16_t>(port_int);
    return addr;
}

// Decode a 64-character hex device token to 32 bytes.
// Returns false on a wrong length or a non-hex character.
inline bool decode_device_token(const std::string& token,
                                std::array<uint8_t, kDeviceTokenLength>& out) {
    if (token.size() != kDeviceTokenLength * 2) return false;

    auto hex_val = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    for (size_t i = 0; i < kDeviceTokenLength; i++) {
        int hi = hex_val(token[i * 2]);
        int lo = hex_val(token[i * 2 + 1]);
        if (hi < 0 || lo < 0) return false;
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return true;
}

} // namespace validation
} // namespace pushgate
