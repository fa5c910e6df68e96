// src/encoding.hpp
// Big-endian frame encoding and error-response frame parsing.

#pragma once

#include "pushgate/types.hpp"
#include <cstdint>
#include <cstring>
#include <vector>

namespace pushgate {
namespace encoding {

// Item identifiers inside a command-2 frame.
static constexpr uint8_t ITEM_DEVICE_TOKEN = 1;
static constexpr uint8_t ITEM_PAYLOAD      = 2;
static constexpr uint8_t ITEM_IDENTIFIER   = 3;
static constexpr uint8_t ITEM_EXPIRY       = 4;
static constexpr uint8_t ITEM_PRIORITY     = 5;

// command(1) + frame length(4)
static constexpr size_t FRAME_HEADER_LENGTH = 5;

// item id(1) + item length(2)
static constexpr size_t ITEM_HEADER_LENGTH = 3;

inline void write_u8(std::vector<uint8_t>& buf, uint8_t value) {
    buf.push_back(value);
}

inline void write_u16_be(std::vector<uint8_t>& buf, uint16_t value) {
    buf.push_back(static_cast<uint8_t>(value >> 8));
    buf.push_back(static_cast<uint8_t>(value));
}

inline void write_u32_be(std::vector<uint8_t>& buf, uint32_t value) {
    buf.push_back(static_cast<uint8_t>(value >> 24));
    buf.push_back(static_cast<uint8_t>(value >> 16));
    buf.push_back(static_cast<uint8_t>(value >> 8));
    buf.push_back(static_cast<uint8_t>(value));
}

inline void patch_u32_be(std::vector<uint8_t>& buf, size_t pos, uint32_t value) {
    buf[pos]     = static_cast<uint8_t>(value >> 24);
    buf[pos + 1] = static_cast<uint8_t>(value >> 16);
    buf[pos + 2] = static_cast<uint8_t>(value >> 8);
    buf[pos + 3] = static_cast<uint8_t>(value);
}

inline uint32_t read_u32_be(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

// Write [u8 id][u16 BE length][data].
inline void write_item(std::vector<uint8_t>& buf, uint8_t id, const uint8_t* data, size_t len) {
    write_u8(buf, id);
    write_u16_be(buf, static_cast<uint16_t>(len));
    if (data && len > 0) buf.insert(buf.end(), data, data + len);
}

// Begin a frame and return the position of its length field.
inline size_t begin_frame(std::vector<uint8_t>& buf, uint8_t command) {
    write_u8(buf, command);
    size_t length_pos = buf.size();
    write_u32_be(buf, 0); // patched by end_frame
    return length_pos;
}

inline void end_frame(std::vector<uint8_t>& buf, size_t length_pos) {
    patch_u32_be(buf, length_pos, static_cast<uint32_t>(buf.size() - length_pos - 4));
}

// Decode a 6-byte error-response frame. The caller checks command and status.
inline FailureReport decode_error_response(const uint8_t frame[kErrorResponseLength]) {
    FailureReport report;
    report.command = frame[0];
    report.status = frame[1];
    report.identifier = static_cast<int32_t>(read_u32_be(frame + 2));
    return report;
}

} // namespace encoding
} // namespace pushgate
