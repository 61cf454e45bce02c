// src/serialization_utils.cpp
#include "tabvault/serialization_utils.h"
#include "tabvault/debug_utils.h"

#include <zlib.h>
#include <stdexcept>

namespace tabvault {

namespace {

constexpr uint32_t MAX_SANE_LENGTH = 256 * 1024 * 1024;

void WriteU32(std::ostream& out, uint32_t value) {
    char bytes[4];
    for (int i = 0; i < 4; ++i) {
        bytes[i] = static_cast<char>((value >> (i * 8)) & 0xFF);
    }
    out.write(bytes, 4);
}

bool ReadU32(std::istream& in, uint32_t& value, std::streamsize& got) {
    unsigned char bytes[4];
    in.read(reinterpret_cast<char*>(bytes), 4);
    got = in.gcount();
    if (got != 4) return false;
    value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(bytes[i]) << (i * 8);
    }
    return true;
}

} // namespace

uint32_t calculate_payload_checksum(const uint8_t* data, size_t len) {
    if (data == nullptr || len == 0) {
        return 0;
    }
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, data, static_cast<uInt>(len));
    return static_cast<uint32_t>(crc);
}

void WriteFrame(std::ostream& out, const std::vector<uint8_t>& payload) {
    if (payload.size() > MAX_SANE_LENGTH) {
        throw std::overflow_error("WriteFrame: payload of " + std::to_string(payload.size()) + " bytes exceeds frame limit.");
    }
    WriteU32(out, kFrameMagic);
    WriteU32(out, static_cast<uint32_t>(payload.size()));
    WriteU32(out, calculate_payload_checksum(payload.data(), payload.size()));
    if (!payload.empty()) {
        out.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
    }
    if (!out) {
        throw std::runtime_error("WriteFrame: stream write failed.");
    }
}

FrameReadStatus ReadFrame(std::istream& in, std::vector<uint8_t>& payload) {
    uint32_t magic = 0, length = 0, expected_crc = 0;
    std::streamsize got = 0;
    if (!ReadU32(in, magic, got)) {
        return got == 0 ? FrameReadStatus::END_OF_STREAM : FrameReadStatus::TRUNCATED;
    }
    if (magic != kFrameMagic) {
        LOG_TRACE("[ReadFrame] Bad frame magic 0x{}", hex_dump_string(std::string(reinterpret_cast<const char*>(&magic), 4)));
        return FrameReadStatus::CORRUPT;
    }
    if (!ReadU32(in, length, got) || !ReadU32(in, expected_crc, got)) {
        return FrameReadStatus::TRUNCATED;
    }
    if (length > MAX_SANE_LENGTH) {
        return FrameReadStatus::CORRUPT;
    }
    payload.assign(length, 0);
    if (length > 0) {
        in.read(reinterpret_cast<char*>(payload.data()), length);
        if (static_cast<uint32_t>(in.gcount()) != length) {
            return FrameReadStatus::TRUNCATED;
        }
    }
    if (calculate_payload_checksum(payload.data(), payload.size()) != expected_crc) {
        return FrameReadStatus::CORRUPT;
    }
    return FrameReadStatus::OK;
}

} // namespace tabvault
