// include/tabvault/serialization_utils.h
#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <vector>

namespace tabvault {

uint32_t calculate_payload_checksum(const uint8_t* data, size_t len);

// --- Checksummed frames: [magic u32][length u32][crc32 u32][payload] ---

constexpr uint32_t kFrameMagic = 0x54564A31; // "TVJ1"

void WriteFrame(std::ostream& out, const std::vector<uint8_t>& payload);

enum class FrameReadStatus {
    OK,
    END_OF_STREAM,   // Clean end exactly at a frame boundary
    TRUNCATED,       // Header or payload cut short (torn write)
    CORRUPT          // Bad magic or checksum mismatch
};

/**
 * @brief Reads the next frame. The stream position after a failed read is unspecified.
 */
FrameReadStatus ReadFrame(std::istream& in, std::vector<uint8_t>& payload);

} // namespace tabvault
