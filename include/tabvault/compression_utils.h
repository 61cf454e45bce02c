// @include/tabvault/compression_utils.h
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tabvault {

enum class CompressionType : uint8_t {
    NONE = 0,
    ZSTD = 1,
    LZ4 = 2
};

class CompressionManager {
public:
    // Throws std::runtime_error on codec failure. level 0 selects the codec default.
    static std::vector<uint8_t> compress(const uint8_t* uncompressed_data, size_t uncompressed_size,
                                         CompressionType type, int level = 0);

    // uncompressed_size must be the exact original size (stored alongside the payload).
    static std::vector<uint8_t> decompress(const uint8_t* compressed_data, size_t compressed_size,
                                           size_t uncompressed_size, CompressionType type);

};

// "none", "zstd", "lz4" (case-insensitive); unknown names map to ZSTD.
CompressionType compressionTypeFromString(const std::string& name);
std::string compressionTypeToString(CompressionType type);

} // namespace tabvault
