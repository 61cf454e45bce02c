// @src/compression_utils.cpp
#include "tabvault/compression_utils.h"
#include "tabvault/debug_utils.h"

#include <zstd.h>
#include <lz4.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace tabvault {

std::vector<uint8_t> CompressionManager::compress(const uint8_t* uncompressed_data, size_t uncompressed_size,
                                                  CompressionType type, int level) {
    if (type == CompressionType::NONE || uncompressed_size == 0) {
        return std::vector<uint8_t>(uncompressed_data, uncompressed_data + uncompressed_size);
    }

    if (type == CompressionType::ZSTD) {
        size_t const bound = ZSTD_compressBound(uncompressed_size);
        std::vector<uint8_t> compressed(bound);
        int effective_level = (level == 0) ? ZSTD_CLEVEL_DEFAULT : level;
        size_t const written = ZSTD_compress(compressed.data(), bound, uncompressed_data, uncompressed_size,
                                             effective_level);
        if (ZSTD_isError(written)) {
            LOG_ERROR("[CompressionManager::compress] ZSTD_compress failed: {}", ZSTD_getErrorName(written));
            throw std::runtime_error(std::string("ZSTD_compress error: ") + ZSTD_getErrorName(written));
        }
        LOG_TRACE("[CompressionManager::compress] ZSTD {} -> {} bytes (level {})", uncompressed_size, written, effective_level);
        compressed.resize(written);
        return compressed;
    }

    if (type == CompressionType::LZ4) {
        if (uncompressed_size > static_cast<size_t>(LZ4_MAX_INPUT_SIZE)) {
            throw std::runtime_error("LZ4 input exceeds LZ4_MAX_INPUT_SIZE");
        }
        int const bound = LZ4_compressBound(static_cast<int>(uncompressed_size));
        if (bound <= 0) {
            throw std::runtime_error("LZ4_compressBound failed");
        }
        std::vector<uint8_t> compressed(static_cast<size_t>(bound));
        int const written = LZ4_compress_default(reinterpret_cast<const char*>(uncompressed_data),
                                                 reinterpret_cast<char*>(compressed.data()),
                                                 static_cast<int>(uncompressed_size), bound);
        if (written <= 0) {
            LOG_ERROR("[CompressionManager::compress] LZ4_compress_default failed.");
            throw std::runtime_error("LZ4_compress_default failed");
        }
        LOG_TRACE("[CompressionManager::compress] LZ4 {} -> {} bytes", uncompressed_size, written);
        compressed.resize(static_cast<size_t>(written));
        return compressed;
    }

    throw std::runtime_error("Unsupported compression type: " + std::to_string(static_cast<int>(type)));
}

std::vector<uint8_t> CompressionManager::decompress(const uint8_t* compressed_data, size_t compressed_size,
                                                    size_t uncompressed_size, CompressionType type) {
    if (type == CompressionType::NONE || compressed_size == 0) {
        return std::vector<uint8_t>(compressed_data, compressed_data + compressed_size);
    }
    if (uncompressed_size == 0) {
        throw std::runtime_error("decompress requires the original uncompressed size");
    }

    std::vector<uint8_t> output(uncompressed_size);
    if (type == CompressionType::ZSTD) {
        size_t const produced = ZSTD_decompress(output.data(), uncompressed_size, compressed_data, compressed_size);
        if (ZSTD_isError(produced)) {
            LOG_ERROR("[CompressionManager::decompress] ZSTD_decompress failed: {}", ZSTD_getErrorName(produced));
            throw std::runtime_error(std::string("ZSTD_decompress error: ") + ZSTD_getErrorName(produced));
        }
        if (produced != uncompressed_size) {
            throw std::runtime_error("ZSTD_decompress produced " + std::to_string(produced) +
                                     " bytes, expected " + std::to_string(uncompressed_size));
        }
        return output;
    }

    if (type == CompressionType::LZ4) {
        if (compressed_size > static_cast<size_t>(std::numeric_limits<int>::max()) ||
            uncompressed_size > static_cast<size_t>(std::numeric_limits<int>::max())) {
            throw std::runtime_error("LZ4 block too large");
        }
        int const produced = LZ4_decompress_safe(reinterpret_cast<const char*>(compressed_data),
                                                 reinterpret_cast<char*>(output.data()),
                                                 static_cast<int>(compressed_size),
                                                 static_cast<int>(uncompressed_size));
        if (produced < 0 || static_cast<size_t>(produced) != uncompressed_size) {
            LOG_ERROR("[CompressionManager::decompress] LZ4_decompress_safe returned {}", produced);
            throw std::runtime_error("LZ4_decompress_safe failed");
        }
        return output;
    }

    throw std::runtime_error("Unsupported compression type: " + std::to_string(static_cast<int>(type)));
}

CompressionType compressionTypeFromString(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "none") return CompressionType::NONE;
    if (lowered == "lz4") return CompressionType::LZ4;
    return CompressionType::ZSTD;
}

std::string compressionTypeToString(CompressionType type) {
    switch (type) {
        case CompressionType::NONE: return "none";
        case CompressionType::ZSTD: return "zstd";
        case CompressionType::LZ4: return "lz4";
    }
    return "zstd";
}

} // namespace tabvault
