// @include/tabvault/checksum.h
#pragma once

#include <nlohmann/json.hpp>
#include <memory>
#include <stdexcept>
#include <string>

namespace tabvault {

class ChecksumException : public std::runtime_error {
public:
    explicit ChecksumException(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Digest used for record and backup checksums.
 *
 * Crc32Checksum is the default: fast, but a 32-bit non-cryptographic digest has a
 * real collision risk and offers no tamper resistance. Use Sha256Checksum when the
 * checksum must resist deliberate modification.
 */
class ChecksumAlgorithm {
public:
    virtual ~ChecksumAlgorithm() = default;

    virtual std::string name() const = 0;
    // Lower-case hex digest of the bytes
    virtual std::string digest(const std::string& data) const = 0;

    // Digest of the canonical (sorted-key, compact) JSON rendering
    std::string digestJson(const nlohmann::json& value) const { return digest(value.dump()); }
};

class Crc32Checksum : public ChecksumAlgorithm {
public:
    std::string name() const override { return "crc32"; }
    std::string digest(const std::string& data) const override;
};

class Sha256Checksum : public ChecksumAlgorithm {
public:
    std::string name() const override { return "sha256"; }
    // Throws ChecksumException when the OpenSSL digest fails
    std::string digest(const std::string& data) const override;
};

std::shared_ptr<const ChecksumAlgorithm> makeDefaultChecksum();
// Accepts "crc32" or "sha256"; returns nullptr for anything else.
std::shared_ptr<const ChecksumAlgorithm> makeChecksum(const std::string& name);

// Random lower-case hex string from OpenSSL's CSPRNG
std::string generateRandomHex(size_t num_chars);

} // namespace tabvault
