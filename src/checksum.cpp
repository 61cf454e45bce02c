// @src/checksum.cpp
#include "tabvault/checksum.h"
#include "tabvault/serialization_utils.h"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/err.h>

#include <iomanip>
#include <sstream>
#include <vector>

namespace tabvault {

namespace {

std::string getOpenSSLError() {
    unsigned long err_code = ERR_get_error();
    if (err_code == 0) return "No error";
    char buffer[256];
    ERR_error_string_n(err_code, buffer, sizeof(buffer));
    return std::string(buffer);
}

#define CHECK_OPENSSL_RESULT(result, operation) \
    if ((result) != 1) { \
        throw ChecksumException(std::string(operation) + " failed: " + getOpenSSLError()); \
    }

// RAII wrapper for EVP_MD_CTX
class EVPDigestCtx {
public:
    EVPDigestCtx() : ctx(EVP_MD_CTX_new()) {
        if (!ctx) throw ChecksumException("Failed to create EVP digest context");
    }
    ~EVPDigestCtx() { EVP_MD_CTX_free(ctx); }
    EVP_MD_CTX* get() const { return ctx; }
private:
    EVP_MD_CTX* ctx;
    EVPDigestCtx(const EVPDigestCtx&) = delete;
    EVPDigestCtx& operator=(const EVPDigestCtx&) = delete;
};

std::string toHex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // namespace

std::string Crc32Checksum::digest(const std::string& data) const {
    uint32_t crc = calculate_payload_checksum(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    std::ostringstream oss;
    oss << std::hex << std::setw(8) << std::setfill('0') << crc;
    return oss.str();
}

std::string Sha256Checksum::digest(const std::string& data) const {
    EVPDigestCtx ctx;
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    CHECK_OPENSSL_RESULT(EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr), "EVP_DigestInit_ex");
    CHECK_OPENSSL_RESULT(EVP_DigestUpdate(ctx.get(), data.data(), data.size()), "EVP_DigestUpdate");
    CHECK_OPENSSL_RESULT(EVP_DigestFinal_ex(ctx.get(), hash, &hash_len), "EVP_DigestFinal_ex");
    return toHex(hash, hash_len);
}

std::shared_ptr<const ChecksumAlgorithm> makeDefaultChecksum() {
    return std::make_shared<Crc32Checksum>();
}

std::shared_ptr<const ChecksumAlgorithm> makeChecksum(const std::string& name) {
    if (name == "crc32") return std::make_shared<Crc32Checksum>();
    if (name == "sha256") return std::make_shared<Sha256Checksum>();
    return nullptr;
}

std::string generateRandomHex(size_t num_chars) {
    std::vector<unsigned char> bytes((num_chars + 1) / 2);
    if (bytes.empty()) return "";
    CHECK_OPENSSL_RESULT(RAND_bytes(bytes.data(), static_cast<int>(bytes.size())), "RAND_bytes");
    return toHex(bytes.data(), bytes.size()).substr(0, num_chars);
}

} // namespace tabvault
