#pragma once

#include <string>
#include <vector>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <sstream>
#include <iomanip>

namespace RelayPipe {

/**
 * @brief SHA-256 over EVP, one-shot or incremental
 *
 * The incremental form computes the whole-stream digest while the codec
 * walks the stream chunk by chunk.
 */
class SHA256 {
public:
    using Digest = std::array<uint8_t, SHA256_DIGEST_LENGTH>;

    SHA256() : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_ || EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx_);
            throw std::runtime_error("Failed to initialize SHA-256 context");
        }
    }

    ~SHA256() {
        EVP_MD_CTX_free(ctx_);
    }

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    void update(const uint8_t* data, size_t len) {
        if (len > 0 && EVP_DigestUpdate(ctx_, data, len) != 1) {
            throw std::runtime_error("SHA-256 update failed");
        }
    }

    void update(const std::vector<uint8_t>& data) {
        update(data.data(), data.size());
    }

    Digest finish() {
        Digest out{};
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_, out.data(), &len) != 1 || len != out.size()) {
            throw std::runtime_error("SHA-256 finalization failed");
        }
        return out;
    }

    /**
     * @brief Raw 32-byte digest of binary data
     */
    static Digest digest(const std::vector<uint8_t>& data) {
        SHA256 hasher;
        hasher.update(data);
        return hasher.finish();
    }

    /**
     * @brief Hash a string to hex-encoded SHA256
     */
    static std::string hash(const std::string& input) {
        return hashBytes(std::vector<uint8_t>(input.begin(), input.end()));
    }

    /**
     * @brief Hash binary data to hex-encoded SHA256
     */
    static std::string hashBytes(const std::vector<uint8_t>& data) {
        return toHex(digest(data));
    }

    static std::string toHex(const Digest& d) {
        std::stringstream ss;
        for (uint8_t b : d) {
            ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(b);
        }
        return ss.str();
    }

private:
    EVP_MD_CTX* ctx_;
};

} // namespace RelayPipe
