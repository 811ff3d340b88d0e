#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace RelayPipe {

/**
 * @brief Closed set of cipher algorithm ids carried in the chunk frame
 */
enum class CipherAlgorithm : uint8_t {
    None = 0,
    Aes256GcmPbkdf2 = 1   // AES-256-GCM, key from PBKDF2-HMAC-SHA256
};

/**
 * @brief OpenSSL wrappers used by the chunk codec and the channel credential
 *
 * Failures of the OpenSSL primitives themselves throw std::runtime_error.
 * A GCM tag mismatch is not an exception: decryptGcm() returns std::nullopt.
 */
class Crypto {
public:
    static constexpr size_t KEY_SIZE = 32;       // 256 bits
    static constexpr size_t SALT_SIZE = 16;
    static constexpr size_t GCM_IV_SIZE = 12;    // 96 bits for GCM (recommended)
    static constexpr size_t GCM_TAG_SIZE = 16;   // 128 bits auth tag
    static constexpr size_t HMAC_SIZE = 32;

    static std::vector<uint8_t> randomBytes(size_t count);
    static std::vector<uint8_t> generateSalt();
    static std::vector<uint8_t> generateGcmNonce();

    /**
     * @brief Random identifier rendered as lowercase hex (producer ids, lock tokens)
     */
    static std::string randomToken(size_t bytes = 16);

    /**
     * @brief PBKDF2-HMAC-SHA256 stream key
     */
    static std::vector<uint8_t> deriveKey(
        const std::string& password,
        const std::vector<uint8_t>& salt,
        int iterations
    );

    /**
     * @brief AES-256-GCM encryption
     * @return ciphertext with the 16-byte tag appended
     */
    static std::vector<uint8_t> encryptGcm(
        const std::vector<uint8_t>& plaintext,
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& nonce,
        const std::vector<uint8_t>& aad = {}
    );

    /**
     * @brief AES-256-GCM decryption
     * @return plaintext, or std::nullopt when the tag does not verify
     */
    static std::optional<std::vector<uint8_t>> decryptGcm(
        const std::vector<uint8_t>& ciphertext,
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& nonce,
        const std::vector<uint8_t>& aad = {}
    );

    static std::vector<uint8_t> hmacSHA256(
        const std::vector<uint8_t>& message,
        const std::vector<uint8_t>& key
    );

    static bool constantTimeCompare(
        const std::vector<uint8_t>& a,
        const std::vector<uint8_t>& b
    );

    static bool constantTimeCompare(const std::string& a, const std::string& b);

    /**
     * @brief Channel credential derived from a password
     *
     * hex(HMAC-SHA256(key = password, "relaypipe channel credential")).
     * The relay only ever sees this value, never the password, and the
     * password stays usable as the encryption secret.
     */
    static std::string channelCredential(const std::string& password);

    static std::string toHex(const std::vector<uint8_t>& data);

    /// @throws std::runtime_error on odd length or non-hex characters
    static std::vector<uint8_t> fromHex(const std::string& hex);

    static bool isSupported(uint8_t cipherId);
};

} // namespace RelayPipe
