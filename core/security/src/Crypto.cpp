#include "Crypto.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/hmac.h>
#include <openssl/crypto.h>  // For CRYPTO_memcmp
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <memory>
#include <cctype>

namespace RelayPipe {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

const char* CREDENTIAL_CONTEXT = "relaypipe channel credential";

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::vector<uint8_t> Crypto::randomBytes(size_t count) {
    std::vector<uint8_t> out(count);
    if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
        Logger::instance().error("Failed to generate random bytes", "Crypto");
        throw std::runtime_error("Failed to generate random bytes");
    }
    return out;
}

std::vector<uint8_t> Crypto::generateSalt() {
    return randomBytes(SALT_SIZE);
}

std::vector<uint8_t> Crypto::generateGcmNonce() {
    return randomBytes(GCM_IV_SIZE);
}

std::string Crypto::randomToken(size_t bytes) {
    return toHex(randomBytes(bytes));
}

std::vector<uint8_t> Crypto::deriveKey(
    const std::string& password,
    const std::vector<uint8_t>& salt,
    int iterations
) {
    auto& logger = Logger::instance();
    logger.debug("Deriving stream key (" + std::to_string(iterations) + " iterations)", "Crypto");

    std::vector<uint8_t> key(KEY_SIZE);
    if (PKCS5_PBKDF2_HMAC(
        password.c_str(),
        static_cast<int>(password.length()),
        salt.data(),
        static_cast<int>(salt.size()),
        iterations,
        EVP_sha256(),
        static_cast<int>(KEY_SIZE),
        key.data()
    ) != 1) {
        logger.error("Key derivation failed", "Crypto");
        throw std::runtime_error("Key derivation failed");
    }

    return key;
}

std::vector<uint8_t> Crypto::encryptGcm(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& nonce,
    const std::vector<uint8_t>& aad
) {
    if (key.size() != KEY_SIZE) {
        Logger::instance().error("Invalid key size for GCM encryption", "Crypto");
        throw std::runtime_error("Invalid key size");
    }
    if (nonce.size() != GCM_IV_SIZE) {
        Logger::instance().error("Invalid nonce size for GCM", "Crypto");
        throw std::runtime_error("Invalid nonce size (must be 12 bytes)");
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to create cipher context");
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        throw std::runtime_error("Failed to initialize GCM");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, GCM_IV_SIZE, nullptr) != 1) {
        throw std::runtime_error("Failed to set GCM IV length");
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        throw std::runtime_error("Failed to set GCM key/nonce");
    }

    int len = 0;

    if (!aad.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
            throw std::runtime_error("Failed to add AAD");
        }
    }

    std::vector<uint8_t> ciphertext(plaintext.size() + GCM_TAG_SIZE);
    int ciphertextLen = 0;

    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len, plaintext.data(),
                              static_cast<int>(plaintext.size())) != 1) {
            throw std::runtime_error("GCM encryption failed");
        }
        ciphertextLen = len;
    }

    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + ciphertextLen, &len) != 1) {
        throw std::runtime_error("GCM finalization failed");
    }
    ciphertextLen += len;

    // Tag goes after the ciphertext
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, GCM_TAG_SIZE,
                            ciphertext.data() + ciphertextLen) != 1) {
        throw std::runtime_error("Failed to get GCM tag");
    }
    ciphertextLen += GCM_TAG_SIZE;

    ciphertext.resize(ciphertextLen);
    return ciphertext;
}

std::optional<std::vector<uint8_t>> Crypto::decryptGcm(
    const std::vector<uint8_t>& ciphertext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& nonce,
    const std::vector<uint8_t>& aad
) {
    auto& logger = Logger::instance();

    if (key.size() != KEY_SIZE) {
        logger.error("Invalid key size for GCM decryption", "Crypto");
        throw std::runtime_error("Invalid key size");
    }
    if (nonce.size() != GCM_IV_SIZE) {
        logger.error("Invalid nonce size for GCM", "Crypto");
        throw std::runtime_error("Invalid nonce size");
    }
    if (ciphertext.size() < GCM_TAG_SIZE) {
        logger.warn("Ciphertext too short for GCM", "Crypto");
        return std::nullopt;
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to create cipher context");
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        throw std::runtime_error("Failed to initialize GCM decryption");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, GCM_IV_SIZE, nullptr) != 1) {
        throw std::runtime_error("Failed to set GCM IV length");
    }
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        throw std::runtime_error("Failed to set GCM key/nonce");
    }

    int len = 0;

    if (!aad.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
            throw std::runtime_error("Failed to add AAD");
        }
    }

    size_t actualCiphertextLen = ciphertext.size() - GCM_TAG_SIZE;

    // One spare byte so data() + len stays valid for an empty payload
    std::vector<uint8_t> plaintext(actualCiphertextLen + 1);
    int plaintextLen = 0;
    if (actualCiphertextLen > 0) {
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext.data(),
                              static_cast<int>(actualCiphertextLen)) != 1) {
            return std::nullopt;
        }
        plaintextLen = len;
    }

    std::vector<uint8_t> tag(ciphertext.end() - GCM_TAG_SIZE, ciphertext.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, GCM_TAG_SIZE, tag.data()) != 1) {
        return std::nullopt;
    }

    // Tag verification happens here
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + plaintextLen, &len) <= 0) {
        logger.warn("GCM authentication failed", "Crypto");
        MetricsCollector::instance().incrementIntegrityErrors();
        return std::nullopt;
    }

    plaintextLen += len;
    plaintext.resize(plaintextLen);
    return plaintext;
}

std::vector<uint8_t> Crypto::hmacSHA256(
    const std::vector<uint8_t>& message,
    const std::vector<uint8_t>& key
) {
    std::vector<uint8_t> hmac(HMAC_SIZE);
    unsigned int hmacLen = 0;

    if (HMAC(
        EVP_sha256(),
        key.data(),
        static_cast<int>(key.size()),
        message.data(),
        message.size(),
        hmac.data(),
        &hmacLen
    ) == nullptr) {
        throw std::runtime_error("HMAC computation failed");
    }

    hmac.resize(hmacLen);
    return hmac;
}

bool Crypto::constantTimeCompare(
    const std::vector<uint8_t>& a,
    const std::vector<uint8_t>& b
) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool Crypto::constantTimeCompare(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string Crypto::channelCredential(const std::string& password) {
    std::string context(CREDENTIAL_CONTEXT);
    std::vector<uint8_t> message(context.begin(), context.end());
    std::vector<uint8_t> key(password.begin(), password.end());
    return toHex(hmacSHA256(message, key));
}

std::string Crypto::toHex(const std::vector<uint8_t>& data) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (uint8_t byte : data) {
        ss << std::setw(2) << static_cast<int>(byte);
    }
    return ss.str();
}

std::vector<uint8_t> Crypto::fromHex(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        throw std::runtime_error("Invalid hex string length");
    }

    std::vector<uint8_t> data;
    data.reserve(hex.length() / 2);

    for (size_t i = 0; i < hex.length(); i += 2) {
        int hi = hexValue(hex[i]);
        int lo = hexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::runtime_error("Invalid hex character");
        }
        data.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }

    return data;
}

bool Crypto::isSupported(uint8_t cipherId) {
    switch (static_cast<CipherAlgorithm>(cipherId)) {
        case CipherAlgorithm::None:
        case CipherAlgorithm::Aes256GcmPbkdf2:
            return true;
        default:
            return false;
    }
}

} // namespace RelayPipe
