#include <gtest/gtest.h>

#include "Crypto.h"

#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace RelayPipe;

namespace {

std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

TEST(CryptoTest, RandomBytesAndSizes) {
    EXPECT_EQ(Crypto::randomBytes(0).size(), 0u);
    EXPECT_EQ(Crypto::randomBytes(64).size(), 64u);
    EXPECT_EQ(Crypto::generateSalt().size(), Crypto::SALT_SIZE);
    EXPECT_EQ(Crypto::generateGcmNonce().size(), Crypto::GCM_IV_SIZE);
    EXPECT_NE(Crypto::generateSalt(), Crypto::generateSalt());
}

TEST(CryptoTest, RandomTokensAreHexAndDistinct) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto token = Crypto::randomToken();
        EXPECT_EQ(token.size(), 32u);
        EXPECT_EQ(token.find_first_not_of("0123456789abcdef"), std::string::npos);
        seen.insert(token);
    }
    EXPECT_EQ(seen.size(), 100u);
    EXPECT_EQ(Crypto::randomToken(4).size(), 8u);
}

TEST(CryptoTest, DeriveKeyIsDeterministicPerSalt) {
    auto salt = Crypto::generateSalt();
    auto k1 = Crypto::deriveKey("password", salt, 1000);
    auto k2 = Crypto::deriveKey("password", salt, 1000);
    EXPECT_EQ(k1.size(), Crypto::KEY_SIZE);
    EXPECT_EQ(k1, k2);

    EXPECT_NE(k1, Crypto::deriveKey("password", Crypto::generateSalt(), 1000));
    EXPECT_NE(k1, Crypto::deriveKey("Password", salt, 1000));
    EXPECT_NE(k1, Crypto::deriveKey("password", salt, 1001));
}

TEST(CryptoTest, GcmRoundTrip) {
    auto key = Crypto::deriveKey("secret", Crypto::generateSalt(), 1000);
    auto nonce = Crypto::generateGcmNonce();
    auto aad = bytes("header bytes");
    auto plaintext = bytes("The quick brown fox jumps over the lazy dog");

    auto ciphertext = Crypto::encryptGcm(plaintext, key, nonce, aad);
    EXPECT_EQ(ciphertext.size(), plaintext.size() + Crypto::GCM_TAG_SIZE);
    EXPECT_NE(std::vector<uint8_t>(ciphertext.begin(), ciphertext.begin() + plaintext.size()), plaintext);

    auto decrypted = Crypto::decryptGcm(ciphertext, key, nonce, aad);
    ASSERT_TRUE(decrypted.has_value());
    EXPECT_EQ(*decrypted, plaintext);
}

TEST(CryptoTest, GcmEmptyPlaintext) {
    auto key = Crypto::randomBytes(Crypto::KEY_SIZE);
    auto nonce = Crypto::generateGcmNonce();
    auto ciphertext = Crypto::encryptGcm({}, key, nonce);
    EXPECT_EQ(ciphertext.size(), Crypto::GCM_TAG_SIZE);

    auto decrypted = Crypto::decryptGcm(ciphertext, key, nonce);
    ASSERT_TRUE(decrypted.has_value());
    EXPECT_TRUE(decrypted->empty());
}

TEST(CryptoTest, GcmRejectsTampering) {
    auto key = Crypto::randomBytes(Crypto::KEY_SIZE);
    auto nonce = Crypto::generateGcmNonce();
    auto aad = bytes("aad");
    auto ciphertext = Crypto::encryptGcm(bytes("payload"), key, nonce, aad);

    auto flipped = ciphertext;
    flipped[0] ^= 0x01;
    EXPECT_FALSE(Crypto::decryptGcm(flipped, key, nonce, aad).has_value());

    auto badTag = ciphertext;
    badTag.back() ^= 0x80;
    EXPECT_FALSE(Crypto::decryptGcm(badTag, key, nonce, aad).has_value());

    EXPECT_FALSE(Crypto::decryptGcm(ciphertext, key, nonce, bytes("other")).has_value());
    EXPECT_FALSE(Crypto::decryptGcm(ciphertext, Crypto::randomBytes(Crypto::KEY_SIZE), nonce, aad).has_value());
    EXPECT_FALSE(Crypto::decryptGcm(ciphertext, key, Crypto::generateGcmNonce(), aad).has_value());
}

TEST(CryptoTest, HmacKnownAnswer) {
    // RFC 4231 test case 2
    auto mac = Crypto::hmacSHA256(bytes("what do ya want for nothing?"), bytes("Jefe"));
    EXPECT_EQ(Crypto::toHex(mac),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(CryptoTest, ConstantTimeCompare) {
    EXPECT_TRUE(Crypto::constantTimeCompare(bytes("abc"), bytes("abc")));
    EXPECT_FALSE(Crypto::constantTimeCompare(bytes("abc"), bytes("abd")));
    EXPECT_FALSE(Crypto::constantTimeCompare(bytes("abc"), bytes("abcd")));
    EXPECT_TRUE(Crypto::constantTimeCompare(std::string(), std::string()));
    EXPECT_FALSE(Crypto::constantTimeCompare(std::string("x"), std::string("y")));
}

TEST(CryptoTest, ChannelCredentialHidesPassword) {
    auto c1 = Crypto::channelCredential("hunter2");
    auto c2 = Crypto::channelCredential("hunter2");
    EXPECT_EQ(c1, c2);
    EXPECT_EQ(c1.size(), 64u);
    EXPECT_EQ(c1.find("hunter2"), std::string::npos);
    EXPECT_NE(c1, Crypto::channelCredential("hunter3"));
}

TEST(CryptoTest, HexRoundTripAndErrors) {
    std::vector<uint8_t> data = {0x00, 0x0f, 0xa5, 0xff};
    EXPECT_EQ(Crypto::toHex(data), "000fa5ff");
    EXPECT_EQ(Crypto::fromHex("000fa5ff"), data);
    EXPECT_EQ(Crypto::fromHex("000FA5FF"), data);
    EXPECT_TRUE(Crypto::fromHex("").empty());

    EXPECT_THROW(Crypto::fromHex("abc"), std::runtime_error);
    EXPECT_THROW(Crypto::fromHex("zz"), std::runtime_error);
}

TEST(CryptoTest, SupportedCiphers) {
    EXPECT_TRUE(Crypto::isSupported(static_cast<uint8_t>(CipherAlgorithm::None)));
    EXPECT_TRUE(Crypto::isSupported(static_cast<uint8_t>(CipherAlgorithm::Aes256GcmPbkdf2)));
    EXPECT_FALSE(Crypto::isSupported(2));
    EXPECT_FALSE(Crypto::isSupported(255));
}
