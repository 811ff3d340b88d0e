#include <gtest/gtest.h>

#include "Compression.h"
#include "Crypto.h"

#include <string>
#include <vector>

using namespace RelayPipe;

namespace {

std::vector<uint8_t> repetitive(size_t size) {
    const std::string pattern = "relaypipe chunk payload ";
    std::vector<uint8_t> out;
    out.reserve(size);
    while (out.size() < size) {
        out.push_back(static_cast<uint8_t>(pattern[out.size() % pattern.size()]));
    }
    return out;
}

} // namespace

TEST(CompressionTest, RoundTrip) {
    auto data = repetitive(64 * 1024);
    auto compressed = Compression::compress(data);
    ASSERT_FALSE(compressed.empty());
    EXPECT_LT(compressed.size(), data.size() / 10);

    auto restored = Compression::decompress(compressed, data.size());
    EXPECT_EQ(restored, data);
}

TEST(CompressionTest, AllLevelsRoundTrip) {
    auto data = repetitive(8192);
    for (auto level : {CompressionLevel::Fast, CompressionLevel::Default, CompressionLevel::Best}) {
        auto compressed = Compression::compress(data, level);
        ASSERT_FALSE(compressed.empty());
        EXPECT_EQ(Compression::decompress(compressed, data.size()), data);
    }
}

TEST(CompressionTest, SmallInputIsLeftAlone) {
    auto data = repetitive(Compression::MIN_COMPRESS_SIZE - 1);
    EXPECT_TRUE(Compression::compress(data).empty());
    EXPECT_TRUE(Compression::compress({}).empty());
}

TEST(CompressionTest, IncompressibleInputIsLeftAlone) {
    auto random = Crypto::randomBytes(16 * 1024);
    EXPECT_TRUE(Compression::compress(random).empty());
}

TEST(CompressionTest, DecompressRejectsWrongSizeOrGarbage) {
    auto data = repetitive(4096);
    auto compressed = Compression::compress(data);
    ASSERT_FALSE(compressed.empty());

    EXPECT_TRUE(Compression::decompress(compressed, data.size() + 1).empty());
    EXPECT_TRUE(Compression::decompress(compressed, data.size() - 1).empty());
    EXPECT_TRUE(Compression::decompress(compressed, 0).empty());
    EXPECT_TRUE(Compression::decompress({}, 10).empty());
    EXPECT_TRUE(Compression::decompress({0x01, 0x02, 0x03, 0x04}, 16).empty());
    EXPECT_TRUE(Compression::decompress(compressed, Compression::MAX_DECOMPRESSED_SIZE + 1).empty());
}

TEST(CompressionTest, CompressibilityHeuristic) {
    EXPECT_TRUE(Compression::isCompressible(repetitive(1024)));
    EXPECT_FALSE(Compression::isCompressible(repetitive(16)));

    std::vector<uint8_t> everyByte(512);
    for (size_t i = 0; i < everyByte.size(); ++i) {
        everyByte[i] = static_cast<uint8_t>(i);
    }
    EXPECT_FALSE(Compression::isCompressible(everyByte));
}

TEST(CompressionTest, RatioAndSupportedIds) {
    EXPECT_DOUBLE_EQ(Compression::compressionRatio(100, 50), 0.5);
    EXPECT_DOUBLE_EQ(Compression::compressionRatio(0, 10), 1.0);

    EXPECT_TRUE(Compression::isSupported(static_cast<uint8_t>(CompressionAlgorithm::None)));
    EXPECT_TRUE(Compression::isSupported(static_cast<uint8_t>(CompressionAlgorithm::Zlib)));
    EXPECT_FALSE(Compression::isSupported(2));
}
