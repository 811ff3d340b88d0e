#include <gtest/gtest.h>

#include "ChunkCodec.h"
#include "Crypto.h"
#include "ThreadPool.h"

#include <string>
#include <vector>

using namespace RelayPipe;

namespace {

// Fast key derivation keeps the suite quick; the iteration count is not under test
constexpr int TEST_ITERATIONS = 1000;

std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

std::vector<uint8_t> repetitive(size_t size) {
    std::vector<uint8_t> out(size);
    for (size_t i = 0; i < size; ++i) {
        out[i] = static_cast<uint8_t>('a' + (i % 7));
    }
    return out;
}

std::vector<uint8_t> decodeAll(const std::vector<Chunk>& chunks, ChannelKey* key) {
    std::vector<uint8_t> out;
    for (const auto& chunk : chunks) {
        auto plain = ChunkCodec::decode(chunk, key);
        EXPECT_TRUE(plain.ok()) << (plain.ok() ? "" : plain.error().toString());
        if (!plain) {
            return {};
        }
        out.insert(out.end(), plain->begin(), plain->end());
    }
    return out;
}

} // namespace

TEST(ChunkCodecTest, EmptyInputIsOneFinalChunk) {
    auto chunks = ChunkCodec::encode({}, nullptr);
    ASSERT_TRUE(chunks.ok());
    ASSERT_EQ(chunks->size(), 1u);

    const Chunk& only = chunks->front();
    EXPECT_TRUE(only.isFinal());
    EXPECT_TRUE(only.hasStreamDigest());
    EXPECT_EQ(only.plaintextLength, 0u);
    EXPECT_TRUE(only.payload.empty());

    auto plain = ChunkCodec::decode(only, nullptr);
    ASSERT_TRUE(plain.ok());
    EXPECT_TRUE(plain->empty());
}

TEST(ChunkCodecTest, SplitsIntoOrderedPiecesWithFinalLast) {
    EncodeOptions options;
    options.maxChunkSize = 1000;
    options.producerIndexBase = 3;

    auto data = Crypto::randomBytes(4500);
    auto chunks = ChunkCodec::encode(data, nullptr, options);
    ASSERT_TRUE(chunks.ok());
    ASSERT_EQ(chunks->size(), 5u);

    for (size_t i = 0; i < chunks->size(); ++i) {
        const Chunk& c = (*chunks)[i];
        EXPECT_EQ(c.producerIndex, 3 + i);
        EXPECT_EQ(c.isFinal(), i == chunks->size() - 1);
        EXPECT_EQ(c.hasStreamDigest(), c.isFinal());
    }
    EXPECT_EQ((*chunks)[4].plaintextLength, 500u);
    EXPECT_EQ(decodeAll(*chunks, nullptr), data);
}

TEST(ChunkCodecTest, AllKeyAndCompressionCombinationsDecode) {
    ChannelKey key("correct horse", TEST_ITERATIONS);
    auto data = repetitive(3000);

    for (bool compress : {false, true}) {
        for (ChannelKey* k : {static_cast<ChannelKey*>(nullptr), &key}) {
            EncodeOptions options;
            options.compress = compress;
            options.maxChunkSize = 1024;

            auto chunks = ChunkCodec::encode(data, k, options);
            ASSERT_TRUE(chunks.ok());
            for (const auto& c : *chunks) {
                EXPECT_EQ(c.isCompressed(), compress);
                EXPECT_EQ(c.isEncrypted(), k != nullptr);
            }
            EXPECT_EQ(decodeAll(*chunks, k), data) << "compress=" << compress << " key=" << (k != nullptr);
        }
    }
}

TEST(ChunkCodecTest, IncompressibleDataIsStoredRaw) {
    EncodeOptions options;
    options.compress = true;

    auto chunks = ChunkCodec::encode(Crypto::randomBytes(4096), nullptr, options);
    ASSERT_TRUE(chunks.ok());
    ASSERT_EQ(chunks->size(), 1u);
    EXPECT_FALSE(chunks->front().isCompressed());
    EXPECT_EQ(chunks->front().compression, 0);
}

TEST(ChunkCodecTest, EncryptedChecksumIsNotPlainSha256) {
    ChannelKey key("pw", TEST_ITERATIONS);
    auto data = bytes("fingerprint me");

    auto chunks = ChunkCodec::encode(data, &key);
    ASSERT_TRUE(chunks.ok());
    EXPECT_NE(chunks->front().checksum, SHA256::digest(data));
    EXPECT_NE(chunks->front().streamDigest, SHA256::digest(data));
    EXPECT_EQ(chunks->front().salt.size(), Crypto::SALT_SIZE);
    EXPECT_EQ(chunks->front().nonce.size(), Crypto::GCM_IV_SIZE);
}

TEST(ChunkCodecTest, CorruptPayloadIsIntegrityError) {
    auto chunks = ChunkCodec::encode(bytes("hello relay"), nullptr);
    ASSERT_TRUE(chunks.ok());
    Chunk chunk = chunks->front();
    chunk.payload[0] ^= 0x01;

    auto plain = ChunkCodec::decode(chunk, nullptr);
    ASSERT_FALSE(plain.ok());
    EXPECT_EQ(plain.error().code, ErrorCode::IntegrityError);
}

TEST(ChunkCodecTest, WrongPasswordIsIntegrityError) {
    ChannelKey key("right", TEST_ITERATIONS);
    ChannelKey wrong("wrong", TEST_ITERATIONS);

    auto chunks = ChunkCodec::encode(bytes("secret"), &key);
    ASSERT_TRUE(chunks.ok());

    auto plain = ChunkCodec::decode(chunks->front(), &wrong);
    ASSERT_FALSE(plain.ok());
    EXPECT_EQ(plain.error().code, ErrorCode::IntegrityError);
}

TEST(ChunkCodecTest, EncryptedChunkWithoutKeyIsAuthError) {
    ChannelKey key("pw", TEST_ITERATIONS);
    auto chunks = ChunkCodec::encode(bytes("secret"), &key);
    ASSERT_TRUE(chunks.ok());

    auto plain = ChunkCodec::decode(chunks->front(), nullptr);
    ASSERT_FALSE(plain.ok());
    EXPECT_EQ(plain.error().code, ErrorCode::AuthError);
}

TEST(ChunkCodecTest, HeaderIsAuthenticated) {
    ChannelKey key("pw", TEST_ITERATIONS);
    auto chunks = ChunkCodec::encode(bytes("bound to its header"), &key);
    ASSERT_TRUE(chunks.ok());

    Chunk moved = chunks->front();
    moved.producerIndex = 7;
    auto plain = ChunkCodec::decode(moved, &key);
    ASSERT_FALSE(plain.ok());
    EXPECT_EQ(plain.error().code, ErrorCode::IntegrityError);
}

TEST(ChunkCodecTest, UnknownAlgorithmIdIsFormatError) {
    auto chunks = ChunkCodec::encode(bytes("x"), nullptr);
    ASSERT_TRUE(chunks.ok());
    Chunk chunk = chunks->front();
    chunk.flags |= FLAG_COMPRESSED;
    chunk.compression = 9;

    auto plain = ChunkCodec::decode(chunk, nullptr);
    ASSERT_FALSE(plain.ok());
    EXPECT_EQ(plain.error().code, ErrorCode::FormatError);
}

TEST(ChunkCodecTest, StreamDigestMismatchDetected) {
    auto chunks = ChunkCodec::encode(bytes("whole stream"), nullptr);
    ASSERT_TRUE(chunks.ok());
    const Chunk& last = chunks->back();

    EXPECT_TRUE(ChunkCodec::verifyStreamDigest(last, SHA256::digest(bytes("whole stream")), nullptr).ok());

    auto bad = ChunkCodec::verifyStreamDigest(last, SHA256::digest(bytes("other stream")), nullptr);
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.error().code, ErrorCode::IntegrityError);
}

TEST(ChunkCodecTest, EncryptedStreamDigestVerifiesWithKey) {
    ChannelKey key("pw", TEST_ITERATIONS);
    auto data = repetitive(2500);
    EncodeOptions options;
    options.maxChunkSize = 1000;

    auto chunks = ChunkCodec::encode(data, &key, options);
    ASSERT_TRUE(chunks.ok());
    EXPECT_TRUE(ChunkCodec::verifyStreamDigest(chunks->back(), SHA256::digest(data), &key).ok());
    // All chunks of one stream share the salt, so one derivation serves them all
    EXPECT_EQ(key.cachedKeys(), 1u);
}

TEST(ChunkCodecTest, ParallelMatchesSequentialOrder) {
    ThreadPool pool(4);
    ChannelKey key("pw", TEST_ITERATIONS);
    auto data = Crypto::randomBytes(10 * 1024);
    EncodeOptions options;
    options.compress = true;
    options.maxChunkSize = 1024;

    auto chunks = ChunkCodec::encodeParallel(data, &key, options, pool);
    ASSERT_TRUE(chunks.ok());
    ASSERT_EQ(chunks->size(), 10u);
    for (size_t i = 0; i < chunks->size(); ++i) {
        EXPECT_EQ((*chunks)[i].producerIndex, i);
    }

    auto plain = ChunkCodec::decodeParallel(*chunks, &key, pool);
    ASSERT_TRUE(plain.ok());
    EXPECT_EQ(*plain, data);
}

TEST(ChunkCodecTest, PlainChunkForWebPath) {
    auto data = bytes("typed in a browser");
    Chunk chunk = ChunkCodec::makePlainChunk(data);

    EXPECT_TRUE(chunk.isFinal());
    EXPECT_FALSE(chunk.isEncrypted());
    EXPECT_FALSE(chunk.isCompressed());

    auto plain = ChunkCodec::decode(chunk, nullptr);
    ASSERT_TRUE(plain.ok());
    EXPECT_EQ(*plain, data);
    EXPECT_TRUE(ChunkCodec::verifyStreamDigest(chunk, SHA256::digest(data), nullptr).ok());
}

// ----------------------------------------------------------------------------
// Wire frame
// ----------------------------------------------------------------------------

TEST(ChunkFrameTest, SerializeThenParse) {
    ChannelKey key("pw", TEST_ITERATIONS);
    auto chunks = ChunkCodec::encode(bytes("framed"), &key);
    ASSERT_TRUE(chunks.ok());
    const Chunk& original = chunks->front();

    auto frame = ChunkFrame::serialize(original);
    EXPECT_EQ(frame.size(), original.frameSize());
    EXPECT_EQ(std::string(frame.begin(), frame.begin() + 4), "RPCK");
    EXPECT_EQ(frame[4], ChunkFrame::VERSION);

    auto parsed = ChunkFrame::parse(frame);
    ASSERT_TRUE(parsed.ok());
    EXPECT_EQ(parsed->flags, original.flags);
    EXPECT_EQ(parsed->salt, original.salt);
    EXPECT_EQ(parsed->nonce, original.nonce);
    EXPECT_EQ(parsed->streamDigest, original.streamDigest);

    auto plain = ChunkCodec::decode(*parsed, &key);
    ASSERT_TRUE(plain.ok());
    EXPECT_EQ(*plain, bytes("framed"));
}

TEST(ChunkFrameTest, RejectsMalformedFrames) {
    auto frame = ChunkFrame::serialize(ChunkCodec::makePlainChunk(bytes("abc")));

    auto badMagic = frame;
    badMagic[0] = 'X';
    EXPECT_EQ(ChunkFrame::parse(badMagic).error().code, ErrorCode::FormatError);

    auto badVersion = frame;
    badVersion[4] = 2;
    EXPECT_EQ(ChunkFrame::parse(badVersion).error().code, ErrorCode::FormatError);

    auto badFlags = frame;
    badFlags[5] |= 0x80;
    EXPECT_EQ(ChunkFrame::parse(badFlags).error().code, ErrorCode::FormatError);

    auto badCipher = frame;
    badCipher[7] = 5;
    EXPECT_EQ(ChunkFrame::parse(badCipher).error().code, ErrorCode::FormatError);

    auto truncated = frame;
    truncated.pop_back();
    EXPECT_EQ(ChunkFrame::parse(truncated).error().code, ErrorCode::FormatError);

    auto trailing = frame;
    trailing.push_back(0);
    EXPECT_EQ(ChunkFrame::parse(trailing).error().code, ErrorCode::FormatError);

    std::vector<uint8_t> tiny = {'R', 'P'};
    EXPECT_EQ(ChunkFrame::parse(tiny).error().code, ErrorCode::FormatError);
}

TEST(ChunkFrameTest, ParsesConcatenatedFrames) {
    EncodeOptions options;
    options.maxChunkSize = 4;
    auto chunks = ChunkCodec::encode(bytes("abcdefghij"), nullptr, options);
    ASSERT_TRUE(chunks.ok());
    ASSERT_EQ(chunks->size(), 3u);

    std::vector<uint8_t> body;
    for (const auto& c : *chunks) {
        ChunkFrame::appendTo(c, body);
    }

    auto parsed = ChunkFrame::parseSequence(body);
    ASSERT_TRUE(parsed.ok());
    ASSERT_EQ(parsed->size(), 3u);
    EXPECT_EQ(decodeAll(*parsed, nullptr), bytes("abcdefghij"));
    EXPECT_TRUE(parsed->back().isFinal());

    auto empty = ChunkFrame::parseSequence({});
    ASSERT_TRUE(empty.ok());
    EXPECT_TRUE(empty->empty());
}
