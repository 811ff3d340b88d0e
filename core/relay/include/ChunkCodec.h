#pragma once

/**
 * @file ChunkCodec.h
 * @brief Splits a byte stream into chunks and reverses it
 *
 * Each piece is optionally zlib-compressed (kept only when smaller) and
 * optionally sealed with AES-256-GCM under a PBKDF2 key derived from the
 * channel password and a per-stream random salt. Every chunk carries a
 * checksum of its plaintext; the final chunk also carries a digest of the
 * whole stream.
 */

#include "Chunk.h"
#include "Constants.h"
#include "Result.h"
#include "SHA256.h"
#include "ThreadPool.h"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace RelayPipe {

/**
 * @brief Password plus a cache of PBKDF2 keys by salt
 *
 * Derivation is deliberately slow, so one ChannelKey should live for the
 * whole transfer. Thread-safe.
 */
class ChannelKey {
public:
    explicit ChannelKey(std::string password, int iterations = config::KDF_ITERATIONS);

    ChannelKey(const ChannelKey&) = delete;
    ChannelKey& operator=(const ChannelKey&) = delete;

    const std::string& password() const { return password_; }
    int iterations() const { return iterations_; }

    /// @throws std::runtime_error if the derivation fails
    std::vector<uint8_t> keyForSalt(const std::vector<uint8_t>& salt);

    size_t cachedKeys() const;

private:
    std::string password_;
    int iterations_;
    mutable std::mutex mutex_;
    std::map<std::vector<uint8_t>, std::vector<uint8_t>> cache_;
};

struct EncodeOptions {
    bool compress = false;
    uint64_t producerIndexBase = 0;
    size_t maxChunkSize = config::MAX_CHUNK_PLAINTEXT;
};

class ChunkCodec {
public:
    /**
     * @brief Encode a whole stream
     *
     * Empty input yields exactly one zero-length final chunk. A null key
     * leaves the chunks in clear.
     */
    static Result<std::vector<Chunk>> encode(
        const std::vector<uint8_t>& data,
        ChannelKey* key,
        const EncodeOptions& options = EncodeOptions());

    /**
     * @brief Same as encode(), pieces processed on the pool, order preserved
     */
    static Result<std::vector<Chunk>> encodeParallel(
        const std::vector<uint8_t>& data,
        ChannelKey* key,
        const EncodeOptions& options,
        ThreadPool& pool);

    /**
     * @brief Recover one chunk's plaintext
     *
     * FormatError for an algorithm id outside the supported set, AuthError for
     * an encrypted chunk without a key, IntegrityError when the tag or the
     * checksum does not verify.
     */
    static Result<std::vector<uint8_t>> decode(const Chunk& chunk, ChannelKey* key);

    /**
     * @brief Decode chunks on the pool and concatenate them in order
     */
    static Result<std::vector<uint8_t>> decodeParallel(
        const std::vector<Chunk>& chunks,
        ChannelKey* key,
        ThreadPool& pool);

    /**
     * @brief Single final, uncompressed, unencrypted chunk (plaintext web path)
     */
    static Chunk makePlainChunk(const std::vector<uint8_t>& data, uint64_t producerIndex = 0);

    /**
     * @brief Check the final chunk's stream digest against the decoded stream
     */
    static VoidResult verifyStreamDigest(
        const Chunk& finalChunk,
        const SHA256::Digest& plaintextDigest,
        ChannelKey* key);

    /**
     * @brief Digest stored in the final chunk: SHA-256 of the stream, or
     *        HMAC-SHA256(stream key, SHA-256 of the stream) when encrypted
     */
    static SHA256::Digest streamDigestFor(
        const SHA256::Digest& plaintextDigest,
        const std::vector<uint8_t>* streamKey);

private:
    struct StreamContext {
        std::vector<uint8_t> salt;
        std::vector<uint8_t> key;   // empty when unencrypted
        bool compress = false;
        SHA256::Digest streamDigest{};
    };

    struct Piece {
        size_t offset;
        size_t length;
        uint64_t producerIndex;
        bool final;
    };

    static Result<StreamContext> prepareStream(const std::vector<uint8_t>& data, ChannelKey* key, bool compress);
    static std::vector<Piece> split(size_t total, const EncodeOptions& options);
    static Chunk encodePiece(const uint8_t* data, const Piece& piece, const StreamContext& ctx);
};

} // namespace RelayPipe
