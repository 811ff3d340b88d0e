#include "ChunkCodec.h"
#include "Compression.h"
#include "Crypto.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "MetricsCollector.h"

#include <algorithm>
#include <stdexcept>

namespace RelayPipe {

// ============================================================================
// ChannelKey
// ============================================================================

ChannelKey::ChannelKey(std::string password, int iterations)
    : password_(std::move(password))
    , iterations_(iterations) {
}

std::vector<uint8_t> ChannelKey::keyForSalt(const std::vector<uint8_t>& salt) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(salt);
        if (it != cache_.end()) {
            return it->second;
        }
    }

    // Derive outside the lock; a concurrent derivation of the same salt
    // produces the same key
    auto key = Crypto::deriveKey(password_, salt, iterations_);

    std::lock_guard<std::mutex> lock(mutex_);
    cache_.emplace(salt, key);
    return key;
}

size_t ChannelKey::cachedKeys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

// ============================================================================
// ChunkCodec
// ============================================================================

namespace {

Error integrityError(const std::string& message) {
    MetricsCollector::instance().incrementIntegrityErrors();
    Logger::instance().warn(message, "ChunkCodec");
    return Err(ErrorCode::IntegrityError, message);
}

template<size_t N>
void copyDigest(const std::vector<uint8_t>& from, std::array<uint8_t, N>& to) {
    std::copy_n(from.begin(), std::min(from.size(), N), to.begin());
}

} // namespace

Result<ChunkCodec::StreamContext> ChunkCodec::prepareStream(
    const std::vector<uint8_t>& data, ChannelKey* key, bool compress) {
    StreamContext ctx;
    ctx.compress = compress;
    try {
        auto plainDigest = SHA256::digest(data);
        if (key) {
            ctx.salt = Crypto::generateSalt();
            ctx.key = key->keyForSalt(ctx.salt);
            ctx.streamDigest = streamDigestFor(plainDigest, &ctx.key);
        } else {
            ctx.streamDigest = plainDigest;
        }
    } catch (const std::exception& e) {
        Logger::instance().error(std::string("Failed to prepare stream: ") + e.what(), "ChunkCodec");
        return Err(ErrorCode::InternalError, e.what());
    }
    return ctx;
}

std::vector<ChunkCodec::Piece> ChunkCodec::split(size_t total, const EncodeOptions& options) {
    size_t maxChunk = std::max<size_t>(1, std::min(options.maxChunkSize, config::MAX_CHUNK_PLAINTEXT));
    std::vector<Piece> pieces;
    if (total == 0) {
        pieces.push_back({0, 0, options.producerIndexBase, true});
        return pieces;
    }
    uint64_t index = options.producerIndexBase;
    for (size_t offset = 0; offset < total; offset += maxChunk) {
        size_t length = std::min(maxChunk, total - offset);
        pieces.push_back({offset, length, index++, offset + length == total});
    }
    return pieces;
}

Chunk ChunkCodec::encodePiece(const uint8_t* data, const Piece& piece, const StreamContext& ctx) {
    std::vector<uint8_t> plain(data + piece.offset, data + piece.offset + piece.length);
    bool encrypted = !ctx.key.empty();

    Chunk chunk;
    chunk.producerIndex = piece.producerIndex;
    chunk.plaintextLength = static_cast<uint32_t>(plain.size());
    if (piece.final) {
        chunk.flags |= FLAG_FINAL | FLAG_STREAM_DIGEST;
        chunk.streamDigest = ctx.streamDigest;
    }

    if (encrypted) {
        copyDigest(Crypto::hmacSHA256(plain, ctx.key), chunk.checksum);
    } else {
        chunk.checksum = SHA256::digest(plain);
    }

    std::vector<uint8_t> body;
    if (ctx.compress) {
        body = Compression::compress(plain);
    }
    if (!body.empty()) {
        chunk.flags |= FLAG_COMPRESSED;
        chunk.compression = static_cast<uint8_t>(CompressionAlgorithm::Zlib);
    } else {
        body = std::move(plain);
    }

    if (encrypted) {
        chunk.flags |= FLAG_ENCRYPTED;
        chunk.cipher = static_cast<uint8_t>(CipherAlgorithm::Aes256GcmPbkdf2);
        chunk.salt = ctx.salt;
        chunk.nonce = Crypto::generateGcmNonce();
        auto aad = ChunkFrame::headerBytes(chunk, static_cast<uint32_t>(body.size() + Crypto::GCM_TAG_SIZE));
        chunk.payload = Crypto::encryptGcm(body, ctx.key, chunk.nonce, aad);
    } else {
        chunk.payload = std::move(body);
    }
    return chunk;
}

Result<std::vector<Chunk>> ChunkCodec::encode(
    const std::vector<uint8_t>& data, ChannelKey* key, const EncodeOptions& options) {
    auto ctx = prepareStream(data, key, options.compress);
    if (!ctx) {
        return ctx.error();
    }

    std::vector<Chunk> chunks;
    try {
        for (const auto& piece : split(data.size(), options)) {
            chunks.push_back(encodePiece(data.data(), piece, ctx.value()));
        }
    } catch (const std::exception& e) {
        Logger::instance().error(std::string("Chunk encoding failed: ") + e.what(), "ChunkCodec");
        return Err(ErrorCode::InternalError, e.what());
    }
    LOG_DEBUG_COMP_IF("Encoded " + std::to_string(data.size()) + " bytes into " +
                      std::to_string(chunks.size()) + " chunk(s)", "ChunkCodec");
    return chunks;
}

Result<std::vector<Chunk>> ChunkCodec::encodeParallel(
    const std::vector<uint8_t>& data, ChannelKey* key, const EncodeOptions& options, ThreadPool& pool) {
    auto pieces = split(data.size(), options);
    if (pieces.size() < 2 || pool.size() < 2) {
        return encode(data, key, options);
    }

    auto ctx = prepareStream(data, key, options.compress);
    if (!ctx) {
        return ctx.error();
    }

    SCOPED_TIMER_COMP("encodeParallel", "ChunkCodec");
    const StreamContext& shared = ctx.value();
    try {
        return pool.mapOrdered<Chunk>(pieces.size(), [&](size_t i) {
            return encodePiece(data.data(), pieces[i], shared);
        });
    } catch (const std::exception& e) {
        Logger::instance().error(std::string("Parallel chunk encoding failed: ") + e.what(), "ChunkCodec");
        return Err(ErrorCode::InternalError, e.what());
    }
}

Result<std::vector<uint8_t>> ChunkCodec::decode(const Chunk& chunk, ChannelKey* key) {
    if (!Compression::isSupported(chunk.compression)) {
        return Err(ErrorCode::FormatError, "unsupported compression id " + std::to_string(chunk.compression));
    }
    if (!Crypto::isSupported(chunk.cipher)) {
        return Err(ErrorCode::FormatError, "unsupported cipher id " + std::to_string(chunk.cipher));
    }
    if (chunk.isCompressed() != (chunk.compression != 0) ||
        chunk.isEncrypted() != (chunk.cipher != 0)) {
        return Err(ErrorCode::FormatError, "flags disagree with algorithm ids");
    }
    if (chunk.plaintextLength > config::MAX_CHUNK_PLAINTEXT) {
        return Err(ErrorCode::TooLarge, "chunk plaintext too large");
    }

    try {
        std::vector<uint8_t> streamKey;
        std::vector<uint8_t> body;

        if (chunk.isEncrypted()) {
            if (!key) {
                return Err(ErrorCode::AuthError, "chunk is encrypted and no password was given");
            }
            if (chunk.salt.size() != Crypto::SALT_SIZE || chunk.nonce.size() != Crypto::GCM_IV_SIZE) {
                return Err(ErrorCode::FormatError, "bad salt or nonce size");
            }
            streamKey = key->keyForSalt(chunk.salt);
            auto aad = ChunkFrame::headerBytes(chunk, static_cast<uint32_t>(chunk.payload.size()));
            auto opened = Crypto::decryptGcm(chunk.payload, streamKey, chunk.nonce, aad);
            if (!opened) {
                return integrityError("authentication tag mismatch (wrong password?) at index " +
                                      std::to_string(chunk.producerIndex));
            }
            body = std::move(*opened);
        } else {
            body = chunk.payload;
        }

        std::vector<uint8_t> plain;
        if (chunk.isCompressed()) {
            plain = Compression::decompress(body, chunk.plaintextLength);
            if (plain.empty() && chunk.plaintextLength > 0) {
                return integrityError("corrupt compressed payload at index " + std::to_string(chunk.producerIndex));
            }
        } else {
            plain = std::move(body);
        }

        if (plain.size() != chunk.plaintextLength) {
            return integrityError("plaintext length mismatch at index " + std::to_string(chunk.producerIndex));
        }

        std::vector<uint8_t> expected;
        if (chunk.isEncrypted()) {
            expected = Crypto::hmacSHA256(plain, streamKey);
        } else {
            auto d = SHA256::digest(plain);
            expected.assign(d.begin(), d.end());
        }
        std::vector<uint8_t> actual(chunk.checksum.begin(), chunk.checksum.end());
        if (!Crypto::constantTimeCompare(expected, actual)) {
            return integrityError("checksum mismatch at index " + std::to_string(chunk.producerIndex));
        }
        return plain;
    } catch (const std::exception& e) {
        Logger::instance().error(std::string("Chunk decoding failed: ") + e.what(), "ChunkCodec");
        return Err(ErrorCode::InternalError, e.what());
    }
}

Result<std::vector<uint8_t>> ChunkCodec::decodeParallel(
    const std::vector<Chunk>& chunks, ChannelKey* key, ThreadPool& pool) {
    std::vector<Result<std::vector<uint8_t>>> results;
    try {
        results = pool.mapOrdered<Result<std::vector<uint8_t>>>(chunks.size(), [&](size_t i) {
            return decode(chunks[i], key);
        });
    } catch (const std::exception& e) {
        Logger::instance().error(std::string("Parallel chunk decoding failed: ") + e.what(), "ChunkCodec");
        return Err(ErrorCode::InternalError, e.what());
    }

    std::vector<uint8_t> out;
    for (auto& result : results) {
        if (!result) {
            return result.error();
        }
        out.insert(out.end(), result->begin(), result->end());
    }
    return out;
}

Chunk ChunkCodec::makePlainChunk(const std::vector<uint8_t>& data, uint64_t producerIndex) {
    Chunk chunk;
    chunk.producerIndex = producerIndex;
    chunk.flags = FLAG_FINAL | FLAG_STREAM_DIGEST;
    chunk.plaintextLength = static_cast<uint32_t>(data.size());
    chunk.checksum = SHA256::digest(data);
    chunk.streamDigest = chunk.checksum;
    chunk.payload = data;
    return chunk;
}

VoidResult ChunkCodec::verifyStreamDigest(
    const Chunk& finalChunk, const SHA256::Digest& plaintextDigest, ChannelKey* key) {
    if (!finalChunk.hasStreamDigest()) {
        return integrityError("final chunk carries no stream digest");
    }
    try {
        SHA256::Digest expected;
        if (finalChunk.isEncrypted()) {
            if (!key) {
                return Err(ErrorCode::AuthError, "stream is encrypted and no password was given");
            }
            auto streamKey = key->keyForSalt(finalChunk.salt);
            expected = streamDigestFor(plaintextDigest, &streamKey);
        } else {
            expected = streamDigestFor(plaintextDigest, nullptr);
        }
        std::vector<uint8_t> a(expected.begin(), expected.end());
        std::vector<uint8_t> b(finalChunk.streamDigest.begin(), finalChunk.streamDigest.end());
        if (!Crypto::constantTimeCompare(a, b)) {
            return integrityError("stream digest mismatch");
        }
    } catch (const std::exception& e) {
        return Err(ErrorCode::InternalError, e.what());
    }
    return Ok();
}

SHA256::Digest ChunkCodec::streamDigestFor(
    const SHA256::Digest& plaintextDigest, const std::vector<uint8_t>* streamKey) {
    if (!streamKey) {
        return plaintextDigest;
    }
    std::vector<uint8_t> message(plaintextDigest.begin(), plaintextDigest.end());
    SHA256::Digest out{};
    copyDigest(Crypto::hmacSHA256(message, *streamKey), out);
    return out;
}

} // namespace RelayPipe
