#include "Chunk.h"
#include "Compression.h"
#include "Constants.h"
#include "Crypto.h"

#include <algorithm>

namespace RelayPipe {

namespace {

void writeU32(std::vector<uint8_t>& out, uint32_t value) {
    for (int i = 3; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

void writeU64(std::vector<uint8_t>& out, uint64_t value) {
    for (int i = 7; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

uint32_t readU32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

uint64_t readU64(const uint8_t* p) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | p[i];
    }
    return value;
}

} // namespace

size_t Chunk::headerSize() const {
    size_t size = ChunkFrame::FIXED_HEADER_SIZE;
    if (hasStreamDigest()) size += ChunkFrame::DIGEST_SIZE;
    if (isEncrypted()) size += Crypto::SALT_SIZE + Crypto::GCM_IV_SIZE;
    return size;
}

std::vector<uint8_t> ChunkFrame::headerBytes(const Chunk& chunk, uint32_t payloadLength) {
    std::vector<uint8_t> out;
    out.reserve(chunk.headerSize());

    out.insert(out.end(), MAGIC, MAGIC + 4);
    out.push_back(VERSION);
    out.push_back(chunk.flags);
    out.push_back(chunk.compression);
    out.push_back(chunk.cipher);
    writeU64(out, chunk.producerIndex);
    writeU32(out, payloadLength);
    writeU32(out, chunk.plaintextLength);
    out.insert(out.end(), chunk.checksum.begin(), chunk.checksum.end());

    if (chunk.hasStreamDigest()) {
        out.insert(out.end(), chunk.streamDigest.begin(), chunk.streamDigest.end());
    }
    if (chunk.isEncrypted()) {
        // Sizes are fixed on the wire; pad or cut rather than shift the payload
        std::vector<uint8_t> salt(chunk.salt);
        std::vector<uint8_t> nonce(chunk.nonce);
        salt.resize(Crypto::SALT_SIZE, 0);
        nonce.resize(Crypto::GCM_IV_SIZE, 0);
        out.insert(out.end(), salt.begin(), salt.end());
        out.insert(out.end(), nonce.begin(), nonce.end());
    }
    return out;
}

void ChunkFrame::appendTo(const Chunk& chunk, std::vector<uint8_t>& out) {
    auto header = headerBytes(chunk, static_cast<uint32_t>(chunk.payload.size()));
    out.reserve(out.size() + header.size() + chunk.payload.size());
    out.insert(out.end(), header.begin(), header.end());
    out.insert(out.end(), chunk.payload.begin(), chunk.payload.end());
}

std::vector<uint8_t> ChunkFrame::serialize(const Chunk& chunk) {
    std::vector<uint8_t> out;
    appendTo(chunk, out);
    return out;
}

Result<Chunk> ChunkFrame::parseAt(const uint8_t* data, size_t size, size_t& consumed) {
    consumed = 0;
    if (size < FIXED_HEADER_SIZE) {
        return Err(ErrorCode::FormatError, "truncated chunk header");
    }
    if (!std::equal(MAGIC, MAGIC + 4, data)) {
        return Err(ErrorCode::FormatError, "bad chunk magic");
    }
    if (data[4] != VERSION) {
        return Err(ErrorCode::FormatError, "unsupported frame version " + std::to_string(data[4]));
    }

    Chunk chunk;
    chunk.flags = data[5];
    chunk.compression = data[6];
    chunk.cipher = data[7];

    if ((chunk.flags & ~KNOWN_FLAGS) != 0) {
        return Err(ErrorCode::FormatError, "unknown chunk flags");
    }
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
    if (chunk.hasStreamDigest() && !chunk.isFinal()) {
        return Err(ErrorCode::FormatError, "stream digest on a non-final chunk");
    }

    chunk.producerIndex = readU64(data + 8);
    uint32_t payloadLength = readU32(data + 16);
    chunk.plaintextLength = readU32(data + 20);
    std::copy(data + 24, data + 56, chunk.checksum.begin());

    if (chunk.plaintextLength > config::MAX_CHUNK_PLAINTEXT) {
        return Err(ErrorCode::TooLarge, "chunk plaintext exceeds " + std::to_string(config::MAX_CHUNK_PLAINTEXT));
    }
    if (payloadLength > config::MAX_FRAME_SIZE) {
        return Err(ErrorCode::TooLarge, "chunk payload too large");
    }

    size_t offset = FIXED_HEADER_SIZE;
    size_t header = chunk.headerSize();
    if (size < header) {
        return Err(ErrorCode::FormatError, "truncated chunk header");
    }
    if (chunk.hasStreamDigest()) {
        std::copy(data + offset, data + offset + DIGEST_SIZE, chunk.streamDigest.begin());
        offset += DIGEST_SIZE;
    }
    if (chunk.isEncrypted()) {
        chunk.salt.assign(data + offset, data + offset + Crypto::SALT_SIZE);
        offset += Crypto::SALT_SIZE;
        chunk.nonce.assign(data + offset, data + offset + Crypto::GCM_IV_SIZE);
        offset += Crypto::GCM_IV_SIZE;
    }

    if (size - offset < payloadLength) {
        return Err(ErrorCode::FormatError, "truncated chunk payload");
    }
    chunk.payload.assign(data + offset, data + offset + payloadLength);
    consumed = offset + payloadLength;
    return chunk;
}

Result<Chunk> ChunkFrame::parse(const std::vector<uint8_t>& data) {
    size_t consumed = 0;
    auto result = parseAt(data.data(), data.size(), consumed);
    if (result && consumed != data.size()) {
        return Err(ErrorCode::FormatError, "trailing bytes after chunk frame");
    }
    return result;
}

Result<std::vector<Chunk>> ChunkFrame::parseSequence(const std::vector<uint8_t>& data) {
    std::vector<Chunk> chunks;
    size_t offset = 0;
    while (offset < data.size()) {
        size_t consumed = 0;
        auto result = parseAt(data.data() + offset, data.size() - offset, consumed);
        if (!result) {
            return result.error();
        }
        chunks.push_back(std::move(result.value()));
        offset += consumed;
    }
    return chunks;
}

} // namespace RelayPipe
