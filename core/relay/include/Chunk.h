#pragma once

/**
 * @file Chunk.h
 * @brief Chunk record and its self-delimiting wire frame
 *
 * Frame layout (big-endian):
 *   0   magic "RPCK"
 *   4   frame version
 *   5   flags
 *   6   compression algorithm id
 *   7   cipher algorithm id
 *   8   producer index (u64)
 *   16  payload length (u32)
 *   20  plaintext length (u32)
 *   24  checksum (32 bytes)
 *   56  stream digest (32 bytes, FLAG_STREAM_DIGEST only)
 *   ..  salt (16) + nonce (12), FLAG_ENCRYPTED only
 *   ..  payload
 *
 * Everything before the payload is the GCM additional authenticated data.
 */

#include "Result.h"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace RelayPipe {

enum ChunkFlags : uint8_t {
    FLAG_COMPRESSED = 0x01,
    FLAG_ENCRYPTED = 0x02,
    FLAG_FINAL = 0x04,
    FLAG_STREAM_DIGEST = 0x08
};

struct Chunk {
    uint64_t sequence = 0;          // assigned by the channel store
    std::string producerId;         // X-Producer-Id, not part of the frame
    uint64_t producerIndex = 0;
    uint8_t flags = 0;
    uint8_t compression = 0;
    uint8_t cipher = 0;
    uint32_t plaintextLength = 0;
    std::array<uint8_t, 32> checksum{};
    std::array<uint8_t, 32> streamDigest{};
    std::vector<uint8_t> salt;
    std::vector<uint8_t> nonce;
    std::vector<uint8_t> payload;

    bool isCompressed() const { return (flags & FLAG_COMPRESSED) != 0; }
    bool isEncrypted() const { return (flags & FLAG_ENCRYPTED) != 0; }
    bool isFinal() const { return (flags & FLAG_FINAL) != 0; }
    bool hasStreamDigest() const { return (flags & FLAG_STREAM_DIGEST) != 0; }

    size_t headerSize() const;
    size_t frameSize() const { return headerSize() + payload.size(); }
};

class ChunkFrame {
public:
    static constexpr uint8_t MAGIC[4] = {'R', 'P', 'C', 'K'};
    static constexpr uint8_t VERSION = 1;
    static constexpr size_t FIXED_HEADER_SIZE = 56;
    static constexpr size_t DIGEST_SIZE = 32;
    static constexpr uint8_t KNOWN_FLAGS = FLAG_COMPRESSED | FLAG_ENCRYPTED | FLAG_FINAL | FLAG_STREAM_DIGEST;

    static std::vector<uint8_t> serialize(const Chunk& chunk);
    static void appendTo(const Chunk& chunk, std::vector<uint8_t>& out);

    /**
     * @brief Header bytes as they will appear on the wire for a payload of
     *        the given length; used as AAD before the payload exists
     */
    static std::vector<uint8_t> headerBytes(const Chunk& chunk, uint32_t payloadLength);

    /**
     * @brief Parse exactly one frame; trailing bytes are a FormatError
     */
    static Result<Chunk> parse(const std::vector<uint8_t>& data);

    /**
     * @brief Parse a concatenation of frames (PEEK response body)
     */
    static Result<std::vector<Chunk>> parseSequence(const std::vector<uint8_t>& data);

private:
    static Result<Chunk> parseAt(const uint8_t* data, size_t size, size_t& consumed);
};

} // namespace RelayPipe
