#pragma once

/**
 * @file Compression.h
 * @brief zlib compression of chunk payloads
 *
 * The chunk frame records the plaintext length, so the compressed form is a
 * bare zlib stream with no header of its own.
 */

#include <vector>
#include <cstdint>
#include <cstddef>

namespace RelayPipe {

/**
 * @brief Compression level presets
 */
enum class CompressionLevel {
    None = 0,
    Fast = 1,
    Default = 6,
    Best = 9
};

/**
 * @brief Closed set of compression algorithm ids carried in the chunk frame
 */
enum class CompressionAlgorithm : uint8_t {
    None = 0,
    Zlib = 1
};

class Compression {
public:
    /**
     * @brief Compress data using zlib deflate
     * @return Compressed data, or empty vector when the input is below
     *         MIN_COMPRESS_SIZE, zlib fails, or the result is not smaller
     */
    static std::vector<uint8_t> compress(
        const std::vector<uint8_t>& data,
        CompressionLevel level = CompressionLevel::Default
    );

    /**
     * @brief Inflate a zlib stream whose original size is known
     * @return Decompressed data, or empty vector on failure or size mismatch
     */
    static std::vector<uint8_t> decompress(const std::vector<uint8_t>& data, size_t originalSize);

    /**
     * @brief Quick entropy check on a sample of the data
     */
    static bool isCompressible(const std::vector<uint8_t>& data);

    /**
     * @brief Compressed size as a fraction of the original (0.5 = half)
     */
    static double compressionRatio(size_t originalSize, size_t compressedSize);

    static bool isSupported(uint8_t algorithmId);

    /**
     * @brief Minimum size for compression to be worthwhile
     */
    static constexpr size_t MIN_COMPRESS_SIZE = 256;

    /**
     * @brief Refuse to inflate past this (1GB)
     */
    static constexpr size_t MAX_DECOMPRESSED_SIZE = 1024u * 1024u * 1024u;
};

} // namespace RelayPipe
