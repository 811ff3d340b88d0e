#include "Compression.h"
#include <zlib.h>
#include <algorithm>

namespace RelayPipe {

std::vector<uint8_t> Compression::compress(
    const std::vector<uint8_t>& data,
    CompressionLevel level
) {
    if (data.empty() || data.size() < MIN_COMPRESS_SIZE) {
        return {}; // Too small to compress
    }

    uLongf compressedSize = compressBound(static_cast<uLong>(data.size()));
    std::vector<uint8_t> compressed(compressedSize);

    int result = compress2(
        compressed.data(),
        &compressedSize,
        data.data(),
        static_cast<uLong>(data.size()),
        static_cast<int>(level)
    );

    if (result != Z_OK) {
        return {};
    }

    compressed.resize(compressedSize);

    // Only return compressed data if it's actually smaller
    if (compressed.size() >= data.size()) {
        return {};
    }

    return compressed;
}

std::vector<uint8_t> Compression::decompress(const std::vector<uint8_t>& data, size_t originalSize) {
    if (data.empty() || originalSize == 0 || originalSize > MAX_DECOMPRESSED_SIZE) {
        return {};
    }

    std::vector<uint8_t> decompressed(originalSize);
    uLongf destLen = static_cast<uLongf>(originalSize);

    int result = uncompress(
        decompressed.data(),
        &destLen,
        data.data(),
        static_cast<uLong>(data.size())
    );

    if (result != Z_OK || destLen != originalSize) {
        return {};
    }

    return decompressed;
}

bool Compression::isCompressible(const std::vector<uint8_t>& data) {
    if (data.size() < MIN_COMPRESS_SIZE) {
        return false;
    }

    // High entropy (random/encrypted) data doesn't compress well
    constexpr size_t sampleSize = 256;
    size_t checkSize = std::min(data.size(), sampleSize);

    bool seen[256] = {false};
    int uniqueBytes = 0;

    for (size_t i = 0; i < checkSize; ++i) {
        if (!seen[data[i]]) {
            seen[data[i]] = true;
            ++uniqueBytes;
        }
    }

    double entropyRatio = static_cast<double>(uniqueBytes) / 256.0;
    return entropyRatio < 0.9;
}

double Compression::compressionRatio(size_t originalSize, size_t compressedSize) {
    if (originalSize == 0) return 1.0;
    return static_cast<double>(compressedSize) / static_cast<double>(originalSize);
}

bool Compression::isSupported(uint8_t algorithmId) {
    switch (static_cast<CompressionAlgorithm>(algorithmId)) {
        case CompressionAlgorithm::None:
        case CompressionAlgorithm::Zlib:
            return true;
        default:
            return false;
    }
}

} // namespace RelayPipe
