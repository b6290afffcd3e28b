// =============================================================================
// nucpack - Generic Byte Codecs
// =============================================================================
// Thin wrappers over the two general-purpose compressors used for chunk
// streams:
// - kDeflate:  zlib compress2/uncompress (default level 9)
// - kZstdLong: Zstandard with long-distance matching, window sized to the
//              input so every earlier repeat inside a chunk is reachable
//
// Decompression always knows the exact expected size (derived from the chunk
// length), so a size mismatch is reported as corruption.
// =============================================================================

#ifndef NUCPACK_ALGO_GENERIC_CODEC_H
#define NUCPACK_ALGO_GENERIC_CODEC_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "nucpack/common/error.h"
#include "nucpack/common/types.h"

namespace nucpack::algo {

/// @brief Compress with zlib DEFLATE.
/// @param level zlib level (1-9).
/// @return Compressed bytes, or kCodecError.
[[nodiscard]] Result<std::vector<std::uint8_t>> deflateCompress(
    std::span<const std::uint8_t> data, int level);

/// @brief Decompress a zlib stream of known decompressed size.
/// @return Decompressed bytes, or kCorruptedData.
[[nodiscard]] Result<std::vector<std::uint8_t>> deflateDecompress(
    std::span<const std::uint8_t> data, std::size_t expectedSize);

/// @brief Compress with Zstandard, long-distance matching enabled.
/// @param level Zstandard level (1 to ZSTD_maxCLevel()).
/// @return Compressed bytes, or kCodecError.
[[nodiscard]] Result<std::vector<std::uint8_t>> zstdLongCompress(
    std::span<const std::uint8_t> data, int level);

/// @brief Decompress a Zstandard frame of known decompressed size.
/// @return Decompressed bytes, or kCorruptedData.
[[nodiscard]] Result<std::vector<std::uint8_t>> zstdDecompress(
    std::span<const std::uint8_t> data, std::size_t expectedSize);

/// @brief Decompress with the given family.
[[nodiscard]] Result<std::vector<std::uint8_t>> decompressWith(
    CodecFamily family, std::span<const std::uint8_t> data, std::size_t expectedSize);

/// @brief Zstandard window log that covers an input of the given size.
[[nodiscard]] int zstdWindowLogFor(std::size_t inputSize) noexcept;

}  // namespace nucpack::algo

#endif  // NUCPACK_ALGO_GENERIC_CODEC_H
