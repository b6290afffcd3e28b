// =============================================================================
// nucpack - Checksum Utilities
// =============================================================================
// - CRC-32 (zlib) for chunk and blob integrity
// - xxHash64 for content hashing (pipeline cache keys, bundle footer)
// =============================================================================

#ifndef NUCPACK_COMMON_CHECKSUM_H
#define NUCPACK_COMMON_CHECKSUM_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "nucpack/common/types.h"

namespace nucpack {

/// @brief CRC-32 (IEEE 802.3, as computed by zlib) of a byte range.
[[nodiscard]] Crc32 crc32(std::span<const std::uint8_t> data) noexcept;

/// @brief Continue a running CRC-32 with another byte range.
[[nodiscard]] Crc32 crc32Update(Crc32 crc, std::span<const std::uint8_t> data) noexcept;

/// @brief xxHash64 of a byte range.
[[nodiscard]] std::uint64_t xxhash64(const void* data, std::size_t size,
                                     std::uint64_t seed = 0) noexcept;

/// @brief xxHash64 of a text, rendered as 16 lowercase hex digits.
[[nodiscard]] std::string contentHash(std::string_view text);

}  // namespace nucpack

#endif  // NUCPACK_COMMON_CHECKSUM_H
