// =============================================================================
// nucpack - Bundle Format Definitions
// =============================================================================
// Binary layout of a .npk bundle: one compressed blob plus its chunk metadata.
//
// File Layout:
// +--------------------+
// |   Magic Header     |  (8 magic bytes + version byte)
// +--------------------+
// |   Chunk Count      |  (uint32)
// +--------------------+
// |   Blob             |  (uint64 length + base64 text)
// +--------------------+
// |   Metadata         |  (uint64 raw size + uint64 stored size + Zstd frame)
// +--------------------+
// |   File Footer      |  (xxHash64 of everything above + "NPK_EOF\0")
// +--------------------+
//
// All integers are little-endian. Cache snapshots are not persisted.
// =============================================================================

#ifndef NUCPACK_FORMAT_BUNDLE_FORMAT_H
#define NUCPACK_FORMAT_BUNDLE_FORMAT_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "nucpack/algo/chunk_compressor.h"

namespace nucpack::format {

// =============================================================================
// Magic Header Constants
// =============================================================================

/// @brief Magic number bytes.
/// @note Format: 0x89 'N' 'P' 'K' 0x0D 0x0A 0x1A 0x0A (PNG-style: catches
///       7-bit transfers and line-ending conversion).
inline constexpr std::array<std::uint8_t, 8> kMagicBytes = {
    0x89, 'N', 'P', 'K', 0x0D, 0x0A, 0x1A, 0x0A
};

/// @brief Magic header size (magic bytes + version).
inline constexpr std::size_t kMagicHeaderSize = 9;

/// @brief Current format major version (incompatible changes).
inline constexpr std::uint8_t kFormatVersionMajor = 1;

/// @brief Current format minor version (backward compatible changes).
inline constexpr std::uint8_t kFormatVersionMinor = 0;

/// @brief Encode version as single byte (major:4bit, minor:4bit).
[[nodiscard]] constexpr std::uint8_t encodeVersion(std::uint8_t major, std::uint8_t minor) noexcept {
    return static_cast<std::uint8_t>((major << 4) | (minor & 0x0F));
}

/// @brief Decode major version from version byte.
[[nodiscard]] constexpr std::uint8_t decodeMajorVersion(std::uint8_t version) noexcept {
    return static_cast<std::uint8_t>(version >> 4);
}

/// @brief Decode minor version from version byte.
[[nodiscard]] constexpr std::uint8_t decodeMinorVersion(std::uint8_t version) noexcept {
    return static_cast<std::uint8_t>(version & 0x0F);
}

/// @brief Current format version (encoded).
inline constexpr std::uint8_t kCurrentVersion =
    encodeVersion(kFormatVersionMajor, kFormatVersionMinor);

/// @brief Check whether a version byte can be read by this build.
[[nodiscard]] constexpr bool isVersionCompatible(std::uint8_t version) noexcept {
    return decodeMajorVersion(version) == kFormatVersionMajor;
}

// =============================================================================
// File Footer Constants
// =============================================================================

/// @brief File footer end marker "NPK_EOF\0".
inline constexpr std::array<std::uint8_t, 8> kMagicEnd = {
    'N', 'P', 'K', '_', 'E', 'O', 'F', '\0'
};

/// @brief File footer size (xxHash64 + end marker).
inline constexpr std::size_t kFileFooterSize = 16;

/// @brief Zstd level used for the metadata section.
inline constexpr int kMetadataZstdLevel = 9;

// =============================================================================
// Bundle
// =============================================================================

/// @brief Decoded contents of a bundle.
struct Bundle {
    /// @brief Encoded format version.
    std::uint8_t version = kCurrentVersion;

    /// @brief Base64 blob.
    std::string blob;

    /// @brief Chunk metadata, in chunk order.
    std::vector<algo::ChunkMetadata> metadata;

    /// @brief xxHash64 stored in the footer.
    std::uint64_t checksum = 0;

    /// @brief Serialized size of the metadata section before Zstd.
    std::uint64_t metadataRawSize = 0;

    /// @brief Stored size of the metadata section.
    std::uint64_t metadataStoredSize = 0;
};

/// @brief Serialize a blob and its metadata into bundle bytes.
/// @throws CodecError if the metadata section cannot be compressed.
[[nodiscard]] std::vector<std::uint8_t> encodeBundle(
    std::string_view blob, std::span<const algo::ChunkMetadata> metadata);

/// @brief Parse and validate bundle bytes.
/// @throws FormatError for bad magic, version, marker, or layout.
/// @throws ChecksumError when the footer hash does not match.
[[nodiscard]] Bundle decodeBundle(std::span<const std::uint8_t> data);

}  // namespace nucpack::format

#endif  // NUCPACK_FORMAT_BUNDLE_FORMAT_H
