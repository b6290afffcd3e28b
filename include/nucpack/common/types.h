// =============================================================================
// nucpack - Common Type Definitions
// =============================================================================
// Core type definitions for the nucpack library.
//
// This module defines:
// - QualityScore, Position, ChunkIndex type aliases
// - PatternMap: repeated substring -> ordered start positions
// - AmbiguousRun: a run of 'N' symbols inside a chunk
// - CompressionType / CodecFamily enums
// - Library-wide defaults (chunk size, quality model, pattern window)
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef NUCPACK_COMMON_TYPES_H
#define NUCPACK_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace nucpack {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Synthesized per-base confidence score in [0, 40].
using QualityScore = std::uint8_t;

/// @brief Position of a base inside a chunk or sequence (0-based).
using Position = std::uint32_t;

/// @brief Index of a chunk in submission order.
using ChunkIndex = std::uint32_t;

/// @brief CRC-32 checksum value.
using Crc32 = std::uint32_t;

/// @brief Repeated substring -> ordered list of its start positions.
/// @note Ordered map so that serialized metadata is deterministic.
using PatternMap = std::map<std::string, std::vector<Position>>;

// =============================================================================
// Sequence Constants
// =============================================================================

/// @brief Minimum accepted sequence length (symbols).
inline constexpr std::size_t kMinSequenceLength = 100;

/// @brief Maximum accepted sequence length (symbols).
/// @note Positions are stored as 32-bit values.
inline constexpr std::size_t kMaxSequenceLength = 1'000'000'000;

/// @brief Default chunk size (symbols per independently compressed chunk).
inline constexpr std::size_t kDefaultChunkSize = 1024 * 1024;

/// @brief Ambiguous base symbol.
inline constexpr char kAmbiguousBase = 'N';

// =============================================================================
// Quality Model Constants
// =============================================================================

/// @brief Score assigned to every base before context bonuses.
inline constexpr QualityScore kBaseQuality = 30;

/// @brief Bonus when a base equals its immediate predecessor.
inline constexpr QualityScore kHomopolymerBonus = 5;

/// @brief Bonus when a base equals the base two positions earlier.
inline constexpr QualityScore kPeriodTwoBonus = 3;

/// @brief Upper bound of a quality score.
inline constexpr QualityScore kMaxQuality = 40;

/// @brief Lower bound of a quality score.
inline constexpr QualityScore kMinQuality = 0;

/// @brief Scores below this value raise a decode-time warning.
inline constexpr QualityScore kDefaultQualityThreshold = 30;

// =============================================================================
// Pattern Detection Constants
// =============================================================================

/// @brief Shortest window scanned for repeats.
inline constexpr std::size_t kDefaultMinPatternLength = 8;

/// @brief Longest window scanned for repeats.
inline constexpr std::size_t kDefaultMaxPatternLength = 32;

/// @brief Patterns need more than this many positions to be retained.
inline constexpr std::size_t kMinPatternOccurrences = 2;

/// @brief A window is a repeat only when it occurs, without overlapping
///        itself, more than this many times.
inline constexpr std::size_t kMinPatternRepeats = 1;

/// @brief Fraction of the sequence length that total pattern occurrences must
///        exceed for a chunk to count as highly repetitive.
inline constexpr double kDefaultRepetitiveFraction = 0.3;

/// @brief Homopolymer penalty used by the error-rate estimate.
inline constexpr double kHomopolymerErrorPenalty = 0.1;

// =============================================================================
// Compression Constants
// =============================================================================

/// @brief Default DEFLATE level (maximum ratio).
inline constexpr int kDefaultDeflateLevel = 9;

/// @brief Default Zstandard level for the repetition-aware path (maximum ratio).
inline constexpr int kDefaultZstdLevel = 22;

/// @brief Largest Zstandard window used, so decoders need no extra parameters.
inline constexpr int kMaxZstdWindowLog = 27;

// =============================================================================
// Compression Type Enumeration
// =============================================================================

/// @brief Compression strategy recorded in chunk metadata.
enum class CompressionType : std::uint8_t {
    /// @brief Back-end chosen per chunk from measured repetitiveness.
    kAdaptive = 0
};

/// @brief Convert CompressionType to string representation.
[[nodiscard]] std::string_view compressionTypeToString(CompressionType type) noexcept;


// =============================================================================
// Codec Family Enumeration
// =============================================================================

/// @brief Generic byte compressor that produced a chunk stream.
enum class CodecFamily : std::uint8_t {
    /// @brief zlib DEFLATE at maximum level (generic path).
    kDeflate = 0,

    /// @brief Zstandard with long-distance matching (repetition-aware path).
    kZstdLong = 1
};

/// @brief Convert CodecFamily to string representation.
[[nodiscard]] std::string_view codecFamilyToString(CodecFamily family) noexcept;

/// @brief Check whether a raw byte names a known codec family.
[[nodiscard]] constexpr bool isKnownCodecFamily(std::uint8_t value) noexcept {
    return value <= static_cast<std::uint8_t>(CodecFamily::kZstdLong);
}

// =============================================================================
// Ambiguous Run
// =============================================================================

/// @brief A maximal run of 'N' symbols inside a chunk.
/// @note The 2-bit stream stores N as A; runs restore it on decode.
struct AmbiguousRun {
    /// @brief Start position inside the chunk.
    Position start = 0;

    /// @brief Number of consecutive 'N' symbols.
    std::uint32_t length = 0;

    bool operator==(const AmbiguousRun&) const = default;
};

}  // namespace nucpack

#endif  // NUCPACK_COMMON_TYPES_H
