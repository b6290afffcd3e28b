// =============================================================================
// nucpack - Nucleotide Encoder
// =============================================================================
// Packs bases and their quality scores into one dense bit buffer.
//
// Bit layout (MSB-first, big-endian byte order):
//
//   | b0 b1 ... b(n-1) | q0 q1 ... q(n-1) | pad |
//     2 bits per base    8 bits per score   0-7 zero bits
//
//   A=00  C=01  G=10  T=11  (any other symbol, notably N, is stored as 00)
//
// Encoded size is ceil(10 * n / 8) bytes. Because N collapses onto A, the
// positions of N are carried separately as AmbiguousRun records and restored
// after unpacking.
// =============================================================================

#ifndef NUCPACK_ALGO_NUCLEOTIDE_ENCODER_H
#define NUCPACK_ALGO_NUCLEOTIDE_ENCODER_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "nucpack/common/error.h"
#include "nucpack/common/types.h"

namespace nucpack::algo {

/// @brief Bits used per base in the packed stream.
inline constexpr std::size_t kBitsPerBase = 2;

/// @brief Bits used per quality score in the packed stream.
inline constexpr std::size_t kBitsPerQuality = 8;

/// @brief Encoded byte size for a sequence of the given length.
[[nodiscard]] constexpr std::size_t encodedSize(std::size_t length) noexcept {
    return (length * (kBitsPerBase + kBitsPerQuality) + 7) / 8;
}

/// @brief 2-bit code of a base (N and unknown symbols map to 0).
[[nodiscard]] constexpr std::uint8_t baseToCode(char base) noexcept {
    switch (base) {
        case 'C': case 'c':
            return 1;
        case 'G': case 'g':
            return 2;
        case 'T': case 't':
            return 3;
        default:
            return 0;
    }
}

/// @brief Base for a 2-bit code.
[[nodiscard]] constexpr char codeToBase(std::uint8_t code) noexcept {
    constexpr char kBases[4] = {'A', 'C', 'G', 'T'};
    return kBases[code & 0x3];
}

/// @brief Bases and scores recovered from a packed buffer.
struct DecodedNucleotides {
    /// @brief Bases over {A,C,G,T} (N not yet restored).
    std::string bases;

    /// @brief Quality scores in positional order.
    std::vector<QualityScore> qualityScores;
};

/// @brief Pack a sequence and its quality scores.
/// @throws NucpackException (kInvalidArgument) if the score count differs
///         from the sequence length.
[[nodiscard]] std::vector<std::uint8_t> encodeNucleotides(
    std::string_view sequence,
    std::span<const QualityScore> qualityScores);

/// @brief Unpack a buffer produced by encodeNucleotides().
/// @param data Packed bytes.
/// @param length Number of bases the buffer holds.
/// @return Decoded bases and scores, or kFormatError if the buffer size does
///         not match encodedSize(length).
[[nodiscard]] Result<DecodedNucleotides> decodeNucleotides(
    std::span<const std::uint8_t> data,
    std::size_t length);

/// @brief Collect the maximal runs of 'N' in a sequence.
[[nodiscard]] std::vector<AmbiguousRun> findAmbiguousRuns(std::string_view sequence);

/// @brief Write 'N' back over the recorded runs.
/// @return kFormatError if a run reaches past the end of the bases.
[[nodiscard]] VoidResult restoreAmbiguousRuns(std::string& bases,
                                              std::span<const AmbiguousRun> runs);

}  // namespace nucpack::algo

#endif  // NUCPACK_ALGO_NUCLEOTIDE_ENCODER_H
