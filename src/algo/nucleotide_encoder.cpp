// =============================================================================
// nucpack - Nucleotide Encoder Implementation
// =============================================================================

#include "nucpack/algo/nucleotide_encoder.h"

#include <fmt/format.h>

namespace nucpack::algo {

namespace {

/// @brief Bases stored per byte in the base region.
constexpr std::size_t kBasesPerByte = 8 / kBitsPerBase;

/// @brief Bit shift of base i inside its byte (first base in the high bits).
constexpr unsigned baseShift(std::size_t i) noexcept {
    return static_cast<unsigned>(6 - kBitsPerBase * (i % kBasesPerByte));
}

}  // namespace

std::vector<std::uint8_t> encodeNucleotides(std::string_view sequence,
                                            std::span<const QualityScore> qualityScores) {
    if (qualityScores.size() != sequence.size()) {
        throw NucpackException(
            ErrorCode::kInvalidArgument,
            fmt::format("quality score count {} does not match sequence length {}",
                        qualityScores.size(), sequence.size()));
    }

    const std::size_t length = sequence.size();
    std::vector<std::uint8_t> out(encodedSize(length), 0);

    for (std::size_t i = 0; i < length; ++i) {
        out[i / kBasesPerByte] |=
            static_cast<std::uint8_t>(baseToCode(sequence[i]) << baseShift(i));
    }

    // Quality region starts right after the last base and is generally not
    // byte aligned: every score straddles two bytes when the shift is non-zero.
    const std::size_t qualityBitStart = length * kBitsPerBase;
    const unsigned shift = static_cast<unsigned>(qualityBitStart % 8);
    std::size_t byteIndex = qualityBitStart / 8;

    for (QualityScore score : qualityScores) {
        if (shift == 0) {
            out[byteIndex] = score;
        } else {
            out[byteIndex] |= static_cast<std::uint8_t>(score >> shift);
            out[byteIndex + 1] |= static_cast<std::uint8_t>(score << (8 - shift));
        }
        ++byteIndex;
    }

    return out;
}

Result<DecodedNucleotides> decodeNucleotides(std::span<const std::uint8_t> data,
                                             std::size_t length) {
    if (data.size() != encodedSize(length)) {
        return makeError<DecodedNucleotides>(
            ErrorCode::kFormatError,
            fmt::format("packed buffer holds {} bytes, expected {} for {} bases", data.size(),
                        encodedSize(length), length));
    }

    DecodedNucleotides decoded;
    decoded.bases.resize(length);
    decoded.qualityScores.resize(length);

    for (std::size_t i = 0; i < length; ++i) {
        const auto code = static_cast<std::uint8_t>((data[i / kBasesPerByte] >> baseShift(i)) & 0x3);
        decoded.bases[i] = codeToBase(code);
    }

    const std::size_t qualityBitStart = length * kBitsPerBase;
    const unsigned shift = static_cast<unsigned>(qualityBitStart % 8);
    std::size_t byteIndex = qualityBitStart / 8;

    for (std::size_t i = 0; i < length; ++i, ++byteIndex) {
        if (shift == 0) {
            decoded.qualityScores[i] = data[byteIndex];
        } else {
            decoded.qualityScores[i] = static_cast<QualityScore>(
                (data[byteIndex] << shift) | (data[byteIndex + 1] >> (8 - shift)));
        }
    }

    return decoded;
}

std::vector<AmbiguousRun> findAmbiguousRuns(std::string_view sequence) {
    std::vector<AmbiguousRun> runs;

    std::size_t i = 0;
    while (i < sequence.size()) {
        if (sequence[i] != kAmbiguousBase && sequence[i] != 'n') {
            ++i;
            continue;
        }
        const std::size_t start = i;
        while (i < sequence.size() && (sequence[i] == kAmbiguousBase || sequence[i] == 'n')) {
            ++i;
        }
        runs.push_back({static_cast<Position>(start), static_cast<std::uint32_t>(i - start)});
    }

    return runs;
}

VoidResult restoreAmbiguousRuns(std::string& bases, std::span<const AmbiguousRun> runs) {
    for (const auto& run : runs) {
        const std::uint64_t end = static_cast<std::uint64_t>(run.start) + run.length;
        if (end > bases.size()) {
            return makeVoidError(
                ErrorCode::kFormatError,
                fmt::format("ambiguous run [{}, {}) exceeds chunk length {}", run.start, end,
                            bases.size()));
        }
        bases.replace(run.start, run.length, run.length, kAmbiguousBase);
    }
    return makeVoidSuccess();
}

}  // namespace nucpack::algo
