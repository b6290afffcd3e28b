// =============================================================================
// nucpack - Chunk Compressor Implementation
// =============================================================================

#include "nucpack/algo/chunk_compressor.h"

#include <utility>

#include <fmt/format.h>

#include "nucpack/algo/generic_codec.h"
#include "nucpack/algo/nucleotide_encoder.h"
#include "nucpack/algo/quality_estimator.h"
#include "nucpack/common/checksum.h"
#include "nucpack/common/logger.h"

namespace nucpack::algo {

// =============================================================================
// ChunkMetadata Implementation
// =============================================================================

double ChunkMetadata::meanQuality() const noexcept {
    return algo::meanQuality(qualityScores);
}

// =============================================================================
// ChunkCompressorConfig Implementation
// =============================================================================

VoidResult ChunkCompressorConfig::validate() const {
    if (auto result = patterns.validate(); !result) {
        return result;
    }
    if (deflateLevel < 1 || deflateLevel > 9) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("DEFLATE level must be 1-9, got {}", deflateLevel));
    }
    if (zstdLevel < 1 || zstdLevel > kDefaultZstdLevel) {
        return makeVoidError(
            ErrorCode::kInvalidArgument,
            fmt::format("Zstd level must be 1-{}, got {}", kDefaultZstdLevel, zstdLevel));
    }
    return makeVoidSuccess();
}

// =============================================================================
// ChunkCompressor Implementation
// =============================================================================

ChunkCompressor::ChunkCompressor(ChunkCompressorConfig config)
    : config_(std::move(config)), detector_(config_.patterns) {
    unwrapOrThrow(config_.validate());
}

CompressedChunk ChunkCompressor::compress(std::string_view chunk) const {
    CompressedChunk result;
    ChunkMetadata& meta = result.metadata;

    meta.originalLength = chunk.size();
    meta.compressionType = CompressionType::kAdaptive;
    meta.qualityScores = estimateQuality(chunk);
    meta.errorRate = estimateErrorRate(chunk);
    meta.ambiguousRuns = findAmbiguousRuns(chunk);

    const std::vector<std::uint8_t> packed = encodeNucleotides(chunk, meta.qualityScores);
    meta.checksum = crc32(packed);

    meta.patterns = detector_.findPatterns(chunk);
    const bool repetitive = config_.enableRepetitivePath &&
                            detector_.isHighlyRepetitive(meta.patterns, chunk.size());

    auto deflated = deflateCompress(packed, config_.deflateLevel);
    if (!deflated) {
        throw CodecError(deflated.error().message());
    }
    result.data = std::move(*deflated);
    meta.codec = CodecFamily::kDeflate;

    if (repetitive) {
        auto zstd = zstdLongCompress(packed, config_.zstdLevel);
        if (!zstd) {
            throw CodecError(zstd.error().message());
        }
        if (zstd->size() < result.data.size()) {
            result.data = std::move(*zstd);
            meta.codec = CodecFamily::kZstdLong;
        }
    }

    meta.compressedLength = result.data.size();

    NUCPACK_LOG_TRACE("Chunk of {} symbols: {} patterns, repetitive={}, codec={}, {} -> {} bytes",
                      chunk.size(), meta.patterns.size(), repetitive,
                      codecFamilyToString(meta.codec), packed.size(), result.data.size());
    return result;
}

std::string ChunkCompressor::decompress(std::span<const std::uint8_t> data,
                                        const ChunkMetadata& metadata, ChunkIndex index) const {
    if (data.size() != metadata.compressedLength) {
        throw FormatError(fmt::format("chunk stream holds {} bytes, metadata records {}",
                                      data.size(), metadata.compressedLength),
                          ErrorContext{}.withChunk(index));
    }

    if (metadata.originalLength > kMaxSequenceLength) {
        throw FormatError(fmt::format("chunk records {} symbols, limit is {}",
                                      metadata.originalLength, kMaxSequenceLength),
                          ErrorContext{}.withChunk(index));
    }

    const std::size_t length = static_cast<std::size_t>(metadata.originalLength);
    auto packed = decompressWith(metadata.codec, data, encodedSize(length));
    if (!packed) {
        if (packed.error().code() == ErrorCode::kCorruptedData) {
            throw ChecksumError(packed.error().message(), ErrorContext{}.withChunk(index));
        }
        throw FormatError(packed.error().message(), ErrorContext{}.withChunk(index));
    }

    const Crc32 actual = crc32(*packed);
    if (actual != metadata.checksum) {
        throw ChecksumError(metadata.checksum, actual, ErrorContext{}.withChunk(index));
    }

    auto decoded = decodeNucleotides(*packed, length);
    if (!decoded) {
        throw FormatError(decoded.error().message(), ErrorContext{}.withChunk(index));
    }

    if (auto restored = restoreAmbiguousRuns(decoded->bases, metadata.ambiguousRuns);
        !restored) {
        throw FormatError(restored.error().message(), ErrorContext{}.withChunk(index));
    }

    return std::move(decoded->bases);
}

}  // namespace nucpack::algo
