// =============================================================================
// nucpack - Chunk Compressor
// =============================================================================
// Compresses one chunk of a validated sequence and assembles its metadata.
//
// Per chunk:
// 1. Estimate quality scores and pack bases + scores (NucleotideEncoder)
// 2. Detect repeated patterns (PatternDetector)
// 3. Adaptive step:
//    - not repetitive -> DEFLATE at maximum level
//    - highly repetitive -> Zstandard with long-distance matching, kept only
//      when it beats DEFLATE on this chunk
// 4. CRC-32 of the *pre-compression* packed buffer, original and compressed
//    lengths, patterns, scores, N runs and error-rate estimate -> metadata
//
// Chunks share no state, so one ChunkCompressor can serve many worker
// threads concurrently.
// =============================================================================

#ifndef NUCPACK_ALGO_CHUNK_COMPRESSOR_H
#define NUCPACK_ALGO_CHUNK_COMPRESSOR_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "nucpack/algo/pattern_detector.h"
#include "nucpack/common/error.h"
#include "nucpack/common/types.h"

namespace nucpack::pipeline {
struct CacheSnapshot;
}  // namespace nucpack::pipeline

namespace nucpack::algo {

// =============================================================================
// Chunk Metadata
// =============================================================================

/// @brief Everything needed to decode one chunk of a blob.
/// @note Metadata lists are ordered exactly like the chunks; decoding walks
///       them in that order to locate each chunk's bytes.
struct ChunkMetadata {
    /// @brief Number of symbols in the chunk.
    std::uint64_t originalLength = 0;

    /// @brief Size of the chunk's compressed stream inside the decoded blob.
    std::uint64_t compressedLength = 0;

    /// @brief Retained repeats of the chunk (positions relative to the chunk).
    PatternMap patterns;

    /// @brief CRC-32 of the packed buffer before compression.
    Crc32 checksum = 0;

    /// @brief Synthesized per-base scores.
    std::vector<QualityScore> qualityScores;

    /// @brief Compression strategy.
    CompressionType compressionType = CompressionType::kAdaptive;

    /// @brief Back-end that produced the stream.
    CodecFamily codec = CodecFamily::kDeflate;

    /// @brief Estimated error rate of the chunk.
    double errorRate = 0.0;

    /// @brief Runs of 'N' collapsed onto 'A' by the 2-bit encoding.
    std::vector<AmbiguousRun> ambiguousRuns;

    /// @brief Snapshot of the pipeline caches (null when the codec is used directly).
    std::shared_ptr<const pipeline::CacheSnapshot> cacheSnapshot;

    /// @brief Mean of the chunk's quality scores.
    [[nodiscard]] double meanQuality() const noexcept;
};

/// @brief A compressed chunk and its metadata.
struct CompressedChunk {
    /// @brief Compressed stream.
    std::vector<std::uint8_t> data;

    /// @brief Metadata describing the stream.
    ChunkMetadata metadata;
};

// =============================================================================
// Chunk Compressor Configuration
// =============================================================================

/// @brief Configuration for chunk compression.
struct ChunkCompressorConfig {
    /// @brief Repeat detection settings.
    PatternDetectorConfig patterns;

    /// @brief zlib level for the generic path (1-9).
    int deflateLevel = kDefaultDeflateLevel;

    /// @brief Zstandard level for the repetition-aware path.
    int zstdLevel = kDefaultZstdLevel;

    /// @brief Enable the repetition-aware path (DEFLATE only when false).
    bool enableRepetitivePath = true;

    /// @brief Validate configuration.
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Chunk Compressor Class
// =============================================================================

/// @brief Compresses and decompresses single chunks.
class ChunkCompressor {
public:
    /// @brief Construct with configuration.
    /// @throws NucpackException (kInvalidArgument) for an invalid configuration.
    explicit ChunkCompressor(ChunkCompressorConfig config = {});

    /// @brief Compress one chunk.
    /// @param chunk Uppercase symbols over {A,C,G,T,N}.
    /// @throws CodecError if a back-end fails.
    [[nodiscard]] CompressedChunk compress(std::string_view chunk) const;

    /// @brief Decompress one chunk and verify its checksum.
    /// @param data The chunk's compressed stream.
    /// @param metadata The chunk's metadata.
    /// @param index Chunk index (error context only).
    /// @return The chunk's symbols, with 'N' restored.
    /// @throws ChecksumError if the stream is corrupt or the CRC-32 differs.
    /// @throws FormatError if the metadata is inconsistent.
    [[nodiscard]] std::string decompress(std::span<const std::uint8_t> data,
                                         const ChunkMetadata& metadata,
                                         ChunkIndex index) const;

    /// @brief Get current configuration.
    [[nodiscard]] const ChunkCompressorConfig& config() const noexcept { return config_; }

private:
    ChunkCompressorConfig config_;
    PatternDetector detector_;
};

}  // namespace nucpack::algo

#endif  // NUCPACK_ALGO_CHUNK_COMPRESSOR_H
