// =============================================================================
// nucpack - Genome Codec
// =============================================================================
// Chunk orchestration and decoding for whole sequences.
//
// Compression:
// 1. Validate the sequence (fails fast, nothing is compressed)
// 2. Split into chunkSize slices (the last may be shorter)
// 3. Compress all chunks in parallel on a bounded oneTBB arena, collecting
//    results by chunk index
// 4. Concatenate the chunk streams in chunk order, CRC-32 the concatenation
// 5. Base64-encode and record CompressionStats
//
// Decompression walks the metadata in order, slicing compressedLength bytes per
// chunk out of the decoded blob, and aborts on the first checksum mismatch.
//
// The codec itself is stateless apart from the stats history, whose appends
// are serialized, so one instance may be shared between threads.
// =============================================================================

#ifndef NUCPACK_PIPELINE_GENOME_CODEC_H
#define NUCPACK_PIPELINE_GENOME_CODEC_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "nucpack/algo/chunk_compressor.h"
#include "nucpack/common/error.h"
#include "nucpack/common/types.h"

namespace nucpack::pipeline {

// =============================================================================
// Forward Declarations
// =============================================================================

class GenomeCodecImpl;

// =============================================================================
// Configuration
// =============================================================================

/// @brief Codec configuration.
struct CodecConfig {
    /// @brief Symbols per independently compressed chunk.
    std::size_t chunkSize = kDefaultChunkSize;

    /// @brief Number of worker threads (0 = auto-detect).
    std::size_t numThreads = 0;

    /// @brief Scores below this value raise a warning on decode.
    QualityScore qualityThreshold = kDefaultQualityThreshold;

    /// @brief Per-chunk compression settings.
    algo::ChunkCompressorConfig chunk;

    /// @brief Validate configuration.
    [[nodiscard]] VoidResult validate() const;

    /// @brief Get effective number of threads.
    [[nodiscard]] std::size_t effectiveThreads() const noexcept;
};

/// @brief Recommended worker count for this machine.
[[nodiscard]] std::size_t recommendedThreadCount() noexcept;

// =============================================================================
// Results and Statistics
// =============================================================================

/// @brief Statistics of one successful compression.
struct CompressionStats {
    /// @brief Input length in symbols.
    std::uint64_t originalSize = 0;

    /// @brief Blob length in characters.
    std::uint64_t compressedSize = 0;

    /// @brief Blob characters per input symbol.
    /// @note An approximation: the blob is base64 text, not raw bytes.
    double compressionRatio = 0.0;

    /// @brief Strategy name.
    std::string algorithm;

    /// @brief Mean over chunks of each chunk's mean quality score.
    double qualityScore = 0.0;

    /// @brief Mean over chunks of each chunk's error rate.
    double errorRate = 0.0;

    /// @brief Wall-clock compression time (seconds).
    double compressionTime = 0.0;

    /// @brief Number of chunks produced.
    std::uint32_t chunkCount = 0;

    /// @brief CRC-32 of the concatenated chunk streams.
    Crc32 blobChecksum = 0;
};

/// @brief Output of one compression.
struct CompressionResult {
    /// @brief Base64 text of the concatenated chunk streams.
    std::string blob;

    /// @brief One entry per chunk, in chunk order.
    std::vector<algo::ChunkMetadata> metadata;
};

/// @brief Outcome of verifying one chunk.
struct ChunkVerification {
    ChunkIndex index = 0;
    bool ok = false;
    ErrorCode code = ErrorCode::kSuccess;
    std::string message;
};

// =============================================================================
// Genome Codec
// =============================================================================

/// @brief Parallel chunked codec for nucleotide sequences.
///
/// Usage:
/// @code
/// CodecConfig config;
/// config.numThreads = 4;
///
/// GenomeCodec codec(config);
/// auto [blob, metadata] = codec.compress(sequence);
/// std::string restored = codec.decompress(blob, metadata);
/// @endcode
class GenomeCodec {
public:
    /// @brief Construct with configuration.
    /// @throws NucpackException (kInvalidArgument) for an invalid configuration.
    explicit GenomeCodec(CodecConfig config = {});

    /// @brief Destructor
    ~GenomeCodec();

    // Non-copyable, movable
    GenomeCodec(const GenomeCodec&) = delete;
    GenomeCodec& operator=(const GenomeCodec&) = delete;
    GenomeCodec(GenomeCodec&&) noexcept;
    GenomeCodec& operator=(GenomeCodec&&) noexcept;

    /// @brief Compress a sequence.
    /// @throws InvalidSequenceError if the sequence is rejected.
    /// @throws CodecError if a back-end fails inside a worker.
    [[nodiscard]] CompressionResult compress(std::string_view sequence);

    /// @brief Restore a sequence from a blob and its metadata.
    /// @throws FormatError for malformed text or inconsistent metadata.
    /// @throws ChecksumError when a chunk fails its CRC-32.
    [[nodiscard]] std::string decompress(std::string_view blob,
                                         std::span<const algo::ChunkMetadata> metadata) const;

    /// @brief Decode every chunk independently and report per-chunk status.
    /// @param failFast Stop after the first failing chunk.
    /// @throws FormatError when the blob itself cannot be decoded or sliced.
    [[nodiscard]] std::vector<ChunkVerification> verifyChunks(
        std::string_view blob, std::span<const algo::ChunkMetadata> metadata,
        bool failFast = false) const;

    /// @brief Snapshot of the stats history, one entry per compression.
    [[nodiscard]] std::vector<CompressionStats> getStats() const;

    /// @brief Get current configuration.
    [[nodiscard]] const CodecConfig& config() const noexcept;

    /// @brief Number of chunks a sequence of `length` symbols splits into.
    [[nodiscard]] static std::size_t chunkCount(std::size_t length,
                                                std::size_t chunkSize) noexcept;

private:
    std::unique_ptr<GenomeCodecImpl> impl_;
};

}  // namespace nucpack::pipeline

#endif  // NUCPACK_PIPELINE_GENOME_CODEC_H
