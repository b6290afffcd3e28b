// =============================================================================
// nucpack - Genome Codec Implementation
// =============================================================================

#include "nucpack/pipeline/genome_codec.h"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include "nucpack/algo/quality_estimator.h"
#include "nucpack/algo/sequence_validator.h"
#include "nucpack/common/base64.h"
#include "nucpack/common/checksum.h"
#include "nucpack/common/logger.h"

namespace nucpack::pipeline {

// =============================================================================
// Utility Function Implementations
// =============================================================================

std::size_t recommendedThreadCount() noexcept {
    auto hwThreads = std::thread::hardware_concurrency();
    if (hwThreads == 0) {
        return 4;
    }
    return std::min(hwThreads, 32u);
}

// =============================================================================
// CodecConfig Implementation
// =============================================================================

VoidResult CodecConfig::validate() const {
    if (chunkSize == 0) {
        return makeVoidError(ErrorCode::kInvalidArgument, "chunk size must be positive");
    }
    if (qualityThreshold > kMaxQuality) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("quality threshold {} exceeds maximum score {}",
                                         qualityThreshold, kMaxQuality));
    }
    return chunk.validate();
}

std::size_t CodecConfig::effectiveThreads() const noexcept {
    return numThreads > 0 ? numThreads : recommendedThreadCount();
}

// =============================================================================
// GenomeCodecImpl
// =============================================================================

namespace {

/// @brief Decoded blob cut into per-chunk slices.
struct SlicedBlob {
    std::vector<std::uint8_t> bytes;
    std::vector<std::span<const std::uint8_t>> chunks;
};

}  // namespace

class GenomeCodecImpl {
public:
    explicit GenomeCodecImpl(CodecConfig config)
        : config_(std::move(config)), compressor_(config_.chunk) {}

    [[nodiscard]] CompressionResult compress(std::string_view sequence);

    [[nodiscard]] std::string decompress(std::string_view blob,
                                         std::span<const algo::ChunkMetadata> metadata) const;

    [[nodiscard]] std::vector<ChunkVerification> verifyChunks(
        std::string_view blob, std::span<const algo::ChunkMetadata> metadata,
        bool failFast) const;

    [[nodiscard]] std::vector<CompressionStats> stats() const {
        std::lock_guard<std::mutex> lock(statsMutex_);
        return stats_;
    }

    [[nodiscard]] const CodecConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::vector<algo::CompressedChunk> compressChunks(std::string_view sequence);

    [[nodiscard]] SlicedBlob slice(std::string_view blob,
                                   std::span<const algo::ChunkMetadata> metadata) const;

    void warnOnLowQuality(const algo::ChunkMetadata& meta, ChunkIndex index) const;

    CodecConfig config_;
    algo::ChunkCompressor compressor_;

    mutable std::mutex statsMutex_;
    std::vector<CompressionStats> stats_;
};

std::vector<algo::CompressedChunk> GenomeCodecImpl::compressChunks(std::string_view sequence) {
    const std::size_t chunkSize = config_.chunkSize;
    const std::size_t count = GenomeCodec::chunkCount(sequence.size(), chunkSize);
    std::vector<algo::CompressedChunk> slots(count);

    tbb::task_arena arena(static_cast<int>(config_.effectiveThreads()));
    arena.execute([&] {
        tbb::parallel_for(tbb::blocked_range<std::size_t>(0, count),
                          [&](const tbb::blocked_range<std::size_t>& range) {
                              for (std::size_t i = range.begin(); i < range.end(); ++i) {
                                  slots[i] = compressor_.compress(
                                      sequence.substr(i * chunkSize, chunkSize));
                              }
                          });
    });

    return slots;
}

CompressionResult GenomeCodecImpl::compress(std::string_view sequence) {
    const auto start = std::chrono::steady_clock::now();

    const std::string validated = algo::validateSequence(sequence);
    std::vector<algo::CompressedChunk> chunks = compressChunks(validated);

    CompressionResult result;
    result.metadata.reserve(chunks.size());

    std::size_t totalBytes = 0;
    for (const auto& chunk : chunks) {
        totalBytes += chunk.data.size();
    }

    std::vector<std::uint8_t> merged;
    merged.reserve(totalBytes);
    double qualitySum = 0.0;
    double errorSum = 0.0;
    for (auto& chunk : chunks) {
        merged.insert(merged.end(), chunk.data.begin(), chunk.data.end());
        qualitySum += chunk.metadata.meanQuality();
        errorSum += chunk.metadata.errorRate;
        result.metadata.push_back(std::move(chunk.metadata));
    }

    const Crc32 blobChecksum = crc32(merged);
    NUCPACK_LOG_DEBUG("Merged {} chunk streams: {} bytes, CRC-32 0x{:08x}", chunks.size(),
                      merged.size(), blobChecksum);

    result.blob = base64Encode(merged);

    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start);
    const double chunkTotal = static_cast<double>(chunks.size());

    CompressionStats entry;
    entry.originalSize = validated.size();
    entry.compressedSize = result.blob.size();
    entry.compressionRatio =
        static_cast<double>(result.blob.size()) / static_cast<double>(validated.size());
    entry.algorithm = std::string(compressionTypeToString(CompressionType::kAdaptive));
    entry.qualityScore = qualitySum / chunkTotal;
    entry.errorRate = errorSum / chunkTotal;
    entry.compressionTime = elapsed.count();
    entry.chunkCount = static_cast<std::uint32_t>(chunks.size());
    entry.blobChecksum = blobChecksum;

    NUCPACK_LOG_INFO(
        "Compressed {} symbols into {} chunks: {} characters (ratio {:.3f}), mean quality "
        "{:.2f}, mean error rate {:.4f}",
        entry.originalSize, entry.chunkCount, entry.compressedSize, entry.compressionRatio,
        entry.qualityScore, entry.errorRate);

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.push_back(std::move(entry));
    }

    return result;
}

SlicedBlob GenomeCodecImpl::slice(std::string_view blob,
                                  std::span<const algo::ChunkMetadata> metadata) const {
    auto decoded = base64Decode(blob);
    if (!decoded) {
        throw FormatError(fmt::format("blob is not valid base64: {}", decoded.error().message()));
    }

    SlicedBlob sliced;
    sliced.bytes = std::move(*decoded);
    sliced.chunks.reserve(metadata.size());

    std::size_t cursor = 0;
    for (std::size_t i = 0; i < metadata.size(); ++i) {
        const std::uint64_t length = metadata[i].compressedLength;
        if (length > sliced.bytes.size() - cursor) {
            throw FormatError(
                fmt::format("chunk stream of {} bytes runs past the end of the blob", length),
                ErrorContext{}.withChunk(static_cast<ChunkIndex>(i)).withOffset(cursor));
        }
        sliced.chunks.emplace_back(sliced.bytes.data() + cursor,
                                   static_cast<std::size_t>(length));
        cursor += static_cast<std::size_t>(length);
    }

    if (cursor != sliced.bytes.size()) {
        throw FormatError(fmt::format("{} trailing bytes after the last chunk",
                                      sliced.bytes.size() - cursor),
                          ErrorContext{}.withOffset(cursor));
    }

    return sliced;
}

void GenomeCodecImpl::warnOnLowQuality(const algo::ChunkMetadata& meta, ChunkIndex index) const {
    if (algo::hasLowQuality(meta.qualityScores, config_.qualityThreshold)) {
        NUCPACK_LOG_WARNING("Chunk {} has quality scores below {}", index,
                            static_cast<unsigned>(config_.qualityThreshold));
    }
}

std::string GenomeCodecImpl::decompress(std::string_view blob,
                                        std::span<const algo::ChunkMetadata> metadata) const {
    const SlicedBlob sliced = slice(blob, metadata);

    // Recorded lengths are untrusted until each chunk decodes; reserve only a
    // total that a valid sequence could have.
    std::uint64_t totalLength = 0;
    for (const auto& meta : metadata) {
        totalLength += std::min<std::uint64_t>(meta.originalLength, kMaxSequenceLength + 1);
    }

    std::string sequence;
    if (totalLength <= kMaxSequenceLength) {
        sequence.reserve(static_cast<std::size_t>(totalLength));
    }
    for (std::size_t i = 0; i < metadata.size(); ++i) {
        const auto index = static_cast<ChunkIndex>(i);
        sequence += compressor_.decompress(sliced.chunks[i], metadata[i], index);
        warnOnLowQuality(metadata[i], index);
    }

    NUCPACK_LOG_DEBUG("Decompressed {} chunks into {} symbols", metadata.size(),
                      sequence.size());
    return sequence;
}

std::vector<ChunkVerification> GenomeCodecImpl::verifyChunks(
    std::string_view blob, std::span<const algo::ChunkMetadata> metadata,
    bool failFast) const {
    const SlicedBlob sliced = slice(blob, metadata);

    std::vector<ChunkVerification> report;
    report.reserve(metadata.size());
    for (std::size_t i = 0; i < metadata.size(); ++i) {
        ChunkVerification entry;
        entry.index = static_cast<ChunkIndex>(i);
        try {
            const std::string chunk = compressor_.decompress(sliced.chunks[i], metadata[i],
                                                             entry.index);
            if (chunk.size() != metadata[i].originalLength) {
                throw FormatError(fmt::format("chunk decoded to {} symbols, expected {}",
                                              chunk.size(), metadata[i].originalLength),
                                  ErrorContext{}.withChunk(entry.index));
            }
            entry.ok = true;
        } catch (const NucpackException& e) {
            entry.code = e.code();
            entry.message = e.what();
        }
        const bool failed = !entry.ok;
        report.push_back(std::move(entry));
        if (failed && failFast) {
            break;
        }
    }
    return report;
}

// =============================================================================
// GenomeCodec - Public Interface Implementation
// =============================================================================

GenomeCodec::GenomeCodec(CodecConfig config) {
    unwrapOrThrow(config.validate());
    impl_ = std::make_unique<GenomeCodecImpl>(std::move(config));
}

GenomeCodec::~GenomeCodec() = default;

GenomeCodec::GenomeCodec(GenomeCodec&&) noexcept = default;

GenomeCodec& GenomeCodec::operator=(GenomeCodec&&) noexcept = default;

CompressionResult GenomeCodec::compress(std::string_view sequence) {
    return impl_->compress(sequence);
}

std::string GenomeCodec::decompress(std::string_view blob,
                                    std::span<const algo::ChunkMetadata> metadata) const {
    return impl_->decompress(blob, metadata);
}

std::vector<ChunkVerification> GenomeCodec::verifyChunks(
    std::string_view blob, std::span<const algo::ChunkMetadata> metadata, bool failFast) const {
    return impl_->verifyChunks(blob, metadata, failFast);
}

std::vector<CompressionStats> GenomeCodec::getStats() const {
    return impl_->stats();
}

const CodecConfig& GenomeCodec::config() const noexcept {
    return impl_->config();
}

std::size_t GenomeCodec::chunkCount(std::size_t length, std::size_t chunkSize) noexcept {
    if (chunkSize == 0) {
        return 0;
    }
    return (length + chunkSize - 1) / chunkSize;
}

}  // namespace nucpack::pipeline
