// =============================================================================
// nucpack - Compression Pipeline
// =============================================================================
// Cache-augmented front end to GenomeCodec:
// 1. Uppercase the input and drop every symbol outside {A,C,G,T,N}
// 2. Validate the cleaned sequence (caches stay untouched on rejection)
// 3. Merge the sequence's repeats into the pattern cache
// 4. Record its quality scores under an xxHash64 content hash
// 5. Compress through GenomeCodec
// 6. Stamp a snapshot of both caches onto every chunk's metadata
// =============================================================================

#ifndef NUCPACK_PIPELINE_COMPRESSION_PIPELINE_H
#define NUCPACK_PIPELINE_COMPRESSION_PIPELINE_H

#include <memory>
#include <string_view>

#include "nucpack/pipeline/genome_codec.h"
#include "nucpack/pipeline/sequence_cache.h"

namespace nucpack::pipeline {

/// @brief GenomeCodec plus shared pattern and quality caches.
///
/// Usage:
/// @code
/// auto cache = std::make_shared<SequenceCache>();
/// CompressionPipeline pipeline(CodecConfig{}, cache);
/// auto result = pipeline.process(rawText);
/// @endcode
class CompressionPipeline {
public:
    /// @brief Construct with codec configuration and an optional shared cache.
    /// @param cache Cache to use; a private one is created when null.
    explicit CompressionPipeline(CodecConfig config = {},
                                 std::shared_ptr<SequenceCache> cache = nullptr);

    /// @brief Clean, cache and compress a raw sequence.
    /// @throws InvalidSequenceError if the cleaned sequence is rejected.
    [[nodiscard]] CompressionResult process(std::string_view raw);

    /// @brief Underlying codec (for decompression and stats).
    [[nodiscard]] GenomeCodec& codec() noexcept { return codec_; }
    [[nodiscard]] const GenomeCodec& codec() const noexcept { return codec_; }

    /// @brief Caches used by this pipeline.
    [[nodiscard]] const SequenceCache& cache() const noexcept { return *cache_; }

private:
    GenomeCodec codec_;
    std::shared_ptr<SequenceCache> cache_;
};

}  // namespace nucpack::pipeline

#endif  // NUCPACK_PIPELINE_COMPRESSION_PIPELINE_H
