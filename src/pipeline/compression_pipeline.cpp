// =============================================================================
// nucpack - Compression Pipeline Implementation
// =============================================================================

#include "nucpack/pipeline/compression_pipeline.h"

#include <utility>

#include "nucpack/algo/pattern_detector.h"
#include "nucpack/algo/quality_estimator.h"
#include "nucpack/algo/sequence_validator.h"
#include "nucpack/common/checksum.h"
#include "nucpack/common/logger.h"

namespace nucpack::pipeline {

CompressionPipeline::CompressionPipeline(CodecConfig config, std::shared_ptr<SequenceCache> cache)
    : codec_(std::move(config)),
      cache_(cache ? std::move(cache) : std::make_shared<SequenceCache>()) {}

CompressionResult CompressionPipeline::process(std::string_view raw) {
    const std::string cleaned = algo::cleanSequence(raw);
    if (cleaned.size() != raw.size()) {
        NUCPACK_LOG_DEBUG("Dropped {} symbols outside ACGTN", raw.size() - cleaned.size());
    }
    unwrapOrThrow(algo::checkSequence(cleaned));

    const algo::PatternDetector detector(codec_.config().chunk.patterns);
    cache_->mergePatterns(detector.findPatterns(cleaned));
    cache_->recordQuality(contentHash(cleaned), algo::estimateQuality(cleaned));

    CompressionResult result = codec_.compress(cleaned);

    auto snapshot = cache_->snapshot();
    for (auto& meta : result.metadata) {
        meta.cacheSnapshot = snapshot;
    }

    NUCPACK_LOG_DEBUG("Pipeline caches: {} patterns, {} quality entries",
                      snapshot->patterns.size(), snapshot->qualities.size());
    return result;
}

}  // namespace nucpack::pipeline
