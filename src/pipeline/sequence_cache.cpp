// =============================================================================
// nucpack - Sequence Cache Implementation
// =============================================================================

#include "nucpack/pipeline/sequence_cache.h"

#include <utility>

#include "nucpack/algo/pattern_detector.h"

namespace nucpack::pipeline {

void SequenceCache::mergePatterns(const PatternMap& patterns) {
    std::lock_guard<std::mutex> lock(mutex_);
    algo::mergePatterns(patterns_, patterns);
}

void SequenceCache::recordQuality(std::string key, std::vector<QualityScore> scores) {
    std::lock_guard<std::mutex> lock(mutex_);
    qualities_.insert_or_assign(std::move(key), std::move(scores));
}

std::shared_ptr<const CacheSnapshot> SequenceCache::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto copy = std::make_shared<CacheSnapshot>();
    copy->patterns = patterns_;
    copy->qualities = qualities_;
    return copy;
}

std::size_t SequenceCache::patternCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return patterns_.size();
}

std::size_t SequenceCache::qualityCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return qualities_.size();
}

}  // namespace nucpack::pipeline
