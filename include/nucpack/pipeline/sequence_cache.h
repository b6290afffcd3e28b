// =============================================================================
// nucpack - Sequence Cache
// =============================================================================
// Process-lifetime caches shared by compression pipeline calls:
// - pattern cache: repeated substring -> accumulated start positions
// - quality cache: content hash of a cleaned sequence -> its quality scores
//
// Entries are only ever added or extended. All access is serialized by one
// mutex, so a cache may be shared by several pipelines and threads.
// =============================================================================

#ifndef NUCPACK_PIPELINE_SEQUENCE_CACHE_H
#define NUCPACK_PIPELINE_SEQUENCE_CACHE_H

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "nucpack/common/types.h"

namespace nucpack::pipeline {

/// @brief Immutable copy of both caches at one point in time.
struct CacheSnapshot {
    PatternMap patterns;
    std::map<std::string, std::vector<QualityScore>> qualities;
};

/// @brief Mutex-guarded pattern and quality caches.
class SequenceCache {
public:
    SequenceCache() = default;

    // Non-copyable (owns a mutex)
    SequenceCache(const SequenceCache&) = delete;
    SequenceCache& operator=(const SequenceCache&) = delete;

    /// @brief Append newly found pattern positions, key by key.
    void mergePatterns(const PatternMap& patterns);

    /// @brief Record (or replace) the scores of a sequence under its content hash.
    void recordQuality(std::string key, std::vector<QualityScore> scores);

    /// @brief Take a consistent copy of both caches.
    [[nodiscard]] std::shared_ptr<const CacheSnapshot> snapshot() const;

    /// @brief Number of distinct cached patterns.
    [[nodiscard]] std::size_t patternCount() const;

    /// @brief Number of cached quality entries.
    [[nodiscard]] std::size_t qualityCount() const;

private:
    mutable std::mutex mutex_;
    PatternMap patterns_;
    std::map<std::string, std::vector<QualityScore>> qualities_;
};

}  // namespace nucpack::pipeline

#endif  // NUCPACK_PIPELINE_SEQUENCE_CACHE_H
