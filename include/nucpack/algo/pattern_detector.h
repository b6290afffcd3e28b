// =============================================================================
// nucpack - Pattern Detector
// =============================================================================
// Finds repeated substrings and classifies how repetitive a chunk is.
//
// For every window length L in [minLength, maxLength] and every start index
// i (0 <= i <= n - L), the substring s[i, i+L) is recorded under its own key
// when a left-to-right scan finds it more than once without overlap (after a
// match at j the scan resumes at j + L). Only substrings with more than two
// recorded positions are kept.
//
// The scan is exhaustive per window length (hash-counted, so roughly linear
// in n per length), which is affordable at chunk granularity.
//
// A sequence is highly repetitive when the total number of recorded
// positions across all patterns exceeds repetitiveFraction * n.
// =============================================================================

#ifndef NUCPACK_ALGO_PATTERN_DETECTOR_H
#define NUCPACK_ALGO_PATTERN_DETECTOR_H

#include <cstddef>
#include <string_view>

#include "nucpack/common/error.h"
#include "nucpack/common/types.h"

namespace nucpack::algo {

// =============================================================================
// Pattern Detector Configuration
// =============================================================================

/// @brief Configuration for pattern detection.
struct PatternDetectorConfig {
    /// @brief Shortest window length scanned.
    std::size_t minLength = kDefaultMinPatternLength;

    /// @brief Longest window length scanned.
    std::size_t maxLength = kDefaultMaxPatternLength;

    /// @brief Repetitiveness threshold as a fraction of sequence length.
    double repetitiveFraction = kDefaultRepetitiveFraction;

    /// @brief Validate configuration.
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Pattern Detector Class
// =============================================================================

/// @brief Repeat finder used by the chunk compressor and the pipeline cache.
///
/// Usage:
/// @code
/// PatternDetector detector;
/// auto patterns = detector.findPatterns(chunk);
/// if (detector.isHighlyRepetitive(patterns, chunk.size())) {
///     // take the repetition-aware path
/// }
/// @endcode
class PatternDetector {
public:
    /// @brief Construct with configuration.
    /// @throws NucpackException (kInvalidArgument) for an invalid configuration.
    explicit PatternDetector(PatternDetectorConfig config = {});

    /// @brief Find all retained patterns of a sequence.
    [[nodiscard]] PatternMap findPatterns(std::string_view sequence) const;

    /// @brief Classify a sequence, scanning it for patterns first.
    [[nodiscard]] bool isHighlyRepetitive(std::string_view sequence) const;

    /// @brief Classify a sequence from an already computed pattern map.
    /// @param patterns Result of findPatterns() on the sequence.
    /// @param length Sequence length.
    [[nodiscard]] bool isHighlyRepetitive(const PatternMap& patterns,
                                          std::size_t length) const noexcept;

    /// @brief Total number of recorded positions across all patterns.
    [[nodiscard]] static std::size_t totalOccurrences(const PatternMap& patterns) noexcept;

    /// @brief Get current configuration.
    [[nodiscard]] const PatternDetectorConfig& config() const noexcept { return config_; }

private:
    PatternDetectorConfig config_;
};

/// @brief Append the positions of `source` to those of `target`, key by key.
/// @note Existing position lists grow; keys new to `target` are inserted.
void mergePatterns(PatternMap& target, const PatternMap& source);

}  // namespace nucpack::algo

#endif  // NUCPACK_ALGO_PATTERN_DETECTOR_H
