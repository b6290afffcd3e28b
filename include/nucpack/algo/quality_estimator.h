// =============================================================================
// nucpack - Quality Estimator
// =============================================================================
// Synthesizes a per-base confidence score from local sequence context.
//
// Model (deterministic, never persisted apart from its sequence):
//   score = 30
//         + 5 if the base equals its immediate predecessor (homopolymer run)
//         + 3 if the base equals the base two positions earlier
//   clamped to [0, 40]
//
// This is a synthetic proxy, not an instrument quality value.
//
// The module also hosts the error-rate estimate:
//   (non-ACGT count + 0.1 * positions repeating their predecessor) / length
// =============================================================================

#ifndef NUCPACK_ALGO_QUALITY_ESTIMATOR_H
#define NUCPACK_ALGO_QUALITY_ESTIMATOR_H

#include <span>
#include <string_view>
#include <vector>

#include "nucpack/common/types.h"

namespace nucpack::algo {

/// @brief Estimate one quality score per base.
/// @return Vector with the same length as the sequence.
[[nodiscard]] std::vector<QualityScore> estimateQuality(std::string_view sequence);

/// @brief Arithmetic mean of a score list (0 for an empty list).
[[nodiscard]] double meanQuality(std::span<const QualityScore> scores) noexcept;

/// @brief Check whether any score is below a threshold.
[[nodiscard]] bool hasLowQuality(std::span<const QualityScore> scores,
                                 QualityScore threshold) noexcept;

/// @brief Estimated error rate of a sequence (0 for an empty sequence).
[[nodiscard]] double estimateErrorRate(std::string_view sequence) noexcept;

}  // namespace nucpack::algo

#endif  // NUCPACK_ALGO_QUALITY_ESTIMATOR_H
