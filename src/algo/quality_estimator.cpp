// =============================================================================
// nucpack - Quality Estimator Implementation
// =============================================================================

#include "nucpack/algo/quality_estimator.h"

#include <algorithm>
#include <numeric>

#include "nucpack/algo/sequence_validator.h"

namespace nucpack::algo {

std::vector<QualityScore> estimateQuality(std::string_view sequence) {
    std::vector<QualityScore> scores;
    scores.reserve(sequence.size());

    for (std::size_t i = 0; i < sequence.size(); ++i) {
        int score = kBaseQuality;
        if (i > 0 && sequence[i] == sequence[i - 1]) {
            score += kHomopolymerBonus;
        }
        if (i > 1 && sequence[i] == sequence[i - 2]) {
            score += kPeriodTwoBonus;
        }
        score = std::clamp<int>(score, kMinQuality, kMaxQuality);
        scores.push_back(static_cast<QualityScore>(score));
    }

    return scores;
}

double meanQuality(std::span<const QualityScore> scores) noexcept {
    if (scores.empty()) {
        return 0.0;
    }
    const auto total = std::accumulate(scores.begin(), scores.end(), std::uint64_t{0});
    return static_cast<double>(total) / static_cast<double>(scores.size());
}

bool hasLowQuality(std::span<const QualityScore> scores, QualityScore threshold) noexcept {
    return std::any_of(scores.begin(), scores.end(),
                       [threshold](QualityScore s) { return s < threshold; });
}

double estimateErrorRate(std::string_view sequence) noexcept {
    if (sequence.empty()) {
        return 0.0;
    }

    double errors = 0.0;
    for (std::size_t i = 0; i < sequence.size(); ++i) {
        if (!isConcreteBase(sequence[i])) {
            errors += 1.0;
        }
        if (i > 0 && sequence[i] == sequence[i - 1]) {
            errors += kHomopolymerErrorPenalty;
        }
    }
    return errors / static_cast<double>(sequence.size());
}

}  // namespace nucpack::algo
