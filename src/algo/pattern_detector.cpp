// =============================================================================
// nucpack - Pattern Detector Implementation
// =============================================================================

#include "nucpack/algo/pattern_detector.h"

#include <unordered_map>
#include <vector>

#include <fmt/format.h>

namespace nucpack::algo {

namespace {

struct WindowTally {
    std::size_t starts = 0;
    std::size_t repeats = 0;
    std::size_t lastRepeat = 0;
};

}  // namespace

// =============================================================================
// PatternDetectorConfig Implementation
// =============================================================================

VoidResult PatternDetectorConfig::validate() const {
    if (minLength == 0) {
        return makeVoidError(ErrorCode::kInvalidArgument, "minimum pattern length must be positive");
    }
    if (maxLength < minLength) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("maximum pattern length {} is below minimum {}",
                                         maxLength, minLength));
    }
    if (maxLength > 255) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("maximum pattern length {} exceeds 255", maxLength));
    }
    if (!(repetitiveFraction >= 0.0)) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             "repetitive fraction must be a non-negative number");
    }
    return makeVoidSuccess();
}

// =============================================================================
// PatternDetector Implementation
// =============================================================================

PatternDetector::PatternDetector(PatternDetectorConfig config) : config_(config) {
    unwrapOrThrow(config_.validate());
}

PatternMap PatternDetector::findPatterns(std::string_view sequence) const {
    PatternMap patterns;
    const std::size_t n = sequence.size();

    for (std::size_t length = config_.minLength; length <= config_.maxLength; ++length) {
        if (length > n) {
            break;
        }
        const std::size_t windows = n - length + 1;

        // Pass 1: tally every window. Starts arrive in ascending order, so a
        // start at or past the last counted start plus the window length is
        // the next non-overlapping match of a left-to-right scan.
        std::unordered_map<std::string_view, WindowTally> tallies;
        tallies.reserve(windows);
        for (std::size_t i = 0; i < windows; ++i) {
            auto& tally = tallies[sequence.substr(i, length)];
            ++tally.starts;
            if (tally.repeats == 0 || i >= tally.lastRepeat + length) {
                ++tally.repeats;
                tally.lastRepeat = i;
            }
        }

        // Pass 2: materialize positions only for windows that survive both filters.
        std::unordered_map<std::string_view, std::vector<Position>> positions;
        for (std::size_t i = 0; i < windows; ++i) {
            const std::string_view window = sequence.substr(i, length);
            const auto& tally = tallies[window];
            if (tally.repeats > kMinPatternRepeats && tally.starts > kMinPatternOccurrences) {
                positions[window].push_back(static_cast<Position>(i));
            }
        }

        for (auto& [window, starts] : positions) {
            patterns.emplace(std::string(window), std::move(starts));
        }
    }

    return patterns;
}

bool PatternDetector::isHighlyRepetitive(std::string_view sequence) const {
    return isHighlyRepetitive(findPatterns(sequence), sequence.size());
}

bool PatternDetector::isHighlyRepetitive(const PatternMap& patterns,
                                         std::size_t length) const noexcept {
    return static_cast<double>(totalOccurrences(patterns)) >
           static_cast<double>(length) * config_.repetitiveFraction;
}

std::size_t PatternDetector::totalOccurrences(const PatternMap& patterns) noexcept {
    std::size_t total = 0;
    for (const auto& [pattern, starts] : patterns) {
        total += starts.size();
    }
    return total;
}

void mergePatterns(PatternMap& target, const PatternMap& source) {
    for (const auto& [pattern, starts] : source) {
        auto& existing = target[pattern];
        existing.insert(existing.end(), starts.begin(), starts.end());
    }
}

}  // namespace nucpack::algo
