// =============================================================================
// nucpack - Sequence Validator
// =============================================================================
// Admits or rejects raw nucleotide input before anything is compressed.
//
// A sequence is accepted when it is:
// - non-empty and at least kMinSequenceLength symbols long
// - no longer than kMaxSequenceLength symbols
// - made only of A, C, G, T, N (case-insensitive)
//
// Accepted input is returned uppercased; that normalized text is what the
// encoder and pattern detector see.
// =============================================================================

#ifndef NUCPACK_ALGO_SEQUENCE_VALIDATOR_H
#define NUCPACK_ALGO_SEQUENCE_VALIDATOR_H

#include <string>
#include <string_view>

#include "nucpack/common/error.h"

namespace nucpack::algo {

/// @brief Check whether a (case-insensitive) symbol belongs to {A,C,G,T,N}.
[[nodiscard]] constexpr bool isNucleotideSymbol(char c) noexcept {
    switch (c) {
        case 'A': case 'C': case 'G': case 'T': case 'N':
        case 'a': case 'c': case 'g': case 't': case 'n':
            return true;
        default:
            return false;
    }
}

/// @brief Check whether an uppercase symbol is one of the four concrete bases.
[[nodiscard]] constexpr bool isConcreteBase(char c) noexcept {
    return c == 'A' || c == 'C' || c == 'G' || c == 'T';
}

/// @brief Uppercase a nucleotide text (ASCII only).
[[nodiscard]] std::string toUpperSequence(std::string_view sequence);

/// @brief Check a sequence without throwing.
/// @return kInvalidSequence naming the first problem, or success.
[[nodiscard]] VoidResult checkSequence(std::string_view sequence);

/// @brief Validate and normalize a sequence.
/// @return The uppercased sequence.
/// @throws InvalidSequenceError for empty, too short, too long or
///         non-nucleotide input.
[[nodiscard]] std::string validateSequence(std::string_view sequence);

/// @brief Drop every symbol outside {A,C,G,T,N} and uppercase the rest.
/// @note Used by the cache-augmented pipeline before validation.
[[nodiscard]] std::string cleanSequence(std::string_view raw);

}  // namespace nucpack::algo

#endif  // NUCPACK_ALGO_SEQUENCE_VALIDATOR_H
