// =============================================================================
// nucpack - Sequence Validator Implementation
// =============================================================================

#include "nucpack/algo/sequence_validator.h"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

#include "nucpack/common/types.h"

namespace nucpack::algo {

namespace {

/// @brief Printable rendering of a rejected symbol for error messages.
std::string describeSymbol(char c) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isprint(uc) != 0) {
        return fmt::format("'{}'", c);
    }
    return fmt::format("0x{:02x}", uc);
}

}  // namespace

std::string toUpperSequence(std::string_view sequence) {
    std::string upper(sequence);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

VoidResult checkSequence(std::string_view sequence) {
    if (sequence.empty()) {
        return makeVoidError(ErrorCode::kInvalidSequence, "sequence is empty");
    }

    const auto invalid = std::find_if(sequence.begin(), sequence.end(),
                                      [](char c) { return !isNucleotideSymbol(c); });
    if (invalid != sequence.end()) {
        const auto position = static_cast<std::size_t>(invalid - sequence.begin());
        return makeVoidError(ErrorCode::kInvalidSequence,
                             fmt::format("invalid symbol {} at position {}",
                                         describeSymbol(*invalid), position));
    }

    if (sequence.size() < kMinSequenceLength) {
        return makeVoidError(ErrorCode::kInvalidSequence,
                             fmt::format("sequence length {} is below the minimum of {}",
                                         sequence.size(), kMinSequenceLength));
    }

    if (sequence.size() > kMaxSequenceLength) {
        return makeVoidError(ErrorCode::kInvalidSequence,
                             fmt::format("sequence length {} exceeds the maximum of {}",
                                         sequence.size(), kMaxSequenceLength));
    }

    return makeVoidSuccess();
}

std::string validateSequence(std::string_view sequence) {
    if (sequence.empty()) {
        throw InvalidSequenceError("sequence is empty");
    }

    const auto invalid = std::find_if(sequence.begin(), sequence.end(),
                                      [](char c) { return !isNucleotideSymbol(c); });
    if (invalid != sequence.end()) {
        const auto position = static_cast<std::uint64_t>(invalid - sequence.begin());
        throw InvalidSequenceError(
            fmt::format("invalid symbol {} at position {}", describeSymbol(*invalid), position),
            position);
    }

    unwrapOrThrow(checkSequence(sequence));
    return toUpperSequence(sequence);
}

std::string cleanSequence(std::string_view raw) {
    std::string cleaned;
    cleaned.reserve(raw.size());
    for (char c : raw) {
        if (isNucleotideSymbol(c)) {
            cleaned.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }
    return cleaned;
}

}  // namespace nucpack::algo
