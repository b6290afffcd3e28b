// =============================================================================
// nucpack - Sequence Validator Tests
// =============================================================================

#include "nucpack/algo/sequence_validator.h"

#include <gtest/gtest.h>

#include <string>

#include "nucpack/common/error.h"
#include "nucpack/common/types.h"

namespace nucpack::algo {
namespace {

std::string repeat(std::string_view unit, std::size_t times) {
    std::string out;
    out.reserve(unit.size() * times);
    for (std::size_t i = 0; i < times; ++i) {
        out += unit;
    }
    return out;
}

TEST(SequenceValidatorTest, SymbolClassification) {
    for (char c : std::string_view("ACGTNacgtn")) {
        EXPECT_TRUE(isNucleotideSymbol(c)) << c;
    }
    for (char c : std::string_view("XU1 -*\n")) {
        EXPECT_FALSE(isNucleotideSymbol(c)) << c;
    }
    EXPECT_TRUE(isConcreteBase('G'));
    EXPECT_FALSE(isConcreteBase('N'));
    EXPECT_FALSE(isConcreteBase('g'));
}

TEST(SequenceValidatorTest, AcceptsMixedCaseAndUppercases) {
    const std::string input = repeat("acgTN", 20);

    const std::string validated = validateSequence(input);

    EXPECT_EQ(validated, repeat("ACGTN", 20));
    EXPECT_TRUE(checkSequence(input).has_value());
}

TEST(SequenceValidatorTest, RejectsEmpty) {
    EXPECT_THROW((void)validateSequence(""), InvalidSequenceError);

    auto result = checkSequence("");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidSequence);
}

TEST(SequenceValidatorTest, RejectsNonNucleotideSymbolWithPosition) {
    std::string input = repeat("ACGT", 30);
    input[42] = 'X';

    try {
        (void)validateSequence(input);
        FAIL() << "expected InvalidSequenceError";
    } catch (const InvalidSequenceError& e) {
        ASSERT_TRUE(e.position().has_value());
        EXPECT_EQ(*e.position(), 42u);
        EXPECT_NE(e.message().find("'X'"), std::string::npos);
    }
}

TEST(SequenceValidatorTest, DigitsAreRejected) {
    EXPECT_THROW((void)validateSequence("123"), InvalidSequenceError);
}

TEST(SequenceValidatorTest, EnforcesMinimumLength) {
    EXPECT_THROW((void)validateSequence(std::string(kMinSequenceLength - 1, 'A')),
                 InvalidSequenceError);
    EXPECT_NO_THROW((void)validateSequence(std::string(kMinSequenceLength, 'A')));
}

TEST(SequenceValidatorTest, CleanDropsForeignSymbols) {
    EXPECT_EQ(cleanSequence("ac gT\nNx-u"), "ACGTN");
    EXPECT_EQ(cleanSequence("1234"), "");
    EXPECT_EQ(toUpperSequence("acgtn"), "ACGTN");
}

}  // namespace
}  // namespace nucpack::algo
