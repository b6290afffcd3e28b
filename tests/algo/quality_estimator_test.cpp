// =============================================================================
// nucpack - Quality Estimator Tests
// =============================================================================

#include "nucpack/algo/quality_estimator.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <string>
#include <vector>

#include "nucpack/common/types.h"

namespace nucpack::algo {
namespace {

TEST(QualityEstimatorTest, AlternatingBasesGetBaseQuality) {
    const auto scores = estimateQuality("ACGTACGT");

    ASSERT_EQ(scores.size(), 8u);
    for (QualityScore s : scores) {
        EXPECT_EQ(s, kBaseQuality);
    }
}

TEST(QualityEstimatorTest, HomopolymerAndPeriodTwoBonuses) {
    const auto homopolymer = estimateQuality("AAAA");
    const std::vector<QualityScore> expected = {30, 35, 38, 38};
    EXPECT_EQ(homopolymer, expected);

    const auto dinucleotide = estimateQuality("ACAC");
    const std::vector<QualityScore> expectedDi = {30, 30, 33, 33};
    EXPECT_EQ(dinucleotide, expectedDi);
}

TEST(QualityEstimatorTest, EmptySequence) {
    EXPECT_TRUE(estimateQuality("").empty());
    EXPECT_DOUBLE_EQ(meanQuality({}), 0.0);
    EXPECT_DOUBLE_EQ(estimateErrorRate(""), 0.0);
}

TEST(QualityEstimatorTest, MeanAndLowQuality) {
    const std::vector<QualityScore> scores = {30, 35, 38, 38};

    EXPECT_DOUBLE_EQ(meanQuality(scores), 35.25);
    EXPECT_FALSE(hasLowQuality(scores, 30));
    EXPECT_TRUE(hasLowQuality(scores, 31));
}

TEST(QualityEstimatorTest, ErrorRateCountsAmbiguityAndHomopolymers) {
    EXPECT_DOUBLE_EQ(estimateErrorRate("ACGT"), 0.0);
    EXPECT_DOUBLE_EQ(estimateErrorRate("AAAA"), 3 * kHomopolymerErrorPenalty / 4.0);
    EXPECT_DOUBLE_EQ(estimateErrorRate("ANGT"), 0.25);
}

RC_GTEST_PROP(QualityEstimatorProperty, ScoresStayInRange, ()) {
    const auto sequence = *rc::gen::container<std::string>(
        rc::gen::element('A', 'C', 'G', 'T', 'N'));

    const auto scores = estimateQuality(sequence);

    RC_ASSERT(scores.size() == sequence.size());
    for (QualityScore s : scores) {
        RC_ASSERT(s >= kBaseQuality);
        RC_ASSERT(s <= kMaxQuality);
    }
}

}  // namespace
}  // namespace nucpack::algo
