// =============================================================================
// nucpack - Base64 Tests
// =============================================================================

#include "nucpack/common/base64.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

namespace nucpack {
namespace {

std::vector<std::uint8_t> bytesOf(std::string_view text) {
    return {text.begin(), text.end()};
}

// =============================================================================
// Encoding
// =============================================================================

TEST(Base64Test, EncodesKnownVectors) {
    EXPECT_EQ(base64Encode(bytesOf("")), "");
    EXPECT_EQ(base64Encode(bytesOf("f")), "Zg==");
    EXPECT_EQ(base64Encode(bytesOf("fo")), "Zm8=");
    EXPECT_EQ(base64Encode(bytesOf("foo")), "Zm9v");
    EXPECT_EQ(base64Encode(bytesOf("foob")), "Zm9vYg==");
    EXPECT_EQ(base64Encode(bytesOf("foobar")), "Zm9vYmFy");
}

TEST(Base64Test, EncodesHighBytes) {
    const std::vector<std::uint8_t> data = {0xFF, 0xFE, 0x00};
    EXPECT_EQ(base64Encode(data), "//4A");
}

TEST(Base64Test, EncodedLengthMatchesOutput) {
    for (std::size_t n = 0; n < 16; ++n) {
        const std::vector<std::uint8_t> data(n, 0x5A);
        EXPECT_EQ(base64Encode(data).size(), base64EncodedLength(n)) << "n=" << n;
    }
}

// =============================================================================
// Decoding
// =============================================================================

TEST(Base64Test, DecodesKnownVectors) {
    auto decoded = base64Decode("Zm9vYg==");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, bytesOf("foob"));

    auto empty = base64Decode("");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST(Base64Test, RejectsLengthNotMultipleOfFour) {
    auto decoded = base64Decode("Zm9");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kFormatError);
}

TEST(Base64Test, RejectsSymbolsOutsideAlphabet) {
    auto decoded = base64Decode("Zm9*");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kFormatError);
}

TEST(Base64Test, RejectsPaddingBeforeLastQuad) {
    auto decoded = base64Decode("Zg==Zg==");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kFormatError);
}

RC_GTEST_PROP(Base64Property, DecodeInvertsEncode, (const std::vector<std::uint8_t>& data)) {
    const std::string text = base64Encode(data);
    RC_ASSERT(text.size() % 4 == 0);

    auto decoded = base64Decode(text);
    RC_ASSERT(decoded.has_value());
    RC_ASSERT(*decoded == data);
}

}  // namespace
}  // namespace nucpack
