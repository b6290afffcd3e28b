// =============================================================================
// nucpack - Chunk Compressor Property Tests
// =============================================================================
// A chunk is packed, checksummed and compressed with DEFLATE, or with Zstd
// long-distance matching when the chunk is highly repetitive and that stream
// is smaller. Decompression must restore the exact chunk, including N runs.
// =============================================================================

#include "nucpack/algo/chunk_compressor.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "nucpack/algo/generic_codec.h"
#include "nucpack/algo/nucleotide_encoder.h"

namespace nucpack::algo::test {

namespace {

std::string repeat(std::string_view unit, std::size_t times) {
    std::string out;
    for (std::size_t i = 0; i < times; ++i) {
        out += unit;
    }
    return out;
}

}  // namespace

namespace gen {

[[nodiscard]] rc::Gen<std::string> chunk() {
    return rc::gen::nonEmpty(rc::gen::container<std::string>(rc::gen::weightedElement<char>(
        {{10, 'A'}, {10, 'C'}, {10, 'G'}, {10, 'T'}, {1, 'N'}})));
}

}  // namespace gen

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(ChunkCompressorProperty, RoundTrip, ()) {
    const auto chunk = *gen::chunk();
    const ChunkCompressor compressor;

    const auto compressed = compressor.compress(chunk);

    RC_ASSERT(compressed.metadata.originalLength == chunk.size());
    RC_ASSERT(compressed.metadata.compressedLength == compressed.data.size());
    RC_ASSERT(compressed.metadata.qualityScores.size() == chunk.size());
    RC_ASSERT(compressor.decompress(compressed.data, compressed.metadata, 0) == chunk);
}

RC_GTEST_PROP(ChunkCompressorProperty, RepetitiveChunksRoundTrip, ()) {
    const auto unit = *rc::gen::container<std::string>(
        *rc::gen::inRange<std::size_t>(1, 12), rc::gen::element('A', 'C', 'G', 'T'));
    const auto times = *rc::gen::inRange<std::size_t>(50, 400);
    const std::string chunk = repeat(unit, times);
    const ChunkCompressor compressor;

    const auto compressed = compressor.compress(chunk);

    RC_ASSERT(!compressed.metadata.patterns.empty());
    RC_ASSERT(compressor.decompress(compressed.data, compressed.metadata, 0) == chunk);
}

// =============================================================================
// Unit Tests
// =============================================================================

TEST(ChunkCompressorTest, ConfigValidation) {
    ChunkCompressorConfig config;
    EXPECT_TRUE(config.validate().has_value());

    config.deflateLevel = 0;
    EXPECT_FALSE(config.validate().has_value());
    EXPECT_THROW(ChunkCompressor{config}, NucpackException);

    config.deflateLevel = 9;
    config.zstdLevel = 23;
    EXPECT_FALSE(config.validate().has_value());
}

TEST(ChunkCompressorTest, TandemRepeatRecordsPatterns) {
    const std::string chunk = repeat("ACGT", 1000);
    const ChunkCompressor compressor;

    const auto compressed = compressor.compress(chunk);

    EXPECT_FALSE(compressed.metadata.patterns.empty());
    EXPECT_LT(compressed.data.size(), encodedSize(chunk.size()));
    EXPECT_EQ(compressor.decompress(compressed.data, compressed.metadata, 0), chunk);
}

TEST(ChunkCompressorTest, DisabledRepetitivePathUsesDeflate) {
    ChunkCompressorConfig config;
    config.enableRepetitivePath = false;
    const ChunkCompressor compressor(config);

    const auto compressed = compressor.compress(repeat("ACGT", 1000));

    EXPECT_EQ(compressed.metadata.codec, CodecFamily::kDeflate);
}

TEST(ChunkCompressorTest, CodecChoiceIsNeverLarger) {
    const std::string chunk = repeat("AACCGGTTAC", 500);
    const ChunkCompressor compressor;

    const auto compressed = compressor.compress(chunk);
    const auto packed = encodeNucleotides(chunk, compressed.metadata.qualityScores);
    auto deflated = deflateCompress(packed, kDefaultDeflateLevel);
    ASSERT_TRUE(deflated.has_value());

    EXPECT_LE(compressed.data.size(), deflated->size());
}

TEST(ChunkCompressorTest, PreservesAmbiguousRuns) {
    const std::string chunk = "NNNNACGTNNACGTACGTN";
    const ChunkCompressor compressor;

    const auto compressed = compressor.compress(chunk);

    ASSERT_EQ(compressed.metadata.ambiguousRuns.size(), 3u);
    EXPECT_EQ(compressed.metadata.ambiguousRuns[0], (AmbiguousRun{0, 4}));
    EXPECT_EQ(compressed.metadata.ambiguousRuns[2], (AmbiguousRun{18, 1}));
    EXPECT_EQ(compressor.decompress(compressed.data, compressed.metadata, 0), chunk);
}

TEST(ChunkCompressorTest, ChecksumMismatchIsReported) {
    const ChunkCompressor compressor;
    auto compressed = compressor.compress(repeat("ACGTTGCA", 40));
    compressed.metadata.checksum ^= 0x1;

    try {
        (void)compressor.decompress(compressed.data, compressed.metadata, 7);
        FAIL() << "expected ChecksumError";
    } catch (const ChecksumError& e) {
        ASSERT_TRUE(e.expected().has_value());
        ASSERT_TRUE(e.actual().has_value());
        EXPECT_NE(*e.expected(), *e.actual());
        ASSERT_TRUE(e.context().has_value());
        ASSERT_TRUE(e.context()->chunkIndex.has_value());
        EXPECT_EQ(*e.context()->chunkIndex, 7u);
    }
}

TEST(ChunkCompressorTest, CorruptedStreamIsChecksumError) {
    ChunkCompressorConfig config;
    config.enableRepetitivePath = false;
    const ChunkCompressor compressor(config);
    auto compressed = compressor.compress(repeat("ACGTTGCA", 40));
    compressed.data[compressed.data.size() / 2] ^= 0x5A;

    EXPECT_THROW((void)compressor.decompress(compressed.data, compressed.metadata, 0),
                 ChecksumError);
}

TEST(ChunkCompressorTest, LengthMismatchIsFormatError) {
    const ChunkCompressor compressor;
    auto compressed = compressor.compress(repeat("ACGT", 50));
    compressed.data.push_back(0);

    EXPECT_THROW((void)compressor.decompress(compressed.data, compressed.metadata, 0),
                 FormatError);
}

TEST(ChunkCompressorTest, OversizedRecordedLengthIsFormatError) {
    const ChunkCompressor compressor;
    auto compressed = compressor.compress(repeat("ACGT", 50));
    compressed.metadata.originalLength = std::numeric_limits<std::uint64_t>::max();

    try {
        (void)compressor.decompress(compressed.data, compressed.metadata, 3);
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        ASSERT_TRUE(e.context().has_value());
        ASSERT_TRUE(e.context()->chunkIndex.has_value());
        EXPECT_EQ(*e.context()->chunkIndex, 3u);
    }

    compressed.metadata.originalLength = kMaxSequenceLength + 1;
    EXPECT_THROW((void)compressor.decompress(compressed.data, compressed.metadata, 0),
                 FormatError);
}

}  // namespace nucpack::algo::test
