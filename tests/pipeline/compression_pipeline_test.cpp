// =============================================================================
// nucpack - Compression Pipeline and Sequence Cache Tests
// =============================================================================

#include "nucpack/pipeline/compression_pipeline.h"

#include <gtest/gtest.h>

#include <cctype>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "nucpack/algo/quality_estimator.h"
#include "nucpack/common/checksum.h"
#include "nucpack/common/error.h"

namespace nucpack::pipeline {
namespace {

std::string repeat(std::string_view unit, std::size_t times) {
    std::string out;
    for (std::size_t i = 0; i < times; ++i) {
        out += unit;
    }
    return out;
}

CodecConfig smallChunks(std::size_t chunkSize) {
    CodecConfig config;
    config.chunkSize = chunkSize;
    config.numThreads = 2;
    return config;
}

// =============================================================================
// SequenceCache
// =============================================================================

TEST(SequenceCacheTest, MergesPatternsAndReplacesQualities) {
    SequenceCache cache;
    PatternMap first;
    first["ACGTACGT"] = {0, 4, 8};
    PatternMap second;
    second["ACGTACGT"] = {100};
    second["TTTTTTTT"] = {1, 2, 3};

    cache.mergePatterns(first);
    cache.mergePatterns(second);
    cache.recordQuality("k", {30, 30});
    cache.recordQuality("k", {35});

    EXPECT_EQ(cache.patternCount(), 2u);
    EXPECT_EQ(cache.qualityCount(), 1u);

    const auto snapshot = cache.snapshot();
    EXPECT_EQ(snapshot->patterns.at("ACGTACGT").size(), 4u);
    const std::vector<QualityScore> latest = {35};
    EXPECT_EQ(snapshot->qualities.at("k"), latest);
}

TEST(SequenceCacheTest, SnapshotIsIsolatedFromLaterWrites) {
    SequenceCache cache;
    cache.recordQuality("a", {30});

    const auto before = cache.snapshot();
    cache.recordQuality("b", {31});

    EXPECT_EQ(before->qualities.size(), 1u);
    EXPECT_EQ(cache.snapshot()->qualities.size(), 2u);
}

TEST(SequenceCacheTest, ConcurrentWriters) {
    SequenceCache cache;
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&cache, t] {
            for (int i = 0; i < 100; ++i) {
                PatternMap patterns;
                patterns["AAAAAAAA"] = {static_cast<Position>(i)};
                cache.mergePatterns(patterns);
                cache.recordQuality(std::to_string(t * 1000 + i), {30});
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(cache.patternCount(), 1u);
    EXPECT_EQ(cache.snapshot()->patterns.at("AAAAAAAA").size(), 400u);
    EXPECT_EQ(cache.qualityCount(), 400u);
}

// =============================================================================
// CompressionPipeline
// =============================================================================

TEST(CompressionPipelineTest, CleansInputBeforeCompressing) {
    const std::string clean = repeat("ACGTN", 40);
    std::string dirty;
    for (char c : clean) {
        dirty.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        dirty += " 1\n";
    }
    CompressionPipeline pipeline(smallChunks(64));

    const auto result = pipeline.process(dirty);

    EXPECT_EQ(pipeline.codec().decompress(result.blob, result.metadata), clean);
}

TEST(CompressionPipelineTest, RecordsPatternsAndQualityInCache) {
    const std::string sequence = repeat("ACGT", 250);
    CompressionPipeline pipeline(smallChunks(400));

    const auto result = pipeline.process(sequence);

    EXPECT_GT(pipeline.cache().patternCount(), 0u);
    ASSERT_EQ(pipeline.cache().qualityCount(), 1u);

    const auto snapshot = pipeline.cache().snapshot();
    const auto& scores = snapshot->qualities.at(contentHash(sequence));
    EXPECT_EQ(scores, algo::estimateQuality(sequence));
}

TEST(CompressionPipelineTest, StampsSnapshotOnEveryChunk) {
    CompressionPipeline pipeline(smallChunks(100));

    const auto result = pipeline.process(repeat("GATTACA", 50));

    ASSERT_EQ(result.metadata.size(), 4u);
    const auto& first = result.metadata.front().cacheSnapshot;
    ASSERT_NE(first, nullptr);
    for (const auto& meta : result.metadata) {
        EXPECT_EQ(meta.cacheSnapshot, first);
    }
    EXPECT_EQ(first->qualities.size(), 1u);
}

TEST(CompressionPipelineTest, RejectedInputLeavesCachesUntouched) {
    CompressionPipeline pipeline;

    EXPECT_THROW((void)pipeline.process(""), InvalidSequenceError);
    EXPECT_THROW((void)pipeline.process("123"), InvalidSequenceError);
    EXPECT_THROW((void)pipeline.process("ACGT xyz"), InvalidSequenceError);

    EXPECT_EQ(pipeline.cache().patternCount(), 0u);
    EXPECT_EQ(pipeline.cache().qualityCount(), 0u);
    EXPECT_TRUE(pipeline.codec().getStats().empty());
}

TEST(CompressionPipelineTest, SharedCacheAcrossPipelines) {
    auto cache = std::make_shared<SequenceCache>();
    CompressionPipeline first(smallChunks(512), cache);
    CompressionPipeline second(smallChunks(512), cache);

    (void)first.process(repeat("ACGT", 100));
    (void)second.process(repeat("TTGCA", 100));
    (void)second.process(repeat("ACGT", 100));

    EXPECT_EQ(cache->qualityCount(), 2u);
    EXPECT_EQ(first.codec().getStats().size(), 1u);
    EXPECT_EQ(second.codec().getStats().size(), 2u);
}

}  // namespace
}  // namespace nucpack::pipeline
