// =============================================================================
// nucpack - Bundle Format Property Tests
// =============================================================================
// A bundle written by encodeBundle/BundleWriter must read back to the same
// blob and chunk metadata, and any damage to the file must be detected before
// chunk data is handed to the codec.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <vector>

#include "nucpack/format/bundle_format.h"
#include "nucpack/format/bundle_reader.h"
#include "nucpack/format/bundle_writer.h"
#include "nucpack/pipeline/genome_codec.h"

namespace nucpack::format::test {

// =============================================================================
// Test Utilities
// =============================================================================

/// @brief Generate a temporary file path for testing.
[[nodiscard]] std::filesystem::path tempFilePath() {
    static std::atomic<int> counter{0};
    auto path = std::filesystem::temp_directory_path() /
                ("nucpack_test_" + std::to_string(counter++) + "_" +
                 std::to_string(std::random_device{}()) + ".npk");
    return path;
}

/// @brief RAII cleanup for temporary files.
class TempFileGuard {
public:
    explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        std::filesystem::remove(path_.string() + ".tmp", ec);
    }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

namespace {

std::string repeat(std::string_view unit, std::size_t times) {
    std::string out;
    for (std::size_t i = 0; i < times; ++i) {
        out += unit;
    }
    return out;
}

pipeline::CompressionResult compressSample(std::string_view sequence, std::size_t chunkSize) {
    pipeline::CodecConfig config;
    config.chunkSize = chunkSize;
    config.numThreads = 2;
    pipeline::GenomeCodec codec(config);
    return codec.compress(sequence);
}

/// @brief Offset of the first blob character (magic + version + count + length).
constexpr std::size_t kBlobOffset = kMagicHeaderSize + sizeof(std::uint32_t) + sizeof(std::uint64_t);

void expectSameMetadata(const algo::ChunkMetadata& a, const algo::ChunkMetadata& b) {
    EXPECT_EQ(a.originalLength, b.originalLength);
    EXPECT_EQ(a.compressedLength, b.compressedLength);
    EXPECT_EQ(a.checksum, b.checksum);
    EXPECT_EQ(a.codec, b.codec);
    EXPECT_EQ(a.compressionType, b.compressionType);
    EXPECT_DOUBLE_EQ(a.errorRate, b.errorRate);
    EXPECT_EQ(a.patterns, b.patterns);
    EXPECT_EQ(a.qualityScores, b.qualityScores);
    EXPECT_EQ(a.ambiguousRuns, b.ambiguousRuns);
}

std::vector<std::uint8_t> readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

void writeFile(const std::filesystem::path& path, const std::vector<std::uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
}

}  // namespace

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(BundleFormatProperty, DecodeRestoresEncodedBundle, ()) {
    const auto length = *rc::gen::inRange<std::size_t>(kMinSequenceLength, 3000);
    const auto sequence = *rc::gen::container<std::string>(
        length, rc::gen::element('A', 'C', 'G', 'T', 'N'));
    const auto chunkSize = *rc::gen::inRange<std::size_t>(1, 1000);
    const auto result = compressSample(sequence, chunkSize);

    const auto bytes = encodeBundle(result.blob, result.metadata);
    const Bundle bundle = decodeBundle(bytes);

    RC_ASSERT(bundle.version == kCurrentVersion);
    RC_ASSERT(bundle.blob == result.blob);
    RC_ASSERT(bundle.metadata.size() == result.metadata.size());
    for (std::size_t i = 0; i < bundle.metadata.size(); ++i) {
        RC_ASSERT(bundle.metadata[i].checksum == result.metadata[i].checksum);
        RC_ASSERT(bundle.metadata[i].patterns == result.metadata[i].patterns);
        RC_ASSERT(bundle.metadata[i].ambiguousRuns == result.metadata[i].ambiguousRuns);
        RC_ASSERT(bundle.metadata[i].qualityScores == result.metadata[i].qualityScores);
    }

    const pipeline::GenomeCodec codec;
    RC_ASSERT(codec.decompress(bundle.blob, bundle.metadata) == sequence);
}

RC_GTEST_PROP(BundleFormatProperty, AnyFlippedByteIsDetected, ()) {
    const auto result = compressSample(repeat("ACGTTGCAAC", 30), 100);
    auto bytes = encodeBundle(result.blob, result.metadata);
    const auto index = *rc::gen::inRange<std::size_t>(0, bytes.size());
    const auto mask = *rc::gen::inRange<int>(1, 256);

    bytes[index] ^= static_cast<std::uint8_t>(mask);

    try {
        (void)decodeBundle(bytes);
        RC_FAIL("damaged bundle was accepted");
    } catch (const FormatError&) {
    } catch (const ChecksumError&) {
    }
}

// =============================================================================
// Unit Tests
// =============================================================================

TEST(BundleFormatTest, VersionHelpers) {
    EXPECT_EQ(decodeMajorVersion(kCurrentVersion), kFormatVersionMajor);
    EXPECT_EQ(decodeMinorVersion(kCurrentVersion), kFormatVersionMinor);
    EXPECT_TRUE(isVersionCompatible(encodeVersion(1, 7)));
    EXPECT_FALSE(isVersionCompatible(encodeVersion(2, 0)));
}

TEST(BundleFormatTest, LayoutStartsWithMagicAndEndsWithMarker) {
    const auto result = compressSample(repeat("ACGT", 50), 64);

    const auto bytes = encodeBundle(result.blob, result.metadata);

    ASSERT_GT(bytes.size(), kBlobOffset + result.blob.size() + kFileFooterSize);
    EXPECT_TRUE(std::equal(kMagicBytes.begin(), kMagicBytes.end(), bytes.begin()));
    EXPECT_EQ(bytes[8], kCurrentVersion);
    EXPECT_EQ(bytes[9], result.metadata.size());
    EXPECT_TRUE(std::equal(kMagicEnd.begin(), kMagicEnd.end(), bytes.end() - 8));
    const std::string blobText(bytes.begin() + kBlobOffset,
                               bytes.begin() + kBlobOffset + result.blob.size());
    EXPECT_EQ(blobText, result.blob);
}

TEST(BundleFormatTest, RecordsMetadataSectionSizes) {
    const auto result = compressSample(repeat("ACGT", 500), 200);

    const Bundle bundle = decodeBundle(encodeBundle(result.blob, result.metadata));

    EXPECT_GT(bundle.metadataRawSize, 0u);
    EXPECT_GT(bundle.metadataStoredSize, 0u);
    EXPECT_LT(bundle.metadataStoredSize, bundle.metadataRawSize);
    EXPECT_EQ(bundle.metadata[0].cacheSnapshot, nullptr);
    for (std::size_t i = 0; i < bundle.metadata.size(); ++i) {
        expectSameMetadata(bundle.metadata[i], result.metadata[i]);
    }
}

TEST(BundleFormatTest, RejectsBadMagic) {
    const auto result = compressSample(repeat("ACGT", 50), 64);
    auto bytes = encodeBundle(result.blob, result.metadata);
    bytes[1] = 'X';

    EXPECT_THROW((void)decodeBundle(bytes), FormatError);
}

TEST(BundleFormatTest, RejectsNewerMajorVersion) {
    const auto result = compressSample(repeat("ACGT", 50), 64);
    auto bytes = encodeBundle(result.blob, result.metadata);
    bytes[8] = encodeVersion(2, 0);

    EXPECT_THROW((void)decodeBundle(bytes), FormatError);
}

TEST(BundleFormatTest, DamagedBlobIsChecksumError) {
    const auto result = compressSample(repeat("ACGT", 50), 64);
    auto bytes = encodeBundle(result.blob, result.metadata);
    bytes[kBlobOffset] ^= 0x01;

    try {
        (void)decodeBundle(bytes);
        FAIL() << "expected ChecksumError";
    } catch (const ChecksumError& e) {
        EXPECT_TRUE(e.expected().has_value());
        EXPECT_TRUE(e.actual().has_value());
    }
}

TEST(BundleFormatTest, TruncationIsFormatError) {
    const auto result = compressSample(repeat("ACGT", 50), 64);
    auto bytes = encodeBundle(result.blob, result.metadata);

    auto missingTail = bytes;
    missingTail.pop_back();
    EXPECT_THROW((void)decodeBundle(missingTail), FormatError);

    const std::vector<std::uint8_t> tiny(bytes.begin(), bytes.begin() + 10);
    EXPECT_THROW((void)decodeBundle(tiny), FormatError);
    EXPECT_THROW((void)decodeBundle({}), FormatError);
}

// =============================================================================
// Writer / Reader
// =============================================================================

TEST(BundleFileTest, WriteThenRead) {
    TempFileGuard guard(tempFilePath());
    const std::string sequence = repeat("GATTACANNN", 40);
    const auto result = compressSample(sequence, 128);

    {
        BundleWriter writer(guard.path());
        writer.write(result.blob, result.metadata);
        writer.finalize();
        EXPECT_EQ(writer.bytesWritten(), std::filesystem::file_size(guard.path()));
    }
    EXPECT_FALSE(std::filesystem::exists(guard.path().string() + ".tmp"));

    const BundleReader reader(guard.path());
    EXPECT_EQ(reader.chunkCount(), result.metadata.size());
    EXPECT_EQ(reader.totalLength(), sequence.size());
    EXPECT_EQ(reader.version(), kCurrentVersion);
    EXPECT_EQ(reader.fileSize(), std::filesystem::file_size(guard.path()));

    const pipeline::GenomeCodec codec;
    EXPECT_EQ(codec.decompress(reader.bundle().blob, reader.bundle().metadata), sequence);
}

TEST(BundleFileTest, UnfinalizedWriterLeavesNothingBehind) {
    TempFileGuard guard(tempFilePath());
    const auto result = compressSample(repeat("ACGT", 50), 64);

    {
        BundleWriter writer(guard.path());
        writer.write(result.blob, result.metadata);
        EXPECT_TRUE(std::filesystem::exists(guard.path().string() + ".tmp"));
    }

    EXPECT_FALSE(std::filesystem::exists(guard.path()));
    EXPECT_FALSE(std::filesystem::exists(guard.path().string() + ".tmp"));
}

TEST(BundleFileTest, WriterStateErrors) {
    TempFileGuard guard(tempFilePath());
    const auto result = compressSample(repeat("ACGT", 50), 64);

    BundleWriter empty(guard.path());
    EXPECT_THROW(empty.finalize(), FormatError);
    empty.abort();
    EXPECT_THROW(empty.write(result.blob, result.metadata), FormatError);

    BundleWriter writer(guard.path());
    writer.write(result.blob, result.metadata);
    EXPECT_THROW(writer.write(result.blob, result.metadata), FormatError);
    writer.finalize();
    EXPECT_THROW(writer.finalize(), FormatError);
}

TEST(BundleFileTest, ReaderReportsMissingAndDamagedFiles) {
    TempFileGuard guard(tempFilePath());
    EXPECT_THROW(BundleReader{guard.path()}, IOError);

    const auto result = compressSample(repeat("ACGT", 50), 64);
    auto bytes = encodeBundle(result.blob, result.metadata);
    bytes[kBlobOffset + 1] ^= 0x10;
    writeFile(guard.path(), bytes);
    EXPECT_THROW(BundleReader{guard.path()}, ChecksumError);

    bytes[0] = 0;
    writeFile(guard.path(), bytes);
    try {
        const BundleReader reader(guard.path());
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        ASSERT_TRUE(e.context().has_value());
        EXPECT_EQ(e.context()->filePath, guard.path().string());
    }

    EXPECT_EQ(readFile(guard.path()).size(), bytes.size());
}

TEST(BundleFileTest, ReaderKeepsOffsetAndAddsFile) {
    TempFileGuard guard(tempFilePath());
    const auto result = compressSample(repeat("ACGT", 50), 64);
    const auto bytes = encodeBundle(result.blob, result.metadata);

    auto truncated = bytes;
    truncated.pop_back();
    writeFile(guard.path(), truncated);
    try {
        const BundleReader reader(guard.path());
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        ASSERT_TRUE(e.context().has_value());
        EXPECT_EQ(e.context()->filePath, guard.path().string());
        ASSERT_TRUE(e.context()->byteOffset.has_value());
        EXPECT_EQ(*e.context()->byteOffset, truncated.size() - kFileFooterSize);
    }

    auto damaged = bytes;
    damaged[kBlobOffset + 1] ^= 0x10;
    writeFile(guard.path(), damaged);
    try {
        const BundleReader reader(guard.path());
        FAIL() << "expected ChecksumError";
    } catch (const ChecksumError& e) {
        ASSERT_TRUE(e.context().has_value());
        EXPECT_EQ(e.context()->filePath, guard.path().string());
        ASSERT_TRUE(e.context()->byteOffset.has_value());
        EXPECT_EQ(*e.context()->byteOffset, damaged.size() - kFileFooterSize);
        EXPECT_TRUE(e.expected().has_value());
        EXPECT_TRUE(e.actual().has_value());
    }
}

}  // namespace nucpack::format::test
