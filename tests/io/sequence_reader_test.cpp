// =============================================================================
// nucpack - Sequence Reader Tests
// =============================================================================

#include "nucpack/io/sequence_reader.h"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <vector>

#include <zlib.h>

#include "nucpack/common/error.h"

namespace nucpack::io {
namespace {

// =============================================================================
// Test Utilities
// =============================================================================

std::filesystem::path tempFilePath(std::string_view suffix) {
    static std::atomic<int> counter{0};
    return std::filesystem::temp_directory_path() /
           ("nucpack_io_test_" + std::to_string(counter++) + "_" +
            std::to_string(std::random_device{}()) + std::string(suffix));
}

class TempFileGuard {
public:
    explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

/// @brief Compress text into a single gzip member.
std::vector<std::uint8_t> gzipText(std::string_view text) {
    z_stream stream{};
    EXPECT_EQ(deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8,
                           Z_DEFAULT_STRATEGY),
              Z_OK);

    std::vector<std::uint8_t> out(deflateBound(&stream, static_cast<uLong>(text.size())) + 32);
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(text.data()));
    stream.avail_in = static_cast<uInt>(text.size());
    stream.next_out = out.data();
    stream.avail_out = static_cast<uInt>(out.size());

    EXPECT_EQ(deflate(&stream, Z_FINISH), Z_STREAM_END);
    out.resize(stream.total_out);
    deflateEnd(&stream);
    return out;
}

void writeBytes(const std::filesystem::path& path, const void* data, std::size_t size) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
}

std::string readText(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

// =============================================================================
// Parsing
// =============================================================================

TEST(SequenceReaderTest, RawTextDropsWhitespace) {
    const auto parsed = parseSequenceText("  ACGT\nacgt \r\n\tNN\n");

    EXPECT_EQ(parsed.sequence, "ACGTacgtNN");
    EXPECT_TRUE(parsed.name.empty());
    EXPECT_FALSE(parsed.isFasta());
}

TEST(SequenceReaderTest, RawTextKeepsForeignSymbols) {
    const auto parsed = parseSequenceText("AC-GT*1");

    EXPECT_EQ(parsed.sequence, "AC-GT*1");
}

TEST(SequenceReaderTest, SingleFastaRecord) {
    const auto parsed = parseSequenceText(">chr1 test contig \nACGT\nTTGA\r\nNN\n");

    EXPECT_TRUE(parsed.isFasta());
    EXPECT_EQ(parsed.recordCount, 1u);
    EXPECT_EQ(parsed.name, "chr1 test contig");
    EXPECT_EQ(parsed.sequence, "ACGTTTGANN");
}

TEST(SequenceReaderTest, MultiFastaUsesFirstRecord) {
    const auto parsed = parseSequenceText(">a\nAAAA\nCC\n>b\nGGGG\n>c\nTTTT");

    EXPECT_EQ(parsed.recordCount, 3u);
    EXPECT_EQ(parsed.name, "a");
    EXPECT_EQ(parsed.sequence, "AAAACC");
}

TEST(SequenceReaderTest, EmptyInput) {
    const auto parsed = parseSequenceText("");

    EXPECT_TRUE(parsed.sequence.empty());
    EXPECT_EQ(parsed.recordCount, 0u);
}

// =============================================================================
// Gzip
// =============================================================================

TEST(SequenceReaderTest, DetectsGzipMagic) {
    const std::vector<std::uint8_t> gz = {0x1f, 0x8b, 0x08};
    const std::vector<std::uint8_t> plain = {'>', 'a'};

    EXPECT_TRUE(isGzipData(gz));
    EXPECT_FALSE(isGzipData(plain));
    EXPECT_FALSE(isGzipData({}));
}

TEST(SequenceReaderTest, GunzipSingleMember) {
    const std::string text = ">seq\nACGTACGTNNNN\n";

    EXPECT_EQ(gunzip(gzipText(text)), text);
}

TEST(SequenceReaderTest, GunzipConcatenatedMembers) {
    auto data = gzipText(">seq\nACGT");
    const auto second = gzipText("TTTT\n");
    data.insert(data.end(), second.begin(), second.end());

    EXPECT_EQ(gunzip(data), ">seq\nACGTTTTT\n");
}

TEST(SequenceReaderTest, GunzipRejectsTruncatedStream) {
    auto data = gzipText(std::string(5000, 'A') + "CGT");
    data.resize(data.size() / 2);

    EXPECT_THROW((void)gunzip(data), IOError);
}

TEST(SequenceReaderTest, GunzipFeedsInputInSlices) {
    std::string text = ">seq\n";
    for (int i = 0; i < 400; ++i) {
        text += "ACGTTGCAAN";
    }
    auto data = gzipText(text);
    const auto second = gzipText("GATTACA\n");
    data.insert(data.end(), second.begin(), second.end());
    text += "GATTACA\n";

    for (std::size_t slice : {std::size_t{1}, std::size_t{3}, std::size_t{7}, std::size_t{64},
                              data.size() - 1, data.size()}) {
        EXPECT_EQ(gunzip(data, slice), text) << "slice " << slice;
    }

    data.resize(data.size() - second.size() - 4);
    EXPECT_THROW((void)gunzip(data, 5), IOError);
}

TEST(SequenceReaderTest, GunzipRejectsGarbage) {
    std::vector<std::uint8_t> data = {0x1f, 0x8b, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};

    EXPECT_THROW((void)gunzip(data), IOError);
}

// =============================================================================
// Files
// =============================================================================

TEST(SequenceReaderTest, ReadsPlainAndGzipFiles) {
    const std::string text = ">contig\nACGTN\nGGCC\n";

    TempFileGuard plain(tempFilePath(".fa"));
    writeBytes(plain.path(), text.data(), text.size());
    const auto fromPlain = readSequenceFile(plain.path());

    TempFileGuard gz(tempFilePath(".fa.gz"));
    const auto compressed = gzipText(text);
    writeBytes(gz.path(), compressed.data(), compressed.size());
    const auto fromGzip = readSequenceFile(gz.path());

    EXPECT_EQ(fromPlain.sequence, "ACGTNGGCC");
    EXPECT_EQ(fromGzip.sequence, fromPlain.sequence);
    EXPECT_EQ(fromGzip.name, "contig");
}

TEST(SequenceReaderTest, MissingFileIsIOError) {
    EXPECT_THROW((void)readSequenceFile(tempFilePath(".missing")), IOError);
}

TEST(SequenceWriterTest, SingleLineOutput) {
    TempFileGuard out(tempFilePath(".txt"));

    writeSequenceFile(out.path(), "ignored", "ACGTACGT");

    EXPECT_EQ(readText(out.path()), "ACGTACGT\n");
}

TEST(SequenceWriterTest, WrappedFastaOutput) {
    TempFileGuard out(tempFilePath(".fa"));

    writeSequenceFile(out.path(), "chr2", "ACGTACGTAC", 4);

    EXPECT_EQ(readText(out.path()), ">chr2\nACGT\nACGT\nAC\n");
    const auto parsed = readSequenceFile(out.path());
    EXPECT_EQ(parsed.name, "chr2");
    EXPECT_EQ(parsed.sequence, "ACGTACGTAC");
}

TEST(SequenceWriterTest, UnwritablePathIsIOError) {
    const auto path = tempFilePath("") / "no_such_dir" / "out.fa";

    EXPECT_THROW(writeSequenceFile(path, "x", "ACGT"), IOError);
}

}  // namespace
}  // namespace nucpack::io
