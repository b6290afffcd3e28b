// =============================================================================
// nucpack - Sequence Reader
// =============================================================================
// Loads sequence text for the CLI:
// - raw text: every non-whitespace character is part of the sequence
// - FASTA: the first record is used (header after '>' becomes the name);
//   further records are counted and reported
// - gzip input is detected by its magic bytes (0x1f 0x8b) and inflated with
//   zlib, including multi-member files
// - "-" reads stdin / writes stdout
//
// Symbols are not validated here; that is the codec's or pipeline's job.
// =============================================================================

#ifndef NUCPACK_IO_SEQUENCE_READER_H
#define NUCPACK_IO_SEQUENCE_READER_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace nucpack::io {

/// @brief Sequence text recovered from an input file.
struct ParsedSequence {
    /// @brief FASTA record name (empty for raw text).
    std::string name;

    /// @brief Sequence symbols with line breaks and whitespace removed.
    std::string sequence;

    /// @brief Number of FASTA records seen (0 for raw text).
    std::size_t recordCount = 0;

    [[nodiscard]] bool isFasta() const noexcept { return recordCount > 0; }
};

/// @brief Check for the gzip magic bytes.
[[nodiscard]] bool isGzipData(std::span<const std::uint8_t> data) noexcept;

/// @brief Largest input block handed to zlib at once (its lengths are uInt).
inline constexpr std::size_t kMaxInflateSlice = std::numeric_limits<std::uint32_t>::max();

/// @brief Inflate a (possibly multi-member) gzip buffer.
/// @param data Compressed bytes.
/// @param inputSlice Input is fed to zlib in blocks of at most this size.
/// @throws IOError if the data is not a valid gzip stream.
[[nodiscard]] std::string gunzip(std::span<const std::uint8_t> data,
                                 std::size_t inputSlice = kMaxInflateSlice);

/// @brief Parse raw or FASTA text.
[[nodiscard]] ParsedSequence parseSequenceText(std::string_view text);

/// @brief Read all bytes of a file, or stdin for "-".
/// @throws IOError if the file cannot be read.
[[nodiscard]] std::vector<std::uint8_t> readAllBytes(const std::filesystem::path& path);

/// @brief Read and parse a sequence file (gzip detected automatically).
/// @throws IOError if the file cannot be read or inflated.
[[nodiscard]] ParsedSequence readSequenceFile(const std::filesystem::path& path);

/// @brief Write a sequence to a file, or stdout for "-".
/// @param name FASTA header name; written only when lineWidth > 0.
/// @param lineWidth Wrap width (0 = single line, no header).
/// @throws IOError on write failure.
void writeSequenceFile(const std::filesystem::path& path, std::string_view name,
                       std::string_view sequence, std::size_t lineWidth = 0);

}  // namespace nucpack::io

#endif  // NUCPACK_IO_SEQUENCE_READER_H
