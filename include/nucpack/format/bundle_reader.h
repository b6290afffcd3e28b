// =============================================================================
// nucpack - Bundle Reader
// =============================================================================
// Loads a .npk bundle and validates it (magic, version, end marker, xxHash64)
// before exposing the blob and chunk metadata.
// =============================================================================

#ifndef NUCPACK_FORMAT_BUNDLE_READER_H
#define NUCPACK_FORMAT_BUNDLE_READER_H

#include <cstddef>
#include <cstdint>
#include <filesystem>

#include "nucpack/format/bundle_format.h"

namespace nucpack::format {

/// @brief Validated read-only view of a bundle file.
class BundleReader {
public:
    /// @brief Read and validate a bundle file.
    /// @throws IOError if the file cannot be read.
    /// @throws FormatError for a malformed bundle.
    /// @throws ChecksumError if the footer hash does not match.
    explicit BundleReader(std::filesystem::path path);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    [[nodiscard]] std::uint64_t fileSize() const noexcept { return fileSize_; }

    [[nodiscard]] const Bundle& bundle() const noexcept { return bundle_; }

    [[nodiscard]] std::uint8_t version() const noexcept { return bundle_.version; }

    [[nodiscard]] std::size_t chunkCount() const noexcept { return bundle_.metadata.size(); }

    /// @brief Total symbols across all chunks.
    [[nodiscard]] std::uint64_t totalLength() const noexcept;

private:
    std::filesystem::path path_;
    std::uint64_t fileSize_ = 0;
    Bundle bundle_;
};

}  // namespace nucpack::format

#endif  // NUCPACK_FORMAT_BUNDLE_READER_H
