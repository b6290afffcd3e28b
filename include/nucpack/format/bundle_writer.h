// =============================================================================
// nucpack - Bundle Writer
// =============================================================================
// Writes a .npk bundle atomically: bytes go to "<output>.tmp" and are renamed
// onto the output path by finalize(). A writer destroyed before finalize()
// removes its temporary file, so a failed run never leaves a partial bundle.
// =============================================================================

#ifndef NUCPACK_FORMAT_BUNDLE_WRITER_H
#define NUCPACK_FORMAT_BUNDLE_WRITER_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <string_view>

#include "nucpack/algo/chunk_compressor.h"

namespace nucpack::format {

/// @brief Atomic .npk bundle writer.
///
/// Usage:
/// @code
/// BundleWriter writer("out.npk");
/// writer.write(result.blob, result.metadata);
/// writer.finalize();
/// @endcode
class BundleWriter {
public:
    /// @brief Open the temporary file next to `outputPath`.
    /// @throws IOError if the temporary file cannot be created.
    explicit BundleWriter(std::filesystem::path outputPath);

    /// @brief Removes the temporary file unless finalize() succeeded.
    ~BundleWriter();

    BundleWriter(const BundleWriter&) = delete;
    BundleWriter& operator=(const BundleWriter&) = delete;

    /// @brief Serialize and write the bundle body and footer.
    /// @throws IOError on write failure, FormatError if called twice.
    void write(std::string_view blob, std::span<const algo::ChunkMetadata> metadata);

    /// @brief Flush, close and rename onto the output path.
    /// @throws IOError on failure, FormatError if nothing was written.
    void finalize();

    /// @brief Discard the temporary file.
    void abort() noexcept;

    /// @brief Bytes written so far.
    [[nodiscard]] std::uint64_t bytesWritten() const noexcept { return bytesWritten_; }

    [[nodiscard]] const std::filesystem::path& outputPath() const noexcept { return outputPath_; }

private:
    void cleanupTempFile() noexcept;

    std::filesystem::path outputPath_;
    std::filesystem::path tempPath_;
    std::ofstream stream_;
    std::uint64_t bytesWritten_ = 0;
    bool written_ = false;
    bool finalized_ = false;
    bool aborted_ = false;
};

}  // namespace nucpack::format

#endif  // NUCPACK_FORMAT_BUNDLE_WRITER_H
