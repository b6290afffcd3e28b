// =============================================================================
// nucpack - Bundle Writer Implementation
// =============================================================================

#include "nucpack/format/bundle_writer.h"

#include <system_error>
#include <utility>

#include "nucpack/common/error.h"
#include "nucpack/common/logger.h"
#include "nucpack/format/bundle_format.h"

namespace nucpack::format {

BundleWriter::BundleWriter(std::filesystem::path outputPath)
    : outputPath_(std::move(outputPath)), tempPath_(outputPath_.string() + ".tmp") {
    stream_.open(tempPath_, std::ios::binary | std::ios::trunc);
    if (!stream_.is_open()) {
        throw IOError("Failed to create temporary file: " + tempPath_.string(),
                      ErrorContext(tempPath_.string()));
    }

    NUCPACK_LOG_DEBUG("BundleWriter created: output={}, temp={}", outputPath_.string(),
                      tempPath_.string());
}

BundleWriter::~BundleWriter() {
    if (!finalized_ && !aborted_) {
        abort();
    }
}

void BundleWriter::write(std::string_view blob, std::span<const algo::ChunkMetadata> metadata) {
    if (written_) {
        throw FormatError("Bundle already written");
    }
    if (finalized_ || aborted_) {
        throw FormatError("Writer is finalized or aborted");
    }

    const std::vector<std::uint8_t> bytes = encodeBundle(blob, metadata);
    stream_.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
    if (!stream_.good()) {
        throw IOError("Failed to write to file", ErrorContext(tempPath_.string()));
    }

    bytesWritten_ = bytes.size();
    written_ = true;
}

void BundleWriter::finalize() {
    if (finalized_ || aborted_) {
        throw FormatError("Writer is finalized or aborted");
    }
    if (!written_) {
        throw FormatError("No bundle content written");
    }

    stream_.flush();
    stream_.close();
    if (stream_.fail()) {
        throw IOError("Failed to close temporary file", ErrorContext(tempPath_.string()));
    }

    std::error_code ec;
    std::filesystem::rename(tempPath_, outputPath_, ec);
    if (ec) {
        throw IOError("Failed to rename temporary file to " + outputPath_.string(), ec);
    }

    finalized_ = true;
    NUCPACK_LOG_INFO("Bundle finalized: {}, {} bytes", outputPath_.string(), bytesWritten_);
}

void BundleWriter::abort() noexcept {
    if (aborted_) {
        return;
    }
    aborted_ = true;
    cleanupTempFile();
    NUCPACK_LOG_DEBUG("BundleWriter aborted: {}", tempPath_.string());
}

void BundleWriter::cleanupTempFile() noexcept {
    if (stream_.is_open()) {
        stream_.close();
    }

    std::error_code ec;
    if (std::filesystem::exists(tempPath_, ec)) {
        std::filesystem::remove(tempPath_, ec);
        if (ec) {
            NUCPACK_LOG_WARNING("Failed to remove temporary file: {}", tempPath_.string());
        }
    }
}

}  // namespace nucpack::format
