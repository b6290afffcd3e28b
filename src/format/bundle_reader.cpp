// =============================================================================
// nucpack - Bundle Reader Implementation
// =============================================================================

#include "nucpack/format/bundle_reader.h"

#include <fstream>
#include <iterator>
#include <utility>
#include <vector>

#include "nucpack/common/error.h"
#include "nucpack/common/logger.h"

namespace nucpack::format {

namespace {

/// @brief Keep the chunk index and offset already recorded, and add the file.
ErrorContext contextWithFile(const NucpackException& e, const std::filesystem::path& path) {
    ErrorContext context = e.context().value_or(ErrorContext{});
    context.withFile(path.string());
    return context;
}

}  // namespace

BundleReader::BundleReader(std::filesystem::path path) : path_(std::move(path)) {
    std::ifstream stream(path_, std::ios::binary);
    if (!stream.is_open()) {
        throw IOError("Failed to open bundle file: " + path_.string(),
                      ErrorContext(path_.string()));
    }

    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(stream)),
                                    std::istreambuf_iterator<char>());
    if (stream.bad()) {
        throw IOError("Failed to read bundle file: " + path_.string(),
                      ErrorContext(path_.string()));
    }
    fileSize_ = bytes.size();

    try {
        bundle_ = decodeBundle(bytes);
    } catch (const FormatError& e) {
        throw FormatError(e.message(), contextWithFile(e, path_));
    } catch (const ChecksumError& e) {
        if (e.expected() && e.actual()) {
            throw ChecksumError(*e.expected(), *e.actual(), contextWithFile(e, path_));
        }
        throw ChecksumError(e.message(), contextWithFile(e, path_));
    }

    NUCPACK_LOG_DEBUG("BundleReader opened: {}, version={}.{}, chunks={}, size={}",
                      path_.string(), decodeMajorVersion(bundle_.version),
                      decodeMinorVersion(bundle_.version), bundle_.metadata.size(), fileSize_);
}

std::uint64_t BundleReader::totalLength() const noexcept {
    std::uint64_t total = 0;
    for (const auto& meta : bundle_.metadata) {
        total += meta.originalLength;
    }
    return total;
}

}  // namespace nucpack::format
