// =============================================================================
// nucpack - Generic Byte Codecs Implementation
// =============================================================================

#include "nucpack/algo/generic_codec.h"

#include <algorithm>
#include <bit>
#include <memory>
#include <string>

#include <fmt/format.h>
#include <zlib.h>
#include <zstd.h>

namespace nucpack::algo {

namespace {

struct ZstdCCtxDeleter {
    void operator()(ZSTD_CCtx* ctx) const noexcept { ZSTD_freeCCtx(ctx); }
};

using ZstdCCtxPtr = std::unique_ptr<ZSTD_CCtx, ZstdCCtxDeleter>;

/// @brief Set a Zstandard compression parameter, reporting failures as errors.
VoidResult setZstdParameter(ZSTD_CCtx* ctx, ZSTD_cParameter param, int value,
                            const char* name) {
    const std::size_t rc = ZSTD_CCtx_setParameter(ctx, param, value);
    if (ZSTD_isError(rc)) {
        return makeVoidError(ErrorCode::kCodecError,
                             fmt::format("Zstd parameter {}={} rejected: {}", name, value,
                                         ZSTD_getErrorName(rc)));
    }
    return makeVoidSuccess();
}

}  // namespace

// =============================================================================
// DEFLATE (zlib)
// =============================================================================

Result<std::vector<std::uint8_t>> deflateCompress(std::span<const std::uint8_t> data,
                                                  int level) {
    uLongf compressedSize = compressBound(static_cast<uLong>(data.size()));
    std::vector<std::uint8_t> compressed(compressedSize);

    const int rc = compress2(compressed.data(), &compressedSize, data.data(),
                             static_cast<uLong>(data.size()), level);
    if (rc != Z_OK) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kCodecError, fmt::format("zlib compression failed: {}", zError(rc)));
    }

    compressed.resize(compressedSize);
    return compressed;
}

Result<std::vector<std::uint8_t>> deflateDecompress(std::span<const std::uint8_t> data,
                                                    std::size_t expectedSize) {
    // uncompress() needs a non-null destination even for empty output.
    std::vector<std::uint8_t> decompressed(std::max<std::size_t>(expectedSize, 1));
    uLongf decompressedSize = static_cast<uLongf>(expectedSize);

    const int rc = uncompress(decompressed.data(), &decompressedSize, data.data(),
                              static_cast<uLong>(data.size()));
    if (rc != Z_OK) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kCorruptedData, fmt::format("zlib decompression failed: {}", zError(rc)));
    }
    if (decompressedSize != expectedSize) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kCorruptedData,
            fmt::format("zlib stream decompressed to {} bytes, expected {}", decompressedSize,
                        expectedSize));
    }

    decompressed.resize(expectedSize);
    return decompressed;
}

// =============================================================================
// Zstandard (long-distance matching)
// =============================================================================

int zstdWindowLogFor(std::size_t inputSize) noexcept {
    const ZSTD_bounds bounds = ZSTD_cParam_getBounds(ZSTD_c_windowLog);
    const int minLog = ZSTD_isError(bounds.error) ? 10 : bounds.lowerBound;
    const int needed = inputSize > 1 ? static_cast<int>(std::bit_width(inputSize - 1)) : minLog;
    return std::clamp(needed, minLog, kMaxZstdWindowLog);
}

Result<std::vector<std::uint8_t>> zstdLongCompress(std::span<const std::uint8_t> data,
                                                   int level) {
    ZstdCCtxPtr ctx(ZSTD_createCCtx());
    if (!ctx) {
        return makeError<std::vector<std::uint8_t>>(ErrorCode::kCodecError,
                                                    "failed to create Zstd context");
    }

    if (auto rc = setZstdParameter(ctx.get(), ZSTD_c_compressionLevel, level, "level"); !rc) {
        return std::unexpected(rc.error());
    }
    if (auto rc = setZstdParameter(ctx.get(), ZSTD_c_enableLongDistanceMatching, 1, "ldm"); !rc) {
        return std::unexpected(rc.error());
    }
    if (auto rc = setZstdParameter(ctx.get(), ZSTD_c_windowLog, zstdWindowLogFor(data.size()),
                                   "windowLog");
        !rc) {
        return std::unexpected(rc.error());
    }

    std::vector<std::uint8_t> compressed(ZSTD_compressBound(data.size()));
    const std::size_t compressedSize = ZSTD_compress2(ctx.get(), compressed.data(),
                                                      compressed.size(), data.data(), data.size());
    if (ZSTD_isError(compressedSize)) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kCodecError,
            fmt::format("Zstd compression failed: {}", ZSTD_getErrorName(compressedSize)));
    }

    compressed.resize(compressedSize);
    return compressed;
}

Result<std::vector<std::uint8_t>> zstdDecompress(std::span<const std::uint8_t> data,
                                                 std::size_t expectedSize) {
    const unsigned long long frameSize = ZSTD_getFrameContentSize(data.data(), data.size());
    if (frameSize == ZSTD_CONTENTSIZE_ERROR || frameSize == ZSTD_CONTENTSIZE_UNKNOWN) {
        return makeError<std::vector<std::uint8_t>>(ErrorCode::kCorruptedData,
                                                    "invalid Zstd frame header");
    }
    if (frameSize != expectedSize) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kCorruptedData,
            fmt::format("Zstd frame declares {} bytes, expected {}", frameSize, expectedSize));
    }

    std::vector<std::uint8_t> decompressed(expectedSize);
    const std::size_t actualSize =
        ZSTD_decompress(decompressed.data(), decompressed.size(), data.data(), data.size());
    if (ZSTD_isError(actualSize)) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kCorruptedData,
            fmt::format("Zstd decompression failed: {}", ZSTD_getErrorName(actualSize)));
    }
    if (actualSize != expectedSize) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kCorruptedData,
            fmt::format("Zstd frame decompressed to {} bytes, expected {}", actualSize,
                        expectedSize));
    }

    return decompressed;
}

// =============================================================================
// Dispatch
// =============================================================================

Result<std::vector<std::uint8_t>> decompressWith(CodecFamily family,
                                                 std::span<const std::uint8_t> data,
                                                 std::size_t expectedSize) {
    switch (family) {
        case CodecFamily::kDeflate:
            return deflateDecompress(data, expectedSize);
        case CodecFamily::kZstdLong:
            return zstdDecompress(data, expectedSize);
    }
    return makeError<std::vector<std::uint8_t>>(
        ErrorCode::kFormatError,
        fmt::format("unsupported codec family {}", static_cast<int>(family)));
}

}  // namespace nucpack::algo
