// =============================================================================
// nucpack - Bundle Format Implementation
// =============================================================================
// Metadata entry layout (little-endian):
//   u64 originalLength, u64 compressedLength, u32 crc32, u8 compressionType,
//   u8 codec, f64 errorRate,
//   u32 patternCount { u8 keyLength, key, u32 positionCount, u32 positions... },
//   u64 scoreCount, scores...,
//   u32 runCount { u32 start, u32 length }...
// =============================================================================

#include "nucpack/format/bundle_format.h"

#include <algorithm>

#include <fmt/format.h>

#include "nucpack/algo/generic_codec.h"
#include "nucpack/common/checksum.h"
#include "nucpack/common/logger.h"
#include "nucpack/format/binary_io.h"

namespace nucpack::format {

namespace {

/// @brief Reject element counts that cannot fit in the remaining input.
void requireCount(const ByteReader& reader, std::uint64_t count, std::size_t elementSize,
                  std::string_view what) {
    if (count > reader.remaining() / elementSize) {
        throw FormatError(fmt::format("{} count {} exceeds remaining {} bytes", what, count,
                                      reader.remaining()),
                          ErrorContext{}.withOffset(reader.offset()));
    }
}

void writeMetadata(ByteWriter& writer, const algo::ChunkMetadata& meta) {
    writer.writeLE(meta.originalLength);
    writer.writeLE(meta.compressedLength);
    writer.writeLE(meta.checksum);
    writer.writeLE(static_cast<std::uint8_t>(meta.compressionType));
    writer.writeLE(static_cast<std::uint8_t>(meta.codec));
    writer.writeDouble(meta.errorRate);

    writer.writeLE(static_cast<std::uint32_t>(meta.patterns.size()));
    for (const auto& [pattern, positions] : meta.patterns) {
        writer.writeLE(static_cast<std::uint8_t>(pattern.size()));
        writer.writeBytes(pattern);
        writer.writeLE(static_cast<std::uint32_t>(positions.size()));
        for (Position position : positions) {
            writer.writeLE(position);
        }
    }

    writer.writeLE(static_cast<std::uint64_t>(meta.qualityScores.size()));
    writer.writeBytes(meta.qualityScores);

    writer.writeLE(static_cast<std::uint32_t>(meta.ambiguousRuns.size()));
    for (const auto& run : meta.ambiguousRuns) {
        writer.writeLE(run.start);
        writer.writeLE(run.length);
    }
}

algo::ChunkMetadata readMetadata(ByteReader& reader) {
    algo::ChunkMetadata meta;
    meta.originalLength = reader.readLE<std::uint64_t>();
    meta.compressedLength = reader.readLE<std::uint64_t>();
    meta.checksum = reader.readLE<std::uint32_t>();

    const auto type = reader.readLE<std::uint8_t>();
    if (type != static_cast<std::uint8_t>(CompressionType::kAdaptive)) {
        throw FormatError(fmt::format("unknown compression type {}", type),
                          ErrorContext{}.withOffset(reader.offset()));
    }
    meta.compressionType = static_cast<CompressionType>(type);

    const auto codec = reader.readLE<std::uint8_t>();
    if (!isKnownCodecFamily(codec)) {
        throw FormatError(fmt::format("unknown codec family {}", codec),
                          ErrorContext{}.withOffset(reader.offset()));
    }
    meta.codec = static_cast<CodecFamily>(codec);
    meta.errorRate = reader.readDouble();

    const auto patternCount = reader.readLE<std::uint32_t>();
    for (std::uint32_t p = 0; p < patternCount; ++p) {
        const auto keyLength = reader.readLE<std::uint8_t>();
        std::string pattern = reader.readString(keyLength);
        const auto positionCount = reader.readLE<std::uint32_t>();
        requireCount(reader, positionCount, sizeof(Position), "pattern position");
        std::vector<Position> positions;
        positions.reserve(positionCount);
        for (std::uint32_t i = 0; i < positionCount; ++i) {
            positions.push_back(reader.readLE<Position>());
        }
        meta.patterns.insert_or_assign(std::move(pattern), std::move(positions));
    }

    const auto scoreCount = reader.readLE<std::uint64_t>();
    requireCount(reader, scoreCount, sizeof(QualityScore), "quality score");
    auto scores = reader.readBytes(static_cast<std::size_t>(scoreCount));
    meta.qualityScores.assign(scores.begin(), scores.end());

    const auto runCount = reader.readLE<std::uint32_t>();
    requireCount(reader, runCount, 2 * sizeof(std::uint32_t), "ambiguous run");
    meta.ambiguousRuns.reserve(runCount);
    for (std::uint32_t i = 0; i < runCount; ++i) {
        AmbiguousRun run;
        run.start = reader.readLE<Position>();
        run.length = reader.readLE<std::uint32_t>();
        meta.ambiguousRuns.push_back(run);
    }

    return meta;
}

}  // namespace

// =============================================================================
// Encoding
// =============================================================================

std::vector<std::uint8_t> encodeBundle(std::string_view blob,
                                       std::span<const algo::ChunkMetadata> metadata) {
    ByteWriter section;
    for (const auto& meta : metadata) {
        writeMetadata(section, meta);
    }
    auto stored = algo::zstdLongCompress(section.buffer(), kMetadataZstdLevel);
    if (!stored) {
        throw CodecError(fmt::format("metadata section: {}", stored.error().message()));
    }

    ByteWriter writer;
    writer.writeBytes(kMagicBytes);
    writer.writeLE(kCurrentVersion);
    writer.writeLE(static_cast<std::uint32_t>(metadata.size()));
    writer.writeLE(static_cast<std::uint64_t>(blob.size()));
    writer.writeBytes(blob);
    writer.writeLE(static_cast<std::uint64_t>(section.size()));
    writer.writeLE(static_cast<std::uint64_t>(stored->size()));
    writer.writeBytes(*stored);

    const std::uint64_t hash = xxhash64(writer.buffer().data(), writer.size());
    writer.writeLE(hash);
    writer.writeBytes(kMagicEnd);

    NUCPACK_LOG_DEBUG("Bundle encoded: {} chunks, blob {} bytes, metadata {} -> {} bytes, "
                      "xxhash64={:016x}",
                      metadata.size(), blob.size(), section.size(), stored->size(), hash);
    return writer.release();
}

// =============================================================================
// Decoding
// =============================================================================

Bundle decodeBundle(std::span<const std::uint8_t> data) {
    constexpr std::size_t kMinimumSize = kMagicHeaderSize + sizeof(std::uint32_t) +
                                         3 * sizeof(std::uint64_t) + kFileFooterSize;
    if (data.size() < kMinimumSize) {
        throw FormatError(fmt::format("file too small for a bundle: {} bytes", data.size()));
    }
    if (!std::equal(kMagicBytes.begin(), kMagicBytes.end(), data.begin())) {
        throw FormatError("not a nucpack bundle (bad magic)");
    }

    Bundle bundle;
    bundle.version = data[kMagicBytes.size()];
    if (!isVersionCompatible(bundle.version)) {
        throw FormatError(fmt::format("unsupported bundle version {}.{}",
                                      decodeMajorVersion(bundle.version),
                                      decodeMinorVersion(bundle.version)));
    }

    const std::size_t footerOffset = data.size() - kFileFooterSize;
    auto footer = data.subspan(footerOffset);
    if (!std::equal(kMagicEnd.begin(), kMagicEnd.end(), footer.begin() + sizeof(std::uint64_t))) {
        throw FormatError("bundle end marker missing (truncated file?)",
                          ErrorContext{}.withOffset(footerOffset));
    }

    ByteReader footerReader(footer);
    bundle.checksum = footerReader.readLE<std::uint64_t>();
    const std::uint64_t actual = xxhash64(data.data(), footerOffset);
    if (actual != bundle.checksum) {
        throw ChecksumError(bundle.checksum, actual, ErrorContext{}.withOffset(footerOffset));
    }

    ByteReader reader(data.subspan(kMagicHeaderSize, footerOffset - kMagicHeaderSize));
    const auto chunkCount = reader.readLE<std::uint32_t>();
    const auto blobSize = reader.readLE<std::uint64_t>();
    requireCount(reader, blobSize, 1, "blob byte");
    bundle.blob = reader.readString(static_cast<std::size_t>(blobSize));

    bundle.metadataRawSize = reader.readLE<std::uint64_t>();
    bundle.metadataStoredSize = reader.readLE<std::uint64_t>();
    requireCount(reader, bundle.metadataStoredSize, 1, "metadata byte");
    auto stored = reader.readBytes(static_cast<std::size_t>(bundle.metadataStoredSize));
    if (!reader.atEnd()) {
        throw FormatError(fmt::format("{} unexpected bytes before the footer", reader.remaining()));
    }

    auto section = algo::zstdDecompress(stored, static_cast<std::size_t>(bundle.metadataRawSize));
    if (!section) {
        throw FormatError(fmt::format("metadata section: {}", section.error().message()));
    }

    ByteReader metaReader(*section);
    bundle.metadata.reserve(std::min<std::size_t>(chunkCount, section->size()));
    for (std::uint32_t i = 0; i < chunkCount; ++i) {
        bundle.metadata.push_back(readMetadata(metaReader));
    }
    if (!metaReader.atEnd()) {
        throw FormatError(fmt::format("{} unexpected bytes after chunk metadata",
                                      metaReader.remaining()));
    }

    return bundle;
}

}  // namespace nucpack::format
