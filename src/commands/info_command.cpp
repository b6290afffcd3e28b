// =============================================================================
// nucpack - Info Command Implementation
// =============================================================================

#include "info_command.h"

#include <iomanip>
#include <iostream>
#include <utility>

#include <fmt/format.h>

#include "nucpack/common/error.h"
#include "nucpack/common/logger.h"
#include "nucpack/format/bundle_reader.h"

namespace nucpack::commands {

namespace {

/// @brief Escape a string for a JSON string literal.
std::string jsonEscape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

/// @brief Per-bundle aggregates shared by both output formats.
struct BundleTotals {
    std::uint64_t symbols = 0;
    std::uint64_t streamBytes = 0;
    std::size_t zstdChunks = 0;
    std::size_t ambiguousRuns = 0;
    double meanQuality = 0.0;
    double meanErrorRate = 0.0;
};

BundleTotals computeTotals(const format::Bundle& bundle) {
    BundleTotals totals;
    for (const auto& meta : bundle.metadata) {
        totals.symbols += meta.originalLength;
        totals.streamBytes += meta.compressedLength;
        totals.ambiguousRuns += meta.ambiguousRuns.size();
        totals.meanQuality += meta.meanQuality();
        totals.meanErrorRate += meta.errorRate;
        if (meta.codec == CodecFamily::kZstdLong) {
            ++totals.zstdChunks;
        }
    }
    if (!bundle.metadata.empty()) {
        totals.meanQuality /= static_cast<double>(bundle.metadata.size());
        totals.meanErrorRate /= static_cast<double>(bundle.metadata.size());
    }
    return totals;
}

}  // namespace

// =============================================================================
// InfoCommand Implementation
// =============================================================================

InfoCommand::InfoCommand(InfoOptions options) : options_(std::move(options)) {}

InfoCommand::~InfoCommand() = default;

InfoCommand::InfoCommand(InfoCommand&&) noexcept = default;
InfoCommand& InfoCommand::operator=(InfoCommand&&) noexcept = default;

int InfoCommand::execute() {
    try {
        if (!std::filesystem::exists(options_.inputPath)) {
            throw IOError("Input file not found: " + options_.inputPath.string(),
                          ErrorContext(options_.inputPath.string()));
        }

        const format::BundleReader reader(options_.inputPath);
        if (options_.jsonOutput) {
            printJsonInfo(reader);
        } else {
            printTextInfo(reader);
        }

        return 0;

    } catch (const NucpackException& e) {
        NUCPACK_LOG_ERROR("Info command failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        NUCPACK_LOG_ERROR("Unexpected error: {}", e.what());
        return 1;
    }
}

void InfoCommand::printTextInfo(const format::BundleReader& reader) const {
    const format::Bundle& bundle = reader.bundle();
    const BundleTotals totals = computeTotals(bundle);

    std::cout << "=== nucpack Bundle Information ===" << std::endl;
    std::cout << std::endl;
    std::cout << "File:           " << reader.path().string() << std::endl;
    std::cout << "Size:           " << reader.fileSize() << " bytes" << std::endl;
    std::cout << "Version:        " << static_cast<int>(format::decodeMajorVersion(bundle.version))
              << "." << static_cast<int>(format::decodeMinorVersion(bundle.version)) << std::endl;
    std::cout << "Checksum:       " << fmt::format("{:016x}", bundle.checksum) << " (xxHash64)"
              << std::endl;
    std::cout << std::endl;
    std::cout << "--- Content ---" << std::endl;
    std::cout << "Symbols:        " << totals.symbols << std::endl;
    std::cout << "Chunks:         " << bundle.metadata.size() << " (" << totals.zstdChunks
              << " zstd-long)" << std::endl;
    std::cout << "Blob:           " << bundle.blob.size() << " characters, "
              << totals.streamBytes << " bytes decoded" << std::endl;
    std::cout << "Metadata:       " << bundle.metadataRawSize << " bytes ("
              << bundle.metadataStoredSize << " stored)" << std::endl;
    std::cout << "N runs:         " << totals.ambiguousRuns << std::endl;
    std::cout << "Mean quality:   " << std::fixed << std::setprecision(2) << totals.meanQuality
              << std::endl;
    std::cout << "Mean error:     " << std::fixed << std::setprecision(4) << totals.meanErrorRate
              << std::endl;

    if (options_.detailed) {
        std::cout << std::endl;
        std::cout << "--- Chunk Details ---" << std::endl;
        for (std::size_t i = 0; i < bundle.metadata.size(); ++i) {
            const auto& meta = bundle.metadata[i];
            std::cout << fmt::format(
                             "  [{:>4}] length={} stream={} codec={} crc32={:08x} patterns={} "
                             "n_runs={} quality={:.2f} error={:.4f}",
                             i, meta.originalLength, meta.compressedLength,
                             codecFamilyToString(meta.codec), meta.checksum,
                             meta.patterns.size(), meta.ambiguousRuns.size(),
                             meta.meanQuality(), meta.errorRate)
                      << std::endl;
        }
    }

    std::cout << std::endl;
    std::cout << "==================================" << std::endl;
}

void InfoCommand::printJsonInfo(const format::BundleReader& reader) const {
    const format::Bundle& bundle = reader.bundle();
    const BundleTotals totals = computeTotals(bundle);

    std::cout << "{" << std::endl;
    std::cout << "  \"file\": \"" << jsonEscape(reader.path().string()) << "\"," << std::endl;
    std::cout << "  \"size\": " << reader.fileSize() << "," << std::endl;
    std::cout << "  \"version\": {" << std::endl;
    std::cout << "    \"major\": " << static_cast<int>(format::decodeMajorVersion(bundle.version))
              << "," << std::endl;
    std::cout << "    \"minor\": " << static_cast<int>(format::decodeMinorVersion(bundle.version))
              << std::endl;
    std::cout << "  }," << std::endl;
    std::cout << "  \"checksum\": \"" << fmt::format("{:016x}", bundle.checksum) << "\","
              << std::endl;
    std::cout << "  \"symbols\": " << totals.symbols << "," << std::endl;
    std::cout << "  \"chunk_count\": " << bundle.metadata.size() << "," << std::endl;
    std::cout << "  \"blob_characters\": " << bundle.blob.size() << "," << std::endl;
    std::cout << "  \"stream_bytes\": " << totals.streamBytes << "," << std::endl;
    std::cout << "  \"mean_quality\": " << fmt::format("{:.4f}", totals.meanQuality) << ","
              << std::endl;
    std::cout << "  \"mean_error_rate\": " << fmt::format("{:.6f}", totals.meanErrorRate);

    if (options_.detailed) {
        std::cout << "," << std::endl;
        std::cout << "  \"chunks\": [" << std::endl;
        for (std::size_t i = 0; i < bundle.metadata.size(); ++i) {
            const auto& meta = bundle.metadata[i];
            std::cout << fmt::format(
                "    {{\"index\": {}, \"original_length\": {}, \"compressed_length\": {}, "
                "\"codec\": \"{}\", \"compression_type\": \"{}\", \"checksum\": {}, "
                "\"patterns\": {}, \"ambiguous_runs\": {}, \"mean_quality\": {:.4f}, "
                "\"error_rate\": {:.6f}}}",
                i, meta.originalLength, meta.compressedLength, codecFamilyToString(meta.codec),
                compressionTypeToString(meta.compressionType), meta.checksum,
                meta.patterns.size(), meta.ambiguousRuns.size(), meta.meanQuality(),
                meta.errorRate);
            std::cout << (i + 1 < bundle.metadata.size() ? "," : "") << std::endl;
        }
        std::cout << "  ]" << std::endl;
    } else {
        std::cout << std::endl;
    }

    std::cout << "}" << std::endl;
}

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<InfoCommand> createInfoCommand(
    const std::string& inputPath,
    bool jsonOutput,
    bool detailed) {

    InfoOptions opts;
    opts.inputPath = inputPath;
    opts.jsonOutput = jsonOutput;
    opts.detailed = detailed;

    return std::make_unique<InfoCommand>(std::move(opts));
}

}  // namespace nucpack::commands
