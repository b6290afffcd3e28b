// =============================================================================
// nucpack - Compress Command Implementation
// =============================================================================

#include "compress_command.h"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <utility>

#include "nucpack/common/error.h"
#include "nucpack/common/logger.h"
#include "nucpack/format/bundle_writer.h"
#include "nucpack/io/sequence_reader.h"
#include "nucpack/pipeline/compression_pipeline.h"

namespace nucpack::commands {

// =============================================================================
// CompressCommand Implementation
// =============================================================================

CompressCommand::CompressCommand(CompressOptions options) : options_(std::move(options)) {}

CompressCommand::~CompressCommand() = default;

CompressCommand::CompressCommand(CompressCommand&&) noexcept = default;
CompressCommand& CompressCommand::operator=(CompressCommand&&) noexcept = default;

int CompressCommand::execute() {
    auto startTime = std::chrono::steady_clock::now();

    try {
        validateOptions();
        runCompression();

        auto endTime = std::chrono::steady_clock::now();
        summary_.elapsedSeconds = std::chrono::duration<double>(endTime - startTime).count();

        if (options_.showSummary) {
            printSummary();
        }
        return 0;

    } catch (const NucpackException& e) {
        NUCPACK_LOG_ERROR("Compression failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        NUCPACK_LOG_ERROR("Unexpected error: {}", e.what());
        return 1;
    }
}

void CompressCommand::validateOptions() {
    if (options_.inputPath != "-" && !std::filesystem::exists(options_.inputPath)) {
        throw IOError("Input file not found: " + options_.inputPath.string(),
                      ErrorContext(options_.inputPath.string()));
    }
    if (options_.outputPath.empty() || options_.outputPath == "-") {
        throw UsageError("Output must be a file path");
    }
    if (options_.chunkSize == 0) {
        throw UsageError("Chunk size must be positive");
    }
    if (options_.threads < 0) {
        throw UsageError("Thread count cannot be negative");
    }
}

void CompressCommand::runCompression() {
    const io::ParsedSequence input = io::readSequenceFile(options_.inputPath);
    summary_.inputSymbols = input.sequence.size();
    NUCPACK_LOG_INFO("Read {} symbols from {}{}", input.sequence.size(),
                     options_.inputPath.string(), input.isFasta() ? " (FASTA)" : "");

    pipeline::CodecConfig config;
    config.chunkSize = options_.chunkSize;
    config.numThreads = static_cast<std::size_t>(options_.threads);

    pipeline::CompressionResult result;
    pipeline::CompressionStats stats;
    if (options_.keepInvalid) {
        pipeline::GenomeCodec codec(config);
        result = codec.compress(input.sequence);
        stats = codec.getStats().back();
    } else {
        pipeline::CompressionPipeline pipe(config);
        result = pipe.process(input.sequence);
        stats = pipe.codec().getStats().back();
    }

    format::BundleWriter writer(options_.outputPath);
    writer.write(result.blob, result.metadata);
    writer.finalize();

    summary_.encodedSymbols = stats.originalSize;
    summary_.blobCharacters = stats.compressedSize;
    summary_.outputBytes = writer.bytesWritten();
    summary_.chunkCount = stats.chunkCount;
    summary_.compressionRatio = stats.compressionRatio;
    summary_.meanQuality = stats.qualityScore;
    summary_.meanErrorRate = stats.errorRate;
}

void CompressCommand::printSummary() const {
    std::cout << "\n=== Compression Summary ===" << std::endl;
    std::cout << "  Input symbols:    " << summary_.inputSymbols << std::endl;
    std::cout << "  Encoded symbols:  " << summary_.encodedSymbols << std::endl;
    std::cout << "  Chunks:           " << summary_.chunkCount << std::endl;
    std::cout << "  Blob size:        " << summary_.blobCharacters << " characters" << std::endl;
    std::cout << "  Bundle size:      " << summary_.outputBytes << " bytes" << std::endl;
    std::cout << "  Blob ratio:       " << std::fixed << std::setprecision(3)
              << summary_.compressionRatio << std::endl;
    std::cout << "  Bits per base:    " << std::fixed << std::setprecision(3)
              << summary_.bitsPerBase() << std::endl;
    std::cout << "  Mean quality:     " << std::fixed << std::setprecision(2)
              << summary_.meanQuality << std::endl;
    std::cout << "  Mean error rate:  " << std::fixed << std::setprecision(4)
              << summary_.meanErrorRate << std::endl;
    std::cout << "  Elapsed time:     " << std::fixed << std::setprecision(2)
              << summary_.elapsedSeconds << " s" << std::endl;
    std::cout << "===========================" << std::endl;
}

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<CompressCommand> createCompressCommand(
    const std::string& inputPath,
    const std::string& outputPath,
    std::size_t chunkSize,
    int threads,
    bool keepInvalid) {

    CompressOptions opts;
    opts.inputPath = inputPath;
    opts.outputPath = outputPath;
    opts.chunkSize = chunkSize;
    opts.threads = threads;
    opts.keepInvalid = keepInvalid;

    return std::make_unique<CompressCommand>(std::move(opts));
}

}  // namespace nucpack::commands
