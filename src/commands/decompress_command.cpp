// =============================================================================
// nucpack - Decompress Command Implementation
// =============================================================================

#include "decompress_command.h"

#include <utility>

#include "nucpack/common/error.h"
#include "nucpack/common/logger.h"
#include "nucpack/format/bundle_reader.h"
#include "nucpack/io/sequence_reader.h"
#include "nucpack/pipeline/genome_codec.h"

namespace nucpack::commands {

DecompressCommand::DecompressCommand(DecompressOptions options) : options_(std::move(options)) {}

DecompressCommand::~DecompressCommand() = default;

DecompressCommand::DecompressCommand(DecompressCommand&&) noexcept = default;
DecompressCommand& DecompressCommand::operator=(DecompressCommand&&) noexcept = default;

int DecompressCommand::execute() {
    try {
        if (!std::filesystem::exists(options_.inputPath)) {
            throw IOError("Input file not found: " + options_.inputPath.string(),
                          ErrorContext(options_.inputPath.string()));
        }

        const format::BundleReader reader(options_.inputPath);
        const format::Bundle& bundle = reader.bundle();

        const pipeline::GenomeCodec codec;
        const std::string sequence = codec.decompress(bundle.blob, bundle.metadata);

        io::writeSequenceFile(options_.outputPath, options_.recordName, sequence,
                              options_.lineWidth);

        NUCPACK_LOG_INFO("Restored {} symbols from {} chunks to {}", sequence.size(),
                         bundle.metadata.size(), options_.outputPath.string());
        return 0;

    } catch (const NucpackException& e) {
        NUCPACK_LOG_ERROR("Decompression failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        NUCPACK_LOG_ERROR("Unexpected error: {}", e.what());
        return 1;
    }
}

std::unique_ptr<DecompressCommand> createDecompressCommand(
    const std::string& inputPath,
    const std::string& outputPath,
    std::size_t lineWidth) {

    DecompressOptions opts;
    opts.inputPath = inputPath;
    opts.outputPath = outputPath;
    opts.lineWidth = lineWidth;

    return std::make_unique<DecompressCommand>(std::move(opts));
}

}  // namespace nucpack::commands
