// =============================================================================
// nucpack - Compress Command
// =============================================================================
// Command handler for compressing a sequence file into a .npk bundle.
//
// Input is raw text or FASTA (first record), optionally gzip compressed. By
// default the input goes through the cleaning pipeline, which drops symbols
// outside ACGTN; with keepInvalid the text is handed to the codec unchanged
// and any such symbol rejects the input.
// =============================================================================

#ifndef NUCPACK_COMMANDS_COMPRESS_COMMAND_H
#define NUCPACK_COMMANDS_COMPRESS_COMMAND_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "nucpack/common/types.h"

namespace nucpack::commands {

// =============================================================================
// Compression Options
// =============================================================================

/// @brief Configuration options for compression.
struct CompressOptions {
    /// @brief Input file path (or "-" for stdin).
    std::filesystem::path inputPath;

    /// @brief Output bundle path.
    std::filesystem::path outputPath;

    /// @brief Symbols per chunk.
    std::size_t chunkSize = kDefaultChunkSize;

    /// @brief Number of threads (0 = auto).
    int threads = 0;

    /// @brief Skip the cleaning step and reject symbols outside ACGTN.
    bool keepInvalid = false;

    /// @brief Print a summary when done.
    bool showSummary = true;
};

// =============================================================================
// Compression Statistics
// =============================================================================

/// @brief Statistics collected by one compress run.
struct CompressionSummary {
    std::uint64_t inputSymbols = 0;
    std::uint64_t encodedSymbols = 0;
    std::uint64_t blobCharacters = 0;
    std::uint64_t outputBytes = 0;
    std::uint32_t chunkCount = 0;
    double compressionRatio = 0.0;
    double meanQuality = 0.0;
    double meanErrorRate = 0.0;
    double elapsedSeconds = 0.0;

    /// @brief Output bits per encoded symbol.
    [[nodiscard]] double bitsPerBase() const noexcept {
        if (encodedSymbols == 0) return 0.0;
        return static_cast<double>(outputBytes) * 8.0 / static_cast<double>(encodedSymbols);
    }
};

// =============================================================================
// CompressCommand Class
// =============================================================================

/// @brief Command handler for compression.
class CompressCommand {
public:
    /// @brief Construct with options.
    explicit CompressCommand(CompressOptions options);

    /// @brief Destructor.
    ~CompressCommand();

    // Non-copyable, movable
    CompressCommand(const CompressCommand&) = delete;
    CompressCommand& operator=(const CompressCommand&) = delete;
    CompressCommand(CompressCommand&&) noexcept;
    CompressCommand& operator=(CompressCommand&&) noexcept;

    /// @brief Execute the compression.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    /// @brief Get the options.
    [[nodiscard]] const CompressOptions& options() const noexcept { return options_; }

    /// @brief Get the statistics of the last run.
    [[nodiscard]] const CompressionSummary& summary() const noexcept { return summary_; }

private:
    /// @brief Validate options.
    void validateOptions();

    /// @brief Run compression.
    void runCompression();

    /// @brief Print compression summary.
    void printSummary() const;

    CompressOptions options_;
    CompressionSummary summary_;
};

// =============================================================================
// Factory Function
// =============================================================================

/// @brief Create a compress command from CLI options.
[[nodiscard]] std::unique_ptr<CompressCommand> createCompressCommand(
    const std::string& inputPath,
    const std::string& outputPath,
    std::size_t chunkSize,
    int threads,
    bool keepInvalid);

}  // namespace nucpack::commands

#endif  // NUCPACK_COMMANDS_COMPRESS_COMMAND_H
